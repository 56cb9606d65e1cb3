#include <atomvec/types/construction.h>
#include <atomvec/ops/recycler.h>

#include <boost/cast.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace atomvec {

    namespace {
        // Relative tolerance when counting steps, absorbs floating point accumulation error
        constexpr double sequence_fuzz = 1e-10;

        bool is_integral(double value) {
            return std::isfinite(value) && std::trunc(value) == value;
        }

        template<ElementType T>
        void cycle_into(column_t<T>& out, const column_t<T>& source, size_t length_out) {
            out.reserve(length_out);
            for (size_t i = 0; i < length_out; ++i) {
                out.push_back(source[i % source.size()]);
            }
        }

        Vector cycle(const Vector& value, size_t length_out) {
            Vector result = value.visit([length_out](const auto& column) {
                using T = typename std::decay_t<decltype(column)>::value_type::value_type;
                column_t<T> out;
                if (length_out > 0) cycle_into(out, column, length_out);
                return Vector{std::move(out)};
            });
            if (value.has_names()) {
                const auto& source = value.name_table()->names();
                name_list_t out;
                out.reserve(length_out);
                for (size_t i = 0; i < length_out; ++i) {
                    out.push_back(source[i % source.size()]);
                }
                result.set_names(std::move(out));
            }
            return result;
        }
    } // namespace

    Vector combine(const std::vector<Vector>& values) {
        std::vector<ElementKind> kinds;
        kinds.reserve(values.size());
        size_t total = 0;
        bool named = false;
        for (const auto& v : values) {
            kinds.push_back(v.kind());
            total += v.length();
            named = named || v.has_names();
        }

        Vector result{common_kind(kinds), 0};
        result.visit([total](auto& column) { column.reserve(total); });
        for (const auto& v : values) {
            result.append(v);
        }
        if (named && !result.has_names()) {
            // Only zero-length inputs were named
            result.set_names(name_list_t{});
        }
        return result;
    }

    Vector sequence(double from, double to, std::optional<double> step) {
        if (!std::isfinite(from) || !std::isfinite(to)) {
            throw_error<InvalidStepError>("sequence: 'from' and 'to' must be finite, got {} and {}", from, to);
        }
        double by = step.value_or(to >= from ? 1.0 : -1.0);
        if (!std::isfinite(by)) {
            throw_error<InvalidStepError>("sequence: step must be finite, got {}", by);
        }

        if (by == 0.0) {
            if (from != to) {
                throw_error<InvalidStepError>("sequence: zero step cannot go from {} to {}", from, to);
            }
            return is_integral(from) ? Vector::integer({static_cast<av_int>(from)}) : Vector::numeric({from});
        }

        double span = (to - from) / by;
        if (span < 0.0) {
            throw_error<InvalidStepError>("sequence: step {} has the wrong sign to go from {} to {}", by, from, to);
        }
        if (span >= static_cast<double>(column_t<av_float>{}.max_size())) {
            throw_error<InvalidArgumentError>("sequence: {} to {} by {} is too long", from, to, by);
        }
        auto count = static_cast<size_t>(std::floor(span + sequence_fuzz)) + 1;

        if (is_integral(from) && is_integral(to) && is_integral(by)) {
            try {
                auto start = boost::numeric_cast<av_int>(from);
                auto increment = boost::numeric_cast<av_int>(by);
                // Range check the last value, the others lie between it and start
                (void)boost::numeric_cast<av_int>(from + static_cast<double>(count - 1) * by);

                column_t<av_int> values;
                values.reserve(count);
                for (size_t i = 0; i < count; ++i) {
                    values.emplace_back(start + static_cast<av_int>(i) * increment);
                }
                return Vector::integer(std::move(values));
            } catch (const boost::numeric::bad_numeric_cast&) {
                // Outside av_int, fall through to a double sequence
            }
        }

        column_t<av_float> values;
        values.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            // The fuzzed count may admit a last value a rounding error past to
            double value = from + static_cast<double>(i) * by;
            values.emplace_back(by > 0.0 ? std::min(value, to) : std::max(value, to));
        }
        return Vector::numeric(std::move(values));
    }

    Vector repeat(const Vector& value, av_int times) {
        if (times < 0) {
            throw_error<InvalidArgumentError>("repeat: 'times' must be non-negative, got {}", times);
        }
        const auto count = static_cast<size_t>(times);
        const size_t limit = value.visit([](const auto& column) { return column.max_size(); });
        if (value.length() > 0 && count > limit / value.length()) {
            throw_error<InvalidArgumentError>("repeat: {} copies of a length {} vector is too long", times, value.length());
        }
        return cycle(value, value.length() * count);
    }

    Vector repeat_to_length(const Vector& value, size_t length_out) {
        // An explicit length_out truncates silently, the alignment warning is dropped
        auto alignment = fit(length_out, value.length());
        return cycle(value, alignment.length());
    }

    Vector set_names(const Vector& v, std::optional<name_list_t> names) {
        Vector result{v};
        result.set_names(std::move(names));
        return result;
    }

} // namespace atomvec
