#include <atomvec/ops/index_spec.h>

#include <boost/cast.hpp>

#include <cmath>

namespace atomvec {

    const char* to_string(IndexKind kind) {
        switch (kind) {
            case IndexKind::Positive: return "positive";
            case IndexKind::Negative: return "negative";
            case IndexKind::Mask: return "mask";
            case IndexKind::Names: return "names";
        }
        return "unknown";
    }

    IndexSpec IndexSpec::positions(positions_t values) {
        bool has_positive = false;
        bool has_negative = false;
        bool has_na = false;
        for (const auto& value : values) {
            if (!value) {
                has_na = true;
            } else if (*value > 0) {
                has_positive = true;
            } else if (*value < 0) {
                has_negative = true;
            }
        }

        if (has_positive && has_negative) {
            throw_error<MixedSignIndexError>("cannot mix positive and negative subscripts");
        }
        if (has_negative && has_na) {
            throw_error<InvalidIndexError>("cannot mix NA with negative subscripts");
        }
        return IndexSpec{has_negative ? IndexKind::Negative : IndexKind::Positive, std::move(values)};
    }

    IndexSpec IndexSpec::mask(mask_t values) {
        return IndexSpec{IndexKind::Mask, std::move(values)};
    }

    IndexSpec IndexSpec::names(names_t values) {
        return IndexSpec{IndexKind::Names, std::move(values)};
    }

    IndexSpec IndexSpec::from_vector(const Vector& index) {
        switch (index.kind()) {
            case ElementKind::Logical:
                return mask(index.data<av_bool>());
            case ElementKind::Integer:
                return positions(index.data<av_int>());
            case ElementKind::Double: {
                positions_t values;
                values.reserve(index.length());
                for (const auto& value : index.data<av_float>()) {
                    if (!value) {
                        values.emplace_back(std::nullopt);
                        continue;
                    }
                    if (!std::isfinite(*value)) {
                        throw_error<InvalidIndexError>("subscript {} is not a finite number", format_double(*value));
                    }
                    try {
                        values.emplace_back(boost::numeric_cast<av_int>(std::trunc(*value)));
                    } catch (const boost::numeric::bad_numeric_cast&) {
                        throw_error<InvalidIndexError>("subscript {} is out of range", format_double(*value));
                    }
                }
                return positions(std::move(values));
            }
            case ElementKind::Character:
                return names(index.data<av_string>());
        }
        throw_error<InvalidIndexError>("unsupported index kind {}", index.kind());
    }

    size_t IndexSpec::size() const {
        return std::visit([](const auto& values) { return values.size(); }, _values);
    }

} // namespace atomvec
