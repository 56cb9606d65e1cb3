#ifndef ATOMVEC_TYPES_TYPE_LATTICE_H
#define ATOMVEC_TYPES_TYPE_LATTICE_H

#include <atomvec/atomvec_export.h>
#include <atomvec/types/element_kind.h>
#include <atomvec/util/errors.h>

#include <initializer_list>
#include <string>
#include <vector>

namespace atomvec {

    // =========================================================================
    // Ordering
    // =========================================================================

    [[nodiscard]] constexpr int rank_of(ElementKind kind) noexcept {
        return static_cast<int>(kind);
    }

    [[nodiscard]] constexpr ElementKind higher_kind(ElementKind a, ElementKind b) noexcept {
        return rank_of(a) >= rank_of(b) ? a : b;
    }

    // Coercion only ever moves up the lattice (or stays put)
    [[nodiscard]] constexpr bool can_coerce(ElementKind from, ElementKind to) noexcept {
        return rank_of(from) <= rank_of(to);
    }

    /**
     * Maximum rank among kinds. An empty list yields Logical, the lattice bottom,
     * which is also the kind of the untyped empty vector.
     */
    [[nodiscard]] ATOMVEC_EXPORT ElementKind common_kind(std::initializer_list<ElementKind> kinds);
    [[nodiscard]] ATOMVEC_EXPORT ElementKind common_kind(const std::vector<ElementKind>& kinds);

    // =========================================================================
    // Canonical text rendering
    // =========================================================================

    /**
     * Locale independent decimal rendering of a double using options().character_digits
     * significant digits. Non-finite values render as "Inf", "-Inf" and "NaN".
     */
    [[nodiscard]] ATOMVEC_EXPORT std::string format_double(double value);
    [[nodiscard]] ATOMVEC_EXPORT std::string format_double(double value, int digits);

    [[nodiscard]] inline std::string format_value(av_bool value) { return value ? "TRUE" : "FALSE"; }
    [[nodiscard]] inline std::string format_value(av_int value) { return fmt::format("{}", value); }
    [[nodiscard]] inline std::string format_value(av_float value) { return format_double(value); }
    [[nodiscard]] inline const std::string& format_value(const av_string& value) { return value; }

    // =========================================================================
    // Element coercion
    // =========================================================================

    /**
     * coerce - Convert a single element up the lattice.
     *
     * Logical -> Integer maps true to 1 and false to 0, Integer -> Double widens and
     * anything -> Character uses the canonical text rendering. NA maps to NA.
     * Downward conversions do not compile.
     */
    template<ElementType To, ElementType From>
        requires (can_coerce(kind_of_v<From>, kind_of_v<To>))
    [[nodiscard]] std::optional<To> coerce(const std::optional<From>& value) {
        if (!value) return std::nullopt;
        if constexpr (std::same_as<From, To>) {
            return value;
        } else if constexpr (std::same_as<To, av_string>) {
            return format_value(*value);
        } else {
            return static_cast<To>(*value);
        }
    }

    template<ElementType To, ElementType From>
        requires (can_coerce(kind_of_v<From>, kind_of_v<To>))
    [[nodiscard]] column_t<To> coerce_column(const column_t<From>& source) {
        if constexpr (std::same_as<From, To>) {
            return source;
        } else {
            column_t<To> result;
            result.reserve(source.size());
            for (const auto& value : source) {
                result.push_back(coerce<To>(value));
            }
            return result;
        }
    }

    /**
     * Runtime checked column coercion, throws CoercionError when To is below From.
     */
    template<ElementType To, ElementType From>
    [[nodiscard]] column_t<To> coerce_column_checked(const column_t<From>& source) {
        if constexpr (can_coerce(kind_of_v<From>, kind_of_v<To>)) {
            return coerce_column<To>(source);
        } else {
            throw_error<CoercionError>("cannot coerce {} to {}: coercion only moves up the lattice",
                                       kind_of_v<From>, kind_of_v<To>);
        }
    }

} // namespace atomvec

#endif // ATOMVEC_TYPES_TYPE_LATTICE_H
