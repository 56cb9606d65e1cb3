#ifndef ATOMVEC_TYPES_CONSTRUCTION_H
#define ATOMVEC_TYPES_CONSTRUCTION_H

#include <atomvec/atomvec_export.h>
#include <atomvec/types/vector.h>

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atomvec {

    // =========================================================================
    // Scalars as length-one vectors
    // =========================================================================

    [[nodiscard]] inline const Vector& as_vector(const Vector& v) { return v; }

    [[nodiscard]] inline Vector as_vector(av_bool value) { return Vector::logical({value}); }

    template<std::integral T>
        requires (!std::same_as<T, bool>)
    [[nodiscard]] Vector as_vector(T value) {
        return Vector::integer({static_cast<av_int>(value)});
    }

    template<std::floating_point T>
    [[nodiscard]] Vector as_vector(T value) {
        return Vector::numeric({static_cast<av_float>(value)});
    }

    [[nodiscard]] inline Vector as_vector(const char* value) { return Vector::character({av_string{value}}); }
    [[nodiscard]] inline Vector as_vector(std::string_view value) { return Vector::character({av_string{value}}); }
    [[nodiscard]] inline Vector as_vector(const av_string& value) { return Vector::character({value}); }

    template<typename T>
    concept VectorLike = requires(const T& value) {
        { as_vector(value) } -> std::convertible_to<Vector>;
    };

    // =========================================================================
    // Construction
    // =========================================================================

    /**
     * combine - Concatenate vectors into one vector.
     *
     * The result kind is the highest kind among the inputs and every element is
     * coerced to it. If any input is named, the result is named and unnamed inputs
     * contribute empty names. combine() of nothing is the untyped empty vector
     * (length 0, Logical).
     */
    [[nodiscard]] ATOMVEC_EXPORT Vector combine(const std::vector<Vector>& values);

    template<VectorLike... Args>
    [[nodiscard]] Vector combine(const Args&... values) {
        return combine(std::vector<Vector>{Vector{as_vector(values)}...});
    }

    /**
     * sequence - from, from + step, ... stopping at or before to.
     *
     * The default step is +1 when to >= from and -1 otherwise. The result is Integer
     * when from, to and step are integral (and every value fits av_int), otherwise Double.
     *
     * Throws InvalidStepError for a zero step over a non-empty range, a step pointing
     * away from to, or non-finite arguments.
     */
    [[nodiscard]] ATOMVEC_EXPORT Vector sequence(double from, double to, std::optional<double> step = std::nullopt);

    // Whole-input cycles: length(value) * times elements, names repeated
    [[nodiscard]] ATOMVEC_EXPORT Vector repeat(const Vector& value, av_int times);

    // Cycles value until exactly length_out elements have been produced
    [[nodiscard]] ATOMVEC_EXPORT Vector repeat_to_length(const Vector& value, size_t length_out);

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] inline size_t length(const Vector& v) { return v.length(); }

    [[nodiscard]] inline std::optional<name_list_t> names(const Vector& v) { return v.names(); }

    // Copy of v with the given names (see Vector::set_names)
    [[nodiscard]] ATOMVEC_EXPORT Vector set_names(const Vector& v, std::optional<name_list_t> names);

} // namespace atomvec

#endif // ATOMVEC_TYPES_CONSTRUCTION_H
