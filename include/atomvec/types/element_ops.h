#ifndef ATOMVEC_TYPES_ELEMENT_OPS_H
#define ATOMVEC_TYPES_ELEMENT_OPS_H

#include <atomvec/types/element_kind.h>

#include <atomic>
#include <cmath>
#include <limits>
#include <optional>

namespace atomvec {

    /**
     * ArithmeticFlags - Conditions raised by element kernels.
     *
     * Kernels may run on several threads at once, the flags are atomic and are turned
     * into warnings by the caller once the whole result has been computed.
     */
    struct ArithmeticFlags {
        std::atomic<bool> integer_overflow{false};
    };

    /**
     * ElementOps - Primitive operations on non-missing element values of type T.
     *
     * NA handling is done by the vector level kernels; these functions see plain
     * values. Integer operations return std::nullopt when the mathematical result is
     * not representable (overflow, division by zero), which surfaces as NA.
     */
    template<ElementType T>
    struct ElementOps {
        static std::optional<T> add(T a, T b, ArithmeticFlags& flags) {
            if constexpr (std::same_as<T, av_int>) {
                if ((b > 0 && a > std::numeric_limits<T>::max() - b) ||
                    (b < 0 && a < std::numeric_limits<T>::min() - b)) {
                    return overflow(flags);
                }
                return a + b;
            } else {
                return a + b;
            }
        }

        static std::optional<T> subtract(T a, T b, ArithmeticFlags& flags) {
            if constexpr (std::same_as<T, av_int>) {
                if ((b < 0 && a > std::numeric_limits<T>::max() + b) ||
                    (b > 0 && a < std::numeric_limits<T>::min() + b)) {
                    return overflow(flags);
                }
                return a - b;
            } else {
                return a - b;
            }
        }

        static std::optional<T> multiply(T a, T b, ArithmeticFlags& flags) {
            if constexpr (std::same_as<T, av_int>) {
                constexpr T max = std::numeric_limits<T>::max();
                constexpr T min = std::numeric_limits<T>::min();
                if (a > 0) {
                    if (b > 0 ? a > max / b : b < min / a) return overflow(flags);
                } else if (a < 0) {
                    if (b > 0 ? a < min / b : b < max / a) return overflow(flags);
                }
                return a * b;
            } else {
                return a * b;
            }
        }

        // Division and power are always computed in double
        static std::optional<T> divide(T a, T b, ArithmeticFlags&) requires std::same_as<T, av_float> {
            return a / b;
        }

        static std::optional<T> power(T a, T b, ArithmeticFlags&) requires std::same_as<T, av_float> {
            // 1^y and x^0 are 1 even for NaN operands
            if (a == 1.0 || b == 0.0) return 1.0;
            return std::pow(a, b);
        }

        // Floor division: rounds toward negative infinity
        static std::optional<T> floor_divide(T a, T b, ArithmeticFlags& flags) {
            if constexpr (std::same_as<T, av_int>) {
                if (b == 0) return std::nullopt;
                if (b == -1 && a == std::numeric_limits<T>::min()) return overflow(flags);
                T result = a / b;
                if ((a < 0) != (b < 0) && a % b != 0) {
                    result -= 1;
                }
                return result;
            } else {
                return std::floor(a / b);
            }
        }

        // Modulo: the result has the same sign as the divisor
        static std::optional<T> modulo(T a, T b, ArithmeticFlags&) {
            if constexpr (std::same_as<T, av_int>) {
                if (b == 0) return std::nullopt;
                if (b == -1) return T{0};
                T result = a % b;
                if ((result < 0 && b > 0) || (result > 0 && b < 0)) {
                    result += b;
                }
                return result;
            } else {
                if (b == 0.0) return std::numeric_limits<T>::quiet_NaN();
                T result = std::fmod(a, b);
                if (result != 0.0 && ((result < 0.0) != (b < 0.0))) {
                    result += b;
                }
                return result;
            }
        }

        static std::optional<T> negate(T a, ArithmeticFlags& flags) {
            if constexpr (std::same_as<T, av_int>) {
                if (a == std::numeric_limits<T>::min()) return overflow(flags);
                return -a;
            } else {
                return -a;
            }
        }

        /**
         * Three way comparison for the ordered kinds. Returns std::nullopt when the
         * operands are unordered (a NaN is involved), which surfaces as NA.
         */
        static std::optional<int> compare(const T& a, const T& b) {
            if constexpr (std::same_as<T, av_float>) {
                if (std::isnan(a) || std::isnan(b)) return std::nullopt;
            }
            if (a < b) return -1;
            if (b < a) return 1;
            return 0;
        }

    private:
        static std::optional<T> overflow(ArithmeticFlags& flags) {
            flags.integer_overflow.store(true, std::memory_order_relaxed);
            return std::nullopt;
        }
    };

    // Three-valued logic: false dominates &, true dominates |
    [[nodiscard]] inline std::optional<av_bool> logical_and(const std::optional<av_bool>& a,
                                                            const std::optional<av_bool>& b) {
        if ((a && !*a) || (b && !*b)) return false;
        if (!a || !b) return std::nullopt;
        return true;
    }

    [[nodiscard]] inline std::optional<av_bool> logical_or(const std::optional<av_bool>& a,
                                                           const std::optional<av_bool>& b) {
        if ((a && *a) || (b && *b)) return true;
        if (!a || !b) return std::nullopt;
        return false;
    }

} // namespace atomvec

#endif // ATOMVEC_TYPES_ELEMENT_OPS_H
