#ifndef ATOMVEC_OPS_VECTOR_OPS_H
#define ATOMVEC_OPS_VECTOR_OPS_H

#include <atomvec/atomvec_export.h>
#include <atomvec/ops/recycler.h>
#include <atomvec/types/vector.h>
#include <atomvec/util/parallel.h>

#include <array>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace atomvec {

    enum class BinaryOp : uint8_t {
        // arithmetic
        Add,
        Subtract,
        Multiply,
        Divide,
        Power,
        Modulo,
        IntDivide,
        // comparison
        Less,
        LessEqual,
        Greater,
        GreaterEqual,
        Equal,
        NotEqual,
        // logical
        And,
        Or,
    };

    // "+", "-", "*", "/", "^", "%%", "%/%", "<", "<=", ">", ">=", "==", "!=", "&", "|"
    [[nodiscard]] ATOMVEC_EXPORT const char* op_symbol(BinaryOp op);

    // Inverse of op_symbol, throws InvalidArgumentError for an unknown symbol
    [[nodiscard]] ATOMVEC_EXPORT BinaryOp parse_op(std::string_view symbol);

    [[nodiscard]] constexpr bool is_arithmetic(BinaryOp op) noexcept { return op <= BinaryOp::IntDivide; }
    [[nodiscard]] constexpr bool is_comparison(BinaryOp op) noexcept {
        return op >= BinaryOp::Less && op <= BinaryOp::NotEqual;
    }
    [[nodiscard]] constexpr bool is_logical(BinaryOp op) noexcept { return op >= BinaryOp::And; }

    /**
     * binary_op - Elementwise a op b over the recycled alignment of the operands.
     *
     * Arithmetic works in the higher operand kind, at least Integer (Logical acts as
     * 0/1); "/" and "^" always produce Double; Character operands throw
     * InvalidOperandError. Integer overflow and integer "%%" or "%/%" by zero give NA,
     * overflow also raises one IntegerOverflow warning per call.
     *
     * Comparisons coerce both operands to the higher kind and produce Logical; a NaN
     * operand compares as NA. "&" and "|" take Logical operands only and follow
     * three-valued logic.
     *
     * The result takes the names of a when a is named and as long as the result,
     * otherwise those of b under the same rule.
     */
    [[nodiscard]] ATOMVEC_EXPORT Vector binary_op(BinaryOp op, const Vector& a, const Vector& b);

    [[nodiscard]] ATOMVEC_EXPORT Vector binary_op(std::string_view op, const Vector& a, const Vector& b);

    // Unary minus; Logical operands become Integer
    [[nodiscard]] ATOMVEC_EXPORT Vector negate(const Vector& v);

    // Logical negation; numeric operands are true when non-zero
    [[nodiscard]] ATOMVEC_EXPORT Vector logical_not(const Vector& v);

    // TRUE where the element is NA (a NaN is a value, not NA)
    [[nodiscard]] ATOMVEC_EXPORT Vector is_na(const Vector& v);

    /**
     * round_to - Round half away from zero to the given number of decimal places.
     *
     * Negative decimals round to tens, hundreds and so on. The result is Double;
     * Character input throws InvalidOperandError. A vector of decimals is recycled
     * against v.
     */
    [[nodiscard]] ATOMVEC_EXPORT Vector round_to(const Vector& v, int decimals = 0);

    [[nodiscard]] ATOMVEC_EXPORT Vector round_to(const Vector& v, const Vector& decimals);

    // =========================================================================
    // Operators
    // =========================================================================
    // Vector::operator== stays structural; elementwise equality is binary_op(BinaryOp::Equal, ...)

    [[nodiscard]] inline Vector operator+(const Vector& a, const Vector& b) { return binary_op(BinaryOp::Add, a, b); }
    [[nodiscard]] inline Vector operator-(const Vector& a, const Vector& b) { return binary_op(BinaryOp::Subtract, a, b); }
    [[nodiscard]] inline Vector operator*(const Vector& a, const Vector& b) { return binary_op(BinaryOp::Multiply, a, b); }
    [[nodiscard]] inline Vector operator/(const Vector& a, const Vector& b) { return binary_op(BinaryOp::Divide, a, b); }
    [[nodiscard]] inline Vector operator<(const Vector& a, const Vector& b) { return binary_op(BinaryOp::Less, a, b); }
    [[nodiscard]] inline Vector operator<=(const Vector& a, const Vector& b) { return binary_op(BinaryOp::LessEqual, a, b); }
    [[nodiscard]] inline Vector operator>(const Vector& a, const Vector& b) { return binary_op(BinaryOp::Greater, a, b); }
    [[nodiscard]] inline Vector operator>=(const Vector& a, const Vector& b) { return binary_op(BinaryOp::GreaterEqual, a, b); }
    [[nodiscard]] inline Vector operator&(const Vector& a, const Vector& b) { return binary_op(BinaryOp::And, a, b); }
    [[nodiscard]] inline Vector operator|(const Vector& a, const Vector& b) { return binary_op(BinaryOp::Or, a, b); }
    [[nodiscard]] inline Vector operator-(const Vector& v) { return negate(v); }
    [[nodiscard]] inline Vector operator!(const Vector& v) { return logical_not(v); }

    // =========================================================================
    // Function application
    // =========================================================================

    namespace detail {
        template<typename T>
        struct optional_value;

        template<ElementType T>
        struct optional_value<std::optional<T>> {
            using type = T;
        };

        // Names for a result of the given length, from the first named operand of that length
        [[nodiscard]] ATOMVEC_EXPORT std::optional<name_list_t> result_names(std::initializer_list<const Vector*> operands,
                                                                             size_t length);

        template<ElementType... Ts, typename F, size_t... Is>
        Vector elementwise_apply(F& fn, const std::array<Vector, sizeof...(Ts)>& inputs, std::index_sequence<Is...>) {
            using R = typename optional_value<std::invoke_result_t<F&, const std::optional<Ts>&...>>::type;

            auto alignment = align(std::vector<size_t>{inputs[Is].length()...});
            std::tuple<const column_t<Ts>&...> columns{inputs[Is].template data<Ts>()...};

            column_t<R> out(alignment.length());
            for_each(alignment.length(), [&](size_t i) {
                out[i] = std::invoke(fn, std::get<Is>(columns)[alignment.index(Is, i)]...);
            });

            Vector result{std::move(out)};
            if (auto names = result_names({&inputs[Is]...}, alignment.length())) result.set_names(std::move(*names));
            alignment.report();
            return result;
        }
    } // namespace detail

    /**
     * unary_apply - Apply fn(const std::optional<T>&) -> std::optional<R> to every element.
     *
     * v is first coerced (upward) to T's kind. The result is a vector of R's kind with
     * v's names. fn may be called concurrently from several threads when the parallel
     * policy is enabled.
     */
    template<ElementType T, typename F>
    [[nodiscard]] Vector unary_apply(const Vector& v, F&& fn) {
        using R = typename detail::optional_value<std::invoke_result_t<F&, const std::optional<T>&>>::type;

        const Vector input = v.coerced(kind_of_v<T>);
        const auto& column = input.template data<T>();
        column_t<R> out(column.size());
        for_each(column.size(), [&](size_t i) { out[i] = std::invoke(fn, column[i]); });

        Vector result{std::move(out)};
        if (v.has_names()) result.set_names(v.names());
        return result;
    }

    /**
     * elementwise_apply - n-ary unary_apply over the recycled tuples of vs.
     *
     * Each operand is coerced to the kind of its T; the result length is the n-ary
     * alignment length and a RecycleLength warning is reported when an operand does
     * not divide it. Names follow the binary_op rule over the operands in order.
     */
    template<ElementType... Ts, typename F, typename... Vs>
        requires (sizeof...(Ts) == sizeof...(Vs) && sizeof...(Ts) > 0 && (std::same_as<Vs, Vector> && ...))
    [[nodiscard]] Vector elementwise_apply(F&& fn, const Vs&... vs) {
        std::array<Vector, sizeof...(Ts)> inputs{vs.coerced(kind_of_v<Ts>)...};
        return detail::elementwise_apply<Ts...>(fn, inputs, std::index_sequence_for<Ts...>{});
    }

} // namespace atomvec

#endif // ATOMVEC_OPS_VECTOR_OPS_H
