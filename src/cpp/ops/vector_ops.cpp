#include <atomvec/ops/vector_ops.h>
#include <atomvec/types/element_ops.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace atomvec {

    namespace {
        constexpr std::array<std::pair<BinaryOp, std::string_view>, 15> op_symbols{{
            {BinaryOp::Add, "+"},
            {BinaryOp::Subtract, "-"},
            {BinaryOp::Multiply, "*"},
            {BinaryOp::Divide, "/"},
            {BinaryOp::Power, "^"},
            {BinaryOp::Modulo, "%%"},
            {BinaryOp::IntDivide, "%/%"},
            {BinaryOp::Less, "<"},
            {BinaryOp::LessEqual, "<="},
            {BinaryOp::Greater, ">"},
            {BinaryOp::GreaterEqual, ">="},
            {BinaryOp::Equal, "=="},
            {BinaryOp::NotEqual, "!="},
            {BinaryOp::And, "&"},
            {BinaryOp::Or, "|"},
        }};

        // v itself when it already has the kind, otherwise a coerced copy kept in holder
        const Vector& with_kind(const Vector& v, ElementKind kind, std::optional<Vector>& holder) {
            if (v.kind() == kind) return v;
            return holder.emplace(v.coerced(kind));
        }

        void report_overflow(const ArithmeticFlags& flags) {
            if (flags.integer_overflow.load(std::memory_order_relaxed)) {
                emit_warning(WarningKind::IntegerOverflow, "NAs produced by integer overflow");
            }
        }

        template<typename T, typename Kernel>
        Vector arithmetic_loop(const column_t<T>& x, const column_t<T>& y, const Alignment& alignment,
                               ArithmeticFlags& flags, Kernel kernel) {
            column_t<T> out(alignment.length());
            for_each(alignment.length(), [&](size_t i) {
                const auto& l = x[alignment.index_a(i)];
                const auto& r = y[alignment.index_b(i)];
                if (l && r) out[i] = kernel(*l, *r, flags);
            });
            return Vector{std::move(out)};
        }

        template<typename T>
        Vector arithmetic(BinaryOp op, const column_t<T>& x, const column_t<T>& y, const Alignment& alignment,
                          ArithmeticFlags& flags) {
            using Ops = ElementOps<T>;
            switch (op) {
                case BinaryOp::Add: return arithmetic_loop(x, y, alignment, flags, &Ops::add);
                case BinaryOp::Subtract: return arithmetic_loop(x, y, alignment, flags, &Ops::subtract);
                case BinaryOp::Multiply: return arithmetic_loop(x, y, alignment, flags, &Ops::multiply);
                case BinaryOp::Modulo: return arithmetic_loop(x, y, alignment, flags, &Ops::modulo);
                case BinaryOp::IntDivide: return arithmetic_loop(x, y, alignment, flags, &Ops::floor_divide);
                case BinaryOp::Divide:
                case BinaryOp::Power:
                    if constexpr (std::same_as<T, av_float>) {
                        return op == BinaryOp::Divide ? arithmetic_loop(x, y, alignment, flags, &Ops::divide)
                                                      : arithmetic_loop(x, y, alignment, flags, &Ops::power);
                    }
                    break;
                default:
                    break;
            }
            throw_error<InvalidOperandError>("operator {} is not arithmetic over {}", op_symbol(op), kind_of_v<T>);
        }

        Vector arithmetic(BinaryOp op, const Vector& a, const Vector& b, const Alignment& alignment,
                          ArithmeticFlags& flags) {
            if (a.kind() == ElementKind::Character || b.kind() == ElementKind::Character) {
                throw_error<InvalidOperandError>("non-numeric argument to binary operator {}", op_symbol(op));
            }
            ElementKind kind = higher_kind(higher_kind(a.kind(), b.kind()), ElementKind::Integer);
            if (op == BinaryOp::Divide || op == BinaryOp::Power) kind = ElementKind::Double;

            std::optional<Vector> a_holder;
            std::optional<Vector> b_holder;
            const Vector& x = with_kind(a, kind, a_holder);
            const Vector& y = with_kind(b, kind, b_holder);
            if (kind == ElementKind::Integer) {
                return arithmetic(op, x.data<av_int>(), y.data<av_int>(), alignment, flags);
            }
            return arithmetic(op, x.data<av_float>(), y.data<av_float>(), alignment, flags);
        }

        bool holds(BinaryOp op, int order) {
            switch (op) {
                case BinaryOp::Less: return order < 0;
                case BinaryOp::LessEqual: return order <= 0;
                case BinaryOp::Greater: return order > 0;
                case BinaryOp::GreaterEqual: return order >= 0;
                case BinaryOp::Equal: return order == 0;
                case BinaryOp::NotEqual: return order != 0;
                default: break;
            }
            throw_error<InvalidOperandError>("operator {} is not a comparison", op_symbol(op));
        }

        Vector comparison(BinaryOp op, const Vector& a, const Vector& b, const Alignment& alignment) {
            ElementKind kind = higher_kind(a.kind(), b.kind());
            std::optional<Vector> a_holder;
            std::optional<Vector> b_holder;
            const Vector& x = with_kind(a, kind, a_holder);
            const Vector& y = with_kind(b, kind, b_holder);

            column_t<av_bool> out(alignment.length());
            x.visit([&](const auto& left) {
                using T = typename std::decay_t<decltype(left)>::value_type::value_type;
                const auto& right = y.data<T>();
                for_each(alignment.length(), [&](size_t i) {
                    const auto& l = left[alignment.index_a(i)];
                    const auto& r = right[alignment.index_b(i)];
                    if (!l || !r) return;
                    if (auto order = ElementOps<T>::compare(*l, *r)) out[i] = holds(op, *order);
                });
            });
            return Vector{std::move(out)};
        }

        Vector logical(BinaryOp op, const Vector& a, const Vector& b, const Alignment& alignment) {
            if (a.kind() != ElementKind::Logical || b.kind() != ElementKind::Logical) {
                throw_error<InvalidOperandError>("operator {} requires logical operands, got {} and {}", op_symbol(op),
                                                 a.kind(), b.kind());
            }
            const auto& x = a.data<av_bool>();
            const auto& y = b.data<av_bool>();
            column_t<av_bool> out(alignment.length());
            for_each(alignment.length(), [&](size_t i) {
                const auto& l = x[alignment.index_a(i)];
                const auto& r = y[alignment.index_b(i)];
                out[i] = op == BinaryOp::And ? logical_and(l, r) : logical_or(l, r);
            });
            return Vector{std::move(out)};
        }

        // Round half away from zero to digits decimal places
        double round_digits(double value, av_int digits) {
            if (!std::isfinite(value)) return value;
            if (digits > 308) return value;
            if (digits < -308) return std::copysign(0.0, value);
            double scale = std::pow(10.0, static_cast<double>(std::abs(digits)));
            if (digits >= 0) {
                double scaled = value * scale;
                if (!std::isfinite(scaled)) return value;
                return std::round(scaled) / scale;
            }
            return std::round(value / scale) * scale;
        }
    } // namespace

    const char* op_symbol(BinaryOp op) {
        for (const auto& [candidate, symbol] : op_symbols) {
            if (candidate == op) return symbol.data();
        }
        return "?";
    }

    BinaryOp parse_op(std::string_view symbol) {
        for (const auto& [op, candidate] : op_symbols) {
            if (candidate == symbol) return op;
        }
        throw_error<InvalidArgumentError>("unknown operator '{}'", symbol);
    }

    namespace detail {
        std::optional<name_list_t> result_names(std::initializer_list<const Vector*> operands, size_t length) {
            for (const Vector* operand : operands) {
                if (operand->has_names() && operand->length() == length) return operand->names();
            }
            return std::nullopt;
        }
    } // namespace detail

    Vector binary_op(BinaryOp op, const Vector& a, const Vector& b) {
        auto alignment = align(a.length(), b.length());
        ArithmeticFlags flags;

        Vector result = is_arithmetic(op)   ? arithmetic(op, a, b, alignment, flags)
                        : is_comparison(op) ? comparison(op, a, b, alignment)
                                            : logical(op, a, b, alignment);

        if (auto names = detail::result_names({&a, &b}, alignment.length())) result.set_names(std::move(*names));
        alignment.report();
        report_overflow(flags);
        return result;
    }

    Vector binary_op(std::string_view op, const Vector& a, const Vector& b) {
        return binary_op(parse_op(op), a, b);
    }

    Vector negate(const Vector& v) {
        if (v.kind() == ElementKind::Character) {
            throw_error<InvalidOperandError>("invalid argument to unary minus: {}", v.kind());
        }
        ArithmeticFlags flags;
        Vector result = v.kind() == ElementKind::Double
                            ? unary_apply<av_float>(v, [&flags](const std::optional<av_float>& x) {
                                  return x ? ElementOps<av_float>::negate(*x, flags) : std::nullopt;
                              })
                            : unary_apply<av_int>(v, [&flags](const std::optional<av_int>& x) {
                                  return x ? ElementOps<av_int>::negate(*x, flags) : std::nullopt;
                              });
        report_overflow(flags);
        return result;
    }

    Vector logical_not(const Vector& v) {
        switch (v.kind()) {
            case ElementKind::Logical:
                return unary_apply<av_bool>(v, [](const std::optional<av_bool>& x) -> std::optional<av_bool> {
                    if (!x) return std::nullopt;
                    return !*x;
                });
            case ElementKind::Integer:
            case ElementKind::Double:
                return unary_apply<av_float>(v, [](const std::optional<av_float>& x) -> std::optional<av_bool> {
                    if (!x || std::isnan(*x)) return std::nullopt;
                    return *x == 0.0;
                });
            case ElementKind::Character:
                break;
        }
        throw_error<InvalidOperandError>("invalid argument type for logical negation: {}", v.kind());
    }

    Vector is_na(const Vector& v) {
        column_t<av_bool> out(v.length());
        v.visit([&out](const auto& column) {
            for_each(column.size(), [&](size_t i) { out[i] = !column[i].has_value(); });
        });
        Vector result{std::move(out)};
        if (v.has_names()) result.set_names(v.names());
        return result;
    }

    Vector round_to(const Vector& v, int decimals) {
        return round_to(v, Vector::integer({decimals}));
    }

    Vector round_to(const Vector& v, const Vector& decimals) {
        if (v.kind() == ElementKind::Character) {
            throw_error<InvalidOperandError>("non-numeric argument to round_to: {}", v.kind());
        }
        if (decimals.kind() == ElementKind::Character) {
            throw_error<InvalidOperandError>("non-numeric decimals for round_to: {}", decimals.kind());
        }
        return elementwise_apply<av_float, av_float>(
            [](const std::optional<av_float>& x, const std::optional<av_float>& digits) -> std::optional<av_float> {
                if (!x || !digits || std::isnan(*digits)) return std::nullopt;
                double places = std::trunc(std::clamp(*digits, -400.0, 400.0));
                return round_digits(*x, static_cast<av_int>(places));
            },
            v, decimals);
    }

} // namespace atomvec
