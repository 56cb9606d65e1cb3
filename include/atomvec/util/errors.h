#ifndef ATOMVEC_UTIL_ERRORS_H
#define ATOMVEC_UTIL_ERRORS_H

#include <fmt/format.h>

#include <concepts>
#include <stdexcept>
#include <string>
#include <string_view>

namespace atomvec {

    /**
     * VectorError - Root of every fatal error raised by the engine.
     *
     * A VectorError aborts the single operation that raised it; the operands
     * (including the target of an assignment) are left unmodified.
     */
    struct VectorError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Positive and negative positions in one index specification.
    struct MixedSignIndexError : VectorError {
        using VectorError::VectorError;
    };

    // Zero step over a non-empty range, wrong-sign step or non-finite bounds.
    struct InvalidStepError : VectorError {
        using VectorError::VectorError;
    };

    // A zero-length operand paired with a non-zero-length operand.
    struct IncompatibleLengthError : VectorError {
        using VectorError::VectorError;
    };

    struct InvalidIndexError : VectorError {
        using VectorError::VectorError;
    };

    // Operand kind not supported by the operation (e.g. arithmetic on character).
    struct InvalidOperandError : VectorError {
        using VectorError::VectorError;
    };

    // Conversion requested down the kind lattice.
    struct CoercionError : VectorError {
        using VectorError::VectorError;
    };

    struct InvalidArgumentError : VectorError {
        using VectorError::VectorError;
    };

    template<typename Error = VectorError>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] auto throw_error(std::string_view msg) {
        throw Error{std::string(msg)};
    }

    // Formats the message from args and throws Error
    template<typename Error = VectorError, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace atomvec

#endif // ATOMVEC_UTIL_ERRORS_H
