#ifndef ATOMVEC_UTIL_WARNINGS_H
#define ATOMVEC_UTIL_WARNINGS_H

#include <atomvec/atomvec_export.h>

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <vector>

namespace atomvec {

    enum class WarningKind : uint8_t {
        RecycleLength,
        IntegerOverflow,
    };

    [[nodiscard]] ATOMVEC_EXPORT const char* to_string(WarningKind kind);

    /**
     * Warning - A non-fatal condition raised while computing a result.
     *
     * Warnings always accompany a fully computed result; they are advisory.
     */
    struct Warning {
        WarningKind kind;
        std::string message;

        [[nodiscard]] bool operator==(const Warning& other) const = default;
    };

    /**
     * WarningHandler - Receives warnings raised on the current thread.
     */
    struct ATOMVEC_EXPORT WarningHandler {
        virtual ~WarningHandler() = default;

        virtual void on_warning(const Warning& warning) = 0;
    };

    /**
     * StderrWarningHandler - Default handler, writes "Warning: <message>" to std::cerr.
     *
     * Output is suppressed when options().warnings_enabled is false.
     */
    struct ATOMVEC_EXPORT StderrWarningHandler final : WarningHandler {
        void on_warning(const Warning& warning) override;
    };

    /**
     * CollectingWarningHandler - Keeps every warning it receives, in order.
     */
    class ATOMVEC_EXPORT CollectingWarningHandler final : public WarningHandler {
    public:
        void on_warning(const Warning& warning) override;

        [[nodiscard]] const std::vector<Warning>& warnings() const { return _warnings; }
        [[nodiscard]] size_t count(WarningKind kind) const;
        [[nodiscard]] bool empty() const { return _warnings.empty(); }
        void clear() { _warnings.clear(); }

    private:
        std::vector<Warning> _warnings;
    };

    /**
     * ScopedWarningHandler - Installs a handler for the current thread until destroyed.
     *
     * Scopes nest; the previous handler is restored on destruction.
     */
    class ATOMVEC_EXPORT ScopedWarningHandler {
    public:
        explicit ScopedWarningHandler(WarningHandler& handler);
        ~ScopedWarningHandler();

        ScopedWarningHandler(const ScopedWarningHandler&) = delete;
        ScopedWarningHandler& operator=(const ScopedWarningHandler&) = delete;

    private:
        WarningHandler* _previous;
    };

    // The handler active on the calling thread (the stderr handler when none is installed)
    [[nodiscard]] ATOMVEC_EXPORT WarningHandler& current_warning_handler();

    ATOMVEC_EXPORT void emit_warning(const Warning& warning);

    template<typename... Ts>
    void emit_warning(WarningKind kind, fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        emit_warning(Warning{kind, fmt::format(fmt_str, std::forward<Ts>(xs)...)});
    }

} // namespace atomvec

template<>
struct fmt::formatter<atomvec::Warning> : fmt::formatter<fmt::string_view> {
    template<typename FormatContext>
    auto format(const atomvec::Warning& w, FormatContext& ctx) const {
        return fmt::formatter<fmt::string_view>::format(
            fmt::format("{}: {}", atomvec::to_string(w.kind), w.message), ctx);
    }
};

#endif // ATOMVEC_UTIL_WARNINGS_H
