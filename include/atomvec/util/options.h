#ifndef ATOMVEC_UTIL_OPTIONS_H
#define ATOMVEC_UTIL_OPTIONS_H

#include <atomvec/atomvec_export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

namespace atomvec {

    enum class ExecPolicy : uint8_t {
        serial,
        threads,
    };

    [[nodiscard]] ATOMVEC_EXPORT const char* to_string(ExecPolicy policy);
    [[nodiscard]] ATOMVEC_EXPORT ExecPolicy from_string(std::type_identity<ExecPolicy>, const std::string& text);

    /**
     * EngineOptions - Process wide engine configuration.
     *
     * Options are read by operations when they start; change them only while no
     * operation is running (typically at startup, or from a ScopedOptions in tests).
     *
     * Environment overrides (see apply_environment):
     *   ATOMVEC_EXEC                serial | threads
     *   ATOMVEC_PARALLEL_THRESHOLD  minimum length before elementwise work is split
     *   ATOMVEC_MAX_THREADS         worker cap, 0 uses std::thread::hardware_concurrency
     *   ATOMVEC_DIGITS              significant digits when rendering doubles as text (1-17)
     *   ATOMVEC_QUIET               when set, the default warning handler prints nothing
     */
    struct ATOMVEC_EXPORT EngineOptions {
        ExecPolicy exec_policy{ExecPolicy::serial};
        size_t parallel_threshold{65536};
        size_t max_threads{0};
        int character_digits{15};
        bool warnings_enabled{true};

        // Overrides fields from ATOMVEC_* environment variables, throws InvalidArgumentError on bad values
        void apply_environment();

        [[nodiscard]] size_t worker_count() const;

        [[nodiscard]] bool operator==(const EngineOptions& other) const = default;
    };

    [[nodiscard]] ATOMVEC_EXPORT EngineOptions& options();

    /**
     * ScopedOptions - Restores the options in effect at construction when destroyed.
     */
    class ATOMVEC_EXPORT ScopedOptions {
    public:
        ScopedOptions() : _saved{options()} {}
        explicit ScopedOptions(const EngineOptions& replacement) : _saved{options()} { options() = replacement; }
        ~ScopedOptions() { options() = _saved; }

        ScopedOptions(const ScopedOptions&) = delete;
        ScopedOptions& operator=(const ScopedOptions&) = delete;

    private:
        EngineOptions _saved;
    };

} // namespace atomvec

#endif // ATOMVEC_UTIL_OPTIONS_H
