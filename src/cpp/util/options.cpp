#include <atomvec/util/options.h>
#include <atomvec/util/errors.h>

#include <charconv>
#include <cstdlib>
#include <string_view>
#include <thread>

namespace atomvec {

    namespace {
        template<typename T>
        T parse_number(const char* variable, std::string_view text) {
            T value{};
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || end != text.data() + text.size()) {
                throw_error<InvalidArgumentError>("{}: expected a non-negative integer, got '{}'", variable, text);
            }
            return value;
        }
    } // namespace

    const char* to_string(ExecPolicy policy) {
        switch (policy) {
            case ExecPolicy::serial: return "serial";
            case ExecPolicy::threads: return "threads";
        }
        return "unknown";
    }

    ExecPolicy from_string(std::type_identity<ExecPolicy>, const std::string& text) {
        if (text == "serial") return ExecPolicy::serial;
        if (text == "threads") return ExecPolicy::threads;
        throw_error<InvalidArgumentError>("invalid exec policy: '{}'", text);
    }

    void EngineOptions::apply_environment() {
        EngineOptions updated{*this};

        if (const char* exec = std::getenv("ATOMVEC_EXEC")) {
            updated.exec_policy = from_string(std::type_identity<ExecPolicy>{}, exec);
        }
        if (const char* threshold = std::getenv("ATOMVEC_PARALLEL_THRESHOLD")) {
            updated.parallel_threshold = parse_number<size_t>("ATOMVEC_PARALLEL_THRESHOLD", threshold);
        }
        if (const char* threads = std::getenv("ATOMVEC_MAX_THREADS")) {
            updated.max_threads = parse_number<size_t>("ATOMVEC_MAX_THREADS", threads);
        }
        if (const char* digits = std::getenv("ATOMVEC_DIGITS")) {
            int value = parse_number<int>("ATOMVEC_DIGITS", digits);
            if (value < 1 || value > 17) {
                throw_error<InvalidArgumentError>("ATOMVEC_DIGITS: must be between 1 and 17, got {}", value);
            }
            updated.character_digits = value;
        }
        if (std::getenv("ATOMVEC_QUIET") != nullptr) {
            updated.warnings_enabled = false;
        }

        // Only commit once every variable parsed
        *this = updated;
    }

    size_t EngineOptions::worker_count() const {
        if (max_threads > 0) return max_threads;
        auto hardware = static_cast<size_t>(std::thread::hardware_concurrency());
        return hardware > 0 ? hardware : 1;
    }

    EngineOptions& options() {
        static EngineOptions instance;
        return instance;
    }

} // namespace atomvec
