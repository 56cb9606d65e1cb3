#include <atomvec/util/warnings.h>
#include <atomvec/util/options.h>

#include <algorithm>
#include <iostream>

namespace atomvec {

    namespace {
        thread_local WarningHandler* current_handler = nullptr;

        StderrWarningHandler& default_handler() {
            static StderrWarningHandler handler;
            return handler;
        }
    } // namespace

    const char* to_string(WarningKind kind) {
        switch (kind) {
            case WarningKind::RecycleLength: return "RecycleLengthWarning";
            case WarningKind::IntegerOverflow: return "IntegerOverflowWarning";
        }
        return "Warning";
    }

    void StderrWarningHandler::on_warning(const Warning& warning) {
        if (!options().warnings_enabled) return;
        std::cerr << fmt::format("Warning: {}", warning.message) << std::endl;
    }

    void CollectingWarningHandler::on_warning(const Warning& warning) {
        _warnings.push_back(warning);
    }

    size_t CollectingWarningHandler::count(WarningKind kind) const {
        return static_cast<size_t>(std::count_if(_warnings.begin(), _warnings.end(),
                                                 [kind](const Warning& w) { return w.kind == kind; }));
    }

    ScopedWarningHandler::ScopedWarningHandler(WarningHandler& handler) : _previous{current_handler} {
        current_handler = &handler;
    }

    ScopedWarningHandler::~ScopedWarningHandler() {
        current_handler = _previous;
    }

    WarningHandler& current_warning_handler() {
        return current_handler ? *current_handler : default_handler();
    }

    void emit_warning(const Warning& warning) {
        current_warning_handler().on_warning(warning);
    }

} // namespace atomvec
