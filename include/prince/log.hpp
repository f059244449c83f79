#ifndef PRINCE_LOG_HPP
#define PRINCE_LOG_HPP

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace prince {

// Shared "prince" logger. A host that registers its own logger under this
// name before the first conversion gets its sinks used instead.
inline std::shared_ptr<spdlog::logger> logger() {
    static const char* const name = "prince";
    std::shared_ptr<spdlog::logger> l = spdlog::get(name);
    if (l) return l;
    try {
        return spdlog::stderr_color_mt(name);
    } catch (const spdlog::spdlog_ex&) {
        // lost the registration race against another thread
        return spdlog::get(name);
    }
}

} // namespace prince

#endif // PRINCE_LOG_HPP
