#pragma once

#include <memory>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace FormFusion {
namespace log {

inline constexpr const char* LoggerName = "formfusion";

namespace detail {

/// Registers `created`, or returns the logger someone else registered under
/// the same name in the meantime. If that one is gone again, `created` is
/// used unregistered.
inline std::shared_ptr<spdlog::logger> register_or_adopt(std::shared_ptr<spdlog::logger> created) {
    try {
        spdlog::register_logger(created);
    } catch(const spdlog::spdlog_ex&) {
        if(auto existing = spdlog::get(created->name())) {
            return existing;
        }
    }
    return created;
}

} // namespace detail

/// Library logger. Applications may register their own logger under the name
/// "formfusion" before the first parse to redirect or silence the library.
inline std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if(auto existing = spdlog::get(LoggerName)) {
            return existing;
        }
        auto created = std::make_shared<spdlog::logger>(
            LoggerName, std::make_shared<spdlog::sinks::stderr_sink_mt>());
        created->set_level(spdlog::level::warn);
        return detail::register_or_adopt(std::move(created));
    }();
    return instance;
}

template<class... Args>
void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger()->debug(fmt, std::forward<Args>(args)...);
}

template<class... Args>
void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger()->info(fmt, std::forward<Args>(args)...);
}

template<class... Args>
void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger()->warn(fmt, std::forward<Args>(args)...);
}

template<class... Args>
void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger()->error(fmt, std::forward<Args>(args)...);
}

} // namespace log
} // namespace FormFusion
