#pragma once

/// @file log.hpp
/// @brief Leveled fmt logging with a runtime threshold.
///
/// Level comes from the MAXWIRE_LOG environment variable
/// (trace|debug|info|warn|error). Lines look like
/// `[2025-01-01 12:00:00.000123][INFO][client][max_client.cpp:88] connected`.

#include <chrono>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/core.h>

namespace svckit::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Off };

inline auto parse_level(const char* env) -> Level {
    if (!env) return Level::Info;
    std::string_view s{env};
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "info")  return Level::Info;
    if (s == "warn")  return Level::Warn;
    if (s == "off")   return Level::Off;
    return Level::Error;
}

inline auto runtime_level() -> Level& {
    static Level level = [] {
        if (const char* env = std::getenv("MAXWIRE_LOG")) {
            return parse_level(env);
        }
#ifdef NDEBUG
        return Level::Info;
#else
        return Level::Debug;
#endif
    }();
    return level;
}

/// Override the threshold (tests silence logs with Level::Off).
inline void set_level(Level level) noexcept {
    runtime_level() = level;
}

[[nodiscard]] constexpr auto to_string(Level lvl) noexcept -> std::string_view {
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off:   break;
    }
    return "OFF";
}

inline auto base_name(std::string_view file) -> std::string_view {
    auto pos = file.find_last_of("/\\");
    return pos == std::string_view::npos ? file : file.substr(pos + 1);
}

template<class... Args>
void write(Level lvl, std::string_view category, const char* file, int line,
           fmt::format_string<Args...> format, Args&&... args) {
    if (lvl < runtime_level()) return;
    auto now = std::chrono::system_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    auto msg = fmt::format(format, std::forward<Args>(args)...);
    std::FILE* out = lvl >= Level::Warn ? stderr : stdout;
    fmt::print(out, "[{:%Y-%m-%d %H:%M:%S}.{:06}][{}][{}][{}:{}] {}\n",
               std::chrono::floor<std::chrono::seconds>(now),
               us % 1000000,
               to_string(lvl), category, base_name(file), line, msg);
}

}  // namespace svckit::log

#define MAXWIRE_LOG_IMPL(level, cat, ...) \
    ::svckit::log::write(::svckit::log::Level::level, cat, __FILE__, __LINE__, __VA_ARGS__)
#define MAXWIRE_LOG_T(cat, ...) MAXWIRE_LOG_IMPL(Trace, cat, __VA_ARGS__)
#define MAXWIRE_LOG_D(cat, ...) MAXWIRE_LOG_IMPL(Debug, cat, __VA_ARGS__)
#define MAXWIRE_LOG_I(cat, ...) MAXWIRE_LOG_IMPL(Info,  cat, __VA_ARGS__)
#define MAXWIRE_LOG_W(cat, ...) MAXWIRE_LOG_IMPL(Warn,  cat, __VA_ARGS__)
#define MAXWIRE_LOG_E(cat, ...) MAXWIRE_LOG_IMPL(Error, cat, __VA_ARGS__)
