#pragma once
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string_view>
#include <utility>

// Console logger for sandcastle_host. Library code logs through the
// SandcastleLogging.hpp categories instead.
//
//   SANDCASTLE_LOG=warn sandcastle_host     # hide info lines

namespace Sandcastle::Log {

enum class Level { Info = 0, Warn, Error };

inline Level threshold() {
    static const Level level = []{
        const char* env = std::getenv("SANDCASTLE_LOG");
        const std::string_view name = env ? env : "info";
        if (name == "error") return Level::Error;
        if (name == "warn")  return Level::Warn;
        return Level::Info;
    }();
    return level;
}

// One line per record: "<date> <time> LEVEL [category] message".
// Warnings and errors go to stderr.
template <class... Args>
void write(Level level, std::string_view category, fmt::format_string<Args...> format, Args&&... args) {
    if (level < threshold())
        return;
    static constexpr std::string_view kNames[] = {"INFO ", "WARN ", "ERROR"};
    std::FILE* out = level == Level::Info ? stdout : stderr;
    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    fmt::print(out, "{:%F %T} {} [{}] {}\n", now, kNames[static_cast<int>(level)], category,
               fmt::format(format, std::forward<Args>(args)...));
    std::fflush(out);
}

} // namespace Sandcastle::Log

#define LOG_I(cat, ...) ::Sandcastle::Log::write(::Sandcastle::Log::Level::Info, cat, __VA_ARGS__)
#define LOG_W(cat, ...) ::Sandcastle::Log::write(::Sandcastle::Log::Level::Warn, cat, __VA_ARGS__)
#define LOG_E(cat, ...) ::Sandcastle::Log::write(::Sandcastle::Log::Level::Error, cat, __VA_ARGS__)
