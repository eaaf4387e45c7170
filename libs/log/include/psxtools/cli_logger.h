#pragma once

#include <algorithm>
#include <iostream>
#include <utility>

namespace psxtools::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

// set_verbosity maps the tools' -v count onto a level, clamped to Debug.
inline void set_verbosity(int level) {
    current_level = static_cast<VerbosityLevel>(std::clamp(level, 0, 2));
}

namespace detail {

template <typename... Args>
void write_line(std::ostream& out, const char* tag, Args&&... args) {
    if (tag) out << '[' << tag << "] ";
    ((out << std::forward<Args>(args) << ' '), ...);
    out << '\n';
}

} // namespace detail

template <typename... Args>
void info(Args&&... args) {
    if (current_level < VerbosityLevel::Verbose) return;
    detail::write_line(std::cerr, "INFO", std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    if (current_level < VerbosityLevel::Debug) return;
    detail::write_line(std::cerr, "DEBUG", std::forward<Args>(args)...);
}

// Warnings and errors ignore the verbosity level.
template <typename... Args>
void warn(Args&&... args) {
    detail::write_line(std::cerr, "WARN", std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args) {
    detail::write_line(std::cerr, "ERROR", std::forward<Args>(args)...);
}

// print writes untagged tool output to stdout.
template <typename... Args>
void print(Args&&... args) {
    detail::write_line(std::cout, nullptr, std::forward<Args>(args)...);
}

} // namespace psxtools::log

#define LOGI(...) ::psxtools::log::info(__VA_ARGS__)
#define LOGW(...) ::psxtools::log::warn(__VA_ARGS__)
#define LOGE(...) ::psxtools::log::error(__VA_ARGS__)

#if PSXTOOLS_DEBUG
    #define LOGD(...) ::psxtools::log::debug(__VA_ARGS__)
#else
    #define LOGD(...) do {} while(false)
#endif
