#pragma once
#include <cstdio>
#include <string_view>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace tapevm::ansi {
inline constexpr std::string_view red{"\x1b[31m"};
inline constexpr std::string_view green{"\x1b[32m"};
inline constexpr std::string_view yellow{"\x1b[33m"};
inline constexpr std::string_view reset{"\x1b[0m"};

// Escape codes are only emitted when the stream is an interactive terminal.
inline bool enabled(std::FILE* stream) {
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

inline std::string_view paint(std::string_view code, bool on) { return on ? code : ""; }
}  // namespace tapevm::ansi
