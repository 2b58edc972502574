#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace guactoken::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* CYAN = "\033[0;36m";
    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BOLD_YELLOW = "\033[1;33m";
}

// Auto-detected per stream (TTY or not) until SetColorsEnabled forces it either way
bool ColorsEnabled(std::ostream& os = std::cerr);
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cerr);

inline std::string Cyan(const std::string& text) { return Colorize(text, color::CYAN); }
inline std::string BoldRed(const std::string& text) { return Colorize(text, color::BOLD_RED); }
inline std::string BoldYellow(const std::string& text) { return Colorize(text, color::BOLD_YELLOW); }

// Diagnostics always go to stderr so stdout carries only the token or URL.
void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintInfo(const std::string& message);

}  // namespace guactoken::cli
