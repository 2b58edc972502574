#include "guactoken/cli_colors.hpp"

#include <cstdio>
#include <iostream>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
#else
    #include <unistd.h>
#endif

namespace guactoken::cli {

namespace {
    bool g_override_set = false;
    bool g_override_value = true;

    bool StreamIsTty(std::ostream& os) {
        if (&os == &std::cout) {
            return isatty(fileno(stdout)) != 0;
        }
        if (&os == &std::cerr) {
            return isatty(fileno(stderr)) != 0;
        }
        return false;
    }
}

bool ColorsEnabled(std::ostream& os) {
    if (g_override_set) {
        return g_override_value;
    }
    return StreamIsTty(os);
}

void SetColorsEnabled(bool enabled) {
    g_override_set = true;
    g_override_value = enabled;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

void PrintError(const std::string& message) {
    std::cerr << BoldRed("Error:") << " " << message << "\n";
}

void PrintWarning(const std::string& message) {
    std::cerr << BoldYellow("Warning:") << " " << message << "\n";
}

void PrintInfo(const std::string& message) {
    std::cerr << Cyan(message) << "\n";
}

}  // namespace guactoken::cli
