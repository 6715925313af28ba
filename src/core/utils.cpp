#include "include/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iostream>
#include <print>

#include <sys/ioctl.h>
#include <unistd.h>

#include "include/config.hpp"

using namespace std::chrono;

std::size_t get_term_width() {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return std::min(static_cast<std::size_t>(w.ws_col), Config::TERM_WIDTH);
    }
    return Config::TERM_WIDTH;
}

void print_line(char fill) {
    std::println("{}", std::string(get_term_width(), fill));
    std::cout << std::flush;
}

std::string to_lower(std::string_view text) {
    std::string ret(text);
    std::ranges::transform(ret, ret.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ret;
}

std::string format_duration(nanoseconds elapsed) {
    if (elapsed < seconds(1)) {
        return std::format("{}ms", duration_cast<milliseconds>(elapsed).count());
    }
    return std::format("{:.3f}s", duration<double>(elapsed).count());
}

std::string truncate_for_display(std::string_view text, std::size_t limit) {
    std::string ret;
    ret.reserve(std::min(text.size(), limit));
    for (char c : trim_sv(text)) {
        if (ret.size() >= limit) {
            ret += "...";
            break;
        }
        ret += (c == '\n' || c == '\r' || c == '\t') ? ' ' : c;
    }
    return ret;
}
