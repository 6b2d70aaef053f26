#include "util/Formatting.hpp"
#include <format>

namespace reprise::util {

namespace {

int utf8_length(unsigned char c) {
    if ((c & 0x80) == 0) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;  // Invalid lead byte, skip it alone
}

} // namespace

std::string format_time(int64_t ms) {
    if (ms < 0) ms = 0;
    int64_t total_seconds = ms / 1000;
    int64_t hours = total_seconds / 3600;
    int64_t minutes = (total_seconds % 3600) / 60;
    int64_t seconds = total_seconds % 60;

    if (hours > 0) {
        return std::format("{:02}:{:02}:{:02}", hours, minutes, seconds);
    }
    return std::format("{:02}:{:02}", minutes, seconds);
}

int display_cols(const std::string& s) {
    int cols = 0;
    for (size_t i = 0; i < s.size(); ) {
        i += utf8_length(static_cast<unsigned char>(s[i]));
        cols++;
    }
    return cols;
}

std::string take_cols(const std::string& s, int cols) {
    if (cols <= 0) return "";

    std::string out;
    out.reserve(s.size());
    int seen = 0;
    size_t i = 0;

    while (i < s.size() && seen < cols) {
        size_t len = utf8_length(static_cast<unsigned char>(s[i]));
        if (i + len > s.size()) len = 1;
        out.append(s, i, len);
        i += len;
        seen++;
    }

    return out;
}

std::string trunc_pad(const std::string& s, int w) {
    if (w <= 0) return "";

    int cols = display_cols(s);

    if (cols == w) {
        return s;
    }

    if (cols < w) {
        return s + std::string(w - cols, ' ');
    }

    if (w <= 1) {
        return take_cols(s, w);
    }

    return take_cols(s, w - 1) + "…";
}

} // namespace reprise::util
