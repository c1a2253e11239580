#pragma once

// Shared CLI UI helpers for sitecache
// - ANSI color enablement (TTY/NO_COLOR)
// - Section headers and banners
// - [OK]/[WARN]/[FAIL]/[INFO] status markers
// - Visible-width-safe padding and simple tables
//
// Header-only, no external dependencies.

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <unistd.h>

namespace sitecache::cli::ui {

struct Ansi {
    static constexpr const char* RESET = "\x1b[0m";
    static constexpr const char* BOLD = "\x1b[1m";
    static constexpr const char* DIM = "\x1b[2m";

    static constexpr const char* RED = "\x1b[31m";
    static constexpr const char* GREEN = "\x1b[32m";
    static constexpr const char* YELLOW = "\x1b[33m";
    static constexpr const char* BLUE = "\x1b[34m";
    static constexpr const char* CYAN = "\x1b[36m";
};

inline bool stdout_is_tty() {
    return ::isatty(::fileno(stdout));
}

enum class ColorMode { Auto, ForceOn, ForceOff };

inline ColorMode& color_mode() {
    static ColorMode m = ColorMode::Auto;
    return m;
}

inline void set_color_mode(ColorMode mode) {
    color_mode() = mode;
}

// Colors enabled if NO_COLOR is unset, TERM is not "dumb" and stdout is a TTY
inline bool colors_enabled() {
    ColorMode m = color_mode();
    if (m == ColorMode::ForceOn)
        return true;
    if (m == ColorMode::ForceOff)
        return false;

    if (std::getenv("NO_COLOR"))
        return false;
    const char* term = std::getenv("TERM");
    if (term && std::string_view(term) == "dumb")
        return false;
    return stdout_is_tty();
}

inline std::string colorize(std::string_view s, const char* code) {
    if (!colors_enabled() || code == nullptr || *code == '\0') {
        return std::string(s);
    }
    std::string out;
    out.reserve(s.size() + 16);
    out.append(code);
    out.append(s.data(), s.size());
    out.append(Ansi::RESET);
    return out;
}

inline std::string repeat(char ch, size_t n) {
    return std::string(n, ch);
}

// Visible width of string treating ANSI CSI sequences as zero-width
inline size_t visible_width(std::string_view s) {
    size_t w = 0;
    bool in_esc = false;
    for (unsigned char c : s) {
        if (!in_esc) {
            if (c == 0x1B) {
                in_esc = true;
                continue;
            }
            ++w;
        } else if (c >= 0x40 && c <= 0x7E) {
            in_esc = false;
        }
    }
    return w;
}

inline std::string pad_right(std::string_view s, size_t width, char fill = ' ') {
    size_t vw = visible_width(s);
    std::string out(s);
    if (vw < width)
        out.append(width - vw, fill);
    return out;
}

// Title banner framed by '=' lines
inline std::string title_banner(std::string_view title, size_t width = 40) {
    std::string rule = repeat('=', std::max(width, title.size()));
    std::string text = rule + "\n" + std::string(title) + "\n" + rule;
    return colorize(text, Ansi::BOLD);
}

// Section header: title underlined with '-'
inline std::string section_header(std::string_view title) {
    return colorize(std::string(title), Ansi::CYAN) + "\n" + repeat('-', title.size() + 1);
}

// Status markers
inline std::string status_ok(std::string_view text) {
    return colorize("[OK]", Ansi::GREEN) + " " + std::string(text);
}

inline std::string status_warning(std::string_view text) {
    return colorize("[WARN]", Ansi::YELLOW) + " " + std::string(text);
}

inline std::string status_error(std::string_view text) {
    return colorize("[FAIL]", Ansi::RED) + " " + std::string(text);
}

inline std::string status_info(std::string_view text) {
    return colorize("[INFO]", Ansi::BLUE) + " " + std::string(text);
}

inline std::string key_value(std::string_view key, std::string_view value, int key_width = 0) {
    std::string k = std::string(key) + ":";
    if (key_width > 0) {
        k = pad_right(k, static_cast<size_t>(key_width));
    }
    return k + " " + std::string(value);
}

// Simple table structure for multi-column data
struct Table {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;

    void add_row(const std::vector<std::string>& row) { rows.push_back(row); }
};

// Header, dashed separator, then rows; columns sized to the widest cell
inline void render_table(std::ostream& os, const Table& table) {
    size_t num_cols = table.headers.size();
    if (num_cols == 0)
        return;

    std::vector<size_t> col_widths(num_cols, 0);
    for (size_t i = 0; i < num_cols; ++i) {
        col_widths[i] = visible_width(table.headers[i]);
    }
    for (const auto& row : table.rows) {
        for (size_t i = 0; i < num_cols && i < row.size(); ++i) {
            col_widths[i] = std::max(col_widths[i], visible_width(row[i]));
        }
    }

    auto renderLine = [&](const std::vector<std::string>& cells) {
        os << "  ";
        for (size_t i = 0; i < num_cols; ++i) {
            if (i > 0)
                os << "  ";
            std::string cell = (i < cells.size()) ? cells[i] : "";
            os << pad_right(cell, col_widths[i]);
        }
        os << '\n';
    };

    renderLine(table.headers);
    os << "  ";
    for (size_t i = 0; i < num_cols; ++i) {
        if (i > 0)
            os << "  ";
        os << repeat('-', col_widths[i]);
    }
    os << '\n';
    for (const auto& row : table.rows) {
        renderLine(row);
    }
}

} // namespace sitecache::cli::ui
