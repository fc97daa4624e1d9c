// ==============================================================================
// output.cpp - Пользовательский вывод и журнал
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr. Байты первичны, std::endl не
// используется. Все публичные методы Writer берут один мьютекс.
//
// ==============================================================================

#include "evidex/output.hpp"

#include "evidex/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace evidex::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Стереть строку терминала (CSI 2K) и вернуть каретку
constexpr const char* ANSI_CLEAR_LINE = "\r\x1b[2K";

// Unicode box-drawing (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼

// Сообщение прогресса обрезается, чтобы строка помещалась в терминал
constexpr std::size_t PROGRESS_MESSAGE_LIMIT = 60;

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    progress_end();
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_impl(s, bytes);
    write_impl(s, "\n");
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    FILE* f = nullptr;
    if (s == Stream::Stdout && output_file_ != nullptr) {
        f = output_file_;
    } else {
        f = get_file(s);
    }

    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    // Прогресс занимает текущую строку stderr: сначала стираем её
    clear_progress_line();
    write_colored(Stream::Stderr, prefix, color);
    write_impl(Stream::Stderr, message);
    write_impl(Stream::Stderr, "\n");
}

void Writer::info(std::string_view message) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    // Ошибки печатаются всегда, даже при --quiet
    write_prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~] ", Color::Magenta, message);
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    // В файл вывода ANSI-коды не пишем
    bool use_color = (s == Stream::Stdout && output_file_ == nullptr && supports_color(s)) ||
                     (s == Stream::Stderr && supports_color(s));

    if (use_color) {
        write_impl(s, ansi_color_code(color));
        write_impl(s, message);
        write_impl(s, ansi_reset_code());
    } else {
        write_impl(s, message);
    }
}

void Writer::write_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_impl(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    flush();
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_impl(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write_impl(Stream::Stdout, "\n");
    flush();
}

// ----------------------------------------------------------------------------
// Прогресс
// ----------------------------------------------------------------------------

void Writer::progress_begin(std::string_view label, std::size_t total) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    progress_label_ = std::string(label);
    progress_total_ = total;
    progress_current_ = 0;
    progress_ticks_ = 0;
    progress_active_ = true;
    progress_drawn_ = false;
}

void Writer::progress_update(std::size_t current, std::size_t total, std::string_view message) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!progress_active_) {
        return;
    }

    progress_current_ = current;
    progress_total_ = total;

    // Рисуем только на TTY и без подробного журнала
    if (config_.verbose > 0 || config_.quiet || !supports_color(Stream::Stderr)) {
        return;
    }

    std::size_t tick_count = std::strlen(TICK_CHARS) / TICK_CHAR_BYTES;
    std::size_t tick = progress_ticks_++ % tick_count;

    std::string line = ANSI_CLEAR_LINE;
    line.append(TICK_CHARS + tick * TICK_CHAR_BYTES, TICK_CHAR_BYTES);
    line += ' ';
    line += progress_label_;
    line += " [";
    line += std::to_string(current);
    // total == 0: размер неизвестен (поток tar)
    if (total > 0) {
        line += '/';
        line += std::to_string(total);
    }
    line += "] ";
    if (message.size() > PROGRESS_MESSAGE_LIMIT) {
        line.append(message.substr(0, PROGRESS_MESSAGE_LIMIT - 3));
        line += "...";
    } else {
        line.append(message);
    }

    write_impl(Stream::Stderr, line);
    std::fflush(stderr);
    progress_drawn_ = true;
}

void Writer::progress_end() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!progress_active_) {
        return;
    }
    clear_progress_line();
    progress_active_ = false;
    progress_label_.clear();
}

std::size_t Writer::progress_current() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return progress_current_;
}

bool Writer::progress_active() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return progress_active_;
}

void Writer::clear_progress_line() {
    if (progress_drawn_) {
        write_impl(Stream::Stderr, ANSI_CLEAR_LINE);
        progress_drawn_ = false;
    }
}

// ----------------------------------------------------------------------------
// Управление
// ----------------------------------------------------------------------------

void Writer::flush() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!config_.output_path.has_value()) {
        return false;
    }

    const auto& path = config_.output_path.value();

#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    std::string path_str = platform::path_to_utf8(path);
    output_file_ = std::fopen(path_str.c_str(), "wb");
#endif

    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<std::size_t> Table::calculate_widths() const {
    std::size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<std::size_t> widths(num_cols, 0);
    for (std::size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], headers_[i].size());
    }
    for (const auto& row : rows_) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }
    return widths;
}

std::string Table::format_line(char position) const {
    // position: 'T' верх, 'M' разделитель заголовка, 'B' низ
    const char* left = position == 'T' ? BOX_TL : (position == 'M' ? BOX_LT : BOX_BL);
    const char* middle = position == 'T' ? BOX_TT : (position == 'M' ? BOX_CROSS : BOX_BT);
    const char* right = position == 'T' ? BOX_TR : (position == 'M' ? BOX_RT : BOX_BR);

    std::vector<std::size_t> widths = calculate_widths();
    std::string line = left;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        for (std::size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        if (i + 1 < widths.size()) {
            line += middle;
        }
    }
    line += right;
    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells) const {
    std::vector<std::size_t> widths = calculate_widths();
    std::string line = BOX_V;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        line += ' ';
        std::string cell = (i < cells.size()) ? cells[i] : "";
        line += cell;
        if (cell.size() < widths[i]) {
            line.append(widths[i] - cell.size(), ' ');
        }
        line += ' ';
        line += BOX_V;
    }
    return line;
}

std::string Table::to_string() const {
    std::string result;
    result += format_line('T');
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_);
        result += '\n';
        result += format_line('M');
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row);
        result += '\n';
    }

    result += format_line('B');
    result += '\n';
    return result;
}

void Table::print(Writer& w) {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_field(std::string_view field, std::size_t limit, bool full_output) {
    std::string result;
    result.reserve(field.size());

    bool prev_space = false;
    for (char c : field) {
        if (c == '\n' || c == '\r' || c == '\t' || c == ' ') {
            if (!prev_space) {
                result += ' ';
                prev_space = true;
            }
            continue;
        }
        result += c;
        prev_space = false;
    }

    if (!full_output && limit > 3 && result.size() > limit) {
        result.resize(limit - 3);
        result += "...";
    }
    return result;
}

std::string format_size(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    return buf;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace evidex::output
