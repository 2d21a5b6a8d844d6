// ==============================================================================
// output.cpp - Пользовательский вывод и файловые приёмники
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
// Байты первичны: никаких std::endl, только fwrite.
//
// ==============================================================================

#include "chatx/output.hpp"

#include "chatx/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <system_error>

namespace chatx::output {

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing characters для таблиц
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

FILE* get_file(Stream s) {
    return (s == Stream::Stdout) ? stdout : stderr;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_unlocked(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_unlocked(s, bytes);
    write_unlocked(s, "\n");
}

void Writer::write_unlocked(Stream s, std::string_view bytes) {
    std::fwrite(bytes.data(), 1, bytes.size(), get_file(s));
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (supports_color(Stream::Stderr)) {
        write_unlocked(Stream::Stderr, ansi_color_code(color));
        write_unlocked(Stream::Stderr, prefix);
        write_unlocked(Stream::Stderr, ANSI_RESET);
    } else {
        write_unlocked(Stream::Stderr, prefix);
    }
    write_unlocked(Stream::Stderr, message);
    write_unlocked(Stream::Stderr, "\n");
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    write_prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~] ", Color::Magenta, message);
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::column_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], headers_[i].size());
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }
    return widths;
}

std::string Table::format_line(const std::vector<size_t>& widths, const char* left,
                               const char* middle, const char* right) const {
    std::string line = left;
    for (size_t i = 0; i < widths.size(); ++i) {
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        if (i + 1 < widths.size()) {
            line += middle;
        }
    }
    line += right;
    return line;
}

std::string Table::format_row(const std::vector<size_t>& widths,
                              const std::vector<std::string>& cells) const {
    std::string line = BOX_V;
    for (size_t i = 0; i < widths.size(); ++i) {
        std::string cell = (i < cells.size()) ? cells[i] : "";
        line += ' ';
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
    auto widths = column_widths();
    std::string result;

    result += format_line(widths, BOX_TL, BOX_TT, BOX_TR);
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(widths, headers_);
        result += '\n';
        result += format_line(widths, BOX_LT, BOX_CROSS, BOX_RT);
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(widths, row);
        result += '\n';
    }

    result += format_line(widths, BOX_BL, BOX_BT, BOX_BR);
    result += '\n';
    return result;
}

void Table::print(Writer& w) const {
    if (w.config().quiet) {
        return;
    }
    w.write(Stream::Stderr, to_string());
}

// ----------------------------------------------------------------------------
// JsonlFile
// ----------------------------------------------------------------------------

JsonlFile::~JsonlFile() {
    if (file_ != nullptr) {
        std::fclose(file_);
    }
}

bool JsonlFile::open(const std::filesystem::path& path) {
    if (file_ != nullptr) {
        return false;
    }
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return false;
        }
    }
    file_ = std::fopen(platform::path_to_utf8(path).c_str(), "wb");
    path_ = path;
    lines_ = 0;
    return file_ != nullptr;
}

bool JsonlFile::write(const rapidjson::Value& value) {
    if (file_ == nullptr) {
        return false;
    }
    std::string text = to_json(value);
    text += '\n';
    if (std::fwrite(text.data(), 1, text.size(), file_) != text.size()) {
        return false;
    }
    ++lines_;
    return true;
}

bool JsonlFile::close() {
    if (file_ == nullptr) {
        return true;
    }
    bool ok = std::fflush(file_) == 0;
    ok = (std::fclose(file_) == 0) && ok;
    file_ = nullptr;
    return ok;
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string to_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string to_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

bool write_json_file(const std::filesystem::path& path, const rapidjson::Value& value) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    std::filesystem::path tmp = path;
    tmp += ".tmp";
    std::string text = to_json_pretty(value);
    text += '\n';

    FILE* f = std::fopen(platform::path_to_utf8(tmp).c_str(), "wb");
    if (f == nullptr) {
        return false;
    }
    bool ok = std::fwrite(text.data(), 1, text.size(), f) == text.size();
    ok = (std::fclose(f) == 0) && ok;
    if (!ok) {
        std::filesystem::remove(tmp, ec);
        return false;
    }

    std::filesystem::rename(tmp, path, ec);
    return !ec;
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

}  // namespace chatx::output
