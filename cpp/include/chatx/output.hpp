// ==============================================================================
// chatx/output.hpp - Пользовательский вывод и файловые приёмники
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Уровни сообщений: [+] info, [!] warn, [x] error, [*] debug, [~] trace
// - Цветной вывод (ANSI escape codes) на TTY
// - Таблица для итоговой сводки прогона
// - JSONL / JSON файлы результатов (messages.jsonl, run_report.json, ...)
//
// ==============================================================================

#ifndef CHATX_OUTPUT_HPP
#define CHATX_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace chatx::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;      // -q: подавить info/warn
    int verbose = 0;         // -v: уровень подробности (0..2+)
    bool no_banner = false;  // --no-banner: скрыть баннер
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------
//
// Методы потокобезопасны: воркеры вложений пишут предупреждения параллельно.
//

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    void write_unlocked(Stream s, std::string_view bytes);
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    OutputConfig config_;
    std::mutex mutex_;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц (сводка прогона)
// ----------------------------------------------------------------------------

class Table {
public:
    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу в stderr через Writer (если не quiet)
    void print(Writer& w) const;

    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::vector<size_t> column_widths() const;
    std::string format_line(const std::vector<size_t>& widths, const char* left,
                            const char* middle, const char* right) const;
    std::string format_row(const std::vector<size_t>& widths,
                           const std::vector<std::string>& cells) const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// JsonlFile - построчный JSON файл (messages.jsonl, messages_bad.jsonl)
// ----------------------------------------------------------------------------

class JsonlFile {
public:
    JsonlFile() = default;
    ~JsonlFile();

    JsonlFile(const JsonlFile&) = delete;
    JsonlFile& operator=(const JsonlFile&) = delete;

    /// Открыть (создать/перезаписать) файл; создаёт родительские каталоги
    bool open(const std::filesystem::path& path);

    /// Записать одну строку JSON; false при ошибке записи
    bool write(const rapidjson::Value& value);

    /// Закрыть с flush; false если fclose/fflush вернули ошибку
    bool close();

    bool is_open() const { return file_ != nullptr; }
    size_t lines() const { return lines_; }
    const std::filesystem::path& path() const { return path_; }

private:
    FILE* file_ = nullptr;
    std::filesystem::path path_;
    size_t lines_ = 0;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Сериализовать JSON в компактную строку
std::string to_json(const rapidjson::Value& value);

/// Сериализовать JSON с отступами
std::string to_json_pretty(const rapidjson::Value& value);

/// Записать pretty JSON в файл целиком (через временный файл + rename)
bool write_json_file(const std::filesystem::path& path, const rapidjson::Value& value);

std::string ansi_color_code(Color color);
std::string ansi_reset_code();

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace chatx::output

#endif  // CHATX_OUTPUT_HPP
