// ==============================================================================
// evidex/output.hpp - Пользовательский вывод и журнал
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Журнал с префиксами: [+] info, [!] warn, [x] error, [*] debug, [~] trace
// - Цветной вывод (ANSI escape codes) при TTY
// - Прогресс-индикатор конвейера (current/total/message)
// - JSON вывод через RapidJSON
// - Таблицы с Unicode box-drawing
//
// Writer потокобезопасен: рабочие потоки пула пишут через него
// предупреждения по отдельным элементам.
//
// ==============================================================================

#ifndef EVIDEX_OUTPUT_HPP
#define EVIDEX_OUTPUT_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <optional>
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

namespace evidex::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // информация
    Yellow,  // предупреждения
    Red,     // ошибки
    Cyan,    // отладка
    Magenta  // трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;           // -q: подавить informational stderr
    int verbose = 0;              // -v: уровень подробности (0..2+)
    bool no_banner = false;       // --no-banner

    // Путь для вывода результатов (--output)
    std::optional<std::filesystem::path> output_path;
};

#ifdef _WIN32
constexpr const char* TICK_CHARS = "-\\|/";
constexpr std::size_t TICK_CHAR_BYTES = 1;
#else
// Braille spinner, 3 байта UTF-8 на символ
constexpr const char* TICK_CHARS = "\xe2\xa0\x8b\xe2\xa0\x99\xe2\xa0\xb9\xe2\xa0\xb8\xe2\xa0\xbc"
                                   "\xe2\xa0\xb4\xe2\xa0\xa6\xe2\xa0\xa7\xe2\xa0\x87\xe2\xa0\x8f";
constexpr std::size_t TICK_CHAR_BYTES = 3;
#endif

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    // Журнал с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только verbose > 1)
    void trace(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    void write_json(const rapidjson::Value& value);
    void write_json_pretty(const rapidjson::Value& value);

    // Прогресс-индикатор
    // -------------------------------------------------------------------------
    //
    // На TTY строка перерисовывается через '\r'. Без TTY, при verbose
    // или quiet прогресс не рисуется.

    void progress_begin(std::string_view label, std::size_t total);

    /// Обновить прогресс; message - текущий элемент ("Indexing: a.jpg")
    void progress_update(std::size_t current, std::size_t total, std::string_view message);

    void progress_end();

    /// Последнее состояние прогресса (для тестов и итоговых сообщений)
    std::size_t progress_current() const;
    bool progress_active() const;

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    bool open_output_file();
    void close_output_file();
    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_impl(Stream s, std::string_view bytes);
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);
    void write_colored(Stream s, std::string_view message, Color color);
    void clear_progress_line();
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;

    // Журнал пишут рабочие потоки; весь вывод сериализован
    mutable std::recursive_mutex mutex_;

    std::string progress_label_;
    std::size_t progress_total_ = 0;
    std::size_t progress_current_ = 0;
    std::size_t progress_ticks_ = 0;
    bool progress_active_ = false;
    bool progress_drawn_ = false;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    void print(Writer& w);
    std::string to_string() const;

    std::size_t row_count() const { return rows_.size(); }

private:
    std::string format_line(char position) const;
    std::string format_row(const std::vector<std::string>& cells) const;
    std::vector<std::size_t> calculate_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Очистить поле для таблицы: \n, \r, \t -> пробел, схлопнуть пробелы.
/// При full_output=false обрезает до limit символов с "..."
std::string format_field(std::string_view field, std::size_t limit, bool full_output);

/// "1.5 MB", "320 B"
std::string format_size(std::uint64_t bytes);

std::string ansi_color_code(Color color);
std::string ansi_reset_code();
bool supports_color(Stream s);

}  // namespace evidex::output

#endif  // EVIDEX_OUTPUT_HPP
