// ==============================================================================
// evidex/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - TTY detection для цветного вывода
// - Временные директории для полной распаковки
// - Время: текущий момент, времена файла, местное время в единый формат
// - Число аппаратных потоков
//
// Платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef EVIDEX_PLATFORM_HPP
#define EVIDEX_PLATFORM_HPP

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <string_view>

namespace evidex::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str);
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Временные директории
// ----------------------------------------------------------------------------

/// Создать уникальную директорию в TMPDIR (или системном temp)
/// Имя: <prefix><random>
/// @throws std::runtime_error при ошибке создания
std::filesystem::path make_temp_directory(std::string_view prefix);

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------
//
// Все временные метки хранятся как "YYYY-MM-DD HH:MM:SS" (UTC), тот же
// формат, что у CURRENT_TIMESTAMP в SQLite. Лексикографическое сравнение
// таких строк совпадает с хронологическим.

/// Текущее время UTC
std::string now_timestamp();

/// Текущий год UTC
int current_year();

/// time_t -> "YYYY-MM-DD HH:MM:SS" (UTC)
std::string format_timestamp(std::time_t t);

/// time_t -> "YYYY-MM-DD HH:MM:SS" в местном времени (для форматов без зоны)
std::string format_local_timestamp(std::time_t t);

/// Времена файла из stat(); пустые строки при ошибке.
/// created - st_ctime (на POSIX это время смены метаданных, не рождения)
struct FileTimes {
    std::string created;
    std::string modified;
    std::string accessed;
};

FileTimes file_times(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// Прочее
// ----------------------------------------------------------------------------

/// std::thread::hardware_concurrency() с фолбэком на 1
unsigned hardware_threads();

/// ASCII lower-case (UTF-8 байты > 0x7F не трогаются)
std::string to_lower_ascii(std::string_view s);

/// "Linux" / "macOS" / "Windows" / "Unknown"
std::string os_name();

}  // namespace evidex::platform

#endif  // EVIDEX_PLATFORM_HPP
