// ==============================================================================
// evidex/config.hpp - Конфигурация evidex (YAML)
// ==============================================================================
//
// Назначение:
// - Settings: значения по умолчанию для БД, приёма, анализа и вывода
// - load(): чтение YAML-файла с проверкой типов
//
// Неизвестные ключи игнорируются. Значение неверного типа - ошибка загрузки.
// Флаги командной строки перекрывают значения из файла.
//
// ==============================================================================

#ifndef EVIDEX_CONFIG_HPP
#define EVIDEX_CONFIG_HPP

#include "evidex/analysis.hpp"
#include "evidex/database.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace evidex::config {

struct IngestSettings {
    unsigned workers = 0;  // 0 - число аппаратных потоков
    std::chrono::milliseconds entry_read_timeout{0};
    std::string extract_prefix = "evidex_extract_";
};

struct LoggingSettings {
    int verbose = 0;
    bool quiet = false;
};

struct Settings {
    store::DatabaseOptions database;
    IngestSettings ingest;
    analysis::AnalysisFeatures analysis;
    std::string user_name = "System";
    LoggingSettings logging;
};

struct LoadResult {
    bool ok = false;
    Settings settings;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Загрузить настройки из YAML-файла
LoadResult load(const std::filesystem::path& path);

/// Разобрать YAML из строки (source - имя для сообщений)
LoadResult parse(const std::string& yaml, const std::string& source = "<string>");

}  // namespace evidex::config

#endif  // EVIDEX_CONFIG_HPP
