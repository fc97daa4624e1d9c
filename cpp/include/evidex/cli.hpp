// ==============================================================================
// evidex/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv в ParseResult (глобальные опции + команда)
// - Генерация --help / --version
// - Диагностические ошибки CLI
//
// ==============================================================================

#ifndef EVIDEX_CLI_HPP
#define EVIDEX_CLI_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace evidex::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    std::optional<std::filesystem::path> db;      // --db
    std::optional<std::filesystem::path> config;  // --config
    std::optional<std::filesystem::path> output;  // -o, --output
    std::optional<unsigned> num_threads;          // --num-threads (0 = число CPU)
    bool no_banner = false;                       // --no-banner
    int verbose = 0;                              // -v (повторяемый)
    bool quiet = false;                           // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// detect - определить формат контейнеров
struct DetectCommand {
    std::vector<std::filesystem::path> paths;
    bool json = false;
};

/// index - построить индекс контейнера без распаковки
struct IndexCommand {
    std::filesystem::path archive;
    bool json = false;
};

/// case create
struct CaseCreateCommand {
    std::string name;
    std::optional<std::string> number;        // --number
    std::optional<std::string> investigator;  // --investigator
    std::optional<std::string> agency;        // --agency
    std::optional<std::string> incident_date; // --incident-date
    std::optional<std::string> notes;         // --notes
};

/// case list
struct CaseListCommand {
    std::optional<std::string> status;  // --status open|closed
    bool json = false;
};

/// case show
struct CaseShowCommand {
    std::int64_t case_id = 0;
    bool json = false;
};

/// case close
struct CaseCloseCommand {
    std::int64_t case_id = 0;
};

/// ingest - индекс контейнера в дело
struct IngestCommand {
    std::filesystem::path archive;
    std::int64_t case_id = 0;                     // --case
    std::optional<std::uint64_t> entry_timeout_ms;  // --entry-timeout
    bool json = false;
};

/// extract - полная распаковка и импорт
struct ExtractCommand {
    std::filesystem::path archive;
    std::int64_t case_id = 0;
    std::optional<std::filesystem::path> target;  // -t, --target
    std::vector<std::string> include;             // --include <SUBSTR>
    bool json = false;
};

/// import - импорт директории
struct ImportCommand {
    std::filesystem::path root;
    std::int64_t case_id = 0;
    bool json = false;
};

/// files - файлы дела с фильтрами
struct FilesCommand {
    std::int64_t case_id = 0;
    bool flagged = false;
    bool has_faces = false;
    std::optional<std::string> type;
    std::optional<std::string> from;
    std::optional<std::string> to;
    std::optional<std::string> text;
    std::optional<std::string> tag;
    bool json = false;
};

struct FlagCommand {
    std::int64_t file_id = 0;
    std::string reason;  // --reason
};

struct UnflagCommand {
    std::int64_t file_id = 0;
};

struct NoteCommand {
    std::int64_t file_id = 0;
    std::string text;
};

struct RecountCommand {
    std::int64_t case_id = 0;
};

/// hash - заполнить отсутствующие хэши дела или одного файла
struct HashCommand {
    std::optional<std::int64_t> case_id;  // --case
    std::optional<std::int64_t> file_id;  // --file
};

/// analyze - анализ необработанных файлов дела
struct AnalyzeCommand {
    std::int64_t case_id = 0;
    bool json = false;
};

/// search - поиск по делу
struct SearchCommand {
    std::int64_t case_id = 0;
    std::optional<std::string> name;       // --name
    std::vector<std::string> keywords;     // -k, --keyword
    std::optional<std::string> from;       // --from
    std::optional<std::string> to;         // --to
    std::vector<std::string> types;        // --type
    bool json = false;
};

/// audit - журнал аудита
struct AuditCommand {
    std::optional<std::int64_t> case_id;
    std::optional<std::string> action;
    std::optional<std::size_t> limit;
    bool json = false;
};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

// ----------------------------------------------------------------------------
// Command - вариант команды
// ----------------------------------------------------------------------------

using Command =
    std::variant<HelpCommand, VersionCommand, DetectCommand, IndexCommand, CaseCreateCommand,
                 CaseListCommand, CaseShowCommand, CaseCloseCommand, IngestCommand, ExtractCommand,
                 ImportCommand, FilesCommand, FlagCommand, UnflagCommand, NoteCommand,
                 RecountCommand, HashCommand, AnalyzeCommand, SearchCommand, AuditCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (для команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

std::string render_version();

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Forensic evidence ingestion and indexing";

}  // namespace evidex::cli

#endif  // EVIDEX_CLI_HPP
