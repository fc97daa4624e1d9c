// ==============================================================================
// evidex/repository.hpp - Репозитории дел, файлов улик и журнала аудита
// ==============================================================================
//
// Назначение:
// - Case / EvidenceFile / AuditLogEntry: строки таблиц в типизированном виде
// - CaseRepository: дела, пересчёт денормализованных счётчиков, статистика
// - FileRepository: файлы улик, анализ, пометки, заметки, ленивые хэши
// - AuditRepository: журнал действий (только добавление)
//
// Все изменяющие операции выполняются в Database::transaction().
// Временные метки - строки "YYYY-MM-DD HH:MM:SS" (UTC).
//
// ==============================================================================

#ifndef EVIDEX_REPOSITORY_HPP
#define EVIDEX_REPOSITORY_HPP

#include "evidex/database.hpp"
#include "evidex/taxonomy.hpp"

#include <rapidjson/document.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evidex::store {

// ----------------------------------------------------------------------------
// Case
// ----------------------------------------------------------------------------

enum class CaseStatus { Open, Closed };

const char* case_status_to_string(CaseStatus s);
std::optional<CaseStatus> case_status_from_string(std::string_view s);

struct Case {
    std::int64_t case_id = 0;
    std::string case_number;
    std::string case_name;
    std::optional<std::string> investigator_name;
    std::optional<std::string> agency_name;
    std::optional<std::string> incident_date;
    std::string created_date;
    std::string last_modified;
    CaseStatus status = CaseStatus::Open;
    std::optional<std::string> notes;
    std::optional<std::string> evidence_source_path;
    std::int64_t total_files = 0;    // меняется только recount_statistics()
    std::int64_t total_flagged = 0;
};

struct NewCase {
    std::string case_number;
    std::string case_name;
    std::optional<std::string> investigator_name;
    std::optional<std::string> agency_name;
    std::optional<std::string> incident_date;
    std::optional<std::string> notes;
    std::optional<std::string> evidence_source_path;
};

/// Обновляются только заданные поля
struct CaseUpdate {
    std::optional<std::string> case_name;
    std::optional<std::string> investigator_name;
    std::optional<std::string> agency_name;
    std::optional<std::string> incident_date;
    std::optional<std::string> notes;
    std::optional<std::string> evidence_source_path;
    std::optional<CaseStatus> status;

    bool empty() const {
        return !case_name && !investigator_name && !agency_name && !incident_date && !notes &&
               !evidence_source_path && !status;
    }
};

struct CaseStatistics {
    std::int64_t total_files = 0;
    std::int64_t processed_files = 0;
    std::int64_t flagged_files = 0;
    std::int64_t files_with_faces = 0;
    std::int64_t total_faces = 0;
    std::int64_t unique_dates = 0;
};

// ----------------------------------------------------------------------------
// EvidenceFile
// ----------------------------------------------------------------------------

struct EvidenceFile {
    std::int64_t file_id = 0;
    std::int64_t case_id = 0;
    std::string file_path;
    std::optional<std::string> file_relative_path;
    std::string file_name;
    taxonomy::Category file_type = taxonomy::Category::Other;
    std::int64_t file_size = 0;
    std::optional<std::string> file_hash;  // SHA-256 hex, заполняется лениво
    std::optional<std::string> source_archive;

    std::optional<std::string> date_created;
    std::optional<std::string> date_modified;
    std::optional<std::string> date_accessed;
    std::optional<std::string> date_taken;

    std::optional<double> gps_latitude;
    std::optional<double> gps_longitude;
    std::optional<double> gps_altitude;
    std::optional<std::string> location_name;

    std::optional<std::string> camera_make;
    std::optional<std::string> camera_model;

    bool ai_processed = false;
    std::vector<std::string> ai_tags;  // JSON-массив в БД
    std::optional<double> ai_confidence;
    std::optional<std::string> ocr_text;
    std::int64_t face_count = 0;

    bool is_flagged = false;
    std::optional<std::string> flag_reason;
    std::optional<std::string> analyst_notes;

    std::string imported_date;
    std::optional<std::string> analyzed_date;
};

/// Результат анализа одного файла
struct AnalysisUpdate {
    std::vector<std::string> ai_tags;
    std::optional<double> ai_confidence;
    std::optional<std::string> ocr_text;
    std::int64_t face_count = 0;

    // Метаданные, извлечённые анализатором; null не затирает сохранённое
    std::optional<std::string> date_taken;
    std::optional<double> gps_latitude;
    std::optional<double> gps_longitude;
    std::optional<double> gps_altitude;
    std::optional<std::string> camera_make;
    std::optional<std::string> camera_model;
};

/// Фильтр на стороне SQL; незаданные условия не применяются
struct FileFilter {
    std::optional<std::string> date_from;  // по date_taken, включительно
    std::optional<std::string> date_to;
    std::optional<taxonomy::Category> file_type;
    bool flagged_only = false;
    bool has_faces = false;
    std::optional<std::string> text_contains;  // подстрока ocr_text
    std::optional<std::string> tag_contains;   // подстрока в ai_tags
};

// ----------------------------------------------------------------------------
// AuditLogEntry
// ----------------------------------------------------------------------------

struct AuditLogEntry {
    std::int64_t log_id = 0;
    std::optional<std::int64_t> case_id;
    std::string user_name;
    std::string action;
    std::optional<std::string> details;  // JSON-объект
    std::string timestamp;
};

// ----------------------------------------------------------------------------
// Теги (JSON-массив строк)
// ----------------------------------------------------------------------------

std::string tags_to_json(const std::vector<std::string>& tags);

/// Некорректный JSON или не-массив дают пустой список
std::vector<std::string> tags_from_json(std::string_view json);

// ----------------------------------------------------------------------------
// CaseRepository
// ----------------------------------------------------------------------------

class CaseRepository {
public:
    explicit CaseRepository(Database& db) : db_(db) {}

    /// @throws evidex::Error(DuplicateCaseNumber) если номер занят
    std::int64_t create_case(const NewCase& data);

    std::optional<Case> get_case(std::int64_t case_id);
    std::optional<Case> get_case_by_number(const std::string& case_number);

    /// По убыванию last_modified; nullopt - все статусы
    std::vector<Case> list_cases(std::optional<CaseStatus> status = std::nullopt);

    /// false если дела нет
    bool update_case(std::int64_t case_id, const CaseUpdate& update);
    bool set_status(std::int64_t case_id, CaseStatus status);

    /// Пересчитать total_files / total_flagged по evidence_files.
    /// Идемпотентно. false если дела нет.
    bool recount_statistics(std::int64_t case_id);

    CaseStatistics statistics(std::int64_t case_id);

    /// Следующий номер вида CASE-YYYY-NNNN
    std::string next_case_number(int year);

private:
    Database& db_;
};

// ----------------------------------------------------------------------------
// FileRepository
// ----------------------------------------------------------------------------

class FileRepository {
public:
    explicit FileRepository(Database& db) : db_(db) {}

    /// @throws evidex::Error(ForeignKeyViolation) если дела нет
    std::int64_t add_file(const EvidenceFile& file);

    std::optional<EvidenceFile> get_file(std::int64_t file_id);

    /// date_taken по убыванию, без даты - в конце
    std::vector<EvidenceFile> get_files_by_case(std::int64_t case_id, bool flagged_only = false);

    /// ai_processed = 1, analyzed_date = now. Повторный вызов перезаписывает результат.
    bool update_analysis(std::int64_t file_id, const AnalysisUpdate& update);

    /// is_flagged и flag_reason меняются вместе
    bool flag(std::int64_t file_id, const std::string& reason);
    bool unflag(std::int64_t file_id);

    bool add_note(std::int64_t file_id, const std::string& note);

    /// @throws evidex::Error(Database) если hash не SHA-256 hex
    bool set_hash(std::int64_t file_id, const std::string& sha256_hex);

    std::vector<EvidenceFile> files_missing_hash(std::int64_t case_id);

    /// ai_processed = 0, по возрастанию imported_date
    std::vector<EvidenceFile> get_unprocessed_files(std::int64_t case_id);
    std::int64_t count_unprocessed(std::int64_t case_id);

    std::vector<EvidenceFile> filter_files(std::int64_t case_id, const FileFilter& filter);

private:
    Database& db_;
};

// ----------------------------------------------------------------------------
// AuditRepository
// ----------------------------------------------------------------------------

class AuditRepository {
public:
    explicit AuditRepository(Database& db) : db_(db) {}

    /// details - JSON-объект или null
    std::int64_t log_action(const std::string& action, std::optional<std::int64_t> case_id,
                            const std::string& user_name,
                            const rapidjson::Value* details = nullptr);

    /// По убыванию времени
    std::vector<AuditLogEntry> case_logs(std::int64_t case_id, std::size_t limit = 100);
    std::vector<AuditLogEntry> all_logs(std::size_t limit = 1000);
    std::vector<AuditLogEntry> logs_by_action(const std::string& action, std::size_t limit = 100);

private:
    std::vector<AuditLogEntry> query(const std::string& where, const std::string& param,
                                     std::optional<std::int64_t> id_param, std::size_t limit);

    Database& db_;
};

/// Проверка формата SHA-256 (64 hex-символа в нижнем регистре)
bool is_sha256_hex(std::string_view s);

}  // namespace evidex::store

#endif  // EVIDEX_REPOSITORY_HPP
