// ==============================================================================
// evidex/case_manager.hpp - Управление делами
// ==============================================================================
//
// Назначение:
// - Создание дела с автоматическим номером CASE-YYYY-NNNN
// - Открытие / закрытие дела с записью в журнал аудита
// - Сводка по делу: статистика, последние и помеченные файлы
//
// ==============================================================================

#ifndef EVIDEX_CASE_MANAGER_HPP
#define EVIDEX_CASE_MANAGER_HPP

#include "evidex/repository.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace evidex::cases {

constexpr std::size_t SUMMARY_RECENT_FILES = 10;

struct CaseSummary {
    store::Case info;
    store::CaseStatistics statistics;
    std::vector<store::EvidenceFile> recent_files;   // первые 10 по date_taken
    std::vector<store::EvidenceFile> flagged_files;
};

class CaseManager {
public:
    CaseManager(store::Database& db, std::string user_name);

    /// Пустой case_number заменяется следующим CASE-<год>-NNNN.
    /// Аудит: create_case {"case_number": ...}
    /// @throws evidex::Error(DuplicateCaseNumber)
    std::int64_t create_case(store::NewCase data);

    /// Аудит open_case, если дело найдено
    std::optional<store::Case> open_case(std::int64_t case_id);

    /// status = closed, аудит close_case
    /// @throws evidex::Error(NotFound) если дела нет
    void close_case(std::int64_t case_id);

    std::optional<CaseSummary> summary(std::int64_t case_id);

    const std::string& user_name() const { return user_name_; }

private:
    store::CaseRepository cases_;
    store::FileRepository files_;
    store::AuditRepository audit_;
    std::string user_name_;
};

}  // namespace evidex::cases

#endif  // EVIDEX_CASE_MANAGER_HPP
