// ==============================================================================
// evidex/search.hpp - Криминалистический поиск по файлам дела
// ==============================================================================
//
// Назначение:
// - SearchCriteria: имя, диапазон дат, ключевые слова, категории, эталонное фото
// - SearchEngine: оценка критериев по каждому файлу и ранжирование
// - IdentityMatcher: внешний сопоставитель лиц
//
// Каждое срабатывание критерия даёт +1 к счётчику и строку пояснения.
// Файл попадает в результат, если счётчик больше нуля. Порядок: по
// убыванию счётчика, при равенстве сохраняется порядок файлов дела.
//
// ==============================================================================

#ifndef EVIDEX_SEARCH_HPP
#define EVIDEX_SEARCH_HPP

#include "evidex/archive.hpp"
#include "evidex/repository.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace evidex::output {
class Writer;
}

namespace evidex::search {

// ----------------------------------------------------------------------------
// IdentityMatcher
// ----------------------------------------------------------------------------

struct IdentityMatch {
    bool has_match = false;
    double confidence = 0.0;  // проценты, 0-100
    std::int64_t match_count = 0;
};

class IdentityMatcher {
public:
    virtual ~IdentityMatcher() = default;

    /// Есть ли на изображении candidate лицо с эталонного фото
    virtual IdentityMatch match(const std::filesystem::path& reference,
                                const store::EvidenceFile& candidate) = 0;
};

// ----------------------------------------------------------------------------
// SearchCriteria / SearchMatch
// ----------------------------------------------------------------------------

struct SearchCriteria {
    std::optional<std::string> identity;
    std::optional<std::string> date_from;  // YYYY-MM-DD, включительно
    std::optional<std::string> date_to;
    std::vector<std::string> keywords;

    /// nullopt - все категории
    std::optional<std::set<taxonomy::Category>> categories;

    std::optional<std::filesystem::path> reference_image;
};

struct SearchMatch {
    store::EvidenceFile file;
    std::vector<std::string> explanations;
    std::int64_t match_count = 0;
    std::optional<double> confidence;  // от сопоставителя лиц
};

/// Подстрока без учёта регистра (ASCII). Пустые строки не совпадают.
bool contains_ci(const std::string& text, const std::string& term);

/// "Face match: 87.5% confidence"
std::string face_match_explanation(double confidence);

// ----------------------------------------------------------------------------
// SearchEngine
// ----------------------------------------------------------------------------

class SearchEngine {
public:
    /// matcher может отсутствовать: проход по лицам тогда пропускается
    SearchEngine(store::Database& db, IdentityMatcher* matcher = nullptr,
                 output::Writer* log = nullptr);

    /// @throws evidex::Error(NotFound) если дела нет
    std::vector<SearchMatch> search(std::int64_t case_id, const SearchCriteria& criteria,
                                    const io::ProgressCallback& progress = {});

    /// Только сопоставление лиц по изображениям дела, по убыванию уверенности
    /// @throws evidex::Error(NotFound) если дела нет или не задан сопоставитель
    std::vector<SearchMatch> find_person(std::int64_t case_id,
                                         const std::filesystem::path& reference_image,
                                         const io::ProgressCallback& progress = {});

    /// Оценка текстовых критериев для одного файла
    static SearchMatch evaluate(const store::EvidenceFile& file, const SearchCriteria& criteria);

private:
    void require_case(std::int64_t case_id);

    /// Проход сопоставителя по изображениям; слияние с results
    void face_pass(const std::vector<store::EvidenceFile>& files,
                   const std::filesystem::path& reference, std::vector<SearchMatch>& results,
                   const io::ProgressCallback& progress);

    store::Database& db_;
    IdentityMatcher* matcher_;
    output::Writer* log_;
};

}  // namespace evidex::search

#endif  // EVIDEX_SEARCH_HPP
