// ==============================================================================
// search.cpp - Криминалистический поиск по файлам дела
// ==============================================================================

#include "evidex/search.hpp"

#include "evidex/errors.hpp"
#include "evidex/output.hpp"
#include "evidex/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <unordered_map>

namespace evidex::search {

namespace {

/// Дата файла: date_taken, иначе date_created, иначе date_modified
std::optional<std::string> effective_date(const store::EvidenceFile& file) {
    const std::optional<std::string>* candidates[] = {&file.date_taken, &file.date_created,
                                                      &file.date_modified};
    for (const auto* c : candidates) {
        if (*c && c->value().size() >= 10) {
            return c->value().substr(0, 10);
        }
    }
    return std::nullopt;
}

/// YYYY-MM-DD сравниваются лексикографически
bool well_formed_date(const std::string& s) {
    if (s.size() < 10 || s[4] != '-' || s[7] != '-') {
        return false;
    }
    for (std::size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (s[i] < '0' || s[i] > '9') {
            return false;
        }
    }
    return true;
}

bool in_date_range(const store::EvidenceFile& file, const SearchCriteria& criteria) {
    auto date = effective_date(file);
    if (!date || !well_formed_date(*date)) {
        return false;
    }
    if (criteria.date_from && *date < criteria.date_from->substr(0, 10)) {
        return false;
    }
    if (criteria.date_to && *date > criteria.date_to->substr(0, 10)) {
        return false;
    }
    return true;
}

void rank(std::vector<SearchMatch>& results) {
    std::stable_sort(results.begin(), results.end(),
                     [](const SearchMatch& a, const SearchMatch& b) {
                         return a.match_count > b.match_count;
                     });
}

}  // namespace

bool contains_ci(const std::string& text, const std::string& term) {
    if (text.empty() || term.empty()) {
        return false;
    }
    return platform::to_lower_ascii(text).find(platform::to_lower_ascii(term)) != std::string::npos;
}

std::string face_match_explanation(double confidence) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "Face match: %.1f%% confidence", confidence);
    return buf;
}

// ----------------------------------------------------------------------------
// SearchEngine
// ----------------------------------------------------------------------------

SearchEngine::SearchEngine(store::Database& db, IdentityMatcher* matcher, output::Writer* log)
    : db_(db), matcher_(matcher), log_(log) {}

void SearchEngine::require_case(std::int64_t case_id) {
    store::CaseRepository cases(db_);
    if (!cases.get_case(case_id)) {
        throw Error(ErrorKind::NotFound, "case " + std::to_string(case_id) + " not found");
    }
}

SearchMatch SearchEngine::evaluate(const store::EvidenceFile& file, const SearchCriteria& criteria) {
    SearchMatch m;
    m.file = file;
    const std::string text = file.ocr_text.value_or("");

    auto hit = [&m](std::string explanation) {
        m.explanations.push_back(std::move(explanation));
        ++m.match_count;
    };

    if (criteria.identity && !criteria.identity->empty()) {
        if (contains_ci(file.file_name, *criteria.identity)) {
            hit("Name in filename: " + file.file_name);
        }
        if (contains_ci(text, *criteria.identity)) {
            hit("Name found in file content");
        }
    }

    for (const auto& keyword : criteria.keywords) {
        if (keyword.empty()) {
            continue;
        }
        if (contains_ci(file.file_name, keyword)) {
            hit("Keyword '" + keyword + "' in filename");
        }
        if (contains_ci(text, keyword)) {
            hit("Keyword '" + keyword + "' in content");
        }
        bool tagged = std::any_of(file.ai_tags.begin(), file.ai_tags.end(),
                                  [&](const std::string& tag) { return contains_ci(tag, keyword); });
        if (tagged) {
            hit("Keyword '" + keyword + "' in AI tags");
        }
    }

    if ((criteria.date_from || criteria.date_to) && in_date_range(file, criteria)) {
        hit("File date within search range");
    }
    return m;
}

std::vector<SearchMatch> SearchEngine::search(std::int64_t case_id, const SearchCriteria& criteria,
                                              const io::ProgressCallback& progress) {
    require_case(case_id);

    store::FileRepository repo(db_);
    std::vector<store::EvidenceFile> files = repo.get_files_by_case(case_id);

    // Фильтр категорий ограничивает только текстовые критерии; лица ищутся
    // по всем изображениям дела
    std::vector<const store::EvidenceFile*> candidates;
    candidates.reserve(files.size());
    for (const auto& f : files) {
        if (!criteria.categories || criteria.categories->count(f.file_type) != 0) {
            candidates.push_back(&f);
        }
    }
    if (log_ != nullptr) {
        log_->debug("searching " + std::to_string(candidates.size()) + " files in case " +
                    std::to_string(case_id));
    }

    std::vector<SearchMatch> results;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        SearchMatch m = evaluate(*candidates[i], criteria);
        if (m.match_count > 0) {
            results.push_back(std::move(m));
        }
        if (progress) {
            progress(i + 1, candidates.size(), "Searching: " + candidates[i]->file_name);
        }
    }
    rank(results);

    if (criteria.reference_image) {
        if (matcher_ == nullptr) {
            if (log_ != nullptr) {
                log_->warn("reference image given but no identity matcher is available");
            }
        } else {
            face_pass(files, *criteria.reference_image, results, progress);
            rank(results);
        }
    }

    if (log_ != nullptr) {
        log_->info("Found " + std::to_string(results.size()) + " matching files");
    }
    return results;
}

void SearchEngine::face_pass(const std::vector<store::EvidenceFile>& files,
                             const std::filesystem::path& reference,
                             std::vector<SearchMatch>& results,
                             const io::ProgressCallback& progress) {
    std::vector<const store::EvidenceFile*> images;
    for (const auto& f : files) {
        if (f.file_type == taxonomy::Category::Image) {
            images.push_back(&f);
        }
    }

    std::unordered_map<std::int64_t, std::size_t> position;
    for (std::size_t i = 0; i < results.size(); ++i) {
        position[results[i].file.file_id] = i;
    }

    for (std::size_t i = 0; i < images.size(); ++i) {
        const store::EvidenceFile& image = *images[i];
        try {
            IdentityMatch match = matcher_->match(reference, image);
            if (match.has_match) {
                auto it = position.find(image.file_id);
                if (it == position.end()) {
                    SearchMatch m;
                    m.file = image;
                    m.explanations.push_back(face_match_explanation(match.confidence));
                    m.match_count = 1;
                    m.confidence = match.confidence;
                    position[image.file_id] = results.size();
                    results.push_back(std::move(m));
                } else {
                    SearchMatch& m = results[it->second];
                    m.explanations.push_back(face_match_explanation(match.confidence));
                    ++m.match_count;
                    m.confidence = match.confidence;
                }
            }
        } catch (const std::exception& e) {
            if (log_ != nullptr) {
                log_->error("face matching failed for '" + image.file_name + "' - " + e.what());
            }
        }
        if (progress) {
            progress(i + 1, images.size(), "Matching faces: " + image.file_name);
        }
    }
}

std::vector<SearchMatch> SearchEngine::find_person(std::int64_t case_id,
                                                   const std::filesystem::path& reference_image,
                                                   const io::ProgressCallback& progress) {
    require_case(case_id);
    if (matcher_ == nullptr) {
        throw Error(ErrorKind::NotFound, "no identity matcher is available");
    }

    store::FileRepository repo(db_);
    std::vector<store::EvidenceFile> files = repo.get_files_by_case(case_id);

    std::vector<SearchMatch> results;
    face_pass(files, reference_image, results, progress);
    std::stable_sort(results.begin(), results.end(),
                     [](const SearchMatch& a, const SearchMatch& b) {
                         return a.confidence.value_or(0.0) > b.confidence.value_or(0.0);
                     });
    return results;
}

}  // namespace evidex::search
