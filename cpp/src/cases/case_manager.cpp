// ==============================================================================
// case_manager.cpp - Управление делами
// ==============================================================================

#include "evidex/case_manager.hpp"

#include "evidex/errors.hpp"
#include "evidex/platform.hpp"

namespace evidex::cases {

CaseManager::CaseManager(store::Database& db, std::string user_name)
    : cases_(db), files_(db), audit_(db), user_name_(std::move(user_name)) {}

std::int64_t CaseManager::create_case(store::NewCase data) {
    if (data.case_number.empty()) {
        data.case_number = cases_.next_case_number(platform::current_year());
    }

    std::int64_t case_id = cases_.create_case(data);

    rapidjson::Document details(rapidjson::kObjectType);
    auto& alloc = details.GetAllocator();
    details.AddMember("case_number", rapidjson::Value(data.case_number.c_str(), alloc), alloc);
    audit_.log_action("create_case", case_id, user_name_, &details);
    return case_id;
}

std::optional<store::Case> CaseManager::open_case(std::int64_t case_id) {
    auto c = cases_.get_case(case_id);
    if (c) {
        audit_.log_action("open_case", case_id, user_name_);
    }
    return c;
}

void CaseManager::close_case(std::int64_t case_id) {
    if (!cases_.set_status(case_id, store::CaseStatus::Closed)) {
        throw Error(ErrorKind::NotFound, "case " + std::to_string(case_id) + " not found");
    }
    audit_.log_action("close_case", case_id, user_name_);
}

std::optional<CaseSummary> CaseManager::summary(std::int64_t case_id) {
    auto c = cases_.get_case(case_id);
    if (!c) {
        return std::nullopt;
    }

    CaseSummary s;
    s.info = std::move(*c);
    s.statistics = cases_.statistics(case_id);
    s.recent_files = files_.get_files_by_case(case_id);
    if (s.recent_files.size() > SUMMARY_RECENT_FILES) {
        s.recent_files.resize(SUMMARY_RECENT_FILES);
    }
    s.flagged_files = files_.get_files_by_case(case_id, true);
    return s;
}

}  // namespace evidex::cases
