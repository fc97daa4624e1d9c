// ==============================================================================
// case_repository.cpp - Репозиторий дел
// ==============================================================================

#include "evidex/repository.hpp"

#include <cstdio>
#include <cstdlib>
#include <functional>

namespace evidex::store {

namespace {

constexpr const char* CASE_COLUMNS =
    "case_id, case_number, case_name, investigator_name, agency_name, incident_date, "
    "created_date, last_modified, status, notes, evidence_source_path, total_files, "
    "total_flagged";

Case read_case(const Statement& st) {
    Case c;
    c.case_id = st.column_int64(0);
    c.case_number = st.column_text(1);
    c.case_name = st.column_text(2);
    c.investigator_name = st.column_optional_text(3);
    c.agency_name = st.column_optional_text(4);
    c.incident_date = st.column_optional_text(5);
    c.created_date = st.column_text(6);
    c.last_modified = st.column_text(7);
    c.status = case_status_from_string(st.column_text(8)).value_or(CaseStatus::Open);
    c.notes = st.column_optional_text(9);
    c.evidence_source_path = st.column_optional_text(10);
    c.total_files = st.column_int64(11);
    c.total_flagged = st.column_int64(12);
    return c;
}

std::optional<Case> select_one_case(Database& db, const std::string& where,
                                    const std::function<void(Statement&)>& bind) {
    std::optional<Case> result;
    db.read([&](Connection& conn) {
        Statement st(conn, std::string("SELECT ") + CASE_COLUMNS + " FROM cases WHERE " + where);
        bind(st);
        if (st.step()) {
            result = read_case(st);
        }
    });
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// CaseStatus
// ----------------------------------------------------------------------------

const char* case_status_to_string(CaseStatus s) {
    return s == CaseStatus::Closed ? "closed" : "open";
}

std::optional<CaseStatus> case_status_from_string(std::string_view s) {
    if (s == "open") {
        return CaseStatus::Open;
    }
    if (s == "closed") {
        return CaseStatus::Closed;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// CaseRepository
// ----------------------------------------------------------------------------

std::int64_t CaseRepository::create_case(const NewCase& data) {
    std::int64_t case_id = 0;
    try {
        db_.transaction([&](Connection& conn) {
            Statement st(conn,
                         "INSERT INTO cases (case_number, case_name, investigator_name, "
                         "agency_name, incident_date, notes, evidence_source_path) "
                         "VALUES (?, ?, ?, ?, ?, ?, ?)");
            st.bind_text(1, data.case_number)
                .bind_text(2, data.case_name)
                .bind_optional_text(3, data.investigator_name)
                .bind_optional_text(4, data.agency_name)
                .bind_optional_text(5, data.incident_date)
                .bind_optional_text(6, data.notes)
                .bind_optional_text(7, data.evidence_source_path);
            st.run();
            case_id = conn.last_insert_rowid();
        });
    } catch (const SqliteError& e) {
        if (e.is_unique_violation()) {
            throw Error(ErrorKind::DuplicateCaseNumber,
                        "case number '" + data.case_number + "' already exists");
        }
        throw;
    }
    return case_id;
}

std::optional<Case> CaseRepository::get_case(std::int64_t case_id) {
    return select_one_case(db_, "case_id = ?", [&](Statement& st) { st.bind_int64(1, case_id); });
}

std::optional<Case> CaseRepository::get_case_by_number(const std::string& case_number) {
    return select_one_case(db_, "case_number = ?",
                           [&](Statement& st) { st.bind_text(1, case_number); });
}

std::vector<Case> CaseRepository::list_cases(std::optional<CaseStatus> status) {
    std::vector<Case> cases;
    db_.read([&](Connection& conn) {
        std::string sql = std::string("SELECT ") + CASE_COLUMNS + " FROM cases";
        if (status) {
            sql += " WHERE status = ?";
        }
        sql += " ORDER BY last_modified DESC, case_id DESC";

        Statement st(conn, sql);
        if (status) {
            st.bind_text(1, case_status_to_string(*status));
        }
        while (st.step()) {
            cases.push_back(read_case(st));
        }
    });
    return cases;
}

bool CaseRepository::update_case(std::int64_t case_id, const CaseUpdate& update) {
    // Пустое обновление только трогает last_modified
    std::vector<std::pair<std::string, std::optional<std::string>>> fields;
    auto add = [&](const char* column, const std::optional<std::string>& value) {
        if (value) {
            fields.emplace_back(column, value);
        }
    };
    add("case_name", update.case_name);
    add("investigator_name", update.investigator_name);
    add("agency_name", update.agency_name);
    add("incident_date", update.incident_date);
    add("notes", update.notes);
    add("evidence_source_path", update.evidence_source_path);
    if (update.status) {
        fields.emplace_back("status", std::string(case_status_to_string(*update.status)));
    }

    std::string sql = "UPDATE cases SET ";
    for (const auto& f : fields) {
        sql += f.first + " = ?, ";
    }
    sql += "last_modified = CURRENT_TIMESTAMP WHERE case_id = ?";

    bool changed = false;
    db_.transaction([&](Connection& conn) {
        Statement st(conn, sql);
        int index = 1;
        for (const auto& f : fields) {
            st.bind_optional_text(index++, f.second);
        }
        st.bind_int64(index, case_id);
        st.run();
        changed = conn.changes() > 0;
    });
    return changed;
}

bool CaseRepository::set_status(std::int64_t case_id, CaseStatus status) {
    CaseUpdate update;
    update.status = status;
    return update_case(case_id, update);
}

bool CaseRepository::recount_statistics(std::int64_t case_id) {
    bool changed = false;
    db_.transaction([&](Connection& conn) {
        Statement st(conn,
                     "UPDATE cases SET "
                     "total_files = (SELECT COUNT(*) FROM evidence_files WHERE case_id = ?1), "
                     "total_flagged = (SELECT COUNT(*) FROM evidence_files "
                     "WHERE case_id = ?1 AND is_flagged = 1), "
                     "last_modified = CURRENT_TIMESTAMP "
                     "WHERE case_id = ?1");
        st.bind_int64(1, case_id);
        st.run();
        changed = conn.changes() > 0;
    });
    return changed;
}

CaseStatistics CaseRepository::statistics(std::int64_t case_id) {
    CaseStatistics stats;
    db_.read([&](Connection& conn) {
        Statement st(conn,
                     "SELECT COUNT(*), "
                     "COALESCE(SUM(CASE WHEN ai_processed = 1 THEN 1 ELSE 0 END), 0), "
                     "COALESCE(SUM(CASE WHEN is_flagged = 1 THEN 1 ELSE 0 END), 0), "
                     "COALESCE(SUM(CASE WHEN face_count > 0 THEN 1 ELSE 0 END), 0), "
                     "COALESCE(SUM(face_count), 0), "
                     "COUNT(DISTINCT date_taken) "
                     "FROM evidence_files WHERE case_id = ?");
        st.bind_int64(1, case_id);
        if (st.step()) {
            stats.total_files = st.column_int64(0);
            stats.processed_files = st.column_int64(1);
            stats.flagged_files = st.column_int64(2);
            stats.files_with_faces = st.column_int64(3);
            stats.total_faces = st.column_int64(4);
            stats.unique_dates = st.column_int64(5);
        }
    });
    return stats;
}

std::string CaseRepository::next_case_number(int year) {
    const std::string prefix = "CASE-" + std::to_string(year) + "-";

    long max_seq = 0;
    db_.read([&](Connection& conn) {
        Statement st(conn, "SELECT case_number FROM cases WHERE substr(case_number, 1, ?) = ?");
        st.bind_int64(1, static_cast<std::int64_t>(prefix.size())).bind_text(2, prefix);
        while (st.step()) {
            std::string suffix = st.column_text(0).substr(prefix.size());
            if (suffix.empty() || suffix.find_first_not_of("0123456789") != std::string::npos) {
                continue;
            }
            long seq = std::strtol(suffix.c_str(), nullptr, 10);
            if (seq > max_seq) {
                max_seq = seq;
            }
        }
    });

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04ld", max_seq + 1);
    return prefix + buf;
}

}  // namespace evidex::store
