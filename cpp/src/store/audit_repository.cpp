// ==============================================================================
// audit_repository.cpp - Журнал аудита
// ==============================================================================

#include "evidex/repository.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace evidex::store {

std::int64_t AuditRepository::log_action(const std::string& action,
                                         std::optional<std::int64_t> case_id,
                                         const std::string& user_name,
                                         const rapidjson::Value* details) {
    std::optional<std::string> details_json;
    if (details != nullptr && !details->IsNull()) {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        details->Accept(writer);
        details_json = std::string(buffer.GetString(), buffer.GetSize());
    }

    std::int64_t log_id = 0;
    db_.transaction([&](Connection& conn) {
        Statement st(conn,
                     "INSERT INTO audit_log (case_id, user_name, action, details) "
                     "VALUES (?, ?, ?, ?)");
        if (case_id) {
            st.bind_int64(1, *case_id);
        } else {
            st.bind_null(1);
        }
        st.bind_text(2, user_name).bind_text(3, action).bind_optional_text(4, details_json);
        st.run();
        log_id = conn.last_insert_rowid();
    });
    return log_id;
}

std::vector<AuditLogEntry> AuditRepository::query(const std::string& where,
                                                  const std::string& param,
                                                  std::optional<std::int64_t> id_param,
                                                  std::size_t limit) {
    std::vector<AuditLogEntry> entries;
    db_.read([&](Connection& conn) {
        std::string sql =
            "SELECT log_id, case_id, user_name, action, details, timestamp FROM audit_log";
        if (!where.empty()) {
            sql += " WHERE " + where;
        }
        sql += " ORDER BY timestamp DESC, log_id DESC LIMIT ?";

        Statement st(conn, sql);
        int index = 1;
        if (id_param) {
            st.bind_int64(index++, *id_param);
        } else if (!where.empty()) {
            st.bind_text(index++, param);
        }
        st.bind_int64(index, static_cast<std::int64_t>(limit));

        while (st.step()) {
            AuditLogEntry e;
            e.log_id = st.column_int64(0);
            if (!st.column_is_null(1)) {
                e.case_id = st.column_int64(1);
            }
            e.user_name = st.column_text(2);
            e.action = st.column_text(3);
            e.details = st.column_optional_text(4);
            e.timestamp = st.column_text(5);
            entries.push_back(std::move(e));
        }
    });
    return entries;
}

std::vector<AuditLogEntry> AuditRepository::case_logs(std::int64_t case_id, std::size_t limit) {
    return query("case_id = ?", {}, case_id, limit);
}

std::vector<AuditLogEntry> AuditRepository::all_logs(std::size_t limit) {
    return query({}, {}, std::nullopt, limit);
}

std::vector<AuditLogEntry> AuditRepository::logs_by_action(const std::string& action,
                                                           std::size_t limit) {
    return query("action = ?", action, std::nullopt, limit);
}

}  // namespace evidex::store
