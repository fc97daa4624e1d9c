// ==============================================================================
// file_repository.cpp - Репозиторий файлов улик
// ==============================================================================

#include "evidex/repository.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <functional>

namespace evidex::store {

namespace {

constexpr const char* FILE_COLUMNS =
    "file_id, case_id, file_path, file_relative_path, file_name, file_type, file_size, "
    "file_hash, source_archive, date_created, date_modified, date_accessed, date_taken, "
    "gps_latitude, gps_longitude, gps_altitude, location_name, camera_make, camera_model, "
    "ai_processed, ai_tags, ai_confidence, ocr_text, face_count, is_flagged, flag_reason, "
    "analyst_notes, imported_date, analyzed_date";

EvidenceFile read_file(const Statement& st) {
    EvidenceFile f;
    f.file_id = st.column_int64(0);
    f.case_id = st.column_int64(1);
    f.file_path = st.column_text(2);
    f.file_relative_path = st.column_optional_text(3);
    f.file_name = st.column_text(4);
    f.file_type = taxonomy::category_from_string(st.column_text(5)).value_or(taxonomy::Category::Other);
    f.file_size = st.column_int64(6);
    f.file_hash = st.column_optional_text(7);
    f.source_archive = st.column_optional_text(8);
    f.date_created = st.column_optional_text(9);
    f.date_modified = st.column_optional_text(10);
    f.date_accessed = st.column_optional_text(11);
    f.date_taken = st.column_optional_text(12);
    f.gps_latitude = st.column_optional_double(13);
    f.gps_longitude = st.column_optional_double(14);
    f.gps_altitude = st.column_optional_double(15);
    f.location_name = st.column_optional_text(16);
    f.camera_make = st.column_optional_text(17);
    f.camera_model = st.column_optional_text(18);
    f.ai_processed = st.column_int64(19) != 0;
    if (!st.column_is_null(20)) {
        f.ai_tags = tags_from_json(st.column_text(20));
    }
    f.ai_confidence = st.column_optional_double(21);
    f.ocr_text = st.column_optional_text(22);
    f.face_count = st.column_int64(23);
    f.is_flagged = st.column_int64(24) != 0;
    f.flag_reason = st.column_optional_text(25);
    f.analyst_notes = st.column_optional_text(26);
    f.imported_date = st.column_text(27);
    f.analyzed_date = st.column_optional_text(28);
    return f;
}

std::vector<EvidenceFile> select_files(Database& db, const std::string& tail,
                                       const std::function<void(Statement&)>& bind) {
    std::vector<EvidenceFile> files;
    db.read([&](Connection& conn) {
        Statement st(conn, std::string("SELECT ") + FILE_COLUMNS + " FROM evidence_files " + tail);
        bind(st);
        while (st.step()) {
            files.push_back(read_file(st));
        }
    });
    return files;
}

/// UPDATE одного файла; true если строка изменена
bool update_file(Database& db, const std::string& sql,
                 const std::function<void(Statement&)>& bind) {
    bool changed = false;
    db.transaction([&](Connection& conn) {
        Statement st(conn, sql);
        bind(st);
        st.run();
        changed = conn.changes() > 0;
    });
    return changed;
}

/// "2024-03-01 10:00:00" -> "2024-03-01"
std::string date_part(const std::string& s) {
    return s.substr(0, 10);
}

}  // namespace

// ----------------------------------------------------------------------------
// Теги и хэши
// ----------------------------------------------------------------------------

std::string tags_to_json(const std::vector<std::string>& tags) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartArray();
    for (const auto& tag : tags) {
        writer.String(tag.c_str(), static_cast<rapidjson::SizeType>(tag.size()));
    }
    writer.EndArray();
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::vector<std::string> tags_from_json(std::string_view json) {
    std::vector<std::string> tags;
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError() || !doc.IsArray()) {
        return tags;
    }
    for (const auto& item : doc.GetArray()) {
        if (item.IsString()) {
            tags.emplace_back(item.GetString(), item.GetStringLength());
        }
    }
    return tags;
}

bool is_sha256_hex(std::string_view s) {
    if (s.size() != 64) {
        return false;
    }
    for (char c : s) {
        bool digit = c >= '0' && c <= '9';
        bool lower_hex = c >= 'a' && c <= 'f';
        if (!digit && !lower_hex) {
            return false;
        }
    }
    return true;
}

// ----------------------------------------------------------------------------
// FileRepository
// ----------------------------------------------------------------------------

std::int64_t FileRepository::add_file(const EvidenceFile& file) {
    if (file.file_hash && !is_sha256_hex(*file.file_hash)) {
        throw Error(ErrorKind::Database, "invalid SHA-256 digest for '" + file.file_name + "'");
    }

    std::int64_t file_id = 0;
    try {
        db_.transaction([&](Connection& conn) {
            Statement st(conn,
                         "INSERT INTO evidence_files (case_id, file_path, file_relative_path, "
                         "file_name, file_type, file_size, file_hash, source_archive, "
                         "date_created, date_modified, date_accessed, date_taken, "
                         "gps_latitude, gps_longitude, gps_altitude, location_name, "
                         "camera_make, camera_model) "
                         "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
            st.bind_int64(1, file.case_id)
                .bind_text(2, file.file_path)
                .bind_optional_text(3, file.file_relative_path)
                .bind_text(4, file.file_name)
                .bind_text(5, taxonomy::category_to_string(file.file_type))
                .bind_int64(6, file.file_size)
                .bind_optional_text(7, file.file_hash)
                .bind_optional_text(8, file.source_archive)
                .bind_optional_text(9, file.date_created)
                .bind_optional_text(10, file.date_modified)
                .bind_optional_text(11, file.date_accessed)
                .bind_optional_text(12, file.date_taken)
                .bind_optional_double(13, file.gps_latitude)
                .bind_optional_double(14, file.gps_longitude)
                .bind_optional_double(15, file.gps_altitude)
                .bind_optional_text(16, file.location_name)
                .bind_optional_text(17, file.camera_make)
                .bind_optional_text(18, file.camera_model);
            st.run();
            file_id = conn.last_insert_rowid();
        });
    } catch (const SqliteError& e) {
        if (e.is_foreign_key_violation()) {
            throw Error(ErrorKind::ForeignKeyViolation,
                        "case " + std::to_string(file.case_id) + " does not exist");
        }
        throw;
    }
    return file_id;
}

std::optional<EvidenceFile> FileRepository::get_file(std::int64_t file_id) {
    auto files = select_files(db_, "WHERE file_id = ?",
                              [&](Statement& st) { st.bind_int64(1, file_id); });
    if (files.empty()) {
        return std::nullopt;
    }
    return std::move(files.front());
}

std::vector<EvidenceFile> FileRepository::get_files_by_case(std::int64_t case_id,
                                                            bool flagged_only) {
    std::string tail = "WHERE case_id = ?";
    if (flagged_only) {
        tail += " AND is_flagged = 1";
    }
    tail += " ORDER BY date_taken IS NULL, date_taken DESC, file_id ASC";
    return select_files(db_, tail, [&](Statement& st) { st.bind_int64(1, case_id); });
}

bool FileRepository::update_analysis(std::int64_t file_id, const AnalysisUpdate& update) {
    return update_file(
        db_,
        "UPDATE evidence_files SET ai_processed = 1, ai_tags = ?, ai_confidence = ?, "
        "ocr_text = ?, face_count = ?, "
        "date_taken = COALESCE(?, date_taken), "
        "gps_latitude = COALESCE(?, gps_latitude), "
        "gps_longitude = COALESCE(?, gps_longitude), "
        "gps_altitude = COALESCE(?, gps_altitude), "
        "camera_make = COALESCE(?, camera_make), "
        "camera_model = COALESCE(?, camera_model), "
        "analyzed_date = CURRENT_TIMESTAMP "
        "WHERE file_id = ?",
        [&](Statement& st) {
            st.bind_text(1, tags_to_json(update.ai_tags))
                .bind_optional_double(2, update.ai_confidence)
                .bind_optional_text(3, update.ocr_text)
                .bind_int64(4, update.face_count)
                .bind_optional_text(5, update.date_taken)
                .bind_optional_double(6, update.gps_latitude)
                .bind_optional_double(7, update.gps_longitude)
                .bind_optional_double(8, update.gps_altitude)
                .bind_optional_text(9, update.camera_make)
                .bind_optional_text(10, update.camera_model)
                .bind_int64(11, file_id);
        });
}

bool FileRepository::flag(std::int64_t file_id, const std::string& reason) {
    return update_file(db_, "UPDATE evidence_files SET is_flagged = 1, flag_reason = ? WHERE file_id = ?",
                       [&](Statement& st) { st.bind_text(1, reason).bind_int64(2, file_id); });
}

bool FileRepository::unflag(std::int64_t file_id) {
    return update_file(db_,
                       "UPDATE evidence_files SET is_flagged = 0, flag_reason = NULL WHERE file_id = ?",
                       [&](Statement& st) { st.bind_int64(1, file_id); });
}

bool FileRepository::add_note(std::int64_t file_id, const std::string& note) {
    return update_file(db_, "UPDATE evidence_files SET analyst_notes = ? WHERE file_id = ?",
                       [&](Statement& st) { st.bind_text(1, note).bind_int64(2, file_id); });
}

bool FileRepository::set_hash(std::int64_t file_id, const std::string& sha256_hex) {
    if (!is_sha256_hex(sha256_hex)) {
        throw Error(ErrorKind::Database, "invalid SHA-256 digest '" + sha256_hex + "'");
    }
    return update_file(db_, "UPDATE evidence_files SET file_hash = ? WHERE file_id = ?",
                       [&](Statement& st) { st.bind_text(1, sha256_hex).bind_int64(2, file_id); });
}

std::vector<EvidenceFile> FileRepository::files_missing_hash(std::int64_t case_id) {
    return select_files(db_, "WHERE case_id = ? AND file_hash IS NULL ORDER BY file_id ASC",
                        [&](Statement& st) { st.bind_int64(1, case_id); });
}

std::vector<EvidenceFile> FileRepository::get_unprocessed_files(std::int64_t case_id) {
    return select_files(db_,
                        "WHERE case_id = ? AND ai_processed = 0 "
                        "ORDER BY imported_date ASC, file_id ASC",
                        [&](Statement& st) { st.bind_int64(1, case_id); });
}

std::int64_t FileRepository::count_unprocessed(std::int64_t case_id) {
    std::int64_t count = 0;
    db_.read([&](Connection& conn) {
        Statement st(conn,
                     "SELECT COUNT(*) FROM evidence_files WHERE case_id = ? AND ai_processed = 0");
        st.bind_int64(1, case_id);
        if (st.step()) {
            count = st.column_int64(0);
        }
    });
    return count;
}

std::vector<EvidenceFile> FileRepository::filter_files(std::int64_t case_id,
                                                       const FileFilter& filter) {
    std::string tail = "WHERE case_id = ?";
    std::vector<std::string> text_params;

    if (filter.date_from) {
        tail += " AND date_taken IS NOT NULL AND substr(date_taken, 1, 10) >= ?";
        text_params.push_back(date_part(*filter.date_from));
    }
    if (filter.date_to) {
        tail += " AND date_taken IS NOT NULL AND substr(date_taken, 1, 10) <= ?";
        text_params.push_back(date_part(*filter.date_to));
    }
    if (filter.file_type) {
        tail += " AND file_type = ?";
        text_params.push_back(taxonomy::category_to_string(*filter.file_type));
    }
    if (filter.flagged_only) {
        tail += " AND is_flagged = 1";
    }
    if (filter.has_faces) {
        tail += " AND face_count > 0";
    }
    if (filter.text_contains) {
        tail += " AND instr(lower(ocr_text), lower(?)) > 0";
        text_params.push_back(*filter.text_contains);
    }
    if (filter.tag_contains) {
        tail += " AND instr(lower(ai_tags), lower(?)) > 0";
        text_params.push_back(*filter.tag_contains);
    }
    tail += " ORDER BY date_taken IS NULL, date_taken DESC, file_id ASC";

    return select_files(db_, tail, [&](Statement& st) {
        st.bind_int64(1, case_id);
        int index = 2;
        for (const auto& p : text_params) {
            st.bind_text(index++, p);
        }
    });
}

}  // namespace evidex::store
