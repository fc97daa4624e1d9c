// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv через cli
// 2. Загрузка конфигурации и создание Writer
// 3. Dispatch команды
// 4. Возврат exit code
//
// ==============================================================================

#include "evidex/analysis.hpp"
#include "evidex/case_manager.hpp"
#include "evidex/cli.hpp"
#include "evidex/config.hpp"
#include "evidex/database.hpp"
#include "evidex/errors.hpp"
#include "evidex/format.hpp"
#include "evidex/hashing.hpp"
#include "evidex/ingestor.hpp"
#include "evidex/output.hpp"
#include "evidex/platform.hpp"
#include "evidex/search.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <set>
#include <type_traits>
#include <variant>
#include <rapidjson/document.h>

namespace {

using namespace evidex;

// ----------------------------------------------------------------------------
// ASCII Banner (--no-banner)
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
    ███████╗██╗   ██╗██╗██████╗ ███████╗██╗  ██╗
    ██╔════╝██║   ██║██║██╔══██╗██╔════╝╚██╗██╔╝
    █████╗  ██║   ██║██║██║  ██║█████╗   ╚███╔╝
    ██╔══╝  ╚██╗ ██╔╝██║██║  ██║██╔══╝   ██╔██╗
    ███████╗ ╚████╔╝ ██║██████╔╝███████╗██╔╝ ██╗
    ╚══════╝  ╚═══╝  ╚═╝╚═════╝ ╚══════╝╚═╝  ╚═╝
)";

void print_banner(output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(output::Stream::Stderr, BANNER);
    writer.write_line(output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Контекст выполнения команды
// ----------------------------------------------------------------------------

struct Context {
    config::Settings settings;
    cli::GlobalOptions global;
    output::Writer& writer;

    unsigned workers() const {
        return global.num_threads.value_or(settings.ingest.workers);
    }
};

/// Прогресс-индикатор Writer на время жизни объекта
class ProgressScope {
public:
    ProgressScope(output::Writer& writer, std::string_view label, std::size_t total = 0)
        : writer_(writer) {
        writer_.progress_begin(label, total);
    }
    ~ProgressScope() { writer_.progress_end(); }

    ProgressScope(const ProgressScope&) = delete;
    ProgressScope& operator=(const ProgressScope&) = delete;

    io::ProgressCallback callback() {
        return [this](std::size_t current, std::size_t total, const std::string& message) {
            writer_.progress_update(current, total, message);
        };
    }

private:
    output::Writer& writer_;
};

std::string opt(const std::optional<std::string>& v) {
    return v.value_or("");
}

std::string format_double(double v, const char* fmt = "%.1f") {
    char buf[64];
    std::snprintf(buf, sizeof(buf), fmt, v);
    return buf;
}

void add_string(rapidjson::Value& obj, const char* key, const std::string& value,
                rapidjson::Document::AllocatorType& alloc) {
    obj.AddMember(rapidjson::StringRef(key), rapidjson::Value(value.c_str(), alloc), alloc);
}

void add_optional(rapidjson::Value& obj, const char* key, const std::optional<std::string>& value,
                  rapidjson::Document::AllocatorType& alloc) {
    if (value) {
        add_string(obj, key, *value, alloc);
    } else {
        obj.AddMember(rapidjson::StringRef(key), rapidjson::Value(rapidjson::kNullType), alloc);
    }
}

rapidjson::Value case_to_json(const store::Case& c, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("case_id", c.case_id, alloc);
    add_string(obj, "case_number", c.case_number, alloc);
    add_string(obj, "case_name", c.case_name, alloc);
    add_optional(obj, "investigator_name", c.investigator_name, alloc);
    add_optional(obj, "agency_name", c.agency_name, alloc);
    add_optional(obj, "incident_date", c.incident_date, alloc);
    add_string(obj, "created_date", c.created_date, alloc);
    add_string(obj, "last_modified", c.last_modified, alloc);
    obj.AddMember("status", rapidjson::StringRef(store::case_status_to_string(c.status)), alloc);
    add_optional(obj, "notes", c.notes, alloc);
    add_optional(obj, "evidence_source_path", c.evidence_source_path, alloc);
    obj.AddMember("total_files", c.total_files, alloc);
    obj.AddMember("total_flagged", c.total_flagged, alloc);
    return obj;
}

rapidjson::Value file_to_json(const store::EvidenceFile& f,
                              rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("file_id", f.file_id, alloc);
    obj.AddMember("case_id", f.case_id, alloc);
    add_string(obj, "file_name", f.file_name, alloc);
    add_string(obj, "file_path", f.file_path, alloc);
    add_optional(obj, "file_relative_path", f.file_relative_path, alloc);
    obj.AddMember("file_type", rapidjson::StringRef(taxonomy::category_to_string(f.file_type)),
                  alloc);
    obj.AddMember("file_size", f.file_size, alloc);
    add_optional(obj, "file_hash", f.file_hash, alloc);
    add_optional(obj, "source_archive", f.source_archive, alloc);
    add_optional(obj, "date_modified", f.date_modified, alloc);
    add_optional(obj, "date_taken", f.date_taken, alloc);
    obj.AddMember("ai_processed", f.ai_processed, alloc);
    rapidjson::Value tags(rapidjson::kArrayType);
    for (const auto& t : f.ai_tags) {
        tags.PushBack(rapidjson::Value(t.c_str(), alloc), alloc);
    }
    obj.AddMember("ai_tags", tags, alloc);
    obj.AddMember("face_count", f.face_count, alloc);
    obj.AddMember("is_flagged", f.is_flagged, alloc);
    add_optional(obj, "flag_reason", f.flag_reason, alloc);
    add_optional(obj, "analyst_notes", f.analyst_notes, alloc);
    return obj;
}

rapidjson::Value stats_to_json(const ingest::IngestStats& s,
                               rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("format", rapidjson::StringRef(io::format_to_string(s.format)), alloc);
    obj.AddMember("total", static_cast<std::uint64_t>(s.total), alloc);
    obj.AddMember("processed", static_cast<std::uint64_t>(s.processed), alloc);
    obj.AddMember("errors", static_cast<std::uint64_t>(s.errors), alloc);
    obj.AddMember("cancelled", s.cancelled, alloc);
    obj.AddMember("elapsed_seconds", s.elapsed_seconds, alloc);
    obj.AddMember("files_per_second", s.files_per_second, alloc);
    rapidjson::Value categories(rapidjson::kObjectType);
    for (const auto& [category, count] : s.per_category) {
        categories.AddMember(rapidjson::StringRef(taxonomy::category_to_string(category)),
                             static_cast<std::uint64_t>(count), alloc);
    }
    obj.AddMember("per_category", categories, alloc);
    return obj;
}

void print_stats(Context& ctx, const ingest::IngestStats& stats, bool json) {
    if (json) {
        rapidjson::Document doc;
        auto& alloc = doc.GetAllocator();
        rapidjson::Value obj = stats_to_json(stats, alloc);
        ctx.writer.write_json_pretty(obj);
        return;
    }

    output::Table table;
    table.set_headers({"Category", "Files"});
    for (const auto& [category, count] : stats.per_category) {
        table.add_row({taxonomy::category_to_string(category), std::to_string(count)});
    }
    if (table.row_count() > 0) {
        table.print(ctx.writer);
    }
    ctx.writer.info("Processed " + std::to_string(stats.processed) + "/" +
                    std::to_string(stats.total) + " files, " + std::to_string(stats.errors) +
                    " errors in " + format_double(stats.elapsed_seconds) + "s (" +
                    format_double(stats.files_per_second) + " files/s)");
    if (stats.cancelled) {
        ctx.writer.warn("Processing was cancelled before all files were stored");
    }
}

store::DatabaseOptions database_options(const Context& ctx) {
    store::DatabaseOptions options = ctx.settings.database;
    if (ctx.global.db) {
        options.path = *ctx.global.db;
    }
    return options;
}

ingest::IngestOptions ingest_options(const Context& ctx) {
    ingest::IngestOptions options;
    options.entry_timeout = ctx.settings.ingest.entry_read_timeout;
    options.user_name = ctx.settings.user_name;
    options.extract_prefix = ctx.settings.ingest.extract_prefix;
    return options;
}

[[noreturn]] void not_found(const std::string& what, std::int64_t id) {
    throw Error(ErrorKind::NotFound, what + " " + std::to_string(id) + " not found");
}

/// Записать действие аналитика в журнал аудита
void audit_file_action(store::Database& db, const Context& ctx, const std::string& action,
                       const store::EvidenceFile& file) {
    rapidjson::Document details(rapidjson::kObjectType);
    auto& alloc = details.GetAllocator();
    details.AddMember("file_id", file.file_id, alloc);
    add_string(details, "file_name", file.file_name, alloc);
    store::AuditRepository audit(db);
    audit.log_action(action, file.case_id, ctx.settings.user_name, &details);
}

store::EvidenceFile require_file(store::FileRepository& files, std::int64_t file_id) {
    auto file = files.get_file(file_id);
    if (!file) {
        not_found("file", file_id);
    }
    return *file;
}

// ----------------------------------------------------------------------------
// Команды без базы данных
// ----------------------------------------------------------------------------

int run_detect(const cli::DetectCommand& cmd, Context& ctx) {
    rapidjson::Document doc(rapidjson::kArrayType);
    auto& alloc = doc.GetAllocator();
    output::Table table;
    table.set_headers({"Path", "Format", "Indexable"});

    for (const auto& path : cmd.paths) {
        io::ContainerFormat format = io::detect_format(path);
        std::string path_u8 = platform::path_to_utf8(path);
        if (cmd.json) {
            rapidjson::Value obj(rapidjson::kObjectType);
            add_string(obj, "path", path_u8, alloc);
            obj.AddMember("format", rapidjson::StringRef(io::format_to_string(format)), alloc);
            obj.AddMember("display_name", rapidjson::StringRef(io::display_name(format)), alloc);
            obj.AddMember("indexable", io::is_indexable(format), alloc);
            doc.PushBack(obj, alloc);
        } else {
            table.add_row({path_u8, io::display_name(format), io::is_indexable(format) ? "yes" : "no"});
        }
    }

    if (cmd.json) {
        ctx.writer.write_json_pretty(doc);
    } else {
        table.print(ctx.writer);
    }
    return 0;
}

int run_index(const cli::IndexCommand& cmd, Context& ctx) {
    auto indexer = io::open_archive(cmd.archive, &ctx.writer);
    indexer->set_entry_timeout(ctx.settings.ingest.entry_read_timeout);

    io::IndexResult result;
    {
        ProgressScope progress(ctx.writer, "Indexing");
        result = indexer->index(progress.callback());
    }

    if (cmd.json) {
        rapidjson::Document doc(rapidjson::kArrayType);
        auto& alloc = doc.GetAllocator();
        for (const auto& d : result.descriptors) {
            rapidjson::Value obj(rapidjson::kObjectType);
            add_string(obj, "name", d.name, alloc);
            add_string(obj, "path", d.path, alloc);
            obj.AddMember("size", static_cast<std::uint64_t>(d.size), alloc);
            add_string(obj, "modified", d.modified, alloc);
            obj.AddMember("category", rapidjson::StringRef(taxonomy::category_to_string(d.category)),
                          alloc);
            doc.PushBack(obj, alloc);
        }
        ctx.writer.write_json_pretty(doc);
    } else {
        output::Table table;
        table.set_headers({"Path", "Category", "Size", "Modified"});
        for (const auto& d : result.descriptors) {
            table.add_row({output::format_field(d.path, 80, false),
                           taxonomy::category_to_string(d.category), output::format_size(d.size),
                           d.modified});
        }
        table.print(ctx.writer);
    }

    ctx.writer.info("Indexed " + std::to_string(result.descriptors.size()) + " files (" +
                    std::to_string(result.directories_skipped) + " directories, " +
                    std::to_string(result.errors) + " errors, " +
                    output::format_size(indexer->bytes_read()) + " read)");
    return 0;
}

// ----------------------------------------------------------------------------
// Дела
// ----------------------------------------------------------------------------

int run_case_create(const cli::CaseCreateCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    cases::CaseManager manager(db, ctx.settings.user_name);

    store::NewCase data;
    data.case_number = cmd.number.value_or("");
    data.case_name = cmd.name;
    data.investigator_name = cmd.investigator;
    data.agency_name = cmd.agency;
    data.incident_date = cmd.incident_date;
    data.notes = cmd.notes;

    std::int64_t id = manager.create_case(data);
    store::CaseRepository repo(db);
    auto created = repo.get_case(id);
    ctx.writer.info("Created case " + (created ? created->case_number : std::string()) +
                    " (id " + std::to_string(id) + ")");
    ctx.writer.write_line(output::Stream::Stdout, std::to_string(id));
    return 0;
}

int run_case_list(const cli::CaseListCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    store::CaseRepository repo(db);

    std::optional<store::CaseStatus> status;
    if (cmd.status) {
        status = store::case_status_from_string(*cmd.status);
    }
    auto cases = repo.list_cases(status);

    if (cmd.json) {
        rapidjson::Document doc(rapidjson::kArrayType);
        for (const auto& c : cases) {
            doc.PushBack(case_to_json(c, doc.GetAllocator()), doc.GetAllocator());
        }
        ctx.writer.write_json_pretty(doc);
        return 0;
    }

    output::Table table;
    table.set_headers({"ID", "Number", "Name", "Status", "Files", "Flagged", "Modified"});
    for (const auto& c : cases) {
        table.add_row({std::to_string(c.case_id), c.case_number, c.case_name,
                       store::case_status_to_string(c.status), std::to_string(c.total_files),
                       std::to_string(c.total_flagged), c.last_modified});
    }
    table.print(ctx.writer);
    ctx.writer.info(std::to_string(cases.size()) + " cases");
    return 0;
}

int run_case_show(const cli::CaseShowCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    cases::CaseManager manager(db, ctx.settings.user_name);

    auto summary = manager.summary(cmd.case_id);
    if (!summary) {
        not_found("case", cmd.case_id);
    }
    const auto& s = summary->statistics;

    if (cmd.json) {
        rapidjson::Document doc(rapidjson::kObjectType);
        auto& alloc = doc.GetAllocator();
        doc.AddMember("case", case_to_json(summary->info, alloc), alloc);
        rapidjson::Value stats(rapidjson::kObjectType);
        stats.AddMember("total_files", s.total_files, alloc);
        stats.AddMember("processed_files", s.processed_files, alloc);
        stats.AddMember("flagged_files", s.flagged_files, alloc);
        stats.AddMember("files_with_faces", s.files_with_faces, alloc);
        stats.AddMember("total_faces", s.total_faces, alloc);
        stats.AddMember("unique_dates", s.unique_dates, alloc);
        doc.AddMember("statistics", stats, alloc);
        rapidjson::Value recent(rapidjson::kArrayType);
        for (const auto& f : summary->recent_files) {
            recent.PushBack(file_to_json(f, alloc), alloc);
        }
        doc.AddMember("recent_files", recent, alloc);
        rapidjson::Value flagged(rapidjson::kArrayType);
        for (const auto& f : summary->flagged_files) {
            flagged.PushBack(file_to_json(f, alloc), alloc);
        }
        doc.AddMember("flagged_files", flagged, alloc);
        ctx.writer.write_json_pretty(doc);
        return 0;
    }

    const auto& c = summary->info;
    output::Table table;
    table.set_headers({"Field", "Value"});
    table.add_row({"Case number", c.case_number});
    table.add_row({"Name", c.case_name});
    table.add_row({"Status", store::case_status_to_string(c.status)});
    table.add_row({"Investigator", opt(c.investigator_name)});
    table.add_row({"Agency", opt(c.agency_name)});
    table.add_row({"Incident date", opt(c.incident_date)});
    table.add_row({"Created", c.created_date});
    table.add_row({"Evidence source", opt(c.evidence_source_path)});
    table.add_row({"Total files", std::to_string(s.total_files)});
    table.add_row({"Analyzed", std::to_string(s.processed_files)});
    table.add_row({"Flagged", std::to_string(s.flagged_files)});
    table.add_row({"Files with faces", std::to_string(s.files_with_faces)});
    table.add_row({"Faces", std::to_string(s.total_faces)});
    table.add_row({"Unique dates", std::to_string(s.unique_dates)});
    table.print(ctx.writer);

    if (!summary->flagged_files.empty()) {
        output::Table flagged;
        flagged.set_headers({"File ID", "Name", "Reason"});
        for (const auto& f : summary->flagged_files) {
            flagged.add_row({std::to_string(f.file_id), f.file_name, opt(f.flag_reason)});
        }
        flagged.print(ctx.writer);
    }
    return 0;
}

int run_case_close(const cli::CaseCloseCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    cases::CaseManager manager(db, ctx.settings.user_name);
    manager.close_case(cmd.case_id);
    ctx.writer.info("Closed case " + std::to_string(cmd.case_id));
    return 0;
}

// ----------------------------------------------------------------------------
// Приём улик
// ----------------------------------------------------------------------------

int run_ingest(const cli::IngestCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    ingest::IngestOptions options = ingest_options(ctx);
    if (cmd.entry_timeout_ms) {
        options.entry_timeout = std::chrono::milliseconds(*cmd.entry_timeout_ms);
    }
    ingest::Ingestor ingestor(db, &ctx.writer, options);

    ingest::IngestStats stats;
    {
        ProgressScope progress(ctx.writer, "Ingesting", 100);
        stats = ingestor.ingest(cmd.archive, cmd.case_id, ctx.workers(), progress.callback());
    }
    print_stats(ctx, stats, cmd.json);
    return stats.errors == 0 ? 0 : 1;
}

int run_extract(const cli::ExtractCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    ingest::Ingestor ingestor(db, &ctx.writer, ingest_options(ctx));

    io::EntryFilter filter;
    if (!cmd.include.empty()) {
        filter = [patterns = cmd.include](const std::string& entry) {
            return std::any_of(patterns.begin(), patterns.end(), [&](const std::string& p) {
                return entry.find(p) != std::string::npos;
            });
        };
    }

    ingest::IngestStats stats;
    {
        ProgressScope progress(ctx.writer, "Extracting", 100);
        stats = ingestor.extract_and_import(cmd.archive, cmd.case_id, cmd.target, filter,
                                            ctx.workers(), progress.callback());
    }
    if (ingestor.temp_directory()) {
        ctx.writer.info("Extracted files kept in " +
                        platform::path_to_utf8(*ingestor.temp_directory()));
    }
    print_stats(ctx, stats, cmd.json);
    return stats.errors == 0 ? 0 : 1;
}

int run_import(const cli::ImportCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    ingest::Ingestor ingestor(db, &ctx.writer, ingest_options(ctx));

    ingest::IngestStats stats;
    {
        ProgressScope progress(ctx.writer, "Importing");
        stats = ingestor.import_directory(cmd.root, cmd.case_id, ctx.workers(),
                                          progress.callback());
    }
    print_stats(ctx, stats, cmd.json);
    return stats.errors == 0 ? 0 : 1;
}

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

taxonomy::Category parse_category(const std::string& name) {
    auto category = taxonomy::category_from_string(name);
    if (!category) {
        throw Error(ErrorKind::Config, "unknown file type '" + name + "'");
    }
    return *category;
}

void print_files(Context& ctx, const std::vector<store::EvidenceFile>& files, bool json) {
    if (json) {
        rapidjson::Document doc(rapidjson::kArrayType);
        for (const auto& f : files) {
            doc.PushBack(file_to_json(f, doc.GetAllocator()), doc.GetAllocator());
        }
        ctx.writer.write_json_pretty(doc);
        return;
    }

    output::Table table;
    table.set_headers({"ID", "Name", "Type", "Size", "Date", "Flag", "Path"});
    for (const auto& f : files) {
        std::string date = f.date_taken ? *f.date_taken : opt(f.date_modified);
        table.add_row({std::to_string(f.file_id), output::format_field(f.file_name, 40, false),
                       taxonomy::category_to_string(f.file_type),
                       output::format_size(static_cast<std::uint64_t>(f.file_size)), date,
                       f.is_flagged ? "*" : "",
                       output::format_field(f.file_relative_path.value_or(f.file_path), 60, false)});
    }
    table.print(ctx.writer);
    ctx.writer.info(std::to_string(files.size()) + " files");
}

int run_files(const cli::FilesCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    store::CaseRepository cases(db);
    if (!cases.get_case(cmd.case_id)) {
        not_found("case", cmd.case_id);
    }

    store::FileFilter filter;
    filter.date_from = cmd.from;
    filter.date_to = cmd.to;
    if (cmd.type) {
        filter.file_type = parse_category(*cmd.type);
    }
    filter.flagged_only = cmd.flagged;
    filter.has_faces = cmd.has_faces;
    filter.text_contains = cmd.text;
    filter.tag_contains = cmd.tag;

    store::FileRepository files(db);
    print_files(ctx, files.filter_files(cmd.case_id, filter), cmd.json);
    return 0;
}

int run_flag(const cli::FlagCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    store::FileRepository files(db);
    store::EvidenceFile file = require_file(files, cmd.file_id);

    if (!files.flag(cmd.file_id, cmd.reason)) {
        not_found("file", cmd.file_id);
    }
    store::CaseRepository(db).recount_statistics(file.case_id);
    audit_file_action(db, ctx, "flag_file", file);
    ctx.writer.info("Flagged file " + std::to_string(cmd.file_id) + " (" + file.file_name + ")");
    return 0;
}

int run_unflag(const cli::UnflagCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    store::FileRepository files(db);
    store::EvidenceFile file = require_file(files, cmd.file_id);

    if (!files.unflag(cmd.file_id)) {
        not_found("file", cmd.file_id);
    }
    store::CaseRepository(db).recount_statistics(file.case_id);
    audit_file_action(db, ctx, "unflag_file", file);
    ctx.writer.info("Unflagged file " + std::to_string(cmd.file_id));
    return 0;
}

int run_note(const cli::NoteCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    store::FileRepository files(db);
    store::EvidenceFile file = require_file(files, cmd.file_id);

    if (!files.add_note(cmd.file_id, cmd.text)) {
        not_found("file", cmd.file_id);
    }
    audit_file_action(db, ctx, "add_note", file);
    ctx.writer.info("Updated note of file " + std::to_string(cmd.file_id));
    return 0;
}

int run_recount(const cli::RecountCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    store::CaseRepository cases(db);
    if (!cases.recount_statistics(cmd.case_id)) {
        not_found("case", cmd.case_id);
    }
    auto c = cases.get_case(cmd.case_id);
    ctx.writer.info("Case " + std::to_string(cmd.case_id) + ": " +
                    std::to_string(c ? c->total_files : 0) + " files, " +
                    std::to_string(c ? c->total_flagged : 0) + " flagged");
    return 0;
}

int run_hash(const cli::HashCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    ingest::HashBackfill backfill(db, &ctx.writer);
    backfill.set_entry_timeout(ctx.settings.ingest.entry_read_timeout);

    if (cmd.file_id) {
        std::string hash = backfill.ensure(*cmd.file_id);
        ctx.writer.write_line(output::Stream::Stdout, hash);
        return 0;
    }

    ingest::BackfillStats stats;
    {
        ProgressScope progress(ctx.writer, "Hashing");
        stats = backfill.run(*cmd.case_id, progress.callback());
    }
    ctx.writer.info("Hashed " + std::to_string(stats.hashed) + "/" + std::to_string(stats.total) +
                    " files, " + std::to_string(stats.errors) + " errors");
    return stats.errors == 0 ? 0 : 1;
}

int run_analyze(const cli::AnalyzeCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    analysis::AnalysisService service(ctx.settings.analysis, &ctx.writer);
    service.add(std::make_unique<analysis::TextContentAnalyzer>());
    analysis::AnalysisRunner runner(db, service, &ctx.writer, ctx.settings.user_name);

    analysis::AnalysisStats stats;
    {
        ProgressScope progress(ctx.writer, "Analyzing");
        stats = runner.analyze_case(cmd.case_id, progress.callback());
    }

    if (cmd.json) {
        rapidjson::Document doc(rapidjson::kObjectType);
        auto& alloc = doc.GetAllocator();
        doc.AddMember("total", static_cast<std::uint64_t>(stats.total), alloc);
        doc.AddMember("processed", static_cast<std::uint64_t>(stats.processed), alloc);
        doc.AddMember("errors", static_cast<std::uint64_t>(stats.errors), alloc);
        doc.AddMember("faces_found", static_cast<std::uint64_t>(stats.faces_found), alloc);
        doc.AddMember("text_found", static_cast<std::uint64_t>(stats.text_found), alloc);
        doc.AddMember("objects_found", static_cast<std::uint64_t>(stats.objects_found), alloc);
        ctx.writer.write_json_pretty(doc);
    } else {
        ctx.writer.info("Analyzed " + std::to_string(stats.processed) + "/" +
                        std::to_string(stats.total) + " files (" + std::to_string(stats.errors) +
                        " errors, " + std::to_string(stats.text_found) + " with text, " +
                        std::to_string(stats.faces_found) + " faces)");
    }
    return stats.errors == 0 ? 0 : 1;
}

int run_search(const cli::SearchCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    search::SearchEngine engine(db, nullptr, &ctx.writer);

    search::SearchCriteria criteria;
    criteria.identity = cmd.name;
    criteria.keywords = cmd.keywords;
    criteria.date_from = cmd.from;
    criteria.date_to = cmd.to;
    if (!cmd.types.empty()) {
        std::set<taxonomy::Category> categories;
        for (const auto& t : cmd.types) {
            categories.insert(parse_category(t));
        }
        criteria.categories = std::move(categories);
    }

    std::vector<search::SearchMatch> matches;
    {
        ProgressScope progress(ctx.writer, "Searching");
        matches = engine.search(cmd.case_id, criteria, progress.callback());
    }

    if (cmd.json) {
        rapidjson::Document doc(rapidjson::kArrayType);
        auto& alloc = doc.GetAllocator();
        for (const auto& m : matches) {
            rapidjson::Value obj(rapidjson::kObjectType);
            obj.AddMember("file", file_to_json(m.file, alloc), alloc);
            obj.AddMember("match_count", m.match_count, alloc);
            rapidjson::Value explanations(rapidjson::kArrayType);
            for (const auto& e : m.explanations) {
                explanations.PushBack(rapidjson::Value(e.c_str(), alloc), alloc);
            }
            obj.AddMember("matches", explanations, alloc);
            doc.PushBack(obj, alloc);
        }
        ctx.writer.write_json_pretty(doc);
        return 0;
    }

    output::Table table;
    table.set_headers({"ID", "Name", "Type", "Matches", "Why"});
    for (const auto& m : matches) {
        std::string why;
        for (const auto& e : m.explanations) {
            if (!why.empty()) {
                why += "; ";
            }
            why += e;
        }
        table.add_row({std::to_string(m.file.file_id), output::format_field(m.file.file_name, 40, false),
                       taxonomy::category_to_string(m.file.file_type),
                       std::to_string(m.match_count), output::format_field(why, 80, false)});
    }
    table.print(ctx.writer);
    return 0;
}

int run_audit(const cli::AuditCommand& cmd, Context& ctx) {
    store::Database db(database_options(ctx));
    store::AuditRepository audit(db);

    std::vector<store::AuditLogEntry> entries;
    if (cmd.case_id) {
        entries = audit.case_logs(*cmd.case_id, cmd.limit.value_or(100));
    } else if (cmd.action) {
        entries = audit.logs_by_action(*cmd.action, cmd.limit.value_or(100));
    } else {
        entries = audit.all_logs(cmd.limit.value_or(1000));
    }
    // --case и --action вместе: фильтр по действию поверх журнала дела
    if (cmd.case_id && cmd.action) {
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [&](const store::AuditLogEntry& e) {
                                         return e.action != *cmd.action;
                                     }),
                      entries.end());
    }

    if (cmd.json) {
        rapidjson::Document doc(rapidjson::kArrayType);
        auto& alloc = doc.GetAllocator();
        for (const auto& e : entries) {
            rapidjson::Value obj(rapidjson::kObjectType);
            obj.AddMember("log_id", e.log_id, alloc);
            if (e.case_id) {
                obj.AddMember("case_id", *e.case_id, alloc);
            } else {
                obj.AddMember("case_id", rapidjson::Value(rapidjson::kNullType), alloc);
            }
            add_string(obj, "user_name", e.user_name, alloc);
            add_string(obj, "action", e.action, alloc);
            add_string(obj, "timestamp", e.timestamp, alloc);
            rapidjson::Document details;
            if (e.details && !details.Parse(e.details->c_str()).HasParseError()) {
                obj.AddMember("details", rapidjson::Value(details, alloc), alloc);
            } else {
                add_optional(obj, "details", e.details, alloc);
            }
            doc.PushBack(obj, alloc);
        }
        ctx.writer.write_json_pretty(doc);
        return 0;
    }

    output::Table table;
    table.set_headers({"ID", "Time", "Case", "User", "Action", "Details"});
    for (const auto& e : entries) {
        table.add_row({std::to_string(e.log_id), e.timestamp,
                       e.case_id ? std::to_string(*e.case_id) : "", e.user_name, e.action,
                       output::format_field(opt(e.details), 60, false)});
    }
    table.print(ctx.writer);
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Конфигурация: файл, затем флаги командной строки
    config::Settings settings;
    std::string config_error;
    if (parse_result.ok && parse_result.global.config) {
        config::LoadResult loaded = config::load(*parse_result.global.config);
        if (loaded) {
            settings = std::move(loaded.settings);
        } else {
            config_error = loaded.error;
        }
    }

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet || settings.logging.quiet;
    out_cfg.verbose = std::max(parse_result.global.verbose, settings.logging.verbose);
    out_cfg.no_banner = parse_result.global.no_banner;
    if (parse_result.ok) {
        out_cfg.output_path = parse_result.global.output;
    }
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга выводятся без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }
    if (!config_error.empty()) {
        writer.error(config_error);
        return 1;
    }
    if (out_cfg.output_path && !writer.has_output_file()) {
        writer.error("Unable to write to specified output file - " +
                     platform::path_to_utf8(*out_cfg.output_path));
        return 1;
    }

    Context ctx{std::move(settings), parse_result.global, writer};

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                if constexpr (std::is_same_v<T, cli::DetectCommand>) {
                    return run_detect(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::IndexCommand>) {
                    return run_index(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::CaseCreateCommand>) {
                    return run_case_create(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::CaseListCommand>) {
                    return run_case_list(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::CaseShowCommand>) {
                    return run_case_show(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::CaseCloseCommand>) {
                    return run_case_close(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::IngestCommand>) {
                    return run_ingest(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::ExtractCommand>) {
                    return run_extract(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::ImportCommand>) {
                    return run_import(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::FilesCommand>) {
                    return run_files(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::FlagCommand>) {
                    return run_flag(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::UnflagCommand>) {
                    return run_unflag(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::NoteCommand>) {
                    return run_note(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::RecountCommand>) {
                    return run_recount(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::HashCommand>) {
                    return run_hash(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::AnalyzeCommand>) {
                    return run_analyze(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::SearchCommand>) {
                    return run_search(cmd, ctx);
                } else if constexpr (std::is_same_v<T, cli::AuditCommand>) {
                    return run_audit(cmd, ctx);
                } else {
                    return 1;
                }
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const evidex::Error& e) {
        std::cerr << "[x] " << e.format() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
