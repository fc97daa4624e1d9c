// ==============================================================================
// ingestor.cpp - Конвейер приёма извлечений
// ==============================================================================

#include "evidex/ingestor.hpp"

#include "evidex/discovery.hpp"
#include "evidex/errors.hpp"
#include "evidex/exif.hpp"
#include "evidex/output.hpp"
#include "evidex/platform.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <system_error>

namespace evidex::ingest {

namespace {

/// Прогресс подфазы (c из t) в диапазон [lo, hi] общей шкалы 0-100.
/// При неизвестном t сообщается нижняя граница и сообщение подфазы.
io::ProgressCallback scaled(const io::ProgressCallback& progress, std::size_t lo, std::size_t hi) {
    if (!progress) {
        return {};
    }
    return [progress, lo, hi](std::size_t current, std::size_t total, const std::string& message) {
        std::size_t value = lo;
        if (total > 0) {
            value = lo + (hi - lo) * std::min(current, total) / total;
        }
        progress(value, 100, message);
    };
}

void report(const io::ProgressCallback& progress, std::size_t value, const std::string& message) {
    if (progress) {
        progress(value, 100, message);
    }
}

std::string format_seconds(double seconds) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", seconds);
    return buf;
}

}  // namespace

io::FileDescriptor describe_file(const std::filesystem::path& file,
                                 const std::filesystem::path& root) {
    io::FileDescriptor d;
    d.name = platform::path_to_utf8(file.filename());
    d.path = platform::path_to_utf8(file);

    std::error_code ec;
    auto size = std::filesystem::file_size(file, ec);
    d.size = ec ? 0 : size;

    platform::FileTimes times = platform::file_times(file);
    d.created = std::move(times.created);
    d.modified = std::move(times.modified);
    d.accessed = std::move(times.accessed);

    std::filesystem::path rel = file.lexically_relative(root);
    std::string category_path = rel.empty() ? d.name : platform::path_to_utf8(rel);
    d.category = taxonomy::categorize(d.name, category_path, {}, {});
    if (d.category == taxonomy::Category::Image) {
        d.exif = io::read_exif(file);
    }
    d.indexed = false;
    return d;
}

// ----------------------------------------------------------------------------
// Ingestor
// ----------------------------------------------------------------------------

Ingestor::Ingestor(store::Database& db, output::Writer* log, IngestOptions options)
    : db_(db), log_(log), options_(std::move(options)) {}

Ingestor::~Ingestor() = default;

void Ingestor::require_case(std::int64_t case_id) {
    store::CaseRepository cases(db_);
    if (!cases.get_case(case_id)) {
        throw Error(ErrorKind::NotFound, "case " + std::to_string(case_id) + " not found");
    }
}

void Ingestor::audit(const std::string& action, std::int64_t case_id,
                     const std::filesystem::path& source, const IngestStats& stats,
                     std::size_t index_errors) {
    rapidjson::Document details(rapidjson::kObjectType);
    auto& alloc = details.GetAllocator();
    std::string source_u8 = platform::path_to_utf8(source);
    details.AddMember("source", rapidjson::Value(source_u8.c_str(), alloc), alloc);
    details.AddMember("format", rapidjson::StringRef(io::format_to_string(stats.format)), alloc);
    details.AddMember("total", static_cast<std::uint64_t>(stats.total), alloc);
    details.AddMember("processed", static_cast<std::uint64_t>(stats.processed), alloc);
    details.AddMember("errors", static_cast<std::uint64_t>(stats.errors), alloc);
    details.AddMember("index_errors", static_cast<std::uint64_t>(index_errors), alloc);
    details.AddMember("cancelled", stats.cancelled, alloc);
    details.AddMember("elapsed_seconds", stats.elapsed_seconds, alloc);
    details.AddMember("files_per_second", stats.files_per_second, alloc);

    store::AuditRepository audit_log(db_);
    audit_log.log_action(action, case_id, options_.user_name, &details);
}

IngestStats Ingestor::ingest(const std::filesystem::path& archive, std::int64_t case_id,
                             unsigned workers, const io::ProgressCallback& progress) {
    require_case(case_id);
    const auto start = std::chrono::steady_clock::now();

    // 1. Формат
    io::ContainerFormat format = io::detect_format(archive);
    report(progress, 0, std::string("Detected ") + io::display_name(format) + " format");
    if (log_ != nullptr) {
        log_->info(std::string("Detected format: ") + io::format_to_string(format));
    }

    // 2. Индекс (create_indexer бросает UnsupportedFormat)
    auto indexer = io::create_indexer(archive, format, log_);
    indexer->set_entry_timeout(options_.entry_timeout);
    report(progress, 10, "Building file index...");
    io::IndexResult index = indexer->index(scaled(progress, 10, 30));
    if (log_ != nullptr) {
        log_->info("Indexed " + std::to_string(index.descriptors.size()) + " files (" +
                   std::to_string(indexer->bytes_read()) + " bytes read)");
    }

    // 3. Параллельная обработка
    report(progress, 30, "Processing files in parallel...");
    ParallelProcessor processor(db_, log_);
    ProcessOptions popts;
    popts.workers = workers;
    popts.progress = scaled(progress, 30, 90);
    popts.cancel = options_.cancel;
    IngestStats stats = processor.process(index.descriptors, case_id, popts);
    stats.format = format;
    // Повреждённые записи каталога не дали дескрипторов, но входят в итог
    stats.errors += index.errors;
    stats.total += index.errors;

    // 4. Финализация
    report(progress, 95, "Finalizing...");
    store::CaseRepository cases(db_);
    store::CaseUpdate update;
    update.evidence_source_path = platform::path_to_utf8(archive);
    cases.update_case(case_id, update);

    stats.elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    stats.files_per_second = stats.elapsed_seconds > 0.0
                                 ? static_cast<double>(stats.total) / stats.elapsed_seconds
                                 : 0.0;
    audit("ingest_extraction", case_id, archive, stats, index.errors);

    report(progress, 100, "Complete! Processed " + std::to_string(stats.total) + " files in " +
                              format_seconds(stats.elapsed_seconds) + "s");
    return stats;
}

IngestStats Ingestor::extract_and_import(const std::filesystem::path& archive,
                                         std::int64_t case_id,
                                         const std::optional<std::filesystem::path>& target_dir,
                                         const io::EntryFilter& filter, unsigned workers,
                                         const io::ProgressCallback& progress) {
    require_case(case_id);

    io::ContainerFormat format = io::detect_format(archive);
    auto indexer = io::create_indexer(archive, format, log_);
    indexer->set_entry_timeout(options_.entry_timeout);

    std::filesystem::path target;
    if (target_dir) {
        target = *target_dir;
    } else {
        temp_dir_ = platform::make_temp_directory(options_.extract_prefix);
        target = *temp_dir_;
    }
    if (log_ != nullptr) {
        log_->info("Extracting to: " + platform::path_to_utf8(target));
    }

    report(progress, 0, "Extracting files...");
    io::ExtractResult extracted = indexer->extract_all(target, filter, scaled(progress, 0, 50));
    if (log_ != nullptr) {
        log_->info("Extracted " + std::to_string(extracted.extracted) + "/" +
                   std::to_string(extracted.total) + " files");
    }

    report(progress, 50, "Importing extracted files...");
    IngestStats stats = process_directory(target, case_id, workers, scaled(progress, 50, 100));
    stats.format = format;
    stats.errors += extracted.errors;
    stats.total += extracted.errors;
    audit("ingest_full_extraction", case_id, archive, stats, extracted.errors);
    return stats;
}

IngestStats Ingestor::import_directory(const std::filesystem::path& root, std::int64_t case_id,
                                       unsigned workers, const io::ProgressCallback& progress) {
    require_case(case_id);
    IngestStats stats = process_directory(root, case_id, workers, progress);
    audit("import_directory", case_id, root, stats, 0);
    return stats;
}

IngestStats Ingestor::process_directory(const std::filesystem::path& root, std::int64_t case_id,
                                        unsigned workers, const io::ProgressCallback& progress) {
    const auto start = std::chrono::steady_clock::now();

    io::DiscoveryOptions dopts;
    dopts.skip_errors = true;
    dopts.log = log_;
    auto paths = io::discover_files({root}, dopts);

    std::vector<io::FileDescriptor> descriptors;
    descriptors.reserve(paths.size());
    for (const auto& p : paths) {
        descriptors.push_back(describe_file(p, root));
    }

    ParallelProcessor processor(db_, log_);
    ProcessOptions popts;
    popts.workers = workers;
    popts.progress = progress;
    popts.cancel = options_.cancel;
    popts.import_root = root;
    IngestStats stats = processor.process(descriptors, case_id, popts);

    // Время включает обход директории
    stats.elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    stats.files_per_second = stats.elapsed_seconds > 0.0
                                 ? static_cast<double>(stats.total) / stats.elapsed_seconds
                                 : 0.0;
    return stats;
}

void Ingestor::cleanup() {
    if (!temp_dir_) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(*temp_dir_, ec);
    if (ec && log_ != nullptr) {
        log_->warn("failed to remove '" + platform::path_to_utf8(*temp_dir_) + "' - " +
                   ec.message());
    }
    temp_dir_.reset();
}

}  // namespace evidex::ingest
