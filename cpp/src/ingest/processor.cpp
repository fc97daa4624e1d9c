// ==============================================================================
// processor.cpp - Параллельная обработка дескрипторов
// ==============================================================================

#include "evidex/processor.hpp"

#include "evidex/errors.hpp"
#include "evidex/output.hpp"
#include "evidex/platform.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <mutex>
#include <thread>

namespace evidex::ingest {

namespace {

/// Путь относительно корня импорта; имя файла, если путь вне корня
std::string relative_to_root(const std::filesystem::path& file, const std::filesystem::path& root) {
    std::filesystem::path rel = file.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty() || *rel.begin() == "..") {
        return platform::path_to_utf8(file.filename());
    }
    return platform::path_to_utf8(rel);
}

/// Счётчики одного потока, сливаются после join
struct WorkerTally {
    std::size_t processed = 0;
    std::size_t errors = 0;
    std::map<taxonomy::Category, std::size_t> per_category;
};

}  // namespace

unsigned resolve_workers(unsigned requested, std::size_t batch) {
    unsigned workers = requested == 0 ? platform::hardware_threads() : requested;
    workers = std::clamp(workers, 1u, MAX_WORKERS);
    if (batch > 0 && batch < workers) {
        workers = static_cast<unsigned>(batch);
    }
    return workers;
}

store::EvidenceFile make_evidence_file(const io::FileDescriptor& descriptor, std::int64_t case_id,
                                       const std::optional<std::filesystem::path>& import_root) {
    store::EvidenceFile f;
    f.case_id = case_id;
    f.file_path = descriptor.path;
    f.file_name = descriptor.name;
    f.file_type = descriptor.category;
    f.file_size = static_cast<std::int64_t>(descriptor.size);
    f.file_hash = descriptor.hash;

    if (!descriptor.source_archive.empty()) {
        f.source_archive = descriptor.source_archive;
        f.file_relative_path = descriptor.path;
    } else if (import_root) {
        f.file_relative_path = relative_to_root(platform::path_from_utf8(descriptor.path), *import_root);
    }

    if (!descriptor.created.empty()) {
        f.date_created = descriptor.created;
    }
    if (!descriptor.modified.empty()) {
        f.date_modified = descriptor.modified;
    }
    if (!descriptor.accessed.empty()) {
        f.date_accessed = descriptor.accessed;
    }

    const io::ExifMetadata& exif = descriptor.exif;
    f.date_taken = exif.date_taken;
    f.camera_make = exif.camera_make;
    f.camera_model = exif.camera_model;
    f.gps_latitude = exif.gps_latitude;
    f.gps_longitude = exif.gps_longitude;
    f.gps_altitude = exif.gps_altitude;
    return f;
}

// ----------------------------------------------------------------------------
// ParallelProcessor
// ----------------------------------------------------------------------------

ParallelProcessor::ParallelProcessor(store::Database& db, output::Writer* log)
    : db_(db), log_(log) {}

IngestStats ParallelProcessor::process(const std::vector<io::FileDescriptor>& descriptors,
                                       std::int64_t case_id, const ProcessOptions& options) {
    store::CaseRepository cases(db_);
    if (!cases.get_case(case_id)) {
        throw Error(ErrorKind::NotFound, "case " + std::to_string(case_id) + " not found");
    }

    const auto start = std::chrono::steady_clock::now();
    const std::size_t total = descriptors.size();
    const unsigned workers = resolve_workers(options.workers, total);

    IngestStats stats;
    stats.total = total;

    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> completed{0};
    std::atomic<bool> stop{false};
    std::mutex progress_mutex;
    std::exception_ptr progress_failure;
    std::vector<WorkerTally> tallies(workers);

    auto cancelled = [&]() {
        return stop.load(std::memory_order_relaxed) ||
               (options.cancel != nullptr && options.cancel->cancelled());
    };

    auto worker = [&](WorkerTally& tally) {
        store::FileRepository files(db_);
        while (!cancelled()) {
            std::size_t index = next.fetch_add(1, std::memory_order_relaxed);
            if (index >= total) {
                break;
            }
            const io::FileDescriptor& d = descriptors[index];

            try {
                files.add_file(make_evidence_file(d, case_id, options.import_root));
                ++tally.processed;
                ++tally.per_category[d.category];
            } catch (const std::exception& e) {
                ++tally.errors;
                if (log_ != nullptr) {
                    log_->warn("failed to add '" + d.path + "' - " + e.what());
                }
            }

            std::size_t done = completed.fetch_add(1, std::memory_order_relaxed) + 1;
            if (options.progress) {
                std::lock_guard<std::mutex> lock(progress_mutex);
                if (progress_failure) {
                    continue;
                }
                try {
                    options.progress(done, total, "Processing: " + d.name);
                } catch (...) {
                    // Ошибка колбэка останавливает пакет и пробрасывается после join
                    progress_failure = std::current_exception();
                    stop.store(true, std::memory_order_relaxed);
                }
            }
        }
    };

    if (workers == 1) {
        worker(tallies[0]);
    } else {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (unsigned i = 0; i < workers; ++i) {
            threads.emplace_back(worker, std::ref(tallies[i]));
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    if (progress_failure) {
        std::rethrow_exception(progress_failure);
    }

    for (const auto& tally : tallies) {
        stats.processed += tally.processed;
        stats.errors += tally.errors;
        for (const auto& [category, count] : tally.per_category) {
            stats.per_category[category] += count;
        }
    }
    stats.cancelled = stats.processed + stats.errors < total;

    // Строго после завершения всех потоков
    cases.recount_statistics(case_id);

    stats.elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    stats.files_per_second =
        stats.elapsed_seconds > 0.0 ? static_cast<double>(total) / stats.elapsed_seconds : 0.0;

    if (log_ != nullptr) {
        log_->debug("processed " + std::to_string(stats.processed) + "/" + std::to_string(total) +
                    " descriptors with " + std::to_string(workers) + " workers");
    }
    return stats;
}

}  // namespace evidex::ingest
