// ==============================================================================
// evidex/processor.hpp - Параллельная обработка дескрипторов
// ==============================================================================
//
// Назначение:
// - ParallelProcessor: пул потоков, сохраняющий дескрипторы в evidence_files
// - IngestStats: итог пакета (счётчики, категории, скорость)
// - CancelToken: кооперативная отмена между элементами
//
// Ошибка одного элемента увеличивает errors и не останавливает пакет.
// Прогресс сообщается в порядке завершения, а не в порядке входа.
// Пересчёт счётчиков дела выполняется после завершения всех потоков.
//
// ==============================================================================

#ifndef EVIDEX_PROCESSOR_HPP
#define EVIDEX_PROCESSOR_HPP

#include "evidex/archive.hpp"
#include "evidex/repository.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <vector>

namespace evidex::output {
class Writer;
}

namespace evidex::ingest {

// ----------------------------------------------------------------------------
// CancelToken
// ----------------------------------------------------------------------------

class CancelToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    bool cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

// ----------------------------------------------------------------------------
// IngestStats
// ----------------------------------------------------------------------------

struct IngestStats {
    std::size_t total = 0;
    std::size_t processed = 0;
    std::size_t errors = 0;
    bool cancelled = false;
    std::map<taxonomy::Category, std::size_t> per_category;
    double elapsed_seconds = 0.0;
    double files_per_second = 0.0;
    io::ContainerFormat format = io::ContainerFormat::Unknown;
};

// ----------------------------------------------------------------------------
// ProcessOptions
// ----------------------------------------------------------------------------

constexpr unsigned MAX_WORKERS = 64;

struct ProcessOptions {
    /// 0 - число аппаратных потоков
    unsigned workers = 0;

    /// (завершено, всего, "Processing: <name>")
    io::ProgressCallback progress;

    const CancelToken* cancel = nullptr;

    /// Корень импорта директории: относительные пути считаются от него.
    /// Для элементов архива относительный путь - путь внутри контейнера.
    std::optional<std::filesystem::path> import_root;
};

/// Число потоков: 0 -> hardware_threads(), затем [1, MAX_WORKERS] и не больше batch
unsigned resolve_workers(unsigned requested, std::size_t batch);

/// Дескриптор -> строка evidence_files (hash всегда null)
store::EvidenceFile make_evidence_file(const io::FileDescriptor& descriptor, std::int64_t case_id,
                                       const std::optional<std::filesystem::path>& import_root);

// ----------------------------------------------------------------------------
// ParallelProcessor
// ----------------------------------------------------------------------------

class ParallelProcessor {
public:
    ParallelProcessor(store::Database& db, output::Writer* log = nullptr);

    /// Сохранить пакет дескрипторов в дело.
    /// @throws evidex::Error(NotFound) если дела нет (до запуска потоков)
    IngestStats process(const std::vector<io::FileDescriptor>& descriptors, std::int64_t case_id,
                        const ProcessOptions& options);

private:
    store::Database& db_;
    output::Writer* log_;
};

}  // namespace evidex::ingest

#endif  // EVIDEX_PROCESSOR_HPP
