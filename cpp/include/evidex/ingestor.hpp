// ==============================================================================
// evidex/ingestor.hpp - Конвейер приёма извлечений
// ==============================================================================
//
// Назначение:
// - ingest(): формат -> индекс -> параллельное сохранение -> пересчёт -> аудит
// - extract_and_import(): полная распаковка и импорт распакованного дерева
// - import_directory(): импорт папки с уликами
//
// Фазы прогресса ingest(): 0 формат, 10-30 индекс, 30-90 обработка,
// 95 финализация, 100 готово.
//
// ==============================================================================

#ifndef EVIDEX_INGESTOR_HPP
#define EVIDEX_INGESTOR_HPP

#include "evidex/archive.hpp"
#include "evidex/processor.hpp"
#include "evidex/repository.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace evidex::output {
class Writer;
}

namespace evidex::ingest {

struct IngestOptions {
    std::chrono::milliseconds entry_timeout{0};
    std::string user_name = "System";
    std::string extract_prefix = "evidex_extract_";
    const CancelToken* cancel = nullptr;
};

class Ingestor {
public:
    Ingestor(store::Database& db, output::Writer* log, IngestOptions options = {});
    ~Ingestor();

    Ingestor(const Ingestor&) = delete;
    Ingestor& operator=(const Ingestor&) = delete;

    /// Быстрый путь: только индекс контейнера, без распаковки содержимого
    /// @throws evidex::Error(NotFound) если дела нет
    /// @throws evidex::Error(UnsupportedFormat) если формат не индексируется
    IngestStats ingest(const std::filesystem::path& archive, std::int64_t case_id,
                       unsigned workers, const io::ProgressCallback& progress);

    /// Полная распаковка в target_dir (или новую временную директорию) и импорт.
    /// Прогресс: 0-50 распаковка, 50-100 импорт.
    IngestStats extract_and_import(const std::filesystem::path& archive, std::int64_t case_id,
                                   const std::optional<std::filesystem::path>& target_dir,
                                   const io::EntryFilter& filter, unsigned workers,
                                   const io::ProgressCallback& progress);

    /// Импорт директории (рекурсивно, отсортировано, ошибки пропускаются)
    IngestStats import_directory(const std::filesystem::path& root, std::int64_t case_id,
                                 unsigned workers, const io::ProgressCallback& progress);

    /// Временная директория последней распаковки
    const std::optional<std::filesystem::path>& temp_directory() const { return temp_dir_; }

    /// Удалить временную директорию распаковки
    void cleanup();

private:
    void require_case(std::int64_t case_id);
    IngestStats process_directory(const std::filesystem::path& root, std::int64_t case_id,
                                  unsigned workers, const io::ProgressCallback& progress);
    void audit(const std::string& action, std::int64_t case_id, const std::filesystem::path& source,
               const IngestStats& stats, std::size_t index_errors);

    store::Database& db_;
    output::Writer* log_;
    IngestOptions options_;
    std::optional<std::filesystem::path> temp_dir_;
};

/// Дескриптор файла файловой системы (категория по пути относительно root)
io::FileDescriptor describe_file(const std::filesystem::path& file, const std::filesystem::path& root);

}  // namespace evidex::ingest

#endif  // EVIDEX_INGESTOR_HPP
