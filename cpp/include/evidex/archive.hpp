// ==============================================================================
// evidex/archive.hpp - Потоковый индексатор архивов (общий каркас)
// ==============================================================================
//
// Назначение:
// - FileDescriptor: лёгкая запись об элементе контейнера (до сохранения)
// - ArchiveIndexer: интерфейс индексатора (index / extract_all / stream_entry)
// - Фабрика индексаторов по формату
// - Безопасное соединение путей при распаковке
//
// Индексация читает только каталог/таблицу элементов контейнера и не
// распаковывает содержимое. Память пропорциональна числу элементов, а не
// их несжатому размеру.
//
// ==============================================================================

#ifndef EVIDEX_ARCHIVE_HPP
#define EVIDEX_ARCHIVE_HPP

#include "evidex/exif.hpp"
#include "evidex/format.hpp"
#include "evidex/taxonomy.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace evidex::output {
class Writer;
}

namespace evidex::io {

// ----------------------------------------------------------------------------
// Колбэки
// ----------------------------------------------------------------------------

/// (current, total, message); total == 0 если число элементов заранее неизвестно
using ProgressCallback =
    std::function<void(std::size_t current, std::size_t total, const std::string& message)>;

/// Предикат по пути элемента внутри контейнера
using EntryFilter = std::function<bool(const std::string& entry_path)>;

/// Приёмник содержимого элемента кусками
using ChunkSink = std::function<void(const char* data, std::size_t size)>;

// ----------------------------------------------------------------------------
// FileDescriptor
// ----------------------------------------------------------------------------

struct FileDescriptor {
    std::string name;            // последний компонент пути
    std::string path;            // путь внутри контейнера ("DCIM/Camera/a.jpg")
    std::uint64_t size = 0;      // несжатый размер
    std::string modified;        // "YYYY-MM-DD HH:MM:SS" или пусто
    std::string created;         // только для файлов файловой системы
    std::string accessed;
    taxonomy::Category category = taxonomy::Category::Other;
    std::string source_archive;  // путь контейнера (UTF-8)
    bool indexed = true;
    std::optional<std::string> hash;  // всегда nullopt при индексации
    ExifMetadata exif;                // изображения файловой системы
};

// ----------------------------------------------------------------------------
// Результаты
// ----------------------------------------------------------------------------

struct IndexResult {
    std::vector<FileDescriptor> descriptors;
    std::size_t total_entries = 0;        // все записи каталога, включая папки
    std::size_t directories_skipped = 0;
    std::size_t errors = 0;               // повреждённые записи каталога
};

struct ExtractResult {
    std::size_t total = 0;      // элементы-файлы, прошедшие фильтр
    std::size_t extracted = 0;
    std::size_t errors = 0;
    std::size_t filtered_out = 0;
};

// ----------------------------------------------------------------------------
// ArchiveIndexer
// ----------------------------------------------------------------------------

class ArchiveIndexer {
public:
    ArchiveIndexer(std::filesystem::path archive, ContainerFormat format, output::Writer* log);
    virtual ~ArchiveIndexer() = default;

    ArchiveIndexer(const ArchiveIndexer&) = delete;
    ArchiveIndexer& operator=(const ArchiveIndexer&) = delete;

    /// Построить дескрипторы по каталогу контейнера.
    /// Прогресс "(i, total, "Indexing: <name>")" после каждого элемента.
    /// @throws evidex::Error(UnsupportedFormat) если контейнер не читается целиком
    virtual IndexResult index(const ProgressCallback& progress) = 0;

    /// Полная распаковка в target_dir. Ошибка одного элемента
    /// журналируется и учитывается в errors, пакет продолжается.
    virtual ExtractResult extract_all(const std::filesystem::path& target_dir,
                                      const EntryFilter& filter,
                                      const ProgressCallback& progress) = 0;

    /// Передать содержимое одного элемента кусками
    /// @throws evidex::Error(NotFound) если элемента нет
    /// @throws evidex::Error(CorruptEntry) при ошибке чтения элемента
    virtual void stream_entry(const std::string& entry_path, const ChunkSink& sink) = 0;

    /// Байты контейнера, прочитанные с диска этим индексатором
    virtual std::uint64_t bytes_read() const = 0;

    ContainerFormat format() const { return format_; }

    /// Таймаут чтения одного элемента (0 = без ограничения).
    /// Проверяется между кусками, один блокирующий read() не прерывается.
    void set_entry_timeout(std::chrono::milliseconds timeout) { entry_timeout_ = timeout; }

protected:
    /// Дескриптор по пути элемента
    FileDescriptor make_descriptor(const std::string& entry_path, std::uint64_t size,
                                   std::string modified) const;

    /// Записать один элемент в target_dir; produce передаёт содержимое в sink
    void write_entry(const std::filesystem::path& target_dir, const std::string& entry_path,
                     const std::function<void(const ChunkSink&)>& produce);

    void log_warning(const std::string& message) const;
    void log_debug(const std::string& message) const;

    std::filesystem::path archive_;
    ContainerFormat format_;
    output::Writer* log_;
    std::chrono::milliseconds entry_timeout_{0};
};

// ----------------------------------------------------------------------------
// EntryDeadline - кооперативный таймаут чтения элемента
// ----------------------------------------------------------------------------

class EntryDeadline {
public:
    EntryDeadline(std::chrono::milliseconds timeout, std::string entry);

    /// @throws evidex::Error(CorruptEntry) если время вышло
    void check() const;

private:
    std::chrono::steady_clock::time_point start_;
    std::chrono::milliseconds timeout_;
    std::string entry_;
};

// ----------------------------------------------------------------------------
// Фабрика
// ----------------------------------------------------------------------------

/// Индексатор для известного формата
/// @throws evidex::Error(UnsupportedFormat) для неиндексируемых форматов
std::unique_ptr<ArchiveIndexer> create_indexer(const std::filesystem::path& archive,
                                               ContainerFormat format,
                                               output::Writer* log = nullptr);

/// detect_format() + create_indexer()
std::unique_ptr<ArchiveIndexer> open_archive(const std::filesystem::path& archive,
                                             output::Writer* log = nullptr);

// ----------------------------------------------------------------------------
// Пути распаковки
// ----------------------------------------------------------------------------

/// Путь элемента безопасен: не абсолютный, без "..", без пустого имени
bool is_safe_entry_path(const std::string& entry_path);

/// target_dir / entry_path
/// @throws evidex::Error(CorruptEntry) для небезопасного пути
std::filesystem::path safe_join(const std::filesystem::path& target_dir,
                                const std::string& entry_path);

}  // namespace evidex::io

#endif  // EVIDEX_ARCHIVE_HPP
