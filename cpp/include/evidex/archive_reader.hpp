// ==============================================================================
// evidex/archive_reader.hpp - Чтение контейнеров через libarchive
// ==============================================================================
//
// Назначение:
// - ArchiveReader: RAII-обёртка над struct archive, читающая через ByteSource
//   (колбэки read / skip / seek, учёт прочитанных с диска байтов)
// - StreamingIndexer: общий обход заголовков для ZIP, TAR и Android Backup
//
// Индексация только перебирает заголовки: данные элементов пропускаются
// seek'ом (plain TAR, ZIP по центральному каталогу) или распаковкой потока
// (сжатый TAR, где каталога нет).
//
// ==============================================================================

#ifndef EVIDEX_ARCHIVE_READER_HPP
#define EVIDEX_ARCHIVE_READER_HPP

#include "evidex/archive.hpp"
#include "evidex/byte_stream.hpp"

#include <cstdint>
#include <ctime>
#include <functional>
#include <memory>
#include <string>

struct archive;
struct archive_entry;

namespace evidex::io {

// ----------------------------------------------------------------------------
// ArchiveReader
// ----------------------------------------------------------------------------

/// Какие форматы libarchive включить
enum class ReaderLayout {
    ZipCentralDirectory,  // zip_seekable: список из центрального каталога
    ZipLocalHeaders,      // zip_streamable: проход по локальным заголовкам
    Tar,                  // tar (+ все фильтры сжатия)
};

struct ReaderClient;

class ArchiveReader {
public:
    /// Открыть контейнер. bytes_counter (может быть nullptr) накапливает
    /// байты, прочитанные с диска.
    /// @throws evidex::Error(UnsupportedFormat) если libarchive не распознал поток
    ArchiveReader(std::unique_ptr<ByteSource> source, ReaderLayout layout, std::string label,
                  std::uint64_t* bytes_counter);
    ~ArchiveReader();

    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;

    /// archive_read_next_header(); код возврата libarchive
    int next_header(struct archive_entry** entry);

    /// Передать данные текущего элемента кусками. Дыры разреженных
    /// элементов заполняются нулями.
    /// @throws evidex::Error(CorruptEntry) при ошибке распаковки или CRC
    void read_data(const std::string& entry_path, const ChunkSink& sink,
                   const EntryDeadline* deadline);

    /// Последняя ошибка libarchive
    std::string error_message() const;

    const std::string& label() const { return label_; }

private:
    struct Free {
        void operator()(struct archive* a) const;
    };

    std::unique_ptr<ReaderClient> client_;
    std::unique_ptr<struct archive, Free> handle_;
    std::string label_;
};

// ----------------------------------------------------------------------------
// StreamingIndexer
// ----------------------------------------------------------------------------

/// Элемент контейнера, как его видит обход
struct EntryInfo {
    std::string path;        // без ведущего "./"
    std::uint64_t size = 0;
    std::string modified;    // "YYYY-MM-DD HH:MM:SS" или пусто
    bool directory = false;  // включая имя с завершающим '/'
    bool regular = false;
};

class StreamingIndexer : public ArchiveIndexer {
public:
    IndexResult index(const ProgressCallback& progress) override;
    ExtractResult extract_all(const std::filesystem::path& target_dir, const EntryFilter& filter,
                              const ProgressCallback& progress) override;
    void stream_entry(const std::string& entry_path, const ChunkSink& sink) override;
    std::uint64_t bytes_read() const override { return bytes_read_; }

protected:
    StreamingIndexer(std::filesystem::path archive, ContainerFormat format, output::Writer* log);

    /// Новый проход по контейнеру
    virtual std::unique_ptr<ArchiveReader> open_reader() = 0;

    /// Обход оборвался фатальной ошибкой после headers_seen заголовков.
    /// true - открыть проход заново (open_reader()) и продолжить.
    virtual bool recover(const std::string& error, std::size_t headers_seen);

    /// mtime элемента; по умолчанию UTC
    virtual std::string format_mtime(std::time_t t) const;

    /// false из посетителя останавливает обход
    using EntryVisitor = std::function<bool(const EntryInfo& entry, ArchiveReader& reader)>;

    struct WalkStats {
        std::size_t headers = 0;
        std::size_t errors = 0;  // повреждённые заголовки / области / каталог
    };

    WalkStats walk(const EntryVisitor& visit);

    std::string archive_label() const;

    std::uint64_t bytes_read_ = 0;
};

/// Убрать ведущие "./" из пути элемента
std::string normalize_entry_path(const std::string& raw);

}  // namespace evidex::io

#endif  // EVIDEX_ARCHIVE_READER_HPP
