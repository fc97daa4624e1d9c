// ==============================================================================
// evidex/tar.hpp - Индексатор TAR и Android Backup
// ==============================================================================
//
// Назначение:
// - TAR (ustar / GNU / pax) и сжатый TAR через libarchive
// - Несжатый TAR: данные пропускаются seek'ом, читаются только заголовки
// - Android Backup: заголовок "ANDROID BACKUP", затем zlib-поток TAR,
//   который распаковывается последовательно с ограниченным буфером
//
// ==============================================================================

#ifndef EVIDEX_TAR_HPP
#define EVIDEX_TAR_HPP

#include "evidex/archive_reader.hpp"
#include "evidex/byte_stream.hpp"

#include <memory>
#include <string>

namespace evidex::io {

// ----------------------------------------------------------------------------
// TarIndexer
// ----------------------------------------------------------------------------

class TarIndexer : public StreamingIndexer {
public:
    explicit TarIndexer(const std::filesystem::path& archive,
                        ContainerFormat format = ContainerFormat::TarArchive,
                        output::Writer* log = nullptr);

protected:
    std::unique_ptr<ArchiveReader> open_reader() override;

    /// Поток с первым байтом TAR; сжатие распознаёт libarchive
    virtual std::unique_ptr<ByteSource> open_stream();
};

// ----------------------------------------------------------------------------
// Android Backup
// ----------------------------------------------------------------------------

struct AndroidBackupHeader {
    int version = 0;
    bool compressed = false;
    std::string encryption;  // "none" или имя алгоритма
};

class AndroidBackupIndexer : public TarIndexer {
public:
    explicit AndroidBackupIndexer(const std::filesystem::path& archive,
                                  output::Writer* log = nullptr);

    const AndroidBackupHeader& header() const { return header_; }

protected:
    /// Пропускает текстовый заголовок; zlib-поток распаковывается здесь,
    /// у libarchive нет фильтра для zlib без gzip-обёртки
    /// @throws evidex::Error(UnsupportedFormat) для зашифрованной или
    ///         некорректной резервной копии
    std::unique_ptr<ByteSource> open_stream() override;

private:
    AndroidBackupHeader header_;
};

/// Прочитать заголовок из начала файла; источник остаётся за заголовком
/// @throws evidex::Error(UnsupportedFormat) при неверной сигнатуре
AndroidBackupHeader read_android_backup_header(FileSource& file);

}  // namespace evidex::io

#endif  // EVIDEX_TAR_HPP
