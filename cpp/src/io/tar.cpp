// ==============================================================================
// tar.cpp - Индексатор TAR и Android Backup
// ==============================================================================

#include "evidex/tar.hpp"

#include "evidex/errors.hpp"
#include "evidex/platform.hpp"

namespace evidex::io {

namespace {

constexpr const char ANDROID_BACKUP_MAGIC[] = "ANDROID BACKUP";
constexpr std::size_t AB_MAX_LINE = 128;

/// Строка заголовка Android Backup до '\n'
std::string read_header_line(FileSource& file) {
    std::string line;
    char c = 0;
    while (line.size() < AB_MAX_LINE) {
        if (file.read(&c, 1) == 0) {
            throw Error(ErrorKind::UnsupportedFormat, "truncated Android backup header");
        }
        if (c == '\n') {
            return line;
        }
        line.push_back(c);
    }
    throw Error(ErrorKind::UnsupportedFormat, "malformed Android backup header");
}

}  // namespace

// ----------------------------------------------------------------------------
// TarIndexer
// ----------------------------------------------------------------------------

TarIndexer::TarIndexer(const std::filesystem::path& archive, ContainerFormat format,
                       output::Writer* log)
    : StreamingIndexer(archive, format, log) {}

std::unique_ptr<ByteSource> TarIndexer::open_stream() {
    return std::make_unique<FileSource>(archive_);
}

std::unique_ptr<ArchiveReader> TarIndexer::open_reader() {
    return std::make_unique<ArchiveReader>(open_stream(), ReaderLayout::Tar, archive_label(),
                                           &bytes_read_);
}

// ----------------------------------------------------------------------------
// Android Backup
// ----------------------------------------------------------------------------

AndroidBackupHeader read_android_backup_header(FileSource& file) {
    if (read_header_line(file) != ANDROID_BACKUP_MAGIC) {
        throw Error(ErrorKind::UnsupportedFormat, "not an Android backup");
    }

    AndroidBackupHeader header;
    try {
        header.version = std::stoi(read_header_line(file));
        header.compressed = std::stoi(read_header_line(file)) != 0;
    } catch (const std::logic_error&) {
        throw Error(ErrorKind::UnsupportedFormat, "malformed Android backup header");
    }
    header.encryption = read_header_line(file);
    return header;
}

AndroidBackupIndexer::AndroidBackupIndexer(const std::filesystem::path& archive,
                                           output::Writer* log)
    : TarIndexer(archive, ContainerFormat::AndroidBackup, log) {}

std::unique_ptr<ByteSource> AndroidBackupIndexer::open_stream() {
    auto file = std::make_unique<FileSource>(archive_);
    header_ = read_android_backup_header(*file);

    if (header_.encryption != "none") {
        throw Error(ErrorKind::UnsupportedFormat, "encrypted Android backup (" +
                                                      header_.encryption + ") is not supported");
    }
    if (header_.compressed) {
        return std::make_unique<InflateSource>(std::move(file), 15);
    }
    return file;
}

}  // namespace evidex::io
