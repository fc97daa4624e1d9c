// ==============================================================================
// archive.cpp - Потоковый индексатор архивов (общий каркас)
// ==============================================================================

#include "evidex/archive.hpp"

#include "evidex/errors.hpp"
#include "evidex/output.hpp"
#include "evidex/platform.hpp"
#include "evidex/tar.hpp"
#include "evidex/zip.hpp"

#include <fstream>
#include <system_error>

namespace evidex::io {

// ----------------------------------------------------------------------------
// ArchiveIndexer
// ----------------------------------------------------------------------------

ArchiveIndexer::ArchiveIndexer(std::filesystem::path archive, ContainerFormat format,
                               output::Writer* log)
    : archive_(std::move(archive)), format_(format), log_(log) {}

FileDescriptor ArchiveIndexer::make_descriptor(const std::string& entry_path, std::uint64_t size,
                                               std::string modified) const {
    FileDescriptor d;
    d.path = entry_path;
    d.name = taxonomy::file_name_of(entry_path);
    d.size = size;
    d.modified = std::move(modified);
    d.category = taxonomy::categorize(d.name, d.path, {}, {});
    d.source_archive = platform::path_to_utf8(archive_);
    d.indexed = true;
    return d;
}

void ArchiveIndexer::write_entry(const std::filesystem::path& target_dir,
                                 const std::string& entry_path,
                                 const std::function<void(const ChunkSink&)>& produce) {
    std::filesystem::path out_path = safe_join(target_dir, entry_path);

    std::error_code ec;
    std::filesystem::create_directories(out_path.parent_path(), ec);
    if (ec) {
        throw Error(ErrorKind::Io, "failed to create directory for '" + entry_path + "' - " +
                                       ec.message());
    }

    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw Error(ErrorKind::Io, "failed to create '" + platform::path_to_utf8(out_path) + "'");
    }

    try {
        produce([&](const char* data, std::size_t size) {
            out.write(data, static_cast<std::streamsize>(size));
            if (!out) {
                throw Error(ErrorKind::Io,
                            "failed to write '" + platform::path_to_utf8(out_path) + "'");
            }
        });
    } catch (const std::exception&) {
        // Недописанный файл не должен попасть в импорт
        out.close();
        std::filesystem::remove(out_path, ec);
        throw;
    }

    out.close();
    if (!out) {
        throw Error(ErrorKind::Io, "failed to close '" + platform::path_to_utf8(out_path) + "'");
    }
}

void ArchiveIndexer::log_warning(const std::string& message) const {
    if (log_ != nullptr) {
        log_->warn(message);
    }
}

void ArchiveIndexer::log_debug(const std::string& message) const {
    if (log_ != nullptr) {
        log_->debug(message);
    }
}

// ----------------------------------------------------------------------------
// EntryDeadline
// ----------------------------------------------------------------------------

EntryDeadline::EntryDeadline(std::chrono::milliseconds timeout, std::string entry)
    : start_(std::chrono::steady_clock::now()), timeout_(timeout), entry_(std::move(entry)) {}

void EntryDeadline::check() const {
    if (timeout_.count() <= 0) {
        return;
    }
    if (std::chrono::steady_clock::now() - start_ > timeout_) {
        throw Error(ErrorKind::CorruptEntry, "read of '" + entry_ + "' timed out after " +
                                                 std::to_string(timeout_.count()) + " ms");
    }
}

// ----------------------------------------------------------------------------
// Фабрика
// ----------------------------------------------------------------------------

std::unique_ptr<ArchiveIndexer> create_indexer(const std::filesystem::path& archive,
                                               ContainerFormat format, output::Writer* log) {
    if (is_zip_family(format)) {
        return std::make_unique<ZipIndexer>(archive, format, log);
    }
    if (format == ContainerFormat::TarArchive) {
        return std::make_unique<TarIndexer>(archive, format, log);
    }
    if (format == ContainerFormat::AndroidBackup) {
        return std::make_unique<AndroidBackupIndexer>(archive, log);
    }
    throw Error(ErrorKind::UnsupportedFormat, std::string("Unsupported format: ") +
                                                  format_to_string(format) + " (" +
                                                  platform::path_to_utf8(archive) + ")");
}

std::unique_ptr<ArchiveIndexer> open_archive(const std::filesystem::path& archive,
                                             output::Writer* log) {
    return create_indexer(archive, detect_format(archive), log);
}

// ----------------------------------------------------------------------------
// Пути распаковки
// ----------------------------------------------------------------------------

bool is_safe_entry_path(const std::string& entry_path) {
    if (entry_path.empty() || entry_path[0] == '/' || entry_path[0] == '\\') {
        return false;
    }
    // "C:..." - абсолютный путь Windows
    if (entry_path.size() >= 2 && entry_path[1] == ':') {
        return false;
    }

    std::size_t start = 0;
    while (start <= entry_path.size()) {
        std::size_t sep = entry_path.find_first_of("/\\", start);
        std::size_t end = (sep == std::string::npos) ? entry_path.size() : sep;
        if (entry_path.compare(start, end - start, "..") == 0 && end - start == 2) {
            return false;
        }
        if (sep == std::string::npos) {
            break;
        }
        start = sep + 1;
    }
    return true;
}

std::filesystem::path safe_join(const std::filesystem::path& target_dir,
                                const std::string& entry_path) {
    if (!is_safe_entry_path(entry_path)) {
        throw Error(ErrorKind::CorruptEntry, "unsafe entry path '" + entry_path + "'");
    }
    std::filesystem::path relative = platform::path_from_utf8(entry_path);
    return target_dir / relative.relative_path();
}

}  // namespace evidex::io
