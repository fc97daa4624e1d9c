// ==============================================================================
// archive_reader.cpp - Чтение контейнеров через libarchive
// ==============================================================================

#include "evidex/archive_reader.hpp"

#include "evidex/errors.hpp"
#include "evidex/output.hpp"
#include "evidex/platform.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <system_error>
#include <vector>

namespace evidex::io {

// Клиентские данные колбэков libarchive
struct ReaderClient {
    std::unique_ptr<ByteSource> source;
    FileSource* file = nullptr;  // nullptr - поток без произвольного доступа
    std::vector<char> buffer;
    std::uint64_t* bytes_counter = nullptr;
};

namespace {

constexpr std::size_t READ_BLOCK = 16 * 1024;
constexpr std::size_t ZERO_CHUNK = 64 * 1024;

// Подряд идущие ARCHIVE_RETRY, после которых обход прекращается
constexpr std::size_t MAX_RESYNC_ATTEMPTS = 4096;

la_ssize_t read_callback(struct archive* a, void* data, const void** buffer) {
    auto* client = static_cast<ReaderClient*>(data);
    try {
        std::uint64_t before = client->source->bytes_read();
        std::size_t got = client->source->read(client->buffer.data(), client->buffer.size());
        if (client->bytes_counter != nullptr) {
            *client->bytes_counter += client->source->bytes_read() - before;
        }
        *buffer = client->buffer.data();
        return static_cast<la_ssize_t>(got);
    } catch (const std::exception& e) {
        // Исключение не должно пересечь C-код libarchive
        archive_set_error(a, EIO, "%s", e.what());
        return ARCHIVE_FATAL;
    }
}

la_int64_t skip_callback(struct archive* a, void* data, la_int64_t request) {
    auto* client = static_cast<ReaderClient*>(data);
    if (client->file == nullptr || request <= 0) {
        return 0;
    }
    try {
        std::uint64_t left = client->file->size() - client->file->position();
        std::uint64_t n = std::min<std::uint64_t>(static_cast<std::uint64_t>(request), left);
        client->file->skip(n);
        return static_cast<la_int64_t>(n);
    } catch (const std::exception& e) {
        archive_set_error(a, EIO, "%s", e.what());
        return ARCHIVE_FATAL;
    }
}

la_int64_t seek_callback(struct archive* a, void* data, la_int64_t offset, int whence) {
    auto* client = static_cast<ReaderClient*>(data);
    if (client->file == nullptr) {
        archive_set_error(a, ESPIPE, "stream is not seekable");
        return ARCHIVE_FATAL;
    }

    la_int64_t base = 0;
    if (whence == SEEK_CUR) {
        base = static_cast<la_int64_t>(client->file->position());
    } else if (whence == SEEK_END) {
        base = static_cast<la_int64_t>(client->file->size());
    }
    la_int64_t target = base + offset;
    if (target < 0 || static_cast<std::uint64_t>(target) > client->file->size()) {
        archive_set_error(a, EINVAL, "seek outside of file (%lld)", static_cast<long long>(target));
        return ARCHIVE_FATAL;
    }

    try {
        client->file->seek(static_cast<std::uint64_t>(target));
        return target;
    } catch (const std::exception& e) {
        archive_set_error(a, EIO, "%s", e.what());
        return ARCHIVE_FATAL;
    }
}

void configure(struct archive* a, ReaderLayout layout) {
    switch (layout) {
        case ReaderLayout::ZipCentralDirectory:
            archive_read_support_format_zip_seekable(a);
            break;
        case ReaderLayout::ZipLocalHeaders:
            archive_read_support_format_zip_streamable(a);
            break;
        case ReaderLayout::Tar:
            archive_read_support_format_tar(a);
            // Пустой файл - пустой архив, а не ошибка формата
            archive_read_support_format_empty(a);
            archive_read_support_filter_all(a);
            break;
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// ArchiveReader
// ----------------------------------------------------------------------------

void ArchiveReader::Free::operator()(struct archive* a) const {
    archive_read_free(a);
}

ArchiveReader::ArchiveReader(std::unique_ptr<ByteSource> source, ReaderLayout layout,
                             std::string label, std::uint64_t* bytes_counter)
    : client_(std::make_unique<ReaderClient>()),
      handle_(archive_read_new()),
      label_(std::move(label)) {
    if (!handle_) {
        throw Error(ErrorKind::Io, "archive_read_new failed");
    }

    client_->file = dynamic_cast<FileSource*>(source.get());
    client_->source = std::move(source);
    client_->buffer.resize(READ_BLOCK);
    client_->bytes_counter = bytes_counter;

    struct archive* a = handle_.get();
    configure(a, layout);
    archive_read_set_callback_data(a, client_.get());
    archive_read_set_read_callback(a, read_callback);
    if (client_->file != nullptr) {
        archive_read_set_skip_callback(a, skip_callback);
        // Смещения ZIP абсолютны от начала файла; TAR seek не использует
        if (layout != ReaderLayout::Tar) {
            archive_read_set_seek_callback(a, seek_callback);
        }
    }

    if (archive_read_open1(a) < ARCHIVE_WARN) {
        throw Error(ErrorKind::UnsupportedFormat,
                    "cannot read " + label_ + " - " + error_message());
    }
}

ArchiveReader::~ArchiveReader() = default;

int ArchiveReader::next_header(struct archive_entry** entry) {
    return archive_read_next_header(handle_.get(), entry);
}

void ArchiveReader::read_data(const std::string& entry_path, const ChunkSink& sink,
                              const EntryDeadline* deadline) {
    std::uint64_t written = 0;
    std::vector<char> zeros;

    while (true) {
        if (deadline != nullptr) {
            deadline->check();
        }

        const void* block = nullptr;
        std::size_t size = 0;
        la_int64_t offset = 0;
        int rc = archive_read_data_block(handle_.get(), &block, &size, &offset);
        if (rc == ARCHIVE_EOF) {
            return;
        }
        if (rc != ARCHIVE_OK) {
            throw Error(ErrorKind::CorruptEntry,
                        "failed to read '" + entry_path + "' - " + error_message());
        }

        std::uint64_t at = offset < 0 ? written : static_cast<std::uint64_t>(offset);
        while (written < at) {
            if (zeros.empty()) {
                zeros.assign(ZERO_CHUNK, '\0');
            }
            std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(ZERO_CHUNK, at - written));
            sink(zeros.data(), n);
            written += n;
        }
        if (size > 0) {
            sink(static_cast<const char*>(block), size);
            written += size;
        }
    }
}

std::string ArchiveReader::error_message() const {
    const char* message = archive_error_string(handle_.get());
    return message != nullptr ? message : "unknown archive error";
}

// ----------------------------------------------------------------------------
// StreamingIndexer
// ----------------------------------------------------------------------------

std::string normalize_entry_path(const std::string& raw) {
    std::size_t start = 0;
    while (raw.compare(start, 2, "./") == 0) {
        start += 2;
    }
    if (raw.size() - start == 1 && raw[start] == '.') {
        return {};
    }
    return raw.substr(start);
}

StreamingIndexer::StreamingIndexer(std::filesystem::path archive, ContainerFormat format,
                                   output::Writer* log)
    : ArchiveIndexer(std::move(archive), format, log) {}

bool StreamingIndexer::recover(const std::string&, std::size_t) {
    return false;
}

std::string StreamingIndexer::format_mtime(std::time_t t) const {
    return platform::format_timestamp(t);
}

std::string StreamingIndexer::archive_label() const {
    return platform::path_to_utf8(archive_);
}

StreamingIndexer::WalkStats StreamingIndexer::walk(const EntryVisitor& visit) {
    WalkStats stats;
    std::unique_ptr<ArchiveReader> reader = open_reader();
    std::size_t retries = 0;

    while (true) {
        struct archive_entry* entry = nullptr;
        int rc = reader->next_header(&entry);
        if (rc == ARCHIVE_EOF) {
            break;
        }

        if (rc == ARCHIVE_RETRY) {
            // Повреждённая область считается одной ошибкой, сколько бы
            // блоков libarchive ни отбросил до следующего заголовка
            if (retries == 0) {
                ++stats.errors;
                log_warning(archive_label() + ": damaged header - " + reader->error_message());
            }
            if (++retries > MAX_RESYNC_ATTEMPTS) {
                log_warning(archive_label() + ": no valid header found, stopping");
                break;
            }
            continue;
        }
        retries = 0;

        if (rc == ARCHIVE_FATAL) {
            ++stats.errors;
            std::string message = reader->error_message();
            if (recover(message, stats.headers)) {
                reader = open_reader();
                continue;
            }
            log_warning(archive_label() + ": " + message);
            break;
        }
        if (rc == ARCHIVE_FAILED) {
            ++stats.errors;
            log_warning(archive_label() + ": unreadable entry - " + reader->error_message());
            continue;
        }
        if (rc == ARCHIVE_WARN) {
            log_warning(archive_label() + ": " + reader->error_message());
        }

        const char* name = archive_entry_pathname_utf8(entry);
        if (name == nullptr) {
            name = archive_entry_pathname(entry);
        }
        if (name == nullptr) {
            ++stats.errors;
            log_warning(archive_label() + ": entry without a readable name");
            continue;
        }

        EntryInfo info;
        info.path = normalize_entry_path(name);
        // Старые TAR помечают каталог только завершающим '/'
        info.directory = archive_entry_filetype(entry) == AE_IFDIR || info.path.empty() ||
                         info.path.back() == '/';
        info.regular = !info.directory && archive_entry_filetype(entry) == AE_IFREG;
        if (archive_entry_size_is_set(entry) != 0 && archive_entry_size(entry) > 0) {
            info.size = static_cast<std::uint64_t>(archive_entry_size(entry));
        }
        if (archive_entry_mtime_is_set(entry) != 0) {
            info.modified = format_mtime(archive_entry_mtime(entry));
        }

        ++stats.headers;
        if (!visit(info, *reader)) {
            break;
        }
    }

    return stats;
}

IndexResult StreamingIndexer::index(const ProgressCallback& progress) {
    IndexResult result;
    WalkStats stats = walk([&](const EntryInfo& entry, ArchiveReader&) {
        ++result.total_entries;
        if (entry.directory) {
            ++result.directories_skipped;
            return true;
        }
        // Ссылки и устройства дескрипторов не дают
        if (!entry.regular) {
            return true;
        }

        FileDescriptor d = make_descriptor(entry.path, entry.size, entry.modified);
        std::string message = "Indexing: " + d.name;
        result.descriptors.push_back(std::move(d));
        if (progress) {
            // Число элементов заранее неизвестно: заголовки читаются по одному
            progress(result.descriptors.size(), 0, message);
        }
        return true;
    });
    result.errors = stats.errors;

    log_debug("indexed " + std::to_string(result.descriptors.size()) + " entries from " +
              archive_label() + " (" + std::to_string(bytes_read_) + " bytes read)");
    return result;
}

ExtractResult StreamingIndexer::extract_all(const std::filesystem::path& target_dir,
                                            const EntryFilter& filter,
                                            const ProgressCallback& progress) {
    std::error_code ec;
    std::filesystem::create_directories(target_dir, ec);
    if (ec) {
        throw Error(ErrorKind::Io, "failed to create target directory '" +
                                       platform::path_to_utf8(target_dir) + "' - " + ec.message());
    }

    ExtractResult result;
    WalkStats stats = walk([&](const EntryInfo& entry, ArchiveReader& reader) {
        if (!entry.regular) {
            return true;
        }
        if (filter && !filter(entry.path)) {
            ++result.filtered_out;
            return true;
        }

        ++result.total;
        try {
            EntryDeadline deadline(entry_timeout_, entry.path);
            write_entry(target_dir, entry.path, [&](const ChunkSink& sink) {
                reader.read_data(entry.path, sink, &deadline);
            });
            ++result.extracted;
        } catch (const Error& e) {
            ++result.errors;
            log_warning("failed to extract '" + entry.path + "' - " + e.what());
        } catch (const std::filesystem::filesystem_error& e) {
            ++result.errors;
            log_warning("failed to extract '" + entry.path + "' - " + e.what());
        }

        if (progress) {
            progress(result.total, 0, "Extracting: " + taxonomy::file_name_of(entry.path));
        }
        return true;
    });

    result.errors += stats.errors;
    return result;
}

void StreamingIndexer::stream_entry(const std::string& entry_path, const ChunkSink& sink) {
    bool found = false;
    walk([&](const EntryInfo& entry, ArchiveReader& reader) {
        if (!entry.regular || entry.path != entry_path) {
            return true;
        }
        found = true;
        EntryDeadline deadline(entry_timeout_, entry_path);
        reader.read_data(entry_path, sink, &deadline);
        return false;
    });

    if (!found) {
        throw Error(ErrorKind::NotFound,
                    "entry '" + entry_path + "' not found in " + archive_label());
    }
}

}  // namespace evidex::io
