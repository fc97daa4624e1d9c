// ==============================================================================
// zip.cpp - Индексатор ZIP по центральному каталогу
// ==============================================================================

#include "evidex/zip.hpp"

#include "evidex/platform.hpp"

namespace evidex::io {

ZipIndexer::ZipIndexer(const std::filesystem::path& archive, ContainerFormat format,
                       output::Writer* log)
    : StreamingIndexer(archive, format, log) {}

std::unique_ptr<ArchiveReader> ZipIndexer::open_reader() {
    return std::make_unique<ArchiveReader>(std::make_unique<FileSource>(archive_), layout_,
                                           archive_label(), &bytes_read_);
}

bool ZipIndexer::recover(const std::string& error, std::size_t headers_seen) {
    // Каталог читается целиком до первого заголовка: ошибка после него
    // относится к данным, а не к каталогу
    if (layout_ != ReaderLayout::ZipCentralDirectory || headers_seen != 0) {
        return false;
    }
    log_warning("central directory of " + archive_label() + " is damaged (" + error +
                "), scanning local headers");
    layout_ = ReaderLayout::ZipLocalHeaders;
    return true;
}

std::string ZipIndexer::format_mtime(std::time_t t) const {
    return platform::format_local_timestamp(t);
}

std::vector<std::string> ZipIndexer::entry_names() {
    std::vector<std::string> names;
    walk([&](const EntryInfo& entry, ArchiveReader&) {
        std::string name = entry.path;
        if (entry.directory && !name.empty() && name.back() != '/') {
            name.push_back('/');
        }
        names.push_back(std::move(name));
        return true;
    });
    return names;
}

std::vector<std::string> list_zip_entry_names(const std::filesystem::path& archive) {
    ZipIndexer indexer(archive);
    return indexer.entry_names();
}

}  // namespace evidex::io
