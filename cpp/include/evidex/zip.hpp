// ==============================================================================
// evidex/zip.hpp - Индексатор ZIP по центральному каталогу
// ==============================================================================
//
// Назначение:
// - Индексация по центральному каталогу (libarchive zip_seekable): с диска
//   читаются хвост файла, каталог и локальные заголовки, но не данные
// - Повреждённый каталог: повторный проход по локальным заголовкам
// - Распаковка stored/deflate элементов с проверкой CRC-32
//
// Используется для всех форматов семейства ZIP (UFDR, OFB, CLBX, ZIP).
//
// ==============================================================================

#ifndef EVIDEX_ZIP_HPP
#define EVIDEX_ZIP_HPP

#include "evidex/archive_reader.hpp"

#include <string>
#include <vector>

namespace evidex::io {

class ZipIndexer : public StreamingIndexer {
public:
    explicit ZipIndexer(const std::filesystem::path& archive,
                        ContainerFormat format = ContainerFormat::ZipArchive,
                        output::Writer* log = nullptr);

    /// Имена всех элементов, включая каталоги (с завершающим '/')
    std::vector<std::string> entry_names();

    /// Центральный каталог оказался повреждён и обход идёт по локальным заголовкам
    bool scanning_local_headers() const { return layout_ == ReaderLayout::ZipLocalHeaders; }

protected:
    std::unique_ptr<ArchiveReader> open_reader() override;
    bool recover(const std::string& error, std::size_t headers_seen) override;

    /// Время DOS - местное время без зоны
    std::string format_mtime(std::time_t t) const override;

private:
    ReaderLayout layout_ = ReaderLayout::ZipCentralDirectory;
};

/// Только имена элементов (для уточнения формата)
/// @throws evidex::Error если каталог не читается
std::vector<std::string> list_zip_entry_names(const std::filesystem::path& archive);

}  // namespace evidex::io

#endif  // EVIDEX_ZIP_HPP
