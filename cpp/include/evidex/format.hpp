// ==============================================================================
// evidex/format.hpp - Определение формата контейнера извлечения
// ==============================================================================
//
// Назначение:
// - ContainerFormat: закрытый набор типов контейнеров
// - detect_format(): расширение + сигнатура + дешёвый просмотр листинга ZIP
// - Строковые имена форматов и признак поддержки индексации
//
// detect_format() никогда не бросает исключений: нечитаемые или
// неизвестные файлы дают ContainerFormat::Unknown.
//
// ==============================================================================

#ifndef EVIDEX_FORMAT_HPP
#define EVIDEX_FORMAT_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evidex::io {

// ----------------------------------------------------------------------------
// ContainerFormat
// ----------------------------------------------------------------------------

enum class ContainerFormat {
    CellebriteZip,   // ZIP с XML-отчётом (*report*.xml)
    CellebriteUfdr,  // .ufdr (ZIP внутри)
    OxygenOfb,       // .ofb (ZIP внутри)
    AxiomMfdb,       // .mfdb (собственная БД, не индексируется)
    GenericZip,      // ZIP с manifest.json / metadata.json
    ZipArchive,      // прочие ZIP
    RawImage,        // .bin/.dd/.raw/.img (образ диска, не индексируется)
    TarArchive,      // .tar / .tar.gz / .tgz
    AndroidBackup,   // .ab (adb backup)
    Unknown
};

/// "cellebrite_zip", "zip_archive", "unknown", ...
const char* format_to_string(ContainerFormat f);

std::optional<ContainerFormat> format_from_string(std::string_view s);

/// Человекочитаемое имя ("Cellebrite UFDR")
const char* display_name(ContainerFormat f);

/// Есть ли для формата потоковый индексатор
bool is_indexable(ContainerFormat f);

/// Семейство ZIP (центральный каталог)
bool is_zip_family(ContainerFormat f);

// ----------------------------------------------------------------------------
// Определение формата
// ----------------------------------------------------------------------------

/// Классифицировать файл. Не бросает исключений.
ContainerFormat detect_format(const std::filesystem::path& path);

/// Уточнить ZIP по листингу имён: XML-отчёт -> CellebriteZip,
/// manifest.json/metadata.json -> GenericZip, иначе ZipArchive
ContainerFormat classify_zip_listing(const std::vector<std::string>& entry_names);

}  // namespace evidex::io

#endif  // EVIDEX_FORMAT_HPP
