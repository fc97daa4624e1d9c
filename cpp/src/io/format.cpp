// ==============================================================================
// format.cpp - Определение формата контейнера извлечения
// ==============================================================================

#include "evidex/format.hpp"

#include "evidex/errors.hpp"
#include "evidex/platform.hpp"
#include "evidex/zip.hpp"

#include <array>
#include <cstring>
#include <fstream>

namespace evidex::io {

namespace {

struct FormatName {
    ContainerFormat format;
    const char* id;
    const char* display;
};

constexpr std::array<FormatName, 10> FORMAT_NAMES = {{
    {ContainerFormat::CellebriteZip, "cellebrite_zip", "Cellebrite ZIP"},
    {ContainerFormat::CellebriteUfdr, "cellebrite_ufdr", "Cellebrite UFDR"},
    {ContainerFormat::OxygenOfb, "oxygen_ofb", "Oxygen OFB"},
    {ContainerFormat::AxiomMfdb, "axiom_mfdb", "Magnet AXIOM MFDB"},
    {ContainerFormat::GenericZip, "generic_zip", "Generic extraction ZIP"},
    {ContainerFormat::ZipArchive, "zip_archive", "ZIP archive"},
    {ContainerFormat::RawImage, "raw_image", "Raw disk image"},
    {ContainerFormat::TarArchive, "tar_archive", "TAR archive"},
    {ContainerFormat::AndroidBackup, "android_backup", "Android backup"},
    {ContainerFormat::Unknown, "unknown", "Unknown"},
}};

constexpr const char ANDROID_BACKUP_MAGIC[] = "ANDROID BACKUP\n";
constexpr std::size_t TAR_MAGIC_OFFSET = 257;
constexpr std::size_t SNIFF_SIZE = 512;

bool ends_with(const std::string& s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// Уточнение ZIP по листингу; при нечитаемом каталоге - ZipArchive
ContainerFormat sniff_zip_family(const std::filesystem::path& path) {
    try {
        return classify_zip_listing(list_zip_entry_names(path));
    } catch (const Error&) {
        return ContainerFormat::ZipArchive;
    }
}

/// Сигнатура в первых 512 байтах
ContainerFormat sniff_signature(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return ContainerFormat::Unknown;
    }
    char head[SNIFF_SIZE] = {};
    in.read(head, sizeof(head));
    std::size_t got = static_cast<std::size_t>(in.gcount());

    if (got >= 4 && std::memcmp(head, "PK\x03\x04", 4) == 0) {
        return ContainerFormat::ZipArchive;
    }
    std::size_t ab_len = sizeof(ANDROID_BACKUP_MAGIC) - 1;
    if (got >= ab_len && std::memcmp(head, ANDROID_BACKUP_MAGIC, ab_len) == 0) {
        return ContainerFormat::AndroidBackup;
    }
    if (got >= TAR_MAGIC_OFFSET + 5 && std::memcmp(head + TAR_MAGIC_OFFSET, "ustar", 5) == 0) {
        return ContainerFormat::TarArchive;
    }
    return ContainerFormat::Unknown;
}

}  // namespace

// ----------------------------------------------------------------------------
// Имена
// ----------------------------------------------------------------------------

const char* format_to_string(ContainerFormat f) {
    for (const auto& n : FORMAT_NAMES) {
        if (n.format == f) {
            return n.id;
        }
    }
    return "unknown";
}

std::optional<ContainerFormat> format_from_string(std::string_view s) {
    for (const auto& n : FORMAT_NAMES) {
        if (s == n.id) {
            return n.format;
        }
    }
    return std::nullopt;
}

const char* display_name(ContainerFormat f) {
    for (const auto& n : FORMAT_NAMES) {
        if (n.format == f) {
            return n.display;
        }
    }
    return "Unknown";
}

bool is_zip_family(ContainerFormat f) {
    switch (f) {
        case ContainerFormat::CellebriteZip:
        case ContainerFormat::CellebriteUfdr:
        case ContainerFormat::OxygenOfb:
        case ContainerFormat::GenericZip:
        case ContainerFormat::ZipArchive:
            return true;
        default:
            return false;
    }
}

bool is_indexable(ContainerFormat f) {
    return is_zip_family(f) || f == ContainerFormat::TarArchive ||
           f == ContainerFormat::AndroidBackup;
}

// ----------------------------------------------------------------------------
// Определение формата
// ----------------------------------------------------------------------------

ContainerFormat classify_zip_listing(const std::vector<std::string>& entry_names) {
    bool has_manifest = false;
    for (const auto& raw : entry_names) {
        std::string name = platform::to_lower_ascii(raw);
        if (ends_with(name, ".xml") && name.find("report") != std::string::npos) {
            return ContainerFormat::CellebriteZip;
        }
        if (name == "manifest.json" || name == "metadata.json") {
            has_manifest = true;
        }
    }
    return has_manifest ? ContainerFormat::GenericZip : ContainerFormat::ZipArchive;
}

ContainerFormat detect_format(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return ContainerFormat::Unknown;
    }

    std::string name = platform::to_lower_ascii(platform::path_to_utf8(path.filename()));

    if (ends_with(name, ".ufdr")) {
        return ContainerFormat::CellebriteUfdr;
    }
    if (ends_with(name, ".ofb")) {
        return ContainerFormat::OxygenOfb;
    }
    if (ends_with(name, ".mfdb")) {
        return ContainerFormat::AxiomMfdb;
    }
    if (ends_with(name, ".zip") || ends_with(name, ".clbx")) {
        return sniff_zip_family(path);
    }
    if (ends_with(name, ".bin") || ends_with(name, ".dd") || ends_with(name, ".raw") ||
        ends_with(name, ".img")) {
        return ContainerFormat::RawImage;
    }
    if (ends_with(name, ".tar") || ends_with(name, ".tar.gz") || ends_with(name, ".tgz")) {
        return ContainerFormat::TarArchive;
    }
    if (ends_with(name, ".ab")) {
        return ContainerFormat::AndroidBackup;
    }

    // Расширение не помогло: сигнатура
    ContainerFormat sniffed = sniff_signature(path);
    if (sniffed == ContainerFormat::ZipArchive) {
        return sniff_zip_family(path);
    }
    return sniffed;
}

}  // namespace evidex::io
