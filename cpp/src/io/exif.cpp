// ==============================================================================
// exif.cpp - Метаданные EXIF изображений
// ==============================================================================
//
// Все чтения проверяют границы буфера: смещения в IFD приходят из файла
// и могут указывать куда угодно.
//
// ==============================================================================

#include "evidex/exif.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <vector>

namespace evidex::io {

namespace {

// JPEG с EXIF укладывается в первый APP1 (до 64 KiB) после APP0
constexpr std::size_t EXIF_READ_LIMIT = 128 * 1024;

constexpr std::uint16_t TAG_MAKE = 0x010F;
constexpr std::uint16_t TAG_MODEL = 0x0110;
constexpr std::uint16_t TAG_DATETIME = 0x0132;
constexpr std::uint16_t TAG_EXIF_IFD = 0x8769;
constexpr std::uint16_t TAG_GPS_IFD = 0x8825;
constexpr std::uint16_t TAG_DATETIME_ORIGINAL = 0x9003;

constexpr std::uint16_t TAG_GPS_LATITUDE_REF = 1;
constexpr std::uint16_t TAG_GPS_LATITUDE = 2;
constexpr std::uint16_t TAG_GPS_LONGITUDE_REF = 3;
constexpr std::uint16_t TAG_GPS_LONGITUDE = 4;
constexpr std::uint16_t TAG_GPS_ALTITUDE_REF = 5;
constexpr std::uint16_t TAG_GPS_ALTITUDE = 6;

constexpr std::uint16_t TYPE_BYTE = 1;
constexpr std::uint16_t TYPE_ASCII = 2;
constexpr std::uint16_t TYPE_LONG = 4;
constexpr std::uint16_t TYPE_RATIONAL = 5;

std::size_t type_size(std::uint16_t type) {
    switch (type) {
        case 1:   // BYTE
        case 2:   // ASCII
        case 6:   // SBYTE
        case 7:   // UNDEFINED
            return 1;
        case 3:   // SHORT
        case 8:   // SSHORT
            return 2;
        case 4:   // LONG
        case 9:   // SLONG
        case 11:  // FLOAT
            return 4;
        case 5:   // RATIONAL
        case 10:  // SRATIONAL
        case 12:  // DOUBLE
            return 8;
        default:
            return 0;
    }
}

// ----------------------------------------------------------------------------
// TiffView - блок TIFF с порядком байт из заголовка
// ----------------------------------------------------------------------------

class TiffView {
public:
    TiffView(const unsigned char* data, std::size_t size, bool big_endian)
        : data_(data), size_(size), big_endian_(big_endian) {}

    std::optional<std::uint16_t> u16(std::size_t offset) const {
        if (offset > size_ || size_ - offset < 2) {
            return std::nullopt;
        }
        const unsigned char* p = data_ + offset;
        return big_endian_ ? static_cast<std::uint16_t>((p[0] << 8) | p[1])
                           : static_cast<std::uint16_t>(p[0] | (p[1] << 8));
    }

    std::optional<std::uint32_t> u32(std::size_t offset) const {
        if (offset > size_ || size_ - offset < 4) {
            return std::nullopt;
        }
        const unsigned char* p = data_ + offset;
        if (big_endian_) {
            return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
                   (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
        }
        return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
               (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
    }

    const unsigned char* data() const { return data_; }
    std::size_t size() const { return size_; }

private:
    const unsigned char* data_;
    std::size_t size_;
    bool big_endian_;
};

struct IfdEntry {
    std::uint16_t tag = 0;
    std::uint16_t type = 0;
    std::uint32_t count = 0;
    std::size_t value_offset = 0;  // данные уже проверены на границы
};

/// Записи IFD; записи с данными за пределами блока пропускаются
std::vector<IfdEntry> read_ifd(const TiffView& tiff, std::size_t offset) {
    std::vector<IfdEntry> entries;
    auto count = tiff.u16(offset);
    if (!count) {
        return entries;
    }

    for (std::size_t i = 0; i < *count; ++i) {
        std::size_t at = offset + 2 + i * 12;
        auto tag = tiff.u16(at);
        auto type = tiff.u16(at + 2);
        auto n = tiff.u32(at + 4);
        auto inline_value = tiff.u32(at + 8);
        if (!tag || !type || !n || !inline_value) {
            break;
        }
        std::size_t unit = type_size(*type);
        if (unit == 0) {
            continue;
        }

        IfdEntry entry;
        entry.tag = *tag;
        entry.type = *type;
        entry.count = *n;
        std::uint64_t bytes = static_cast<std::uint64_t>(unit) * *n;
        if (bytes <= 4) {
            entry.value_offset = at + 8;
        } else {
            if (*inline_value > tiff.size() || bytes > tiff.size() - *inline_value) {
                continue;
            }
            entry.value_offset = *inline_value;
        }
        entries.push_back(entry);
    }
    return entries;
}

std::optional<std::string> ascii_value(const TiffView& tiff, const IfdEntry& e) {
    if (e.type != TYPE_ASCII) {
        return std::nullopt;
    }
    const char* p = reinterpret_cast<const char*>(tiff.data() + e.value_offset);
    std::size_t n = 0;
    while (n < e.count && p[n] != '\0') {
        ++n;
    }
    while (n > 0 && p[n - 1] == ' ') {
        --n;
    }
    if (n == 0) {
        return std::nullopt;
    }
    return std::string(p, n);
}

std::optional<std::uint32_t> long_value(const TiffView& tiff, const IfdEntry& e) {
    if (e.type != TYPE_LONG || e.count < 1) {
        return std::nullopt;
    }
    return tiff.u32(e.value_offset);
}

std::optional<double> rational_value(const TiffView& tiff, const IfdEntry& e, std::size_t index) {
    if (e.type != TYPE_RATIONAL || index >= e.count) {
        return std::nullopt;
    }
    auto num = tiff.u32(e.value_offset + index * 8);
    auto den = tiff.u32(e.value_offset + index * 8 + 4);
    if (!num || !den || *den == 0) {
        return std::nullopt;
    }
    return static_cast<double>(*num) / static_cast<double>(*den);
}

/// Градусы, минуты, секунды -> десятичные градусы
std::optional<double> degrees_value(const TiffView& tiff, const IfdEntry& e) {
    auto d = rational_value(tiff, e, 0);
    auto m = rational_value(tiff, e, 1);
    auto s = rational_value(tiff, e, 2);
    if (!d || !m || !s) {
        return std::nullopt;
    }
    return *d + *m / 60.0 + *s / 3600.0;
}

/// "YYYY:MM:DD HH:MM:SS" -> "YYYY-MM-DD HH:MM:SS"
std::optional<std::string> exif_datetime(const std::string& value) {
    static const char shape[] = "dddd:dd:dd dd:dd:dd";
    if (value.size() < sizeof(shape) - 1) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < sizeof(shape) - 1; ++i) {
        bool ok = shape[i] == 'd' ? (value[i] >= '0' && value[i] <= '9') : value[i] == shape[i];
        if (!ok) {
            return std::nullopt;
        }
    }
    // Камеры без часов пишут нули
    if (value.compare(0, 4, "0000") == 0) {
        return std::nullopt;
    }
    std::string out = value.substr(0, sizeof(shape) - 1);
    out[4] = '-';
    out[7] = '-';
    return out;
}

const IfdEntry* find_tag(const std::vector<IfdEntry>& entries, std::uint16_t tag) {
    for (const auto& e : entries) {
        if (e.tag == tag) {
            return &e;
        }
    }
    return nullptr;
}

std::optional<double> signed_coordinate(const TiffView& tiff, const std::vector<IfdEntry>& gps,
                                        std::uint16_t ref_tag, std::uint16_t value_tag,
                                        char negative_ref, double limit) {
    const IfdEntry* ref = find_tag(gps, ref_tag);
    const IfdEntry* value = find_tag(gps, value_tag);
    if (ref == nullptr || value == nullptr) {
        return std::nullopt;
    }
    auto ref_text = ascii_value(tiff, *ref);
    auto degrees = degrees_value(tiff, *value);
    if (!ref_text || !degrees || *degrees > limit) {
        return std::nullopt;
    }
    return (*ref_text)[0] == negative_ref ? -*degrees : *degrees;
}

void read_gps(const TiffView& tiff, std::size_t offset, ExifMetadata& out) {
    std::vector<IfdEntry> gps = read_ifd(tiff, offset);

    out.gps_latitude =
        signed_coordinate(tiff, gps, TAG_GPS_LATITUDE_REF, TAG_GPS_LATITUDE, 'S', 90.0);
    out.gps_longitude =
        signed_coordinate(tiff, gps, TAG_GPS_LONGITUDE_REF, TAG_GPS_LONGITUDE, 'W', 180.0);

    if (const IfdEntry* alt = find_tag(gps, TAG_GPS_ALTITUDE)) {
        auto meters = rational_value(tiff, *alt, 0);
        if (meters) {
            // AltitudeRef 1 - ниже уровня моря
            const IfdEntry* ref = find_tag(gps, TAG_GPS_ALTITUDE_REF);
            bool below = ref != nullptr && ref->type == TYPE_BYTE &&
                         tiff.data()[ref->value_offset] == 1;
            out.gps_altitude = below ? -*meters : *meters;
        }
    }
}

ExifMetadata parse_tiff(const unsigned char* data, std::size_t size) {
    ExifMetadata out;
    if (size < 8) {
        return out;
    }
    bool big_endian = false;
    if (std::memcmp(data, "MM\0*", 4) == 0) {
        big_endian = true;
    } else if (std::memcmp(data, "II*\0", 4) != 0) {
        return out;
    }

    TiffView tiff(data, size, big_endian);
    auto ifd0 = tiff.u32(4);
    if (!ifd0) {
        return out;
    }

    std::optional<std::string> datetime;
    std::optional<std::uint32_t> exif_ifd;
    std::optional<std::uint32_t> gps_ifd;
    for (const auto& e : read_ifd(tiff, *ifd0)) {
        switch (e.tag) {
            case TAG_MAKE:
                out.camera_make = ascii_value(tiff, e);
                break;
            case TAG_MODEL:
                out.camera_model = ascii_value(tiff, e);
                break;
            case TAG_DATETIME:
                if (auto text = ascii_value(tiff, e)) {
                    datetime = exif_datetime(*text);
                }
                break;
            case TAG_EXIF_IFD:
                exif_ifd = long_value(tiff, e);
                break;
            case TAG_GPS_IFD:
                gps_ifd = long_value(tiff, e);
                break;
            default:
                break;
        }
    }

    // DateTimeOriginal - момент съёмки; DateTime меняют редакторы
    if (exif_ifd && *exif_ifd != *ifd0) {
        std::vector<IfdEntry> exif = read_ifd(tiff, *exif_ifd);
        if (const IfdEntry* e = find_tag(exif, TAG_DATETIME_ORIGINAL)) {
            if (auto text = ascii_value(tiff, *e)) {
                out.date_taken = exif_datetime(*text);
            }
        }
    }
    if (!out.date_taken) {
        out.date_taken = datetime;
    }

    if (gps_ifd && *gps_ifd != *ifd0) {
        read_gps(tiff, *gps_ifd, out);
    }
    return out;
}

/// Сегменты JPEG до первого APP1 "Exif\0\0" или начала скана
ExifMetadata parse_jpeg(const unsigned char* data, std::size_t size) {
    std::size_t offset = 2;
    while (offset < size) {
        if (data[offset] != 0xFF) {
            return {};
        }
        while (offset < size && data[offset] == 0xFF) {
            ++offset;
        }
        if (offset >= size) {
            break;
        }
        unsigned char marker = data[offset++];
        if (marker == 0xD9 || marker == 0xDA) {
            break;
        }
        if ((marker >= 0xD0 && marker <= 0xD7) || marker == 0x01) {
            continue;
        }

        if (size - offset < 2) {
            break;
        }
        std::size_t length = static_cast<std::size_t>((data[offset] << 8) | data[offset + 1]);
        if (length < 2) {
            return {};
        }
        std::size_t payload = offset + 2;
        // Обрезанный сегмент разбирается в пределах прочитанного
        std::size_t available = std::min(length - 2, size - std::min(size, payload));

        if (marker == 0xE1 && available >= 6 && std::memcmp(data + payload, "Exif\0\0", 6) == 0) {
            return parse_tiff(data + payload + 6, available - 6);
        }
        offset = payload + (length - 2);
    }
    return {};
}

}  // namespace

ExifMetadata parse_exif(const unsigned char* data, std::size_t size) {
    if (data == nullptr || size < 4) {
        return {};
    }
    if (data[0] == 0xFF && data[1] == 0xD8) {
        return parse_jpeg(data, size);
    }
    return parse_tiff(data, size);
}

ExifMetadata read_exif(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return {};
    }
    std::vector<unsigned char> buffer(EXIF_READ_LIMIT);
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    return parse_exif(buffer.data(), static_cast<std::size_t>(in.gcount()));
}

}  // namespace evidex::io
