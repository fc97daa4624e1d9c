// ==============================================================================
// test_fixtures.hpp - Общие помощники тестов: временные директории, сборка
// ZIP, TAR и EXIF в памяти
// ==============================================================================

#ifndef EVIDEX_TEST_FIXTURES_HPP
#define EVIDEX_TEST_FIXTURES_HPP

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <zlib.h>

// Platform-specific includes для PID (уникальные temp директории при параллельных тестах)
#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace evidex::test {

// ==============================================================================
// TempDirTest: уникальная временная директория на тест
// ==============================================================================

class TempDirTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    virtual const char* prefix() const { return "evidex_test_"; }

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string(prefix()) + test_info->test_case_name() + "_" +
                                  test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );

        test_dir_ = std::filesystem::temp_directory_path() / unique_name;
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path write_file(const std::filesystem::path& rel, const std::string& content) {
        std::filesystem::path p = test_dir_ / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return p;
    }
};

// ==============================================================================
// Байтовые помощники
// ==============================================================================

inline void put_u16(std::string& out, std::uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

inline void put_u32(std::string& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

inline std::uint32_t crc_of(const std::string& data) {
    return static_cast<std::uint32_t>(
        crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(data.data()),
              static_cast<uInt>(data.size())));
}

/// Сжать данные zlib; window_bits -15 - raw deflate, 31 - gzip
inline std::string deflate_bytes(const std::string& data, int window_bits) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_BEST_SPEED, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::string out;
    out.resize(deflateBound(&zs, static_cast<uLong>(data.size())) + 32);
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = deflate(&zs, Z_FINISH);
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    out.resize(zs.total_out);
    return out;
}

inline void write_bytes(const std::filesystem::path& path, const std::string& bytes) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

// ==============================================================================
// ZipBuilder: stored и deflate записи, центральный каталог, EOCD
// ==============================================================================

class ZipBuilder {
public:
    /// 2023-05-17 12:30:00
    static constexpr std::uint16_t DOS_DATE = ((2023 - 1980) << 9) | (5 << 5) | 17;
    static constexpr std::uint16_t DOS_TIME = (12 << 11) | (30 << 5);

    ZipBuilder& add(const std::string& name, const std::string& content, bool deflate = false) {
        Entry e;
        e.name = name;
        e.method = deflate ? 8 : 0;
        e.crc = crc_of(content);
        e.uncompressed = static_cast<std::uint32_t>(content.size());
        std::string payload = deflate ? deflate_bytes(content, -15) : content;
        e.compressed = static_cast<std::uint32_t>(payload.size());
        e.offset = static_cast<std::uint32_t>(body_.size());

        put_u32(body_, 0x04034b50);
        put_u16(body_, 20);
        put_u16(body_, 0);
        put_u16(body_, e.method);
        put_u16(body_, DOS_TIME);
        put_u16(body_, DOS_DATE);
        put_u32(body_, e.crc);
        put_u32(body_, e.compressed);
        put_u32(body_, e.uncompressed);
        put_u16(body_, static_cast<std::uint16_t>(name.size()));
        put_u16(body_, 0);
        body_ += name;
        body_ += payload;
        entries_.push_back(e);
        return *this;
    }

    ZipBuilder& add_directory(const std::string& name) {
        return add(name.back() == '/' ? name : name + "/", "");
    }

    /// Повредить CRC последней записи одинаково в локальном заголовке и в
    /// центральном каталоге: заголовки согласованы, ошибка видна только на данных
    ZipBuilder& corrupt_last_crc() {
        Entry& e = entries_.back();
        e.crc ^= 0xFFFFFFFFu;
        std::string crc;
        put_u32(crc, e.crc);
        body_.replace(e.offset + 14, 4, crc);
        return *this;
    }

    /// Испортить сигнатуру записи центрального каталога с номером index
    ZipBuilder& corrupt_central_record(std::size_t index) {
        corrupt_central_ = index;
        return *this;
    }

    std::string bytes() const {
        std::string out = body_;
        std::uint32_t cd_offset = static_cast<std::uint32_t>(out.size());
        for (std::size_t i = 0; i < entries_.size(); ++i) {
            const Entry& e = entries_[i];
            put_u32(out, i == corrupt_central_ ? 0x0badf00du : 0x02014b50u);
            put_u16(out, 20);
            put_u16(out, 20);
            put_u16(out, 0);
            put_u16(out, e.method);
            put_u16(out, DOS_TIME);
            put_u16(out, DOS_DATE);
            put_u32(out, e.crc);
            put_u32(out, e.compressed);
            put_u32(out, e.uncompressed);
            put_u16(out, static_cast<std::uint16_t>(e.name.size()));
            put_u16(out, 0);
            put_u16(out, 0);
            put_u16(out, 0);
            put_u16(out, 0);
            put_u32(out, 0);
            put_u32(out, e.offset);
            out += e.name;
        }
        std::uint32_t cd_size = static_cast<std::uint32_t>(out.size()) - cd_offset;

        put_u32(out, 0x06054b50);
        put_u16(out, 0);
        put_u16(out, 0);
        put_u16(out, static_cast<std::uint16_t>(entries_.size()));
        put_u16(out, static_cast<std::uint16_t>(entries_.size()));
        put_u32(out, cd_size);
        put_u32(out, cd_offset);
        put_u16(out, 0);
        return out;
    }

    void write(const std::filesystem::path& path) const { write_bytes(path, bytes()); }

private:
    struct Entry {
        std::string name;
        std::uint16_t method = 0;
        std::uint32_t crc = 0;
        std::uint32_t compressed = 0;
        std::uint32_t uncompressed = 0;
        std::uint32_t offset = 0;
    };

    std::string body_;
    std::vector<Entry> entries_;
    std::size_t corrupt_central_ = static_cast<std::size_t>(-1);
};

// ==============================================================================
// TarBuilder: ustar заголовки, данные кратны 512
// ==============================================================================

class TarBuilder {
public:
    /// 2023-05-17 12:30:00 UTC
    static constexpr std::uint64_t MTIME = 1684326600;

    /// type '0' - файл, 'L' / 'x' - мета-элементы GNU / pax (тоже с данными)
    TarBuilder& add(const std::string& name, const std::string& content, char type = '0') {
        const bool has_data = type == '0' || type == 'L' || type == 'x';
        std::string header(512, '\0');
        std::memcpy(&header[0], name.data(), std::min<std::size_t>(name.size(), 100));
        put_octal(header, 100, 8, 0644);
        put_octal(header, 108, 8, 0);
        put_octal(header, 116, 8, 0);
        put_octal(header, 124, 12, has_data ? content.size() : 0);
        put_octal(header, 136, 12, MTIME);
        header[156] = type;
        std::memcpy(&header[257], "ustar", 5);
        header[262] = '\0';
        header[263] = '0';
        header[264] = '0';

        // Контрольная сумма считается с пробелами в поле chksum
        std::memset(&header[148], ' ', 8);
        unsigned sum = 0;
        for (unsigned char c : header) {
            sum += c;
        }
        char chk[8];
        std::snprintf(chk, sizeof(chk), "%06o", sum);
        std::memcpy(&header[148], chk, 6);
        header[154] = '\0';
        header[155] = ' ';

        data_ += header;
        if (has_data) {
            data_ += content;
            data_.append((512 - content.size() % 512) % 512, '\0');
        }
        return *this;
    }

    TarBuilder& add_directory(const std::string& name) {
        return add(name.back() == '/' ? name : name + "/", "", '5');
    }

    std::string bytes() const {
        std::string out = data_;
        out.append(1024, '\0');
        return out;
    }

    std::string gzip_bytes() const { return deflate_bytes(bytes(), 31); }

    void write(const std::filesystem::path& path) const { write_bytes(path, bytes()); }
    void write_gz(const std::filesystem::path& path) const { write_bytes(path, gzip_bytes()); }

private:
    static void put_octal(std::string& header, std::size_t offset, std::size_t width,
                          std::uint64_t value) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%0*llo", static_cast<int>(width - 1),
                      static_cast<unsigned long long>(value));
        std::memcpy(&header[offset], buf, width - 1);
        header[offset + width - 1] = '\0';
    }

    std::string data_;
};

// ==============================================================================
// ExifBuilder: TIFF с IFD0, Exif IFD и GPS IFD; JPEG с APP1 "Exif"
// ==============================================================================

class ExifBuilder {
public:
    enum Ifd { Ifd0 = 0, ExifIfd = 1, GpsIfd = 2 };

    explicit ExifBuilder(bool big_endian = false) : big_(big_endian) {}

    ExifBuilder& ascii(Ifd ifd, std::uint16_t tag, const std::string& text) {
        return field(ifd, tag, 2, static_cast<std::uint32_t>(text.size() + 1), text + '\0');
    }

    ExifBuilder& byte(Ifd ifd, std::uint16_t tag, std::uint8_t value) {
        return field(ifd, tag, 1, 1, std::string(1, static_cast<char>(value)));
    }

    /// RATIONAL: пары (числитель, знаменатель)
    ExifBuilder& rationals(Ifd ifd, std::uint16_t tag,
                           const std::vector<std::pair<std::uint32_t, std::uint32_t>>& values) {
        std::string data;
        for (const auto& v : values) {
            put32(data, v.first);
            put32(data, v.second);
        }
        return field(ifd, tag, 5, static_cast<std::uint32_t>(values.size()), data);
    }

    std::string tiff() const {
        const bool has_exif = !fields_[ExifIfd].empty();
        const bool has_gps = !fields_[GpsIfd].empty();

        std::size_t counts[3] = {fields_[Ifd0].size() + (has_exif ? 1 : 0) + (has_gps ? 1 : 0),
                                 fields_[ExifIfd].size(), fields_[GpsIfd].size()};
        std::uint32_t offsets[3] = {8, 0, 0};
        std::uint32_t next = 8 + ifd_size(counts[0]);
        if (has_exif) {
            offsets[ExifIfd] = next;
            next += ifd_size(counts[ExifIfd]);
        }
        if (has_gps) {
            offsets[GpsIfd] = next;
            next += ifd_size(counts[GpsIfd]);
        }

        std::string out = big_ ? std::string("MM\0*", 4) : std::string("II*\0", 4);
        put32(out, 8);
        std::string data;
        for (int k = 0; k < 3; ++k) {
            if (counts[k] == 0) {
                continue;
            }
            std::vector<Field> fields = fields_[k];
            if (k == Ifd0 && has_exif) {
                fields.push_back(pointer(0x8769, offsets[ExifIfd]));
            }
            if (k == Ifd0 && has_gps) {
                fields.push_back(pointer(0x8825, offsets[GpsIfd]));
            }
            put16(out, static_cast<std::uint16_t>(fields.size()));
            for (const auto& f : fields) {
                put16(out, f.tag);
                put16(out, f.type);
                put32(out, f.count);
                if (f.data.size() <= 4) {
                    std::string value = f.data;
                    value.resize(4, '\0');
                    out += value;
                } else {
                    put32(out, next + static_cast<std::uint32_t>(data.size()));
                    data += f.data;
                    if (data.size() % 2 != 0) {
                        data.push_back('\0');
                    }
                }
            }
            put32(out, 0);
        }
        return out + data;
    }

    /// SOI, APP0 JFIF, APP1 Exif, SOS, EOI
    std::string jpeg() const {
        std::string exif = std::string("Exif\0\0", 6) + tiff();
        std::string out("\xFF\xD8", 2);
        out += std::string("\xFF\xE0\x00\x10JFIF\x00\x01\x01\x00\x00\x01\x00\x01\x00\x00", 18);
        out += "\xFF\xE1";
        std::uint16_t length = static_cast<std::uint16_t>(exif.size() + 2);
        out.push_back(static_cast<char>(length >> 8));
        out.push_back(static_cast<char>(length & 0xFF));
        out += exif;
        out += std::string("\xFF\xDA\x00\x02", 4);
        out += std::string(64, '\x55');
        out += "\xFF\xD9";
        return out;
    }

private:
    struct Field {
        std::uint16_t tag;
        std::uint16_t type;
        std::uint32_t count;
        std::string data;
    };

    ExifBuilder& field(Ifd ifd, std::uint16_t tag, std::uint16_t type, std::uint32_t count,
                       std::string data) {
        fields_[ifd].push_back(Field{tag, type, count, std::move(data)});
        return *this;
    }

    Field pointer(std::uint16_t tag, std::uint32_t offset) const {
        std::string data;
        put32(data, offset);
        return Field{tag, 4, 1, data};
    }

    static std::uint32_t ifd_size(std::size_t count) {
        return static_cast<std::uint32_t>(2 + 12 * count + 4);
    }

    void put16(std::string& out, std::uint16_t v) const {
        if (big_) {
            out.push_back(static_cast<char>(v >> 8));
            out.push_back(static_cast<char>(v & 0xFF));
        } else {
            put_u16(out, v);
        }
    }

    void put32(std::string& out, std::uint32_t v) const {
        if (big_) {
            put16(out, static_cast<std::uint16_t>(v >> 16));
            put16(out, static_cast<std::uint16_t>(v & 0xFFFF));
        } else {
            put_u32(out, v);
        }
    }

    bool big_;
    std::vector<Field> fields_[3];
};

}  // namespace evidex::test

#endif  // EVIDEX_TEST_FIXTURES_HPP
