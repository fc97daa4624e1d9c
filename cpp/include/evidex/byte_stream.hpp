// ==============================================================================
// evidex/byte_stream.hpp - Последовательные источники байтов
// ==============================================================================
//
// Назначение:
// - ByteSource: последовательное чтение с пропуском (skip)
// - FileSource: файл с произвольным доступом; skip = seek, без чтения
// - InflateSource: zlib/gzip поток поверх FileSource с ограниченным буфером
//
// bytes_read() считает только байты, реально прочитанные с диска: это
// позволяет проверять, что индексация не распаковывает содержимое.
//
// ==============================================================================

#ifndef EVIDEX_BYTE_STREAM_HPP
#define EVIDEX_BYTE_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

// Forward declaration zlib
struct z_stream_s;

namespace evidex::io {

// ----------------------------------------------------------------------------
// ByteSource
// ----------------------------------------------------------------------------

class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Прочитать до n байт; 0 означает конец потока
    /// @throws evidex::Error (Io / CorruptEntry) при ошибке чтения
    virtual std::size_t read(char* buf, std::size_t n) = 0;

    /// Пропустить n байт
    virtual void skip(std::uint64_t n) = 0;

    /// Байты, прочитанные с диска
    virtual std::uint64_t bytes_read() const = 0;
};

// ----------------------------------------------------------------------------
// FileSource
// ----------------------------------------------------------------------------

class FileSource : public ByteSource {
public:
    /// @throws evidex::Error(Io) если файл не открывается
    explicit FileSource(const std::filesystem::path& path);

    std::size_t read(char* buf, std::size_t n) override;
    void skip(std::uint64_t n) override;
    std::uint64_t bytes_read() const override { return bytes_read_; }

    /// Абсолютное позиционирование
    void seek(std::uint64_t offset);

    std::uint64_t position() const { return position_; }
    std::uint64_t size() const { return size_; }

private:
    std::ifstream stream_;
    std::uint64_t size_ = 0;
    std::uint64_t position_ = 0;
    std::uint64_t bytes_read_ = 0;
};

// ----------------------------------------------------------------------------
// InflateSource
// ----------------------------------------------------------------------------

class InflateSource : public ByteSource {
public:
    /// window_bits как у inflateInit2: 15 = zlib, 16+15 = gzip, -15 = raw deflate
    InflateSource(std::unique_ptr<FileSource> file, int window_bits);
    ~InflateSource() override;

    InflateSource(const InflateSource&) = delete;
    InflateSource& operator=(const InflateSource&) = delete;

    std::size_t read(char* buf, std::size_t n) override;
    void skip(std::uint64_t n) override;
    std::uint64_t bytes_read() const override { return file_->bytes_read(); }

private:
    std::unique_ptr<FileSource> file_;
    std::unique_ptr<z_stream_s> zs_;
    std::vector<char> in_buf_;
    bool input_eof_ = false;
    bool finished_ = false;
};

}  // namespace evidex::io

#endif  // EVIDEX_BYTE_STREAM_HPP
