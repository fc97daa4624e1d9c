// ==============================================================================
// byte_stream.cpp - Последовательные источники байтов
// ==============================================================================

#include "evidex/byte_stream.hpp"

#include "evidex/errors.hpp"
#include "evidex/platform.hpp"

#include <algorithm>
#include <system_error>
#include <zlib.h>

namespace evidex::io {

namespace {

constexpr std::size_t INFLATE_CHUNK = 64 * 1024;

}  // namespace

// ----------------------------------------------------------------------------
// FileSource
// ----------------------------------------------------------------------------

FileSource::FileSource(const std::filesystem::path& path) {
    std::error_code ec;
    size_ = std::filesystem::file_size(path, ec);
    if (ec) {
        throw Error(ErrorKind::Io,
                    "failed to stat '" + platform::path_to_utf8(path) + "' - " + ec.message());
    }
    stream_.open(path, std::ios::binary);
    if (!stream_) {
        throw Error(ErrorKind::Io, "failed to open '" + platform::path_to_utf8(path) + "'");
    }
}

std::size_t FileSource::read(char* buf, std::size_t n) {
    if (position_ >= size_ || n == 0) {
        return 0;
    }
    std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(n, size_ - position_));
    stream_.read(buf, static_cast<std::streamsize>(want));
    std::size_t got = static_cast<std::size_t>(stream_.gcount());
    if (got == 0 && stream_.bad()) {
        throw Error(ErrorKind::Io, "read error at offset " + std::to_string(position_));
    }
    // Частичное чтение сбрасывает eof, следующий seek его не переживёт
    stream_.clear();
    position_ += got;
    bytes_read_ += got;
    return got;
}

void FileSource::skip(std::uint64_t n) {
    seek(std::min(position_ + n, size_));
}

void FileSource::seek(std::uint64_t offset) {
    if (offset > size_) {
        throw Error(ErrorKind::CorruptEntry, "seek beyond end of file (" + std::to_string(offset) +
                                                 " > " + std::to_string(size_) + ")");
    }
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_) {
        throw Error(ErrorKind::Io, "seek failed at offset " + std::to_string(offset));
    }
    position_ = offset;
}

// ----------------------------------------------------------------------------
// InflateSource
// ----------------------------------------------------------------------------

InflateSource::InflateSource(std::unique_ptr<FileSource> file, int window_bits)
    : file_(std::move(file)), zs_(std::make_unique<z_stream>()), in_buf_(INFLATE_CHUNK) {
    zs_->zalloc = Z_NULL;
    zs_->zfree = Z_NULL;
    zs_->opaque = Z_NULL;
    zs_->next_in = Z_NULL;
    zs_->avail_in = 0;
    if (inflateInit2(zs_.get(), window_bits) != Z_OK) {
        throw Error(ErrorKind::Io, "inflateInit2 failed");
    }
}

InflateSource::~InflateSource() {
    inflateEnd(zs_.get());
}

std::size_t InflateSource::read(char* buf, std::size_t n) {
    if (finished_ || n == 0) {
        return 0;
    }

    zs_->next_out = reinterpret_cast<Bytef*>(buf);
    zs_->avail_out = static_cast<uInt>(std::min<std::size_t>(n, INFLATE_CHUNK * 4));
    const uInt out_start = zs_->avail_out;

    while (zs_->avail_out == out_start) {
        if (zs_->avail_in == 0 && !input_eof_) {
            std::size_t got = file_->read(in_buf_.data(), in_buf_.size());
            if (got == 0) {
                input_eof_ = true;
            }
            zs_->next_in = reinterpret_cast<Bytef*>(in_buf_.data());
            zs_->avail_in = static_cast<uInt>(got);
        }

        int rc = inflate(zs_.get(), Z_NO_FLUSH);
        if (rc == Z_STREAM_END) {
            finished_ = true;
            break;
        }
        if (rc == Z_BUF_ERROR && zs_->avail_in == 0 && input_eof_) {
            throw Error(ErrorKind::CorruptEntry, "truncated compressed stream");
        }
        if (rc != Z_OK && rc != Z_BUF_ERROR) {
            std::string msg = zs_->msg != nullptr ? zs_->msg : "inflate error";
            throw Error(ErrorKind::CorruptEntry, "decompression failed - " + msg);
        }
    }

    return static_cast<std::size_t>(out_start - zs_->avail_out);
}

void InflateSource::skip(std::uint64_t n) {
    std::vector<char> scratch(INFLATE_CHUNK);
    while (n > 0) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(n, scratch.size()));
        std::size_t got = read(scratch.data(), want);
        if (got == 0) {
            return;
        }
        n -= got;
    }
}

}  // namespace evidex::io
