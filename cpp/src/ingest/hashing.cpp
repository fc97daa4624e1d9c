// ==============================================================================
// hashing.cpp - SHA-256 и ленивое заполнение хэшей
// ==============================================================================

#include "evidex/hashing.hpp"

#include "evidex/errors.hpp"
#include "evidex/output.hpp"
#include "evidex/platform.hpp"
#include "evidex/processor.hpp"

#include <fstream>
#include <openssl/evp.h>
#include <vector>

namespace evidex::ingest {

namespace {

constexpr std::size_t HASH_CHUNK = 64 * 1024;

}  // namespace

// ----------------------------------------------------------------------------
// Sha256
// ----------------------------------------------------------------------------

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ == nullptr) {
        throw Error(ErrorKind::Io, "EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw Error(ErrorKind::Io, "EVP_DigestInit_ex failed");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const char* data, std::size_t size) {
    if (EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw Error(ErrorKind::Io, "EVP_DigestUpdate failed");
    }
}

std::string Sha256::final_hex() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, digest, &len) != 1) {
        throw Error(ErrorKind::Io, "EVP_DigestFinal_ex failed");
    }

    static const char HEX[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex.push_back(HEX[digest[i] >> 4]);
        hex.push_back(HEX[digest[i] & 0x0F]);
    }
    return hex;
}

std::string sha256_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Error(ErrorKind::Io, "failed to open '" + platform::path_to_utf8(path) + "'");
    }

    Sha256 sha;
    std::vector<char> buf(HASH_CHUNK);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            sha.update(buf.data(), static_cast<std::size_t>(got));
        }
    }
    if (in.bad()) {
        throw Error(ErrorKind::Io, "failed to read '" + platform::path_to_utf8(path) + "'");
    }
    return sha.final_hex();
}

std::string sha256_hex(std::string_view data) {
    Sha256 sha;
    sha.update(data.data(), data.size());
    return sha.final_hex();
}

// ----------------------------------------------------------------------------
// HashBackfill
// ----------------------------------------------------------------------------

HashBackfill::HashBackfill(store::Database& db, output::Writer* log) : db_(db), log_(log) {}

io::ArchiveIndexer& HashBackfill::indexer_for(const std::string& archive) {
    auto it = indexers_.find(archive);
    if (it == indexers_.end()) {
        auto indexer = io::open_archive(platform::path_from_utf8(archive), log_);
        indexer->set_entry_timeout(entry_timeout_);
        it = indexers_.emplace(archive, std::move(indexer)).first;
    }
    return *it->second;
}

std::string HashBackfill::compute(const store::EvidenceFile& file) {
    if (file.source_archive) {
        Sha256 sha;
        indexer_for(*file.source_archive)
            .stream_entry(file.file_path,
                          [&](const char* data, std::size_t size) { sha.update(data, size); });
        return sha.final_hex();
    }
    return sha256_file(platform::path_from_utf8(file.file_path));
}

BackfillStats HashBackfill::run(std::int64_t case_id, const io::ProgressCallback& progress,
                                const CancelToken* cancel) {
    store::FileRepository files(db_);
    auto pending = files.files_missing_hash(case_id);

    BackfillStats stats;
    stats.total = pending.size();

    for (std::size_t i = 0; i < pending.size(); ++i) {
        if (cancel != nullptr && cancel->cancelled()) {
            stats.cancelled = true;
            break;
        }

        const auto& file = pending[i];
        try {
            files.set_hash(file.file_id, compute(file));
            ++stats.hashed;
        } catch (const Error& e) {
            ++stats.errors;
            if (log_ != nullptr) {
                log_->warn("failed to hash '" + file.file_path + "' - " + e.what());
            }
        }

        if (progress) {
            progress(i + 1, pending.size(), "Hashing: " + file.file_name);
        }
    }

    indexers_.clear();
    return stats;
}

std::string HashBackfill::ensure(std::int64_t file_id) {
    store::FileRepository files(db_);
    auto file = files.get_file(file_id);
    if (!file) {
        throw Error(ErrorKind::NotFound, "file " + std::to_string(file_id) + " not found");
    }
    if (file->file_hash) {
        return *file->file_hash;
    }

    std::string hash = compute(*file);
    files.set_hash(file_id, hash);
    indexers_.clear();
    return hash;
}

}  // namespace evidex::ingest
