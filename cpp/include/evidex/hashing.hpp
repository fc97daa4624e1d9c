// ==============================================================================
// evidex/hashing.hpp - SHA-256 и ленивое заполнение хэшей
// ==============================================================================
//
// Назначение:
// - Sha256: потоковый SHA-256 (OpenSSL EVP)
// - HashBackfill: вычисление file_hash по требованию для файлов дела
//
// Индексация хэши не вычисляет (file_hash = null). Содержимое берётся из
// файловой системы либо потоком из исходного контейнера.
//
// ==============================================================================

#ifndef EVIDEX_HASHING_HPP
#define EVIDEX_HASHING_HPP

#include "evidex/archive.hpp"
#include "evidex/repository.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>

// Forward declaration OpenSSL
struct evp_md_ctx_st;

namespace evidex::output {
class Writer;
}

namespace evidex::ingest {

class CancelToken;

// ----------------------------------------------------------------------------
// Sha256
// ----------------------------------------------------------------------------

class Sha256 {
public:
    /// @throws evidex::Error(Io) если контекст OpenSSL не создаётся
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const char* data, std::size_t size);

    /// Hex в нижнем регистре; после вызова объект не используется
    std::string final_hex();

private:
    evp_md_ctx_st* ctx_ = nullptr;
};

/// SHA-256 файла
/// @throws evidex::Error(Io)
std::string sha256_file(const std::filesystem::path& path);

/// SHA-256 строки (для тестов и коротких данных)
std::string sha256_hex(std::string_view data);

// ----------------------------------------------------------------------------
// HashBackfill
// ----------------------------------------------------------------------------

struct BackfillStats {
    std::size_t total = 0;   // файлы без хэша на старте
    std::size_t hashed = 0;
    std::size_t errors = 0;  // содержимое недоступно
    bool cancelled = false;
};

class HashBackfill {
public:
    HashBackfill(store::Database& db, output::Writer* log = nullptr);

    /// Таймаут чтения элемента архива (0 = без ограничения)
    void set_entry_timeout(std::chrono::milliseconds timeout) { entry_timeout_ = timeout; }

    /// Вычислить хэши всех файлов дела без file_hash
    BackfillStats run(std::int64_t case_id, const io::ProgressCallback& progress,
                      const CancelToken* cancel = nullptr);

    /// Хэш одного файла: сохранённый или вычисленный и сохранённый
    /// @throws evidex::Error(NotFound) если файла нет
    /// @throws evidex::Error(Io / CorruptEntry) если содержимое не читается
    std::string ensure(std::int64_t file_id);

private:
    /// Вычислить хэш содержимого файла улики
    std::string compute(const store::EvidenceFile& file);

    /// Индексатор исходного контейнера (кэшируется на время run())
    io::ArchiveIndexer& indexer_for(const std::string& archive);

    store::Database& db_;
    output::Writer* log_;
    std::chrono::milliseconds entry_timeout_{0};
    std::map<std::string, std::unique_ptr<io::ArchiveIndexer>> indexers_;
};

}  // namespace evidex::ingest

#endif  // EVIDEX_HASHING_HPP
