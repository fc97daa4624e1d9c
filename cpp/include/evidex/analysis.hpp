// ==============================================================================
// evidex/analysis.hpp - Анализ содержимого файлов улик
// ==============================================================================
//
// Назначение:
// - Analyzer: интерфейс внешнего анализатора (лица, объекты, OCR, текст)
// - AnalysisService: явно создаваемый реестр анализаторов (без синглтона)
// - AnalysisRunner: анализ необработанных файлов дела
// - TextContentAnalyzer: встроенное извлечение текста из текстовых файлов
//
// Реализации распознавания лиц, объектов и OCR подключаются извне через
// Analyzer. Если ни один анализатор не поддерживает категорию, файл
// помечается тегом "<категория>_file".
//
// ==============================================================================

#ifndef EVIDEX_ANALYSIS_HPP
#define EVIDEX_ANALYSIS_HPP

#include "evidex/archive.hpp"
#include "evidex/repository.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace evidex::output {
class Writer;
}

namespace evidex::ingest {
class CancelToken;
}

namespace evidex::analysis {

// ----------------------------------------------------------------------------
// AnalysisResult
// ----------------------------------------------------------------------------

struct AnalysisResult {
    std::vector<std::string> tags;
    std::optional<double> confidence;
    std::string text;                  // OCR или извлечённый текст
    std::int64_t face_count = 0;
    std::vector<std::string> objects;  // классы найденных объектов

    std::optional<std::string> date_taken;
    std::optional<double> gps_latitude;
    std::optional<double> gps_longitude;
    std::optional<double> gps_altitude;
    std::optional<std::string> camera_make;
    std::optional<std::string> camera_model;

    /// Преобразование в обновление строки evidence_files
    store::AnalysisUpdate to_update() const;
};

// ----------------------------------------------------------------------------
// Analyzer
// ----------------------------------------------------------------------------

enum class Capability { Classification, FaceDetection, ObjectDetection, Ocr, Text };

const char* capability_to_string(Capability c);

class Analyzer {
public:
    virtual ~Analyzer() = default;

    virtual std::string name() const = 0;
    virtual Capability capability() const = 0;
    virtual bool supports(taxonomy::Category category) const = 0;

    /// Дополнить result. Исключение означает отказ этого анализатора.
    virtual void analyze(const store::EvidenceFile& file, AnalysisResult& result) = 0;
};

// ----------------------------------------------------------------------------
// AnalysisService
// ----------------------------------------------------------------------------

/// Какие возможности включены (секция analysis конфигурации)
struct AnalysisFeatures {
    bool face_detection = true;
    bool object_detection = true;
    bool ocr = true;
};

class AnalysisService {
public:
    explicit AnalysisService(AnalysisFeatures features = {}, output::Writer* log = nullptr);

    /// Зарегистрировать анализатор. false если его возможность выключена.
    bool add(std::unique_ptr<Analyzer> analyzer);

    std::vector<Analyzer*> analyzers_for(taxonomy::Category category) const;
    std::size_t size() const { return analyzers_.size(); }

    /// Прогнать все подходящие анализаторы. Отказ одного анализатора
    /// журналируется, остальные продолжают.
    /// @throws evidex::Error(AnalysisFailure) если отказали все подходящие
    AnalysisResult analyze(const store::EvidenceFile& file);

private:
    AnalysisFeatures features_;
    output::Writer* log_;
    std::vector<std::unique_ptr<Analyzer>> analyzers_;
};

// ----------------------------------------------------------------------------
// AnalysisRunner
// ----------------------------------------------------------------------------

struct AnalysisStats {
    std::size_t total = 0;
    std::size_t processed = 0;
    std::size_t errors = 0;
    std::size_t faces_found = 0;
    std::size_t text_found = 0;
    std::size_t objects_found = 0;
    bool cancelled = false;
};

class AnalysisRunner {
public:
    AnalysisRunner(store::Database& db, AnalysisService& service, output::Writer* log = nullptr,
                   std::string user_name = "System");

    /// Проанализировать файлы дела с ai_processed = 0 (в порядке импорта)
    AnalysisStats analyze_case(std::int64_t case_id, const io::ProgressCallback& progress,
                               const ingest::CancelToken* cancel = nullptr);

    /// Проанализировать один файл (повторный анализ разрешён)
    /// @throws evidex::Error(NotFound / AnalysisFailure)
    AnalysisResult analyze_file(std::int64_t file_id);

private:
    store::Database& db_;
    AnalysisService& service_;
    output::Writer* log_;
    std::string user_name_;
};

// ----------------------------------------------------------------------------
// TextContentAnalyzer
// ----------------------------------------------------------------------------

/// Текст из файлов с текстовыми расширениями (.txt, .csv, .json, .xml, .log, ...)
class TextContentAnalyzer : public Analyzer {
public:
    explicit TextContentAnalyzer(std::size_t max_bytes = 1024 * 1024) : max_bytes_(max_bytes) {}

    std::string name() const override { return "text_content"; }
    Capability capability() const override { return Capability::Text; }
    bool supports(taxonomy::Category category) const override;
    void analyze(const store::EvidenceFile& file, AnalysisResult& result) override;

private:
    std::size_t max_bytes_;
};

/// Содержимое файла улики (файловая система или элемент контейнера), не
/// больше limit байт
/// @throws evidex::Error(Io / CorruptEntry / NotFound)
std::string read_content(const store::EvidenceFile& file, std::size_t limit);

}  // namespace evidex::analysis

#endif  // EVIDEX_ANALYSIS_HPP
