// ==============================================================================
// analysis.cpp - Реестр анализаторов и анализ файлов дела
// ==============================================================================

#include "evidex/analysis.hpp"

#include "evidex/errors.hpp"
#include "evidex/output.hpp"
#include "evidex/platform.hpp"
#include "evidex/processor.hpp"

#include <algorithm>
#include <fstream>
#include <rapidjson/document.h>

namespace evidex::analysis {

namespace {

bool enabled(const AnalysisFeatures& features, Capability c) {
    switch (c) {
        case Capability::FaceDetection:
            return features.face_detection;
        case Capability::ObjectDetection:
            return features.object_detection;
        case Capability::Ocr:
            return features.ocr;
        case Capability::Classification:
        case Capability::Text:
            return true;
    }
    return true;
}

void append_unique(std::vector<std::string>& into, const std::string& value) {
    if (std::find(into.begin(), into.end(), value) == into.end()) {
        into.push_back(value);
    }
}

}  // namespace

const char* capability_to_string(Capability c) {
    switch (c) {
        case Capability::Classification:
            return "classification";
        case Capability::FaceDetection:
            return "face_detection";
        case Capability::ObjectDetection:
            return "object_detection";
        case Capability::Ocr:
            return "ocr";
        case Capability::Text:
            return "text";
    }
    return "unknown";
}

store::AnalysisUpdate AnalysisResult::to_update() const {
    store::AnalysisUpdate u;
    u.ai_tags = tags;
    for (const auto& object : objects) {
        append_unique(u.ai_tags, object);
    }
    u.ai_confidence = confidence;
    if (!text.empty()) {
        u.ocr_text = text;
    }
    u.face_count = face_count;
    u.date_taken = date_taken;
    u.gps_latitude = gps_latitude;
    u.gps_longitude = gps_longitude;
    u.gps_altitude = gps_altitude;
    u.camera_make = camera_make;
    u.camera_model = camera_model;
    return u;
}

// ----------------------------------------------------------------------------
// AnalysisService
// ----------------------------------------------------------------------------

AnalysisService::AnalysisService(AnalysisFeatures features, output::Writer* log)
    : features_(features), log_(log) {}

bool AnalysisService::add(std::unique_ptr<Analyzer> analyzer) {
    if (!analyzer) {
        return false;
    }
    if (!enabled(features_, analyzer->capability())) {
        if (log_ != nullptr) {
            log_->debug("analyzer '" + analyzer->name() + "' disabled (" +
                        capability_to_string(analyzer->capability()) + ")");
        }
        return false;
    }
    analyzers_.push_back(std::move(analyzer));
    return true;
}

std::vector<Analyzer*> AnalysisService::analyzers_for(taxonomy::Category category) const {
    std::vector<Analyzer*> result;
    for (const auto& a : analyzers_) {
        if (a->supports(category)) {
            result.push_back(a.get());
        }
    }
    return result;
}

AnalysisResult AnalysisService::analyze(const store::EvidenceFile& file) {
    AnalysisResult result;
    auto selected = analyzers_for(file.file_type);

    std::size_t failures = 0;
    std::string last_error;
    for (Analyzer* analyzer : selected) {
        try {
            analyzer->analyze(file, result);
        } catch (const std::exception& e) {
            ++failures;
            last_error = analyzer->name() + ": " + e.what();
            if (log_ != nullptr) {
                log_->warn("analyzer '" + analyzer->name() + "' failed on '" + file.file_name +
                           "' - " + e.what());
            }
        }
    }

    if (!selected.empty() && failures == selected.size()) {
        throw Error(ErrorKind::AnalysisFailure,
                    "analysis failed for '" + file.file_name + "' - " + last_error);
    }

    if (result.tags.empty() && result.objects.empty()) {
        result.tags.push_back(std::string(taxonomy::category_to_string(file.file_type)) + "_file");
    }
    return result;
}

// ----------------------------------------------------------------------------
// AnalysisRunner
// ----------------------------------------------------------------------------

AnalysisRunner::AnalysisRunner(store::Database& db, AnalysisService& service, output::Writer* log,
                               std::string user_name)
    : db_(db), service_(service), log_(log), user_name_(std::move(user_name)) {}

AnalysisStats AnalysisRunner::analyze_case(std::int64_t case_id,
                                           const io::ProgressCallback& progress,
                                           const ingest::CancelToken* cancel) {
    store::CaseRepository cases(db_);
    if (!cases.get_case(case_id)) {
        throw Error(ErrorKind::NotFound, "case " + std::to_string(case_id) + " not found");
    }

    store::FileRepository files(db_);
    auto pending = files.get_unprocessed_files(case_id);

    AnalysisStats stats;
    stats.total = pending.size();
    if (log_ != nullptr) {
        log_->info("Analyzing " + std::to_string(stats.total) + " files");
    }

    std::size_t done = 0;
    for (const auto& file : pending) {
        if (cancel != nullptr && cancel->cancelled()) {
            stats.cancelled = true;
            break;
        }

        try {
            AnalysisResult result = service_.analyze(file);
            files.update_analysis(file.file_id, result.to_update());
            ++stats.processed;
            if (result.face_count > 0) {
                stats.faces_found += static_cast<std::size_t>(result.face_count);
            }
            if (!result.text.empty()) {
                ++stats.text_found;
            }
            stats.objects_found += result.objects.size();
        } catch (const Error& e) {
            ++stats.errors;
            if (log_ != nullptr) {
                log_->warn(e.format());
            }
        }

        ++done;
        if (progress) {
            progress(done, stats.total, "Analyzing: " + file.file_name);
        }
    }

    cases.recount_statistics(case_id);

    rapidjson::Document details(rapidjson::kObjectType);
    auto& alloc = details.GetAllocator();
    details.AddMember("total", static_cast<std::uint64_t>(stats.total), alloc);
    details.AddMember("processed", static_cast<std::uint64_t>(stats.processed), alloc);
    details.AddMember("errors", static_cast<std::uint64_t>(stats.errors), alloc);
    details.AddMember("faces_found", static_cast<std::uint64_t>(stats.faces_found), alloc);
    details.AddMember("text_found", static_cast<std::uint64_t>(stats.text_found), alloc);
    details.AddMember("objects_found", static_cast<std::uint64_t>(stats.objects_found), alloc);
    details.AddMember("cancelled", stats.cancelled, alloc);
    store::AuditRepository audit_log(db_);
    audit_log.log_action("analyze_case", case_id, user_name_, &details);

    return stats;
}

AnalysisResult AnalysisRunner::analyze_file(std::int64_t file_id) {
    store::FileRepository files(db_);
    auto file = files.get_file(file_id);
    if (!file) {
        throw Error(ErrorKind::NotFound, "file " + std::to_string(file_id) + " not found");
    }
    AnalysisResult result = service_.analyze(*file);
    files.update_analysis(file_id, result.to_update());
    return result;
}

// ----------------------------------------------------------------------------
// Содержимое файлов
// ----------------------------------------------------------------------------

std::string read_content(const store::EvidenceFile& file, std::size_t limit) {
    std::string data;

    if (file.source_archive) {
        auto indexer = io::open_archive(platform::path_from_utf8(*file.source_archive));
        indexer->stream_entry(file.file_path, [&](const char* chunk, std::size_t size) {
            if (data.size() < limit) {
                data.append(chunk, std::min(size, limit - data.size()));
            }
        });
        return data;
    }

    std::ifstream in(platform::path_from_utf8(file.file_path), std::ios::binary);
    if (!in) {
        throw Error(ErrorKind::Io, "failed to open '" + file.file_path + "'");
    }
    data.resize(limit);
    in.read(data.data(), static_cast<std::streamsize>(limit));
    if (in.bad()) {
        throw Error(ErrorKind::Io, "failed to read '" + file.file_path + "'");
    }
    data.resize(static_cast<std::size_t>(in.gcount()));
    return data;
}

}  // namespace evidex::analysis
