// ==============================================================================
// config.cpp - Загрузка конфигурации evidex
// ==============================================================================

#include "evidex/config.hpp"

#include "evidex/platform.hpp"

#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace evidex::config {

namespace {

/// Ошибка типа значения: "database.path: expected string"
struct TypeError {
    std::string message;
};

template <typename T>
void read_scalar(const YAML::Node& section, const char* section_name, const char* key,
                 const char* expected, T& out) {
    YAML::Node node = section[key];
    if (!node) {
        return;
    }
    if (!node.IsScalar()) {
        throw TypeError{std::string(section_name) + "." + key + ": expected " + expected};
    }
    try {
        out = node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw TypeError{std::string(section_name) + "." + key + ": expected " + expected};
    }
}

YAML::Node section_of(const YAML::Node& root, const char* name) {
    YAML::Node node = root[name];
    if (node && !node.IsMap()) {
        throw TypeError{std::string(name) + ": expected mapping"};
    }
    return node;
}

void apply(const YAML::Node& root, Settings& s) {
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw TypeError{"top level: expected mapping"};
    }

    if (YAML::Node db = section_of(root, "database")) {
        std::string path = platform::path_to_utf8(s.database.path);
        read_scalar(db, "database", "path", "string", path);
        s.database.path = platform::path_from_utf8(path);
        read_scalar(db, "database", "busy_timeout_ms", "integer", s.database.busy_timeout_ms);
        read_scalar(db, "database", "insert_retries", "integer", s.database.insert_retries);
        read_scalar(db, "database", "retry_backoff_ms", "integer", s.database.retry_backoff_ms);
        if (s.database.busy_timeout_ms < 0 || s.database.insert_retries < 0 ||
            s.database.retry_backoff_ms < 0) {
            throw TypeError{"database: negative values are not allowed"};
        }
    }

    if (YAML::Node ingest = section_of(root, "ingest")) {
        read_scalar(ingest, "ingest", "workers", "non-negative integer", s.ingest.workers);
        long long timeout = s.ingest.entry_read_timeout.count();
        read_scalar(ingest, "ingest", "entry_read_timeout_ms", "integer", timeout);
        if (timeout < 0) {
            throw TypeError{"ingest.entry_read_timeout_ms: expected non-negative integer"};
        }
        s.ingest.entry_read_timeout = std::chrono::milliseconds(timeout);
        read_scalar(ingest, "ingest", "extract_prefix", "string", s.ingest.extract_prefix);
    }

    if (YAML::Node analysis = section_of(root, "analysis")) {
        read_scalar(analysis, "analysis", "face_detection", "boolean",
                    s.analysis.face_detection);
        read_scalar(analysis, "analysis", "object_detection", "boolean",
                    s.analysis.object_detection);
        read_scalar(analysis, "analysis", "ocr", "boolean", s.analysis.ocr);
    }

    if (YAML::Node user = section_of(root, "user")) {
        read_scalar(user, "user", "name", "string", s.user_name);
    }

    if (YAML::Node logging = section_of(root, "logging")) {
        read_scalar(logging, "logging", "verbose", "integer", s.logging.verbose);
        read_scalar(logging, "logging", "quiet", "boolean", s.logging.quiet);
    }
}

}  // namespace

LoadResult parse(const std::string& yaml, const std::string& source) {
    LoadResult result;
    try {
        YAML::Node root = YAML::Load(yaml);
        apply(root, result.settings);
        result.ok = true;
    } catch (const TypeError& e) {
        result.error = source + ": " + e.message;
    } catch (const YAML::Exception& e) {
        result.error = source + ": " + e.what();
    }
    return result;
}

LoadResult load(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        LoadResult result;
        result.error = "failed to open config '" + platform::path_to_utf8(path) + "'";
        return result;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str(), platform::path_to_utf8(path));
}

}  // namespace evidex::config
