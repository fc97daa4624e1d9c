// ==============================================================================
// text_analyzer.cpp - Извлечение текста из текстовых файлов
// ==============================================================================

#include "evidex/analysis.hpp"

#include "evidex/platform.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace evidex::analysis {

namespace {

constexpr std::array<const char*, 14> TEXT_EXTENSIONS = {
    ".txt", ".csv", ".log", ".json", ".xml", ".html", ".htm",
    ".md",  ".ini", ".cfg", ".conf", ".vcf", ".eml", ".plist"};

bool has_text_extension(const std::string& name) {
    std::string ext = taxonomy::extension_of(name);
    return std::any_of(TEXT_EXTENSIONS.begin(), TEXT_EXTENSIONS.end(),
                       [&](const char* e) { return ext == e; });
}

/// Бинарное содержимое: NUL или много управляющих символов
bool looks_binary(const std::string& data) {
    if (data.find('\0') != std::string::npos) {
        return true;
    }
    std::size_t control = 0;
    for (unsigned char c : data) {
        if (c < 0x20 && c != '\n' && c != '\r' && c != '\t') {
            ++control;
        }
    }
    return control * 10 > data.size();
}

/// Схлопнуть пробельные последовательности
std::string normalize_whitespace(const std::string& data) {
    std::string out;
    out.reserve(data.size());
    bool space = false;
    for (char c : data) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
            space = true;
            continue;
        }
        if (space && !out.empty()) {
            out.push_back(' ');
        }
        space = false;
        out.push_back(c);
    }
    return out;
}

}  // namespace

bool TextContentAnalyzer::supports(taxonomy::Category category) const {
    switch (category) {
        case taxonomy::Category::Image:
        case taxonomy::Category::Video:
        case taxonomy::Category::Cctv:
        case taxonomy::Category::Audio:
        case taxonomy::Category::Executable:
        case taxonomy::Category::Encrypted:
        case taxonomy::Category::Archive:
            return false;
        default:
            return true;
    }
}

void TextContentAnalyzer::analyze(const store::EvidenceFile& file, AnalysisResult& result) {
    if (!has_text_extension(file.file_name)) {
        return;
    }

    std::string data = read_content(file, max_bytes_);
    if (data.empty() || looks_binary(data)) {
        return;
    }

    std::string text = normalize_whitespace(data);
    if (text.empty()) {
        return;
    }
    result.text = std::move(text);
    result.tags.push_back("text_content");
    result.tags.push_back(std::string(taxonomy::category_to_string(file.file_type)) + "_file");
    if (!result.confidence) {
        result.confidence = 1.0;
    }
}

}  // namespace evidex::analysis
