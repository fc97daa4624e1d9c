// ==============================================================================
// errors.cpp - Таксономия ошибок конвейера
// ==============================================================================

#include "evidex/errors.hpp"

namespace evidex {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnsupportedFormat:
        return "unsupported_format";
    case ErrorKind::CorruptEntry:
        return "corrupt_entry";
    case ErrorKind::DuplicateCaseNumber:
        return "duplicate_case_number";
    case ErrorKind::ForeignKeyViolation:
        return "foreign_key_violation";
    case ErrorKind::AnalysisFailure:
        return "analysis_failure";
    case ErrorKind::NotFound:
        return "not_found";
    case ErrorKind::Database:
        return "database";
    case ErrorKind::Io:
        return "io";
    case ErrorKind::Config:
        return "config";
    }
    return "unknown";
}

std::string Error::format() const {
    std::string result = error_kind_name(kind_);
    result += ": ";
    result += what();
    return result;
}

}  // namespace evidex
