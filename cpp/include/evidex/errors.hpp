// ==============================================================================
// evidex/errors.hpp - Таксономия ошибок конвейера
// ==============================================================================
//
// Назначение:
// - ErrorKind: закрытый набор категорий ошибок
// - Error: исключение с категорией (наследник std::runtime_error)
// - Единый текстовый формат для вывода в CLI
//
// Политика распространения:
// - Ошибки отдельного элемента (CorruptEntry, AnalysisFailure) изолируются
//   и агрегируются в статистику, наружу не выбрасываются
// - Наружу выбрасываются только ошибки, мешающие начать пакет
//   (UnsupportedFormat, NotFound) и нарушения ограничений хранилища
//
// ==============================================================================

#ifndef EVIDEX_ERRORS_HPP
#define EVIDEX_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace evidex {

// ----------------------------------------------------------------------------
// ErrorKind
// ----------------------------------------------------------------------------

enum class ErrorKind {
    UnsupportedFormat,    // контейнер не распознан или не поддерживается
    CorruptEntry,         // один элемент архива не читается
    DuplicateCaseNumber,  // номер дела уже существует
    ForeignKeyViolation,  // владелец записи отсутствует
    AnalysisFailure,      // анализатор упал на одном файле
    NotFound,             // запрошенная сущность не найдена
    Database,             // прочие ошибки SQLite
    Io,                   // ошибки файловой системы
    Config                // ошибки конфигурации
};

/// Строковое имя категории ("unsupported_format", "corrupt_entry", ...)
const char* error_kind_name(ErrorKind kind);

// ----------------------------------------------------------------------------
// Error
// ----------------------------------------------------------------------------

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

    /// "<kind>: <message>"
    std::string format() const;

private:
    ErrorKind kind_;
};

}  // namespace evidex

#endif  // EVIDEX_ERRORS_HPP
