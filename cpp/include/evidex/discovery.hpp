// ==============================================================================
// evidex/discovery.hpp - Поиск файлов для импорта директории
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход директорий (распакованные извлечения, папки улик)
// - Фильтрация по расширениям (без точки, без учёта регистра)
// - Детерминированный порядок результатов (сортировка по пути)
// - Режим skip_errors: предупреждение вместо исключения
//
// ==============================================================================

#ifndef EVIDEX_DISCOVERY_HPP
#define EVIDEX_DISCOVERY_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace evidex::output {
class Writer;
}

namespace evidex::io {

struct DiscoveryOptions {
    /// Допустимые расширения в нижнем регистре без точки ("jpg");
    /// nullopt - все файлы
    std::optional<std::unordered_set<std::string>> extensions;

    /// true - нечитаемые пути пропускаются с предупреждением
    bool skip_errors = true;

    /// Куда писать предупреждения (может быть nullptr)
    output::Writer* log = nullptr;
};

/// Найти файлы по путям. Пустой результат - не ошибка.
/// @throws evidex::Error(Io) при ошибке, если skip_errors == false
std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt);

}  // namespace evidex::io

#endif  // EVIDEX_DISCOVERY_HPP
