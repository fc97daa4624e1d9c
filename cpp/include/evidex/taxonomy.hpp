// ==============================================================================
// evidex/taxonomy.hpp - Криминалистическая классификация файлов
// ==============================================================================
//
// Назначение:
// - Category: фиксированная таксономия категорий улик
// - Упорядоченная таблица правил (имя, категория, предикат)
// - categorize(): чистая функция, первое совпавшее правило побеждает
//
// Эвристики по имени файла и папке идут раньше таблиц расширений: один и
// тот же ".db" означает разное в зависимости от приложения-источника.
//
// ==============================================================================

#ifndef EVIDEX_TAXONOMY_HPP
#define EVIDEX_TAXONOMY_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evidex::taxonomy {

// ----------------------------------------------------------------------------
// Category
// ----------------------------------------------------------------------------

enum class Category {
    Messaging,
    Messages,
    Calls,
    SocialMedia,
    Banking,
    Cryptocurrency,
    Image,
    Video,
    Cctv,
    Document,
    Contacts,
    Location,
    Browser,
    Cloud,
    Database,
    Archive,
    Memory,
    Network,
    SimData,
    FraudDevice,
    Iot,
    Encrypted,
    Audio,
    Email,
    Executable,
    Code,
    System,
    Other
};

/// "messaging", "social_media", "sim_data", ...
const char* category_to_string(Category c);

/// Обратное преобразование; nullopt для неизвестной строки
std::optional<Category> category_from_string(std::string_view s);

/// Все категории в порядке объявления
const std::vector<Category>& all_categories();

// ----------------------------------------------------------------------------
// Subject - нормализованный вход правил
// ----------------------------------------------------------------------------

/// Все поля в нижнем регистре; разделители пути приведены к '/'
struct Subject {
    std::string name;           // "msgstore.db"
    std::string path;           // "apps/com.whatsapp/db/msgstore.db"
    std::string extension;      // ".db" (с точкой); для "x.tar.gz" - ".gz"
    std::string parent_folder;  // "db"
};

Subject make_subject(std::string_view name, std::string_view path, std::string_view extension,
                     std::string_view parent_folder);

// ----------------------------------------------------------------------------
// Rule
// ----------------------------------------------------------------------------

struct Rule {
    std::string name;
    Category category;
    std::function<bool(const Subject&)> predicate;
};

/// Упорядоченная таблица правил (порядок = приоритет)
const std::vector<Rule>& rules();

/// Имя правила, которое сработало бы для входа; nullopt -> Other
std::optional<std::string> matching_rule(const Subject& subject);

// ----------------------------------------------------------------------------
// categorize
// ----------------------------------------------------------------------------

/// Категория по имени, пути внутри контейнера, расширению и имени
/// родительской папки. Пустое extension/parent_folder выводятся из name/path.
Category categorize(std::string_view name, std::string_view path, std::string_view extension,
                    std::string_view parent_folder);

/// Удобная форма: всё выводится из пути ("a/b/c.jpg")
Category categorize_path(std::string_view path);

/// Последнее расширение с точкой в нижнем регистре (".jpg"); "" если нет
std::string extension_of(std::string_view name);

/// Имя родительской папки из пути с '/' или '\\'; "" для корня
std::string parent_folder_of(std::string_view path);

/// Последний компонент пути
std::string file_name_of(std::string_view path);

}  // namespace evidex::taxonomy

#endif  // EVIDEX_TAXONOMY_HPP
