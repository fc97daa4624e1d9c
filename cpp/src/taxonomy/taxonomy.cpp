// ==============================================================================
// taxonomy.cpp - Криминалистическая классификация файлов
// ==============================================================================
//
// Таблица правил строится один раз и не меняется: порядок правил задаёт
// приоритет и одинаков между запусками.
//
// ==============================================================================

#include "evidex/taxonomy.hpp"

#include "evidex/platform.hpp"

#include <algorithm>
#include <initializer_list>
#include <unordered_set>

namespace evidex::taxonomy {

namespace {

// ----------------------------------------------------------------------------
// Имена категорий
// ----------------------------------------------------------------------------

struct CategoryName {
    Category category;
    const char* name;
};

constexpr CategoryName CATEGORY_NAMES[] = {
    {Category::Messaging, "messaging"},
    {Category::Messages, "messages"},
    {Category::Calls, "calls"},
    {Category::SocialMedia, "social_media"},
    {Category::Banking, "banking"},
    {Category::Cryptocurrency, "cryptocurrency"},
    {Category::Image, "image"},
    {Category::Video, "video"},
    {Category::Cctv, "cctv"},
    {Category::Document, "document"},
    {Category::Contacts, "contacts"},
    {Category::Location, "location"},
    {Category::Browser, "browser"},
    {Category::Cloud, "cloud"},
    {Category::Database, "database"},
    {Category::Archive, "archive"},
    {Category::Memory, "memory"},
    {Category::Network, "network"},
    {Category::SimData, "sim_data"},
    {Category::FraudDevice, "fraud_device"},
    {Category::Iot, "iot"},
    {Category::Encrypted, "encrypted"},
    {Category::Audio, "audio"},
    {Category::Email, "email"},
    {Category::Executable, "executable"},
    {Category::Code, "code"},
    {Category::System, "system"},
    {Category::Other, "other"},
};

// ----------------------------------------------------------------------------
// Строительные блоки предикатов
// ----------------------------------------------------------------------------

using Predicate = std::function<bool(const Subject&)>;
using Words = std::vector<std::string>;

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

/// Компоненты-директории пути (без имени файла) + parent_folder
std::vector<std::string> directories(const Subject& s) {
    std::vector<std::string> dirs;
    std::size_t start = 0;
    while (start < s.path.size()) {
        std::size_t slash = s.path.find('/', start);
        if (slash == std::string::npos) {
            break;  // последний компонент - имя файла
        }
        if (slash > start) {
            dirs.push_back(s.path.substr(start, slash - start));
        }
        start = slash + 1;
    }
    if (!s.parent_folder.empty() &&
        std::find(dirs.begin(), dirs.end(), s.parent_folder) == dirs.end()) {
        dirs.push_back(s.parent_folder);
    }
    return dirs;
}

Predicate name_is(Words names) {
    std::unordered_set<std::string> set(names.begin(), names.end());
    return [set = std::move(set)](const Subject& s) { return set.count(s.name) > 0; };
}

Predicate name_contains(Words tokens) {
    return [tokens = std::move(tokens)](const Subject& s) {
        return std::any_of(tokens.begin(), tokens.end(),
                           [&](const std::string& t) { return contains(s.name, t); });
    };
}

Predicate extension_in(Words exts) {
    std::unordered_set<std::string> set(exts.begin(), exts.end());
    return [set = std::move(set)](const Subject& s) {
        return !s.extension.empty() && set.count(s.extension) > 0;
    };
}

/// Любая папка пути содержит подстроку
Predicate folder_contains(Words tokens) {
    return [tokens = std::move(tokens)](const Subject& s) {
        for (const auto& dir : directories(s)) {
            for (const auto& t : tokens) {
                if (contains(dir, t)) {
                    return true;
                }
            }
        }
        return false;
    };
}

/// Любая папка пути равна одному из имён (для коротких, неоднозначных имён)
Predicate folder_is(Words names) {
    std::unordered_set<std::string> set(names.begin(), names.end());
    return [set = std::move(set)](const Subject& s) {
        for (const auto& dir : directories(s)) {
            if (set.count(dir) > 0) {
                return true;
            }
        }
        return false;
    };
}

Predicate one_of(std::initializer_list<Predicate> preds) {
    std::vector<Predicate> list(preds);
    return [list = std::move(list)](const Subject& s) {
        return std::any_of(list.begin(), list.end(), [&](const Predicate& p) { return p(s); });
    };
}

// ----------------------------------------------------------------------------
// Таблица правил
// ----------------------------------------------------------------------------

std::vector<Rule> build_rules() {
    std::vector<Rule> table;

    // 1. Мессенджеры: базы чатов и папки приложений
    table.push_back({"messaging_app", Category::Messaging,
                     one_of({name_is({"msgstore.db", "wa.db", "axolotl.db", "chatstorage.sqlite",
                                      "cache4.db", "signal.db", "signal.sqlite", "enmicromsg.db",
                                      "viber_messages", "viber_data", "kikdatabase.db",
                                      "threema.db", "naver_line"}),
                             name_contains({"msgstore", "whatsapp", "telegram"}),
                             folder_contains({"whatsapp", "telegram", "signal", "viber", "wechat",
                                              "threema", "com.tencent.mm",
                                              "org.thoughtcrime.securesms", "jp.naver.line",
                                              "kik.android"}),
                             folder_is({"line", "kik"})})});

    // 2. SMS/MMS
    table.push_back({"sms_mms_store", Category::Messages,
                     one_of({name_is({"mmssms.db", "sms.db", "sms.sqlite", "mms.db"}),
                             name_contains({"sms_backup", "sms-backup", "smsbackup"}),
                             folder_contains({"com.android.providers.telephony"}),
                             folder_is({"sms", "mms", "smsmms"})})});

    // 3. Журнал звонков
    table.push_back({"call_log_store", Category::Calls,
                     one_of({name_is({"calllog.db", "calllog.sqlite", "call_history.db",
                                      "callhistory.storedata", "callhistory.db", "calls.db"}),
                             name_contains({"calllog", "call_log", "callhistory"}),
                             folder_is({"calllog", "call_logs", "calls", "callhistory"})})});

    // 4. Социальные сети
    table.push_back({"social_media_app", Category::SocialMedia,
                     one_of({name_contains({"facebook", "instagram", "snapchat", "tiktok"}),
                             folder_contains({"facebook", "instagram", "twitter", "tiktok",
                                              "snapchat", "linkedin", "reddit",
                                              "com.zhiliaoapp.musically"})})});

    // 5. Финансы, затем криптовалюты
    table.push_back({"payment_app", Category::Banking,
                     one_of({name_contains({"bank_statement", "bankstatement", "upi_transaction",
                                            "paytm", "phonepe", "paypal"}),
                             folder_contains({"paytm", "phonepe", "gpay", "google pay",
                                              "googlepay", "bhim", "paypal", "venmo", "cashapp",
                                              "cash app", "bank",
                                              "com.google.android.apps.nbu.paisa"})})});

    table.push_back({"crypto_wallet", Category::Cryptocurrency,
                     one_of({name_is({"wallet.dat"}), extension_in({".wallet"}),
                             name_contains({"utc--", "seed_phrase", "mnemonic"}),
                             folder_contains({"bitcoin", "ethereum", "electrum", "metamask",
                                              "trustwallet", "trust wallet", "coinbase",
                                              "binance", "exodus", "blockchain"}),
                             folder_is({"keystore"})})});

    // 6. Видеонаблюдение (отдельно от обычного видео)
    table.push_back({"surveillance_dvr", Category::Cctv,
                     one_of({extension_in({".dav", ".264", ".h264"}),
                             folder_contains({"cctv", "dvr", "nvr", "surveillance", "hikvision",
                                              "dahua", "ipcam", "ip camera",
                                              "security camera"})})});

    // 7. Контакты, затем геоданные
    table.push_back({"contact_store", Category::Contacts,
                     one_of({name_is({"contacts2.db", "contacts.db", "addressbook.sqlitedb",
                                      "addressbookimages.sqlitedb"}),
                             extension_in({".vcf", ".vcard"}),
                             folder_contains({"com.android.providers.contacts"}),
                             folder_is({"contacts"})})});

    table.push_back({"location_track", Category::Location,
                     one_of({extension_in({".gpx", ".kml", ".kmz", ".nmea", ".geojson"}),
                             name_is({"consolidated.db", "cache_encryptedb.db", "gmm_storage.db",
                                      "gmm_myplaces.db"}),
                             folder_is({"location_history", "locationhistory"})})});

    // 8. Артефакты браузеров, затем облачные папки
    table.push_back({"browser_artifact", Category::Browser,
                     one_of({name_is({"history", "cookies", "login data", "web data",
                                      "bookmarks", "top sites", "favicons", "places.sqlite",
                                      "cookies.sqlite", "formhistory.sqlite", "history.db",
                                      "webkit.db", "downloads.plist", "browser.db",
                                      "browser2.db"}),
                             folder_contains({"com.android.chrome", "org.mozilla", "chrome",
                                              "firefox", "safari"})})});

    table.push_back({"cloud_sync", Category::Cloud,
                     one_of({folder_contains({"dropbox", "google drive", "googledrive",
                                              "onedrive", "icloud", "com.google.android.apps.docs",
                                              "box sync", "pcloud"}),
                             folder_is({"mega", "box"})})});

    // 9. Дампы памяти, сеть, SIM, мошеннические устройства
    table.push_back({"memory_dump", Category::Memory,
                     one_of({extension_in({".dmp", ".mem", ".vmem", ".vmsn", ".vmss", ".lime",
                                           ".core"}),
                             name_is({"hiberfil.sys", "pagefile.sys", "swapfile.sys"}),
                             name_contains({"memdump", "memory_dump"})})});

    table.push_back({"network_capture", Category::Network,
                     one_of({extension_in({".pcap", ".pcapng"}),
                             folder_contains({"pcap", "wireshark", "tcpdump", "firewall", "router",
                                              "network_logs", "network logs", "netlogs"}),
                             folder_is({"network", "netflow"})})});

    table.push_back({"sim_dump", Category::SimData,
                     one_of({name_contains({"iccid", "imsi"}),
                             folder_is({"sim", "simcard", "sim_card", "sim card", "sim_dump",
                                        "simdump", "uicc"})})});

    table.push_back({"fraud_device", Category::FraudDevice,
                     folder_contains({"simbox", "sim box", "sim_box", "gsm_gateway", "gsm gateway",
                                      "gsmgateway", "goip", "skimmer"})});

    // 10. Носимые/автомобильные данные, затем зашифрованные контейнеры
    table.push_back({"wearable_vehicle", Category::Iot,
                     one_of({extension_in({".fit", ".tcx"}),
                             folder_contains({"fitbit", "garmin", "mi fit", "wearable",
                                              "smartwatch", "wear os", "apple watch", "vehicle",
                                              "carplay", "android auto", "gearhead", "tesla",
                                              "infotainment", "smart home", "com.amazon.dee.app"}),
                             folder_is({"nest", "obd", "obd2", "alexa"})})});

    table.push_back({"encrypted_container", Category::Encrypted,
                     extension_in({".tc", ".hc", ".vc", ".aes", ".gpg", ".pgp", ".enc", ".axx",
                                   ".crypt", ".crypt12", ".crypt14", ".crypt15", ".locked",
                                   ".kdbx", ".bfe", ".cpt", ".p7m"})});

    // 11. Таблицы расширений
    table.push_back({"image_extension", Category::Image,
                     extension_in({".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".tif",
                                   ".webp", ".heic", ".heif"})});
    table.push_back({"video_extension", Category::Video,
                     extension_in({".mp4", ".avi", ".mov", ".wmv", ".flv", ".mkv", ".webm", ".m4v",
                                   ".mpeg", ".mpg", ".3gp"})});
    table.push_back({"document_extension", Category::Document,
                     extension_in({".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx",
                                   ".odt", ".ods", ".odp", ".txt", ".rtf", ".csv", ".pages",
                                   ".numbers", ".keynote"})});
    table.push_back({"audio_extension", Category::Audio,
                     extension_in({".mp3", ".wav", ".aac", ".flac", ".m4a", ".wma", ".ogg", ".opus",
                                   ".aiff", ".ape", ".alac", ".amr"})});
    table.push_back({"archive_extension", Category::Archive,
                     extension_in({".zip", ".rar", ".7z", ".tar", ".gz", ".bz2", ".xz", ".tgz",
                                   ".tbz2"})});
    table.push_back({"database_extension", Category::Database,
                     extension_in({".db", ".sqlite", ".sqlite3", ".sql", ".mdb", ".accdb", ".dbf",
                                   ".pdb", ".frm", ".ibd", ".sqlitedb", ".storedata"})});
    table.push_back({"code_extension", Category::Code,
                     extension_in({".py", ".java", ".cpp", ".c", ".h", ".js", ".ts", ".jsx",
                                   ".tsx", ".php", ".rb", ".go", ".rs", ".swift", ".kt", ".html",
                                   ".css", ".scss", ".sass", ".xml", ".json", ".yaml", ".yml",
                                   ".sh", ".bat", ".ps1"})});
    table.push_back({"executable_extension", Category::Executable,
                     extension_in({".exe", ".dll", ".app", ".apk", ".ipa", ".deb", ".rpm", ".dmg",
                                   ".pkg", ".msi", ".bin", ".so", ".dylib"})});
    table.push_back({"email_extension", Category::Email,
                     extension_in({".eml", ".msg", ".pst", ".ost", ".mbox", ".emlx"})});
    table.push_back({"system_extension", Category::System,
                     extension_in({".log", ".ini", ".cfg", ".conf", ".reg", ".plist", ".dat",
                                   ".tmp", ".bak", ".sys"})});

    return table;
}

std::string normalize_path(std::string_view path) {
    std::string result = platform::to_lower_ascii(path);
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Имена категорий
// ----------------------------------------------------------------------------

const char* category_to_string(Category c) {
    for (const auto& entry : CATEGORY_NAMES) {
        if (entry.category == c) {
            return entry.name;
        }
    }
    return "other";
}

std::optional<Category> category_from_string(std::string_view s) {
    std::string lower = platform::to_lower_ascii(s);
    for (const auto& entry : CATEGORY_NAMES) {
        if (lower == entry.name) {
            return entry.category;
        }
    }
    return std::nullopt;
}

const std::vector<Category>& all_categories() {
    static const std::vector<Category> list = [] {
        std::vector<Category> v;
        for (const auto& entry : CATEGORY_NAMES) {
            v.push_back(entry.category);
        }
        return v;
    }();
    return list;
}

// ----------------------------------------------------------------------------
// Разбор пути
// ----------------------------------------------------------------------------

std::string file_name_of(std::string_view path) {
    std::size_t pos = path.find_last_of("/\\");
    if (pos == std::string_view::npos) {
        return std::string(path);
    }
    return std::string(path.substr(pos + 1));
}

std::string parent_folder_of(std::string_view path) {
    std::size_t pos = path.find_last_of("/\\");
    if (pos == std::string_view::npos || pos == 0) {
        return {};
    }
    std::string_view dir = path.substr(0, pos);
    std::size_t prev = dir.find_last_of("/\\");
    if (prev == std::string_view::npos) {
        return std::string(dir);
    }
    return std::string(dir.substr(prev + 1));
}

std::string extension_of(std::string_view name) {
    std::string file = file_name_of(name);
    std::size_t dot = file.rfind('.');
    // ".bashrc" - скрытый файл без расширения
    if (dot == std::string::npos || dot == 0) {
        return {};
    }
    return platform::to_lower_ascii(std::string_view(file).substr(dot));
}

Subject make_subject(std::string_view name, std::string_view path, std::string_view extension,
                     std::string_view parent_folder) {
    Subject s;
    s.name = platform::to_lower_ascii(name.empty() ? std::string_view(file_name_of(path)) : name);
    s.path = normalize_path(path.empty() ? name : path);

    if (!extension.empty()) {
        s.extension = platform::to_lower_ascii(extension);
        if (s.extension[0] != '.') {
            s.extension.insert(s.extension.begin(), '.');
        }
    } else {
        s.extension = extension_of(s.name);
    }

    s.parent_folder = parent_folder.empty() ? parent_folder_of(s.path)
                                            : platform::to_lower_ascii(parent_folder);
    return s;
}

// ----------------------------------------------------------------------------
// Правила
// ----------------------------------------------------------------------------

const std::vector<Rule>& rules() {
    static const std::vector<Rule> table = build_rules();
    return table;
}

std::optional<std::string> matching_rule(const Subject& subject) {
    for (const auto& rule : rules()) {
        if (rule.predicate(subject)) {
            return rule.name;
        }
    }
    return std::nullopt;
}

Category categorize(std::string_view name, std::string_view path, std::string_view extension,
                    std::string_view parent_folder) {
    Subject subject = make_subject(name, path, extension, parent_folder);
    for (const auto& rule : rules()) {
        if (rule.predicate(subject)) {
            return rule.category;
        }
    }
    return Category::Other;
}

Category categorize_path(std::string_view path) {
    return categorize(file_name_of(path), path, {}, {});
}

}  // namespace evidex::taxonomy
