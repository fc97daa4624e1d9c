// ==============================================================================
// discovery.cpp - Поиск файлов для импорта директории
// ==============================================================================

#include "evidex/discovery.hpp"

#include "evidex/errors.hpp"
#include "evidex/output.hpp"
#include "evidex/platform.hpp"

#include <algorithm>
#include <system_error>

namespace evidex::io {

namespace {

bool matches_extensions(const std::filesystem::path& file_path,
                        const std::optional<std::unordered_set<std::string>>& extensions) {
    if (!extensions.has_value()) {
        return true;
    }
    if (!file_path.has_extension()) {
        return false;
    }

    std::string ext = platform::to_lower_ascii(platform::path_to_utf8(file_path.extension()));
    if (!ext.empty() && ext[0] == '.') {
        ext.erase(0, 1);
    }
    return extensions->count(ext) > 0;
}

/// Ошибка обхода: предупреждение или исключение
void report(const DiscoveryOptions& opt, const std::string& message) {
    if (!opt.skip_errors) {
        throw Error(ErrorKind::Io, message);
    }
    if (opt.log != nullptr) {
        opt.log->warn(message);
    }
}

void collect_files_recursive(const std::filesystem::path& path, const DiscoveryOptions& opt,
                             std::vector<std::filesystem::path>& result) {
    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::symlink_status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        report(opt, "Specified path does not exist - " + platform::path_to_utf8(path));
        return;
    }

    if (std::filesystem::is_directory(status)) {
        std::filesystem::directory_iterator it(path, ec);
        if (ec) {
            report(opt, "failed to read directory '" + platform::path_to_utf8(path) + "' - " +
                            ec.message());
            return;
        }

        std::filesystem::directory_iterator end;
        while (it != end) {
            collect_files_recursive(it->path(), opt, result);
            it.increment(ec);
            if (ec) {
                break;
            }
        }
        if (ec) {
            report(opt, "failed to enter directory '" + platform::path_to_utf8(path) + "' - " +
                            ec.message());
        }
    } else if (std::filesystem::is_regular_file(status)) {
        if (matches_extensions(path, opt.extensions)) {
            result.push_back(path);
        }
    }
    // Символические ссылки и специальные файлы не импортируются
}

}  // namespace

std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt) {
    std::vector<std::filesystem::path> result;
    for (const auto& input : inputs) {
        collect_files_recursive(input, opt, result);
    }
    std::sort(result.begin(), result.end());
    return result;
}

}  // namespace evidex::io
