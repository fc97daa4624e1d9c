// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================

#include "evidex/cli.hpp"

#include "evidex/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <type_traits>

namespace evidex::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

/// Аргументы после имени команды
class ArgList {
public:
    ArgList(int argc, char** argv, int start) {
        for (int i = start; i < argc; ++i) {
            args_.emplace_back(argv[i]);
        }
    }

    bool done() const { return pos_ >= args_.size(); }
    const std::string& next() { return args_[pos_++]; }

    /// Значение опции; nullopt и ошибка, если аргументы кончились
    std::optional<std::string> value(const std::string& flag) {
        if (done()) {
            fail("a value is required for '" + flag + "' but none was supplied");
            return std::nullopt;
        }
        return args_[pos_++];
    }

    bool failed() const { return !error_.empty(); }
    const std::string& error() const { return error_; }

    void fail(std::string message) {
        if (error_.empty()) {
            error_ = std::move(message);
        }
    }

private:
    std::vector<std::string> args_;
    std::size_t pos_ = 0;
    std::string error_;
};

bool is_option(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-';
}

std::optional<std::uint64_t> parse_unsigned(const std::string& text) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(v);
}

/// Идентификатор строки БД: целое > 0
std::optional<std::int64_t> parse_id(ArgList& a, const std::string& flag, const std::string& text) {
    auto v = parse_unsigned(text);
    if (!v || *v == 0 || *v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        a.fail("invalid value '" + text + "' for '" + flag + "': expected a positive integer");
        return std::nullopt;
    }
    return static_cast<std::int64_t>(*v);
}

std::optional<std::int64_t> id_option(ArgList& a, const std::string& flag) {
    auto text = a.value(flag);
    if (!text) {
        return std::nullopt;
    }
    return parse_id(a, flag, *text);
}

/// Глобальные флаги допускаются и после команды
bool take_global(ArgList& a, const std::string& arg, GlobalOptions& g) {
    if (arg == "-v") {
        ++g.verbose;
    } else if (arg == "-vv") {
        g.verbose += 2;
    } else if (arg == "-q") {
        g.quiet = true;
    } else if (arg == "--no-banner") {
        g.no_banner = true;
    } else if (arg == "--db") {
        if (auto v = a.value(arg)) {
            g.db = platform::path_from_utf8(*v);
        }
    } else if (arg == "--config") {
        if (auto v = a.value(arg)) {
            g.config = platform::path_from_utf8(*v);
        }
    } else if (arg == "-o" || arg == "--output") {
        if (auto v = a.value(arg)) {
            g.output = platform::path_from_utf8(*v);
        }
    } else if (arg == "--num-threads") {
        if (auto v = a.value(arg)) {
            auto n = parse_unsigned(*v);
            if (!n || *n > std::numeric_limits<unsigned>::max()) {
                a.fail("invalid value '" + *v + "' for '--num-threads'");
            } else {
                g.num_threads = static_cast<unsigned>(*n);
            }
        }
    } else {
        return false;
    }
    return true;
}

bool is_help(const std::string& arg) {
    return arg == "-h" || arg == "--help";
}

std::string unexpected(const std::string& arg) {
    return "unexpected argument '" + arg + "' found";
}

// ----------------------------------------------------------------------------
// Usage строки команд
// ----------------------------------------------------------------------------

std::string usage_of(const std::string& command) {
    if (command == "detect") return "evidex detect [OPTIONS] <PATH>...";
    if (command == "index") return "evidex index [OPTIONS] <ARCHIVE>";
    if (command == "case") return "evidex case <create|list|show|close> [OPTIONS]";
    if (command == "ingest") return "evidex ingest [OPTIONS] --case <CASE> <ARCHIVE>";
    if (command == "extract") return "evidex extract [OPTIONS] --case <CASE> <ARCHIVE>";
    if (command == "import") return "evidex import [OPTIONS] --case <CASE> <DIR>";
    if (command == "files") return "evidex files [OPTIONS] --case <CASE>";
    if (command == "flag") return "evidex flag --reason <REASON> <FILE>";
    if (command == "unflag") return "evidex unflag <FILE>";
    if (command == "note") return "evidex note <FILE> <TEXT>";
    if (command == "recount") return "evidex recount <CASE>";
    if (command == "hash") return "evidex hash (--case <CASE> | --file <FILE>)";
    if (command == "analyze") return "evidex analyze [OPTIONS] --case <CASE>";
    if (command == "search") return "evidex search [OPTIONS] --case <CASE>";
    if (command == "audit") return "evidex audit [OPTIONS]";
    return "evidex [OPTIONS] <COMMAND>";
}

std::string render_usage_error(const std::string& message, const std::string& command) {
    return "error: " + message + "\n\nUsage: " + usage_of(command) +
           "\n\nFor more information, try '--help'.\n";
}

// ----------------------------------------------------------------------------
// Парсеры команд
// ----------------------------------------------------------------------------
//
// Каждый парсер возвращает команду; ошибка фиксируется в ArgList.

Command parse_detect(ArgList& a, GlobalOptions& g) {
    DetectCommand cmd;
    while (!a.done() && !a.failed()) {
        const std::string arg = a.next();
        if (take_global(a, arg, g)) {
        } else if (is_help(arg)) {
            return HelpCommand{"detect"};
        } else if (arg == "-j" || arg == "--json") {
            cmd.json = true;
        } else if (is_option(arg)) {
            a.fail(unexpected(arg));
        } else {
            cmd.paths.push_back(platform::path_from_utf8(arg));
        }
    }
    if (!a.failed() && cmd.paths.empty()) {
        a.fail("the following required arguments were not provided: <PATH>...");
    }
    return cmd;
}

Command parse_index(ArgList& a, GlobalOptions& g) {
    IndexCommand cmd;
    bool have_archive = false;
    while (!a.done() && !a.failed()) {
        const std::string arg = a.next();
        if (take_global(a, arg, g)) {
        } else if (is_help(arg)) {
            return HelpCommand{"index"};
        } else if (arg == "-j" || arg == "--json") {
            cmd.json = true;
        } else if (is_option(arg) || have_archive) {
            a.fail(unexpected(arg));
        } else {
            cmd.archive = platform::path_from_utf8(arg);
            have_archive = true;
        }
    }
    if (!a.failed() && !have_archive) {
        a.fail("the following required arguments were not provided: <ARCHIVE>");
    }
    return cmd;
}

Command parse_case(ArgList& a, GlobalOptions& g) {
    if (a.done()) {
        a.fail("'evidex case' requires a subcommand: create, list, show or close");
        return HelpCommand{"case"};
    }
    const std::string sub = a.next();
    if (is_help(sub)) {
        return HelpCommand{"case"};
    }

    if (sub == "create") {
        CaseCreateCommand cmd;
        bool have_name = false;
        while (!a.done() && !a.failed()) {
            const std::string arg = a.next();
            if (take_global(a, arg, g)) {
            } else if (is_help(arg)) {
                return HelpCommand{"case"};
            } else if (arg == "--number") {
                cmd.number = a.value(arg);
            } else if (arg == "--investigator") {
                cmd.investigator = a.value(arg);
            } else if (arg == "--agency") {
                cmd.agency = a.value(arg);
            } else if (arg == "--incident-date") {
                cmd.incident_date = a.value(arg);
            } else if (arg == "--notes") {
                cmd.notes = a.value(arg);
            } else if (is_option(arg) || have_name) {
                a.fail(unexpected(arg));
            } else {
                cmd.name = arg;
                have_name = true;
            }
        }
        if (!a.failed() && !have_name) {
            a.fail("the following required arguments were not provided: <NAME>");
        }
        return cmd;
    }

    if (sub == "list") {
        CaseListCommand cmd;
        while (!a.done() && !a.failed()) {
            const std::string arg = a.next();
            if (take_global(a, arg, g)) {
            } else if (is_help(arg)) {
                return HelpCommand{"case"};
            } else if (arg == "--status") {
                cmd.status = a.value(arg);
                if (cmd.status && *cmd.status != "open" && *cmd.status != "closed") {
                    a.fail("invalid value '" + *cmd.status + "' for '--status': open or closed");
                }
            } else if (arg == "-j" || arg == "--json") {
                cmd.json = true;
            } else {
                a.fail(unexpected(arg));
            }
        }
        return cmd;
    }

    if (sub == "show" || sub == "close") {
        std::optional<std::int64_t> id;
        bool json = false;
        while (!a.done() && !a.failed()) {
            const std::string arg = a.next();
            if (take_global(a, arg, g)) {
            } else if (is_help(arg)) {
                return HelpCommand{"case"};
            } else if (sub == "show" && (arg == "-j" || arg == "--json")) {
                json = true;
            } else if (is_option(arg) || id) {
                a.fail(unexpected(arg));
            } else {
                id = parse_id(a, "<CASE>", arg);
            }
        }
        if (!a.failed() && !id) {
            a.fail("the following required arguments were not provided: <CASE>");
        }
        if (sub == "show") {
            CaseShowCommand cmd;
            cmd.case_id = id.value_or(0);
            cmd.json = json;
            return cmd;
        }
        CaseCloseCommand cmd;
        cmd.case_id = id.value_or(0);
        return cmd;
    }

    a.fail("unrecognized subcommand 'case " + sub + "'");
    return HelpCommand{"case"};
}

/// Общий разбор для ingest / extract / import: один позиционный путь и --case
template <typename T>
Command parse_source_command(ArgList& a, GlobalOptions& g, const std::string& name,
                             std::filesystem::path T::*source, const char* source_label) {
    T cmd;
    bool have_source = false;
    bool have_case = false;
    while (!a.done() && !a.failed()) {
        const std::string arg = a.next();
        if (take_global(a, arg, g)) {
        } else if (is_help(arg)) {
            return HelpCommand{name};
        } else if (arg == "-c" || arg == "--case") {
            if (auto id = id_option(a, arg)) {
                cmd.case_id = *id;
                have_case = true;
            }
        } else if (arg == "-j" || arg == "--json") {
            cmd.json = true;
        } else if constexpr (std::is_same_v<T, IngestCommand>) {
            if (arg == "--entry-timeout") {
                if (auto v = a.value(arg)) {
                    cmd.entry_timeout_ms = parse_unsigned(*v);
                    if (!cmd.entry_timeout_ms) {
                        a.fail("invalid value '" + *v + "' for '--entry-timeout'");
                    }
                }
            } else if (is_option(arg) || have_source) {
                a.fail(unexpected(arg));
            } else {
                cmd.*source = platform::path_from_utf8(arg);
                have_source = true;
            }
        } else if constexpr (std::is_same_v<T, ExtractCommand>) {
            if (arg == "-t" || arg == "--target") {
                if (auto v = a.value(arg)) {
                    cmd.target = platform::path_from_utf8(*v);
                }
            } else if (arg == "--include") {
                if (auto v = a.value(arg)) {
                    cmd.include.push_back(*v);
                }
            } else if (is_option(arg) || have_source) {
                a.fail(unexpected(arg));
            } else {
                cmd.*source = platform::path_from_utf8(arg);
                have_source = true;
            }
        } else {
            if (is_option(arg) || have_source) {
                a.fail(unexpected(arg));
            } else {
                cmd.*source = platform::path_from_utf8(arg);
                have_source = true;
            }
        }
    }
    if (!a.failed() && !have_case) {
        a.fail("the following required arguments were not provided: --case <CASE>");
    }
    if (!a.failed() && !have_source) {
        a.fail(std::string("the following required arguments were not provided: ") + source_label);
    }
    return cmd;
}

Command parse_files(ArgList& a, GlobalOptions& g) {
    FilesCommand cmd;
    bool have_case = false;
    while (!a.done() && !a.failed()) {
        const std::string arg = a.next();
        if (take_global(a, arg, g)) {
        } else if (is_help(arg)) {
            return HelpCommand{"files"};
        } else if (arg == "-c" || arg == "--case") {
            if (auto id = id_option(a, arg)) {
                cmd.case_id = *id;
                have_case = true;
            }
        } else if (arg == "--flagged") {
            cmd.flagged = true;
        } else if (arg == "--has-faces") {
            cmd.has_faces = true;
        } else if (arg == "--type") {
            cmd.type = a.value(arg);
        } else if (arg == "--from") {
            cmd.from = a.value(arg);
        } else if (arg == "--to") {
            cmd.to = a.value(arg);
        } else if (arg == "--text") {
            cmd.text = a.value(arg);
        } else if (arg == "--tag") {
            cmd.tag = a.value(arg);
        } else if (arg == "-j" || arg == "--json") {
            cmd.json = true;
        } else {
            a.fail(unexpected(arg));
        }
    }
    if (!a.failed() && !have_case) {
        a.fail("the following required arguments were not provided: --case <CASE>");
    }
    return cmd;
}

Command parse_flag(ArgList& a, GlobalOptions& g) {
    FlagCommand cmd;
    std::optional<std::int64_t> id;
    std::optional<std::string> reason;
    while (!a.done() && !a.failed()) {
        const std::string arg = a.next();
        if (take_global(a, arg, g)) {
        } else if (is_help(arg)) {
            return HelpCommand{"flag"};
        } else if (arg == "-r" || arg == "--reason") {
            reason = a.value(arg);
        } else if (is_option(arg) || id) {
            a.fail(unexpected(arg));
        } else {
            id = parse_id(a, "<FILE>", arg);
        }
    }
    if (!a.failed() && !id) {
        a.fail("the following required arguments were not provided: <FILE>");
    }
    if (!a.failed() && (!reason || reason->empty())) {
        a.fail("the following required arguments were not provided: --reason <REASON>");
    }
    cmd.file_id = id.value_or(0);
    cmd.reason = reason.value_or("");
    return cmd;
}

/// unflag <FILE> / recount <CASE>: один позиционный идентификатор
template <typename T>
Command parse_single_id(ArgList& a, GlobalOptions& g, const std::string& name,
                        std::int64_t T::*field, const char* label) {
    T cmd;
    std::optional<std::int64_t> id;
    while (!a.done() && !a.failed()) {
        const std::string arg = a.next();
        if (take_global(a, arg, g)) {
        } else if (is_help(arg)) {
            return HelpCommand{name};
        } else if (is_option(arg) || id) {
            a.fail(unexpected(arg));
        } else {
            id = parse_id(a, label, arg);
        }
    }
    if (!a.failed() && !id) {
        a.fail(std::string("the following required arguments were not provided: ") + label);
    }
    cmd.*field = id.value_or(0);
    return cmd;
}

Command parse_note(ArgList& a, GlobalOptions& g) {
    NoteCommand cmd;
    std::optional<std::int64_t> id;
    std::optional<std::string> text;
    while (!a.done() && !a.failed()) {
        const std::string arg = a.next();
        if (take_global(a, arg, g)) {
        } else if (is_help(arg)) {
            return HelpCommand{"note"};
        } else if (is_option(arg)) {
            a.fail(unexpected(arg));
        } else if (!id) {
            id = parse_id(a, "<FILE>", arg);
        } else if (!text) {
            text = arg;
        } else {
            a.fail(unexpected(arg));
        }
    }
    if (!a.failed() && (!id || !text)) {
        a.fail("the following required arguments were not provided: <FILE> <TEXT>");
    }
    cmd.file_id = id.value_or(0);
    cmd.text = text.value_or("");
    return cmd;
}

Command parse_hash(ArgList& a, GlobalOptions& g) {
    HashCommand cmd;
    while (!a.done() && !a.failed()) {
        const std::string arg = a.next();
        if (take_global(a, arg, g)) {
        } else if (is_help(arg)) {
            return HelpCommand{"hash"};
        } else if (arg == "-c" || arg == "--case") {
            cmd.case_id = id_option(a, arg);
        } else if (arg == "--file") {
            cmd.file_id = id_option(a, arg);
        } else {
            a.fail(unexpected(arg));
        }
    }
    if (!a.failed() && cmd.case_id.has_value() == cmd.file_id.has_value()) {
        a.fail("exactly one of '--case <CASE>' or '--file <FILE>' is required");
    }
    return cmd;
}

Command parse_analyze(ArgList& a, GlobalOptions& g) {
    AnalyzeCommand cmd;
    bool have_case = false;
    while (!a.done() && !a.failed()) {
        const std::string arg = a.next();
        if (take_global(a, arg, g)) {
        } else if (is_help(arg)) {
            return HelpCommand{"analyze"};
        } else if (arg == "-c" || arg == "--case") {
            if (auto id = id_option(a, arg)) {
                cmd.case_id = *id;
                have_case = true;
            }
        } else if (arg == "-j" || arg == "--json") {
            cmd.json = true;
        } else {
            a.fail(unexpected(arg));
        }
    }
    if (!a.failed() && !have_case) {
        a.fail("the following required arguments were not provided: --case <CASE>");
    }
    return cmd;
}

Command parse_search(ArgList& a, GlobalOptions& g) {
    SearchCommand cmd;
    bool have_case = false;
    while (!a.done() && !a.failed()) {
        const std::string arg = a.next();
        if (take_global(a, arg, g)) {
        } else if (is_help(arg)) {
            return HelpCommand{"search"};
        } else if (arg == "-c" || arg == "--case") {
            if (auto id = id_option(a, arg)) {
                cmd.case_id = *id;
                have_case = true;
            }
        } else if (arg == "-n" || arg == "--name") {
            cmd.name = a.value(arg);
        } else if (arg == "-k" || arg == "--keyword") {
            if (auto v = a.value(arg)) {
                cmd.keywords.push_back(*v);
            }
        } else if (arg == "--from") {
            cmd.from = a.value(arg);
        } else if (arg == "--to") {
            cmd.to = a.value(arg);
        } else if (arg == "--type") {
            if (auto v = a.value(arg)) {
                cmd.types.push_back(*v);
            }
        } else if (arg == "-j" || arg == "--json") {
            cmd.json = true;
        } else {
            a.fail(unexpected(arg));
        }
    }
    if (!a.failed() && !have_case) {
        a.fail("the following required arguments were not provided: --case <CASE>");
    }
    if (!a.failed() && !cmd.name && cmd.keywords.empty() && !cmd.from && !cmd.to) {
        a.fail("at least one of '--name', '--keyword', '--from' or '--to' is required");
    }
    return cmd;
}

Command parse_audit(ArgList& a, GlobalOptions& g) {
    AuditCommand cmd;
    while (!a.done() && !a.failed()) {
        const std::string arg = a.next();
        if (take_global(a, arg, g)) {
        } else if (is_help(arg)) {
            return HelpCommand{"audit"};
        } else if (arg == "-c" || arg == "--case") {
            cmd.case_id = id_option(a, arg);
        } else if (arg == "--action") {
            cmd.action = a.value(arg);
        } else if (arg == "--limit") {
            if (auto v = a.value(arg)) {
                auto n = parse_unsigned(*v);
                if (!n || *n == 0) {
                    a.fail("invalid value '" + *v + "' for '--limit'");
                } else {
                    cmd.limit = static_cast<std::size_t>(*n);
                }
            }
        } else if (arg == "-j" || arg == "--json") {
            cmd.json = true;
        } else {
            a.fail(unexpected(arg));
        }
    }
    return cmd;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("evidex ") + VERSION + " (" + platform::os_name() + ")\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: evidex [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  detect   Detect the container format of extraction files\n"
               "  index    List the entries of a container without extracting it\n"
               "  case     Create, list, show or close cases\n"
               "  ingest   Index a container into a case\n"
               "  extract  Extract a container and import the extracted files into a case\n"
               "  import   Import a directory tree into a case\n"
               "  files    List the files of a case\n"
               "  flag     Flag a file as evidence of interest\n"
               "  unflag   Clear the flag of a file\n"
               "  note     Set the analyst note of a file\n"
               "  recount  Recompute the file counters of a case\n"
               "  hash     Compute missing SHA-256 hashes\n"
               "  analyze  Run content analysis on unprocessed files of a case\n"
               "  search   Search the files of a case\n"
               "  audit    Show the audit log\n"
               "  help     Print this message or the help of the given subcommand\n"
               "\n"
               "Options:\n"
               "      --db <PATH>                  Case database (default: evidex_cases.db)\n"
               "      --config <PATH>              YAML configuration file\n"
               "  -o, --output <PATH>              Save results to a file\n"
               "      --num-threads <NUM_THREADS>  Limit the thread number (default: num of CPUs)\n"
               "      --no-banner                  Hide the banner\n"
               "  -v...                            Print verbose output\n"
               "  -q                               Suppress informational output\n"
               "  -h, --help                       Print help\n"
               "  -V, --version                    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Create a case and ingest a Cellebrite report:\n"
               "        ./evidex case create \"Fraud 17\"\n"
               "        ./evidex ingest --case 1 phone.ufdr\n"
               "\n"
               "    Search a case for a keyword:\n"
               "        ./evidex search --case 1 -k invoice\n";
    }

    const std::string& c = *command;
    std::string text;
    if (c == "detect") {
        text = "Detect the container format of extraction files\n\n"
               "Usage: " + usage_of(c) + "\n\n"
               "Arguments:\n"
               "  <PATH>...  Files to inspect\n\n"
               "Options:\n"
               "  -j, --json  Output as JSON\n";
    } else if (c == "index") {
        text = "List the entries of a container without extracting it\n\n"
               "Usage: " + usage_of(c) + "\n\n"
               "Arguments:\n"
               "  <ARCHIVE>  Container to index\n\n"
               "Options:\n"
               "  -j, --json  Output as JSON\n";
    } else if (c == "case") {
        text = "Create, list, show or close cases\n\n"
               "Usage:\n"
               "  evidex case create [--number <N>] [--investigator <NAME>] [--agency <NAME>]\n"
               "                     [--incident-date <DATE>] [--notes <TEXT>] <NAME>\n"
               "  evidex case list [--status <open|closed>] [--json]\n"
               "  evidex case show [--json] <CASE>\n"
               "  evidex case close <CASE>\n\n"
               "A case number of the form CASE-YYYY-NNNN is generated when --number is omitted.\n";
    } else if (c == "ingest") {
        text = "Index a container into a case\n\n"
               "Usage: " + usage_of(c) + "\n\n"
               "Arguments:\n"
               "  <ARCHIVE>  Extraction container (UFDR, ZIP, TAR, Android backup)\n\n"
               "Options:\n"
               "  -c, --case <CASE>         Target case id\n"
               "      --entry-timeout <MS>  Per-entry read timeout (0 = none)\n"
               "  -j, --json                Output statistics as JSON\n";
    } else if (c == "extract") {
        text = "Extract a container and import the extracted files into a case\n\n"
               "Usage: " + usage_of(c) + "\n\n"
               "Arguments:\n"
               "  <ARCHIVE>  Extraction container\n\n"
               "Options:\n"
               "  -c, --case <CASE>       Target case id\n"
               "  -t, --target <DIR>      Extraction directory (default: a new temp directory)\n"
               "      --include <SUBSTR>  Only extract entries whose path contains SUBSTR\n"
               "  -j, --json              Output statistics as JSON\n";
    } else if (c == "import") {
        text = "Import a directory tree into a case\n\n"
               "Usage: " + usage_of(c) + "\n\n"
               "Arguments:\n"
               "  <DIR>  Directory to import recursively\n\n"
               "Options:\n"
               "  -c, --case <CASE>  Target case id\n"
               "  -j, --json         Output statistics as JSON\n";
    } else if (c == "files") {
        text = "List the files of a case\n\n"
               "Usage: " + usage_of(c) + "\n\n"
               "Options:\n"
               "  -c, --case <CASE>  Case id\n"
               "      --flagged      Only flagged files\n"
               "      --has-faces    Only files with detected faces\n"
               "      --type <TYPE>  Only files of this category\n"
               "      --from <DATE>  Capture date from (YYYY-MM-DD)\n"
               "      --to <DATE>    Capture date to (YYYY-MM-DD)\n"
               "      --text <TEXT>  Extracted text contains TEXT\n"
               "      --tag <TAG>    A tag contains TAG\n"
               "  -j, --json         Output as JSON\n";
    } else if (c == "flag" || c == "unflag" || c == "note" || c == "recount" || c == "hash" ||
               c == "analyze" || c == "audit") {
        text = "Usage: " + usage_of(c) + "\n";
    } else if (c == "search") {
        text = "Search the files of a case\n\n"
               "Usage: " + usage_of(c) + "\n\n"
               "Options:\n"
               "  -c, --case <CASE>        Case id\n"
               "  -n, --name <NAME>        Person name in file names and extracted text\n"
               "  -k, --keyword <KEYWORD>  Keyword in file names, text and tags (repeatable)\n"
               "      --from <DATE>        File date from (YYYY-MM-DD)\n"
               "      --to <DATE>          File date to (YYYY-MM-DD)\n"
               "      --type <TYPE>        Restrict to a category (repeatable)\n"
               "  -j, --json               Output as JSON\n";
    } else {
        return "error: unrecognized subcommand '" + c + "'\n";
    }
    return text + "  -h, --help  Print help\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до команды
    int cmd_idx = argc;
    for (int i = 1; i < argc;) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            result.ok = true;
            return result;
        }
        if (arg == "-V" || arg == "--version") {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        }
        if (!is_option(arg)) {
            cmd_idx = i;
            break;
        }

        ArgList one(argc, argv, i + 1);
        if (!take_global(one, arg, result.global)) {
            result.diagnostic.stderr_message = render_usage_error(unexpected(arg), "");
            return result;
        }
        if (one.failed()) {
            result.diagnostic.stderr_message = render_usage_error(one.error(), "");
            return result;
        }
        // Опции со значением занимают два аргумента
        bool takes_value = arg == "--db" || arg == "--config" || arg == "--num-threads" ||
                           arg == "-o" || arg == "--output";
        i += takes_value ? 2 : 1;
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        return result;
    }

    const std::string cmd = argv[cmd_idx];
    ArgList a(argc, argv, cmd_idx + 1);
    Command command;

    if (cmd == "help") {
        HelpCommand help;
        if (!a.done()) {
            help.command = a.next();
        }
        command = help;
    } else if (cmd == "detect") {
        command = parse_detect(a, result.global);
    } else if (cmd == "index") {
        command = parse_index(a, result.global);
    } else if (cmd == "case") {
        command = parse_case(a, result.global);
    } else if (cmd == "ingest") {
        command = parse_source_command<IngestCommand>(a, result.global, cmd,
                                                      &IngestCommand::archive, "<ARCHIVE>");
    } else if (cmd == "extract") {
        command = parse_source_command<ExtractCommand>(a, result.global, cmd,
                                                       &ExtractCommand::archive, "<ARCHIVE>");
    } else if (cmd == "import") {
        command = parse_source_command<ImportCommand>(a, result.global, cmd, &ImportCommand::root,
                                                      "<DIR>");
    } else if (cmd == "files") {
        command = parse_files(a, result.global);
    } else if (cmd == "flag") {
        command = parse_flag(a, result.global);
    } else if (cmd == "unflag") {
        command = parse_single_id<UnflagCommand>(a, result.global, cmd, &UnflagCommand::file_id,
                                                 "<FILE>");
    } else if (cmd == "note") {
        command = parse_note(a, result.global);
    } else if (cmd == "recount") {
        command = parse_single_id<RecountCommand>(a, result.global, cmd, &RecountCommand::case_id,
                                                  "<CASE>");
    } else if (cmd == "hash") {
        command = parse_hash(a, result.global);
    } else if (cmd == "analyze") {
        command = parse_analyze(a, result.global);
    } else if (cmd == "search") {
        command = parse_search(a, result.global);
    } else if (cmd == "audit") {
        command = parse_audit(a, result.global);
    } else {
        result.diagnostic.stderr_message =
            render_usage_error("unrecognized subcommand '" + cmd + "'", "");
        return result;
    }

    if (a.failed()) {
        result.diagnostic.stderr_message = render_usage_error(a.error(), cmd);
        return result;
    }

    result.ok = true;
    result.command = std::move(command);
    return result;
}

}  // namespace evidex::cli
