#include "cli.h"
#include "utils.h"
#include "exporter.h"
#include "migration.h"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <unistd.h>
#include <termios.h>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

namespace prompthub {

namespace {

const char* VERSION_STRING = "PromptHub version 2.0.0 (C++)";

// Options that never take a value
const std::set<std::string> FLAG_OPTIONS = {
    "major", "root", "yes", "clear-tags", "all"
};

// Cuts str to at most max_chars UTF-8 characters
std::string shorten(const std::string& str, size_t max_chars) {
    if (utils::utf8Length(str) <= max_chars) return str;
    size_t chars = 0;
    size_t i = 0;
    while (i < str.size() && chars < max_chars) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        size_t len = 1;
        if (c >= 0xF0) len = 4;
        else if (c >= 0xE0) len = 3;
        else if (c >= 0xC0) len = 2;
        i += len;
        chars++;
    }
    return str.substr(0, i) + "...";
}

std::string firstLine(const std::string& str) {
    size_t nl = str.find('\n');
    return nl == std::string::npos ? str : str.substr(0, nl);
}

} // namespace

// ============================================================================
// CommandArgs
// ============================================================================

bool CommandArgs::has(const std::string& name) const {
    return flags.count(name) > 0 || options.count(name) > 0;
}

std::string CommandArgs::get(const std::string& name, const std::string& fallback) const {
    auto it = options.find(name);
    if (it == options.end() || it->second.empty()) return fallback;
    return it->second.back();
}

std::vector<std::string> CommandArgs::getAll(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) return {};
    return it->second;
}

int CommandArgs::getInt(const std::string& name, int fallback) const {
    std::string value = get(name);
    if (value.empty()) return fallback;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

// ============================================================================
// CLI
// ============================================================================

CLI::CLI()
    : debug_override_(false)
    , assume_yes_(false)
    , exit_code_(0)
{
}

CLI::~CLI() = default;

bool CLI::parseArgs(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printHelp();
            return false;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << VERSION_STRING << std::endl;
            return false;
        } else if (arg == "-c" || arg == "--config" || arg == "-s" || arg == "--secret" ||
                   arg == "--backend" || arg == "--data-dir") {
            if (i + 1 >= argc) {
                utils::terminal::printError("Missing value for " + arg);
                exit_code_ = exitCodeFor(ErrorKind::InvalidInput);
                return false;
            }
            std::string value = argv[++i];
            if (arg == "-c" || arg == "--config") config_path_ = value;
            else if (arg == "-s" || arg == "--secret") secret_ = value;
            else if (arg == "--backend") backend_override_ = value;
            else data_dir_override_ = value;
        } else if (arg == "--debug") {
            debug_override_ = true;
        } else if (arg == "-y" || arg == "--yes") {
            assume_yes_ = true;
        } else {
            // Everything from the first command word on belongs to the command
            for (int j = i; j < argc; j++) {
                command_.push_back(argv[j]);
            }
            break;
        }
    }

    if (secret_.empty()) {
        if (const char* env = std::getenv("PROMPTHUB_SECRET")) {
            secret_ = env;
        }
    }
    return true;
}

void CLI::printHelp() {
    std::cout << R"(Usage: prompthub [OPTIONS] <COMMAND> [ARGS]

Prompt catalog with categories, tags and version history

OPTIONS:
    -c, --config PATH       Use a specific config file
    -s, --secret SECRET     Admin secret for write commands (or PROMPTHUB_SECRET)
    --backend NAME          Storage backend for this run (json, sqlite)
    --data-dir DIR          Data directory for this run
    -y, --yes               Do not ask for confirmation
    --debug                 Print debug output
    -v, --version           Show version
    -h, --help              Show this help

PROMPTS:
    list [FILTERS]                          List prompts, newest first
    search TEXT [FILTERS]                   Search title, content and description
    show ID                                 Show one prompt
    add --title T --content C [FIELDS]      Create a prompt (version 1.0)
    edit ID [FIELDS] [--note N] [--major]   Update a prompt
    delete ID                               Delete a prompt
    use ID                                  Print the content and count one use
    versions ID [LABEL]                     List versions or show one
    rollback ID LABEL                       Restore the fields of a version

    FILTERS: --category ID --tag NAME (repeatable) --page N --page-size N
    FIELDS:  --title --content --content-file PATH --description
             --category ID --tag NAME (repeatable) --clear-tags

CATEGORIES:
    category list                           List categories by path
    category tree                           Show the tree with prompt counts
    category add NAME [--parent ID] [--color C] [--description D]
    category edit ID [--name N] [--parent ID | --root] [--color C] [--description D]
    category preview ID                     Show what a delete would touch
    category delete ID                      Delete, reassigning prompts and children

TAGS:
    tag list                                List tags with usage counts
    tag add NAME [--color C]
    tag edit ID [--name N] [--color C]      Renames cascade to prompts
    tag delete ID                           Removes the tag from every prompt

DATA:
    stats                                   Catalog statistics
    check                                   Verify referential integrity
    export-csv PATH [FILTERS]               Export prompts as CSV
    export-json PATH [FILTERS]              Export prompts as JSON
    import PATH                             Merge prompts from a JSON export
    backup                                  Write a full backup now
    reset                                   Back up, then restore defaults
    load-test-data PATH                     Back up, then replace all prompts
    migrate --from json|unified-file PATH [--to BACKEND]
                                            Back up, then copy a catalog from another storage variant
    passwd [NEW]                            Change the admin password
    config                                  Show configuration
    config set KEY VALUE                    Change backend, data-dir, backup-dir, max-depth, page-size or debug
    shell                                   Interactive mode (default)

EXAMPLES:
    prompthub list --tag writing
    prompthub -s admin123 add --title "Summary" --content "Summarize: {text}" --tag writing
    prompthub -s admin123 category add "Reports" --parent 3
    prompthub export-csv prompts.csv

)";
}

void CLI::printConfig() {
    std::cout << utils::terminal::CYAN << utils::terminal::BOLD << "Current Configuration:" << utils::terminal::RESET << "\n";
    std::cout << "  Config File:  " << config_->getConfigFile() << "\n";
    std::cout << "  Backend:      " << utils::terminal::GREEN << store_->getBackend() << utils::terminal::RESET << "\n";
    std::cout << "  Data Dir:     " << config_->getDataDir() << "\n";
    std::cout << "  Location:     " << store_->getLocation() << "\n";
    std::cout << "  Backup Dir:   " << config_->getBackupDir() << "\n";
    std::cout << "  Max Depth:    " << config_->getMaxCategoryDepth() << "\n";
    std::cout << "  Page Size:    " << config_->getPageSize() << "\n";
    std::cout << "  Debug:        " << (config_->getDebug() ? "true" : "false") << "\n";
    std::cout << "  Write Access: " << (config_->getAdminSecretHash().empty()
                                        ? std::string(utils::terminal::RED) + "disabled (no admin password)"
                                        : std::string(utils::terminal::GREEN) + "password protected")
              << utils::terminal::RESET << "\n\n";
}

int CLI::exitCodeFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return 0;
        case ErrorKind::InvalidInput:
        case ErrorKind::Conflict: return 2;
        case ErrorKind::Unauthorized: return 3;
        case ErrorKind::NotFound: return 4;
        case ErrorKind::StorageFailure:
        case ErrorKind::ConsistencyViolation: return 5;
    }
    return 1;
}

int CLI::reportError(ErrorKind kind, const std::string& message) {
    utils::terminal::printError(message);
    utils::debugLog(std::string("error kind: ") + errorKindName(kind));
    return exitCodeFor(kind);
}

bool CLI::confirm(const std::string& question, bool assume_yes) {
    if (assume_yes || assume_yes_) return true;
    if (!isatty(STDIN_FILENO)) {
        utils::terminal::printWarning("Not a terminal; pass --yes to confirm");
        return false;
    }
    std::cout << question << " (y/n): ";
    std::string answer;
    std::getline(std::cin, answer);
    answer = utils::trim(answer);
    return answer == "y" || answer == "Y";
}

std::string CLI::readHidden(const std::string& label) {
    std::cout << label;
    std::cout.flush();

    std::string value;
    if (!isatty(STDIN_FILENO)) {
        std::getline(std::cin, value);
        return value;
    }

    struct termios oldt, newt;
    tcgetattr(STDIN_FILENO, &oldt);
    newt = oldt;
    newt.c_lflag &= ~ECHO;
    tcsetattr(STDIN_FILENO, TCSANOW, &newt);
    std::getline(std::cin, value);
    tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
    std::cout << "\n";
    return value;
}

std::string CLI::secret() {
    if (secret_.empty() && isatty(STDIN_FILENO)) {
        secret_ = readHidden("Admin secret: ");
    }
    return secret_;
}

bool CLI::openCatalog() {
    std::string backend = config_->getStorageBackend();
    auto impl = EntityStore::createBackend(backend);
    if (!impl) {
        utils::terminal::printError("Unknown storage backend: " + backend + " (available: " +
                                    utils::join(EntityStore::getAvailableBackends(), ", ") + ")");
        return false;
    }

    store_ = std::make_unique<EntityStore>(std::move(impl));
    if (!store_->open(config_->getStoreLocation())) {
        utils::terminal::printError("Cannot open catalog at " + config_->getStoreLocation());
        return false;
    }
    utils::debugLog("Opened " + backend + " catalog at " + store_->getLocation());

    IntegrityOptions options;
    options.max_category_depth = config_->getMaxCategoryDepth();
    integrity_ = std::make_unique<IntegrityManager>(options);
    backups_ = std::make_unique<BackupManager>(config_->getBackupDir());
    gate_ = std::make_unique<MutationGate>(*store_, *integrity_, *backups_, config_->getAdminSecretHash());
    query_ = std::make_unique<QueryEngine>(*store_);

    Result<std::vector<std::string>> init = gate_->initialize();
    if (!init.isSuccess()) {
        utils::terminal::printError("Cannot initialize catalog: " + init.error);
        return false;
    }
    if (!init.value.empty()) {
        utils::terminal::printWarning("Catalog has " + std::to_string(init.value.size()) +
                                      " consistency problem(s); changes are refused until they are fixed. "
                                      "Run 'check' for details.");
    }
    return true;
}

std::vector<std::string> CLI::tokenize(const std::string& line) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = 0;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else if (c == '\\' && quote == '"' && i + 1 < line.size() &&
                       (line[i + 1] == '"' || line[i + 1] == '\\')) {
                current += line[++i];
            } else {
                current += c;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
            in_word = true;
        } else if (c == ' ' || c == '\t') {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
        } else {
            current += c;
            in_word = true;
        }
    }
    if (in_word) words.push_back(current);
    return words;
}

CommandArgs CLI::parseCommandArgs(const std::vector<std::string>& args, size_t start) {
    CommandArgs parsed;
    for (size_t i = start; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (utils::startsWith(arg, "--") && arg.size() > 2) {
            std::string name = arg.substr(2);
            size_t eq = name.find('=');
            if (eq != std::string::npos) {
                parsed.options[name.substr(0, eq)].push_back(name.substr(eq + 1));
            } else if (FLAG_OPTIONS.count(name)) {
                parsed.flags.insert(name);
            } else if (i + 1 < args.size()) {
                parsed.options[name].push_back(args[++i]);
            } else {
                parsed.options[name].push_back("");
            }
        } else {
            parsed.positional.push_back(arg);
        }
    }
    return parsed;
}

SearchQuery CLI::buildQuery(const CommandArgs& args) const {
    SearchQuery query;
    query.category_id = args.get("category");
    query.tags = args.getAll("tag");
    query.page = args.getInt("page", 1);
    query.page_size = args.getInt("page-size", config_->getPageSize());
    if (args.has("all")) query.page_size = 0;
    return query;
}

// ============================================================================
// Printing
// ============================================================================

void CLI::printPromptRow(const Prompt& p) {
    std::cout << "  " << utils::terminal::DIM << p.id.substr(0, 8) << utils::terminal::RESET << "  ";
    std::cout << utils::terminal::GREEN << shorten(p.title, 40) << utils::terminal::RESET;
    std::cout << " [" << (p.category_path.empty() ? p.category_name : p.category_path) << "]";
    if (!p.tags.empty()) {
        std::cout << " " << utils::terminal::CYAN << "#" << utils::join(p.tags, " #") << utils::terminal::RESET;
    }
    std::cout << " v" << p.current_version;
    if (p.usage_count > 0) std::cout << " (" << p.usage_count << " uses)";
    std::cout << "\n";
    if (!p.description.empty()) {
        std::cout << "            " << shorten(firstLine(p.description), 60) << "\n";
    }
}

void CLI::printPromptDetail(const Prompt& p) {
    std::cout << "\n" << utils::terminal::BOLD << p.title << utils::terminal::RESET << "\n";
    std::cout << std::string(50, '-') << "\n";
    std::cout << "  ID:          " << p.id << "\n";
    std::cout << "  Category:    " << p.category_path << " (" << p.category_id << ")\n";
    std::cout << "  Tags:        " << (p.tags.empty() ? "-" : utils::join(p.tags, ", ")) << "\n";
    std::cout << "  Version:     " << p.current_version << "\n";
    std::cout << "  Used:        " << p.usage_count << "\n";
    std::cout << "  Created:     " << p.created_at << "\n";
    std::cout << "  Updated:     " << p.updated_at << "\n";
    if (!p.description.empty()) {
        std::cout << "  Description: " << p.description << "\n";
    }
    std::cout << std::string(50, '-') << "\n";
    std::cout << utils::terminal::CYAN << p.content << utils::terminal::RESET << "\n\n";
}

void CLI::printCategoryNode(const CategoryNode& node, int depth) {
    std::cout << "  " << std::string(depth * 2, ' ');
    std::cout << utils::terminal::GREEN << node.category.name << utils::terminal::RESET;
    std::cout << " " << utils::terminal::DIM << "(" << node.category.id << ")" << utils::terminal::RESET;
    std::cout << " " << node.prompt_count;
    if (node.total_count != node.prompt_count) {
        std::cout << "/" << node.total_count;
    }
    std::cout << "\n";
    for (const auto& child : node.children) {
        printCategoryNode(child, depth + 1);
    }
}

// ============================================================================
// Command dispatch
// ============================================================================

int CLI::executeCommand(const std::vector<std::string>& args) {
    if (args.empty()) return 0;

    std::string cmd = args[0];
    if (!cmd.empty() && cmd[0] == '/') cmd = cmd.substr(1);
    utils::debugLog("command: " + utils::join(args, " "));

    if (cmd == "help") {
        printHelp();
        return 0;
    } else if (cmd == "config") {
        return handleConfigCommand(parseCommandArgs(args, 1));
    } else if (cmd == "list") {
        return handleSearchCommand(parseCommandArgs(args, 1), true);
    } else if (cmd == "search") {
        return handleSearchCommand(parseCommandArgs(args, 1), false);
    } else if (cmd == "show") {
        return handleShowCommand(parseCommandArgs(args, 1));
    } else if (cmd == "add") {
        return handleAddCommand(parseCommandArgs(args, 1));
    } else if (cmd == "edit") {
        return handleEditCommand(parseCommandArgs(args, 1));
    } else if (cmd == "delete") {
        return handleDeleteCommand(parseCommandArgs(args, 1));
    } else if (cmd == "use") {
        return handleUseCommand(parseCommandArgs(args, 1));
    } else if (cmd == "versions") {
        return handleVersionsCommand(parseCommandArgs(args, 1));
    } else if (cmd == "rollback") {
        return handleRollbackCommand(parseCommandArgs(args, 1));
    } else if (cmd == "category" || cmd == "categories") {
        return handleCategoryCommand(parseCommandArgs(args, 1));
    } else if (cmd == "tag" || cmd == "tags") {
        return handleTagCommand(parseCommandArgs(args, 1));
    } else if (cmd == "stats") {
        return handleStatsCommand();
    } else if (cmd == "check") {
        return handleCheckCommand();
    } else if (cmd == "export-csv") {
        return handleExportCommand(parseCommandArgs(args, 1), true);
    } else if (cmd == "export-json") {
        return handleExportCommand(parseCommandArgs(args, 1), false);
    } else if (cmd == "import") {
        return handleImportCommand(parseCommandArgs(args, 1));
    } else if (cmd == "load-test-data") {
        return handleLoadTestDataCommand(parseCommandArgs(args, 1));
    } else if (cmd == "backup") {
        return handleBackupCommand();
    } else if (cmd == "reset") {
        return handleResetCommand(parseCommandArgs(args, 1));
    } else if (cmd == "migrate") {
        return handleMigrateCommand(parseCommandArgs(args, 1));
    } else if (cmd == "passwd") {
        return handlePasswdCommand(parseCommandArgs(args, 1));
    }

    return reportError(ErrorKind::InvalidInput, "Unknown command: " + cmd + " (try 'help')");
}

// ============================================================================
// Prompt Command Handlers
// ============================================================================

int CLI::handleSearchCommand(const CommandArgs& args, bool list_all) {
    SearchQuery query = buildQuery(args);
    if (!list_all) {
        query.text = utils::join(args.positional, " ");
        if (query.text.empty()) {
            return reportError(ErrorKind::InvalidInput, "Usage: search TEXT [--category ID] [--tag NAME]");
        }
    }

    auto result = query_->search(query);
    if (!result.isSuccess()) {
        return reportError(result.kind, result.error);
    }

    const SearchPage& page = result.value;
    if (page.items.empty()) {
        if (page.total_count > 0) {
            utils::terminal::printInfo("Page " + std::to_string(page.page) + " is empty (" +
                                       std::to_string(page.total_count) + " prompts in " +
                                       std::to_string(page.totalPages()) + " pages).");
        } else if (list_all) {
            utils::terminal::printInfo("No prompts found.");
        } else {
            utils::terminal::printInfo("No prompts matching '" + query.text + "'");
        }
        return 0;
    }

    std::cout << "\n" << utils::terminal::BOLD << "Prompts" << utils::terminal::RESET;
    if (page.page_size > 0) {
        std::cout << " (page " << page.page << "/" << page.totalPages() << ", " << page.total_count << " total)";
    } else {
        std::cout << " (" << page.total_count << ")";
    }
    std::cout << "\n" << std::string(50, '-') << "\n";
    for (const auto& p : page.items) {
        printPromptRow(p);
    }
    std::cout << "\n";
    return 0;
}

int CLI::handleShowCommand(const CommandArgs& args) {
    if (args.positional.empty()) {
        return reportError(ErrorKind::InvalidInput, "Usage: show ID");
    }
    auto result = query_->getPrompt(args.positional[0]);
    if (!result.isSuccess()) {
        return reportError(result.kind, result.error);
    }
    printPromptDetail(result.value);
    return 0;
}

int CLI::handleAddCommand(const CommandArgs& args) {
    PromptInput input;
    input.title = args.get("title");
    input.content = args.get("content");
    input.description = args.get("description");
    input.category_id = args.get("category");
    input.tags = args.getAll("tag");

    if (args.has("content-file")) {
        std::string path = utils::expandHome(args.get("content-file"));
        if (!utils::readFile(path, input.content)) {
            return reportError(ErrorKind::NotFound, "Cannot read " + path);
        }
    }
    if (input.title.empty() && !args.positional.empty()) {
        input.title = args.positional[0];
    }

    auto result = gate_->createPrompt(secret(), input);
    if (!result.isSuccess()) {
        return reportError(result.kind, "Failed to add prompt: " + result.error);
    }
    utils::terminal::printSuccess("Prompt '" + result.value.title + "' added as " + result.value.id);
    return 0;
}

int CLI::handleEditCommand(const CommandArgs& args) {
    if (args.positional.empty()) {
        return reportError(ErrorKind::InvalidInput, "Usage: edit ID [--title T] [--content C] [--tag NAME] ...");
    }

    PromptPatch patch;
    if (args.has("title")) patch.title = args.get("title");
    if (args.has("content")) patch.content = args.get("content");
    if (args.has("description")) patch.description = args.get("description");
    if (args.has("category")) patch.category_id = args.get("category");
    if (args.has("tag")) {
        patch.tags = args.getAll("tag");
    } else if (args.has("clear-tags")) {
        patch.tags = std::vector<std::string>();
    }
    if (args.has("content-file")) {
        std::string path = utils::expandHome(args.get("content-file"));
        std::string content;
        if (!utils::readFile(path, content)) {
            return reportError(ErrorKind::NotFound, "Cannot read " + path);
        }
        patch.content = content;
    }
    patch.change_note = args.get("note");
    patch.major = args.has("major");

    std::string before;
    auto current = query_->getPrompt(args.positional[0]);
    if (current.isSuccess()) before = current.value.current_version;

    auto result = gate_->updatePrompt(secret(), args.positional[0], patch);
    if (!result.isSuccess()) {
        return reportError(result.kind, "Failed to update prompt: " + result.error);
    }

    if (result.value.current_version != before) {
        utils::terminal::printSuccess("Prompt updated to version " + result.value.current_version);
    } else {
        utils::terminal::printSuccess("Prompt updated.");
    }
    return 0;
}

int CLI::handleDeleteCommand(const CommandArgs& args) {
    if (args.positional.empty()) {
        return reportError(ErrorKind::InvalidInput, "Usage: delete ID");
    }
    auto current = query_->getPrompt(args.positional[0]);
    if (!current.isSuccess()) {
        return reportError(current.kind, current.error);
    }
    if (!confirm("Delete prompt '" + current.value.title + "'?", args.has("yes"))) {
        utils::terminal::printInfo("Cancelled.");
        return 0;
    }

    auto result = gate_->deletePrompt(secret(), args.positional[0]);
    if (!result.isSuccess()) {
        return reportError(result.kind, "Failed to delete prompt: " + result.error);
    }
    utils::terminal::printSuccess("Prompt deleted.");
    return 0;
}

int CLI::handleUseCommand(const CommandArgs& args) {
    if (args.positional.empty()) {
        return reportError(ErrorKind::InvalidInput, "Usage: use ID");
    }
    auto result = gate_->usePrompt(args.positional[0]);
    if (!result.isSuccess()) {
        return reportError(result.kind, result.error);
    }
    std::cout << result.value.content << "\n";
    return 0;
}

int CLI::handleVersionsCommand(const CommandArgs& args) {
    if (args.positional.empty()) {
        return reportError(ErrorKind::InvalidInput, "Usage: versions ID [LABEL]");
    }
    const std::string& id = args.positional[0];

    if (args.positional.size() > 1) {
        auto version = query_->getVersion(id, args.positional[1]);
        if (!version.isSuccess()) {
            return reportError(version.kind, version.error);
        }
        const PromptVersion& v = version.value;
        std::cout << "\n" << utils::terminal::BOLD << v.title << " v" << v.version << utils::terminal::RESET << "\n";
        std::cout << std::string(50, '-') << "\n";
        std::cout << "  Created:     " << v.created_at << "\n";
        std::cout << "  Note:        " << v.change_note << "\n";
        if (!v.description.empty()) {
            std::cout << "  Description: " << v.description << "\n";
        }
        std::cout << std::string(50, '-') << "\n";
        std::cout << utils::terminal::CYAN << v.content << utils::terminal::RESET << "\n\n";
        return 0;
    }

    auto result = query_->listVersions(id);
    if (!result.isSuccess()) {
        return reportError(result.kind, result.error);
    }
    std::string current;
    auto prompt = query_->getPrompt(id);
    if (prompt.isSuccess()) current = prompt.value.current_version;

    std::cout << "\n" << utils::terminal::BOLD << "Versions" << utils::terminal::RESET << "\n";
    std::cout << std::string(50, '-') << "\n";
    for (const auto& v : result.value) {
        std::cout << "  " << (v.version == current ? std::string(utils::terminal::GREEN) + "* " : "  ");
        std::cout << v.version << utils::terminal::RESET;
        std::cout << "  " << v.created_at << "  " << shorten(v.change_note, 40) << "\n";
    }
    std::cout << "\n";
    return 0;
}

int CLI::handleRollbackCommand(const CommandArgs& args) {
    if (args.positional.size() < 2) {
        return reportError(ErrorKind::InvalidInput, "Usage: rollback ID LABEL");
    }
    auto result = gate_->rollbackPrompt(secret(), args.positional[0], args.positional[1]);
    if (!result.isSuccess()) {
        return reportError(result.kind, "Rollback failed: " + result.error);
    }
    utils::terminal::printSuccess("Prompt '" + result.value.title + "' is at version " + result.value.current_version);
    return 0;
}

// ============================================================================
// Category Command Handlers
// ============================================================================

int CLI::handleCategoryCommand(const CommandArgs& args) {
    std::string sub = args.positional.empty() ? "list" : args.positional[0];
    std::string target = args.positional.size() > 1 ? args.positional[1] : "";

    if (sub == "list") {
        auto result = query_->listCategories();
        if (!result.isSuccess()) {
            return reportError(result.kind, result.error);
        }
        std::cout << "\nCategories:\n";
        for (const auto& c : result.value) {
            std::cout << "  " << utils::terminal::DIM << c.id.substr(0, 8) << utils::terminal::RESET << "  ";
            std::cout << c.path;
            if (!c.description.empty()) std::cout << " (" << c.description << ")";
            std::cout << "\n";
        }
        std::cout << "\n";
        return 0;
    } else if (sub == "tree") {
        auto result = query_->categoryTree();
        if (!result.isSuccess()) {
            return reportError(result.kind, result.error);
        }
        std::cout << "\n";
        for (const auto& node : result.value) {
            printCategoryNode(node, 0);
        }
        std::cout << "\n";
        return 0;
    } else if (sub == "add") {
        CategoryInput input;
        input.name = target.empty() ? args.get("name") : target;
        input.parent_id = args.get("parent");
        input.color = args.get("color");
        input.description = args.get("description");
        auto result = gate_->createCategory(secret(), input);
        if (!result.isSuccess()) {
            return reportError(result.kind, "Failed to add category: " + result.error);
        }
        utils::terminal::printSuccess("Category '" + result.value.path + "' added as " + result.value.id);
        return 0;
    } else if (sub == "edit") {
        if (target.empty()) {
            return reportError(ErrorKind::InvalidInput, "Usage: category edit ID [--name N] [--parent ID | --root]");
        }
        CategoryPatch patch;
        if (args.has("name")) patch.name = args.get("name");
        if (args.has("color")) patch.color = args.get("color");
        if (args.has("description")) patch.description = args.get("description");
        if (args.has("root")) patch.parent_id = std::string();
        else if (args.has("parent")) patch.parent_id = args.get("parent");

        auto result = gate_->updateCategory(secret(), target, patch);
        if (!result.isSuccess()) {
            return reportError(result.kind, "Failed to update category: " + result.error);
        }
        utils::terminal::printSuccess("Category is now '" + result.value.path + "'");
        return 0;
    } else if (sub == "preview" || sub == "delete") {
        if (target.empty()) {
            return reportError(ErrorKind::InvalidInput, "Usage: category " + sub + " ID");
        }
        auto impact = query_->previewCategoryDeletion(target);
        if (!impact.isSuccess()) {
            return reportError(impact.kind, impact.error);
        }
        const CategoryImpact& info = impact.value;
        std::cout << "Category '" << info.category.path << "': "
                  << info.prompt_count << " prompts move to the fallback category";
        if (!info.child_names.empty()) {
            std::cout << ", " << info.child_names.size() << " subcategories move up ("
                      << utils::join(info.child_names, ", ") << ")";
        }
        std::cout << "\n";
        if (!info.colliding_children.empty()) {
            utils::terminal::printWarning("Blocked: " + utils::join(info.colliding_children, ", ") +
                                          " already exist one level up");
        }
        if (sub == "preview") return 0;

        if (!confirm("Delete category '" + info.category.name + "'?", args.has("yes"))) {
            utils::terminal::printInfo("Cancelled.");
            return 0;
        }
        auto result = gate_->deleteCategory(secret(), target);
        if (!result.isSuccess()) {
            return reportError(result.kind, "Failed to delete category: " + result.error);
        }
        utils::terminal::printSuccess("Category deleted; " + std::to_string(result.value.reassigned_prompts) +
                                      " prompts reassigned, " + std::to_string(result.value.reparented_children) +
                                      " subcategories moved.");
        return 0;
    }

    return reportError(ErrorKind::InvalidInput, "Unknown category command: " + sub);
}

// ============================================================================
// Tag Command Handlers
// ============================================================================

int CLI::handleTagCommand(const CommandArgs& args) {
    std::string sub = args.positional.empty() ? "list" : args.positional[0];
    std::string target = args.positional.size() > 1 ? args.positional[1] : "";

    if (sub == "list") {
        auto result = query_->listTags();
        if (!result.isSuccess()) {
            return reportError(result.kind, result.error);
        }
        if (result.value.empty()) {
            utils::terminal::printInfo("No tags.");
            return 0;
        }
        std::cout << "\nTags:\n";
        for (const auto& usage : result.value) {
            std::cout << "  " << utils::terminal::DIM << usage.tag.id.substr(0, 8) << utils::terminal::RESET << "  ";
            std::cout << utils::terminal::CYAN << usage.tag.name << utils::terminal::RESET;
            std::cout << " (" << usage.prompt_count << ")\n";
        }
        std::cout << "\n";
        return 0;
    } else if (sub == "add") {
        TagInput input;
        input.name = target.empty() ? args.get("name") : target;
        input.color = args.get("color");
        auto result = gate_->createTag(secret(), input);
        if (!result.isSuccess()) {
            return reportError(result.kind, "Failed to add tag: " + result.error);
        }
        utils::terminal::printSuccess("Tag '" + result.value.name + "' added as " + result.value.id);
        return 0;
    } else if (sub == "edit") {
        if (target.empty()) {
            return reportError(ErrorKind::InvalidInput, "Usage: tag edit ID [--name N] [--color C]");
        }
        TagPatch patch;
        if (args.has("name")) patch.name = args.get("name");
        if (args.has("color")) patch.color = args.get("color");
        auto result = gate_->updateTag(secret(), target, patch);
        if (!result.isSuccess()) {
            return reportError(result.kind, "Failed to update tag: " + result.error);
        }
        utils::terminal::printSuccess("Tag '" + result.value.tag.name + "' updated (" +
                                      std::to_string(result.value.affected_prompts) + " prompts).");
        return 0;
    } else if (sub == "delete") {
        if (target.empty()) {
            return reportError(ErrorKind::InvalidInput, "Usage: tag delete ID");
        }
        if (!confirm("Delete tag " + target + " from every prompt?", args.has("yes"))) {
            utils::terminal::printInfo("Cancelled.");
            return 0;
        }
        auto result = gate_->deleteTag(secret(), target);
        if (!result.isSuccess()) {
            return reportError(result.kind, "Failed to delete tag: " + result.error);
        }
        utils::terminal::printSuccess("Tag '" + result.value.tag.name + "' deleted from " +
                                      std::to_string(result.value.affected_prompts) + " prompts.");
        return 0;
    }

    return reportError(ErrorKind::InvalidInput, "Unknown tag command: " + sub);
}

// ============================================================================
// Data Command Handlers
// ============================================================================

int CLI::handleStatsCommand() {
    auto result = query_->stats();
    if (!result.isSuccess()) {
        return reportError(result.kind, result.error);
    }
    const CatalogStats& stats = result.value;

    std::cout << utils::terminal::CYAN << utils::terminal::BOLD << "Catalog Statistics:" << utils::terminal::RESET << "\n";
    std::cout << "  Prompts:      " << stats.total_prompts << "\n";
    std::cout << "  Categories:   " << stats.total_categories << "\n";
    std::cout << "  Tags:         " << stats.total_tags << "\n";
    std::cout << "  Versions:     " << stats.total_versions << "\n";
    std::cout << "  Total Uses:   " << stats.total_usage << "\n";
    if (stats.has_most_used) {
        std::cout << "  Most Used:    " << stats.most_used.title << " (" << stats.most_used.usage_count << ")\n";
    }

    std::cout << "\n  By category:\n";
    for (const auto& entry : stats.category_distribution) {
        std::cout << "    " << entry.category.path << ": " << entry.prompt_count << "\n";
    }
    std::cout << "\n  Categories per level:\n";
    for (const auto& level : stats.level_stats) {
        std::cout << "    " << level.first << ": " << level.second << "\n";
    }
    std::cout << "\n";
    return 0;
}

int CLI::handleCheckCommand() {
    auto result = query_->checkConsistency(*integrity_);
    if (!result.isSuccess()) {
        return reportError(result.kind, result.error);
    }
    if (result.value.empty()) {
        utils::terminal::printSuccess("Catalog is consistent.");
        return 0;
    }
    for (const auto& problem : result.value) {
        utils::terminal::printWarning(problem);
    }
    return reportError(ErrorKind::ConsistencyViolation,
                       std::to_string(result.value.size()) + " consistency problems found");
}

int CLI::handleExportCommand(const CommandArgs& args, bool csv) {
    if (args.positional.empty()) {
        return reportError(ErrorKind::InvalidInput, csv ? "Usage: export-csv PATH" : "Usage: export-json PATH");
    }
    std::string path = utils::expandHome(args.positional[0]);

    SearchQuery query = buildQuery(args);
    query.text = args.get("search");
    query.page_size = 0;
    auto result = query_->search(query);
    if (!result.isSuccess()) {
        return reportError(result.kind, result.error);
    }

    Status written = csv ? exporter::writeCsv(result.value.items, path)
                         : exporter::writeJson(result.value.items, path);
    if (!written.isSuccess()) {
        return reportError(written.kind, written.error);
    }
    utils::terminal::printSuccess("Exported " + std::to_string(result.value.items.size()) + " prompts to " + path);
    return 0;
}

int CLI::handleImportCommand(const CommandArgs& args) {
    if (args.positional.empty()) {
        return reportError(ErrorKind::InvalidInput, "Usage: import PATH");
    }
    auto records = exporter::readPrompts(utils::expandHome(args.positional[0]));
    if (!records.isSuccess()) {
        return reportError(records.kind, records.error);
    }

    auto result = gate_->importPrompts(secret(), records.value);
    if (!result.isSuccess()) {
        return reportError(result.kind, "Import failed: " + result.error);
    }
    for (const auto& message : result.value.messages) {
        utils::terminal::printWarning(message);
    }
    utils::terminal::printSuccess("Imported: " + std::to_string(result.value.created) + " new, " +
                                  std::to_string(result.value.updated) + " updated, " +
                                  std::to_string(result.value.skipped) + " skipped.");
    return 0;
}

int CLI::handleLoadTestDataCommand(const CommandArgs& args) {
    if (args.positional.empty()) {
        return reportError(ErrorKind::InvalidInput, "Usage: load-test-data PATH");
    }
    auto records = exporter::readPrompts(utils::expandHome(args.positional[0]));
    if (!records.isSuccess()) {
        return reportError(records.kind, records.error);
    }
    if (!confirm("Replace all prompts with " + std::to_string(records.value.size()) + " test records?",
                 args.has("yes"))) {
        utils::terminal::printInfo("Cancelled.");
        return 0;
    }

    auto result = gate_->loadTestData(secret(), records.value);
    if (!result.isSuccess()) {
        return reportError(result.kind, "Loading test data failed: " + result.error);
    }
    utils::terminal::printInfo("Backup written to " + result.value.backup_path);
    utils::terminal::printSuccess("Loaded " + std::to_string(result.value.prompt_count) + " prompts.");
    return 0;
}

int CLI::handleBackupCommand() {
    auto result = gate_->backupNow(secret());
    if (!result.isSuccess()) {
        return reportError(result.kind, "Backup failed: " + result.error);
    }
    utils::terminal::printSuccess("Backup written to " + result.value);
    return 0;
}

int CLI::handleResetCommand(const CommandArgs& args) {
    if (!confirm("Reset the catalog to its defaults? A backup is written first.", args.has("yes"))) {
        utils::terminal::printInfo("Cancelled.");
        return 0;
    }
    auto result = gate_->resetAll(secret());
    if (!result.isSuccess()) {
        return reportError(result.kind, "Reset failed: " + result.error);
    }
    utils::terminal::printInfo("Backup written to " + result.value.backup_path);
    utils::terminal::printSuccess("Catalog reset to defaults.");
    return 0;
}

int CLI::handleMigrateCommand(const CommandArgs& args) {
    if (args.positional.size() != 1 || args.get("from").empty()) {
        return reportError(ErrorKind::InvalidInput, "Usage: migrate --from json|unified-file PATH [--to BACKEND]");
    }
    auto kind = migration::parseSourceKind(args.get("from"));
    if (!kind.isSuccess()) {
        return reportError(kind.kind, kind.error);
    }
    std::string target = args.get("to", store_->getBackend());
    if (target != store_->getBackend()) {
        return reportError(ErrorKind::InvalidInput, "The open catalog uses " + store_->getBackend() +
                           "; run 'config set backend " + target + "' first");
    }
    std::string source_path = utils::expandHome(args.positional[0]);
    if (kind.value == migration::SourceKind::JsonDirectory && target == "json" &&
        source_path == store_->getLocation()) {
        return reportError(ErrorKind::InvalidInput, "Source and target are the same catalog");
    }

    auto source = migration::readSource(kind.value, source_path);
    if (!source.isSuccess()) {
        return reportError(source.kind, source.error);
    }
    if (!gate_->verifySecret(secret())) {
        return reportError(ErrorKind::Unauthorized, "Invalid admin secret");
    }
    if (!confirm("Replace the " + target + " catalog with " + std::to_string(source.value.prompts.size()) +
                 " prompts from " + source_path + "? A backup is written first.", args.has("yes"))) {
        utils::terminal::printInfo("Cancelled.");
        return 0;
    }

    auto result = gate_->migrate(secret(), source.value);
    if (!result.isSuccess()) {
        return reportError(result.kind, "Migration failed: " + result.error);
    }
    utils::terminal::printInfo("Backup written to " + result.value.backup_path);
    utils::terminal::printSuccess("Migrated " + std::to_string(result.value.prompt_count) + " prompts into " +
                                  store_->getLocation());
    return 0;
}

int CLI::handlePasswdCommand(const CommandArgs& args) {
    if (!gate_->verifySecret(secret())) {
        return reportError(ErrorKind::Unauthorized, "Current admin secret is wrong");
    }

    std::string password;
    if (!args.positional.empty()) {
        password = args.positional[0];
    } else {
        password = readHidden("New password: ");
        if (readHidden("Repeat password: ") != password) {
            return reportError(ErrorKind::InvalidInput, "Passwords do not match");
        }
    }
    if (password.empty()) {
        return reportError(ErrorKind::InvalidInput, "Password cannot be empty");
    }

    config_->setAdminPassword(password);
    gate_ = std::make_unique<MutationGate>(*store_, *integrity_, *backups_, config_->getAdminSecretHash());
    secret_ = password;
    utils::terminal::printSuccess("Admin password changed.");
    return 0;
}

int CLI::handleConfigCommand(const CommandArgs& args) {
    if (args.positional.empty()) {
        printConfig();
        return 0;
    }
    if (args.positional[0] != "set" || args.positional.size() != 3) {
        return reportError(ErrorKind::InvalidInput, "Usage: config [set KEY VALUE]");
    }
    if (!gate_->verifySecret(secret())) {
        return reportError(ErrorKind::Unauthorized, "Invalid admin secret");
    }

    const std::string& key = args.positional[1];
    const std::string& value = args.positional[2];

    if (key == "backend") {
        if (value != "json" && value != "sqlite") {
            return reportError(ErrorKind::InvalidInput, "Backend must be json or sqlite");
        }
        config_->setStorageBackend(value);
    } else if (key == "data-dir") {
        config_->setDataDir(value);
    } else if (key == "backup-dir") {
        config_->setBackupDir(value);
    } else if (key == "max-depth" || key == "page-size") {
        int number = 0;
        try {
            number = std::stoi(value);
        } catch (const std::exception&) {
            return reportError(ErrorKind::InvalidInput, key + " must be a number");
        }
        if (key == "max-depth") {
            Result<CatalogState> current = store_->snapshot();
            if (!current.isSuccess()) {
                return reportError(current.kind, "Failed to read categories: " + current.error);
            }
            Status allowed = IntegrityManager::checkDepthLimit(current.value, number);
            if (!allowed.isSuccess()) {
                return reportError(allowed.kind, allowed.error);
            }
            config_->setMaxCategoryDepth(number);
        } else {
            config_->setPageSize(number);
        }
    } else if (key == "debug") {
        if (value != "true" && value != "false") {
            return reportError(ErrorKind::InvalidInput, "debug must be true or false");
        }
        config_->setDebug(value == "true");
    } else {
        return reportError(ErrorKind::InvalidInput,
                           "Unknown key: " + key + " (backend, data-dir, backup-dir, max-depth, page-size, debug)");
    }

    utils::terminal::printSuccess("Set " + key + " = " + value);
    if (key != "debug" && key != "page-size") {
        utils::terminal::printWarning("Takes effect the next time the catalog is opened.");
    }
    return 0;
}

// ============================================================================
// Interactive Mode
// ============================================================================

void CLI::interactiveMode() {
    std::cout << utils::terminal::CYAN << utils::terminal::BOLD << config_->getAppName() << utils::terminal::RESET;
    std::cout << utils::terminal::BLUE << " - " << VERSION_STRING << utils::terminal::RESET << "\n";
    std::cout << utils::terminal::YELLOW << "Type 'help' for commands, 'exit' to quit" << utils::terminal::RESET << "\n\n";

#ifdef HAVE_READLINE
    std::string history_path = Config::getHistoryPath();
    read_history(history_path.c_str());
#endif

    while (true) {
        std::string input;

#ifdef HAVE_READLINE
        char* line = readline("prompthub> ");
        if (!line) {
            std::cout << "\n";
            break;
        }
        input = line;
        free(line);
        if (!utils::trim(input).empty()) {
            add_history(input.c_str());
        }
#else
        std::cout << utils::terminal::BOLD << utils::terminal::CYAN << "prompthub> " << utils::terminal::RESET;
        std::cout.flush();
        if (!std::getline(std::cin, input)) {
            std::cout << "\n";
            break;
        }
#endif

        input = utils::trim(input);
        if (input.empty()) continue;

        if (input == "exit" || input == "quit" || input == "/exit" || input == "/quit") {
            std::cout << utils::terminal::GREEN << "Goodbye!" << utils::terminal::RESET << "\n";
            break;
        }
        if (input == "clear" || input == "/clear") {
            std::cout << "\033[2J\033[H";
            continue;
        }

        std::vector<std::string> words = tokenize(input);
        if (!words.empty() && (words[0] == "shell" || words[0] == "/shell")) {
            continue;
        }
        executeCommand(words);
    }

#ifdef HAVE_READLINE
    write_history(history_path.c_str());
#endif
}

int CLI::run() {
    config_ = std::make_unique<Config>();
    if (!config_->initialize(config_path_)) {
        utils::terminal::printError("Failed to load configuration");
        return exitCodeFor(ErrorKind::StorageFailure);
    }
    config_->applyOverrides(backend_override_, data_dir_override_, debug_override_);

    if (!openCatalog()) {
        return exitCodeFor(ErrorKind::StorageFailure);
    }

    // Interactive mode unless a single command was given
    if (command_.empty() || command_[0] == "shell") {
        interactiveMode();
        return 0;
    }
    return executeCommand(command_);
}

} // namespace prompthub
