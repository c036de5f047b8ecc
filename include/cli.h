#ifndef PROMPTHUB_CLI_H
#define PROMPTHUB_CLI_H

#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include "config.h"
#include "errors.h"
#include "entity_store.h"
#include "integrity_manager.h"
#include "backup_manager.h"
#include "mutation_gate.h"
#include "query_engine.h"

namespace prompthub {

// Positional arguments and --options of one command line
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::vector<std::string>> options;
    std::set<std::string> flags;

    bool has(const std::string& name) const;
    std::string get(const std::string& name, const std::string& fallback = "") const;
    std::vector<std::string> getAll(const std::string& name) const;
    int getInt(const std::string& name, int fallback) const;
};

class CLI {
public:
    CLI();
    ~CLI();

    // Parse command line arguments
    bool parseArgs(int argc, char* argv[]);

    // Run the application
    int run();

    // Exit status when parseArgs returned false
    int getExitCode() const { return exit_code_; }

    // Splits a shell line into words, honoring single and double quotes
    static std::vector<std::string> tokenize(const std::string& line);
    static CommandArgs parseCommandArgs(const std::vector<std::string>& args, size_t start);

private:
    bool openCatalog();
    int executeCommand(const std::vector<std::string>& args);
    void interactiveMode();

    // Command handlers
    int handleSearchCommand(const CommandArgs& args, bool list_all);
    int handleShowCommand(const CommandArgs& args);
    int handleAddCommand(const CommandArgs& args);
    int handleEditCommand(const CommandArgs& args);
    int handleDeleteCommand(const CommandArgs& args);
    int handleUseCommand(const CommandArgs& args);
    int handleVersionsCommand(const CommandArgs& args);
    int handleRollbackCommand(const CommandArgs& args);
    int handleCategoryCommand(const CommandArgs& args);
    int handleTagCommand(const CommandArgs& args);
    int handleStatsCommand();
    int handleCheckCommand();
    int handleExportCommand(const CommandArgs& args, bool csv);
    int handleImportCommand(const CommandArgs& args);
    int handleLoadTestDataCommand(const CommandArgs& args);
    int handleBackupCommand();
    int handleResetCommand(const CommandArgs& args);
    int handleMigrateCommand(const CommandArgs& args);
    int handlePasswdCommand(const CommandArgs& args);
    int handleConfigCommand(const CommandArgs& args);

    // UI helpers
    void printHelp();
    void printConfig();
    void printPromptRow(const Prompt& p);
    void printPromptDetail(const Prompt& p);
    void printCategoryNode(const CategoryNode& node, int depth);
    int reportError(ErrorKind kind, const std::string& message);
    bool confirm(const std::string& question, bool assume_yes);
    std::string secret();
    std::string readHidden(const std::string& label);
    SearchQuery buildQuery(const CommandArgs& args) const;

    static int exitCodeFor(ErrorKind kind);

    std::unique_ptr<Config> config_;
    std::unique_ptr<EntityStore> store_;
    std::unique_ptr<IntegrityManager> integrity_;
    std::unique_ptr<BackupManager> backups_;
    std::unique_ptr<MutationGate> gate_;
    std::unique_ptr<QueryEngine> query_;

    // Command line overrides
    std::string config_path_;
    std::string secret_;
    std::string backend_override_;
    std::string data_dir_override_;
    bool debug_override_;
    bool assume_yes_;
    int exit_code_;
    std::vector<std::string> command_;
};

} // namespace prompthub

#endif // PROMPTHUB_CLI_H
