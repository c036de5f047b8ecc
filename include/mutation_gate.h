#ifndef PROMPTHUB_MUTATION_GATE_H
#define PROMPTHUB_MUTATION_GATE_H

#include "errors.h"
#include "models.h"
#include "entity_store.h"
#include "integrity_manager.h"
#include "backup_manager.h"
#include <string>
#include <vector>
#include <functional>

namespace prompthub {

// Result of a destructive bulk operation; backup_path is always set on success
struct BulkOutcome {
    std::string backup_path;
    int prompt_count = 0;
    ImportSummary summary;
};

// Single entry point for writes. Checks the admin secret before touching
// storage, runs each request as one EntityStore transaction, verifies the
// resulting state, and backs up before destructive bulk operations.
class MutationGate {
public:
    MutationGate(EntityStore& store, const IntegrityManager& integrity,
                 const BackupManager& backups, const std::string& secret_sha256);

    // Seeds default categories and repairs caches of data written by older
    // versions. Returns what the repair could not fix; the catalog stays
    // readable, while gated writes fail until it is resolved.
    Result<std::vector<std::string>> initialize();

    bool verifySecret(const std::string& secret) const;

    // Prompts
    Result<Prompt> createPrompt(const std::string& secret, const PromptInput& input);
    Result<Prompt> updatePrompt(const std::string& secret, const std::string& id, const PromptPatch& patch);
    Result<Prompt> deletePrompt(const std::string& secret, const std::string& id);
    Result<Prompt> rollbackPrompt(const std::string& secret, const std::string& id, const std::string& label);
    Result<Prompt> usePrompt(const std::string& id);   // not gated

    // Categories
    Result<Category> createCategory(const std::string& secret, const CategoryInput& input);
    Result<Category> updateCategory(const std::string& secret, const std::string& id, const CategoryPatch& patch);
    Result<CategoryDeletion> deleteCategory(const std::string& secret, const std::string& id);

    // Tags
    Result<Tag> createTag(const std::string& secret, const TagInput& input);
    Result<TagChange> updateTag(const std::string& secret, const std::string& id, const TagPatch& patch);
    Result<TagChange> deleteTag(const std::string& secret, const std::string& id);

    // Bulk
    Result<ImportSummary> importPrompts(const std::string& secret, const std::vector<Prompt>& records);
    Result<BulkOutcome> loadTestData(const std::string& secret, const std::vector<Prompt>& records);
    Result<BulkOutcome> resetAll(const std::string& secret);
    // Replaces the whole catalog with one read from another storage variant
    Result<BulkOutcome> migrate(const std::string& secret, const CatalogState& source);
    Result<std::string> backupNow(const std::string& secret);

private:
    EntityStore& store_;
    const IntegrityManager& integrity_;
    const BackupManager& backups_;
    std::string secret_hash_;

    template <typename T>
    using Operation = std::function<Result<T>(CatalogState&, ChangeSet&)>;

    // rewrites_ledger: the operation may drop ledger entries (reset, test data)
    template <typename T>
    Result<T> run(const std::string* secret, const Operation<T>& op, bool rewrites_ledger = false);

    Status takeBackup(const CatalogState& state, const std::string& reason, std::string& path) const;
};

} // namespace prompthub

#endif // PROMPTHUB_MUTATION_GATE_H
