#include "mutation_gate.h"
#include "version_ledger.h"
#include "utils.h"
#include <iostream>

namespace prompthub {

MutationGate::MutationGate(EntityStore& store, const IntegrityManager& integrity,
                           const BackupManager& backups, const std::string& secret_sha256)
    : store_(store)
    , integrity_(integrity)
    , backups_(backups)
    , secret_hash_(utils::toLower(utils::trim(secret_sha256)))
{
    if (secret_hash_.empty()) {
        std::cerr << "No admin secret configured; all mutations will be refused" << std::endl;
    }
}

bool MutationGate::verifySecret(const std::string& secret) const {
    if (secret_hash_.empty()) return false;
    return utils::constantTimeEquals(utils::sha256Hex(secret), secret_hash_);
}

template <typename T>
Result<T> MutationGate::run(const std::string* secret, const Operation<T>& op, bool rewrites_ledger) {
    if (secret && !verifySecret(*secret)) {
        return Result<T>::fail(ErrorKind::Unauthorized, "Invalid admin secret");
    }

    Result<T> outcome;
    Status st = store_.transact([&](CatalogState& state, ChangeSet& changes) -> Status {
        std::vector<PromptVersion> before;
        if (!rewrites_ledger) before = state.versions;

        outcome = op(state, changes);
        if (!outcome.isSuccess()) return outcome.status();

        if (!rewrites_ledger && !VersionLedger::extends(before, state.versions)) {
            return Status::fail(ErrorKind::ConsistencyViolation, "Version history was rewritten");
        }

        std::vector<std::string> violations = integrity_.verify(state);
        if (!violations.empty()) {
            for (const auto& v : violations) {
                std::cerr << "Consistency violation: " << v << std::endl;
            }
            std::string message = violations.front();
            if (violations.size() > 1) {
                message += " (and " + std::to_string(violations.size() - 1) + " more)";
            }
            return Status::fail(ErrorKind::ConsistencyViolation, message);
        }
        return Status::ok();
    });

    if (!st.isSuccess()) return Result<T>::fail(st);
    return outcome;
}

Status MutationGate::takeBackup(const CatalogState& state, const std::string& reason, std::string& path) const {
    Result<std::string> backup = backups_.write(state, reason, store_.getBackend());
    if (!backup.isSuccess()) {
        return Status::fail(ErrorKind::StorageFailure, "Backup failed, " + reason + " aborted: " + backup.error);
    }
    path = backup.value;
    return Status::ok();
}

Result<std::vector<std::string>> MutationGate::initialize() {
    std::vector<std::string> remaining;
    Status st = store_.transact([&](CatalogState& state, ChangeSet& changes) -> Status {
        std::vector<PromptVersion> before = state.versions;
        integrity_.ensureDefaults(state, changes);
        if (!VersionLedger::extends(before, state.versions)) {
            return Status::fail(ErrorKind::ConsistencyViolation, "Version history was rewritten");
        }
        // Repairs are committed even when other problems remain
        remaining = integrity_.verify(state);
        return Status::ok();
    });
    if (!st.isSuccess()) return Result<std::vector<std::string>>::fail(st);

    for (const auto& v : remaining) {
        utils::debugLog("Unresolved after repair: " + v);
    }
    return Result<std::vector<std::string>>::ok(remaining);
}

// ============================================================================
// Prompts
// ============================================================================

Result<Prompt> MutationGate::createPrompt(const std::string& secret, const PromptInput& input) {
    return run<Prompt>(&secret, [&](CatalogState& state, ChangeSet& changes) {
        return integrity_.createPrompt(state, changes, input);
    });
}

Result<Prompt> MutationGate::updatePrompt(const std::string& secret, const std::string& id, const PromptPatch& patch) {
    return run<Prompt>(&secret, [&](CatalogState& state, ChangeSet& changes) {
        return integrity_.updatePrompt(state, changes, id, patch);
    });
}

Result<Prompt> MutationGate::deletePrompt(const std::string& secret, const std::string& id) {
    return run<Prompt>(&secret, [&](CatalogState& state, ChangeSet& changes) {
        return integrity_.deletePrompt(state, changes, id);
    });
}

Result<Prompt> MutationGate::rollbackPrompt(const std::string& secret, const std::string& id, const std::string& label) {
    return run<Prompt>(&secret, [&](CatalogState& state, ChangeSet& changes) {
        return integrity_.rollbackPrompt(state, changes, id, label);
    });
}

Result<Prompt> MutationGate::usePrompt(const std::string& id) {
    return run<Prompt>(nullptr, [&](CatalogState& state, ChangeSet& changes) {
        return integrity_.usePrompt(state, changes, id);
    });
}

// ============================================================================
// Categories
// ============================================================================

Result<Category> MutationGate::createCategory(const std::string& secret, const CategoryInput& input) {
    return run<Category>(&secret, [&](CatalogState& state, ChangeSet& changes) {
        return integrity_.createCategory(state, changes, input);
    });
}

Result<Category> MutationGate::updateCategory(const std::string& secret, const std::string& id, const CategoryPatch& patch) {
    return run<Category>(&secret, [&](CatalogState& state, ChangeSet& changes) {
        return integrity_.updateCategory(state, changes, id, patch);
    });
}

Result<CategoryDeletion> MutationGate::deleteCategory(const std::string& secret, const std::string& id) {
    return run<CategoryDeletion>(&secret, [&](CatalogState& state, ChangeSet& changes) {
        return integrity_.deleteCategory(state, changes, id);
    });
}

// ============================================================================
// Tags
// ============================================================================

Result<Tag> MutationGate::createTag(const std::string& secret, const TagInput& input) {
    return run<Tag>(&secret, [&](CatalogState& state, ChangeSet& changes) {
        return integrity_.createTag(state, changes, input);
    });
}

Result<TagChange> MutationGate::updateTag(const std::string& secret, const std::string& id, const TagPatch& patch) {
    return run<TagChange>(&secret, [&](CatalogState& state, ChangeSet& changes) {
        return integrity_.updateTag(state, changes, id, patch);
    });
}

Result<TagChange> MutationGate::deleteTag(const std::string& secret, const std::string& id) {
    return run<TagChange>(&secret, [&](CatalogState& state, ChangeSet& changes) {
        return integrity_.deleteTag(state, changes, id);
    });
}

// ============================================================================
// Bulk
// ============================================================================

Result<ImportSummary> MutationGate::importPrompts(const std::string& secret, const std::vector<Prompt>& records) {
    return run<ImportSummary>(&secret, [&](CatalogState& state, ChangeSet& changes) {
        return integrity_.importPrompts(state, changes, records);
    });
}

Result<BulkOutcome> MutationGate::loadTestData(const std::string& secret, const std::vector<Prompt>& records) {
    return run<BulkOutcome>(&secret, [&](CatalogState& state, ChangeSet& changes) {
        BulkOutcome outcome;
        Status st = takeBackup(state, "load-test-data", outcome.backup_path);
        if (!st.isSuccess()) return Result<BulkOutcome>::fail(st);

        Result<ImportSummary> summary = integrity_.replacePrompts(state, changes, records);
        if (!summary.isSuccess()) return Result<BulkOutcome>::fail(summary.status());

        outcome.summary = summary.value;
        outcome.prompt_count = static_cast<int>(state.prompts.size());
        return Result<BulkOutcome>::ok(outcome);
    }, true);
}

Result<BulkOutcome> MutationGate::resetAll(const std::string& secret) {
    return run<BulkOutcome>(&secret, [&](CatalogState& state, ChangeSet& changes) {
        BulkOutcome outcome;
        Status st = takeBackup(state, "reset", outcome.backup_path);
        if (!st.isSuccess()) return Result<BulkOutcome>::fail(st);

        outcome.prompt_count = static_cast<int>(state.prompts.size());
        integrity_.resetState(state, changes);
        return Result<BulkOutcome>::ok(outcome);
    }, true);
}

Result<BulkOutcome> MutationGate::migrate(const std::string& secret, const CatalogState& source) {
    return run<BulkOutcome>(&secret, [&](CatalogState& state, ChangeSet& changes) {
        BulkOutcome outcome;
        Status st = takeBackup(state, "migration", outcome.backup_path);
        if (!st.isSuccess()) return Result<BulkOutcome>::fail(st);

        // The copy goes through the same repair as a freshly opened catalog
        state = source;
        changes.mark(EntityKind::Categories);
        changes.mark(EntityKind::Tags);
        changes.mark(EntityKind::Prompts);
        changes.mark(EntityKind::Versions);
        integrity_.ensureDefaults(state, changes);

        outcome.prompt_count = static_cast<int>(state.prompts.size());
        outcome.summary.created = outcome.prompt_count;
        return Result<BulkOutcome>::ok(outcome);
    }, true);
}

Result<std::string> MutationGate::backupNow(const std::string& secret) {
    return run<std::string>(&secret, [&](CatalogState& state, ChangeSet&) {
        std::string path;
        Status st = takeBackup(state, "manual", path);
        if (!st.isSuccess()) return Result<std::string>::fail(st);
        return Result<std::string>::ok(path);
    });
}

} // namespace prompthub
