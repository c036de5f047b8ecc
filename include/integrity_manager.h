#ifndef PROMPTHUB_INTEGRITY_MANAGER_H
#define PROMPTHUB_INTEGRITY_MANAGER_H

#include "errors.h"
#include "models.h"
#include "entity_store.h"
#include <string>
#include <vector>
#include <set>
#include <optional>

namespace prompthub {

// ============================================================================
// Mutation payloads
// ============================================================================

struct PromptInput {
    std::string id;            // generated when empty
    std::string title;
    std::string content;
    std::string description;
    std::string category_id;   // fallback when empty or unknown
    std::vector<std::string> tags;
};

// Absent fields are left untouched
struct PromptPatch {
    std::optional<std::string> title;
    std::optional<std::string> content;
    std::optional<std::string> description;
    std::optional<std::string> category_id;
    std::optional<std::vector<std::string>> tags;
    std::string change_note;
    bool major = false;        // bump "M.m" to "(M+1).0" instead of "M.(m+1)"
};

struct CategoryInput {
    std::string name;
    std::string color;
    std::string description;
    std::string parent_id;
};

struct CategoryPatch {
    std::optional<std::string> name;
    std::optional<std::string> color;
    std::optional<std::string> description;
    std::optional<std::string> parent_id;   // "" promotes to root
};

struct TagInput {
    std::string name;
    std::string color;
};

struct TagPatch {
    std::optional<std::string> name;
    std::optional<std::string> color;
};

// ============================================================================
// Mutation outcomes
// ============================================================================

struct CategoryDeletion {
    Category category;
    int reassigned_prompts = 0;
    int reparented_children = 0;
};

// What deleting a category would touch
struct CategoryImpact {
    Category category;
    std::vector<std::string> child_names;
    // Children whose names are already taken one level up; deletion is refused
    std::vector<std::string> colliding_children;
    int prompt_count = 0;
};

struct TagChange {
    Tag tag;
    int affected_prompts = 0;
};

struct ImportSummary {
    int created = 0;
    int updated = 0;
    int skipped = 0;
    std::vector<std::string> messages;
};

struct IntegrityOptions {
    int max_category_depth = 5;
};

// Keeps categories, tags, prompts and the version ledger of one CatalogState
// mutually consistent. Every mutation works on the in-memory state and flags
// the collections it rewrote; nothing here touches storage.
class IntegrityManager {
public:
    explicit IntegrityManager(const IntegrityOptions& options = IntegrityOptions());

    static std::vector<Category> defaultCategories();

    // Seeds the default categories into an empty tree and restores a missing fallback
    void ensureDefaults(CatalogState& state, ChangeSet& changes) const;

    // Prompts
    Result<Prompt> createPrompt(CatalogState& state, ChangeSet& changes, const PromptInput& input) const;
    Result<Prompt> updatePrompt(CatalogState& state, ChangeSet& changes, const std::string& id, const PromptPatch& patch) const;
    Result<Prompt> deletePrompt(CatalogState& state, ChangeSet& changes, const std::string& id) const;
    Result<Prompt> usePrompt(CatalogState& state, ChangeSet& changes, const std::string& id) const;
    Result<Prompt> rollbackPrompt(CatalogState& state, ChangeSet& changes, const std::string& id, const std::string& label) const;

    // Categories
    Result<Category> createCategory(CatalogState& state, ChangeSet& changes, const CategoryInput& input) const;
    Result<Category> updateCategory(CatalogState& state, ChangeSet& changes, const std::string& id, const CategoryPatch& patch) const;
    Result<CategoryDeletion> deleteCategory(CatalogState& state, ChangeSet& changes, const std::string& id) const;
    static Result<CategoryImpact> previewCategoryDeletion(const CatalogState& state, const std::string& id);

    // Tags
    Result<Tag> createTag(CatalogState& state, ChangeSet& changes, const TagInput& input) const;
    Result<TagChange> updateTag(CatalogState& state, ChangeSet& changes, const std::string& id, const TagPatch& patch) const;
    Result<TagChange> deleteTag(CatalogState& state, ChangeSet& changes, const std::string& id) const;

    // Bulk
    Result<ImportSummary> importPrompts(CatalogState& state, ChangeSet& changes, const std::vector<Prompt>& records) const;
    Result<ImportSummary> replacePrompts(CatalogState& state, ChangeSet& changes, const std::vector<Prompt>& records) const;
    void resetState(CatalogState& state, ChangeSet& changes) const;

    // Every invariant violation found in state; empty when consistent
    std::vector<std::string> verify(const CatalogState& state) const;

    // Whether max_depth can be configured without orphaning the deepest existing category
    static Status checkDepthLimit(const CatalogState& state, int max_depth);

    // Tree helpers
    static std::set<std::string> descendantIds(const std::vector<Category>& categories, const std::string& id);
    static Status recomputeCategoryPaths(std::vector<Category>& categories);

    int getMaxCategoryDepth() const { return options_.max_category_depth; }

private:
    IntegrityOptions options_;

    Result<Prompt> createPromptImpl(CatalogState& state, ChangeSet& changes, const PromptInput& input) const;
    Result<Prompt> updatePromptImpl(CatalogState& state, ChangeSet& changes, const std::string& id,
                                    const PromptPatch& patch) const;
    Result<std::vector<std::string>> normalizeTags(CatalogState& state, ChangeSet& changes,
                                                   const std::vector<std::string>& names) const;
    const Category& resolveCategory(const CatalogState& state, const std::string& id) const;
    int syncPromptCategories(CatalogState& state, ChangeSet& changes) const;
    int subtreeHeight(const std::vector<Category>& categories, const std::string& id) const;
    Status validatePromptFields(const std::string& title, const std::string& content,
                                const std::string& description) const;
    Status validateCategoryName(const CatalogState& state, const std::string& name,
                                const std::string& parent_id, const std::string& self_id) const;
    static Status validateTagName(const std::string& name);
};

} // namespace prompthub

#endif // PROMPTHUB_INTEGRITY_MANAGER_H
