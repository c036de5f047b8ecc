#include "integrity_manager.h"
#include "version_ledger.h"
#include "utils.h"
#include <algorithm>
#include <map>
#include <deque>

namespace prompthub {

namespace {

const size_t MAX_TITLE_LENGTH = 200;
const size_t MAX_DESCRIPTION_LENGTH = 500;
const size_t MAX_CATEGORY_NAME_LENGTH = 50;
const size_t MAX_TAG_NAME_LENGTH = 30;

const char* INITIAL_VERSION_NOTE = "Initial version";
const char* IMPORT_VERSION_NOTE = "Imported";

} // namespace

IntegrityManager::IntegrityManager(const IntegrityOptions& options)
    : options_(options)
{
    if (options_.max_category_depth < 1) options_.max_category_depth = 1;
}

std::vector<Category> IntegrityManager::defaultCategories() {
    struct Seed { const char* id; const char* name; const char* color; const char* description; };
    static const Seed seeds[] = {
        {"1", "编程", "#3B82F6", "编程相关提示词"},
        {"2", "写作", "#10B981", "写作相关提示词"},
        {"3", "分析", "#F59E0B", "分析相关提示词"},
        {"4", "创意", "#8B5CF6", "创意相关提示词"},
        {"5", "商业", "#EF4444", "商业相关提示词"},
        {"6", "教育", "#06B6D4", "教育相关提示词"},
        {"7", "其他", "#6B7280", "其他类型提示词"},
    };

    std::string now = utils::getCurrentTimestamp();
    std::vector<Category> categories;
    for (const auto& seed : seeds) {
        Category c;
        c.id = seed.id;
        c.name = seed.name;
        c.color = seed.color;
        c.description = seed.description;
        c.level = 1;
        c.path = seed.name;
        c.created_at = now;
        c.updated_at = now;
        categories.push_back(c);
    }
    return categories;
}

// ============================================================================
// Tree helpers
// ============================================================================

std::set<std::string> IntegrityManager::descendantIds(const std::vector<Category>& categories, const std::string& id) {
    std::multimap<std::string, std::string> children;
    for (const auto& c : categories) {
        if (!c.parent_id.empty()) children.emplace(c.parent_id, c.id);
    }

    std::set<std::string> result;
    std::deque<std::string> queue = {id};
    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();
        auto range = children.equal_range(current);
        for (auto it = range.first; it != range.second; ++it) {
            if (it->second == id || !result.insert(it->second).second) continue;
            queue.push_back(it->second);
        }
    }
    return result;
}

Status IntegrityManager::recomputeCategoryPaths(std::vector<Category>& categories) {
    std::map<std::string, size_t> index;
    for (size_t i = 0; i < categories.size(); i++) {
        index[categories[i].id] = i;
    }

    std::vector<int> levels(categories.size());
    std::vector<std::string> paths(categories.size());

    for (size_t i = 0; i < categories.size(); i++) {
        std::vector<std::string> names;
        size_t current = i;
        // A chain longer than the arena means a cycle
        for (size_t steps = 0; ; steps++) {
            if (steps > categories.size()) {
                return Status::fail(ErrorKind::InvalidInput,
                                    "Category '" + categories[i].name + "' is part of a parent cycle");
            }
            names.push_back(categories[current].name);
            const std::string& parent = categories[current].parent_id;
            if (parent.empty()) break;
            auto it = index.find(parent);
            if (it == index.end()) {
                return Status::fail(ErrorKind::ConsistencyViolation,
                                    "Category '" + categories[current].name + "' has unknown parent " + parent);
            }
            current = it->second;
        }
        std::reverse(names.begin(), names.end());
        levels[i] = static_cast<int>(names.size());
        paths[i] = utils::join(names, "/");
    }

    for (size_t i = 0; i < categories.size(); i++) {
        categories[i].level = levels[i];
        categories[i].path = paths[i];
    }
    return Status::ok();
}

int IntegrityManager::subtreeHeight(const std::vector<Category>& categories, const std::string& id) const {
    const Category* root = nullptr;
    for (const auto& c : categories) {
        if (c.id == id) root = &c;
    }
    if (!root) return 0;

    int deepest = root->level;
    std::set<std::string> below = descendantIds(categories, id);
    for (const auto& c : categories) {
        if (below.count(c.id)) deepest = std::max(deepest, c.level);
    }
    return deepest - root->level + 1;
}

const Category& IntegrityManager::resolveCategory(const CatalogState& state, const std::string& id) const {
    if (!id.empty()) {
        const Category* c = state.findCategory(id);
        if (c) return *c;
    }
    return *state.findCategory(FALLBACK_CATEGORY_ID);
}

// Rewrites the cached category name/path on every prompt; unknown ids go to the fallback
int IntegrityManager::syncPromptCategories(CatalogState& state, ChangeSet& changes) const {
    int touched = 0;
    for (auto& p : state.prompts) {
        const Category& c = resolveCategory(state, p.category_id);
        if (p.category_id != c.id || p.category_name != c.name || p.category_path != c.path) {
            p.category_id = c.id;
            p.category_name = c.name;
            p.category_path = c.path;
            touched++;
        }
    }
    if (touched > 0) changes.mark(EntityKind::Prompts);
    return touched;
}

void IntegrityManager::ensureDefaults(CatalogState& state, ChangeSet& changes) const {
    std::string now = utils::getCurrentTimestamp();

    if (state.categories.empty()) {
        state.categories = defaultCategories();
        changes.mark(EntityKind::Categories);
    } else if (!state.findCategory(FALLBACK_CATEGORY_ID)) {
        Category fallback = defaultCategories().back();
        state.categories.push_back(fallback);
        changes.mark(EntityKind::Categories);
    }

    Category* fallback = state.findCategory(FALLBACK_CATEGORY_ID);
    if (!fallback->parent_id.empty()) {
        fallback->parent_id.clear();
        changes.mark(EntityKind::Categories);
    }

    // Detach categories whose parent chain dangles or loops
    for (auto& c : state.categories) {
        std::set<std::string> seen = {c.id};
        std::string parent = c.parent_id;
        while (!parent.empty()) {
            const Category* p = state.findCategory(parent);
            if (!p || parent == c.id) {
                utils::debugLog("Promoting category '" + c.name + "' to root");
                c.parent_id.clear();
                changes.mark(EntityKind::Categories);
                break;
            }
            // A loop further up is detached when its own members are visited
            if (!seen.insert(parent).second) break;
            parent = p->parent_id;
        }
    }

    std::vector<Category> recomputed = state.categories;
    if (recomputeCategoryPaths(recomputed).isSuccess() && !(recomputed == state.categories)) {
        state.categories = recomputed;
        changes.mark(EntityKind::Categories);
    }

    syncPromptCategories(state, changes);

    // Register tag names that prompts use but the tag collection lacks
    for (auto& p : state.prompts) {
        for (const auto& name : p.tags) {
            if (!state.findTagByName(name)) {
                Tag t;
                t.id = utils::generateId();
                t.name = name;
                t.created_at = now;
                t.updated_at = now;
                state.tags.push_back(t);
                changes.mark(EntityKind::Tags);
            }
        }
    }

    // Give prompts from older data files a ledger entry
    VersionLedger ledger(state.versions);
    for (auto& p : state.prompts) {
        if (!p.current_version.empty() && ledger.contains(p.id, p.current_version)) continue;
        Result<PromptVersion> last = ledger.latest(p.id);
        if (last.isSuccess()) {
            p.current_version = last.value.version;
        } else {
            Result<std::string> label = ledger.append(p, INITIAL_VERSION_NOTE);
            if (!label.isSuccess()) continue;
            p.current_version = label.value;
            changes.mark(EntityKind::Versions);
        }
        changes.mark(EntityKind::Prompts);
    }
}

// ============================================================================
// Validation
// ============================================================================

Status IntegrityManager::validatePromptFields(const std::string& title, const std::string& content,
                                              const std::string& description) const {
    if (utils::trim(title).empty()) {
        return Status::fail(ErrorKind::InvalidInput, "Prompt title is required");
    }
    if (utils::utf8Length(title) > MAX_TITLE_LENGTH) {
        return Status::fail(ErrorKind::InvalidInput,
                            "Prompt title exceeds " + std::to_string(MAX_TITLE_LENGTH) + " characters");
    }
    if (utils::trim(content).empty()) {
        return Status::fail(ErrorKind::InvalidInput, "Prompt '" + title + "' has no content");
    }
    if (utils::utf8Length(description) > MAX_DESCRIPTION_LENGTH) {
        return Status::fail(ErrorKind::InvalidInput,
                            "Description of '" + title + "' exceeds " + std::to_string(MAX_DESCRIPTION_LENGTH) + " characters");
    }
    return Status::ok();
}

Status IntegrityManager::validateCategoryName(const CatalogState& state, const std::string& name,
                                              const std::string& parent_id, const std::string& self_id) const {
    if (name.empty()) {
        return Status::fail(ErrorKind::InvalidInput, "Category name is required");
    }
    if (utils::utf8Length(name) > MAX_CATEGORY_NAME_LENGTH) {
        return Status::fail(ErrorKind::InvalidInput,
                            "Category name exceeds " + std::to_string(MAX_CATEGORY_NAME_LENGTH) + " characters");
    }
    if (name.find('/') != std::string::npos) {
        return Status::fail(ErrorKind::InvalidInput, "Category name '" + name + "' must not contain '/'");
    }
    for (const auto& c : state.categories) {
        if (c.id != self_id && c.parent_id == parent_id && c.name == name) {
            return Status::fail(ErrorKind::InvalidInput,
                                "Category '" + name + "' already exists at this level");
        }
    }
    return Status::ok();
}

Status IntegrityManager::validateTagName(const std::string& name) {
    if (name.empty()) {
        return Status::fail(ErrorKind::InvalidInput, "Tag name is required");
    }
    if (utils::utf8Length(name) > MAX_TAG_NAME_LENGTH) {
        return Status::fail(ErrorKind::InvalidInput,
                            "Tag '" + name + "' exceeds " + std::to_string(MAX_TAG_NAME_LENGTH) + " characters");
    }
    return Status::ok();
}

Result<std::vector<std::string>> IntegrityManager::normalizeTags(CatalogState& state, ChangeSet& changes,
                                                                 const std::vector<std::string>& names) const {
    std::vector<std::string> result;
    std::string now = utils::getCurrentTimestamp();

    for (const auto& raw : names) {
        std::string name = utils::trim(raw);
        if (name.empty()) continue;
        if (std::find(result.begin(), result.end(), name) != result.end()) continue;

        Status st = validateTagName(name);
        if (!st.isSuccess()) return Result<std::vector<std::string>>::fail(st);

        if (!state.findTagByName(name)) {
            Tag t;
            t.id = utils::generateId();
            t.name = name;
            t.created_at = now;
            t.updated_at = now;
            state.tags.push_back(t);
            changes.mark(EntityKind::Tags);
            utils::debugLog("Created tag '" + name + "'");
        }
        result.push_back(name);
    }
    return Result<std::vector<std::string>>::ok(result);
}

// ============================================================================
// Prompts
// ============================================================================

Result<Prompt> IntegrityManager::createPrompt(CatalogState& state, ChangeSet& changes, const PromptInput& input) const {
    ensureDefaults(state, changes);
    return createPromptImpl(state, changes, input);
}

Result<Prompt> IntegrityManager::createPromptImpl(CatalogState& state, ChangeSet& changes, const PromptInput& input) const {
    Status st = validatePromptFields(input.title, input.content, input.description);
    if (!st.isSuccess()) return Result<Prompt>::fail(st);

    std::string id = utils::trim(input.id);
    if (id.empty()) {
        id = utils::generateId();
    } else if (state.findPrompt(id)) {
        return Result<Prompt>::fail(ErrorKind::Conflict, "Prompt " + id + " already exists");
    }

    auto tags = normalizeTags(state, changes, input.tags);
    if (!tags.isSuccess()) return Result<Prompt>::fail(tags.status());

    const Category& category = resolveCategory(state, input.category_id);
    std::string now = utils::getCurrentTimestamp();

    Prompt p;
    p.id = id;
    p.title = utils::trim(input.title);
    p.content = input.content;
    p.description = input.description;
    p.category_id = category.id;
    p.category_name = category.name;
    p.category_path = category.path;
    p.tags = tags.value;
    p.usage_count = 0;
    p.created_at = now;
    p.updated_at = now;

    VersionLedger ledger(state.versions);
    Result<std::string> label = ledger.append(p, INITIAL_VERSION_NOTE);
    if (!label.isSuccess()) return Result<Prompt>::fail(label.status());
    p.current_version = label.value;

    state.prompts.push_back(p);
    changes.mark(EntityKind::Prompts);
    changes.mark(EntityKind::Versions);
    return Result<Prompt>::ok(p);
}

Result<Prompt> IntegrityManager::updatePrompt(CatalogState& state, ChangeSet& changes, const std::string& id,
                                              const PromptPatch& patch) const {
    if (!state.findPrompt(id)) {
        return Result<Prompt>::fail(ErrorKind::NotFound, "Prompt " + id + " not found");
    }
    ensureDefaults(state, changes);
    return updatePromptImpl(state, changes, id, patch);
}

Result<Prompt> IntegrityManager::updatePromptImpl(CatalogState& state, ChangeSet& changes, const std::string& id,
                                                  const PromptPatch& patch) const {
    Prompt updated = *state.findPrompt(id);
    if (patch.title) updated.title = utils::trim(*patch.title);
    if (patch.content) updated.content = *patch.content;
    if (patch.description) updated.description = *patch.description;

    Status st = validatePromptFields(updated.title, updated.content, updated.description);
    if (!st.isSuccess()) return Result<Prompt>::fail(st);

    if (patch.tags) {
        auto tags = normalizeTags(state, changes, *patch.tags);
        if (!tags.isSuccess()) return Result<Prompt>::fail(tags.status());
        updated.tags = tags.value;
    }
    if (patch.category_id) {
        const Category& category = resolveCategory(state, utils::trim(*patch.category_id));
        updated.category_id = category.id;
        updated.category_name = category.name;
        updated.category_path = category.path;
    }

    Prompt& current = *state.findPrompt(id);
    bool content_changed = updated.title != current.title ||
                           updated.content != current.content ||
                           updated.description != current.description;
    bool meta_changed = updated.category_id != current.category_id || updated.tags != current.tags;

    if (!content_changed && !meta_changed) {
        return Result<Prompt>::ok(current);
    }

    updated.updated_at = utils::getCurrentTimestamp();

    if (content_changed) {
        VersionLedger ledger(state.versions);
        std::string note = patch.change_note.empty() ? "Updated" : patch.change_note;
        Result<std::string> label = ledger.append(updated, note, patch.major);
        if (!label.isSuccess()) return Result<Prompt>::fail(label.status());
        updated.current_version = label.value;
        changes.mark(EntityKind::Versions);
    }

    current = updated;
    changes.mark(EntityKind::Prompts);
    return Result<Prompt>::ok(updated);
}

Result<Prompt> IntegrityManager::deletePrompt(CatalogState& state, ChangeSet& changes, const std::string& id) const {
    auto it = std::find_if(state.prompts.begin(), state.prompts.end(),
                           [&id](const Prompt& p) { return p.id == id; });
    if (it == state.prompts.end()) {
        return Result<Prompt>::fail(ErrorKind::NotFound, "Prompt " + id + " not found");
    }

    // Ledger entries stay behind for audit
    Prompt removed = *it;
    state.prompts.erase(it);
    changes.mark(EntityKind::Prompts);
    return Result<Prompt>::ok(removed);
}

Result<Prompt> IntegrityManager::usePrompt(CatalogState& state, ChangeSet& changes, const std::string& id) const {
    Prompt* p = state.findPrompt(id);
    if (!p) {
        return Result<Prompt>::fail(ErrorKind::NotFound, "Prompt " + id + " not found");
    }
    p->usage_count++;
    changes.mark(EntityKind::Prompts);
    return Result<Prompt>::ok(*p);
}

Result<Prompt> IntegrityManager::rollbackPrompt(CatalogState& state, ChangeSet& changes, const std::string& id,
                                                const std::string& label) const {
    Prompt* p = state.findPrompt(id);
    if (!p) {
        return Result<Prompt>::fail(ErrorKind::NotFound, "Prompt " + id + " not found");
    }

    VersionLedger ledger(state.versions);
    Result<PromptVersion> version = ledger.get(id, label);
    if (!version.isSuccess()) return Result<Prompt>::fail(version.status());

    const PromptVersion& v = version.value;
    if (p->current_version == v.version && p->title == v.title &&
        p->content == v.content && p->description == v.description) {
        return Result<Prompt>::ok(*p);
    }

    p->title = v.title;
    p->content = v.content;
    p->description = v.description;
    p->current_version = v.version;
    p->updated_at = utils::getCurrentTimestamp();
    changes.mark(EntityKind::Prompts);
    return Result<Prompt>::ok(*p);
}

// ============================================================================
// Categories
// ============================================================================

Result<Category> IntegrityManager::createCategory(CatalogState& state, ChangeSet& changes,
                                                  const CategoryInput& input) const {
    ensureDefaults(state, changes);

    std::string name = utils::trim(input.name);
    std::string parent_id = utils::trim(input.parent_id);

    int level = 1;
    if (!parent_id.empty()) {
        const Category* parent = state.findCategory(parent_id);
        if (!parent) {
            return Result<Category>::fail(ErrorKind::NotFound, "Parent category " + parent_id + " not found");
        }
        level = parent->level + 1;
    }
    if (level > options_.max_category_depth) {
        return Result<Category>::fail(ErrorKind::InvalidInput,
            "Category '" + name + "' would exceed the maximum depth of " + std::to_string(options_.max_category_depth));
    }

    Status st = validateCategoryName(state, name, parent_id, "");
    if (!st.isSuccess()) return Result<Category>::fail(st);

    std::string now = utils::getCurrentTimestamp();
    Category c;
    c.id = utils::generateId();
    c.name = name;
    if (!utils::trim(input.color).empty()) c.color = utils::trim(input.color);
    c.description = input.description;
    c.parent_id = parent_id;
    c.created_at = now;
    c.updated_at = now;
    state.categories.push_back(c);

    st = recomputeCategoryPaths(state.categories);
    if (!st.isSuccess()) return Result<Category>::fail(st);

    changes.mark(EntityKind::Categories);
    return Result<Category>::ok(*state.findCategory(c.id));
}

Result<Category> IntegrityManager::updateCategory(CatalogState& state, ChangeSet& changes, const std::string& id,
                                                  const CategoryPatch& patch) const {
    if (!state.findCategory(id)) {
        return Result<Category>::fail(ErrorKind::NotFound, "Category " + id + " not found");
    }
    ensureDefaults(state, changes);

    Category updated = *state.findCategory(id);

    if (patch.parent_id) {
        std::string parent_id = utils::trim(*patch.parent_id);
        if (parent_id != updated.parent_id) {
            if (id == FALLBACK_CATEGORY_ID) {
                return Result<Category>::fail(ErrorKind::InvalidInput,
                                              "Fallback category '" + updated.name + "' must stay at the root");
            }

            int new_level = 1;
            if (!parent_id.empty()) {
                if (parent_id == id || descendantIds(state.categories, id).count(parent_id)) {
                    return Result<Category>::fail(ErrorKind::InvalidInput,
                        "Moving '" + updated.name + "' under " + parent_id + " would create a cycle");
                }
                const Category* parent = state.findCategory(parent_id);
                if (!parent) {
                    return Result<Category>::fail(ErrorKind::NotFound, "Parent category " + parent_id + " not found");
                }
                new_level = parent->level + 1;
            }

            int deepest = new_level + subtreeHeight(state.categories, id) - 1;
            if (deepest > options_.max_category_depth) {
                return Result<Category>::fail(ErrorKind::InvalidInput,
                    "Moving '" + updated.name + "' would exceed the maximum depth of " +
                    std::to_string(options_.max_category_depth));
            }
            updated.parent_id = parent_id;
        }
    }

    if (patch.name) updated.name = utils::trim(*patch.name);
    if (patch.name || patch.parent_id) {
        Status st = validateCategoryName(state, updated.name, updated.parent_id, id);
        if (!st.isSuccess()) return Result<Category>::fail(st);
    }
    if (patch.color && !utils::trim(*patch.color).empty()) updated.color = utils::trim(*patch.color);
    if (patch.description) updated.description = *patch.description;

    Category& current = *state.findCategory(id);
    if (updated == current) {
        return Result<Category>::ok(current);
    }

    updated.updated_at = utils::getCurrentTimestamp();
    current = updated;

    Status st = recomputeCategoryPaths(state.categories);
    if (!st.isSuccess()) return Result<Category>::fail(st);
    changes.mark(EntityKind::Categories);

    int refreshed = syncPromptCategories(state, changes);
    utils::debugLog("Category '" + updated.name + "' updated, " + std::to_string(refreshed) + " prompt(s) refreshed");

    return Result<Category>::ok(*state.findCategory(id));
}

Result<CategoryDeletion> IntegrityManager::deleteCategory(CatalogState& state, ChangeSet& changes,
                                                          const std::string& id) const {
    if (id == FALLBACK_CATEGORY_ID) {
        return Result<CategoryDeletion>::fail(ErrorKind::Conflict, "The fallback category cannot be deleted");
    }
    if (!state.findCategory(id)) {
        return Result<CategoryDeletion>::fail(ErrorKind::NotFound, "Category " + id + " not found");
    }
    ensureDefaults(state, changes);

    CategoryDeletion outcome;
    outcome.category = *state.findCategory(id);

    // A promoted child must not collide with a category already at its new level
    for (const auto& child : state.categories) {
        if (child.parent_id != id) continue;
        for (const auto& other : state.categories) {
            if (other.id != id && other.parent_id == outcome.category.parent_id && other.name == child.name) {
                return Result<CategoryDeletion>::fail(
                    ErrorKind::Conflict,
                    "Cannot delete '" + outcome.category.name + "': its child '" + child.name +
                        "' would collide with an existing category at that level; rename or move it first");
            }
        }
    }

    // Children take the deleted category's place in the tree
    for (auto& c : state.categories) {
        if (c.parent_id == id) {
            c.parent_id = outcome.category.parent_id;
            outcome.reparented_children++;
        }
    }
    state.categories.erase(std::remove_if(state.categories.begin(), state.categories.end(),
                                          [&id](const Category& c) { return c.id == id; }),
                           state.categories.end());

    Status st = recomputeCategoryPaths(state.categories);
    if (!st.isSuccess()) return Result<CategoryDeletion>::fail(st);
    changes.mark(EntityKind::Categories);

    std::string now = utils::getCurrentTimestamp();
    for (auto& p : state.prompts) {
        if (p.category_id == id) {
            p.category_id = FALLBACK_CATEGORY_ID;
            p.updated_at = now;
            outcome.reassigned_prompts++;
        }
    }
    if (outcome.reassigned_prompts > 0) changes.mark(EntityKind::Prompts);

    // Paths of promoted children changed too
    syncPromptCategories(state, changes);

    return Result<CategoryDeletion>::ok(outcome);
}

Result<CategoryImpact> IntegrityManager::previewCategoryDeletion(const CatalogState& state, const std::string& id) {
    const Category* c = state.findCategory(id);
    if (!c) {
        return Result<CategoryImpact>::fail(ErrorKind::NotFound, "Category " + id + " not found");
    }
    if (id == FALLBACK_CATEGORY_ID) {
        return Result<CategoryImpact>::fail(ErrorKind::Conflict, "The fallback category cannot be deleted");
    }

    CategoryImpact impact;
    impact.category = *c;
    for (const auto& child : state.categories) {
        if (child.parent_id != id) continue;
        impact.child_names.push_back(child.name);
        for (const auto& other : state.categories) {
            if (other.id != id && other.parent_id == c->parent_id && other.name == child.name) {
                impact.colliding_children.push_back(child.name);
                break;
            }
        }
    }
    impact.prompt_count = static_cast<int>(std::count_if(state.prompts.begin(), state.prompts.end(),
        [&id](const Prompt& p) { return p.category_id == id; }));
    return Result<CategoryImpact>::ok(impact);
}

// ============================================================================
// Tags
// ============================================================================

Result<Tag> IntegrityManager::createTag(CatalogState& state, ChangeSet& changes, const TagInput& input) const {
    std::string name = utils::trim(input.name);
    Status st = validateTagName(name);
    if (!st.isSuccess()) return Result<Tag>::fail(st);
    if (state.findTagByName(name)) {
        return Result<Tag>::fail(ErrorKind::InvalidInput, "Tag '" + name + "' already exists");
    }

    std::string now = utils::getCurrentTimestamp();
    Tag t;
    t.id = utils::generateId();
    t.name = name;
    if (!utils::trim(input.color).empty()) t.color = utils::trim(input.color);
    t.created_at = now;
    t.updated_at = now;
    state.tags.push_back(t);
    changes.mark(EntityKind::Tags);
    return Result<Tag>::ok(t);
}

Result<TagChange> IntegrityManager::updateTag(CatalogState& state, ChangeSet& changes, const std::string& id,
                                              const TagPatch& patch) const {
    Tag* tag = state.findTag(id);
    if (!tag) {
        return Result<TagChange>::fail(ErrorKind::NotFound, "Tag " + id + " not found");
    }

    TagChange outcome;
    std::string now = utils::getCurrentTimestamp();
    std::string old_name = tag->name;
    std::string new_name = patch.name ? utils::trim(*patch.name) : old_name;

    if (new_name != old_name) {
        Status st = validateTagName(new_name);
        if (!st.isSuccess()) return Result<TagChange>::fail(st);
        if (state.findTagByName(new_name)) {
            return Result<TagChange>::fail(ErrorKind::InvalidInput, "Tag '" + new_name + "' already exists");
        }

        // Prompts reference tags by name, so every reference moves with the rename
        for (auto& p : state.prompts) {
            auto pos = std::find(p.tags.begin(), p.tags.end(), old_name);
            if (pos == p.tags.end()) continue;
            if (p.hasTag(new_name)) {
                p.tags.erase(pos);
            } else {
                *pos = new_name;
            }
            p.updated_at = now;
            outcome.affected_prompts++;
        }
        if (outcome.affected_prompts > 0) changes.mark(EntityKind::Prompts);
        tag->name = new_name;
    }

    if (patch.color && !utils::trim(*patch.color).empty()) {
        tag->color = utils::trim(*patch.color);
    }

    tag->updated_at = now;
    changes.mark(EntityKind::Tags);
    outcome.tag = *tag;
    return Result<TagChange>::ok(outcome);
}

Result<TagChange> IntegrityManager::deleteTag(CatalogState& state, ChangeSet& changes, const std::string& id) const {
    auto it = std::find_if(state.tags.begin(), state.tags.end(), [&id](const Tag& t) { return t.id == id; });
    if (it == state.tags.end()) {
        return Result<TagChange>::fail(ErrorKind::NotFound, "Tag " + id + " not found");
    }

    TagChange outcome;
    outcome.tag = *it;
    state.tags.erase(it);
    changes.mark(EntityKind::Tags);

    std::string now = utils::getCurrentTimestamp();
    for (auto& p : state.prompts) {
        auto pos = std::remove(p.tags.begin(), p.tags.end(), outcome.tag.name);
        if (pos != p.tags.end()) {
            p.tags.erase(pos, p.tags.end());
            p.updated_at = now;
            outcome.affected_prompts++;
        }
    }
    if (outcome.affected_prompts > 0) changes.mark(EntityKind::Prompts);

    return Result<TagChange>::ok(outcome);
}

// ============================================================================
// Bulk
// ============================================================================

Result<ImportSummary> IntegrityManager::importPrompts(CatalogState& state, ChangeSet& changes,
                                                      const std::vector<Prompt>& records) const {
    ensureDefaults(state, changes);
    ImportSummary summary;

    for (const auto& record : records) {
        std::string label = record.title.empty() ? record.id : record.title;
        if (utils::trim(record.title).empty() || utils::trim(record.content).empty()) {
            summary.skipped++;
            summary.messages.push_back("Skipped '" + label + "': title and content are required");
            continue;
        }

        // Older exports carry only the category path
        std::string category_id = record.category_id;
        if (!state.findCategory(category_id) && !record.category_path.empty()) {
            for (const auto& c : state.categories) {
                if (c.path == record.category_path) category_id = c.id;
            }
        }

        if (!record.id.empty() && state.findPrompt(record.id)) {
            PromptPatch patch;
            patch.title = record.title;
            patch.content = record.content;
            patch.description = record.description;
            patch.category_id = category_id;
            patch.tags = record.tags;
            patch.change_note = IMPORT_VERSION_NOTE;

            Result<Prompt> r = updatePromptImpl(state, changes, record.id, patch);
            if (!r.isSuccess()) {
                summary.skipped++;
                summary.messages.push_back("Skipped '" + label + "': " + r.error);
                continue;
            }
            Prompt* p = state.findPrompt(record.id);
            if (record.usage_count > p->usage_count) {
                p->usage_count = record.usage_count;
                changes.mark(EntityKind::Prompts);
            }
            summary.updated++;
        } else {
            PromptInput input;
            input.id = record.id;
            input.title = record.title;
            input.content = record.content;
            input.description = record.description;
            input.category_id = category_id;
            input.tags = record.tags;

            Result<Prompt> r = createPromptImpl(state, changes, input);
            if (!r.isSuccess()) {
                summary.skipped++;
                summary.messages.push_back("Skipped '" + label + "': " + r.error);
                continue;
            }
            Prompt* p = state.findPrompt(r.value.id);
            p->usage_count = std::max(0, record.usage_count);
            if (!record.created_at.empty()) p->created_at = record.created_at;
            summary.created++;
        }
    }

    return Result<ImportSummary>::ok(summary);
}

Result<ImportSummary> IntegrityManager::replacePrompts(CatalogState& state, ChangeSet& changes,
                                                       const std::vector<Prompt>& records) const {
    state.prompts.clear();
    state.versions.clear();
    changes.mark(EntityKind::Prompts);
    changes.mark(EntityKind::Versions);
    return importPrompts(state, changes, records);
}

void IntegrityManager::resetState(CatalogState& state, ChangeSet& changes) const {
    state.categories = defaultCategories();
    state.tags.clear();
    state.prompts.clear();
    state.versions.clear();
    changes.mark(EntityKind::Categories);
    changes.mark(EntityKind::Tags);
    changes.mark(EntityKind::Prompts);
    changes.mark(EntityKind::Versions);
}

// ============================================================================
// Verification
// ============================================================================

Status IntegrityManager::checkDepthLimit(const CatalogState& state, int max_depth) {
    if (max_depth < 1) {
        return Status::fail(ErrorKind::InvalidInput, "Maximum category depth must be at least 1");
    }
    const Category* deepest = nullptr;
    for (const auto& c : state.categories) {
        if (!deepest || c.level > deepest->level) deepest = &c;
    }
    if (deepest && deepest->level > max_depth) {
        return Status::fail(ErrorKind::Conflict,
                            "Category '" + deepest->path + "' is " + std::to_string(deepest->level) +
                                " levels deep; move it up before lowering the limit to " + std::to_string(max_depth));
    }
    return Status::ok();
}

std::vector<std::string> IntegrityManager::verify(const CatalogState& state) const {
    std::vector<std::string> violations;

    // Categories
    std::set<std::string> category_ids;
    std::set<std::pair<std::string, std::string>> sibling_names;
    for (const auto& c : state.categories) {
        if (c.id.empty()) violations.push_back("Category '" + c.name + "' has no id");
        if (!category_ids.insert(c.id).second) violations.push_back("Duplicate category id " + c.id);
        if (!sibling_names.insert({c.parent_id, c.name}).second) {
            violations.push_back("Category name '" + c.name + "' is used twice under " +
                                 (c.parent_id.empty() ? std::string("the root") : "parent " + c.parent_id));
        }
        if (!c.parent_id.empty() && !state.findCategory(c.parent_id)) {
            violations.push_back("Category '" + c.name + "' has unknown parent " + c.parent_id);
        }
        if (c.level > options_.max_category_depth) {
            violations.push_back("Category '" + c.name + "' is deeper than " +
                                 std::to_string(options_.max_category_depth));
        }
    }

    const Category* fallback = state.findCategory(FALLBACK_CATEGORY_ID);
    if (!fallback) {
        violations.push_back("Fallback category " + std::string(FALLBACK_CATEGORY_ID) + " is missing");
    } else if (!fallback->parent_id.empty()) {
        violations.push_back("Fallback category is not a root");
    }

    std::vector<Category> recomputed = state.categories;
    Status st = recomputeCategoryPaths(recomputed);
    if (!st.isSuccess()) {
        violations.push_back(st.error);
    } else {
        for (size_t i = 0; i < recomputed.size(); i++) {
            const Category& stored = state.categories[i];
            if (stored.level != recomputed[i].level || stored.path != recomputed[i].path) {
                violations.push_back("Category '" + stored.name + "' has stale path '" + stored.path +
                                     "' (expected '" + recomputed[i].path + "')");
            }
        }
    }

    // Tags
    std::set<std::string> tag_ids;
    std::set<std::string> tag_names;
    for (const auto& t : state.tags) {
        if (!tag_ids.insert(t.id).second) violations.push_back("Duplicate tag id " + t.id);
        if (!tag_names.insert(t.name).second) violations.push_back("Duplicate tag name '" + t.name + "'");
    }

    // Prompts
    VersionLedger ledger(state.versions);
    std::set<std::string> prompt_ids;
    for (const auto& p : state.prompts) {
        if (!prompt_ids.insert(p.id).second) violations.push_back("Duplicate prompt id " + p.id);

        const Category* c = state.findCategory(p.category_id);
        if (!c) {
            violations.push_back("Prompt '" + p.title + "' references missing category " + p.category_id);
        } else if (p.category_name != c->name || p.category_path != c->path) {
            violations.push_back("Prompt '" + p.title + "' has stale category cache '" + p.category_path + "'");
        }

        std::set<std::string> seen;
        for (const auto& name : p.tags) {
            if (!tag_names.count(name)) {
                violations.push_back("Prompt '" + p.title + "' references missing tag '" + name + "'");
            }
            if (!seen.insert(name).second) {
                violations.push_back("Prompt '" + p.title + "' lists tag '" + name + "' twice");
            }
        }

        if (!ledger.contains(p.id, p.current_version)) {
            violations.push_back("Prompt '" + p.title + "' points at missing version '" + p.current_version + "'");
        }
    }

    // Ledger
    std::set<std::pair<std::string, std::string>> version_keys;
    for (const auto& v : state.versions) {
        if (!version_keys.insert({v.prompt_id, v.version}).second) {
            violations.push_back("Duplicate version " + v.version + " for prompt " + v.prompt_id);
        }
    }

    return violations;
}

} // namespace prompthub
