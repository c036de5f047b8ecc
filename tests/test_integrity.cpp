#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "integrity_manager.h"
#include "version_ledger.h"

using namespace prompthub;

namespace {

// Catalog holding only the fallback category
CatalogState fallbackOnly() {
    CatalogState state;
    state.categories.push_back(IntegrityManager::defaultCategories().back());
    return state;
}

Prompt createPrompt(const IntegrityManager& integrity, CatalogState& state, const std::string& title,
                    const std::string& category_id, const std::vector<std::string>& tags = {}) {
    ChangeSet changes;
    PromptInput input;
    input.title = title;
    input.content = "Content of " + title;
    input.category_id = category_id;
    input.tags = tags;
    Result<Prompt> r = integrity.createPrompt(state, changes, input);
    assert(r.isSuccess());
    return r.value;
}

Category createCategory(const IntegrityManager& integrity, CatalogState& state, const std::string& name,
                        const std::string& parent_id = "") {
    ChangeSet changes;
    CategoryInput input;
    input.name = name;
    input.parent_id = parent_id;
    Result<Category> r = integrity.createCategory(state, changes, input);
    assert(r.isSuccess());
    assert(changes.categories);
    return r.value;
}

void testDefaults() {
    std::cout << "[Test] default categories..." << std::endl;
    IntegrityManager integrity;
    CatalogState state;
    ChangeSet changes;
    integrity.ensureDefaults(state, changes);

    assert(state.categories.size() == 7);
    assert(changes.categories);
    const Category* fallback = state.findCategory(FALLBACK_CATEGORY_ID);
    assert(fallback && fallback->name == "其他" && fallback->level == 1);
    assert(integrity.verify(state).empty());

    // Already consistent: nothing to rewrite
    ChangeSet again;
    integrity.ensureDefaults(state, again);
    assert(!again.any());
}

void testCategoryDeleteReassignsPrompts() {
    std::cout << "[Test] category delete reassigns prompts..." << std::endl;
    IntegrityManager integrity;
    CatalogState state = fallbackOnly();

    Category c1 = createCategory(integrity, state, "编程");
    Prompt p1 = createPrompt(integrity, state, "P1", c1.id);
    assert(p1.category_id == c1.id);
    assert(p1.category_name == "编程");

    ChangeSet changes;
    Result<CategoryDeletion> deleted = integrity.deleteCategory(state, changes, c1.id);
    assert(deleted.isSuccess());
    assert(deleted.value.reassigned_prompts == 1);
    assert(changes.categories && changes.prompts);
    assert(!changes.versions);

    const Prompt* moved = state.findPrompt(p1.id);
    const Category* fallback = state.findCategory(FALLBACK_CATEGORY_ID);
    assert(moved->category_id == FALLBACK_CATEGORY_ID);
    assert(moved->category_name == fallback->name);
    assert(moved->category_path == fallback->path);
    assert(!state.findCategory(c1.id));
    for (const auto& p : state.prompts) {
        assert(p.category_id != c1.id);
    }
    assert(integrity.verify(state).empty());

    assert(integrity.deleteCategory(state, changes, c1.id).kind == ErrorKind::NotFound);
}

void testCategoryDeleteReparentsChildren() {
    std::cout << "[Test] category delete reparents children..." << std::endl;
    IntegrityManager integrity;
    CatalogState state = fallbackOnly();

    Category root = createCategory(integrity, state, "Root");
    Category middle = createCategory(integrity, state, "Middle", root.id);
    Category leaf = createCategory(integrity, state, "Leaf", middle.id);
    Category sibling = createCategory(integrity, state, "Sibling", middle.id);
    Prompt in_leaf = createPrompt(integrity, state, "In leaf", leaf.id);
    assert(in_leaf.category_path == "Root/Middle/Leaf");
    assert(state.findCategory(leaf.id)->level == 3);

    ChangeSet changes;
    Result<CategoryDeletion> deleted = integrity.deleteCategory(state, changes, middle.id);
    assert(deleted.isSuccess());
    assert(deleted.value.reparented_children == 2);
    assert(deleted.value.reassigned_prompts == 0);

    const Category* moved_leaf = state.findCategory(leaf.id);
    assert(moved_leaf->parent_id == root.id);
    assert(moved_leaf->level == 2);
    assert(moved_leaf->path == "Root/Leaf");
    assert(state.findCategory(sibling.id)->parent_id == root.id);

    // The prompt keeps its category, but its cached path follows the move
    const Prompt* p = state.findPrompt(in_leaf.id);
    assert(p->category_id == leaf.id);
    assert(p->category_path == "Root/Leaf");

    for (const auto& c : state.categories) {
        assert(c.parent_id.empty() || state.findCategory(c.parent_id));
    }
    assert(integrity.verify(state).empty());

    // Deleting a root promotes its children to roots
    assert(integrity.deleteCategory(state, changes, root.id).isSuccess());
    assert(state.findCategory(leaf.id)->parent_id.empty());
    assert(state.findCategory(leaf.id)->path == "Leaf");
    assert(integrity.verify(state).empty());
}

void testFallbackProtected() {
    std::cout << "[Test] fallback category protected..." << std::endl;
    IntegrityManager integrity;
    CatalogState state;
    ChangeSet changes;
    integrity.ensureDefaults(state, changes);

    assert(integrity.deleteCategory(state, changes, FALLBACK_CATEGORY_ID).kind == ErrorKind::Conflict);
    assert(IntegrityManager::previewCategoryDeletion(state, FALLBACK_CATEGORY_ID).kind == ErrorKind::Conflict);

    CategoryPatch move;
    move.parent_id = std::string("1");
    assert(integrity.updateCategory(state, changes, FALLBACK_CATEGORY_ID, move).kind == ErrorKind::InvalidInput);

    // Renaming is allowed
    CategoryPatch rename;
    rename.name = std::string("Misc");
    Result<Category> renamed = integrity.updateCategory(state, changes, FALLBACK_CATEGORY_ID, rename);
    assert(renamed.isSuccess());
    assert(renamed.value.name == "Misc");

    // A missing fallback is restored
    state.categories.pop_back();
    ChangeSet repair;
    integrity.ensureDefaults(state, repair);
    assert(state.findCategory(FALLBACK_CATEGORY_ID));
    assert(integrity.verify(state).empty());
}

void testPreviewCategoryDeletion() {
    std::cout << "[Test] category delete preview..." << std::endl;
    IntegrityManager integrity;
    CatalogState state = fallbackOnly();
    Category parent = createCategory(integrity, state, "Parent");
    createCategory(integrity, state, "Child A", parent.id);
    createCategory(integrity, state, "Child B", parent.id);
    createPrompt(integrity, state, "One", parent.id);
    createPrompt(integrity, state, "Two", parent.id);

    CatalogState before = state;
    Result<CategoryImpact> impact = IntegrityManager::previewCategoryDeletion(state, parent.id);
    assert(impact.isSuccess());
    assert(impact.value.prompt_count == 2);
    assert(impact.value.child_names.size() == 2);
    assert(state == before);

    assert(IntegrityManager::previewCategoryDeletion(state, "nope").kind == ErrorKind::NotFound);
}

void testCycleAndDepthRejected() {
    std::cout << "[Test] cycles and depth..." << std::endl;
    IntegrityOptions options;
    options.max_category_depth = 3;
    IntegrityManager integrity(options);
    CatalogState state = fallbackOnly();

    Category a = createCategory(integrity, state, "A");
    Category b = createCategory(integrity, state, "B", a.id);
    Category c = createCategory(integrity, state, "C", b.id);

    ChangeSet changes;
    CategoryInput too_deep;
    too_deep.name = "D";
    too_deep.parent_id = c.id;
    assert(integrity.createCategory(state, changes, too_deep).kind == ErrorKind::InvalidInput);

    CategoryInput orphan;
    orphan.name = "Orphan";
    orphan.parent_id = "missing";
    assert(integrity.createCategory(state, changes, orphan).kind == ErrorKind::NotFound);

    CatalogState before = state;

    CategoryPatch onto_self;
    onto_self.parent_id = a.id;
    assert(integrity.updateCategory(state, changes, a.id, onto_self).kind == ErrorKind::InvalidInput);

    CategoryPatch onto_descendant;
    onto_descendant.parent_id = c.id;
    assert(integrity.updateCategory(state, changes, a.id, onto_descendant).kind == ErrorKind::InvalidInput);

    // Moving B (height 2) under a level 2 category would put C at level 4
    Category other = createCategory(integrity, state, "Other");
    Category other_child = createCategory(integrity, state, "Other child", other.id);
    CategoryPatch deep_move;
    deep_move.parent_id = other_child.id;
    assert(integrity.updateCategory(state, changes, b.id, deep_move).kind == ErrorKind::InvalidInput);

    for (const auto& cat : before.categories) {
        assert(*state.findCategory(cat.id) == cat);
    }

    // A legal move updates the moved subtree
    CategoryPatch legal;
    legal.parent_id = other.id;
    Result<Category> moved = integrity.updateCategory(state, changes, b.id, legal);
    assert(moved.isSuccess());
    assert(moved.value.path == "Other/B");
    assert(state.findCategory(c.id)->path == "Other/B/C");
    assert(state.findCategory(c.id)->level == 3);
    assert(integrity.verify(state).empty());
}

void testCategoryNameRules() {
    std::cout << "[Test] category names..." << std::endl;
    IntegrityManager integrity;
    CatalogState state = fallbackOnly();
    Category a = createCategory(integrity, state, "Alpha");
    createCategory(integrity, state, "Child", a.id);

    ChangeSet changes;
    CategoryInput duplicate;
    duplicate.name = "Alpha";
    assert(integrity.createCategory(state, changes, duplicate).kind == ErrorKind::InvalidInput);

    // Same name under another parent is fine
    CategoryInput nested;
    nested.name = "Alpha";
    nested.parent_id = a.id;
    assert(integrity.createCategory(state, changes, nested).isSuccess());

    CategoryInput slash;
    slash.name = "a/b";
    assert(integrity.createCategory(state, changes, slash).kind == ErrorKind::InvalidInput);

    CategoryInput empty;
    empty.name = "   ";
    assert(integrity.createCategory(state, changes, empty).kind == ErrorKind::InvalidInput);
}

void testParentRenameRefreshesDescendantPrompts() {
    std::cout << "[Test] parent rename refreshes prompts..." << std::endl;
    IntegrityManager integrity;
    CatalogState state = fallbackOnly();
    Category parent = createCategory(integrity, state, "Dev");
    Category child = createCategory(integrity, state, "Web", parent.id);
    Prompt p = createPrompt(integrity, state, "Page", child.id);
    assert(p.category_path == "Dev/Web");
    size_t versions = state.versions.size();

    ChangeSet changes;
    CategoryPatch rename;
    rename.name = std::string("Engineering");
    assert(integrity.updateCategory(state, changes, parent.id, rename).isSuccess());
    assert(changes.prompts);
    assert(!changes.versions);

    const Prompt* refreshed = state.findPrompt(p.id);
    assert(refreshed->category_name == "Web");
    assert(refreshed->category_path == "Engineering/Web");
    assert(refreshed->updated_at == p.updated_at);
    assert(state.versions.size() == versions);
    assert(integrity.verify(state).empty());
}

void testTagRenameCascades() {
    std::cout << "[Test] tag rename cascades..." << std::endl;
    IntegrityManager integrity;
    CatalogState state = fallbackOnly();

    ChangeSet changes;
    TagInput input;
    input.name = "Python";
    Result<Tag> t1 = integrity.createTag(state, changes, input);
    assert(t1.isSuccess());
    assert(integrity.createTag(state, changes, input).kind == ErrorKind::InvalidInput);

    Prompt p2 = createPrompt(integrity, state, "P2", "", {"Python"});
    assert(p2.category_id == FALLBACK_CATEGORY_ID);
    assert(state.tags.size() == 1);

    Prompt untagged = createPrompt(integrity, state, "Untagged", "");
    const std::string long_ago = "2000-01-01T00:00:00.000000";
    state.findPrompt(p2.id)->updated_at = long_ago;
    state.findPrompt(untagged.id)->updated_at = long_ago;

    TagPatch rename;
    rename.name = std::string("Python3");
    Result<TagChange> renamed = integrity.updateTag(state, changes, t1.value.id, rename);
    assert(renamed.isSuccess());
    assert(renamed.value.affected_prompts == 1);
    assert(renamed.value.tag.id == t1.value.id);

    const Prompt* p = state.findPrompt(p2.id);
    assert(p->hasTag("Python3"));
    assert(!p->hasTag("Python"));
    // The tagged prompt counts as modified, the other one does not
    assert(p->updated_at == renamed.value.tag.updated_at);
    assert(state.findPrompt(untagged.id)->updated_at == long_ago);
    assert(integrity.verify(state).empty());

    // Rename onto an existing name is refused
    TagInput other;
    other.name = "Go";
    assert(integrity.createTag(state, changes, other).isSuccess());
    TagPatch clash;
    clash.name = std::string("Go");
    assert(integrity.updateTag(state, changes, t1.value.id, clash).kind == ErrorKind::InvalidInput);
    assert(integrity.updateTag(state, changes, "missing", clash).kind == ErrorKind::NotFound);
}

void testTagDeleteRemovesReferences() {
    std::cout << "[Test] tag delete..." << std::endl;
    IntegrityManager integrity;
    CatalogState state = fallbackOnly();
    createPrompt(integrity, state, "A", "", {"keep", "drop"});
    createPrompt(integrity, state, "B", "", {"drop"});
    createPrompt(integrity, state, "C", "", {"keep"});
    assert(state.tags.size() == 2);

    const std::string long_ago = "2000-01-01T00:00:00.000000";
    for (auto& p : state.prompts) p.updated_at = long_ago;

    const Tag* drop = state.findTagByName("drop");
    assert(drop);
    ChangeSet changes;
    Result<TagChange> deleted = integrity.deleteTag(state, changes, drop->id);
    assert(deleted.isSuccess());
    assert(deleted.value.affected_prompts == 2);
    assert(!changes.versions);
    assert(state.prompts[0].updated_at != long_ago);
    assert(state.prompts[1].updated_at != long_ago);
    assert(state.prompts[2].updated_at == long_ago);

    for (const auto& p : state.prompts) {
        assert(!p.hasTag("drop"));
    }
    assert(state.prompts[0].tags == std::vector<std::string>({"keep"}));
    assert(!state.findTagByName("drop"));
    assert(integrity.verify(state).empty());

    assert(integrity.deleteTag(state, changes, "missing").kind == ErrorKind::NotFound);
}

void testContentEditVersions() {
    std::cout << "[Test] content edits version, metadata edits do not..." << std::endl;
    IntegrityManager integrity;
    CatalogState state = fallbackOnly();
    Category other = createCategory(integrity, state, "Other place");

    ChangeSet changes;
    PromptInput input;
    input.title = "P3";
    input.content = "v1";
    Result<Prompt> p3 = integrity.createPrompt(state, changes, input);
    assert(p3.isSuccess());
    assert(p3.value.current_version == "1.0");

    PromptPatch content;
    content.content = std::string("v2");
    Result<Prompt> edited = integrity.updatePrompt(state, changes, p3.value.id, content);
    assert(edited.isSuccess());

    VersionLedger ledger(state.versions);
    std::vector<PromptVersion> list = ledger.list(p3.value.id);
    assert(list.size() == 2);
    assert(list[0].content == "v1");
    assert(list[1].content == "v2");
    assert(list[0].change_note == "Initial version");
    assert(edited.value.current_version == list[1].version);

    // Category and tag edits append nothing
    PromptPatch meta;
    meta.category_id = other.id;
    meta.tags = std::vector<std::string>({"fresh", "fresh", " "});
    ChangeSet meta_changes;
    Result<Prompt> moved = integrity.updatePrompt(state, meta_changes, p3.value.id, meta);
    assert(moved.isSuccess());
    assert(moved.value.category_id == other.id);
    assert(moved.value.tags == std::vector<std::string>({"fresh"}));
    assert(moved.value.current_version == edited.value.current_version);
    assert(!meta_changes.versions);
    assert(ledger.count(p3.value.id) == 2);

    // No-op patch changes nothing
    ChangeSet none;
    PromptPatch same;
    same.content = std::string("v2");
    assert(integrity.updatePrompt(state, none, p3.value.id, same).isSuccess());
    assert(!none.prompts && !none.versions);

    // Major bump with a note
    PromptPatch major;
    major.title = std::string("P3 rewritten");
    major.change_note = "Rewrite";
    major.major = true;
    Result<Prompt> bumped = integrity.updatePrompt(state, changes, p3.value.id, major);
    assert(bumped.value.current_version == "2.0");
    assert(ledger.get(p3.value.id, "2.0").value.change_note == "Rewrite");
    assert(integrity.verify(state).empty());
}

void testPromptValidationAndLifecycle() {
    std::cout << "[Test] prompt validation..." << std::endl;
    IntegrityManager integrity;
    CatalogState state = fallbackOnly();
    ChangeSet changes;

    PromptInput missing_title;
    missing_title.content = "x";
    assert(integrity.createPrompt(state, changes, missing_title).kind == ErrorKind::InvalidInput);

    PromptInput missing_content;
    missing_content.title = "x";
    assert(integrity.createPrompt(state, changes, missing_content).kind == ErrorKind::InvalidInput);

    PromptInput long_title;
    long_title.title = std::string(201, 'a');
    long_title.content = "x";
    assert(integrity.createPrompt(state, changes, long_title).kind == ErrorKind::InvalidInput);

    PromptInput long_tag;
    long_tag.title = "t";
    long_tag.content = "x";
    long_tag.tags = {std::string(31, 't')};
    assert(integrity.createPrompt(state, changes, long_tag).kind == ErrorKind::InvalidInput);
    assert(state.prompts.empty());

    // Unknown category falls back
    Prompt p = createPrompt(integrity, state, "Lost", "no-such-category");
    assert(p.category_id == FALLBACK_CATEGORY_ID);

    PromptInput dup;
    dup.id = p.id;
    dup.title = "Again";
    dup.content = "x";
    assert(integrity.createPrompt(state, changes, dup).kind == ErrorKind::Conflict);

    PromptPatch blank;
    blank.title = std::string("");
    assert(integrity.updatePrompt(state, changes, p.id, blank).kind == ErrorKind::InvalidInput);
    assert(integrity.updatePrompt(state, changes, "missing", blank).kind == ErrorKind::NotFound);

    Result<Prompt> used = integrity.usePrompt(state, changes, p.id);
    assert(used.isSuccess() && used.value.usage_count == 1);
    assert(used.value.updated_at == p.updated_at);

    // Deleting keeps the history
    Result<Prompt> removed = integrity.deletePrompt(state, changes, p.id);
    assert(removed.isSuccess());
    assert(!state.findPrompt(p.id));
    assert(VersionLedger(state.versions).count(p.id) == 1);
    assert(integrity.deletePrompt(state, changes, p.id).kind == ErrorKind::NotFound);
    assert(integrity.usePrompt(state, changes, p.id).kind == ErrorKind::NotFound);
    assert(integrity.verify(state).empty());
}

void testRepairOfLegacyData() {
    std::cout << "[Test] repair of legacy data..." << std::endl;
    IntegrityManager integrity;
    CatalogState state;
    state.categories = IntegrityManager::defaultCategories();

    Category dangling;
    dangling.id = "x";
    dangling.name = "Dangling";
    dangling.parent_id = "gone";
    state.categories.push_back(dangling);

    Prompt legacy;
    legacy.id = "legacy";
    legacy.title = "Old";
    legacy.content = "Old content";
    legacy.category_id = "gone";
    legacy.tags = {"untracked"};
    state.prompts.push_back(legacy);

    assert(!integrity.verify(state).empty());

    ChangeSet changes;
    integrity.ensureDefaults(state, changes);
    assert(state.findCategory("x")->parent_id.empty());
    assert(state.findCategory("x")->path == "Dangling");

    const Prompt* p = state.findPrompt("legacy");
    assert(p->category_id == FALLBACK_CATEGORY_ID);
    assert(p->current_version == "1.0");
    assert(state.findTagByName("untracked"));
    assert(changes.categories && changes.prompts && changes.tags && changes.versions);
    assert(integrity.verify(state).empty());
}

void testImportAndReplace() {
    std::cout << "[Test] import..." << std::endl;
    IntegrityManager integrity;
    CatalogState state = fallbackOnly();
    Category writing = createCategory(integrity, state, "Writing");
    Prompt existing = createPrompt(integrity, state, "Existing", writing.id);

    std::vector<Prompt> records(4);
    records[0].id = existing.id;
    records[0].title = "Existing";
    records[0].content = "New body";
    records[0].category_path = "Writing";
    records[0].usage_count = 9;
    records[1].title = "Fresh";
    records[1].content = "Fresh body";
    records[1].category_path = "Writing";
    records[1].tags = {"imported"};
    records[2].title = "No content";
    records[3].id = "kept-id";
    records[3].title = "Keeps id";
    records[3].content = "Body";
    records[3].created_at = "2023-01-01T00:00:00.000000";

    ChangeSet changes;
    Result<ImportSummary> summary = integrity.importPrompts(state, changes, records);
    assert(summary.isSuccess());
    assert(summary.value.created == 2);
    assert(summary.value.updated == 1);
    assert(summary.value.skipped == 1);
    assert(summary.value.messages.size() == 1);

    const Prompt* updated = state.findPrompt(existing.id);
    assert(updated->content == "New body");
    assert(updated->current_version == "1.1");
    assert(updated->usage_count == 9);
    assert(VersionLedger(state.versions).get(existing.id, "1.1").value.change_note == "Imported");

    const Prompt* kept = state.findPrompt("kept-id");
    assert(kept && kept->created_at == "2023-01-01T00:00:00.000000");
    assert(kept->category_id == FALLBACK_CATEGORY_ID);
    assert(state.findTagByName("imported"));
    for (const auto& p : state.prompts) {
        if (p.title == "Fresh") assert(p.category_id == writing.id);
    }
    assert(integrity.verify(state).empty());

    // Replace drops old prompts and their history
    ChangeSet replace_changes;
    std::vector<Prompt> fresh(1);
    fresh[0].title = "Only";
    fresh[0].content = "Only body";
    assert(integrity.replacePrompts(state, replace_changes, fresh).value.created == 1);
    assert(state.prompts.size() == 1);
    assert(state.versions.size() == 1);
    assert(state.findCategory(writing.id));
    assert(integrity.verify(state).empty());
}

void testVerifyDetectsViolations() {
    std::cout << "[Test] verify..." << std::endl;
    IntegrityManager integrity;
    CatalogState state = fallbackOnly();
    createPrompt(integrity, state, "Checked", "", {"t"});
    assert(integrity.verify(state).empty());

    CatalogState broken = state;
    broken.prompts[0].category_id = "nowhere";
    assert(!integrity.verify(broken).empty());

    broken = state;
    broken.prompts[0].tags.push_back("unknown");
    assert(!integrity.verify(broken).empty());

    broken = state;
    broken.prompts[0].current_version = "5.0";
    assert(!integrity.verify(broken).empty());

    broken = state;
    broken.categories[0].path = "Stale";
    assert(!integrity.verify(broken).empty());

    broken = state;
    broken.versions.push_back(broken.versions[0]);
    assert(!integrity.verify(broken).empty());
}

void testCategoryDeleteRefusesNameCollision() {
    std::cout << "[Test] category delete refuses colliding children..." << std::endl;
    IntegrityManager integrity;
    CatalogState state = fallbackOnly();

    Category top_x = createCategory(integrity, state, "X");
    Category a = createCategory(integrity, state, "A");
    Category nested_x = createCategory(integrity, state, "X", a.id);
    Category other = createCategory(integrity, state, "Other", a.id);
    Prompt in_a = createPrompt(integrity, state, "In A", a.id);

    Result<CategoryImpact> impact = IntegrityManager::previewCategoryDeletion(state, a.id);
    assert(impact.isSuccess());
    assert(impact.value.colliding_children == std::vector<std::string>({"X"}));

    CatalogState before = state;
    ChangeSet changes;
    Result<CategoryDeletion> deleted = integrity.deleteCategory(state, changes, a.id);
    assert(deleted.kind == ErrorKind::Conflict);
    assert(deleted.error.find("'X'") != std::string::npos);
    assert(state == before);
    assert(!changes.categories && !changes.prompts);
    assert(state.findPrompt(in_a.id)->category_id == a.id);

    // Once the child is renamed the deletion goes through
    ChangeSet renaming;
    CategoryPatch rename;
    rename.name = std::string("X2");
    assert(integrity.updateCategory(state, renaming, nested_x.id, rename).isSuccess());
    assert(IntegrityManager::previewCategoryDeletion(state, a.id).value.colliding_children.empty());
    assert(integrity.deleteCategory(state, changes, a.id).isSuccess());
    assert(state.findCategory(nested_x.id)->path == "X2");
    assert(state.findCategory(other.id)->parent_id.empty());
    assert(state.findCategory(top_x.id)->path == "X");
    assert(integrity.verify(state).empty());
}

void testVerifyDetectsSiblingNameClash() {
    std::cout << "[Test] verify flags duplicate sibling names..." << std::endl;
    IntegrityManager integrity;
    CatalogState state = fallbackOnly();
    Category parent = createCategory(integrity, state, "Parent");
    Category first = createCategory(integrity, state, "Same", parent.id);
    createCategory(integrity, state, "Other", parent.id);
    assert(integrity.verify(state).empty());

    CatalogState broken = state;
    for (auto& c : broken.categories) {
        if (c.name == "Other") {
            c.name = first.name;
            c.path = "Parent/Same";
        }
    }
    std::vector<std::string> violations = integrity.verify(broken);
    assert(violations.size() == 1);
    assert(violations[0].find("'Same'") != std::string::npos);

    // The same name under different parents is fine
    createCategory(integrity, state, "Same");
    assert(integrity.verify(state).empty());
}

void testDepthLimitCheck() {
    std::cout << "[Test] depth limit check..." << std::endl;
    IntegrityOptions options;
    options.max_category_depth = 3;
    IntegrityManager integrity(options);
    CatalogState state = fallbackOnly();
    Category a = createCategory(integrity, state, "A");
    Category b = createCategory(integrity, state, "B", a.id);
    createCategory(integrity, state, "C", b.id);

    assert(IntegrityManager::checkDepthLimit(state, 3).isSuccess());
    assert(IntegrityManager::checkDepthLimit(state, 5).isSuccess());
    Status lowered = IntegrityManager::checkDepthLimit(state, 2);
    assert(lowered.kind == ErrorKind::Conflict);
    assert(lowered.error.find("A/B/C") != std::string::npos);
    assert(IntegrityManager::checkDepthLimit(state, 0).kind == ErrorKind::InvalidInput);
    assert(IntegrityManager::checkDepthLimit(fallbackOnly(), 1).isSuccess());
}

void testResetState() {
    std::cout << "[Test] reset state..." << std::endl;
    IntegrityManager integrity;
    CatalogState state = fallbackOnly();
    createCategory(integrity, state, "Extra");
    createPrompt(integrity, state, "Gone", "", {"x"});

    ChangeSet changes;
    integrity.resetState(state, changes);
    assert(state.categories.size() == 7);
    assert(state.tags.empty());
    assert(state.prompts.empty());
    assert(state.versions.empty());
    assert(changes.categories && changes.tags && changes.prompts && changes.versions);
    assert(integrity.verify(state).empty());
}

} // namespace

int main() {
    std::cout << "[Test] Integrity manager" << std::endl;

    testDefaults();
    testCategoryDeleteReassignsPrompts();
    testCategoryDeleteReparentsChildren();
    testFallbackProtected();
    testPreviewCategoryDeletion();
    testCycleAndDepthRejected();
    testCategoryNameRules();
    testParentRenameRefreshesDescendantPrompts();
    testTagRenameCascades();
    testTagDeleteRemovesReferences();
    testContentEditVersions();
    testPromptValidationAndLifecycle();
    testRepairOfLegacyData();
    testImportAndReplace();
    testVerifyDetectsViolations();
    testCategoryDeleteRefusesNameCollision();
    testVerifyDetectsSiblingNameClash();
    testDepthLimitCheck();
    testResetState();

    std::cout << "[Test] All integrity tests passed" << std::endl;
    return 0;
}
