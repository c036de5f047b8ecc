#undef NDEBUG
#include <cassert>
#include <algorithm>
#include <cctype>
#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "mutation_gate.h"
#include "query_engine.h"
#include "utils.h"
#include "test_support.h"

using namespace prompthub;

namespace {

const std::string SECRET = "correct horse";

struct Fixture {
    test::TempDir dir;
    std::unique_ptr<EntityStore> store;
    IntegrityManager integrity;
    BackupManager backups;
    MutationGate gate;

    Fixture(const std::string& backend, const std::string& backup_name = "backup",
            const std::string& secret_hash = utils::sha256Hex(SECRET))
        : dir("gate_" + backend)
        , store(test::openStore(backend, dir.path()))
        , backups(dir.file(backup_name))
        , gate(*store, integrity, backups, secret_hash)
    {
        assert(gate.initialize().isSuccess());
    }

    CatalogState snapshot() {
        Result<CatalogState> snap = store->snapshot();
        assert(snap.isSuccess());
        return snap.value;
    }

    // A few categories, tags, prompts and versions
    void populate() {
        CategoryInput category;
        category.name = "Reports";
        category.parent_id = "5";
        Result<Category> c = gate.createCategory(SECRET, category);
        assert(c.isSuccess());

        for (int i = 0; i < 3; i++) {
            PromptInput input;
            input.title = "Prompt " + std::to_string(i);
            input.content = "Content " + std::to_string(i);
            input.category_id = i == 0 ? c.value.id : "2";
            input.tags = {"tag" + std::to_string(i % 2)};
            Result<Prompt> p = gate.createPrompt(SECRET, input);
            assert(p.isSuccess());
            if (i == 0) {
                PromptPatch patch;
                patch.content = std::string("Edited");
                assert(gate.updatePrompt(SECRET, p.value.id, patch).isSuccess());
            }
        }
    }
};

void testWrongSecretChangesNothing(const std::string& backend) {
    std::cout << "[Test] " << backend << " wrong secret..." << std::endl;
    Fixture f(backend);
    f.populate();
    CatalogState before = f.snapshot();
    const Prompt& any_prompt = before.prompts[0];
    const Tag& any_tag = before.tags[0];
    const std::string wrong = "wrong";

    PromptInput input;
    input.title = "Nope";
    input.content = "Nope";
    PromptPatch patch;
    patch.content = std::string("Nope");
    CategoryInput category;
    category.name = "Nope";
    CategoryPatch category_patch;
    category_patch.name = std::string("Nope");
    TagInput tag;
    tag.name = "nope";
    TagPatch tag_patch;
    tag_patch.name = std::string("nope");
    std::vector<Prompt> records(1, any_prompt);

    assert(f.gate.createPrompt(wrong, input).kind == ErrorKind::Unauthorized);
    assert(f.gate.updatePrompt(wrong, any_prompt.id, patch).kind == ErrorKind::Unauthorized);
    assert(f.gate.deletePrompt(wrong, any_prompt.id).kind == ErrorKind::Unauthorized);
    assert(f.gate.rollbackPrompt(wrong, any_prompt.id, "1.0").kind == ErrorKind::Unauthorized);
    assert(f.gate.createCategory(wrong, category).kind == ErrorKind::Unauthorized);
    assert(f.gate.updateCategory(wrong, "1", category_patch).kind == ErrorKind::Unauthorized);
    assert(f.gate.deleteCategory(wrong, "1").kind == ErrorKind::Unauthorized);
    assert(f.gate.createTag(wrong, tag).kind == ErrorKind::Unauthorized);
    assert(f.gate.updateTag(wrong, any_tag.id, tag_patch).kind == ErrorKind::Unauthorized);
    assert(f.gate.deleteTag(wrong, any_tag.id).kind == ErrorKind::Unauthorized);
    assert(f.gate.importPrompts(wrong, records).kind == ErrorKind::Unauthorized);
    assert(f.gate.loadTestData(wrong, records).kind == ErrorKind::Unauthorized);
    assert(f.gate.resetAll(wrong).kind == ErrorKind::Unauthorized);
    assert(f.gate.backupNow(wrong).kind == ErrorKind::Unauthorized);
    assert(f.gate.createPrompt("", input).kind == ErrorKind::Unauthorized);

    // Authorization comes before existence checks
    assert(f.gate.deletePrompt(wrong, "missing").kind == ErrorKind::Unauthorized);

    assert(f.snapshot() == before);
    assert(f.backups.listBackups().empty());
}

void testNoConfiguredSecretRefusesWrites() {
    std::cout << "[Test] no configured secret..." << std::endl;
    Fixture f("json", "backup", "");
    assert(!f.gate.verifySecret(""));
    assert(!f.gate.verifySecret(SECRET));

    TagInput tag;
    tag.name = "x";
    assert(f.gate.createTag("", tag).kind == ErrorKind::Unauthorized);
    assert(f.gate.createTag(SECRET, tag).kind == ErrorKind::Unauthorized);

    // Bootstrap still seeded the defaults
    assert(f.snapshot().categories.size() == 7);
}

void testSecretCheck() {
    std::cout << "[Test] secret check..." << std::endl;
    // Configured hashes are accepted in either case
    std::string upper = utils::sha256Hex(SECRET);
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    Fixture f("json", "backup", "  " + upper + "\n");
    assert(f.gate.verifySecret(SECRET));
    assert(!f.gate.verifySecret(SECRET + " "));
    assert(!f.gate.verifySecret("correct"));
}

void testResetBacksUpFirst(const std::string& backend) {
    std::cout << "[Test] " << backend << " reset backs up first..." << std::endl;
    Fixture f(backend);
    f.populate();
    CatalogState before = f.snapshot();
    assert(before.prompts.size() == 3);

    Result<BulkOutcome> reset = f.gate.resetAll(SECRET);
    assert(reset.isSuccess());
    assert(reset.value.prompt_count == 3);
    assert(utils::fileExists(reset.value.backup_path));
    assert(utils::startsWith(utils::getBasename(reset.value.backup_path), "backup_"));
    assert(f.backups.listBackups().size() == 1);

    // The backup holds the pre-reset state
    Result<CatalogState> saved = BackupManager::read(reset.value.backup_path);
    assert(saved.isSuccess());
    assert(saved.value == before);

    std::string text;
    assert(utils::readFile(reset.value.backup_path, text));
    json doc = json::parse(text);
    assert(doc["reason"] == "reset");
    assert(doc["backend"] == backend);

    CatalogState after = f.snapshot();
    assert(after.prompts.empty());
    assert(after.versions.empty());
    assert(after.tags.empty());
    assert(after.categories.size() == 7);
    assert(f.integrity.verify(after).empty());
}

void testFailedBackupAbortsReset() {
    std::cout << "[Test] failed backup aborts reset..." << std::endl;
    Fixture f("json", "blocked");
    // The backup directory path is taken by a regular file
    assert(utils::writeFile(f.dir.file("blocked"), "not a directory"));
    f.populate();
    CatalogState before = f.snapshot();

    Result<BulkOutcome> reset = f.gate.resetAll(SECRET);
    assert(!reset.isSuccess());
    assert(reset.kind == ErrorKind::StorageFailure);
    assert(f.snapshot() == before);

    std::vector<Prompt> records(1);
    records[0].title = "Replacement";
    records[0].content = "Body";
    assert(f.gate.loadTestData(SECRET, records).kind == ErrorKind::StorageFailure);
    assert(f.gate.backupNow(SECRET).kind == ErrorKind::StorageFailure);
    assert(f.snapshot() == before);
}

void testLoadTestData() {
    std::cout << "[Test] load test data..." << std::endl;
    Fixture f("json");
    f.populate();
    CatalogState before = f.snapshot();

    std::vector<Prompt> records(2);
    records[0].title = "Sample one";
    records[0].content = "First";
    records[0].tags = {"sample"};
    records[1].title = "Sample two";
    records[1].content = "Second";
    records[1].category_id = "4";

    Result<BulkOutcome> loaded = f.gate.loadTestData(SECRET, records);
    assert(loaded.isSuccess());
    assert(loaded.value.prompt_count == 2);
    assert(loaded.value.summary.created == 2);
    assert(BackupManager::read(loaded.value.backup_path).value == before);

    CatalogState after = f.snapshot();
    assert(after.prompts.size() == 2);
    assert(after.versions.size() == 2);
    // Categories survive
    assert(after.categories.size() == before.categories.size());
    assert(f.integrity.verify(after).empty());
}

void testManualBackupAndImport() {
    std::cout << "[Test] manual backup and import..." << std::endl;
    Fixture f("json");
    f.populate();
    CatalogState before = f.snapshot();

    Result<std::string> backup = f.gate.backupNow(SECRET);
    assert(backup.isSuccess());
    assert(BackupManager::read(backup.value).value == before);
    assert(f.snapshot() == before);

    std::vector<Prompt> records(1);
    records[0].title = "Imported";
    records[0].content = "Body";
    records[0].tags = {"fresh"};
    Result<ImportSummary> summary = f.gate.importPrompts(SECRET, records);
    assert(summary.isSuccess());
    assert(summary.value.created == 1);

    CatalogState after = f.snapshot();
    assert(after.prompts.size() == before.prompts.size() + 1);
    assert(after.findTagByName("fresh"));
    // Existing history is untouched
    for (size_t i = 0; i < before.versions.size(); i++) {
        assert(after.versions[i] == before.versions[i]);
    }
}

void testBackupsListedInCreationOrder() {
    std::cout << "[Test] backups listed oldest first..." << std::endl;
    test::TempDir dir("backup_order");
    std::string backup_dir = dir.file("backup");
    assert(utils::createDirs(backup_dir));
    const std::vector<std::string> names = {
        "backup_20240101_000000_10.json", "backup_20240101_000000_2.json", "backup_20240101_000000.json",
        "backup_20231231_235959_11.json", "backup_20240101_000000_1.json", "notes.txt",
    };
    for (const auto& name : names) {
        assert(utils::writeFile(utils::joinPath(backup_dir, name), "{}"));
    }

    BackupManager backups(backup_dir);
    std::vector<std::string> listed;
    for (const auto& path : backups.listBackups()) listed.push_back(utils::getBasename(path));
    assert(listed == std::vector<std::string>({
        "backup_20231231_235959_11.json", "backup_20240101_000000.json", "backup_20240101_000000_1.json",
        "backup_20240101_000000_2.json", "backup_20240101_000000_10.json",
    }));
}

void testPromptLifecycleThroughGate(const std::string& backend) {
    std::cout << "[Test] " << backend << " prompt lifecycle..." << std::endl;
    Fixture f(backend);
    QueryEngine query(*f.store);

    PromptInput input;
    input.title = "Lifecycle";
    input.content = "v1";
    input.tags = {"one"};
    Result<Prompt> created = f.gate.createPrompt(SECRET, input);
    assert(created.isSuccess());
    std::string id = created.value.id;

    PromptPatch patch;
    patch.content = std::string("v2");
    assert(f.gate.updatePrompt(SECRET, id, patch).value.current_version == "1.1");

    Result<Prompt> rolled = f.gate.rollbackPrompt(SECRET, id, "1.0");
    assert(rolled.isSuccess());
    assert(query.getPrompt(id).value.content == "v1");
    assert(query.getPrompt(id).value.current_version == "1.0");
    assert(query.listVersions(id).value.size() == 2);

    // Validation errors leave no trace
    CatalogState before = f.snapshot();
    PromptPatch invalid;
    invalid.title = std::string("");
    assert(f.gate.updatePrompt(SECRET, id, invalid).kind == ErrorKind::InvalidInput);
    assert(f.gate.deleteCategory(SECRET, FALLBACK_CATEGORY_ID).kind == ErrorKind::Conflict);
    assert(f.gate.deletePrompt(SECRET, "missing").kind == ErrorKind::NotFound);
    assert(f.snapshot() == before);

    const Tag* tag = before.findTagByName("one");
    assert(tag);
    TagPatch rename;
    rename.name = std::string("uno");
    assert(f.gate.updateTag(SECRET, tag->id, rename).value.affected_prompts == 1);
    assert(query.getPrompt(id).value.tags == std::vector<std::string>({"uno"}));

    assert(f.gate.deletePrompt(SECRET, id).isSuccess());
    assert(query.getPrompt(id).kind == ErrorKind::NotFound);
    // History outlives the prompt
    assert(query.listVersions(id).value.size() == 2);
}

void testInitializeRepairsLegacyFiles() {
    std::cout << "[Test] initialize repairs legacy files..." << std::endl;
    test::TempDir dir("legacy");
    assert(utils::writeFile(dir.file("prompts.json"), R"({"prompts": [
        {"id": 12, "title": "Old", "content": "Old body", "category_id": 3, "tags": ["kept"]}
    ]})"));

    auto store = test::openStore("json", dir.path());
    IntegrityManager integrity;
    BackupManager backups(dir.file("backup"));
    MutationGate gate(*store, integrity, backups, utils::sha256Hex(SECRET));
    assert(gate.initialize().isSuccess());

    Result<CatalogState> snap = store->snapshot();
    assert(snap.isSuccess());
    const Prompt* p = snap.value.findPrompt("12");
    assert(p);
    assert(p->category_id == "3");
    assert(p->category_name == "分析");
    assert(p->current_version == "1.0");
    assert(snap.value.findTagByName("kept"));
    assert(integrity.verify(snap.value).empty());

    // Running it again is a no-op
    assert(gate.initialize().isSuccess());
    assert(store->snapshot().value == snap.value);
}

void testUnresolvedProblemsKeepCatalogReadable(const std::string& backend) {
    std::cout << "[Test] " << backend << " catalog deeper than the configured limit..." << std::endl;
    Fixture f(backend);
    CategoryInput outer;
    outer.name = "Outer";
    outer.parent_id = "1";
    Result<Category> nested = f.gate.createCategory(SECRET, outer);
    assert(nested.isSuccess());
    assert(nested.value.level == 2);
    CatalogState before = f.snapshot();

    // Reopened under a stricter limit than the data was written with
    IntegrityOptions options;
    options.max_category_depth = 1;
    IntegrityManager strict(options);
    MutationGate gate(*f.store, strict, f.backups, utils::sha256Hex(SECRET));
    Result<std::vector<std::string>> opened = gate.initialize();
    assert(opened.isSuccess());
    assert(opened.value.size() == 1);
    assert(opened.value[0].find("Outer") != std::string::npos);

    QueryEngine query(*f.store);
    assert(query.listCategories().value.size() == 8);
    assert(query.checkConsistency(strict).value == opened.value);

    TagInput tag;
    tag.name = "blocked";
    assert(gate.createTag(SECRET, tag).kind == ErrorKind::ConsistencyViolation);
    assert(f.snapshot() == before);
    assert(IntegrityManager::checkDepthLimit(before, 1).kind == ErrorKind::Conflict);

    // A change that resolves the problem goes through
    CategoryPatch promote;
    promote.parent_id = std::string("");
    Result<Category> moved = gate.updateCategory(SECRET, nested.value.id, promote);
    assert(moved.isSuccess());
    assert(moved.value.level == 1);
    assert(gate.initialize().value.empty());
    assert(gate.createTag(SECRET, tag).isSuccess());
}

void testConcurrentWritersLoseNothing(const std::string& backend) {
    std::cout << "[Test] " << backend << " concurrent writers..." << std::endl;
    Fixture f(backend);

    PromptInput input;
    input.title = "Shared";
    input.content = "Body";
    std::string shared = f.gate.createPrompt(SECRET, input).value.id;

    const int NUM_THREADS = 8;
    const int USES_PER_THREAD = 10;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&f, &failures, &shared, t]() {
            for (int i = 0; i < USES_PER_THREAD; ++i) {
                if (!f.gate.usePrompt(shared).isSuccess()) failures++;
            }
            PromptInput own;
            own.title = "Thread " + std::to_string(t);
            own.content = "Body";
            own.tags = {"thread"};
            if (!f.gate.createPrompt(SECRET, own).isSuccess()) failures++;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    assert(failures == 0);
    CatalogState state = f.snapshot();
    assert(state.findPrompt(shared)->usage_count == NUM_THREADS * USES_PER_THREAD);
    assert(static_cast<int>(state.prompts.size()) == NUM_THREADS + 1);
    assert(state.tags.size() == 1);
    assert(f.integrity.verify(state).empty());
}

// One "prompthub add" run: its own store, gate and bootstrap
int addPromptsInChild(const std::string& backend, const std::string& dir, int child, int count) {
    auto store = test::openStore(backend, dir);
    IntegrityManager integrity;
    BackupManager backups(utils::joinPath(dir, "backup"));
    MutationGate gate(*store, integrity, backups, utils::sha256Hex(SECRET));
    if (!gate.initialize().isSuccess()) return 1;

    for (int i = 0; i < count; i++) {
        PromptInput input;
        input.title = "Process " + std::to_string(child) + " prompt " + std::to_string(i);
        input.content = "Body";
        input.tags = {"shared"};
        Result<Prompt> created = gate.createPrompt(SECRET, input);
        if (!created.isSuccess()) {
            std::cerr << "child add failed: " << created.error << std::endl;
            return 2;
        }
    }
    return 0;
}

void testConcurrentProcessesLoseNothing(const std::string& backend) {
    std::cout << "[Test] " << backend << " concurrent processes..." << std::endl;
    test::TempDir dir("gate_procs_" + backend);

    // Every child also races on seeding the empty catalog
    const int NUM_PROCESSES = 8;
    const int PROMPTS_PER_PROCESS = 4;
    std::vector<pid_t> children;
    for (int c = 0; c < NUM_PROCESSES; c++) {
        pid_t pid = fork();
        assert(pid >= 0);
        if (pid == 0) {
            _exit(addPromptsInChild(backend, dir.path(), c, PROMPTS_PER_PROCESS));
        }
        children.push_back(pid);
    }
    for (pid_t pid : children) {
        int status = 0;
        assert(waitpid(pid, &status, 0) == pid);
        assert(WIFEXITED(status) && WEXITSTATUS(status) == 0);
    }

    auto store = test::openStore(backend, dir.path());
    Result<CatalogState> snap = store->snapshot();
    assert(snap.isSuccess());
    const CatalogState& state = snap.value;
    assert(static_cast<int>(state.prompts.size()) == NUM_PROCESSES * PROMPTS_PER_PROCESS);
    assert(static_cast<int>(state.versions.size()) == NUM_PROCESSES * PROMPTS_PER_PROCESS);
    assert(state.categories.size() == 7);
    assert(state.tags.size() == 1);
    IntegrityManager integrity;
    assert(integrity.verify(state).empty());

    if (backend == "json") {
        for (const auto& name : utils::listDir(dir.path())) {
            assert(!utils::endsWith(name, ".tmp"));
            assert(name != "commit.journal");
        }
    }
}

} // namespace

int main() {
    std::cout << "[Test] Mutation gate" << std::endl;

    for (const std::string backend : {"json", "sqlite"}) {
        testWrongSecretChangesNothing(backend);
        testResetBacksUpFirst(backend);
        testPromptLifecycleThroughGate(backend);
        testConcurrentWritersLoseNothing(backend);
        testConcurrentProcessesLoseNothing(backend);
        testUnresolvedProblemsKeepCatalogReadable(backend);
    }
    testNoConfiguredSecretRefusesWrites();
    testSecretCheck();
    testFailedBackupAbortsReset();
    testLoadTestData();
    testManualBackupAndImport();
    testBackupsListedInCreationOrder();
    testInitializeRepairsLegacyFiles();

    std::cout << "[Test] All mutation gate tests passed" << std::endl;
    return 0;
}
