#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "entity_store.h"
#include "integrity_manager.h"
#include "utils.h"
#include "test_support.h"

using namespace prompthub;

namespace {

CatalogState sampleState() {
    CatalogState state;
    state.categories = IntegrityManager::defaultCategories();

    Category child;
    child.id = "c-web";
    child.name = "Web";
    child.parent_id = "1";
    child.level = 2;
    child.path = "编程/Web";
    child.created_at = "2024-05-01T10:00:00.000000";
    child.updated_at = child.created_at;
    state.categories.push_back(child);

    Tag tag;
    tag.id = "t-1";
    tag.name = "react";
    tag.color = "#FF0000";
    tag.created_at = "2024-05-01T10:00:00.000000";
    tag.updated_at = tag.created_at;
    state.tags.push_back(tag);

    Prompt p;
    p.id = "p-1";
    p.title = "Component review";
    p.content = "Review this component:\n{code}";
    p.description = "Line one, \"quoted\"";
    p.category_id = "c-web";
    p.category_name = "Web";
    p.category_path = "编程/Web";
    p.tags = {"react"};
    p.usage_count = 3;
    p.current_version = "1.1";
    p.created_at = "2024-05-01T10:00:00.000000";
    p.updated_at = "2024-05-02T10:00:00.000000";
    state.prompts.push_back(p);

    PromptVersion v1;
    v1.prompt_id = "p-1";
    v1.version = "1.0";
    v1.title = "Component review";
    v1.content = "Review:\n{code}";
    v1.change_note = "Initial version";
    v1.created_at = "2024-05-01T10:00:00.000000";
    PromptVersion v2 = v1;
    v2.version = "1.1";
    v2.content = p.content;
    v2.description = p.description;
    v2.change_note = "Updated";
    v2.created_at = "2024-05-02T10:00:00.000000";
    state.versions = {v1, v2};
    return state;
}

Status writeAll(EntityStore& store, const CatalogState& state) {
    return store.transact([&state](CatalogState& current, ChangeSet& changes) {
        current = state;
        changes.mark(EntityKind::Categories);
        changes.mark(EntityKind::Tags);
        changes.mark(EntityKind::Prompts);
        changes.mark(EntityKind::Versions);
        return Status::ok();
    });
}

void testRoundTrip(const std::string& backend) {
    std::cout << "[Test] " << backend << " round trip..." << std::endl;
    test::TempDir dir("store_" + backend);
    CatalogState state = sampleState();

    {
        auto store = test::openStore(backend, dir.path());
        assert(writeAll(*store, state).isSuccess());

        Result<CatalogState> snap = store->snapshot();
        assert(snap.isSuccess());
        assert(snap.value == state);
    }

    // A fresh process sees the same data
    auto reopened = test::openStore(backend, dir.path());
    Result<CatalogState> snap = reopened->snapshot();
    assert(snap.isSuccess());
    assert(snap.value == state);

    // Loading twice without writes yields the same collection
    Result<CatalogState> a = reopened->load(EntityKind::Prompts);
    Result<CatalogState> b = reopened->load(EntityKind::Prompts);
    assert(a.isSuccess() && b.isSuccess());
    assert(a.value.prompts == b.value.prompts);
    assert(a.value.prompts == state.prompts);
}

void testSingleCollectionSave(const std::string& backend) {
    std::cout << "[Test] " << backend << " single collection save..." << std::endl;
    test::TempDir dir("save_" + backend);
    auto store = test::openStore(backend, dir.path());
    CatalogState state = sampleState();
    assert(writeAll(*store, state).isSuccess());

    CatalogState tags_only;
    Tag extra;
    extra.id = "t-2";
    extra.name = "vue";
    tags_only.tags = state.tags;
    tags_only.tags.push_back(extra);
    assert(store->save(EntityKind::Tags, tags_only).isSuccess());

    Result<CatalogState> snap = store->snapshot();
    assert(snap.isSuccess());
    assert(snap.value.tags.size() == 2);
    assert(snap.value.tags[1].name == "vue");
    // Other collections untouched
    assert(snap.value.prompts == state.prompts);
    assert(snap.value.versions == state.versions);
}

void testEmptyStore(const std::string& backend) {
    std::cout << "[Test] " << backend << " empty store..." << std::endl;
    test::TempDir dir("empty_" + backend);
    auto store = test::openStore(backend, dir.path());

    Result<CatalogState> snap = store->snapshot();
    assert(snap.isSuccess());
    assert(snap.value.categories.empty());
    assert(snap.value.tags.empty());
    assert(snap.value.prompts.empty());
    assert(snap.value.versions.empty());
}

void testFailedTransactionWritesNothing(const std::string& backend) {
    std::cout << "[Test] " << backend << " failed transaction..." << std::endl;
    test::TempDir dir("abort_" + backend);
    auto store = test::openStore(backend, dir.path());
    CatalogState state = sampleState();
    assert(writeAll(*store, state).isSuccess());

    Status st = store->transact([](CatalogState& current, ChangeSet& changes) {
        current.prompts.clear();
        changes.mark(EntityKind::Prompts);
        return Status::fail(ErrorKind::InvalidInput, "rejected");
    });
    assert(!st.isSuccess());
    assert(st.kind == ErrorKind::InvalidInput);

    Result<CatalogState> snap = store->snapshot();
    assert(snap.isSuccess());
    assert(snap.value == state);
}

void testJsonFileLayout() {
    std::cout << "[Test] json file layout..." << std::endl;
    test::TempDir dir("layout");
    auto store = test::openStore("json", dir.path());
    assert(writeAll(*store, sampleState()).isSuccess());

    for (const char* name : {"categories.json", "tags.json", "prompts.json", "versions.json"}) {
        assert(utils::fileExists(dir.file(name)));
    }
    for (const auto& name : utils::listDir(dir.path())) {
        assert(!utils::endsWith(name, ".tmp"));
        assert(name != "commit.journal");
    }

    std::string text;
    assert(utils::readFile(dir.file("prompts.json"), text));
    json doc = json::parse(text);
    assert(doc.contains("prompts"));
    assert(doc["prompts"].size() == 1);
    assert(doc["prompts"][0]["title"] == "Component review");
}

void testJsonBareArrayAccepted() {
    std::cout << "[Test] json bare array..." << std::endl;
    test::TempDir dir("bare");
    assert(utils::writeFile(dir.file("tags.json"),
                            R"([{"id": 5, "name": "legacy"}, {"id": "t-9", "name": "new", "color": "#000000"}])"));
    auto store = test::openStore("json", dir.path());

    Result<CatalogState> tags = store->load(EntityKind::Tags);
    assert(tags.isSuccess());
    assert(tags.value.tags.size() == 2);
    assert(tags.value.tags[0].id == "5");
    assert(tags.value.tags[0].color == DEFAULT_TAG_COLOR);
    assert(tags.value.tags[1].color == "#000000");
}

void testCorruptJsonIsStorageFailure() {
    std::cout << "[Test] corrupt json..." << std::endl;
    test::TempDir dir("corrupt");
    assert(utils::writeFile(dir.file("prompts.json"), "{\"prompts\": [ {\"id\": \"p-1\", "));
    auto store = test::openStore("json", dir.path());

    Result<CatalogState> prompts = store->load(EntityKind::Prompts);
    assert(!prompts.isSuccess());
    assert(prompts.kind == ErrorKind::StorageFailure);

    Result<CatalogState> snap = store->snapshot();
    assert(!snap.isSuccess());
    assert(snap.kind == ErrorKind::StorageFailure);

    // Wrong shape is corrupt as well
    assert(utils::writeFile(dir.file("prompts.json"), "{\"prompts\": 42}"));
    assert(store->load(EntityKind::Prompts).kind == ErrorKind::StorageFailure);

    // An empty file reads as an empty collection
    assert(utils::writeFile(dir.file("prompts.json"), "  \n"));
    Result<CatalogState> empty = store->load(EntityKind::Prompts);
    assert(empty.isSuccess());
    assert(empty.value.prompts.empty());
}

json collectionDoc(EntityKind kind, const CatalogState& state) {
    return JsonFileBackend::serialize(kind, state);
}

void testInterruptedJsonCommitIsCompleted() {
    std::cout << "[Test] interrupted json commit..." << std::endl;
    test::TempDir dir("journal");
    CatalogState before = sampleState();
    {
        auto store = test::openStore("json", dir.path());
        assert(writeAll(*store, before).isSuccess());
    }

    CatalogState after = before;
    after.prompts[0].content = "Third draft";
    after.prompts[0].current_version = "1.2";
    PromptVersion v3 = after.versions.back();
    v3.version = "1.2";
    v3.content = "Third draft";
    after.versions.push_back(v3);

    // Crash after the journal was published and the prompts rename happened,
    // before versions.json was replaced
    assert(utils::writeFile(dir.file("prompts.json"), collectionDoc(EntityKind::Prompts, after).dump(2)));
    assert(utils::writeFile(dir.file("versions.json.4242.deadbeef.tmp"),
                            collectionDoc(EntityKind::Versions, after).dump(2)));
    json journal;
    journal["renames"] = json::array({
        {{"from", "prompts.json.4242.cafebabe.tmp"}, {"to", "prompts.json"}},
        {{"from", "versions.json.4242.deadbeef.tmp"}, {"to", "versions.json"}}
    });
    assert(utils::writeFile(dir.file("commit.journal"), journal.dump()));
    // A writer that died while staging
    assert(utils::writeFile(dir.file("tags.json.777.0badf00d.tmp"), "{\"tags\": ["));

    auto store = test::openStore("json", dir.path());
    Result<CatalogState> snap = store->snapshot();
    assert(snap.isSuccess());
    assert(snap.value.prompts == after.prompts);
    assert(snap.value.versions == after.versions);
    assert(snap.value.tags == before.tags);
    assert(!utils::fileExists(dir.file("commit.journal")));
    for (const auto& name : utils::listDir(dir.path())) {
        assert(!utils::endsWith(name, ".tmp"));
    }

    // Without a journal, plain reads leave staging files alone and the next writer clears them
    assert(utils::writeFile(dir.file("prompts.json.778.0badcafe.tmp"), "{"));
    assert(store->snapshot().isSuccess());
    assert(utils::fileExists(dir.file("prompts.json.778.0badcafe.tmp")));
    assert(store->transact([](CatalogState&, ChangeSet&) { return Status::ok(); }).isSuccess());
    assert(!utils::fileExists(dir.file("prompts.json.778.0badcafe.tmp")));

    // An unreadable journal is a storage failure, not silently skipped
    assert(utils::writeFile(dir.file("commit.journal"), "{\"renames\": 3"));
    assert(store->snapshot().kind == ErrorKind::StorageFailure);
}

// Each child process opens the store on its own, as separate CLI runs do
int bumpUsageInChild(const std::string& backend, const std::string& dir, int rounds) {
    auto store = test::openStore(backend, dir);
    for (int i = 0; i < rounds; i++) {
        Status st = store->transact([](CatalogState& state, ChangeSet& changes) {
            state.prompts[0].usage_count++;
            changes.mark(EntityKind::Prompts);
            return Status::ok();
        });
        if (!st.isSuccess()) {
            std::cerr << "child transaction failed: " << st.error << std::endl;
            return 1;
        }
    }
    return 0;
}

void testWritersInOtherProcessesLoseNothing(const std::string& backend) {
    std::cout << "[Test] " << backend << " writers in other processes..." << std::endl;
    test::TempDir dir("procs_" + backend);
    CatalogState state = sampleState();
    state.prompts[0].usage_count = 0;
    {
        auto store = test::openStore(backend, dir.path());
        assert(writeAll(*store, state).isSuccess());
    }

    const int NUM_PROCESSES = 6;
    const int ROUNDS = 20;
    std::vector<pid_t> children;
    for (int c = 0; c < NUM_PROCESSES; c++) {
        pid_t pid = fork();
        assert(pid >= 0);
        if (pid == 0) {
            _exit(bumpUsageInChild(backend, dir.path(), ROUNDS));
        }
        children.push_back(pid);
    }

    // Readers in this process never see a torn catalog meanwhile
    auto store = test::openStore(backend, dir.path());
    for (int i = 0; i < 20; i++) {
        Result<CatalogState> snap = store->snapshot();
        assert(snap.isSuccess());
        assert(snap.value.prompts.size() == 1);
        assert(snap.value.versions == state.versions);
    }

    for (pid_t pid : children) {
        int status = 0;
        assert(waitpid(pid, &status, 0) == pid);
        assert(WIFEXITED(status) && WEXITSTATUS(status) == 0);
    }

    Result<CatalogState> snap = store->snapshot();
    assert(snap.isSuccess());
    assert(snap.value.prompts[0].usage_count == NUM_PROCESSES * ROUNDS);
    assert(snap.value.categories == state.categories);
}

void testBackendFactory() {
    std::cout << "[Test] backend factory..." << std::endl;
    assert(EntityStore::createBackend("json") != nullptr);
    assert(EntityStore::createBackend("sqlite") != nullptr);
    assert(EntityStore::createBackend("mongodb") == nullptr);
    assert(EntityStore::getAvailableBackends().size() == 2);

    EntityStore closed(EntityStore::createBackend("json"));
    assert(!closed.isOpen());
    assert(closed.snapshot().kind == ErrorKind::StorageFailure);
}

} // namespace

int main() {
    std::cout << "[Test] Entity store" << std::endl;

    for (const std::string backend : {"json", "sqlite"}) {
        testRoundTrip(backend);
        testSingleCollectionSave(backend);
        testEmptyStore(backend);
        testFailedTransactionWritesNothing(backend);
        testWritersInOtherProcessesLoseNothing(backend);
    }
    testJsonFileLayout();
    testInterruptedJsonCommitIsCompleted();
    testJsonBareArrayAccepted();
    testCorruptJsonIsStorageFailure();
    testBackendFactory();

    std::cout << "[Test] All entity store tests passed" << std::endl;
    return 0;
}
