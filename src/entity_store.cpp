#include "entity_store.h"
#include "utils.h"
#include <iostream>

namespace prompthub {

const char* entityKindName(EntityKind kind) {
    switch (kind) {
        case EntityKind::Categories: return "categories";
        case EntityKind::Tags: return "tags";
        case EntityKind::Prompts: return "prompts";
        case EntityKind::Versions: return "versions";
    }
    return "unknown";
}

void ChangeSet::mark(EntityKind kind) {
    switch (kind) {
        case EntityKind::Categories: categories = true; break;
        case EntityKind::Tags: tags = true; break;
        case EntityKind::Prompts: prompts = true; break;
        case EntityKind::Versions: versions = true; break;
    }
}

bool ChangeSet::has(EntityKind kind) const {
    switch (kind) {
        case EntityKind::Categories: return categories;
        case EntityKind::Tags: return tags;
        case EntityKind::Prompts: return prompts;
        case EntityKind::Versions: return versions;
    }
    return false;
}

// ============================================================================
// EntityStore
// ============================================================================

EntityStore::EntityStore(std::unique_ptr<StoreBackend> backend)
    : backend_(std::move(backend))
{
}

EntityStore::~EntityStore() {
    close();
}

std::unique_ptr<StoreBackend> EntityStore::createBackend(const std::string& name) {
    if (name == "json") {
        return std::make_unique<JsonFileBackend>();
    } else if (name == "sqlite") {
        return std::make_unique<SQLiteBackend>();
    }
    std::cerr << "Unknown storage backend: " << name << std::endl;
    return nullptr;
}

std::vector<std::string> EntityStore::getAvailableBackends() {
    return {"json", "sqlite"};
}

bool EntityStore::open(const std::string& location) {
    if (!backend_) return false;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return backend_->open(location);
}

void EntityStore::close() {
    if (!backend_) return;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    backend_->close();
}

bool EntityStore::isOpen() const {
    return backend_ && backend_->isOpen();
}

std::string EntityStore::getBackend() const {
    return backend_ ? backend_->getName() : "";
}

std::string EntityStore::getLocation() const {
    return backend_ ? backend_->getLocation() : "";
}

Result<CatalogState> EntityStore::load(EntityKind kind) const {
    if (!isOpen()) {
        return Result<CatalogState>::fail(ErrorKind::StorageFailure, "Store is not open");
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::unique_ptr<StoreLock> guard;
    Status st = backend_->acquire(LockMode::Shared, guard);
    if (!st.isSuccess()) return Result<CatalogState>::fail(st);

    CatalogState state;
    st = backend_->load(kind, state);
    if (!st.isSuccess()) return Result<CatalogState>::fail(st);
    return Result<CatalogState>::ok(std::move(state));
}

Status EntityStore::save(EntityKind kind, const CatalogState& state) {
    if (!isOpen()) {
        return Status::fail(ErrorKind::StorageFailure, "Store is not open");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::unique_ptr<StoreLock> guard;
    Status st = backend_->acquire(LockMode::Exclusive, guard);
    if (!st.isSuccess()) return st;

    ChangeSet changes;
    changes.mark(kind);
    return backend_->commit(state, changes);
}

Status EntityStore::loadAll(CatalogState& state) const {
    for (EntityKind kind : {EntityKind::Categories, EntityKind::Tags, EntityKind::Prompts, EntityKind::Versions}) {
        Status st = backend_->load(kind, state);
        if (!st.isSuccess()) return st;
    }
    return Status::ok();
}

Result<CatalogState> EntityStore::snapshot() const {
    if (!isOpen()) {
        return Result<CatalogState>::fail(ErrorKind::StorageFailure, "Store is not open");
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::unique_ptr<StoreLock> guard;
    Status st = backend_->acquire(LockMode::Shared, guard);
    if (!st.isSuccess()) return Result<CatalogState>::fail(st);

    CatalogState state;
    st = loadAll(state);
    if (!st.isSuccess()) return Result<CatalogState>::fail(st);
    return Result<CatalogState>::ok(std::move(state));
}

Status EntityStore::transact(const TransactionFn& fn) {
    if (!isOpen()) {
        return Status::fail(ErrorKind::StorageFailure, "Store is not open");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);

    // Held across load, fn and commit so writers in other processes queue
    // behind this one instead of committing over it
    std::unique_ptr<StoreLock> guard;
    Status st = backend_->acquire(LockMode::Exclusive, guard);
    if (!st.isSuccess()) return st;

    CatalogState state;
    st = loadAll(state);
    if (!st.isSuccess()) return st;

    ChangeSet changes;
    st = fn(state, changes);
    if (!st.isSuccess()) {
        utils::debugLog(std::string("Transaction aborted (") + errorKindName(st.kind) + "): " + st.error);
        return st;
    }
    if (!changes.any()) return Status::ok();

    st = backend_->commit(state, changes);
    if (!st.isSuccess()) {
        std::cerr << "Commit to " << backend_->getName() << " store failed: " << st.error << std::endl;
    }
    return st;
}

} // namespace prompthub
