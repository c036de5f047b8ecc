#ifndef PROMPTHUB_ENTITY_STORE_H
#define PROMPTHUB_ENTITY_STORE_H

#include "errors.h"
#include "models.h"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <functional>

namespace prompthub {

enum class EntityKind {
    Categories,
    Tags,
    Prompts,
    Versions
};

const char* entityKindName(EntityKind kind);

// Collections a transaction has rewritten
struct ChangeSet {
    bool categories = false;
    bool tags = false;
    bool prompts = false;
    bool versions = false;

    void mark(EntityKind kind);
    bool has(EntityKind kind) const;
    bool any() const { return categories || tags || prompts || versions; }
};

enum class LockMode {
    Shared,     // consistent read of all collections
    Exclusive   // load -> commit cycle
};

// Lock on the backing storage, shared with every process that opens the same
// location. Released when destroyed.
class StoreLock {
public:
    virtual ~StoreLock() = default;
};

// Storage backend interface
class StoreBackend {
public:
    virtual ~StoreBackend() = default;

    // Lifecycle
    virtual bool open(const std::string& location) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Replaces the given collection of state with what is persisted.
    // Missing data loads as an empty collection; corrupt data is a StorageFailure.
    virtual Status load(EntityKind kind, CatalogState& state) = 0;

    // Blocks until the lock is granted. Loads and commits made while an
    // exclusive lock is held cannot interleave with any other process.
    virtual Status acquire(LockMode mode, std::unique_ptr<StoreLock>& lock) = 0;

    // Persists every collection flagged in changes as one atomic unit
    virtual Status commit(const CatalogState& state, const ChangeSet& changes) = 0;

    virtual std::string getName() const = 0;
    virtual std::string getLocation() const = 0;
};

// One pretty-printed JSON file per collection inside a data directory
class JsonFileBackend : public StoreBackend {
public:
    JsonFileBackend();
    ~JsonFileBackend() override;

    bool open(const std::string& data_dir) override;
    void close() override;
    bool isOpen() const override;

    Status acquire(LockMode mode, std::unique_ptr<StoreLock>& lock) override;
    Status load(EntityKind kind, CatalogState& state) override;
    Status commit(const CatalogState& state, const ChangeSet& changes) override;

    std::string getName() const override { return "json"; }
    std::string getLocation() const override { return data_dir_; }

    std::string getFilePath(EntityKind kind) const;
    // flock(2) target
    std::string getLockPath() const;
    // Renames still owed by a multi-file commit; present only while one is in flight
    std::string getJournalPath() const;

    static json serialize(EntityKind kind, const CatalogState& state);

private:
    std::string data_dir_;
    bool open_;

    static const char* fileName(EntityKind kind);

    // Finishes an interrupted commit and drops orphaned temp files.
    // Caller holds the exclusive lock.
    Status recover();
};

// Normalized relational schema in a single SQLite database file
class SQLiteBackend : public StoreBackend {
public:
    SQLiteBackend();
    ~SQLiteBackend() override;

    bool open(const std::string& db_path) override;
    void close() override;
    bool isOpen() const override;

    Status acquire(LockMode mode, std::unique_ptr<StoreLock>& lock) override;
    Status load(EntityKind kind, CatalogState& state) override;
    Status commit(const CatalogState& state, const ChangeSet& changes) override;

    std::string getName() const override { return "sqlite"; }
    std::string getLocation() const override { return db_path_; }

private:
    class Session;

    void* db_;  // sqlite3*
    std::string db_path_;
    std::mutex conn_mutex_;
    // One open transaction per connection
    std::mutex session_mutex_;

    bool createTables();
    bool exec(const char* sql, std::string& error);
    std::string lastError() const;

    Status loadCategories(CatalogState& state);
    Status loadTags(CatalogState& state);
    Status loadPrompts(CatalogState& state);
    Status loadVersions(CatalogState& state);

    bool saveCategories(const CatalogState& state, std::string& error);
    bool saveTags(const CatalogState& state, std::string& error);
    bool savePrompts(const CatalogState& state, std::string& error);
    bool saveVersions(const CatalogState& state, std::string& error);
    bool touchSettings(std::string& error);
};

// Owns the backend and the per-store reader/writer lock
class EntityStore {
public:
    using TransactionFn = std::function<Status(CatalogState&, ChangeSet&)>;

    explicit EntityStore(std::unique_ptr<StoreBackend> backend);
    ~EntityStore();

    // Creates a backend by name ("json" or "sqlite"); nullptr for unknown names
    static std::unique_ptr<StoreBackend> createBackend(const std::string& name);
    static std::vector<std::string> getAvailableBackends();

    bool open(const std::string& location);
    void close();
    bool isOpen() const;

    std::string getBackend() const;
    std::string getLocation() const;

    // Single collection access
    Result<CatalogState> load(EntityKind kind) const;
    Status save(EntityKind kind, const CatalogState& state);

    // All four collections as one consistent view
    Result<CatalogState> snapshot() const;

    // Exclusive load -> fn -> commit cycle, excluding other threads and other
    // processes on the same location. Nothing is written unless fn succeeds.
    Status transact(const TransactionFn& fn);

private:
    std::unique_ptr<StoreBackend> backend_;
    mutable std::shared_mutex mutex_;

    Status loadAll(CatalogState& state) const;
};

} // namespace prompthub

#endif // PROMPTHUB_ENTITY_STORE_H
