#include "entity_store.h"
#include "utils.h"
#include <sqlite3.h>
#include <iostream>
#include <map>

// Helper macro to cast db_
#define DB() (reinterpret_cast<sqlite3*>(db_))

namespace prompthub {

namespace {

const char* SCHEMA_VERSION = "2.0";

std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

void bindText(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt* stmt, int idx, const std::string& value) {
    if (value.empty()) {
        sqlite3_bind_null(stmt, idx);
    } else {
        bindText(stmt, idx, value);
    }
}

} // namespace

// Open transaction on the shared connection. A read session commits on
// release; an exclusive one still open at release never reached COMMIT
// and is rolled back.
class SQLiteBackend::Session : public StoreLock {
public:
    Session(SQLiteBackend& backend, LockMode mode, std::unique_lock<std::mutex> session)
        : backend_(backend)
        , mode_(mode)
        , session_(std::move(session))
    {
    }

    ~Session() override {
        std::lock_guard<std::mutex> lock(backend_.conn_mutex_);
        sqlite3* db = reinterpret_cast<sqlite3*>(backend_.db_);
        if (!db || sqlite3_get_autocommit(db)) return;

        std::string error;
        const char* sql = mode_ == LockMode::Shared ? "COMMIT" : "ROLLBACK";
        if (!backend_.exec(sql, error)) {
            std::cerr << "Cannot end catalog transaction: " << error << std::endl;
        }
    }

private:
    SQLiteBackend& backend_;
    LockMode mode_;
    std::unique_lock<std::mutex> session_;
};

SQLiteBackend::SQLiteBackend()
    : db_(nullptr)
{
}

SQLiteBackend::~SQLiteBackend() {
    close();
}

bool SQLiteBackend::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (db_) return true;

    std::string dir = utils::getDirname(db_path);
    if (dir != "." && !utils::createDirs(dir)) {
        std::cerr << "Cannot create directory for database: " << dir << std::endl;
        return false;
    }

    sqlite3* db_ptr = nullptr;
    int rc = sqlite3_open(db_path.c_str(), &db_ptr);
    db_ = db_ptr;
    if (rc != SQLITE_OK) {
        std::cerr << "Cannot open catalog database: " << sqlite3_errmsg(DB()) << std::endl;
        sqlite3_close(DB());
        db_ = nullptr;
        return false;
    }

    db_path_ = db_path;
    sqlite3_busy_timeout(DB(), 30000);

    if (!createTables()) {
        sqlite3_close(DB());
        db_ = nullptr;
        return false;
    }
    return true;
}

void SQLiteBackend::close() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (db_) {
        sqlite3_close(DB());
        db_ = nullptr;
    }
}

bool SQLiteBackend::isOpen() const {
    return db_ != nullptr;
}

std::string SQLiteBackend::lastError() const {
    return db_ ? sqlite3_errmsg(reinterpret_cast<sqlite3*>(db_)) : "database not open";
}

bool SQLiteBackend::exec(const char* sql, std::string& error) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(DB(), sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        error = errmsg ? errmsg : lastError();
        if (errmsg) sqlite3_free(errmsg);
        return false;
    }
    return true;
}

bool SQLiteBackend::createTables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS categories (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            color TEXT NOT NULL,
            description TEXT,
            parent_id TEXT,
            level INTEGER NOT NULL DEFAULT 1,
            path TEXT NOT NULL,
            position INTEGER NOT NULL,
            created_at TEXT,
            updated_at TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_categories_parent ON categories(parent_id);

        CREATE TABLE IF NOT EXISTS tags (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL UNIQUE,
            color TEXT NOT NULL,
            position INTEGER NOT NULL,
            created_at TEXT,
            updated_at TEXT
        );

        CREATE TABLE IF NOT EXISTS prompts (
            id TEXT PRIMARY KEY,
            title TEXT NOT NULL,
            content TEXT NOT NULL,
            description TEXT,
            category_id TEXT NOT NULL,
            category_name TEXT,
            category_path TEXT,
            usage_count INTEGER NOT NULL DEFAULT 0,
            current_version TEXT,
            position INTEGER NOT NULL,
            created_at TEXT,
            updated_at TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_prompts_category ON prompts(category_id);

        CREATE TABLE IF NOT EXISTS prompt_tags (
            prompt_id TEXT NOT NULL,
            tag_name TEXT NOT NULL,
            position INTEGER NOT NULL,
            PRIMARY KEY (prompt_id, tag_name)
        );
        CREATE INDEX IF NOT EXISTS idx_prompt_tags_tag ON prompt_tags(tag_name);

        CREATE TABLE IF NOT EXISTS prompt_versions (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            prompt_id TEXT NOT NULL,
            version TEXT NOT NULL,
            title TEXT NOT NULL,
            content TEXT NOT NULL,
            description TEXT,
            change_note TEXT,
            created_at TEXT,
            UNIQUE (prompt_id, version)
        );
        CREATE INDEX IF NOT EXISTS idx_prompt_versions_prompt ON prompt_versions(prompt_id);

        CREATE TABLE IF NOT EXISTS settings (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )";

    std::string error;
    if (!exec(sql, error)) {
        std::cerr << "Failed to create catalog tables: " << error << std::endl;
        return false;
    }
    return true;
}

// ============================================================================
// Locking
// ============================================================================

Status SQLiteBackend::acquire(LockMode mode, std::unique_ptr<StoreLock>& lock) {
    std::unique_lock<std::mutex> session(session_mutex_);
    {
        std::lock_guard<std::mutex> conn(conn_mutex_);
        if (!db_) {
            return Status::fail(ErrorKind::StorageFailure, "SQLite store is not open");
        }
        // IMMEDIATE takes the write lock before anything is read, so the
        // snapshot a writer mutates is the one it commits over
        std::string error;
        const char* sql = mode == LockMode::Exclusive ? "BEGIN IMMEDIATE TRANSACTION" : "BEGIN TRANSACTION";
        if (!exec(sql, error)) {
            return Status::fail(ErrorKind::StorageFailure, "Cannot lock catalog database: " + error);
        }
    }
    lock = std::make_unique<Session>(*this, mode, std::move(session));
    return Status::ok();
}

// ============================================================================
// Load
// ============================================================================

Status SQLiteBackend::load(EntityKind kind, CatalogState& state) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!db_) {
        return Status::fail(ErrorKind::StorageFailure, "SQLite store is not open");
    }

    switch (kind) {
        case EntityKind::Categories: return loadCategories(state);
        case EntityKind::Tags: return loadTags(state);
        case EntityKind::Prompts: return loadPrompts(state);
        case EntityKind::Versions: return loadVersions(state);
    }
    return Status::fail(ErrorKind::StorageFailure, "Unknown collection");
}

Status SQLiteBackend::loadCategories(CatalogState& state) {
    state.categories.clear();

    sqlite3_stmt* stmt;
    const char* sql = "SELECT id, name, color, description, parent_id, level, path, created_at, updated_at "
                      "FROM categories ORDER BY position";
    if (sqlite3_prepare_v2(DB(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Status::fail(ErrorKind::StorageFailure, "Cannot read categories: " + lastError());
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Category c;
        c.id = columnText(stmt, 0);
        c.name = columnText(stmt, 1);
        c.color = columnText(stmt, 2);
        c.description = columnText(stmt, 3);
        c.parent_id = columnText(stmt, 4);
        c.level = sqlite3_column_int(stmt, 5);
        c.path = columnText(stmt, 6);
        c.created_at = columnText(stmt, 7);
        c.updated_at = columnText(stmt, 8);
        state.categories.push_back(c);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Status::fail(ErrorKind::StorageFailure, "Cannot read categories: " + lastError());
    }
    return Status::ok();
}

Status SQLiteBackend::loadTags(CatalogState& state) {
    state.tags.clear();

    sqlite3_stmt* stmt;
    const char* sql = "SELECT id, name, color, created_at, updated_at FROM tags ORDER BY position";
    if (sqlite3_prepare_v2(DB(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Status::fail(ErrorKind::StorageFailure, "Cannot read tags: " + lastError());
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Tag t;
        t.id = columnText(stmt, 0);
        t.name = columnText(stmt, 1);
        t.color = columnText(stmt, 2);
        t.created_at = columnText(stmt, 3);
        t.updated_at = columnText(stmt, 4);
        state.tags.push_back(t);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Status::fail(ErrorKind::StorageFailure, "Cannot read tags: " + lastError());
    }
    return Status::ok();
}

Status SQLiteBackend::loadPrompts(CatalogState& state) {
    state.prompts.clear();

    sqlite3_stmt* stmt;
    const char* sql = "SELECT id, title, content, description, category_id, category_name, category_path, "
                      "usage_count, current_version, created_at, updated_at FROM prompts ORDER BY position";
    if (sqlite3_prepare_v2(DB(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Status::fail(ErrorKind::StorageFailure, "Cannot read prompts: " + lastError());
    }

    std::map<std::string, size_t> index;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Prompt p;
        p.id = columnText(stmt, 0);
        p.title = columnText(stmt, 1);
        p.content = columnText(stmt, 2);
        p.description = columnText(stmt, 3);
        p.category_id = columnText(stmt, 4);
        p.category_name = columnText(stmt, 5);
        p.category_path = columnText(stmt, 6);
        p.usage_count = sqlite3_column_int(stmt, 7);
        p.current_version = columnText(stmt, 8);
        p.created_at = columnText(stmt, 9);
        p.updated_at = columnText(stmt, 10);
        index[p.id] = state.prompts.size();
        state.prompts.push_back(p);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Status::fail(ErrorKind::StorageFailure, "Cannot read prompts: " + lastError());
    }

    const char* tag_sql = "SELECT prompt_id, tag_name FROM prompt_tags ORDER BY prompt_id, position";
    if (sqlite3_prepare_v2(DB(), tag_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Status::fail(ErrorKind::StorageFailure, "Cannot read prompt tags: " + lastError());
    }
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto it = index.find(columnText(stmt, 0));
        if (it != index.end()) {
            state.prompts[it->second].tags.push_back(columnText(stmt, 1));
        }
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Status::fail(ErrorKind::StorageFailure, "Cannot read prompt tags: " + lastError());
    }
    return Status::ok();
}

Status SQLiteBackend::loadVersions(CatalogState& state) {
    state.versions.clear();

    sqlite3_stmt* stmt;
    const char* sql = "SELECT prompt_id, version, title, content, description, change_note, created_at "
                      "FROM prompt_versions ORDER BY seq";
    if (sqlite3_prepare_v2(DB(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Status::fail(ErrorKind::StorageFailure, "Cannot read versions: " + lastError());
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        PromptVersion v;
        v.prompt_id = columnText(stmt, 0);
        v.version = columnText(stmt, 1);
        v.title = columnText(stmt, 2);
        v.content = columnText(stmt, 3);
        v.description = columnText(stmt, 4);
        v.change_note = columnText(stmt, 5);
        v.created_at = columnText(stmt, 6);
        state.versions.push_back(v);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return Status::fail(ErrorKind::StorageFailure, "Cannot read versions: " + lastError());
    }
    return Status::ok();
}

// ============================================================================
// Commit
// ============================================================================

Status SQLiteBackend::commit(const CatalogState& state, const ChangeSet& changes) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!db_) {
        return Status::fail(ErrorKind::StorageFailure, "SQLite store is not open");
    }

    // Inside an exclusive session the transaction is already open
    std::string error;
    if (sqlite3_get_autocommit(DB()) && !exec("BEGIN IMMEDIATE TRANSACTION", error)) {
        return Status::fail(ErrorKind::StorageFailure, "Cannot begin transaction: " + error);
    }

    bool ok = true;
    if (ok && changes.categories) ok = saveCategories(state, error);
    if (ok && changes.tags) ok = saveTags(state, error);
    if (ok && changes.prompts) ok = savePrompts(state, error);
    if (ok && changes.versions) ok = saveVersions(state, error);
    if (ok) ok = touchSettings(error);

    if (!ok) {
        std::string rollback_error;
        if (!exec("ROLLBACK", rollback_error)) {
            std::cerr << "Rollback failed: " << rollback_error << std::endl;
        }
        return Status::fail(ErrorKind::StorageFailure, "Commit failed: " + error);
    }

    if (!exec("COMMIT", error)) {
        std::string rollback_error;
        if (!sqlite3_get_autocommit(DB()) && !exec("ROLLBACK", rollback_error)) {
            std::cerr << "Rollback failed: " << rollback_error << std::endl;
        }
        return Status::fail(ErrorKind::StorageFailure, "Commit failed: " + error);
    }
    return Status::ok();
}

bool SQLiteBackend::saveCategories(const CatalogState& state, std::string& error) {
    if (!exec("DELETE FROM categories", error)) return false;

    sqlite3_stmt* stmt;
    const char* sql = "INSERT INTO categories (id, name, color, description, parent_id, level, path, position, "
                      "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    if (sqlite3_prepare_v2(DB(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = lastError();
        return false;
    }

    int position = 0;
    for (const auto& c : state.categories) {
        bindText(stmt, 1, c.id);
        bindText(stmt, 2, c.name);
        bindText(stmt, 3, c.color);
        bindText(stmt, 4, c.description);
        bindOptionalText(stmt, 5, c.parent_id);
        sqlite3_bind_int(stmt, 6, c.level);
        bindText(stmt, 7, c.path);
        sqlite3_bind_int(stmt, 8, position++);
        bindText(stmt, 9, c.created_at);
        bindText(stmt, 10, c.updated_at);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            error = "category '" + c.id + "': " + lastError();
            sqlite3_finalize(stmt);
            return false;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);
    return true;
}

bool SQLiteBackend::saveTags(const CatalogState& state, std::string& error) {
    if (!exec("DELETE FROM tags", error)) return false;

    sqlite3_stmt* stmt;
    const char* sql = "INSERT INTO tags (id, name, color, position, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?)";
    if (sqlite3_prepare_v2(DB(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = lastError();
        return false;
    }

    int position = 0;
    for (const auto& t : state.tags) {
        bindText(stmt, 1, t.id);
        bindText(stmt, 2, t.name);
        bindText(stmt, 3, t.color);
        sqlite3_bind_int(stmt, 4, position++);
        bindText(stmt, 5, t.created_at);
        bindText(stmt, 6, t.updated_at);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            error = "tag '" + t.name + "': " + lastError();
            sqlite3_finalize(stmt);
            return false;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);
    return true;
}

bool SQLiteBackend::savePrompts(const CatalogState& state, std::string& error) {
    if (!exec("DELETE FROM prompt_tags; DELETE FROM prompts;", error)) return false;

    sqlite3_stmt* stmt;
    const char* sql = "INSERT INTO prompts (id, title, content, description, category_id, category_name, "
                      "category_path, usage_count, current_version, position, created_at, updated_at) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    if (sqlite3_prepare_v2(DB(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = lastError();
        return false;
    }

    sqlite3_stmt* tag_stmt;
    const char* tag_sql = "INSERT INTO prompt_tags (prompt_id, tag_name, position) VALUES (?, ?, ?)";
    if (sqlite3_prepare_v2(DB(), tag_sql, -1, &tag_stmt, nullptr) != SQLITE_OK) {
        error = lastError();
        sqlite3_finalize(stmt);
        return false;
    }

    bool ok = true;
    int position = 0;
    for (const auto& p : state.prompts) {
        bindText(stmt, 1, p.id);
        bindText(stmt, 2, p.title);
        bindText(stmt, 3, p.content);
        bindText(stmt, 4, p.description);
        bindText(stmt, 5, p.category_id);
        bindText(stmt, 6, p.category_name);
        bindText(stmt, 7, p.category_path);
        sqlite3_bind_int(stmt, 8, p.usage_count);
        bindText(stmt, 9, p.current_version);
        sqlite3_bind_int(stmt, 10, position++);
        bindText(stmt, 11, p.created_at);
        bindText(stmt, 12, p.updated_at);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            error = "prompt '" + p.id + "': " + lastError();
            ok = false;
            break;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);

        int tag_position = 0;
        for (const auto& tag : p.tags) {
            bindText(tag_stmt, 1, p.id);
            bindText(tag_stmt, 2, tag);
            sqlite3_bind_int(tag_stmt, 3, tag_position++);
            if (sqlite3_step(tag_stmt) != SQLITE_DONE) {
                error = "tag '" + tag + "' on prompt '" + p.id + "': " + lastError();
                ok = false;
                break;
            }
            sqlite3_reset(tag_stmt);
            sqlite3_clear_bindings(tag_stmt);
        }
        if (!ok) break;
    }

    sqlite3_finalize(tag_stmt);
    sqlite3_finalize(stmt);
    return ok;
}

bool SQLiteBackend::saveVersions(const CatalogState& state, std::string& error) {
    if (!exec("DELETE FROM prompt_versions", error)) return false;

    sqlite3_stmt* stmt;
    const char* sql = "INSERT INTO prompt_versions (prompt_id, version, title, content, description, "
                      "change_note, created_at) VALUES (?, ?, ?, ?, ?, ?, ?)";
    if (sqlite3_prepare_v2(DB(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = lastError();
        return false;
    }

    for (const auto& v : state.versions) {
        bindText(stmt, 1, v.prompt_id);
        bindText(stmt, 2, v.version);
        bindText(stmt, 3, v.title);
        bindText(stmt, 4, v.content);
        bindText(stmt, 5, v.description);
        bindText(stmt, 6, v.change_note);
        bindText(stmt, 7, v.created_at);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            error = "version " + v.version + " of prompt '" + v.prompt_id + "': " + lastError();
            sqlite3_finalize(stmt);
            return false;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);
    return true;
}

bool SQLiteBackend::touchSettings(std::string& error) {
    sqlite3_stmt* stmt;
    const char* sql = "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?)";
    if (sqlite3_prepare_v2(DB(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = lastError();
        return false;
    }

    bool ok = true;
    auto saveValue = [&](const std::string& key, const std::string& value) {
        if (!ok) return;
        bindText(stmt, 1, key);
        bindText(stmt, 2, value);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            error = "setting '" + key + "': " + lastError();
            ok = false;
        }
        sqlite3_reset(stmt);
    };

    saveValue("schema_version", SCHEMA_VERSION);
    saveValue("last_updated", utils::getCurrentTimestamp());

    sqlite3_finalize(stmt);
    return ok;
}

} // namespace prompthub
