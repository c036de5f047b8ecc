#include "entity_store.h"
#include "utils.h"
#include <iostream>
#include <vector>
#include <utility>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace prompthub {

namespace {

const char* LOCK_FILE = ".lock";
const char* JOURNAL_FILE = "commit.journal";

bool lockFile(int fd, int operation) {
    while (flock(fd, operation) != 0) {
        if (errno != EINTR) return false;
    }
    return true;
}

class FileLock : public StoreLock {
public:
    explicit FileLock(int fd) : fd_(fd) {}
    ~FileLock() override {
        flock(fd_, LOCK_UN);
        ::close(fd_);
    }

private:
    int fd_;
};

} // namespace

JsonFileBackend::JsonFileBackend()
    : open_(false)
{
}

JsonFileBackend::~JsonFileBackend() {
    close();
}

bool JsonFileBackend::open(const std::string& data_dir) {
    if (data_dir.empty()) {
        std::cerr << "JSON store needs a data directory" << std::endl;
        return false;
    }
    if (!utils::createDirs(data_dir)) {
        std::cerr << "Cannot create data directory: " << data_dir << std::endl;
        return false;
    }
    data_dir_ = data_dir;
    open_ = true;
    return true;
}

void JsonFileBackend::close() {
    open_ = false;
}

bool JsonFileBackend::isOpen() const {
    return open_;
}

const char* JsonFileBackend::fileName(EntityKind kind) {
    switch (kind) {
        case EntityKind::Categories: return "categories.json";
        case EntityKind::Tags: return "tags.json";
        case EntityKind::Prompts: return "prompts.json";
        case EntityKind::Versions: return "versions.json";
    }
    return "unknown.json";
}

std::string JsonFileBackend::getFilePath(EntityKind kind) const {
    return utils::joinPath(data_dir_, fileName(kind));
}

std::string JsonFileBackend::getLockPath() const {
    return utils::joinPath(data_dir_, LOCK_FILE);
}

std::string JsonFileBackend::getJournalPath() const {
    return utils::joinPath(data_dir_, JOURNAL_FILE);
}

Status JsonFileBackend::acquire(LockMode mode, std::unique_ptr<StoreLock>& lock) {
    if (!open_) {
        return Status::fail(ErrorKind::StorageFailure, "JSON store is not open");
    }

    std::string path = getLockPath();
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Status::fail(ErrorKind::StorageFailure,
                            "Cannot open lock file " + path + ": " + std::strerror(errno));
    }
    auto held = std::make_unique<FileLock>(fd);

    if (!lockFile(fd, mode == LockMode::Exclusive ? LOCK_EX : LOCK_SH)) {
        return Status::fail(ErrorKind::StorageFailure,
                            "Cannot lock " + path + ": " + std::strerror(errno));
    }

    // Readers never see a half-applied commit: whoever finds the journal first
    // upgrades and finishes it
    if (mode == LockMode::Exclusive || utils::fileExists(getJournalPath())) {
        if (mode == LockMode::Shared && !lockFile(fd, LOCK_EX)) {
            return Status::fail(ErrorKind::StorageFailure,
                                "Cannot lock " + path + ": " + std::strerror(errno));
        }
        Status st = recover();
        if (!st.isSuccess()) return st;
    }

    lock = std::move(held);
    return Status::ok();
}

Status JsonFileBackend::recover() {
    std::string journal = getJournalPath();
    if (utils::fileExists(journal)) {
        std::string content;
        if (!utils::readFile(journal, content)) {
            return Status::fail(ErrorKind::StorageFailure, "Cannot read " + journal);
        }

        std::vector<std::pair<std::string, std::string>> renames;
        try {
            json doc = json::parse(content);
            for (const auto& entry : doc.at("renames")) {
                std::string from = entry.at("from").get<std::string>();
                std::string to = entry.at("to").get<std::string>();
                if (from.find('/') != std::string::npos || to.find('/') != std::string::npos) {
                    return Status::fail(ErrorKind::StorageFailure, journal + ": entries must be file names");
                }
                renames.emplace_back(from, to);
            }
        } catch (const std::exception& e) {
            return Status::fail(ErrorKind::StorageFailure, "Corrupt journal " + journal + ": " + e.what());
        }

        for (const auto& r : renames) {
            std::string from = utils::joinPath(data_dir_, r.first);
            // Missing means this rename already happened
            if (!utils::fileExists(from)) continue;
            if (!utils::renameFile(from, utils::joinPath(data_dir_, r.second))) {
                return Status::fail(ErrorKind::StorageFailure, "Cannot complete interrupted commit in " + data_dir_);
            }
        }
        if (!utils::removeFile(journal)) {
            return Status::fail(ErrorKind::StorageFailure, "Cannot remove " + journal);
        }
        std::cerr << "Completed an interrupted commit in " << data_dir_ << std::endl;
    }

    // Temp files of writers that died before publishing a journal
    for (const auto& name : utils::listDir(data_dir_)) {
        if (!utils::endsWith(name, ".tmp")) continue;
        for (EntityKind kind : {EntityKind::Categories, EntityKind::Tags, EntityKind::Prompts, EntityKind::Versions}) {
            if (utils::startsWith(name, std::string(fileName(kind)) + ".")) {
                utils::debugLog("Removing orphaned " + name);
                utils::removeFile(utils::joinPath(data_dir_, name));
                break;
            }
        }
    }
    return Status::ok();
}

Status JsonFileBackend::load(EntityKind kind, CatalogState& state) {
    const char* key = entityKindName(kind);
    std::string path = getFilePath(kind);

    switch (kind) {
        case EntityKind::Categories: state.categories.clear(); break;
        case EntityKind::Tags: state.tags.clear(); break;
        case EntityKind::Prompts: state.prompts.clear(); break;
        case EntityKind::Versions: state.versions.clear(); break;
    }

    if (!utils::fileExists(path)) {
        return Status::ok();
    }

    std::string content;
    if (!utils::readFile(path, content)) {
        return Status::fail(ErrorKind::StorageFailure, "Cannot read " + path);
    }
    if (utils::trim(content).empty()) {
        return Status::ok();
    }

    try {
        json doc = json::parse(content);

        // Accept both {"<kind>": [...]} and a bare array
        const json* items = nullptr;
        if (doc.is_object() && doc.contains(key) && doc[key].is_array()) {
            items = &doc[key];
        } else if (doc.is_array()) {
            items = &doc;
        } else {
            return Status::fail(ErrorKind::StorageFailure,
                                path + ": expected an array under \"" + key + "\"");
        }

        for (const auto& item : *items) {
            if (!item.is_object()) {
                return Status::fail(ErrorKind::StorageFailure, path + ": entries must be objects");
            }
            switch (kind) {
                case EntityKind::Categories: state.categories.push_back(Category::fromJson(item)); break;
                case EntityKind::Tags: state.tags.push_back(Tag::fromJson(item)); break;
                case EntityKind::Prompts: state.prompts.push_back(Prompt::fromJson(item)); break;
                case EntityKind::Versions: state.versions.push_back(PromptVersion::fromJson(item)); break;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error parsing " << path << ": " << e.what() << std::endl;
        return Status::fail(ErrorKind::StorageFailure, "Corrupt data in " + path + ": " + e.what());
    }

    return Status::ok();
}

json JsonFileBackend::serialize(EntityKind kind, const CatalogState& state) {
    json items = json::array();
    switch (kind) {
        case EntityKind::Categories:
            for (const auto& c : state.categories) items.push_back(c.toJson());
            break;
        case EntityKind::Tags:
            for (const auto& t : state.tags) items.push_back(t.toJson());
            break;
        case EntityKind::Prompts:
            for (const auto& p : state.prompts) items.push_back(p.toJson());
            break;
        case EntityKind::Versions:
            for (const auto& v : state.versions) items.push_back(v.toJson());
            break;
    }
    json doc;
    doc[entityKindName(kind)] = items;
    return doc;
}

Status JsonFileBackend::commit(const CatalogState& state, const ChangeSet& changes) {
    if (!open_) {
        return Status::fail(ErrorKind::StorageFailure, "JSON store is not open");
    }

    // Stage every changed collection before the first rename so a failure
    // part way leaves all files untouched
    std::vector<std::pair<std::string, std::string>> staged;  // tmp -> target
    auto discard = [&staged]() {
        for (const auto& s : staged) utils::removeFile(s.first);
    };

    for (EntityKind kind : {EntityKind::Categories, EntityKind::Tags, EntityKind::Prompts, EntityKind::Versions}) {
        if (!changes.has(kind)) continue;

        std::string target = getFilePath(kind);
        std::string tmp = utils::uniqueTempPath(target);
        std::string text;
        try {
            text = serialize(kind, state).dump(2, ' ', false, json::error_handler_t::replace);
        } catch (const std::exception& e) {
            discard();
            return Status::fail(ErrorKind::StorageFailure,
                                std::string("Cannot serialize ") + entityKindName(kind) + ": " + e.what());
        }
        text += "\n";

        if (!utils::writeFileSync(tmp, text)) {
            utils::removeFile(tmp);
            discard();
            return Status::fail(ErrorKind::StorageFailure, "Cannot write " + tmp);
        }
        staged.emplace_back(tmp, target);
    }

    // Several renames are only atomic together through the journal: once it
    // exists the commit is decided and recover() finishes it after a crash
    bool journaled = staged.size() > 1;
    if (journaled) {
        json doc;
        doc["renames"] = json::array();
        for (const auto& s : staged) {
            doc["renames"].push_back({{"from", utils::getBasename(s.first)}, {"to", utils::getBasename(s.second)}});
        }
        if (!utils::writeFileAtomic(getJournalPath(), doc.dump(2) + "\n")) {
            discard();
            return Status::fail(ErrorKind::StorageFailure, "Cannot write " + getJournalPath());
        }
    }

    for (size_t i = 0; i < staged.size(); i++) {
        if (!utils::renameFile(staged[i].first, staged[i].second)) {
            if (journaled) {
                return Status::fail(ErrorKind::StorageFailure,
                                    "Cannot replace " + staged[i].second + "; the commit completes on next access");
            }
            discard();
            return Status::fail(ErrorKind::StorageFailure, "Cannot replace " + staged[i].second);
        }
    }

    if (journaled && !utils::removeFile(getJournalPath())) {
        std::cerr << "Cannot remove " << getJournalPath() << std::endl;
    }

    utils::debugLog("Committed " + std::to_string(staged.size()) + " collection(s) to " + data_dir_);
    return Status::ok();
}

} // namespace prompthub
