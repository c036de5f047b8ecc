#include "backup_manager.h"
#include "utils.h"
#include <iostream>
#include <algorithm>
#include <utility>

namespace prompthub {

BackupManager::BackupManager(const std::string& backup_dir)
    : backup_dir_(backup_dir)
{
}

std::string BackupManager::nextPath() const {
    std::string base = "backup_" + utils::getCompactTimestamp();
    std::string path = utils::joinPath(backup_dir_, base + ".json");
    for (int n = 1; utils::fileExists(path); n++) {
        path = utils::joinPath(backup_dir_, base + "_" + std::to_string(n) + ".json");
    }
    return path;
}

Result<std::string> BackupManager::write(const CatalogState& state, const std::string& reason,
                                         const std::string& backend) const {
    if (backup_dir_.empty()) {
        return Result<std::string>::fail(ErrorKind::StorageFailure, "No backup directory configured");
    }
    if (!utils::createDirs(backup_dir_)) {
        return Result<std::string>::fail(ErrorKind::StorageFailure,
                                         "Cannot create backup directory " + backup_dir_);
    }

    json doc = state.toJson();
    doc["created_at"] = utils::getCurrentTimestamp();
    doc["reason"] = reason;
    doc["backend"] = backend;

    std::string text;
    try {
        text = doc.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const std::exception& e) {
        return Result<std::string>::fail(ErrorKind::StorageFailure, std::string("Cannot serialize backup: ") + e.what());
    }

    std::string path = nextPath();
    if (!utils::writeFileAtomic(path, text + "\n")) {
        std::cerr << "Backup write failed: " << path << std::endl;
        return Result<std::string>::fail(ErrorKind::StorageFailure, "Cannot write backup " + path);
    }

    utils::debugLog("Backup written to " + path + " (" + reason + ")");
    return Result<std::string>::ok(path);
}

namespace {

// "backup_20240101_120000_10.json" -> ("20240101_120000", 10); no suffix counts as 0
std::pair<std::string, long> backupOrder(const std::string& name) {
    std::string stem = name.substr(7, name.size() - 12);
    size_t sep = stem.rfind('_');
    if (sep == std::string::npos || sep + 1 == stem.size() || sep < 15) return {stem, 0};
    std::string suffix = stem.substr(sep + 1);
    if (suffix.size() > 9 || suffix.find_first_not_of("0123456789") != std::string::npos) return {stem, 0};
    return {stem.substr(0, sep), std::stol(suffix)};
}

} // namespace

std::vector<std::string> BackupManager::listBackups() const {
    std::vector<std::string> names;
    for (const auto& name : utils::listDir(backup_dir_)) {
        if (utils::startsWith(name, "backup_") && utils::endsWith(name, ".json")) {
            names.push_back(name);
        }
    }

    // Oldest first; same-second backups by their numeric suffix
    std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
        return backupOrder(a) < backupOrder(b);
    });

    std::vector<std::string> backups;
    for (const auto& name : names) backups.push_back(utils::joinPath(backup_dir_, name));
    return backups;
}

Result<CatalogState> BackupManager::read(const std::string& path) {
    std::string content;
    if (!utils::readFile(path, content)) {
        return Result<CatalogState>::fail(ErrorKind::NotFound, "Backup " + path + " not found");
    }

    try {
        json doc = json::parse(content);
        CatalogState state;
        for (const auto& c : doc.value("categories", json::array())) state.categories.push_back(Category::fromJson(c));
        for (const auto& t : doc.value("tags", json::array())) state.tags.push_back(Tag::fromJson(t));
        for (const auto& p : doc.value("prompts", json::array())) state.prompts.push_back(Prompt::fromJson(p));
        for (const auto& v : doc.value("versions", json::array())) state.versions.push_back(PromptVersion::fromJson(v));
        return Result<CatalogState>::ok(state);
    } catch (const std::exception& e) {
        return Result<CatalogState>::fail(ErrorKind::StorageFailure, "Corrupt backup " + path + ": " + e.what());
    }
}

} // namespace prompthub
