#include "config.h"
#include "utils.h"
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace prompthub {

namespace {

const char* DEFAULT_ADMIN_PASSWORD = "admin123";

} // namespace

Config::Config()
    : app_name_("PromptHub")
    , admin_secret_hash_("")
    , storage_backend_("json")
    , data_dir_("")       // Will be set to default in initialize()
    , backup_dir_("")
    , max_category_depth_(5)
    , page_size_(20)
    , debug_(false)
{
}

Config::~Config() = default;

bool Config::initialize(const std::string& config_path) {
    if (config_path.empty()) {
        config_path_ = getConfigPath();
    } else {
        config_path_ = utils::expandHome(config_path);
    }

    // Create config directory if it doesn't exist
    std::string config_dir = utils::getDirname(config_path_);
    if (!utils::dirExists(config_dir)) {
        if (!utils::createDirs(config_dir)) {
            std::cerr << "Failed to create config directory: " << config_dir << std::endl;
            return false;
        }
    }

    if (!utils::fileExists(config_path_)) {
        data_dir_ = utils::joinPath(config_dir, "data");
        createDefaultConfig();
    }

    if (!load()) {
        return false;
    }

    // Set default directories if not set
    if (data_dir_.empty()) {
        data_dir_ = utils::joinPath(config_dir, "data");
    }
    if (backup_dir_.empty()) {
        backup_dir_ = utils::joinPath(data_dir_, "backup");
    }

    applyEnvironment();
    utils::setDebug(debug_);
    return true;
}

void Config::createDefaultConfig() {
    admin_secret_hash_ = utils::sha256Hex(DEFAULT_ADMIN_PASSWORD);
    if (save()) {
        utils::terminal::printWarning("Created " + config_path_ + " with the default admin password '" +
                                      std::string(DEFAULT_ADMIN_PASSWORD) + "'. Change it with 'prompthub passwd'.");
    }
}

void Config::applyEnvironment() {
    if (const char* password = std::getenv("PROMPTHUB_ADMIN_PASSWORD")) {
        admin_secret_hash_ = utils::sha256Hex(password);
    }
    if (const char* backend = std::getenv("PROMPTHUB_BACKEND")) {
        storage_backend_ = backend;
    }
    if (const char* dir = std::getenv("PROMPTHUB_DATA_DIR")) {
        data_dir_ = utils::expandHome(dir);
        backup_dir_ = utils::joinPath(data_dir_, "backup");
    }
}

bool Config::load() {
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        std::cerr << "Cannot open config file: " << config_path_ << std::endl;
        return false;
    }

    try {
        json config = json::parse(file);
        if (!config.is_object()) {
            std::cerr << "Config file " << config_path_ << " must contain a JSON object" << std::endl;
            return false;
        }

        app_name_ = config.value("app_name", app_name_);
        storage_backend_ = config.value("storage_backend", storage_backend_);
        data_dir_ = utils::expandHome(config.value("data_dir", data_dir_));
        backup_dir_ = utils::expandHome(config.value("backup_dir", backup_dir_));
        max_category_depth_ = config.value("max_category_depth", max_category_depth_);
        page_size_ = config.value("page_size", page_size_);
        debug_ = config.value("debug", debug_);

        // A plaintext password is accepted for hand-edited files and hashed here
        if (config.contains("admin_password_sha256") && config["admin_password_sha256"].is_string()) {
            admin_secret_hash_ = utils::toLower(config["admin_password_sha256"].get<std::string>());
        } else if (config.contains("admin_password") && config["admin_password"].is_string()) {
            admin_secret_hash_ = utils::sha256Hex(config["admin_password"].get<std::string>());
        }
    } catch (const std::exception& e) {
        std::cerr << "Error loading config " << config_path_ << ": " << e.what() << std::endl;
        return false;
    }

    if (storage_backend_ != "json" && storage_backend_ != "sqlite") {
        std::cerr << "Unknown storage_backend '" << storage_backend_ << "', using json" << std::endl;
        storage_backend_ = "json";
    }
    if (max_category_depth_ < 1) max_category_depth_ = 1;
    return true;
}

bool Config::save() {
    json config;
    config["app_name"] = app_name_;
    config["admin_password_sha256"] = admin_secret_hash_;
    config["storage_backend"] = storage_backend_;
    config["data_dir"] = data_dir_;
    config["backup_dir"] = backup_dir_;
    config["max_category_depth"] = max_category_depth_;
    config["page_size"] = page_size_;
    config["debug"] = debug_;

    if (!utils::writeFileAtomic(config_path_, config.dump(2) + "\n")) {
        std::cerr << "Failed to save config: " << config_path_ << std::endl;
        return false;
    }
    return true;
}

std::string Config::getStoreLocation() const {
    if (storage_backend_ == "sqlite") {
        return utils::joinPath(data_dir_, "prompthub.db");
    }
    return data_dir_;
}

void Config::setAdminPassword(const std::string& password) {
    admin_secret_hash_ = utils::sha256Hex(password);
    save();
}

void Config::setStorageBackend(const std::string& backend) {
    storage_backend_ = backend;
    save();
}

void Config::setDataDir(const std::string& dir) {
    data_dir_ = utils::expandHome(dir);
    save();
}

void Config::setBackupDir(const std::string& dir) {
    backup_dir_ = utils::expandHome(dir);
    save();
}

void Config::setMaxCategoryDepth(int depth) {
    max_category_depth_ = depth < 1 ? 1 : depth;
    save();
}

void Config::setPageSize(int size) {
    page_size_ = size;
    save();
}

void Config::setDebug(bool enabled) {
    debug_ = enabled;
    utils::setDebug(enabled);
    save();
}

void Config::applyOverrides(const std::string& backend, const std::string& data_dir, bool debug) {
    if (!backend.empty()) {
        storage_backend_ = backend;
    }
    if (!data_dir.empty()) {
        data_dir_ = utils::expandHome(data_dir);
        backup_dir_ = utils::joinPath(data_dir_, "backup");
    }
    if (debug) {
        debug_ = true;
        utils::setDebug(true);
    }
}

// Static methods
std::string Config::getConfigDir() {
    return utils::joinPath(utils::getHomeDir(), ".config/prompthub");
}

std::string Config::getConfigPath() {
    return utils::joinPath(getConfigDir(), "config.json");
}

std::string Config::getHistoryPath() {
    return utils::joinPath(getConfigDir(), "history.txt");
}

} // namespace prompthub
