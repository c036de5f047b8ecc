#ifndef PROMPTHUB_CONFIG_H
#define PROMPTHUB_CONFIG_H

#include <string>

namespace prompthub {

class Config {
public:
    Config();
    ~Config();

    // Initialize/load configuration; writes a default file when none exists
    bool initialize(const std::string& config_path = "");

    // Getters
    std::string getAppName() const { return app_name_; }
    std::string getAdminSecretHash() const { return admin_secret_hash_; }
    std::string getStorageBackend() const { return storage_backend_; }
    std::string getDataDir() const { return data_dir_; }
    std::string getBackupDir() const { return backup_dir_; }
    int getMaxCategoryDepth() const { return max_category_depth_; }
    int getPageSize() const { return page_size_; }
    bool getDebug() const { return debug_; }
    std::string getConfigFile() const { return config_path_; }

    // Location handed to the storage backend: a directory for json, a file for sqlite
    std::string getStoreLocation() const;

    // Setters
    void setAdminPassword(const std::string& password);
    void setStorageBackend(const std::string& backend);
    void setDataDir(const std::string& dir);
    void setBackupDir(const std::string& dir);
    void setMaxCategoryDepth(int depth);
    void setPageSize(int size);
    void setDebug(bool enabled);

    // Command line overrides for this run only; not written back
    void applyOverrides(const std::string& backend, const std::string& data_dir, bool debug);

    // Persistence
    bool save();
    bool load();

    static std::string getConfigDir();
    static std::string getConfigPath();
    static std::string getHistoryPath();

private:
    void createDefaultConfig();
    void applyEnvironment();

    std::string config_path_;

    std::string app_name_;
    std::string admin_secret_hash_;
    std::string storage_backend_;
    std::string data_dir_;
    std::string backup_dir_;
    int max_category_depth_;
    int page_size_;
    bool debug_;
};

} // namespace prompthub

#endif // PROMPTHUB_CONFIG_H
