#ifndef PROMPTHUB_BACKUP_MANAGER_H
#define PROMPTHUB_BACKUP_MANAGER_H

#include "errors.h"
#include "models.h"
#include <string>
#include <vector>

namespace prompthub {

// Writes full catalog snapshots to <backup_dir>/backup_YYYYMMDD_HHMMSS[_N].json
class BackupManager {
public:
    explicit BackupManager(const std::string& backup_dir);

    // Returns the path of the new backup file
    Result<std::string> write(const CatalogState& state, const std::string& reason,
                              const std::string& backend) const;

    // Backup files, oldest first
    std::vector<std::string> listBackups() const;

    static Result<CatalogState> read(const std::string& path);

    std::string getBackupDir() const { return backup_dir_; }

private:
    std::string backup_dir_;

    std::string nextPath() const;
};

} // namespace prompthub

#endif // PROMPTHUB_BACKUP_MANAGER_H
