#ifndef PROMPTHUB_MIGRATION_H
#define PROMPTHUB_MIGRATION_H

#include "errors.h"
#include "models.h"
#include <string>

namespace prompthub {

namespace migration {

// Storage variants a catalog can be copied out of
enum class SourceKind {
    JsonDirectory,  // prompts.json, categories.json, tags.json, versions.json
    UnifiedFile     // one file holding prompts plus a metadata section
};

// "json" or "unified-file"
Result<SourceKind> parseSourceKind(const std::string& name);

// {"prompts": [...], "metadata": {"categories": [...], "tags": [...]}}
// Version history may be nested under each prompt as "versions".
Result<CatalogState> parseUnifiedFile(const std::string& text);

// Everything stored at location. The source is only read.
Result<CatalogState> readSource(SourceKind kind, const std::string& location);

} // namespace migration

} // namespace prompthub

#endif // PROMPTHUB_MIGRATION_H
