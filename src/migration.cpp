#include "migration.h"
#include "entity_store.h"
#include "utils.h"
#include <stdexcept>

namespace prompthub {
namespace migration {

namespace {

const char* DEFAULT_VERSION_LABEL = "1.0";

// Older files may omit ids; everything downstream keys on them
template <typename T>
void assignMissingId(T& entity) {
    if (entity.id.empty()) entity.id = utils::generateId();
}

const json& arrayOrEmpty(const json& parent, const char* key) {
    static const json empty = json::array();
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) return empty;
    if (!it->is_array()) {
        throw std::runtime_error(std::string("\"") + key + "\" must be an array");
    }
    return *it;
}

}

Result<SourceKind> parseSourceKind(const std::string& name) {
    if (name == "json") return Result<SourceKind>::ok(SourceKind::JsonDirectory);
    if (name == "unified-file") return Result<SourceKind>::ok(SourceKind::UnifiedFile);
    return Result<SourceKind>::fail(ErrorKind::InvalidInput,
                                    "Unknown migration source '" + name + "' (json, unified-file)");
}

Result<CatalogState> parseUnifiedFile(const std::string& text) {
    CatalogState state;
    try {
        json doc = json::parse(text);
        if (!doc.is_object() || !doc.contains("prompts") || !doc["prompts"].is_array()) {
            return Result<CatalogState>::fail(ErrorKind::InvalidInput, "Expected a \"prompts\" array");
        }

        json metadata = doc.value("metadata", json::object());
        if (!metadata.is_object()) {
            return Result<CatalogState>::fail(ErrorKind::InvalidInput, "\"metadata\" must be an object");
        }
        for (const auto& item : arrayOrEmpty(metadata, "categories")) {
            Category c = Category::fromJson(item);
            assignMissingId(c);
            state.categories.push_back(c);
        }
        for (const auto& item : arrayOrEmpty(metadata, "tags")) {
            Tag t = Tag::fromJson(item);
            assignMissingId(t);
            state.tags.push_back(t);
        }

        for (const auto& item : doc["prompts"]) {
            if (!item.is_object()) {
                return Result<CatalogState>::fail(ErrorKind::InvalidInput, "Prompt entries must be objects");
            }
            Prompt p = Prompt::fromJson(item);
            assignMissingId(p);

            for (const auto& entry : arrayOrEmpty(item, "versions")) {
                PromptVersion v = PromptVersion::fromJson(entry);
                v.prompt_id = p.id;
                if (v.version.empty()) v.version = DEFAULT_VERSION_LABEL;
                if (v.title.empty()) v.title = p.title;
                if (v.content.empty()) v.content = p.content;
                if (v.created_at.empty()) v.created_at = p.created_at;
                state.versions.push_back(v);
            }
            state.prompts.push_back(p);
        }
    } catch (const std::exception& e) {
        return Result<CatalogState>::fail(ErrorKind::InvalidInput, std::string("Invalid unified file: ") + e.what());
    }
    return Result<CatalogState>::ok(state);
}

Result<CatalogState> readSource(SourceKind kind, const std::string& location) {
    if (kind == SourceKind::UnifiedFile) {
        std::string text;
        if (!utils::fileExists(location) || !utils::readFile(location, text)) {
            return Result<CatalogState>::fail(ErrorKind::NotFound, "Cannot read " + location);
        }
        Result<CatalogState> parsed = parseUnifiedFile(text);
        if (!parsed.isSuccess()) parsed.error = location + ": " + parsed.error;
        return parsed;
    }

    // Opening would create a missing directory
    if (!utils::dirExists(location)) {
        return Result<CatalogState>::fail(ErrorKind::NotFound, "No JSON catalog at " + location);
    }
    EntityStore source(EntityStore::createBackend("json"));
    if (!source.open(location)) {
        return Result<CatalogState>::fail(ErrorKind::StorageFailure, "Cannot open JSON catalog at " + location);
    }
    Result<CatalogState> snap = source.snapshot();
    source.close();
    return snap;
}

} // namespace migration
} // namespace prompthub
