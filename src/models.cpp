#include "models.h"
#include <algorithm>
#include <stdexcept>

namespace prompthub {

namespace {

// Ids in older data files may be numbers; everything else must be a string or null
std::string stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<long long>());
    throw std::runtime_error(std::string("field '") + key + "' must be a string");
}

std::vector<std::string> tagList(const json& j) {
    std::vector<std::string> tags;
    auto it = j.find("tags");
    if (it == j.end() || it->is_null()) return tags;
    if (it->is_string()) {
        // "a, b" form used by CSV-era exports
        std::string raw = it->get<std::string>();
        size_t start = 0;
        while (start <= raw.size()) {
            size_t comma = raw.find(',', start);
            std::string part = raw.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
            size_t b = part.find_first_not_of(" \t");
            size_t e = part.find_last_not_of(" \t");
            if (b != std::string::npos) tags.push_back(part.substr(b, e - b + 1));
            if (comma == std::string::npos) break;
            start = comma + 1;
        }
        return tags;
    }
    for (const auto& t : *it) {
        if (t.is_string()) {
            tags.push_back(t.get<std::string>());
        } else if (t.is_object()) {
            tags.push_back(stringField(t, "name"));
        }
    }
    return tags;
}

template <typename T>
T* findById(std::vector<T>& items, const std::string& id) {
    auto it = std::find_if(items.begin(), items.end(), [&id](const T& item) { return item.id == id; });
    return it == items.end() ? nullptr : &*it;
}

template <typename T>
const T* findById(const std::vector<T>& items, const std::string& id) {
    auto it = std::find_if(items.begin(), items.end(), [&id](const T& item) { return item.id == id; });
    return it == items.end() ? nullptr : &*it;
}

} // namespace

// ============================================================================
// Category
// ============================================================================

json Category::toJson() const {
    json j = {
        {"id", id},
        {"name", name},
        {"color", color},
        {"description", description},
        {"level", level},
        {"path", path},
        {"created_at", created_at},
        {"updated_at", updated_at}
    };
    j["parent_id"] = parent_id.empty() ? json(nullptr) : json(parent_id);
    return j;
}

Category Category::fromJson(const json& j) {
    Category c;
    c.id = stringField(j, "id");
    c.name = stringField(j, "name");
    c.color = j.contains("color") && j["color"].is_string() ? j["color"].get<std::string>() : DEFAULT_CATEGORY_COLOR;
    c.description = stringField(j, "description");
    c.parent_id = stringField(j, "parent_id");
    c.level = j.value("level", 1);
    c.path = stringField(j, "path");
    if (c.path.empty()) c.path = c.name;
    c.created_at = stringField(j, "created_at");
    c.updated_at = stringField(j, "updated_at");
    return c;
}

bool Category::operator==(const Category& other) const {
    return id == other.id && name == other.name && color == other.color &&
           description == other.description && parent_id == other.parent_id &&
           level == other.level && path == other.path &&
           created_at == other.created_at && updated_at == other.updated_at;
}

// ============================================================================
// Tag
// ============================================================================

json Tag::toJson() const {
    return {
        {"id", id},
        {"name", name},
        {"color", color},
        {"created_at", created_at},
        {"updated_at", updated_at}
    };
}

Tag Tag::fromJson(const json& j) {
    Tag t;
    t.id = stringField(j, "id");
    t.name = stringField(j, "name");
    t.color = j.contains("color") && j["color"].is_string() ? j["color"].get<std::string>() : DEFAULT_TAG_COLOR;
    t.created_at = stringField(j, "created_at");
    t.updated_at = stringField(j, "updated_at");
    return t;
}

bool Tag::operator==(const Tag& other) const {
    return id == other.id && name == other.name && color == other.color &&
           created_at == other.created_at && updated_at == other.updated_at;
}

// ============================================================================
// Prompt
// ============================================================================

bool Prompt::hasTag(const std::string& name) const {
    return std::find(tags.begin(), tags.end(), name) != tags.end();
}

json Prompt::toJson() const {
    return {
        {"id", id},
        {"title", title},
        {"content", content},
        {"description", description},
        {"category_id", category_id},
        {"category_name", category_name},
        {"category_path", category_path},
        {"tags", tags},
        {"usage_count", usage_count},
        {"current_version", current_version},
        {"created_at", created_at},
        {"updated_at", updated_at}
    };
}

Prompt Prompt::fromJson(const json& j) {
    Prompt p;
    p.id = stringField(j, "id");
    p.title = stringField(j, "title");
    p.content = stringField(j, "content");
    p.description = stringField(j, "description");
    p.category_id = stringField(j, "category_id");
    p.category_name = stringField(j, "category_name");
    if (p.category_name.empty()) p.category_name = stringField(j, "category");
    p.category_path = stringField(j, "category_path");
    p.tags = tagList(j);
    p.usage_count = j.value("usage_count", 0);
    p.current_version = stringField(j, "current_version");
    p.created_at = stringField(j, "created_at");
    p.updated_at = stringField(j, "updated_at");
    return p;
}

bool Prompt::operator==(const Prompt& other) const {
    return id == other.id && title == other.title && content == other.content &&
           description == other.description && category_id == other.category_id &&
           category_name == other.category_name && category_path == other.category_path &&
           tags == other.tags && usage_count == other.usage_count &&
           current_version == other.current_version &&
           created_at == other.created_at && updated_at == other.updated_at;
}

// ============================================================================
// PromptVersion
// ============================================================================

json PromptVersion::toJson() const {
    return {
        {"prompt_id", prompt_id},
        {"version", version},
        {"title", title},
        {"content", content},
        {"description", description},
        {"change_note", change_note},
        {"created_at", created_at}
    };
}

PromptVersion PromptVersion::fromJson(const json& j) {
    PromptVersion v;
    v.prompt_id = stringField(j, "prompt_id");
    v.version = stringField(j, "version");
    v.title = stringField(j, "title");
    v.content = stringField(j, "content");
    v.description = stringField(j, "description");
    v.change_note = stringField(j, "change_note");
    v.created_at = stringField(j, "created_at");
    return v;
}

bool PromptVersion::operator==(const PromptVersion& other) const {
    return prompt_id == other.prompt_id && version == other.version &&
           title == other.title && content == other.content &&
           description == other.description && change_note == other.change_note &&
           created_at == other.created_at;
}

// ============================================================================
// CatalogState
// ============================================================================

Category* CatalogState::findCategory(const std::string& id) { return findById(categories, id); }
const Category* CatalogState::findCategory(const std::string& id) const { return findById(categories, id); }
Tag* CatalogState::findTag(const std::string& id) { return findById(tags, id); }
const Tag* CatalogState::findTag(const std::string& id) const { return findById(tags, id); }
Prompt* CatalogState::findPrompt(const std::string& id) { return findById(prompts, id); }
const Prompt* CatalogState::findPrompt(const std::string& id) const { return findById(prompts, id); }

Tag* CatalogState::findTagByName(const std::string& name) {
    auto it = std::find_if(tags.begin(), tags.end(), [&name](const Tag& t) { return t.name == name; });
    return it == tags.end() ? nullptr : &*it;
}

const Tag* CatalogState::findTagByName(const std::string& name) const {
    auto it = std::find_if(tags.begin(), tags.end(), [&name](const Tag& t) { return t.name == name; });
    return it == tags.end() ? nullptr : &*it;
}

json CatalogState::toJson() const {
    json j;
    j["categories"] = json::array();
    for (const auto& c : categories) j["categories"].push_back(c.toJson());
    j["tags"] = json::array();
    for (const auto& t : tags) j["tags"].push_back(t.toJson());
    j["prompts"] = json::array();
    for (const auto& p : prompts) j["prompts"].push_back(p.toJson());
    j["versions"] = json::array();
    for (const auto& v : versions) j["versions"].push_back(v.toJson());
    return j;
}

bool CatalogState::operator==(const CatalogState& other) const {
    return categories == other.categories && tags == other.tags &&
           prompts == other.prompts && versions == other.versions;
}

} // namespace prompthub
