#ifndef PROMPTHUB_MODELS_H
#define PROMPTHUB_MODELS_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace prompthub {

constexpr const char* FALLBACK_CATEGORY_ID = "7";
constexpr const char* DEFAULT_TAG_COLOR = "#3B82F6";
constexpr const char* DEFAULT_CATEGORY_COLOR = "#6B7280";

struct Category {
    std::string id;
    std::string name;
    std::string color = DEFAULT_CATEGORY_COLOR;
    std::string description;
    std::string parent_id;      // empty for a root
    int level = 1;              // root = 1
    std::string path;           // ancestor names joined with '/'
    std::string created_at;
    std::string updated_at;

    json toJson() const;
    static Category fromJson(const json& j);
    bool operator==(const Category& other) const;
};

struct Tag {
    std::string id;
    std::string name;
    std::string color = DEFAULT_TAG_COLOR;
    std::string created_at;
    std::string updated_at;

    json toJson() const;
    static Tag fromJson(const json& j);
    bool operator==(const Tag& other) const;
};

struct Prompt {
    std::string id;
    std::string title;
    std::string content;
    std::string description;
    std::string category_id;
    std::string category_name;
    std::string category_path;
    std::vector<std::string> tags;     // tag names, display order
    int usage_count = 0;
    std::string current_version;
    std::string created_at;
    std::string updated_at;

    bool hasTag(const std::string& name) const;

    json toJson() const;
    static Prompt fromJson(const json& j);
    bool operator==(const Prompt& other) const;
};

struct PromptVersion {
    std::string prompt_id;
    std::string version;
    std::string title;
    std::string content;
    std::string description;
    std::string change_note;
    std::string created_at;

    json toJson() const;
    static PromptVersion fromJson(const json& j);
    bool operator==(const PromptVersion& other) const;
};

// Everything a single transaction sees and may rewrite
struct CatalogState {
    std::vector<Category> categories;
    std::vector<Tag> tags;
    std::vector<Prompt> prompts;
    std::vector<PromptVersion> versions;

    Category* findCategory(const std::string& id);
    const Category* findCategory(const std::string& id) const;
    Tag* findTag(const std::string& id);
    const Tag* findTag(const std::string& id) const;
    Tag* findTagByName(const std::string& name);
    const Tag* findTagByName(const std::string& name) const;
    Prompt* findPrompt(const std::string& id);
    const Prompt* findPrompt(const std::string& id) const;

    json toJson() const;
    bool operator==(const CatalogState& other) const;
};

} // namespace prompthub

#endif // PROMPTHUB_MODELS_H
