#ifndef PROMPTHUB_QUERY_ENGINE_H
#define PROMPTHUB_QUERY_ENGINE_H

#include "errors.h"
#include "models.h"
#include "entity_store.h"
#include "integrity_manager.h"
#include <string>
#include <vector>
#include <map>

namespace prompthub {

struct SearchQuery {
    std::string text;                 // case-insensitive, any of title/content/description
    std::string category_id;          // includes every descendant category
    std::vector<std::string> tags;    // prompt matches when it has any of them
    int page = 1;                     // 1-based
    int page_size = 20;               // <= 0 returns everything
};

struct SearchPage {
    std::vector<Prompt> items;
    size_t total_count = 0;
    int page = 1;
    int page_size = 0;

    int totalPages() const;
};

struct CategoryNode {
    Category category;
    int prompt_count = 0;             // prompts filed directly here
    int total_count = 0;              // including all descendants
    std::vector<CategoryNode> children;
};

struct TagUsage {
    Tag tag;
    int prompt_count = 0;
};

struct CategoryCount {
    Category category;
    int prompt_count = 0;             // subtree-inclusive
};

struct CatalogStats {
    int total_prompts = 0;
    int total_categories = 0;
    int total_tags = 0;
    int total_versions = 0;
    long long total_usage = 0;
    bool has_most_used = false;
    Prompt most_used;
    std::vector<CategoryCount> category_distribution;
    std::map<int, int> level_stats;   // category level -> number of categories
};

// Read side of the catalog. Every call works on one consistent snapshot and
// never writes; usage counters only move through MutationGate::usePrompt.
class QueryEngine {
public:
    explicit QueryEngine(EntityStore& store);

    Result<SearchPage> search(const SearchQuery& query) const;
    Result<Prompt> getPrompt(const std::string& id) const;

    Result<std::vector<Category>> listCategories() const;
    Result<std::vector<CategoryNode>> categoryTree() const;
    Result<CategoryImpact> previewCategoryDeletion(const std::string& id) const;

    Result<std::vector<TagUsage>> listTags() const;

    Result<std::vector<PromptVersion>> listVersions(const std::string& prompt_id) const;
    Result<PromptVersion> getVersion(const std::string& prompt_id, const std::string& label) const;

    Result<CatalogStats> stats() const;
    Result<std::vector<std::string>> checkConsistency(const IntegrityManager& integrity) const;

    // Snapshot-level helpers
    static SearchPage searchIn(const CatalogState& state, const SearchQuery& query);
    static std::vector<Prompt> filterIn(const CatalogState& state, const SearchQuery& query);
    static std::vector<CategoryNode> treeOf(const CatalogState& state);
    static std::vector<TagUsage> tagUsageOf(const CatalogState& state);
    static CatalogStats statsOf(const CatalogState& state);

private:
    EntityStore& store_;
};

} // namespace prompthub

#endif // PROMPTHUB_QUERY_ENGINE_H
