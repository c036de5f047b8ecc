#include "query_engine.h"
#include "version_ledger.h"
#include "utils.h"
#include <algorithm>
#include <set>
#include <functional>

namespace prompthub {

int SearchPage::totalPages() const {
    if (page_size <= 0) return total_count > 0 ? 1 : 0;
    return static_cast<int>((total_count + page_size - 1) / page_size);
}

QueryEngine::QueryEngine(EntityStore& store)
    : store_(store)
{
}

// ============================================================================
// Snapshot-level helpers
// ============================================================================

std::vector<Prompt> QueryEngine::filterIn(const CatalogState& state, const SearchQuery& query) {
    std::string text = utils::trim(query.text);

    std::set<std::string> categories;
    if (!query.category_id.empty()) {
        categories = IntegrityManager::descendantIds(state.categories, query.category_id);
        categories.insert(query.category_id);
    }

    std::vector<std::string> tags;
    for (const auto& t : query.tags) {
        std::string name = utils::trim(t);
        if (!name.empty()) tags.push_back(name);
    }

    std::vector<Prompt> matches;
    for (const auto& p : state.prompts) {
        if (!text.empty() &&
            !utils::containsIgnoreCase(p.title, text) &&
            !utils::containsIgnoreCase(p.content, text) &&
            !utils::containsIgnoreCase(p.description, text)) {
            continue;
        }
        if (!categories.empty() && !categories.count(p.category_id)) {
            continue;
        }
        if (!tags.empty() &&
            std::none_of(tags.begin(), tags.end(), [&p](const std::string& t) { return p.hasTag(t); })) {
            continue;
        }
        matches.push_back(p);
    }

    // Most recently updated first, ties by id
    std::sort(matches.begin(), matches.end(), [](const Prompt& a, const Prompt& b) {
        if (a.updated_at != b.updated_at) return a.updated_at > b.updated_at;
        return a.id < b.id;
    });
    return matches;
}

SearchPage QueryEngine::searchIn(const CatalogState& state, const SearchQuery& query) {
    std::vector<Prompt> matches = filterIn(state, query);

    SearchPage page;
    page.total_count = matches.size();
    page.page_size = query.page_size > 0 ? query.page_size : 0;
    page.page = query.page > 0 ? query.page : 1;

    if (page.page_size == 0) {
        page.page = 1;
        page.items = std::move(matches);
        return page;
    }

    size_t offset = static_cast<size_t>(page.page - 1) * static_cast<size_t>(page.page_size);
    if (offset < matches.size()) {
        size_t end = std::min(matches.size(), offset + static_cast<size_t>(page.page_size));
        page.items.assign(matches.begin() + offset, matches.begin() + end);
    }
    return page;
}

std::vector<CategoryNode> QueryEngine::treeOf(const CatalogState& state) {
    std::map<std::string, int> direct;
    for (const auto& p : state.prompts) {
        direct[p.category_id]++;
    }

    std::set<std::string> visited;
    std::function<CategoryNode(const Category&)> build = [&](const Category& c) {
        CategoryNode node;
        node.category = c;
        node.prompt_count = direct[c.id];
        node.total_count = node.prompt_count;
        visited.insert(c.id);
        for (const auto& child : state.categories) {
            if (child.parent_id == c.id && !visited.count(child.id)) {
                node.children.push_back(build(child));
                node.total_count += node.children.back().total_count;
            }
        }
        return node;
    };

    std::vector<CategoryNode> roots;
    for (const auto& c : state.categories) {
        if (c.parent_id.empty()) roots.push_back(build(c));
    }
    return roots;
}

std::vector<TagUsage> QueryEngine::tagUsageOf(const CatalogState& state) {
    std::map<std::string, int> counts;
    for (const auto& p : state.prompts) {
        for (const auto& t : p.tags) counts[t]++;
    }

    std::vector<TagUsage> usage;
    for (const auto& t : state.tags) {
        TagUsage u;
        u.tag = t;
        u.prompt_count = counts[t.name];
        usage.push_back(u);
    }
    return usage;
}

CatalogStats QueryEngine::statsOf(const CatalogState& state) {
    CatalogStats stats;
    stats.total_prompts = static_cast<int>(state.prompts.size());
    stats.total_categories = static_cast<int>(state.categories.size());
    stats.total_tags = static_cast<int>(state.tags.size());

    std::set<std::string> live;
    for (const auto& p : state.prompts) {
        live.insert(p.id);
        stats.total_usage += p.usage_count;
        if (!stats.has_most_used || p.usage_count > stats.most_used.usage_count) {
            stats.most_used = p;
            stats.has_most_used = true;
        }
    }
    for (const auto& v : state.versions) {
        if (live.count(v.prompt_id)) stats.total_versions++;
    }

    for (const auto& c : state.categories) {
        std::set<std::string> subtree = IntegrityManager::descendantIds(state.categories, c.id);
        subtree.insert(c.id);

        CategoryCount count;
        count.category = c;
        count.prompt_count = static_cast<int>(std::count_if(state.prompts.begin(), state.prompts.end(),
            [&subtree](const Prompt& p) { return subtree.count(p.category_id) > 0; }));
        stats.category_distribution.push_back(count);
        stats.level_stats[c.level]++;
    }
    return stats;
}

// ============================================================================
// Store-backed reads
// ============================================================================

Result<SearchPage> QueryEngine::search(const SearchQuery& query) const {
    Result<CatalogState> snap = store_.snapshot();
    if (!snap.isSuccess()) return Result<SearchPage>::fail(snap.status());
    return Result<SearchPage>::ok(searchIn(snap.value, query));
}

Result<Prompt> QueryEngine::getPrompt(const std::string& id) const {
    Result<CatalogState> snap = store_.load(EntityKind::Prompts);
    if (!snap.isSuccess()) return Result<Prompt>::fail(snap.status());

    const Prompt* p = snap.value.findPrompt(id);
    if (!p) return Result<Prompt>::fail(ErrorKind::NotFound, "Prompt " + id + " not found");
    return Result<Prompt>::ok(*p);
}

Result<std::vector<Category>> QueryEngine::listCategories() const {
    Result<CatalogState> snap = store_.load(EntityKind::Categories);
    if (!snap.isSuccess()) return Result<std::vector<Category>>::fail(snap.status());

    std::vector<Category> categories = snap.value.categories;
    std::stable_sort(categories.begin(), categories.end(), [](const Category& a, const Category& b) {
        return a.path < b.path;
    });
    return Result<std::vector<Category>>::ok(categories);
}

Result<std::vector<CategoryNode>> QueryEngine::categoryTree() const {
    Result<CatalogState> snap = store_.snapshot();
    if (!snap.isSuccess()) return Result<std::vector<CategoryNode>>::fail(snap.status());
    return Result<std::vector<CategoryNode>>::ok(treeOf(snap.value));
}

Result<CategoryImpact> QueryEngine::previewCategoryDeletion(const std::string& id) const {
    Result<CatalogState> snap = store_.snapshot();
    if (!snap.isSuccess()) return Result<CategoryImpact>::fail(snap.status());
    return IntegrityManager::previewCategoryDeletion(snap.value, id);
}

Result<std::vector<TagUsage>> QueryEngine::listTags() const {
    Result<CatalogState> snap = store_.snapshot();
    if (!snap.isSuccess()) return Result<std::vector<TagUsage>>::fail(snap.status());
    return Result<std::vector<TagUsage>>::ok(tagUsageOf(snap.value));
}

Result<std::vector<PromptVersion>> QueryEngine::listVersions(const std::string& prompt_id) const {
    Result<CatalogState> snap = store_.load(EntityKind::Versions);
    if (!snap.isSuccess()) return Result<std::vector<PromptVersion>>::fail(snap.status());

    VersionLedger ledger(static_cast<const std::vector<PromptVersion>&>(snap.value.versions));
    std::vector<PromptVersion> versions = ledger.list(prompt_id);
    if (versions.empty()) {
        return Result<std::vector<PromptVersion>>::fail(ErrorKind::NotFound,
                                                        "No versions recorded for prompt " + prompt_id);
    }
    return Result<std::vector<PromptVersion>>::ok(versions);
}

Result<PromptVersion> QueryEngine::getVersion(const std::string& prompt_id, const std::string& label) const {
    Result<CatalogState> snap = store_.load(EntityKind::Versions);
    if (!snap.isSuccess()) return Result<PromptVersion>::fail(snap.status());

    VersionLedger ledger(static_cast<const std::vector<PromptVersion>&>(snap.value.versions));
    return ledger.get(prompt_id, label);
}

Result<CatalogStats> QueryEngine::stats() const {
    Result<CatalogState> snap = store_.snapshot();
    if (!snap.isSuccess()) return Result<CatalogStats>::fail(snap.status());
    return Result<CatalogStats>::ok(statsOf(snap.value));
}

Result<std::vector<std::string>> QueryEngine::checkConsistency(const IntegrityManager& integrity) const {
    Result<CatalogState> snap = store_.snapshot();
    if (!snap.isSuccess()) return Result<std::vector<std::string>>::fail(snap.status());
    return Result<std::vector<std::string>>::ok(integrity.verify(snap.value));
}

} // namespace prompthub
