#ifndef PROMPTHUB_VERSION_LEDGER_H
#define PROMPTHUB_VERSION_LEDGER_H

#include "errors.h"
#include "models.h"
#include <string>
#include <vector>

namespace prompthub {

// "<major>.<minor>" with non-negative integers, e.g. "1.0", "1.12", "3.0"
struct VersionLabel {
    int major = 1;
    int minor = 0;

    static bool parse(const std::string& text, VersionLabel& out);
    std::string toString() const;
};

// Append-only history of prompt snapshots. Wraps the versions collection of a
// CatalogState; the const constructor gives a read-only view.
class VersionLedger {
public:
    explicit VersionLedger(std::vector<PromptVersion>& versions);
    explicit VersionLedger(const std::vector<PromptVersion>& versions);

    // Records title/content/description of snapshot under the next label
    Result<std::string> append(const Prompt& snapshot, const std::string& change_note, bool major = false);

    std::vector<PromptVersion> list(const std::string& prompt_id) const;
    Result<PromptVersion> get(const std::string& prompt_id, const std::string& label) const;
    Result<PromptVersion> latest(const std::string& prompt_id) const;
    bool contains(const std::string& prompt_id, const std::string& label) const;
    size_t count(const std::string& prompt_id) const;

    // Label that append() would assign; always above every existing label of the prompt
    std::string nextLabel(const std::string& prompt_id, bool major = false) const;

    // <0, 0, >0 like strcmp; numeric when both labels parse
    static int compareLabels(const std::string& a, const std::string& b);

    // True when after keeps every entry of before unchanged and in order
    static bool extends(const std::vector<PromptVersion>& before, const std::vector<PromptVersion>& after);

private:
    const std::vector<PromptVersion>& versions_;
    std::vector<PromptVersion>* writable_;
};

} // namespace prompthub

#endif // PROMPTHUB_VERSION_LEDGER_H
