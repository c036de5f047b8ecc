#include "version_ledger.h"
#include "utils.h"
#include <algorithm>
#include <cctype>

namespace prompthub {

namespace {

bool parseNumber(const std::string& text, int& out) {
    if (text.empty() || text.size() > 9) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    out = std::stoi(text);
    return true;
}

} // namespace

bool VersionLabel::parse(const std::string& text, VersionLabel& out) {
    size_t dot = text.find('.');
    if (dot == std::string::npos) return false;
    VersionLabel label;
    if (!parseNumber(text.substr(0, dot), label.major)) return false;
    if (!parseNumber(text.substr(dot + 1), label.minor)) return false;
    out = label;
    return true;
}

std::string VersionLabel::toString() const {
    return std::to_string(major) + "." + std::to_string(minor);
}

VersionLedger::VersionLedger(std::vector<PromptVersion>& versions)
    : versions_(versions)
    , writable_(&versions)
{
}

VersionLedger::VersionLedger(const std::vector<PromptVersion>& versions)
    : versions_(versions)
    , writable_(nullptr)
{
}

int VersionLedger::compareLabels(const std::string& a, const std::string& b) {
    VersionLabel la, lb;
    if (VersionLabel::parse(a, la) && VersionLabel::parse(b, lb)) {
        if (la.major != lb.major) return la.major < lb.major ? -1 : 1;
        if (la.minor != lb.minor) return la.minor < lb.minor ? -1 : 1;
        return 0;
    }
    return a.compare(b);
}

std::string VersionLedger::nextLabel(const std::string& prompt_id, bool major) const {
    bool found = false;
    VersionLabel highest;
    for (const auto& v : versions_) {
        if (v.prompt_id != prompt_id) continue;
        VersionLabel label;
        if (!VersionLabel::parse(v.version, label)) continue;
        if (!found || label.major > highest.major ||
            (label.major == highest.major && label.minor > highest.minor)) {
            highest = label;
            found = true;
        }
    }

    if (!found) return "1.0";

    VersionLabel next = highest;
    if (major) {
        next.major++;
        next.minor = 0;
    } else {
        next.minor++;
    }
    return next.toString();
}

Result<std::string> VersionLedger::append(const Prompt& snapshot, const std::string& change_note, bool major) {
    if (!writable_) {
        return Result<std::string>::fail(ErrorKind::ConsistencyViolation, "Version ledger opened read-only");
    }
    if (snapshot.id.empty()) {
        return Result<std::string>::fail(ErrorKind::InvalidInput, "Cannot version a prompt without an id");
    }

    std::string label = nextLabel(snapshot.id, major);
    if (contains(snapshot.id, label)) {
        return Result<std::string>::fail(ErrorKind::ConsistencyViolation,
                                         "Version " + label + " of prompt " + snapshot.id + " already exists");
    }

    PromptVersion v;
    v.prompt_id = snapshot.id;
    v.version = label;
    v.title = snapshot.title;
    v.content = snapshot.content;
    v.description = snapshot.description;
    v.change_note = change_note;
    v.created_at = utils::getCurrentTimestamp();
    writable_->push_back(v);

    return Result<std::string>::ok(label);
}

std::vector<PromptVersion> VersionLedger::list(const std::string& prompt_id) const {
    std::vector<PromptVersion> result;
    for (const auto& v : versions_) {
        if (v.prompt_id == prompt_id) result.push_back(v);
    }
    std::stable_sort(result.begin(), result.end(), [](const PromptVersion& a, const PromptVersion& b) {
        return compareLabels(a.version, b.version) < 0;
    });
    return result;
}

Result<PromptVersion> VersionLedger::get(const std::string& prompt_id, const std::string& label) const {
    for (const auto& v : versions_) {
        if (v.prompt_id == prompt_id && v.version == label) {
            return Result<PromptVersion>::ok(v);
        }
    }
    return Result<PromptVersion>::fail(ErrorKind::NotFound,
                                       "Version " + label + " of prompt " + prompt_id + " not found");
}

Result<PromptVersion> VersionLedger::latest(const std::string& prompt_id) const {
    std::vector<PromptVersion> all = list(prompt_id);
    if (all.empty()) {
        return Result<PromptVersion>::fail(ErrorKind::NotFound, "Prompt " + prompt_id + " has no versions");
    }
    return Result<PromptVersion>::ok(all.back());
}

bool VersionLedger::contains(const std::string& prompt_id, const std::string& label) const {
    return std::any_of(versions_.begin(), versions_.end(), [&](const PromptVersion& v) {
        return v.prompt_id == prompt_id && v.version == label;
    });
}

size_t VersionLedger::count(const std::string& prompt_id) const {
    return static_cast<size_t>(std::count_if(versions_.begin(), versions_.end(),
        [&prompt_id](const PromptVersion& v) { return v.prompt_id == prompt_id; }));
}

bool VersionLedger::extends(const std::vector<PromptVersion>& before, const std::vector<PromptVersion>& after) {
    if (after.size() < before.size()) return false;
    return std::equal(before.begin(), before.end(), after.begin());
}

} // namespace prompthub
