#include "exporter.h"
#include "utils.h"
#include <iostream>

namespace prompthub {
namespace exporter {

namespace {

const char* UTF8_BOM = "\xEF\xBB\xBF";
const char* EXPORT_FORMAT_VERSION = "2.0";

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += "\"";
    return quoted;
}

} // namespace

std::string toCsv(const std::vector<Prompt>& prompts) {
    std::string out = UTF8_BOM;
    out += "标题,描述,分类,标签,内容,创建时间,更新时间\r\n";

    for (const auto& p : prompts) {
        std::vector<std::string> row = {
            p.title,
            p.description,
            p.category_path.empty() ? p.category_name : p.category_path,
            utils::join(p.tags, ", "),
            p.content,
            p.created_at,
            p.updated_at
        };
        for (size_t i = 0; i < row.size(); i++) {
            if (i > 0) out += ",";
            out += csvField(row[i]);
        }
        out += "\r\n";
    }
    return out;
}

Status writeCsv(const std::vector<Prompt>& prompts, const std::string& path) {
    if (!utils::writeFileAtomic(path, toCsv(prompts))) {
        return Status::fail(ErrorKind::StorageFailure, "Cannot write " + path);
    }
    return Status::ok();
}

json toJson(const std::vector<Prompt>& prompts) {
    json doc;
    doc["version"] = EXPORT_FORMAT_VERSION;
    doc["exported_at"] = utils::getCurrentTimestamp();
    doc["prompts"] = json::array();
    for (const auto& p : prompts) {
        doc["prompts"].push_back(p.toJson());
    }
    return doc;
}

Status writeJson(const std::vector<Prompt>& prompts, const std::string& path) {
    std::string text;
    try {
        text = toJson(prompts).dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const std::exception& e) {
        return Status::fail(ErrorKind::StorageFailure, std::string("Cannot serialize export: ") + e.what());
    }
    if (!utils::writeFileAtomic(path, text + "\n")) {
        return Status::fail(ErrorKind::StorageFailure, "Cannot write " + path);
    }
    return Status::ok();
}

Result<std::vector<Prompt>> parsePrompts(const std::string& text) {
    std::vector<Prompt> prompts;
    try {
        json doc = json::parse(text);
        const json* items = nullptr;
        if (doc.is_array()) {
            items = &doc;
        } else if (doc.is_object() && doc.contains("prompts") && doc["prompts"].is_array()) {
            items = &doc["prompts"];
        } else {
            return Result<std::vector<Prompt>>::fail(ErrorKind::InvalidInput,
                                                     "Expected a \"prompts\" array");
        }

        for (const auto& item : *items) {
            if (!item.is_object()) {
                return Result<std::vector<Prompt>>::fail(ErrorKind::InvalidInput, "Prompt entries must be objects");
            }
            prompts.push_back(Prompt::fromJson(item));
        }
    } catch (const std::exception& e) {
        return Result<std::vector<Prompt>>::fail(ErrorKind::InvalidInput, std::string("Invalid JSON: ") + e.what());
    }
    return Result<std::vector<Prompt>>::ok(prompts);
}

Result<std::vector<Prompt>> readPrompts(const std::string& path) {
    std::string text;
    if (!utils::fileExists(path) || !utils::readFile(path, text)) {
        return Result<std::vector<Prompt>>::fail(ErrorKind::NotFound, "Cannot read " + path);
    }
    Result<std::vector<Prompt>> r = parsePrompts(text);
    if (!r.isSuccess()) {
        r.error = path + ": " + r.error;
    }
    return r;
}

} // namespace exporter
} // namespace prompthub
