#ifndef PROMPTHUB_EXPORTER_H
#define PROMPTHUB_EXPORTER_H

#include "errors.h"
#include "models.h"
#include <string>
#include <vector>

namespace prompthub {

namespace exporter {

// UTF-8 BOM + header row + one RFC 4180 row per prompt
std::string toCsv(const std::vector<Prompt>& prompts);
Status writeCsv(const std::vector<Prompt>& prompts, const std::string& path);

// {"version": "2.0", "exported_at": ..., "prompts": [...]}
json toJson(const std::vector<Prompt>& prompts);
Status writeJson(const std::vector<Prompt>& prompts, const std::string& path);

// Accepts an export document, {"prompts": [...]} or a bare array
Result<std::vector<Prompt>> readPrompts(const std::string& path);
Result<std::vector<Prompt>> parsePrompts(const std::string& text);

} // namespace exporter

} // namespace prompthub

#endif // PROMPTHUB_EXPORTER_H
