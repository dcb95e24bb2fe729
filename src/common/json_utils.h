#ifndef PATCHARBITER_SRC_COMMON_JSON_UTILS_H_
#define PATCHARBITER_SRC_COMMON_JSON_UTILS_H_

#include <string>

#include <json/json.h>

namespace PatchArbiter {

// Parses `text`; throws DatasetError naming `origin` on malformed input.
Json::Value ParseJson(const std::string& text, const std::string& origin);

// Reads and parses a whole file.
Json::Value ReadJsonFile(const std::string& path);

// Serializes with the given indentation ("" produces a single line).
std::string ToJsonString(const Json::Value& value, const std::string& indent = "    ");

// Writes `content` to `<path>.tmp` and renames it over `path`, creating parent
// directories. Readers never observe a partially written file.
void WriteFileAtomically(const std::string& path, const std::string& content);

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_COMMON_JSON_UTILS_H_
