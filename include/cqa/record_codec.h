#pragma once

#include <cqa/models.h>

#include <string>
#include <vector>

namespace cqa {

std::string Escape(const std::string &value);
std::string Unescape(const std::string &value);
std::vector<std::string> SplitEscaped(const std::string &line);

std::string EncodeFileRecord(const FileRecord &record);
std::string EncodeRunEntry(const RunCacheEntry &entry);

// Both decoders throw CacheError on any malformed or truncated input.
FileRecord DecodeFileRecord(const std::string &text);
RunCacheEntry DecodeRunEntry(const std::string &text);

} // namespace cqa
