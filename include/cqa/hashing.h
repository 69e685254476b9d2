#pragma once

#include <cqa/models.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace cqa {

std::string Sha256Hex(std::string_view data);
std::string Sha256FileHex(const std::filesystem::path &path);

// Throws ResourceError when the file cannot be read.
FileFingerprint FingerprintFile(const std::filesystem::path &path);

} // namespace cqa
