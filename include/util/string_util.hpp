#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace hookrelay::stringutil {

// Trim leading and trailing whitespace from a string
void trim(std::string &str);
std::string trim_copy(std::string_view str);

std::string to_lower_copy(std::string_view str);

bool iequals(std::string_view a, std::string_view b);
bool istarts_with(std::string_view value, std::string_view prefix);

// Split `str` on `delim`, trimming every piece; empty pieces are dropped.
std::vector<std::string> split_trim(const std::string &str, char delim);

std::string readFile(const fs::path &file_path, std::error_code &ec);

// ASCII slug: lower case, runs of anything outside [a-z0-9_-] become '-'.
std::string slugify(std::string_view str);

std::string join(const std::vector<std::string> &parts, std::string_view sep);

} // namespace hookrelay::stringutil
