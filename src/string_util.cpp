#include "util/string_util.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

namespace hookrelay::stringutil {

void trim(std::string &str) {
  auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
               return std::isspace(c) != 0;
             }).base();
  if (start >= end) {
    str.clear();
    return;
  }
  str = std::string(start, end);
}

std::string trim_copy(std::string_view str) {
  std::string copy(str);
  trim(copy);
  return copy;
}

std::string to_lower_copy(std::string_view str) {
  std::string out(str);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool istarts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         iequals(value.substr(0, prefix.size()), prefix);
}

std::vector<std::string> split_trim(const std::string &str, char delim) {
  std::vector<std::string> result;
  std::stringstream ss(str);
  std::string item;
  while (std::getline(ss, item, delim)) {
    trim(item);
    if (!item.empty()) {
      result.push_back(std::move(item));
    }
  }
  return result;
}

std::string readFile(const fs::path &file_path, std::error_code &ec) {
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
    return {};
  }
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (file.bad()) {
    ec = std::make_error_code(std::errc::io_error);
    return {};
  }
  ec.clear();
  return content;
}

std::string slugify(std::string_view str) {
  std::string out;
  out.reserve(str.size());
  bool last_dash = false;
  for (unsigned char c : str) {
    if (std::isalnum(c) || c == '_' || c == '-') {
      out.push_back(static_cast<char>(std::tolower(c)));
      last_dash = c == '-';
    } else if (!last_dash && !out.empty()) {
      out.push_back('-');
      last_dash = true;
    }
  }
  while (!out.empty() && out.back() == '-') {
    out.pop_back();
  }
  return out;
}

std::string join(const std::vector<std::string> &parts, std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) {
      out += sep;
    }
    out += parts[i];
  }
  return out;
}

} // namespace hookrelay::stringutil
