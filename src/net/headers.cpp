#include "courier/net/headers.hpp"

#include <algorithm>
#include <cctype>

namespace courier::net {

bool iequals(const std::string& a, const std::string& b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return str;
}

bool is_token(const std::string& str) {
  if (str.empty()) return false;
  for (unsigned char c : str) {
    if (c <= 0x20 || c >= 0x7f) return false;
    switch (c) {
      case '(': case ')': case ',': case '/': case ':': case ';': case '<': case '=':
      case '>': case '?': case '@': case '[': case '\\': case ']': case '{': case '}': case '"':
        return false;
      default:
        break;
    }
  }
  return true;
}

bool valid_header_name(const std::string& name) {
  return is_token(name);
}

bool valid_header_value(const std::string& value) {
  return value.find_first_of(std::string("\r\n\0", 3)) == std::string::npos;
}

Headers::Headers(std::initializer_list<Entry> entries) {
  for (const auto& [name, value] : entries) {
    add(name, value);
  }
}

void Headers::add(const std::string& name, const std::string& value) {
  entries_.emplace_back(name, value);
}

void Headers::set(const std::string& name, const std::string& value) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return iequals(e.first, name); });
  if (it == entries_.end()) {
    entries_.emplace_back(name, value);
    return;
  }
  // Keep the position of the first occurrence
  it->second = value;
  entries_.erase(std::remove_if(std::next(it), entries_.end(), [&](const Entry& e) { return iequals(e.first, name); }), entries_.end());
}

size_t Headers::remove(const std::string& name) {
  auto before = entries_.size();
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return iequals(e.first, name); }), entries_.end());
  return before - entries_.size();
}

std::optional<std::string> Headers::get(const std::string& name) const {
  for (const auto& [key, value] : entries_) {
    if (iequals(key, name)) return value;
  }
  return std::nullopt;
}

std::string Headers::get_or(const std::string& name, const std::string& fallback) const {
  auto value = get(name);
  return value ? *value : fallback;
}

std::vector<std::string> Headers::get_all(const std::string& name) const {
  std::vector<std::string> result;
  for (const auto& [key, value] : entries_) {
    if (iequals(key, name)) result.push_back(value);
  }
  return result;
}

bool Headers::contains(const std::string& name) const {
  return get(name).has_value();
}

std::map<std::string, std::string> Headers::to_map() const {
  std::map<std::string, std::string> result;
  for (const auto& [key, value] : entries_) {
    auto lower = to_lower(key);
    auto it = result.find(lower);
    if (it == result.end()) {
      result.emplace(lower, value);
    } else {
      it->second += ", " + value;
    }
  }
  return result;
}

}  // namespace courier::net
