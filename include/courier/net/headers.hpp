#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace courier::net {

bool iequals(const std::string& a, const std::string& b);

std::string to_lower(std::string str);

// RFC 7230 token: non-empty, visible ASCII without separators
bool is_token(const std::string& str);

bool valid_header_name(const std::string& name);

// Rejects CR, LF and NUL, which would end the header line early
bool valid_header_value(const std::string& value);

// Ordered header multimap. Names compare case-insensitively, original spelling is kept.
class Headers {
 public:
  using Entry = std::pair<std::string, std::string>;
  using const_iterator = std::vector<Entry>::const_iterator;

  Headers() = default;

  Headers(std::initializer_list<Entry> entries);

  // Appends, keeping existing values with the same name
  void add(const std::string& name, const std::string& value);

  // Replaces every value with the same name
  void set(const std::string& name, const std::string& value);

  // Returns the number of removed entries
  size_t remove(const std::string& name);

  std::optional<std::string> get(const std::string& name) const;

  std::string get_or(const std::string& name, const std::string& fallback) const;

  std::vector<std::string> get_all(const std::string& name) const;

  bool contains(const std::string& name) const;

  size_t size() const {
    return entries_.size();
  }

  bool empty() const {
    return entries_.empty();
  }

  void clear() {
    entries_.clear();
  }

  const_iterator begin() const {
    return entries_.begin();
  }

  const_iterator end() const {
    return entries_.end();
  }

  // Lowercased names, duplicate values joined with ", "
  std::map<std::string, std::string> to_map() const;

 private:
  std::vector<Entry> entries_;
};

}  // namespace courier::net
