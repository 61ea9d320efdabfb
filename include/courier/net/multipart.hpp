#pragma once

#include <optional>
#include <string>
#include <vector>

namespace courier::net {

// One multipart/form-data part
struct Part {
  std::string name;
  std::string content;
  std::optional<std::string> filename;
  std::optional<std::string> content_type;
};

std::string make_boundary();

std::string multipart_content_type(const std::string& boundary);

std::string encode_multipart(const std::vector<Part>& parts, const std::string& boundary);

}  // namespace courier::net
