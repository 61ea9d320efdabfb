#include "courier/core/version.hpp"

#include <string>

namespace courier {

std::string version() {
  return COURIER_VERSION_STRING;
}

}  // namespace courier
