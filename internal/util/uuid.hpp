#pragma once

#include <string>

namespace convtree::util {

// Fresh RFC 4122 version-4 UUID, lowercase 8-4-4-4-12.
// Used for both topic and message ids.
std::string NewId();

} // namespace convtree::util
