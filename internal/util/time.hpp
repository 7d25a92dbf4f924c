#pragma once

#include <cstdint>

namespace convtree::util {

// Wall-clock milliseconds since the Unix epoch; the unit of every
// created_at_ms / updated_at_ms column.
uint64_t NowMillis();

} // namespace convtree::util
