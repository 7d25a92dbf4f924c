#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace convtree::db::model {

struct TopicRecord {
  std::string                id;
  std::string                name;
  std::optional<std::string> active_node_id;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace convtree::db::model
