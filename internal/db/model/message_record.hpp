#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace convtree::db::model {

/*
  Persistent message row.

  role / status are stored as their lowercase names ("user", "pending").
  JSON columns hold the serialized google.protobuf.Struct; nullopt is
  SQL NULL.
*/

struct MessageRecord {
  std::string                id;
  std::string                topic_id;
  std::optional<std::string> parent_id; // nullopt => root

  std::string role;
  std::string data_json = "{}";

  std::optional<std::string> searchable_text;

  std::string status;
  int64_t     siblings_group_id = 0; // 0 => not grouped

  std::optional<std::string> assistant_id;
  std::optional<std::string> assistant_meta_json;
  std::optional<std::string> model_id;
  std::optional<std::string> model_meta_json;
  std::optional<std::string> trace_id;
  std::optional<std::string> stats_json;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

// Identifies one siblings group.
struct SiblingsKey {
  std::string parent_id;
  int64_t     siblings_group_id = 0;

  bool operator==(const SiblingsKey&) const = default;
};

// Subtree row annotated with its distance from the subtree root.
struct DepthRecord {
  MessageRecord message;
  uint32_t      depth = 0;
};

} // namespace convtree::db::model
