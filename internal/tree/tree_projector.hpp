#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "convtree/tree/v1/message.pb.h"
#include "internal/db/model/message_record.hpp"
#include "message_codec.hpp"

namespace convtree::tree {

/*
  TreeProjector

  Turns a loaded slice of a topic (depth-bounded subtree, active path
  and the children of every active-path node) into the flat
  TreeResponse shape: ordinary nodes plus siblings groups.

  Walk rules:
    - pre-order, children in (created_at_ms, id) order
    - a (parent_id, siblings_group_id) key is emitted once; a group of
      one is emitted as an ordinary node
    - a node's children are expanded when the node is on the active
      path, when depth is negative, or while the node's depth < depth
    - children of an active-path node restart at depth 0

  The walk is iterative so very deep branches cannot exhaust the stack.
*/
class TreeProjector {
 public:
  TreeProjector(std::vector<db::model::MessageRecord> records, std::unordered_set<std::string> active_path,
                std::unordered_set<std::string> ids_with_children, std::size_t preview_length = kDefaultPreviewLength);

  // Appends nodes and siblings groups reachable from root_id to `out`.
  void Project(const std::string& root_id, int32_t depth, convtree::tree::v1::TreeResponse* out) const;

 private:
  const std::vector<std::string>& ChildrenOf(const std::string& id) const;
  bool                            HasChildren(const std::string& id) const;

  std::unordered_map<std::string, db::model::MessageRecord> by_id_;
  std::unordered_map<std::string, std::vector<std::string>> children_;
  std::unordered_set<std::string>                           active_path_;
  std::unordered_set<std::string>                           ids_with_children_;
  std::size_t                                               preview_length_;
};

} // namespace convtree::tree
