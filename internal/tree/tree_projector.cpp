#include "tree_projector.hpp"

#include <algorithm>

namespace convtree::tree {

using namespace convtree::tree::v1;

namespace {

struct Frame {
  std::string id;
  int32_t     depth;
  bool        on_active_path;
};

struct GroupKeyHash {
  std::size_t operator()(const db::model::SiblingsKey& key) const {
    return std::hash<std::string>{}(key.parent_id) ^ (std::hash<int64_t>{}(key.siblings_group_id) << 1);
  }
};

} // namespace

TreeProjector::TreeProjector(std::vector<db::model::MessageRecord> records, std::unordered_set<std::string> active_path,
                             std::unordered_set<std::string> ids_with_children, std::size_t preview_length)
    : active_path_(std::move(active_path)), ids_with_children_(std::move(ids_with_children)), preview_length_(preview_length) {
  for (auto& record : records) {
    const auto id = record.id;
    by_id_.try_emplace(id, std::move(record));
  }

  for (const auto& [id, record] : by_id_) {
    if (record.parent_id) {
      children_[*record.parent_id].push_back(id);
    }
  }

  for (auto& [parent, ids] : children_) {
    std::sort(ids.begin(), ids.end(), [this](const std::string& a, const std::string& b) {
      const auto& ra = by_id_.at(a);
      const auto& rb = by_id_.at(b);
      if (ra.created_at_ms != rb.created_at_ms) return ra.created_at_ms < rb.created_at_ms;
      return ra.id < rb.id;
    });
  }
}

const std::vector<std::string>& TreeProjector::ChildrenOf(const std::string& id) const {
  static const std::vector<std::string> kNone;
  const auto                            it = children_.find(id);
  return it == children_.end() ? kNone : it->second;
}

bool TreeProjector::HasChildren(const std::string& id) const {
  return ids_with_children_.count(id) > 0 || !ChildrenOf(id).empty();
}

void TreeProjector::Project(const std::string& root_id, int32_t depth, TreeResponse* out) const {
  if (!by_id_.count(root_id)) {
    return;
  }

  std::unordered_set<db::model::SiblingsKey, GroupKeyHash> visited_groups;
  std::vector<Frame>                                       stack;
  stack.push_back({root_id, 0, active_path_.count(root_id) > 0});

  while (!stack.empty()) {
    const Frame frame = std::move(stack.back());
    stack.pop_back();

    const auto it = by_id_.find(frame.id);
    if (it == by_id_.end()) {
      continue;
    }
    const auto& record = it->second;

    if (record.siblings_group_id != 0 && record.parent_id) {
      db::model::SiblingsKey key{*record.parent_id, record.siblings_group_id};
      if (visited_groups.insert(key).second) {
        std::vector<const db::model::MessageRecord*> members;
        for (const auto& sibling_id : ChildrenOf(*record.parent_id)) {
          const auto& sibling = by_id_.at(sibling_id);
          if (sibling.siblings_group_id == record.siblings_group_id) {
            members.push_back(&sibling);
          }
        }

        if (members.size() > 1) {
          auto* group = out->add_siblings_groups();
          group->set_parent_id(*record.parent_id);
          group->set_siblings_group_id(record.siblings_group_id);
          for (const auto* member : members) {
            auto node = ToTreeNode(*member, HasChildren(member->id), preview_length_);
            node.clear_parent_id();
            *group->add_nodes() = std::move(node);
          }
        } else {
          *out->add_nodes() = ToTreeNode(record, HasChildren(record.id), preview_length_);
        }
      }
    } else {
      *out->add_nodes() = ToTreeNode(record, HasChildren(record.id), preview_length_);
    }

    const bool expand = frame.on_active_path || depth < 0 || frame.depth < depth;
    if (!expand) {
      continue;
    }

    const auto&   children    = ChildrenOf(record.id);
    const int32_t child_depth = frame.on_active_path ? 0 : frame.depth + 1;
    for (auto child = children.rbegin(); child != children.rend(); ++child) {
      stack.push_back({*child, child_depth, active_path_.count(*child) > 0});
    }
  }
}

} // namespace convtree::tree
