#include "memory_repository.hpp"

#include <algorithm>
#include <deque>
#include <set>
#include <tuple>
#include <utility>

#include "memory_tx.hpp"

namespace convtree::db::memory {

namespace {

using State = MemoryRepository::State;

bool CreatedBefore(const model::MessageRecord& a, const model::MessageRecord& b) {
  return std::tie(a.created_at_ms, a.id) < std::tie(b.created_at_ms, b.id);
}

std::vector<std::string>& SlotFor(State& s, const model::MessageRecord& r) {
  return r.parent_id ? s.children[*r.parent_id] : s.roots[r.topic_id];
}

void Attach(State& s, const model::MessageRecord& r) {
  SlotFor(s, r).push_back(r.id);
}

void Detach(State& s, const model::MessageRecord& r) {
  auto& slot = SlotFor(s, r);
  slot.erase(std::remove(slot.begin(), slot.end(), r.id), slot.end());
}

std::vector<model::MessageRecord> SortedRecords(const State& s, const std::vector<std::string>& ids) {
  std::vector<model::MessageRecord> out;
  out.reserve(ids.size());
  for (const auto& id : ids) {
    auto it = s.messages.find(id);
    if (it != s.messages.end()) out.push_back(it->second);
  }
  std::sort(out.begin(), out.end(), CreatedBefore);
  return out;
}

std::vector<model::MessageRecord> ChildrenOf(const State& s, const std::string& parent_id) {
  auto it = s.children.find(parent_id);
  if (it == s.children.end()) return {};
  return SortedRecords(s, it->second);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Topics
// ------------------------------------------------------------------

Result MemoryRepository::InsertTopic(Transaction& t, const model::TopicRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.topics.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "topic " + r.id);
  s.topics[r.id] = r;
  return Result::Ok();
}

std::optional<model::TopicRecord> MemoryRepository::GetTopic(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.topics.find(id);
  if (it == s.topics.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::SetActiveNode(Transaction& t, const std::string& topic_id, const std::optional<std::string>& node_id,
                                       uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.topics.find(topic_id);
  if (it == s.topics.end()) return Result::Err(ErrorCode::NotFound, "topic " + topic_id);
  it->second.active_node_id = node_id;
  it->second.updated_at_ms  = updated_at_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteTopic(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (!s.topics.contains(id)) return Result::Err(ErrorCode::NotFound, "topic " + id);

  auto members = s.topic_messages.find(id);
  if (members != s.topic_messages.end()) {
    for (const auto& message_id : members->second) {
      s.messages.erase(message_id);
      s.children.erase(message_id);
    }
    s.topic_messages.erase(members);
  }
  s.roots.erase(id);
  s.topics.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result MemoryRepository::InsertMessage(Transaction& t, const model::MessageRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.messages.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "message " + r.id);
  if (!s.topics.contains(r.topic_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown topic " + r.topic_id);
  if (r.parent_id && !s.messages.contains(*r.parent_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown parent " + *r.parent_id);
  }

  s.messages[r.id] = r;
  Attach(s, r);
  s.topic_messages[r.topic_id].insert(r.id);
  return Result::Ok();
}

std::optional<model::MessageRecord> MemoryRepository::GetMessage(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.messages.find(id);
  if (it == s.messages.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateMessage(Transaction& t, const model::MessageRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.messages.find(r.id);
  if (it == s.messages.end()) return Result::Err(ErrorCode::NotFound, "message " + r.id);
  if (r.parent_id && !s.messages.contains(*r.parent_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown parent " + *r.parent_id);
  }

  auto updated          = r;
  updated.topic_id      = it->second.topic_id;
  updated.role          = it->second.role;
  updated.created_at_ms = it->second.created_at_ms;

  if (updated.parent_id != it->second.parent_id) {
    Detach(s, it->second);
    Attach(s, updated);
  }
  it->second = std::move(updated);
  return Result::Ok();
}

Result MemoryRepository::DeleteMessages(Transaction& t, const std::vector<std::string>& ids) {
  auto& s = TX(t).Mutable();

  std::vector<std::string> removed;
  removed.reserve(ids.size());
  for (const auto& id : ids) {
    auto it = s.messages.find(id);
    if (it == s.messages.end()) continue;
    Detach(s, it->second);
    s.topic_messages[it->second.topic_id].erase(id);
    s.messages.erase(it);
    removed.push_back(id);
  }

  // Surviving children would dangle; SQL backends reject this at commit.
  for (const auto& id : removed) {
    auto children = s.children.find(id);
    if (children == s.children.end()) continue;
    if (!children->second.empty()) {
      return Result::Err(ErrorCode::ConstraintViolation, "message " + id + " still has children");
    }
    s.children.erase(children);
  }
  return Result::Ok();
}

std::optional<std::string> MemoryRepository::FindRootId(Transaction& t, const std::string& topic_id) {
  const auto& s  = TX(t).View();
  auto        it = s.roots.find(topic_id);
  if (it == s.roots.end() || it->second.empty()) return std::nullopt;
  return SortedRecords(s, it->second).front().id;
}

std::vector<std::string> MemoryRepository::GetChildIds(Transaction& t, const std::string& parent_id) {
  std::vector<std::string> out;
  for (auto& child : ChildrenOf(TX(t).View(), parent_id)) {
    out.push_back(std::move(child.id));
  }
  return out;
}

std::vector<model::MessageRecord> MemoryRepository::GetChildrenOf(Transaction& t, const std::vector<std::string>& parent_ids) {
  const auto&                       s = TX(t).View();
  std::set<std::string>             seen;
  std::vector<model::MessageRecord> out;
  for (const auto& parent_id : parent_ids) {
    if (!seen.insert(parent_id).second) continue;
    auto children = ChildrenOf(s, parent_id);
    out.insert(out.end(), std::make_move_iterator(children.begin()), std::make_move_iterator(children.end()));
  }
  return out;
}

std::vector<std::string> MemoryRepository::GetIdsWithChildren(Transaction& t, const std::vector<std::string>& ids) {
  const auto&              s = TX(t).View();
  std::vector<std::string> out;
  for (const auto& id : ids) {
    auto it = s.children.find(id);
    if (it != s.children.end() && !it->second.empty()) out.push_back(id);
  }
  return out;
}

Result MemoryRepository::ReparentChildren(Transaction& t, const std::string& parent_id, const std::optional<std::string>& new_parent_id,
                                          uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.children.find(parent_id);
  if (it == s.children.end()) return Result::Ok();
  if (new_parent_id && !s.messages.contains(*new_parent_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown parent " + *new_parent_id);
  }

  auto moved = std::move(it->second);
  s.children.erase(it);
  for (const auto& child_id : moved) {
    auto& child         = s.messages.at(child_id);
    child.parent_id     = new_parent_id;
    child.updated_at_ms = updated_at_ms;
    Attach(s, child);
  }
  return Result::Ok();
}

std::vector<model::MessageRecord> MemoryRepository::GetSiblings(Transaction& t, const std::vector<model::SiblingsKey>& keys) {
  const auto&                       s = TX(t).View();
  std::vector<model::SiblingsKey>   seen;
  std::vector<model::MessageRecord> out;
  for (const auto& key : keys) {
    if (std::find(seen.begin(), seen.end(), key) != seen.end()) continue;
    seen.push_back(key);
    for (auto& child : ChildrenOf(s, key.parent_id)) {
      if (child.siblings_group_id == key.siblings_group_id) out.push_back(std::move(child));
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Traversal
// ------------------------------------------------------------------

std::vector<model::MessageRecord> MemoryRepository::GetPathToRoot(Transaction& t, const std::string& id) {
  const auto&                       s = TX(t).View();
  std::vector<model::MessageRecord> path;

  auto it = s.messages.find(id);
  while (it != s.messages.end() && path.size() <= s.messages.size()) {
    path.push_back(it->second);
    if (!it->second.parent_id) break;
    it = s.messages.find(*it->second.parent_id);
  }
  return path;
}

std::vector<std::string> MemoryRepository::GetDescendantIds(Transaction& t, const std::string& id) {
  const auto&              s = TX(t).View();
  std::vector<std::string> out;
  std::vector<std::string> pending{id};

  while (!pending.empty()) {
    auto current = std::move(pending.back());
    pending.pop_back();

    auto it = s.children.find(current);
    if (it == s.children.end()) continue;
    for (const auto& child_id : it->second) {
      out.push_back(child_id);
      pending.push_back(child_id);
    }
  }
  return out;
}

std::vector<model::DepthRecord> MemoryRepository::GetSubtree(Transaction& t, const std::string& root_id, std::optional<uint32_t> max_depth) {
  const auto&                     s = TX(t).View();
  std::vector<model::DepthRecord> out;

  auto root = s.messages.find(root_id);
  if (root == s.messages.end()) return out;

  std::deque<std::pair<std::string, uint32_t>> queue{{root_id, 0}};
  while (!queue.empty()) {
    auto [current, depth] = std::move(queue.front());
    queue.pop_front();

    out.push_back({s.messages.at(current), depth});
    if (max_depth && depth >= *max_depth) continue;

    for (auto& child : ChildrenOf(s, current)) {
      queue.emplace_back(std::move(child.id), depth + 1);
    }
  }
  return out;
}

} // namespace convtree::db::memory
