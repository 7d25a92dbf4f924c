#include "message_tree.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/tree/message_codec.hpp"
#include "internal/tree/tree_projector.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace convtree::core {

using namespace convtree::tree::v1;
using convtree::observability::BoolField;
using convtree::observability::IntField;
using convtree::observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound("record", message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message);
  }
}

db::model::TopicRecord RequireTopic(db::Repository& repo, db::Transaction& tx, const std::string& topic_id) {
  auto topic = repo.GetTopic(tx, topic_id);
  if (!topic) throw util::NotFound("topic", topic_id);
  return *topic;
}

db::model::MessageRecord RequireMessage(db::Repository& repo, db::Transaction& tx, const std::string& id) {
  auto message = repo.GetMessage(tx, id);
  if (!message) throw util::NotFound("message", id);
  return *message;
}

std::optional<std::string> StructJson(const std::optional<google::protobuf::Struct>& value) {
  if (!value) return std::nullopt;
  return tree::StructToJson(*value);
}

struct SiblingsKeyHash {
  std::size_t operator()(const db::model::SiblingsKey& key) const {
    return std::hash<std::string>{}(key.parent_id) ^ (std::hash<int64_t>{}(key.siblings_group_id) << 1);
  }
};

} // namespace

MessageTree::MessageTree(std::shared_ptr<db::Repository> repository, MessageTreeOptions options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("message tree: repository is required");
  }
}

// ---------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------

TreeResponse MessageTree::GetTree(const std::string& topic_id, const TreeQuery& query) {
  auto tx    = repository_->Begin();
  auto topic = RequireTopic(*repository_, *tx, topic_id);

  const auto focus = query.node_id ? query.node_id : topic.active_node_id;

  std::optional<std::string> root_id;
  if (query.root_id) {
    auto root = repository_->GetMessage(*tx, *query.root_id);
    if (!root || root->topic_id != topic_id) throw util::NotFound("message", *query.root_id);
    root_id = root->id;
  } else {
    root_id = repository_->FindRootId(*tx, topic_id);
  }

  TreeResponse response;
  if (!root_id) {
    tx->Commit();
    return response;
  }

  std::vector<db::model::MessageRecord> active_path;
  if (focus) {
    active_path = repository_->GetPathToRoot(*tx, *focus);
    const bool foreign = !active_path.empty() && active_path.front().topic_id != topic_id;
    if (query.node_id && (active_path.empty() || foreign)) {
      throw util::NotFound("message", *focus);
    }
    if (foreign) active_path.clear();
  }

  const int32_t depth = query.depth.value_or(options_.default_depth);
  const auto    max_depth =
      depth < 0 ? std::nullopt : std::optional<uint32_t>(static_cast<uint32_t>(depth));

  std::vector<db::model::MessageRecord> records;
  std::unordered_set<std::string>       loaded;
  for (auto& row : repository_->GetSubtree(*tx, *root_id, max_depth)) {
    loaded.insert(row.message.id);
    records.push_back(std::move(row.message));
  }

  std::unordered_set<std::string> path_ids;
  std::vector<std::string>        path_list;
  for (auto& record : active_path) {
    path_ids.insert(record.id);
    path_list.push_back(record.id);
    if (loaded.insert(record.id).second) {
      records.push_back(std::move(record));
    }
  }

  if (!path_list.empty()) {
    for (auto& child : repository_->GetChildrenOf(*tx, path_list)) {
      if (loaded.insert(child.id).second) {
        records.push_back(std::move(child));
      }
    }
  }

  std::vector<std::string> loaded_ids(loaded.begin(), loaded.end());
  auto                     with_children = repository_->GetIdsWithChildren(*tx, loaded_ids);
  tx->Commit();

  tree::TreeProjector projector(std::move(records), std::move(path_ids),
                                std::unordered_set<std::string>(with_children.begin(), with_children.end()),
                                options_.preview_length);
  projector.Project(*root_id, depth, &response);

  if (focus) response.set_active_node_id(*focus);
  return response;
}

BranchMessagesResponse MessageTree::GetBranchMessages(const std::string& topic_id, const BranchQuery& query) {
  auto tx    = repository_->Begin();
  auto topic = RequireTopic(*repository_, *tx, topic_id);

  BranchMessagesResponse response;

  const auto node_id = query.node_id ? query.node_id : topic.active_node_id;
  if (!node_id) {
    tx->Commit();
    return response;
  }

  auto path = repository_->GetPathToRoot(*tx, *node_id);
  if (path.empty() || path.front().topic_id != topic_id) throw util::NotFound("message", *node_id);
  std::reverse(path.begin(), path.end());

  const int32_t limit = query.limit.value_or(options_.default_branch_limit);
  std::size_t   start = 0;
  std::size_t   end   = path.size();

  if (query.before_node_id) {
    const auto it = std::find_if(path.begin(), path.end(),
                                 [&](const db::model::MessageRecord& r) { return r.id == *query.before_node_id; });
    if (it == path.end()) throw util::NotFound("message", *query.before_node_id);
    end = static_cast<std::size_t>(it - path.begin());
  }
  if (limit > 0 && end > static_cast<std::size_t>(limit)) {
    start = end - static_cast<std::size_t>(limit);
  }

  std::unordered_map<db::model::SiblingsKey, std::vector<db::model::MessageRecord>, SiblingsKeyHash> groups;
  if (query.include_siblings.value_or(true)) {
    std::vector<db::model::SiblingsKey> keys;
    for (std::size_t i = start; i < end; ++i) {
      const auto& record = path[i];
      if (record.siblings_group_id == 0 || !record.parent_id) continue;
      db::model::SiblingsKey key{*record.parent_id, record.siblings_group_id};
      if (groups.try_emplace(key).second) keys.push_back(std::move(key));
    }
    if (!keys.empty()) {
      for (auto& sibling : repository_->GetSiblings(*tx, keys)) {
        if (!sibling.parent_id) continue;
        const auto it = groups.find({*sibling.parent_id, sibling.siblings_group_id});
        if (it != groups.end()) it->second.push_back(std::move(sibling));
      }
    }
  }
  tx->Commit();

  for (std::size_t i = start; i < end; ++i) {
    const auto& record = path[i];
    auto*       entry  = response.add_messages();
    *entry->mutable_message() = tree::ToMessage(record);

    if (record.siblings_group_id == 0 || !record.parent_id) continue;
    const auto it = groups.find({*record.parent_id, record.siblings_group_id});
    if (it == groups.end() || it->second.size() < 2) continue;
    for (const auto& sibling : it->second) {
      if (sibling.id != record.id) *entry->add_siblings_group() = tree::ToMessage(sibling);
    }
  }

  if (topic.active_node_id) response.set_active_node_id(*topic.active_node_id);
  return response;
}

Message MessageTree::GetById(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = RequireMessage(*repository_, *tx, id);
  tx->Commit();
  return tree::ToMessage(record);
}

std::vector<Message> MessageTree::GetPathToNode(const std::string& node_id) {
  auto tx   = repository_->Begin();
  auto path = repository_->GetPathToRoot(*tx, node_id);
  tx->Commit();
  if (path.empty()) throw util::NotFound("message", node_id);

  std::vector<Message> out;
  out.reserve(path.size());
  for (auto it = path.rbegin(); it != path.rend(); ++it) {
    out.push_back(tree::ToMessage(*it));
  }
  return out;
}

// ---------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------

std::optional<std::string> MessageTree::ResolveParent(db::Transaction& tx, const db::model::TopicRecord& topic,
                                                      const ParentResolution& parent) {
  if (std::holds_alternative<AutoParent>(parent)) {
    if (!repository_->FindRootId(tx, topic.id)) return std::nullopt;
    if (topic.active_node_id) return topic.active_node_id;
    throw util::InvalidOperation("create message", "topic has messages but no active node; specify a parent");
  }

  if (std::holds_alternative<ExplicitRoot>(parent)) {
    if (repository_->FindRootId(tx, topic.id)) {
      throw util::InvalidOperation("create message", "topic already has a root message");
    }
    return std::nullopt;
  }

  const auto& parent_id = std::get<ExplicitParent>(parent).id;
  auto        record    = RequireMessage(*repository_, tx, parent_id);
  if (record.topic_id != topic.id) {
    throw util::InvalidOperation("create message", "parent " + parent_id + " belongs to another topic");
  }
  return record.id;
}

Message MessageTree::Create(const std::string& topic_id, const NewMessage& request) {
  if (request.role == MESSAGE_ROLE_UNSPECIFIED) {
    throw util::InvalidOperation("create message", "role is required");
  }
  if (request.status == MESSAGE_STATUS_UNSPECIFIED) {
    throw util::InvalidOperation("create message", "status must be set when given");
  }

  auto tx    = repository_->Begin();
  auto topic = RequireTopic(*repository_, *tx, topic_id);

  const auto now = util::NowMillis();

  db::model::MessageRecord record;
  record.id                  = util::NewId();
  record.topic_id            = topic_id;
  record.parent_id           = ResolveParent(*tx, topic, request.parent);
  record.role                = tree::RoleToString(request.role);
  record.data_json           = tree::StructToJson(request.data);
  record.searchable_text     = tree::ExtractSearchableText(request.data);
  record.status              = tree::StatusToString(request.status.value_or(MESSAGE_STATUS_PENDING));
  record.siblings_group_id   = request.siblings_group_id.value_or(0);
  record.assistant_id        = request.assistant_id;
  record.assistant_meta_json = StructJson(request.assistant_meta);
  record.model_id            = request.model_id;
  record.model_meta_json     = StructJson(request.model_meta);
  record.trace_id            = request.trace_id;
  record.stats_json          = StructJson(request.stats);
  record.created_at_ms       = now;
  record.updated_at_ms       = now;

  ThrowIfDbError(repository_->InsertMessage(*tx, record), "create message");
  if (request.set_as_active) {
    ThrowIfDbError(repository_->SetActiveNode(*tx, topic_id, record.id, now), "create message");
  }
  tx->Commit();

  CONVTREE_LOG_INFO("message created", {StringField("message_id", record.id), StringField("topic_id", topic_id),
                                        StringField("parent_id", record.parent_id.value_or("")),
                                        BoolField("set_as_active", request.set_as_active)});
  return tree::ToMessage(record);
}

Message MessageTree::Update(const std::string& id, const MessagePatch& patch) {
  if (patch.status == MESSAGE_STATUS_UNSPECIFIED) {
    throw util::InvalidOperation("update message", "status must be set when given");
  }
  const bool moves_under_parent = patch.parent_id && patch.parent_id->has_value();

  if (moves_under_parent) {
    const auto& new_parent = **patch.parent_id;
    if (new_parent == id) {
      throw util::InvalidOperation("update message", "a message cannot be its own parent");
    }

    // Read outside the write transaction; SQLite allows one open
    // transaction per connection.
    auto check       = repository_->Begin();
    auto descendants = repository_->GetDescendantIds(*check, id);
    check->Commit();
    if (std::find(descendants.begin(), descendants.end(), new_parent) != descendants.end()) {
      throw util::InvalidOperation("update message", "cannot move a message under its own descendant");
    }
  }

  auto tx     = repository_->Begin();
  auto record = RequireMessage(*repository_, *tx, id);

  if (patch.parent_id && *patch.parent_id != record.parent_id) {
    if (moves_under_parent) {
      auto parent = RequireMessage(*repository_, *tx, **patch.parent_id);
      if (parent.topic_id != record.topic_id) {
        throw util::InvalidOperation("update message", "parent " + parent.id + " belongs to another topic");
      }
    } else {
      const auto root = repository_->FindRootId(*tx, record.topic_id);
      if (root && *root != id) {
        throw util::InvalidOperation("update message", "topic already has a root message");
      }
    }
    record.parent_id = *patch.parent_id;
  }

  if (patch.data) {
    record.data_json       = tree::StructToJson(*patch.data);
    record.searchable_text = tree::ExtractSearchableText(*patch.data);
  }
  if (patch.siblings_group_id) record.siblings_group_id = *patch.siblings_group_id;
  if (patch.status) record.status = tree::StatusToString(*patch.status);
  if (patch.trace_id) record.trace_id = *patch.trace_id;
  if (patch.stats) record.stats_json = tree::StructToJson(*patch.stats);
  record.updated_at_ms = util::NowMillis();

  ThrowIfDbError(repository_->UpdateMessage(*tx, record), "update message");
  tx->Commit();

  CONVTREE_LOG_INFO("message updated", {StringField("message_id", id), StringField("topic_id", record.topic_id),
                                        BoolField("parent_changed", patch.parent_id.has_value())});
  return tree::ToMessage(record);
}

DeleteMessageResponse MessageTree::Delete(const std::string& id, bool cascade, ActiveNodeStrategy strategy) {
  auto tx     = repository_->Begin();
  auto record = RequireMessage(*repository_, *tx, id);
  auto topic  = RequireTopic(*repository_, *tx, record.topic_id);

  if (!record.parent_id && !cascade) {
    throw util::InvalidOperation("delete message", "root message can only be deleted with cascade");
  }

  const auto now = util::NowMillis();
  const auto next_active =
      strategy == ActiveNodeStrategy::kParent ? record.parent_id : std::optional<std::string>{};

  DeleteMessageResponse response;
  bool                  active_removed = false;

  if (cascade) {
    std::vector<std::string> ids{id};
    auto                     descendants = repository_->GetDescendantIds(*tx, id);
    ids.insert(ids.end(), descendants.begin(), descendants.end());

    ThrowIfDbError(repository_->DeleteMessages(*tx, ids), "delete message");
    active_removed = topic.active_node_id &&
                     std::find(ids.begin(), ids.end(), *topic.active_node_id) != ids.end();
    for (auto& deleted : ids) response.add_deleted_ids(std::move(deleted));
  } else {
    auto children = repository_->GetChildIds(*tx, id);
    ThrowIfDbError(repository_->ReparentChildren(*tx, id, record.parent_id, now), "delete message");
    ThrowIfDbError(repository_->DeleteMessages(*tx, {id}), "delete message");
    active_removed = topic.active_node_id == id;
    response.add_deleted_ids(id);
    for (auto& child : children) response.add_reparented_ids(std::move(child));
  }

  if (active_removed) {
    ThrowIfDbError(repository_->SetActiveNode(*tx, topic.id, next_active, now), "delete message");
    response.set_active_node_changed(true);
    if (next_active) response.set_new_active_node_id(*next_active);
  }
  tx->Commit();

  CONVTREE_LOG_INFO(cascade ? "message subtree deleted" : "message deleted",
                    {StringField("message_id", id), StringField("topic_id", topic.id),
                     IntField("deleted", response.deleted_ids_size()),
                     IntField("reparented", response.reparented_ids_size()),
                     BoolField("active_node_changed", response.active_node_changed())});
  return response;
}

// ---------------------------------------------------------------------
// Topics
// ---------------------------------------------------------------------

Topic MessageTree::CreateTopic(const std::string& name) {
  db::model::TopicRecord record;
  record.id            = util::NewId();
  record.name          = name;
  record.created_at_ms = util::NowMillis();
  record.updated_at_ms = record.created_at_ms;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertTopic(*tx, record), "create topic");
  tx->Commit();

  CONVTREE_LOG_INFO("topic created", {StringField("topic_id", record.id)});
  return tree::ToTopic(record);
}

Topic MessageTree::GetTopic(const std::string& id) {
  auto tx    = repository_->Begin();
  auto topic = RequireTopic(*repository_, *tx, id);
  tx->Commit();
  return tree::ToTopic(topic);
}

Topic MessageTree::SetActiveNode(const std::string& topic_id, const std::string& node_id) {
  auto tx    = repository_->Begin();
  auto topic = RequireTopic(*repository_, *tx, topic_id);
  auto node  = RequireMessage(*repository_, *tx, node_id);
  if (node.topic_id != topic_id) {
    throw util::InvalidOperation("set active node", "message " + node_id + " belongs to another topic");
  }

  topic.active_node_id = node_id;
  topic.updated_at_ms  = util::NowMillis();
  ThrowIfDbError(repository_->SetActiveNode(*tx, topic_id, node_id, topic.updated_at_ms), "set active node");
  tx->Commit();

  CONVTREE_LOG_INFO("active node moved", {StringField("topic_id", topic_id), StringField("node_id", node_id)});
  return tree::ToTopic(topic);
}

void MessageTree::DeleteTopic(const std::string& id) {
  auto tx = repository_->Begin();
  RequireTopic(*repository_, *tx, id);
  ThrowIfDbError(repository_->DeleteTopic(*tx, id), "delete topic");
  tx->Commit();

  CONVTREE_LOG_INFO("topic deleted", {StringField("topic_id", id)});
}

} // namespace convtree::core
