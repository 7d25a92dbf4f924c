#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "convtree/tree/v1/message.pb.h"
#include "convtree/tree/v1/tree_service.pb.h"
#include "internal/db/api/repository.hpp"

namespace convtree::core {

// ---------------------------------------------------------------------
// Parent resolution for Create
// ---------------------------------------------------------------------

// Root when the topic is empty, else a child of the active node.
struct AutoParent {};

// Must become the topic's root; fails when one already exists.
struct ExplicitRoot {};

struct ExplicitParent {
  std::string id;
};

using ParentResolution = std::variant<AutoParent, ExplicitRoot, ExplicitParent>;

// ---------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------

struct TreeQuery {
  std::optional<std::string> root_id;
  std::optional<std::string> node_id; // focus; defaults to the active node
  std::optional<int32_t>     depth;   // negative => unlimited
};

struct BranchQuery {
  std::optional<std::string> node_id;
  std::optional<std::string> before_node_id;
  std::optional<int32_t>     limit; // <= 0 => unlimited
  std::optional<bool>        include_siblings;
};

struct NewMessage {
  ParentResolution parent = AutoParent{};

  convtree::tree::v1::MessageRole role = convtree::tree::v1::MESSAGE_ROLE_UNSPECIFIED;
  google::protobuf::Struct        data;

  std::optional<convtree::tree::v1::MessageStatus> status;
  std::optional<int64_t>                           siblings_group_id;

  std::optional<std::string>              assistant_id;
  std::optional<google::protobuf::Struct> assistant_meta;
  std::optional<std::string>              model_id;
  std::optional<google::protobuf::Struct> model_meta;
  std::optional<std::string>              trace_id;
  std::optional<google::protobuf::Struct> stats;

  bool set_as_active = true;
};

// Only engaged fields are written.
struct MessagePatch {
  std::optional<google::protobuf::Struct> data;

  // Outer engaged => parent changes; inner nullopt => move to root.
  std::optional<std::optional<std::string>> parent_id;

  std::optional<int64_t>                           siblings_group_id;
  std::optional<convtree::tree::v1::MessageStatus> status;
  std::optional<std::string>                       trace_id;
  std::optional<google::protobuf::Struct>          stats;
};

enum class ActiveNodeStrategy {
  kParent, // active pointer moves to the deleted node's parent
  kClear,
};

struct MessageTreeOptions {
  int32_t     default_depth        = 1;
  int32_t     default_branch_limit = 20;
  std::size_t preview_length       = 50;
};

/*
  MessageTree

  The branching conversation engine. Owns no state besides the
  repository handle; every public call runs in its own transaction.

  Errors:
    util::NotFound          topic / message / parent / before-node missing
    util::InvalidOperation  tree invariant would be broken
    std::runtime_error      storage failure (propagated unchanged)
*/
class MessageTree {
 public:
  explicit MessageTree(std::shared_ptr<db::Repository> repository, MessageTreeOptions options = {});

  // ---------------------------------------------------------------------
  // Queries
  // ---------------------------------------------------------------------

  convtree::tree::v1::TreeResponse           GetTree(const std::string& topic_id, const TreeQuery& query = {});
  convtree::tree::v1::BranchMessagesResponse GetBranchMessages(const std::string& topic_id, const BranchQuery& query = {});
  convtree::tree::v1::Message                GetById(const std::string& id);

  // Root first, `node_id` last.
  std::vector<convtree::tree::v1::Message> GetPathToNode(const std::string& node_id);

  // ---------------------------------------------------------------------
  // Mutations
  // ---------------------------------------------------------------------

  convtree::tree::v1::Message               Create(const std::string& topic_id, const NewMessage& request);
  convtree::tree::v1::Message               Update(const std::string& id, const MessagePatch& patch);
  convtree::tree::v1::DeleteMessageResponse Delete(const std::string& id, bool cascade = false,
                                                   ActiveNodeStrategy strategy = ActiveNodeStrategy::kParent);

  // ---------------------------------------------------------------------
  // Topics
  // ---------------------------------------------------------------------

  convtree::tree::v1::Topic CreateTopic(const std::string& name);
  convtree::tree::v1::Topic GetTopic(const std::string& id);
  convtree::tree::v1::Topic SetActiveNode(const std::string& topic_id, const std::string& node_id);
  void                      DeleteTopic(const std::string& id);

  const MessageTreeOptions& options() const {
    return options_;
  }

 private:
  std::optional<std::string> ResolveParent(db::Transaction& tx, const db::model::TopicRecord& topic,
                                           const ParentResolution& parent);

  std::shared_ptr<db::Repository> repository_;
  MessageTreeOptions              options_;
};

} // namespace convtree::core
