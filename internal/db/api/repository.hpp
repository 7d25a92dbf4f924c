#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/message_record.hpp"
#include "internal/db/model/topic_record.hpp"

namespace convtree::db {

/*
  Repository abstraction over the `topic` and `message` tables.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Traversal cost is proportional to the path / subtree touched,
    never to the size of the topic

  The repository stores rows only. Tree invariants (single root,
  acyclic parent graph, active pointer consistency) are enforced by
  core::MessageTree.

  Child order is (created_at_ms, id) ascending wherever a method
  returns siblings.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Topics
  // ---------------------------------------------------------------------

  virtual Result InsertTopic(Transaction&, const model::TopicRecord&) = 0;

  virtual std::optional<model::TopicRecord> GetTopic(Transaction&, const std::string& id) = 0;

  // nullopt clears the pointer.
  virtual Result SetActiveNode(Transaction&, const std::string& topic_id, const std::optional<std::string>& node_id,
                               uint64_t updated_at_ms) = 0;

  // Removes the topic and every message it owns.
  virtual Result DeleteTopic(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Messages
  // ---------------------------------------------------------------------

  virtual Result InsertMessage(Transaction&, const model::MessageRecord&) = 0;

  virtual std::optional<model::MessageRecord> GetMessage(Transaction&, const std::string& id) = 0;

  virtual Result UpdateMessage(Transaction&, const model::MessageRecord&) = 0;

  // Batch delete; ids that do not exist are ignored.
  virtual Result DeleteMessages(Transaction&, const std::vector<std::string>& ids) = 0;

  virtual std::optional<std::string> FindRootId(Transaction&, const std::string& topic_id) = 0;

  virtual std::vector<std::string> GetChildIds(Transaction&, const std::string& parent_id) = 0;

  // Direct children of any of the given parents.
  virtual std::vector<model::MessageRecord> GetChildrenOf(Transaction&, const std::vector<std::string>& parent_ids) = 0;

  // Subset of `ids` that have at least one child.
  virtual std::vector<std::string> GetIdsWithChildren(Transaction&, const std::vector<std::string>& ids) = 0;

  // Re-points every direct child of `parent_id` to `new_parent_id`
  // (nullopt => root) and refreshes their updated_at_ms.
  virtual Result ReparentChildren(Transaction&, const std::string& parent_id, const std::optional<std::string>& new_parent_id,
                                  uint64_t updated_at_ms) = 0;

  // All members of the given (parent_id, siblings_group_id) groups.
  virtual std::vector<model::MessageRecord> GetSiblings(Transaction&, const std::vector<model::SiblingsKey>& keys) = 0;

  // ---------------------------------------------------------------------
  // Traversal (one recursive query each)
  // ---------------------------------------------------------------------

  // Node first, root last; empty when `id` does not exist.
  virtual std::vector<model::MessageRecord> GetPathToRoot(Transaction&, const std::string& id) = 0;

  // Every node below `id`, excluding `id` itself.
  virtual std::vector<std::string> GetDescendantIds(Transaction&, const std::string& id) = 0;

  // `root_id` (depth 0) and descendants with depth <= max_depth;
  // nullopt => unbounded.
  virtual std::vector<model::DepthRecord> GetSubtree(Transaction&, const std::string& root_id, std::optional<uint32_t> max_depth) = 0;
};

} // namespace convtree::db
