#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace convtree::db::memory {

class MemoryTransaction;

/*
  In-process repository.

  Keeps an id -> message map plus a parent -> children index and a
  topic -> roots index, so every traversal walks only the nodes it
  returns.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  // One committed snapshot; transactions work on a copy.
  struct State {
    std::unordered_map<std::string, model::TopicRecord>   topics;
    std::unordered_map<std::string, model::MessageRecord> messages;

    // parent id -> child ids (unordered; readers sort)
    std::unordered_map<std::string, std::vector<std::string>> children;
    // topic id -> ids of parentless messages
    std::unordered_map<std::string, std::vector<std::string>> roots;
    // topic id -> every message id of the topic
    std::unordered_map<std::string, std::unordered_set<std::string>> topic_messages;
  };

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTopic(Transaction&, const model::TopicRecord&) override;
  std::optional<model::TopicRecord> GetTopic(Transaction&, const std::string&) override;
  Result SetActiveNode(Transaction&, const std::string& topic_id, const std::optional<std::string>& node_id,
                       uint64_t updated_at_ms) override;
  Result DeleteTopic(Transaction&, const std::string&) override;

  Result InsertMessage(Transaction&, const model::MessageRecord&) override;
  std::optional<model::MessageRecord> GetMessage(Transaction&, const std::string&) override;
  Result UpdateMessage(Transaction&, const model::MessageRecord&) override;
  Result DeleteMessages(Transaction&, const std::vector<std::string>& ids) override;
  std::optional<std::string> FindRootId(Transaction&, const std::string& topic_id) override;
  std::vector<std::string> GetChildIds(Transaction&, const std::string& parent_id) override;
  std::vector<model::MessageRecord> GetChildrenOf(Transaction&, const std::vector<std::string>& parent_ids) override;
  std::vector<std::string> GetIdsWithChildren(Transaction&, const std::vector<std::string>& ids) override;
  Result ReparentChildren(Transaction&, const std::string& parent_id, const std::optional<std::string>& new_parent_id,
                          uint64_t updated_at_ms) override;
  std::vector<model::MessageRecord> GetSiblings(Transaction&, const std::vector<model::SiblingsKey>& keys) override;

  std::vector<model::MessageRecord> GetPathToRoot(Transaction&, const std::string& id) override;
  std::vector<std::string> GetDescendantIds(Transaction&, const std::string& id) override;
  std::vector<model::DepthRecord> GetSubtree(Transaction&, const std::string& root_id,
                                             std::optional<uint32_t> max_depth) override;

private:
  friend class MemoryTransaction;

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace convtree::db::memory
