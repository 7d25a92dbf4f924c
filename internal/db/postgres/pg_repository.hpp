#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace convtree::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

} // namespace convtree::db::postgres
