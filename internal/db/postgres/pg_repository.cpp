#include "pg_repository.hpp"

#include <algorithm>

namespace convtree::db::postgres {

namespace {

constexpr size_t kMaxBatch = 500;

constexpr const char* kMessageColumns =
    "SELECT m.id,m.topic_id,m.parent_id,m.role,m.data::text,m.searchable_text,m.status,m.siblings_group_id,"
    "m.assistant_id,m.assistant_meta::text,m.model_id,m.model_meta::text,m.trace_id,m.stats::text,"
    "m.created_at_ms,m.updated_at_ms";

std::optional<std::string> OptionalText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

model::MessageRecord ReadMessage(const pqxx::row& row) {
  model::MessageRecord r;
  r.id                  = row[0].c_str();
  r.topic_id            = row[1].c_str();
  r.parent_id           = OptionalText(row[2]);
  r.role                = row[3].c_str();
  r.data_json           = row[4].c_str();
  r.searchable_text     = OptionalText(row[5]);
  r.status              = row[6].c_str();
  r.siblings_group_id   = row[7].as<int64_t>();
  r.assistant_id        = OptionalText(row[8]);
  r.assistant_meta_json = OptionalText(row[9]);
  r.model_id            = OptionalText(row[10]);
  r.model_meta_json     = OptionalText(row[11]);
  r.trace_id            = OptionalText(row[12]);
  r.stats_json          = OptionalText(row[13]);
  r.created_at_ms       = row[14].as<uint64_t>();
  r.updated_at_ms       = row[15].as<uint64_t>();
  return r;
}

std::vector<model::MessageRecord> ReadMessages(const pqxx::result& res) {
  std::vector<model::MessageRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadMessage(row));
  return out;
}

std::vector<std::string> ReadIds(const pqxx::result& res) {
  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.emplace_back(row[0].c_str());
  return out;
}

// Quoted, comma separated literal list for ids[first, last).
std::string QuotedList(pqxx::work& w, const std::vector<std::string>& ids, size_t first, size_t last) {
  std::string out;
  for (size_t i = first; i < last; ++i) {
    if (i != first) out += ',';
    out += w.quote(ids[i]);
  }
  return out;
}

template <typename T, typename Fn>
void ForEachBatch(const std::vector<T>& items, size_t batch, Fn&& fn) {
  for (size_t start = 0; start < items.size(); start += batch) {
    fn(start, std::min(items.size(), start + batch));
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e))
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e))
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e))
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Topics
// ------------------------------------------------------------------

Result PgRepository::InsertTopic(Transaction& t, const model::TopicRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_topic", r.id, r.name, r.active_node_id, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TopicRecord> PgRepository::GetTopic(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_topic", id);
  if (res.empty()) return std::nullopt;

  model::TopicRecord r;
  r.id             = res[0][0].c_str();
  r.name           = res[0][1].c_str();
  r.active_node_id = OptionalText(res[0][2]);
  r.created_at_ms  = res[0][3].as<uint64_t>();
  r.updated_at_ms  = res[0][4].as<uint64_t>();
  return r;
}

Result PgRepository::SetActiveNode(Transaction& t, const std::string& topic_id,
                                   const std::optional<std::string>& node_id, uint64_t updated_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("set_active_node", topic_id, node_id, updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "topic " + topic_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteTopic(Transaction& t, const std::string& id) {
  try {
    auto& w = TX(t).Work();
    w.exec_prepared("delete_topic_messages", id);
    auto res = w.exec_prepared("delete_topic", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "topic " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result PgRepository::InsertMessage(Transaction& t, const model::MessageRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_message", r.id, r.topic_id, r.parent_id, r.role, r.data_json, r.searchable_text,
                               r.status, r.siblings_group_id, r.assistant_id, r.assistant_meta_json, r.model_id,
                               r.model_meta_json, r.trace_id, r.stats_json, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MessageRecord> PgRepository::GetMessage(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_message", id);
  if (res.empty()) return std::nullopt;
  return ReadMessage(res[0]);
}

Result PgRepository::UpdateMessage(Transaction& t, const model::MessageRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_message", r.id, r.parent_id, r.data_json, r.searchable_text, r.status,
                                          r.siblings_group_id, r.assistant_id, r.assistant_meta_json, r.model_id,
                                          r.model_meta_json, r.trace_id, r.stats_json, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "message " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteMessages(Transaction& t, const std::vector<std::string>& ids) {
  try {
    auto& w = TX(t).Work();
    ForEachBatch(ids, kMaxBatch, [&](size_t first, size_t last) {
      w.exec("DELETE FROM message WHERE id IN (" + QuotedList(w, ids, first, last) + ");");
    });
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<std::string> PgRepository::FindRootId(Transaction& t, const std::string& topic_id) {
  auto res = TX(t).Work().exec_prepared("get_root_id", topic_id);
  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

std::vector<std::string> PgRepository::GetChildIds(Transaction& t, const std::string& parent_id) {
  return ReadIds(TX(t).Work().exec_prepared("get_child_ids", parent_id));
}

std::vector<model::MessageRecord> PgRepository::GetChildrenOf(Transaction& t,
                                                              const std::vector<std::string>& parent_ids) {
  auto& w = TX(t).Work();

  std::vector<model::MessageRecord> out;
  ForEachBatch(parent_ids, kMaxBatch, [&](size_t first, size_t last) {
    auto rows = ReadMessages(w.exec(std::string(kMessageColumns) + " FROM message m WHERE m.parent_id IN (" +
                                    QuotedList(w, parent_ids, first, last) + ") ORDER BY m.created_at_ms,m.id;"));
    out.insert(out.end(), std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));
  });
  return out;
}

std::vector<std::string> PgRepository::GetIdsWithChildren(Transaction& t, const std::vector<std::string>& ids) {
  auto& w = TX(t).Work();

  std::vector<std::string> out;
  ForEachBatch(ids, kMaxBatch, [&](size_t first, size_t last) {
    auto rows = ReadIds(
        w.exec("SELECT DISTINCT parent_id FROM message WHERE parent_id IN (" + QuotedList(w, ids, first, last) + ");"));
    out.insert(out.end(), rows.begin(), rows.end());
  });
  return out;
}

Result PgRepository::ReparentChildren(Transaction& t, const std::string& parent_id,
                                      const std::optional<std::string>& new_parent_id, uint64_t updated_at_ms) {
  try {
    TX(t).Work().exec_prepared("reparent_children", parent_id, new_parent_id, updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::MessageRecord> PgRepository::GetSiblings(Transaction& t,
                                                            const std::vector<model::SiblingsKey>& keys) {
  auto& w = TX(t).Work();

  std::vector<model::MessageRecord> out;
  ForEachBatch(keys, kMaxBatch, [&](size_t first, size_t last) {
    std::string tuples;
    for (size_t i = first; i < last; ++i) {
      if (i != first) tuples += ',';
      tuples += "(" + w.quote(keys[i].parent_id) + "," + std::to_string(keys[i].siblings_group_id) + ")";
    }
    auto rows = ReadMessages(w.exec(std::string(kMessageColumns) +
                                    " FROM message m WHERE (m.parent_id,m.siblings_group_id) IN (" + tuples +
                                    ") ORDER BY m.created_at_ms,m.id;"));
    out.insert(out.end(), std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));
  });
  return out;
}

// ------------------------------------------------------------------
// Traversal
// ------------------------------------------------------------------

std::vector<model::MessageRecord> PgRepository::GetPathToRoot(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(
      "WITH RECURSIVE path(id,parent_id,hops) AS ("
      " SELECT id,parent_id,0 FROM message WHERE id=$1"
      " UNION ALL"
      " SELECT m.id,m.parent_id,p.hops+1 FROM message m JOIN path p ON m.id=p.parent_id"
      ") " +
          std::string(kMessageColumns) + " FROM path p JOIN message m ON m.id=p.id ORDER BY p.hops;",
      id);
  return ReadMessages(res);
}

std::vector<std::string> PgRepository::GetDescendantIds(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(
      "WITH RECURSIVE sub(id) AS ("
      " SELECT id FROM message WHERE parent_id=$1"
      " UNION ALL"
      " SELECT m.id FROM message m JOIN sub s ON m.parent_id=s.id"
      ") SELECT id FROM sub;",
      id);
  return ReadIds(res);
}

std::vector<model::DepthRecord> PgRepository::GetSubtree(Transaction& t, const std::string& root_id,
                                                         std::optional<uint32_t> max_depth) {
  const int64_t limit = max_depth ? static_cast<int64_t>(*max_depth) : -1;

  auto res = TX(t).Work().exec_params(
      "WITH RECURSIVE tree(id,depth) AS ("
      " SELECT id,0::bigint FROM message WHERE id=$1"
      " UNION ALL"
      " SELECT m.id,t.depth+1 FROM message m JOIN tree t ON m.parent_id=t.id"
      " WHERE $2::bigint < 0 OR t.depth < $2::bigint"
      ") " +
          std::string(kMessageColumns) +
          ",t.depth FROM tree t JOIN message m ON m.id=t.id ORDER BY t.depth,m.created_at_ms,m.id;",
      root_id, limit);

  std::vector<model::DepthRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back({ReadMessage(row), row[16].as<uint32_t>()});
  }
  return out;
}

} // namespace convtree::db::postgres
