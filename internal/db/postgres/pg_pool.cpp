#include "pg_pool.hpp"

namespace convtree::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_topic",
               "INSERT INTO topic(id,name,active_node_id,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5)");

  conn.prepare("get_topic",
               "SELECT id,name,active_node_id,created_at_ms,updated_at_ms "
               "FROM topic WHERE id=$1");

  conn.prepare("set_active_node", "UPDATE topic SET active_node_id=$2,updated_at_ms=$3 WHERE id=$1");

  conn.prepare("delete_topic_messages", "DELETE FROM message WHERE topic_id=$1");

  conn.prepare("delete_topic", "DELETE FROM topic WHERE id=$1");

  conn.prepare("insert_message",
               "INSERT INTO message(id,topic_id,parent_id,role,data,searchable_text,status,siblings_group_id,"
               "assistant_id,assistant_meta,model_id,model_meta,trace_id,stats,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5::jsonb,$6,$7,$8,$9,$10::jsonb,$11,$12::jsonb,$13,$14::jsonb,$15,$16)");

  conn.prepare("get_message",
               "SELECT id,topic_id,parent_id,role,data::text,searchable_text,status,siblings_group_id,"
               "assistant_id,assistant_meta::text,model_id,model_meta::text,trace_id,stats::text,"
               "created_at_ms,updated_at_ms FROM message WHERE id=$1");

  conn.prepare("update_message",
               "UPDATE message SET parent_id=$2,data=$3::jsonb,searchable_text=$4,status=$5,siblings_group_id=$6,"
               "assistant_id=$7,assistant_meta=$8::jsonb,model_id=$9,model_meta=$10::jsonb,trace_id=$11,"
               "stats=$12::jsonb,updated_at_ms=$13 WHERE id=$1");

  conn.prepare("get_root_id",
               "SELECT id FROM message WHERE topic_id=$1 AND parent_id IS NULL "
               "ORDER BY created_at_ms,id LIMIT 1");

  conn.prepare("get_child_ids", "SELECT id FROM message WHERE parent_id=$1 ORDER BY created_at_ms,id");

  conn.prepare("reparent_children", "UPDATE message SET parent_id=$2,updated_at_ms=$3 WHERE parent_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      // broken by a server restart; the next Acquire() reconnects
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace convtree::db::postgres
