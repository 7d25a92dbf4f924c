#pragma once

namespace convtree::db::sql {

/*
  SQL used by the SQLite backend ("?" placeholders).

  The PostgreSQL backend prepares the same statements with $n
  placeholders in PgPool::PrepareStatements.

  Message column order is fixed; sqlite_repository.cpp and
  pg_repository.cpp read rows by position.
*/

// topic

static constexpr const char* INSERT_TOPIC =
    "INSERT INTO topic(id,name,active_node_id,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_TOPIC =
    "SELECT id,name,active_node_id,created_at_ms,updated_at_ms"
    " FROM topic WHERE id=?;";

static constexpr const char* SET_ACTIVE_NODE =
    "UPDATE topic SET active_node_id=?,updated_at_ms=? WHERE id=?;";

static constexpr const char* DELETE_TOPIC_MESSAGES =
    "DELETE FROM message WHERE topic_id=?;";

static constexpr const char* DELETE_TOPIC =
    "DELETE FROM topic WHERE id=?;";

// message

static constexpr const char* INSERT_MESSAGE =
    "INSERT INTO message(id,topic_id,parent_id,role,data,searchable_text,status,siblings_group_id,"
    "assistant_id,assistant_meta,model_id,model_meta,trace_id,stats,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

// Prefix for dynamic WHERE clauses.
static constexpr const char* SELECT_MESSAGE_COLUMNS =
    "SELECT id,topic_id,parent_id,role,data,searchable_text,status,siblings_group_id,"
    "assistant_id,assistant_meta,model_id,model_meta,trace_id,stats,created_at_ms,updated_at_ms"
    " FROM message";

static constexpr const char* SELECT_MESSAGE =
    "SELECT id,topic_id,parent_id,role,data,searchable_text,status,siblings_group_id,"
    "assistant_id,assistant_meta,model_id,model_meta,trace_id,stats,created_at_ms,updated_at_ms"
    " FROM message WHERE id=?;";

// id, topic_id, role and created_at_ms are immutable.
static constexpr const char* UPDATE_MESSAGE =
    "UPDATE message SET parent_id=?,data=?,searchable_text=?,status=?,siblings_group_id=?,"
    "assistant_id=?,assistant_meta=?,model_id=?,model_meta=?,trace_id=?,stats=?,updated_at_ms=?"
    " WHERE id=?;";

static constexpr const char* SELECT_ROOT_ID =
    "SELECT id FROM message WHERE topic_id=? AND parent_id IS NULL"
    " ORDER BY created_at_ms,id LIMIT 1;";

static constexpr const char* SELECT_CHILD_IDS =
    "SELECT id FROM message WHERE parent_id=? ORDER BY created_at_ms,id;";

static constexpr const char* REPARENT_CHILDREN =
    "UPDATE message SET parent_id=?,updated_at_ms=? WHERE parent_id=?;";

// traversal

static constexpr const char* SELECT_PATH_TO_ROOT =
    "WITH RECURSIVE path(id,parent_id,hops) AS ("
    " SELECT id,parent_id,0 FROM message WHERE id=?"
    " UNION ALL"
    " SELECT m.id,m.parent_id,p.hops+1 FROM message m JOIN path p ON m.id=p.parent_id"
    ")"
    " SELECT m.id,m.topic_id,m.parent_id,m.role,m.data,m.searchable_text,m.status,m.siblings_group_id,"
    "m.assistant_id,m.assistant_meta,m.model_id,m.model_meta,m.trace_id,m.stats,m.created_at_ms,m.updated_at_ms"
    " FROM path p JOIN message m ON m.id=p.id ORDER BY p.hops;";

static constexpr const char* SELECT_DESCENDANT_IDS =
    "WITH RECURSIVE sub(id) AS ("
    " SELECT id FROM message WHERE parent_id=?"
    " UNION ALL"
    " SELECT m.id FROM message m JOIN sub s ON m.parent_id=s.id"
    ")"
    " SELECT id FROM sub;";

// ?1 = root id, ?2 = max depth (negative => unbounded)
static constexpr const char* SELECT_SUBTREE =
    "WITH RECURSIVE tree(id,depth) AS ("
    " SELECT id,0 FROM message WHERE id=?1"
    " UNION ALL"
    " SELECT m.id,t.depth+1 FROM message m JOIN tree t ON m.parent_id=t.id"
    " WHERE ?2 < 0 OR t.depth < ?2"
    ")"
    " SELECT m.id,m.topic_id,m.parent_id,m.role,m.data,m.searchable_text,m.status,m.siblings_group_id,"
    "m.assistant_id,m.assistant_meta,m.model_id,m.model_meta,m.trace_id,m.stats,m.created_at_ms,m.updated_at_ms,t.depth"
    " FROM tree t JOIN message m ON m.id=t.id ORDER BY t.depth,m.created_at_ms,m.id;";

} // namespace convtree::db::sql
