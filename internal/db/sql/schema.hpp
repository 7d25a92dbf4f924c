#pragma once

#include <array>

namespace convtree::db::sql {

/*
  Bootstrap DDL, applied by the factory on startup.

  parent_id is checked at commit time so a cascade delete may remove a
  subtree in any order inside one transaction.
*/

static constexpr std::array<const char*, 5> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS topic ("
    "id TEXT PRIMARY KEY, name TEXT NOT NULL DEFAULT '', active_node_id TEXT,"
    " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS message ("
    "id TEXT PRIMARY KEY,"
    " topic_id TEXT NOT NULL REFERENCES topic(id),"
    " parent_id TEXT REFERENCES message(id) DEFERRABLE INITIALLY DEFERRED,"
    " role TEXT NOT NULL, data TEXT NOT NULL, searchable_text TEXT, status TEXT NOT NULL,"
    " siblings_group_id INTEGER NOT NULL DEFAULT 0,"
    " assistant_id TEXT, assistant_meta TEXT, model_id TEXT, model_meta TEXT, trace_id TEXT, stats TEXT,"
    " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",

    "CREATE INDEX IF NOT EXISTS message_topic_idx ON message(topic_id);",

    "CREATE INDEX IF NOT EXISTS message_parent_group_idx ON message(parent_id, siblings_group_id);",

    "CREATE INDEX IF NOT EXISTS message_topic_root_idx ON message(topic_id) WHERE parent_id IS NULL;",
};

static constexpr std::array<const char*, 5> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS topic ("
    "id TEXT PRIMARY KEY, name TEXT NOT NULL DEFAULT '', active_node_id TEXT,"
    " created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS message ("
    "id TEXT PRIMARY KEY,"
    " topic_id TEXT NOT NULL REFERENCES topic(id),"
    " parent_id TEXT REFERENCES message(id) DEFERRABLE INITIALLY DEFERRED,"
    " role TEXT NOT NULL, data JSONB NOT NULL, searchable_text TEXT, status TEXT NOT NULL,"
    " siblings_group_id BIGINT NOT NULL DEFAULT 0,"
    " assistant_id TEXT, assistant_meta JSONB, model_id TEXT, model_meta JSONB, trace_id TEXT, stats JSONB,"
    " created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",

    "CREATE INDEX IF NOT EXISTS message_topic_idx ON message(topic_id);",

    "CREATE INDEX IF NOT EXISTS message_parent_group_idx ON message(parent_id, siblings_group_id);",

    "CREATE INDEX IF NOT EXISTS message_topic_root_idx ON message(topic_id) WHERE parent_id IS NULL;",
};

} // namespace convtree::db::sql
