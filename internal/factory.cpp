#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if CONVTREE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CONVTREE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace convtree::factory {

using convtree::observability::StringField;

namespace {

#if CONVTREE_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto* sql : db::sql::kSqliteSchema) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,name,active_node_id FROM topic LIMIT 1;");
  sqlite_db->Exec("SELECT id,topic_id,parent_id,siblings_group_id FROM message LIMIT 1;");
}
#endif

#if CONVTREE_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto* sql : db::sql::kPostgresSchema) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,name,active_node_id FROM topic LIMIT 1;");
  tx.exec("SELECT id,topic_id,parent_id,siblings_group_id FROM message LIMIT 1;");
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const convtree::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CONVTREE_DB_SQLITE
    const auto& sqlite  = database.sqlite();
    const int   timeout = sqlite.busy_timeout_ms() > 0 ? static_cast<int>(sqlite.busy_timeout_ms()) : 5000;
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), timeout);
    BootstrapSqliteSchema(sqlite_db);
    CONVTREE_LOG_INFO("repository ready", {StringField("backend", "sqlite"), StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CONVTREE_DB_POSTGRES
    const auto& postgres = database.postgres();
    const auto  max_connections = postgres.max_connections() > 0 ? postgres.max_connections() : 16u;
    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    CONVTREE_LOG_INFO("repository ready", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CONVTREE_LOG_INFO("repository ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

core::MessageTreeOptions TreeOptionsFromConfig(const convtree::runtime::config::RuntimeConfig& config) {
  core::MessageTreeOptions options;
  const auto&              tree = config.tree();
  if (tree.has_default_depth()) options.default_depth = tree.default_depth();
  if (tree.has_default_branch_limit()) options.default_branch_limit = tree.default_branch_limit();
  if (tree.preview_length() > 0) options.preview_length = tree.preview_length();
  return options;
}

RuntimeDependencies BuildRuntime(const convtree::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  deps.repository = BuildRepository(config);
  deps.tree       = std::make_shared<core::MessageTree>(deps.repository, TreeOptionsFromConfig(config));

  service::ServiceContext ctx;
  ctx.tree             = deps.tree;
  deps.message_service = std::make_shared<service::MessageService>(ctx);

  return deps;
}

} // namespace convtree::factory
