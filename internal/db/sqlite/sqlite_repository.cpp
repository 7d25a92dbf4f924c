#include "sqlite_repository.hpp"

#include <algorithm>
#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace convtree::db::sqlite {

using convtree::db::ErrorCode;
using convtree::db::Result;

namespace {

// Stays well below SQLITE_MAX_VARIABLE_NUMBER on old builds (999).
constexpr size_t kMaxBatch = 500;

std::string Placeholders(size_t n) {
    std::string out;
    out.reserve(n * 2);
    for (size_t i = 0; i < n; ++i) {
        if (i) out += ',';
        out += '?';
    }
    return out;
}

// Runs fn(first, last) over consecutive slices of at most kMaxBatch items.
template <typename T, typename Fn>
void ForEachBatch(const std::vector<T>& items, size_t batch, Fn&& fn) {
    for (size_t start = 0; start < items.size(); start += batch) {
        const size_t end = std::min(items.size(), start + batch);
        fn(start, end);
    }
}

void BindMessage(Statement& st, const model::MessageRecord& r) {
    st.BindText(1, r.id);
    st.BindText(2, r.topic_id);
    st.BindOptionalText(3, r.parent_id);
    st.BindText(4, r.role);
    st.BindText(5, r.data_json);
    st.BindOptionalText(6, r.searchable_text);
    st.BindText(7, r.status);
    st.BindInt64(8, r.siblings_group_id);
    st.BindOptionalText(9, r.assistant_id);
    st.BindOptionalText(10, r.assistant_meta_json);
    st.BindOptionalText(11, r.model_id);
    st.BindOptionalText(12, r.model_meta_json);
    st.BindOptionalText(13, r.trace_id);
    st.BindOptionalText(14, r.stats_json);
    st.BindU64(15, r.created_at_ms);
    st.BindU64(16, r.updated_at_ms);
}

model::MessageRecord ReadMessage(const Statement& st) {
    model::MessageRecord r;
    r.id                  = st.ColumnText(0);
    r.topic_id            = st.ColumnText(1);
    r.parent_id           = st.ColumnOptionalText(2);
    r.role                = st.ColumnText(3);
    r.data_json           = st.ColumnText(4);
    r.searchable_text     = st.ColumnOptionalText(5);
    r.status              = st.ColumnText(6);
    r.siblings_group_id   = st.ColumnInt64(7);
    r.assistant_id        = st.ColumnOptionalText(8);
    r.assistant_meta_json = st.ColumnOptionalText(9);
    r.model_id            = st.ColumnOptionalText(10);
    r.model_meta_json     = st.ColumnOptionalText(11);
    r.trace_id            = st.ColumnOptionalText(12);
    r.stats_json          = st.ColumnOptionalText(13);
    r.created_at_ms       = st.ColumnU64(14);
    r.updated_at_ms       = st.ColumnU64(15);
    return r;
}

std::vector<model::MessageRecord> ReadMessages(Statement& st) {
    std::vector<model::MessageRecord> out;
    while (st.Next()) out.push_back(ReadMessage(st));
    return out;
}

std::vector<std::string> ReadIds(Statement& st) {
    std::vector<std::string> out;
    while (st.Next()) out.push_back(st.ColumnText(0));
    return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Topics
// ------------------------------------------------------------------

Result SqliteRepository::InsertTopic(Transaction& t, const model::TopicRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_TOPIC);
    st.BindText(1, r.id);
    st.BindText(2, r.name);
    st.BindOptionalText(3, r.active_node_id);
    st.BindU64(4, r.created_at_ms);
    st.BindU64(5, r.updated_at_ms);

    return Translate(db, st.Execute());
}

std::optional<model::TopicRecord>
SqliteRepository::GetTopic(Transaction& t, const std::string& id) {
    Statement st(TX(t).Handle(), sql::SELECT_TOPIC);
    st.BindText(1, id);

    if (!st.Next()) return std::nullopt;

    model::TopicRecord r;
    r.id             = st.ColumnText(0);
    r.name           = st.ColumnText(1);
    r.active_node_id = st.ColumnOptionalText(2);
    r.created_at_ms  = st.ColumnU64(3);
    r.updated_at_ms  = st.ColumnU64(4);
    return r;
}

Result SqliteRepository::SetActiveNode(Transaction& t, const std::string& topic_id,
                                       const std::optional<std::string>& node_id, uint64_t updated_at_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SET_ACTIVE_NODE);
    st.BindOptionalText(1, node_id);
    st.BindU64(2, updated_at_ms);
    st.BindText(3, topic_id);

    auto result = Translate(db, st.Execute());
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "topic " + topic_id);
    return result;
}

Result SqliteRepository::DeleteTopic(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement messages(db, sql::DELETE_TOPIC_MESSAGES);
    messages.BindText(1, id);
    auto result = Translate(db, messages.Execute());
    if (!result) return result;

    Statement topic(db, sql::DELETE_TOPIC);
    topic.BindText(1, id);
    result = Translate(db, topic.Execute());
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "topic " + id);
    return result;
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result SqliteRepository::InsertMessage(Transaction& t, const model::MessageRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_MESSAGE);
    BindMessage(st, r);
    return Translate(db, st.Execute());
}

std::optional<model::MessageRecord>
SqliteRepository::GetMessage(Transaction& t, const std::string& id) {
    Statement st(TX(t).Handle(), sql::SELECT_MESSAGE);
    st.BindText(1, id);

    if (!st.Next()) return std::nullopt;
    return ReadMessage(st);
}

Result SqliteRepository::UpdateMessage(Transaction& t, const model::MessageRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPDATE_MESSAGE);
    st.BindOptionalText(1, r.parent_id);
    st.BindText(2, r.data_json);
    st.BindOptionalText(3, r.searchable_text);
    st.BindText(4, r.status);
    st.BindInt64(5, r.siblings_group_id);
    st.BindOptionalText(6, r.assistant_id);
    st.BindOptionalText(7, r.assistant_meta_json);
    st.BindOptionalText(8, r.model_id);
    st.BindOptionalText(9, r.model_meta_json);
    st.BindOptionalText(10, r.trace_id);
    st.BindOptionalText(11, r.stats_json);
    st.BindU64(12, r.updated_at_ms);
    st.BindText(13, r.id);

    auto result = Translate(db, st.Execute());
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "message " + r.id);
    return result;
}

Result SqliteRepository::DeleteMessages(Transaction& t, const std::vector<std::string>& ids) {
    auto*  db     = TX(t).Handle();
    Result result = Result::Ok();

    ForEachBatch(ids, kMaxBatch, [&](size_t first, size_t last) {
        if (!result) return;
        Statement st(db, "DELETE FROM message WHERE id IN (" + Placeholders(last - first) + ");");
        for (size_t i = first; i < last; ++i) st.BindText(static_cast<int>(i - first + 1), ids[i]);
        result = Translate(db, st.Execute());
    });
    return result;
}

std::optional<std::string> SqliteRepository::FindRootId(Transaction& t, const std::string& topic_id) {
    Statement st(TX(t).Handle(), sql::SELECT_ROOT_ID);
    st.BindText(1, topic_id);

    if (!st.Next()) return std::nullopt;
    return st.ColumnText(0);
}

std::vector<std::string> SqliteRepository::GetChildIds(Transaction& t, const std::string& parent_id) {
    Statement st(TX(t).Handle(), sql::SELECT_CHILD_IDS);
    st.BindText(1, parent_id);
    return ReadIds(st);
}

std::vector<model::MessageRecord>
SqliteRepository::GetChildrenOf(Transaction& t, const std::vector<std::string>& parent_ids) {
    auto* db = TX(t).Handle();

    std::vector<model::MessageRecord> out;
    ForEachBatch(parent_ids, kMaxBatch, [&](size_t first, size_t last) {
        Statement st(db, std::string(sql::SELECT_MESSAGE_COLUMNS) + " WHERE parent_id IN (" + Placeholders(last - first) +
                             ") ORDER BY created_at_ms,id;");
        for (size_t i = first; i < last; ++i) st.BindText(static_cast<int>(i - first + 1), parent_ids[i]);
        auto rows = ReadMessages(st);
        out.insert(out.end(), std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));
    });
    return out;
}

std::vector<std::string> SqliteRepository::GetIdsWithChildren(Transaction& t, const std::vector<std::string>& ids) {
    auto* db = TX(t).Handle();

    std::vector<std::string> out;
    ForEachBatch(ids, kMaxBatch, [&](size_t first, size_t last) {
        Statement st(db, "SELECT DISTINCT parent_id FROM message WHERE parent_id IN (" + Placeholders(last - first) + ");");
        for (size_t i = first; i < last; ++i) st.BindText(static_cast<int>(i - first + 1), ids[i]);
        auto rows = ReadIds(st);
        out.insert(out.end(), rows.begin(), rows.end());
    });
    return out;
}

Result SqliteRepository::ReparentChildren(Transaction& t, const std::string& parent_id,
                                          const std::optional<std::string>& new_parent_id, uint64_t updated_at_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::REPARENT_CHILDREN);
    st.BindOptionalText(1, new_parent_id);
    st.BindU64(2, updated_at_ms);
    st.BindText(3, parent_id);
    return Translate(db, st.Execute());
}

std::vector<model::MessageRecord>
SqliteRepository::GetSiblings(Transaction& t, const std::vector<model::SiblingsKey>& keys) {
    auto* db = TX(t).Handle();

    std::vector<model::MessageRecord> out;
    ForEachBatch(keys, kMaxBatch / 2, [&](size_t first, size_t last) {
        std::string where;
        for (size_t i = first; i < last; ++i) {
            if (i != first) where += " OR ";
            where += "(parent_id=? AND siblings_group_id=?)";
        }

        Statement st(db, std::string(sql::SELECT_MESSAGE_COLUMNS) + " WHERE " + where + " ORDER BY created_at_ms,id;");
        int idx = 1;
        for (size_t i = first; i < last; ++i) {
            st.BindText(idx++, keys[i].parent_id);
            st.BindInt64(idx++, keys[i].siblings_group_id);
        }
        auto rows = ReadMessages(st);
        out.insert(out.end(), std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));
    });
    return out;
}

// ------------------------------------------------------------------
// Traversal
// ------------------------------------------------------------------

std::vector<model::MessageRecord>
SqliteRepository::GetPathToRoot(Transaction& t, const std::string& id) {
    Statement st(TX(t).Handle(), sql::SELECT_PATH_TO_ROOT);
    st.BindText(1, id);
    return ReadMessages(st);
}

std::vector<std::string> SqliteRepository::GetDescendantIds(Transaction& t, const std::string& id) {
    Statement st(TX(t).Handle(), sql::SELECT_DESCENDANT_IDS);
    st.BindText(1, id);
    return ReadIds(st);
}

std::vector<model::DepthRecord>
SqliteRepository::GetSubtree(Transaction& t, const std::string& root_id, std::optional<uint32_t> max_depth) {
    Statement st(TX(t).Handle(), sql::SELECT_SUBTREE);
    st.BindText(1, root_id);
    st.BindInt64(2, max_depth ? static_cast<int64_t>(*max_depth) : -1);

    std::vector<model::DepthRecord> out;
    while (st.Next()) {
        out.push_back({ReadMessage(st), static_cast<uint32_t>(st.ColumnInt64(16))});
    }
    return out;
}

} // namespace convtree::db::sqlite
