#include <algorithm>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using convtree::db::ErrorCode;
using convtree::db::memory::MemoryRepository;
using convtree::db::model::MessageRecord;
using convtree::db::model::SiblingsKey;
using convtree::db::model::TopicRecord;

TopicRecord Topic(const std::string& id) {
  TopicRecord topic;
  topic.id            = id;
  topic.name          = id;
  topic.created_at_ms = 1;
  topic.updated_at_ms = 1;
  return topic;
}

MessageRecord Message(const std::string& id, const std::string& topic_id, std::optional<std::string> parent,
                      uint64_t created_at_ms, int64_t group = 0) {
  MessageRecord m;
  m.id                = id;
  m.topic_id          = topic_id;
  m.parent_id         = std::move(parent);
  m.role              = "user";
  m.status            = "success";
  m.siblings_group_id = group;
  m.created_at_ms     = created_at_ms;
  m.updated_at_ms     = created_at_ms;
  return m;
}

std::vector<std::string> Ids(const std::vector<MessageRecord>& records) {
  std::vector<std::string> out;
  for (const auto& r : records) out.push_back(r.id);
  return out;
}

/*
  t1:  a
       ├── b (t=20)
       │   └── d
       └── c (t=10)
*/
void Seed(MemoryRepository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertTopic(*tx, Topic("t1")));
  assert(repo.InsertTopic(*tx, Topic("t2")));
  assert(repo.InsertMessage(*tx, Message("a", "t1", std::nullopt, 1)));
  assert(repo.InsertMessage(*tx, Message("b", "t1", "a", 20, 7)));
  assert(repo.InsertMessage(*tx, Message("c", "t1", "a", 10, 7)));
  assert(repo.InsertMessage(*tx, Message("d", "t1", "b", 30)));
  tx->Commit();
}

void TestChildrenAreOrderedByCreationTime() {
  MemoryRepository repo;
  Seed(repo);

  auto tx = repo.Begin();
  assert((repo.GetChildIds(*tx, "a") == std::vector<std::string>{"c", "b"}));
  assert((Ids(repo.GetChildrenOf(*tx, {"a", "a"})) == std::vector<std::string>{"c", "b"}));
  assert(repo.FindRootId(*tx, "t1") == std::optional<std::string>("a"));
  assert(!repo.FindRootId(*tx, "t2"));
  tx->Commit();
}

void TestTraversal() {
  MemoryRepository repo;
  Seed(repo);

  auto tx = repo.Begin();
  assert((Ids(repo.GetPathToRoot(*tx, "d")) == std::vector<std::string>{"d", "b", "a"}));
  assert(repo.GetPathToRoot(*tx, "missing").empty());

  auto descendants = repo.GetDescendantIds(*tx, "a");
  std::sort(descendants.begin(), descendants.end());
  assert((descendants == std::vector<std::string>{"b", "c", "d"}));
  assert(repo.GetDescendantIds(*tx, "d").empty());

  auto shallow = repo.GetSubtree(*tx, "a", 1);
  assert(shallow.size() == 3);
  assert(shallow[0].message.id == "a" && shallow[0].depth == 0);
  assert(shallow[1].message.id == "c" && shallow[1].depth == 1);

  auto full = repo.GetSubtree(*tx, "a", std::nullopt);
  assert(full.size() == 4);
  assert(full.back().message.id == "d" && full.back().depth == 2);

  auto with_children = repo.GetIdsWithChildren(*tx, {"a", "b", "c", "d"});
  std::sort(with_children.begin(), with_children.end());
  assert((with_children == std::vector<std::string>{"a", "b"}));
  tx->Commit();
}

void TestSiblingsLookup() {
  MemoryRepository repo;
  Seed(repo);

  auto tx       = repo.Begin();
  auto siblings = repo.GetSiblings(*tx, {SiblingsKey{"a", 7}, SiblingsKey{"a", 7}, SiblingsKey{"b", 7}});
  assert((Ids(siblings) == std::vector<std::string>{"c", "b"}));
  tx->Commit();
}

void TestInsertRejectsDanglingReferences() {
  MemoryRepository repo;
  Seed(repo);

  auto tx = repo.Begin();
  assert(repo.InsertMessage(*tx, Message("x", "nope", std::nullopt, 1)).code == ErrorCode::ConstraintViolation);
  assert(repo.InsertMessage(*tx, Message("x", "t1", "ghost", 1)).code == ErrorCode::ConstraintViolation);
  assert(repo.InsertMessage(*tx, Message("a", "t1", std::nullopt, 1)).code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void TestReparentAndDelete() {
  MemoryRepository repo;
  Seed(repo);

  {
    auto tx = repo.Begin();
    assert(repo.DeleteMessages(*tx, {"b"}).code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(repo.ReparentChildren(*tx, "b", std::string("a"), 99));
  assert(repo.DeleteMessages(*tx, {"b", "unknown"}));
  tx->Commit();

  auto read = repo.Begin();
  auto d    = repo.GetMessage(*read, "d");
  assert(d && d->parent_id == std::optional<std::string>("a") && d->updated_at_ms == 99);
  assert((repo.GetChildIds(*read, "a") == std::vector<std::string>{"c", "d"}));
  assert(!repo.GetMessage(*read, "b"));
  read->Commit();
}

void TestUpdateKeepsImmutableColumnsAndReslots() {
  MemoryRepository repo;
  Seed(repo);

  auto tx = repo.Begin();
  auto d  = *repo.GetMessage(*tx, "d");
  d.parent_id     = "c";
  d.role          = "assistant";
  d.created_at_ms = 5;
  d.status        = "error";
  assert(repo.UpdateMessage(*tx, d));

  auto missing = Message("zzz", "t1", std::nullopt, 1);
  assert(repo.UpdateMessage(*tx, missing).code == ErrorCode::NotFound);
  tx->Commit();

  auto read    = repo.Begin();
  auto updated = *repo.GetMessage(*read, "d");
  assert(updated.role == "user");
  assert(updated.created_at_ms == 30);
  assert(updated.status == "error");
  assert(repo.GetChildIds(*read, "b").empty());
  assert((repo.GetChildIds(*read, "c") == std::vector<std::string>{"d"}));
  read->Commit();
}

void TestTopicPointerAndDelete() {
  MemoryRepository repo;
  Seed(repo);

  auto tx = repo.Begin();
  assert(repo.SetActiveNode(*tx, "t1", std::string("d"), 5));
  assert(repo.SetActiveNode(*tx, "ghost", std::nullopt, 5).code == ErrorCode::NotFound);
  tx->Commit();

  auto check = repo.Begin();
  assert(repo.GetTopic(*check, "t1")->active_node_id == std::optional<std::string>("d"));
  check->Commit();

  auto del = repo.Begin();
  assert(repo.DeleteTopic(*del, "t1"));
  assert(repo.DeleteTopic(*del, "t1").code == ErrorCode::NotFound);
  del->Commit();

  auto read = repo.Begin();
  assert(!repo.GetTopic(*read, "t1"));
  assert(!repo.GetMessage(*read, "a"));
  assert(!repo.FindRootId(*read, "t1"));
  assert(repo.GetTopic(*read, "t2"));
  read->Commit();
}

void TestRollbackDiscardsWrites() {
  MemoryRepository repo;
  Seed(repo);

  {
    auto tx = repo.Begin();
    assert(repo.InsertMessage(*tx, Message("e", "t1", "c", 40)));
    // destroyed without commit
  }

  auto read = repo.Begin();
  assert(!repo.GetMessage(*read, "e"));
  read->Commit();
}

void TestConcurrentWritersConflict() {
  MemoryRepository repo;
  Seed(repo);

  auto first  = repo.Begin();
  auto second = repo.Begin();
  auto reader = repo.Begin();
  assert(repo.InsertMessage(*first, Message("e", "t1", "c", 40)));
  assert(repo.InsertMessage(*second, Message("f", "t1", "c", 41)));
  first->Commit();
  assert(first->IsCommitted());

  bool conflicted = false;
  try {
    second->Commit();
  } catch (const std::runtime_error&) {
    conflicted = true;
  }
  assert(conflicted);

  // read-only transactions never conflict
  assert(repo.GetMessage(*reader, "a"));
  reader->Commit();
}

} // namespace

int main() {
  TestChildrenAreOrderedByCreationTime();
  TestTraversal();
  TestSiblingsLookup();
  TestInsertRejectsDanglingReferences();
  TestReparentAndDelete();
  TestUpdateKeepsImmutableColumnsAndReslots();
  TestTopicPointerAndDelete();
  TestRollbackDiscardsWrites();
  TestConcurrentWritersConflict();

  std::cout << "convtree_unit_memory_repository: pass\n";
  return 0;
}
