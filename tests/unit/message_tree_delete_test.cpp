#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/message_tree.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace convtree::core;
using namespace convtree::tree::v1;
using convtree::util::InvalidOperation;
using convtree::util::NotFound;

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

google::protobuf::Struct TextData(const std::string& text) {
  google::protobuf::Struct data;
  auto*                    block = (*data.mutable_fields())["blocks"].mutable_list_value()->add_values();
  (*block->mutable_struct_value()->mutable_fields())["content"].set_string_value(text);
  return data;
}

NewMessage Msg(const std::string& text, ParentResolution parent = AutoParent{}) {
  NewMessage request;
  request.parent = std::move(parent);
  request.role   = MESSAGE_ROLE_USER;
  request.data   = TextData(text);
  return request;
}

template <typename Ids>
bool Contains(const Ids& ids, const std::string& id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

/*
  root
  └── a
      ├── b
      │   └── c   (active)
      └── d
*/
struct Fixture {
  MessageTree tree{std::make_shared<convtree::db::memory::MemoryRepository>()};
  Topic       topic;
  Message     root, a, b, c, d;

  Fixture() {
    topic = tree.CreateTopic("delete");
    root  = tree.Create(topic.id(), Msg("root"));
    a     = tree.Create(topic.id(), Msg("a"));
    d     = tree.Create(topic.id(), Msg("d", ExplicitParent{a.id()}));
    b     = tree.Create(topic.id(), Msg("b", ExplicitParent{a.id()}));
    c     = tree.Create(topic.id(), Msg("c"));
  }
};

void TestReparentingDelete() {
  Fixture f;

  const auto response = f.tree.Delete(f.a.id());
  assert(response.deleted_ids_size() == 1);
  assert(response.deleted_ids(0) == f.a.id());
  assert(response.reparented_ids_size() == 2);
  assert(Contains(response.reparented_ids(), f.b.id()));
  assert(Contains(response.reparented_ids(), f.d.id()));
  assert(!response.active_node_changed());

  assert(Throws<NotFound>([&] { f.tree.GetById(f.a.id()); }));
  assert(f.tree.GetById(f.b.id()).parent_id() == f.root.id());
  assert(f.tree.GetById(f.d.id()).parent_id() == f.root.id());
  assert(f.tree.GetTopic(f.topic.id()).active_node_id() == f.c.id());
}

void TestDeletingActiveLeafMovesPointerToParent() {
  Fixture f;

  const auto response = f.tree.Delete(f.c.id());
  assert(response.active_node_changed());
  assert(response.new_active_node_id() == f.b.id());
  assert(f.tree.GetTopic(f.topic.id()).active_node_id() == f.b.id());
}

void TestClearStrategy() {
  Fixture f;

  const auto response = f.tree.Delete(f.c.id(), false, convtree::core::ActiveNodeStrategy::kClear);
  assert(response.active_node_changed());
  assert(!response.has_new_active_node_id());
  assert(!f.tree.GetTopic(f.topic.id()).has_active_node_id());
}

void TestCascadeDeleteRemovesSubtree() {
  Fixture f;

  const auto response = f.tree.Delete(f.b.id(), true);
  assert(response.deleted_ids_size() == 2);
  assert(Contains(response.deleted_ids(), f.b.id()));
  assert(Contains(response.deleted_ids(), f.c.id()));
  assert(response.reparented_ids_size() == 0);

  // The active node was inside the removed subtree.
  assert(response.active_node_changed());
  assert(response.new_active_node_id() == f.a.id());

  assert(Throws<NotFound>([&] { f.tree.GetById(f.c.id()); }));
  assert(f.tree.GetById(f.d.id()).parent_id() == f.a.id());
}

void TestCascadeOutsideActivePathKeepsPointer() {
  Fixture f;

  const auto response = f.tree.Delete(f.d.id(), true);
  assert(response.deleted_ids_size() == 1);
  assert(!response.active_node_changed());
  assert(f.tree.GetTopic(f.topic.id()).active_node_id() == f.c.id());
}

void TestRootDeletion() {
  Fixture f;

  assert(Throws<InvalidOperation>([&] { f.tree.Delete(f.root.id()); }));
  assert(f.tree.GetById(f.root.id()).id() == f.root.id());

  const auto response = f.tree.Delete(f.root.id(), true);
  assert(response.deleted_ids_size() == 5);
  assert(response.active_node_changed());
  assert(!response.has_new_active_node_id());

  const auto topic = f.tree.GetTopic(f.topic.id());
  assert(!topic.has_active_node_id());

  // An emptied topic accepts a fresh root.
  const auto fresh = f.tree.Create(f.topic.id(), Msg("again"));
  assert(!fresh.has_parent_id());
}

void TestDeleteMissing() {
  Fixture f;
  assert(Throws<NotFound>([&] { f.tree.Delete("missing"); }));
  assert(Throws<NotFound>([&] { f.tree.Delete("missing", true); }));
}

void TestDeleteTopicRemovesMessages() {
  Fixture f;

  f.tree.DeleteTopic(f.topic.id());
  assert(Throws<NotFound>([&] { f.tree.GetTopic(f.topic.id()); }));
  assert(Throws<NotFound>([&] { f.tree.GetById(f.root.id()); }));
  assert(Throws<NotFound>([&] { f.tree.GetById(f.c.id()); }));
  assert(Throws<NotFound>([&] { f.tree.DeleteTopic(f.topic.id()); }));
}

} // namespace

int main() {
  TestReparentingDelete();
  TestDeletingActiveLeafMovesPointerToParent();
  TestClearStrategy();
  TestCascadeDeleteRemovesSubtree();
  TestCascadeOutsideActivePathKeepsPointer();
  TestRootDeletion();
  TestDeleteMissing();
  TestDeleteTopicRemovesMessages();

  std::cout << "convtree_unit_message_tree_delete: pass\n";
  return 0;
}
