#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

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

NewMessage Msg(MessageRole role, const std::string& text, ParentResolution parent = AutoParent{}, int64_t group = 0) {
  NewMessage request;
  request.parent            = std::move(parent);
  request.role              = role;
  request.data              = TextData(text);
  request.siblings_group_id = group;
  return request;
}

template <typename Nodes>
std::vector<std::string> Ids(const Nodes& nodes) {
  std::vector<std::string> out;
  for (const auto& n : nodes) out.push_back(n.id());
  return out;
}

std::vector<std::string> BranchIds(const BranchMessagesResponse& response) {
  std::vector<std::string> out;
  for (const auto& entry : response.messages()) out.push_back(entry.message().id());
  return out;
}

/*
  root (system)
  ├── a1 [group 1]
  │   └── a1x        (active)
  ├── a2 [group 1]
  │   └── a2x
  │       └── a2xx
  └── a3 [group 1]

  Creation is spaced out so sibling order follows creation order.
*/
struct Fixture {
  MessageTree tree;
  Topic       topic;
  Message     root, a1, a2, a3, a1x, a2x, a2xx;

  explicit Fixture(MessageTreeOptions options = {})
      : tree(std::make_shared<convtree::db::memory::MemoryRepository>(), options) {
    topic = tree.CreateTopic("query");
    root  = Add(Msg(MESSAGE_ROLE_SYSTEM, "you are helpful"));
    a1    = Add(Msg(MESSAGE_ROLE_ASSISTANT, "first answer", ExplicitParent{root.id()}, 1));
    a2    = Add(Msg(MESSAGE_ROLE_ASSISTANT, "second answer", ExplicitParent{root.id()}, 1));
    a3    = Add(Msg(MESSAGE_ROLE_ASSISTANT, "third answer", ExplicitParent{root.id()}, 1));
    a2x   = Add(Msg(MESSAGE_ROLE_USER, "follow up two", ExplicitParent{a2.id()}));
    a2xx  = Add(Msg(MESSAGE_ROLE_ASSISTANT, "deeper", ExplicitParent{a2x.id()}));
    a1x   = Add(Msg(MESSAGE_ROLE_USER, "follow up one", ExplicitParent{a1.id()}));
  }

  Message Add(const NewMessage& request) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    return tree.Create(topic.id(), request);
  }
};

void TestEmptyTopic() {
  MessageTree tree(std::make_shared<convtree::db::memory::MemoryRepository>());
  const auto  topic = tree.CreateTopic("empty");

  const auto response = tree.GetTree(topic.id());
  assert(response.nodes_size() == 0);
  assert(response.siblings_groups_size() == 0);
  assert(!response.has_active_node_id());

  const auto branch = tree.GetBranchMessages(topic.id());
  assert(branch.messages_size() == 0);
  assert(!branch.has_active_node_id());

  assert(Throws<NotFound>([&] { tree.GetTree("missing"); }));
  assert(Throws<NotFound>([&] { tree.GetBranchMessages("missing"); }));
}

void TestDefaultTreeFollowsActivePath() {
  Fixture f;

  const auto response = f.tree.GetTree(f.topic.id());
  assert(response.active_node_id() == f.a1x.id());
  assert((Ids(response.nodes()) == std::vector<std::string>{f.root.id(), f.a1x.id()}));

  assert(response.nodes(0).role() == MESSAGE_ROLE_ASSISTANT); // system displayed as assistant
  assert(response.nodes(0).preview() == "you are helpful");
  assert(!response.nodes(0).has_parent_id());
  assert(response.nodes(1).parent_id() == f.a1.id());
  assert(!response.nodes(1).has_children());

  assert(response.siblings_groups_size() == 1);
  const auto& group = response.siblings_groups(0);
  assert(group.parent_id() == f.root.id());
  assert(group.siblings_group_id() == 1);
  assert((Ids(group.nodes()) == std::vector<std::string>{f.a1.id(), f.a2.id(), f.a3.id()}));
  for (const auto& member : group.nodes()) {
    assert(!member.has_parent_id());
  }
  assert(group.nodes(0).has_children());
  assert(group.nodes(1).has_children());
  assert(!group.nodes(2).has_children());
}

void TestUnlimitedDepthAndFocus() {
  Fixture f;

  TreeQuery query;
  query.depth   = -1;
  query.node_id = f.a3.id();
  const auto response = f.tree.GetTree(f.topic.id(), query);
  assert(response.active_node_id() == f.a3.id());
  assert((Ids(response.nodes()) == std::vector<std::string>{f.root.id(), f.a1x.id(), f.a2x.id(), f.a2xx.id()}));
}

void TestSubtreeRootAndMissingTargets() {
  Fixture f;

  TreeQuery query;
  query.root_id = f.a2x.id();
  query.depth   = 0;
  const auto response = f.tree.GetTree(f.topic.id(), query);
  assert((Ids(response.nodes()) == std::vector<std::string>{f.a2x.id()}));
  assert(response.nodes(0).has_children());

  TreeQuery missing_root;
  missing_root.root_id = "missing";
  assert(Throws<NotFound>([&] { f.tree.GetTree(f.topic.id(), missing_root); }));

  const auto other      = f.tree.CreateTopic("other");
  const auto other_root = f.tree.Create(other.id(), Msg(MESSAGE_ROLE_USER, "elsewhere"));

  TreeQuery foreign_root;
  foreign_root.root_id = other_root.id();
  assert(Throws<NotFound>([&] { f.tree.GetTree(f.topic.id(), foreign_root); }));

  TreeQuery foreign_focus;
  foreign_focus.node_id = other_root.id();
  assert(Throws<NotFound>([&] { f.tree.GetTree(f.topic.id(), foreign_focus); }));
}

void TestBranchWithSiblings() {
  Fixture f;

  const auto branch = f.tree.GetBranchMessages(f.topic.id());
  assert(branch.active_node_id() == f.a1x.id());
  assert((BranchIds(branch) == std::vector<std::string>{f.root.id(), f.a1.id(), f.a1x.id()}));

  assert(branch.messages(0).siblings_group_size() == 0);
  const auto& alternates = branch.messages(1).siblings_group();
  assert((Ids(alternates) == std::vector<std::string>{f.a2.id(), f.a3.id()}) ||
         (Ids(alternates) == std::vector<std::string>{f.a3.id(), f.a2.id()}));
  assert(branch.messages(2).siblings_group_size() == 0);
  assert(branch.messages(0).message().role() == MESSAGE_ROLE_SYSTEM);

  BranchQuery no_siblings;
  no_siblings.include_siblings = false;
  const auto bare = f.tree.GetBranchMessages(f.topic.id(), no_siblings);
  assert(bare.messages(1).siblings_group_size() == 0);
}

void TestBranchWindow() {
  Fixture f;

  BranchQuery last_two;
  last_two.limit = 2;
  assert((BranchIds(f.tree.GetBranchMessages(f.topic.id(), last_two)) ==
          std::vector<std::string>{f.a1.id(), f.a1x.id()}));

  BranchQuery before;
  before.before_node_id = f.a1x.id();
  assert((BranchIds(f.tree.GetBranchMessages(f.topic.id(), before)) ==
          std::vector<std::string>{f.root.id(), f.a1.id()}));

  BranchQuery before_limited;
  before_limited.before_node_id = f.a1x.id();
  before_limited.limit          = 1;
  assert((BranchIds(f.tree.GetBranchMessages(f.topic.id(), before_limited)) == std::vector<std::string>{f.a1.id()}));

  BranchQuery before_root;
  before_root.before_node_id = f.root.id();
  assert(f.tree.GetBranchMessages(f.topic.id(), before_root).messages_size() == 0);

  BranchQuery off_path;
  off_path.before_node_id = f.a2.id();
  assert(Throws<NotFound>([&] { f.tree.GetBranchMessages(f.topic.id(), off_path); }));

  BranchQuery explicit_node;
  explicit_node.node_id = f.a2xx.id();
  const auto deep = f.tree.GetBranchMessages(f.topic.id(), explicit_node);
  assert((BranchIds(deep) == std::vector<std::string>{f.root.id(), f.a2.id(), f.a2x.id(), f.a2xx.id()}));
  assert(deep.active_node_id() == f.a1x.id());

  BranchQuery missing;
  missing.node_id = "missing";
  assert(Throws<NotFound>([&] { f.tree.GetBranchMessages(f.topic.id(), missing); }));

  const auto other      = f.tree.CreateTopic("other");
  const auto other_root = f.tree.Create(other.id(), Msg(MESSAGE_ROLE_USER, "elsewhere"));
  BranchQuery foreign;
  foreign.node_id = other_root.id();
  assert(Throws<NotFound>([&] { f.tree.GetBranchMessages(f.topic.id(), foreign); }));
}

void TestConfiguredDefaults() {
  MessageTreeOptions options;
  options.default_branch_limit = 1;
  options.preview_length       = 3;
  Fixture f(options);

  const auto branch = f.tree.GetBranchMessages(f.topic.id());
  assert((BranchIds(branch) == std::vector<std::string>{f.a1x.id()}));

  const auto tree = f.tree.GetTree(f.topic.id());
  assert(tree.nodes(0).preview() == "you...");
}

// A non-positive limit returns the whole root-to-node path even when the
// configured default would cut it.
void TestUnboundedBranchMatchesPath() {
  MessageTreeOptions options;
  options.default_branch_limit = 1;
  Fixture f(options);

  for (const auto& node : {f.root, f.a1, f.a2, f.a3, f.a1x, f.a2x, f.a2xx}) {
    const auto path = Ids(f.tree.GetPathToNode(node.id()));
    for (const int32_t limit : {0, -1}) {
      BranchQuery whole;
      whole.node_id = node.id();
      whole.limit   = limit;
      assert(BranchIds(f.tree.GetBranchMessages(f.topic.id(), whole)) == path);
    }
  }
}

void TestPathAndTopicPointer() {
  Fixture f;

  const auto path = f.tree.GetPathToNode(f.a2xx.id());
  assert((Ids(path) == std::vector<std::string>{f.root.id(), f.a2.id(), f.a2x.id(), f.a2xx.id()}));
  assert(f.tree.GetPathToNode(f.root.id()).size() == 1);
  assert(Throws<NotFound>([&] { f.tree.GetPathToNode("missing"); }));

  const auto moved = f.tree.SetActiveNode(f.topic.id(), f.a2xx.id());
  assert(moved.active_node_id() == f.a2xx.id());
  assert(f.tree.GetTopic(f.topic.id()).active_node_id() == f.a2xx.id());

  // The next auto-parented message continues the selected branch.
  const auto next = f.tree.Create(f.topic.id(), Msg(MESSAGE_ROLE_USER, "continue"));
  assert(next.parent_id() == f.a2xx.id());

  const auto other      = f.tree.CreateTopic("other");
  const auto other_root = f.tree.Create(other.id(), Msg(MESSAGE_ROLE_USER, "elsewhere"));
  assert(Throws<InvalidOperation>([&] { f.tree.SetActiveNode(f.topic.id(), other_root.id()); }));
  assert(Throws<NotFound>([&] { f.tree.SetActiveNode(f.topic.id(), "missing"); }));
  assert(Throws<NotFound>([&] { f.tree.SetActiveNode("missing", f.root.id()); }));
}

} // namespace

int main() {
  TestEmptyTopic();
  TestDefaultTreeFollowsActivePath();
  TestUnlimitedDepthAndFocus();
  TestSubtreeRootAndMissingTargets();
  TestBranchWithSiblings();
  TestBranchWindow();
  TestConfiguredDefaults();
  TestUnboundedBranchMatchesPath();
  TestPathAndTopicPointer();

  std::cout << "convtree_unit_message_tree_query: pass\n";
  return 0;
}
