#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/tree/tree_projector.hpp"

namespace {

using convtree::db::model::MessageRecord;
using convtree::tree::TreeProjector;
using convtree::tree::v1::TreeResponse;

MessageRecord Node(const std::string& id, std::optional<std::string> parent, uint64_t created_at_ms, int64_t group = 0,
                   const std::string& role = "assistant") {
  MessageRecord m;
  m.id                = id;
  m.topic_id          = "t";
  m.parent_id         = std::move(parent);
  m.role              = role;
  m.status            = "success";
  m.siblings_group_id = group;
  m.created_at_ms     = created_at_ms;
  m.data_json         = R"({"blocks":[{"content":")" + id + R"("}]})";
  return m;
}

/*
  r
  ├── a  (group 1) ── a1 ── a2
  ├── b  (group 1) ── b1
  ├── c             ── d (group 5, alone)
*/
std::vector<MessageRecord> Fixture() {
  // Deliberately out of creation order.
  return {Node("c", "r", 4), Node("r", std::nullopt, 1, 0, "user"), Node("b", "r", 3, 1), Node("a", "r", 2, 1),
          Node("a1", "a", 5, 0, "user"), Node("a2", "a1", 6), Node("b1", "b", 7, 0, "user"), Node("d", "c", 8, 5)};
}

std::vector<std::string> NodeIds(const TreeResponse& response) {
  std::vector<std::string> out;
  for (const auto& node : response.nodes()) out.push_back(node.id());
  return out;
}

void TestDepthOneCollapsesGroups() {
  TreeProjector projector(Fixture(), {}, {"r", "a", "a1", "b", "c"});

  TreeResponse response;
  projector.Project("r", 1, &response);

  assert((NodeIds(response) == std::vector<std::string>{"r", "c"}));
  assert(response.siblings_groups_size() == 1);

  const auto& group = response.siblings_groups(0);
  assert(group.parent_id() == "r");
  assert(group.siblings_group_id() == 1);
  assert(group.nodes_size() == 2);
  assert(group.nodes(0).id() == "a" && group.nodes(1).id() == "b");
  assert(!group.nodes(0).has_parent_id());
  assert(group.nodes(0).has_children());

  assert(response.nodes(0).role() == convtree::tree::v1::MESSAGE_ROLE_USER);
  assert(response.nodes(0).preview() == "r");
  assert(response.nodes(1).has_children());
}

void TestActivePathExpandsAndRestartsDepth() {
  TreeProjector projector(Fixture(), {"r", "a", "a1"}, {"r", "a", "a1", "b", "c"});

  TreeResponse response;
  projector.Project("r", 0, &response);

  // a2 hangs off an active-path node so it is shown; b1 is not.
  assert((NodeIds(response) == std::vector<std::string>{"r", "a1", "a2", "c"}));
  assert(response.siblings_groups_size() == 1);
}

void TestUnlimitedDepthShowsEverything() {
  TreeProjector projector(Fixture(), {}, {});

  TreeResponse response;
  projector.Project("r", -1, &response);

  assert((NodeIds(response) == std::vector<std::string>{"r", "a1", "a2", "b1", "c", "d"}));
  assert(response.siblings_groups_size() == 1);

  // single-member group is an ordinary node, has_children falls back to
  // the loaded children
  assert(response.nodes(5).id() == "d");
  assert(response.nodes(4).has_children());
  assert(!response.nodes(5).has_children());
}

void TestSubtreeRootAndMissingRoot() {
  TreeProjector projector(Fixture(), {}, {});

  TreeResponse from_a;
  projector.Project("a", -1, &from_a);
  // a is still reported as part of its group under r
  assert((NodeIds(from_a) == std::vector<std::string>{"a1", "a2"}));
  assert(from_a.siblings_groups_size() == 1);

  TreeResponse none;
  projector.Project("ghost", -1, &none);
  assert(none.nodes_size() == 0 && none.siblings_groups_size() == 0);
}

void TestGroupIdsDoNotSpanParents() {
  // x1 and the y pair share group 7 but only y1/y2 share a parent.
  std::vector<MessageRecord> records{Node("r", std::nullopt, 1, 0, "user"), Node("x", "r", 2), Node("y", "r", 3),
                                     Node("x1", "x", 4, 7), Node("y1", "y", 5, 7), Node("y2", "y", 6, 7)};
  TreeProjector projector(std::move(records), {}, {});

  TreeResponse response;
  projector.Project("r", -1, &response);

  assert((NodeIds(response) == std::vector<std::string>{"r", "x", "x1", "y"}));
  assert(response.siblings_groups_size() == 1);
  const auto& group = response.siblings_groups(0);
  assert(group.parent_id() == "y");
  assert(group.siblings_group_id() == 7);
  assert(group.nodes_size() == 2);
  assert(group.nodes(0).id() == "y1" && group.nodes(1).id() == "y2");
}

void TestDeepChainDoesNotRecurse() {
  std::vector<MessageRecord> chain{Node("n0", std::nullopt, 0)};
  for (int i = 1; i < 20000; ++i) {
    chain.push_back(Node("n" + std::to_string(i), "n" + std::to_string(i - 1), static_cast<uint64_t>(i)));
  }
  TreeProjector projector(std::move(chain), {}, {});

  TreeResponse response;
  projector.Project("n0", -1, &response);
  assert(response.nodes_size() == 20000);
  assert(response.nodes(19999).id() == "n19999");
}

} // namespace

int main() {
  TestDepthOneCollapsesGroups();
  TestActivePathExpandsAndRestartsDepth();
  TestUnlimitedDepthShowsEverything();
  TestSubtreeRootAndMissingRoot();
  TestGroupIdsDoNotSpanParents();
  TestDeepChainDoesNotRecurse();

  std::cout << "convtree_unit_tree_projector: pass\n";
  return 0;
}
