#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "convtree/tree/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"

namespace {

google::protobuf::Struct TextData(const std::string& text) {
  google::protobuf::Struct data;
  auto*                    block = data.mutable_fields()->operator[]("blocks").mutable_list_value()->add_values();
  (*block->mutable_struct_value()->mutable_fields())["type"].set_string_value("main_text");
  (*block->mutable_struct_value()->mutable_fields())["content"].set_string_value(text);
  return data;
}

const char* RoleName(convtree::tree::v1::MessageRole role) {
  switch (role) {
    case convtree::tree::v1::MESSAGE_ROLE_USER:
      return "user";
    case convtree::tree::v1::MESSAGE_ROLE_ASSISTANT:
      return "assistant";
    default:
      return "?";
  }
}

} // namespace

int main(int argc, char** argv) {
  using namespace convtree::tree::v1;

  // Optional YAML config; defaults to the in-memory backend.
  auto config = argc > 1 ? convtree::config::ConfigLoader::LoadFromYaml(argv[1])
                         : convtree::config::ConfigLoader::LoadFromYamlString("database:\n  memory: {}\n");

  auto  deps    = convtree::factory::BuildRuntime(config);
  auto& service = *deps.message_service;

  CreateTopicRequest topic_req;
  topic_req.set_name("branching example");
  const auto topic = service.CreateTopic(topic_req);

  // Question -> answer, then regenerate the answer twice as a siblings
  // group so the tree shows three alternatives under the question.
  CreateMessageRequest question;
  question.set_topic_id(topic.id());
  question.set_role(MESSAGE_ROLE_USER);
  *question.mutable_data() = TextData("How do I reverse a linked list in place?");
  question.set_status(MESSAGE_STATUS_SUCCESS);
  const auto q = service.CreateMessage(question);

  std::string last_answer;
  for (int attempt = 1; attempt <= 3; ++attempt) {
    CreateMessageRequest answer;
    answer.set_topic_id(topic.id());
    answer.set_parent_id(q.id());
    answer.set_role(MESSAGE_ROLE_ASSISTANT);
    answer.set_siblings_group_id(1);
    answer.set_model_id("model-" + std::to_string(attempt));
    *answer.mutable_data() = TextData("Attempt " + std::to_string(attempt) + ": walk the list and flip each next pointer.");
    last_answer = service.CreateMessage(answer).id();
  }

  GetTreeRequest tree_req;
  tree_req.set_topic_id(topic.id());
  tree_req.set_depth(-1);
  const auto tree = service.GetTree(tree_req);

  std::cout << "nodes:\n";
  for (const auto& node : tree.nodes()) {
    std::cout << "  [" << RoleName(node.role()) << "] " << node.preview() << (node.has_children() ? " (+)" : "") << '\n';
  }
  for (const auto& group : tree.siblings_groups()) {
    std::cout << "siblings group " << group.siblings_group_id() << " (" << group.nodes_size() << " alternatives)\n";
    for (const auto& node : group.nodes()) {
      std::cout << "  " << node.model_id() << ": " << node.preview() << '\n';
    }
  }

  GetBranchMessagesRequest branch_req;
  branch_req.set_topic_id(topic.id());
  const auto branch = service.GetBranchMessages(branch_req);

  std::cout << "active branch (" << branch.messages_size() << " messages):\n";
  for (const auto& entry : branch.messages()) {
    std::cout << "  " << entry.message().id() << " with " << entry.siblings_group_size() << " alternatives\n";
  }

  std::cout << "active node is last answer: " << (branch.active_node_id() == last_answer ? "yes" : "no") << '\n';
  return 0;
}
