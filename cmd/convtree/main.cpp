#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "convtree/tree/v1.hpp"

using namespace convtree::tree::v1;

static void Usage() {
  std::cerr << "Usage: convtree --config <config.yaml> <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  topic-create [name]\n"
            << "  topic-get <topic_id>\n"
            << "  topic-delete <topic_id>\n"
            << "  set-active <topic_id> <node_id>\n"
            << "  create <topic_id> <CreateMessageRequest json>\n"
            << "  get <id>\n"
            << "  update <id> <UpdateMessageRequest json>\n"
            << "  delete <id> [--cascade] [--clear-active]\n"
            << "  tree <topic_id> [GetTreeRequest json]\n"
            << "  branch <topic_id> [GetBranchMessagesRequest json]\n"
            << "  path <node_id>\n";
}

static void Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("encode response: " + status.ToString());
  }
  std::cout << json;
}

static bool ParseRequest(const std::string& json, google::protobuf::Message* request) {
  const auto status = google::protobuf::util::JsonStringToMessage(json, request);
  if (!status.ok()) {
    std::cerr << "invalid " << request->GetTypeName() << ": " << status.ToString() << "\n";
    return false;
  }
  return true;
}

static void Shutdown() {
  convtree::observability::ShutdownLogging();
  convtree::observability::ShutdownTracing();
}

// Returns the process exit code; throws on engine failures.
static int Run(convtree::service::MessageService& service, const std::vector<std::string>& args) {
  const auto& cmd = args[0];
  const auto  arg = [&](std::size_t i) -> const std::string& { return args[i]; };

  if (cmd == "topic-create") {
    CreateTopicRequest req;
    if (args.size() > 1) req.set_name(arg(1));
    Print(service.CreateTopic(req));
    return 0;
  }

  if (cmd == "topic-get" && args.size() == 2) {
    GetTopicRequest req;
    req.set_id(arg(1));
    Print(service.GetTopic(req));
    return 0;
  }

  if (cmd == "topic-delete" && args.size() == 2) {
    DeleteTopicRequest req;
    req.set_id(arg(1));
    service.DeleteTopic(req);
    return 0;
  }

  if (cmd == "set-active" && args.size() == 3) {
    SetActiveNodeRequest req;
    req.set_topic_id(arg(1));
    req.set_node_id(arg(2));
    Print(service.SetActiveNode(req));
    return 0;
  }

  if (cmd == "create" && args.size() == 3) {
    CreateMessageRequest req;
    if (!ParseRequest(arg(2), &req)) return 1;
    req.set_topic_id(arg(1));
    Print(service.CreateMessage(req));
    return 0;
  }

  if (cmd == "get" && args.size() == 2) {
    GetMessageRequest req;
    req.set_id(arg(1));
    Print(service.GetMessage(req));
    return 0;
  }

  if (cmd == "update" && args.size() == 3) {
    UpdateMessageRequest req;
    if (!ParseRequest(arg(2), &req)) return 1;
    req.set_id(arg(1));
    Print(service.UpdateMessage(req));
    return 0;
  }

  if (cmd == "delete" && args.size() >= 2) {
    DeleteMessageRequest req;
    req.set_id(arg(1));
    for (std::size_t i = 2; i < args.size(); ++i) {
      if (arg(i) == "--cascade") {
        req.set_cascade(true);
      } else if (arg(i) == "--clear-active") {
        req.set_active_node_strategy(ACTIVE_NODE_STRATEGY_CLEAR);
      } else {
        std::cerr << "unknown delete flag: " << arg(i) << "\n";
        return 1;
      }
    }
    Print(service.DeleteMessage(req));
    return 0;
  }

  if (cmd == "tree" && (args.size() == 2 || args.size() == 3)) {
    GetTreeRequest req;
    if (args.size() == 3 && !ParseRequest(arg(2), &req)) return 1;
    req.set_topic_id(arg(1));
    Print(service.GetTree(req));
    return 0;
  }

  if (cmd == "branch" && (args.size() == 2 || args.size() == 3)) {
    GetBranchMessagesRequest req;
    if (args.size() == 3 && !ParseRequest(arg(2), &req)) return 1;
    req.set_topic_id(arg(1));
    Print(service.GetBranchMessages(req));
    return 0;
  }

  if (cmd == "path" && args.size() == 2) {
    GetPathToNodeRequest req;
    req.set_node_id(arg(1));
    Print(service.GetPathToNode(req));
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  int code = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = convtree::config::ConfigLoader::LoadFromYaml(config_path);

    convtree::observability::InitializeTracing(config);
    convtree::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build dependency graph and run one command
    // ------------------------------------------------------------
    auto deps = convtree::factory::BuildRuntime(config);
    code      = Run(*deps.message_service, args);
  } catch (const std::exception& e) {
    CONVTREE_LOG_ERROR("Fatal error", {convtree::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  Shutdown();
  return code;
}
