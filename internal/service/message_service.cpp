#include "message_service.hpp"

#include <string_view>
#include <type_traits>

#include "internal/core/message_tree.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace convtree::service {

using namespace convtree::tree::v1;

namespace {

void RequireField(std::string_view operation, std::string_view field, const std::string& value) {
  if (value.empty()) {
    throw util::InvalidOperation(std::string(operation), std::string(field) + " is required");
  }
}

template <typename Fn>
auto ObserveCall(std::string_view route, std::string_view entity_id, Fn&& fn) {
  convtree::observability::SpanScope span(route);
  if (!entity_id.empty()) {
    span.SetAttribute("convtree.id", entity_id);
  }

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    CONVTREE_LOG_ERROR("call failed", {convtree::observability::StringField("route", route),
                                       convtree::observability::StringField("id", entity_id),
                                       convtree::observability::StringField("error", ex.what())});
    throw;
  }
}

core::ParentResolution ToParentResolution(const CreateMessageRequest& req) {
  switch (req.parent_case()) {
    case CreateMessageRequest::kRoot:
      return core::ExplicitRoot{};
    case CreateMessageRequest::kParentId:
      return core::ExplicitParent{req.parent_id()};
    default:
      return core::AutoParent{};
  }
}

} // namespace

MessageService::MessageService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

TreeResponse MessageService::GetTree(const GetTreeRequest& req) {
  return ObserveCall("MessageService.GetTree", req.topic_id(), [&] {
    RequireField("get tree", "topic_id", req.topic_id());

    core::TreeQuery query;
    if (req.has_root_id()) query.root_id = req.root_id();
    if (req.has_node_id()) query.node_id = req.node_id();
    if (req.has_depth()) query.depth = req.depth();
    return ctx_.tree->GetTree(req.topic_id(), query);
  });
}

BranchMessagesResponse MessageService::GetBranchMessages(const GetBranchMessagesRequest& req) {
  return ObserveCall("MessageService.GetBranchMessages", req.topic_id(), [&] {
    RequireField("get branch messages", "topic_id", req.topic_id());

    core::BranchQuery query;
    if (req.has_node_id()) query.node_id = req.node_id();
    if (req.has_before_node_id()) query.before_node_id = req.before_node_id();
    if (req.has_limit()) query.limit = req.limit();
    if (req.has_include_siblings()) query.include_siblings = req.include_siblings();
    return ctx_.tree->GetBranchMessages(req.topic_id(), query);
  });
}

Message MessageService::GetMessage(const GetMessageRequest& req) {
  return ObserveCall("MessageService.GetMessage", req.id(), [&] {
    RequireField("get message", "id", req.id());
    return ctx_.tree->GetById(req.id());
  });
}

GetPathToNodeResponse MessageService::GetPathToNode(const GetPathToNodeRequest& req) {
  return ObserveCall("MessageService.GetPathToNode", req.node_id(), [&] {
    RequireField("get path", "node_id", req.node_id());

    GetPathToNodeResponse resp;
    for (auto& message : ctx_.tree->GetPathToNode(req.node_id())) {
      *resp.add_messages() = std::move(message);
    }
    return resp;
  });
}

Message MessageService::CreateMessage(const CreateMessageRequest& req) {
  return ObserveCall("MessageService.CreateMessage", req.topic_id(), [&] {
    RequireField("create message", "topic_id", req.topic_id());

    core::NewMessage request;
    request.parent = ToParentResolution(req);
    request.role   = req.role();
    request.data   = req.data();
    if (req.has_status()) request.status = req.status();
    if (req.has_siblings_group_id()) request.siblings_group_id = req.siblings_group_id();
    if (req.has_assistant_id()) request.assistant_id = req.assistant_id();
    if (req.has_assistant_meta()) request.assistant_meta = req.assistant_meta();
    if (req.has_model_id()) request.model_id = req.model_id();
    if (req.has_model_meta()) request.model_meta = req.model_meta();
    if (req.has_trace_id()) request.trace_id = req.trace_id();
    if (req.has_stats()) request.stats = req.stats();
    request.set_as_active = !req.has_set_as_active() || req.set_as_active();
    return ctx_.tree->Create(req.topic_id(), request);
  });
}

Message MessageService::UpdateMessage(const UpdateMessageRequest& req) {
  return ObserveCall("MessageService.UpdateMessage", req.id(), [&] {
    RequireField("update message", "id", req.id());

    core::MessagePatch patch;
    if (req.has_data()) patch.data = req.data();
    switch (req.parent_case()) {
      case UpdateMessageRequest::kMoveToRoot:
        patch.parent_id = std::optional<std::string>{};
        break;
      case UpdateMessageRequest::kParentId:
        patch.parent_id = std::optional<std::string>{req.parent_id()};
        break;
      default:
        break;
    }
    if (req.has_siblings_group_id()) patch.siblings_group_id = req.siblings_group_id();
    if (req.has_status()) patch.status = req.status();
    if (req.has_trace_id()) patch.trace_id = req.trace_id();
    if (req.has_stats()) patch.stats = req.stats();
    return ctx_.tree->Update(req.id(), patch);
  });
}

DeleteMessageResponse MessageService::DeleteMessage(const DeleteMessageRequest& req) {
  return ObserveCall("MessageService.DeleteMessage", req.id(), [&] {
    RequireField("delete message", "id", req.id());

    const auto strategy = req.active_node_strategy() == ACTIVE_NODE_STRATEGY_CLEAR ? core::ActiveNodeStrategy::kClear
                                                                                   : core::ActiveNodeStrategy::kParent;
    return ctx_.tree->Delete(req.id(), req.cascade(), strategy);
  });
}

Topic MessageService::CreateTopic(const CreateTopicRequest& req) {
  return ObserveCall("MessageService.CreateTopic", "", [&] { return ctx_.tree->CreateTopic(req.name()); });
}

Topic MessageService::GetTopic(const GetTopicRequest& req) {
  return ObserveCall("MessageService.GetTopic", req.id(), [&] {
    RequireField("get topic", "id", req.id());
    return ctx_.tree->GetTopic(req.id());
  });
}

Topic MessageService::SetActiveNode(const SetActiveNodeRequest& req) {
  return ObserveCall("MessageService.SetActiveNode", req.topic_id(), [&] {
    RequireField("set active node", "topic_id", req.topic_id());
    RequireField("set active node", "node_id", req.node_id());
    return ctx_.tree->SetActiveNode(req.topic_id(), req.node_id());
  });
}

void MessageService::DeleteTopic(const DeleteTopicRequest& req) {
  ObserveCall("MessageService.DeleteTopic", req.id(), [&] {
    RequireField("delete topic", "id", req.id());
    ctx_.tree->DeleteTopic(req.id());
  });
}

} // namespace convtree::service
