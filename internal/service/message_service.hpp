#pragma once

#include "convtree/tree/v1/message.pb.h"
#include "convtree/tree/v1/tree_service.pb.h"
#include "service_context.hpp"

namespace convtree::service {

/*
  Protobuf facade over core::MessageTree.

  Every call opens a "MessageService.<Op>" span; failures are logged
  with the route and rethrown unchanged.
*/
class MessageService {
public:
  explicit MessageService(ServiceContext ctx);

  convtree::tree::v1::TreeResponse
  GetTree(const convtree::tree::v1::GetTreeRequest& req);

  convtree::tree::v1::BranchMessagesResponse
  GetBranchMessages(const convtree::tree::v1::GetBranchMessagesRequest& req);

  convtree::tree::v1::Message
  GetMessage(const convtree::tree::v1::GetMessageRequest& req);

  convtree::tree::v1::GetPathToNodeResponse
  GetPathToNode(const convtree::tree::v1::GetPathToNodeRequest& req);

  convtree::tree::v1::Message
  CreateMessage(const convtree::tree::v1::CreateMessageRequest& req);

  convtree::tree::v1::Message
  UpdateMessage(const convtree::tree::v1::UpdateMessageRequest& req);

  convtree::tree::v1::DeleteMessageResponse
  DeleteMessage(const convtree::tree::v1::DeleteMessageRequest& req);

  convtree::tree::v1::Topic
  CreateTopic(const convtree::tree::v1::CreateTopicRequest& req);

  convtree::tree::v1::Topic
  GetTopic(const convtree::tree::v1::GetTopicRequest& req);

  convtree::tree::v1::Topic
  SetActiveNode(const convtree::tree::v1::SetActiveNodeRequest& req);

  void DeleteTopic(const convtree::tree::v1::DeleteTopicRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace convtree::service
