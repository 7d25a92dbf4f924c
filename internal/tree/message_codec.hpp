#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "convtree/tree/v1/message.pb.h"
#include "internal/db/model/message_record.hpp"
#include "internal/db/model/topic_record.hpp"

namespace convtree::tree {

/*
  Conversions between repository rows and the v1 protobuf types, plus
  the text helpers derived from a message's `data` blocks.
*/

inline constexpr std::size_t kDefaultPreviewLength = 50;

// Lowercase storage names ("user", "success"). UNSPECIFIED throws
// std::invalid_argument; unknown names decode to UNSPECIFIED.
std::string                       RoleToString(convtree::tree::v1::MessageRole role);
convtree::tree::v1::MessageRole   RoleFromString(const std::string& role);
std::string                       StatusToString(convtree::tree::v1::MessageStatus status);
convtree::tree::v1::MessageStatus StatusFromString(const std::string& status);

// system is shown as assistant in tree views.
convtree::tree::v1::MessageRole DisplayRole(convtree::tree::v1::MessageRole role);

std::string              StructToJson(const google::protobuf::Struct& value);
google::protobuf::Struct JsonToStruct(const std::string& json);

/*
  First block whose `content` is a string that is non-empty after
  trimming; cut to `max_chars` code points with "..." appended when
  longer. Empty when no block qualifies.
*/
std::string BuildPreview(const google::protobuf::Struct& data, std::size_t max_chars = kDefaultPreviewLength);

// Non-empty string `content` of every block joined by "\n".
std::optional<std::string> ExtractSearchableText(const google::protobuf::Struct& data);

convtree::tree::v1::Message  ToMessage(const db::model::MessageRecord& record);
convtree::tree::v1::TreeNode ToTreeNode(const db::model::MessageRecord& record, bool has_children,
                                        std::size_t preview_length = kDefaultPreviewLength);
convtree::tree::v1::Topic    ToTopic(const db::model::TopicRecord& record);

} // namespace convtree::tree
