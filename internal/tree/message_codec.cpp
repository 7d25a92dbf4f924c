#include "message_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace convtree::tree {

using namespace convtree::tree::v1;

namespace {

const google::protobuf::ListValue* Blocks(const google::protobuf::Struct& data) {
  const auto it = data.fields().find("blocks");
  if (it == data.fields().end() || it->second.kind_case() != google::protobuf::Value::kListValue) {
    return nullptr;
  }
  return &it->second.list_value();
}

const std::string* BlockContent(const google::protobuf::Value& block) {
  if (block.kind_case() != google::protobuf::Value::kStructValue) {
    return nullptr;
  }
  const auto& fields = block.struct_value().fields();
  const auto  it     = fields.find("content");
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return nullptr;
  }
  return &it->second.string_value();
}

std::string Trim(const std::string& s) {
  constexpr const char* kWhitespace = " \t\n\r\f\v";
  const auto            first       = s.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(kWhitespace);
  return s.substr(first, last - first + 1);
}

// Byte offset just past the first `n` UTF-8 code points, or npos when
// the string has `n` or fewer.
std::size_t CodePointPrefix(const std::string& s, std::size_t n) {
  std::size_t count = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const auto c = static_cast<unsigned char>(s[i]);
    if ((c & 0xC0) != 0x80) {
      if (count == n) {
        return i;
      }
      ++count;
    }
  }
  return std::string::npos;
}

google::protobuf::Struct OptionalStruct(const std::optional<std::string>& json) {
  return json ? JsonToStruct(*json) : google::protobuf::Struct{};
}

} // namespace

std::string RoleToString(MessageRole role) {
  switch (role) {
    case MESSAGE_ROLE_USER:
      return "user";
    case MESSAGE_ROLE_ASSISTANT:
      return "assistant";
    case MESSAGE_ROLE_SYSTEM:
      return "system";
    default:
      throw std::invalid_argument("message role is required");
  }
}

MessageRole RoleFromString(const std::string& role) {
  if (role == "user") return MESSAGE_ROLE_USER;
  if (role == "assistant") return MESSAGE_ROLE_ASSISTANT;
  if (role == "system") return MESSAGE_ROLE_SYSTEM;
  return MESSAGE_ROLE_UNSPECIFIED;
}

std::string StatusToString(MessageStatus status) {
  switch (status) {
    case MESSAGE_STATUS_PENDING:
      return "pending";
    case MESSAGE_STATUS_SUCCESS:
      return "success";
    case MESSAGE_STATUS_ERROR:
      return "error";
    case MESSAGE_STATUS_PAUSED:
      return "paused";
    default:
      throw std::invalid_argument("message status is required");
  }
}

MessageStatus StatusFromString(const std::string& status) {
  if (status == "pending") return MESSAGE_STATUS_PENDING;
  if (status == "success") return MESSAGE_STATUS_SUCCESS;
  if (status == "error") return MESSAGE_STATUS_ERROR;
  if (status == "paused") return MESSAGE_STATUS_PAUSED;
  return MESSAGE_STATUS_UNSPECIFIED;
}

MessageRole DisplayRole(MessageRole role) {
  return role == MESSAGE_ROLE_SYSTEM ? MESSAGE_ROLE_ASSISTANT : role;
}

std::string StructToJson(const google::protobuf::Struct& value) {
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode struct: " + status.ToString());
  }
  return json;
}

google::protobuf::Struct JsonToStruct(const std::string& json) {
  google::protobuf::Struct value;
  const auto               status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    throw std::runtime_error("decode struct: " + status.ToString());
  }
  return value;
}

std::string BuildPreview(const google::protobuf::Struct& data, std::size_t max_chars) {
  const auto* blocks = Blocks(data);
  if (!blocks) {
    return {};
  }

  for (const auto& block : blocks->values()) {
    const auto* content = BlockContent(block);
    if (!content) {
      continue;
    }
    auto text = Trim(*content);
    if (text.empty()) {
      continue;
    }
    const auto cut = CodePointPrefix(text, max_chars);
    if (cut == std::string::npos) {
      return text;
    }
    return text.substr(0, cut) + "...";
  }
  return {};
}

std::optional<std::string> ExtractSearchableText(const google::protobuf::Struct& data) {
  const auto* blocks = Blocks(data);
  if (!blocks) {
    return std::nullopt;
  }

  std::string out;
  for (const auto& block : blocks->values()) {
    const auto* content = BlockContent(block);
    if (!content || content->empty()) {
      continue;
    }
    if (!out.empty()) out += '\n';
    out += *content;
  }
  if (out.empty()) {
    return std::nullopt;
  }
  return out;
}

Message ToMessage(const db::model::MessageRecord& record) {
  Message message;
  message.set_id(record.id);
  message.set_topic_id(record.topic_id);
  if (record.parent_id) message.set_parent_id(*record.parent_id);
  message.set_role(RoleFromString(record.role));
  *message.mutable_data() = JsonToStruct(record.data_json);
  if (record.searchable_text) message.set_searchable_text(*record.searchable_text);
  message.set_status(StatusFromString(record.status));
  message.set_siblings_group_id(record.siblings_group_id);

  if (record.assistant_id) message.set_assistant_id(*record.assistant_id);
  if (record.assistant_meta_json) *message.mutable_assistant_meta() = OptionalStruct(record.assistant_meta_json);
  if (record.model_id) message.set_model_id(*record.model_id);
  if (record.model_meta_json) *message.mutable_model_meta() = OptionalStruct(record.model_meta_json);
  if (record.trace_id) message.set_trace_id(*record.trace_id);
  if (record.stats_json) *message.mutable_stats() = OptionalStruct(record.stats_json);

  message.set_created_at_ms(record.created_at_ms);
  message.set_updated_at_ms(record.updated_at_ms);
  return message;
}

TreeNode ToTreeNode(const db::model::MessageRecord& record, bool has_children, std::size_t preview_length) {
  TreeNode node;
  node.set_id(record.id);
  if (record.parent_id) node.set_parent_id(*record.parent_id);
  node.set_role(DisplayRole(RoleFromString(record.role)));
  node.set_preview(BuildPreview(JsonToStruct(record.data_json), preview_length));
  if (record.model_id) node.set_model_id(*record.model_id);
  if (record.model_meta_json) *node.mutable_model_meta() = OptionalStruct(record.model_meta_json);
  node.set_status(StatusFromString(record.status));
  node.set_created_at_ms(record.created_at_ms);
  node.set_has_children(has_children);
  return node;
}

Topic ToTopic(const db::model::TopicRecord& record) {
  Topic topic;
  topic.set_id(record.id);
  topic.set_name(record.name);
  if (record.active_node_id) topic.set_active_node_id(*record.active_node_id);
  topic.set_created_at_ms(record.created_at_ms);
  topic.set_updated_at_ms(record.updated_at_ms);
  return topic;
}

} // namespace convtree::tree
