#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/tree/message_codec.hpp"

namespace {

using namespace convtree::tree;
using namespace convtree::tree::v1;

google::protobuf::Struct Blocks(std::initializer_list<google::protobuf::Value> blocks) {
  google::protobuf::Struct data;
  auto*                    list = (*data.mutable_fields())["blocks"].mutable_list_value();
  for (const auto& block : blocks) *list->add_values() = block;
  return data;
}

google::protobuf::Value ContentBlock(const std::string& content) {
  google::protobuf::Value block;
  (*block.mutable_struct_value()->mutable_fields())["type"].set_string_value("main_text");
  (*block.mutable_struct_value()->mutable_fields())["content"].set_string_value(content);
  return block;
}

google::protobuf::Value NumericContentBlock(double content) {
  google::protobuf::Value block;
  (*block.mutable_struct_value()->mutable_fields())["content"].set_number_value(content);
  return block;
}

void TestPreviewSkipsBlankAndNonStringBlocks() {
  auto data = Blocks({NumericContentBlock(42), ContentBlock("   \n\t"), ContentBlock("  Hello there  "), ContentBlock("ignored")});
  assert(BuildPreview(data) == "Hello there");
  assert(BuildPreview(google::protobuf::Struct{}).empty());
  assert(BuildPreview(Blocks({ContentBlock("  ")})).empty());
}

void TestPreviewTruncatesOnCodePoints() {
  const std::string fifty(50, 'x');
  assert(BuildPreview(Blocks({ContentBlock(fifty)})) == fifty);
  assert(BuildPreview(Blocks({ContentBlock(fifty + "y")})) == fifty + "...");

  // 51 two-byte characters: the cut must not split a code point.
  std::string umlauts;
  for (int i = 0; i < 51; ++i) umlauts += "\xC3\xBC";
  const auto preview = BuildPreview(Blocks({ContentBlock(umlauts)}));
  assert(preview == umlauts.substr(0, 100) + "...");

  assert(BuildPreview(Blocks({ContentBlock("abcdef")}), 3) == "abc...");
}

void TestSearchableText() {
  auto data = Blocks({ContentBlock("first"), NumericContentBlock(1), ContentBlock(""), ContentBlock("second")});
  assert(ExtractSearchableText(data) == std::optional<std::string>("first\nsecond"));
  assert(!ExtractSearchableText(Blocks({NumericContentBlock(3)})));
  assert(!ExtractSearchableText(google::protobuf::Struct{}));
}

void TestRoleAndStatusNames() {
  assert(RoleToString(MESSAGE_ROLE_SYSTEM) == "system");
  assert(RoleFromString("assistant") == MESSAGE_ROLE_ASSISTANT);
  assert(RoleFromString("robot") == MESSAGE_ROLE_UNSPECIFIED);
  assert(StatusFromString(StatusToString(MESSAGE_STATUS_PAUSED)) == MESSAGE_STATUS_PAUSED);
  assert(DisplayRole(MESSAGE_ROLE_SYSTEM) == MESSAGE_ROLE_ASSISTANT);
  assert(DisplayRole(MESSAGE_ROLE_USER) == MESSAGE_ROLE_USER);

  bool threw = false;
  try {
    (void)RoleToString(MESSAGE_ROLE_UNSPECIFIED);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestRecordConversion() {
  convtree::db::model::MessageRecord record;
  record.id                = "m1";
  record.topic_id          = "t1";
  record.parent_id         = "p1";
  record.role              = "system";
  record.data_json         = R"({"blocks":[{"content":"You are terse."}]})";
  record.status            = "success";
  record.siblings_group_id = 3;
  record.model_id          = "model-a";
  record.model_meta_json   = R"({"temperature":0.5})";
  record.created_at_ms     = 100;
  record.updated_at_ms     = 200;

  auto message = ToMessage(record);
  assert(message.parent_id() == "p1");
  assert(message.role() == MESSAGE_ROLE_SYSTEM);
  assert(message.status() == MESSAGE_STATUS_SUCCESS);
  assert(message.siblings_group_id() == 3);
  assert(message.model_meta().fields().at("temperature").number_value() == 0.5);
  assert(!message.has_assistant_id());
  assert(!message.has_stats());

  auto node = ToTreeNode(record, true);
  assert(node.role() == MESSAGE_ROLE_ASSISTANT);
  assert(node.preview() == "You are terse.");
  assert(node.has_children());
  assert(node.parent_id() == "p1");

  record.parent_id.reset();
  assert(!ToMessage(record).has_parent_id());
}

void TestStructJsonRoundTrip() {
  auto data = Blocks({ContentBlock("hi")});
  auto back = JsonToStruct(StructToJson(data));
  assert(back.fields().at("blocks").list_value().values_size() == 1);

  bool threw = false;
  try {
    (void)JsonToStruct("{not json");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPreviewSkipsBlankAndNonStringBlocks();
  TestPreviewTruncatesOnCodePoints();
  TestSearchableText();
  TestRoleAndStatusNames();
  TestRecordConversion();
  TestStructJsonRoundTrip();

  std::cout << "convtree_unit_message_codec: pass\n";
  return 0;
}
