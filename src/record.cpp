#include "sftcurator/record.hpp"

#include "sftcurator/errors.hpp"

namespace sftcurator {

const std::string* ChatRecord::AssistantContent() const {
  if (!HasTurns()) {
    return nullptr;
  }
  return &messages[kAssistantTurn].content;
}

std::string RawRecord::Text(const std::string& content_key) const {
  return StringField(content_key);
}

std::string RawRecord::StringField(const std::string& key) const {
  if (!fields.is_object()) {
    return {};
  }
  auto it = fields.find(key);
  if (it == fields.end()) {
    return {};
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number()) {
    return it->dump();
  }
  return {};
}

ChatRecord ParseChatRecord(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw MalformedInputError("record is not a JSON object");
  }
  auto messages = j.find("messages");
  if (messages == j.end() || !messages->is_array()) {
    throw MalformedInputError("'messages' is not a list");
  }

  ChatRecord record;
  record.messages.reserve(messages->size());
  for (std::size_t i = 0; i < messages->size(); ++i) {
    const auto& m = (*messages)[i];
    if (!m.is_object()) {
      throw MalformedInputError("message " + std::to_string(i) + " is not an object");
    }
    ChatMessage msg;
    auto role = m.find("role");
    if (role != m.end() && !role->is_null()) {
      if (!role->is_string()) {
        throw MalformedInputError("message " + std::to_string(i) + " role is not a string");
      }
      msg.role = role->get<std::string>();
    }
    auto content = m.find("content");
    if (content != m.end() && !content->is_null()) {
      if (!content->is_string()) {
        throw MalformedInputError("message " + std::to_string(i) + " content is not a string");
      }
      msg.content = content->get<std::string>();
    }
    record.messages.push_back(std::move(msg));
  }

  auto source = j.find("source");
  if (source != j.end() && !source->is_null()) {
    if (!source->is_string()) {
      throw MalformedInputError("'source' is not a string");
    }
    record.source = source->get<std::string>();
  }

  for (auto it = j.begin(); it != j.end(); ++it) {
    if (it.key() == "messages" || it.key() == "source") {
      continue;
    }
    record.extra[it.key()] = it.value();
  }
  return record;
}

ChatRecord ParseChatRecordLine(const std::string& line) {
  auto j = nlohmann::json::parse(line, nullptr, false);
  if (j.is_discarded()) {
    throw MalformedInputError("invalid JSON");
  }
  return ParseChatRecord(j);
}

nlohmann::json ToJson(const ChatRecord& record) {
  nlohmann::json messages = nlohmann::json::array();
  for (const auto& m : record.messages) {
    messages.push_back({{"role", m.role}, {"content", m.content}});
  }
  nlohmann::json j = {{"messages", std::move(messages)}, {"source", record.source}};
  if (record.extra.is_object()) {
    for (auto it = record.extra.begin(); it != record.extra.end(); ++it) {
      j[it.key()] = it.value();
    }
  }
  return j;
}

std::string ToJsonLine(const ChatRecord& record) {
  return ToJson(record).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace sftcurator
