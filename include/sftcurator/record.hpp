#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sftcurator {

inline constexpr int kRecordSchemaVersion = 1;

inline constexpr std::size_t kSystemTurn = 0;
inline constexpr std::size_t kUserTurn = 1;
inline constexpr std::size_t kAssistantTurn = 2;

struct ChatMessage {
  std::string role;
  std::string content;
};

// Chat-formatted training example: [system, user, assistant] plus the id of
// the document it was generated from. Unknown top-level keys ride along in
// `extra` so a record survives a snapshot round trip unchanged.
struct ChatRecord {
  std::vector<ChatMessage> messages;
  std::string source;
  nlohmann::json extra = nlohmann::json::object();

  [[nodiscard]] bool HasTurns() const { return messages.size() >= 3; }

  // Content of the assistant turn, or nullptr for short records.
  [[nodiscard]] const std::string* AssistantContent() const;
};

// Scraper output. Only the configured content key is interpreted.
struct RawRecord {
  nlohmann::json fields = nlohmann::json::object();

  [[nodiscard]] std::string Text(const std::string& content_key = "text") const;
  [[nodiscard]] std::string StringField(const std::string& key) const;
};

// Throws MalformedInputError when `j` does not match the chat record schema.
ChatRecord ParseChatRecord(const nlohmann::json& j);
ChatRecord ParseChatRecordLine(const std::string& line);

[[nodiscard]] nlohmann::json ToJson(const ChatRecord& record);
[[nodiscard]] std::string ToJsonLine(const ChatRecord& record);

}  // namespace sftcurator
