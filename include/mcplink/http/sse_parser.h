#ifndef MCPLINK_HTTP_SSE_PARSER_H
#define MCPLINK_HTTP_SSE_PARSER_H

#include <cstdint>
#include <memory>
#include <string>

#include "mcplink/core/compat.h"

namespace mcplink {
namespace http {

/**
 * Server-Sent Event structure
 */
struct SseEvent {
  optional<std::string> id;     // Event ID for resumption
  optional<std::string> event;  // Event type, "message" when absent
  std::string data;             // Event data (can be multiline)
  optional<uint64_t> retry;     // Reconnection time in milliseconds
  bool has_data_field{false};

  void clear() {
    id.reset();
    event.reset();
    data.clear();
    retry.reset();
    has_data_field = false;
  }

  bool hasContent() const {
    return has_data_field || id.has_value() || event.has_value() ||
           retry.has_value();
  }

  const std::string& type() const {
    static const std::string kMessage = "message";
    return event.has_value() && !event->empty() ? *event : kMessage;
  }
};

/**
 * SSE parser callbacks
 */
class SseParserCallbacks {
 public:
  virtual ~SseParserCallbacks() = default;

  /**
   * Called when a complete SSE event is parsed
   */
  virtual void onSseEvent(const SseEvent& event) = 0;

  /**
   * Called when a comment is encountered
   */
  virtual void onSseComment(const std::string& /*comment*/) {}
};

/**
 * Server-Sent Events parser
 *
 * Parses the event stream format of the W3C specification:
 * https://html.spec.whatwg.org/multipage/server-sent-events.html
 *
 * Input may be split at any byte, including between the CR and LF of a
 * CRLF pair.
 *
 * Thread-safety: Parser instances are not thread-safe
 */
class SseParser {
 public:
  /**
   * Create SSE parser
   * @param callbacks Callbacks to invoke for events, not owned
   */
  explicit SseParser(SseParserCallbacks* callbacks);

  /**
   * Parse SSE data. All bytes are consumed; an incomplete trailing line is
   * kept until the next call.
   */
  void parse(const char* data, size_t length);
  void parse(const std::string& data) { parse(data.data(), data.size()); }

  /**
   * Reset parser state for a new stream
   */
  void reset();

  /**
   * Force dispatch of any pending event at end of stream
   */
  void flush();

  /**
   * Get last event ID (for reconnection)
   */
  const std::string& lastEventId() const { return last_event_id_; }

  /**
   * Get retry time in milliseconds
   */
  uint64_t retryTime() const { return retry_time_; }

 private:
  void processLine(const std::string& line);
  void processField(const std::string& name, const std::string& value);
  void dispatchEvent();

  SseParserCallbacks* callbacks_;
  std::string line_buffer_;
  SseEvent current_event_;
  std::string last_event_id_;
  uint64_t retry_time_{3000};  // Default 3 seconds
  bool bom_checked_{false};
  // Previous chunk ended in CR; a leading LF in the next one is its pair
  bool pending_cr_{false};
};

using SseParserPtr = std::unique_ptr<SseParser>;

/**
 * SSE event builder, used to produce event streams
 */
class SseEventBuilder {
 public:
  SseEventBuilder& withId(const std::string& id) {
    event_.id = id;
    return *this;
  }

  SseEventBuilder& withEvent(const std::string& event) {
    event_.event = event;
    return *this;
  }

  SseEventBuilder& withData(const std::string& data) {
    event_.data = data;
    event_.has_data_field = true;
    return *this;
  }

  SseEventBuilder& withRetry(uint64_t retry_ms) {
    event_.retry = retry_ms;
    return *this;
  }

  SseEvent build() const { return event_; }

  // Serialize to SSE wire format, terminated by a blank line
  std::string serialize() const;

 private:
  SseEvent event_;
};

}  // namespace http
}  // namespace mcplink

#endif  // MCPLINK_HTTP_SSE_PARSER_H
