#ifndef MCPLINK_PROTOCOL_LINE_FRAMER_H
#define MCPLINK_PROTOCOL_LINE_FRAMER_H

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcplink {
namespace protocol {

/**
 * Splits a byte stream into newline terminated messages.
 *
 * Each message is one line; a trailing '\r' is stripped and blank lines
 * are skipped. A partial line is held until the rest arrives. A line that
 * grows past the limit is discarded up to its terminating newline so one
 * runaway message cannot exhaust memory.
 */
class LineFramer {
 public:
  static constexpr size_t kDefaultMaxLineLength = 16 * 1024 * 1024;

  explicit LineFramer(size_t max_line_length = kDefaultMaxLineLength)
      : max_line_length_(max_line_length) {}

  // Returns every line completed by this chunk, in order
  std::vector<std::string> feed(const char* data, size_t len);
  std::vector<std::string> feed(const std::string& data) {
    return feed(data.data(), data.size());
  }

  // Bytes of the incomplete line held so far
  size_t buffered() const { return buffer_.size(); }

  // Lines dropped for exceeding the limit
  size_t droppedLines() const { return dropped_lines_; }

  void reset();

  // Serializes one message as a single line
  static std::string frame(const nlohmann::json& message);

 private:
  void completeLine(std::vector<std::string>& lines);

  size_t max_line_length_;
  std::string buffer_;
  bool discarding_{false};
  size_t dropped_lines_{0};
};

}  // namespace protocol
}  // namespace mcplink

#endif  // MCPLINK_PROTOCOL_LINE_FRAMER_H
