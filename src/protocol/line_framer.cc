#include "mcplink/protocol/line_framer.h"

#include <cstring>

#define MCPLINK_LOG_COMPONENT "protocol.framer"
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace protocol {

std::vector<std::string> LineFramer::feed(const char* data, size_t len) {
  std::vector<std::string> lines;
  size_t start = 0;

  while (start < len) {
    const char* newline =
        static_cast<const char*>(std::memchr(data + start, '\n', len - start));
    size_t end = newline ? static_cast<size_t>(newline - data) : len;

    if (!discarding_) {
      buffer_.append(data + start, end - start);
      if (buffer_.size() > max_line_length_) {
        MCPLINK_LOG_WARNING("dropping message longer than {} bytes",
                            max_line_length_);
        buffer_.clear();
        discarding_ = true;
        ++dropped_lines_;
      }
    }

    if (!newline) {
      break;
    }

    if (discarding_) {
      discarding_ = false;
    } else {
      completeLine(lines);
    }
    start = end + 1;
  }

  return lines;
}

void LineFramer::completeLine(std::vector<std::string>& lines) {
  if (!buffer_.empty() && buffer_.back() == '\r') {
    buffer_.pop_back();
  }
  if (buffer_.find_first_not_of(" \t") != std::string::npos) {
    lines.push_back(std::move(buffer_));
  }
  buffer_.clear();
}

void LineFramer::reset() {
  buffer_.clear();
  discarding_ = false;
}

std::string LineFramer::frame(const nlohmann::json& message) {
  // dump() never emits raw newlines; embedded ones are escaped
  std::string line = message.dump();
  line.push_back('\n');
  return line;
}

}  // namespace protocol
}  // namespace mcplink
