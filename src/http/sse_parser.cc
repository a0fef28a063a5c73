#include "mcplink/http/sse_parser.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace mcplink {
namespace http {

namespace {

// SSE line ending
constexpr char kLF = '\n';
constexpr char kCR = '\r';

// Field separators
constexpr char kColon = ':';
constexpr char kSpace = ' ';

// Field names
constexpr const char* kDataField = "data";
constexpr const char* kEventField = "event";
constexpr const char* kIdField = "id";
constexpr const char* kRetryField = "retry";

bool isAllDigits(const std::string& str) {
  return !str.empty() &&
         std::all_of(str.begin(), str.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // namespace

SseParser::SseParser(SseParserCallbacks* callbacks) : callbacks_(callbacks) {}

void SseParser::parse(const char* data, size_t length) {
  size_t i = 0;

  // A UTF-8 BOM (EF BB BF) may open the stream
  if (!bom_checked_ && length > 0) {
    const auto* udata = reinterpret_cast<const unsigned char*>(data);
    if (length >= 3 && udata[0] == 0xEF && udata[1] == 0xBB &&
        udata[2] == 0xBF) {
      i = 3;
    }
    bom_checked_ = true;
  }

  if (pending_cr_ && i < length && data[i] == kLF) {
    ++i;
  }
  pending_cr_ = false;

  for (; i < length; ++i) {
    char ch = data[i];

    if (ch == kCR) {
      processLine(line_buffer_);
      line_buffer_.clear();
      if (i + 1 < length) {
        if (data[i + 1] == kLF) {
          ++i;
        }
      } else {
        pending_cr_ = true;
      }
    } else if (ch == kLF) {
      processLine(line_buffer_);
      line_buffer_.clear();
    } else {
      line_buffer_ += ch;
    }
  }
}

void SseParser::reset() {
  line_buffer_.clear();
  current_event_.clear();
  last_event_id_.clear();
  retry_time_ = 3000;
  bom_checked_ = false;
  pending_cr_ = false;
}

void SseParser::flush() {
  if (!line_buffer_.empty()) {
    processLine(line_buffer_);
    line_buffer_.clear();
  }

  if (current_event_.hasContent()) {
    dispatchEvent();
  }
}

void SseParser::processLine(const std::string& line) {
  // Empty line dispatches the event
  if (line.empty()) {
    if (current_event_.hasContent()) {
      dispatchEvent();
    }
    return;
  }

  if (line[0] == kColon) {
    if (callbacks_) {
      callbacks_->onSseComment(line.substr(1));
    }
    return;
  }

  size_t colon_pos = line.find(kColon);

  if (colon_pos == std::string::npos) {
    // No colon - entire line is the field name with empty value
    processField(line, "");
    return;
  }

  std::string field = line.substr(0, colon_pos);
  size_t value_start = colon_pos + 1;
  if (value_start < line.length() && line[value_start] == kSpace) {
    value_start++;
  }
  processField(field, line.substr(std::min(value_start, line.length())));
}

void SseParser::processField(const std::string& name,
                             const std::string& value) {
  if (name == kDataField) {
    if (current_event_.has_data_field) {
      current_event_.data += '\n';
    }
    current_event_.has_data_field = true;
    current_event_.data += value;

  } else if (name == kEventField) {
    current_event_.event = value;

  } else if (name == kIdField) {
    // IDs containing NUL are ignored
    if (value.find('\0') == std::string::npos) {
      current_event_.id = value;
      last_event_id_ = value;
    }

  } else if (name == kRetryField) {
    if (isAllDigits(value)) {
      try {
        uint64_t retry_ms = std::stoull(value);
        current_event_.retry = retry_ms;
        retry_time_ = retry_ms;
      } catch (const std::out_of_range&) {
        // Ignored like any other invalid retry value
      }
    }
  }
  // Unknown fields are ignored
}

void SseParser::dispatchEvent() {
  // Events without a data field only update id and retry
  if (current_event_.has_data_field) {
    if (!current_event_.id.has_value() && !last_event_id_.empty()) {
      current_event_.id = last_event_id_;
    }

    if (callbacks_) {
      callbacks_->onSseEvent(current_event_);
    }
  }

  current_event_.clear();
}

std::string SseEventBuilder::serialize() const {
  std::ostringstream oss;

  if (event_.id.has_value()) {
    oss << "id: " << event_.id.value() << "\n";
  }

  if (event_.event.has_value()) {
    oss << "event: " << event_.event.value() << "\n";
  }

  if (event_.retry.has_value()) {
    oss << "retry: " << event_.retry.value() << "\n";
  }

  // One data line per line of payload
  if (event_.has_data_field) {
    size_t start = 0;
    while (true) {
      size_t end = event_.data.find('\n', start);
      oss << "data: " << event_.data.substr(start, end - start) << "\n";
      if (end == std::string::npos) {
        break;
      }
      start = end + 1;
    }
  }

  oss << "\n";
  return oss.str();
}

}  // namespace http
}  // namespace mcplink
