#pragma once

#include <string>

#include "mcplink/logging/log_message.h"

namespace mcplink {
namespace logging {

// Base formatter interface
class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// Single line human readable format
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// JSON formatter for structured logging, one object per line
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

}  // namespace logging
}  // namespace mcplink
