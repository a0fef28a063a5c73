#include "mcplink/logging/log_sink.h"

#include <cstdio>
#include <iostream>

namespace mcplink {
namespace logging {

// StdioSink

void StdioSink::log(const LogMessage& msg) {
  std::string line = formatter_->format(msg);
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
  stream << line << '\n';
  if (msg.level >= LogLevel::Error) {
    stream.flush();
  }
}

void StdioSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
  stream.flush();
}

// RotatingFileSink

RotatingFileSink::RotatingFileSink(const Config& config) : config_(config) {
  openFile();
}

RotatingFileSink::~RotatingFileSink() {
  flush();
  closeFile();
}

void RotatingFileSink::log(const LogMessage& msg) {
  std::string line = formatter_->format(msg);
  std::lock_guard<std::mutex> lock(mutex_);
  checkRotation();
  if (current_file_ && current_file_->is_open()) {
    *current_file_ << line << '\n';
    current_size_ += line.size() + 1;
  }
}

void RotatingFileSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (current_file_ && current_file_->is_open()) {
    current_file_->flush();
  }
}

void RotatingFileSink::openFile() {
  current_file_ =
      std::make_unique<std::ofstream>(config_.base_filename, std::ios::app);
  current_size_ = 0;
  if (current_file_->is_open()) {
    current_file_->seekp(0, std::ios::end);
    auto pos = current_file_->tellp();
    if (pos > 0) {
      current_size_ = static_cast<size_t>(pos);
    }
    last_rotation_ = std::chrono::system_clock::now();
  }
}

void RotatingFileSink::closeFile() {
  if (current_file_ && current_file_->is_open()) {
    current_file_->close();
  }
  current_file_.reset();
}

void RotatingFileSink::checkRotation() {
  if (current_size_ >= config_.max_file_size) {
    rotate();
    return;
  }

  auto now = std::chrono::system_clock::now();
  if (now - last_rotation_ >= config_.rotation_interval) {
    rotate();
  }
}

void RotatingFileSink::rotate() {
  closeFile();

  // log.N is dropped, log.(N-1) becomes log.N, ... log becomes log.1
  if (config_.max_files == 0) {
    std::remove(config_.base_filename.c_str());
  } else {
    std::string oldest =
        config_.base_filename + "." + std::to_string(config_.max_files);
    std::remove(oldest.c_str());
    for (size_t i = config_.max_files - 1; i > 0; --i) {
      std::string old_name = config_.base_filename + "." + std::to_string(i);
      std::string new_name =
          config_.base_filename + "." + std::to_string(i + 1);
      std::rename(old_name.c_str(), new_name.c_str());
    }

    std::string rotated_name = config_.base_filename + ".1";
    std::rename(config_.base_filename.c_str(), rotated_name.c_str());
  }

  openFile();
}

}  // namespace logging
}  // namespace mcplink
