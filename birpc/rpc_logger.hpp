/*Copyright 2025 He Jia <mofhejia@163.com>. All Rights Reserved.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
==============================================================================*/

#pragma once

#ifndef BIRPC_RPC_LOGGER_HPP_
#define BIRPC_RPC_LOGGER_HPP_

#include <atomic>
#include <iostream>
#include <string_view>

namespace birpc {
namespace rpc {

/**
 * @enum LogLevel
 * @brief Defines the severity levels for log messages.
 */
enum class LogLevel {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  ERROR = 4,
  FATAL = 5
};

/**
 * @class RpcLogger
 * @brief An abstract interface for the diagnostics of the dispatch core.
 *
 * Registration reports excluded methods through it, and the transport-driven
 * call path reports method bodies that failed abnormally. Applications
 * install their own implementation through RpcLoggerManager.
 */
class RpcLogger {
 public:
  virtual ~RpcLogger() = default;

  /**
   * @brief Logs a message at a specific level.
   * @param level The log level of the message.
   * @param message The message to log.
   */
  virtual void log(LogLevel level, std::string_view message) = 0;
  virtual void flush() = 0;

  /**
   * @brief Sets the minimum log level for messages to be recorded.
   * @param level The new minimum log level.
   */
  virtual void set_level(LogLevel level) = 0;
  virtual LogLevel get_level() const = 0;
  /**
   * @brief Checks if a given log level is enabled.
   * @param level The log level to check.
   * @return True if the level is enabled, false otherwise.
   */
  virtual bool should_log(LogLevel level) const = 0;

  /**
   * @brief Gets the output stream for a specific log level.
   * @param level The log level for which to get the stream.
   */
  virtual std::ostream& get_stream(LogLevel level) = 0;

  // State of the current streaming statement.
  virtual void set_current_stream_level(LogLevel level) = 0;
  virtual LogLevel get_current_stream_level() const = 0;
  virtual std::ostream& get_current_stream() = 0;
};

/**
 * @class DefaultRpcLogger
 * @brief Writes WARN and above to `std::cerr` and the lower levels to
 * `std::cout`, dropping everything below the configured level.
 */
class DefaultRpcLogger : public RpcLogger {
 public:
  DefaultRpcLogger() : current_level_(LogLevel::WARN) {}

  void log(LogLevel level, std::string_view message) override {
    if (should_log(level)) {
      get_stream(level) << message;
    }
  }

  void flush() override {
    std::cout.flush();
    std::cerr.flush();
  }

  void set_level(LogLevel level) override {
    current_level_.store(level, std::memory_order_relaxed);
  }

  LogLevel get_level() const override {
    return current_level_.load(std::memory_order_relaxed);
  }

  bool should_log(LogLevel level) const override {
    return static_cast<int>(level) >= static_cast<int>(get_level());
  }

  class NullStreambuf : public std::streambuf {
   protected:
    int overflow(int c) override { return traits_type::not_eof(c); }
    std::streamsize xsputn(const char*, std::streamsize n) override {
      return n;
    }
  };

  std::ostream& get_null_stream() {
    static NullStreambuf s_null_streambuf;
    static std::ostream s_null_stream(&s_null_streambuf);
    return s_null_stream;
  }

  std::ostream& get_stream(LogLevel level) override {
    if (!should_log(level)) {
      return get_null_stream();
    }
    if (static_cast<int>(level) >= static_cast<int>(LogLevel::WARN)) {
      return std::cerr;
    }
    return std::cout;
  }

  // Statements are issued from concurrently running calls, so the level of
  // the statement in progress is kept per thread.
  void set_current_stream_level(LogLevel level) override {
    statement_level() = level;
  }

  LogLevel get_current_stream_level() const override {
    return statement_level();
  }

  std::ostream& get_current_stream() override {
    return get_stream(statement_level());
  }

 private:
  static LogLevel& statement_level() noexcept {
    thread_local LogLevel level = LogLevel::INFO;
    return level;
  }

  std::atomic<LogLevel> current_level_;
};

/**
 * @class RpcLoggerManager
 * @brief A singleton holding the process-wide logger of the dispatch core.
 */
class RpcLoggerManager {
 public:
  static RpcLoggerManager& get_instance() {
    static RpcLoggerManager instance;
    return instance;
  }

  /**
   * @brief Sets the global logger instance. The manager does not take
   * ownership; the logger must outlive every later log statement.
   */
  void set_logger(RpcLogger* logger) { logger_ = logger; }

  RpcLogger* get_logger() { return logger_; }

  void set_default_logger() {
    static DefaultRpcLogger default_logger;
    set_logger(&default_logger);
  }

 private:
  RpcLoggerManager() : logger_(nullptr) { set_default_logger(); }
  RpcLogger* logger_;
};

template <typename T>
RpcLogger& operator<<(RpcLogger& logger, const T& value) {
  if (logger.should_log(logger.get_current_stream_level())) {
    logger.get_current_stream() << value;
  }
  return logger;
}

inline RpcLogger& operator<<(
  RpcLogger& logger, std::ostream& (*manip)(std::ostream&)) {
  if (!logger.should_log(logger.get_current_stream_level())) {
    return logger;
  }
  logger.get_current_stream() << manip;
  if (manip == static_cast<std::ostream& (*)(std::ostream&)>(std::endl)) {
    logger.flush();
  }
  return logger;
}

// Starts a statement at `level`; the following insertions are dropped when
// the level is disabled.
inline RpcLogger& operator<<(RpcLogger& logger, LogLevel level) {
  logger.set_current_stream_level(level);
  return logger;
}

#define BIRPC_LOG \
  (*::birpc::rpc::RpcLoggerManager::get_instance().get_logger())

#define BIRPC_TRACE BIRPC_LOG << ::birpc::rpc::LogLevel::TRACE
#define BIRPC_DEBUG BIRPC_LOG << ::birpc::rpc::LogLevel::DEBUG
#define BIRPC_INFO BIRPC_LOG << ::birpc::rpc::LogLevel::INFO
#define BIRPC_WARN BIRPC_LOG << ::birpc::rpc::LogLevel::WARN
#define BIRPC_ERROR BIRPC_LOG << ::birpc::rpc::LogLevel::ERROR
#define BIRPC_FATAL BIRPC_LOG << ::birpc::rpc::LogLevel::FATAL

}  // namespace rpc
}  // namespace birpc

#endif  // BIRPC_RPC_LOGGER_HPP_
