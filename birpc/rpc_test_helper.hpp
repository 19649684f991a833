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

#ifndef BIRPC_RPC_TEST_HELPER_HPP_
#define BIRPC_RPC_TEST_HELPER_HPP_

#include <cista.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <tuple>
#include <vector>

#include "birpc/rpc_logger.hpp"
#include "birpc/rpc_status.hpp"
#include "birpc/rpc_traits.hpp"
#include "birpc/rpc_types.hpp"
#include "birpc/svc/pending_requests.hpp"

namespace birpc {
namespace rpc {
namespace test {

struct AddArgs {
  int A{};
  int B{};

  auto cista_members() const { return std::tie(A, B); }
};

// Not visible to decoders: no cista_members() and no is_exported<>.
struct HiddenArgs {
  int value{};
};

class Math {
 public:
  static constexpr std::string_view kTypeName = "Math";

  static auto Methods() {
    return std::make_tuple(
      Method("Add", &Math::Add), Method("Div", &Math::Div),
      Method("Sum", &Math::Sum), Method("Fail", &Math::Fail),
      Method("Throw", &Math::Throw));
  }

  std::error_code Add(
    CancellationToken /*ctx*/, ClientConnector /*client*/, AddArgs* args,
    int* reply) const {
    *reply = args->A + args->B;
    return {};
  }

  std::error_code Div(
    const CancellationToken& /*ctx*/, const ClientConnector& /*client*/,
    const AddArgs& args, int* reply) const {
    if (args.B == 0) {
      return make_error_code(RpcErrc::INVALID_ARGUMENT);
    }
    *reply = args.A / args.B;
    return {};
  }

  std::error_code Sum(
    const CancellationToken& /*ctx*/, const ClientConnector& /*client*/,
    std::vector<int> values, int64_t* reply) const {
    *reply = 0;
    for (int v : values) {
      *reply += v;
    }
    return {};
  }

  std::error_code Fail(
    const CancellationToken& /*ctx*/, const ClientConnector& /*client*/,
    int /*arg*/, int* /*reply*/) const {
    return make_error_code(RpcErrc::UNIMPLEMENTED);
  }

  std::error_code Throw(
    const CancellationToken& /*ctx*/, const ClientConnector& /*client*/,
    int arg, int* /*reply*/) const {
    throw RpcException(RpcErrc::INTERNAL, "boom " + std::to_string(arg));
  }
};

/**
 * @brief Records everything logged at or above its level.
 *
 * Installed for the lifetime of the object, the previous logger is restored
 * on destruction. Each thread streams into its own line buffer, which is
 * appended to the record as a whole on flush.
 */
class CapturingLogger : public RpcLogger {
 public:
  explicit CapturingLogger(LogLevel level = LogLevel::WARN)
    : level_(level),
      previous_(RpcLoggerManager::get_instance().get_logger()) {
    RpcLoggerManager::get_instance().set_logger(this);
  }

  ~CapturingLogger() override {
    RpcLoggerManager::get_instance().set_logger(previous_);
  }

  void log(LogLevel level, std::string_view message) override {
    if (should_log(level)) {
      std::lock_guard<std::mutex> lock(mutex_);
      captured_ += message;
    }
  }
  void flush() override {
    std::ostringstream& line = line_buffer();
    std::lock_guard<std::mutex> lock(mutex_);
    captured_ += line.str();
    line.str({});
  }
  void set_level(LogLevel level) override { level_.store(level); }
  LogLevel get_level() const override { return level_.load(); }
  bool should_log(LogLevel level) const override {
    return static_cast<int>(level) >= static_cast<int>(get_level());
  }
  std::ostream& get_stream(LogLevel level) override {
    if (!should_log(level)) {
      std::ostringstream& discarded = discard_buffer();
      discarded.str({});
      return discarded;
    }
    return line_buffer();
  }
  void set_current_stream_level(LogLevel level) override {
    statement_level() = level;
  }
  LogLevel get_current_stream_level() const override {
    return statement_level();
  }
  std::ostream& get_current_stream() override {
    return get_stream(statement_level());
  }

  std::string contents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return captured_;
  }

  // Number of non-overlapping occurrences of `needle` in the record.
  size_t count(std::string_view needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (size_t pos = captured_.find(needle); pos != std::string::npos;
         pos = captured_.find(needle, pos + needle.size())) {
      ++n;
    }
    return n;
  }

 private:
  static LogLevel& statement_level() noexcept {
    thread_local LogLevel level = LogLevel::INFO;
    return level;
  }
  static std::ostringstream& line_buffer() {
    thread_local std::ostringstream line;
    return line;
  }
  static std::ostringstream& discard_buffer() {
    thread_local std::ostringstream discarded;
    return discarded;
  }

  std::atomic<LogLevel> level_;
  RpcLogger* previous_;
  mutable std::mutex mutex_;
  std::string captured_;
};

// PendingRequests that counts how it is driven.
class CountingPendingTable {
 public:
  CancellationToken Start(sequence_id_t seq) {
    ++starts;
    return table.Start(seq);
  }

  bool Cancel(sequence_id_t seq) {
    ++cancels;
    bool released = table.Cancel(seq);
    if (released) {
      ++releases;
    }
    return released;
  }

  svc::PendingRequests table;
  std::atomic<int> starts{0};
  std::atomic<int> cancels{0};
  std::atomic<int> releases{0};
};

struct RecordedResponse {
  std::string service_method;
  uint64_t seq{};
  std::string error;
  bool has_reply{false};
};

/**
 * @brief Codec writing length-prefixed frames into one shared byte stream.
 *
 * A frame is the 8-byte sequence id, the 4-byte body length and the body.
 * Bodies are cista serialized `data::string` replies or raw `int` replies;
 * other replies produce an empty body. Bytes are appended one by one so that writes that
 * are not serialized by the caller interleave visibly.
 */
class FramingCodec {
 public:
  std::error_code WriteResponse(
    const Response& resp, const ValueHolder& reply) {
    std::vector<uint8_t> body;
    if (const auto* text = reply.Get<data::string>(); text != nullptr) {
      auto buf = cista::serialize(*text);
      body.assign(buf.begin(), buf.end());
    } else if (const auto* number = reply.Get<int>(); number != nullptr) {
      body.resize(sizeof(int));
      std::memcpy(body.data(), number, sizeof(int));
    }
    const uint64_t seq = resp.seq.v_;
    const auto length = static_cast<uint32_t>(body.size());
    uint8_t header[sizeof(seq) + sizeof(length)];
    std::memcpy(header, &seq, sizeof(seq));
    std::memcpy(header + sizeof(seq), &length, sizeof(length));
    for (uint8_t byte : header) {
      wire.push_back(byte);
      std::this_thread::yield();
    }
    for (uint8_t byte : body) {
      wire.push_back(byte);
      std::this_thread::yield();
    }
    return {};
  }

  std::vector<uint8_t> wire;
};

// Splits FramingCodec output back into (seq, body) frames.
inline std::vector<std::pair<uint64_t, std::vector<uint8_t>>> SplitFrames(
  const std::vector<uint8_t>& wire) {
  std::vector<std::pair<uint64_t, std::vector<uint8_t>>> frames;
  size_t pos = 0;
  while (pos + sizeof(uint64_t) + sizeof(uint32_t) <= wire.size()) {
    uint64_t seq = 0;
    uint32_t length = 0;
    std::memcpy(&seq, wire.data() + pos, sizeof(seq));
    pos += sizeof(seq);
    std::memcpy(&length, wire.data() + pos, sizeof(length));
    pos += sizeof(length);
    if (pos + length > wire.size()) {
      break;
    }
    frames.emplace_back(
      seq, std::vector<uint8_t>(
             wire.begin() + static_cast<std::ptrdiff_t>(pos),
             wire.begin() + static_cast<std::ptrdiff_t>(pos + length)));
    pos += length;
  }
  return frames;
}

// Response sink recording what the dispatcher hands to the transport.
class RecordingSink {
 public:
  void SendResponse(
    std::mutex& sending, const Request& req, const ValueHolder& reply,
    const ServerCodec& codec, std::string_view errmsg) {
    std::lock_guard<std::mutex> lock(sending);
    Response resp{
      .service_method = req.service_method,
      .seq = req.seq,
      .error = std::string(errmsg),
    };
    write_errors.push_back(codec->WriteResponse(resp, reply));
    responses.push_back(RecordedResponse{
      .service_method = req.service_method,
      .seq = req.seq.v_,
      .error = std::string(errmsg),
      .has_reply = reply.has_value(),
    });
  }

  void FreeRequest(Request& req) {
    std::lock_guard<std::mutex> lock(freed_mutex);
    freed.push_back(req.seq.v_);
  }

  // Guarded by the `sending` mutex of the ServeContext.
  std::vector<RecordedResponse> responses;
  std::vector<std::error_code> write_errors;

  std::mutex freed_mutex;
  std::vector<uint64_t> freed;
};

// Waits up to `timeout` for `pred` to hold.
template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

}  // namespace test
}  // namespace rpc
}  // namespace birpc

#endif  // BIRPC_RPC_TEST_HELPER_HPP_
