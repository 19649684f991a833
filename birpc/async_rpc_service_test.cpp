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

#include "birpc/async_rpc_service.hpp"

#include <gtest/gtest.h>

#include <cista.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <unifex/static_thread_pool.hpp>
#include <unifex/sync_wait.hpp>
#include <unifex/v2/async_scope.hpp>

#include "birpc/rpc_service_registry.hpp"
#include "birpc/rpc_test_helper.hpp"
#include "birpc/rpc_types.hpp"
#include "birpc/rpc_value_factory.hpp"
#include "birpc/svc/cancel_service.hpp"
#include "birpc/utils/wait_group.hpp"

using unifex::static_thread_pool;
using unifex::sync_wait;

namespace birpc {
namespace rpc {

namespace {

class Echo {
 public:
  static constexpr std::string_view kTypeName = "Echo";
  static auto Methods() {
    return std::make_tuple(
      Method("Echo", &Echo::Repeat), Method("Block", &Echo::Block));
  }

  std::error_code Repeat(
    const CancellationToken&, const ClientConnector&, const data::string& arg,
    data::string* reply) const {
    std::string out;
    for (int i = 0; i < 8; ++i) {
      out += arg.str();
    }
    *reply = data::string{out};
    return {};
  }

  std::error_code Block(
    const CancellationToken& ctx, const ClientConnector&, int,
    data::string* reply) const {
    const bool cancelled = test::WaitFor(
      [&ctx] { return ctx.stop_requested(); }, std::chrono::seconds(10));
    *reply = data::string{cancelled ? "stopped" : "timeout"};
    return cancelled ? make_error_code(RpcErrc::CANCELLED) : std::error_code{};
  }
};

std::string Payload(uint64_t seq) {
  return "call-" + std::to_string(seq) + ";";
}

std::string Expected(uint64_t seq) {
  std::string out;
  for (int i = 0; i < 8; ++i) {
    out += Payload(seq);
  }
  return out;
}

}  // namespace

class AsyncRpcServiceTest : public ::testing::Test {
 protected:
  AsyncRpcServiceTest()
    : ctx{
        .sink = ResponseSink{&sink},
        .sending = &sending,
        .pending = PendingTable{&pending},
        .wg = &wg,
        .codec = ServerCodec{&codec},
      } {
    EXPECT_TRUE(registry.Register(Echo{}).has_value());
  }

  ServiceRegistry registry;
  test::RecordingSink sink;
  test::FramingCodec codec;
  test::CountingPendingTable pending;
  std::mutex sending;
  utils::WaitGroup wg;
  ServeContext ctx;
  static_thread_pool pool{4};
  unifex::v2::async_scope scope;
};

TEST_F(AsyncRpcServiceTest, ConcurrentCallsEachProduceOneIntactResponse) {
  constexpr uint64_t kCalls = 64;
  std::vector<Request> requests(kCalls);
  auto method = registry.Lookup("Echo.Echo");
  ASSERT_TRUE(method.has_value());

  for (uint64_t seq = 0; seq < kCalls; ++seq) {
    requests[seq] =
      Request{.service_method = "Echo.Echo", .seq = sequence_id_t{seq}};
    auto [arg, is_value] = MakeArgument(**method);
    *arg.Get<data::string>() = data::string{Payload(seq)};
    SpawnServe(
      pool.get_scheduler(), scope, registry, ctx, requests[seq],
      std::move(arg), MakeReply(**method), {});
  }
  sync_wait(scope.join());
  wg.Wait();

  auto frames = test::SplitFrames(codec.wire);
  ASSERT_EQ(frames.size(), kCalls);
  std::set<uint64_t> seen;
  for (auto& [seq, body] : frames) {
    ASSERT_LT(seq, kCalls);
    EXPECT_TRUE(seen.insert(seq).second) << "duplicate response " << seq;
    auto* text = cista::deserialize<data::string>(body);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->str(), Expected(seq));
  }
  EXPECT_EQ(sink.responses.size(), kCalls);
  EXPECT_EQ(sink.freed.size(), kCalls);
  EXPECT_EQ(pending.releases.load(), static_cast<int>(kCalls));
  EXPECT_EQ(pending.table.Size(), 0u);
  EXPECT_EQ(wg.Count(), 0);
}

TEST_F(AsyncRpcServiceTest, DetachedCallIsCancelledThroughMetaService) {
  Request blocked{.service_method = "Echo.Block", .seq = sequence_id_t{500}};
  auto block = registry.Lookup("Echo.Block");
  ASSERT_TRUE(block.has_value());
  auto [arg, is_value] = MakeArgument(**block);
  SpawnServe(
    pool.get_scheduler(), scope, registry, ctx, blocked, std::move(arg),
    MakeReply(**block), {});

  ASSERT_TRUE(test::WaitFor(
    [&] { return pending.table.IsPending(sequence_id_t{500}); },
    std::chrono::seconds(5)));

  Request cancel{.service_method = "_birpc_.Cancel", .seq = sequence_id_t{501}};
  auto cancel_method = registry.Lookup(cancel.service_method);
  ASSERT_TRUE(cancel_method.has_value());
  auto [cancel_arg, cancel_is_value] = MakeArgument(**cancel_method);
  cancel_arg.Get<svc::CancelArgs>()->seq = 500;
  SpawnServe(
    pool.get_scheduler(), scope, registry, ctx, cancel, std::move(cancel_arg),
    MakeReply(**cancel_method), {});

  sync_wait(scope.join());
  wg.Wait();

  ASSERT_EQ(sink.responses.size(), 2u);
  for (const auto& resp : sink.responses) {
    if (resp.seq == 500) {
      EXPECT_EQ(resp.error, make_error_code(RpcErrc::CANCELLED).message());
    } else {
      EXPECT_EQ(resp.error, "");
    }
  }
  EXPECT_EQ(pending.releases.load(), 2);
  EXPECT_EQ(pending.table.Size(), 0u);
}

TEST_F(AsyncRpcServiceTest, UnknownServiceStillAnswersAndCompletes) {
  Request req{.service_method = "Nowhere.Echo", .seq = sequence_id_t{9}};
  SpawnServe(
    pool.get_scheduler(), scope, registry, ctx, req, ValueHolder{},
    ValueHolder{}, {});
  sync_wait(scope.join());
  wg.Wait();

  ASSERT_EQ(sink.responses.size(), 1u);
  EXPECT_EQ(sink.responses[0].error, "birpc: can't find service: Nowhere.Echo");
  EXPECT_EQ(sink.freed, std::vector<uint64_t>{9});
}

TEST_F(AsyncRpcServiceTest, CallSpawnedIntoClosedScopeIsStillAnswered) {
  sync_wait(scope.join());

  Request req{.service_method = "Echo.Echo", .seq = sequence_id_t{77}};
  auto method = registry.Lookup(req.service_method);
  ASSERT_TRUE(method.has_value());
  auto [arg, is_value] = MakeArgument(**method);
  {
    test::CapturingLogger logger;
    SpawnServe(
      pool.get_scheduler(), scope, registry, ctx, req, std::move(arg),
      MakeReply(**method), {});
    wg.Wait();
    EXPECT_NE(
      logger.contents().find("dropped before it started"), std::string::npos);
  }

  ASSERT_EQ(sink.responses.size(), 1u);
  EXPECT_EQ(sink.responses[0].seq, 77u);
  EXPECT_EQ(
    sink.responses[0].error,
    "birpc: call dropped before it started: Echo.Echo");
  EXPECT_FALSE(sink.responses[0].has_reply);
  EXPECT_EQ(sink.freed, std::vector<uint64_t>{77});
  EXPECT_EQ(pending.starts.load(), 0);
  EXPECT_EQ(wg.Count(), 0);
}

TEST_F(AsyncRpcServiceTest, ConcurrentFailuresAreEachLogged) {
  ASSERT_TRUE(registry.Register(test::Math{}).has_value());
  auto method = registry.Lookup("Math.Throw");
  ASSERT_TRUE(method.has_value());

  constexpr uint64_t kCalls = 32;
  std::vector<Request> requests(kCalls);
  {
    test::CapturingLogger logger(LogLevel::ERROR);
    for (uint64_t seq = 0; seq < kCalls; ++seq) {
      requests[seq] =
        Request{.service_method = "Math.Throw", .seq = sequence_id_t{seq}};
      auto [arg, is_value] = MakeArgument(**method);
      *arg.Get<int>() = static_cast<int>(seq);
      SpawnServe(
        pool.get_scheduler(), scope, registry, ctx, requests[seq],
        std::move(arg), MakeReply(**method), {});
    }
    sync_wait(scope.join());
    wg.Wait();

    EXPECT_EQ(logger.count("birpc: method Math.Throw failed:"), kCalls);
    std::istringstream lines(logger.contents());
    size_t line_count = 0;
    for (std::string line; std::getline(lines, line);) {
      ++line_count;
      EXPECT_EQ(line.rfind("birpc: method Math.Throw failed: boom ", 0), 0u)
        << line;
    }
    EXPECT_EQ(line_count, kCalls);
  }

  ASSERT_EQ(sink.responses.size(), kCalls);
  for (const auto& resp : sink.responses) {
    EXPECT_NE(
      resp.error.find("birpc: method Math.Throw failed:"), std::string::npos);
  }
  EXPECT_EQ(pending.releases.load(), static_cast<int>(kCalls));
  EXPECT_EQ(wg.Count(), 0);
}

}  // namespace rpc
}  // namespace birpc
