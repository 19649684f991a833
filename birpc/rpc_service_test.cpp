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

#include "birpc/rpc_service.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <tuple>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include "birpc/rpc_test_helper.hpp"
#include "birpc/rpc_types.hpp"
#include "birpc/rpc_value_factory.hpp"
#include "birpc/utils/wait_group.hpp"

namespace birpc {
namespace rpc {

namespace {

// No declared type name.
class Anonymous {
 public:
  static auto Methods() {
    return std::make_tuple(Method("Ping", &Anonymous::Ping));
  }
  std::error_code Ping(
    const CancellationToken&, const ClientConnector&, int arg,
    int* reply) const {
    *reply = arg;
    return {};
  }
};

class Lowercase : public Anonymous {
 public:
  static constexpr std::string_view kTypeName = "lowercase";
};

// The only method lacks the cancellation token.
class NoToken {
 public:
  static constexpr std::string_view kTypeName = "NoToken";
  static auto Methods() {
    return std::make_tuple(Method("Run", &NoToken::Run));
  }
  std::error_code Run(
    int /*ctx*/, const ClientConnector&, int, int*) const {
    return {};
  }
};

// Only mutating methods: callable through a shared receiver only.
class Counter {
 public:
  static constexpr std::string_view kTypeName = "Counter";
  static auto Methods() {
    return std::make_tuple(Method("Incr", &Counter::Incr));
  }
  std::error_code Incr(
    const CancellationToken&, const ClientConnector&, int by, int* reply) {
    value_ += by;
    *reply = value_;
    return {};
  }

 private:
  int value_{0};
};

// Pending table whose release step fails.
struct ThrowingPendingTable {
  CancellationToken Start(sequence_id_t seq) { return table.Start(seq); }
  bool Cancel(sequence_id_t seq) {
    table.Cancel(seq);
    throw RpcException(RpcErrc::INTERNAL, "release failed");
  }

  svc::PendingRequests table;
};

// Reports whether the call was cancelled before it ran.
class StopWatch {
 public:
  static constexpr std::string_view kTypeName = "StopWatch";
  static auto Methods() {
    return std::make_tuple(Method("Stopped", &StopWatch::Stopped));
  }
  std::error_code Stopped(
    const CancellationToken& ctx, const ClientConnector&, int,
    bool* reply) const {
    *reply = ctx.get_token().stop_requested();
    return {};
  }
};

Service MustRegisterMath() {
  auto service = Service::New(test::Math{});
  EXPECT_TRUE(service.has_value());
  return std::move(*service);
}

}  // namespace

TEST(ServiceRegisterTest, ValueReceiverUsesItsTypeName) {
  auto service = Service::New(test::Math{}, "", false);
  ASSERT_TRUE(service.has_value()) << service.error().what;
  EXPECT_EQ(service->name(), "Math");
  EXPECT_EQ(service->MethodCount(), 5u);
  EXPECT_EQ(
    service->MethodNames(),
    (std::vector<std::string>{"Add", "Div", "Fail", "Sum", "Throw"}));
  EXPECT_TRUE(service->HasMethod("Add"));
  EXPECT_FALSE(service->HasMethod("add"));
}

TEST(ServiceRegisterTest, ExplicitNameIsUsedVerbatim) {
  auto service = Service::New(test::Math{}, "calc", true);
  ASSERT_TRUE(service.has_value());
  EXPECT_EQ(service->name(), "calc");
}

TEST(ServiceRegisterTest, EmptyNameIsRejected) {
  auto service = Service::New(Anonymous{}, "", false);
  ASSERT_FALSE(service.has_value());
  EXPECT_EQ(service.error().status, make_error_code(RegisterErrc::NoServiceName));

  auto explicit_empty = Service::New(test::Math{}, "", true);
  ASSERT_FALSE(explicit_empty.has_value());
  EXPECT_EQ(
    explicit_empty.error().status,
    make_error_code(RegisterErrc::NoServiceName));
}

TEST(ServiceRegisterTest, UnexportedTypeNameNeedsExplicitName) {
  auto service = Service::New(Lowercase{});
  ASSERT_FALSE(service.has_value());
  EXPECT_EQ(
    service.error().status, make_error_code(RegisterErrc::TypeNotExported));
  EXPECT_NE(service.error().what.find("lowercase"), std::string::npos);

  auto named = Service::New(Lowercase{}, "lowercase", true);
  ASSERT_TRUE(named.has_value());
  EXPECT_EQ(named->name(), "lowercase");
}

TEST(ServiceRegisterTest, MissingTokenLeavesNoSuitableMethods) {
  test::CapturingLogger logger;
  auto service = Service::New(NoToken{});
  ASSERT_FALSE(service.has_value());
  EXPECT_EQ(
    service.error().status, make_error_code(RegisterErrc::NoSuitableMethods));
  EXPECT_FALSE(service.error().pointer_receiver_hint);
  EXPECT_NE(logger.contents().find("\"Run\""), std::string::npos);
}

TEST(ServiceRegisterTest, ValueReceiverGetsPointerHint) {
  auto by_value = Service::New(Counter{});
  ASSERT_FALSE(by_value.has_value());
  EXPECT_TRUE(by_value.error().pointer_receiver_hint);
  EXPECT_NE(by_value.error().what.find("hint"), std::string::npos);

  auto by_pointer = Service::New(std::make_shared<Counter>());
  ASSERT_TRUE(by_pointer.has_value());
  int reply = 0;
  int by = 3;
  EXPECT_FALSE(by_pointer->Call({}, {}, "Counter.Incr", by, &reply));
  EXPECT_FALSE(by_pointer->Call({}, {}, "Counter.Incr", by, &reply));
  EXPECT_EQ(reply, 6);
}

TEST(ServiceRegisterTest, NullSharedReceiverIsRejected) {
  auto service = Service::New(std::shared_ptr<Counter>{});
  ASSERT_FALSE(service.has_value());
  EXPECT_EQ(
    service.error().status, make_error_code(RegisterErrc::NullReceiver));
  EXPECT_NE(
    service.error().status, make_error_code(RegisterErrc::NoSuitableMethods));
}

TEST(ServiceRegisterTest, ReceiverTypeIsRecorded) {
  Service math = MustRegisterMath();
  EXPECT_EQ(math.receiver_type(), std::type_index(typeid(test::Math)));

  auto counter = Service::New(std::make_shared<Counter>());
  ASSERT_TRUE(counter.has_value());
  EXPECT_EQ(counter->receiver_type(), std::type_index(typeid(Counter)));
}

TEST(ServiceCallTest, AddReturnsSum) {
  Service service = MustRegisterMath();
  test::AddArgs args{.A = 2, .B = 3};
  int reply = 0;
  std::error_code ec = service.Call({}, {}, "Math.Add", &args, &reply);
  EXPECT_FALSE(ec) << ec.message();
  EXPECT_EQ(reply, 5);
}

TEST(ServiceCallTest, ValueArgumentsAndTemporaries) {
  Service service = MustRegisterMath();
  int reply = 0;
  EXPECT_FALSE(
    service.Call({}, {}, "Math.Div", test::AddArgs{.A = 9, .B = 3}, &reply));
  EXPECT_EQ(reply, 3);

  int64_t total = 0;
  std::vector<int> values{1, 2, 3, 4};
  EXPECT_FALSE(service.Call({}, {}, "Math.Sum", values, &total));
  EXPECT_EQ(total, 10);
}

TEST(ServiceCallTest, MethodErrorIsReturnedUnmodified) {
  Service service = MustRegisterMath();
  int reply = 0;
  EXPECT_EQ(
    service.Call({}, {}, "Math.Div", test::AddArgs{.A = 1, .B = 0}, &reply),
    make_error_code(RpcErrc::INVALID_ARGUMENT));
}

TEST(ServiceCallTest, AddressErrors) {
  Service service = MustRegisterMath();
  int arg = 0;
  int reply = 0;
  EXPECT_EQ(
    service.Call({}, {}, "Math", arg, &reply),
    make_error_code(DispatchErrc::IllFormedAddress));
  EXPECT_EQ(
    service.Call({}, {}, "Other.Add", arg, &reply),
    make_error_code(DispatchErrc::UnknownService));
  EXPECT_EQ(
    service.Call({}, {}, "Math.Nope", arg, &reply),
    make_error_code(DispatchErrc::UnknownMethod));
  EXPECT_EQ(
    service.Call({}, {}, "Outer.Math.Add", arg, &reply),
    make_error_code(DispatchErrc::UnknownService));
}

TEST(ServiceCallTest, WrongArgumentTypeIsRejected) {
  Service service = MustRegisterMath();
  int wrong = 1;
  int reply = 0;
  EXPECT_EQ(
    service.Call({}, {}, "Math.Add", wrong, &reply),
    make_error_code(DispatchErrc::ArgumentTypeMismatch));
}

TEST(ServiceCallTest, ThrowingMethodPropagatesOnDirectPath) {
  Service service = MustRegisterMath();
  int arg = 1;
  int reply = 0;
  EXPECT_THROW(service.Call({}, {}, "Math.Throw", arg, &reply), RpcException);
}

TEST(ServiceCallTest, TokenIsPassedThrough) {
  auto service = Service::New(StopWatch{});
  ASSERT_TRUE(service.has_value());
  CancellationSource source;
  int arg = 0;
  bool stopped = true;
  EXPECT_FALSE(
    service->Call(source.token(), {}, "StopWatch.Stopped", arg, &stopped));
  EXPECT_FALSE(stopped);

  source.Cancel();
  EXPECT_FALSE(
    service->Call(source.token(), {}, "StopWatch.Stopped", arg, &stopped));
  EXPECT_TRUE(stopped);
}

TEST(ServiceCallTest, DefaultTokenCannotBeStopped) {
  CancellationToken token;
  EXPECT_FALSE(token.stop_possible());
  EXPECT_FALSE(token.get_token().stop_possible());

  CancellationSource source;
  EXPECT_TRUE(source.token().get_token().stop_possible());
}

class ServiceServeTest : public ::testing::Test {
 protected:
  ServiceServeTest()
    : service(MustRegisterMath()),
      ctx{
        .sink = ResponseSink{&sink},
        .sending = &sending,
        .pending = PendingTable{&pending},
        .wg = &wg,
        .codec = ServerCodec{&codec},
      } {}

  // Serves `addr` the way a transport would after decoding `arg`.
  void ServeWith(Request& req, ValueHolder arg, ValueHolder reply) {
    wg.Add(1);
    service.Serve(ctx, req, std::move(arg), std::move(reply), {});
  }

  test::RecordingSink sink;
  test::FramingCodec codec;
  test::CountingPendingTable pending;
  std::mutex sending;
  utils::WaitGroup wg;
  Service service;
  ServeContext ctx;
};

TEST_F(ServiceServeTest, SuccessfulCallProducesOneResponse) {
  Request req{.service_method = "Math.Add", .seq = sequence_id_t{42}};
  const MethodDescriptor* add = service.FindMethod("Add");
  ASSERT_NE(add, nullptr);
  auto [arg, is_value] = MakeArgument(*add);
  EXPECT_FALSE(is_value);
  arg.Get<test::AddArgs>()->A = 20;
  arg.Get<test::AddArgs>()->B = 22;

  ServeWith(req, std::move(arg), MakeReply(*add));

  ASSERT_EQ(sink.responses.size(), 1u);
  EXPECT_EQ(sink.responses[0].seq, 42u);
  EXPECT_EQ(sink.responses[0].error, "");
  EXPECT_TRUE(sink.responses[0].has_reply);
  EXPECT_EQ(sink.freed, std::vector<uint64_t>{42});
  EXPECT_EQ(wg.Count(), 0);
  EXPECT_EQ(pending.starts.load(), 1);
  EXPECT_EQ(pending.releases.load(), 1);
  EXPECT_EQ(pending.table.Size(), 0u);

  auto frames = test::SplitFrames(codec.wire);
  ASSERT_EQ(frames.size(), 1u);
  ASSERT_EQ(frames[0].second.size(), sizeof(int));
  int body = 0;
  std::memcpy(&body, frames[0].second.data(), sizeof(int));
  EXPECT_EQ(body, 42);
}

TEST_F(ServiceServeTest, MethodErrorStillForwardsReply) {
  Request req{.service_method = "Math.Div", .seq = sequence_id_t{1}};
  const MethodDescriptor* div = service.FindMethod("Div");
  auto [arg, is_value] = MakeArgument(*div);
  EXPECT_TRUE(is_value);

  ServeWith(req, std::move(arg), MakeReply(*div));

  ASSERT_EQ(sink.responses.size(), 1u);
  EXPECT_EQ(
    sink.responses[0].error,
    make_error_code(RpcErrc::INVALID_ARGUMENT).message());
  EXPECT_TRUE(sink.responses[0].has_reply);
  EXPECT_EQ(pending.releases.load(), 1);
  EXPECT_EQ(wg.Count(), 0);
}

TEST_F(ServiceServeTest, UnknownMethodBecomesErrorResponse) {
  Request req{.service_method = "Math.Nope", .seq = sequence_id_t{5}};
  ServeWith(req, ValueHolder{}, ValueHolder{});

  ASSERT_EQ(sink.responses.size(), 1u);
  EXPECT_EQ(sink.responses[0].error, "birpc: can't find method: Math.Nope");
  EXPECT_FALSE(sink.responses[0].has_reply);
  EXPECT_EQ(sink.freed, std::vector<uint64_t>{5});
  EXPECT_EQ(pending.starts.load(), 0);
  EXPECT_EQ(wg.Count(), 0);
}

TEST_F(ServiceServeTest, IllFormedAddressBecomesErrorResponse) {
  Request req{.service_method = "MathAdd", .seq = sequence_id_t{6}};
  ServeWith(req, ValueHolder{}, ValueHolder{});

  ASSERT_EQ(sink.responses.size(), 1u);
  EXPECT_EQ(
    sink.responses[0].error, "birpc: service/method request ill-formed: MathAdd");
}

TEST_F(ServiceServeTest, ThrowingMethodIsReleasedAndAnswered) {
  test::CapturingLogger logger;
  Request req{.service_method = "Math.Throw", .seq = sequence_id_t{9}};
  const MethodDescriptor* method = service.FindMethod("Throw");
  auto [arg, is_value] = MakeArgument(*method);
  *arg.Get<int>() = 7;

  ServeWith(req, std::move(arg), MakeReply(*method));

  ASSERT_EQ(sink.responses.size(), 1u);
  EXPECT_NE(
    sink.responses[0].error.find("birpc: method Math.Throw failed:"),
    std::string::npos);
  EXPECT_NE(sink.responses[0].error.find("boom 7"), std::string::npos);
  EXPECT_EQ(pending.releases.load(), 1);
  EXPECT_EQ(pending.table.Size(), 0u);
  EXPECT_EQ(sink.freed.size(), 1u);
  EXPECT_EQ(wg.Count(), 0);
  EXPECT_NE(logger.contents().find("Math.Throw"), std::string::npos);
}

TEST_F(ServiceServeTest, WorksWithoutPendingTableOrWaitGroup) {
  ServeContext bare{
    .sink = ResponseSink{&sink},
    .sending = &sending,
    .codec = ServerCodec{&codec},
  };
  Request req{.service_method = "Math.Fail", .seq = sequence_id_t{3}};
  const MethodDescriptor* fail = service.FindMethod("Fail");
  auto [arg, is_value] = MakeArgument(*fail);
  service.Serve(bare, req, std::move(arg), MakeReply(*fail), {});

  ASSERT_EQ(sink.responses.size(), 1u);
  EXPECT_EQ(
    sink.responses[0].error,
    make_error_code(RpcErrc::UNIMPLEMENTED).message());
  EXPECT_EQ(pending.starts.load(), 0);
}

TEST_F(ServiceServeTest, MissingWaitGroupAddIsLoggedNotFatal) {
  test::CapturingLogger logger;
  Request req{.service_method = "Math.Add", .seq = sequence_id_t{13}};
  const MethodDescriptor* add = service.FindMethod("Add");
  auto [arg, is_value] = MakeArgument(*add);

  service.Serve(ctx, req, std::move(arg), MakeReply(*add), {});

  ASSERT_EQ(sink.responses.size(), 1u);
  EXPECT_EQ(sink.responses[0].error, "");
  EXPECT_EQ(wg.Count(), 0);
  EXPECT_NE(
    logger.contents().find("without a matching WaitGroup::Add"),
    std::string::npos);
}

TEST_F(ServiceServeTest, ThrowingPendingReleaseStillAnswers) {
  test::CapturingLogger logger;
  ThrowingPendingTable throwing;
  ctx.pending = PendingTable{&throwing};
  Request req{.service_method = "Math.Add", .seq = sequence_id_t{14}};
  const MethodDescriptor* add = service.FindMethod("Add");
  auto [arg, is_value] = MakeArgument(*add);

  ServeWith(req, std::move(arg), MakeReply(*add));

  ASSERT_EQ(sink.responses.size(), 1u);
  EXPECT_EQ(sink.freed, std::vector<uint64_t>{14});
  EXPECT_EQ(wg.Count(), 0);
  EXPECT_EQ(throwing.table.Size(), 0u);
  EXPECT_NE(logger.contents().find("release failed"), std::string::npos);
}

TEST_F(ServiceServeTest, ServeErrorAnswersAndFrees) {
  Request req{.service_method = "Math.Add", .seq = sequence_id_t{12}};
  service.ServeError(ctx, req, "birpc: cannot decode argument");

  ASSERT_EQ(sink.responses.size(), 1u);
  EXPECT_EQ(sink.responses[0].error, "birpc: cannot decode argument");
  EXPECT_FALSE(sink.responses[0].has_reply);
  EXPECT_EQ(sink.freed, std::vector<uint64_t>{12});
}

}  // namespace rpc
}  // namespace birpc
