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

#ifndef BIRPC_RPC_SERVICE_HPP_
#define BIRPC_RPC_SERVICE_HPP_

#include <algorithm>
#include <cstddef>
#include <exception>
#include <expected>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include <unifex/scope_guard.hpp>

#include "birpc/rpc_logger.hpp"
#include "birpc/rpc_method_catalog.hpp"
#include "birpc/rpc_method_descriptor.hpp"
#include "birpc/rpc_status.hpp"
#include "birpc/rpc_traits.hpp"
#include "birpc/rpc_types.hpp"
#include "birpc/utils/wait_group.hpp"

namespace birpc {
namespace rpc {

// Reserved name of the cancellation service. Calls to it get the pending
// request table injected into their argument.
inline constexpr std::string_view kCancelServiceName = "_birpc_";

struct RegisterOptions {
  std::string_view name;
  bool use_name{false};
  bool report_exclusions{true};
};

/**
 * @brief Per-transport collaborators of a transport-driven call.
 *
 * `sending` is the write lock shared by every call on the same transport
 * and must be set; `pending` and `wg` are optional. When `wg` is set, the
 * transport must have called `wg->Add(1)` for the call.
 */
struct ServeContext {
  ResponseSink sink;
  std::mutex* sending = nullptr;
  PendingTable pending;
  utils::WaitGroup* wg = nullptr;
  ServerCodec codec;
};

template <typename T>
struct is_shared_ptr : std::false_type {};
template <typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

namespace detail {
template <typename T>
T& Deref(T& value) noexcept {
  return value;
}
template <typename T>
T& Deref(T* value) noexcept {
  return *value;
}

inline std::string AddressErrorMessage(
  const std::error_code& ec, std::string_view service_method) {
  return std::format("birpc: {}: {}", ec.message(), service_method);
}
}  // namespace detail

/**
 * @brief A named receiver together with its validated method table.
 *
 * Immutable once built. A Service can be used from any number of threads;
 * concurrent calls only share the receiver, whose own synchronisation is
 * the application's concern.
 */
class Service {
 public:
  using RegisterResult = std::expected<Service, RegistrationError>;

  /**
   * @brief Registers a copy of `rcvr`. Only its const member functions are
   * callable; when none conforms but non-const ones would, the error carries
   * the pointer-receiver hint.
   */
  template <RpcReceiver Receiver>
    requires(!is_shared_ptr<Receiver>::value)
  static RegisterResult New(
    const Receiver& rcvr, std::string_view name = {}, bool use_name = false) {
    return New(
      rcvr, RegisterOptions{.name = name, .use_name = use_name});
  }

  template <RpcReceiver Receiver>
    requires(!is_shared_ptr<Receiver>::value)
  static RegisterResult New(
    const Receiver& rcvr, const RegisterOptions& options) {
    return Build<ReceiverKind::kValue, Receiver>(
      std::make_shared<const Receiver>(rcvr), options);
  }

  // Registers a shared receiver; all listed member functions are callable.
  template <RpcReceiver Receiver>
  static RegisterResult New(
    std::shared_ptr<Receiver> rcvr, std::string_view name = {},
    bool use_name = false) {
    return New(
      std::move(rcvr), RegisterOptions{.name = name, .use_name = use_name});
  }

  template <RpcReceiver Receiver>
  static RegisterResult New(
    std::shared_ptr<Receiver> rcvr, const RegisterOptions& options) {
    if (!rcvr) {
      return std::unexpected(RegistrationError{
        .status = make_error_code(RegisterErrc::NullReceiver),
        .what = "birpc.Register: null receiver",
      });
    }
    return Build<ReceiverKind::kPointer, Receiver>(std::move(rcvr), options);
  }

  const std::string& name() const noexcept { return name_; }
  std::type_index receiver_type() const noexcept { return receiver_type_; }

  size_t MethodCount() const noexcept { return methods_.size(); }

  bool HasMethod(std::string_view method) const {
    return FindMethod(method) != nullptr;
  }

  const MethodDescriptor* FindMethod(std::string_view method) const {
    auto it = methods_.find(std::string(method));
    return it == methods_.end() ? nullptr : &it->second;
  }

  std::vector<std::string> MethodNames() const {
    std::vector<std::string> names;
    names.reserve(methods_.size());
    for (const auto& entry : methods_) {
      names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
  }

  // Resolves "Service.Method", splitting on the last dot.
  std::expected<const MethodDescriptor*, std::error_code> Lookup(
    std::string_view service_method) const {
    const auto dot = service_method.rfind('.');
    if (dot == std::string_view::npos) {
      return std::unexpected(make_error_code(DispatchErrc::IllFormedAddress));
    }
    if (service_method.substr(0, dot) != name_) {
      return std::unexpected(make_error_code(DispatchErrc::UnknownService));
    }
    const MethodDescriptor* method = FindMethod(service_method.substr(dot + 1));
    if (method == nullptr) {
      return std::unexpected(make_error_code(DispatchErrc::UnknownMethod));
    }
    return method;
  }

  /**
   * @brief Direct call on the caller's thread.
   *
   * `args` may be an object or a pointer to one; it and `*reply` are
   * borrowed for the duration of the call. Returns the address error or the
   * method's own result unmodified. Nothing is registered for cancellation:
   * the caller owns `ctx`. Exceptions thrown by the method propagate.
   */
  template <typename Arg, typename Reply>
  std::error_code Call(
    const CancellationToken& ctx, const ClientConnector& client,
    std::string_view service_method, Arg&& args, Reply* reply) const {
    auto& arg_value = detail::Deref(args);
    ValueHolder arg_holder = ValueHolder::View(arg_value);
    ValueHolder reply_holder =
      reply != nullptr ? ValueHolder::View(*reply) : ValueHolder{};
    return CallHolders(ctx, client, service_method, arg_holder, reply_holder);
  }

  std::error_code CallHolders(
    const CancellationToken& ctx, const ClientConnector& client,
    std::string_view service_method, ValueHolder& arg,
    ValueHolder& reply) const {
    auto method = Lookup(service_method);
    if (!method) {
      return method.error();
    }
    return (*method)->Invoke(ctx, client, arg, reply);
  }

  /**
   * @brief Transport-driven call.
   *
   * Meant to run detached from the receive loop (see SpawnServe). The call
   * is registered in `ctx.pending` before the method runs and released when
   * it returns, on every path. Its response, or the address error, goes to
   * `ctx.sink` exactly once, after which the request is freed. `ctx.wg` is
   * marked done last. A method that throws yields an error response.
   */
  void Serve(
    const ServeContext& ctx, Request& req, ValueHolder arg, ValueHolder reply,
    const ClientConnector& client) const {
    unifex::scope_guard done = [&req, wg = ctx.wg]() noexcept {
      if (wg != nullptr && !wg->TryDone()) {
        BIRPC_ERROR << "birpc: " << req.service_method
                    << " served without a matching WaitGroup::Add"
                    << std::endl;
      }
    };

    auto method = Lookup(req.service_method);
    if (!method) {
      ServeError(
        ctx, req,
        detail::AddressErrorMessage(method.error(), req.service_method));
      return;
    }

    std::string errmsg;
    {
      CancellationToken token = ctx.pending.has_value()
                                  ? ctx.pending->Start(req.seq)
                                  : CancellationToken{};
      unifex::scope_guard release = [&]() noexcept {
        ReleasePending(ctx.pending, req);
      };
      if (name_ == kCancelServiceName && ctx.pending.has_value()) {
        (*method)->BindPendingTable(arg, ctx.pending);
      }
      errmsg = InvokeGuarded(**method, token, client, arg, reply, req);
    }

    unifex::scope_guard free_request = [&]() noexcept {
      ctx.sink->FreeRequest(req);
    };
    ctx.sink->SendResponse(*ctx.sending, req, reply, ctx.codec, errmsg);
  }

  // Answers `req` with `errmsg` and frees it, for requests the transport
  // could not decode.
  void ServeError(
    const ServeContext& ctx, Request& req, std::string_view errmsg) const {
    SendError(ctx, req, errmsg);
  }

  static void SendError(
    const ServeContext& ctx, Request& req, std::string_view errmsg) {
    unifex::scope_guard free_request = [&]() noexcept {
      ctx.sink->FreeRequest(req);
    };
    const ValueHolder empty_reply;
    ctx.sink->SendResponse(*ctx.sending, req, empty_reply, ctx.codec, errmsg);
  }

 private:
  Service(
    std::string name, std::shared_ptr<const void> rcvr,
    std::type_index receiver_type, MethodMap methods)
    : name_(std::move(name)),
      rcvr_(std::move(rcvr)),
      receiver_type_(receiver_type),
      methods_(std::move(methods)) {}

  template <ReceiverKind Kind, typename Receiver>
  static RegisterResult Build(
    ReceiverHandle<Kind, Receiver> rcvr, const RegisterOptions& options) {
    const std::string_view sname =
      options.use_name ? options.name : ReceiverTypeName<Receiver>();
    if (sname.empty()) {
      return std::unexpected(RegistrationError{
        .status = make_error_code(RegisterErrc::NoServiceName),
        .what = std::format(
          "birpc.Register: no service name for type {}",
          typeid(Receiver).name()),
      });
    }
    if (!options.use_name && !IsExportedName(sname)) {
      return std::unexpected(RegistrationError{
        .status = make_error_code(RegisterErrc::TypeNotExported),
        .what = std::format("birpc.Register: type {} is not exported", sname),
      });
    }

    MethodMap methods =
      SuitableMethods<Kind, Receiver>(rcvr, options.report_exclusions);
    if (methods.empty()) {
      const bool hint =
        Kind == ReceiverKind::kValue
        && CountSuitableMethods<ReceiverKind::kPointer, Receiver>() != 0;
      return std::unexpected(RegistrationError{
        .status = make_error_code(RegisterErrc::NoSuitableMethods),
        .what = std::format(
          "birpc.Register: type {} has no exported methods of suitable "
          "type{}",
          sname,
          hint ? " (hint: pass a pointer to value of that type)" : ""),
        .pointer_receiver_hint = hint,
      });
    }
    return Service(
      std::string(sname), std::shared_ptr<const void>(std::move(rcvr)),
      std::type_index(typeid(Receiver)), std::move(methods));
  }

  static void ReleasePending(
    const PendingTable& pending, const Request& req) noexcept {
    if (!pending.has_value()) {
      return;
    }
    try {
      static_cast<void>(pending->Cancel(req.seq));
    } catch (const std::exception& e) {
      BIRPC_ERROR << "birpc: releasing " << req.service_method
                  << " failed: " << e.what() << std::endl;
    }
  }

  static std::string InvokeGuarded(
    const MethodDescriptor& method, const CancellationToken& token,
    const ClientConnector& client, ValueHolder& arg, ValueHolder& reply,
    const Request& req) {
    try {
      std::error_code ec = method.Invoke(token, client, arg, reply);
      return ec ? ec.message() : std::string{};
    } catch (const std::exception& e) {
      std::string msg = std::format(
        "birpc: method {} failed: {}", req.service_method, e.what());
      BIRPC_ERROR << msg << std::endl;
      return msg;
    } catch (...) {
      std::string msg = std::format(
        "birpc: method {} failed: unknown exception", req.service_method);
      BIRPC_ERROR << msg << std::endl;
      return msg;
    }
  }

  std::string name_;
  std::shared_ptr<const void> rcvr_;
  std::type_index receiver_type_;
  MethodMap methods_;
};

}  // namespace rpc
}  // namespace birpc

#endif  // BIRPC_RPC_SERVICE_HPP_
