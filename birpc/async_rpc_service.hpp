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

#ifndef BIRPC_ASYNC_RPC_SERVICE_HPP_
#define BIRPC_ASYNC_RPC_SERVICE_HPP_

#include <exception>
#include <memory>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include <unifex/just_from.hpp>
#include <unifex/on.hpp>
#include <unifex/spawn_detached.hpp>
#include <unifex/upon_error.hpp>
#include <unifex/v2/async_scope.hpp>

#include "birpc/rpc_logger.hpp"
#include "birpc/rpc_service.hpp"
#include "birpc/rpc_status.hpp"
#include "birpc/rpc_types.hpp"

namespace birpc {
namespace rpc {

// Anything that routes transport-driven calls: a Service or a
// ServiceRegistry.
template <typename T>
concept ServeTarget = requires(
  const T& target, const ServeContext& ctx, Request& req, ValueHolder holder,
  const ClientConnector& client, std::string_view errmsg) {
  target.Serve(ctx, req, std::move(holder), std::move(holder), client);
  target.ServeError(ctx, req, errmsg);
};

namespace detail {
struct LogDetachedError {
  template <typename Error>
  void operator()(Error&& error) noexcept {
    using ErrorT = std::decay_t<Error>;
    if constexpr (std::is_same_v<ErrorT, std::exception_ptr>) {
      try {
        std::rethrow_exception(error);
      } catch (const std::exception& e) {
        BIRPC_ERROR << "birpc: detached call failed: " << e.what()
                    << std::endl;
      } catch (...) {
        BIRPC_ERROR << "birpc: detached call failed with unknown exception"
                    << std::endl;
      }
    } else if constexpr (std::is_same_v<ErrorT, std::error_code>) {
      BIRPC_ERROR << "birpc: detached call failed: " << error.message()
                  << std::endl;
    } else {
      BIRPC_ERROR << "birpc: detached call failed" << std::endl;
    }
  }
};

/**
 * @brief Owns everything a detached call needs until Serve takes over.
 *
 * If it is destroyed before Run(), because the scope was already closed or
 * the scheduler stopped, the request is answered with a NotStarted error,
 * freed, and `ctx.wg` is marked done in place of Serve.
 */
template <typename Target>
class DetachedServe {
 public:
  DetachedServe(
    const Target& target, ServeContext ctx, Request& req, ValueHolder arg,
    ValueHolder reply, ClientConnector client)
    : target_(target),
      ctx_(std::move(ctx)),
      req_(req),
      arg_(std::move(arg)),
      reply_(std::move(reply)),
      client_(std::move(client)) {}

  DetachedServe(const DetachedServe&) = delete;
  DetachedServe& operator=(const DetachedServe&) = delete;

  ~DetachedServe() {
    if (!started_) {
      Abandon();
    }
  }

  void Run() {
    started_ = true;
    target_.Serve(ctx_, req_, std::move(arg_), std::move(reply_), client_);
  }

 private:
  void Abandon() noexcept {
    BIRPC_WARN << "birpc: " << req_.service_method
               << " dropped before it started" << std::endl;
    try {
      target_.ServeError(
        ctx_, req_,
        AddressErrorMessage(
          make_error_code(DispatchErrc::NotStarted), req_.service_method));
    } catch (const std::exception& e) {
      BIRPC_ERROR << "birpc: answering " << req_.service_method
                  << " failed: " << e.what() << std::endl;
    }
    if (ctx_.wg != nullptr) {
      static_cast<void>(ctx_.wg->TryDone());
    }
  }

  const Target& target_;
  ServeContext ctx_;
  Request& req_;
  ValueHolder arg_;
  ValueHolder reply_;
  ClientConnector client_;
  bool started_{false};
};
}  // namespace detail

/**
 * @brief Runs target.Serve(...) on `sched` without blocking the caller.
 *
 * `ctx.wg` is incremented before the task is spawned and decremented once
 * the call finishes, whether or not it ever started. `req` is owned by the
 * transport and must stay alive until the sink's FreeRequest hook has run
 * for it.
 */
template <typename Scheduler, ServeTarget Target>
void SpawnServe(
  Scheduler&& sched, unifex::v2::async_scope& scope, const Target& target,
  ServeContext ctx, Request& req, ValueHolder arg, ValueHolder reply,
  ClientConnector client) {
  if (ctx.wg != nullptr) {
    ctx.wg->Add(1);
  }
  auto serve = std::make_unique<detail::DetachedServe<Target>>(
    target, std::move(ctx), req, std::move(arg), std::move(reply),
    std::move(client));
  unifex::spawn_detached(
    unifex::on(
      std::forward<Scheduler>(sched),
      unifex::just_from([serve = std::move(serve)]() { serve->Run(); }))
      | unifex::upon_error(detail::LogDetachedError{}),
    scope);
}

}  // namespace rpc
}  // namespace birpc

#endif  // BIRPC_ASYNC_RPC_SERVICE_HPP_
