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

#ifndef BIRPC_RPC_TYPES_HPP_
#define BIRPC_RPC_TYPES_HPP_

#include <cista.h>
#include <proxy/proxy.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include <unifex/inplace_stop_token.hpp>

#include "birpc/rpc_status.hpp"

namespace birpc {
namespace rpc {

namespace data = cista::offset;

// Transport-assigned identity of one in-flight request. The dispatch core
// only uses it as the cancellation key.
using sequence_id_t = cista::strong<uint64_t, struct sequence_id_tag>;

// Request identity as handed over by the transport. Owned by the transport.
struct Request {
  std::string service_method;
  sequence_id_t seq{};
};

// Response envelope fields handed to a ServerCodec by a response sink.
struct Response {
  std::string service_method;
  sequence_id_t seq{};
  std::string error;
};

/**
 * @brief Observer side of a cancellable call lifetime.
 *
 * Copies share the same underlying stop source, so a token stays usable
 * after the pending-request table has forgotten its sequence number. A
 * default constructed token can never be cancelled.
 */
class CancellationToken {
 public:
  CancellationToken() = default;

  explicit CancellationToken(
    std::shared_ptr<unifex::inplace_stop_source> source) noexcept
    : source_(std::move(source)) {}

  bool stop_requested() const noexcept {
    return source_ && source_->stop_requested();
  }

  bool stop_possible() const noexcept { return source_ != nullptr; }

  // Token for unifex senders, e.g. through
  // with_query_value(sender, get_stop_token, ctx.get_token()).
  unifex::inplace_stop_token get_token() const noexcept {
    return source_ ? source_->get_token() : unifex::inplace_stop_token{};
  }

 private:
  std::shared_ptr<unifex::inplace_stop_source> source_;
};

// Owner side of a cancellable call lifetime.
class CancellationSource {
 public:
  CancellationSource()
    : source_(std::make_shared<unifex::inplace_stop_source>()) {}

  CancellationToken token() const noexcept { return CancellationToken(source_); }

  // Returns true if this call was the one that requested the stop.
  bool Cancel() noexcept { return source_->request_stop(); }

  bool cancelled() const noexcept { return source_->stop_requested(); }

 private:
  std::shared_ptr<unifex::inplace_stop_source> source_;
};

/**
 * @brief A type-erased pointer used to carry argument and reply values.
 *
 * The deleter decides ownership: holders built by the value factory delete
 * their value, views over caller-owned objects use a no-op deleter.
 */
using RpcContextPtr = std::unique_ptr<void, void (*)(void*)>;

/**
 * @brief Type-tagged holder of one argument or reply value.
 *
 * The tag is always the pointee type, whatever the shape of the method
 * parameter (`T`, `const T&`, `T*` ...) the value will be bound to.
 */
class ValueHolder {
 public:
  ValueHolder() = default;

  template <typename T>
  static ValueHolder Own(std::unique_ptr<T> value) {
    ValueHolder holder;
    holder.type_ = std::type_index(typeid(T));
    holder.owning_ = true;
    holder.ptr_ = RpcContextPtr(
      value.release(), [](void* p) { delete static_cast<T*>(p); });
    return holder;
  }

  template <typename T>
  static ValueHolder View(T& value) {
    using ValueT = std::remove_cv_t<T>;
    ValueHolder holder;
    holder.type_ = std::type_index(typeid(ValueT));
    holder.ptr_ = RpcContextPtr(
      const_cast<ValueT*>(&value), [](void*) { /* non-owning */ });
    return holder;
  }

  // Returns nullptr when the holder is empty or holds another type.
  template <typename T>
  T* Get() const noexcept {
    if (!ptr_ || type_ != std::type_index(typeid(T))) {
      return nullptr;
    }
    return static_cast<T*>(ptr_.get());
  }

  bool has_value() const noexcept { return ptr_ != nullptr; }
  bool owns_value() const noexcept { return owning_; }
  std::type_index type() const noexcept { return type_; }

 private:
  RpcContextPtr ptr_{nullptr, [](void*) {}};
  std::type_index type_{typeid(void)};
  bool owning_{false};
};

PRO_DEF_MEM_DISPATCH(MemCall, Call);
PRO_DEF_MEM_DISPATCH(MemStart, Start);
PRO_DEF_MEM_DISPATCH(MemCancel, Cancel);
PRO_DEF_MEM_DISPATCH(MemWriteResponse, WriteResponse);
PRO_DEF_MEM_DISPATCH(MemSendResponse, SendResponse);
PRO_DEF_MEM_DISPATCH(MemFreeRequest, FreeRequest);

/**
 * @brief Reverse channel to the calling peer.
 *
 * The dispatch core never calls it; it is forwarded untouched into every
 * method invocation so that a method body can call back into the client
 * while it serves the client's request.
 */
struct ClientConnectorFacade
  : pro::facade_builder  //
    ::add_convention<
      MemCall,
      std::error_code(
        const CancellationToken&, std::string_view, ValueHolder&, ValueHolder&)
        const>                                         //
    ::support_copy<pro::constraint_level::nontrivial>     //
    ::support_relocation<pro::constraint_level::nothrow>  //
    ::build {};

using ClientConnector = pro::proxy<ClientConnectorFacade>;

/**
 * @brief The pending-request table consumed by the transport-driven path.
 *
 * `Start` registers a sequence number and returns its token, `Cancel`
 * cancels and forgets it and must be a no-op for unknown numbers. Both may
 * be called concurrently from any number of in-flight calls.
 */
struct PendingTableFacade
  : pro::facade_builder  //
    ::add_convention<MemStart, CancellationToken(sequence_id_t) const>  //
    ::add_convention<MemCancel, bool(sequence_id_t) const>              //
    ::support_copy<pro::constraint_level::nontrivial>                      //
    ::support_relocation<pro::constraint_level::nothrow>                //
    ::build {};

using PendingTable = pro::proxy<PendingTableFacade>;

// Serializes response envelopes and bodies. Opaque to the dispatch core,
// which only passes it through to the response sink.
struct ServerCodecFacade
  : pro::facade_builder  //
    ::add_convention<
      MemWriteResponse,
      std::error_code(const Response&, const ValueHolder&) const>  //
    ::support_copy<pro::constraint_level::nontrivial>                 //
    ::support_relocation<pro::constraint_level::nothrow>           //
    ::build {};

using ServerCodec = pro::proxy<ServerCodecFacade>;

/**
 * @brief Response path of the transport.
 *
 * `SendResponse` must hold `sending` for the whole write of one response;
 * `FreeRequest` releases the transport's own bookkeeping for a request.
 */
struct ResponseSinkFacade
  : pro::facade_builder  //
    ::add_convention<
      MemSendResponse,
      void(
        std::mutex&, const Request&, const ValueHolder&, const ServerCodec&,
        std::string_view) const>                                 //
    ::add_convention<MemFreeRequest, void(Request&) const>       //
    ::support_copy<pro::constraint_level::nontrivial>               //
    ::support_relocation<pro::constraint_level::nothrow>         //
    ::build {};

using ResponseSink = pro::proxy<ResponseSinkFacade>;

/**
 * @brief Calls `service_method` on the peer behind `client`.
 *
 * Typed convenience for method bodies; `args` and `*reply` are borrowed for
 * the duration of the call.
 */
template <typename Arg, typename Reply>
std::error_code CallPeer(
  const ClientConnector& client, const CancellationToken& ctx,
  std::string_view service_method, Arg& args, Reply* reply) {
  if (!client.has_value()) {
    return make_error_code(RpcErrc::FAILED_PRECONDITION);
  }
  ValueHolder arg_holder = ValueHolder::View(args);
  ValueHolder reply_holder =
    reply != nullptr ? ValueHolder::View(*reply) : ValueHolder{};
  return client->Call(ctx, service_method, arg_holder, reply_holder);
}

}  // namespace rpc
}  // namespace birpc

#endif  // BIRPC_RPC_TYPES_HPP_
