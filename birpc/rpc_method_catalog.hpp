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

#ifndef BIRPC_RPC_METHOD_CATALOG_HPP_
#define BIRPC_RPC_METHOD_CATALOG_HPP_

#include <cista.h>
#include <proxy/proxy.h>

#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include "birpc/rpc_logger.hpp"
#include "birpc/rpc_method_descriptor.hpp"
#include "birpc/rpc_status.hpp"
#include "birpc/rpc_traits.hpp"
#include "birpc/rpc_types.hpp"
#include "birpc/rpc_value_factory.hpp"

namespace birpc {
namespace rpc {

using MethodMap = cista::raw::hash_map<std::string, MethodDescriptor>;

// How a receiver was handed to the catalog. A value receiver only exposes
// its const member functions.
enum class ReceiverKind : uint8_t { kValue, kPointer };

template <ReceiverKind Kind, typename Receiver>
using ReceiverHandle = std::conditional_t<
  Kind == ReceiverKind::kValue, std::shared_ptr<const Receiver>,
  std::shared_ptr<Receiver>>;

namespace detail {

template <typename MemFn, size_t I>
using param_t =
  std::tuple_element_t<I, typename function_traits<MemFn>::args_tuple>;

template <typename T>
const char* TypeName() noexcept {
  return typeid(T).name();
}

template <typename MemFn>
std::string ExclusionMessage(std::string_view name) {
  constexpr MethodCheck check = CheckMethodSignature<MemFn>();
  using traits = function_traits<MemFn>;
  if constexpr (check == MethodCheck::kParamCount) {
    return std::format(
      "birpc.Register: method \"{}\" has {} input parameters; needs exactly "
      "five",
      name, traits::arity + 1);
  } else if constexpr (check == MethodCheck::kContextType) {
    return std::format(
      "birpc.Register: first argument type of method \"{}\" is \"{}\", must "
      "be CancellationToken",
      name, TypeName<param_t<MemFn, 0>>());
  } else if constexpr (check == MethodCheck::kClientType) {
    return std::format(
      "birpc.Register: second argument type of method \"{}\" is \"{}\", must "
      "be ClientConnector",
      name, TypeName<param_t<MemFn, 1>>());
  } else if constexpr (check == MethodCheck::kArgShape) {
    return std::format(
      "birpc.Register: argument of method \"{}\" must be passed by value, "
      "lvalue reference or single pointer: \"{}\"",
      name, TypeName<param_t<MemFn, 2>>());
  } else if constexpr (check == MethodCheck::kArgNotExported) {
    return std::format(
      "birpc.Register: argument type of method \"{}\" is not exported: \"{}\"",
      name, TypeName<arg_value_t<param_t<MemFn, 2>>>());
  } else if constexpr (check == MethodCheck::kReplyNotPointer) {
    return std::format(
      "birpc.Register: reply type of method \"{}\" is not a pointer: \"{}\"",
      name, TypeName<param_t<MemFn, 3>>());
  } else if constexpr (check == MethodCheck::kReplyShape) {
    return std::format(
      "birpc.Register: reply type of method \"{}\" must be a non-const "
      "single pointer: \"{}\"",
      name, TypeName<param_t<MemFn, 3>>());
  } else if constexpr (check == MethodCheck::kReplyNotExported) {
    return std::format(
      "birpc.Register: reply type of method \"{}\" is not exported: \"{}\"",
      name, TypeName<reply_value_t<param_t<MemFn, 3>>>());
  } else if constexpr (check == MethodCheck::kReturnType) {
    return std::format(
      "birpc.Register: return type of method \"{}\" is \"{}\", must be "
      "std::error_code",
      name, TypeName<typename traits::return_type>());
  } else {
    return {};
  }
}

template <typename T>
bool BindPending(ValueHolder& arg, const PendingTable& table) {
  T* value = arg.Get<T>();
  if (value == nullptr) {
    return false;
  }
  value->SetPending(table);
  return true;
}

// Binds a conforming member function to its receiver. The holders are
// type-checked on every call since they may come from a transport.
template <typename Handle, typename MemFn>
MethodInvoker MakeInvoker(Handle rcvr, MemFn fn) {
  using Arg = param_t<MemFn, 2>;
  using ArgT = arg_value_t<Arg>;
  using ReplyT = reply_value_t<param_t<MemFn, 3>>;
  return pro::make_proxy<MethodInvokerFacade>(
    [rcvr = std::move(rcvr), fn](
      const CancellationToken& ctx, const ClientConnector& client,
      ValueHolder& arg, ValueHolder& reply) -> std::error_code {
      ArgT* arg_value = arg.Get<ArgT>();
      if (arg_value == nullptr) {
        return make_error_code(DispatchErrc::ArgumentTypeMismatch);
      }
      ReplyT* reply_value = reply.Get<ReplyT>();
      if (reply_value == nullptr) {
        return make_error_code(DispatchErrc::ReplyTypeMismatch);
      }
      if constexpr (arg_is_pointer_v<Arg>) {
        return ((*rcvr).*fn)(ctx, client, arg_value, reply_value);
      } else {
        return ((*rcvr).*fn)(ctx, client, *arg_value, reply_value);
      }
    });
}

template <typename Handle, typename MemFn>
MethodDescriptor MakeDescriptor(
  std::string_view name, const Handle& rcvr, MemFn fn) {
  using Arg = param_t<MemFn, 2>;
  using ArgT = arg_value_t<Arg>;
  using ReplyT = reply_value_t<param_t<MemFn, 3>>;
  MethodDescriptor::PendingBinder binder = nullptr;
  if constexpr (AcceptsPendingTable<ArgT>) {
    binder = &BindPending<ArgT>;
  }
  return MethodDescriptor(
    std::string(name), typeid(ArgT), arg_is_pointer_v<Arg>, typeid(ReplyT),
    MakeInvoker(rcvr, fn), &NewArgumentValue<ArgT, arg_is_pointer_v<Arg>>,
    &NewReplyValue<ReplyT>, binder);
}

// Whether `MemFn` belongs to the method set of a receiver of kind `Kind`.
template <ReceiverKind Kind, typename MemFn>
inline constexpr bool in_method_set_v =
  Kind == ReceiverKind::kPointer || function_traits<MemFn>::is_const;

template <ReceiverKind Kind, typename Receiver, typename MemFn>
void AddMethod(
  MethodMap& methods, const ReceiverHandle<Kind, Receiver>& rcvr,
  const MethodEntry<MemFn>& entry, bool report) {
  using traits = function_traits<MemFn>;
  static_assert(
    std::is_base_of_v<typename traits::class_type, Receiver>,
    "Methods() lists a member function of an unrelated type");
  if constexpr (in_method_set_v<Kind, MemFn>) {
    if (!IsExportedName(entry.name)) {
      return;
    }
    if constexpr (is_conforming_method_v<MemFn>) {
      methods.emplace(
        std::string(entry.name), MakeDescriptor(entry.name, rcvr, entry.fn));
    } else if (report) {
      BIRPC_WARN << ExclusionMessage<MemFn>(entry.name) << std::endl;
    }
  }
}

template <ReceiverKind Kind, typename MemFn>
bool IsSuitable(const MethodEntry<MemFn>& entry) {
  return in_method_set_v<Kind, MemFn> && is_conforming_method_v<MemFn>
         && IsExportedName(entry.name);
}

}  // namespace detail

/**
 * @brief Builds the method table of a receiver.
 *
 * Walks `Receiver::Methods()` and keeps the entries whose name is exported
 * and whose signature is
 *   std::error_code Name(CancellationToken, ClientConnector, Arg, Reply*)
 * Non-const members are not part of a value receiver's method set and are
 * skipped without a diagnostic, as are unexported names. Every other
 * excluded entry is logged at WARN when `report` is set.
 */
template <ReceiverKind Kind, RpcReceiver Receiver>
MethodMap SuitableMethods(
  const ReceiverHandle<Kind, Receiver>& rcvr, bool report) {
  MethodMap methods;
  std::apply(
    [&](const auto&... entries) {
      (detail::AddMethod<Kind, Receiver>(methods, rcvr, entries, report), ...);
    },
    Receiver::Methods());
  return methods;
}

// Number of entries SuitableMethods() would keep, without binding anything.
template <ReceiverKind Kind, RpcReceiver Receiver>
size_t CountSuitableMethods() {
  return std::apply(
    [](const auto&... entries) -> size_t {
      return (
        size_t{0} + ...
        + (detail::IsSuitable<Kind>(entries) ? size_t{1} : size_t{0}));
    },
    Receiver::Methods());
}

}  // namespace rpc
}  // namespace birpc

#endif  // BIRPC_RPC_METHOD_CATALOG_HPP_
