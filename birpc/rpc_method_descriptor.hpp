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

#ifndef BIRPC_RPC_METHOD_DESCRIPTOR_HPP_
#define BIRPC_RPC_METHOD_DESCRIPTOR_HPP_

#include <proxy/proxy.h>

#include <string>
#include <string_view>
#include <system_error>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "birpc/rpc_types.hpp"

namespace birpc {
namespace rpc {

struct MethodInvokerFacade
  : pro::facade_builder  //
    ::add_convention<
      pro::operator_dispatch<"()">,
      std::error_code(
        const CancellationToken&, const ClientConnector&, ValueHolder&,
        ValueHolder&) const>                              //
    ::support_copy<pro::constraint_level::nontrivial>        //
    ::support_relocation<pro::constraint_level::nothrow>  //
    ::build {};

using MethodInvoker = pro::proxy<MethodInvokerFacade>;

/**
 * @brief Validated metadata of one callable method.
 *
 * Holds the argument shape (value type and whether the parameter is a
 * pointer), the reply shape (always a pointer, so only its value type is
 * kept), the type-erased invoker bound to the receiver and the factories the
 * transport uses to allocate zero-valued holders.
 */
class MethodDescriptor {
 public:
  using ArgumentFactory = std::pair<ValueHolder, bool> (*)();
  using ReplyFactory = ValueHolder (*)();
  using PendingBinder = bool (*)(ValueHolder&, const PendingTable&);

  MethodDescriptor()
    : arg_type_(typeid(void)), reply_type_(typeid(void)) {}

  MethodDescriptor(
    std::string name, std::type_index arg_type, bool arg_is_pointer,
    std::type_index reply_type, MethodInvoker invoker,
    ArgumentFactory make_arg, ReplyFactory make_reply,
    PendingBinder bind_pending)
    : name_(std::move(name)),
      arg_type_(arg_type),
      arg_is_pointer_(arg_is_pointer),
      reply_type_(reply_type),
      invoker_(std::move(invoker)),
      make_arg_(make_arg),
      make_reply_(make_reply),
      bind_pending_(bind_pending) {}

  const std::string& name() const noexcept { return name_; }
  std::type_index arg_type() const noexcept { return arg_type_; }
  bool arg_is_pointer() const noexcept { return arg_is_pointer_; }
  std::type_index reply_type() const noexcept { return reply_type_; }

  // True when the argument type implements SetPending(PendingTable).
  bool accepts_pending_table() const noexcept {
    return bind_pending_ != nullptr;
  }

  std::error_code Invoke(
    const CancellationToken& ctx, const ClientConnector& client,
    ValueHolder& arg, ValueHolder& reply) const {
    return (*invoker_)(ctx, client, arg, reply);
  }

  // Returns a zero argument and whether the method takes it by value.
  std::pair<ValueHolder, bool> NewArgument() const { return make_arg_(); }

  ValueHolder NewReply() const { return make_reply_(); }

  // Hands `table` to the argument in `arg`. Returns false when the argument
  // type has no such capability or `arg` holds another type.
  bool BindPendingTable(ValueHolder& arg, const PendingTable& table) const {
    return bind_pending_ != nullptr && bind_pending_(arg, table);
  }

 private:
  std::string name_;
  std::type_index arg_type_;
  bool arg_is_pointer_{false};
  std::type_index reply_type_;
  MethodInvoker invoker_;
  ArgumentFactory make_arg_{nullptr};
  ReplyFactory make_reply_{nullptr};
  PendingBinder bind_pending_{nullptr};
};

}  // namespace rpc
}  // namespace birpc

#endif  // BIRPC_RPC_METHOD_DESCRIPTOR_HPP_
