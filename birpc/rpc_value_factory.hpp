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

#ifndef BIRPC_RPC_VALUE_FACTORY_HPP_
#define BIRPC_RPC_VALUE_FACTORY_HPP_

#include <memory>
#include <utility>

#include "birpc/rpc_method_descriptor.hpp"
#include "birpc/rpc_types.hpp"

namespace birpc {
namespace rpc {

/**
 * @brief Allocates a zero argument of type T.
 *
 * The second member is true when the method takes the argument by value, so
 * the transport decodes into the pointee either way.
 */
template <typename T, bool IsPointer>
std::pair<ValueHolder, bool> NewArgumentValue() {
  return {ValueHolder::Own(std::make_unique<T>()), !IsPointer};
}

// Allocates a zero reply. Maps and sequences are value-initialized, so they
// start out empty, not absent.
template <typename T>
ValueHolder NewReplyValue() {
  return ValueHolder::Own(std::make_unique<T>());
}

inline std::pair<ValueHolder, bool> MakeArgument(
  const MethodDescriptor& method) {
  return method.NewArgument();
}

inline ValueHolder MakeReply(const MethodDescriptor& method) {
  return method.NewReply();
}

}  // namespace rpc
}  // namespace birpc

#endif  // BIRPC_RPC_VALUE_FACTORY_HPP_
