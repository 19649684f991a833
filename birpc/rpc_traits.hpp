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

#ifndef BIRPC_RPC_TRAITS_HPP_
#define BIRPC_RPC_TRAITS_HPP_

#include <cista.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "birpc/rpc_types.hpp"

namespace birpc {
namespace rpc {

// =============================================================================
// Exported-or-builtin payload types
// =============================================================================

// Customization point: specialise to make a struct without cista_members()
// visible to decoders.
template <typename T>
struct is_exported : std::false_type {};

template <typename T>
concept HasCistaMembers = requires(const T& t) { t.cista_members(); };

template <typename T>
struct is_std_vector : std::false_type {};
template <typename T, typename A>
struct is_std_vector<std::vector<T, A>> : std::true_type {};

template <typename T>
struct is_std_deque : std::false_type {};
template <typename T, typename A>
struct is_std_deque<std::deque<T, A>> : std::true_type {};

template <typename T>
struct is_data_vector : std::false_type {};
template <typename T>
struct is_data_vector<data::vector<T>> : std::true_type {};

// Sequence containers the value factory hands out empty.
template <typename T>
struct is_ordered_sequence
  : std::disjunction<is_std_vector<T>, is_std_deque<T>, is_data_vector<T>> {};

template <typename T>
inline constexpr bool is_ordered_sequence_v = is_ordered_sequence<T>::value;

// Keyed containers the value factory hands out empty.
template <typename T>
struct is_keyed_mapping : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_keyed_mapping<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A>
struct is_keyed_mapping<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <typename T>
inline constexpr bool is_keyed_mapping_v = is_keyed_mapping<T>::value;

template <typename T>
struct is_exported_or_builtin;

namespace detail {
template <typename T>
constexpr bool exported_or_builtin_impl() {
  if constexpr (std::is_arithmetic_v<T> || std::is_enum_v<T>) {
    return true;
  } else if constexpr (
    std::is_same_v<T, std::string> || std::is_same_v<T, data::string>) {
    return true;
  } else if constexpr (is_ordered_sequence_v<T>) {
    return is_exported_or_builtin<typename T::value_type>::value;
  } else if constexpr (is_keyed_mapping_v<T>) {
    return is_exported_or_builtin<typename T::key_type>::value
           && is_exported_or_builtin<typename T::mapped_type>::value;
  } else if constexpr (std::is_class_v<T>) {
    return (HasCistaMembers<T> || is_exported<T>::value)
           && std::is_default_constructible_v<T>;
  } else {
    return false;
  }
}
}  // namespace detail

// True for types an external decoder can see: builtins, containers of such
// types and exported structs. Pointers and cv-qualifiers are looked through.
template <typename T>
struct is_exported_or_builtin
  : std::bool_constant<detail::exported_or_builtin_impl<
      std::remove_cv_t<std::remove_pointer_t<std::remove_cvref_t<T>>>>()> {};

template <typename T>
inline constexpr bool is_exported_or_builtin_v =
  is_exported_or_builtin<T>::value;

// A name is externally visible when it starts with an upper-case letter.
constexpr bool IsExportedName(std::string_view name) noexcept {
  return !name.empty() && name.front() >= 'A' && name.front() <= 'Z';
}

// =============================================================================
// Member function traits
// =============================================================================

template <typename T>
struct function_traits;

template <typename R, typename C, typename... Args>
struct function_traits<R (C::*)(Args...)> {
  using return_type = R;
  using class_type = C;
  using args_tuple = std::tuple<Args...>;
  static constexpr size_t arity = sizeof...(Args);
  static constexpr bool is_const = false;
};

template <typename R, typename C, typename... Args>
struct function_traits<R (C::*)(Args...) const> {
  using return_type = R;
  using class_type = C;
  using args_tuple = std::tuple<Args...>;
  static constexpr size_t arity = sizeof...(Args);
  static constexpr bool is_const = true;
};

template <typename R, typename C, typename... Args>
struct function_traits<R (C::*)(Args...) noexcept>
  : function_traits<R (C::*)(Args...)> {};

template <typename R, typename C, typename... Args>
struct function_traits<R (C::*)(Args...) const noexcept>
  : function_traits<R (C::*)(Args...) const> {};

// =============================================================================
// Calling convention
// =============================================================================

// Outcome of checking one member function against
//   std::error_code Name(CancellationToken, ClientConnector, Arg, Reply*)
enum class MethodCheck : uint8_t {
  kOk,
  kParamCount,
  kContextType,
  kClientType,
  kArgShape,
  kArgNotExported,
  kReplyNotPointer,
  kReplyShape,
  kReplyNotExported,
  kReturnType,
};

namespace detail {
// Accepts `T` and `const T&`; the framework owns the values it passes.
template <typename Param, typename Expected>
inline constexpr bool is_by_value_or_const_ref_v =
  std::is_same_v<Param, Expected> || std::is_same_v<Param, const Expected&>
  || std::is_same_v<Param, const Expected>;

template <typename Param>
constexpr bool valid_arg_shape() {
  if constexpr (std::is_rvalue_reference_v<Param>) {
    return false;
  } else {
    using Bare = std::remove_cvref_t<Param>;
    if constexpr (std::is_pointer_v<Bare>) {
      using Pointee = std::remove_pointer_t<Bare>;
      return !std::is_pointer_v<Pointee> && !std::is_volatile_v<Pointee>
             && !std::is_reference_v<Param>;
    } else {
      return !std::is_volatile_v<std::remove_reference_t<Param>>;
    }
  }
}
}  // namespace detail

// The value type behind an argument parameter: `T` for `T`, `const T&`,
// `T&`, `T*` and `const T*`.
template <typename Param>
using arg_value_t =
  std::remove_cv_t<std::remove_pointer_t<std::remove_cvref_t<Param>>>;

template <typename Param>
inline constexpr bool arg_is_pointer_v =
  std::is_pointer_v<std::remove_cvref_t<Param>>;

template <typename Param>
using reply_value_t = std::remove_pointer_t<std::remove_cvref_t<Param>>;

template <typename MemFn>
constexpr MethodCheck CheckMethodSignature() {
  using traits = function_traits<MemFn>;
  if constexpr (traits::arity != 4) {
    return MethodCheck::kParamCount;
  } else {
    using Ctx = std::tuple_element_t<0, typename traits::args_tuple>;
    using Client = std::tuple_element_t<1, typename traits::args_tuple>;
    using Arg = std::tuple_element_t<2, typename traits::args_tuple>;
    using Reply = std::tuple_element_t<3, typename traits::args_tuple>;
    if constexpr (!detail::is_by_value_or_const_ref_v<Ctx, CancellationToken>) {
      return MethodCheck::kContextType;
    } else if constexpr (!detail::is_by_value_or_const_ref_v<
                           Client, ClientConnector>) {
      return MethodCheck::kClientType;
    } else if constexpr (!detail::valid_arg_shape<Arg>()) {
      return MethodCheck::kArgShape;
    } else if constexpr (!is_exported_or_builtin_v<arg_value_t<Arg>>) {
      return MethodCheck::kArgNotExported;
    } else if constexpr (!std::is_pointer_v<std::remove_cvref_t<Reply>>) {
      return MethodCheck::kReplyNotPointer;
    } else if constexpr (
      std::is_const_v<reply_value_t<Reply>>
      || std::is_pointer_v<reply_value_t<Reply>>) {
      return MethodCheck::kReplyShape;
    } else if constexpr (!is_exported_or_builtin_v<reply_value_t<Reply>>) {
      return MethodCheck::kReplyNotExported;
    } else if constexpr (!std::is_same_v<
                           typename traits::return_type, std::error_code>) {
      return MethodCheck::kReturnType;
    } else {
      return MethodCheck::kOk;
    }
  }
}

template <typename MemFn>
inline constexpr bool is_conforming_method_v =
  CheckMethodSignature<MemFn>() == MethodCheck::kOk;

// =============================================================================
// Receiver declaration
// =============================================================================

// One entry of a receiver's static method list.
template <typename MemFn>
struct MethodEntry {
  static_assert(
    std::is_member_function_pointer_v<MemFn>,
    "Method() entries must name member functions");

  std::string_view name;
  MemFn fn;
};

template <typename MemFn>
constexpr MethodEntry<MemFn> Method(std::string_view name, MemFn fn) {
  return MethodEntry<MemFn>{name, fn};
}

// A receiver lists its callable members with
//   static auto Methods() { return std::make_tuple(Method("Add", &T::Add)); }
template <typename T>
concept RpcReceiver = requires { T::Methods(); };

template <typename T>
concept HasTypeName = requires {
  { T::kTypeName } -> std::convertible_to<std::string_view>;
};

// The receiver's own declared type name, empty when it declares none.
template <typename T>
constexpr std::string_view ReceiverTypeName() noexcept {
  if constexpr (HasTypeName<T>) {
    return std::string_view(T::kTypeName);
  } else {
    return {};
  }
}

// Capability of argument types that want the live pending-request table.
template <typename T>
concept AcceptsPendingTable =
  requires(T& t, PendingTable table) { t.SetPending(std::move(table)); };

}  // namespace rpc
}  // namespace birpc

#endif  // BIRPC_RPC_TRAITS_HPP_
