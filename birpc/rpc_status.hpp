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

#ifndef BIRPC_RPC_STATUS_HPP_
#define BIRPC_RPC_STATUS_HPP_

#include <exception>
#include <string>
#include <system_error>

namespace birpc {
namespace rpc {

// Common RPC status codes, numbered after the gRPC status codes.
enum class RpcErrc {
  OK = 0,
  CANCELLED = 1,
  UNKNOWN = 2,
  INVALID_ARGUMENT = 3,
  NOT_FOUND = 5,
  ALREADY_EXISTS = 6,
  FAILED_PRECONDITION = 9,
  UNIMPLEMENTED = 12,
  INTERNAL = 13,
};

// Failures of a registration attempt. All of them are terminal for that
// attempt; the caller decides whether to abort or to skip the receiver.
enum class RegisterErrc {
  Ok = 0,
  NoServiceName,
  TypeNotExported,
  NoSuitableMethods,
  ServiceAlreadyDefined,
  NullReceiver,
};

// Failures detected while resolving and invoking a "Service.Method" address.
enum class DispatchErrc {
  Ok = 0,
  IllFormedAddress,
  UnknownService,
  UnknownMethod,
  ArgumentTypeMismatch,
  ReplyTypeMismatch,
  NotStarted,
};

}  // namespace rpc
}  // namespace birpc

namespace std {
template <>
struct is_error_code_enum<birpc::rpc::RpcErrc> : public true_type {};
template <>
struct is_error_code_enum<birpc::rpc::RegisterErrc> : public true_type {};
template <>
struct is_error_code_enum<birpc::rpc::DispatchErrc> : public true_type {};
}  // namespace std

namespace birpc {
namespace rpc {

class RpcErrorCategory : public std::error_category {
 public:
  const char* name() const noexcept override { return "RPC"; }

  std::string message(int ev) const override {
    switch (static_cast<RpcErrc>(ev)) {
      case RpcErrc::OK:
        return "OK";
      case RpcErrc::CANCELLED:
        return "Cancelled";
      case RpcErrc::UNKNOWN:
        return "Unknown";
      case RpcErrc::INVALID_ARGUMENT:
        return "Invalid argument";
      case RpcErrc::NOT_FOUND:
        return "Not found";
      case RpcErrc::ALREADY_EXISTS:
        return "Already exists";
      case RpcErrc::FAILED_PRECONDITION:
        return "Failed precondition";
      case RpcErrc::UNIMPLEMENTED:
        return "Unimplemented";
      case RpcErrc::INTERNAL:
        return "Internal";
      default:
        return "Unknown RPC error";
    }
  }
};

class RegisterErrorCategory : public std::error_category {
 public:
  const char* name() const noexcept override { return "birpc.Register"; }

  std::string message(int ev) const override {
    switch (static_cast<RegisterErrc>(ev)) {
      case RegisterErrc::Ok:
        return "OK";
      case RegisterErrc::NoServiceName:
        return "no service name";
      case RegisterErrc::TypeNotExported:
        return "type not exported";
      case RegisterErrc::NoSuitableMethods:
        return "no suitable methods";
      case RegisterErrc::ServiceAlreadyDefined:
        return "service already defined";
      case RegisterErrc::NullReceiver:
        return "null receiver";
      default:
        return "unknown registration error";
    }
  }
};

class DispatchErrorCategory : public std::error_category {
 public:
  const char* name() const noexcept override { return "birpc.Dispatch"; }

  std::string message(int ev) const override {
    switch (static_cast<DispatchErrc>(ev)) {
      case DispatchErrc::Ok:
        return "OK";
      case DispatchErrc::IllFormedAddress:
        return "service/method request ill-formed";
      case DispatchErrc::UnknownService:
        return "can't find service";
      case DispatchErrc::UnknownMethod:
        return "can't find method";
      case DispatchErrc::ArgumentTypeMismatch:
        return "argument type does not match method";
      case DispatchErrc::ReplyTypeMismatch:
        return "reply type does not match method";
      case DispatchErrc::NotStarted:
        return "call dropped before it started";
      default:
        return "unknown dispatch error";
    }
  }
};

inline const std::error_category& rpc_error_category() noexcept {
  static const RpcErrorCategory category;
  return category;
}

inline const std::error_category& register_error_category() noexcept {
  static const RegisterErrorCategory category;
  return category;
}

inline const std::error_category& dispatch_error_category() noexcept {
  static const DispatchErrorCategory category;
  return category;
}

inline std::error_code make_error_code(RpcErrc e) noexcept {
  return {static_cast<int>(e), rpc_error_category()};
}

inline std::error_code make_error_code(RegisterErrc e) noexcept {
  return {static_cast<int>(e), register_error_category()};
}

inline std::error_code make_error_code(DispatchErrc e) noexcept {
  return {static_cast<int>(e), dispatch_error_category()};
}

/**
 * @brief Describes why a receiver could not be turned into a Service.
 *
 * `what` is the human readable message (it names the offending type or
 * service), `status` the machine readable cause. `pointer_receiver_hint` is
 * set when the receiver was registered by value and would have exposed
 * suitable methods had it been registered by pointer.
 */
struct RegistrationError {
  std::error_code status = make_error_code(RegisterErrc::NoSuitableMethods);
  std::string what = "Unknown error";
  bool pointer_receiver_hint{false};
};

// Thrown by method bodies that want to fail with a specific status instead
// of returning an error code.
class RpcException : public std::system_error {
 public:
  RpcException(RpcErrc errc, const std::string& what)
    : std::system_error(make_error_code(errc), what) {}

  RpcException(std::error_code ec, const std::string& what)
    : std::system_error(ec, what) {}
};

inline std::exception_ptr MakeRpcExceptionPtr(
  RpcErrc errc, const std::string& what) {
  return std::make_exception_ptr(RpcException(errc, what));
}

}  // namespace rpc
}  // namespace birpc

#endif  // BIRPC_RPC_STATUS_HPP_
