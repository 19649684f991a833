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

#ifndef BIRPC_RPC_SERVICE_REGISTRY_HPP_
#define BIRPC_RPC_SERVICE_REGISTRY_HPP_

#include <proxy/proxy.h>

#include <expected>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unifex/scope_guard.hpp>

#include "birpc/rpc_logger.hpp"
#include "birpc/rpc_method_descriptor.hpp"
#include "birpc/rpc_service.hpp"
#include "birpc/rpc_status.hpp"
#include "birpc/rpc_traits.hpp"
#include "birpc/rpc_types.hpp"
#include "birpc/svc/cancel_service.hpp"

namespace birpc {
namespace rpc {

/**
 * @brief The set of services one endpoint exposes, keyed by name.
 *
 * Always contains the cancellation service. Services can be added while
 * calls are being routed; they are never removed, so pointers returned by
 * Find() stay valid for the registry's lifetime.
 */
class ServiceRegistry {
 public:
  ServiceRegistry() {
    auto cancel = svc::NewCancelService();
    if (!cancel) {
      throw RpcException(cancel.error().status, cancel.error().what);
    }
    Insert(std::move(*cancel));
  }

  ServiceRegistry(const ServiceRegistry&) = delete;
  ServiceRegistry& operator=(const ServiceRegistry&) = delete;

  std::expected<void, RegistrationError> Register(Service service) {
    std::string name = service.name();
    if (!Insert(std::move(service))) {
      return std::unexpected(RegistrationError{
        .status = make_error_code(RegisterErrc::ServiceAlreadyDefined),
        .what = std::format("birpc: service already defined: {}", name),
      });
    }
    return {};
  }

  template <typename Receiver>
    requires RpcReceiver<Receiver>
             || (is_shared_ptr<Receiver>::value
                 && RpcReceiver<typename Receiver::element_type>)
  std::expected<void, RegistrationError> Register(
    Receiver rcvr, std::string_view name = {}, bool use_name = false) {
    auto service = Service::New(std::move(rcvr), name, use_name);
    if (!service) {
      return std::unexpected(std::move(service.error()));
    }
    return Register(std::move(*service));
  }

  template <typename Receiver>
  std::expected<void, RegistrationError> RegisterName(
    std::string_view name, Receiver rcvr) {
    return Register(std::move(rcvr), name, true);
  }

  const Service* Find(std::string_view name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = services_.find(name);
    return it == services_.end() ? nullptr : it->second.get();
  }

  std::vector<std::string> ServiceNames() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(services_.size());
    for (const auto& [name, _] : services_) {
      names.push_back(name);
    }
    return names;
  }

  std::expected<const MethodDescriptor*, std::error_code> Lookup(
    std::string_view service_method) const {
    auto service = FindService(service_method);
    if (!service) {
      return std::unexpected(service.error());
    }
    return (*service)->Lookup(service_method);
  }

  template <typename Arg, typename Reply>
  std::error_code Call(
    const CancellationToken& ctx, const ClientConnector& client,
    std::string_view service_method, Arg&& args, Reply* reply) const {
    auto service = FindService(service_method);
    if (!service) {
      return service.error();
    }
    return (*service)->Call(
      ctx, client, service_method, std::forward<Arg>(args), reply);
  }

  std::error_code CallHolders(
    const CancellationToken& ctx, const ClientConnector& client,
    std::string_view service_method, ValueHolder& arg,
    ValueHolder& reply) const {
    auto service = FindService(service_method);
    if (!service) {
      return service.error();
    }
    return (*service)->CallHolders(ctx, client, service_method, arg, reply);
  }

  // Routes a transport-driven call; see Service::Serve.
  void Serve(
    const ServeContext& ctx, Request& req, ValueHolder arg, ValueHolder reply,
    const ClientConnector& client) const {
    auto service = FindService(req.service_method);
    if (!service) {
      unifex::scope_guard done = [wg = ctx.wg]() noexcept {
        if (wg != nullptr) {
          wg->Done();
        }
      };
      Service::SendError(
        ctx, req,
        detail::AddressErrorMessage(service.error(), req.service_method));
      return;
    }
    (*service)->Serve(ctx, req, std::move(arg), std::move(reply), client);
  }

  void ServeError(
    const ServeContext& ctx, Request& req, std::string_view errmsg) const {
    Service::SendError(ctx, req, errmsg);
  }

 private:
  bool Insert(Service service) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::string name = service.name();
    auto [it, inserted] = services_.try_emplace(std::move(name), nullptr);
    if (!inserted) {
      return false;
    }
    it->second = std::make_unique<Service>(std::move(service));
    return true;
  }

  std::expected<const Service*, std::error_code> FindService(
    std::string_view service_method) const {
    const auto dot = service_method.rfind('.');
    if (dot == std::string_view::npos) {
      return std::unexpected(make_error_code(DispatchErrc::IllFormedAddress));
    }
    const Service* service = Find(service_method.substr(0, dot));
    if (service == nullptr) {
      return std::unexpected(make_error_code(DispatchErrc::UnknownService));
    }
    return service;
  }

  mutable std::shared_mutex mutex_;
  std::map<std::string, std::unique_ptr<Service>, std::less<>> services_;
};

/**
 * @brief ClientConnector that forwards calls to an in-process registry.
 *
 * `peer` is handed to the methods it reaches as their own client, so they
 * can call back into the side that issued the call.
 */
class LocalConnector {
 public:
  explicit LocalConnector(
    const ServiceRegistry* registry, ClientConnector peer = {}) noexcept
    : registry_(registry), peer_(std::move(peer)) {}

  std::error_code Call(
    const CancellationToken& ctx, std::string_view service_method,
    ValueHolder& arg, ValueHolder& reply) const {
    if (registry_ == nullptr) {
      return make_error_code(RpcErrc::FAILED_PRECONDITION);
    }
    return registry_->CallHolders(ctx, peer_, service_method, arg, reply);
  }

 private:
  const ServiceRegistry* registry_;
  ClientConnector peer_;
};

inline ClientConnector MakeLocalConnector(
  const ServiceRegistry& registry, ClientConnector peer = {}) {
  return pro::make_proxy<ClientConnectorFacade>(
    LocalConnector(&registry, std::move(peer)));
}

}  // namespace rpc
}  // namespace birpc

#endif  // BIRPC_RPC_SERVICE_REGISTRY_HPP_
