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

#ifndef BIRPC_SVC_CANCEL_SERVICE_HPP_
#define BIRPC_SVC_CANCEL_SERVICE_HPP_

#include <cstdint>
#include <system_error>
#include <tuple>
#include <utility>

#include "birpc/rpc_service.hpp"
#include "birpc/rpc_status.hpp"
#include "birpc/rpc_traits.hpp"
#include "birpc/rpc_types.hpp"

namespace birpc {
namespace rpc {
namespace svc {

// Argument of _birpc_.Cancel. Only `seq` goes over the wire; the table is
// injected by the dispatcher.
struct CancelArgs {
  uint64_t seq{};
  PendingTable pending;

  void SetPending(PendingTable table) { pending = std::move(table); }

  auto cista_members() const { return std::tie(seq); }
};

/**
 * @brief Lets a peer cancel one of its own in-flight calls by sequence id.
 *
 * Registered under kCancelServiceName. Replies true when the call was still
 * pending.
 */
class CancelService {
 public:
  static auto Methods() {
    return std::make_tuple(Method("Cancel", &CancelService::Cancel));
  }

  std::error_code Cancel(
    const CancellationToken& /*ctx*/, const ClientConnector& /*client*/,
    CancelArgs* args, bool* reply) const {
    if (!args->pending.has_value()) {
      return make_error_code(RpcErrc::FAILED_PRECONDITION);
    }
    *reply = args->pending->Cancel(sequence_id_t{args->seq});
    return {};
  }
};

inline Service::RegisterResult NewCancelService() {
  return Service::New(
    CancelService{}, RegisterOptions{
                       .name = kCancelServiceName,
                       .use_name = true,
                     });
}

}  // namespace svc
}  // namespace rpc
}  // namespace birpc

#endif  // BIRPC_SVC_CANCEL_SERVICE_HPP_
