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

#ifndef BIRPC_SVC_PENDING_REQUESTS_HPP_
#define BIRPC_SVC_PENDING_REQUESTS_HPP_

#include <cista.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <unifex/inplace_stop_token.hpp>

#include "birpc/rpc_logger.hpp"
#include "birpc/rpc_types.hpp"

namespace birpc {
namespace rpc {
namespace svc {

/**
 * @brief Thread-safe table of in-flight requests keyed by sequence id.
 *
 * Implements the PendingTable contract. A sequence id that is registered
 * again while still pending keeps its first token. Tokens handed out stay
 * valid after their entry is gone.
 */
class PendingRequests {
 public:
  PendingRequests() = default;
  PendingRequests(const PendingRequests&) = delete;
  PendingRequests& operator=(const PendingRequests&) = delete;

  CancellationToken Start(sequence_id_t seq) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(seq);
    if (it != pending_.end()) {
      BIRPC_WARN << "birpc: request " << seq.v_
                 << " registered while still pending" << std::endl;
      return CancellationToken(it->second);
    }
    auto source = std::make_shared<unifex::inplace_stop_source>();
    pending_.emplace(seq, source);
    return CancellationToken(std::move(source));
  }

  // Cancels and forgets `seq`. Returns false when it was not pending.
  bool Cancel(sequence_id_t seq) {
    std::shared_ptr<unifex::inplace_stop_source> source;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pending_.find(seq);
      if (it == pending_.end()) {
        return false;
      }
      source = std::move(it->second);
      pending_.erase(it);
    }
    // Stop callbacks run outside the lock; they may call back into us.
    source->request_stop();
    return true;
  }

  // Cancels every pending request, e.g. when the connection goes away.
  size_t CancelAll() {
    std::vector<std::shared_ptr<unifex::inplace_stop_source>> sources;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      sources.reserve(pending_.size());
      for (auto& entry : pending_) {
        sources.push_back(std::move(entry.second));
      }
      pending_.clear();
    }
    for (auto& source : sources) {
      source->request_stop();
    }
    return sources.size();
  }

  bool IsPending(sequence_id_t seq) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.find(seq) != pending_.end();
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
  }

 private:
  mutable std::mutex mutex_;
  cista::raw::hash_map<
    sequence_id_t, std::shared_ptr<unifex::inplace_stop_source>>
    pending_;
};

}  // namespace svc
}  // namespace rpc
}  // namespace birpc

#endif  // BIRPC_SVC_PENDING_REQUESTS_HPP_
