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

#ifndef BIRPC_UTILS_WAIT_GROUP_HPP_
#define BIRPC_UTILS_WAIT_GROUP_HPP_

#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "birpc/rpc_status.hpp"

namespace birpc {
namespace rpc {
namespace utils {

/**
 * @brief Counts outstanding units of work and lets a thread wait for all of
 * them to finish.
 *
 * The transport calls Add() before handing a request to a detached task;
 * the dispatcher calls Done() exactly once when that task finishes.
 */
class WaitGroup final {
 public:
  WaitGroup() = default;
  WaitGroup(const WaitGroup&) = delete;
  WaitGroup& operator=(const WaitGroup&) = delete;

  void Add(int64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count_ + delta < 0) {
      throw RpcException(
        RpcErrc::FAILED_PRECONDITION, "WaitGroup: negative counter");
    }
    count_ += delta;
    if (count_ == 0) {
      zero_.notify_all();
    }
  }

  void Done() { Add(-1); }

  // Done() for paths that must not throw. Returns false, leaving the counter
  // at zero, when there was nothing outstanding.
  bool TryDone() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count_ == 0) {
      return false;
    }
    if (--count_ == 0) {
      zero_.notify_all();
    }
    return true;
  }

  void Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    zero_.wait(lock, [this] { return count_ == 0; });
  }

  [[nodiscard]] int64_t Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable zero_;
  int64_t count_{0};
};

}  // namespace utils
}  // namespace rpc
}  // namespace birpc

#endif  // BIRPC_UTILS_WAIT_GROUP_HPP_
