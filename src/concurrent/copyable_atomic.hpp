/*
 * Copyright 2015 Georgia Institute of Technology
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file    copyable_atomic.hpp
 * @ingroup concurrent
 * @author  Tony Pan <tpan7@gatech.edu>
 * @brief   std::atomic that can be copied and moved, so it can be stored in standard containers.
 * @details std::vector<std::atomic<T>> can only be sized once at construction and cannot be copied.
 *          a vector or map of copyable_atomic can be filled, resized and copied like any other
 *          container, and each element is still updated atomically.
 *
 *          copying and moving are NOT atomic.  only do them while no other thread uses the source
 *          or destination, e.g. before or after a parallel parse.
 */
#ifndef COPYABLE_ATOMIC_HPP_
#define COPYABLE_ATOMIC_HPP_

#include <atomic>

namespace fastmap
{
  namespace concurrent
  {

    /**
     * @class     fastmap::concurrent::copyable_atomic
     * @brief     subclass of std::atomic that is CopyConstructible and CopyAssignable.
     * @details   all remaining operations use std::atomic's
     */
    template <typename T>
    struct copyable_atomic : public std::atomic<T>
    {
      protected:
        typedef std::atomic<T> base;

      public:
        copyable_atomic() noexcept : base(T()) {}

        constexpr copyable_atomic(T desired) noexcept : base(desired) {}

        copyable_atomic(const copyable_atomic<T>& other) noexcept : base(other.load(std::memory_order_relaxed)) {}

        /// the source is reset to T()
        copyable_atomic(copyable_atomic<T>&& other) noexcept : base(other.exchange(T(), std::memory_order_relaxed)) {}

        T operator=(T desired) noexcept {
          base::store(desired, std::memory_order_relaxed);
          return desired;
        }

        copyable_atomic& operator=(const copyable_atomic<T>& other) noexcept {
          base::store(other.load(std::memory_order_relaxed), std::memory_order_relaxed);
          return *this;
        }

        /// the source is reset to T()
        copyable_atomic& operator=(copyable_atomic<T>&& other) noexcept {
          base::store(other.exchange(T(), std::memory_order_relaxed), std::memory_order_relaxed);
          return *this;
        }
    };

  } /* namespace concurrent */
} /* namespace fastmap */

#endif /* COPYABLE_ATOMIC_HPP_ */
