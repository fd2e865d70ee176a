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
 * @file    counter_array.hpp
 * @ingroup concurrent
 * @author  tpan
 * @brief   fixed size array of independently atomic counters, for use as a shared accumulator.
 */
#ifndef COUNTER_ARRAY_HPP_
#define COUNTER_ARRAY_HPP_

#include <vector>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "concurrent/copyable_atomic.hpp"

namespace fastmap
{
  namespace concurrent
  {

    /**
     * @class   counter_array
     * @brief   n counters, each updated atomically with relaxed ordering.
     * @details the counters are only read for totals once the updating threads are joined,
     *          so no ordering between counters is needed.  increments from any number of threads
     *          are never lost.
     * @tparam T  integral counter type
     */
    template <typename T = uint64_t>
    class counter_array {
        static_assert(std::is_integral<T>::value, "counter_array requires an integral counter type");

      public:
        typedef T value_type;

      protected:
        std::vector<copyable_atomic<T> > counts;

      public:
        /// n counters, all 0
        explicit counter_array(size_t const & n) : counts(n, copyable_atomic<T>(0)) {}

        /// add v to counter i
        void increment(size_t const & i, T const & v = 1) {
          counts[i].fetch_add(v, std::memory_order_relaxed);
        }

        T get(size_t const & i) const {
          return counts[i].load(std::memory_order_relaxed);
        }

        T operator[](size_t const & i) const {
          return get(i);
        }

        size_t size() const {
          return counts.size();
        }

        /// sum of all counters
        T total() const {
          T sum = 0;
          for (size_t i = 0; i < counts.size(); ++i) {
            sum += counts[i].load(std::memory_order_relaxed);
          }
          return sum;
        }

        /// set all counters to 0.  not atomic as a whole.
        void reset() {
          for (size_t i = 0; i < counts.size(); ++i) {
            counts[i].store(0, std::memory_order_relaxed);
          }
        }

        /// plain copy of the current values
        std::vector<T> values() const {
          std::vector<T> out;
          out.reserve(counts.size());
          for (size_t i = 0; i < counts.size(); ++i) {
            out.push_back(counts[i].load(std::memory_order_relaxed));
          }
          return out;
        }
    };

  } /* namespace concurrent */
} /* namespace fastmap */

#endif /* COUNTER_ARRAY_HPP_ */
