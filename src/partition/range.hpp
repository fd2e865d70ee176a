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
 * @file    range.hpp
 * @ingroup partition
 * @author  Tony Pan <tpan7@gatech.edu>
 * @brief   half open interval [start, end) of integral offsets, e.g. byte positions in a file.
 * @details used to describe the valid bytes of a block, the mapped bytes of an mmap region,
 *          and the window a producer is about to correct.  page alignment helpers compute the
 *          mmap offset for a range; the aligned value is returned, not stored.
 */

#ifndef RANGE_HPP_
#define RANGE_HPP_

#include <stdexcept>
#include <iostream>       // for printing to ostream
#include <type_traits>
#include <limits>         // lowest
#include <cstdint>

namespace fastmap
{
  /**
   * @namespace partition
   */
  namespace partition
  {

    /**
     * @class range
     * @brief   interval [start, end) on a 1D integral coordinate.
     * @tparam T  integral type of the offsets.
     */
    template<typename T>
    struct range
    {
        static_assert(std::is_integral<T>::value, "range requires an integral offset type");

        typedef T ValueType;

        /// first position in the range
        T start;

        /// one past the last position in the range
        T end;

        /**
         * @brief   construct from start and end offsets
         * @param[in] _start    first position
         * @param[in] _end      one past the last position.  must not be less than _start
         */
        range(const T &_start, const T &_end)
            : start(_start), end(_end)
        {
          if (_end < _start)
            throw std::invalid_argument("ERROR: range constructor: end is less than start");
        }

        /// empty range at 0
        range() : start(), end() {}

        range(const range<T> &other) = default;
        range<T>& operator=(const range<T> & other) = default;

        bool operator==(const range<T> &other) const
        {
          return (start == other.start) && (end == other.end);
        }

        bool operator!=(const range<T> &other) const
        {
          return !(*this == other);
        }

        /// number of positions in [start, end)
        size_t size() const
        {
          return static_cast<size_t>(end - start);
        }

        bool empty() const
        {
          return start == end;
        }

        /**
         * @brief   intersection [max(s1, s2), min(e1, e2)) of 2 ranges.
         * @details if the ranges are disjoint, the result is empty and sits at the end
         *          of first that is closest to second.
         */
        static range<T> intersect(const range<T>& first, const range<T>& second)
        {
          T lstart = (first.start >= second.start) ? first.start : second.start;
          T lend =   (first.end <= second.end) ? first.end : second.end;

          if (lstart <= lend) return range<T>(lstart, lend);

          T closer = (lend == first.end) ? first.end : first.start;
          return range<T>(closer, closer);
        }

        /// true if other lies entirely inside this range
        bool contains(const range<T> &other) const {
          return (other.start >= this->start) && (other.end <= this->end);
        }

        /**
         * @brief   largest multiple of page_size that is not greater than pos.
         * @details for negative pos this moves away from zero.  throws if that would pass the
         *          lowest value of T.
         */
        static T align_to_page(const T& pos, const size_t &page_size)
        {
          if (page_size == 0) throw std::invalid_argument("ERROR: range align_to_page: page size specified as 0.");

          T page = static_cast<T>(page_size);
          T block_start = (pos / page) * page;

          if (block_start > pos)  // only when pos is negative
          {
            if (block_start < std::numeric_limits<T>::lowest() + page)
              throw std::range_error("ERROR: range align_to_page: start is within a page of the type minimum.");

            block_start -= page;
          }
          return block_start;
        }

        /// page aligned position at or before the start of r
        static T align_to_page(const range<T>& r, const size_t &page_size)
        {
          return align_to_page(r.start, page_size);
        }
    };

    template<typename T>
    std::ostream& operator<<(std::ostream& ost, const range<T>& r)
    {
      if (std::is_signed<T>::value)
        ost << "range: [" << static_cast<int64_t>(r.start) << ":" << static_cast<int64_t>(r.end) << ")";
      else
        ost << "range: [" << static_cast<uint64_t>(r.start) << ":" << static_cast<uint64_t>(r.end) << ")";
      return ost;
    }

  } /* namespace partition */
} /* namespace fastmap */
#endif /* RANGE_HPP_ */
