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
 * @file    block.hpp
 * @ingroup io
 * @author  tpan
 * @brief   a mapped region of a file holding only whole records.
 */
#ifndef BLOCK_HPP_
#define BLOCK_HPP_

#include <stdexcept>
#include <sstream>
#include <utility>  // move

#include "io/file.hpp"

namespace fastmap {

namespace io {

/**
 * @brief  boundary corrected block of a file.
 * @details owns the mapping.  only the valid range is exposed:  the mapping starts at a page
 *          boundary at or before valid.start, and may extend past valid.end when the producer
 *          shortened the window to the last record boundary.
 *
 *          move-only.  the memory is released when the block is destroyed, so any iterator
 *          or record referencing it must not outlive it.
 */
class block {
  public:
    typedef ::fastmap::partition::range<size_t> range_type;
    typedef const unsigned char * const_iterator;

  protected:
    /// the mapping
    mapped_data mapping;

    /// valid bytes, in file coordinates
    range_type valid_range_bytes;

  public:
    /// empty block
    block() : mapping(), valid_range_bytes(0, 0) {}

    /**
     * @brief take ownership of a mapping, exposing only the valid range.
     * @param _mapping   mapping that covers valid
     * @param valid      valid byte range of the file
     */
    block(mapped_data && _mapping, range_type const & valid) :
      mapping(std::move(_mapping)), valid_range_bytes(valid) {
      if ((valid.size() > 0) && !mapping.get_range().contains(valid)) {
        std::stringstream ss;
        ss << "ERROR: block valid " << valid << " is not inside mapped " << mapping.get_range();
        throw std::logic_error(ss.str());
      }
    }

    block(block const & other) = delete;
    block& operator=(block const & other) = delete;

    /// the moved-from block is left empty
    block(block && other) :
      mapping(std::move(other.mapping)), valid_range_bytes(other.valid_range_bytes) {
      other.valid_range_bytes.start = other.valid_range_bytes.end;
    }
    block& operator=(block && other) {
      if (this != &other) {
        mapping = std::move(other.mapping);
        valid_range_bytes = other.valid_range_bytes;
        other.valid_range_bytes.start = other.valid_range_bytes.end;
      }
      return *this;
    }

    /// first valid byte
    const_iterator begin() const {
      if (valid_range_bytes.size() == 0) return nullptr;
      return mapping.get_data() + (valid_range_bytes.start - mapping.get_range().start);
    }

    /// one past the last valid byte
    const_iterator end() const {
      return begin() + valid_range_bytes.size();
    }

    const_iterator data() const {
      return begin();
    }

    /// number of valid bytes
    size_t size() const {
      return valid_range_bytes.size();
    }

    bool empty() const {
      return valid_range_bytes.size() == 0;
    }

    /// valid range in file coordinates
    range_type const & getRange() const {
      return valid_range_bytes;
    }

    /// the mapped range, including page alignment and any bytes past the valid end
    range_type const & getMappedRange() const {
      return mapping.get_range();
    }
};

} /* namespace io */
} /* namespace fastmap */

#endif /* BLOCK_HPP_ */
