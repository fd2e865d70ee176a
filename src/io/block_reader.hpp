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
 * @file    block_reader.hpp
 * @ingroup io
 * @author  Tony Pan <tpan7@gatech.edu>
 * @brief   iterates the records of one block.
 */
#ifndef BLOCK_READER_HPP_
#define BLOCK_READER_HPP_

#include <utility>  // move

#include "io/block.hpp"

namespace fastmap
{
  namespace io
  {

    /**
     * @class BlockReader
     * @brief owns a block and yields its records in file order, without copying.
     * @details records handed out reference the owned block.  a record is valid until the
     *          next call to next(), or until the reader is destroyed.
     * @tparam FileParser   format strategy, e.g. FASTAParser or FASTQParser.
     */
    template <typename FileParser>
    class BlockReader {

      public:
        typedef FileParser                            FileParserType;
        typedef typename FileParser::RecordType       RecordType;
        typedef ::fastmap::io::block                  BlockType;

      protected:
        /// the block being read
        BlockType data;

        /// offset of the next record in the block
        size_t offset;

        FileParser parser;

      public:
        explicit BlockReader(BlockType && _data) : data(std::move(_data)), offset(0), parser() {}

        BlockReader(BlockReader const & other) = delete;
        BlockReader& operator=(BlockReader const & other) = delete;

        /**
         * @brief extract the next record.
         * @param[out] record   fields point into the block.  untouched at the end of the block.
         * @return  false when the block is exhausted.
         * @throw   IOException PARTIAL_RECORD if a line is not terminated within the block
         */
        bool next(RecordType & record) {
          if (offset == data.size()) return false;

          offset = parser.next_record(data.data(), offset, data.size(), record);
          return true;
        }

        /// offset of the next record, relative to the block start
        size_t get_offset() const {
          return offset;
        }

        BlockType const & get_block() const {
          return data;
        }
    };

  } /* namespace io */
} /* namespace fastmap */

#endif /* BLOCK_READER_HPP_ */
