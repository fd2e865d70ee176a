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
 * @file    block_producer.hpp
 * @ingroup io
 * @author  Tony Pan <tpan7@gatech.edu>
 * @brief   partitions a file into boundary corrected blocks.
 * @details
 *    each call to next() maps a chunk_size window at the cursor, asks the FileParser for the last
 *    record boundary inside it, and returns the window truncated there.  the parser sees one byte
 *    past the window, so a window that ends exactly at a record end is kept whole.  the cursor
 *    then moves to the boundary, so consecutive blocks are adjacent and together cover the file
 *    exactly.  the window that reaches the end of the file is returned whole, since end of file
 *    is always a record boundary.
 *
 *    chunk_size must be larger than the longest record, so the backward scan finds a boundary.
 *    a chunk that is too small fails the same way a malformed file does, with NO_NEWLINE_IN_BLOCK
 *    or the format's NOT_A_*_FILE error.
 *
 *    not thread safe.  exactly one thread drives a producer.
 */
#ifndef BLOCK_PRODUCER_HPP_
#define BLOCK_PRODUCER_HPP_

#include "fastmap-config.hpp"

#include <string>
#include <stdexcept>
#include <algorithm>  // min

#include "io/block.hpp"
#include "io/file.hpp"
#include "utils/logging.h"

namespace fastmap
{
  namespace io
  {

    /**
     * @class BlockProducer
     * @brief lazily yields the blocks of a file, each holding only whole records.
     * @tparam FileParser   format strategy, e.g. FASTAParser or FASTQParser.
     */
    template <typename FileParser>
    class BlockProducer {

      public:
        typedef FileParser                               FileParserType;
        typedef ::fastmap::io::block                     BlockType;
        typedef ::fastmap::partition::range<size_t>      RangeType;

      protected:
        /// the open file
        mmap_file file;

        /// target block size before correction.  at most the file size
        size_t chunk_size;

        /// file offset of the next block.  always at a record start
        size_t cursor;

        /// format strategy
        FileParser parser;

      public:

        /**
         * @brief open a file for partitioning.
         * @param filename      path of the file
         * @param _chunk_size   target block size in bytes.  clamped to the file size.
         * @throw IOException METADATA_FILE, OPEN_FILE.  std::invalid_argument for a 0 chunk size.
         */
        explicit BlockProducer(std::string const & filename, size_t const & _chunk_size = FASTMAP_DEFAULT_CHUNK_SIZE) :
          file(filename), chunk_size(std::min(file.size(), _chunk_size)), cursor(0), parser() {
          if (_chunk_size == 0)
            throw std::invalid_argument("ERROR: BlockProducer: chunk size must be positive");

          FM_DEBUG(FileParser::format_name() << " producer for " << filename << ": " << file.size()
                   << " bytes, chunk size " << chunk_size);
        }

        BlockProducer(BlockProducer const & other) = delete;
        BlockProducer& operator=(BlockProducer const & other) = delete;

        /**
         * @brief produce the next block.
         * @param[out] output   receives the block.  untouched when there are no more blocks.
         * @return  false if the file is exhausted.
         * @throw   IOException MMAP_FILE, NO_NEWLINE_IN_BLOCK, NOT_A_FASTA_FILE, NOT_A_FASTQ_FILE
         */
        bool next(BlockType & output) {
          if (cursor == file.size()) return false;

          // last block.  no correction needed.
          if (cursor + chunk_size >= file.size()) {
            RangeType last(cursor, file.size());
            output = BlockType(file.map(last), last);
            cursor = last.end;

            FM_DEBUG(FileParser::format_name() << " final block " << last);
            return true;
          }

          // cursor + chunk_size < file size here, so the lookahead byte exists.
          RangeType window(cursor, cursor + chunk_size + 1);
          mapped_data md = file.map(window);

          const unsigned char * window_data = md.get_data() + (window.start - md.get_range().start);
          size_t len = parser.find_block_end(window_data, window.size());

          RangeType valid(window.start, window.start + len);
          output = BlockType(std::move(md), valid);
          cursor = valid.end;

          FM_DEBUG(FileParser::format_name() << " block " << valid << " corrected from "
                   << RangeType(valid.start, valid.start + chunk_size));
          return true;
        }

        /// file offset of the next block
        size_t get_cursor() const {
          return cursor;
        }

        size_t get_chunk_size() const {
          return chunk_size;
        }

        size_t get_file_size() const {
          return file.size();
        }

        std::string const & get_filename() const {
          return file.get_filename();
        }

        FileParser const & get_parser() const {
          return parser;
        }
    };

  } /* namespace io */
} /* namespace fastmap */

#endif /* BLOCK_PRODUCER_HPP_ */
