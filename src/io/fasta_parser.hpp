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
 * @file    fasta_parser.hpp
 * @ingroup io
 * @author  Tony Pan <tpan7@gatech.edu>
 * @brief   FASTA parsing strategy:  one header line and one sequence line per record.
 */
#ifndef FASTA_PARSER_HPP_
#define FASTA_PARSER_HPP_

#include "common/record.hpp"
#include "io/file_parser.hpp"

namespace fastmap
{
  namespace io
  {

    /**
     * @class FASTAParser
     * @brief boundary correction and record extraction for single line FASTA.
     * @details records are   '>' header '\n' sequence '\n'.
     */
    class FASTAParser : public BaseFileParser {

      public:
        typedef ::fastmap::common::FASTARecord<IteratorType> RecordType;

        /// record start marker
        static constexpr unsigned char header_marker = '>';

        /// number of backward line hops before giving up
        static constexpr int max_hops = 2;

        static const char* format_name() { return "FASTA"; }

        /**
         * @brief   find the last record boundary in a candidate window.
         * @details walks backward over at most 2 line terminators.  the first one that is followed
         *          by '>' inside the window is the cut point.
         * @param data  start of the window.  must be at a record start
         * @param len   window length
         * @return  length of the corrected block, in (0, len)
         * @throw   IOException NO_NEWLINE_IN_BLOCK, NOT_A_FASTA_FILE
         */
        size_t find_block_end(IteratorType data, size_t const & len) const {
          // a terminator at len - 1 cannot give a cut inside the window.  skip it.
          size_t end = (len > 0) ? len - 1 : 0;
          for (int hop = 0; hop < max_hops; ++hop) {
            end = this->find_last_eol(data, end);

            if (this->line_starts_with(data, end + 1, len, header_marker)) {
              return end + 1;
            }
          }

          this->handleError(IOErrorType::NOT_A_FASTA_FILE, "no FASTA record start found in backward scan", data, end, len);
          return len;  // not reached
        }

        /**
         * @brief   extract the record starting at offset.
         * @param[out] record   fields point into data
         * @return  offset of the next record
         * @throw   IOException PARTIAL_RECORD
         */
        size_t next_record(IteratorType data, size_t const & offset, size_t const & len, RecordType & record) const {
          size_t pos = this->get_line(data, offset, len, record.header_begin, record.header_end);
          return this->get_line(data, pos, len, record.seq_begin, record.seq_end);
        }
    };

  } /* namespace io */
} /* namespace fastmap */

#endif /* FASTA_PARSER_HPP_ */
