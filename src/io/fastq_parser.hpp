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
 * @file    fastq_parser.hpp
 * @ingroup io
 * @author  Tony Pan <tpan7@gatech.edu>
 * @author  Patrick Flick <patrick.flick@gmail.com>
 * @brief   FASTQ parsing strategy:  header, sequence, separator and quality lines per record.
 */
#ifndef FASTQ_PARSER_HPP_
#define FASTQ_PARSER_HPP_

#include "common/record.hpp"
#include "io/file_parser.hpp"

namespace fastmap
{
  namespace io
  {

    /**
     * @class FASTQParser
     * @brief boundary correction and record extraction for 4 line FASTQ.
     * @details records are   '@' header '\n' sequence '\n' '+' [header] '\n' quality '\n'.
     *
     *    quality scores are printable characters, so a quality line can begin with '@' or '+'.
     *    a line starting with '@' is a header only if the line before it is not the separator.
     *    the cases, for a line L starting with '@', P the line before it, PP the one before P:
     *
     *      P does not start with '+'           L is a header (P is a sequence line).
     *      P and PP both start with '+'        P is a quality line starting with '+', PP the separator.
     *                                          L is a header.
     *      P starts with '+', PP does not      P is the separator and L a quality line.  the line
     *                                          before PP must then be the header of L's record.
     *
     *    sequence lines never start with '@' or '+'.
     */
    class FASTQParser : public BaseFileParser {

      public:
        typedef ::fastmap::common::FASTQRecord<IteratorType> RecordType;

        /// record start marker
        static constexpr unsigned char header_marker = '@';

        /// separator line marker
        static constexpr unsigned char separator_marker = '+';

        /// number of backward line hops spent looking for a '@' line
        static constexpr int max_hops = 5;

        static const char* format_name() { return "FASTQ"; }

        /**
         * @brief   find the last record boundary in a candidate window.
         * @param data  start of the window.  must be at a record start
         * @param len   window length
         * @return  length of the corrected block, in (0, len)
         * @throw   IOException NO_NEWLINE_IN_BLOCK, NOT_A_FASTQ_FILE
         */
        size_t find_block_end(IteratorType data, size_t const & len) const {
          // a terminator at len - 1 cannot give a cut inside the window.  skip it.
          size_t end = (len > 0) ? len - 1 : 0;
          for (int hop = 0; hop < max_hops; ++hop) {
            end = this->find_last_eol(data, end);

            if (!this->line_starts_with(data, end + 1, len, header_marker)) continue;

            // candidate header at end + 1.  check the line before it.
            size_t prev = this->find_last_eol(data, end);
            if (!this->line_starts_with(data, prev + 1, len, separator_marker)) {
              return end + 1;
            }

            size_t prevprev = this->find_last_eol(data, prev);
            if (this->line_starts_with(data, prevprev + 1, len, separator_marker)) {
              return end + 1;
            }

            // candidate was a quality line.  its header is 3 lines up.
            size_t header = this->find_last_eol(data, prevprev);
            if (this->line_starts_with(data, header + 1, len, header_marker)) {
              return header + 1;
            }

            this->handleError(IOErrorType::NOT_A_FASTQ_FILE, "line before separator is not a FASTQ header", data, header + 1, len);
          }

          this->handleError(IOErrorType::NOT_A_FASTQ_FILE, "no FASTQ record start found in backward scan", data, end, len);
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
          pos = this->get_line(data, pos, len, record.seq_begin, record.seq_end);
          pos = this->get_line(data, pos, len, record.plus_begin, record.plus_end);
          return this->get_line(data, pos, len, record.qual_begin, record.qual_end);
        }
    };

  } /* namespace io */
} /* namespace fastmap */

#endif /* FASTQ_PARSER_HPP_ */
