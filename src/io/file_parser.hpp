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
 * @file    file_parser.hpp
 * @ingroup io
 * @author  Tony Pan <tpan7@gatech.edu>
 * @brief   base class for the per-format parsing strategies used by BlockProducer and BlockReader.
 * @details A FileParser is the only format specific piece.  it provides
 *
 *            RecordType                              the record view type
 *            size_t find_block_end(data, len)        boundary correction of a candidate window
 *            size_t next_record(data, offset, len, record)   field extraction, returns new offset
 *
 *          the generic BlockProducer<FileParser> and BlockReader<FileParser> are instantiated once
 *          per format.  BaseFileParser supplies the line scanning and error reporting shared by
 *          FASTAParser and FASTQParser.
 *
 *          all offsets are relative to the start of the data passed in.
 */
#ifndef FILE_PARSER_HPP_
#define FILE_PARSER_HPP_

#include <string>
#include <sstream>
#include <algorithm>  // min

#include "io/io_exception.hpp"
#include "utils/exception_handling.hpp"

namespace fastmap
{
  namespace io
  {

    class BaseFileParser {

      public:
        typedef const unsigned char * IteratorType;

        /// line terminator
        static constexpr unsigned char eol = '\n';

      protected:

        /// bytes of the offending data quoted in error messages
        static constexpr size_t max_excerpt = 64;

        /**
         * @brief   position of the last eol strictly before end.
         * @param data  start of window
         * @param end   search [0, end)
         * @return  offset of the eol
         * @throw   IOException NO_NEWLINE_IN_BLOCK if there is none
         */
        size_t find_last_eol(IteratorType data, size_t const & end) const {
          size_t pos = end;
          while (pos > 0) {
            --pos;
            if (data[pos] == eol) return pos;
          }
          handleError(IOErrorType::NO_NEWLINE_IN_BLOCK, "no line terminator before backward scan limit", data, 0, end);
          return end;  // not reached
        }

        /**
         * @brief   consume one line starting at offset.
         * @param[out] line_begin   first byte of the line
         * @param[out] line_end     the terminating eol
         * @return  offset just past the eol
         * @throw   IOException PARTIAL_RECORD if no eol before len
         */
        size_t get_line(IteratorType data, size_t const & offset, size_t const & len,
                        IteratorType & line_begin, IteratorType & line_end) const {
          size_t pos = offset;
          while ((pos < len) && (data[pos] != eol)) ++pos;

          if (pos >= len) {
            handleError(IOErrorType::PARTIAL_RECORD, "record is not terminated within block", data, offset, len);
          }

          line_begin = data + offset;
          line_end = data + pos;
          return pos + 1;
        }

        /// true if the line starting at offset begins with marker
        bool line_starts_with(IteratorType data, size_t const & offset, size_t const & len, unsigned char marker) const {
          return (offset < len) && (data[offset] == marker);
        }

        /**
         * @brief throws an IOException with the relevant debug data.
         * @param type        failure category
         * @param errType     description of the failure
         * @param data        start of the data in question
         * @param startOffset offset for the beginning of the data in question
         * @param endOffset   offset for the end of the data in question
         */
        void handleError(IOErrorType const & type, const std::string& errType, IteratorType data,
                         size_t const & startOffset, size_t const & endOffset) const {
          std::stringstream ss;
          ss << "ERROR: " << type << ": " << errType << " in " << startOffset << " to " << endOffset;

          size_t excerpt_start = (endOffset - startOffset > max_excerpt) ? endOffset - max_excerpt : startOffset;
          ss << ".  offending string ends with \"";
          ss.write(reinterpret_cast<const char*>(data + excerpt_start), endOffset - excerpt_start);
          ss << "\".";

          throw ::fastmap::utils::make_exception<IOException>(type, ss.str());
        }

      public:
        BaseFileParser() {};
        virtual ~BaseFileParser() {};
    };

  } /* namespace io */
} /* namespace fastmap */

#endif /* FILE_PARSER_HPP_ */
