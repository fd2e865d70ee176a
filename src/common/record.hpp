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
 * @file    record.hpp
 * @ingroup common
 * @author  Tony Pan <tpan7@gatech.edu>
 * @brief   zero-copy views of FASTA and FASTQ records.
 * @details each field is a [begin, end) iterator pair into the block the record was read from.
 *          no bytes are owned.  a record is only valid until the reader that produced it
 *          advances, and never past the lifetime of its block.  copy out what needs to be kept.
 *
 *          header includes its marker ('>' or '@').  separator includes its '+'.
 *          no field includes the line terminator.
 */
#ifndef RECORD_HPP_
#define RECORD_HPP_

#include <iterator>
#include <string>
#include <ostream>

namespace fastmap
{
  namespace common
  {

    /**
     * @class FASTARecord
     * @brief header and sequence lines of one record.
     * @tparam Iterator  random access iterator over the block bytes
     */
    template <typename Iterator>
    struct FASTARecord
    {
        typedef Iterator IteratorType;
        typedef typename std::iterator_traits<Iterator>::value_type ValueType;

        /// header line, including '>'
        Iterator header_begin;
        Iterator header_end;

        /// sequence line
        Iterator seq_begin;
        Iterator seq_end;

        FASTARecord() : header_begin(), header_end(), seq_begin(), seq_end() {}

        size_t header_size() const {
          return std::distance(header_begin, header_end);
        }

        size_t seq_size() const {
          return std::distance(seq_begin, seq_end);
        }

        /// copy of the header.  for debugging and tests
        std::string header_string() const {
          return std::string(header_begin, header_end);
        }

        /// copy of the sequence.
        std::string seq_string() const {
          return std::string(seq_begin, seq_end);
        }

        friend std::ostream& operator<<(std::ostream& ost, FASTARecord const & r)
        {
          ost << "FASTARecord: header len=" << r.header_size() << " seq len=" << r.seq_size();
          return ost;
        }
    };


    /**
     * @class FASTQRecord
     * @brief FASTARecord plus the separator and quality lines.
     * @details quality has the same length as sequence in a well formed file.  this is not checked.
     */
    template <typename Iterator>
    struct FASTQRecord : public FASTARecord<Iterator>
    {
        /// separator line, including '+'
        Iterator plus_begin;
        Iterator plus_end;

        /// quality line
        Iterator qual_begin;
        Iterator qual_end;

        FASTQRecord() : FASTARecord<Iterator>(), plus_begin(), plus_end(), qual_begin(), qual_end() {}

        size_t plus_size() const {
          return std::distance(plus_begin, plus_end);
        }

        size_t qual_size() const {
          return std::distance(qual_begin, qual_end);
        }

        std::string plus_string() const {
          return std::string(plus_begin, plus_end);
        }

        std::string qual_string() const {
          return std::string(qual_begin, qual_end);
        }

        friend std::ostream& operator<<(std::ostream& ost, FASTQRecord const & r)
        {
          ost << "FASTQRecord: header len=" << r.header_size() << " seq len=" << r.seq_size()
              << " qual len=" << r.qual_size();
          return ost;
        }
    };

  } // namespace common
} // namespace fastmap

#endif /* RECORD_HPP_ */
