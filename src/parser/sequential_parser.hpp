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
 * @file    sequential_parser.hpp
 * @ingroup parser
 * @author  tpan
 * @brief   single threaded parse of a FASTA or FASTQ file.
 * @details usage:
 *
 *    size_t bases = 0;
 *    fastmap::parser::parse_sequential<fastmap::io::FASTQParser>(filename, bases,
 *        [](fastmap::io::FASTQParser::RecordType const & r, size_t & acc) { acc += r.seq_size(); });
 */
#ifndef SEQUENTIAL_PARSER_HPP_
#define SEQUENTIAL_PARSER_HPP_

#include "fastmap-config.hpp"

#include <string>
#include <utility>  // move

#include "io/block_producer.hpp"
#include "io/block_reader.hpp"
#include "utils/logging.h"

namespace fastmap
{
  namespace parser
  {

    /**
     * @brief visit every record of a file in file order, on the calling thread.
     * @details the first failure propagates immediately.  updates already made to acc are kept.
     *
     * @tparam FileParser     format strategy, FASTAParser or FASTQParser
     * @tparam Accumulator    caller owned state
     * @tparam RecordHandler  callable as on_record(FileParser::RecordType const &, Accumulator &).
     *                        must not keep the record.
     * @param filename    file to parse
     * @param chunk_size  target block size in bytes
     * @param acc         accumulator, passed to every on_record call
     * @param on_record   record visitor
     * @return  number of records visited
     * @throw   IOException from opening, block production or record extraction, and whatever on_record throws
     */
    template <typename FileParser, typename Accumulator, typename RecordHandler>
    size_t parse_sequential(std::string const & filename, size_t const & chunk_size,
                            Accumulator & acc, RecordHandler on_record) {
      typedef ::fastmap::io::BlockReader<FileParser> ReaderType;

      ::fastmap::io::BlockProducer<FileParser> producer(filename, chunk_size);

      ::fastmap::io::block b;
      typename ReaderType::RecordType record;
      size_t nrecords = 0;
      size_t nblocks = 0;

      while (producer.next(b)) {
        ReaderType reader(std::move(b));
        while (reader.next(record)) {
          on_record(record, acc);
          ++nrecords;
        }
        ++nblocks;
      }

      FM_INFOF("sequential %s parse of %s: %lu records in %lu blocks",
               FileParser::format_name(), filename.c_str(), nrecords, nblocks);
      return nrecords;
    }

    /// parse_sequential with FASTMAP_DEFAULT_CHUNK_SIZE
    template <typename FileParser, typename Accumulator, typename RecordHandler>
    size_t parse_sequential(std::string const & filename, Accumulator & acc, RecordHandler on_record) {
      return parse_sequential<FileParser>(filename, FASTMAP_DEFAULT_CHUNK_SIZE, acc, on_record);
    }

  } /* namespace parser */
} /* namespace fastmap */

#endif /* SEQUENTIAL_PARSER_HPP_ */
