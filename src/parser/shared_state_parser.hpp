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
 * @file    shared_state_parser.hpp
 * @ingroup parser
 * @author  tpan
 * @brief   multi threaded parse of a FASTA or FASTQ file into a shared, thread safe accumulator.
 * @details
 *    one thread of an OpenMP team runs the BlockProducer and creates one task per block.
 *    any thread of the team, including the producer once it waits, runs a BlockReader loop over
 *    the block in a task, calling on_record for each record.
 *
 *    the accumulator is shared by all tasks and is never locked here.  it must tolerate concurrent
 *    updates, e.g. fastmap::concurrent::counter_array or a container of copyable_atomic.
 *    on_record is called concurrently and must be safe to call from several threads.
 *
 *    records of a block are visited in file order.  blocks complete in any order.
 *
 *    the number of blocks waiting for a task is bounded by FASTMAP_MAX_BLOCKS_IN_FLIGHT_PER_THREAD
 *    times the thread count; the producer waits for outstanding tasks when the bound is reached.
 *    this bounds the number of live mappings.
 *
 *    failures:  the first exception, from the producer, a reader, or on_record, is kept and
 *    rethrown after the parallel region.  after a failure no more blocks are produced and tasks that
 *    have not started skip their block.  tasks already running finish.
 */
#ifndef SHARED_STATE_PARSER_HPP_
#define SHARED_STATE_PARSER_HPP_

#include "fastmap-config.hpp"

#include <omp.h>

#include <string>
#include <memory>     // shared_ptr
#include <atomic>
#include <exception>  // exception_ptr
#include <utility>

#include "io/block_producer.hpp"
#include "io/block_reader.hpp"
#include "utils/logging.h"

namespace fastmap
{
  namespace parser
  {

    namespace detail
    {
      /// keeps the first error reported by any thread.
      class first_error {
        protected:
          std::exception_ptr error;
          std::atomic<bool> failed;

        public:
          first_error() : error(), failed(false) {}

          /// record err unless an earlier error was recorded.
          void set(std::exception_ptr const & err) {
#pragma omp critical (fastmap_shared_state_error)
            {
              if (!error) error = err;
            }
            failed.store(true, std::memory_order_release);
          }

          bool is_set() const {
            return failed.load(std::memory_order_acquire);
          }

          /// rethrow the recorded error, if any.  call outside of the parallel region.
          void rethrow() const {
            if (error) std::rethrow_exception(error);
          }
      };
    }

    /**
     * @brief visit every record of a file with a team of threads, sharing one accumulator.
     *
     * @tparam FileParser         format strategy, FASTAParser or FASTQParser
     * @tparam SharedAccumulator  caller owned state.  must be safe for concurrent updates.
     * @tparam RecordHandler      callable as on_record(FileParser::RecordType const &, SharedAccumulator &),
     *                            concurrently.  must not keep the record.
     * @param filename      file to parse
     * @param chunk_size    target block size in bytes
     * @param acc           shared accumulator
     * @param on_record     record visitor
     * @param num_threads   team size.  0 uses omp_get_max_threads()
     * @return  number of records visited
     * @throw   the first IOException or on_record exception observed.  opening failures are thrown directly.
     */
    template <typename FileParser, typename SharedAccumulator, typename RecordHandler>
    size_t parse_shared_state(std::string const & filename, size_t const & chunk_size,
                              SharedAccumulator & acc, RecordHandler on_record, int const & num_threads = 0) {
      typedef ::fastmap::io::BlockReader<FileParser> ReaderType;
      typedef ::fastmap::io::block BlockType;

      const int nthreads = (num_threads > 0) ? num_threads : omp_get_max_threads();
      const size_t max_in_flight = FASTMAP_MAX_BLOCKS_IN_FLIGHT_PER_THREAD * static_cast<size_t>(nthreads);

      // open errors are thrown here, before any thread is started.
      ::fastmap::io::BlockProducer<FileParser> producer(filename, chunk_size);

      detail::first_error err;
      std::atomic<size_t> nrecords(0);
      size_t nblocks = 0;

#pragma omp parallel num_threads(nthreads)
      {
#pragma omp single
        {
          size_t in_flight = 0;

          while (!err.is_set()) {
            std::shared_ptr<BlockType> b = std::make_shared<BlockType>();

            bool has_block = false;
            try {
              has_block = producer.next(*b);
            } catch (...) {
              err.set(std::current_exception());
            }
            if (!has_block) break;
            ++nblocks;

#pragma omp task firstprivate(b)
            {
              if (!err.is_set()) {
                try {
                  ReaderType reader(std::move(*b));
                  typename ReaderType::RecordType record;
                  size_t count = 0;
                  while (reader.next(record)) {
                    on_record(record, acc);
                    ++count;
                  }
                  nrecords.fetch_add(count, std::memory_order_relaxed);
                } catch (...) {
                  err.set(std::current_exception());
                }
              }
            }

            if (++in_flight >= max_in_flight) {
#pragma omp taskwait
              in_flight = 0;
            }
          }
        }  // implicit barrier.  all tasks complete here.
      }

      err.rethrow();

      FM_INFOF("shared state %s parse of %s: %lu records in %lu blocks, %d threads",
               FileParser::format_name(), filename.c_str(), nrecords.load(), nblocks, nthreads);
      return nrecords.load();
    }

    /// parse_shared_state with FASTMAP_DEFAULT_CHUNK_SIZE
    template <typename FileParser, typename SharedAccumulator, typename RecordHandler>
    size_t parse_shared_state(std::string const & filename, SharedAccumulator & acc, RecordHandler on_record) {
      return parse_shared_state<FileParser>(filename, FASTMAP_DEFAULT_CHUNK_SIZE, acc, on_record);
    }

  } /* namespace parser */
} /* namespace fastmap */

#endif /* SHARED_STATE_PARSER_HPP_ */
