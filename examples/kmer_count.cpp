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
 * @file    kmer_count.cpp
 * @ingroup
 * @author  Tony Pan <tpan7@gatech.edu>
 * @brief   counts every k-mer of the reads in one or more FASTQ files.
 * @details k-mers are 2 bits per base, A=0 C=1 T=2 G=3.  a k-mer containing any other
 *          character is skipped.  output is one "KMER,count" line per k-mer, in code order.
 *
 *          the sequential mode counts into a plain vector.  the parallel mode counts into a
 *          counter_array shared by all threads.
 */

#include "fastmap-config.hpp"

#include <string>
#include <vector>
#include <iostream>
#include <cstdint>
#include <cstdlib>

#include <omp.h>

#include "utils/logging.h"
#include "io/io_exception.hpp"
#include "io/fastq_parser.hpp"
#include "common/kmer_tokenizer.hpp"
#include "concurrent/counter_array.hpp"
#include "parser/sequential_parser.hpp"
#include "parser/shared_state_parser.hpp"

#include "tclap/CmdLine.h"

int main(int argc, char** argv) {

  //////////////// init logging
  LOG_INIT();

  //////////////// parse parameters

  std::vector<std::string> inputs;
  unsigned int k = 5;
  size_t blocksize = 131072;
  int nthreads = omp_get_max_threads();
  bool parallel = false;

  // Wrap everything in a try block.  Do this every time,
  // because exceptions will be thrown for problems.
  try {

    TCLAP::CmdLine cmd("Count k-mers in FASTQ files", ' ', "0.1");

    TCLAP::MultiArg<std::string> inputArg("i", "input", "FASTQ input file.  may be repeated", true, "string", cmd);
    TCLAP::ValueArg<unsigned int> kArg("k", "kmer", "k-mer length, at most 15", false, k, "unsigned int", cmd);
    TCLAP::ValueArg<size_t> blockArg("b", "blocksize", "target block size in bytes", false, blocksize, "unsigned long int", cmd);
    TCLAP::ValueArg<int> threadArg("t", "threads", "number of threads for the parallel mode", false, nthreads, "int", cmd);
    TCLAP::SwitchArg parallelArg("p", "parallel", "count with multiple threads into shared counters", cmd, false);

    // Parse the argv array.
    cmd.parse( argc, argv );

    inputs = inputArg.getValue();
    k = kArg.getValue();
    blocksize = blockArg.getValue();
    nthreads = threadArg.getValue();
    parallel = parallelArg.getValue();

  } catch (TCLAP::ArgException &e)  // catch any exceptions
  {
    std::cerr << "error: " << e.error() << " for arg " << e.argId() << std::endl;
    exit(-1);
  }

  if (k == 0 || k > ::fastmap::common::max_kmer_size) {
    std::cerr << "error: k must be between 1 and " << ::fastmap::common::max_kmer_size << std::endl;
    exit(-1);
  }

  const size_t kmer_space = ::fastmap::common::kmer_space(k);
  std::vector<uint64_t> counts;

  try {
    if (parallel) {
      ::fastmap::concurrent::counter_array<uint64_t> shared(kmer_space);

      for (size_t i = 0; i < inputs.size(); ++i) {
        ::fastmap::parser::parse_shared_state<::fastmap::io::FASTQParser>(inputs[i], blocksize, shared,
            [k](::fastmap::io::FASTQParser::RecordType const & r, ::fastmap::concurrent::counter_array<uint64_t> & acc) {
              ::fastmap::common::for_each_kmer(r.seq_begin, r.seq_end, k, [&acc](uint64_t kmer) { acc.increment(kmer); });
            }, nthreads);
      }
      counts = shared.values();

    } else {
      counts.resize(kmer_space, 0);

      for (size_t i = 0; i < inputs.size(); ++i) {
        ::fastmap::parser::parse_sequential<::fastmap::io::FASTQParser>(inputs[i], blocksize, counts,
            [k](::fastmap::io::FASTQParser::RecordType const & r, std::vector<uint64_t> & acc) {
              ::fastmap::common::for_each_kmer(r.seq_begin, r.seq_end, k, [&acc](uint64_t kmer) { ++acc[kmer]; });
            });
      }
    }
  } catch (::fastmap::io::IOException const & e) {
    std::cerr << "error: " << e.what() << std::endl;
    return 1;
  }

  for (size_t kmer = 0; kmer < counts.size(); ++kmer) {
    std::cout << ::fastmap::common::decode_kmer(kmer, k) << "," << counts[kmer] << "\n";
  }
  std::cout << std::flush;

  return 0;
}
