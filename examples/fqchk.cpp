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
 * @file    fqchk.cpp
 * @ingroup
 * @author  Tony Pan <tpan7@gatech.edu>
 * @brief   per read position base composition and quality summary of FASTQ files,
 *          in the layout of seqtk fqchk.
 */

#include "fastmap-config.hpp"

#include <string>
#include <vector>
#include <iostream>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

#include "utils/logging.h"
#include "io/io_exception.hpp"
#include "io/fastq_parser.hpp"
#include "common/quality_scores.hpp"
#include "common/quality_stats.hpp"
#include "parser/sequential_parser.hpp"

#include "tclap/CmdLine.h"

int main(int argc, char** argv) {

  //////////////// init logging
  LOG_INIT();

  //////////////// parse parameters

  std::vector<std::string> inputs;
  unsigned int threshold = 20;
  size_t blocksize = 16384;

  // Wrap everything in a try block.  Do this every time,
  // because exceptions will be thrown for problems.
  try {

    TCLAP::CmdLine cmd("Per position quality summary of FASTQ files, like seqtk fqchk", ' ', "0.1");

    TCLAP::MultiArg<std::string> inputArg("i", "input", "FASTQ input file.  may be repeated", true, "string", cmd);
    TCLAP::ValueArg<unsigned int> qualArg("q", "quality-threshold", "Phred score separating low and high quality", false, threshold, "unsigned int", cmd);
    TCLAP::ValueArg<size_t> blockArg("b", "blocksize", "target block size in bytes", false, blocksize, "unsigned long int", cmd);

    // Parse the argv array.
    cmd.parse( argc, argv );

    inputs = inputArg.getValue();
    threshold = qualArg.getValue();
    blocksize = blockArg.getValue();

  } catch (TCLAP::ArgException &e)  // catch any exceptions
  {
    std::cerr << "error: " << e.error() << " for arg " << e.argId() << std::endl;
    exit(-1);
  }

  ::fastmap::common::phred_error_table perr;
  ::fastmap::common::quality_stats stats(perr);

  try {
    for (size_t i = 0; i < inputs.size(); ++i) {
      ::fastmap::parser::parse_sequential<::fastmap::io::FASTQParser>(inputs[i], blocksize, stats,
          [](::fastmap::io::FASTQParser::RecordType const & r, ::fastmap::common::quality_stats & acc) { acc.add(r); });
    }
  } catch (::fastmap::io::IOException const & e) {
    std::cerr << "error: " << e.what() << std::endl;
    return 1;
  } catch (std::logic_error const & e) {
    std::cerr << "error: " << e.what() << std::endl;
    return 1;
  }

  if (stats.get_read_count() == 0) {
    FM_WARNING("fqchk: no reads found");
    return 0;
  }

  stats.report(std::cout, threshold);
  std::cout << std::flush;

  return 0;
}
