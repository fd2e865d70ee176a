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
 * test_shared_state_parser.cpp
 * Test multi threaded parse into a shared accumulator, against the sequential parse
 *  Author: tpan
 */

#include "io/test/fastx_test_fixtures.hpp"
#include "parser/test/base_count.hpp"

#include <omp.h>

#include <atomic>
#include <tuple>
#include <vector>
#include <string>
#include <stdexcept>

#include "concurrent/counter_array.hpp"
#include "io/fasta_parser.hpp"
#include "io/fastq_parser.hpp"
#include "parser/sequential_parser.hpp"
#include "parser/shared_state_parser.hpp"

using namespace fastmap::io;
using namespace fastmap::parser;
using fastmap::concurrent::counter_array;


/**
 * @brief parallel parse over (chunk size, thread count)
 */
class SharedStateParserTest : public ::testing::TestWithParam<std::tuple<size_t, int> >
{
  protected:
    virtual void SetUp()
    {
      chunk_size = std::get<0>(GetParam());
      nthreads = std::get<1>(GetParam());
    }

    size_t chunk_size;
    int nthreads;
};


TEST_P(SharedStateParserTest, fastqMatchesSequential)
{
  TestFileInfo info = fastq_test_file();
  ASSERT_EQ(info.fileSize, get_file_size(info.filename));

  std::vector<uint64_t> seq_counts(NUM_SLOTS, 0);
  size_t nseq = parse_sequential<FASTQParser>(info.filename, chunk_size, seq_counts, CountBases());

  counter_array<uint64_t> counts(NUM_SLOTS);
  size_t n = parse_shared_state<FASTQParser>(info.filename, chunk_size, counts, CountBases(), nthreads);

  EXPECT_EQ(info.elemCount, n);
  EXPECT_EQ(nseq, n);
  EXPECT_EQ(seq_counts, counts.values());
  EXPECT_EQ(fastq_base_counts(), counts.values());
}

TEST_P(SharedStateParserTest, fastaMatchesSequential)
{
  TestFileInfo info = fasta_test_file();
  ASSERT_EQ(info.fileSize, get_file_size(info.filename));

  std::vector<uint64_t> seq_counts(NUM_SLOTS, 0);
  size_t nseq = parse_sequential<FASTAParser>(info.filename, chunk_size, seq_counts, CountBases());

  counter_array<uint64_t> counts(NUM_SLOTS);
  size_t n = parse_shared_state<FASTAParser>(info.filename, chunk_size, counts, CountBases(), nthreads);

  EXPECT_EQ(info.elemCount, n);
  EXPECT_EQ(nseq, n);
  EXPECT_EQ(seq_counts, counts.values());
  EXPECT_EQ(44821UL, counts.total());
}

// every record is visited exactly once
TEST_P(SharedStateParserTest, eachRecordOnce)
{
  TestFileInfo info = fastq_test_file();

  counter_array<uint32_t> seen(info.elemCount);
  parse_shared_state<FASTQParser>(info.filename, chunk_size, seen,
      [](FASTQParser::RecordType const & r, counter_array<uint32_t> & acc) {
        // "@read_<i> length=100"
        std::string h = r.header_string();
        size_t id = std::stoul(h.substr(6, h.find(' ') - 6));
        acc.increment(id);
      }, nthreads);

  for (size_t i = 0; i < seen.size(); ++i) {
    EXPECT_EQ(1U, seen[i]) << "record " << i;
  }
}

INSTANTIATE_TEST_CASE_P(FastMap, SharedStateParserTest,
    ::testing::Combine(::testing::Values(700UL, 1024UL, 4096UL, 65536UL),
                       ::testing::Values(1, 2, 3, 4)));


TEST(SharedStateParserErrorTest, defaultChunkAndThreads)
{
  TestFileInfo info = fastq_test_file();
  counter_array<uint64_t> counts(NUM_SLOTS);
  size_t n = parse_shared_state<FASTQParser>(info.filename, counts, CountBases());

  EXPECT_EQ(info.elemCount, n);
  EXPECT_EQ(30000UL, counts.total());
}

TEST(SharedStateParserErrorTest, missingFile)
{
  counter_array<uint64_t> counts(NUM_SLOTS);
  EXPECT_EQ(IOErrorType::METADATA_FILE, expect_io_error([&counts](){
    parse_shared_state<FASTQParser>("/nonexistent/path/x.fastq", 1024, counts, CountBases(), 2);
  }));
}

// a malformed block is reported after the threads are joined
TEST(SharedStateParserErrorTest, wrongFormat)
{
  TestFileInfo info = fastq_test_file();
  counter_array<uint64_t> counts(NUM_SLOTS);
  EXPECT_EQ(IOErrorType::NOT_A_FASTA_FILE, expect_io_error([&](){
    parse_shared_state<FASTAParser>(info.filename, 4096, counts, CountBases(), 4);
  }));
}

// an unterminated last record fails the block that holds it
TEST(SharedStateParserErrorTest, partialRecord)
{
  std::string text = make_fastq(50, 30);
  text.resize(text.size() - 1);
  TempFile tmp(text);

  counter_array<uint64_t> counts(NUM_SLOTS);
  EXPECT_EQ(IOErrorType::PARTIAL_RECORD, expect_io_error([&](){
    parse_shared_state<FASTQParser>(tmp.name(), 512, counts, CountBases(), 3);
  }));
}

TEST(SharedStateParserErrorTest, handlerExceptionPropagates)
{
  TestFileInfo info = fastq_test_file();
  std::atomic<size_t> calls(0);

  EXPECT_THROW(parse_shared_state<FASTQParser>(info.filename, 1024, calls,
      [](FASTQParser::RecordType const & r, std::atomic<size_t> & acc) {
        acc.fetch_add(1);
        if (r.header_string() == "@read_150 length=100") throw std::runtime_error("stop");
      }, 4), std::runtime_error);

  EXPECT_GT(calls.load(), 0UL);
}
