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
 * test_sequential_parser.cpp
 * Test single threaded parse of the FASTA and FASTQ test files
 *  Author: tpan
 */

#include "io/test/fastx_test_fixtures.hpp"
#include "parser/test/base_count.hpp"

#include <vector>
#include <string>
#include <stdexcept>

#include "io/fasta_parser.hpp"
#include "io/fastq_parser.hpp"
#include "parser/sequential_parser.hpp"

using namespace fastmap::io;
using namespace fastmap::parser;


/**
 * @brief parse test over (file, chunk size) pairs
 */
class SequentialParserTest : public ::testing::TestWithParam<size_t>
{
  protected:
    virtual void SetUp()
    {
      fastq = new TestFileInfo(fastq_test_file());
      fasta = new TestFileInfo(fasta_test_file());
      ASSERT_EQ(fastq->fileSize, get_file_size(fastq->filename));
      ASSERT_EQ(fasta->fileSize, get_file_size(fasta->filename));
    }

    virtual void TearDown()
    {
      delete fastq;
      delete fasta;
    }

    TestFileInfo * fastq;
    TestFileInfo * fasta;
};


TEST_P(SequentialParserTest, fastqBaseCounts)
{
  std::vector<uint64_t> counts(NUM_SLOTS, 0);
  size_t n = parse_sequential<FASTQParser>(fastq->filename, GetParam(), counts, CountBases());

  EXPECT_EQ(fastq->elemCount, n);
  EXPECT_EQ(fastq_base_counts(), counts);
}

TEST_P(SequentialParserTest, fastaBaseCounts)
{
  std::vector<uint64_t> counts(NUM_SLOTS, 0);
  size_t n = parse_sequential<FASTAParser>(fasta->filename, GetParam(), counts, CountBases());

  EXPECT_EQ(fasta->elemCount, n);
  EXPECT_EQ(fasta_base_counts(), counts);
}

// records are visited in file order
TEST_P(SequentialParserTest, fileOrder)
{
  std::vector<std::string> headers;
  parse_sequential<FASTQParser>(fastq->filename, GetParam(), headers,
      [](FASTQParser::RecordType const & r, std::vector<std::string> & acc) { acc.push_back(r.header_string()); });

  ASSERT_EQ(fastq->elemCount, headers.size());
  for (size_t i = 0; i < headers.size(); ++i) {
    EXPECT_EQ("@read_" + std::to_string(i) + " length=100", headers[i]);
  }
}

INSTANTIATE_TEST_CASE_P(FastMap, SequentialParserTest, ::testing::Values(700UL, 1024UL, 4096UL, 65536UL, 1000000UL));


TEST(SequentialParserDefaultTest, defaultChunkSize)
{
  TestFileInfo info = fastq_test_file();
  size_t total = 0;
  size_t n = parse_sequential<FASTQParser>(info.filename, total,
      [](FASTQParser::RecordType const & r, size_t & acc) { acc += r.seq_size(); });

  EXPECT_EQ(info.elemCount, n);
  EXPECT_EQ(30000UL, total);
}

TEST(SequentialParserDefaultTest, emptyFile)
{
  TempFile tmp("");
  size_t total = 0;
  size_t n = parse_sequential<FASTAParser>(tmp.name(), 1024, total,
      [](FASTAParser::RecordType const & r, size_t & acc) { acc += r.seq_size(); });
  EXPECT_EQ(0UL, n);
  EXPECT_EQ(0UL, total);
}

TEST(SequentialParserDefaultTest, missingFile)
{
  size_t total = 0;
  EXPECT_EQ(IOErrorType::METADATA_FILE, expect_io_error([&total](){
    parse_sequential<FASTAParser>("/nonexistent/path/x.fasta", total,
        [](FASTAParser::RecordType const &, size_t & acc) { ++acc; });
  }));
}

// FASTQ parse of a FASTA file fails
TEST(SequentialParserDefaultTest, wrongFormat)
{
  TestFileInfo info = fasta_test_file();
  size_t total = 0;
  EXPECT_EQ(IOErrorType::NOT_A_FASTQ_FILE, expect_io_error([&](){
    parse_sequential<FASTQParser>(info.filename, 4096, total,
        [](FASTQParser::RecordType const &, size_t & acc) { ++acc; });
  }));
}

TEST(SequentialParserDefaultTest, handlerExceptionPropagates)
{
  TestFileInfo info = fastq_test_file();
  size_t total = 0;
  EXPECT_THROW(parse_sequential<FASTQParser>(info.filename, 4096, total,
      [](FASTQParser::RecordType const &, size_t & acc) {
        if (++acc == 10) throw std::runtime_error("stop");
      }), std::runtime_error);
  EXPECT_EQ(10UL, total);
}

// a bad last block fails the parse.  records of the earlier blocks stay counted.
TEST(SequentialParserDefaultTest, laterBlockFailureKeepsEarlierUpdates)
{
  std::string text = make_fastq(50, 30);
  text.resize(text.size() - 1);
  TempFile tmp(text);
  ASSERT_GT(text.size(), 4 * 512UL);

  std::vector<uint64_t> counts(NUM_SLOTS, 0);
  size_t calls = 0;
  EXPECT_EQ(IOErrorType::PARTIAL_RECORD, expect_io_error([&](){
    parse_sequential<FASTQParser>(tmp.name(), 512, counts,
        [&calls](FASTQParser::RecordType const & r, std::vector<uint64_t> & acc) {
          CountBases()(r, acc);
          ++calls;
        });
  }));

  // every record but the unterminated last one was visited
  EXPECT_EQ(49UL, calls);
  uint64_t total = 0;
  for (size_t i = 0; i < counts.size(); ++i) total += counts[i];
  EXPECT_EQ(49UL * 30UL, total);
}
