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
 * test_block_reader.cpp
 * Test BlockReader record iteration over produced blocks
 *  Author: tpan
 */

#include "io/test/fastx_test_fixtures.hpp"

#include <utility>

#include "io/block_producer.hpp"
#include "io/block_reader.hpp"
#include "io/fasta_parser.hpp"
#include "io/fastq_parser.hpp"

using namespace fastmap::io;


TEST(BlockReaderTest, fastqRecords)
{
  TestFileInfo info = fastq_test_file();
  ASSERT_EQ(info.fileSize, get_file_size(info.filename));

  BlockProducer<FASTQParser> producer(info.filename, 1000);
  block b;
  size_t nrecords = 0;

  while (producer.next(b)) {
    BlockReader<FASTQParser> reader(std::move(b));
    EXPECT_TRUE(b.empty());

    const unsigned char * begin = reader.get_block().begin();
    const unsigned char * end = reader.get_block().end();

    FASTQParser::RecordType r;
    while (reader.next(r)) {
      // fields point into the block
      EXPECT_TRUE(r.header_begin >= begin && r.qual_end < end);

      EXPECT_EQ('@', *(r.header_begin));
      EXPECT_EQ('+', *(r.plus_begin));
      EXPECT_EQ(100UL, r.seq_size());
      EXPECT_EQ(r.seq_size(), r.qual_size());

      std::stringstream ss;
      ss << "@read_" << nrecords << " length=100";
      EXPECT_EQ(ss.str(), r.header_string());

      // separator repeats the header on odd records
      if (nrecords % 2) EXPECT_EQ("+read_" + std::to_string(nrecords), r.plus_string());
      else EXPECT_EQ("+", r.plus_string());

      ++nrecords;
    }
    EXPECT_EQ(reader.get_block().size(), reader.get_offset());
  }

  EXPECT_EQ(info.elemCount, nrecords);
}

TEST(BlockReaderTest, fastaRecords)
{
  TestFileInfo info = fasta_test_file();
  ASSERT_EQ(info.fileSize, get_file_size(info.filename));

  BlockProducer<FASTAParser> producer(info.filename, 4096);
  block b;
  size_t nrecords = 0;
  size_t nbases = 0;

  while (producer.next(b)) {
    BlockReader<FASTAParser> reader(std::move(b));

    FASTAParser::RecordType r;
    while (reader.next(r)) {
      EXPECT_EQ('>', *(r.header_begin));
      EXPECT_EQ(0, r.header_string().compare(0, 8, ">contig_"));
      EXPECT_GE(r.seq_size(), 40UL);
      EXPECT_LE(r.seq_size(), 320UL);
      nbases += r.seq_size();
      ++nrecords;
    }
  }

  EXPECT_EQ(info.elemCount, nrecords);
  EXPECT_EQ(44821UL, nbases);
}

TEST(BlockReaderTest, emptyBlock)
{
  BlockReader<FASTQParser> reader((block()));
  FASTQParser::RecordType r;
  EXPECT_FALSE(reader.next(r));
}

// the last record has no trailing newline
TEST(BlockReaderTest, partialLastRecord)
{
  TempFile tmp("@r1\nACGT\n+\nIIII\n@r2\nTTGG\n+\nIIII");

  BlockProducer<FASTQParser> producer(tmp.name());
  block b;
  ASSERT_TRUE(producer.next(b));

  BlockReader<FASTQParser> reader(std::move(b));
  FASTQParser::RecordType r;
  ASSERT_TRUE(reader.next(r));
  EXPECT_EQ("@r1", r.header_string());

  EXPECT_EQ(IOErrorType::PARTIAL_RECORD, expect_io_error([&](){ reader.next(r); }));
}
