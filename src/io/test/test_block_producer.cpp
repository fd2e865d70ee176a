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
 * test_block_producer.cpp
 * Test BlockProducer partitioning of FASTA and FASTQ files
 *  Author: tpan
 */

#include "io/test/fastx_test_fixtures.hpp"

#include <vector>
#include <cstring>

#include "io/block_producer.hpp"
#include "io/fasta_parser.hpp"
#include "io/fastq_parser.hpp"

using namespace fastmap::io;

/// per format test data
template <typename FileParser>
struct ProducerTestTraits;

template <>
struct ProducerTestTraits<FASTQParser> {
    static TestFileInfo file() { return fastq_test_file(); }
    static std::vector<size_t> chunk_sizes() { return { 240, 512, 1000, 4096, 65536 }; }
    static char marker() { return '@'; }
    static IOErrorType not_format() { return IOErrorType::NOT_A_FASTQ_FILE; }
};

template <>
struct ProducerTestTraits<FASTAParser> {
    static TestFileInfo file() { return fasta_test_file(); }
    static std::vector<size_t> chunk_sizes() { return { 400, 700, 1024, 2048, 4096, 65536 }; }
    static char marker() { return '>'; }
    static IOErrorType not_format() { return IOErrorType::NOT_A_FASTA_FILE; }
};


template <typename FileParser>
class BlockProducerTest : public ::testing::Test
{
  protected:
    typedef ProducerTestTraits<FileParser> Traits;

    virtual void SetUp()
    {
      TestFileInfo info = Traits::file();
      fileName = info.filename;
      fileSize = get_file_size(fileName);
      ASSERT_EQ(info.fileSize, fileSize);

      content = read_file(fileName);
    }

    std::string fileName;
    size_t fileSize;
    std::string content;
};

// indicate this is a typed test
TYPED_TEST_CASE_P(BlockProducerTest);


// blocks are adjacent, start at a record, and reassemble the file exactly.
TYPED_TEST_P(BlockProducerTest, blocksCoverFile)
{
  typedef ProducerTestTraits<TypeParam> Traits;

  for (size_t chunk : Traits::chunk_sizes()) {
    BlockProducer<TypeParam> producer(this->fileName, chunk);

    block b;
    std::string joined;
    size_t last_end = 0;
    size_t nblocks = 0;

    while (producer.next(b)) {
      ASSERT_EQ(last_end, b.getRange().start) << "chunk " << chunk;
      ASSERT_LE(b.size(), producer.get_chunk_size());
      ASSERT_FALSE(b.empty());
      EXPECT_EQ(Traits::marker(), static_cast<char>(*(b.begin())));
      EXPECT_EQ('\n', static_cast<char>(*(b.end() - 1)));

      joined.append(reinterpret_cast<const char*>(b.begin()), b.size());
      last_end = b.getRange().end;
      EXPECT_EQ(last_end, producer.get_cursor());
      ++nblocks;
    }

    EXPECT_EQ(this->fileSize, last_end);
    EXPECT_EQ(this->fileSize, producer.get_cursor());
    EXPECT_GE(nblocks, this->fileSize / chunk);
    EXPECT_TRUE(joined == this->content) << "chunk " << chunk;

    // exhausted producer stays exhausted and leaves the output alone
    EXPECT_FALSE(producer.next(b));
  }
}

TYPED_TEST_P(BlockProducerTest, chunkLargerThanFile)
{
  BlockProducer<TypeParam> producer(this->fileName, this->fileSize * 2);
  EXPECT_EQ(this->fileSize, producer.get_chunk_size());
  EXPECT_EQ(this->fileSize, producer.get_file_size());
  EXPECT_EQ(this->fileName, producer.get_filename());

  block b;
  ASSERT_TRUE(producer.next(b));
  EXPECT_EQ(0UL, b.getRange().start);
  EXPECT_EQ(this->fileSize, b.size());
  EXPECT_FALSE(producer.next(b));
}

TYPED_TEST_P(BlockProducerTest, chunkEqualsFile)
{
  BlockProducer<TypeParam> producer(this->fileName, this->fileSize);

  block b;
  ASSERT_TRUE(producer.next(b));
  EXPECT_EQ(this->fileSize, b.size());
  EXPECT_FALSE(producer.next(b));
}

TYPED_TEST_P(BlockProducerTest, emptyFile)
{
  TempFile tmp("");
  BlockProducer<TypeParam> producer(tmp.name(), 1024);
  EXPECT_EQ(0UL, producer.get_file_size());

  block b;
  EXPECT_FALSE(producer.next(b));
}

TYPED_TEST_P(BlockProducerTest, zeroChunkSize)
{
  EXPECT_THROW(BlockProducer<TypeParam>(this->fileName, 0), std::invalid_argument);
}

TYPED_TEST_P(BlockProducerTest, missingFile)
{
  std::string missing = this->fileName + ".missing";
  EXPECT_EQ(IOErrorType::METADATA_FILE, expect_io_error([&missing](){ BlockProducer<TypeParam> p(missing, 1024); }));
}

TYPED_TEST_P(BlockProducerTest, notThisFormat)
{
  typedef ProducerTestTraits<TypeParam> Traits;

  std::string text;
  for (int i = 0; i < 200; ++i) text.append("lorem ipsum dolor sit amet\n");
  TempFile tmp(text);

  BlockProducer<TypeParam> producer(tmp.name(), 1024);
  block b;
  EXPECT_EQ(Traits::not_format(), expect_io_error([&](){ producer.next(b); }));
}

TYPED_TEST_P(BlockProducerTest, noNewLine)
{
  TempFile tmp(std::string(5000, 'A'));

  BlockProducer<TypeParam> producer(tmp.name(), 1024);
  block b;
  EXPECT_EQ(IOErrorType::NO_NEWLINE_IN_BLOCK, expect_io_error([&](){ producer.next(b); }));
}

// a path that opens but cannot be mapped fails on the first block
TYPED_TEST_P(BlockProducerTest, unmappablePath)
{
  TempDir dir;
  BlockProducer<TypeParam> producer(dir.name(), 1024);
  ASSERT_GT(producer.get_file_size(), 0UL);

  block b;
  EXPECT_EQ(IOErrorType::MMAP_FILE, expect_io_error([&](){ producer.next(b); }));
}

// a window ending exactly at a record end keeps the whole window
TYPED_TEST_P(BlockProducerTest, windowEndsAtRecordEnd)
{
  block b;
  BlockProducer<TypeParam> producer(this->fileName, 4096);
  ASSERT_TRUE(producer.next(b));

  // the first block ends at a record end.  use its size as the chunk size.
  size_t exact = b.size();
  BlockProducer<TypeParam> producer2(this->fileName, exact);
  block b2;
  ASSERT_TRUE(producer2.next(b2));
  EXPECT_EQ(exact, b2.size());
}


// now register the test cases
REGISTER_TYPED_TEST_CASE_P(BlockProducerTest, blocksCoverFile, chunkLargerThanFile, chunkEqualsFile,
                           emptyFile, zeroChunkSize, missingFile, notThisFormat, noNewLine, unmappablePath,
                           windowEndsAtRecordEnd);


//////////////////// RUN the tests with different types.

typedef ::testing::Types<FASTQParser, FASTAParser> BlockProducerTestTypes;
INSTANTIATE_TYPED_TEST_CASE_P(FastMap, BlockProducerTest, BlockProducerTestTypes);
