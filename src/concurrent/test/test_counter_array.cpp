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
 * test_counter_array.cpp
 * Test copyable_atomic and counter_array under concurrent updates
 *  Author: tpan
 */

#include "concurrent/copyable_atomic.hpp"
#include "concurrent/counter_array.hpp"

#include <gtest/gtest.h>
#include <omp.h>

#include <cstdint>
#include <vector>
#include <utility>

using namespace fastmap::concurrent;


TEST(CopyableAtomicTest, copyAndMove)
{
  copyable_atomic<int> a(5);
  copyable_atomic<int> b(a);
  EXPECT_EQ(5, b.load());
  EXPECT_EQ(5, a.load());

  copyable_atomic<int> c(std::move(a));
  EXPECT_EQ(5, c.load());
  EXPECT_EQ(0, a.load());

  b = 7;
  c = b;
  EXPECT_EQ(7, c.load());

  // vector of atomics can grow
  std::vector<copyable_atomic<int> > v(3, copyable_atomic<int>(1));
  v.resize(10);
  EXPECT_EQ(1, v[2].load());
  EXPECT_EQ(0, v[9].load());
}


template <typename T>
class CounterArrayTest : public ::testing::Test
{
};

// indicate this is a typed test
TYPED_TEST_CASE_P(CounterArrayTest);


TYPED_TEST_P(CounterArrayTest, sequential)
{
  counter_array<TypeParam> c(4);
  EXPECT_EQ(4UL, c.size());
  EXPECT_EQ(0, c.total());

  c.increment(0);
  c.increment(2, 5);
  c.increment(2);

  EXPECT_EQ(1, c.get(0));
  EXPECT_EQ(0, c[1]);
  EXPECT_EQ(6, c[2]);
  EXPECT_EQ(7, c.total());

  std::vector<TypeParam> vals = c.values();
  ASSERT_EQ(4UL, vals.size());
  EXPECT_EQ(6, vals[2]);

  c.reset();
  EXPECT_EQ(0, c.total());
}

// no increment is lost when many threads hit the same counters
TYPED_TEST_P(CounterArrayTest, concurrentIncrements)
{
  const int nthreads = 4;
  const size_t iters = 10000;
  const size_t ncounters = 8;

  counter_array<TypeParam> c(ncounters);

#pragma omp parallel for num_threads(nthreads)
  for (int t = 0; t < nthreads; ++t) {
    for (size_t i = 0; i < iters; ++i) {
      c.increment(i % ncounters);
    }
  }

  for (size_t i = 0; i < ncounters; ++i) {
    EXPECT_EQ(static_cast<TypeParam>(nthreads * iters / ncounters), c[i]);
  }
  EXPECT_EQ(static_cast<TypeParam>(nthreads * iters), c.total());
}


// now register the test cases
REGISTER_TYPED_TEST_CASE_P(CounterArrayTest, sequential, concurrentIncrements);


//////////////////// RUN the tests with different types.

typedef ::testing::Types<uint32_t, int64_t, uint64_t, size_t> CounterArrayTestTypes;
INSTANTIATE_TYPED_TEST_CASE_P(FastMap, CounterArrayTest, CounterArrayTestTypes);
