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
 * @file    kmer_tokenizer.hpp
 * @ingroup common
 * @author  Tony Pan <tpan7@gatech.edu>
 * @brief   2 bit packed k-mers of a DNA sequence.
 * @details bases are coded A=0 C=1 T=2 G=3, first base in the highest bits.  any other
 *          character, including lower case, breaks the sequence:  no k-mer spans it.
 */
#ifndef KMER_TOKENIZER_HPP_
#define KMER_TOKENIZER_HPP_

#include <string>
#include <cstdint>
#include <stdexcept>

namespace fastmap
{
  namespace common
  {

    /// longest k that fits the 4^k counter space of the k-mer counting tools
    static const unsigned int max_kmer_size = 15;

    /// marks a character that is not one of ACGT
    static const uint64_t invalid_base = 4;

    /// 2 bit code of a base, or invalid_base
    inline uint64_t encode_base(unsigned char const & c) {
      switch (c) {
        case 'A': return 0;
        case 'C': return 1;
        case 'T': return 2;
        case 'G': return 3;
        default:  return invalid_base;
      }
    }

    /// the k characters of a packed k-mer
    inline std::string decode_kmer(uint64_t kmer, unsigned int const & k) {
      static const char bases[] = { 'A', 'C', 'T', 'G' };
      std::string out(k, 'A');
      for (unsigned int i = 0; i < k; ++i) {
        out[k - 1 - i] = bases[kmer & 0x3];
        kmer >>= 2;
      }
      return out;
    }

    /// number of distinct k-mers of length k
    inline uint64_t kmer_space(unsigned int const & k) {
      if (k == 0 || k > max_kmer_size)
        throw std::invalid_argument("ERROR: kmer_space: k must be between 1 and 15");
      return 1ULL << (2 * k);
    }

    /**
     * @brief calls emit(code) for every k-mer of [begin, end), in sequence order.
     * @details windows holding a non ACGT character are skipped.
     * @param k   k-mer length, 1 to max_kmer_size
     */
    template <typename Iterator, typename Emit>
    void for_each_kmer(Iterator begin, Iterator end, unsigned int const & k, Emit emit) {
      const uint64_t mask = kmer_space(k) - 1;
      uint64_t kmer = 0;
      unsigned int valid = 0;  // bases since the last invalid one

      for (Iterator it = begin; it != end; ++it) {
        uint64_t code = encode_base(*it);
        if (code == invalid_base) {
          valid = 0;
          kmer = 0;
          continue;
        }
        kmer = ((kmer << 2) | code) & mask;
        if (++valid >= k) emit(kmer);
      }
    }

  } // namespace common
} // namespace fastmap

#endif /* KMER_TOKENIZER_HPP_ */
