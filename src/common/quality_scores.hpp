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
 * @file    quality_scores.hpp
 * @ingroup common
 * @author  Tony Pan <tpan7@gatech.edu>
 * @brief   lookup table from Phred quality characters to base call error probabilities.
 * @details see http://en.wikipedia.org/wiki/FASTQ_format.
 *
 *  Perr(q) = 10^(-q/10).  scores below 4 are all treated as 0.5, since 10^(-q/10) exceeds 0.5 there
 *  and carries no more information than a coin flip.
 *
 *  the table is built once, e.g. in main, and passed by reference to whatever needs it.  scores
 *  are 0 to 93, the printable range '!' to '~' with the Sanger offset of 33.
 */
#ifndef QUALITY_SCORES_HPP_
#define QUALITY_SCORES_HPP_

#include <vector>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace fastmap
{
  namespace common
  {

    /**
     * @class phred_error_table
     * @brief error probability by Phred score, and by quality character.
     */
    class phred_error_table
    {
      public:
        /// highest Phred score representable by a printable character
        static constexpr unsigned int max_score = 93;

        /// scores below this map to 0.5
        static constexpr unsigned int min_informative_score = 4;

      protected:
        /// Perr by score, [0, max_score]
        std::vector<double> perr;

        /// ASCII value of score 0
        unsigned char offset;

      public:
        /**
         * @brief build the table
         * @param _offset   character of score 0.  33 for Sanger / Illumina 1.8+
         */
        explicit phred_error_table(unsigned char const & _offset = 33) : perr(max_score + 1), offset(_offset) {
          for (unsigned int q = 0; q <= max_score; ++q) {
            perr[q] = (q < min_informative_score) ? 0.5 : std::pow(10.0, static_cast<double>(q) / -10.0);
          }
        }

        /// Phred score of a quality character
        unsigned int score(unsigned char const & c) const {
          if ((c < offset) || (static_cast<unsigned int>(c - offset) > max_score)) {
            std::stringstream ss;
            ss << "ERROR: quality character " << static_cast<unsigned int>(c) << " is outside the Phred range for offset "
               << static_cast<unsigned int>(offset);
            throw std::out_of_range(ss.str());
          }
          return c - offset;
        }

        /// error probability of a Phred score
        double operator[](unsigned int const & q) const {
          return perr.at(q);
        }

        /// error probability of a quality character
        double error_probability(unsigned char const & c) const {
          return perr[score(c)];
        }

        unsigned char get_offset() const {
          return offset;
        }

        /// number of scores in the table
        size_t size() const {
          return perr.size();
        }
    };

  } // namespace common
} // namespace fastmap

#endif /* QUALITY_SCORES_HPP_ */
