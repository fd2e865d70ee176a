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
 * @file    quality_stats.hpp
 * @ingroup common
 * @author  Tony Pan <tpan7@gatech.edu>
 * @brief   per read position base composition and quality counts, reported in the layout of seqtk fqchk.
 */
#ifndef QUALITY_STATS_HPP_
#define QUALITY_STATS_HPP_

#include <vector>
#include <string>
#include <ostream>
#include <iomanip>
#include <limits>
#include <cmath>
#include <cstdint>
#include <stdexcept>

#include "common/quality_scores.hpp"

namespace fastmap
{
  namespace common
  {

    /// base slots of position_stats, in report column order
    enum FqchkBase { FQCHK_A = 0, FQCHK_C, FQCHK_G, FQCHK_T, FQCHK_N, FQCHK_NUM_BASES };

    /// report column of a base.  anything other than acgt counts as N
    inline size_t fqchk_base(unsigned char const & c) {
      switch (c) {
        case 'A': case 'a': return FQCHK_A;
        case 'C': case 'c': return FQCHK_C;
        case 'G': case 'g': return FQCHK_G;
        case 'T': case 't': return FQCHK_T;
        default:            return FQCHK_N;
      }
    }

    /// counts for one read position
    struct position_stats {
        uint64_t bases[FQCHK_NUM_BASES];

        /// by Phred score
        std::vector<uint64_t> quals;

        position_stats() : quals(phred_error_table::max_score + 1, 0) {
          for (int i = 0; i < FQCHK_NUM_BASES; ++i) bases[i] = 0;
        }

        void merge(position_stats const & other) {
          for (int i = 0; i < FQCHK_NUM_BASES; ++i) bases[i] += other.bases[i];
          for (size_t q = 0; q < quals.size(); ++q) quals[q] += other.quals[q];
        }
    };

    /**
     * @brief one report row, computed from a position_stats.
     * @details errQ is -10 log10 of the mean error probability.  %low counts scores below the threshold.
     */
    struct fqchk_row {
        uint64_t nbases;
        double base_pct[FQCHK_NUM_BASES];
        double avg_q;
        double err_q;
        double low_pct;
        double high_pct;

        fqchk_row(position_stats const & p, phred_error_table const & perr, unsigned int const & threshold) {
          double sum = 0.0, sum_low = 0.0, q_sum = 0.0, p_sum = 0.0;
          for (size_t q = 0; q < p.quals.size(); ++q) {
            double c = static_cast<double>(p.quals[q]);
            sum += c;
            if (q < threshold) sum_low += c;
            q_sum += c * q;
            p_sum += c * perr[q];
          }
          nbases = static_cast<uint64_t>(sum);
          if (sum == 0.0) sum = 1.0;

          for (int i = 0; i < FQCHK_NUM_BASES; ++i) base_pct[i] = 100.0 * p.bases[i] / sum;
          avg_q = q_sum / sum;
          err_q = -10.0 * std::log10((p_sum + 1e-6) / (sum + 1e-6));
          low_pct = 100.0 * sum_low / sum;
          high_pct = 100.0 * (sum - sum_low) / sum;
        }

        /// tab separated, in the stream's current number format
        friend std::ostream& operator<<(std::ostream & ost, fqchk_row const & r) {
          ost << r.nbases;
          for (int i = 0; i < FQCHK_NUM_BASES; ++i) ost << "\t" << r.base_pct[i];
          ost << "\t" << r.avg_q << "\t" << r.err_q << "\t" << r.low_pct << "\t" << r.high_pct;
          return ost;
        }
    };

    /**
     * @class quality_stats
     * @brief accumulates position_stats over FASTQ records, for a single thread.
     */
    class quality_stats {
      protected:
        phred_error_table const & perr;

        std::vector<position_stats> positions;

        uint64_t min_len;
        uint64_t max_len;
        uint64_t total_len;
        uint64_t nreads;

      public:
        explicit quality_stats(phred_error_table const & _perr) :
          perr(_perr), positions(), min_len(std::numeric_limits<uint64_t>::max()), max_len(0), total_len(0), nreads(0) {}

        /**
         * @brief count the bases and qualities of one read
         * @throw std::invalid_argument if sequence and quality lengths differ.
         *        std::out_of_range for a quality character outside the Phred range.
         */
        template <typename Record>
        void add(Record const & r) {
          size_t len = r.seq_size();
          if (r.qual_size() != len) {
            throw std::invalid_argument("ERROR: sequence and quality lengths differ for " + r.header_string());
          }
          if (positions.size() < len) positions.resize(len);

          auto s = r.seq_begin;
          auto q = r.qual_begin;
          for (size_t i = 0; i < len; ++i, ++s, ++q) {
            position_stats & p = positions[i];
            ++p.bases[fqchk_base(*s)];
            ++p.quals[perr.score(*q)];
          }

          if (len < min_len) min_len = len;
          if (len > max_len) max_len = len;
          total_len += len;
          ++nreads;
        }

        uint64_t get_read_count() const {
          return nreads;
        }

        /// 0 when no reads were added
        uint64_t get_min_length() const {
          return nreads == 0 ? 0 : min_len;
        }

        uint64_t get_max_length() const {
          return max_len;
        }

        double get_avg_length() const {
          return nreads == 0 ? 0.0 : static_cast<double>(total_len) / nreads;
        }

        std::vector<position_stats> const & get_positions() const {
          return positions;
        }

        /// all positions merged
        position_stats total() const {
          position_stats all;
          for (size_t i = 0; i < positions.size(); ++i) all.merge(positions[i]);
          return all;
        }

        /**
         * @brief write the length summary, the column header, the ALL row, then one row per position.
         * @param threshold   Phred score separating %low from %high
         */
        void report(std::ostream & ost, unsigned int const & threshold) const {
          std::ios::fmtflags flags = ost.flags();
          std::streamsize precision = ost.precision();

          ost << std::fixed << std::setprecision(2);
          ost << "min_len: " << get_min_length() << "; max_len: " << max_len
              << "; avg_len: " << get_avg_length() << "\n";

          ost << std::setprecision(1);
          ost << "POS\t#bases\t%A\t%C\t%G\t%T\t%N\tavgQ\terrQ\t%low\t%high\n";
          ost << "ALL\t" << fqchk_row(total(), perr, threshold) << "\n";
          for (size_t i = 0; i < positions.size(); ++i) {
            ost << (i + 1) << "\t" << fqchk_row(positions[i], perr, threshold) << "\n";
          }

          ost.flags(flags);
          ost.precision(precision);
        }
    };

  } // namespace common
} // namespace fastmap

#endif /* QUALITY_STATS_HPP_ */
