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
 * @file    exception_handling.hpp
 * @ingroup utils
 * @author  tpan
 * @brief   helpers for constructing exceptions that are logged where they originate.
 * @details usage:  throw ::fastmap::utils::make_exception<::fastmap::io::IOException>(type, ss.str());
 */
#ifndef SRC_UTILS_EXCEPTION_HANDLING_HPP_
#define SRC_UTILS_EXCEPTION_HANDLING_HPP_

#include <string>
#include <utility>  // forward

#include "utils/logging.h"

namespace fastmap {

  namespace utils {

    /// log msg at error level, then return an EXCEPTION constructed from it.
    template <typename EXCEPTION>
    inline EXCEPTION make_exception(::std::string const & msg) {
      FM_ERROR(msg);
      return EXCEPTION(msg);
    }

    /// log msg at error level, then return an EXCEPTION constructed from a leading argument (e.g. an error type) and msg
    template <typename EXCEPTION, typename FIRST>
    inline EXCEPTION make_exception(FIRST && first, ::std::string const & msg) {
      FM_ERROR(msg);
      return EXCEPTION(::std::forward<FIRST>(first), msg);
    }

  }
}

#endif /* SRC_UTILS_EXCEPTION_HANDLING_HPP_ */
