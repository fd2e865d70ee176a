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
 * @file    io_exception.hpp
 * @ingroup io
 * @author  Tony Pan <tpan7@gatech.edu>
 * @brief   exception type for file access and record format failures.
 */
#ifndef IO_EXCEPTION_HPP_
#define IO_EXCEPTION_HPP_

#include <exception>
#include <string>
#include <ostream>

namespace fastmap
{
  namespace io
  {

    /// categories of failures reported through IOException
    enum class IOErrorType : int {
      OPEN_FILE = 0,          ///< path could not be opened
      METADATA_FILE,          ///< file size could not be queried
      MMAP_FILE,              ///< mmap failed
      NO_NEWLINE_IN_BLOCK,    ///< backward scan ran out of line terminators
      NOT_A_FASTA_FILE,       ///< no '>' record start within the scan budget
      NOT_A_FASTQ_FILE,       ///< four line cadence could not be confirmed
      PARTIAL_RECORD          ///< a record runs past the end of its block
    };

    /// short name of an IOErrorType
    inline const char* to_string(IOErrorType const & type) {
      switch (type) {
        case IOErrorType::OPEN_FILE:            return "OpenFile";
        case IOErrorType::METADATA_FILE:        return "MetaDataFile";
        case IOErrorType::MMAP_FILE:            return "MapFile";
        case IOErrorType::NO_NEWLINE_IN_BLOCK:  return "NoNewLineInBlock";
        case IOErrorType::NOT_A_FASTA_FILE:     return "NotAFastaFile";
        case IOErrorType::NOT_A_FASTQ_FILE:     return "NotAFastqFile";
        case IOErrorType::PARTIAL_RECORD:       return "PartialRecord";
      }
      return "Unknown";
    }

    inline std::ostream& operator<<(std::ostream & ost, IOErrorType const & type) {
      ost << to_string(type);
      return ost;
    }

    /**
     * @class     IOException
     * @brief     derived from std exception to represent an IO or format exception
     * @details   kind() tells the failure category, what() the details.
     */
    class IOException : public std::exception
    {
      protected:
        /// failure category
        IOErrorType type;

        /// internal error message string
        std::string message;

      public:
        /**
         * @brief constructor
         * @param _type   failure category
         * @param _msg    error message for the exception
         */
        IOException(IOErrorType const & _type, const std::string &_msg) : type(_type), message(_msg) {}

        IOException(IOException const & other) = default;
        IOException(IOException && other) = default;
        IOException& operator=(IOException const & other) = default;
        IOException& operator=(IOException && other) = default;

        virtual ~IOException() {};

        /// failure category of this exception
        IOErrorType kind() const {
          return type;
        }

        /**
         * @brief   overridden method to retrieve the content of the error message.
         * @return  actual error message.
         */
        virtual const char* what() const throw ()
        {
          return message.c_str();
        }
    };
  } /* namespace io */
} /* namespace fastmap */

#endif /* IO_EXCEPTION_HPP_ */
