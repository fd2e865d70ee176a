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
 * @file    logging_internal.h
 * @ingroup utils
 * @brief   engine specific PRINT_* and NOPRINT_* macros behind the FM_* logging macros.
 * @details include utils/logging.h instead of this file.
 *
 *  every macro uses the "do {...} while (false)" form so it behaves as a single statement
 *  inside if/else.  the definitions carry no trailing semicolon.
 */

#ifndef FASTMAP_LOGGING_INTERNAL_H
#define FASTMAP_LOGGING_INTERNAL_H

#include <cstdio>   // printf, snprintf
#include <cstdlib>  // exit
#include <sstream>

/// non-printing versions.  fatal still prints and exits.
#define NOPRINT_FATAL(msg) do { std::stringstream ss; ss << msg; printf("[fatal] %s\n", ss.str().c_str());  exit(-1); } while (false)
#define NOPRINT_ERROR(msg) do {} while (false)
#define NOPRINT_WARNING(msg) do {} while (false)
#define NOPRINT_INFO(msg) do {} while (false)
#define NOPRINT_DEBUG(msg) do {} while (false)
#define NOPRINT_TRACE(msg) do {} while (false)

#define NOPRINT_FATALF(msg, ...) do { printf("[fatal] " msg "\n", ##__VA_ARGS__); exit(-1); } while (false)
#define NOPRINT_ERRORF(msg, ...) do {} while (false)
#define NOPRINT_WARNINGF(msg, ...) do {} while (false)
#define NOPRINT_INFOF(msg, ...) do {} while (false)
#define NOPRINT_DEBUGF(msg, ...) do {} while (false)
#define NOPRINT_TRACEF(msg, ...) do {} while (false)



#if USE_LOGGER == FASTMAP_LOGGING_NO_LOG

#define PRINT_FATAL(msg) NOPRINT_FATAL(msg)
#define PRINT_ERROR(msg) do {} while (false)
#define PRINT_WARNING(msg) do {} while (false)
#define PRINT_INFO(msg) do {} while (false)
#define PRINT_DEBUG(msg) do {} while (false)
#define PRINT_TRACE(msg) do {} while (false)


#elif USE_LOGGER == FASTMAP_LOGGING_CERR

// NOTE: not thread safe.  lines from different threads may interleave.
#include <iostream>

#define PRINT_FATAL(msg)      do { std::cerr << "[fatal] " << msg << std::endl << std::flush; exit(-1); } while (false)
#define PRINT_ERROR(msg)      do { std::cerr << "[error] " << msg << std::endl << std::flush; } while (false)
#define PRINT_WARNING(msg)    do { std::cerr << "[warn ] " << msg << std::endl << std::flush; } while (false)
#define PRINT_INFO(msg)       do { std::cerr << "[info ] " << msg << std::endl << std::flush; } while (false)
#define PRINT_DEBUG(msg)      do { std::cerr << "[debug] " << msg << std::endl << std::flush; } while (false)
#define PRINT_TRACE(msg)      do { std::cerr << "[trace] " << msg << std::endl << std::flush; } while (false)


#elif USE_LOGGER == FASTMAP_LOGGING_PRINTF

// message is formatted into a stringstream first, then written with one printf call.
#define PRINT_FATAL(msg)    do { std::stringstream ss; ss << msg; printf("[fatal] %s\n", ss.str().c_str());  exit(-1); } while (false)
#define PRINT_ERROR(msg)    do { std::stringstream ss; ss << msg; printf("[error] %s\n", ss.str().c_str());  } while (false)
#define PRINT_WARNING(msg)  do { std::stringstream ss; ss << msg; printf("[warn ] %s\n", ss.str().c_str());  } while (false)
#define PRINT_INFO(msg)     do { std::stringstream ss; ss << msg; printf("[info ] %s\n", ss.str().c_str());  } while (false)
#define PRINT_DEBUG(msg)    do { std::stringstream ss; ss << msg; printf("[debug] %s\n", ss.str().c_str());  } while (false)
#define PRINT_TRACE(msg)    do { std::stringstream ss; ss << msg; printf("[trace] %s\n", ss.str().c_str());  } while (false)


#elif USE_LOGGER == FASTMAP_LOGGING_BOOST_TRIVIAL

#include <boost/log/trivial.hpp>

#define PRINT_FATAL(msg)      do { BOOST_LOG_TRIVIAL(fatal) << msg;  exit(-1);  } while (false)
#define PRINT_ERROR(msg)      do { BOOST_LOG_TRIVIAL(error) << msg;   } while (false)
#define PRINT_WARNING(msg)    do { BOOST_LOG_TRIVIAL(warning) << msg; } while (false)
#define PRINT_INFO(msg)       do { BOOST_LOG_TRIVIAL(info) << msg;    } while (false)
#define PRINT_DEBUG(msg)      do { BOOST_LOG_TRIVIAL(debug) << msg;   } while (false)
#define PRINT_TRACE(msg)      do { BOOST_LOG_TRIVIAL(trace) << msg;   } while (false)


#elif USE_LOGGER == FASTMAP_LOGGING_BOOST_CUSTOM

#include <ostream>

#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>

namespace fastmap
{

namespace log
{

enum severity_level
{
    trace,
    debug,
    info,
    warning,
    error,
    fatal
};

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

/// defined in logging.cpp
extern boost::log::sources::severity_logger_mt<severity_level> global_logger;

/// fixed width name of the severity level
std::ostream& operator<< (std::ostream& strm, severity_level level);

/// attach a synchronized, timestamped clog sink and the common attributes.
void init();

} // namespace log

} // namespace fastmap

// prefix file and line
#define _FM_LOG_MSG(msg) __FILE__ << ":" << __LINE__ << ":\t" << msg

#define PRINT_FATAL(msg)      do { BOOST_LOG_SEV(fastmap::log::global_logger, fastmap::log::fatal) << _FM_LOG_MSG(msg); exit(-1);   } while (false)
#define PRINT_ERROR(msg)      do { BOOST_LOG_SEV(fastmap::log::global_logger, fastmap::log::error) << _FM_LOG_MSG(msg);   } while (false)
#define PRINT_WARNING(msg)    do { BOOST_LOG_SEV(fastmap::log::global_logger, fastmap::log::warning) << _FM_LOG_MSG(msg); } while (false)
#define PRINT_INFO(msg)       do { BOOST_LOG_SEV(fastmap::log::global_logger, fastmap::log::info) << _FM_LOG_MSG(msg);    } while (false)
#define PRINT_DEBUG(msg)      do { BOOST_LOG_SEV(fastmap::log::global_logger, fastmap::log::debug) << _FM_LOG_MSG(msg);   } while (false)
#define PRINT_TRACE(msg)      do { BOOST_LOG_SEV(fastmap::log::global_logger, fastmap::log::trace) << _FM_LOG_MSG(msg);   } while (false)

#define LOG_INIT() fastmap::log::init()

#else
#error "Invalid value of USE_LOGGER: logger not found."
#endif



/*******************************
 *  printf style macros        *
 *******************************/
#if USE_LOGGER == FASTMAP_LOGGING_NO_LOG

#define PRINT_FATALF(msg, ...) NOPRINT_FATALF(msg, ##__VA_ARGS__)
#define PRINT_ERRORF(msg, ...) do {} while (false)
#define PRINT_WARNINGF(msg, ...) do {} while (false)
#define PRINT_INFOF(msg, ...) do {} while (false)
#define PRINT_DEBUGF(msg, ...) do {} while (false)
#define PRINT_TRACEF(msg, ...) do {} while (false)

#elif USE_LOGGER == FASTMAP_LOGGING_PRINTF

// C++11 requires a space between the literal and the macro argument:  "[info ] " msg "\n".
#define PRINT_FATALF(msg, ...)   do { printf("[fatal] " msg "\n", ##__VA_ARGS__); exit(-1); } while (false)
#define PRINT_ERRORF(msg, ...)   do { printf("[error] " msg "\n", ##__VA_ARGS__); } while (false)
#define PRINT_WARNINGF(msg, ...) do { printf("[warn ] " msg "\n", ##__VA_ARGS__); } while (false)
#define PRINT_INFOF(msg, ...)    do { printf("[info ] " msg "\n", ##__VA_ARGS__); } while (false)
#define PRINT_DEBUGF(msg, ...)   do { printf("[debug] " msg "\n", ##__VA_ARGS__); } while (false)
#define PRINT_TRACEF(msg, ...)   do { printf("[trace] " msg "\n", ##__VA_ARGS__); } while (false)

#else
// stream based engines:  format into a buffer, then forward to the stream macro.
#define FASTMAP_SPRINTF_BUFFER_SIZE 256

#define _FM_PRINTF_VIA(PRINTER, msg, ...) do {\
        char buffer[FASTMAP_SPRINTF_BUFFER_SIZE]; \
        snprintf(buffer, FASTMAP_SPRINTF_BUFFER_SIZE, msg, ##__VA_ARGS__);\
        PRINTER(buffer);\
        } while (false)

#define PRINT_FATALF(msg, ...)   _FM_PRINTF_VIA(PRINT_FATAL, msg, ##__VA_ARGS__)
#define PRINT_ERRORF(msg, ...)   _FM_PRINTF_VIA(PRINT_ERROR, msg, ##__VA_ARGS__)
#define PRINT_WARNINGF(msg, ...) _FM_PRINTF_VIA(PRINT_WARNING, msg, ##__VA_ARGS__)
#define PRINT_INFOF(msg, ...)    _FM_PRINTF_VIA(PRINT_INFO, msg, ##__VA_ARGS__)
#define PRINT_DEBUGF(msg, ...)   _FM_PRINTF_VIA(PRINT_DEBUG, msg, ##__VA_ARGS__)
#define PRINT_TRACEF(msg, ...)   _FM_PRINTF_VIA(PRINT_TRACE, msg, ##__VA_ARGS__)
#endif


#ifndef LOG_INIT
#define LOG_INIT() ;
#endif

#endif // FASTMAP_LOGGING_INTERNAL_H
