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
 * @file    logging.h
 * @ingroup utils
 * @brief   logging macros for fastmap, with severity levels and a configurable engine.
 *
 * Two macro families are available:
 *   stream style, taking anything with an operator<<:
 *      FM_FATAL(msg), FM_ERROR(msg), FM_WARNING(msg), FM_INFO(msg), FM_DEBUG(msg), FM_TRACE(msg)
 *      e.g.  FM_DEBUG("block " << r << " corrected to " << len << " bytes");
 *   printf style, suffixed with F:
 *      FM_FATALF(fmt, ...), FM_ERRORF(fmt, ...), ... FM_TRACEF(fmt, ...)
 *      e.g.  FM_INFOF("parsed %lu records", count);
 *
 * No trailing newline is needed.  The printf style macros are preferred inside
 * OpenMP regions since a single printf call does not interleave with other threads.
 *
 * The verbosity names the least severe level that is still printed.  Levels below
 * it compile to empty statements.  FATAL always prints and exits.
 *
 * The engine (USE_LOGGER) and verbosity (LOGGER_VERBOSITY) come from the cmake generated
 * fastmap-logger_config.hpp.  LOG_INIT() must be called once, in main, before logging.
 *
 * The boost engines need -DBOOST_LOG_DYN_LINK and linking against boost_log and boost_log_setup.
 */

#ifndef FASTMAP_LOGGING_H
#define FASTMAP_LOGGING_H

// cast to void to suppress unused vars when log level is set to minimal.
#define USED_BY_LOGGER_ONLY(x) do { (void)(x); } while (0)


/// LOG ENGINE TYPES
// Disable logging
#define FASTMAP_LOGGING_NO_LOG         1
// Use std::cerr output for logging (not thread safe)
#define FASTMAP_LOGGING_CERR           2
// Use boost::log::trivial for logging
#define FASTMAP_LOGGING_BOOST_TRIVIAL  3
// Use boost::log with a severity logger and timestamped sink
#define FASTMAP_LOGGING_BOOST_CUSTOM   4
// using printf
#define FASTMAP_LOGGING_PRINTF         5

/// logger verbosity, in increasing order.
#define FASTMAP_LOGGER_VERBOSITY_FATAL   0
#define FASTMAP_LOGGER_VERBOSITY_ERROR   1
#define FASTMAP_LOGGER_VERBOSITY_WARNING 2
#define FASTMAP_LOGGER_VERBOSITY_INFO    3
#define FASTMAP_LOGGER_VERBOSITY_DEBUG   4
#define FASTMAP_LOGGER_VERBOSITY_TRACE   5

#include "fastmap-logger_config.hpp"

#ifndef USE_LOGGER
#define USE_LOGGER FASTMAP_LOGGING_PRINTF
#endif

#ifndef LOGGER_VERBOSITY
#define LOGGER_VERBOSITY FASTMAP_LOGGER_VERBOSITY_WARNING
#endif

#include "utils/logging_internal.h"


#if LOGGER_VERBOSITY >= FASTMAP_LOGGER_VERBOSITY_FATAL
#define FM_FATAL(msg)       PRINT_FATAL(msg)
#define FM_FATALF(msg, ...) PRINT_FATALF(msg, ##__VA_ARGS__)
#else
#define FM_FATAL(msg)       NOPRINT_FATAL(msg)
#define FM_FATALF(msg, ...) NOPRINT_FATALF(msg, ##__VA_ARGS__)
#endif

#if LOGGER_VERBOSITY >= FASTMAP_LOGGER_VERBOSITY_ERROR
#define FM_ERROR(msg)       PRINT_ERROR(msg)
#define FM_ERRORF(msg, ...) PRINT_ERRORF(msg, ##__VA_ARGS__)
#else
#define FM_ERROR(msg)       NOPRINT_ERROR(msg)
#define FM_ERRORF(msg, ...) NOPRINT_ERRORF(msg, ##__VA_ARGS__)
#endif

#if LOGGER_VERBOSITY >= FASTMAP_LOGGER_VERBOSITY_WARNING
#define FM_WARNING(msg)       PRINT_WARNING(msg)
#define FM_WARNINGF(msg, ...) PRINT_WARNINGF(msg, ##__VA_ARGS__)
#else
#define FM_WARNING(msg)       NOPRINT_WARNING(msg)
#define FM_WARNINGF(msg, ...) NOPRINT_WARNINGF(msg, ##__VA_ARGS__)
#endif

#if LOGGER_VERBOSITY >= FASTMAP_LOGGER_VERBOSITY_INFO
#define FM_INFO(msg)       PRINT_INFO(msg)
#define FM_INFOF(msg, ...) PRINT_INFOF(msg, ##__VA_ARGS__)
#else
#define FM_INFO(msg)       NOPRINT_INFO(msg)
#define FM_INFOF(msg, ...) NOPRINT_INFOF(msg, ##__VA_ARGS__)
#endif

#if LOGGER_VERBOSITY >= FASTMAP_LOGGER_VERBOSITY_DEBUG
#define FM_DEBUG(msg)       PRINT_DEBUG(msg)
#define FM_DEBUGF(msg, ...) PRINT_DEBUGF(msg, ##__VA_ARGS__)
#else
#define FM_DEBUG(msg)       NOPRINT_DEBUG(msg)
#define FM_DEBUGF(msg, ...) NOPRINT_DEBUGF(msg, ##__VA_ARGS__)
#endif

#if LOGGER_VERBOSITY >= FASTMAP_LOGGER_VERBOSITY_TRACE
#define FM_TRACE(msg)       PRINT_TRACE(msg)
#define FM_TRACEF(msg, ...) PRINT_TRACEF(msg, ##__VA_ARGS__)
#else
#define FM_TRACE(msg)       NOPRINT_TRACE(msg)
#define FM_TRACEF(msg, ...) NOPRINT_TRACEF(msg, ##__VA_ARGS__)
#endif


#ifndef LOG_INIT
#define LOG_INIT() ;
#endif

#endif // FASTMAP_LOGGING_H
