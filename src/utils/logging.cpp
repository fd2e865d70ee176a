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
 * @file    logging.cpp
 * @ingroup utils
 * @brief   out of line parts of the boost::log based logging engine.
 * @details only the FASTMAP_LOGGING_BOOST_CUSTOM engine needs a translation unit: the
 *          global severity logger, the level names, and the sink setup.  for every
 *          other engine this file compiles to nothing.
 */

#include "utils/logging.h"

#if USE_LOGGER == FASTMAP_LOGGING_BOOST_CUSTOM

#include <iostream>

#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/core/null_deleter.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

namespace fastmap
{

namespace log
{

  namespace logging = boost::log;
  namespace src = boost::log::sources;
  namespace expr = boost::log::expressions;
  namespace sinks = boost::log::sinks;

  src::severity_logger_mt<severity_level> global_logger;

  std::ostream& operator<< (std::ostream& strm, severity_level level)
  {
    static const char* strings[] =
    {
      "trace",
      "debug",
      "info ",
      "warn ",
      "error",
      "fatal"
    };

    if (static_cast< std::size_t >(level) < sizeof(strings) / sizeof(*strings))
      strm << strings[level];
    else
      strm << static_cast< int >(level);

    return strm;
  }

  void init()
  {
    boost::shared_ptr< logging::core > core = logging::core::get();

    boost::shared_ptr< sinks::text_ostream_backend > backend =
        boost::make_shared< sinks::text_ostream_backend >();
    backend->add_stream(
        boost::shared_ptr< std::ostream >(&std::clog, boost::null_deleter()));
    backend->auto_flush(true);

    // worker threads log concurrently, so the frontend synchronizes.
    typedef sinks::synchronous_sink< sinks::text_ostream_backend > sink_t;
    boost::shared_ptr< sink_t > sink(new sink_t(backend));

    sink->set_formatter(expr::stream
        << expr::format_date_time< boost::posix_time::ptime >("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << ": <" << severity << ">\t"
        << expr::smessage);

    core->add_sink(sink);
    logging::add_common_attributes();
  }

} // namespace log

} // namespace fastmap

#endif
