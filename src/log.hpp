#pragma once

// Internal logging macros over the Boost.Log trivial logger.

#include <boost/log/trivial.hpp>

#define SCOPEDI_LOG_TRACE   BOOST_LOG_TRIVIAL(trace)   << "[scopedi] "
#define SCOPEDI_LOG_DEBUG   BOOST_LOG_TRIVIAL(debug)   << "[scopedi] "
#define SCOPEDI_LOG_INFO    BOOST_LOG_TRIVIAL(info)    << "[scopedi] "
#define SCOPEDI_LOG_WARNING BOOST_LOG_TRIVIAL(warning) << "[scopedi] "
#define SCOPEDI_LOG_ERROR   BOOST_LOG_TRIVIAL(error)   << "[scopedi] "
