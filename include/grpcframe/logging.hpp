//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef GRPCFRAME_LOGGING_HPP
#define GRPCFRAME_LOGGING_HPP

#include <boost/log/trivial.hpp>

namespace grpcframe::log {

using severity = boost::log::trivial::severity_level;

// Only records with at least this severity are emitted. Affects the global Boost.Log core
void set_level(severity level);

}  // namespace grpcframe::log

#define GRPCFRAME_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define GRPCFRAME_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define GRPCFRAME_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define GRPCFRAME_LOG_WARNING BOOST_LOG_TRIVIAL(warning)
#define GRPCFRAME_LOG_ERROR BOOST_LOG_TRIVIAL(error)

#endif
