#include "awsid/Copyright.hpp"
#pragma once
#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>

#include <sstream>
#include <stdexcept>

#define AWSID_THROW(Exception, x) {\
    std::ostringstream os;\
    os << x << " at " << __FILE__ << ':' << __LINE__ << '\n'\
        << boost::lexical_cast<std::string>(boost::stacktrace::stacktrace());\
    throw Exception(os.str()); \
}

/// same as AWSID_THROW, the extra args are forwarded to the Exception ctor after the message
#define AWSID_THROW_WITH(Exception, x, ...) {\
    std::ostringstream os;\
    os << x << " at " << __FILE__ << ':' << __LINE__ << '\n'\
        << boost::lexical_cast<std::string>(boost::stacktrace::stacktrace());\
    throw Exception(os.str(), __VA_ARGS__); \
}
