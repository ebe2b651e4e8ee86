#ifndef FERRY_LOG_HPP
#define FERRY_LOG_HPP

#include <iosfwd>
#include <iostream>
#include <string>

namespace ferry {
namespace log {

enum class severity
{
    debug,
    info,
    warning,
    error
};

// three-letter tag which leads each log line, eg "ERR"
std::ostream & operator<<(std::ostream &, severity);

unsigned gettid();

// quotes & escapes non-printable bytes, for logging of untrusted strings
std::string ascii_escape(const std::string &);

}
}

#define LOG_AT(sev, what) (std::cerr << (sev) << " [" \
    << ::ferry::log::gettid() << "] " << __FILE__ << ":" << __LINE__ \
    << " {" << __PRETTY_FUNCTION__ << "}: " << what << std::endl)

#ifdef FERRY_DISABLE_DEBUG_LOG
#define LOG_DBG(what) ((void)0)
#else
#define LOG_DBG(what) LOG_AT(::ferry::log::severity::debug, what)
#endif

#define LOG_INFO(what) LOG_AT(::ferry::log::severity::info, what)
#define LOG_WARN(what) LOG_AT(::ferry::log::severity::warning, what)
#define LOG_ERR(what)  LOG_AT(::ferry::log::severity::error, what)

#endif
