#include "ferry/error.hpp"
#include "ferry/log.hpp"

namespace ferry {
namespace error {

namespace {

std::string describe(const std::string & expression, const std::string & msg)
{
    std::string out = "check failed: " + expression;

    if(!msg.empty())
    {
        out += " (" + msg + ")";
    }
    return out;
}

}

ferry_exception::ferry_exception(
    const std::string & expression,
    const std::string & msg,
    const char * file,
    const char * func,
    unsigned line_no)
 : std::runtime_error(describe(expression, msg)),
   expression(expression),
   msg(msg),
   file(file),
   func(func),
   line_no(line_no)
{ }

void throw_assertion_failure(
    const char * expression,
    const std::string & msg,
    const char * file,
    const char * func,
    unsigned line_no)
{
    ferry_exception exc(expression, msg, file, func, line_no);

    LOG_DBG(exc.what() << " at " << file << ":" << line_no);
    throw exc;
}

}
}
