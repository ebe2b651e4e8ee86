#ifndef FERRY_ERROR_HPP
#define FERRY_ERROR_HPP

#include <stdexcept>
#include <string>

/*!
    Checked preconditions & invariants. A failed check throws
    ferry::error::ferry_exception, naming the failed expression and its
    location in the source.
*/
#define FERRY_ASSERT(arg)\
{\
    if(__builtin_expect(!(bool)(arg), 0))\
    {\
        ferry::error::throw_assertion_failure(#arg, std::string(),\
            __FILE__, __PRETTY_FUNCTION__, __LINE__);\
    }\
}

#define FERRY_ASSERT_MSG(arg, msg)\
{\
    if(__builtin_expect(!(bool)(arg), 0))\
    {\
        ferry::error::throw_assertion_failure(#arg, (msg),\
            __FILE__, __PRETTY_FUNCTION__, __LINE__);\
    }\
}

namespace ferry {
namespace error {

class ferry_exception : public std::runtime_error
{
public:

    ferry_exception(
        const std::string & expression,
        const std::string & msg,
        const char * file,
        const char * func,
        unsigned line_no);

    /// Source text of the failed check
    const std::string expression;

    /// Optional detail; may be empty
    const std::string msg;

    const char * const file;
    const char * const func;
    const unsigned line_no;
};

void throw_assertion_failure(
    const char * expression,
    const std::string & msg,
    const char * file,
    const char * func,
    unsigned line_no);

}
}

#endif
