#include "ferry/log.hpp"

#include <unistd.h>
#include <sys/syscall.h>
#include <ostream>

namespace ferry {
namespace log {

std::ostream & operator<<(std::ostream & out, severity sev)
{
    switch(sev)
    {
    case severity::debug:   return out << "DBG";
    case severity::info:    return out << "INF";
    case severity::warning: return out << "WRN";
    case severity::error:   return out << "ERR";
    }
    return out << "???";
}

unsigned gettid()
{
    return static_cast<unsigned>(syscall(SYS_gettid));
}

std::string ascii_escape(const std::string & in)
{
    static const char hex_digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(in.size() + 2);

    out.push_back('"');
    for(unsigned char c : in)
    {
        switch(c)
        {
        case '\r': out += "\\r"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\\': out += "\\\\"; break;
        case '"':  out += "\\\""; break;
        default:
            if(c < 0x20 || c >= 0x7f)
            {
                out += "\\x";
                out.push_back(hex_digits[c >> 4]);
                out.push_back(hex_digits[c & 0xf]);
            }
            else
            {
                out.push_back(static_cast<char>(c));
            }
        }
    }
    out.push_back('"');
    return out;
}

}
}
