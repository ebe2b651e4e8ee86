#include "ferry/core/uuid.hpp"
#include "ferry/error.hpp"
#include "ferry/log.hpp"
#include <boost/uuid/string_generator.hpp>
#include <algorithm>
#include <stdexcept>

namespace ferry {
namespace core {

boost::optional<uuid> try_parse_uuid(const std::string & in)
{
    uuid out = boost::uuids::nil_uuid();

    if(in.size() == out.size())
    {
        std::copy(in.begin(), in.end(), out.begin());
    }
    else
    {
        try
        {
            out = boost::uuids::string_generator()(in);
        }
        catch(const std::runtime_error &)
        {
            return boost::none;
        }
    }

    if(out.is_nil())
    {
        return boost::none;
    }
    return out;
}

uuid parse_uuid(const std::string & in)
{
    boost::optional<uuid> out = try_parse_uuid(in);

    FERRY_ASSERT_MSG(out, "malformed node uuid " + log::ascii_escape(in));
    return *out;
}

}
}
