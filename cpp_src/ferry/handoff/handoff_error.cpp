#include "ferry/handoff/handoff_error.hpp"
#include <string>

namespace ferry {
namespace handoff {

namespace {

class handoff_category_impl :
    public boost::system::error_category
{
public:

    const char * name() const BOOST_SYSTEM_NOEXCEPT
    { return "ferry.handoff"; }

    std::string message(int ev) const
    {
        switch(static_cast<errc>(ev))
        {
        case max_concurrency:
            return "max_concurrency";
        case spawn_failed:
            return "failed to spawn transfer unit";
        case transfer_failed:
            return "transfer unit failed";
        case transfer_lost:
            return "transfer unit lost";
        case shutting_down:
            return "handoff manager is shutting down";
        }
        return "unknown handoff error";
    }
};

}

const boost::system::error_category & handoff_category()
{
    static handoff_category_impl instance;
    return instance;
}

}
}

