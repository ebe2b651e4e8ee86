#include "ferry/handoff/handoff_id.hpp"
#include <ostream>

namespace ferry {
namespace handoff {

std::ostream & operator<<(std::ostream & out, direction dir)
{
    return out << (dir == direction::outbound ? "outbound" : "inbound");
}

bool operator==(const handoff_id & lhs, const handoff_id & rhs)
{
    return lhs.module == rhs.module &&
        lhs.partition == rhs.partition &&
        lhs.node == rhs.node;
}

std::ostream & operator<<(std::ostream & out, const handoff_id & id)
{
    if(id.is_unset())
    {
        return out << "{undefined}";
    }

    out << "{" << id.module << ", ";

    if(id.partition)
        out << *id.partition;
    else
        out << "undefined";

    return out << ", " << id.node << "}";
}

}
}

