#ifndef FERRY_HANDOFF_HANDOFF_ID_HPP
#define FERRY_HANDOFF_HANDOFF_ID_HPP

#include "ferry/core/uuid.hpp"
#include <boost/optional.hpp>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>

namespace ferry {
namespace handoff {

enum class direction
{
    outbound,
    inbound
};

std::ostream & operator<<(std::ostream &, direction);

//! Identifies the partition being handed off, and its remote node
/*!
    Inbound handoffs learn their partition only once negotiated with
    the sender, and are identified by an unset handoff_id.
*/
struct handoff_id
{
    handoff_id()
     : node(boost::uuids::nil_uuid())
    { }

    handoff_id(const std::string & module, uint64_t partition,
        const core::uuid & node)
     : module(module),
       partition(partition),
       node(node)
    { }

    bool is_unset() const
    { return module.empty() && !partition && node.is_nil(); }

    std::string module;
    boost::optional<uint64_t> partition;
    core::uuid node;
};

bool operator==(const handoff_id &, const handoff_id &);

inline bool operator!=(const handoff_id & lhs, const handoff_id & rhs)
{ return !(lhs == rhs); }

std::ostream & operator<<(std::ostream &, const handoff_id &);

//! Free-form progress of a transfer, as reported by its unit
typedef std::map<std::string, std::string> transfer_status_t;

//! Entry of a handoff_manager::handoff_status() snapshot
struct handoff_status
{
    handoff_id id;
    handoff::direction direction;

    // always "active": only live handoffs are tracked
    std::string state;

    transfer_status_t status;
};

}
}

#endif

