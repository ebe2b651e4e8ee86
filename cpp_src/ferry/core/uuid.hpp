#ifndef FERRY_CORE_UUID_HPP
#define FERRY_CORE_UUID_HPP

#include <boost/optional.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/nil_generator.hpp>
#include <string>

namespace ferry {
namespace core {

//! Identifies a node of the ring
typedef boost::uuids::uuid uuid;

/*!
    Parses a node identifier, given either as 16 raw bytes (the form
    carried by RingState) or as canonical hexadecimal. The nil uuid is
    never a valid node identifier.
*/
boost::optional<uuid> try_parse_uuid(const std::string &);

/// As try_parse_uuid(), but throws ferry_exception on failure
uuid parse_uuid(const std::string &);

inline std::string to_hex(const uuid & id)
{ return boost::uuids::to_string(id); }

inline std::string to_bytes(const uuid & id)
{ return std::string(id.begin(), id.end()); }

}
}

#endif
