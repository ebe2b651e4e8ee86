#ifndef FERRY_HANDOFF_EXCLUSION_SET_HPP
#define FERRY_HANDOFF_EXCLUSION_SET_HPP

#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ferry {
namespace handoff {

//! Set of (module, partition) pairs barred from inbound handoff
/*!
    Not synchronized: it's owned by the handoff_manager's serialized
    context.
*/
class exclusion_set
{
public:

    typedef std::pair<std::string, uint64_t> entry_t;

    /// \return true iff the entry was not already present
    bool add(const std::string & module, uint64_t partition);

    /// \return true iff the entry was present
    bool remove(const std::string & module, uint64_t partition);

    bool contains(const std::string & module, uint64_t partition) const;

    /// Excluded partitions of `module`, in ascending order
    std::vector<uint64_t> get_exclusions(const std::string & module) const;

    size_t size() const
    { return _entries.size(); }

private:

    typedef std::set<entry_t> entries_t;
    entries_t _entries;
};

}
}

#endif

