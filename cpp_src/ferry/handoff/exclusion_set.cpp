#include "ferry/handoff/exclusion_set.hpp"

namespace ferry {
namespace handoff {

bool exclusion_set::add(const std::string & module, uint64_t partition)
{
    return _entries.insert(entry_t(module, partition)).second;
}

bool exclusion_set::remove(const std::string & module, uint64_t partition)
{
    return _entries.erase(entry_t(module, partition)) != 0;
}

bool exclusion_set::contains(const std::string & module,
    uint64_t partition) const
{
    return _entries.count(entry_t(module, partition)) != 0;
}

std::vector<uint64_t> exclusion_set::get_exclusions(
    const std::string & module) const
{
    std::vector<uint64_t> result;

    // entries are ordered by module, then partition
    for(entries_t::const_iterator it = _entries.lower_bound(
            entry_t(module, 0));
        it != _entries.end() && it->first == module; ++it)
    {
        result.push_back(it->second);
    }
    return result;
}

}
}

