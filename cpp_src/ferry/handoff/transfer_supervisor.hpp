#ifndef FERRY_HANDOFF_TRANSFER_SUPERVISOR_HPP
#define FERRY_HANDOFF_TRANSFER_SUPERVISOR_HPP

#include "ferry/handoff/fwd.hpp"
#include "ferry/handoff/transfer_unit.hpp"
#include "ferry/spinlock.hpp"
#include <boost/system/error_code.hpp>
#include <map>
#include <memory>
#include <string>

namespace ferry {
namespace handoff {

class transfer_supervisor :
    public std::enable_shared_from_this<transfer_supervisor>
{
public:

    typedef transfer_supervisor_ptr_t ptr_t;

    /// Role names started units, eg "sender-12"
    transfer_supervisor(const std::string & role);

    ~transfer_supervisor();

    const std::string & get_role() const
    { return _role; }

    /*!
     * Names & monitors the unit, and posts a call to
     *  transfer_unit::run_transfer() on the unit's io_service.
     *
     * `monitor`, if set, is added to the unit before it starts, and so
     *  observes every exit of the unit including one from run_transfer().
     *
     * The unit is tracked by weak_ptr, and need not be externally
     *  referenced: it's kept alive by its own pending callbacks.
     */
    transport_handle start_unit(const transfer_unit_ptr_t &,
        const transfer_unit::monitor_callback_t & monitor =
            transfer_unit::monitor_callback_t());

    /// Number of started units which have not yet exited
    size_t count_active() const;

    /// Sends a termination signal to each active unit
    void terminate_all(const boost::system::error_code & reason);

private:

    static void on_unit_exit(const std::weak_ptr<transfer_supervisor> &,
        const transport_handle &, const boost::system::error_code &);

    const std::string _role;

    typedef std::map<uint64_t, transfer_unit_weak_ptr_t> units_t;
    units_t _units;

    mutable spinlock _lock;
};

}
}

#endif

