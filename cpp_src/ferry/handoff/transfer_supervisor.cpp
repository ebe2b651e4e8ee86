#include "ferry/handoff/transfer_supervisor.hpp"
#include "ferry/error.hpp"
#include "ferry/log.hpp"
#include <functional>
#include <boost/lexical_cast.hpp>
#include <vector>

namespace ferry {
namespace handoff {

transfer_supervisor::transfer_supervisor(const std::string & role)
 : _role(role)
{
    FERRY_ASSERT(!_role.empty());
}

transfer_supervisor::~transfer_supervisor()
{
    spinlock::guard guard(_lock);

    if(!_units.empty())
    {
        LOG_WARN(_role << " supervisor destroyed with " << _units.size() \
            << " active units");
    }
}

transport_handle transfer_supervisor::start_unit(
    const transfer_unit::ptr_t & unit,
    const transfer_unit::monitor_callback_t & monitor)
{
    FERRY_ASSERT(unit);
    FERRY_ASSERT(unit->get_name().empty());

    unit->set_name(_role + "-" + boost::lexical_cast<std::string>(
        unit->get_id()));

    {
        spinlock::guard guard(_lock);

        FERRY_ASSERT(_units.insert(std::make_pair(
            unit->get_id(), transfer_unit::weak_ptr_t(unit))).second);
    }

    unit->add_monitor(std::bind(&transfer_supervisor::on_unit_exit,
        std::weak_ptr<transfer_supervisor>(shared_from_this()),
        std::placeholders::_1, std::placeholders::_2));

    if(monitor)
    {
        unit->add_monitor(monitor);
    }

    unit->start();

    LOG_DBG("started " << unit->get_name());
    return unit->get_handle();
}

size_t transfer_supervisor::count_active() const
{
    spinlock::guard guard(_lock);
    return _units.size();
}

void transfer_supervisor::terminate_all(
    const boost::system::error_code & reason)
{
    std::vector<transfer_unit::ptr_t> units;
    {
        spinlock::guard guard(_lock);

        for(const units_t::value_type & entry : _units)
        {
            transfer_unit::ptr_t unit = entry.second.lock();
            if(unit)
            {
                units.push_back(unit);
            }
        }
    }

    // terminate outside of the lock, as monitors re-enter on_unit_exit
    for(const transfer_unit::ptr_t & unit : units)
    {
        unit->terminate(reason);
    }
}

void transfer_supervisor::on_unit_exit(
    const std::weak_ptr<transfer_supervisor> & weak_self,
    const transport_handle & handle,
    const boost::system::error_code &)
{
    ptr_t self = weak_self.lock();
    if(!self)
    {
        return;
    }

    spinlock::guard guard(self->_lock);

    units_t::iterator it = self->_units.find(handle.get_id());
    if(it != self->_units.end())
    {
        self->_units.erase(it);
    }
}

}
}

