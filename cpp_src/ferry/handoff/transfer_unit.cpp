#include "ferry/handoff/transfer_unit.hpp"
#include "ferry/handoff/handoff_error.hpp"
#include "ferry/error.hpp"
#include "ferry/log.hpp"
#include <functional>
#include <atomic>
#include <stdexcept>

namespace ferry {
namespace handoff {

namespace {

std::atomic<uint64_t> _next_unit_id(1);

}

void transport_handle::terminate(
    const boost::system::error_code & reason) const
{
    transfer_unit::ptr_t unit = _unit.lock();
    if(unit)
    {
        unit->terminate(reason);
    }
}

transfer_unit::transfer_unit(const core::io_service_ptr_t & io_service)
 : _io_service(io_service),
   _id(_next_unit_id++),
   _started(false),
   _exited(false)
{
    FERRY_ASSERT(_io_service);
}

transfer_unit::~transfer_unit()
{
    bool exited;
    {
        spinlock::guard guard(_lock);

        exited = _exited;
        if(!_exited)
        {
            _exited = true;
            _exit_reason = make_error_code(transfer_lost);
        }
    }

    if(!exited)
    {
        LOG_WARN("transfer unit " << _name << " destroyed without exiting");

        // no weak reference can be formed during destruction
        fire_monitors(transport_handle(_id, weak_ptr_t()));
    }
}

transport_handle transfer_unit::get_handle()
{
    return transport_handle(_id, shared_from_this());
}

void transfer_unit::set_name(std::string && name)
{
    FERRY_ASSERT(_name.empty());
    FERRY_ASSERT(!name.empty());

    _name = std::move(name);
}

void transfer_unit::start()
{
    {
        spinlock::guard guard(_lock);

        FERRY_ASSERT(!_started);
        _started = true;
    }

    _io_service->post(std::bind(&transfer_unit::on_start,
        shared_from_this()));
}

void transfer_unit::terminate(const boost::system::error_code & reason)
{
    FERRY_ASSERT(reason);

    if(has_exited())
    {
        return;
    }

    LOG_INFO("terminating transfer unit " << _name << ": " << reason.message());

    exit(reason);

    _io_service->post(std::bind(&transfer_unit::on_halt,
        weak_ptr_t(shared_from_this())));
}

void transfer_unit::add_monitor(const monitor_callback_t & callback)
{
    boost::system::error_code reason;
    {
        spinlock::guard guard(_lock);

        if(!_exited)
        {
            _monitors.push_back(callback);
            return;
        }
        reason = _exit_reason;
    }

    // already exited; notify immediately
    callback(get_handle(), reason);
}

bool transfer_unit::has_exited() const
{
    spinlock::guard guard(_lock);
    return _exited;
}

boost::system::error_code transfer_unit::get_exit_reason() const
{
    spinlock::guard guard(_lock);

    FERRY_ASSERT(_exited);
    return _exit_reason;
}

void transfer_unit::exit(const boost::system::error_code & reason)
{
    {
        spinlock::guard guard(_lock);

        if(_exited)
        {
            return;
        }
        _exited = true;
        _exit_reason = reason;
    }

    LOG_DBG(_name << " exited: " << (reason ? reason.message() : "normal"));

    fire_monitors(get_handle());
}

void transfer_unit::post_step(const std::function<void()> & step)
{
    _io_service->post(std::bind(&transfer_unit::on_step,
        shared_from_this(), step));
}

void transfer_unit::fire_monitors(const transport_handle & handle)
{
    std::vector<monitor_callback_t> monitors;
    boost::system::error_code reason;
    {
        spinlock::guard guard(_lock);

        monitors.swap(_monitors);
        reason = _exit_reason;
    }

    for(const monitor_callback_t & monitor : monitors)
    {
        monitor(handle, reason);
    }
}

void transfer_unit::on_start(const ptr_t & unit)
{
    if(unit->has_exited())
    {
        // terminated before it could run
        return;
    }

    on_step(unit, std::bind(&transfer_unit::run_transfer, unit.get()));
}

void transfer_unit::on_halt(const weak_ptr_t & weak_unit)
{
    // silently ignore units which have already been destroyed
    ptr_t unit = weak_unit.lock();
    if(!unit)
    {
        return;
    }

    try
    {
        unit->halt_transfer();
    }
    catch(const std::exception & exc)
    {
        LOG_ERR(unit->get_name() << " halt_transfer() threw: " << exc.what());
    }
}

void transfer_unit::on_step(const ptr_t & unit,
    const std::function<void()> & step)
{
    try
    {
        step();
    }
    catch(const std::exception & exc)
    {
        LOG_ERR(unit->get_name() << " failed: " << exc.what());
        unit->exit(make_error_code(transfer_failed));
    }
}

}
}

