#ifndef FERRY_HANDOFF_TRANSFER_UNIT_HPP
#define FERRY_HANDOFF_TRANSFER_UNIT_HPP

#include "ferry/handoff/fwd.hpp"
#include "ferry/core/fwd.hpp"
#include "ferry/spinlock.hpp"
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ferry {
namespace handoff {

//! Opaque, weak reference to a running transfer_unit
/*!
    A transport_handle outlives its unit: once the unit has been destroyed
    the handle still identifies it, but terminate() becomes a no-op.
*/
class transport_handle
{
public:

    /// A null handle, which identifies no unit
    transport_handle()
     : _id(0)
    { }

    uint64_t get_id() const
    { return _id; }

    bool is_null() const
    { return _id == 0; }

    /// Returns nullptr if the unit has been destroyed
    transfer_unit_ptr_t lock() const
    { return _unit.lock(); }

    /// Forced-termination signal. Silently ignored for destroyed units.
    void terminate(const boost::system::error_code & reason) const;

    bool operator==(const transport_handle & other) const
    { return _id == other._id; }

    bool operator!=(const transport_handle & other) const
    { return _id != other._id; }

private:

    friend class transfer_unit;

    transport_handle(uint64_t id, const transfer_unit_weak_ptr_t & unit)
     : _id(id),
       _unit(unit)
    { }

    uint64_t _id;
    transfer_unit_weak_ptr_t _unit;
};

/*
A transfer_unit is the concurrently running half of a handoff: it streams
a partition's data to (or from) a remote node, on its own io_service.

Units are started by a transfer_supervisor, and thereafter manage their
own lifetime by holding shared_from_this() in pending callbacks. A unit
ends in exactly one of three ways:

  - It reports completion or failure through exit(). A default error_code
    is a normal completion.
  - It is forcibly terminated through terminate(), which exits the unit
    immediately with the given reason, and then posts halt_transfer() so
    the unit may abandon in-progress IO.
  - It is destroyed without having exited, and exits with transfer_lost.

Monitors registered through add_monitor() are invoked exactly once, with
the unit's handle and exit reason, from whichever thread ended the unit.
Monitors must not block.
*/
class transfer_unit :
    public std::enable_shared_from_this<transfer_unit>
{
public:

    typedef transfer_unit_ptr_t ptr_t;
    typedef transfer_unit_weak_ptr_t weak_ptr_t;

    typedef std::function<void(const transport_handle &,
        const boost::system::error_code &)> monitor_callback_t;

    transfer_unit(const core::io_service_ptr_t &);

    virtual ~transfer_unit();

    const core::io_service_ptr_t & get_io_service() const
    { return _io_service; }

    /// Process-unique, and never zero
    uint64_t get_id() const
    { return _id; }

    transport_handle get_handle();

    const std::string & get_name() const
    { return _name; }

    /// Must be called exactly once, prior to starting the unit
    void set_name(std::string &&);

    /// Posts a call to run_transfer() on the unit's io_service
    void start();

    void terminate(const boost::system::error_code & reason);

    void add_monitor(const monitor_callback_t &);

    bool has_exited() const;

    /// Precondition: has_exited()
    boost::system::error_code get_exit_reason() const;

protected:

    virtual void run_transfer() = 0;
    virtual void halt_transfer() = 0;

    /// Reports that the unit has finished. Calls after the first are ignored.
    void exit(const boost::system::error_code & reason);

    /*!
     * Posts a continuation of the transfer to the unit's io_service.
     *
     * An exception thrown by the continuation exits the unit with
     *  transfer_failed, rather than unwinding the io_service.
     */
    void post_step(const std::function<void()> &);

private:

    void fire_monitors(const transport_handle &);

    static void on_start(const ptr_t &);
    static void on_halt(const weak_ptr_t &);
    static void on_step(const ptr_t &, const std::function<void()> &);

    const core::io_service_ptr_t _io_service;
    const uint64_t _id;
    std::string _name;

    mutable spinlock _lock;

    bool _started;
    bool _exited;
    boost::system::error_code _exit_reason;

    std::vector<monitor_callback_t> _monitors;
};

}
}

#endif

