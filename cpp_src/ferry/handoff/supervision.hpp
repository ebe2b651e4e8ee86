#ifndef FERRY_HANDOFF_SUPERVISION_HPP
#define FERRY_HANDOFF_SUPERVISION_HPP

#include "ferry/handoff/fwd.hpp"
#include "ferry/handoff/handoff_id.hpp"
#include "ferry/handoff/transfer_unit.hpp"
#include "ferry/core/fwd.hpp"
#include "ferry/core/uuid.hpp"
#include "ferry/core/protobuf/ferry.pb.h"
#include <functional>
#include <string>

namespace ferry {
namespace handoff {

namespace spb = ferry::core::protobuf;

//! Starts outbound transfer units, and counts those which are live
class sender_supervisor
{
public:

    typedef sender_supervisor_ptr_t ptr_t;

    virtual ~sender_supervisor();

    //! Starts a unit handing `partition` of `module` off to `target_node`
    /*!
        `monitor` must be added to the unit before it's started.
        Throws if the unit cannot be started.
    */
    virtual transport_handle start_sender(
        const core::uuid & target_node,
        const std::string & module,
        uint64_t partition,
        const vnode_handle_t & vnode,
        const transfer_unit::monitor_callback_t & monitor) = 0;

    virtual size_t count_active() const = 0;
};

//! Starts inbound transfer units, and counts those which are live
class receiver_supervisor
{
public:

    typedef receiver_supervisor_ptr_t ptr_t;

    virtual ~receiver_supervisor();

    /// As sender_supervisor::start_sender()
    virtual transport_handle start_receiver(
        const spb::TransportOptions &,
        const transfer_unit::monitor_callback_t & monitor) = 0;

    virtual size_t count_active() const = 0;
};

//! sender_supervisor which builds units from a factory
/*!
    Each unit is given a serial io_service of the proactor, selected
    round-robin, and is started on a transfer_supervisor of role "sender".
*/
class sender_pool : public sender_supervisor
{
public:

    typedef std::function<transfer_unit_ptr_t(
        const core::io_service_ptr_t &,
        const handoff_id &,
        const vnode_handle_t &)
    > sender_factory_t;

    sender_pool(const sender_factory_t &);

    transport_handle start_sender(
        const core::uuid & target_node,
        const std::string & module,
        uint64_t partition,
        const vnode_handle_t & vnode,
        const transfer_unit::monitor_callback_t & monitor);

    size_t count_active() const;

    const transfer_supervisor_ptr_t & get_supervisor() const
    { return _supervisor; }

private:

    // proactor lifetime management
    const core::proactor_ptr_t _proactor;

    const sender_factory_t _factory;
    const transfer_supervisor_ptr_t _supervisor;
};

//! receiver_supervisor which builds units from a factory
class receiver_pool : public receiver_supervisor
{
public:

    typedef std::function<transfer_unit_ptr_t(
        const core::io_service_ptr_t &,
        const spb::TransportOptions &)
    > receiver_factory_t;

    receiver_pool(const receiver_factory_t &);

    transport_handle start_receiver(const spb::TransportOptions &,
        const transfer_unit::monitor_callback_t & monitor);

    size_t count_active() const;

    const transfer_supervisor_ptr_t & get_supervisor() const
    { return _supervisor; }

private:

    const core::proactor_ptr_t _proactor;

    const receiver_factory_t _factory;
    const transfer_supervisor_ptr_t _supervisor;
};

}
}

#endif

