#include "ferry/handoff/supervision.hpp"
#include "ferry/handoff/transfer_supervisor.hpp"
#include "ferry/core/proactor.hpp"
#include "ferry/error.hpp"
#include "ferry/log.hpp"
#include <functional>

namespace ferry {
namespace handoff {

sender_supervisor::~sender_supervisor()
{ }

receiver_supervisor::~receiver_supervisor()
{ }

sender_pool::sender_pool(const sender_factory_t & factory)
 : _proactor(core::proactor::get_proactor()),
   _factory(factory),
   _supervisor(std::make_shared<transfer_supervisor>("sender"))
{
    FERRY_ASSERT(_factory);
}

transport_handle sender_pool::start_sender(
    const core::uuid & target_node,
    const std::string & module,
    uint64_t partition,
    const vnode_handle_t & vnode,
    const transfer_unit::monitor_callback_t & monitor)
{
    handoff_id id(module, partition, target_node);

    transfer_unit::ptr_t unit = _factory(
        _proactor->serial_io_service(), id, vnode);

    FERRY_ASSERT_MSG(unit, "sender factory returned no unit");

    LOG_INFO("starting outbound handoff " << id);
    return _supervisor->start_unit(unit, monitor);
}

size_t sender_pool::count_active() const
{
    return _supervisor->count_active();
}

receiver_pool::receiver_pool(const receiver_factory_t & factory)
 : _proactor(core::proactor::get_proactor()),
   _factory(factory),
   _supervisor(std::make_shared<transfer_supervisor>("receiver"))
{
    FERRY_ASSERT(_factory);
}

transport_handle receiver_pool::start_receiver(
    const spb::TransportOptions & options,
    const transfer_unit::monitor_callback_t & monitor)
{
    transfer_unit::ptr_t unit = _factory(
        _proactor->serial_io_service(), options);

    FERRY_ASSERT_MSG(unit, "receiver factory returned no unit");

    LOG_INFO("starting inbound handoff (ssl " \
        << (options.ssl_enabled() ? "enabled" : "disabled") << ")");
    return _supervisor->start_unit(unit, monitor);
}

size_t receiver_pool::count_active() const
{
    return _supervisor->count_active();
}

}
}

