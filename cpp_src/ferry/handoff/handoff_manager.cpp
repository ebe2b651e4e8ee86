#include "ferry/handoff/handoff_manager.hpp"
#include "ferry/handoff/handoff_config.hpp"
#include "ferry/handoff/handoff_error.hpp"
#include "ferry/handoff/ring_events.hpp"
#include "ferry/handoff/supervision.hpp"
#include "ferry/handoff/vnode_endpoint.hpp"
#include "ferry/core/proactor.hpp"
#include "ferry/error.hpp"
#include "ferry/log.hpp"
#include <algorithm>
#include <string>

namespace ferry {
namespace handoff {

using std::placeholders::_1;
using std::placeholders::_2;

handoff_manager::handoff_manager(
    const handoff_config & config,
    const sender_supervisor::ptr_t & senders,
    const receiver_supervisor::ptr_t & receivers,
    const ring_state_source::ptr_t & ring_source,
    const ring_event_sink::ptr_t & ring_sink)
 : _proactor(core::proactor::get_proactor()),
   _io_service(_proactor->serial_io_service()),
   _strand(*_io_service),
   _senders(senders),
   _receivers(receivers),
   _ring_source(ring_source),
   _ring_sink(ring_sink),
   _concurrency_limit(config.get_handoff_concurrency()),
   _shutdown(false)
{
    FERRY_ASSERT(_senders && _receivers);
    FERRY_ASSERT(_ring_source && _ring_sink);

    for(const spb::HandoffConfig::Exclusion & excl :
        config.get_protobuf_description().exclusion())
    {
        _exclusions.add(excl.module(), excl.partition());
    }

    LOG_INFO("handoff manager created (concurrency " << _concurrency_limit \
        << ", " << _exclusions.size() << " exclusions)");
}

handoff_manager::~handoff_manager()
{
    if(!_sessions.empty())
    {
        LOG_WARN("handoff manager destroyed while tracking " \
            << _sessions.size() << " handoffs");
    }
    LOG_DBG("handoff manager destroyed");
}

void handoff_manager::add_outbound(
    const add_handoff_callback_t & callback,
    const std::string & module,
    uint64_t partition,
    const core::uuid & target_node,
    const vnode_handle_t & vnode)
{
    _strand.post(std::bind(&handoff_manager::on_add_outbound,
        shared_from_this(), callback, module, partition, target_node, vnode));
}

void handoff_manager::add_inbound(
    const add_handoff_callback_t & callback,
    const spb::TransportOptions & options)
{
    _strand.post(std::bind(&handoff_manager::on_add_inbound,
        shared_from_this(), callback, options));
}

void handoff_manager::handoff_status(const status_callback_t & callback)
{
    _strand.post(std::bind(&handoff_manager::on_handoff_status,
        shared_from_this(), callback));
}

void handoff_manager::set_concurrency(const ack_callback_t & callback,
    unsigned limit)
{
    _strand.post(std::bind(&handoff_manager::on_set_concurrency,
        shared_from_this(), callback, limit));
}

void handoff_manager::kill_handoffs(const ack_callback_t & callback)
{
    set_concurrency(callback, 0);
}

void handoff_manager::get_concurrency(
    const concurrency_callback_t & callback)
{
    _strand.post(std::bind(&handoff_manager::on_get_concurrency,
        shared_from_this(), callback));
}

void handoff_manager::get_exclusions(const exclusions_callback_t & callback,
    const std::string & module)
{
    _strand.post(std::bind(&handoff_manager::on_get_exclusions,
        shared_from_this(), callback, module));
}

void handoff_manager::add_exclusion(const std::string & module,
    uint64_t partition)
{
    _strand.post(std::bind(&handoff_manager::on_add_exclusion,
        shared_from_this(), module, partition));
}

void handoff_manager::remove_exclusion(const std::string & module,
    uint64_t partition)
{
    _strand.post(std::bind(&handoff_manager::on_remove_exclusion,
        shared_from_this(), module, partition));
}

void handoff_manager::update_status(const transport_handle & handle,
    const transfer_status_t & status)
{
    _strand.post(std::bind(&handoff_manager::on_update_status,
        shared_from_this(), handle, status));
}

void handoff_manager::shutdown(const ack_callback_t & callback)
{
    _strand.post(std::bind(&handoff_manager::on_shutdown,
        shared_from_this(), callback));
}

bool handoff_manager::capacity_available() const
{
    // query supervisors rather than _sessions: units may have exited
    //  without their exit having been observed yet
    size_t active = _senders->count_active() + _receivers->count_active();

    return active < _concurrency_limit;
}

boost::system::error_code handoff_manager::check_admission() const
{
    if(_shutdown)
    {
        return make_error_code(shutting_down);
    }
    if(!capacity_available())
    {
        return make_error_code(max_concurrency);
    }
    return boost::system::error_code();
}

void handoff_manager::track_session(session && s)
{
    s.started_at = std::chrono::steady_clock::now();

    LOG_INFO("tracking " << s.direction << " handoff " << s.id \
        << " (transfer unit " << s.handle.get_id() << ")");

    _sessions.push_back(std::move(s));
}

transfer_unit::monitor_callback_t handoff_manager::make_monitor()
{
    // exits are posted to the strand, and so are observed only after
    //  the starting handler has tracked the session
    return std::bind(&handoff_manager::on_transfer_monitor,
        weak_ptr_t(shared_from_this()), _1, _2);
}

void handoff_manager::on_add_outbound(
    const add_handoff_callback_t & callback,
    const std::string & module,
    uint64_t partition,
    const core::uuid & target_node,
    const vnode_handle_t & vnode)
{
    boost::system::error_code ec = check_admission();
    if(ec)
    {
        LOG_DBG("outbound handoff of " << log::ascii_escape(module) << " " \
            << partition << " refused: " << ec.message());
        callback(ec, transport_handle());
        return;
    }

    session s;
    s.id = handoff_id(module, partition, target_node);
    s.direction = direction::outbound;
    s.vnode = vnode;

    try
    {
        s.handle = _senders->start_sender(
            target_node, module, partition, vnode, make_monitor());
    }
    catch(const std::exception & exc)
    {
        LOG_ERR("failed to start sender of partition " \
            << log::ascii_escape(module) << " " << partition << ": " \
            << exc.what());
        callback(make_error_code(spawn_failed), transport_handle());
        return;
    }

    transport_handle handle = s.handle;
    track_session(std::move(s));

    callback(boost::system::error_code(), handle);
}

void handoff_manager::on_add_inbound(
    const add_handoff_callback_t & callback,
    const spb::TransportOptions & options)
{
    boost::system::error_code ec = check_admission();
    if(ec)
    {
        LOG_DBG("inbound handoff refused: " << ec.message());
        callback(ec, transport_handle());
        return;
    }

    session s;
    s.direction = direction::inbound;

    try
    {
        s.handle = _receivers->start_receiver(options, make_monitor());
    }
    catch(const std::exception & exc)
    {
        LOG_ERR("failed to start receiver: " << exc.what());
        callback(make_error_code(spawn_failed), transport_handle());
        return;
    }

    transport_handle handle = s.handle;
    track_session(std::move(s));

    callback(boost::system::error_code(), handle);
}

void handoff_manager::on_handoff_status(const status_callback_t & callback)
{
    std::vector<handoff::handoff_status> result;
    result.reserve(_sessions.size());

    for(const session & s : _sessions)
    {
        handoff::handoff_status entry;
        entry.id = s.id;
        entry.direction = s.direction;
        entry.state = "active";
        entry.status = s.status;

        result.push_back(std::move(entry));
    }
    callback(result);
}

void handoff_manager::on_set_concurrency(const ack_callback_t & callback,
    unsigned limit)
{
    LOG_INFO("setting handoff concurrency from " << _concurrency_limit \
        << " to " << limit);

    _concurrency_limit = limit;

    if(limit < _sessions.size())
    {
        // Keep the first `limit` handoffs in admission order, and terminate
        //  the remainder. Terminated handoffs stay tracked: their exits are
        //  still to be observed, and reported to their vnodes.
        for(sessions_t::size_type i = limit; i != _sessions.size(); ++i)
        {
            _sessions[i].handle.terminate(make_error_code(max_concurrency));
        }
    }
    callback();
}

void handoff_manager::on_get_concurrency(
    const concurrency_callback_t & callback)
{
    callback(_concurrency_limit);
}

void handoff_manager::on_get_exclusions(
    const exclusions_callback_t & callback,
    const std::string & module)
{
    callback(_exclusions.get_exclusions(module));
}

void handoff_manager::on_add_exclusion(const std::string & module,
    uint64_t partition)
{
    if(_exclusions.add(module, partition))
    {
        LOG_INFO("excluding partition " << log::ascii_escape(module) \
            << " " << partition << " from inbound handoff");
    }

    // ring event handlers re-evaluate ownership against exclusions
    try
    {
        _ring_sink->ring_update(_ring_source->get_raw_ring());
    }
    catch(const std::exception & exc)
    {
        LOG_ERR("ring update for exclusion of " \
            << log::ascii_escape(module) << " " << partition \
            << " failed: " << exc.what());
    }
}

void handoff_manager::on_remove_exclusion(const std::string & module,
    uint64_t partition)
{
    if(_exclusions.remove(module, partition))
    {
        LOG_INFO("partition " << log::ascii_escape(module) << " " \
            << partition << " is no longer excluded");
    }
}

void handoff_manager::on_update_status(const transport_handle & handle,
    const transfer_status_t & status)
{
    for(session & s : _sessions)
    {
        if(s.handle == handle)
        {
            s.status = status;
            return;
        }
    }
    LOG_DBG("status of untracked handoff " << handle.get_id() << " ignored");
}

void handoff_manager::on_shutdown(const ack_callback_t & callback)
{
    if(!_shutdown)
    {
        LOG_INFO("shutting down; terminating " << _sessions.size() \
            << " handoffs");

        _shutdown = true;

        for(const session & s : _sessions)
        {
            s.handle.terminate(make_error_code(shutting_down));
        }
    }
    callback();
}

void handoff_manager::on_transfer_monitor(const weak_ptr_t & weak_self,
    const transport_handle & handle,
    const boost::system::error_code & reason)
{
    ptr_t self = weak_self.lock();
    if(!self)
    {
        // manager was destroyed first
        return;
    }

    // always post: the monitor may fire from within the strand, eg when
    //  set_concurrency() terminates a unit, or before the session of a
    //  quickly exiting unit is tracked
    self->_strand.post(std::bind(&handoff_manager::on_transfer_exit,
        self, handle, reason));
}

void handoff_manager::on_transfer_exit(const transport_handle & handle,
    const boost::system::error_code & reason)
{
    sessions_t::iterator it = std::find_if(_sessions.begin(), _sessions.end(),
        [&handle](const session & s) { return s.handle == handle; });

    if(it == _sessions.end())
    {
        LOG_DBG("exit of untracked transfer unit " << handle.get_id());
        return;
    }

    if(reason)
    {
        LOG_ERR("An " << it->direction << " handoff of partition " \
            << log::ascii_escape(it->id.module) << " " \
            << (it->id.partition ? std::to_string(*it->id.partition)
                                 : std::string("undefined")) \
            << " was terminated for reason: " << reason.message());
    }

    // tell the vnode why the handoff stopped, so it can clean up its state
    if(!it->vnode.expired())
    {
        vnode_endpoint::deliver_handoff_exit(it->vnode, it->id, reason);
    }

    _sessions.erase(it);
}

}
}
