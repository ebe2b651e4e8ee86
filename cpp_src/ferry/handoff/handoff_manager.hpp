#ifndef FERRY_HANDOFF_HANDOFF_MANAGER_HPP
#define FERRY_HANDOFF_HANDOFF_MANAGER_HPP

#include "ferry/handoff/fwd.hpp"
#include "ferry/handoff/handoff_id.hpp"
#include "ferry/handoff/exclusion_set.hpp"
#include "ferry/handoff/transfer_unit.hpp"
#include "ferry/core/fwd.hpp"
#include "ferry/core/uuid.hpp"
#include "ferry/core/protobuf/ferry.pb.h"
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ferry {
namespace handoff {

namespace spb = ferry::core::protobuf;

//! Coordinates the handoff of partitions between nodes
/*!
    handoff_manager throttles concurrently running handoffs, tracks
    partitions excluded from inbound handoff, starts handoffs on request,
    and cleans up after each handoff's transfer unit exits.

    All manager state is owned by a strand of a serial io_service, and
    operations are handled strictly in the order they're called:

      - Calls (add_outbound, add_inbound, handoff_status, set_concurrency,
        kill_handoffs, get_exclusions, get_concurrency, shutdown) complete
        by invoking their callback from within the strand. Callbacks must
        not block.

      - Notifications (add_exclusion, remove_exclusion, update_status)
        have no reply.

    Exits of transfer units are observed through monitors, and handled
    within the strand as well.

    One manager is expected per process. It's built at startup and passed
    explicitly to its users, and torn down with shutdown().

    \sa blocking.hpp for blocking forms of each call
*/
class handoff_manager :
    public std::enable_shared_from_this<handoff_manager>
{
public:

    typedef handoff_manager_ptr_t ptr_t;
    typedef handoff_manager_weak_ptr_t weak_ptr_t;

    handoff_manager(
        const handoff_config &,
        const sender_supervisor_ptr_t &,
        const receiver_supervisor_ptr_t &,
        const ring_state_source_ptr_t &,
        const ring_event_sink_ptr_t &);

    ~handoff_manager();

    /// True iff the calling thread is running the manager's strand
    bool running_in_strand() const
    { return _strand.running_in_this_thread(); }

    typedef std::function<void(const boost::system::error_code &,
        const transport_handle &)> add_handoff_callback_t;

    //! Starts handing off `partition` of `module` to `target_node`
    /*!
        Fails with errc::max_concurrency iff the concurrency limit is
        reached, or errc::spawn_failed if the sender could not be started.

        `vnode` is notified when the handoff ends, for whatever reason.
    */
    void add_outbound(
        const add_handoff_callback_t &,
        const std::string & module,
        uint64_t partition,
        const core::uuid & target_node,
        const vnode_handle_t & vnode);

    /// Starts receiving a handoff from a not-yet-known peer
    void add_inbound(
        const add_handoff_callback_t &,
        const spb::TransportOptions &);

    typedef std::function<void(
        const std::vector<handoff::handoff_status> &)> status_callback_t;

    /// Snapshot of tracked handoffs, in the order they were admitted
    void handoff_status(const status_callback_t &);

    typedef std::function<void()> ack_callback_t;

    //! Changes the concurrency limit
    /*!
        If fewer than the number of tracked handoffs, the oldest `limit`
        handoffs are kept and the remainder are terminated with reason
        errc::max_concurrency. Terminated handoffs remain tracked until
        the manager observes their exit.
    */
    void set_concurrency(const ack_callback_t &, unsigned limit);

    /// Equivalent to set_concurrency(0)
    void kill_handoffs(const ack_callback_t &);

    typedef std::function<void(unsigned)> concurrency_callback_t;

    void get_concurrency(const concurrency_callback_t &);

    typedef std::function<void(const std::vector<uint64_t> &)
        > exclusions_callback_t;

    /// Excluded partitions of `module`, in ascending order
    void get_exclusions(const exclusions_callback_t &,
        const std::string & module);

    /// Bars `partition` of `module` from inbound handoff, and
    ///  notifies the ring event sink
    void add_exclusion(const std::string & module, uint64_t partition);

    void remove_exclusion(const std::string & module, uint64_t partition);

    /// Replaces the reported status of a tracked handoff
    void update_status(const transport_handle &, const transfer_status_t &);

    //! Terminates tracked handoffs, and refuses further admissions
    /*!
        Tracked handoffs are terminated with reason errc::shutting_down,
        and later admissions fail with the same.
    */
    void shutdown(const ack_callback_t &);

private:

    struct session
    {
        handoff_id id;
        handoff::direction direction;
        transport_handle handle;
        std::chrono::steady_clock::time_point started_at;
        transfer_status_t status;
        vnode_handle_t vnode;
    };

    typedef std::vector<session> sessions_t;

    // true iff active handoffs, as counted by supervisors, are
    //  under the concurrency limit
    bool capacity_available() const;

    boost::system::error_code check_admission() const;

    void track_session(session &&);

    // monitor handed to supervisors, for each started transfer unit
    transfer_unit::monitor_callback_t make_monitor();

    void on_add_outbound(const add_handoff_callback_t &,
        const std::string &, uint64_t, const core::uuid &,
        const vnode_handle_t &);

    void on_add_inbound(const add_handoff_callback_t &,
        const spb::TransportOptions &);

    void on_handoff_status(const status_callback_t &);

    void on_set_concurrency(const ack_callback_t &, unsigned);

    void on_get_concurrency(const concurrency_callback_t &);

    void on_get_exclusions(const exclusions_callback_t &,
        const std::string &);

    void on_add_exclusion(const std::string &, uint64_t);

    void on_remove_exclusion(const std::string &, uint64_t);

    void on_update_status(const transport_handle &,
        const transfer_status_t &);

    void on_shutdown(const ack_callback_t &);

    static void on_transfer_monitor(const weak_ptr_t &,
        const transport_handle &, const boost::system::error_code &);

    void on_transfer_exit(const transport_handle &,
        const boost::system::error_code &);

    // proactor & io-service lifetime management
    const core::proactor_ptr_t _proactor;
    const core::io_service_ptr_t _io_service;

    boost::asio::io_service::strand _strand;

    const sender_supervisor_ptr_t _senders;
    const receiver_supervisor_ptr_t _receivers;
    const ring_state_source_ptr_t _ring_source;
    const ring_event_sink_ptr_t _ring_sink;

    // state below is accessed only from within _strand

    exclusion_set _exclusions;
    sessions_t _sessions;
    unsigned _concurrency_limit;
    bool _shutdown;
};

}
}

#endif
