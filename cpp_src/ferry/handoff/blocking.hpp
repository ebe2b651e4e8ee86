#ifndef FERRY_HANDOFF_BLOCKING_HPP
#define FERRY_HANDOFF_BLOCKING_HPP

#include "ferry/handoff/fwd.hpp"
#include "ferry/handoff/handoff_id.hpp"
#include "ferry/handoff/transfer_unit.hpp"
#include "ferry/core/uuid.hpp"
#include "ferry/core/protobuf/ferry.pb.h"
#include <boost/system/error_code.hpp>
#include <string>
#include <vector>

namespace ferry {
namespace handoff {

/*!
    Blocking forms of handoff_manager calls, for callers outside of the
    proactor's event loops (eg, the main thread, or tests).

    Each blocks the calling thread until the manager replies. Calling
    from a proactor io-service thread would deadlock the manager's
    strand, and throws ferry::error::ferry_exception instead.

    As with boost::asio, add_outbound() and add_inbound() come in two
    forms: one reporting failure through an error_code, and one throwing
    boost::system::system_error.
*/
namespace blocking {

transport_handle add_outbound(
    const handoff_manager_ptr_t &,
    const std::string & module,
    uint64_t partition,
    const core::uuid & target_node,
    const vnode_handle_t & vnode,
    boost::system::error_code & ec);

transport_handle add_outbound(
    const handoff_manager_ptr_t &,
    const std::string & module,
    uint64_t partition,
    const core::uuid & target_node,
    const vnode_handle_t & vnode);

transport_handle add_inbound(
    const handoff_manager_ptr_t &,
    const core::protobuf::TransportOptions &,
    boost::system::error_code & ec);

transport_handle add_inbound(
    const handoff_manager_ptr_t &,
    const core::protobuf::TransportOptions &);

std::vector<handoff::handoff_status> handoff_status(
    const handoff_manager_ptr_t &);

void set_concurrency(const handoff_manager_ptr_t &, unsigned limit);

void kill_handoffs(const handoff_manager_ptr_t &);

unsigned get_concurrency(const handoff_manager_ptr_t &);

std::vector<uint64_t> get_exclusions(const handoff_manager_ptr_t &,
    const std::string & module);

void shutdown(const handoff_manager_ptr_t &);

}

}
}

#endif

