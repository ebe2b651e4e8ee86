#ifndef FERRY_HANDOFF_FWD_HPP
#define FERRY_HANDOFF_FWD_HPP

#include <memory>

namespace ferry {
namespace handoff {

class handoff_manager;
typedef std::shared_ptr<handoff_manager> handoff_manager_ptr_t;
typedef std::weak_ptr<handoff_manager> handoff_manager_weak_ptr_t;

class transfer_unit;
typedef std::shared_ptr<transfer_unit> transfer_unit_ptr_t;
typedef std::weak_ptr<transfer_unit> transfer_unit_weak_ptr_t;

class transport_handle;

class transfer_supervisor;
typedef std::shared_ptr<transfer_supervisor> transfer_supervisor_ptr_t;

class sender_supervisor;
typedef std::shared_ptr<sender_supervisor> sender_supervisor_ptr_t;

class receiver_supervisor;
typedef std::shared_ptr<receiver_supervisor> receiver_supervisor_ptr_t;

class ring_state_source;
typedef std::shared_ptr<ring_state_source> ring_state_source_ptr_t;

class ring_event_sink;
typedef std::shared_ptr<ring_event_sink> ring_event_sink_ptr_t;

class vnode_endpoint;
typedef std::shared_ptr<vnode_endpoint> vnode_endpoint_ptr_t;

// Handoffs reference their requesting vnode only weakly
typedef std::weak_ptr<vnode_endpoint> vnode_handle_t;

class exclusion_set;
class handoff_config;

struct handoff_id;
struct handoff_status;

}
}

#endif

