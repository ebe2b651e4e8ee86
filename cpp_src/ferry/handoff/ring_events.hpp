#ifndef FERRY_HANDOFF_RING_EVENTS_HPP
#define FERRY_HANDOFF_RING_EVENTS_HPP

#include "ferry/handoff/fwd.hpp"
#include "ferry/core/protobuf/ferry.pb.h"

namespace ferry {
namespace handoff {

namespace spb = ferry::core::protobuf;

//! Queries the current partition ownership of the cluster
class ring_state_source
{
public:

    typedef ring_state_source_ptr_t ptr_t;

    virtual ~ring_state_source()
    { }

    virtual spb::RingState get_raw_ring() = 0;
};

//! Receives notice that downstream ownership should be recomputed
/*!
    ring_update() is called from within the handoff_manager's serialized
    context, and must neither block nor call back into the manager
    synchronously.
*/
class ring_event_sink
{
public:

    typedef ring_event_sink_ptr_t ptr_t;

    virtual ~ring_event_sink()
    { }

    virtual void ring_update(const spb::RingState &) = 0;
};

}
}

#endif

