#include "ferry/handoff/vnode_endpoint.hpp"
#include "ferry/error.hpp"
#include "ferry/log.hpp"
#include <functional>

namespace ferry {
namespace handoff {

vnode_endpoint::vnode_endpoint(const core::io_service_ptr_t & io_service)
 : _io_service(io_service)
{
    FERRY_ASSERT(_io_service);
}

vnode_endpoint::~vnode_endpoint()
{ }

bool vnode_endpoint::deliver_handoff_exit(const vnode_handle_t & weak_vnode,
    const handoff_id & id, const boost::system::error_code & reason)
{
    ptr_t vnode = weak_vnode.lock();
    if(!vnode)
    {
        LOG_DBG("vnode of handoff " << id << " is gone");
        return false;
    }

    vnode->get_io_service()->post(std::bind(&vnode_endpoint::on_deliver,
        weak_vnode, id, reason));
    return true;
}

void vnode_endpoint::on_deliver(const vnode_handle_t & weak_vnode,
    const handoff_id & id, const boost::system::error_code & reason)
{
    ptr_t vnode = weak_vnode.lock();
    if(vnode)
    {
        vnode->on_handoff_exit(id, reason);
    }
}

}
}

