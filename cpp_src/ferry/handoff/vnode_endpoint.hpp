#ifndef FERRY_HANDOFF_VNODE_ENDPOINT_HPP
#define FERRY_HANDOFF_VNODE_ENDPOINT_HPP

#include "ferry/handoff/fwd.hpp"
#include "ferry/handoff/handoff_id.hpp"
#include "ferry/core/fwd.hpp"
#include <boost/system/error_code.hpp>
#include <memory>

namespace ferry {
namespace handoff {

//! The partition-owning process which requested an outbound handoff
/*!
    Handoffs hold only a vnode_handle_t (weak_ptr) to their vnode, and
    use it solely to report why the handoff ended.
*/
class vnode_endpoint :
    public std::enable_shared_from_this<vnode_endpoint>
{
public:

    typedef vnode_endpoint_ptr_t ptr_t;

    vnode_endpoint(const core::io_service_ptr_t &);

    virtual ~vnode_endpoint();

    const core::io_service_ptr_t & get_io_service() const
    { return _io_service; }

    /*!
     * Posts on_handoff_exit() to the vnode's io_service.
     *
     * Delivery is best-effort: it's dropped if the vnode is destroyed
     *  before (or while) the notification is in flight.
     *
     * \return false iff the vnode was already unreachable
     */
    static bool deliver_handoff_exit(const vnode_handle_t &,
        const handoff_id &, const boost::system::error_code & reason);

protected:

    /// A default error_code reason is a normal completion
    virtual void on_handoff_exit(const handoff_id &,
        const boost::system::error_code & reason) = 0;

private:

    static void on_deliver(const vnode_handle_t &,
        const handoff_id &, const boost::system::error_code &);

    const core::io_service_ptr_t _io_service;
};

}
}

#endif

