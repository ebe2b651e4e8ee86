#ifndef FERRY_TEST_RECORDING_VNODE_HPP
#define FERRY_TEST_RECORDING_VNODE_HPP

#include "ferry/handoff/vnode_endpoint.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <utility>
#include <vector>

namespace ferry {
namespace test {

//! vnode_endpoint which records each handoff exit delivered to it
class recording_vnode : public handoff::vnode_endpoint
{
public:

    typedef std::shared_ptr<recording_vnode> ptr_t;

    typedef std::pair<handoff::handoff_id, boost::system::error_code> exit_t;

    recording_vnode(const core::io_service_ptr_t & io_srv)
     : handoff::vnode_endpoint(io_srv)
    { }

    /// Waits for at least `count` exits. Returns false on timeout.
    bool wait_for_exits(size_t count,
        std::chrono::milliseconds timeout = std::chrono::seconds(5))
    {
        std::unique_lock<std::mutex> lock(_mutex);

        return _cond.wait_for(lock, timeout,
            [this, count]() { return _exits.size() >= count; });
    }

    std::vector<exit_t> exits()
    {
        std::lock_guard<std::mutex> guard(_mutex);
        return _exits;
    }

protected:

    void on_handoff_exit(const handoff::handoff_id & id,
        const boost::system::error_code & reason)
    {
        {
            std::lock_guard<std::mutex> guard(_mutex);
            _exits.push_back(exit_t(id, reason));
        }
        _cond.notify_all();
    }

private:

    std::mutex _mutex;
    std::condition_variable _cond;

    std::vector<exit_t> _exits;
};

}
}

#endif

