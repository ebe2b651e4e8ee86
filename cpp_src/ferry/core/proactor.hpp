#ifndef FERRY_CORE_PROACTOR_HPP
#define FERRY_CORE_PROACTOR_HPP

#include "ferry/core/fwd.hpp"
#include "ferry/spinlock.hpp"
#include <boost/asio.hpp>
#include <boost/thread/thread.hpp>
#include <memory>
#include <vector>

namespace ferry {
namespace core {

//! Owns the process's io-service threads
/*!
    The handoff manager, transfer units and vnodes each run their handlers
    on one of the proactor's serial io-services. A serial io-service is
    run by exactly one thread, so handlers posted to it never race one
    another.
*/
class proactor :
    public std::enable_shared_from_this<proactor>
{
public:

    typedef proactor_ptr_t ptr_t;

    /// Returns the live instance, creating one if none is referenced.
    /// The instance is destroyed with its last reference.
    static ptr_t get_proactor();

    virtual ~proactor();

    /// Adds `count` serial io-services to the pool, each with a thread
    ///  which runs it until shutdown()
    void spawn_serial_io_threads(unsigned count);

    /// Next serial io-service of the pool, round-robin.
    /// Throws ferry_exception if no threads have been spawned.
    io_service_ptr_t serial_io_service();

    bool in_io_thread() const;

    //! Stops every io-service, and joins their threads
    /*!
        Handlers not yet run are dropped. From within an io-service thread,
        threads are stopped but not joined.
    */
    void shutdown();

private:

    proactor();

    static void run_io_service(const io_service_ptr_t &);

    static std::weak_ptr<proactor> _class_instance;
    static spinlock _class_lock;

    mutable spinlock _lock;

    std::vector<io_service_ptr_t> _serial_io_services;
    std::vector<io_work_ptr_t> _work;
    unsigned _next_serial_service;

    boost::thread_group _threads;
    std::vector<boost::thread::id> _thread_ids;
};

}
}

#endif
