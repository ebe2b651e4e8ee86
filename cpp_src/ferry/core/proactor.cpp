
#include "ferry/core/proactor.hpp"
#include "ferry/error.hpp"
#include "ferry/log.hpp"
#include <algorithm>
#include <functional>

namespace ferry {
namespace core {

// static initialization
std::weak_ptr<proactor> proactor::_class_instance;
spinlock proactor::_class_lock;

proactor::ptr_t proactor::get_proactor()
{
    spinlock::guard guard(_class_lock);

    ptr_t result = _class_instance.lock();

    if(!result)
    {
        result = ptr_t(new proactor());
        _class_instance = result;
    }
    return result;
}

proactor::proactor()
 : _next_serial_service(0)
{
    LOG_DBG("proactor created");
}

proactor::~proactor()
{
    shutdown();
    LOG_DBG("proactor destroyed");
}

void proactor::spawn_serial_io_threads(unsigned count)
{
    spinlock::guard guard(_lock);

    for(unsigned i = 0; i != count; ++i)
    {
        io_service_ptr_t io_srv = std::make_shared<boost::asio::io_service>();

        _serial_io_services.push_back(io_srv);
        _work.push_back(
            std::make_shared<boost::asio::io_service::work>(*io_srv));

        boost::thread * thread = _threads.create_thread(
            std::bind(&proactor::run_io_service, io_srv));

        _thread_ids.push_back(thread->get_id());
    }

    LOG_DBG(count << " serial io-service threads spawned");
}

io_service_ptr_t proactor::serial_io_service()
{
    spinlock::guard guard(_lock);

    FERRY_ASSERT(!_serial_io_services.empty());

    io_service_ptr_t io_srv = _serial_io_services.at(_next_serial_service);

    // round-robin increment
    _next_serial_service = \
        (_next_serial_service + 1) % _serial_io_services.size();

    return io_srv;
}

bool proactor::in_io_thread() const
{
    spinlock::guard guard(_lock);

    return std::find(_thread_ids.begin(), _thread_ids.end(),
        boost::this_thread::get_id()) != _thread_ids.end();
}

void proactor::shutdown()
{
    std::vector<io_service_ptr_t> io_services;
    {
        spinlock::guard guard(_lock);

        _work.clear();
        io_services = _serial_io_services;
    }

    for(const io_service_ptr_t & io_srv : io_services)
    {
        io_srv->stop();
    }

    if(in_io_thread())
    {
        // cannot join ourselves; remaining threads exit on their own
        LOG_WARN("shutdown from within an io-service thread");
        return;
    }

    _threads.join_all();
}

void proactor::run_io_service(const io_service_ptr_t & io_srv)
{
    LOG_DBG("serial io-service running");
    io_srv->run();
    LOG_DBG("serial io-service stopped");
}

}
}

