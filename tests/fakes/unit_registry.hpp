#ifndef FERRY_TEST_UNIT_REGISTRY_HPP
#define FERRY_TEST_UNIT_REGISTRY_HPP

#include "scripted_transfer.hpp"
#include "ferry/handoff/supervision.hpp"
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace ferry {
namespace test {

/*!
    Builds scripted_transfer units for sender_pool & receiver_pool, and
    holds a strong reference to each so that tests control their lifetime.

    Shared by the factories it hands out, which run on the manager's
    io-service thread.
*/
class unit_registry :
    public std::enable_shared_from_this<unit_registry>
{
public:

    typedef std::shared_ptr<unit_registry> ptr_t;

    unit_registry()
     : _fail_spawns(false)
    { }

    handoff::sender_pool::sender_factory_t sender_factory()
    {
        ptr_t self = shared_from_this();

        return [self](const core::io_service_ptr_t & io_srv,
            const handoff::handoff_id & id,
            const handoff::vnode_handle_t &) -> handoff::transfer_unit_ptr_t
        {
            return self->build(io_srv, id, self->_senders);
        };
    }

    handoff::receiver_pool::receiver_factory_t receiver_factory()
    {
        ptr_t self = shared_from_this();

        return [self](const core::io_service_ptr_t & io_srv,
            const core::protobuf::TransportOptions & options
            ) -> handoff::transfer_unit_ptr_t
        {
            self->record_options(options);
            return self->build(io_srv, handoff::handoff_id(),
                self->_receivers);
        };
    }

    /// Subsequent factory calls throw, as an unreachable supervisor would
    void fail_spawns(bool fail)
    {
        std::lock_guard<std::mutex> guard(_mutex);
        _fail_spawns = fail;
    }

    scripted_transfer::ptr_t sender(size_t i)
    {
        std::lock_guard<std::mutex> guard(_mutex);
        return _senders.at(i);
    }

    scripted_transfer::ptr_t receiver(size_t i)
    {
        std::lock_guard<std::mutex> guard(_mutex);
        return _receivers.at(i);
    }

    size_t sender_count()
    {
        std::lock_guard<std::mutex> guard(_mutex);
        return _senders.size();
    }

    size_t receiver_count()
    {
        std::lock_guard<std::mutex> guard(_mutex);
        return _receivers.size();
    }

    core::protobuf::TransportOptions last_options()
    {
        std::lock_guard<std::mutex> guard(_mutex);
        return _last_options;
    }

    /// Drops the registry's reference to a sender
    void release_sender(size_t i)
    {
        scripted_transfer::ptr_t released;
        {
            std::lock_guard<std::mutex> guard(_mutex);
            released.swap(_senders.at(i));
        }
        // `released` may be the last reference, and is dropped unlocked
    }

    void clear()
    {
        std::vector<scripted_transfer::ptr_t> senders, receivers;
        {
            std::lock_guard<std::mutex> guard(_mutex);
            senders.swap(_senders);
            receivers.swap(_receivers);
        }
    }

private:

    void record_options(const core::protobuf::TransportOptions & options)
    {
        std::lock_guard<std::mutex> guard(_mutex);
        _last_options = options;
    }

    scripted_transfer::ptr_t build(const core::io_service_ptr_t & io_srv,
        const handoff::handoff_id & id,
        std::vector<scripted_transfer::ptr_t> & units)
    {
        std::lock_guard<std::mutex> guard(_mutex);

        if(_fail_spawns)
        {
            throw std::runtime_error("supervisor is unreachable");
        }

        scripted_transfer::ptr_t unit =
            std::make_shared<scripted_transfer>(io_srv, id);

        units.push_back(unit);
        return unit;
    }

    std::mutex _mutex;

    bool _fail_spawns;
    core::protobuf::TransportOptions _last_options;

    std::vector<scripted_transfer::ptr_t> _senders;
    std::vector<scripted_transfer::ptr_t> _receivers;
};

}
}

#endif

