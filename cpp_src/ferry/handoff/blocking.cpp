#include "ferry/handoff/blocking.hpp"
#include "ferry/handoff/handoff_manager.hpp"
#include "ferry/core/proactor.hpp"
#include "ferry/error.hpp"
#include <boost/system/system_error.hpp>
#include <future>
#include <utility>

namespace ferry {
namespace handoff {
namespace blocking {

namespace {

typedef std::pair<boost::system::error_code, transport_handle> add_result_t;

void check_caller(const handoff_manager::ptr_t & manager)
{
    FERRY_ASSERT(manager);
    FERRY_ASSERT_MSG(!manager->running_in_strand() &&
        !core::proactor::get_proactor()->in_io_thread(),
        "blocking handoff call from an io-service thread");
}

template<typename Result>
struct reply
{
    // std::function requires copyable callbacks
    typedef std::shared_ptr<std::promise<Result>> promise_ptr_t;

    reply()
     : promise(std::make_shared<std::promise<Result>>())
    { }

    Result wait()
    { return promise->get_future().get(); }

    promise_ptr_t promise;
};

transport_handle finish_add(const add_result_t & result,
    boost::system::error_code & ec)
{
    ec = result.first;
    return result.second;
}

transport_handle throw_on_error(const transport_handle & handle,
    const boost::system::error_code & ec, const char * what)
{
    if(ec)
    {
        throw boost::system::system_error(ec, what);
    }
    return handle;
}

}

transport_handle add_outbound(
    const handoff_manager::ptr_t & manager,
    const std::string & module,
    uint64_t partition,
    const core::uuid & target_node,
    const vnode_handle_t & vnode,
    boost::system::error_code & ec)
{
    check_caller(manager);

    reply<add_result_t> r;
    reply<add_result_t>::promise_ptr_t promise = r.promise;

    manager->add_outbound(
        [promise](const boost::system::error_code & result,
            const transport_handle & handle)
        {
            promise->set_value(add_result_t(result, handle));
        },
        module, partition, target_node, vnode);

    return finish_add(r.wait(), ec);
}

transport_handle add_outbound(
    const handoff_manager::ptr_t & manager,
    const std::string & module,
    uint64_t partition,
    const core::uuid & target_node,
    const vnode_handle_t & vnode)
{
    boost::system::error_code ec;
    transport_handle handle = add_outbound(
        manager, module, partition, target_node, vnode, ec);

    return throw_on_error(handle, ec, "add_outbound");
}

transport_handle add_inbound(
    const handoff_manager::ptr_t & manager,
    const core::protobuf::TransportOptions & options,
    boost::system::error_code & ec)
{
    check_caller(manager);

    reply<add_result_t> r;
    reply<add_result_t>::promise_ptr_t promise = r.promise;

    manager->add_inbound(
        [promise](const boost::system::error_code & result,
            const transport_handle & handle)
        {
            promise->set_value(add_result_t(result, handle));
        },
        options);

    return finish_add(r.wait(), ec);
}

transport_handle add_inbound(
    const handoff_manager::ptr_t & manager,
    const core::protobuf::TransportOptions & options)
{
    boost::system::error_code ec;
    transport_handle handle = add_inbound(manager, options, ec);

    return throw_on_error(handle, ec, "add_inbound");
}

std::vector<handoff::handoff_status> handoff_status(
    const handoff_manager::ptr_t & manager)
{
    check_caller(manager);

    typedef std::vector<handoff::handoff_status> result_t;

    reply<result_t> r;
    reply<result_t>::promise_ptr_t promise = r.promise;

    manager->handoff_status(
        [promise](const result_t & status)
        {
            promise->set_value(status);
        });

    return r.wait();
}

void set_concurrency(const handoff_manager::ptr_t & manager, unsigned limit)
{
    check_caller(manager);

    reply<void> r;
    reply<void>::promise_ptr_t promise = r.promise;

    manager->set_concurrency([promise]() { promise->set_value(); }, limit);
    r.wait();
}

void kill_handoffs(const handoff_manager::ptr_t & manager)
{
    check_caller(manager);

    reply<void> r;
    reply<void>::promise_ptr_t promise = r.promise;

    manager->kill_handoffs([promise]() { promise->set_value(); });
    r.wait();
}

unsigned get_concurrency(const handoff_manager::ptr_t & manager)
{
    check_caller(manager);

    reply<unsigned> r;
    reply<unsigned>::promise_ptr_t promise = r.promise;

    manager->get_concurrency(
        [promise](unsigned limit) { promise->set_value(limit); });

    return r.wait();
}

std::vector<uint64_t> get_exclusions(const handoff_manager::ptr_t & manager,
    const std::string & module)
{
    check_caller(manager);

    typedef std::vector<uint64_t> result_t;

    reply<result_t> r;
    reply<result_t>::promise_ptr_t promise = r.promise;

    manager->get_exclusions(
        [promise](const result_t & partitions)
        {
            promise->set_value(partitions);
        },
        module);

    return r.wait();
}

void shutdown(const handoff_manager::ptr_t & manager)
{
    check_caller(manager);

    reply<void> r;
    reply<void>::promise_ptr_t promise = r.promise;

    manager->shutdown([promise]() { promise->set_value(); });
    r.wait();
}

}
}
}

