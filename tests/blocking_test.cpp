#include "handoff_fixture.hpp"

#include "ferry/handoff/handoff_error.hpp"
#include "ferry/error.hpp"

#include <gtest/gtest.h>

#include <boost/system/system_error.hpp>
#include <future>

namespace ferry {
namespace test {

using handoff::make_error_code;

typedef handoff_fixture blocking_test;

TEST_F(blocking_test, ThrowingAddOutbound)
{
    handoff::blocking::set_concurrency(manager, 0);

    try
    {
        handoff::blocking::add_outbound(manager, "mod_x", 0,
            remote_node, vnode);
        FAIL() << "expected system_error";
    }
    catch(const boost::system::system_error & exc)
    {
        EXPECT_EQ(make_error_code(handoff::max_concurrency), exc.code());
    }
}

TEST_F(blocking_test, ThrowingAddInbound)
{
    handoff::blocking::shutdown(manager);

    try
    {
        handoff::blocking::add_inbound(manager,
            core::protobuf::TransportOptions());
        FAIL() << "expected system_error";
    }
    catch(const boost::system::system_error & exc)
    {
        EXPECT_EQ(make_error_code(handoff::shutting_down), exc.code());
    }
}

TEST_F(blocking_test, ShutdownIsIdempotent)
{
    handoff::blocking::shutdown(manager);
    handoff::blocking::shutdown(manager);

    EXPECT_TRUE(handoff::blocking::handoff_status(manager).empty());
}

TEST_F(blocking_test, CallFromIoThreadThrows)
{
    std::promise<bool> threw;

    proactor->serial_io_service()->post([this, &threw]()
    {
        try
        {
            handoff::blocking::get_concurrency(manager);
            threw.set_value(false);
        }
        catch(const error::ferry_exception &)
        {
            threw.set_value(true);
        }
    });

    EXPECT_TRUE(threw.get_future().get());
}

TEST_F(blocking_test, CallWithoutManagerThrows)
{
    EXPECT_THROW(handoff::blocking::handoff_status(
        handoff::handoff_manager::ptr_t()), error::ferry_exception);
}

}
}
