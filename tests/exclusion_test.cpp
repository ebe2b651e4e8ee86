#include "handoff_fixture.hpp"

#include "ferry/handoff/exclusion_set.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <random>
#include <set>
#include <stdexcept>

namespace ferry {
namespace test {

using handoff::blocking::get_exclusions;
using testing::_;
using testing::ElementsAre;
using testing::Return;

namespace spb = core::protobuf;

TEST(exclusion_set_test, AddIsIdempotent)
{
    handoff::exclusion_set excl;

    EXPECT_TRUE(excl.add("kv", 42));
    EXPECT_FALSE(excl.add("kv", 42));

    EXPECT_EQ(1u, excl.size());
    EXPECT_TRUE(excl.contains("kv", 42));
}

TEST(exclusion_set_test, RemoveOfAbsentEntry)
{
    handoff::exclusion_set excl;
    excl.add("kv", 1);

    EXPECT_FALSE(excl.remove("kv", 2));
    EXPECT_FALSE(excl.remove("counters", 1));
    EXPECT_TRUE(excl.remove("kv", 1));
    EXPECT_FALSE(excl.remove("kv", 1));

    EXPECT_EQ(0u, excl.size());
}

TEST(exclusion_set_test, ExclusionsAreScopedByModule)
{
    handoff::exclusion_set excl;

    excl.add("kv", 900);
    excl.add("kv", 3);
    excl.add("kv", 17);
    excl.add("counters", 5);
    excl.add("kva", 1);

    EXPECT_THAT(excl.get_exclusions("kv"), ElementsAre(3, 17, 900));
    EXPECT_THAT(excl.get_exclusions("counters"), ElementsAre(5));
    EXPECT_THAT(excl.get_exclusions("kva"), ElementsAre(1));
    EXPECT_TRUE(excl.get_exclusions("k").empty());
    EXPECT_TRUE(excl.get_exclusions("").empty());
}

TEST(exclusion_set_test, MatchesSetOfPairs)
{
    // random sequences of adds & removes agree with a std::set model
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> coin(0, 1);
    std::uniform_int_distribution<uint64_t> partition(0, 15);

    const std::string modules[] = {"kv", "counters"};

    handoff::exclusion_set excl;
    std::set<std::pair<std::string, uint64_t>> model;

    for(size_t i = 0; i != 2000; ++i)
    {
        const std::string & module = modules[coin(rng)];
        uint64_t p = partition(rng);

        if(coin(rng))
        {
            EXPECT_EQ(model.insert(std::make_pair(module, p)).second,
                excl.add(module, p));
        }
        else
        {
            EXPECT_EQ(model.erase(std::make_pair(module, p)) != 0,
                excl.remove(module, p));
        }
    }

    EXPECT_EQ(model.size(), excl.size());

    for(const std::string & module : modules)
    {
        std::vector<uint64_t> expected;
        for(const std::pair<std::string, uint64_t> & entry : model)
        {
            if(entry.first == module)
            {
                expected.push_back(entry.second);
            }
        }
        EXPECT_EQ(expected, excl.get_exclusions(module));
    }
}

typedef handoff_fixture manager_exclusion_test;

TEST_F(manager_exclusion_test, AddAndRemove)
{
    EXPECT_TRUE(get_exclusions(manager, "kv").empty());

    manager->add_exclusion("kv", 8);
    manager->add_exclusion("kv", 2);
    manager->add_exclusion("kv", 8);
    manager->add_exclusion("counters", 2);

    EXPECT_THAT(get_exclusions(manager, "kv"), ElementsAre(2, 8));
    EXPECT_THAT(get_exclusions(manager, "counters"), ElementsAre(2));

    manager->remove_exclusion("kv", 8);
    manager->remove_exclusion("kv", 99);

    EXPECT_THAT(get_exclusions(manager, "kv"), ElementsAre(2));
}

TEST_F(manager_exclusion_test, AddNotifiesRingSink)
{
    spb::RingState ring;
    ring.set_cluster_name("ferry-test");
    ring.set_version(42);

    EXPECT_CALL(*ring_source, get_raw_ring())
        .Times(3)
        .WillRepeatedly(Return(ring));

    // each add notifies, including those of already-excluded partitions
    EXPECT_CALL(*ring_sink, ring_update(
        testing::Property(&spb::RingState::version, 42u)))
        .Times(3);

    manager->add_exclusion("kv", 1);
    manager->add_exclusion("kv", 1);
    manager->add_exclusion("kv", 2);

    // sequenced after the adds, which are complete on return
    EXPECT_THAT(get_exclusions(manager, "kv"), ElementsAre(1, 2));
}

TEST_F(manager_exclusion_test, RemoveDoesNotNotifyRingSink)
{
    EXPECT_CALL(*ring_sink, ring_update(_)).Times(1);

    manager->add_exclusion("kv", 1);
    manager->remove_exclusion("kv", 1);
    manager->remove_exclusion("kv", 1);

    EXPECT_TRUE(get_exclusions(manager, "kv").empty());
}

TEST_F(manager_exclusion_test, FailedRingUpdateIsLogged)
{
    ON_CALL(*ring_sink, ring_update(_)).WillByDefault(
        testing::Throw(std::runtime_error("ring handler unavailable")));

    testing::internal::CaptureStderr();

    manager->add_exclusion("kv", 11);
    std::vector<uint64_t> excluded = get_exclusions(manager, "kv");

    std::string output = testing::internal::GetCapturedStderr();

    // the exclusion stands, and the manager remains usable
    EXPECT_THAT(excluded, ElementsAre(11));
    EXPECT_THAT(output, testing::HasSubstr("ring handler unavailable"));

    boost::system::error_code ec;
    add_outbound(0, ec);
    EXPECT_FALSE(ec);
}

TEST_F(manager_exclusion_test, ConfiguredExclusions)
{
    handoff::handoff_config config = handoff::handoff_config::from_text(
        "exclusion { module: 'kv' partition: 42 }\n"
        "exclusion { module: 'kv' partition: 7 }\n"
        "exclusion { module: 'counters' partition: 42 }\n");

    start_manager(config);

    EXPECT_THAT(get_exclusions(manager, "kv"), ElementsAre(7, 42));
    EXPECT_THAT(get_exclusions(manager, "counters"), ElementsAre(42));
}

}
}
