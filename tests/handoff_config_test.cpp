#include "ferry/handoff/handoff_config.hpp"
#include "ferry/error.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

namespace ferry {
namespace test {

using handoff::handoff_config;

TEST(handoff_config_test, Defaults)
{
    handoff_config config;

    EXPECT_EQ(1u, config.get_handoff_concurrency());
    EXPECT_EQ(0, config.get_protobuf_description().exclusion_size());

    // an empty description carries the same defaults
    EXPECT_EQ(1u, handoff_config::from_text("").get_handoff_concurrency());
}

TEST(handoff_config_test, FromText)
{
    handoff_config config = handoff_config::from_text(
        "handoff_concurrency: 4\n"
        "exclusion { module: 'kv' partition: 42 }\n"
        "exclusion { module: 'counters' partition: 0 }\n");

    EXPECT_EQ(4u, config.get_handoff_concurrency());

    const core::protobuf::HandoffConfig & desc =
        config.get_protobuf_description();

    ASSERT_EQ(2, desc.exclusion_size());
    EXPECT_EQ("kv", desc.exclusion(0).module());
    EXPECT_EQ(42u, desc.exclusion(0).partition());
    EXPECT_EQ("counters", desc.exclusion(1).module());
}

TEST(handoff_config_test, ZeroConcurrency)
{
    EXPECT_EQ(0u, handoff_config::from_text(
        "handoff_concurrency: 0").get_handoff_concurrency());
}

TEST(handoff_config_test, MalformedText)
{
    EXPECT_THROW(handoff_config::from_text("handoff_concurrency: -1"),
        error::ferry_exception);
    EXPECT_THROW(handoff_config::from_text("handoff_concurrency 2 }"),
        error::ferry_exception);
    EXPECT_THROW(handoff_config::from_text("no_such_field: 1"),
        error::ferry_exception);
}

TEST(handoff_config_test, IncompleteExclusion)
{
    EXPECT_THROW(handoff_config::from_text("exclusion { partition: 3 }"),
        error::ferry_exception);

    core::protobuf::HandoffConfig desc;
    desc.add_exclusion()->set_module("kv");

    EXPECT_THROW(handoff_config config(desc), error::ferry_exception);
}

TEST(handoff_config_test, ExclusionWithoutModule)
{
    EXPECT_THROW(handoff_config::from_text(
        "exclusion { module: '' partition: 3 }"), error::ferry_exception);
}

TEST(handoff_config_test, FromFile)
{
    std::string path = testing::TempDir() + "ferry_handoff_config.txt";
    {
        std::ofstream out(path.c_str());
        out << "handoff_concurrency: 3\n";
        out << "exclusion { module: 'kv' partition: 9 }\n";
    }

    handoff_config config = handoff_config::from_file(path);
    std::remove(path.c_str());

    EXPECT_EQ(3u, config.get_handoff_concurrency());
    EXPECT_EQ(1, config.get_protobuf_description().exclusion_size());
}

TEST(handoff_config_test, MissingFile)
{
    EXPECT_THROW(handoff_config::from_file(
        testing::TempDir() + "ferry_no_such_config.txt"),
        error::ferry_exception);
}

}
}
