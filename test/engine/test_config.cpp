//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine/config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <exception>
#include <string>

namespace
{

using namespace devtopo::engine;  // NOLINT This our main concern here in the unit tests.

using testing::Eq;
using testing::IsTrue;
using testing::IsFalse;
using testing::IsEmpty;
using testing::NotNull;
using testing::Optional;
using testing::ElementsAre;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

// MARK: - Tests:

TEST(TestConfig, full)
{
    const auto config = Config::makeFromString(R"(
[node]
parts_matcher = "aggregator"

[[node.endpoints]]
id = 0
device_type = { id = 0x0016, revision = 1 }
clusters = [0x001D, 0x0028]

[[node.endpoints]]
id = 1
device_type = { id = 0x0100, revision = 3 }
clusters = [0x001D]

[logging]
file = "./devtopo.log"
level = "debug"
flush_level = "warn"
)");
    ASSERT_THAT(config, NotNull());

    EXPECT_THAT(config->getPartsMatcher(), Optional(std::string{"aggregator"}));
    EXPECT_THAT(config->getLoggingFile(), Optional(std::string{"./devtopo.log"}));
    EXPECT_THAT(config->getLoggingLevel(), Optional(std::string{"debug"}));
    EXPECT_THAT(config->getLoggingFlushLevel(), Optional(std::string{"warn"}));

    const auto endpoints = config->getEndpoints();
    ASSERT_THAT(endpoints.size(), 2);

    EXPECT_THAT(endpoints[0].id, Optional(0));
    EXPECT_THAT(endpoints[0].device_type_id, Optional(0x0016));
    EXPECT_THAT(endpoints[0].device_type_revision, 1);
    EXPECT_THAT(endpoints[0].clusters, ElementsAre(0x001D, 0x0028));
    EXPECT_THAT(endpoints[0].invalid_keys, IsEmpty());

    EXPECT_THAT(endpoints[1].id, Optional(1));
    EXPECT_THAT(endpoints[1].device_type_id, Optional(0x0100));
    EXPECT_THAT(endpoints[1].device_type_revision, 3);
    EXPECT_THAT(endpoints[1].clusters, ElementsAre(0x001D));
}

TEST(TestConfig, defaults)
{
    const auto config = Config::makeFromString("");
    ASSERT_THAT(config, NotNull());

    EXPECT_THAT(config->getPartsMatcher(), Optional(std::string{"standard"}));
    EXPECT_THAT(config->getEndpoints(), IsEmpty());
    EXPECT_THAT(config->getLoggingFile().has_value(), IsFalse());
    EXPECT_THAT(config->getLoggingLevel().has_value(), IsFalse());
    EXPECT_THAT(config->getLoggingFlushLevel().has_value(), IsFalse());
}

TEST(TestConfig, partial_endpoint)
{
    const auto config = Config::makeFromString(R"(
[[node.endpoints]]
device_type = { id = 5 }

[[node.endpoints]]
id = "one"
)");
    ASSERT_THAT(config, NotNull());

    const auto endpoints = config->getEndpoints();
    ASSERT_THAT(endpoints.size(), 2);

    EXPECT_THAT(endpoints[0].id.has_value(), IsFalse());
    EXPECT_THAT(endpoints[0].device_type_id, Optional(5));
    EXPECT_THAT(endpoints[0].device_type_revision, 1);
    EXPECT_THAT(endpoints[0].clusters, IsEmpty());
    EXPECT_THAT(endpoints[0].invalid_keys, IsEmpty());

    // Wrong type is reported, unlike the missing `device_type`.
    EXPECT_THAT(endpoints[1].id.has_value(), IsFalse());
    EXPECT_THAT(endpoints[1].device_type_id.has_value(), IsFalse());
    EXPECT_THAT(endpoints[1].invalid_keys, ElementsAre("id"));
}

TEST(TestConfig, malformed_endpoint_keys)
{
    const auto config = Config::makeFromString(R"(
[[node.endpoints]]
id = 0
device_type = { id = 0x0016 }
clusters = [0x001D, "x"]

[[node.endpoints]]
id = 1
device_type = { id = 0x10000, revision = -1 }
clusters = [0x001D, 0x100000000]

[[node.endpoints]]
id = 2
device_type = "light"
clusters = { id = 0x001D }
)");
    ASSERT_THAT(config, NotNull());

    const auto endpoints = config->getEndpoints();
    ASSERT_THAT(endpoints.size(), 3);

    EXPECT_THAT(endpoints[0].id, Optional(0));
    EXPECT_THAT(endpoints[0].device_type_id, Optional(0x0016));
    EXPECT_THAT(endpoints[0].clusters, IsEmpty());
    EXPECT_THAT(endpoints[0].invalid_keys, ElementsAre("clusters"));

    EXPECT_THAT(endpoints[1].device_type_id.has_value(), IsFalse());
    EXPECT_THAT(endpoints[1].device_type_revision, 1);
    EXPECT_THAT(endpoints[1].clusters, IsEmpty());
    EXPECT_THAT(endpoints[1].invalid_keys, ElementsAre("device_type.id", "device_type.revision", "clusters"));

    EXPECT_THAT(endpoints[2].invalid_keys, ElementsAre("device_type", "clusters"));
}

TEST(TestConfig, malformed_parts_matcher)
{
    const auto config = Config::makeFromString("[node]\nparts_matcher = [\"standard\"]\n");
    ASSERT_THAT(config, NotNull());

    EXPECT_THAT(config->getPartsMatcher().has_value(), IsFalse());
}

TEST(TestConfig, syntax_error)
{
    EXPECT_THROW((void) Config::makeFromString("[node\nparts_matcher = "), std::exception);
}

TEST(TestConfig, missing_file)
{
    EXPECT_THROW((void) Config::make("/nonexistent/devtopo.toml"), std::exception);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
