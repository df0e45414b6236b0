//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "devtopo/dm/dataver.hpp"

#include "devtopo/dm/types.hpp"

#include <cetl/pf20/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <limits>
#include <thread>

namespace
{

using namespace devtopo::dm;  // NOLINT This our main concern here in the unit tests.

using testing::IsTrue;
using testing::IsFalse;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

// MARK: - Tests:

TEST(TestDataver, seeded_from_rand)
{
    std::size_t   requested = 0;
    const Dataver dataver{[&requested](const cetl::span<std::uint8_t> buffer) {
        //
        requested          = buffer.size();
        std::uint8_t value = 0x12;
        for (auto& byte : buffer)
        {
            byte = value;
            value += 0x22;
        }
    }};

    EXPECT_THAT(requested, sizeof(DataVer));
    EXPECT_THAT(dataver.get(), 0x12345678);
}

TEST(TestDataver, changed_increments)
{
    Dataver dataver{41};
    EXPECT_THAT(dataver.get(), 41);

    EXPECT_THAT(dataver.changed(), 42);
    EXPECT_THAT(dataver.get(), 42);
    EXPECT_THAT(dataver.changed(), 43);
}

TEST(TestDataver, changed_wraps_around)
{
    Dataver dataver{std::numeric_limits<DataVer>::max()};

    EXPECT_THAT(dataver.changed(), 0);
    EXPECT_THAT(dataver.get(), 0);
}

TEST(TestDataver, consumeChange_is_edge_triggered)
{
    Dataver dataver{0};
    EXPECT_THAT(dataver.consumeChange(), IsFalse());

    // A burst of changes is consumed once.
    dataver.changed();
    dataver.changed();
    dataver.changed();
    EXPECT_THAT(dataver.consumeChange(), IsTrue());
    EXPECT_THAT(dataver.consumeChange(), IsFalse());
    EXPECT_THAT(dataver.get(), 3);

    dataver.changed();
    EXPECT_THAT(dataver.consumeChange(), IsTrue());
    EXPECT_THAT(dataver.consumeChange(), IsFalse());
}

TEST(TestDataver, changed_concurrently_with_consumeChange)
{
    constexpr DataVer Bursts      = 500;
    constexpr DataVer BurstLength = 3;

    Dataver              dataver{0};
    std::atomic<DataVer> consumed{0};
    std::atomic<bool>    done{false};

    // Next burst starts only after at least `burst + 1` consumptions.
    std::thread mutator{[&dataver, &consumed, &done] {
        //
        for (DataVer burst = 0; burst < Bursts; ++burst)
        {
            for (DataVer i = 0; i < BurstLength; ++i)
            {
                dataver.changed();
            }
            while (consumed.load() <= burst)
            {
                std::this_thread::yield();
            }
        }
        done = true;
    }};

    while (!done.load())
    {
        if (dataver.consumeChange())
        {
            ++consumed;
        }
        else
        {
            std::this_thread::yield();
        }
    }
    mutator.join();

    EXPECT_THAT(consumed.load(), testing::Ge(Bursts));
    EXPECT_THAT(dataver.get(), Bursts * BurstLength);

    // A change which landed after the last counted consumption is still pending, but only once.
    (void) dataver.consumeChange();
    EXPECT_THAT(dataver.consumeChange(), IsFalse());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
