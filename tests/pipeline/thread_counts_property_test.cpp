// =============================================================================
// sendstream-upgrade - Thread Allocation Property Tests
// =============================================================================

#include "ssu/pipeline/thread_counts.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>

namespace ssu::pipeline::test {

// =============================================================================
// Generators
// =============================================================================

namespace gen {

rc::Gen<ThreadTunables> validTunables() {
    return rc::gen::apply(
        [](std::uint32_t nonScalable, std::uint32_t maxConstructors, std::uint32_t weight,
           int ratioPercent) {
            ThreadTunables tunables;
            tunables.nonScalableRoles = nonScalable;
            tunables.maxConstructors = maxConstructors;
            tunables.compressorWeight = weight;
            tunables.minCompressorRatio = ratioPercent / 100.0;
            return tunables;
        },
        rc::gen::inRange<std::uint32_t>(1, 9), rc::gen::inRange<std::uint32_t>(1, 17),
        rc::gen::inRange<std::uint32_t>(1, 9), rc::gen::inRange(1, 101));
}

}  // namespace gen

std::uint32_t budgetFor(std::uint32_t requested, std::uint32_t cpus) {
    const std::uint32_t cap = std::max<std::uint32_t>(cpus / 2, 1);
    return requested == 0 ? cap : std::min(requested, cap);
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(ThreadCountsProperty, AllocationUsesExactBudgetOrFallsBack, ()) {
    const auto tunables = *gen::validTunables();
    const auto requested = *rc::gen::inRange<std::uint32_t>(0, 200);
    const auto cpus = *rc::gen::inRange<std::uint32_t>(1, 400);
    RC_PRE(tunables.validate().has_value());

    const ThreadCounts counts = computeThreadCounts(requested, cpus, tunables);
    const std::uint32_t budget = budgetFor(requested, cpus);

    if (budget < tunables.minimumViablePipeline()) {
        RC_ASSERT(counts == ThreadCounts{});
    } else {
        RC_ASSERT(counts.total(tunables) == budget);
    }
}

RC_GTEST_PROP(ThreadCountsProperty, CompressorRatioIsGuaranteed, ()) {
    const auto tunables = *gen::validTunables();
    const auto requested = *rc::gen::inRange<std::uint32_t>(0, 200);
    const auto cpus = *rc::gen::inRange<std::uint32_t>(1, 400);
    RC_PRE(tunables.validate().has_value());

    const ThreadCounts counts = computeThreadCounts(requested, cpus, tunables);

    RC_ASSERT(counts.constructors >= 1u);
    RC_ASSERT(counts.constructors <= tunables.maxConstructors);
    RC_ASSERT(counts.compressors >= 1u);
    RC_ASSERT(static_cast<double>(counts.compressors) >=
              tunables.minCompressorRatio * static_cast<double>(counts.constructors));
}

RC_GTEST_PROP(ThreadCountsProperty, LargerBudgetNeverShrinksPipeline, ()) {
    const auto requested = *rc::gen::inRange<std::uint32_t>(1, 100);
    const auto cpus = *rc::gen::inRange<std::uint32_t>(1, 400);

    const ThreadCounts smaller = computeThreadCounts(requested, cpus);
    const ThreadCounts larger = computeThreadCounts(requested + 1, cpus);
    RC_ASSERT(larger.constructors >= smaller.constructors);
    RC_ASSERT(larger.compressors >= smaller.compressors);
}

// =============================================================================
// Examples
// =============================================================================

TEST(ThreadCountsTest, SmallBudgetsFallBackToOneOfEach) {
    EXPECT_EQ(computeThreadCounts(1, 64), ThreadCounts{});
    EXPECT_EQ(computeThreadCounts(5, 64), ThreadCounts{});
    EXPECT_EQ(computeThreadCounts(0, 4), ThreadCounts{});
}

TEST(ThreadCountsTest, BudgetIsCappedAtHalfTheCpus) {
    const ThreadCounts counts = computeThreadCounts(100, 24);
    EXPECT_EQ(counts.total(ThreadTunables{}), 12u);
    EXPECT_EQ(counts.constructors, 2u);
    EXPECT_EQ(counts.compressors, 6u);
}

TEST(ThreadCountsTest, ConstructorsAreCapped) {
    const ThreadCounts counts = computeThreadCounts(0, 256);
    EXPECT_EQ(counts.constructors, 4u);
    EXPECT_EQ(counts.compressors, 124u - 4u);
}

TEST(ThreadCountsTest, DefaultTunablesAreValid) {
    EXPECT_TRUE(ThreadTunables{}.validate().has_value());
}

TEST(ThreadCountsTest, InvalidTunablesAreRejected) {
    ThreadTunables noRoles;
    noRoles.nonScalableRoles = 0;
    EXPECT_EQ(noRoles.validate().error().code(), ErrorCode::kConfigurationError);

    ThreadTunables noWeight;
    noWeight.compressorWeight = 0;
    EXPECT_FALSE(noWeight.validate().has_value());

    ThreadTunables ratioTooHigh;
    ratioTooHigh.minCompressorRatio = 1.5;
    EXPECT_FALSE(ratioTooHigh.validate().has_value());

    ThreadTunables ratioZero;
    ratioZero.minCompressorRatio = 0.0;
    EXPECT_FALSE(ratioZero.validate().has_value());
}

TEST(ThreadCountsTest, AvailableCpusIsPositive) {
    EXPECT_GE(availableCpuCount(), 1u);
}

}  // namespace ssu::pipeline::test
