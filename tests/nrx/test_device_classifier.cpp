#include <gtest/gtest.h>
#include <nrx/llm/device_classifier.hpp>

#include "fakes.hpp"

using namespace nrx;
using namespace nrx::llm;
using nrx::test::GB;

class DeviceClassifierTest : public ::testing::Test {
protected:
    DeviceClassification classify() {
        DeviceClassifier classifier(&device_, logger_);
        return classifier.classify();
    }

    test::FakeDeviceInfo device_;
    NullLogger logger_;
};

// ============================================================================
// RAM Tiers
// ============================================================================

TEST_F(DeviceClassifierTest, RamThresholdsOnArm64) {
    struct Case { uint64_t bytes; CapabilityTier tier; };
    const Case cases[] = {
        {12 * GB, CapabilityTier::STANDARD},
        {6 * GB, CapabilityTier::STANDARD},
        {6 * GB - 1, CapabilityTier::COMPACT},
        {4 * GB, CapabilityTier::COMPACT},
        {3 * GB, CapabilityTier::MINIMAL},
        {3 * GB - 1, CapabilityTier::UNSUPPORTED},
        {1 * GB, CapabilityTier::UNSUPPORTED},
    };

    for (const auto& c : cases) {
        device_.memory = c.bytes;
        EXPECT_EQ(classify().tier, c.tier) << "bytes=" << c.bytes;
    }
}

TEST_F(DeviceClassifierTest, ReportsRamInBinaryGigabytes) {
    device_.memory = 6 * GB;
    auto result = classify();
    EXPECT_DOUBLE_EQ(result.ram_gb, 6.0);
    EXPECT_EQ(result.architecture, "arm64");
    EXPECT_EQ(result.model, "Pixel 8");
}

TEST_F(DeviceClassifierTest, NonArmIsUnsupportedRegardlessOfRam) {
    device_.memory = 64 * GB;
    device_.abis = {"x86_64", "x86"};

    auto result = classify();
    EXPECT_EQ(result.tier, CapabilityTier::UNSUPPORTED);
    EXPECT_EQ(result.architecture, "x86_64");
}

TEST_F(DeviceClassifierTest, NoAbisIsUnsupported) {
    device_.abis = {};
    auto result = classify();
    EXPECT_EQ(result.tier, CapabilityTier::UNSUPPORTED);
    EXPECT_EQ(result.architecture, "unknown");
}

TEST_F(DeviceClassifierTest, AcceptsAarch64Abi) {
    device_.abis = {"aarch64"};
    EXPECT_EQ(classify().tier, CapabilityTier::STANDARD);
}

// ============================================================================
// Foundation Eligibility
// ============================================================================

TEST(FoundationEligibilityTest, MatchesModelGenerations) {
    EXPECT_TRUE(is_foundation_eligible("iPhone17,1"));
    EXPECT_TRUE(is_foundation_eligible("iPhone16,2"));
    EXPECT_FALSE(is_foundation_eligible("iPhone15,3"));
    EXPECT_TRUE(is_foundation_eligible("iPad14,1"));
    EXPECT_TRUE(is_foundation_eligible("iPad16,3"));
    // A14 tablets share major 13 with the first M1 models
    EXPECT_FALSE(is_foundation_eligible("iPad13,1"));
    EXPECT_FALSE(is_foundation_eligible("iPad13,18"));
    EXPECT_FALSE(is_foundation_eligible("iPad12,1"));
    EXPECT_FALSE(is_foundation_eligible("Pixel 8"));
    EXPECT_FALSE(is_foundation_eligible("iPhone"));
    EXPECT_FALSE(is_foundation_eligible(""));
}

TEST_F(DeviceClassifierTest, EligibleIphoneOnNewOsGetsFoundation) {
    device_.device_model = "iPhone17,1";
    device_.os = "ios";
    device_.version = "26.0";

    auto result = classify();
    EXPECT_EQ(result.tier, CapabilityTier::APPLE_FOUNDATION);
    EXPECT_TRUE(result.foundation_eligible);
}

TEST_F(DeviceClassifierTest, OldIphoneFallsBackToRamTier) {
    device_.device_model = "iPhone15,2";
    device_.os = "ios";
    device_.version = "26.0";
    device_.memory = 6 * GB;

    auto result = classify();
    EXPECT_EQ(result.tier, CapabilityTier::STANDARD);
    EXPECT_FALSE(result.foundation_eligible);
}

TEST_F(DeviceClassifierTest, EligibleModelOnOldOsUsesRamTier) {
    device_.device_model = "iPhone17,1";
    device_.os = "ios";
    device_.version = "18.4";
    device_.memory = 4 * GB;

    auto result = classify();
    EXPECT_EQ(result.tier, CapabilityTier::COMPACT);
    EXPECT_TRUE(result.foundation_eligible);
}

TEST_F(DeviceClassifierTest, EligibleModelOnOtherOsUsesRamTier) {
    device_.device_model = "iPhone17,1";
    device_.os = "linux";
    device_.version = "30";

    EXPECT_EQ(classify().tier, CapabilityTier::STANDARD);
}

TEST_F(DeviceClassifierTest, NonArmClearsEligibility) {
    device_.device_model = "iPhone17,1";
    device_.os = "ios";
    device_.version = "26.0";
    device_.abis = {"x86_64"};

    auto result = classify();
    EXPECT_EQ(result.tier, CapabilityTier::UNSUPPORTED);
    EXPECT_FALSE(result.foundation_eligible);
}

// ============================================================================
// Degraded Input
// ============================================================================

TEST_F(DeviceClassifierTest, ReadFailureYieldsDefaultClassification) {
    device_.fail = true;

    auto result = classify();
    EXPECT_EQ(result.tier, CapabilityTier::UNSUPPORTED);
    EXPECT_DOUBLE_EQ(result.ram_gb, 0.0);
    EXPECT_EQ(result.architecture, "unknown");
    EXPECT_EQ(result.model, "unknown");
}

TEST_F(DeviceClassifierTest, NonStandardReadFailureYieldsDefaultClassification) {
    device_.fail_with_code = true;

    DeviceClassification result;
    EXPECT_NO_THROW(result = classify());
    EXPECT_EQ(result.tier, CapabilityTier::UNSUPPORTED);
    EXPECT_DOUBLE_EQ(result.ram_gb, 0.0);
    EXPECT_EQ(result.model, "unknown");
}

TEST(DeviceClassifierNoSourceTest, MissingSourceIsUnsupported) {
    NullLogger logger;
    DeviceClassifier classifier(nullptr, logger);

    auto result = classifier.classify();
    EXPECT_EQ(result.tier, CapabilityTier::UNSUPPORTED);
    EXPECT_EQ(result.model, "unknown");
}

TEST(TierNameTest, StableNames) {
    EXPECT_STREQ(tier_name(CapabilityTier::APPLE_FOUNDATION), "apple_foundation");
    EXPECT_STREQ(tier_name(CapabilityTier::STANDARD), "standard");
    EXPECT_STREQ(tier_name(CapabilityTier::COMPACT), "compact");
    EXPECT_STREQ(tier_name(CapabilityTier::MINIMAL), "minimal");
    EXPECT_STREQ(tier_name(CapabilityTier::UNSUPPORTED), "unsupported");
}
