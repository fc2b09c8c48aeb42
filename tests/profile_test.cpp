#include <gtest/gtest.h>

#include <cmath>

#include "auxon/audio.h"
#include "auxon/profile.h"

using namespace auxon;

TEST(ProfileTest, NamesRoundTrip) {
    for (const auto& p : allProfiles()) {
        TransmissionProfile parsed;
        ASSERT_TRUE(parseProfile(p.name, parsed)) << p.name;
        EXPECT_EQ(parsed, p.id);
        EXPECT_STREQ(profileParams(parsed).name, p.name);
    }

    TransmissionProfile parsed;
    EXPECT_FALSE(parseProfile("warp_speed", parsed));
    EXPECT_FALSE(parseProfile("", parsed));
}

TEST(ProfileTest, TonesSitOnFftBins) {
    for (const auto& p : allProfiles()) {
        const int n = samplesPerBit(p);
        EXPECT_DOUBLE_EQ(std::fmod(p.f0 * n, kSampleRate), 0.0) << p.name;
        EXPECT_DOUBLE_EQ(std::fmod(p.f1 * n, kSampleRate), 0.0) << p.name;
        EXPECT_LT(p.f1, kSampleRate / 2.0) << p.name;
    }
}

TEST(ProfileTest, SamplesPerBit) {
    EXPECT_EQ(samplesPerBit(profileParams(TransmissionProfile::AudibleNormal)), 480);
    EXPECT_EQ(samplesPerBit(profileParams(TransmissionProfile::AudibleFast)), 240);
    EXPECT_EQ(samplesPerBit(profileParams(TransmissionProfile::UltrasoundFastest)), 120);
}

TEST(ProfileTest, SelectsMostRobustProfileThatFits) {
    TransmissionProfile selected;

    ASSERT_TRUE(selectProfile(0, Band::Audible, selected));
    EXPECT_EQ(selected, TransmissionProfile::AudibleNormal);

    ASSERT_TRUE(selectProfile(256, Band::Audible, selected));
    EXPECT_EQ(selected, TransmissionProfile::AudibleNormal);

    ASSERT_TRUE(selectProfile(257, Band::Audible, selected));
    EXPECT_EQ(selected, TransmissionProfile::AudibleFast);

    ASSERT_TRUE(selectProfile(600, Band::Ultrasound, selected));
    EXPECT_EQ(selected, TransmissionProfile::UltrasoundFastest);

    EXPECT_FALSE(selectProfile(1025, Band::Audible, selected));
}

TEST(ProfileTest, ParsesBands) {
    Band band;
    ASSERT_TRUE(parseBand("ultrasound", band));
    EXPECT_EQ(band, Band::Ultrasound);
    EXPECT_STREQ(bandName(band), "ultrasound");
    EXPECT_FALSE(parseBand("infrasound", band));
}
