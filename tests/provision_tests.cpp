#include <gtest/gtest.h>

#include "core/provision.hpp"
#include "test_support.hpp"

namespace {

using core::Polarity;
using test_support::day;
using test_support::ProvisionBuilder;

TEST(ProvisionTest, NormalizeSortsAndDedupesSetFields) {
    core::NormativeProvision p{};
    p.jurisdiction = {"FR", "DE", "FR"};
    p.topic_tags = {"b", "a"};
    p.qualifiers = {"z", "z"};
    p.context_flags = {"y", "x"};
    core::normalize_provision(p);
    EXPECT_EQ(p.jurisdiction, (std::vector<std::string>{"DE", "FR"}));
    EXPECT_EQ(p.topic_tags, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(p.qualifiers, (std::vector<std::string>{"z"}));
    EXPECT_EQ(p.context_flags, (std::vector<std::string>{"x", "y"}));
}

TEST(ProvisionTest, ParsesPolarityAndBound) {
    EXPECT_EQ(core::parse_polarity("prohibits"), Polarity::Prohibits);
    EXPECT_FALSE(core::parse_polarity("forbids").has_value());
    EXPECT_EQ(core::parse_quantity_bound("at_least"), core::QuantityBound::AtLeast);
    EXPECT_FALSE(core::parse_quantity_bound("exactly").has_value());
}

TEST(ProvisionTest, IncompatiblePolarities) {
    EXPECT_TRUE(core::polarities_incompatible(Polarity::Requires, Polarity::Prohibits));
    EXPECT_TRUE(core::polarities_incompatible(Polarity::Permits, Polarity::Prohibits));
    EXPECT_FALSE(core::polarities_incompatible(Polarity::Requires, Polarity::Permits));
    EXPECT_FALSE(core::polarities_incompatible(Polarity::Prohibits, Polarity::Prohibits));
}

TEST(ProvisionTest, OverlapWindowIsHalfOpen) {
    const auto a = ProvisionBuilder("A").effective(day(2024, 1, 1)).expires(day(2024, 6, 1)).build();
    const auto b = ProvisionBuilder("B").effective(day(2024, 6, 1)).build();
    EXPECT_FALSE(core::overlap_window(a, b).has_value());
    EXPECT_TRUE(core::windows_disjoint(a, b));

    const auto c = ProvisionBuilder("C").effective(day(2024, 3, 1)).build();
    const auto w = core::overlap_window(a, c);
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(w->start, day(2024, 3, 1));
    EXPECT_EQ(w->end, day(2024, 6, 1));
}

TEST(ProvisionTest, UnknownDateIsNeitherOverlappingNorDisjoint) {
    const auto a = ProvisionBuilder("A").effective(day(2024, 1, 1)).build();
    const auto b = ProvisionBuilder("B").build();
    EXPECT_FALSE(core::overlap_window(a, b).has_value());
    EXPECT_FALSE(core::windows_disjoint(a, b));
}

TEST(ProvisionTest, ActiveOnRespectsExpiry) {
    const auto a = ProvisionBuilder("A").effective(day(2024, 1, 1)).expires(day(2024, 2, 1)).build();
    EXPECT_FALSE(core::active_on(a, day(2023, 12, 31)));
    EXPECT_TRUE(core::active_on(a, day(2024, 1, 31)));
    EXPECT_FALSE(core::active_on(a, day(2024, 2, 1)));
}

TEST(ProvisionTest, SupersessionLinkEitherDirection) {
    const auto a = ProvisionBuilder("A").superseded_by("B").build();
    const auto b = ProvisionBuilder("B").build();
    const auto c = ProvisionBuilder("C").revision_of("B").build();
    EXPECT_TRUE(core::supersession_link(a, b));
    EXPECT_TRUE(core::supersession_link(b, a));
    EXPECT_TRUE(core::supersession_link(b, c));
    EXPECT_FALSE(core::supersession_link(a, c));
}

TEST(ProvisionTest, NarrowerScopeByQualifiersOrSubset) {
    const auto general = ProvisionBuilder("G").jurisdiction({"EU"}).build();
    const auto large = ProvisionBuilder("L").jurisdiction({"EU"}).qualifiers({"staff>500"}).build();
    EXPECT_TRUE(core::is_narrower_scope(large, general));
    EXPECT_FALSE(core::is_narrower_scope(general, large));

    const auto wide = ProvisionBuilder("W").jurisdiction({"DE", "FR"}).build();
    const auto de = ProvisionBuilder("D").jurisdiction({"DE"}).build();
    EXPECT_TRUE(core::is_narrower_scope(de, wide));
    EXPECT_FALSE(core::is_narrower_scope(wide, de));
}

TEST(ProvisionTest, FingerprintTracksVerdictFields) {
    const auto a = ProvisionBuilder("A").jurisdiction({"EU"}).topics({"t"}).authority(1).build();
    auto b = a;
    EXPECT_EQ(core::provision_fingerprint(a), core::provision_fingerprint(b));
    b.authority_level = 2;
    EXPECT_NE(core::provision_fingerprint(a), core::provision_fingerprint(b));
}

TEST(ProvisionTest, CivilDayRoundTripAndStrictParse) {
    EXPECT_EQ(util::parse_civil_day("1970-01-01"), 0);
    EXPECT_EQ(util::parse_civil_day("2024-02-29"), day(2024, 2, 29));
    EXPECT_FALSE(util::parse_civil_day("2023-02-29").has_value());
    EXPECT_FALSE(util::parse_civil_day("2024-1-01").has_value());
    EXPECT_EQ(util::format_civil_day(day(2023, 6, 1)), "2023-06-01");
}

} // namespace
