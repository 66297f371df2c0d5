#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "ingest/provision_loader.hpp"
#include "test_support.hpp"

namespace {

using test_support::day;

TEST(ProvisionLoaderTest, ParsesFullProvision) {
    const std::string json = R"({"provisions": [
        {"id": "GDPR-33", "framework_id": "gdpr", "jurisdiction": ["EU", "DE", "EU"], "authority_level": 3,
         "effective_date": "2018-05-25", "expiry_date": null, "superseded_by": null, "revision_of": "DPD-17",
         "polarity": "requires", "topic_tags": ["breach"], "obligation": "notify the authority",
         "quantity": {"value": 72, "unit": "h", "bound": "at_most"}, "qualifiers": [],
         "context_flags": ["cross_border"], "entity_count": 250000}
    ]})";
    std::vector<core::NormativeProvision> out;
    std::string error;
    ASSERT_TRUE(ingest::parse_provisions(json, out, error)) << error;
    ASSERT_EQ(out.size(), 1u);
    const auto& p = out.front();
    EXPECT_EQ(p.id, "GDPR-33");
    EXPECT_EQ(p.jurisdiction, (std::vector<std::string>{"DE", "EU"}));
    EXPECT_EQ(p.authority_level, 3);
    EXPECT_EQ(p.effective_date, day(2018, 5, 25));
    EXPECT_FALSE(p.expiry_date.has_value());
    EXPECT_EQ(p.revision_of, "DPD-17");
    EXPECT_EQ(p.polarity, core::Polarity::Requires);
    ASSERT_TRUE(p.quantity.has_value());
    EXPECT_DOUBLE_EQ(p.quantity->value, 72.0);
    EXPECT_EQ(p.quantity->bound, core::QuantityBound::AtMost);
    EXPECT_EQ(p.entity_count, 250000u);
}

TEST(ProvisionLoaderTest, MinimalProvisionUsesDefaults) {
    std::vector<core::NormativeProvision> out;
    std::string error;
    ASSERT_TRUE(ingest::parse_provisions(R"({"provisions": [{"id": "X", "polarity": "permits"}]})", out, error))
        << error;
    EXPECT_FALSE(out.front().effective_date.has_value());
    EXPECT_TRUE(out.front().jurisdiction.empty());
}

struct BadInput {
    const char* json;
    const char* message;
};

class ProvisionLoaderRejectTest : public ::testing::TestWithParam<BadInput> {};

TEST_P(ProvisionLoaderRejectTest, RejectsAndKeepsOutput) {
    std::vector<core::NormativeProvision> out(2);
    std::string error;
    EXPECT_FALSE(ingest::parse_provisions(GetParam().json, out, error));
    EXPECT_NE(error.find(GetParam().message), std::string::npos) << error;
    EXPECT_EQ(out.size(), 2u);
}

INSTANTIATE_TEST_SUITE_P(
    Inputs, ProvisionLoaderRejectTest,
    ::testing::Values(
        BadInput{R"({"provisions": [{"polarity": "requires"}]})", "missing id"},
        BadInput{R"({"provisions": [{"id": "A"}]})", "missing polarity"},
        BadInput{R"({"provisions": [{"id": "A", "polarity": "shall"}]})", "unknown polarity"},
        BadInput{R"({"provisions": [{"id": "A", "polarity": "requires", "colour": 1}]})", "unknown provision field"},
        BadInput{R"({"provisions": [{"id": "A", "polarity": "requires", "effective_date": "2024-02-30"}]})",
                 "invalid date"},
        BadInput{R"({"provisions": [{"id": "A", "polarity": "requires", "effective_date": "2024-01-01",
                     "expiry_date": "2023-01-01"}]})",
                 "expires before"},
        BadInput{R"({"provisions": [{"id": "A", "polarity": "requires"}, {"id": "A", "polarity": "permits"}]})",
                 "duplicate provision id"},
        BadInput{R"({"provisions": [{"id": "A", "polarity": "requires", "quantity": {"unit": "h"}}]})",
                 "missing value"},
        BadInput{R"({})", "missing provisions array"},
        BadInput{R"({"provisions": []} [])", "trailing content"}));

TEST(ProvisionLoaderTest, LoadsFileAndPrefixesPath) {
    const auto path = std::filesystem::temp_directory_path() / "normconflict_provisions_test.json";
    {
        std::ofstream f(path);
        f << R"({"provisions": [{"id": "A", "polarity": "prohibits"}, {"id": "B", "polarity": "requires"}]})";
    }
    std::vector<core::NormativeProvision> out;
    std::string error;
    ASSERT_TRUE(ingest::load_provisions(path, out, error)) << error;
    EXPECT_EQ(out.size(), 2u);

    {
        std::ofstream f(path);
        f << R"({"provisions": [{"id": "A"}]})";
    }
    EXPECT_FALSE(ingest::load_provisions(path, out, error));
    EXPECT_EQ(error.rfind(path.string(), 0), 0u);
    EXPECT_EQ(out.size(), 2u);
    std::filesystem::remove(path);
}

} // namespace
