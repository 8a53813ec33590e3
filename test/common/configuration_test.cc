#include <gtest/gtest.h>
#include "../../src/common/config.h"
#include "../../src/common/env_flags.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace Estuary;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("ESTUARY_DATA_BATCH_SIZE");
        unsetenv("ESTUARY_DETERMINISTIC_WITHIN_TIMESTAMP");
        Configuration::getInstance().resetToDefaults();
    }

    void TearDown() override {
        unsetenv("ESTUARY_DATA_BATCH_SIZE");
        unsetenv("ESTUARY_DETERMINISTIC_WITHIN_TIMESTAMP");
        Configuration::getInstance().resetToDefaults();
    }

    Configuration& config() { return Configuration::getInstance(); }
};

TEST_F(ConfigurationTest, Defaults) {
    EXPECT_EQ(config().getDataBatchSize(), 80000u);
    EXPECT_FALSE(config().getDeterministicWithinTimestamp());
    EXPECT_EQ(config().getMaxCachedBatches(), 64u);
    EXPECT_FALSE(config().config().pool.force_row_oriented.get());
    EXPECT_EQ(DataBatchSize(), 80000u);
    EXPECT_TRUE(config().validate());
}

TEST_F(ConfigurationTest, LoadFromString) {
    const std::string yaml = R"(
estuary:
  engine:
    data_batch_size: 1024
    deterministic_within_timestamp: true
  pool:
    max_cached_batches: 8
    force_row_oriented: true
)";
    ASSERT_TRUE(config().loadFromString(yaml));
    EXPECT_EQ(config().getDataBatchSize(), 1024u);
    EXPECT_TRUE(config().getDeterministicWithinTimestamp());
    EXPECT_TRUE(DeterministicWithinTimestamp());
    EXPECT_EQ(config().getMaxCachedBatches(), 8u);
    EXPECT_TRUE(config().config().pool.force_row_oriented.get());
}

TEST_F(ConfigurationTest, PartialYamlKeepsOtherValues) {
    ASSERT_TRUE(config().loadFromString("estuary:\n  pool:\n    max_cached_batches: 3\n"));
    EXPECT_EQ(config().getMaxCachedBatches(), 3u);
    EXPECT_EQ(config().getDataBatchSize(), 80000u);
}

TEST_F(ConfigurationTest, MissingRootKeyChangesNothing) {
    EXPECT_TRUE(config().loadFromString("other:\n  data_batch_size: 5\n"));
    EXPECT_EQ(config().getDataBatchSize(), 80000u);
}

TEST_F(ConfigurationTest, InvalidYamlIsRejected) {
    EXPECT_FALSE(config().loadFromString("estuary: [unclosed"));
    EXPECT_FALSE(config().loadFromString("estuary:\n  engine:\n    data_batch_size: lots\n"));
    EXPECT_FALSE(config().loadFromFile("/nonexistent/estuary.yaml"));
}

TEST_F(ConfigurationTest, ValidationReportsZeroBatchSize) {
    EXPECT_FALSE(config().loadFromString("estuary:\n  engine:\n    data_batch_size: 0\n"));
    auto errors = config().getValidationErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("batch size"), std::string::npos);
}

TEST_F(ConfigurationTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "estuary_config_test.yaml";
    {
        std::ofstream out(path);
        out << "estuary:\n  engine:\n    data_batch_size: 256\n";
    }
    ASSERT_TRUE(config().loadFromFile(path));
    EXPECT_EQ(config().getDataBatchSize(), 256u);
    std::remove(path.c_str());
}

TEST_F(ConfigurationTest, EnvironmentOverridesLoadedValue) {
    ASSERT_TRUE(config().loadFromString("estuary:\n  engine:\n    data_batch_size: 1024\n"));
    setenv("ESTUARY_DATA_BATCH_SIZE", "4096", 1);
    setenv("ESTUARY_DETERMINISTIC_WITHIN_TIMESTAMP", "on", 1);

    EXPECT_EQ(config().getDataBatchSize(), 4096u);
    EXPECT_TRUE(config().getDeterministicWithinTimestamp());

    // Unparseable values fall back to the configured one
    setenv("ESTUARY_DATA_BATCH_SIZE", "many", 1);
    setenv("ESTUARY_DETERMINISTIC_WITHIN_TIMESTAMP", "maybe", 1);
    EXPECT_EQ(config().getDataBatchSize(), 1024u);
    EXPECT_FALSE(config().getDeterministicWithinTimestamp());
}

TEST_F(ConfigurationTest, ResetToDefaults) {
    config().config().engine.data_batch_size.set(7);
    config().config().engine.deterministic_within_timestamp.set(true);
    config().resetToDefaults();
    EXPECT_EQ(config().getDataBatchSize(), 80000u);
    EXPECT_FALSE(config().getDeterministicWithinTimestamp());
}

TEST(EnvFlagsTest, RecognizedSpellings) {
    EXPECT_TRUE(IsEnvTrueValue("1"));
    EXPECT_TRUE(IsEnvTrueValue("yes"));
    EXPECT_TRUE(IsEnvTrueValue("ON"));
    EXPECT_FALSE(IsEnvTrueValue(""));
    EXPECT_FALSE(IsEnvTrueValue(nullptr));
    EXPECT_TRUE(IsEnvFalseValue("false"));
    EXPECT_TRUE(IsEnvFalseValue("off"));
    EXPECT_FALSE(IsEnvFalseValue("2"));
}
