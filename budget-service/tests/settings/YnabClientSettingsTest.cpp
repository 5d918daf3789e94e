#include <gtest/gtest.h>

#include "settings/YnabClientSettings.hpp"
#include "settings/OutputSettings.hpp"
#include <cstdlib>

using namespace budget::settings;

// ============================================================================
// Test Fixture: окружение восстанавливается после каждого теста
// ============================================================================

class YnabClientSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("YNAB_API_KEY");
        unsetenv("YNAB_API_HOST");
        unsetenv("YNAB_API_PORT");
        unsetenv("YNAB_API_BASE_PATH");
        unsetenv("YNAB_OUTPUT_DIR");
    }

    void TearDown() override {
        SetUp();
    }
};

TEST_F(YnabClientSettingsTest, Defaults) {
    YnabClientSettings settings;

    EXPECT_EQ(settings.getHost(), "api.ynab.com");
    EXPECT_EQ(settings.getPort(), 443);
    EXPECT_EQ(settings.getBasePath(), "/v1");
    EXPECT_FALSE(settings.getAccessToken().has_value());
}

TEST_F(YnabClientSettingsTest, TokenReadOnEveryCall) {
    YnabClientSettings settings;
    EXPECT_FALSE(settings.getAccessToken().has_value());

    setenv("YNAB_API_KEY", "abc123", 1);

    EXPECT_EQ(settings.getAccessToken(), std::optional<std::string>("abc123"));
}

TEST_F(YnabClientSettingsTest, EmptyTokenIsMissing) {
    setenv("YNAB_API_KEY", "", 1);
    YnabClientSettings settings;

    EXPECT_FALSE(settings.getAccessToken().has_value());
}

TEST_F(YnabClientSettingsTest, OutputDir_DefaultAndOverride) {
    EXPECT_EQ(OutputSettings().getOutputDir(), std::filesystem::path("/tmp/ynab-mcp"));

    setenv("YNAB_OUTPUT_DIR", "/var/budget", 1);

    EXPECT_EQ(OutputSettings().getOutputDir(), std::filesystem::path("/var/budget"));
}
