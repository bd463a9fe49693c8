#include "core/ConfigLoader.h"
#include "core/training/ppo/PpoConfig.h"
#include "orchestrator/OrchestratorConfig.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace SimPool;

struct TestConfig {
    std::string key;
    std::string source;
    int count = 3;
};

void from_json(const nlohmann::json& j, TestConfig& c)
{
    c.key = j.value("key", c.key);
    c.source = j.value("source", c.source);
    c.count = j.value("count", c.count);
}

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        testDir_ = std::filesystem::temp_directory_path() / "simpool_config_loader_test";
        std::filesystem::create_directories(testDir_);
        ConfigLoader::setConfigDir(testDir_.string());
    }

    void TearDown() override
    {
        std::filesystem::remove_all(testDir_);
        ConfigLoader::clearConfigDir();
    }

    void writeConfigFile(const std::string& filename, const std::string& content)
    {
        std::ofstream file(testDir_ / filename);
        file << content;
    }

    std::filesystem::path testDir_;
};

TEST_F(ConfigLoaderTest, LoadReturnsErrorWhenFileNotFound)
{
    auto result = ConfigLoader::load<TestConfig>("nonexistent.json");
    EXPECT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("not found"), std::string::npos);
}

TEST_F(ConfigLoaderTest, LoadReturnsValueWhenFileExists)
{
    writeConfigFile("test.json", R"({"key": "value"})");

    auto result = ConfigLoader::load<TestConfig>("test.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().key, "value");
    EXPECT_EQ(result.value().count, 3);
}

TEST_F(ConfigLoaderTest, LocalFileTakesPrecedenceOverBase)
{
    writeConfigFile("test.json", R"({"source": "base"})");
    writeConfigFile("test.json.local", R"({"source": "local"})");

    auto result = ConfigLoader::load<TestConfig>("test.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().source, "local");
}

TEST_F(ConfigLoaderTest, FindConfigFileReturnsLocalPathWhenBothExist)
{
    writeConfigFile("test.json", "{}");
    auto path = ConfigLoader::findConfigFile("test.json");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path.value(), testDir_ / "test.json");

    writeConfigFile("test.json.local", "{}");
    path = ConfigLoader::findConfigFile("test.json");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path.value(), testDir_ / "test.json.local");
}

TEST_F(ConfigLoaderTest, ExplicitDirectoryIsSearchedFirst)
{
    const auto paths = ConfigLoader::getSearchPaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), testDir_);
}

TEST_F(ConfigLoaderTest, InvalidJsonReturnsError)
{
    writeConfigFile("bad.json", "not valid json {{{");

    auto result = ConfigLoader::load<TestConfig>("bad.json");
    EXPECT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Parse error"), std::string::npos);
}

TEST_F(ConfigLoaderTest, EmptyFileReturnsError)
{
    writeConfigFile("empty.json", "");

    auto result = ConfigLoader::load<TestConfig>("empty.json");
    EXPECT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Empty config file"), std::string::npos);
}

TEST_F(ConfigLoaderTest, WrongValueTypeReturnsError)
{
    writeConfigFile("typed.json", R"({"count": "three"})");

    auto result = ConfigLoader::load<TestConfig>("typed.json");
    EXPECT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Failed to parse typed.json"), std::string::npos);
}

TEST_F(ConfigLoaderTest, LoadSectionReadsOneBlock)
{
    writeConfigFile(
        "simpool.json",
        R"({
            "orchestrator": { "numEnvironments": 6, "numUnits": 3, "environmentType": "ant" },
            "ppo": { "rolloutSize": 512, "gamma": 0.98 }
        })");

    auto orchestrator = ConfigLoader::loadSection<OrchestratorConfig>("simpool.json", "orchestrator");
    ASSERT_TRUE(orchestrator.isValue()) << orchestrator.errorValue();
    EXPECT_EQ(orchestrator.value().numEnvironments, 6);
    EXPECT_EQ(orchestrator.value().numUnits, 3);
    EXPECT_EQ(orchestrator.value().environmentType, Environment::EnumType::Ant);
    EXPECT_DOUBLE_EQ(orchestrator.value().physicsHz, 100.0);

    auto ppo = ConfigLoader::loadSection<PpoConfig>("simpool.json", "ppo");
    ASSERT_TRUE(ppo.isValue()) << ppo.errorValue();
    EXPECT_EQ(ppo.value().rolloutSize, 512);
    EXPECT_DOUBLE_EQ(ppo.value().gamma, 0.98);
}

TEST_F(ConfigLoaderTest, MissingSectionUsesDefaults)
{
    writeConfigFile("simpool.json", R"({"ppo": {}})");

    auto result = ConfigLoader::loadSection<TestConfig>("simpool.json", "absent");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().count, 3);
    EXPECT_TRUE(result.value().key.empty());
}

TEST_F(ConfigLoaderTest, BadSectionNamesTheSection)
{
    writeConfigFile("simpool.json", R"({"orchestrator": {"environmentType": "octopus"}})");

    auto result = ConfigLoader::loadSection<OrchestratorConfig>("simpool.json", "orchestrator");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("simpool.json:orchestrator"), std::string::npos);
}
