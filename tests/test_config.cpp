#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path project_dir;
    fs::path global_path;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("prompt_merge_config_test_" + std::to_string(getpid()));
        fs::remove_all(test_dir);
        project_dir = test_dir / "project";
        global_path = test_dir / "home" / ".prompt-merge" / "config.yaml";
        fs::create_directories(project_dir);
        fs::create_directories(global_path.parent_path());
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_global(const std::string& yaml) {
        std::ofstream(global_path) << yaml;
    }

    void write_project(const std::string& yaml) {
        std::ofstream(project_dir / "prompt-merge.yaml") << yaml;
    }
};

TEST_F(ConfigTest, DefaultsWithoutFiles) {
    auto r = Config::load(project_dir, global_path);
    ASSERT_TRUE(r.is_ok()) << r.error;

    const Config& c = r.value;
    EXPECT_EQ(c.output(), "CLAUDE.md");
    EXPECT_EQ(c.templates_dir().filename(), "templates");
    ASSERT_EQ(c.scan().extensions.size(), 1u);
    EXPECT_EQ(c.scan().extensions[0], ".md");
    ASSERT_EQ(c.scan().exclude.size(), 1u);
    EXPECT_EQ(c.scan().exclude[0], "README.md");
    EXPECT_TRUE(c.scan().title_from_heading);
    EXPECT_TRUE(c.merge().header);
    EXPECT_FALSE(c.merge().base_first);
    EXPECT_TRUE(c.sources().empty());
}

TEST_F(ConfigTest, ProjectOverridesGlobal) {
    write_global("output: global.md\nbase_first: true\ndocument_title: AGENTS.md\n");
    write_project("output: project.md\n");

    auto r = Config::load(project_dir, global_path);
    ASSERT_TRUE(r.is_ok()) << r.error;

    EXPECT_EQ(r.value.output(), "project.md");
    EXPECT_TRUE(r.value.merge().base_first);
    EXPECT_EQ(r.value.merge().document_title, "AGENTS.md");
    EXPECT_EQ(r.value.sources().size(), 2u);
}

TEST_F(ConfigTest, RelativeTemplatesDirResolvesAgainstConfigFile) {
    write_project("templates_dir: prompts\n");

    auto r = Config::load(project_dir, global_path);
    ASSERT_TRUE(r.is_ok()) << r.error;

    EXPECT_EQ(r.value.templates_dir(), (project_dir / "prompts").lexically_normal());
}

TEST_F(ConfigTest, ExtensionsAcceptScalarAndAddDot) {
    write_project("extensions: txt\nexclude: [INDEX.md, README.md]\ntitle_from_heading: false\n");

    auto r = Config::load(project_dir, global_path);
    ASSERT_TRUE(r.is_ok()) << r.error;

    ASSERT_EQ(r.value.scan().extensions.size(), 1u);
    EXPECT_EQ(r.value.scan().extensions[0], ".txt");
    EXPECT_EQ(r.value.scan().exclude.size(), 2u);
    EXPECT_FALSE(r.value.scan().title_from_heading);
}

TEST_F(ConfigTest, EmptyFileIsAccepted) {
    write_project("");

    auto r = Config::load(project_dir, global_path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.output(), "CLAUDE.md");
}

TEST_F(ConfigTest, MalformedYamlIsConfigurationError) {
    write_project("output: [unterminated\n");

    auto r = Config::load(project_dir, global_path);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Configuration);
    EXPECT_NE(r.error.find("prompt-merge.yaml"), std::string::npos);
}

TEST_F(ConfigTest, WrongTypeIsConfigurationError) {
    write_global("base_first: sometimes\n");

    auto r = Config::load(project_dir, global_path);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Configuration);
}

TEST_F(ConfigTest, NonMappingIsConfigurationError) {
    write_project("- just\n- a list\n");

    auto r = Config::load(project_dir, global_path);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Configuration);
}
