#include <gtest/gtest.h>
#include "core/config.hpp"
#include "test_support.hpp"

#include <cstdlib>

class ConfigTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string original_home;
    bool had_home = false;

    void SetUp() override {
        test_dir = make_test_dir("config");

        // Save and clear LAUNCHPAD_HOME
        const char* home = std::getenv("LAUNCHPAD_HOME");
        if (home) {
            had_home = true;
            original_home = home;
        }
        unsetenv("LAUNCHPAD_HOME");
    }

    void TearDown() override {
        if (had_home) {
            setenv("LAUNCHPAD_HOME", original_home.c_str(), 1);
        } else {
            unsetenv("LAUNCHPAD_HOME");
        }
        fs::remove_all(test_dir);
    }
};

TEST_F(ConfigTest, DefaultValues) {
    Config cfg(test_dir);
    EXPECT_EQ(cfg.data().server_url, "http://127.0.0.1:8000");
    EXPECT_EQ(cfg.data().server_timeout_sec, 10);
    EXPECT_EQ(cfg.data().download_timeout_sec, 120);
    EXPECT_EQ(cfg.data().program_id, "app");
    EXPECT_EQ(cfg.data().executable, "app");
    EXPECT_EQ(cfg.data().update_policy, UpdatePolicy::Ask);
    EXPECT_EQ(cfg.data().retain_count, 2);
    EXPECT_TRUE(cfg.data().check_notices);
    EXPECT_EQ(cfg.data().log_level, "info");
    EXPECT_EQ(cfg.data().log_file, "launcher.log");
}

TEST_F(ConfigTest, Paths) {
    Config cfg(test_dir);
    EXPECT_EQ(cfg.base_dir(), test_dir);
    EXPECT_EQ(cfg.data_dir(), (fs::path(test_dir) / "data").string());
    EXPECT_EQ(cfg.versions_dir(), (fs::path(test_dir) / "versions").string());
    EXPECT_EQ(cfg.config_path(), (fs::path(test_dir) / "data" / "launcher.yaml").string());
    EXPECT_EQ(cfg.current_record_path(), (fs::path(test_dir) / "data" / "current.json").string());
}

TEST_F(ConfigTest, BaseDirFromEnvironment) {
    setenv("LAUNCHPAD_HOME", test_dir.c_str(), 1);
    Config cfg;
    EXPECT_EQ(cfg.base_dir(), test_dir);
}

TEST_F(ConfigTest, BaseDirDefaultsToBinaryDirectory) {
    Config cfg;
    EXPECT_FALSE(cfg.base_dir().empty());
    EXPECT_EQ(cfg.base_dir(), fs::canonical("/proc/self/exe").parent_path().string());
}

TEST_F(ConfigTest, LoadNonExistentReturnsFalse) {
    Config cfg(test_dir);
    EXPECT_FALSE(cfg.load());
}

TEST_F(ConfigTest, SaveAndLoad) {
    Config cfg1(test_dir);
    cfg1.data().server_url = "https://updates.example.com/base";
    cfg1.data().server_timeout_sec = 3;
    cfg1.data().program_id = "editor";
    cfg1.data().executable = "editor-bin";
    cfg1.data().update_policy = UpdatePolicy::Always;
    cfg1.data().retain_count = 4;
    cfg1.data().check_notices = false;
    cfg1.data().log_level = "debug";
    cfg1.data().log_file = "";

    ASSERT_TRUE(cfg1.save());
    EXPECT_TRUE(fs::exists(cfg1.config_path()));

    Config cfg2(test_dir);
    ASSERT_TRUE(cfg2.load());
    EXPECT_EQ(cfg2.data().server_url, "https://updates.example.com/base");
    EXPECT_EQ(cfg2.data().server_timeout_sec, 3);
    EXPECT_EQ(cfg2.data().program_id, "editor");
    EXPECT_EQ(cfg2.data().executable, "editor-bin");
    EXPECT_EQ(cfg2.data().update_policy, UpdatePolicy::Always);
    EXPECT_EQ(cfg2.data().retain_count, 4);
    EXPECT_FALSE(cfg2.data().check_notices);
    EXPECT_EQ(cfg2.data().log_level, "debug");
    EXPECT_EQ(cfg2.data().log_file, "");
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    write_file(test_dir + "/data/launcher.yaml",
               "program:\n"
               "  id: game\n"
               "update:\n"
               "  policy: never\n");

    Config cfg(test_dir);
    ASSERT_TRUE(cfg.load());
    EXPECT_EQ(cfg.data().program_id, "game");
    EXPECT_EQ(cfg.data().executable, "app");
    EXPECT_EQ(cfg.data().update_policy, UpdatePolicy::Never);
    EXPECT_EQ(cfg.data().server_url, "http://127.0.0.1:8000");
    EXPECT_EQ(cfg.data().retain_count, 2);
}

TEST_F(ConfigTest, RetainCountAtLeastOne) {
    write_file(test_dir + "/data/launcher.yaml", "update:\n  retain_count: 0\n");
    Config cfg(test_dir);
    ASSERT_TRUE(cfg.load());
    EXPECT_EQ(cfg.data().retain_count, 1);
}

TEST_F(ConfigTest, UnknownPolicyKeepsDefault) {
    write_file(test_dir + "/data/launcher.yaml", "update:\n  policy: sometimes\n");
    Config cfg(test_dir);
    ASSERT_TRUE(cfg.load());
    EXPECT_EQ(cfg.data().update_policy, UpdatePolicy::Ask);
}

TEST_F(ConfigTest, LoadMalformedYamlUsesDefaults) {
    write_file(test_dir + "/data/launcher.yaml", "{{{{invalid yaml!!!!");

    Config cfg(test_dir);
    EXPECT_FALSE(cfg.load());
    EXPECT_EQ(cfg.data().program_id, "app");
    EXPECT_EQ(cfg.data().update_policy, UpdatePolicy::Ask);
}

TEST_F(ConfigTest, PolicyStrings) {
    UpdatePolicy p = UpdatePolicy::Ask;
    EXPECT_TRUE(Config::policy_from_string("always", p));
    EXPECT_EQ(p, UpdatePolicy::Always);
    EXPECT_TRUE(Config::policy_from_string("never", p));
    EXPECT_EQ(p, UpdatePolicy::Never);
    EXPECT_FALSE(Config::policy_from_string("ALWAYS", p));
    EXPECT_EQ(p, UpdatePolicy::Never);
    EXPECT_EQ(Config::policy_to_string(UpdatePolicy::Ask), "ask");
}
