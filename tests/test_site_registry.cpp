#include <gtest/gtest.h>
#include "core/site_registry.hpp"

#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

class SiteRegistryTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        test_dir = (fs::temp_directory_path() / ("pisite-test-registry-" + std::to_string(::getpid()))).string();
        fs::create_directories(test_dir + "/site");
        setenv("PSM_CONFIG_DIR", (test_dir + "/cfg").c_str(), 1);
    }

    void TearDown() override {
        unsetenv("PSM_CONFIG_DIR");
        fs::remove_all(test_dir);
    }

    Site make_site(const std::string& name) {
        Site site;
        site.name = name;
        site.cwd = test_dir + "/site";
        site.cmd = "echo hi";
        return site;
    }
};

TEST_F(SiteRegistryTest, ValidNames) {
    EXPECT_TRUE(SiteRegistry::is_valid_name("demo"));
    EXPECT_TRUE(SiteRegistry::is_valid_name("my_site-2"));
    EXPECT_FALSE(SiteRegistry::is_valid_name(""));
    EXPECT_FALSE(SiteRegistry::is_valid_name("a/b"));
    EXPECT_FALSE(SiteRegistry::is_valid_name("../etc"));
    EXPECT_FALSE(SiteRegistry::is_valid_name("has space"));
    EXPECT_FALSE(SiteRegistry::is_valid_name("dot.name"));
}

TEST_F(SiteRegistryTest, AddGetAndPersist) {
    Config config;
    SiteRegistry registry(config);
    auto result = registry.add(make_site("demo"));
    ASSERT_TRUE(result.success) << result.error;

    auto site = registry.get("demo");
    ASSERT_TRUE(site.has_value());
    EXPECT_EQ(site->log, "activity.log");
    EXPECT_TRUE(registry.contains("demo"));
    EXPECT_FALSE(registry.get("other").has_value());

    // A fresh config sees the saved site
    Config config2;
    ASSERT_TRUE(config2.load());
    SiteRegistry registry2(config2);
    EXPECT_TRUE(registry2.contains("demo"));
}

TEST_F(SiteRegistryTest, RejectsInvalidSites) {
    Config config;
    SiteRegistry registry(config);

    auto bad_name = make_site("bad/name");
    EXPECT_FALSE(registry.add(bad_name).success);

    auto missing_cwd = make_site("nocwd");
    missing_cwd.cwd = test_dir + "/does-not-exist";
    auto r = registry.add(missing_cwd);
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("CWD"), std::string::npos);

    auto empty_cmd = make_site("nocmd");
    empty_cmd.cmd.clear();
    EXPECT_FALSE(registry.add(empty_cmd).success);

    EXPECT_TRUE(registry.list().empty());
}

TEST_F(SiteRegistryTest, RejectsDuplicate) {
    Config config;
    SiteRegistry registry(config);
    ASSERT_TRUE(registry.add(make_site("demo")).success);
    auto again = registry.add(make_site("demo"));
    EXPECT_FALSE(again.success);
    EXPECT_EQ(registry.list().size(), 1u);
}

TEST_F(SiteRegistryTest, RemoveAndReload) {
    Config config;
    SiteRegistry registry(config);
    ASSERT_TRUE(registry.add(make_site("a")).success);
    ASSERT_TRUE(registry.add(make_site("b")).success);

    EXPECT_TRUE(registry.remove("a"));
    EXPECT_FALSE(registry.remove("a"));
    EXPECT_FALSE(registry.contains("a"));

    // Another writer adds a site; reload picks it up
    Config other;
    other.load();
    SiteRegistry other_registry(other);
    ASSERT_TRUE(other_registry.add(make_site("c")).success);

    EXPECT_TRUE(registry.reload());
    EXPECT_TRUE(registry.contains("b"));
    EXPECT_TRUE(registry.contains("c"));
}

TEST_F(SiteRegistryTest, LogPath) {
    Site site = make_site("demo");
    EXPECT_EQ(site.log_path(), test_dir + "/site/activity.log");
    site.log = "logs/out.log";
    EXPECT_EQ(site.log_path(), test_dir + "/site/logs/out.log");
    site.log = "/var/log/demo.log";
    EXPECT_EQ(site.log_path(), "/var/log/demo.log");
}

TEST_F(SiteRegistryTest, FileEntriesWithBadOrRepeatedNamesAreSkipped) {
    fs::create_directories(test_dir + "/cfg");
    {
        std::ofstream out(test_dir + "/cfg/config.yaml");
        out << "sites:\n"
            << "  - name: ../escape\n    cwd: " << test_dir << "/site\n    cmd: echo x\n"
            << "  - name: demo\n    cwd: " << test_dir << "/site\n    cmd: echo first\n"
            << "  - name: demo\n    cwd: " << test_dir << "/site\n    cmd: echo second\n"
            << "  - name: other\n    cwd: " << test_dir << "/site\n    cmd: echo y\n";
    }

    Config config;
    ASSERT_TRUE(config.load());
    SiteRegistry registry(config);

    auto sites = registry.list();
    ASSERT_EQ(sites.size(), 2u);
    EXPECT_EQ(sites[0].name, "demo");
    EXPECT_EQ(sites[0].cmd, "echo first");
    EXPECT_EQ(sites[1].name, "other");
    EXPECT_FALSE(registry.contains("../escape"));
    EXPECT_EQ(config.data().sites.size(), 2u);

    // Same filtering on reload
    EXPECT_TRUE(registry.reload());
    EXPECT_EQ(registry.list().size(), 2u);
}

TEST_F(SiteRegistryTest, FailedSaveRollsBackAdd) {
    // The config dir sits under a regular file, so it cannot be created
    { std::ofstream blocker(test_dir + "/blocker"); blocker << "x"; }
    setenv("PSM_CONFIG_DIR", (test_dir + "/blocker/cfg").c_str(), 1);

    Config config;
    SiteRegistry registry(config);
    auto failed = registry.add(make_site("demo"));
    EXPECT_FALSE(failed.success);
    EXPECT_FALSE(registry.contains("demo"));
    EXPECT_TRUE(config.data().sites.empty());

    setenv("PSM_CONFIG_DIR", (test_dir + "/cfg").c_str(), 1);
    auto retried = registry.add(make_site("demo"));
    EXPECT_TRUE(retried.success) << retried.error;
    EXPECT_TRUE(registry.contains("demo"));
}

TEST_F(SiteRegistryTest, FailedSaveKeepsRemovedSite) {
    Config config;
    SiteRegistry registry(config);
    ASSERT_TRUE(registry.add(make_site("a")).success);
    ASSERT_TRUE(registry.add(make_site("b")).success);

    { std::ofstream blocker(test_dir + "/blocker"); blocker << "x"; }
    setenv("PSM_CONFIG_DIR", (test_dir + "/blocker/cfg").c_str(), 1);

    EXPECT_FALSE(registry.remove("a"));
    auto sites = registry.list();
    ASSERT_EQ(sites.size(), 2u);
    EXPECT_EQ(sites[0].name, "a");
    EXPECT_EQ(config.data().sites.size(), 2u);
}
