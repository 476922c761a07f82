#include <gtest/gtest.h>
#include "config_store.h"
#include "fake_runner.h"

TEST(ConfigStore, MissingFileKeepsDefaults)
{
  TempDir dir;
  ConfigStore store(dir.file("config.json"));
  EXPECT_FALSE(store.load());
  const Config& cfg = store.data();
  EXPECT_EQ("", cfg.discovery_range);
  EXPECT_EQ(DEFAULT_MAX_TARGETS, cfg.limits.max_targets);
  EXPECT_EQ(250u, cfg.limits.probe_workers);
  EXPECT_EQ(20u, cfg.limits.classify_workers);
  EXPECT_EQ(10u, cfg.limits.post_workers);
  EXPECT_EQ("cumulus", cfg.ssh.user);
  EXPECT_TRUE(cfg.post_provision.base_config);
  EXPECT_DOUBLE_EQ(300, cfg.stale_after_s);
}

TEST(ConfigStore, LoadsValuesAndFillsGaps)
{
  TempDir dir;
  dir.write("config.json", R"({
    "discovery_range": " 10.9.0.10-10.9.0.20 ",
    "inventory_file": "/srv/inv.json",
    "ssh": {"user": "admin", "run_as": "www-data"},
    "post_provision": {"ztp_disable": false},
    "limits": {"max_targets": 64, "classify_workers": 0}
  })");
  ConfigStore store(dir.file("config.json"));
  ASSERT_TRUE(store.load());
  const Config& cfg = store.data();
  EXPECT_EQ("10.9.0.10-10.9.0.20", cfg.discovery_range);
  EXPECT_EQ("/srv/inv.json", cfg.inventory_file);
  EXPECT_EQ("admin", cfg.ssh.user);
  EXPECT_EQ("www-data", cfg.ssh.run_as);
  EXPECT_EQ(DEFAULT_MARKER_PATH, cfg.ssh.marker);
  EXPECT_FALSE(cfg.post_provision.ztp_disable);
  EXPECT_TRUE(cfg.post_provision.set_hostname);
  EXPECT_EQ(64u, cfg.limits.max_targets);
  EXPECT_EQ(1u, cfg.limits.classify_workers);
}

TEST(ConfigStore, BrokenFileKeepsDefaults)
{
  TempDir dir;
  dir.write("config.json", "{\"discovery_range\": ");
  ConfigStore store(dir.file("config.json"));
  EXPECT_FALSE(store.load());
  EXPECT_EQ("", store.data().discovery_range);
}

TEST(ConfigStore, SettingsArePersisted)
{
  TempDir dir;
  FakeRunner runner;
  FileStore files(runner, "");
  ConfigStore store(dir.file("config.json"));
  std::string error;

  EXPECT_FALSE(store.setDiscoveryRange("10.0.0.x", files, error));
  EXPECT_EQ("Invalid discovery range: 10.0.0.x", error);
  ASSERT_TRUE(store.setDiscoveryRange("10.0.0.1-10.0.0.9", files, error)) << error;

  PostProvisionToggles toggles;
  toggles.set_hostname = false;
  ASSERT_TRUE(store.setToggles(toggles, files, error)) << error;

  ConfigStore reloaded(dir.file("config.json"));
  ASSERT_TRUE(reloaded.load());
  EXPECT_EQ("10.0.0.1-10.0.0.9", reloaded.data().discovery_range);
  EXPECT_FALSE(reloaded.data().post_provision.set_hostname);
  EXPECT_TRUE(reloaded.data().post_provision.base_config);

  ASSERT_TRUE(reloaded.setDiscoveryRange("", files, error));
  EXPECT_EQ("", reloaded.data().discovery_range);
}

TEST(ConfigStore, TargetCapCannotBeRaised)
{
  TempDir dir;
  dir.write("config.json", R"({"limits": {"max_targets": 5000}})");
  ConfigStore store(dir.file("config.json"));
  ASSERT_TRUE(store.load());
  EXPECT_EQ(DEFAULT_MAX_TARGETS, store.data().limits.max_targets);
}
