#include <gtest/gtest.h>
#include "fake_runner.h"
#include "state_reconciler.h"

namespace {
  const char* INVENTORY = R"({"bindings": [
    {"hostname": "leaf-01", "ip": "10.2.0.11", "mac": "aa:bb:cc:00:00:11", "role": "leaf", "serial": "INV-11"},
    {"hostname": "leaf-02", "ip": "10.2.0.12", "mac": "aa:bb:cc:00:00:12"},
    {"hostname": "spine-01", "ip": "10.2.0.21", "mac": "xx:xx:xx:xx:xx:xx"}
  ]})";

  const char* DEVICES = R"({"devices": {
    "10.2.0.12": "leaf-02 @leaf",
    "10.2.0.30": "oob-sw @mgmt"
  }})";

  class StateReconcilerTest : public ::testing::Test {
  protected:
    void SetUp() override
    {
      dir.write("inventory.json", INVENTORY);
      dir.write("devices.json", DEVICES);
      std::string error;
      ASSERT_TRUE(store.load(error)) << error;
    }

    TempDir dir;
    BindingStore store{dir.file("inventory.json"), dir.file("devices.json")};
  };

  Classification provisioned(const std::string& serial)
  {
    Classification c;
    c.type = DeviceType::Provisioned;
    c.serial = serial;
    return c;
  }
}

TEST(StateRules, DeviceType)
{
  Classification c = provisioned("");
  EXPECT_EQ(DeviceType::Unreachable, entryDeviceType(false, &c));
  EXPECT_EQ(DeviceType::Provisioned, entryDeviceType(true, &c));
  EXPECT_EQ(DeviceType::Other, entryDeviceType(true, nullptr));
}

TEST(StateRules, MacStatus)
{
  EXPECT_EQ(MacStatus::NoBinding, entryMacStatus(true, false, "", "aa:aa:aa:aa:aa:aa"));
  EXPECT_EQ(MacStatus::Unreachable, entryMacStatus(false, true, "aa:aa:aa:aa:aa:aa", ""));
  EXPECT_EQ(MacStatus::Match, entryMacStatus(true, true, "aa:aa:aa:aa:aa:aa", ""));
  EXPECT_EQ(MacStatus::Match, entryMacStatus(true, true, "AA:AA:AA:AA:AA:AA", "aa:aa:aa:aa:aa:aa"));
  EXPECT_EQ(MacStatus::Mismatch, entryMacStatus(true, true, "aa:aa:aa:aa:aa:aa", "aa:aa:aa:aa:aa:ab"));
  EXPECT_EQ(MacStatus::Mismatch, entryMacStatus(true, true, "xx:xx:xx:xx:xx:xx", "aa:aa:aa:aa:aa:ab"));
}

TEST_F(StateReconcilerTest, BoundReachableMatchingDevice)
{
  StageResults stages;
  stages.reachable["10.2.0.11"] = true;
  stages.neighbors["10.2.0.11"] = "aa:bb:cc:00:00:11";
  stages.classified["10.2.0.11"] = provisioned("SN-11");

  DiscoveryEntry e = StateReconciler(store, DiscoveryCache()).reconcileOne("10.2.0.11", stages);
  EXPECT_EQ("leaf-01", e.hostname);
  EXPECT_EQ("aa:bb:cc:00:00:11", e.binding_mac);
  EXPECT_EQ("aa:bb:cc:00:00:11", e.discovered_mac);
  EXPECT_EQ(DeviceType::Provisioned, e.device_type);
  EXPECT_EQ(MacStatus::Match, e.mac_status);
  EXPECT_EQ("SN-11", e.serial);
  EXPECT_EQ("leaf", e.role);
  EXPECT_EQ("Ping+ARP", e.source);
  EXPECT_TRUE(e.has_binding);
  EXPECT_EQ(PostProvision::None, e.post_provision);
}

TEST_F(StateReconcilerTest, ReplacedHardwareIsMismatch)
{
  StageResults stages;
  stages.reachable["10.2.0.12"] = true;
  stages.neighbors["10.2.0.12"] = "de:ad:be:ef:00:12";
  Classification fresh;
  fresh.type = DeviceType::NotProvisioned;
  stages.classified["10.2.0.12"] = fresh;

  DiscoveryEntry e = StateReconciler(store, DiscoveryCache()).reconcileOne("10.2.0.12", stages);
  EXPECT_EQ(MacStatus::Mismatch, e.mac_status);
  EXPECT_EQ(DeviceType::NotProvisioned, e.device_type);
  EXPECT_EQ("leaf", e.role);
}

TEST_F(StateReconcilerTest, UnreachableBoundDeviceKeepsKnownSerial)
{
  StageResults stages;
  stages.reachable["10.2.0.11"] = false;

  DiscoveryEntry e = StateReconciler(store, DiscoveryCache()).reconcileOne("10.2.0.11", stages);
  EXPECT_EQ(DeviceType::Unreachable, e.device_type);
  EXPECT_EQ(MacStatus::Unreachable, e.mac_status);
  EXPECT_EQ("INV-11", e.serial);
  EXPECT_EQ("", e.source);

  DiscoveryCache prior;
  DiscoveryEntry last;
  last.ip = "10.2.0.11";
  last.serial = "SN-PRIOR";
  prior.entries.push_back(last);
  EXPECT_EQ("SN-PRIOR", StateReconciler(store, prior).reconcileOne("10.2.0.11", stages).serial);
}

TEST_F(StateReconcilerTest, UnboundAddressUsesDeviceIdentity)
{
  StageResults stages;
  stages.reachable["10.2.0.30"] = true;
  stages.classified["10.2.0.30"] = provisioned("");

  DiscoveryEntry e = StateReconciler(store, DiscoveryCache()).reconcileOne("10.2.0.30", stages);
  EXPECT_FALSE(e.has_binding);
  EXPECT_EQ(MacStatus::NoBinding, e.mac_status);
  EXPECT_EQ("oob-sw", e.hostname);
  EXPECT_EQ("mgmt", e.role);
  EXPECT_EQ("", e.binding_mac);
  EXPECT_EQ("Ping", e.source);
}

TEST_F(StateReconcilerTest, ReconcileIsOrderedAndDeterministic)
{
  std::vector<std::string> targets = {"10.2.0.21", "10.2.0.11", "10.2.0.99"};
  StageResults stages;
  stages.reachable["10.2.0.21"] = true;
  stages.reachable["10.2.0.11"] = false;
  stages.reachable["10.2.0.99"] = false;
  stages.neighbors["10.2.0.21"] = "aa:bb:cc:00:00:21";

  StateReconciler reconciler(store, DiscoveryCache());
  auto first = reconciler.reconcile(targets, stages);
  auto second = reconciler.reconcile(targets, stages);
  ASSERT_EQ(3u, first.size());
  for (size_t i = 0; i < targets.size(); i++) {
    EXPECT_EQ(targets[i], first[i].ip);
    EXPECT_EQ(first[i].device_type, second[i].device_type);
    EXPECT_EQ(first[i].mac_status, second[i].mac_status);
  }
  EXPECT_EQ(DeviceType::Other, first[0].device_type);
  EXPECT_EQ(MacStatus::Mismatch, first[0].mac_status);
  EXPECT_EQ(MacStatus::NoBinding, first[2].mac_status);
}
