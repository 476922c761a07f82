#include <gtest/gtest.h>
#include <algorithm>
#include "device_classifier.h"
#include "fake_runner.h"
#include "reachability_prober.h"

TEST(DeviceClassifier, SuccessfulProbeIsProvisionedWithSerial)
{
  Classification c = classifySshResult(FakeRunner::exited(0, "OK\nMT2101X12345\n"));
  EXPECT_EQ(DeviceType::Provisioned, c.type);
  EXPECT_EQ("MT2101X12345", c.serial);
}

TEST(DeviceClassifier, PlaceholderSerialsAreDropped)
{
  EXPECT_EQ("", normalizeSerial(" Not Specified "));
  EXPECT_EQ("", normalizeSerial("N/A"));
  EXPECT_EQ("", normalizeSerial("none"));
  EXPECT_EQ("ABC", normalizeSerial(" ABC\n"));
  EXPECT_EQ("", classifySshResult(FakeRunner::exited(0, "OK\n")).serial);
}

TEST(DeviceClassifier, PermissionDeniedIsNotProvisioned)
{
  Classification c = classifySshResult(FakeRunner::exited(255, "", "cumulus@10.0.0.1: Permission denied (publickey,password)."));
  EXPECT_EQ(DeviceType::NotProvisioned, c.type);
}

TEST(DeviceClassifier, OtherFailuresAreOther)
{
  EXPECT_EQ(DeviceType::Other, classifySshResult(FakeRunner::timedOut()).type);
  EXPECT_EQ(DeviceType::Other, classifySshResult(CommandResult()).type);
  EXPECT_EQ(DeviceType::Other,
            classifySshResult(FakeRunner::exited(255, "", "ssh: connect to host 10.0.0.1 port 22: Connection refused")).type);
}

TEST(DeviceClassifier, ProbeUsesBatchModeSsh)
{
  FakeRunner runner;
  SshSettings ssh;
  ssh.run_as = "ops";
  DeviceClassifier(runner, ssh).classify("10.0.0.9");
  auto call = runner.recorded().at(0);
  EXPECT_EQ("sudo", call[0]);
  EXPECT_EQ("ops", call[2]);
  EXPECT_EQ("ssh", FakeRunner::toolOf(call));
  EXPECT_NE(call.end(), std::find(call.begin(), call.end(), "BatchMode=yes"));
  EXPECT_NE(call.end(), std::find(call.begin(), call.end(), "ConnectTimeout=3"));
  EXPECT_EQ("cumulus@10.0.0.9", call[call.size() - 2]);
}

TEST(DeviceClassifier, ClassifyAllCoversEveryTarget)
{
  FakeRunner runner([](const std::vector<std::string>& argv, const std::string&) {
    const std::string& host = argv[argv.size() - 2];
    if (host == "cumulus@10.0.0.1") return FakeRunner::exited(0, "OK\nS1\n");
    if (host == "cumulus@10.0.0.2") return FakeRunner::exited(255, "", "Permission denied");
    return FakeRunner::timedOut();
  });
  auto results = DeviceClassifier(runner, SshSettings()).classifyAll({"10.0.0.1", "10.0.0.2", "10.0.0.3"}, 20);
  ASSERT_EQ(3u, results.size());
  EXPECT_EQ(DeviceType::Provisioned, results["10.0.0.1"].type);
  EXPECT_EQ("S1", results["10.0.0.1"].serial);
  EXPECT_EQ(DeviceType::NotProvisioned, results["10.0.0.2"].type);
  EXPECT_EQ(DeviceType::Other, results["10.0.0.3"].type);
}

TEST(ReachabilityProber, ProbeMapsEveryTarget)
{
  FakeRunner runner([](const std::vector<std::string>& argv, const std::string&) {
    return FakeRunner::exited(argv.back() == "10.0.0.2" ? 0 : 1);
  });
  ProbeOptions options;
  options.pacingMs = 0;
  auto alive = ReachabilityProber(runner).probe({"10.0.0.1", "10.0.0.2", "10.0.0.3"}, options);
  ASSERT_EQ(3u, alive.size());
  EXPECT_FALSE(alive["10.0.0.1"]);
  EXPECT_TRUE(alive["10.0.0.2"]);
  EXPECT_FALSE(alive["10.0.0.3"]);
  EXPECT_EQ(3u, runner.countTool("ping"));
}

TEST(ReachabilityProber, ShortWaitHalvesReplyTimeout)
{
  FakeRunner runner;
  ReachabilityProber prober(runner);
  prober.pingHost("10.0.0.1", false);
  prober.pingHost("10.0.0.1", true);
  auto calls = runner.recorded();
  std::vector<std::string> normal = {"ping", "-c", "1", "-W", "1", "-i", "0.2", "10.0.0.1"};
  std::vector<std::string> quick = {"ping", "-c", "1", "-W", "0.5", "-i", "0.2", "10.0.0.1"};
  EXPECT_EQ(normal, calls[0]);
  EXPECT_EQ(quick, calls[1]);
}
