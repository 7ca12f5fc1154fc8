// Tests for discovery reconciliation and device enrichment.
#include "fake_device.h"
#include "fakes.h"
#include "heos/discovery.h"

#include <gtest/gtest.h>

#include <thread>

namespace {

using heos::fakes::BrowserScript;
using heos::fakes::MakeService;

heos::Config DiscoveryConfig() {
  heos::Config config;
  config.discovery_settle_delay = std::chrono::milliseconds(50);
  config.log_callback = [](heos::LogLevel, const std::string&) {};
  return config;
}

void Announce(BrowserScript* script, const heos::ResolvedService& service) {
  script->announcements.push_back({heos::kServiceType, service.instance});
  script->resolutions[service.instance] = service;
}

std::vector<std::string> Names(const std::vector<heos::DeviceDescriptor>& devices) {
  std::vector<std::string> names;
  for (const auto& device : devices) {
    names.push_back(device.name);
  }
  return names;
}

}  // namespace

TEST(DiscoveryHelpersTest, IsLinkLocal) {
  EXPECT_TRUE(heos::IsLinkLocal("169.254.1.5"));
  EXPECT_TRUE(heos::IsLinkLocal("169.254.255.255"));
  EXPECT_FALSE(heos::IsLinkLocal("169.253.1.5"));
  EXPECT_FALSE(heos::IsLinkLocal("192.168.1.20"));
  EXPECT_FALSE(heos::IsLinkLocal("garbage"));
}

TEST(DiscoveryHelpersTest, DescriptorFromServiceUsesTxtAndCliPort) {
  const auto service = MakeService("Kitchen", {"169.254.1.5", "192.168.1.20"});
  const auto descriptor = heos::DescriptorFromService(service, heos::kCliPort);
  ASSERT_TRUE(descriptor);
  EXPECT_EQ(descriptor->name, "Kitchen");
  EXPECT_EQ(descriptor->address, "192.168.1.20");
  EXPECT_EQ(descriptor->port, heos::kCliPort);
  EXPECT_EQ(descriptor->model, "HEOS 1");
  EXPECT_EQ(descriptor->firmware_version, "1.583.147");
  EXPECT_EQ(descriptor->network_id, "a1b2c3");
  EXPECT_EQ(descriptor->serial, "ADAG9170202780");
  EXPECT_TRUE(descriptor->id.empty());

  EXPECT_FALSE(heos::DescriptorFromService(MakeService("Den", {"169.254.1.5"}), heos::kCliPort));
  EXPECT_FALSE(heos::DescriptorFromService(MakeService("Den", {}), heos::kCliPort));
}

TEST(ReconcilerTest, EmptyNetworkSucceedsWithinTimeout) {
  auto script = std::make_shared<BrowserScript>();
  heos::Reconciler reconciler(DiscoveryConfig(), nullptr, heos::fakes::MakeBrowserFactory(script));

  std::vector<heos::DeviceDescriptor> devices = {heos::DeviceDescriptor()};
  heos::Error error;
  const auto started = std::chrono::steady_clock::now();
  ASSERT_TRUE(reconciler.Discover(std::chrono::milliseconds(200), &devices, &error));
  const auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_TRUE(devices.empty());
  EXPECT_TRUE(error.ok());
  EXPECT_GE(elapsed, std::chrono::milliseconds(200));
  EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
  EXPECT_EQ(script->started.load(), 1);
  EXPECT_EQ(script->stopped.load(), 1);
  EXPECT_EQ(reconciler.scans_completed(), 1u);
}

TEST(ReconcilerTest, SettleDelayEndsScanEarly) {
  auto script = std::make_shared<BrowserScript>();
  Announce(script.get(), MakeService("Kitchen", {"192.168.1.20"}));
  heos::Reconciler reconciler(DiscoveryConfig(), nullptr, heos::fakes::MakeBrowserFactory(script));

  std::vector<heos::DeviceDescriptor> devices;
  heos::Error error;
  const auto started = std::chrono::steady_clock::now();
  ASSERT_TRUE(reconciler.Discover(std::chrono::milliseconds(3000), &devices, &error));
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(1500));
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].address, "192.168.1.20");
}

TEST(ReconcilerTest, DuplicateAddressKeepsFirstInstanceByName) {
  auto script = std::make_shared<BrowserScript>();
  Announce(script.get(), MakeService("Kitchen (2)", {"192.168.1.20"}));
  Announce(script.get(), MakeService("Kitchen", {"192.168.1.20"}));
  heos::Reconciler reconciler(DiscoveryConfig(), nullptr, heos::fakes::MakeBrowserFactory(script));

  std::vector<heos::DeviceDescriptor> devices;
  heos::Error error;
  ASSERT_TRUE(reconciler.Discover(std::chrono::milliseconds(1000), &devices, &error));
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].name, "Kitchen");
}

TEST(ReconcilerTest, SkipsLinkLocalOnlyAndUnresolvedInstances) {
  auto script = std::make_shared<BrowserScript>();
  Announce(script.get(), MakeService("Attic", {"169.254.1.5"}));
  Announce(script.get(), MakeService("Den", {"169.254.1.6", "192.168.1.30"}));
  script->announcements.push_back({heos::kServiceType, "Ghost._heos-audio._tcp.local."});
  heos::Reconciler reconciler(DiscoveryConfig(), nullptr, heos::fakes::MakeBrowserFactory(script));

  std::vector<heos::DeviceDescriptor> devices;
  heos::Error error;
  ASSERT_TRUE(reconciler.Discover(std::chrono::milliseconds(1000), &devices, &error));
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].name, "Den");
  EXPECT_EQ(devices[0].address, "192.168.1.30");
  EXPECT_EQ(script->resolves.load(), 3);
}

TEST(ReconcilerTest, SortsByNameInByteOrder) {
  auto script = std::make_shared<BrowserScript>();
  Announce(script.get(), MakeService("alpha", {"192.168.1.21"}));
  Announce(script.get(), MakeService("Zeta", {"192.168.1.22"}));
  Announce(script.get(), MakeService("Beta", {"192.168.1.23"}));
  heos::Reconciler reconciler(DiscoveryConfig(), nullptr, heos::fakes::MakeBrowserFactory(script));

  std::vector<heos::DeviceDescriptor> devices;
  heos::Error error;
  ASSERT_TRUE(reconciler.Discover(std::chrono::milliseconds(1000), &devices, &error));
  EXPECT_EQ(Names(devices), (std::vector<std::string>{"Beta", "Zeta", "alpha"}));
}

TEST(ReconcilerTest, RepeatedAnnouncementsAreCountedOnce) {
  auto script = std::make_shared<BrowserScript>();
  const auto kitchen = MakeService("Kitchen", {"192.168.1.20"});
  Announce(script.get(), kitchen);
  Announce(script.get(), kitchen);
  heos::Reconciler reconciler(DiscoveryConfig(), nullptr, heos::fakes::MakeBrowserFactory(script));

  std::vector<heos::DeviceDescriptor> devices;
  heos::Error error;
  ASSERT_TRUE(reconciler.Discover(std::chrono::milliseconds(1000), &devices, &error));
  EXPECT_EQ(devices.size(), 1u);
  EXPECT_EQ(script->resolves.load(), 1);
}

TEST(ReconcilerTest, BrowserStartFailureIsDiscoveryFailed) {
  auto script = std::make_shared<BrowserScript>();
  script->fail_start = true;
  heos::Reconciler reconciler(DiscoveryConfig(), nullptr, heos::fakes::MakeBrowserFactory(script));

  heos::Error error;
  EXPECT_FALSE(reconciler.Discover(std::chrono::milliseconds(200), nullptr, &error));
  EXPECT_EQ(error.kind, heos::ErrorKind::kDiscoveryFailed);
  EXPECT_FALSE(reconciler.InProgress());
}

TEST(ReconcilerTest, RejectsNonPositiveTimeout) {
  auto script = std::make_shared<BrowserScript>();
  heos::Reconciler reconciler(DiscoveryConfig(), nullptr, heos::fakes::MakeBrowserFactory(script));
  heos::Error error;
  EXPECT_FALSE(reconciler.Discover(std::chrono::milliseconds(0), nullptr, &error));
  EXPECT_EQ(error.kind, heos::ErrorKind::kInvalidArgument);
  EXPECT_EQ(script->created.load(), 0);
}

TEST(ReconcilerTest, CancelStopsScanAndBrowser) {
  auto script = std::make_shared<BrowserScript>();
  heos::Reconciler reconciler(DiscoveryConfig(), nullptr, heos::fakes::MakeBrowserFactory(script));

  heos::Error error;
  bool result = true;
  std::thread scan([&]() {
    result = reconciler.Discover(std::chrono::milliseconds(5000), nullptr, &error);
  });
  while (!reconciler.InProgress() || script->started.load() == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  const auto started = std::chrono::steady_clock::now();
  reconciler.Cancel();
  scan.join();

  EXPECT_FALSE(result);
  EXPECT_EQ(error.kind, heos::ErrorKind::kCancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(1000));
  EXPECT_EQ(script->stopped.load(), 1);
  EXPECT_FALSE(reconciler.InProgress());
}

TEST(ReconcilerTest, CancelInterruptsPendingResolve) {
  auto script = std::make_shared<BrowserScript>();
  Announce(script.get(), MakeService("Kitchen", {"192.168.1.20"}));
  script->resolve_delay = std::chrono::milliseconds(10000);
  heos::Config config = DiscoveryConfig();
  config.resolve_timeout = std::chrono::milliseconds(10000);
  heos::Reconciler reconciler(config, nullptr, heos::fakes::MakeBrowserFactory(script));

  heos::Error error;
  bool result = true;
  std::thread scan([&]() {
    result = reconciler.Discover(std::chrono::milliseconds(5000), nullptr, &error);
  });
  while (script->resolves.load() == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  const auto started = std::chrono::steady_clock::now();
  reconciler.Cancel();
  scan.join();

  EXPECT_FALSE(result);
  EXPECT_EQ(error.kind, heos::ErrorKind::kCancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(1000));
  EXPECT_EQ(script->stopped.load(), 1);
}

TEST(ReconcilerTest, SlowResolutionIsBoundedByScanDeadline) {
  auto script = std::make_shared<BrowserScript>();
  Announce(script.get(), MakeService("Attic", {"192.168.1.21"}));
  Announce(script.get(), MakeService("Den", {"192.168.1.22"}));
  Announce(script.get(), MakeService("Hall", {"192.168.1.23"}));
  script->resolve_delay = std::chrono::milliseconds(10000);
  heos::Config config = DiscoveryConfig();
  config.resolve_timeout = std::chrono::milliseconds(300);
  heos::Reconciler reconciler(config, nullptr, heos::fakes::MakeBrowserFactory(script));

  std::vector<heos::DeviceDescriptor> devices;
  heos::Error error;
  const auto started = std::chrono::steady_clock::now();
  ASSERT_TRUE(reconciler.Discover(std::chrono::milliseconds(200), &devices, &error));
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(1200));
  EXPECT_TRUE(devices.empty());
  EXPECT_LT(script->resolves.load(), 3);
}

TEST(ReconcilerTest, NewScanCancelsScanInFlight) {
  auto script = std::make_shared<BrowserScript>();
  heos::Reconciler reconciler(DiscoveryConfig(), nullptr, heos::fakes::MakeBrowserFactory(script));

  heos::Error first_error;
  bool first_result = true;
  std::thread first([&]() {
    first_result = reconciler.Discover(std::chrono::milliseconds(5000), nullptr, &first_error);
  });
  while (script->started.load() == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  std::vector<heos::DeviceDescriptor> devices;
  heos::Error second_error;
  EXPECT_TRUE(reconciler.Discover(std::chrono::milliseconds(100), &devices, &second_error));
  first.join();

  EXPECT_FALSE(first_result);
  EXPECT_EQ(first_error.kind, heos::ErrorKind::kCancelled);
  EXPECT_EQ(script->started.load(), 2);
  EXPECT_EQ(script->stopped.load(), 2);
}

class EnrichmentTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(device_.Start());
    config_ = DiscoveryConfig();
    config_.command_retry_delay = std::chrono::milliseconds(1);
    pool_.reset(new heos::SessionPool(config_));
    dispatcher_.reset(new heos::Dispatcher(config_, pool_.get()));
    reconciler_.reset(new heos::Reconciler(config_, dispatcher_.get(),
                                           heos::fakes::MakeBrowserFactory(
                                               std::make_shared<BrowserScript>())));
    descriptor_.name = "kitchen-mdns";
    descriptor_.address = device_.address();
    descriptor_.port = device_.port();
  }

  heos::fakes::FakeDevice device_;
  heos::Config config_;
  std::unique_ptr<heos::SessionPool> pool_;
  std::unique_ptr<heos::Dispatcher> dispatcher_;
  std::unique_ptr<heos::Reconciler> reconciler_;
  heos::DeviceDescriptor descriptor_;
};

TEST_F(EnrichmentTest, CollectsPlayerQueueAndGroupState) {
  const heos::DiscoveryResult result = reconciler_->EnrichOne(descriptor_);
  ASSERT_TRUE(result.ok()) << result.error;
  const auto& snapshot = result.snapshot;
  EXPECT_EQ(snapshot.descriptor.id, "12345");
  EXPECT_EQ(snapshot.descriptor.name, "Kitchen");
  EXPECT_EQ(snapshot.descriptor.serial, "ADAG9170202780");
  EXPECT_EQ(snapshot.descriptor.firmware_version, "3.34.620");
  EXPECT_EQ(snapshot.play_state, "play");
  ASSERT_TRUE(snapshot.volume.has_value());
  EXPECT_EQ(*snapshot.volume, 25);
  ASSERT_TRUE(snapshot.muted.has_value());
  EXPECT_FALSE(*snapshot.muted);
  EXPECT_EQ(snapshot.now_playing.at("station").get<std::string>(), "Radio One");
  EXPECT_EQ(snapshot.queue_head.at("song").get<std::string>(), "Track One");
  EXPECT_EQ(snapshot.group.at("name").get<std::string>(), "Downstairs");

  const nlohmann::json json = result.ToJson();
  EXPECT_EQ(json.at("status").get<std::string>(), "connected");
  EXPECT_EQ(json.at("info").at("volume").get<int>(), 25);
  EXPECT_FALSE(json.at("info").at("mute").get<bool>());

  // One session carried every query.
  EXPECT_EQ(device_.accepted(), 1u);
  EXPECT_EQ(device_.CommandCount("player/get_queue"), 1u);
  EXPECT_EQ(device_.CommandCount("system/get_version"), 1u);
  const auto requests = device_.Requests();
  bool saw_range = false;
  for (const auto& request : requests) {
    if (request.command == "player/get_queue") {
      saw_range = heos::FindField(request.params, "range").value_or("") == "0,0";
    }
  }
  EXPECT_TRUE(saw_range);
}

TEST_F(EnrichmentTest, DeviceFailureKeepsBaseDescriptor) {
  device_.SetHandler("player/get_volume", [](const heos::CommandRequest& request) {
    return std::vector<std::string>{
        heos::fakes::ReplyLine(request.command, false, "eid=2&text=ID Not Valid")};
  });
  const heos::DiscoveryResult result = reconciler_->EnrichOne(descriptor_);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error_kind, heos::ErrorKind::kCommandFailed);
  EXPECT_NE(result.error.find("ID Not Valid"), std::string::npos);
  EXPECT_EQ(result.descriptor(), descriptor_);
}

TEST_F(EnrichmentTest, MissingVersionKeepsPlayerVersion) {
  device_.SetHandler("system/get_version", [](const heos::CommandRequest& request) {
    return std::vector<std::string>{
        heos::fakes::ReplyLine(request.command, false, "eid=1&text=Unrecognized Command")};
  });
  const heos::DiscoveryResult result = reconciler_->EnrichOne(descriptor_);
  ASSERT_TRUE(result.ok()) << result.error;
  EXPECT_EQ(result.descriptor().firmware_version, "1.583.147");
}

TEST_F(EnrichmentTest, EmptyPlayerListIsProtocolError) {
  device_.SetHandler("player/get_players", [](const heos::CommandRequest& request) {
    return std::vector<std::string>{
        heos::fakes::ReplyLine(request.command, true, "", nlohmann::json::array())};
  });
  const heos::DiscoveryResult result = reconciler_->EnrichOne(descriptor_);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error_kind, heos::ErrorKind::kProtocol);
}

TEST_F(EnrichmentTest, UnreachableDeviceIsReportedPerDevice) {
  // Same address as the live device, so the pooled session must not be reused.
  heos::DeviceDescriptor offline = descriptor_;
  offline.address = "127.0.0.1";
  offline.port = 1;
  const auto results = reconciler_->Enrich({descriptor_, offline});
  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].ok());
  EXPECT_FALSE(results[1].ok());
  EXPECT_TRUE(heos::IsRetryable(results[1].error_kind));
  EXPECT_EQ(results[1].ToJson().at("status").get<std::string>(), "error");
}
