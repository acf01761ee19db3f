/**
 * @file test_config.cpp
 * @brief Tests for the daemon Loader (argv classification, TYPE[:NAME], CSI_ENDPOINT) and signal mapping.
 */

#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "csimux/config/config_loader.hpp"
#include "csimux/config/constants.hpp"
#include "csimux/os/signals.hpp"
#include "support/harness.hpp"

#include <csignal>
#include <mutex>
#include <utility>
#include <signal.h>
#include <unistd.h>

using csimux::ErrorCode;
using csimux::config::Loader;
using csimux::config::ServiceDef;

static Loader::Env env_of(std::map<std::string, std::string> vars) {
  return [vars](const char* key) -> std::optional<std::string> {
    auto it = vars.find(key);
    if (it == vars.end()) return std::nullopt;
    return it->second;
  };
}

static Loader::FileProbe files(std::set<std::string> existing) {
  return [existing](const std::string& p) { return existing.count(p) != 0; };
}

// --------------------------- Service definitions ---------------------------

/**
 * @test ServiceDef_Parse
 * @brief TYPE alone and TYPE: both name the Service after the type.
 */
TEST(Loader, ServiceDef_Parse) {
  EXPECT_EQ(*Loader::parse_service_def("mock"), (ServiceDef{"mock", "mock"}));
  EXPECT_EQ(*Loader::parse_service_def("mock:fast"), (ServiceDef{"mock", "fast"}));
  EXPECT_EQ(*Loader::parse_service_def("mock:"), (ServiceDef{"mock", "mock"}));
  EXPECT_EQ(*Loader::parse_service_def("mock:a:b"), (ServiceDef{"mock", "a:b"}));

  auto bad = Loader::parse_service_def(":name");
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().code, ErrorCode::InvalidConfig);
}

// --------------------------- from_args -------------------------------------

/**
 * @test Loader_Splits_Modules_And_Services
 * @brief Existing files become modules in order; everything else is a service definition.
 */
TEST(Loader, Loader_Splits_Modules_And_Services) {
  const std::vector<std::string> args{"/lib/a.so", "mock:one", "/lib/b.so", "mock"};
  auto cfg = Loader::from_args(args, env_of({{"CSI_ENDPOINT", "unix:///run/csi.sock"}}),
                               files({"/lib/a.so", "/lib/b.so"}));
  ASSERT_TRUE(cfg) << cfg.error().describe();
  EXPECT_EQ(cfg->endpoint, "unix:///run/csi.sock");
  EXPECT_EQ(cfg->module_paths, (std::vector<std::string>{"/lib/a.so", "/lib/b.so"}));
  ASSERT_EQ(cfg->services.size(), 2u);
  EXPECT_EQ(cfg->services[0], (ServiceDef{"mock", "one"}));
  EXPECT_EQ(cfg->services[1], (ServiceDef{"mock", "mock"}));
}

/**
 * @test Loader_Requires_Endpoint
 * @brief Missing or empty CSI_ENDPOINT is InvalidConfig.
 */
TEST(Loader, Loader_Requires_Endpoint) {
  const std::vector<std::string> args{"mock"};
  for (auto env : {env_of({}), env_of({{"CSI_ENDPOINT", ""}})}) {
    auto cfg = Loader::from_args(args, env, files({}));
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidConfig);
    EXPECT_NE(cfg.error().message.find(csimux::config::constants::ENDPOINT_ENV), std::string::npos);
  }
}

/**
 * @test Loader_Requires_A_Service
 * @brief Only module paths (or nothing) is InvalidConfig.
 */
TEST(Loader, Loader_Requires_A_Service) {
  const std::vector<std::string> args{"/lib/a.so"};
  auto cfg = Loader::from_args(args, env_of({{"CSI_ENDPOINT", "tcp://:0"}}), files({"/lib/a.so"}));
  ASSERT_FALSE(cfg);
  EXPECT_EQ(cfg.error().code, ErrorCode::InvalidConfig);
}

/**
 * @test Loader_Default_Probe_Uses_Filesystem
 * @brief Without a probe, the real filesystem decides what is a module.
 */
TEST(Loader, Loader_Default_Probe_Uses_Filesystem) {
  const std::vector<std::string> args{CSIMUX_MOCK_MODULE_PATH, "mock"};
  auto cfg = Loader::from_args(args, env_of({{"CSI_ENDPOINT", "tcp://127.0.0.1:0"}}));
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->module_paths, (std::vector<std::string>{CSIMUX_MOCK_MODULE_PATH}));
  EXPECT_EQ(cfg->services.size(), 1u);
}

// --------------------------- Signals ---------------------------------------

/**
 * @test Signals_Classify
 * @brief First exit signal drains; another one while draining forces; others are ignored.
 */
TEST(Signals, Signals_Classify) {
  using csimux::os::ShutdownMode;
  using csimux::os::classify_signal;
  for (int s : {SIGTERM, SIGINT, SIGHUP, SIGQUIT}) {
    EXPECT_EQ(classify_signal(s, false), ShutdownMode::Graceful) << s;
    EXPECT_EQ(classify_signal(s, true), ShutdownMode::Forced) << s;
  }
  EXPECT_FALSE(classify_signal(SIGUSR1, false).has_value());
  EXPECT_STREQ(csimux::os::to_string(ShutdownMode::Forced), "forced");
}

/**
 * @test SignalTrap_Graceful_Then_Forced
 * @brief A process-directed TERM triggers the graceful handler; a second signal escalates.
 */
TEST(Signals, SignalTrap_Graceful_Then_Forced) {
  using csimux::os::ShutdownMode;
  std::mutex mu;
  std::vector<std::pair<ShutdownMode, int>> seen;
  {
    csimux::os::SignalTrap trap([&](ShutdownMode mode, int signo) {
      std::lock_guard<std::mutex> lk(mu);
      seen.emplace_back(mode, signo);
    });
    ASSERT_EQ(::kill(::getpid(), SIGTERM), 0);
    ASSERT_TRUE(csimux::test::eventually([&] { return trap.triggered(); }));
    ASSERT_EQ(::kill(::getpid(), SIGINT), 0);
    ASSERT_TRUE(csimux::test::eventually([&] {
      std::lock_guard<std::mutex> lk(mu);
      return seen.size() == 2;
    }));
  }
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], std::make_pair(ShutdownMode::Graceful, static_cast<int>(SIGTERM)));
  EXPECT_EQ(seen[1], std::make_pair(ShutdownMode::Forced, static_cast<int>(SIGINT)));
}
