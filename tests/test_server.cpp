/**
 * @file test_server.cpp
 * @brief Tests for the routing Server: tag routing, lifecycle, results stream and listeners.
 *
 * Validates:
 *  - `csi.service` metadata selects a Service case-insensitively; otherwise the first one
 *  - Validation answers from the selected Service travel back through the server,
 *    and the provider behind it is never called
 *  - Unknown methods are UNIMPLEMENTED
 *  - serve() misuse (no services binds nothing, twice, after stop)
 *  - graceful_stop() waits for every Service to drain; stop() cancels in-flight calls
 *  - exit handlers run once, results closed
 *  - TCP port resolution and unix socket cleanup
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <grpcpp/create_channel.h>
#include <grpcpp/generic/generic_stub.h>
#include <grpcpp/security/credentials.h>

#include "csimux/config/constants.hpp"
#include "csimux/rpc/client.hpp"
#include "csimux/server/server.hpp"
#include "csimux/transport/pipe_listener.hpp"
#include "support/fake_provider.hpp"
#include "support/harness.hpp"

using namespace std::chrono_literals;
using csimux::ErrorCode;
using csimux::rpc::MethodTraits;
using csimux::rpc::ProtocolClient;
using csimux::server::Server;
using csimux::service::Service;
using csimux::test::FakeProvider;
using csimux::test::RecordingObserver;
using csimux::test::dial_pipe;
using csimux::test::eventually;
using csimux::test::ver;
using csimux::transport::PipeListener;

template <class Request>
static Request versioned() {
  Request r;
  *r.mutable_version() = ver(0, 1, 0);
  return r;
}

class ServerTest : public ::testing::Test {
protected:
  void make_services(const char* first = "alpha", const char* second = "beta") {
    auto a = std::make_unique<FakeProvider>("A");
    auto b = std::make_unique<FakeProvider>("B");
    fa = a.get();
    fb = b.get();
    services = {std::make_shared<Service>("fake", first, std::move(a), &obs),
                std::make_shared<Service>("fake", second, std::move(b), &obs)};
  }

  /// Serve on an in-process front channel and connect a client to it.
  void start(const char* first = "alpha", const char* second = "beta") {
    make_services(first, second);
    server = std::make_unique<Server>("tcp://unused:0", services, &obs);
    auto pipe = std::make_unique<PipeListener>("front");
    front = pipe.get();
    serving = std::thread([this, p = std::move(pipe)]() mutable { served = server->serve(std::move(p)); });
    client = std::make_unique<ProtocolClient>(dial_pipe(*front));
  }

  void serve_on(const std::string& address) {
    make_services();
    server = std::make_unique<Server>(address, services, &obs);
    serving = std::thread([this] { served = server->serve(); });
  }

  template <class Request>
  grpc::Status call(const Request& req, typename MethodTraits<Request>::Response* resp,
                    const char* tag = nullptr) {
    grpc::ClientContext cctx;
    if (tag) cctx.AddMetadata(csimux::config::constants::ROUTING_METADATA_KEY, tag);
    cctx.set_deadline(std::chrono::system_clock::now() + 10s);
    return client->call(cctx, req, resp);
  }

  std::string plugin_name(const char* tag) {
    csi::GetPluginInfoResponse resp;
    auto st = call(versioned<csi::GetPluginInfoRequest>(), &resp, tag);
    return st.ok() ? resp.result().name() : "status:" + std::to_string(st.error_code());
  }

  void TearDown() override {
    client.reset();
    if (server) server->stop();
    if (serving.joinable()) serving.join();
  }

  RecordingObserver                     obs;
  FakeProvider*                         fa = nullptr;
  FakeProvider*                         fb = nullptr;
  std::vector<std::shared_ptr<Service>> services;
  std::unique_ptr<Server>               server;
  PipeListener*                         front = nullptr;
  std::thread                           serving;
  csimux::Result<void>                  served;
  std::unique_ptr<ProtocolClient>       client;
};

// --------------------------- Routing ---------------------------------------

/**
 * @test Server_Routes_By_Tag
 * @brief Matching tags (any case) select their Service; absent/unknown tags use the first.
 */
TEST_F(ServerTest, Server_Routes_By_Tag) {
  start();
  EXPECT_EQ(plugin_name("BETA"), "B");
  EXPECT_EQ(plugin_name("alpha"), "A");
  EXPECT_EQ(plugin_name(nullptr), "A");
  EXPECT_EQ(plugin_name("gamma"), "A");

  auto routes = obs.route_events();
  ASSERT_EQ(routes.size(), 4u);
  EXPECT_EQ(routes[0].service_name, "beta");
  EXPECT_FALSE(routes[0].defaulted);
  EXPECT_EQ(routes[0].method, "/csi.Identity/GetPluginInfo");
  EXPECT_FALSE(routes[1].defaulted);
  EXPECT_TRUE(routes[2].defaulted);
  EXPECT_TRUE(routes[3].defaulted);
  EXPECT_EQ(obs.snapshot().routed_default, 2u);
}

/**
 * @test Server_Returns_Service_Validation
 * @brief Domain errors produced by the selected Service arrive intact at the client.
 */
TEST_F(ServerTest, Server_Returns_Service_Validation) {
  start();
  csi::ListVolumesResponse resp;
  auto st = call(csi::ListVolumesRequest{}, &resp, "beta");
  ASSERT_TRUE(st.ok()) << st.error_message();
  ASSERT_TRUE(resp.has_error());
  EXPECT_EQ(resp.error().general_error().error_code(),
            csi::Error::GeneralError::UNSUPPORTED_REQUEST_VERSION);
  EXPECT_EQ(fb->calls.load(), 0);

  csi::ListVolumesResponse ok;
  ASSERT_TRUE(call(versioned<csi::ListVolumesRequest>(), &ok, "beta").ok());
  ASSERT_EQ(ok.result().entries_size(), 1);
  EXPECT_EQ(ok.result().entries(0).volume_info().id().values().at("id"), "B");
}

/**
 * @test Server_Tagged_CreateVolume_Without_Name
 * @brief Services {A, B}; tag B; CreateVolume with no name → OK status carrying
 *        INVALID_VOLUME_NAME, and neither provider receives the call.
 */
TEST_F(ServerTest, Server_Tagged_CreateVolume_Without_Name) {
  start("A", "B");
  csi::CreateVolumeResponse resp;
  auto st = call(versioned<csi::CreateVolumeRequest>(), &resp, "B");

  ASSERT_TRUE(st.ok()) << st.error_message();
  ASSERT_TRUE(resp.has_error());
  ASSERT_TRUE(resp.error().has_create_volume_error());
  EXPECT_EQ(resp.error().create_volume_error().error_code(),
            csi::Error::CreateVolumeError::INVALID_VOLUME_NAME);
  EXPECT_EQ(resp.error().create_volume_error().error_description(), "missing name");
  EXPECT_EQ(fb->calls.load(), 0);
  EXPECT_EQ(fa->calls.load(), 0);
  EXPECT_EQ(fa->version_calls.load(), 0);

  auto routes = obs.route_events();
  ASSERT_EQ(routes.size(), 1u);
  EXPECT_EQ(routes[0].service_name, "B");
  EXPECT_FALSE(routes[0].defaulted);
  auto rejects = obs.reject_events();
  ASSERT_EQ(rejects.size(), 1u);
  EXPECT_EQ(rejects[0].service_name, "B");
  EXPECT_EQ(rejects[0].method, "CreateVolume");
}

/**
 * @test Server_Unknown_Method_Unimplemented
 * @brief Methods outside the protocol table fail with UNIMPLEMENTED.
 */
TEST_F(ServerTest, Server_Unknown_Method_Unimplemented) {
  start();
  grpc::GenericStub stub(client->channel());
  grpc::ClientContext cctx;
  cctx.set_deadline(std::chrono::system_clock::now() + 10s);
  grpc::ByteBuffer in, out;
  ASSERT_TRUE(csimux::rpc::encode(versioned<csi::ProbeNodeRequest>(), &in).ok());
  std::promise<grpc::Status> done;
  stub.UnaryCall(&cctx, "/csi.Controller/NoSuchMethod", grpc::StubOptions(), &in, &out,
                 [&](grpc::Status st) { done.set_value(st); });
  EXPECT_EQ(done.get_future().get().error_code(), grpc::StatusCode::UNIMPLEMENTED);
}

// --------------------------- serve() misuse --------------------------------

/**
 * @test Server_Empty_Services
 * @brief serve() with no Services fails before binding anything: no socket file appears.
 */
TEST(Server, Server_Empty_Services) {
  const auto path = std::filesystem::temp_directory_path() /
                    ("csimux_empty_" + std::to_string(::getpid()) + ".sock");
  std::filesystem::remove(path);
  const std::string address = "unix://" + path.string();

  RecordingObserver obs;
  Server server(address, {}, &obs);
  auto r = server.serve();
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::EmptyServices);
  EXPECT_EQ(server.address(), address);
  EXPECT_FALSE(std::filesystem::exists(path));
}

/**
 * @test Server_Serve_Twice_And_After_Stop
 * @brief A second serve() is ServerStarted; serve() on a stopped server is ServerStopped.
 */
TEST_F(ServerTest, Server_Serve_Twice_And_After_Stop) {
  start();
  ASSERT_EQ(plugin_name(nullptr), "A");

  auto again = server->serve(std::make_unique<PipeListener>("other"));
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error().code, ErrorCode::ServerStarted);

  RecordingObserver obs2;
  std::vector<std::shared_ptr<Service>> one{
      std::make_shared<Service>("fake", "solo", std::make_unique<FakeProvider>(), &obs2)};
  Server stopped("tcp://127.0.0.1:0", one, &obs2);
  stopped.stop();
  auto late = stopped.serve();
  ASSERT_FALSE(late);
  EXPECT_EQ(late.error().code, ErrorCode::ServerStopped);
}

/**
 * @test Server_Unsupported_Network
 * @brief Binding a datagram scheme fails with UnsupportedNetwork.
 */
TEST_F(ServerTest, Server_Unsupported_Network) {
  make_services();
  Server server("udp://127.0.0.1:0", services, &obs);
  auto r = server.serve();
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::UnsupportedNetwork);
}

// --------------------------- Lifecycle -------------------------------------

/**
 * @test Server_Stop_Closes_Results_And_Runs_Exit_Handlers_Once
 * @brief Every Service reports once; the stream closes; handlers run exactly once.
 */
TEST_F(ServerTest, Server_Stop_Closes_Results_And_Runs_Exit_Handlers_Once) {
  start();
  std::atomic<int> exits{0};
  server->add_exit_handler([&] { ++exits; });
  ASSERT_EQ(plugin_name("alpha"), "A");
  ASSERT_EQ(plugin_name("beta"), "B");

  server->graceful_stop();
  server->stop();
  serving.join();
  EXPECT_TRUE(served) << served.error().describe();
  EXPECT_EQ(exits.load(), 1);

  auto results = server->service_results();
  auto all = results->wait_all();
  EXPECT_TRUE(results->closed());
  ASSERT_EQ(all.size(), 2u);
  for (const auto& o : all) EXPECT_TRUE(o.result) << o.service;
  EXPECT_FALSE(results->next().has_value());

  server.reset();
  EXPECT_EQ(exits.load(), 1);
}

/**
 * @test Server_GracefulStop_Drains_InFlight
 * @brief With a call held on each Service, graceful_stop() returns only after both drained.
 */
TEST_F(ServerTest, Server_GracefulStop_Drains_InFlight) {
  start();
  fa->hold();
  fb->hold();

  grpc::Status st_a, st_b;
  std::atomic<bool> done_a{false};
  std::thread caller_a([&] {
    csi::ListVolumesResponse resp;
    st_a = call(versioned<csi::ListVolumesRequest>(), &resp, "alpha");
    done_a = true;
  });
  std::thread caller_b([&] {
    csi::ListVolumesResponse resp;
    st_b = call(versioned<csi::ListVolumesRequest>(), &resp, "beta");
  });
  ASSERT_TRUE(eventually([&] { return fa->parked.load() == 1 && fb->parked.load() == 1; }));

  std::atomic<bool> drained{false};
  std::thread stopper([&] { server->shutdown(csimux::os::ShutdownMode::Graceful); drained = true; });
  std::this_thread::sleep_for(100ms);
  EXPECT_FALSE(drained.load());

  fa->release();
  ASSERT_TRUE(eventually([&] { return done_a.load(); }));
  std::this_thread::sleep_for(100ms);
  EXPECT_FALSE(drained.load());

  fb->release();
  caller_a.join();
  caller_b.join();
  stopper.join();
  serving.join();
  EXPECT_TRUE(drained.load());
  EXPECT_TRUE(st_a.ok()) << st_a.error_message();
  EXPECT_TRUE(st_b.ok()) << st_b.error_message();
  EXPECT_TRUE(served);
}

/**
 * @test Server_Stop_Cancels_InFlight
 * @brief stop() ends a held call promptly and the provider sees the cancellation.
 */
TEST_F(ServerTest, Server_Stop_Cancels_InFlight) {
  start();
  fb->hold();

  grpc::Status st;
  std::thread caller([&] {
    csi::ListVolumesResponse resp;
    st = call(versioned<csi::ListVolumesRequest>(), &resp, "beta");
  });
  ASSERT_TRUE(eventually([&] { return fb->parked.load() == 1; }));

  const auto t0 = std::chrono::steady_clock::now();
  server->shutdown(csimux::os::ShutdownMode::Forced);
  caller.join();
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 3s);
  EXPECT_FALSE(st.ok());
  EXPECT_TRUE(eventually([&] { return fb->cancelled_calls.load() == 1; }));
}

// --------------------------- Socket listeners ------------------------------

/**
 * @test Server_Tcp_Resolves_Address
 * @brief After binding port 0, address() reports the real port and clients can reach it.
 */
TEST_F(ServerTest, Server_Tcp_Resolves_Address) {
  serve_on("tcp://127.0.0.1:0");
  ASSERT_TRUE(eventually([&] { return server->address() != "tcp://127.0.0.1:0"; }));

  const std::string addr = server->address();
  ASSERT_EQ(addr.rfind("tcp://127.0.0.1:", 0), 0u) << addr;
  auto channel = grpc::CreateChannel(addr.substr(6), grpc::InsecureChannelCredentials());
  ASSERT_TRUE(channel->WaitForConnected(std::chrono::system_clock::now() + 5s));
  client = std::make_unique<ProtocolClient>(channel);

  EXPECT_EQ(plugin_name("beta"), "B");
}

/**
 * @test Server_Unix_Removes_Socket_On_Stop
 * @brief The unix socket file exists while serving and is removed by the exit handler.
 */
TEST_F(ServerTest, Server_Unix_Removes_Socket_On_Stop) {
  const auto path = std::filesystem::temp_directory_path() /
                    ("csimux-server-" + std::to_string(::getpid()) + ".sock");
  std::filesystem::remove(path);

  serve_on("unix://" + path.string());
  ASSERT_TRUE(eventually([&] { return std::filesystem::exists(path); }));
  EXPECT_EQ(server->address(), "unix://" + path.string());

  auto channel = grpc::CreateChannel("unix:" + path.string(), grpc::InsecureChannelCredentials());
  ASSERT_TRUE(channel->WaitForConnected(std::chrono::system_clock::now() + 5s));
  client = std::make_unique<ProtocolClient>(channel);
  EXPECT_EQ(plugin_name(nullptr), "A");
  client.reset();

  server->stop();
  serving.join();
  EXPECT_TRUE(served);
  EXPECT_FALSE(std::filesystem::exists(path));
}
