/**
 * @file test_mock_provider.cpp
 * @brief Tests for the in-memory mock provider, directly and loaded as a module behind a Service.
 */

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <thread>

#include "csimux/config/constants.hpp"
#include "csimux/provider/provider_registry.hpp"
#include "csimux/providers/mock_provider.hpp"
#include "csimux/rpc/call_context.hpp"
#include "csimux/service/service.hpp"
#include "support/fake_provider.hpp"
#include "support/harness.hpp"

using csimux::providers::MockProvider;
using csimux::rpc::CallContext;
using csimux::test::RecordingObserver;
using csimux::test::ver;
namespace k = csimux::config::constants;

static csi::VolumeID vol_id(const std::string& id) {
  csi::VolumeID v;
  (*v.mutable_values())["id"] = id;
  return v;
}

static csi::NodeID node_id(const std::string& id) {
  csi::NodeID n;
  (*n.mutable_values())["id"] = id;
  return n;
}

class MockProviderTest : public ::testing::Test {
protected:
  RecordingObserver obs;
  MockProvider      mock{"mock", &obs};
  CallContext       ctx;

  std::string create(const std::string& name, std::uint64_t bytes = 0) {
    csi::CreateVolumeRequest req;
    req.set_name(name);
    if (bytes) req.mutable_capacity_range()->set_required_bytes(bytes);
    csi::CreateVolumeResponse resp;
    EXPECT_TRUE(mock.CreateVolume(ctx, req, &resp).ok());
    return resp.result().volume_info().id().values().at("id");
  }
};

/**
 * @test Mock_Seeded_Catalog
 * @brief Three default-sized volumes exist at construction.
 */
TEST_F(MockProviderTest, Mock_Seeded_Catalog) {
  EXPECT_EQ(mock.volume_count(), k::MOCK_SEED_VOLUMES);

  csi::ListVolumesResponse resp;
  ASSERT_TRUE(mock.ListVolumes(ctx, csi::ListVolumesRequest{}, &resp).ok());
  ASSERT_EQ(resp.result().entries_size(), 3);
  const auto& first = resp.result().entries(0).volume_info();
  EXPECT_EQ(first.id().values().at("id"), "1");
  EXPECT_EQ(first.id().values().at("name"), "Mock Volume 1");
  EXPECT_EQ(first.capacity_bytes(), k::MOCK_DEFAULT_VOLUME_BYTES);
  EXPECT_TRUE(resp.result().next_token().empty());
}

/**
 * @test Mock_Create_Idempotent_By_Name
 * @brief Re-creating a name (any case) returns the existing volume; capacity follows the request.
 */
TEST_F(MockProviderTest, Mock_Create_Idempotent_By_Name) {
  const auto id = create("data", 5 * k::GIB);
  EXPECT_EQ(id, "4");
  EXPECT_EQ(create("DATA"), id);
  EXPECT_EQ(mock.volume_count(), 4u);

  csi::CreateVolumeRequest unnamed;
  csi::CreateVolumeResponse resp;
  ASSERT_TRUE(mock.CreateVolume(ctx, unnamed, &resp).ok());
  EXPECT_EQ(resp.error().create_volume_error().error_code(), csi::Error::CreateVolumeError::INVALID_VOLUME_NAME);
}

/**
 * @test Mock_Delete
 * @brief Deleting removes the volume; deleting an unknown id still succeeds.
 */
TEST_F(MockProviderTest, Mock_Delete) {
  csi::DeleteVolumeRequest req;
  *req.mutable_volume_id() = vol_id("2");
  csi::DeleteVolumeResponse resp;
  ASSERT_TRUE(mock.DeleteVolume(ctx, req, &resp).ok());
  EXPECT_TRUE(resp.has_result());
  EXPECT_EQ(mock.volume_count(), 2u);

  csi::DeleteVolumeResponse again;
  ASSERT_TRUE(mock.DeleteVolume(ctx, req, &again).ok());
  EXPECT_TRUE(again.has_result());

  csi::DeleteVolumeResponse no_id;
  ASSERT_TRUE(mock.DeleteVolume(ctx, csi::DeleteVolumeRequest{}, &no_id).ok());
  EXPECT_EQ(no_id.error().delete_volume_error().error_code(), csi::Error::DeleteVolumeError::INVALID_VOLUME_ID);
}

/**
 * @test Mock_Publish_Unpublish
 * @brief Publish records a per-node device path; unpublish removes it; a second unpublish fails.
 */
TEST_F(MockProviderTest, Mock_Publish_Unpublish) {
  csi::ControllerPublishVolumeRequest pub;
  *pub.mutable_volume_id() = vol_id("1");
  *pub.mutable_node_id() = node_id("n1");
  csi::ControllerPublishVolumeResponse presp;
  ASSERT_TRUE(mock.ControllerPublishVolume(ctx, pub, &presp).ok());
  ASSERT_TRUE(presp.has_result());
  const auto devpath = presp.result().publish_volume_info().values().at("devpath");
  EXPECT_FALSE(devpath.empty());

  csi::ControllerPublishVolumeResponse again;
  ASSERT_TRUE(mock.ControllerPublishVolume(ctx, pub, &again).ok());
  EXPECT_EQ(again.result().publish_volume_info().values().at("devpath"), devpath);

  csi::ControllerUnpublishVolumeRequest unpub;
  *unpub.mutable_volume_id() = vol_id("1");
  *unpub.mutable_node_id() = node_id("n1");
  csi::ControllerUnpublishVolumeResponse uresp;
  ASSERT_TRUE(mock.ControllerUnpublishVolume(ctx, unpub, &uresp).ok());
  EXPECT_TRUE(uresp.has_result());

  csi::ControllerUnpublishVolumeResponse twice;
  ASSERT_TRUE(mock.ControllerUnpublishVolume(ctx, unpub, &twice).ok());
  EXPECT_EQ(twice.error().controller_unpublish_volume_error().error_code(),
            csi::Error::ControllerUnpublishVolumeError::VOLUME_NOT_ATTACHED_TO_SPECIFIED_NODE);

  *pub.mutable_volume_id() = vol_id("99");
  csi::ControllerPublishVolumeResponse missing;
  ASSERT_TRUE(mock.ControllerPublishVolume(ctx, pub, &missing).ok());
  EXPECT_EQ(missing.error().controller_publish_volume_error().error_code(),
            csi::Error::ControllerPublishVolumeError::VOLUME_DOES_NOT_EXIST);

  pub.clear_node_id();
  csi::ControllerPublishVolumeResponse no_node;
  ASSERT_TRUE(mock.ControllerPublishVolume(ctx, pub, &no_node).ok());
  EXPECT_EQ(no_node.error().controller_publish_volume_error().error_code(),
            csi::Error::ControllerPublishVolumeError::INVALID_NODE_ID);
}

/**
 * @test Mock_List_Pagination
 * @brief max_entries pages through the catalog via next_token; a bad token is an error payload.
 */
TEST_F(MockProviderTest, Mock_List_Pagination) {
  csi::ListVolumesRequest req;
  req.set_max_entries(2);
  csi::ListVolumesResponse page1;
  ASSERT_TRUE(mock.ListVolumes(ctx, req, &page1).ok());
  ASSERT_EQ(page1.result().entries_size(), 2);
  EXPECT_EQ(page1.result().next_token(), "2");

  req.set_starting_token(page1.result().next_token());
  csi::ListVolumesResponse page2;
  ASSERT_TRUE(mock.ListVolumes(ctx, req, &page2).ok());
  ASSERT_EQ(page2.result().entries_size(), 1);
  EXPECT_EQ(page2.result().entries(0).volume_info().id().values().at("id"), "3");
  EXPECT_TRUE(page2.result().next_token().empty());

  for (const char* tok : {"x", "7"}) {
    req.set_starting_token(tok);
    csi::ListVolumesResponse bad;
    ASSERT_TRUE(mock.ListVolumes(ctx, req, &bad).ok());
    EXPECT_TRUE(bad.error().has_general_error()) << tok;
  }
}

/**
 * @test Mock_Node_Publish
 * @brief Node publish requires an existing volume and a target path; unpublish clears it.
 */
TEST_F(MockProviderTest, Mock_Node_Publish) {
  csi::NodePublishVolumeRequest req;
  *req.mutable_volume_id() = vol_id("1");
  csi::NodePublishVolumeResponse no_path;
  ASSERT_TRUE(mock.NodePublishVolume(ctx, req, &no_path).ok());
  EXPECT_EQ(no_path.error().node_publish_volume_error().error_code(),
            csi::Error::NodePublishVolumeError::UNSUPPORTED_MOUNT_FLAGS);

  req.set_target_path("/mnt/one");
  csi::NodePublishVolumeResponse ok;
  ASSERT_TRUE(mock.NodePublishVolume(ctx, req, &ok).ok());
  EXPECT_TRUE(ok.has_result());

  csi::NodeUnpublishVolumeRequest un;
  *un.mutable_volume_id() = vol_id("1");
  un.set_target_path("/mnt/one");
  csi::NodeUnpublishVolumeResponse unresp;
  ASSERT_TRUE(mock.NodeUnpublishVolume(ctx, un, &unresp).ok());
  EXPECT_TRUE(unresp.has_result());

  *req.mutable_volume_id() = vol_id("42");
  csi::NodePublishVolumeResponse missing;
  ASSERT_TRUE(mock.NodePublishVolume(ctx, req, &missing).ok());
  EXPECT_EQ(missing.error().node_publish_volume_error().error_code(),
            csi::Error::NodePublishVolumeError::VOLUME_DOES_NOT_EXIST);
}

/**
 * @test Mock_Identity_And_Capabilities
 * @brief Fixed answers: version 0.1.0, plugin name, node id, capacity, capability lists.
 */
TEST_F(MockProviderTest, Mock_Identity_And_Capabilities) {
  csi::GetSupportedVersionsResponse versions;
  ASSERT_TRUE(mock.GetSupportedVersions(ctx, {}, &versions).ok());
  ASSERT_EQ(versions.result().supported_versions_size(), 1);
  EXPECT_EQ(versions.result().supported_versions(0).minor(), 1u);

  csi::GetPluginInfoResponse info;
  ASSERT_TRUE(mock.GetPluginInfo(ctx, {}, &info).ok());
  EXPECT_EQ(info.result().name(), "mock");
  EXPECT_EQ(info.result().vendor_version(), k::MOCK_VENDOR_VERSION);

  csi::GetNodeIDResponse node;
  ASSERT_TRUE(mock.GetNodeID(ctx, {}, &node).ok());
  EXPECT_EQ(node.result().node_id().values().at("id"), k::MOCK_NODE_ID);

  csi::GetCapacityResponse cap;
  ASSERT_TRUE(mock.GetCapacity(ctx, {}, &cap).ok());
  EXPECT_EQ(cap.result().total_capacity(), k::MOCK_TOTAL_CAPACITY_BYTES);

  csi::ControllerGetCapabilitiesResponse ccaps;
  ASSERT_TRUE(mock.ControllerGetCapabilities(ctx, {}, &ccaps).ok());
  EXPECT_EQ(ccaps.result().capabilities_size(), 4);

  csi::NodeGetCapabilitiesResponse ncaps;
  ASSERT_TRUE(mock.NodeGetCapabilities(ctx, {}, &ncaps).ok());
  ASSERT_EQ(ncaps.result().capabilities_size(), 1);
  EXPECT_EQ(ncaps.result().capabilities(0).volume_capability().mount().fs_type(), "ext4");

  csi::ProbeNodeResponse probe;
  ASSERT_TRUE(mock.ProbeNode(ctx, {}, &probe).ok());
  EXPECT_TRUE(probe.has_result());
}

/**
 * @test Mock_Module_Behind_Service
 * @brief The shipped module loads, and its provider serves version-checked calls through a Service.
 */
TEST(MockModule, Mock_Module_Behind_Service) {
  RecordingObserver obs;
  csimux::provider::ProviderRegistry reg(&obs);
  ASSERT_TRUE(reg.load(std::string(CSIMUX_MOCK_MODULE_PATH)));
  ASSERT_TRUE(reg.contains("MOCK"));

  auto svc = csimux::service::make_service(reg, "mock", "", &obs);
  ASSERT_TRUE(svc) << svc.error().describe();
  std::thread serving([&] { (void)(*svc)->serve(); });

  CallContext ctx;
  csi::ListVolumesRequest req;
  *req.mutable_version() = ver(0, 1, 0);
  csi::ListVolumesResponse resp;
  auto st = (*svc)->ListVolumes(ctx, req, &resp);
  EXPECT_TRUE(st.ok()) << st.error_message();
  EXPECT_EQ(resp.result().entries_size(), 3);

  *req.mutable_version() = ver(0, 2, 0);
  csi::ListVolumesResponse rejected;
  ASSERT_TRUE((*svc)->ListVolumes(ctx, req, &rejected).ok());
  EXPECT_EQ(rejected.error().general_error().error_code(),
            csi::Error::GeneralError::UNSUPPORTED_REQUEST_VERSION);

  (*svc)->graceful_stop();
  serving.join();
  svc->reset(); // provider from the module goes before the registry
}
