/**
 * @file diag_client_test.cpp
 * @brief DiagClient convenience layer over a scripted gateway
 */

#include <gtest/gtest.h>
#include "client.hpp"
#include "test_doubles.hpp"

using namespace udsonip;
using udsonip::test::FakeLink;
using std::chrono::milliseconds;

class DiagClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto link = std::make_unique<FakeLink>();
    link_ = link.get();
    BridgeConfig cfg;
    cfg.initial_target = 0x00E0;
    auto bridge = std::make_unique<ConnectionBridge>(std::move(link), std::make_unique<uds::UdsCodec>(), cfg);
    ASSERT_TRUE(bridge->open().ok);
    client_ = std::make_unique<DiagClient>(std::move(bridge));
  }

  std::vector<uint8_t> last_payload() const { return link_->sent().back().payload; }

  FakeLink* link_{nullptr};
  std::unique_ptr<DiagClient> client_;
};

TEST_F(DiagClientTest, TargetsInitialAddress) {
  EXPECT_EQ(client_->target_address(), std::optional<LogicalAddress>(0x00E0));
  ASSERT_TRUE(client_->tester_present().ok);
  EXPECT_EQ(link_->sent().back().target, 0x00E0);
}

TEST_F(DiagClientTest, SwitchTargetOnSameConnection) {
  ASSERT_TRUE(client_->set_target_address(0x00E1).ok);
  ASSERT_TRUE(client_->read_data_by_identifier(0xF190).ok);
  EXPECT_EQ(link_->sent().back().target, 0x00E1);
  EXPECT_EQ(last_payload(), (std::vector<uint8_t>{0x22, 0xF1, 0x90}));
  EXPECT_EQ(link_->open_calls(), 1);

  EXPECT_EQ(client_->set_target_address(0x0000).error.code, Errc::AddressRejected);
  EXPECT_EQ(client_->target_address(), std::optional<LogicalAddress>(0x00E1));
}

TEST_F(DiagClientTest, ServiceEncodings) {
  client_->write_data_by_identifier(0xF199, {0x20, 0x26});
  EXPECT_EQ(last_payload(), (std::vector<uint8_t>{0x2E, 0xF1, 0x99, 0x20, 0x26}));

  client_->read_dtc_information();
  EXPECT_EQ(last_payload(), (std::vector<uint8_t>{0x19, 0x02, 0xFF}));

  client_->clear_dtc();
  EXPECT_EQ(last_payload(), (std::vector<uint8_t>{0x14, 0xFF, 0xFF, 0xFF}));

  client_->ecu_reset();
  EXPECT_EQ(last_payload(), (std::vector<uint8_t>{0x11, 0x01}));

  client_->routine_control(0x0203);
  EXPECT_EQ(last_payload(), (std::vector<uint8_t>{0x31, 0x01, 0x02, 0x03}));
}

TEST_F(DiagClientTest, SecurityAccessSeedThenKey) {
  client_->security_access(1);
  EXPECT_EQ(last_payload(), (std::vector<uint8_t>{0x27, 0x01}));
  client_->security_access(1, std::vector<uint8_t>{0xCA, 0xFE});
  EXPECT_EQ(last_payload(), (std::vector<uint8_t>{0x27, 0x02, 0xCA, 0xFE}));
}

TEST_F(DiagClientTest, SessionChangeRaisesBridgeTimings) {
  link_->set_responder([](LogicalAddress target, const std::vector<uint8_t>&) {
    Frame f;
    f.source = target;
    f.payload = {0x50, 0x03, 0x07, 0xD0, 0x03, 0xE8};
    return std::vector<Frame>{f};
  });
  ASSERT_TRUE(client_->change_session(uds::Session::ExtendedSession).ok);
  EXPECT_EQ(client_->bridge().config().timings.p2.count(), 2000);
  EXPECT_EQ(client_->bridge().config().timings.p2_star.count(), 10000);
}

TEST_F(DiagClientTest, NegativeResponseIsReturned) {
  link_->set_responder([](LogicalAddress target, const std::vector<uint8_t>& p) {
    Frame f;
    f.source = target;
    f.payload = {0x7F, p[0], 0x22};
    return std::vector<Frame>{f};
  });
  auto r = client_->ecu_reset(uds::EcuResetType::SoftReset);
  ASSERT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, Errc::NegativeResponse);
  EXPECT_EQ(r.error.nrc, 0x22);
}

TEST_F(DiagClientTest, CloseDisconnects) {
  client_->close();
  EXPECT_EQ(client_->bridge().state(), ConnectionState::Disconnected);
  EXPECT_EQ(client_->tester_present().error.code, Errc::NotConnected);
  client_->close();
}

TEST(DiagClientConnectTest, RejectsInvalidEcuAddress) {
  LinkConfig link;
  link.host = "127.0.0.1";
  auto r = DiagClient::connect(link, 0x0000);
  EXPECT_EQ(r.error.code, Errc::AddressRejected);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
