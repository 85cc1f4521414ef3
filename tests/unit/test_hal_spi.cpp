#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <linux/spi/spidev.h>

#include <optional>
#include <vector>

#include "errors.hpp"
#include "hal_spi.hpp"
#include "transfer_plan.hpp"
#include "temp_file.hpp"
#include "test_helpers.hpp"

using namespace spicat::testing;

// These run without SPI hardware: a regular file opens like a device node
// but refuses every spidev ioctl.

namespace {

SpiConfig DefaultConfig() {
  return SpiConfig{1000000, SpiMode::Mode0, ChipSelect::ActiveLow, 8};
}

}  // namespace

TEST(HalSpiTest, MissingDeviceIsNotFound) {
  try {
    HalSpi spi("/dev/spidev-does-not-exist.0");
    FAIL() << "Opening a missing device should throw";
  } catch (const OpenError& e) {
    EXPECT_EQ(e.path(), "/dev/spidev-does-not-exist.0");
    EXPECT_EQ(e.reason(), OpenError::Reason::NotFound);
    EXPECT_THAT(e.what(), ::testing::HasSubstr("Failed to open spidev"));
  }
}

TEST(HalSpiTest, SecondHandleOnSameDeviceIsBusy) {
  TempFile device;
  HalSpi first(device.path());

  try {
    HalSpi second(device.path());
    FAIL() << "The bus must be exclusively owned";
  } catch (const OpenError& e) {
    EXPECT_EQ(e.reason(), OpenError::Reason::Busy);
  }
}

TEST(HalSpiTest, DeviceIsReleasedOnDestruction) {
  TempFile device;
  { HalSpi first(device.path()); }
  EXPECT_NO_THROW(HalSpi again(device.path()));
}

TEST(HalSpiTest, RejectedSettingNamesFieldAndValue) {
  TempFile device;
  HalSpi spi(device.path());
  SpiConfig config = DefaultConfig();
  config.bits_per_word = 64;

  try {
    spi.configure(config);
    FAIL() << "A regular file cannot be configured";
  } catch (const ConfigurationError& e) {
    // bits per word is the first setting applied
    EXPECT_EQ(e.field(), "bits_per_word");
    EXPECT_EQ(e.value(), "64");
    EXPECT_TRUE(e.cause()) << "OS error is kept";
    EXPECT_THAT(e.what(), ::testing::HasSubstr("64 bits per word"));
  }
  EXPECT_FALSE(spi.is_configured());
}

TEST(HalSpiTest, TransferBeforeConfigureIsRejected) {
  TempFile device;
  HalSpi spi(device.path());
  TransferPlan plan = build_transfer_plan(Bytes("AB"), 1000000, std::nullopt);
  std::vector<uint8_t> rx(plan.rx_length());

  EXPECT_THROW(spi.transfer(plan, rx), TransferError);
}

TEST(HalSpiTest, TransferAfterFailedConfigureIsRejected) {
  TempFile device;
  HalSpi spi(device.path());
  EXPECT_THROW(spi.configure(DefaultConfig()), ConfigurationError);

  TransferPlan plan = build_transfer_plan({}, 1000000, uint16_t{5});
  std::vector<uint8_t> rx;
  EXPECT_THROW(spi.transfer(plan, rx), TransferError);
}

// ═══════════════════════════════════════════════════════════════════════════
// spidev transfer records
// ═══════════════════════════════════════════════════════════════════════════

TEST(IocTransferTest, SingleSegmentReleasesChipSelectAtTheEnd) {
  TransferPlan plan = build_transfer_plan(Bytes("AB"), 2000000, std::nullopt);
  std::vector<uint8_t> rx(plan.rx_length());
  spi_ioc_transfer tr[MAX_PLAN_SEGMENTS];

  build_ioc_transfers(plan, rx, 8, tr);

  EXPECT_EQ(tr[0].len, 2u);
  EXPECT_EQ(tr[0].tx_buf, reinterpret_cast<unsigned long>(plan.payload().data()));
  EXPECT_EQ(tr[0].rx_buf, reinterpret_cast<unsigned long>(rx.data()));
  EXPECT_EQ(tr[0].speed_hz, 2000000u);
  EXPECT_EQ(tr[0].delay_usecs, 0);
  EXPECT_EQ(tr[0].bits_per_word, 8);
  EXPECT_EQ(tr[0].cs_change, 0) << "Default: CS is released after the message";
}

TEST(IocTransferTest, PreDelayKeepsChipSelectAssertedIntoPayload) {
  TransferPlan plan = build_transfer_plan(Bytes("AB"), 500000, uint16_t{100});
  std::vector<uint8_t> rx(plan.rx_length());
  spi_ioc_transfer tr[MAX_PLAN_SEGMENTS];

  build_ioc_transfers(plan, rx, 16, tr);

  // Delay segment
  EXPECT_EQ(tr[0].len, 0u);
  EXPECT_EQ(tr[0].tx_buf, 0u);
  EXPECT_EQ(tr[0].rx_buf, 0u);
  EXPECT_EQ(tr[0].delay_usecs, 100);
  EXPECT_EQ(tr[0].speed_hz, 500000u);
  EXPECT_EQ(tr[0].cs_change, 0) << "CS must not toggle between the segments";

  // Payload segment
  EXPECT_EQ(tr[1].len, 2u);
  EXPECT_EQ(tr[1].tx_buf, reinterpret_cast<unsigned long>(plan.payload().data()));
  EXPECT_EQ(tr[1].rx_buf, reinterpret_cast<unsigned long>(rx.data()))
      << "The empty delay segment takes no room in rx";
  EXPECT_EQ(tr[1].delay_usecs, 0);
  EXPECT_EQ(tr[1].speed_hz, 500000u);
  EXPECT_EQ(tr[1].bits_per_word, 16);
  EXPECT_EQ(tr[1].cs_change, 0);
}

TEST(IocTransferTest, EmptyPayloadWithPreDelayOnlyPulsesChipSelect) {
  TransferPlan plan = build_transfer_plan({}, 1000000, uint16_t{7});
  std::vector<uint8_t> rx;
  spi_ioc_transfer tr[MAX_PLAN_SEGMENTS];

  build_ioc_transfers(plan, rx, 8, tr);

  EXPECT_EQ(tr[0].len, 0u);
  EXPECT_EQ(tr[0].delay_usecs, 7);
  EXPECT_EQ(tr[0].cs_change, 0);
  EXPECT_EQ(tr[1].len, 0u);
  EXPECT_EQ(tr[1].delay_usecs, 0);
  EXPECT_EQ(tr[1].cs_change, 0);
}

TEST(IocTransferTest, HeldChipSelectOnLastSegmentSetsKernelFlag) {
  TransferPlan plan = build_transfer_plan(Bytes("x"), 1000000, std::nullopt);
  plan.segments[0].cs_change = false;
  std::vector<uint8_t> rx(plan.rx_length());
  spi_ioc_transfer tr[MAX_PLAN_SEGMENTS];

  build_ioc_transfers(plan, rx, 8, tr);

  EXPECT_EQ(tr[0].cs_change, 1) << "spidev keeps CS asserted after the message";
}

TEST(IocTransferTest, ReleaseBetweenSegmentsSetsKernelFlag) {
  TransferPlan plan = build_transfer_plan(Bytes("xy"), 1000000, uint16_t{3});
  plan.segments[0].cs_change = true;
  std::vector<uint8_t> rx(plan.rx_length());
  spi_ioc_transfer tr[MAX_PLAN_SEGMENTS];

  build_ioc_transfers(plan, rx, 8, tr);

  EXPECT_EQ(tr[0].cs_change, 1) << "spidev deselects before the next segment";
  EXPECT_EQ(tr[1].cs_change, 0);
}
