#ifndef HAL_SPI_HPP
#define HAL_SPI_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <linux/spi/spidev.h>

#include "spi_bus.hpp"

// spidev implementation of SpiBus. The device is opened and locked by the
// constructor and closed by the destructor.
class HalSpi : public SpiBus
{
public:
    explicit HalSpi(const std::string& device_path);
    ~HalSpi() override;

    HalSpi(const HalSpi&) = delete;
    HalSpi& operator=(const HalSpi&) = delete;

    void configure(const SpiConfig& config) override;
    void transfer(const TransferPlan& plan, std::vector<uint8_t>& rx) override;

    bool is_configured() const { return _configured; }

private:
    void close_device();

    int _fd{-1};
    std::string _stored_path;
    bool _configured{false};
    uint8_t _bits_per_word{0};
};

// Fills one spidev record per segment of plan into out (room for
// MAX_PLAN_SEGMENTS). Receive pointers are laid out back to back in rx.
void build_ioc_transfers(const TransferPlan& plan, std::vector<uint8_t>& rx, uint8_t bits_per_word,
                         struct spi_ioc_transfer* out);

#endif
