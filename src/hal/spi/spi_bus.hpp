#ifndef SPI_BUS_HPP
#define SPI_BUS_HPP

#include <cstdint>
#include <vector>

#include "spi_config.hpp"
#include "transfer_plan.hpp"

// An opened, exclusively owned SPI bus.
class SpiBus
{
public:
    virtual ~SpiBus() = default;

    // Applies every field of config. Throws ConfigurationError naming the
    // first setting the driver refused.
    virtual void configure(const SpiConfig& config) = 0;

    // Runs all segments of plan as one blocking message. rx must hold
    // plan.rx_length() bytes and is overwritten. Throws TransferError,
    // also when called before configure() succeeded.
    virtual void transfer(const TransferPlan& plan, std::vector<uint8_t>& rx) = 0;
};

#endif
