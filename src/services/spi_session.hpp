#ifndef SPI_SESSION_HPP
#define SPI_SESSION_HPP

#include <cstddef>

#include "byte_stream.hpp"
#include "options.hpp"
#include "spi_bus.hpp"

// One invocation of spicat: configure the bus, then read the payload and
// run the requested transactions, streaming each capture to the sink.
class SpiSession
{
public:
    SpiSession(SpiBus& bus, const Options& options);

    // Applies the bus settings. Throws ConfigurationError.
    void configure();

    // Returns the number of completed transactions
    std::size_t run(ByteSource& source, ByteSink& sink);

private:
    SpiBus& _bus;
    const Options& _options;
};

#endif
