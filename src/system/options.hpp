#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

#include "config.hpp"
#include "output_formatter.hpp"
#include "spi_config.hpp"

// Everything the command line controls
struct Options
{
    std::string spidev;
    std::string input{STREAM_SENTINEL};
    std::string output{STREAM_SENTINEL};

    uint32_t speed_hz{DEFAULT_SPEED_HZ};
    std::size_t repeat{DEFAULT_REPEAT};

    // Empty: decided by whether the output is a terminal
    std::optional<OutputFormat> format;

    SpiMode mode{DEFAULT_MODE};
    ChipSelect chip_select{DEFAULT_CHIP_SELECT};
    uint8_t bits_per_word{DEFAULT_BITS_PER_WORD};
    std::optional<uint16_t> pre_delay_us;

    bool verbose{false};

    SpiConfig spi_config() const;
};

// Parses argv. Help and version text go to out, and then no Options are
// returned. Throws UsageError for anything invalid.
std::optional<Options> parse_options(int argc, const char* const argv[], std::ostream& out);

#endif
