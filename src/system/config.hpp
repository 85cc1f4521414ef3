#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "spi_config.hpp"

// ============================================================
// Default values for the command line
// ============================================================

const std::string SPICAT_NAME    = "spicat";
const std::string SPICAT_VERSION = "1.0.0";

// "-" selects standard input / standard output
const std::string STREAM_SENTINEL = "-";

const uint32_t    DEFAULT_SPEED_HZ      = 1000000;
const std::size_t DEFAULT_REPEAT        = 1;
const SpiMode     DEFAULT_MODE          = SpiMode::Mode0;
const ChipSelect  DEFAULT_CHIP_SELECT   = ChipSelect::ActiveLow;
const uint8_t     DEFAULT_BITS_PER_WORD = 8;

// Files created by --out
const unsigned OUTPUT_FILE_MODE = 0644;

#endif
