#ifndef SPI_CONFIG_HPP
#define SPI_CONFIG_HPP

#include <cstdint>
#include <iosfwd>
#include <string>

// Clock polarity / phase pairing
enum class SpiMode : uint8_t
{
    Mode0 = 0,
    Mode1 = 1,
    Mode2 = 2,
    Mode3 = 3,
};

enum class ChipSelect : uint8_t
{
    ActiveLow,
    ActiveHigh,
    Disabled,
};

struct SpiConfig
{
    uint32_t speed_hz;
    SpiMode mode;
    ChipSelect chip_select;
    uint8_t bits_per_word;
};

// Bits of the spidev mode byte
uint8_t spi_mode_flags(SpiMode mode);
uint8_t chip_select_flags(ChipSelect chip_select);

std::string to_string(SpiMode mode);
std::string to_string(ChipSelect chip_select);

// Text forms accepted on the command line: "0".."3" and
// "active-low" / "active-high" / "disabled".
std::istream& operator>>(std::istream& in, SpiMode& mode);
std::istream& operator>>(std::istream& in, ChipSelect& chip_select);
std::ostream& operator<<(std::ostream& out, SpiMode mode);
std::ostream& operator<<(std::ostream& out, ChipSelect chip_select);

#endif
