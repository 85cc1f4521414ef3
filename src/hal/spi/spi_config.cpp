#include "spi_config.hpp"

#include <istream>
#include <ostream>
#include <linux/spi/spidev.h>

uint8_t spi_mode_flags(SpiMode mode)
{
    switch(mode)
    {
    case SpiMode::Mode0:
        return SPI_MODE_0;
    case SpiMode::Mode1:
        return SPI_MODE_1;
    case SpiMode::Mode2:
        return SPI_MODE_2;
    case SpiMode::Mode3:
        return SPI_MODE_3;
    }
    return SPI_MODE_0;
}

uint8_t chip_select_flags(ChipSelect chip_select)
{
    switch(chip_select)
    {
    case ChipSelect::ActiveLow:
        return 0;
    case ChipSelect::ActiveHigh:
        return SPI_CS_HIGH;
    case ChipSelect::Disabled:
        return SPI_NO_CS;
    }
    return 0;
}

std::string to_string(SpiMode mode)
{
    return std::to_string(static_cast<unsigned>(mode));
}

std::string to_string(ChipSelect chip_select)
{
    switch(chip_select)
    {
    case ChipSelect::ActiveLow:
        return "active-low";
    case ChipSelect::ActiveHigh:
        return "active-high";
    case ChipSelect::Disabled:
        return "disabled";
    }
    return "unknown";
}

std::istream& operator>>(std::istream& in, SpiMode& mode)
{
    std::string token;
    in >> token;

    if(token == "0")
        mode = SpiMode::Mode0;
    else if(token == "1")
        mode = SpiMode::Mode1;
    else if(token == "2")
        mode = SpiMode::Mode2;
    else if(token == "3")
        mode = SpiMode::Mode3;
    else
        in.setstate(std::ios_base::failbit);

    return in;
}

std::istream& operator>>(std::istream& in, ChipSelect& chip_select)
{
    std::string token;
    in >> token;

    if(token == "active-low")
        chip_select = ChipSelect::ActiveLow;
    else if(token == "active-high")
        chip_select = ChipSelect::ActiveHigh;
    else if(token == "disabled")
        chip_select = ChipSelect::Disabled;
    else
        in.setstate(std::ios_base::failbit);

    return in;
}

std::ostream& operator<<(std::ostream& out, SpiMode mode)
{
    return out << to_string(mode);
}

std::ostream& operator<<(std::ostream& out, ChipSelect chip_select)
{
    return out << to_string(chip_select);
}
