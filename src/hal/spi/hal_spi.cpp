#include "hal_spi.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include <sys/ioctl.h>
#include <linux/spi/spidev.h>
#include <cerrno>
#include <cstring>

static boost::system::error_code last_error()
{
    return boost::system::error_code(errno, boost::system::system_category());
}

HalSpi::HalSpi(const std::string& device_path) : _stored_path(device_path)
{
    _fd = ::open(_stored_path.c_str(), O_RDWR | O_CLOEXEC);

    if(_fd < 0)
        throw OpenError("spidev", _stored_path, last_error());

    // No other spicat may drive the same bus at the same time
    if(::flock(_fd, LOCK_EX | LOCK_NB) < 0)
    {
        boost::system::error_code ec = last_error();
        close_device();
        throw OpenError("spidev", _stored_path, ec);
    }

    if(g_verbose)
        std::cerr << "[SPI] Device opened: " << _stored_path << std::endl;
}

HalSpi::~HalSpi()
{
    close_device();
}

void HalSpi::close_device()
{
    if(_fd >= 0)
    {
        ::close(_fd);
        _fd = -1;
        if(g_verbose)
            std::cerr << "[SPI] Device closed: " << _stored_path << std::endl;
    }
}

void HalSpi::configure(const SpiConfig& config)
{
    _configured = false;

    // Each setting is a separate ioctl. A failure leaves the earlier ones applied.
    uint8_t bits = config.bits_per_word;
    if(ioctl(_fd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0)
    {
        boost::system::error_code ec = last_error();
        throw ConfigurationError("bits_per_word", std::to_string(bits),
                                 "Failed to set " + std::to_string(bits) + " bits per word", ec);
    }

    uint32_t speed = config.speed_hz;
    if(ioctl(_fd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0)
    {
        boost::system::error_code ec = last_error();
        throw ConfigurationError("speed_hz", std::to_string(speed),
                                 "Failed to set max speed to " + std::to_string(speed) + " Hz", ec);
    }

    uint8_t mode = spi_mode_flags(config.mode);
    if(ioctl(_fd, SPI_IOC_WR_MODE, &mode) < 0)
    {
        boost::system::error_code ec = last_error();
        throw ConfigurationError("mode", to_string(config.mode),
                                 "Failed to set SPI mode to " + to_string(config.mode), ec);
    }

    // Chip select shares the mode byte; keep the clock mode bits
    mode |= chip_select_flags(config.chip_select);
    if(ioctl(_fd, SPI_IOC_WR_MODE, &mode) < 0)
    {
        boost::system::error_code ec = last_error();
        throw ConfigurationError("chip_select", to_string(config.chip_select),
                                 "Failed to set chip select mode to " + to_string(config.chip_select),
                                 ec);
    }

    _bits_per_word = config.bits_per_word;
    _configured = true;

    if(g_verbose)
        std::cerr << "[SPI] Configured: " << config.speed_hz << " Hz, mode " << config.mode << ", chip select "
                  << config.chip_select << ", " << unsigned(config.bits_per_word) << " bits per word" << std::endl;
}

void build_ioc_transfers(const TransferPlan& plan, std::vector<uint8_t>& rx, uint8_t bits_per_word,
                         struct spi_ioc_transfer* out)
{
    const std::size_t count = plan.segments.size();
    std::memset(out, 0, count * sizeof(struct spi_ioc_transfer));

    std::size_t offset = 0;
    for(std::size_t i = 0; i < count; i++)
    {
        const SpiSegment& segment = plan.segments[i];
        const bool last = (i + 1 == count);

        if(!segment.tx.empty())
        {
            out[i].tx_buf = (unsigned long) segment.tx.data();
            out[i].rx_buf = (unsigned long) (rx.data() + offset);
        }
        out[i].len = (uint32_t) segment.tx.size();
        out[i].speed_hz = segment.speed_hz;
        out[i].delay_usecs = segment.delay_usecs;
        out[i].bits_per_word = bits_per_word;

        // spidev cs_change: between segments it releases CS, on the last
        // segment it keeps CS asserted after the message.
        out[i].cs_change = last ? !segment.cs_change : segment.cs_change;

        offset += segment.tx.size();
    }
}

void HalSpi::transfer(const TransferPlan& plan, std::vector<uint8_t>& rx)
{
    if(!_configured)
        throw TransferError("SPI transaction rejected: " + _stored_path + " is not configured");

    const std::size_t count = plan.segments.size();
    if(count == 0 || count > MAX_PLAN_SEGMENTS)
        throw TransferError("SPI transaction rejected: plan has " + std::to_string(count) + " segments");

    if(rx.size() != plan.rx_length())
        throw TransferError("SPI transaction rejected: receive buffer holds " + std::to_string(rx.size()) +
                            " bytes, plan transfers " + std::to_string(plan.rx_length()));

    struct spi_ioc_transfer tr[MAX_PLAN_SEGMENTS];
    build_ioc_transfers(plan, rx, _bits_per_word, tr);

    unsigned long request = (count == 1) ? SPI_IOC_MESSAGE(1) : SPI_IOC_MESSAGE(2);
    if(ioctl(_fd, request, tr) < 0)
        throw TransferError("SPI transaction failed", last_error());
}
