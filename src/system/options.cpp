#include "options.hpp"
#include "errors.hpp"

#include <boost/program_options.hpp>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <ostream>

namespace po = boost::program_options;

SpiConfig Options::spi_config() const
{
    return SpiConfig{speed_hz, mode, chip_select, bits_per_word};
}

// lexical_cast happily wraps "-1" into an unsigned, so numbers are checked here
template <typename T>
static T parse_unsigned(const std::string& option, const std::string& text)
{
    if(text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
        throw UsageError("invalid value '" + text + "' for --" + option + ": expected a non-negative integer");

    errno = 0;
    unsigned long long value = std::strtoull(text.c_str(), nullptr, 10);

    if(errno == ERANGE || value > std::numeric_limits<T>::max())
    {
        throw UsageError("invalid value '" + text + "' for --" + option + ": maximum is " +
                         std::to_string(static_cast<unsigned long long>(std::numeric_limits<T>::max())));
    }

    return static_cast<T>(value);
}

static po::options_description build_description()
{
    po::options_description desc("Options");

    // clang-format off
    desc.add_options()
        ("help,h", "Print this help and exit.")
        ("version,V", "Print the version and exit.")
        ("in,i", po::value<std::string>()->default_value(STREAM_SENTINEL)->value_name("PATH"),
            "Read input from a file, or - for standard input.")
        ("out,o", po::value<std::string>()->default_value(STREAM_SENTINEL)->value_name("PATH"),
            "Write output to a file, or - for standard output.")
        ("speed,s", po::value<std::string>()->default_value(std::to_string(DEFAULT_SPEED_HZ))->value_name("HZ"),
            "The speed in Hz for the SPI transaction.")
        ("repeat,r", po::value<std::string>()->default_value(std::to_string(DEFAULT_REPEAT))->value_name("COUNT"),
            "Repeat the transaction COUNT times.")
        ("format,f", po::value<OutputFormat>()->value_name("FORMAT"),
            "Print the response as raw, hex[adecimal] or dec[imal]. "
            "Default: hex when output goes to a terminal, raw otherwise.")
        ("mode", po::value<SpiMode>()->default_value(DEFAULT_MODE)->value_name("MODE"),
            "SPI mode to use: 0, 1, 2 or 3.")
        ("chip-select", po::value<ChipSelect>()->default_value(DEFAULT_CHIP_SELECT)->value_name("CS"),
            "Chip select mode: active-low, active-high or disabled.")
        ("bits", po::value<std::string>()->default_value(std::to_string(DEFAULT_BITS_PER_WORD))->value_name("N"),
            "Bits per word for the SPI transaction.")
        ("pre-delay", po::value<std::string>()->value_name("MICROSECONDS"),
            "Delay in microseconds after enabling the chip select line before sending data.")
        ("verbose,v", po::bool_switch(), "Log each step on standard error.");
    // clang-format on

    return desc;
}

std::optional<Options> parse_options(int argc, const char* const argv[], std::ostream& out)
{
    po::options_description visible = build_description();

    po::options_description all;
    all.add(visible);
    all.add_options()("spidev", po::value<std::string>(), "The spidev to open.");

    po::positional_options_description positional;
    positional.add("spidev", 1);

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    }
    catch(const po::error& e)
    {
        throw UsageError(e.what());
    }

    if(vm.count("help"))
    {
        out << "Perform full-duplex SPI transactions.\n\n"
            << "Usage: " << SPICAT_NAME << " [options] SPIDEV\n\n"
            << visible << std::endl;
        return std::nullopt;
    }

    if(vm.count("version"))
    {
        out << SPICAT_NAME << " " << SPICAT_VERSION << std::endl;
        return std::nullopt;
    }

    if(!vm.count("spidev"))
        throw UsageError("missing required argument SPIDEV");

    Options options;
    options.spidev = vm["spidev"].as<std::string>();
    options.input = vm["in"].as<std::string>();
    options.output = vm["out"].as<std::string>();
    options.speed_hz = parse_unsigned<uint32_t>("speed", vm["speed"].as<std::string>());
    options.repeat = parse_unsigned<std::size_t>("repeat", vm["repeat"].as<std::string>());
    options.mode = vm["mode"].as<SpiMode>();
    options.chip_select = vm["chip-select"].as<ChipSelect>();
    options.bits_per_word = parse_unsigned<uint8_t>("bits", vm["bits"].as<std::string>());
    options.verbose = vm["verbose"].as<bool>();

    if(vm.count("format"))
        options.format = vm["format"].as<OutputFormat>();

    if(vm.count("pre-delay"))
        options.pre_delay_us = parse_unsigned<uint16_t>("pre-delay", vm["pre-delay"].as<std::string>());

    return options;
}
