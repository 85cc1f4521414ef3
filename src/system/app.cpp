#include "app.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <boost/asio/io_context.hpp>

#include "byte_stream.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "hal_spi.hpp"
#include "log.hpp"
#include "options.hpp"
#include "spi_session.hpp"

int run_spicat(int argc, const char* const argv[], std::ostream& out, std::ostream& err)
{
    std::optional<Options> options;

    try
    {
        options = parse_options(argc, argv, out);
    }
    catch(const UsageError& e)
    {
        err << "Error: " << e.what() << "\n"
            << "Try '" << SPICAT_NAME << " --help' for more information." << std::endl;
        return 2;
    }

    // --help / --version
    if(!options)
        return 0;

    g_verbose = options->verbose;

    // A closed pipe must show up as a write error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    try
    {
        boost::asio::io_context io;

        // 1. Hardware
        HalSpi spi(options->spidev);
        SpiSession session(spi, *options);
        session.configure();

        // 2. Streams
        std::unique_ptr<ByteSource> input = open_source(io, options->input);
        std::unique_ptr<ByteSink> output = open_sink(io, options->output);

        // 3. Transactions
        std::size_t completed = session.run(*input, *output);
        if(g_verbose)
            std::cerr << "[SYSTEM] " << completed << " transaction(s) completed" << std::endl;
    }
    catch(const std::exception& e)
    {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
