#include "spi_session.hpp"
#include "log.hpp"
#include "output_formatter.hpp"
#include "transaction_runner.hpp"
#include "transfer_plan.hpp"

#include <utility>
#include <vector>

SpiSession::SpiSession(SpiBus& bus, const Options& options) : _bus(bus), _options(options) {}

void SpiSession::configure()
{
    _bus.configure(_options.spi_config());
}

std::size_t SpiSession::run(ByteSource& source, ByteSink& sink)
{
    // The whole message is read before the first transaction
    std::vector<uint8_t> payload = source.read_all();

    const TransferPlan plan = build_transfer_plan(std::move(payload), _options.speed_hz, _options.pre_delay_us);

    // Resolved once, not per transaction
    OutputFormatter formatter(sink, resolve_format(_options.format, sink.is_interactive()));

    if(g_verbose)
        std::cerr << "[RUN] " << plan.segments.size() << " segment(s), " << plan.payload().size() << " bytes, "
                  << _options.repeat << " repeat(s), format " << formatter.format() << std::endl;

    TransactionRunner runner(_bus);
    return runner.run(plan, _options.repeat, [&formatter](const std::vector<uint8_t>& rx) { formatter.write(rx); });
}
