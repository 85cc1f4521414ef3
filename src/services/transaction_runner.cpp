#include "transaction_runner.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>

TransactionRunner::TransactionRunner(SpiBus& bus) : _bus(bus) {}

std::size_t TransactionRunner::run(const TransferPlan& plan, std::size_t repeat_count,
                                   const CaptureCallback& on_capture)
{
    const std::size_t rx_len = plan.rx_length();
    _rx_buf.assign(rx_len, 0);

    std::size_t completed = 0;
    for(; completed < repeat_count; completed++)
    {
        // Nothing from the previous transaction may survive into this one
        std::fill(_rx_buf.begin(), _rx_buf.end(), 0);

        _bus.transfer(plan, _rx_buf);

        if(_rx_buf.size() != rx_len)
        {
            throw TransferError("SPI transaction returned " + std::to_string(_rx_buf.size()) + " bytes, expected " +
                                std::to_string(rx_len));
        }

        if(g_verbose)
            std::cerr << "[RUN] Transaction " << (completed + 1) << "/" << repeat_count << ": " << rx_len << " bytes"
                      << std::endl;

        if(on_capture)
            on_capture(_rx_buf);
    }

    return completed;
}
