#ifndef TRANSACTION_RUNNER_HPP
#define TRANSACTION_RUNNER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "spi_bus.hpp"
#include "transfer_plan.hpp"

// Receives the capture of one transaction. The buffer is reused by the
// next iteration, so it must be consumed before returning.
using CaptureCallback = std::function<void(const std::vector<uint8_t>&)>;

class TransactionRunner
{
public:
    explicit TransactionRunner(SpiBus& bus);

    // Executes plan repeat_count times, calling on_capture after each
    // transaction. The first failure (TransferError, or anything thrown by
    // on_capture) ends the run; there are no retries.
    // Returns the number of completed transactions.
    std::size_t run(const TransferPlan& plan, std::size_t repeat_count, const CaptureCallback& on_capture);

private:
    SpiBus& _bus;

    // Receive buffer shared by every iteration
    std::vector<uint8_t> _rx_buf;
};

#endif
