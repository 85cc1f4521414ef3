#include "transfer_plan.hpp"

#include <utility>

std::size_t TransferPlan::rx_length() const
{
    std::size_t total = 0;
    for(const SpiSegment& segment : segments)
        total += segment.tx.size();
    return total;
}

const std::vector<uint8_t>& TransferPlan::payload() const
{
    return segments.back().tx;
}

TransferPlan build_transfer_plan(std::vector<uint8_t> payload, uint32_t speed_hz,
                                 std::optional<uint16_t> pre_delay_us)
{
    TransferPlan plan;

    // Dummy segment: assert CS, wait, and keep CS asserted for the payload
    if(pre_delay_us)
    {
        SpiSegment delay;
        delay.speed_hz = speed_hz;
        delay.cs_change = false;
        delay.delay_usecs = *pre_delay_us;
        plan.segments.push_back(delay);
    }

    // An empty payload is still transferred
    SpiSegment data;
    data.tx = std::move(payload);
    data.speed_hz = speed_hz;
    data.cs_change = true;
    plan.segments.push_back(std::move(data));

    return plan;
}
