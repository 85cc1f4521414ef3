#ifndef TRANSFER_PLAN_HPP
#define TRANSFER_PLAN_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// One physical transfer unit. The receive side always has the same length as tx.
struct SpiSegment
{
    std::vector<uint8_t> tx;
    uint32_t speed_hz{0};

    // Chip select is released at the end of this segment.
    // false on a leading segment keeps it asserted into the next one.
    bool cs_change{true};

    uint16_t delay_usecs{0};
};

// A logical transaction: one segment, or an empty delay segment followed by the payload.
struct TransferPlan
{
    std::vector<SpiSegment> segments;

    // Bytes clocked back by the whole plan
    std::size_t rx_length() const;

    // Segment carrying the real data (always the last one)
    const std::vector<uint8_t>& payload() const;
};

const std::size_t MAX_PLAN_SEGMENTS = 2;

TransferPlan build_transfer_plan(std::vector<uint8_t> payload, uint32_t speed_hz,
                                 std::optional<uint16_t> pre_delay_us);

#endif
