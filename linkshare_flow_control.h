// Watermark backpressure for the chunk pump
#pragma once

#include <cstdint>

namespace linkshare {

enum class FlowDecision { Send, Wait };

// Backpressure policy over the channel's pending byte count.
//
// Sending pauses once pending rises above the high watermark and resumes only
// when it has drained to the low watermark. Checked before every chunk, so
// pending never exceeds high + one chunk.
class FlowController {
public:
    FlowController(std::uint64_t high_watermark, std::uint64_t low_watermark);

    FlowDecision decide(std::uint64_t pending_bytes);

    bool paused() const { return paused_; }
    void reset() { paused_ = false; }

    std::uint64_t high_watermark() const { return high_; }
    std::uint64_t low_watermark() const { return low_; }

    // Number of Send->Wait transitions since construction
    std::uint64_t pause_count() const { return pauses_; }

private:
    std::uint64_t high_;
    std::uint64_t low_;
    bool paused_ = false;
    std::uint64_t pauses_ = 0;
};

} // namespace linkshare
