#include "linkshare_flow_control.h"

namespace linkshare {

FlowController::FlowController(std::uint64_t high_watermark, std::uint64_t low_watermark)
    : high_(high_watermark), low_(low_watermark < high_watermark ? low_watermark : high_watermark) {}

FlowDecision FlowController::decide(std::uint64_t pending_bytes) {
    if (paused_) {
        if (pending_bytes > low_) return FlowDecision::Wait;
        paused_ = false;
        return FlowDecision::Send;
    }
    if (pending_bytes > high_) {
        paused_ = true;
        ++pauses_;
        return FlowDecision::Wait;
    }
    return FlowDecision::Send;
}

} // namespace linkshare
