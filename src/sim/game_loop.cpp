#include "sim/game_loop.hpp"
#include "sim/sim_state.hpp"

#include <algorithm>

namespace sky::sim {

FixedStepLoop::FixedStepLoop(SimState& sim, f64 step, f64 max_frame)
    : sim_(sim), step_(step > 0 ? step : 1.0 / 60.0),
      max_frame_(std::max(max_frame, step_)) {}

u32 FixedStepLoop::advance(f64 frame_seconds) {
    if (paused_ || sim_.game_over()) return 0;

    accumulator_ += std::clamp(frame_seconds, 0.0, max_frame_);

    u32 ticks = 0;
    while (accumulator_ >= step_) {
        sim_.tick(step_);
        accumulator_ -= step_;
        ++ticks;
        if (sim_.game_over()) {
            accumulator_ = 0;
            break;
        }
    }
    return ticks;
}

u32 FixedStepLoop::frame(f64 now_seconds) {
    if (!last_now_) {
        last_now_ = now_seconds;
        return 0;
    }
    f64 delta = now_seconds - *last_now_;
    last_now_ = now_seconds;
    return advance(delta);
}

void FixedStepLoop::resume() {
    // Time spent paused is not simulated.
    paused_ = false;
    last_now_.reset();
}

} // namespace sky::sim
