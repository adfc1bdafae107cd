#pragma once

#include "core/types.hpp"

#include <optional>

namespace sky::sim {

class SimState;

/// Accumulator-driven fixed-timestep driver. Variable host frames go in,
/// whole ticks of `step` seconds come out; the leftover fraction is exposed
/// as alpha() for render interpolation.
class FixedStepLoop {
public:
    explicit FixedStepLoop(SimState& sim, f64 step = 1.0 / 60.0,
                           f64 max_frame = 0.1);

    /// Feed one host frame. Returns the number of ticks run; 0 when paused
    /// or when the run is over.
    u32 advance(f64 frame_seconds);

    /// Feed a wall-clock timestamp; the first call only primes the clock.
    u32 frame(f64 now_seconds);

    /// Fraction of a step left in the accumulator, in [0, 1).
    f64 alpha() const { return accumulator_ / step_; }

    void pause() { paused_ = true; }
    void resume();
    bool paused() const { return paused_; }

    f64 step() const { return step_; }
    f64 max_frame() const { return max_frame_; }
    f64 accumulator() const { return accumulator_; }

private:
    SimState& sim_;
    f64 step_;
    f64 max_frame_;
    f64 accumulator_ = 0.0;
    bool paused_ = false;
    std::optional<f64> last_now_;
};

} // namespace sky::sim
