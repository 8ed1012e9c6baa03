#pragma once

namespace obb_perception {

    // Exponential moving average of an event rate (events per second).
    // The first call only records the timestamp; the estimate stays at 0
    // until a second event with a strictly positive delta arrives.
    class RateTracker {
    public:
        static constexpr double kRetain = 0.9;
        static constexpr double kSample = 0.1;

        // `now` is in seconds on any monotonic-enough clock. Returns the
        // estimate after the update.
        double update(double now);

        double rate() const { return rate_; }
        double previousStamp() const { return prev_stamp_; }

    private:
        double rate_{0.0};
        double prev_stamp_{0.0}; // 0 means "no previous event"
    };

} // namespace obb_perception
