#include "obb_perception/rate_tracker.hpp"

namespace obp = obb_perception;

double obp::RateTracker::update(double now) {
    if (prev_stamp_ > 0.0) {
        const double elapsed = now - prev_stamp_;
        if (elapsed > 0.0) {
            rate_ = rate_ * kRetain + (1.0 / elapsed) * kSample;
        }
    }
    prev_stamp_ = now;
    return rate_;
}
