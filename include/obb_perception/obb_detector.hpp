#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace obb_perception {

    // Raw detector output, in source-image pixels.
    struct OrientedDetection {
        float class_id{0.0f}; // as produced by the model, not yet rounded
        float score{0.0f};
        float x{0.0f};
        float y{0.0f};
        float w{0.0f};
        float h{0.0f};
        float angle{0.0f};    // radians
    };

    using OrientedDetections = std::vector<OrientedDetection>;

    // Object detector capability used by the frame pipeline. Implementations
    // are fully prepared (model loaded) once constructed.
    class ObbDetector {
    public:
        virtual ~ObbDetector() = default;

        // Returns detections with score strictly above conf_threshold, in the
        // backend's native order. May throw on inference failure.
        virtual OrientedDetections detect(const cv::Mat &image, float conf_threshold) = 0;

        // Draws boxes and labels onto `image` in place.
        virtual void draw(cv::Mat &image, const OrientedDetections &detections) const = 0;

        // Returns "unknown" for ids outside the class table.
        virtual std::string className(int class_id) const = 0;
    };

} // namespace obb_perception
