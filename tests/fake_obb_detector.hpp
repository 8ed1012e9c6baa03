#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "obb_perception/obb_detector.hpp"

namespace obb_perception_test {

// Returns a fixed list of detections, filtered by the threshold it is given,
// and records how it was called.
class ScriptedDetector : public obb_perception::ObbDetector {
public:
    obb_perception::OrientedDetections results;
    std::vector<std::string> names{"plane", "ship", "storage tank"};

    bool throw_on_detect{false};
    bool throw_on_draw{false};
    bool break_frame_on_draw{false}; // leaves a 2-channel raster that cannot be encoded as JPEG

    int detect_calls{0};
    mutable int draw_calls{0};
    float last_threshold{-1.0f};

    obb_perception::OrientedDetections detect(const cv::Mat &image, float conf_threshold) override {
        detect_calls++;
        last_threshold = conf_threshold;
        if (throw_on_detect) throw std::runtime_error("scripted inference failure");
        if (image.empty()) return {};

        obb_perception::OrientedDetections out;
        for (const auto &d : results) {
            if (d.score > conf_threshold) out.push_back(d);
        }
        return out;
    }

    void draw(cv::Mat &image, const obb_perception::OrientedDetections &) const override {
        draw_calls++;
        if (throw_on_draw) throw std::runtime_error("scripted drawing failure");
        if (break_frame_on_draw) {
            image = cv::Mat(image.size(), CV_8UC2, cv::Scalar(0, 0));
        }
    }

    std::string className(int class_id) const override {
        if (class_id < 0 || class_id >= static_cast<int>(names.size())) return "unknown";
        return names[static_cast<size_t>(class_id)];
    }
};

} // namespace obb_perception_test
