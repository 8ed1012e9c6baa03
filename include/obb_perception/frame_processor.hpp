#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include <opencv2/core.hpp>
#include <rclcpp/logger.hpp>
#include <sensor_msgs/msg/compressed_image.hpp>

#include "obb_perception/msg/obb_detection_array.hpp"
#include "obb_perception/obb_detector.hpp"
#include "obb_perception/rate_tracker.hpp"

namespace obb_perception {

    struct FrameProcessorConfig {
        float confidence_threshold{0.5f};
        int jpeg_quality{95};
    };

    // What one cycle produced. `detections` is set for every decoded frame
    // whose inference succeeded; `annotated` additionally needs a successful
    // encode. Nothing is set when the frame was dropped.
    struct FrameOutputs {
        std::optional<sensor_msgs::msg::CompressedImage> annotated;
        std::optional<msg::OBBDetectionArray> detections;
    };

    // decode -> detect -> annotate -> encode -> translate, for one frame at a
    // time. Not thread safe; owned by the node's single callback thread.
    class FrameProcessor {
    public:
        using Clock = std::function<double()>;

        FrameProcessor(std::shared_ptr<ObbDetector> detector, const FrameProcessorConfig &config,
                       const rclcpp::Logger &logger, Clock clock = &FrameProcessor::steadySeconds);

        // Never throws for per-frame failures; they are logged and reported as
        // missing outputs.
        FrameOutputs process(const sensor_msgs::msg::CompressedImage &msg);

        const RateTracker &arrivalRate() const { return arrival_rate_; }
        const RateTracker &processingRate() const { return processing_rate_; }
        uint64_t frameCount() const { return frame_count_; }

        static double steadySeconds();

    private:
        bool decode(const sensor_msgs::msg::CompressedImage &msg, cv::Mat &frame);
        void drawRates(cv::Mat &frame) const;
        std::optional<sensor_msgs::msg::CompressedImage> encode(const std_msgs::msg::Header &header,
                                                                const cv::Mat &frame);

        std::shared_ptr<ObbDetector> detector_;
        FrameProcessorConfig config_;
        rclcpp::Logger logger_;
        Clock clock_;

        RateTracker arrival_rate_;
        RateTracker processing_rate_;
        uint64_t frame_count_{0};
    };

} // namespace obb_perception
