#include "obb_perception/frame_processor.hpp"

#include <exception>
#include <utility>
#include <vector>

#include <cv_bridge/cv_bridge.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <rclcpp/clock.hpp>
#include <rclcpp/logging.hpp>

#include "obb_perception/detection_translator.hpp"

namespace obp = obb_perception;

obp::FrameProcessor::FrameProcessor(std::shared_ptr<ObbDetector> detector,
                                    const FrameProcessorConfig &config,
                                    const rclcpp::Logger &logger, Clock clock)
        : detector_(std::move(detector)), config_(config), logger_(logger), clock_(std::move(clock)) {}

double obp::FrameProcessor::steadySeconds() {
    static rclcpp::Clock steady_clock(RCL_STEADY_TIME);
    return steady_clock.now().seconds();
}

obp::FrameOutputs obp::FrameProcessor::process(const sensor_msgs::msg::CompressedImage &msg) {
    frame_count_++;
    arrival_rate_.update(clock_());

    FrameOutputs out;

    cv::Mat frame;
    if (!decode(msg, frame)) {
        return out;
    }

    // ----------- DETECTION -----------
    OrientedDetections detections;
    double inferred_at = 0.0;
    try {
        detections = detector_->detect(frame, config_.confidence_threshold);
        inferred_at = clock_();
        detector_->draw(frame, detections);
    } catch (const std::exception &e) {
        RCLCPP_ERROR(logger_, "Inference failed, dropping frame: %s", e.what());
        return out;
    }
    // Only completed cycles count towards the processing rate
    processing_rate_.update(inferred_at);

    drawRates(frame);

    // ----------- PUBLICATION -----------
    out.annotated = encode(msg.header, frame);
    out.detections = toDetectionArray(msg.header, detections, *detector_);
    return out;
}

bool obp::FrameProcessor::decode(const sensor_msgs::msg::CompressedImage &msg, cv::Mat &frame) {
    // cv_bridge indexes data[0] unconditionally
    if (msg.data.empty()) {
        RCLCPP_ERROR(logger_, "Received empty compressed image (format '%s')", msg.format.c_str());
        return false;
    }
    try {
        frame = cv_bridge::toCvCopy(msg, "bgr8")->image;
    } catch (const std::exception &e) {
        RCLCPP_ERROR(logger_, "Error decoding compressed image (format '%s', %zu bytes): %s",
                     msg.format.c_str(), msg.data.size(), e.what());
        return false;
    }
    if (frame.empty()) {
        RCLCPP_ERROR(logger_, "Decoded image is empty (format '%s', %zu bytes)",
                     msg.format.c_str(), msg.data.size());
        return false;
    }
    return true;
}

void obp::FrameProcessor::drawRates(cv::Mat &frame) const {
    const cv::Scalar green(0, 255, 0);
    cv::putText(frame, cv::format("Sub FPS: %.1f", arrival_rate_.rate()), {10, 30},
                cv::FONT_HERSHEY_SIMPLEX, 1.0, green, 2, cv::LINE_AA);
    cv::putText(frame, cv::format("Proc FPS: %.1f", processing_rate_.rate()), {10, 70},
                cv::FONT_HERSHEY_SIMPLEX, 1.0, green, 2, cv::LINE_AA);
}

std::optional<sensor_msgs::msg::CompressedImage>
obp::FrameProcessor::encode(const std_msgs::msg::Header &header, const cv::Mat &frame) {
    sensor_msgs::msg::CompressedImage image;
    image.header = header;
    image.format = "jpeg";

    const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, config_.jpeg_quality};
    try {
        if (!cv::imencode(".jpg", frame, image.data, params)) {
            RCLCPP_ERROR(logger_, "Failed to encode annotated image.");
            return std::nullopt;
        }
    } catch (const std::exception &e) {
        RCLCPP_ERROR(logger_, "Error encoding annotated image: %s", e.what());
        return std::nullopt;
    }
    return image;
}
