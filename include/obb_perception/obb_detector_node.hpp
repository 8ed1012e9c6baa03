#pragma once

#include <memory>
#include <string>

#include <rclcpp/rclcpp.hpp>
#include <sensor_msgs/msg/compressed_image.hpp>

#include "obb_perception/frame_processor.hpp"
#include "obb_perception/msg/obb_detection_array.hpp"
#include "obb_perception/obb_detector.hpp"

namespace obb_perception {

    class ObbDetectorNode : public rclcpp::Node {
    public:
        // Throws ModelBootstrapError or std::invalid_argument when the node
        // cannot be brought up; no subscription exists in that case.
        explicit ObbDetectorNode(const rclcpp::NodeOptions &options = rclcpp::NodeOptions());

    private:
        void onImage(const sensor_msgs::msg::CompressedImage::SharedPtr msg);

        void declareParameters();
        void validateParameters() const;
        std::shared_ptr<ObbDetector> loadDetector();

        // Parameters
        std::string pt_model_path_;
        std::string engine_model_path_;
        std::string class_names_path_;
        std::string input_topic_;
        std::string obb_topic_;
        std::string annotated_image_topic_;
        double confidence_threshold_{0.5};
        double nms_threshold_{0.7};
        int max_detections_{300};
        int input_width_{640};
        int input_height_{640};
        int jpeg_quality_{95};
        int queue_size_{1};
        bool use_cuda_{false};

        std::unique_ptr<FrameProcessor> processor_;

        // ROS 2 I/O
        rclcpp::Subscription<sensor_msgs::msg::CompressedImage>::SharedPtr image_sub_;
        rclcpp::Publisher<msg::OBBDetectionArray>::SharedPtr detection_pub_;
        rclcpp::Publisher<sensor_msgs::msg::CompressedImage>::SharedPtr annotated_image_pub_;
    };

} // namespace obb_perception
