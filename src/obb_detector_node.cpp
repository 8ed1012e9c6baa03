#include "obb_perception/obb_detector_node.hpp"

#include <stdexcept>

#include "obb_perception/dnn_obb_detector.hpp"
#include "obb_perception/model_bootstrap.hpp"
#include "obb_perception/ort_model_exporter.hpp"

namespace obp = obb_perception;

obp::ObbDetectorNode::ObbDetectorNode(const rclcpp::NodeOptions &options)
        : rclcpp::Node("yolo_obb_node", options) {
    declareParameters();
    validateParameters();

    // Model first: a node without a detector must never subscribe
    auto detector = loadDetector();

    FrameProcessorConfig proc_config;
    proc_config.confidence_threshold = static_cast<float>(confidence_threshold_);
    proc_config.jpeg_quality = jpeg_quality_;
    processor_ = std::make_unique<FrameProcessor>(detector, proc_config,
                                                  this->get_logger().get_child("frame_processor"));

    detection_pub_ = this->create_publisher<msg::OBBDetectionArray>(obb_topic_, 10);
    annotated_image_pub_ = this->create_publisher<sensor_msgs::msg::CompressedImage>(annotated_image_topic_, 1);

    // Depth-1 queue: frames arriving mid-cycle replace each other
    rclcpp::QoS img_qos{rclcpp::KeepLast(static_cast<size_t>(queue_size_))};
    img_qos.best_effort();
    image_sub_ = this->create_subscription<sensor_msgs::msg::CompressedImage>(
            input_topic_, img_qos,
            std::bind(&obp::ObbDetectorNode::onImage, this, std::placeholders::_1));

    RCLCPP_INFO(this->get_logger(), "YOLO OBB node initialized and ready. %s -> %s, %s (conf=%.2f)",
                input_topic_.c_str(), obb_topic_.c_str(), annotated_image_topic_.c_str(),
                confidence_threshold_);
}

void obp::ObbDetectorNode::declareParameters() {
    pt_model_path_ = this->declare_parameter<std::string>("pt_model_path", "");
    engine_model_path_ = this->declare_parameter<std::string>("engine_model_path", "");
    class_names_path_ = this->declare_parameter<std::string>("class_names_path", "");

    input_topic_ = this->declare_parameter<std::string>("input_topic", "/camera/color/image_raw/compressed");
    obb_topic_ = this->declare_parameter<std::string>("obb_topic", "/yolo_obb");
    annotated_image_topic_ = this->declare_parameter<std::string>(
            "annotated_image_topic", "/yolo_obb/camera/color/compressed");

    confidence_threshold_ = this->declare_parameter<double>("confidence_threshold", 0.5);
    nms_threshold_ = this->declare_parameter<double>("nms_threshold", 0.7);
    max_detections_ = static_cast<int>(this->declare_parameter<int64_t>("max_detections", 300));
    input_width_ = static_cast<int>(this->declare_parameter<int64_t>("input_width", 640));
    input_height_ = static_cast<int>(this->declare_parameter<int64_t>("input_height", 640));
    jpeg_quality_ = static_cast<int>(this->declare_parameter<int64_t>("jpeg_quality", 95));
    queue_size_ = static_cast<int>(this->declare_parameter<int64_t>("queue_size", 1));
    use_cuda_ = this->declare_parameter<bool>("use_cuda", false);
}

void obp::ObbDetectorNode::validateParameters() const {
    auto fail = [this](const std::string &what) {
        RCLCPP_FATAL(this->get_logger(), "Invalid parameter: %s", what.c_str());
        throw std::invalid_argument(what);
    };

    if (confidence_threshold_ < 0.0 || confidence_threshold_ > 1.0) fail("confidence_threshold must be in [0, 1]");
    if (nms_threshold_ < 0.0 || nms_threshold_ > 1.0) fail("nms_threshold must be in [0, 1]");
    if (jpeg_quality_ < 0 || jpeg_quality_ > 100) fail("jpeg_quality must be in [0, 100]");
    if (max_detections_ <= 0) fail("max_detections must be positive");
    if (input_width_ <= 0 || input_height_ <= 0) fail("input_width/input_height must be positive");
    if (queue_size_ <= 0) fail("queue_size must be positive");
}

std::shared_ptr<obp::ObbDetector> obp::ObbDetectorNode::loadDetector() {
    OrtModelExporter exporter;
    const std::string artifact = resolveModelArtifact({pt_model_path_, engine_model_path_}, exporter,
                                                      this->get_logger());

    DnnDetectorConfig config;
    config.model_path = artifact;
    config.class_names_path = class_names_path_;
    config.input_width = input_width_;
    config.input_height = input_height_;
    config.nms_threshold = static_cast<float>(nms_threshold_);
    config.max_detections = max_detections_;
    config.use_cuda = use_cuda_;

    RCLCPP_INFO(this->get_logger(), "Loading OBB model from %s (%s)", artifact.c_str(),
                use_cuda_ ? "CUDA FP16" : "CPU");
    try {
        auto detector = std::make_shared<DnnObbDetector>(config);
        RCLCPP_INFO(this->get_logger(), "YOLO-OBB model loaded successfully (%zu classes).",
                    detector->classes().size());
        return detector;
    } catch (const std::exception &e) {
        RCLCPP_FATAL(this->get_logger(), "Failed to load YOLO-OBB model: %s", e.what());
        throw ModelBootstrapError(std::string("failed to load model: ") + e.what());
    }
}

void obp::ObbDetectorNode::onImage(const sensor_msgs::msg::CompressedImage::SharedPtr msg) {
    FrameOutputs out = processor_->process(*msg);

    if (out.annotated) {
        annotated_image_pub_->publish(*out.annotated);
    }
    if (out.detections) {
        detection_pub_->publish(*out.detections);
    }

    RCLCPP_INFO_THROTTLE(this->get_logger(), *this->get_clock(), 5000,
                         "frames=%lu sub_fps=%.1f proc_fps=%.1f",
                         static_cast<unsigned long>(processor_->frameCount()),
                         processor_->arrivalRate().rate(), processor_->processingRate().rate());
}
