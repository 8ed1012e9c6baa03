#pragma once

#include <string>

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

#include "obb_perception/class_table.hpp"
#include "obb_perception/obb_decoder.hpp"
#include "obb_perception/obb_detector.hpp"

namespace obb_perception {

    struct DnnDetectorConfig {
        std::string model_path;
        std::string class_names_path; // empty: DOTA-v1 names
        int input_width{640};
        int input_height{640};
        float nms_threshold{0.7f};
        int max_detections{300};
        bool use_cuda{false};
    };

    // YOLO-OBB (v8 / 11) ONNX model run through OpenCV DNN.
    class DnnObbDetector : public ObbDetector {
    public:
        // Throws cv::Exception / std::runtime_error if the model or the class
        // name file cannot be loaded.
        explicit DnnObbDetector(const DnnDetectorConfig &config);

        OrientedDetections detect(const cv::Mat &image, float conf_threshold) override;
        void draw(cv::Mat &image, const OrientedDetections &detections) const override;
        std::string className(int class_id) const override;

        const ClassTable &classes() const { return classes_; }

    private:
        DnnDetectorConfig config_;
        cv::dnn::Net net_;
        ClassTable classes_;
    };

} // namespace obb_perception
