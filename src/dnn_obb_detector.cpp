#include "obb_perception/dnn_obb_detector.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace obp = obb_perception;

namespace {

    // BGR
    const cv::Scalar kPalette[] = {
            {56, 56, 255},  {151, 157, 255}, {31, 112, 255}, {29, 178, 255},
            {49, 210, 207}, {10, 249, 72},   {23, 204, 146}, {134, 219, 61},
            {52, 147, 26},  {187, 212, 0},   {168, 153, 44}, {255, 194, 0},
            {147, 69, 52},  {255, 115, 100}, {236, 24, 0},   {255, 56, 132},
    };

    const cv::Scalar &classColor(int class_id) {
        const int n = static_cast<int>(sizeof(kPalette) / sizeof(kPalette[0]));
        return kPalette[((class_id % n) + n) % n];
    }

} // namespace

obp::DnnObbDetector::DnnObbDetector(const DnnDetectorConfig &config) : config_(config) {
    classes_ = config_.class_names_path.empty() ? ClassTable::dota()
                                                : ClassTable::load(config_.class_names_path);

    net_ = cv::dnn::readNetFromONNX(config_.model_path);
    if (net_.empty()) {
        throw std::runtime_error("OpenCV DNN returned an empty net for " + config_.model_path);
    }

    if (config_.use_cuda) {
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_CUDA);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CUDA_FP16);
    } else {
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
    }
}

obp::OrientedDetections obp::DnnObbDetector::detect(const cv::Mat &image, float conf_threshold) {
    if (image.empty()) return {};

    cv::Mat input;
    const Letterbox lb = letterbox(image, cv::Size(config_.input_width, config_.input_height), input);

    cv::Mat blob = cv::dnn::blobFromImage(input, 1.0 / 255.0, cv::Size(), cv::Scalar(),
                                          /*swapRB=*/true, /*crop=*/false);
    net_.setInput(blob);
    cv::Mat out = net_.forward();

    DecodeOptions opts;
    opts.conf_threshold = conf_threshold;
    opts.nms_threshold = config_.nms_threshold;
    opts.max_detections = config_.max_detections;
    return decodeObbOutput(out, lb, opts);
}

void obp::DnnObbDetector::draw(cv::Mat &image, const OrientedDetections &detections) const {
    const int thickness = std::max(1, static_cast<int>(std::round((image.cols + image.rows) / 2.0 * 0.003)));

    for (const auto &det : detections) {
        const int cls = static_cast<int>(std::lround(det.class_id));
        const cv::Scalar &color = classColor(cls);

        cv::RotatedRect rbox(cv::Point2f(det.x, det.y), cv::Size2f(det.w, det.h),
                             det.angle * 180.0f / static_cast<float>(CV_PI));
        cv::Point2f corners[4];
        rbox.points(corners);

        std::vector<cv::Point> poly(corners, corners + 4);
        cv::polylines(image, poly, /*isClosed=*/true, color, thickness, cv::LINE_AA);

        const auto top = std::min_element(poly.begin(), poly.end(),
                                          [](const cv::Point &a, const cv::Point &b) { return a.y < b.y; });

        const std::string label = className(cls) + " " + cv::format("%.2f", det.score);
        int baseline = 0;
        const cv::Size text = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, 0.5, 1, &baseline);
        const cv::Point origin(top->x, std::max(text.height + baseline, top->y - 4));

        cv::rectangle(image, cv::Point(origin.x, origin.y - text.height - baseline),
                      cv::Point(origin.x + text.width, origin.y), color, cv::FILLED);
        cv::putText(image, label, cv::Point(origin.x, origin.y - baseline),
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
    }
}

std::string obp::DnnObbDetector::className(int class_id) const {
    return classes_.name(class_id);
}
