#pragma once

#include <opencv2/core.hpp>

#include "obb_perception/obb_detector.hpp"

namespace obb_perception {

    // Geometry of a letterbox resize: src * scale, then offset by the pad.
    struct Letterbox {
        float scale{1.0f};
        int pad_x{0};
        int pad_y{0};
    };

    struct DecodeOptions {
        float conf_threshold{0.5f};
        float nms_threshold{0.7f};
        int max_detections{300};
    };

    // Resizes `src` into `dst` of size `input` keeping aspect ratio, padding
    // with gray (114).
    Letterbox letterbox(const cv::Mat &src, const cv::Size &input, cv::Mat &dst);

    // Reshapes a YOLO-OBB output blob to N x (4 + nc + 1) rows, one per
    // anchor. Accepts [1, C, N], [1, N, C] and the 2-D forms, with C the
    // smaller side and at least 6. Throws std::runtime_error otherwise.
    cv::Mat anchorRows(const cv::Mat &output);

    // Normalizes (w, h, angle) so that angle lies in [0, pi/2).
    void regularizeBox(float &w, float &h, float &angle);

    // Full decode: keep score > conf_threshold, regularize, per-class rotated
    // NMS, and map back to source-image pixels. Result is sorted by
    // descending score.
    OrientedDetections decodeObbOutput(const cv::Mat &output, const Letterbox &lb,
                                       const DecodeOptions &opts);

} // namespace obb_perception
