#include "obb_perception/obb_decoder.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>

namespace obp = obb_perception;

namespace {

    constexpr float kPi = static_cast<float>(CV_PI);

    // Keeps boxes of different classes apart during NMS.
    constexpr float kClassOffset = 7680.0f;

    // cx, cy, w, h, >= 1 class score, angle
    constexpr int kMinChannels = 6;

} // namespace

obp::Letterbox obp::letterbox(const cv::Mat &src, const cv::Size &input, cv::Mat &dst) {
    Letterbox lb;
    lb.scale = std::min(static_cast<float>(input.width) / static_cast<float>(src.cols),
                        static_cast<float>(input.height) / static_cast<float>(src.rows));

    const int new_w = static_cast<int>(std::round(src.cols * lb.scale));
    const int new_h = static_cast<int>(std::round(src.rows * lb.scale));
    lb.pad_x = (input.width - new_w) / 2;
    lb.pad_y = (input.height - new_h) / 2;

    cv::Mat resized;
    if (new_w != src.cols || new_h != src.rows) {
        cv::resize(src, resized, cv::Size(new_w, new_h), 0, 0, cv::INTER_LINEAR);
    } else {
        resized = src;
    }

    cv::copyMakeBorder(resized, dst,
                       lb.pad_y, input.height - new_h - lb.pad_y,
                       lb.pad_x, input.width - new_w - lb.pad_x,
                       cv::BORDER_CONSTANT, cv::Scalar(114, 114, 114));
    return lb;
}

cv::Mat obp::anchorRows(const cv::Mat &output) {
    // Anchors always outnumber channels: [1, C, N] is the export default,
    // [1, N, C] the transposed one. The channel side must hold a full box.
    if (output.dims == 3 && output.size[0] == 1) {
        const int A = output.size[1];
        const int B = output.size[2];
        cv::Mat a_by_b(A, B, CV_32F, const_cast<float *>(output.ptr<float>()));
        if (A <= B && A >= kMinChannels) {
            return a_by_b.t();
        }
        if (B < A && B >= kMinChannels) {
            return a_by_b.clone();
        }
    } else if (output.dims == 2) {
        if (output.rows <= output.cols && output.rows >= kMinChannels) {
            return output.t();
        }
        if (output.cols < output.rows && output.cols >= kMinChannels) {
            return output.clone();
        }
    }

    std::string shape;
    for (int i = 0; i < output.dims; ++i) {
        shape += (i ? ", " : "") + std::to_string(output.size[i]);
    }
    throw std::runtime_error("unexpected OBB output shape [" + shape + "]");
}

void obp::regularizeBox(float &w, float &h, float &angle) {
    float t = std::fmod(angle, kPi);
    if (t < 0.0f) {
        t += kPi;
    }
    if (t >= kPi / 2.0f) {
        std::swap(w, h);
        t -= kPi / 2.0f;
    }
    angle = t;
}

obp::OrientedDetections obp::decodeObbOutput(const cv::Mat &output, const Letterbox &lb,
                                             const DecodeOptions &opts) {
    const cv::Mat rows = anchorRows(output);
    const int num_classes = rows.cols - 5;

    std::vector<cv::RotatedRect> nms_boxes;
    std::vector<float> scores;
    OrientedDetections candidates;

    for (int i = 0; i < rows.rows; ++i) {
        const float *p = rows.ptr<float>(i);

        cv::Mat class_scores(1, num_classes, CV_32F, const_cast<float *>(p + 4));
        cv::Point cid;
        double max_score;
        cv::minMaxLoc(class_scores, nullptr, &max_score, nullptr, &cid);

        if (max_score <= opts.conf_threshold) continue;

        OrientedDetection det;
        det.class_id = static_cast<float>(cid.x);
        det.score = static_cast<float>(max_score);
        det.x = p[0];
        det.y = p[1];
        det.w = p[2];
        det.h = p[3];
        det.angle = p[rows.cols - 1];
        regularizeBox(det.w, det.h, det.angle);

        const float offset = det.class_id * kClassOffset;
        nms_boxes.emplace_back(cv::Point2f(det.x + offset, det.y + offset),
                               cv::Size2f(det.w, det.h),
                               det.angle * 180.0f / kPi);
        scores.push_back(det.score);
        candidates.push_back(det);
    }

    // NMSBoxes also drops scores not strictly above the threshold
    std::vector<int> keep;
    cv::dnn::NMSBoxes(nms_boxes, scores, opts.conf_threshold, opts.nms_threshold, keep,
                      1.0f, std::max(0, opts.max_detections));

    OrientedDetections result;
    result.reserve(keep.size());
    for (int k : keep) {
        OrientedDetection det = candidates[k];
        det.x = (det.x - static_cast<float>(lb.pad_x)) / lb.scale;
        det.y = (det.y - static_cast<float>(lb.pad_y)) / lb.scale;
        det.w /= lb.scale;
        det.h /= lb.scale;
        result.push_back(det);
    }
    return result;
}
