#include "obb_perception/detection_translator.hpp"

#include <cmath>
#include <utility>

namespace obp = obb_perception;

obp::msg::OBBDetectionArray obp::toDetectionArray(const std_msgs::msg::Header &header,
                                                  const OrientedDetections &detections,
                                                  const ObbDetector &detector) {
    msg::OBBDetectionArray array;
    array.header = header;
    array.detections.reserve(detections.size());

    for (const auto &d : detections) {
        msg::OBBDetection det;
        det.class_id = static_cast<int32_t>(std::lround(d.class_id));
        det.class_name = detector.className(det.class_id);
        det.score = d.score;
        det.x_center = d.x;
        det.y_center = d.y;
        det.width = d.w;
        det.height = d.h;
        det.angle = d.angle;
        array.detections.push_back(std::move(det));
    }
    return array;
}
