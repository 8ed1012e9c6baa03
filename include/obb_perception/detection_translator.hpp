#pragma once

#include <std_msgs/msg/header.hpp>

#include "obb_perception/msg/obb_detection_array.hpp"
#include "obb_perception/obb_detector.hpp"

namespace obb_perception {

    // Builds the published detection array from raw detector output. Order is
    // preserved and geometry is copied as is; only the class id is rounded
    // and resolved to a name.
    msg::OBBDetectionArray toDetectionArray(const std_msgs::msg::Header &header,
                                            const OrientedDetections &detections,
                                            const ObbDetector &detector);

} // namespace obb_perception
