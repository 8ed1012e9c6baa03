#include <iostream>

#include "rclcpp/rclcpp.hpp"
#include "obb_perception/obb_detector_node.hpp"

int main(int argc, char **argv) {
    rclcpp::init(argc, argv);

    int rc = 0;
    try {
        auto node = std::make_shared<obb_perception::ObbDetectorNode>();
        rclcpp::spin(node);
    } catch (const std::exception &e) {
        std::cerr << "yolo_obb_node fatal error: " << e.what() << std::endl;
        rc = 1;
    }

    rclcpp::shutdown();
    return rc;
}
