#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <rclcpp/rclcpp.hpp>
#include "obb_perception/model_bootstrap.hpp"
#include "obb_perception/obb_detector_node.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using obb_perception::ModelBootstrapError;
using obb_perception::ObbDetectorNode;
namespace fs = std::filesystem;

namespace {

const std::string kInput = "/obb_node_test/image/compressed";
const std::string kObb = "/obb_node_test/obb";
const std::string kAnnotated = "/obb_node_test/annotated/compressed";

rclcpp::NodeOptions optionsWith(std::vector<rclcpp::Parameter> params) {
    params.emplace_back("input_topic", kInput);
    params.emplace_back("obb_topic", kObb);
    params.emplace_back("annotated_image_topic", kAnnotated);
    rclcpp::NodeOptions opts;
    opts.parameter_overrides(params);
    return opts;
}

std::string scratchFile(const std::string &name, const std::string &content) {
    const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
    const fs::path path = fs::temp_directory_path() / (std::to_string(tick) + "_" + name);
    std::ofstream(path) << content;
    return path.string();
}

// Nothing may be attached to the node's topics after a failed start.
void checkNoEndpoints() {
    auto observer = std::make_shared<rclcpp::Node>("obb_node_test_observer");
    CHECK(observer->count_subscribers(kInput) == 0);
    CHECK(observer->count_publishers(kObb) == 0);
    CHECK(observer->count_publishers(kAnnotated) == 0);
}

} // namespace

TEST_CASE("missing model files stop the node before it subscribes") {
    auto opts = optionsWith({rclcpp::Parameter("pt_model_path", "/nonexistent/model.onnx"),
                             rclcpp::Parameter("engine_model_path", "/nonexistent/model.opt.onnx")});

    std::shared_ptr<ObbDetectorNode> node;
    CHECK_THROWS_AS(node = std::make_shared<ObbDetectorNode>(opts), ModelBootstrapError);
    CHECK(node == nullptr);
    checkNoEndpoints();
}

TEST_CASE("unreadable model artifact is a bootstrap failure") {
    const auto artifact = scratchFile("broken.opt.onnx", "not an onnx graph");
    auto opts = optionsWith({rclcpp::Parameter("engine_model_path", artifact)});

    CHECK_THROWS_AS(std::make_shared<ObbDetectorNode>(opts), ModelBootstrapError);
    fs::remove(artifact);
    checkNoEndpoints();
}

TEST_CASE("out of range parameters are rejected") {
    std::vector<rclcpp::Parameter> params;

    SUBCASE("confidence_threshold above 1") {
        params.emplace_back("confidence_threshold", 1.5);
    }
    SUBCASE("negative confidence_threshold") {
        params.emplace_back("confidence_threshold", -0.1);
    }
    SUBCASE("jpeg_quality above 100") {
        params.emplace_back("jpeg_quality", 101);
    }
    SUBCASE("zero queue_size") {
        params.emplace_back("queue_size", 0);
    }

    CHECK_THROWS_AS(std::make_shared<ObbDetectorNode>(optionsWith(params)), std::invalid_argument);
    checkNoEndpoints();
}

int main(int argc, char **argv) {
    rclcpp::init(argc, argv);
    doctest::Context context(argc, argv);
    const int rc = context.run();
    rclcpp::shutdown();
    return rc;
}
