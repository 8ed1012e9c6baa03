#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include <rclcpp/logger.hpp>

namespace obb_perception {

    // Fatal, init-time failure: the node must not start serving.
    class ModelBootstrapError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // One-time conversion of a source model into the optimized artifact the
    // detector loads. May be slow.
    class ModelExporter {
    public:
        virtual ~ModelExporter() = default;
        virtual void exportModel(const std::string &source_path, const std::string &artifact_path) = 0;
    };

    struct ModelPaths {
        std::string source_model_path;   // e.g. yolo11n-obb.onnx
        std::string artifact_model_path; // optimized model written by the exporter
    };

    // Makes sure the artifact exists, exporting it from the source model if
    // needed, and returns its path. Throws ModelBootstrapError when neither
    // file is available or the export fails.
    std::string resolveModelArtifact(const ModelPaths &paths, ModelExporter &exporter,
                                     const rclcpp::Logger &logger);

} // namespace obb_perception
