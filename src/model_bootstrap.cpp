#include "obb_perception/model_bootstrap.hpp"

#include <filesystem>
#include <system_error>

#include <rclcpp/logging.hpp>

namespace obp = obb_perception;
namespace fs = std::filesystem;

namespace {

    bool isRegularFile(const std::string &path) {
        std::error_code ec;
        return !path.empty() && fs::is_regular_file(path, ec);
    }

} // namespace

std::string obp::resolveModelArtifact(const ModelPaths &paths, ModelExporter &exporter,
                                      const rclcpp::Logger &logger) {
    if (isRegularFile(paths.artifact_model_path)) {
        RCLCPP_INFO(logger, "Using optimized model %s", paths.artifact_model_path.c_str());
        return paths.artifact_model_path;
    }

    if (paths.artifact_model_path.empty()) {
        RCLCPP_FATAL(logger, "Parameter 'engine_model_path' is empty.");
        throw ModelBootstrapError("engine_model_path is not set");
    }

    RCLCPP_WARN(logger, "Optimized model not found at %s. Exporting from source model...",
                paths.artifact_model_path.c_str());

    if (!isRegularFile(paths.source_model_path)) {
        RCLCPP_FATAL(logger, "Source model not found at '%s'. Cannot create optimized model.",
                     paths.source_model_path.c_str());
        throw ModelBootstrapError("no model available: neither '" + paths.artifact_model_path +
                                  "' nor '" + paths.source_model_path + "' exists");
    }

    RCLCPP_INFO(logger, "Exporting %s -> %s", paths.source_model_path.c_str(),
                paths.artifact_model_path.c_str());
    try {
        const fs::path parent = fs::path(paths.artifact_model_path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        exporter.exportModel(paths.source_model_path, paths.artifact_model_path);
    } catch (const std::exception &e) {
        RCLCPP_FATAL(logger, "Model export failed: %s", e.what());
        throw ModelBootstrapError(std::string("model export failed: ") + e.what());
    }

    if (!isRegularFile(paths.artifact_model_path)) {
        RCLCPP_FATAL(logger, "Export finished but %s was not written.", paths.artifact_model_path.c_str());
        throw ModelBootstrapError("export did not produce " + paths.artifact_model_path);
    }

    RCLCPP_INFO(logger, "Export complete. Optimized model saved to %s", paths.artifact_model_path.c_str());
    return paths.artifact_model_path;
}
