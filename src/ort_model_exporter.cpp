#include "obb_perception/ort_model_exporter.hpp"

#include <onnxruntime_cxx_api.h>

namespace obp = obb_perception;

void obp::OrtModelExporter::exportModel(const std::string &source_path, const std::string &artifact_path) {
    Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "obb_model_export");

    Ort::SessionOptions options;
    options.SetIntraOpNumThreads(1);
    options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_BASIC);
    options.SetOptimizedModelFilePath(artifact_path.c_str());

    // Creating the session runs the optimizer and writes the file
    Ort::Session session(env, source_path.c_str(), options);
}
