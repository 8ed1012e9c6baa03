#pragma once

#include <string>

#include "obb_perception/model_bootstrap.hpp"

namespace obb_perception {

    // Runs ONNX Runtime's basic graph optimizations (constant folding,
    // redundant node elimination) over the source ONNX model and serializes
    // the optimized graph. The output keeps to standard ONNX operators, so
    // OpenCV DNN can read it.
    class OrtModelExporter : public ModelExporter {
    public:
        void exportModel(const std::string &source_path, const std::string &artifact_path) override;
    };

} // namespace obb_perception
