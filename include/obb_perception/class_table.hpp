#pragma once

#include <string>
#include <vector>

namespace obb_perception {

    // Class id -> name lookup for a detection model.
    class ClassTable {
    public:
        ClassTable() = default;
        explicit ClassTable(std::vector<std::string> names);

        // One name per line; CR line endings and blank lines are ignored.
        // Throws std::runtime_error if the file is missing or has no names.
        static ClassTable load(const std::string &path);

        // The 15 DOTA-v1 classes that YOLO-OBB checkpoints are trained on.
        static ClassTable dota();

        // "unknown" for ids outside the table.
        std::string name(int class_id) const;

        size_t size() const { return names_.size(); }
        const std::vector<std::string> &names() const { return names_; }

    private:
        std::vector<std::string> names_;
    };

} // namespace obb_perception
