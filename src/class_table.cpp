#include "obb_perception/class_table.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace obp = obb_perception;

obp::ClassTable::ClassTable(std::vector<std::string> names) : names_(std::move(names)) {}

obp::ClassTable obp::ClassTable::load(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open class names file: " + path);
    }

    std::vector<std::string> names;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) names.push_back(line);
    }
    if (names.empty()) {
        throw std::runtime_error("Class names file is empty: " + path);
    }
    return ClassTable(std::move(names));
}

obp::ClassTable obp::ClassTable::dota() {
    return ClassTable({"plane",        "ship",          "storage tank",       "baseball diamond",
                       "tennis court", "basketball court", "ground track field", "harbor",
                       "bridge",       "large vehicle", "small vehicle",      "helicopter",
                       "roundabout",   "soccer ball field", "swimming pool"});
}

std::string obp::ClassTable::name(int class_id) const {
    if (class_id < 0 || class_id >= static_cast<int>(names_.size())) {
        return "unknown";
    }
    return names_[static_cast<size_t>(class_id)];
}
