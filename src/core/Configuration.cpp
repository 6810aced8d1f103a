#include "heartfield/core/Configuration.hpp"
#include <sstream>

namespace heartfield {
namespace core {

bool Configuration::load(const std::string& filename) {
    try {
        YAML::Node node = YAML::LoadFile(filename);
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = node;
        filename_ = filename;
    } catch (const YAML::BadFile& e) {
        LOG_ERROR("Configuration: Cannot open " + filename + ": " + e.what());
        return false;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Configuration: Failed to parse " + filename + ": " + e.what());
        return false;
    }
    LOG_INFO("Configuration: Loaded " + filename);
    return true;
}

bool Configuration::loadFromString(const std::string& yaml) {
    try {
        YAML::Node node = YAML::Load(yaml);
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = node;
        filename_.clear();
    } catch (const YAML::Exception& e) {
        LOG_ERROR(std::string("Configuration: Failed to parse YAML: ") + e.what());
        return false;
    }
    return true;
}

bool Configuration::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        const YAML::Node node = find(key);
        return node.IsDefined();
    } catch (const YAML::Exception&) {
        return false;
    }
}

std::string Configuration::getFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filename_;
}

YAML::Node Configuration::find(const std::string& key) const {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }
    return descend(config_, parts, 0);
}

// Walks with fresh handles at each level; reassigning a YAML::Node would
// overwrite the referenced tree node instead of moving the handle.
YAML::Node Configuration::descend(const YAML::Node& node, const std::vector<std::string>& parts, size_t index) {
    if (index == parts.size()) {
        return node;
    }
    if (!node.IsMap()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    const YAML::Node child = node[parts[index]];
    if (!child) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    return descend(child, parts, index + 1);
}

} // namespace core
} // namespace heartfield
