#pragma once

#include <yaml-cpp/yaml.h>
#include <mutex>
#include <string>
#include <vector>
#include "heartfield/core/Logger.hpp"

namespace heartfield {
namespace core {

/**
 * @brief YAML-backed configuration store
 *
 * Values are addressed with dotted keys ("animation.easing"). Lookups that
 * miss or fail to convert return the supplied default; conversion failures
 * are logged as warnings.
 */
class Configuration {
public:
    static Configuration& getInstance() {
        static Configuration instance;
        return instance;
    }

    Configuration() = default;

    /**
     * @brief Load a YAML file, replacing any previous content
     * @return false if the file is missing or malformed (content unchanged)
     */
    bool load(const std::string& filename);

    bool loadFromString(const std::string& yaml);

    bool has(const std::string& key) const;

    template<typename T>
    T get(const std::string& key, const T& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            const YAML::Node node = find(key);
            if (!node || node.IsNull()) {
                return defaultValue;
            }
            return node.as<T>();
        } catch (const YAML::Exception& e) {
            LOG_WARNING("Configuration: Invalid value for '" + key + "' (" + e.what() + "), using default");
            return defaultValue;
        }
    }

    std::string getFilename() const;

private:
    YAML::Node find(const std::string& key) const;

    static YAML::Node descend(const YAML::Node& node, const std::vector<std::string>& parts, size_t index);

    mutable std::mutex mutex_;
    YAML::Node config_;
    std::string filename_;
};

} // namespace core
} // namespace heartfield
