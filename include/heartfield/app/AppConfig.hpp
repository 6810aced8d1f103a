/**
 * @file AppConfig.hpp
 * @brief Typed view of the heartfield YAML configuration
 */

#ifndef HEARTFIELD_APP_APP_CONFIG_HPP
#define HEARTFIELD_APP_APP_CONFIG_HPP

#include <string>
#include "heartfield/core/Configuration.hpp"
#include "heartfield/gesture/GestureTypes.hpp"
#include "heartfield/particles/ParticleTypes.hpp"
#include "heartfield/particles/OpenCVPointRenderer.hpp"

namespace heartfield {
namespace app {

struct LoggingConfig {
    std::string level = "info";
    bool console = true;
    bool file = false;
    std::string directory = "logs";

    bool is_valid() const {
        core::LogLevel parsed;
        return core::parseLogLevel(level, parsed) && (!file || !directory.empty());
    }
};

struct AppConfig {
    gesture::GestureConfig gesture;
    particles::HeartShapeConfig heart;
    particles::StarfieldConfig starfield;
    particles::AnimationConfig animation;
    particles::OrientationConfig orientation;
    particles::PointRendererConfig renderer;
    LoggingConfig logging;
    double target_fps = 60.0;
};

/**
 * @brief Read every section, keeping defaults for missing keys
 *
 * @throws core::ConfigException (ERROR_CONFIG_INVALID) naming the first
 *         section whose values fail validation
 */
AppConfig loadAppConfig(const core::Configuration& config);

/**
 * @brief Apply a logging section to the global logger
 */
bool applyLoggingConfig(const LoggingConfig& logging);

} // namespace app
} // namespace heartfield

#endif // HEARTFIELD_APP_APP_CONFIG_HPP
