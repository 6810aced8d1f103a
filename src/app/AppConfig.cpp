/**
 * @file AppConfig.cpp
 * @brief Section readers for the heartfield configuration
 */

#include "heartfield/app/AppConfig.hpp"
#include "heartfield/core/exception.h"
#include "heartfield/core/Logger.hpp"

namespace heartfield {
namespace app {

namespace {

void require(bool valid, const std::string& section) {
    if (!valid) {
        HEARTFIELD_THROW_CODE(core::ConfigException, core::ResultCode::ERROR_CONFIG_INVALID,
                              "Invalid configuration section '" + section + "'");
    }
}

gesture::GestureConfig readGesture(const core::Configuration& c) {
    gesture::GestureConfig g;
    g.extension_threshold = c.get<float>("gesture.extension_threshold", g.extension_threshold);
    g.min_hand_size = c.get<float>("gesture.min_hand_size", g.min_hand_size);
    g.open_min_extended = c.get<int>("gesture.open_min_extended", g.open_min_extended);
    g.fist_max_extended = c.get<int>("gesture.fist_max_extended", g.fist_max_extended);
    g.debounce_frames = c.get<int>("gesture.debounce_frames", g.debounce_frames);
    g.min_detection_confidence = c.get<float>("gesture.min_detection_confidence", g.min_detection_confidence);
    return g;
}

particles::HeartShapeConfig readHeart(const core::Configuration& c) {
    particles::HeartShapeConfig h;
    h.size = c.get<float>("heart.size", h.size);
    h.scale_x = c.get<float>("heart.scale_x", h.scale_x);
    h.scale_y = c.get<float>("heart.scale_y", h.scale_y);
    h.scale_z = c.get<float>("heart.scale_z", h.scale_z);
    h.surface_ratio = c.get<float>("heart.surface_ratio", h.surface_ratio);
    h.surface_noise = c.get<float>("heart.surface_noise", h.surface_noise);
    h.depth_factor = c.get<float>("heart.depth_factor", h.depth_factor);
    h.interior_fill_max = c.get<float>("heart.interior_fill_max", h.interior_fill_max);
    h.interior_fill_exponent = c.get<float>("heart.interior_fill_exponent", h.interior_fill_exponent);
    h.interior_depth_factor = c.get<float>("heart.interior_depth_factor", h.interior_depth_factor);
    h.center_void_radius = c.get<float>("heart.center_void_radius", h.center_void_radius);
    h.center_void_leak_probability = c.get<float>("heart.center_void_leak_probability",
                                                  h.center_void_leak_probability);
    return h;
}

particles::AnimationConfig readAnimation(const core::Configuration& c) {
    particles::AnimationConfig a;
    const long long count = c.get<long long>("animation.particle_count",
                                             static_cast<long long>(a.particle_count));
    a.particle_count = count > 0 ? static_cast<size_t>(count) : 0;
    a.easing = c.get<float>("animation.easing", a.easing);
    a.rotation_easing = c.get<float>("animation.rotation_easing", a.rotation_easing);
    a.heartbeat_amplitude = c.get<float>("animation.heartbeat_amplitude", a.heartbeat_amplitude);
    a.heartbeat_speed = c.get<float>("animation.heartbeat_speed", a.heartbeat_speed);
    a.time_step = c.get<float>("animation.time_step", a.time_step);

    const std::string mode = c.get<std::string>("animation.initial_mode", particles::mode_to_string(a.initial_mode));
    if (!particles::parse_mode(mode, a.initial_mode)) {
        HEARTFIELD_THROW_CODE(core::ConfigException, core::ResultCode::ERROR_CONFIG_INVALID,
                              "Unknown animation.initial_mode '" + mode + "'");
    }
    return a;
}

particles::PointRendererConfig readRenderer(const core::Configuration& c) {
    particles::PointRendererConfig r;
    r.image_size.width = c.get<int>("renderer.width", r.image_size.width);
    r.image_size.height = c.get<int>("renderer.height", r.image_size.height);
    r.field_of_view_deg = c.get<float>("renderer.field_of_view_deg", r.field_of_view_deg);
    r.camera_distance = c.get<float>("renderer.camera_distance", r.camera_distance);
    r.pixel_ratio = c.get<float>("renderer.pixel_ratio", r.pixel_ratio);
    return r;
}

} // namespace

AppConfig loadAppConfig(const core::Configuration& config) {
    AppConfig app;

    app.gesture = readGesture(config);
    require(app.gesture.is_valid(), "gesture");

    app.heart = readHeart(config);
    require(app.heart.is_valid(), "heart");

    app.starfield.radius = config.get<float>("starfield.radius", app.starfield.radius);
    require(app.starfield.is_valid(), "starfield");

    app.animation = readAnimation(config);
    require(app.animation.is_valid(), "animation");

    app.orientation.sensitivity = config.get<float>("orientation.sensitivity", app.orientation.sensitivity);
    app.orientation.pitch_limit = config.get<float>("orientation.pitch_limit", app.orientation.pitch_limit);
    require(app.orientation.is_valid(), "orientation");

    app.renderer = readRenderer(config);
    require(app.renderer.is_valid(), "renderer");

    app.logging.level = config.get<std::string>("logging.level", app.logging.level);
    app.logging.console = config.get<bool>("logging.console", app.logging.console);
    app.logging.file = config.get<bool>("logging.file", app.logging.file);
    app.logging.directory = config.get<std::string>("logging.directory", app.logging.directory);
    require(app.logging.is_valid(), "logging");

    app.target_fps = config.get<double>("display.target_fps", app.target_fps);
    require(app.target_fps >= 0.0, "display");

    return app;
}

bool applyLoggingConfig(const LoggingConfig& logging) {
    core::LogLevel level = core::LogLevel::INFO;
    if (!core::parseLogLevel(logging.level, level)) {
        LOG_WARNING("Unknown log level '" + logging.level + "', keeping INFO");
    }

    core::Logger& logger = core::Logger::getInstance();
    logger.configure(level, logging.console);
    if (logging.file) {
        return logger.openSessionFile(logging.directory);
    }
    logger.closeLogFile();
    return true;
}

} // namespace app
} // namespace heartfield
