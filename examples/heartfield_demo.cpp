/**
 * @file heartfield_demo.cpp
 * @brief Headless/windowed demo of the gesture driven particle heart
 *
 * Drives the animation engine from a scripted synthetic hand (open, fist,
 * open again with a moving palm) and renders the cloud with the OpenCV point
 * renderer. With --no-hand the tracking source refuses to open and the demo
 * exercises the pointer fallback instead.
 *
 * @copyright 2026 Heartfield Project
 * @license MIT License
 */

#include <heartfield/app/AppConfig.hpp>
#include <heartfield/app/InteractionController.hpp>
#include <heartfield/app/NotificationSink.hpp>
#include <heartfield/core/Configuration.hpp>
#include <heartfield/core/Logger.hpp>
#include <heartfield/core/TickScheduler.hpp>
#include <heartfield/core/exception.h>
#include <heartfield/gesture/HandTrackingSession.hpp>
#include <heartfield/gesture/SyntheticHandSource.hpp>
#include <heartfield/particles/AnimationEngine.hpp>
#include <heartfield/particles/OpenCVPointRenderer.hpp>
#include <opencv2/core.hpp>
#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <system_error>

using namespace heartfield;

// Global flag for CTRL+C handling
static volatile bool running = true;

void signal_handler(int signal) {
    if (signal == SIGINT) {
        std::cout << "\n\nReceived SIGINT, shutting down..." << std::endl;
        running = false;
    }
}

/**
 * @brief Overlay mode, gesture and frame counters
 */
void draw_hud(cv::Mat& frame, const particles::AnimationEngine& engine,
              const gesture::HandTrackingSession& session, const std::string& notification) {
    const cv::Scalar color(230, 200, 255);
    const std::string mode_line = "Mode: " + particles::mode_to_string(engine.getMode()) +
                                  "   Gesture: " + gesture::confirmed_state_to_string(session.currentState()) +
                                  "   Frame: " + std::to_string(engine.frameCount());
    cv::putText(frame, mode_line, cv::Point(16, 28), cv::FONT_HERSHEY_SIMPLEX, 0.6, color, 1, cv::LINE_AA);
    if (!notification.empty()) {
        cv::putText(frame, notification, cv::Point(16, frame.rows - 20),
                    cv::FONT_HERSHEY_SIMPLEX, 0.7, color, 1, cv::LINE_AA);
    }
}

// Whole-string unsigned parse; rejects signs, blanks and trailing text
bool parseCount(const std::string& text, uint64_t& value) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto result = std::from_chars(first, last, value);
    return !text.empty() && result.ec == std::errc() && result.ptr == last;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);

    std::string config_file = "config/heartfield.yaml";
    std::string snapshot_dir;
    uint64_t max_frames = 600;
    int snapshot_every = 60;
    bool display = false;
    bool no_hand = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) {
                config_file = argv[++i];
            }
        } else if (arg == "--frames" || arg == "-n") {
            if (i + 1 < argc) {
                if (!parseCount(argv[++i], max_frames)) {
                    std::cerr << "ERROR: --frames expects a non-negative integer, got '" << argv[i] << "'" << std::endl;
                    return 1;
                }
            }
        } else if (arg == "--display" || arg == "-d") {
            display = true;
        } else if (arg == "--snapshot" || arg == "-s") {
            if (i + 1 < argc) {
                snapshot_dir = argv[++i];
            }
        } else if (arg == "--snapshot-every") {
            if (i + 1 < argc) {
                uint64_t every = 0;
                if (!parseCount(argv[++i], every) || every == 0) {
                    std::cerr << "ERROR: --snapshot-every expects a positive integer, got '" << argv[i] << "'" << std::endl;
                    return 1;
                }
                snapshot_every = static_cast<int>(std::min<uint64_t>(every, 1000000));
            }
        } else if (arg == "--no-hand") {
            no_hand = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [options]" << std::endl;
            std::cout << "Options:" << std::endl;
            std::cout << "  --config, -c <file>      YAML configuration (default: config/heartfield.yaml)" << std::endl;
            std::cout << "  --frames, -n <count>     Frames to run, 0 = until CTRL+C (default: 600)" << std::endl;
            std::cout << "  --display, -d            Show frames in a window" << std::endl;
            std::cout << "  --snapshot, -s <dir>     Write PNG snapshots to <dir>" << std::endl;
            std::cout << "  --snapshot-every <n>     Snapshot interval in frames (default: 60)" << std::endl;
            std::cout << "  --no-hand                Simulate unavailable hand tracking" << std::endl;
            std::cout << "  --help, -h               Show this help message" << std::endl;
            return 0;
        }
    }

    core::Configuration& configuration = core::Configuration::getInstance();
    if (!configuration.load(config_file)) {
        std::cerr << "WARNING: Could not load " << config_file << ", using defaults" << std::endl;
    }

    app::AppConfig app_config;
    try {
        app_config = app::loadAppConfig(configuration);
    } catch (const core::Exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    app::applyLoggingConfig(app_config.logging);

    std::cout << "\n";
    std::cout << "=========================================" << std::endl;
    std::cout << "   HEARTFIELD PARTICLE DEMO" << std::endl;
    std::cout << "=========================================" << std::endl;
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Particles:        " << app_config.animation.particle_count << std::endl;
    std::cout << "  Frames:           " << (max_frames == 0 ? std::string("unlimited") : std::to_string(max_frames)) << std::endl;
    std::cout << "  Display:          " << (display ? "Enabled" : "Disabled") << std::endl;
    std::cout << "  Snapshots:        " << (snapshot_dir.empty() ? std::string("Disabled") : snapshot_dir) << std::endl;
    std::cout << "  Hand tracking:    " << (no_hand ? "Unavailable (pointer fallback)" : "Synthetic script") << std::endl;
    std::cout << "=========================================" << std::endl;
    std::cout << "\nPress CTRL+C to stop\n" << std::endl;

    try {
        if (!snapshot_dir.empty()) {
            std::filesystem::create_directories(snapshot_dir);
        }

        // 1. Animation engine and renderer
        const auto build_start = std::chrono::steady_clock::now();
        particles::AnimationEngine engine(app_config.animation, app_config.heart,
                                          app_config.starfield, app_config.orientation);
        auto renderer = std::make_shared<particles::OpenCVPointRenderer>(app_config.renderer);
        engine.setRenderer(renderer);
        const double build_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - build_start).count();
        std::cout << "Engine ready in " << std::fixed << std::setprecision(1) << build_ms << " ms" << std::endl;

        // 2. Hand tracking with scripted input
        auto source = std::make_shared<gesture::SyntheticHandSource>(
            gesture::SyntheticHandSource::demoScript(), true);
        source->setAvailable(!no_hand);
        gesture::HandTrackingSession session(source, app_config.gesture);

        auto notifications = std::make_shared<app::LogNotificationSink>();
        app::InteractionController controller(engine, notifications);
        controller.startTracking(session, app_config.renderer.image_size);

        if (display) {
            cv::namedWindow("Heartfield", cv::WINDOW_AUTOSIZE);
        }

        // 3. Main loop
        core::TickScheduler scheduler(app_config.target_fps);
        const cv::Point2f center(app_config.renderer.image_size.width * 0.5f,
                                 app_config.renderer.image_size.height * 0.5f);

        auto step = [&]() -> bool {
            if (!running) {
                return false;
            }

            const uint64_t frame = engine.frameCount();
            if (session.isRunning()) {
                session.processFrame();
            } else if (controller.fallbackEnabled()) {
                // Scripted pointer: a click every 240 frames, a slow drag in between
                if (frame % 240 == 0) {
                    controller.pointerDown(center.x, center.y);
                    controller.pointerUp(center.x + 1.0f, center.y);
                } else if (frame % 240 == 120) {
                    controller.pointerDown(center.x, center.y);
                    controller.pointerMove(center.x + 40.0f, center.y - 20.0f);
                    controller.pointerUp(center.x + 40.0f, center.y - 20.0f);
                }
            }

            if (!engine.tick()) {
                return false;
            }

            if (display || !snapshot_dir.empty()) {
                cv::Mat view = renderer->image().clone();
                draw_hud(view, engine, session, notifications->lastMessage());

                if (!snapshot_dir.empty() && frame % static_cast<uint64_t>(snapshot_every) == 0) {
                    char name[32];
                    std::snprintf(name, sizeof(name), "frame_%05llu.png", static_cast<unsigned long long>(frame));
                    const std::string path = snapshot_dir + "/" + name;
                    if (!cv::imwrite(path, view)) {
                        LOG_WARNING("Failed to write snapshot " + path);
                    }
                }

                if (display) {
                    cv::imshow("Heartfield", view);
                    const int key = cv::waitKey(1);
                    if (key == 27 || key == 'q') {
                        return false;
                    }
                    if (key == ' ') {
                        // Space behaves like a click at the center
                        controller.enableFallback(app_config.renderer.image_size);
                        controller.pointerDown(center.x, center.y);
                        controller.pointerUp(center.x, center.y);
                    }
                }
            }
            return true;
        };

        const auto loop_start = std::chrono::steady_clock::now();
        const uint64_t frames = scheduler.run(step, max_frames);
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - loop_start).count();

        session.stop();
        engine.stop();
        if (display) {
            cv::destroyAllWindows();
        }

        std::cout << "\n";
        std::cout << "=======================================" << std::endl;
        std::cout << "           RUNTIME STATISTICS          " << std::endl;
        std::cout << "=======================================" << std::endl;
        std::cout << "Session duration:     " << std::fixed << std::setprecision(1) << elapsed << " seconds" << std::endl;
        std::cout << "Frames rendered:      " << frames << std::endl;
        std::cout << "Average FPS:          " << std::setprecision(1)
                  << (elapsed > 0.0 ? static_cast<double>(frames) / elapsed : 0.0) << std::endl;
        std::cout << "Avg tick time:        " << std::setprecision(2) << scheduler.averageStepMs() << " ms" << std::endl;
        std::cout << "Hand frames:          " << session.framesWithHand() << "/" << session.framesProcessed() << std::endl;
        std::cout << "Mode switches:        " << controller.modeSwitches() << std::endl;
        std::cout << "Final mode:           " << particles::mode_to_string(engine.getMode()) << std::endl;
        std::cout << "Warnings / errors:    " << core::Logger::getInstance().messageCount(core::LogLevel::WARNING)
                  << " / " << core::Logger::getInstance().messageCount(core::LogLevel::ERROR) << std::endl;
        if (!core::Logger::getInstance().getCurrentLogFile().empty()) {
            std::cout << "Log file:             " << core::Logger::getInstance().getCurrentLogFile() << std::endl;
        }
        std::cout << "=======================================" << std::endl;

    } catch (const core::Exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
