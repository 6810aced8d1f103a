/**
 * @file NotificationSink.hpp
 * @brief Short user-facing status messages
 */

#ifndef HEARTFIELD_APP_NOTIFICATION_SINK_HPP
#define HEARTFIELD_APP_NOTIFICATION_SINK_HPP

#include <cstdint>
#include <mutex>
#include <string>

namespace heartfield {
namespace app {

class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    /**
     * @brief Show a transient status message (displays hide it after ~2 s)
     */
    virtual void notify(const std::string& message) = 0;
};

/**
 * @brief Sends notifications to the log and remembers the latest one
 */
class LogNotificationSink : public INotificationSink {
public:
    void notify(const std::string& message) override;

    std::string lastMessage() const;
    uint64_t count() const;

private:
    mutable std::mutex mutex_;
    std::string last_message_;
    uint64_t count_ = 0;
};

} // namespace app
} // namespace heartfield

#endif // HEARTFIELD_APP_NOTIFICATION_SINK_HPP
