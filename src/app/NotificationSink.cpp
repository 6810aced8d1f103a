#include "heartfield/app/NotificationSink.hpp"
#include "heartfield/core/Logger.hpp"

namespace heartfield {
namespace app {

void LogNotificationSink::notify(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_message_ = message;
        ++count_;
    }
    LOG_INFO("[notify] " + message);
}

std::string LogNotificationSink::lastMessage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_message_;
}

uint64_t LogNotificationSink::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

} // namespace app
} // namespace heartfield
