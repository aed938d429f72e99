#include "notifier.hpp"
#include "logger.hpp"

namespace mailfwd::smtp {

void LogNotifier::forwarding_failed(const FailureNotice& notice) {
    LOG_WARNING_FMT("Notify user {}: forwarding for {} failed (from {}, subject '{}'): {}",
                    notice.user_id, notice.alias, notice.sender, notice.subject, notice.error);
}

}  // namespace mailfwd::smtp
