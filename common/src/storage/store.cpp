#include "storage/store.hpp"
#include <format>

namespace mailfwd {

InvalidTransitionError::InvalidTransitionError(MessageStatus from, MessageStatus to)
    : StoreError(std::format("Invalid message status transition {} -> {}",
                             message_status_name(from), message_status_name(to)))
    , from_(from)
    , to_(to) {
}

}  // namespace mailfwd
