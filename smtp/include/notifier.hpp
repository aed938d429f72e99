#pragma once

#include <cstdint>
#include <string>

namespace mailfwd::smtp {

struct FailureNotice {
    int64_t user_id = 0;
    std::string alias;
    std::string sender;
    std::string subject;
    std::string error;
};

// Tells a domain owner that forwarding failed.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void forwarding_failed(const FailureNotice& notice) = 0;
};

class LogNotifier : public Notifier {
public:
    void forwarding_failed(const FailureNotice& notice) override;
};

}  // namespace mailfwd::smtp
