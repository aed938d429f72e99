#pragma once

#include <stdexcept>
#include <string>

namespace mailfwd::delivery {

class DeliveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DnsResolutionError : public DeliveryError {
public:
    DnsResolutionError(const std::string& domain, const std::string& message, bool nxdomain)
        : DeliveryError(message)
        , domain_(domain)
        , nxdomain_(nxdomain) {
    }

    const std::string& domain() const { return domain_; }
    // NXDOMAIN is final; anything else may succeed on a later attempt.
    bool is_nxdomain() const { return nxdomain_; }

private:
    std::string domain_;
    bool nxdomain_;
};

class SmtpError : public DeliveryError {
public:
    SmtpError(int code, const std::string& message)
        : DeliveryError(message)
        , code_(code) {
    }

    // 0 when the failure was not an SMTP reply (timeout, connection loss).
    int code() const { return code_; }

private:
    int code_;
};

class PermanentSmtpError : public SmtpError {
public:
    PermanentSmtpError(int code, const std::string& message, bool recipient_refused = false)
        : SmtpError(code, message)
        , recipient_refused_(recipient_refused) {
    }

    bool recipient_refused() const { return recipient_refused_; }

private:
    bool recipient_refused_;
};

class TemporarySmtpError : public SmtpError {
public:
    using SmtpError::SmtpError;
};

class QueueFullError : public DeliveryError {
public:
    explicit QueueFullError(size_t capacity)
        : DeliveryError("Relay queue is full (capacity " + std::to_string(capacity) + ")")
        , capacity_(capacity) {
    }

    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
};

class SigningError : public DeliveryError {
public:
    using DeliveryError::DeliveryError;
};

}  // namespace mailfwd::delivery
