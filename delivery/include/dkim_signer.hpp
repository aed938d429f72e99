#pragma once

#include <memory>
#include <string>

#include "storage/store.hpp"

struct dkim_lib;

namespace mailfwd::delivery {

struct SignedMessage {
    std::string data;
    bool dkim_signed = false;
};

// Signs outbound mail with the sending domain's stored key. Never blocks a
// send: missing keys and signing failures yield the message unchanged.
class DkimSigner {
public:
    explicit DkimSigner(std::shared_ptr<Store> store, std::string default_selector = "mailfwd");
    ~DkimSigner();

    DkimSigner(const DkimSigner&) = delete;
    DkimSigner& operator=(const DkimSigner&) = delete;

    SignedMessage sign(const std::string& message, const std::string& mail_from);

    static constexpr const char* kSignedHeaders[] = {
        "from", "to", "subject", "date", "message-id", "content-type", nullptr
    };

private:
    // Returns the DKIM-Signature header value; throws SigningError.
    std::string compute_signature(const std::string& message, const std::string& private_key,
                                  const std::string& selector, const std::string& domain);

    std::shared_ptr<Store> store_;
    std::string default_selector_;
    dkim_lib* lib_ = nullptr;
};

}  // namespace mailfwd::delivery
