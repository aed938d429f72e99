#include "dkim_signer.hpp"
#include "delivery_errors.hpp"
#include "mail_message.hpp"
#include "logger.hpp"

#include <cstring>

#include <stdbool.h>
#include <opendkim/dkim.h>

namespace mailfwd::delivery {

namespace {

constexpr const char* kSignatureHeader = "DKIM-Signature";

std::string domain_of(const std::string& address) {
    auto at = address.rfind('@');
    if (at == std::string::npos || at + 1 >= address.size()) {
        return "";
    }
    std::string domain = address.substr(at + 1);
    if (!domain.empty() && domain.back() == '>') {
        domain.pop_back();
    }
    return to_lower_copy(domain);
}

std::string to_crlf(const std::string& text) {
    std::string out;
    out.reserve(text.size() + text.size() / 32);
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n' && (i == 0 || text[i - 1] != '\r')) {
            out += '\r';
        }
        out += text[i];
    }
    return out;
}

struct DkimHandleDeleter {
    void operator()(DKIM* dkim) const {
        dkim_free(dkim);
    }
};

}  // namespace

DkimSigner::DkimSigner(std::shared_ptr<Store> store, std::string default_selector)
    : store_(std::move(store))
    , default_selector_(std::move(default_selector)) {
    lib_ = dkim_init(nullptr, nullptr);
    if (!lib_) {
        LOG_ERROR("OpenDKIM initialization failed, outbound mail will not be signed");
        return;
    }

    // SIGNHDRS takes the NULL-terminated array itself and expects sizeof(char**)
    if (dkim_options(lib_, DKIM_OP_SETOPT, DKIM_OPTS_SIGNHDRS,
                     const_cast<char**>(kSignedHeaders), sizeof(char**)) != DKIM_STAT_OK) {
        LOG_ERROR("Could not restrict the DKIM signed header list, outbound mail will not be signed");
        dkim_close(lib_);
        lib_ = nullptr;
    }
}

DkimSigner::~DkimSigner() {
    if (lib_) {
        dkim_close(lib_);
    }
}

SignedMessage DkimSigner::sign(const std::string& message, const std::string& mail_from) {
    SignedMessage unsigned_message{message, false};

    auto domain = domain_of(mail_from);
    if (domain.empty()) {
        LOG_DEBUG_FMT("No sending domain in '{}', not signing", mail_from);
        return unsigned_message;
    }

    std::optional<Domain> record;
    try {
        record = store_->find_domain(domain);
    } catch (const StoreError& e) {
        LOG_WARNING_FMT("DKIM key lookup for {} failed: {}", domain, e.what());
        return unsigned_message;
    }

    if (!record || !record->dkim_private_key || record->dkim_private_key->empty()) {
        LOG_DEBUG_FMT("No DKIM key for {}, sending unsigned", domain);
        return unsigned_message;
    }

    const std::string& selector = record->dkim_selector.empty()
        ? default_selector_ : record->dkim_selector;

    try {
        auto signature = compute_signature(message, *record->dkim_private_key, selector, domain);
        LOG_INFO_FMT("DKIM signed message for {} (selector {})", domain, selector);
        return {std::string(kSignatureHeader) + ": " + signature + "\r\n" + message, true};
    } catch (const SigningError& e) {
        LOG_WARNING_FMT("DKIM signing for {} failed, sending unsigned: {}", domain, e.what());
        return unsigned_message;
    }
}

std::string DkimSigner::compute_signature(const std::string& message, const std::string& private_key,
                                          const std::string& selector, const std::string& domain) {
    if (!lib_) {
        throw SigningError("OpenDKIM is not initialized");
    }

    DKIM_STAT status = DKIM_STAT_OK;
    std::unique_ptr<DKIM, DkimHandleDeleter> dkim(dkim_sign(
        lib_,
        reinterpret_cast<const unsigned char*>("mailfwd"),
        nullptr,
        reinterpret_cast<dkim_sigkey_t>(const_cast<char*>(private_key.c_str())),
        reinterpret_cast<const unsigned char*>(selector.c_str()),
        reinterpret_cast<const unsigned char*>(domain.c_str()),
        DKIM_CANON_RELAXED,
        DKIM_CANON_RELAXED,
        DKIM_SIGN_RSASHA256,
        -1,
        &status));

    if (!dkim || status != DKIM_STAT_OK) {
        throw SigningError("dkim_sign failed with status " + std::to_string(status));
    }

    auto check = [&](DKIM_STAT st, const char* stage) {
        if (st != DKIM_STAT_OK) {
            const char* detail = dkim_geterror(dkim.get());
            throw SigningError(std::string(stage) + " failed: " +
                               (detail ? detail : std::to_string(st)));
        }
    };

    auto parsed = MailMessage::parse(message);
    for (const auto& header : parsed.header_list()) {
        std::string line = header.name + ":" + header.raw_value;
        check(dkim_header(dkim.get(), reinterpret_cast<unsigned char*>(line.data()), line.size()),
              "dkim_header");
    }
    check(dkim_eoh(dkim.get()), "dkim_eoh");

    std::string body = to_crlf(parsed.body());
    if (!body.empty()) {
        check(dkim_body(dkim.get(), reinterpret_cast<unsigned char*>(body.data()), body.size()),
              "dkim_body");
    }
    check(dkim_eom(dkim.get(), nullptr), "dkim_eom");

    unsigned char* header = nullptr;
    size_t length = 0;
    check(dkim_getsighdr_d(dkim.get(), std::strlen(kSignatureHeader) + 2, &header, &length),
          "dkim_getsighdr_d");
    if (!header || length == 0) {
        throw SigningError("empty DKIM signature");
    }

    // folded continuation lines must be CRLF on the wire
    return to_crlf(std::string(reinterpret_cast<const char*>(header), length));
}

}  // namespace mailfwd::delivery
