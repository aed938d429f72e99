#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace mailfwd {

// RFC 5322 message split into an ordered header list and an opaque body.
// Header values keep their original folding so serialize() reproduces
// untouched headers byte for byte (modulo line endings, which become CRLF).
class MailMessage {
public:
    struct Header {
        std::string name;
        std::string raw_value;  // text after the colon, folds included

        std::string value() const;
    };

    MailMessage() = default;

    static MailMessage parse(std::string_view raw);

    std::optional<std::string> header(std::string_view name) const;
    std::vector<std::string> headers(std::string_view name) const;
    bool has_header(std::string_view name) const;

    void add_header(const std::string& name, const std::string& value);
    void prepend_header(const std::string& name, const std::string& value);
    // Replaces the first occurrence in place and drops the rest; appends if absent.
    void set_header(const std::string& name, const std::string& value);
    size_t remove_header(std::string_view name);

    const std::vector<Header>& header_list() const { return headers_; }
    const std::string& body() const { return body_; }
    void set_body(std::string body) { body_ = std::move(body); }

    std::string serialize() const;

    std::string subject() const;
    std::optional<std::string> message_id() const;
    bool has_attachments() const;

    // Byte length of the message as received; 0 for built messages.
    size_t raw_size() const { return raw_size_; }

    static std::string generate_message_id(std::string_view content, std::string_view hostname);

private:
    std::vector<Header> headers_;
    std::string body_;
    size_t raw_size_ = 0;
};

// Case-insensitive ASCII comparison used for header names and addresses.
bool iequals(std::string_view a, std::string_view b);
std::string to_lower_copy(std::string_view s);

}  // namespace mailfwd
