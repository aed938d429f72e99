#pragma once

#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace mailfwd::smtp {

class SMTPSession;

enum class CommandType {
    HELO,
    EHLO,
    MAIL,      // MAIL FROM:
    RCPT,      // RCPT TO:
    DATA,
    RSET,
    NOOP,
    QUIT,
    VRFY,
    STARTTLS,
    HELP,
    UNKNOWN
};

struct Command {
    CommandType type = CommandType::UNKNOWN;
    std::string name;
    std::string argument;  // everything after the verb (or after "FROM:"/"TO:")

    static Command parse(const std::string& line);
    static CommandType string_to_type(const std::string& name);
    static std::string type_to_string(CommandType type);
};

// Runs one command against the session. Returns the reply line, or an
// empty string when the handler already wrote its own reply.
std::string execute(SMTPSession& session, const Command& cmd);

namespace reply {
    constexpr int HELP = 214;
    constexpr int SERVICE_READY = 220;
    constexpr int SERVICE_CLOSING = 221;
    constexpr int OK = 250;
    constexpr int CANNOT_VRFY = 252;

    constexpr int START_MAIL_INPUT = 354;

    constexpr int SERVICE_NOT_AVAILABLE = 421;
    constexpr int LOCAL_ERROR = 451;
    constexpr int INSUFFICIENT_STORAGE = 452;

    constexpr int SYNTAX_ERROR = 500;
    constexpr int SYNTAX_ERROR_PARAMS = 501;
    constexpr int COMMAND_NOT_IMPLEMENTED = 502;
    constexpr int BAD_SEQUENCE = 503;
    constexpr int PARAM_NOT_IMPLEMENTED = 504;
    constexpr int MAILBOX_NOT_FOUND = 550;
    constexpr int EXCEEDED_STORAGE = 552;

    std::string make(int code, const std::string& text);
    // "250-a\r\n250-b\r\n250 c"; the caller appends the final CRLF.
    std::string make_multi(int code, const std::vector<std::string>& lines);
}

// Address in a MAIL/RCPT argument, with or without angle brackets.
// The null sender "<>" parses to an empty address.
struct EmailAddress {
    std::string local_part;
    std::string domain;
    std::string full_address;

    bool is_null() const { return full_address.empty(); }

    static std::optional<EmailAddress> parse(const std::string& str);
    std::string to_string() const { return local_part + "@" + domain; }
};

// ESMTP keywords trailing the path, e.g. "SIZE=1024 BODY=8BITMIME".
// Keywords are upper-cased; a keyword without '=' maps to an empty value.
struct MailParameters {
    std::unordered_map<std::string, std::string> values;

    std::optional<std::string> get(const std::string& keyword) const;

    // nullopt for a malformed list (e.g. "=x").
    static std::optional<MailParameters> parse(const std::string& argument);
};

}  // namespace mailfwd::smtp
