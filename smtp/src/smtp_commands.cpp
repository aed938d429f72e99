#include "smtp_commands.hpp"
#include "smtp_session.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace mailfwd::smtp {

namespace {

constexpr std::string_view kBlank = " \t";

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string strip(std::string_view s) {
    auto first = s.find_first_not_of(kBlank);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(kBlank);
    return std::string(s.substr(first, last - first + 1));
}

// Offset just past the reverse/forward path in a MAIL/RCPT argument.
size_t path_end(const std::string& argument) {
    if (!argument.empty() && argument.front() == '<') {
        auto close = argument.find('>');
        return close == std::string::npos ? argument.size() : close + 1;
    }
    auto space = argument.find_first_of(kBlank);
    return space == std::string::npos ? argument.size() : space;
}

bool in_transaction_state(SessionState state) {
    return state == SessionState::GREETED || state == SessionState::MAIL ||
           state == SessionState::RCPT;
}

std::string greet(SMTPSession& session, const Command& cmd) {
    session.set_client_hostname(cmd.argument);
    session.set_state(SessionState::GREETED);
    session.envelope().clear();
    return session.hostname() + " greets " + cmd.argument;
}

std::string on_helo(SMTPSession& session, const Command& cmd) {
    if (cmd.argument.empty()) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "HELO requires a domain");
    }
    return reply::make(reply::OK, greet(session, cmd));
}

std::string on_ehlo(SMTPSession& session, const Command& cmd) {
    if (cmd.argument.empty()) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "EHLO requires a domain");
    }

    std::vector<std::string> lines{greet(session, cmd)};
    lines.push_back("SIZE " + std::to_string(session.max_message_size()));
    lines.push_back("8BITMIME");
    lines.push_back("PIPELINING");
    if (session.starttls_available()) {
        lines.push_back("STARTTLS");
    }
    return reply::make_multi(reply::OK, lines);
}

std::string on_mail(SMTPSession& session, const Command& cmd) {
    if (!in_transaction_state(session.state())) {
        return reply::make(reply::BAD_SEQUENCE, "Send HELO/EHLO first");
    }

    auto sender = EmailAddress::parse(cmd.argument);
    if (!sender) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Bad sender address syntax");
    }

    auto params = MailParameters::parse(cmd.argument);
    if (!params) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Bad MAIL parameters");
    }

    if (auto size = params->get("SIZE")) {
        size_t declared = 0;
        auto [end, ec] = std::from_chars(size->data(), size->data() + size->size(), declared);
        if (ec != std::errc() || end != size->data() + size->size()) {
            return reply::make(reply::SYNTAX_ERROR_PARAMS, "Bad SIZE value");
        }
        if (declared > session.max_message_size()) {
            return reply::make(reply::EXCEEDED_STORAGE, "Message size exceeds fixed maximum message size");
        }
    }

    if (auto body = params->get("BODY")) {
        auto type = upper(*body);
        if (type != "7BIT" && type != "8BITMIME") {
            return reply::make(reply::PARAM_NOT_IMPLEMENTED, "BODY type not supported");
        }
    }

    session.envelope().clear();
    session.envelope().mail_from = sender->full_address;
    session.set_state(SessionState::MAIL);
    return reply::make(reply::OK, "Sender OK");
}

std::string on_rcpt(SMTPSession& session, const Command& cmd) {
    if (session.state() != SessionState::MAIL && session.state() != SessionState::RCPT) {
        return reply::make(reply::BAD_SEQUENCE, "Need MAIL before RCPT");
    }

    if (session.envelope().rcpt_to.size() >= session.max_recipients()) {
        return reply::make(reply::INSUFFICIENT_STORAGE, "Too many recipients");
    }

    auto recipient = EmailAddress::parse(cmd.argument);
    if (!recipient || recipient->is_null()) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Bad recipient address syntax");
    }

    // Mail is only taken for hosted domains; anything else would be relaying.
    if (!session.handler().accepts_domain(recipient->domain)) {
        LOG_INFO_FMT("Refusing relay to {} from {}", recipient->full_address, session.remote_address());
        return reply::make(reply::MAILBOX_NOT_FOUND, "Relay access denied");
    }

    session.envelope().rcpt_to.push_back(recipient->full_address);
    session.set_state(SessionState::RCPT);
    return reply::make(reply::OK, "Recipient OK");
}

std::string on_data(SMTPSession& session, const Command&) {
    if (session.state() != SessionState::RCPT) {
        return reply::make(reply::BAD_SEQUENCE, "Need RCPT before DATA");
    }
    session.set_state(SessionState::DATA);
    return reply::make(reply::START_MAIL_INPUT, "End data with <CR><LF>.<CR><LF>");
}

std::string on_rset(SMTPSession& session, const Command&) {
    session.envelope().clear();
    if (session.state() != SessionState::CONNECTED) {
        session.set_state(SessionState::GREETED);
    }
    return reply::make(reply::OK, "Reset OK");
}

std::string on_quit(SMTPSession& session, const Command&) {
    session.set_state(SessionState::QUIT);
    return reply::make(reply::SERVICE_CLOSING, session.hostname() + " Bye");
}

std::string on_vrfy(SMTPSession&, const Command& cmd) {
    if (cmd.argument.empty()) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "VRFY requires an address");
    }
    // Aliases are never disclosed.
    return reply::make(reply::CANNOT_VRFY, "Cannot VRFY user, but will accept message and attempt delivery");
}

std::string on_starttls(SMTPSession& session, const Command&) {
    if (session.is_tls()) {
        return reply::make(reply::BAD_SEQUENCE, "TLS already active");
    }
    if (!session.starttls_available()) {
        return reply::make(reply::COMMAND_NOT_IMPLEMENTED, "STARTTLS not available");
    }

    session.send_line(reply::make(reply::SERVICE_READY, "Ready to start TLS"));
    session.start_tls(*session.ssl_context());

    // RFC 3207: the client greets again over the encrypted channel
    session.set_state(SessionState::CONNECTED);
    session.envelope().clear();
    return "";
}

std::string on_help(SMTPSession& session, const Command&) {
    return reply::make_multi(reply::HELP, {
        session.hostname() + " mail forwarder",
        "Commands: HELO EHLO MAIL RCPT DATA RSET NOOP QUIT VRFY STARTTLS HELP"});
}

}  // namespace

std::string reply::make(int code, const std::string& text) {
    return std::to_string(code) + " " + text;
}

std::string reply::make_multi(int code, const std::vector<std::string>& lines) {
    std::string out;
    auto prefix = std::to_string(code);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += "\r\n";
        out += prefix + (i + 1 == lines.size() ? " " : "-") + lines[i];
    }
    return out;
}

Command Command::parse(const std::string& line) {
    Command cmd;

    auto verb_end = line.find_first_of(" \t:");
    std::string verb = upper(line.substr(0, verb_end));
    size_t rest = verb_end == std::string::npos ? line.size() : verb_end;

    // "MAIL FROM:" and "RCPT TO:" carry a qualifier; RFC 5321 forbids the
    // space before the colon but many clients send one after it.
    if (verb == "MAIL" || verb == "RCPT") {
        auto colon = line.find(':', rest);
        if (colon != std::string::npos) {
            auto qualifier = upper(strip(std::string_view(line).substr(rest, colon - rest)));
            if ((verb == "MAIL" && qualifier == "FROM") || (verb == "RCPT" && qualifier == "TO")) {
                verb += " " + qualifier + ":";
                rest = colon + 1;
            }
        }
    }

    cmd.name = verb;
    cmd.type = string_to_type(verb);
    if (rest < line.size()) {
        cmd.argument = strip(std::string_view(line).substr(rest));
    }
    return cmd;
}

CommandType Command::string_to_type(const std::string& name) {
    static const std::unordered_map<std::string, CommandType> verbs = {
        {"HELO", CommandType::HELO},
        {"EHLO", CommandType::EHLO},
        {"MAIL FROM:", CommandType::MAIL},
        {"MAIL", CommandType::MAIL},
        {"RCPT TO:", CommandType::RCPT},
        {"RCPT", CommandType::RCPT},
        {"DATA", CommandType::DATA},
        {"RSET", CommandType::RSET},
        {"NOOP", CommandType::NOOP},
        {"QUIT", CommandType::QUIT},
        {"VRFY", CommandType::VRFY},
        {"STARTTLS", CommandType::STARTTLS},
        {"HELP", CommandType::HELP}
    };

    auto it = verbs.find(name);
    return it == verbs.end() ? CommandType::UNKNOWN : it->second;
}

std::string Command::type_to_string(CommandType type) {
    switch (type) {
        case CommandType::HELO:     return "HELO";
        case CommandType::EHLO:     return "EHLO";
        case CommandType::MAIL:     return "MAIL";
        case CommandType::RCPT:     return "RCPT";
        case CommandType::DATA:     return "DATA";
        case CommandType::RSET:     return "RSET";
        case CommandType::NOOP:     return "NOOP";
        case CommandType::QUIT:     return "QUIT";
        case CommandType::VRFY:     return "VRFY";
        case CommandType::STARTTLS: return "STARTTLS";
        case CommandType::HELP:     return "HELP";
        case CommandType::UNKNOWN:  break;
    }
    return "UNKNOWN";
}

std::string execute(SMTPSession& session, const Command& cmd) {
    switch (cmd.type) {
        case CommandType::HELO:     return on_helo(session, cmd);
        case CommandType::EHLO:     return on_ehlo(session, cmd);
        case CommandType::MAIL:     return on_mail(session, cmd);
        case CommandType::RCPT:     return on_rcpt(session, cmd);
        case CommandType::DATA:     return on_data(session, cmd);
        case CommandType::RSET:     return on_rset(session, cmd);
        case CommandType::NOOP:     return reply::make(reply::OK, "OK");
        case CommandType::QUIT:     return on_quit(session, cmd);
        case CommandType::VRFY:     return on_vrfy(session, cmd);
        case CommandType::STARTTLS: return on_starttls(session, cmd);
        case CommandType::HELP:     return on_help(session, cmd);
        case CommandType::UNKNOWN:  break;
    }
    return reply::make(reply::SYNTAX_ERROR, "Unrecognized command");
}

std::optional<EmailAddress> EmailAddress::parse(const std::string& str) {
    std::string path = strip(str);
    path = path.substr(0, path_end(path));

    if (!path.empty() && path.front() == '<') {
        if (path.back() != '>') {
            return std::nullopt;
        }
        path = strip(std::string_view(path).substr(1, path.size() - 2));
    } else if (path.find_first_of("<>") != std::string::npos) {
        return std::nullopt;
    }

    if (path.empty()) {
        return EmailAddress{};
    }

    auto at = path.rfind('@');
    if (at == std::string::npos || at == 0 || at + 1 == path.size()) {
        return std::nullopt;
    }

    EmailAddress addr;
    addr.local_part = path.substr(0, at);
    addr.domain = path.substr(at + 1);
    addr.full_address = path;
    return addr;
}

std::optional<std::string> MailParameters::get(const std::string& keyword) const {
    auto it = values.find(upper(keyword));
    if (it == values.end()) return std::nullopt;
    return it->second;
}

std::optional<MailParameters> MailParameters::parse(const std::string& argument) {
    MailParameters params;
    std::string trimmed = strip(argument);
    size_t pos = path_end(trimmed);

    while (pos < trimmed.size()) {
        auto start = trimmed.find_first_not_of(kBlank, pos);
        if (start == std::string::npos) break;
        auto end = trimmed.find_first_of(kBlank, start);
        std::string token = trimmed.substr(start, end == std::string::npos ? std::string::npos : end - start);
        pos = end == std::string::npos ? trimmed.size() : end;

        auto eq = token.find('=');
        std::string keyword = upper(token.substr(0, eq));
        if (keyword.empty()) {
            return std::nullopt;
        }
        params.values[keyword] = eq == std::string::npos ? "" : token.substr(eq + 1);
    }
    return params;
}

}  // namespace mailfwd::smtp
