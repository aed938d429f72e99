#include "mail_message.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <functional>

namespace mailfwd {

namespace {

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(start, end - start + 1));
}

constexpr size_t kMaxSubjectLength = 500;

}  // namespace

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string to_lower_copy(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string MailMessage::Header::value() const {
    std::string unfolded;
    unfolded.reserve(raw_value.size());
    for (char c : raw_value) {
        if (c == '\r' || c == '\n') continue;
        unfolded += c;
    }
    return trim(unfolded);
}

MailMessage MailMessage::parse(std::string_view raw) {
    MailMessage msg;
    msg.raw_size_ = raw.size();

    size_t pos = 0;
    while (pos < raw.size()) {
        size_t eol = raw.find('\n', pos);
        size_t next = eol == std::string_view::npos ? raw.size() : eol + 1;
        std::string_view line = raw.substr(pos, (eol == std::string_view::npos ? raw.size() : eol) - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (line.empty()) {
            pos = next;
            break;
        }

        if ((line.front() == ' ' || line.front() == '\t') && !msg.headers_.empty()) {
            msg.headers_.back().raw_value += "\r\n";
            msg.headers_.back().raw_value += line;
            pos = next;
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            // Not a header: the rest is body
            break;
        }

        msg.headers_.push_back({std::string(line.substr(0, colon)),
                                std::string(line.substr(colon + 1))});
        pos = next;
    }

    if (pos < raw.size()) {
        msg.body_ = std::string(raw.substr(pos));
    }

    return msg;
}

std::optional<std::string> MailMessage::header(std::string_view name) const {
    for (const auto& h : headers_) {
        if (iequals(h.name, name)) {
            return h.value();
        }
    }
    return std::nullopt;
}

std::vector<std::string> MailMessage::headers(std::string_view name) const {
    std::vector<std::string> values;
    for (const auto& h : headers_) {
        if (iequals(h.name, name)) {
            values.push_back(h.value());
        }
    }
    return values;
}

bool MailMessage::has_header(std::string_view name) const {
    return std::any_of(headers_.begin(), headers_.end(),
                       [&](const Header& h) { return iequals(h.name, name); });
}

void MailMessage::add_header(const std::string& name, const std::string& value) {
    headers_.push_back({name, " " + value});
}

void MailMessage::prepend_header(const std::string& name, const std::string& value) {
    headers_.insert(headers_.begin(), Header{name, " " + value});
}

void MailMessage::set_header(const std::string& name, const std::string& value) {
    auto it = std::find_if(headers_.begin(), headers_.end(),
                           [&](const Header& h) { return iequals(h.name, name); });
    if (it == headers_.end()) {
        add_header(name, value);
        return;
    }

    it->raw_value = " " + value;
    auto first = it - headers_.begin();
    headers_.erase(std::remove_if(headers_.begin() + first + 1, headers_.end(),
                                  [&](const Header& h) { return iequals(h.name, name); }),
                   headers_.end());
}

size_t MailMessage::remove_header(std::string_view name) {
    auto before = headers_.size();
    headers_.erase(std::remove_if(headers_.begin(), headers_.end(),
                                  [&](const Header& h) { return iequals(h.name, name); }),
                   headers_.end());
    return before - headers_.size();
}

std::string MailMessage::serialize() const {
    std::string out;
    for (const auto& h : headers_) {
        out += h.name;
        out += ':';
        out += h.raw_value;
        out += "\r\n";
    }
    out += "\r\n";
    out += body_;
    return out;
}

std::string MailMessage::subject() const {
    auto value = header("Subject").value_or("");
    if (value.size() > kMaxSubjectLength) {
        // never cut inside a UTF-8 sequence
        size_t cut = kMaxSubjectLength;
        while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        value.resize(cut);
    }
    return value;
}

std::optional<std::string> MailMessage::message_id() const {
    auto id = header("Message-ID");
    if (!id || id->empty()) {
        return std::nullopt;
    }
    return id;
}

bool MailMessage::has_attachments() const {
    static constexpr std::string_view marker = "content-disposition:";

    auto scan = [](const std::string& text) {
        std::string lower = to_lower_copy(text);
        size_t pos = 0;
        while ((pos = lower.find(marker, pos)) != std::string::npos) {
            pos += marker.size();
            auto start = lower.find_first_not_of(" \t", pos);
            if (start != std::string::npos &&
                lower.compare(start, 10, "attachment") == 0) {
                return true;
            }
        }
        return false;
    };

    for (const auto& h : headers_) {
        if (iequals(h.name, "Content-Disposition") &&
            to_lower_copy(h.value()).starts_with("attachment")) {
            return true;
        }
    }
    return scan(body_);
}

std::string MailMessage::generate_message_id(std::string_view content, std::string_view hostname) {
    auto hash = std::hash<std::string_view>{}(content);
    return std::format("<generated-{:016x}@{}>", hash, hostname);
}

}  // namespace mailfwd
