#include <catch2/catch_test_macros.hpp>
#include "smtp_commands.hpp"

using namespace mailfwd::smtp;

TEST_CASE("SMTP command parsing", "[smtp][commands]") {
    SECTION("Parse HELO command") {
        auto cmd = Command::parse("HELO client.example.com");
        REQUIRE(cmd.type == CommandType::HELO);
        REQUIRE(cmd.argument == "client.example.com");
    }

    SECTION("Parse EHLO command") {
        auto cmd = Command::parse("EHLO client.example.com");
        REQUIRE(cmd.type == CommandType::EHLO);
        REQUIRE(cmd.argument == "client.example.com");
    }

    SECTION("Parse MAIL FROM command") {
        auto cmd = Command::parse("MAIL FROM:<sender@example.com>");
        REQUIRE(cmd.type == CommandType::MAIL);
        REQUIRE(cmd.argument == "<sender@example.com>");
    }

    SECTION("MAIL FROM with a space and ESMTP parameters") {
        auto cmd = Command::parse("MAIL FROM: <sender@example.com> SIZE=1024");
        REQUIRE(cmd.type == CommandType::MAIL);
        REQUIRE(cmd.argument == "<sender@example.com> SIZE=1024");
    }

    SECTION("Parse RCPT TO command") {
        auto cmd = Command::parse("RCPT TO:<recipient@example.com>");
        REQUIRE(cmd.type == CommandType::RCPT);
        REQUIRE(cmd.argument == "<recipient@example.com>");
    }

    SECTION("Parse DATA command") {
        auto cmd = Command::parse("DATA");
        REQUIRE(cmd.type == CommandType::DATA);
    }

    SECTION("Parse RSET command") {
        auto cmd = Command::parse("RSET");
        REQUIRE(cmd.type == CommandType::RSET);
    }

    SECTION("Parse NOOP command") {
        auto cmd = Command::parse("NOOP");
        REQUIRE(cmd.type == CommandType::NOOP);
    }

    SECTION("Parse QUIT command") {
        auto cmd = Command::parse("QUIT");
        REQUIRE(cmd.type == CommandType::QUIT);
    }

    SECTION("Parse STARTTLS command") {
        auto cmd = Command::parse("STARTTLS");
        REQUIRE(cmd.type == CommandType::STARTTLS);
    }

    SECTION("AUTH is not a recognised command") {
        auto cmd = Command::parse("AUTH PLAIN");
        REQUIRE(cmd.type == CommandType::UNKNOWN);
    }

    SECTION("Qualifier is only split off MAIL and RCPT") {
        auto cmd = Command::parse("RCPT FROM:<a@example.com>");
        REQUIRE(cmd.type == CommandType::RCPT);
        REQUIRE(cmd.name == "RCPT");
        REQUIRE(cmd.argument == "FROM:<a@example.com>");
    }

    SECTION("Parse unknown command") {
        auto cmd = Command::parse("INVALID");
        REQUIRE(cmd.type == CommandType::UNKNOWN);
    }

    SECTION("Empty line") {
        auto cmd = Command::parse("");
        REQUIRE(cmd.type == CommandType::UNKNOWN);
        REQUIRE(cmd.argument.empty());
    }

    SECTION("Case insensitive parsing") {
        auto cmd1 = Command::parse("helo client.example.com");
        auto cmd2 = Command::parse("mail from:<a@example.com>");
        REQUIRE(cmd1.type == CommandType::HELO);
        REQUIRE(cmd2.type == CommandType::MAIL);
        REQUIRE(cmd2.argument == "<a@example.com>");
    }
}

TEST_CASE("Email address parsing", "[smtp][email]") {
    SECTION("Simple email address") {
        auto addr = EmailAddress::parse("user@example.com");
        REQUIRE(addr.has_value());
        REQUIRE(addr->local_part == "user");
        REQUIRE(addr->domain == "example.com");
        REQUIRE(addr->full_address == "user@example.com");
    }

    SECTION("Email in angle brackets") {
        auto addr = EmailAddress::parse("<user@example.com>");
        REQUIRE(addr.has_value());
        REQUIRE(addr->local_part == "user");
        REQUIRE(addr->domain == "example.com");
    }

    SECTION("Email with whitespace") {
        auto addr = EmailAddress::parse("  <user@example.com>  ");
        REQUIRE(addr.has_value());
        REQUIRE(addr->full_address == "user@example.com");
    }

    SECTION("ESMTP parameters are ignored") {
        auto bracketed = EmailAddress::parse("<user@example.com> SIZE=2048");
        REQUIRE(bracketed.has_value());
        REQUIRE(bracketed->full_address == "user@example.com");

        auto bare = EmailAddress::parse("user@example.com BODY=8BITMIME");
        REQUIRE(bare.has_value());
        REQUIRE(bare->full_address == "user@example.com");
    }

    SECTION("Null sender") {
        auto addr = EmailAddress::parse("<>");
        REQUIRE(addr.has_value());
        REQUIRE(addr->local_part.empty());
        REQUIRE(addr->domain.empty());
        REQUIRE(addr->is_null());
    }

    SECTION("Invalid - no @") {
        REQUIRE_FALSE(EmailAddress::parse("userexample.com").has_value());
    }

    SECTION("Invalid - empty local part") {
        REQUIRE_FALSE(EmailAddress::parse("@example.com").has_value());
    }

    SECTION("Invalid - empty domain") {
        REQUIRE_FALSE(EmailAddress::parse("user@").has_value());
    }

    SECTION("Invalid - unbalanced brackets") {
        REQUIRE_FALSE(EmailAddress::parse("<user@example.com").has_value());
    }
}

TEST_CASE("SMTP reply codes", "[smtp][reply]") {
    SECTION("Make simple reply") {
        REQUIRE(reply::make(250, "OK") == "250 OK");
    }

    SECTION("Make multi-line reply") {
        std::vector<std::string> lines = {"Hello", "PIPELINING", "SIZE 10240000"};
        auto reply_str = reply::make_multi(250, lines);
        REQUIRE(reply_str == "250-Hello\r\n250-PIPELINING\r\n250 SIZE 10240000");
    }

    SECTION("Reply code constants") {
        REQUIRE(reply::SERVICE_READY == 220);
        REQUIRE(reply::OK == 250);
        REQUIRE(reply::START_MAIL_INPUT == 354);
        REQUIRE(reply::LOCAL_ERROR == 451);
        REQUIRE(reply::SYNTAX_ERROR == 500);
        REQUIRE(reply::MAILBOX_NOT_FOUND == 550);
        REQUIRE(reply::EXCEEDED_STORAGE == 552);
    }
}

TEST_CASE("Command type conversion", "[smtp][commands]") {
    SECTION("Type to string") {
        REQUIRE(Command::type_to_string(CommandType::HELO) == "HELO");
        REQUIRE(Command::type_to_string(CommandType::MAIL) == "MAIL");
        REQUIRE(Command::type_to_string(CommandType::RCPT) == "RCPT");
        REQUIRE(Command::type_to_string(CommandType::STARTTLS) == "STARTTLS");
        REQUIRE(Command::type_to_string(CommandType::UNKNOWN) == "UNKNOWN");
    }

    SECTION("String to type") {
        REQUIRE(Command::string_to_type("MAIL FROM:") == CommandType::MAIL);
        REQUIRE(Command::string_to_type("RCPT TO:") == CommandType::RCPT);
        REQUIRE(Command::string_to_type("VRFY") == CommandType::VRFY);
        REQUIRE(Command::string_to_type("INVALID") == CommandType::UNKNOWN);
    }
}

TEST_CASE("ESMTP MAIL parameters", "[smtp][params]") {
    SECTION("Keywords after a bracketed path") {
        auto params = MailParameters::parse("<user@example.com> size=2048 BODY=8BITMIME");
        REQUIRE(params.has_value());
        REQUIRE(params->get("SIZE") == "2048");
        REQUIRE(params->get("body") == "8BITMIME");
        REQUIRE_FALSE(params->get("RET").has_value());
    }

    SECTION("Keyword without a value") {
        auto params = MailParameters::parse("user@example.com SMTPUTF8");
        REQUIRE(params.has_value());
        REQUIRE(params->get("SMTPUTF8") == "");
    }

    SECTION("No parameters") {
        auto params = MailParameters::parse("<>");
        REQUIRE(params.has_value());
        REQUIRE(params->values.empty());
    }

    SECTION("Spaces inside the brackets are not parameters") {
        auto params = MailParameters::parse("< user@example.com > SIZE=1");
        REQUIRE(params.has_value());
        REQUIRE(params->values.size() == 1);
    }

    SECTION("Missing keyword is rejected") {
        REQUIRE_FALSE(MailParameters::parse("<user@example.com> =10").has_value());
    }
}
