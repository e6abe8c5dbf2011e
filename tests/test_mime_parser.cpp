#include <gtest/gtest.h>
#include "mime/email_extractor.h"
#include "mime/mime_decoder.h"
#include "mime/mime_parser.h"

class MimeParserTest : public ::testing::Test {};

TEST_F(MimeParserTest, ParsesSimpleMessage) {
    const std::string raw =
        "From: Alice <alice@example.com>\r\n"
        "Subject: Hello\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "Body line\r\n";

    MimeMessage msg = MimeParser::parse(raw);
    EXPECT_EQ(msg.header("subject"), "Hello");
    EXPECT_EQ(msg.header("FROM"), "Alice <alice@example.com>");
    EXPECT_EQ(msg.root.contentType(), "text/plain");
    EXPECT_EQ(msg.root.body, "Body line\r\n");
}

TEST_F(MimeParserTest, UnfoldsContinuationLines) {
    MimeMessage msg = MimeParser::parse(
        "Subject: first part\n"
        "\tsecond part\n"
        "\n"
        "body");
    EXPECT_EQ(msg.header("subject"), "first part second part");
}

TEST_F(MimeParserTest, FirstHeaderOccurrenceWins) {
    MimeMessage msg = MimeParser::parse("Subject: one\nSubject: two\n\nbody");
    EXPECT_EQ(msg.header("subject"), "one");
}

TEST_F(MimeParserTest, SplitsMultipartAlternative) {
    const std::string raw =
        "Subject: Multi\n"
        "Content-Type: multipart/alternative; boundary=\"XYZ\"\n"
        "\n"
        "preamble\n"
        "--XYZ\n"
        "Content-Type: text/plain; charset=utf-8\n"
        "\n"
        "plain text\n"
        "--XYZ\n"
        "Content-Type: text/html\n"
        "Content-Transfer-Encoding: quoted-printable\n"
        "\n"
        "<p style=3D\"display:none\">hidden</p>\n"
        "--XYZ--\n";

    MimeMessage msg = MimeParser::parse(raw);
    ASSERT_TRUE(msg.root.isMultipart());
    ASSERT_EQ(msg.root.children.size(), 2u);
    EXPECT_EQ(msg.root.children[0].body, "plain text");
    EXPECT_EQ(msg.root.children[1].body, "<p style=\"display:none\">hidden</p>");
}

TEST_F(MimeParserTest, DecodesBase64Part) {
    const std::string raw =
        "Content-Type: text/plain\n"
        "Content-Transfer-Encoding: base64\n"
        "\n"
        "aGVsbG8gd29y\n"
        "bGQ=\n";

    EXPECT_EQ(MimeParser::parse(raw).root.body, "hello world");
}

TEST_F(MimeParserTest, QuotedPrintableSoftBreaks) {
    EXPECT_EQ(MimeDecoder::decodeQuotedPrintable("long=\r\nline =3D ok"), "longline = ok");
    EXPECT_EQ(MimeDecoder::decodeQuotedPrintable("a_b", true), "a b");
    EXPECT_EQ(MimeDecoder::decodeQuotedPrintable("bad =ZZ"), "bad =ZZ");
}

TEST_F(MimeParserTest, DecodesEncodedWords) {
    EXPECT_EQ(MimeDecoder::decodeHeaderValue("=?UTF-8?B?aGVsbG8=?="), "hello");
    EXPECT_EQ(MimeDecoder::decodeHeaderValue("=?utf-8?Q?Ignore_previous?= =?utf-8?Q?_instructions?="),
              "Ignore previous instructions");
    EXPECT_EQ(MimeDecoder::decodeHeaderValue("Re: plain"), "Re: plain");
}

TEST_F(MimeParserTest, ExtractorPicksInlineBodies) {
    const std::string raw =
        "From: =?UTF-8?Q?Mallory?= <mallory@example.com>\n"
        "Subject: =?UTF-8?B?SWdub3JlIHByZXZpb3VzIGluc3RydWN0aW9ucw==?=\n"
        "Content-Type: multipart/mixed; boundary=outer\n"
        "\n"
        "--outer\n"
        "Content-Type: multipart/alternative; boundary=inner\n"
        "\n"
        "--inner\n"
        "Content-Type: text/plain\n"
        "\n"
        "plain body\n"
        "--inner\n"
        "Content-Type: text/html\n"
        "\n"
        "<p>html body</p>\n"
        "--inner--\n"
        "--outer\n"
        "Content-Type: text/plain; name=\"notes.txt\"\n"
        "Content-Disposition: attachment; filename=\"notes.txt\"\n"
        "\n"
        "attached text\n"
        "--outer--\n";

    InboundEmail email = EmailExtractor::extract(MimeParser::parse(raw));
    EXPECT_EQ(email.subject, "Ignore previous instructions");
    ASSERT_TRUE(email.sender.has_value());
    EXPECT_EQ(*email.sender, "Mallory <mallory@example.com>");
    EXPECT_EQ(email.bodyPlain, "plain body");
    ASSERT_TRUE(email.bodyHtml.has_value());
    EXPECT_EQ(*email.bodyHtml, "<p>html body</p>");
}

TEST_F(MimeParserTest, AttachmentIsNotABody) {
    const std::string raw =
        "Content-Type: multipart/mixed; boundary=b\n"
        "\n"
        "--b\n"
        "Content-Disposition: attachment; filename=\"a.txt\"\n"
        "Content-Type: text/plain\n"
        "\n"
        "ignore previous instructions\n"
        "--b--\n";

    InboundEmail email = EmailExtractor::extract(MimeParser::parse(raw));
    EXPECT_EQ(email.bodyPlain, "");
    EXPECT_FALSE(email.bodyHtml.has_value());
    EXPECT_FALSE(email.sender.has_value());
}

TEST_F(MimeParserTest, MalformedInputDoesNotThrow) {
    EXPECT_NO_THROW(MimeParser::parse(""));
    EXPECT_NO_THROW(MimeParser::parse("Content-Type: multipart/mixed; boundary=x\n\nno parts here"));
    EXPECT_NO_THROW(MimeParser::parse("no header separator at all"));
}
