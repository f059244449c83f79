// tests/log_parser_tests.cpp
// -----------------------------------------------------------------------------
// Structured log parser state machine.
// -----------------------------------------------------------------------------

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "prince/log_parser.hpp"

using prince::conversion_outcome;
using prince::engine_message;
using prince::log_parser;

static conversion_outcome parse(const std::string& text)
{
    std::istringstream is(text);
    log_parser p;
    return p.parse(is);
}

TEST(LogParser, MessageTextKeepsPipes)
{
    conversion_outcome out = parse("msg|err|file.html|Some error|with|pipes\nfin|success\n");
    EXPECT_TRUE(out.success);
    ASSERT_EQ(1u, out.messages.size());
    EXPECT_EQ(engine_message::ERR, out.messages[0].severity);
    EXPECT_EQ("file.html", out.messages[0].location);
    EXPECT_EQ("Some error|with|pipes", out.messages[0].text);
    EXPECT_TRUE(out.data.empty());
}

TEST(LogParser, Severities)
{
    conversion_outcome out = parse("msg|err||e\nmsg|wrn|a.css|w\nmsg|inf||i\nmsg|dbg||d\nmsg|zzz||u\nfin|success\n");
    ASSERT_EQ(5u, out.messages.size());
    EXPECT_EQ(engine_message::ERR, out.messages[0].severity);
    EXPECT_EQ(engine_message::WRN, out.messages[1].severity);
    EXPECT_EQ("a.css", out.messages[1].location);
    EXPECT_EQ(engine_message::INF, out.messages[2].severity);
    EXPECT_EQ(engine_message::DBG, out.messages[3].severity);
    EXPECT_EQ(engine_message::DBG, out.messages[4].severity);
    EXPECT_STREQ("err", out.messages[0].tag());
    EXPECT_STREQ("wrn", out.messages[1].tag());
    EXPECT_STREQ("inf", out.messages[2].tag());
    EXPECT_STREQ("dbg", out.messages[4].tag());
}

TEST(LogParser, DataRecords)
{
    conversion_outcome out = parse("dat|total-page-count|3\ndat|url|http://x/?a=1|b\ndat|flag\nfin|success\n");
    ASSERT_EQ(3u, out.data.size());
    EXPECT_EQ("total-page-count", out.data[0].key);
    EXPECT_EQ("3", out.data[0].value);
    EXPECT_EQ("url", out.data[1].key);
    EXPECT_EQ("http://x/?a=1|b", out.data[1].value);
    EXPECT_EQ("flag", out.data[2].key);
    EXPECT_EQ("", out.data[2].value);
}

TEST(LogParser, FinFailure)
{
    conversion_outcome out = parse("msg|err|in.html|cannot open\nfin|failure\n");
    EXPECT_FALSE(out.success);
    EXPECT_EQ(1u, out.messages.size());
}

TEST(LogParser, UnexpectedOutcomeIsFailure)
{
    log_parser p;
    p.feed("fin|maybe");
    EXPECT_TRUE(p.done());
    EXPECT_EQ("maybe", p.outcome());
    EXPECT_FALSE(p.succeeded());
}

TEST(LogParser, EofWithoutFinKeepsRecords)
{
    conversion_outcome out = parse("msg|wrn||low memory\ndat|k|v\n");
    EXPECT_FALSE(out.success);
    EXPECT_EQ(1u, out.messages.size());
    EXPECT_EQ(1u, out.data.size());
}

TEST(LogParser, EofStateHasEmptyOutcome)
{
    log_parser p;
    EXPECT_EQ(log_parser::ACCUMULATING, p.state());
    p.feed("msg|inf||x");
    p.finish();
    EXPECT_EQ(log_parser::DONE, p.state());
    EXPECT_EQ("", p.outcome());
    EXPECT_FALSE(p.succeeded());
}

TEST(LogParser, NothingAfterFin)
{
    log_parser p;
    EXPECT_TRUE(p.feed("fin|success\n"));
    EXPECT_FALSE(p.feed("msg|err||late"));
    EXPECT_FALSE(p.feed("fin|failure"));
    EXPECT_TRUE(p.succeeded());
    EXPECT_TRUE(p.messages().empty());
}

TEST(LogParser, ParseStopsAtFin)
{
    std::istringstream is("fin|success\nmsg|err||late\n");
    log_parser p;
    conversion_outcome out = p.parse(is);
    EXPECT_TRUE(out.success);
    EXPECT_TRUE(out.messages.empty());
    std::string rest;
    std::getline(is, rest);
    EXPECT_EQ("msg|err||late", rest);
}

TEST(LogParser, FallbackPrefixes)
{
    conversion_outcome out = parse("prince: warning: no fonts\nprince: error: bad license\nsomething else\nfin|failure\n");
    ASSERT_EQ(3u, out.messages.size());
    EXPECT_EQ(engine_message::WRN, out.messages[0].severity);
    EXPECT_EQ("", out.messages[0].location);
    EXPECT_EQ("no fonts", out.messages[0].text);
    EXPECT_EQ(engine_message::ERR, out.messages[1].severity);
    EXPECT_EQ("bad license", out.messages[1].text);
    EXPECT_EQ(engine_message::DBG, out.messages[2].severity);
    EXPECT_EQ("something else", out.messages[2].text);
}

TEST(LogParser, ShortAndMalformedLinesFallBack)
{
    conversion_outcome out = parse("fin\nms\nMSG|err||x\n");
    ASSERT_EQ(3u, out.messages.size());
    EXPECT_EQ("fin", out.messages[0].text);
    EXPECT_EQ("ms", out.messages[1].text);
    EXPECT_EQ("MSG|err||x", out.messages[2].text);
    EXPECT_FALSE(out.success);
}

TEST(LogParser, CrLfAndTrailingWhitespace)
{
    conversion_outcome out = parse("msg|inf||spaced   \r\nfin|success \r\n");
    EXPECT_TRUE(out.success);
    ASSERT_EQ(1u, out.messages.size());
    EXPECT_EQ("spaced", out.messages[0].text);
}

TEST(LogParser, MessagesKeepEmissionOrder)
{
    conversion_outcome out = parse("msg|inf||1\nmsg|err||2\nprince: warning: 3\nmsg|inf||4\nfin|success\n");
    ASSERT_EQ(4u, out.messages.size());
    for (size_t i = 0; i < out.messages.size(); ++i)
        EXPECT_EQ(std::to_string(i + 1), out.messages[i].text);
}
