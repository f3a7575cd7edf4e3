#include "core/FeedParser.hpp"
#include "core/Errors.hpp"
#include <gtest/gtest.h>

using namespace showgrab::core;

namespace {

std::string rss(const std::string& items) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
           "<rss version=\"2.0\"><channel><title>Club Shows</title>" + items +
           "</channel></rss>";
}

} // namespace

TEST(FeedParserTest, EnclosureAndMissingEnclosureInDocumentOrder) {
    FeedParser parser;
    auto shows = parser.parse(rss(
        "<item><title>A</title><enclosure url=\"http://x/a.mp4\" length=\"1000000\" type=\"video/mp4\"/></item>"
        "<item><title>B</title></item>"));

    ASSERT_EQ(shows.size(), 2u);
    EXPECT_EQ(shows[0].title, "A");
    EXPECT_EQ(shows[0].link, "http://x/a.mp4");
    EXPECT_EQ(shows[0].lengthBytes, 1000000u);
    EXPECT_TRUE(shows[0].isDownloadable());
    EXPECT_EQ(shows[1].title, "B");
    EXPECT_EQ(shows[1].link, "");
    EXPECT_EQ(shows[1].lengthBytes, 0u);
    EXPECT_FALSE(shows[1].isDownloadable());
}

TEST(FeedParserTest, MissingFieldsAreDefaulted) {
    FeedParser parser;
    auto shows = parser.parse(rss(
        "<item><title>Full</title><description>&lt;p&gt;Hi&lt;/p&gt;</description>"
        "<pubDate>Tue, 10 Jun 2003 04:00:00 GMT</pubDate>"
        "<enclosure url=\"http://x/full.mp3\" length=\"42\"/></item>"
        "<item/>"));

    ASSERT_EQ(shows.size(), 2u);
    EXPECT_EQ(shows[0].description, "Hi");

    const ShowRecord& empty = shows[1];
    EXPECT_EQ(empty.title, "No Title");
    EXPECT_EQ(empty.description, "");
    EXPECT_EQ(empty.link, "");
    EXPECT_EQ(empty.publishedRaw, "No Date");
    EXPECT_EQ(empty.publishedTimestamp, 0);
    EXPECT_EQ(empty.lengthBytes, 0u);
}

TEST(FeedParserTest, BlankTitleGetsDefault) {
    FeedParser parser;
    auto shows = parser.parse(rss("<item><title>   </title></item>"));
    ASSERT_EQ(shows.size(), 1u);
    EXPECT_EQ(shows[0].title, "No Title");
}

TEST(FeedParserTest, TitleEntitiesAreDecoded) {
    FeedParser parser;
    auto shows = parser.parse(rss("<item><title>Tech &amp; Talk</title></item>"));
    ASSERT_EQ(shows.size(), 1u);
    EXPECT_EQ(shows[0].title, "Tech & Talk");
}

TEST(FeedParserTest, DescriptionTakesFirstParagraphText) {
    FeedParser parser;
    auto shows = parser.parse(rss(
        "<item><title>T</title><description><![CDATA["
        "<div><p>  First <b>bold</b> paragraph.  </p><p>Second</p></div>"
        "]]></description></item>"));

    ASSERT_EQ(shows.size(), 1u);
    EXPECT_EQ(shows[0].description, "First bold paragraph.");
}

TEST(FeedParserTest, DescriptionWithoutParagraphIsEmpty) {
    FeedParser parser;
    auto shows = parser.parse(rss(
        "<item><title>T</title><description><![CDATA[<ul><li>one</li></ul>]]></description></item>"));

    ASSERT_EQ(shows.size(), 1u);
    EXPECT_EQ(shows[0].description, "");
}

TEST(FeedParserTest, CrossedTagsStillYieldFirstParagraph) {
    FeedParser parser;
    auto shows = parser.parse(rss(
        "<item><title>T</title><description><![CDATA[<p>Broken <b>markup</p>]]></description></item>"));

    ASSERT_EQ(shows.size(), 1u);
    EXPECT_EQ(shows[0].description, "Broken markup");
}

TEST(FeedParserTest, UnclosedTagsStillYieldFirstParagraph) {
    EXPECT_EQ(FeedParser::extractFirstParagraph("<p>One<p>Two"), "One");
    EXPECT_EQ(FeedParser::extractFirstParagraph("<ul><li>a<li>b</ul><P class=\"x\">Notes &amp; links</P>"),
              "Notes & links");
    EXPECT_EQ(FeedParser::extractFirstParagraph("<div><pre>code</div>"), "");
}

TEST(FeedParserTest, UnreadableParagraphUsesPlaceholder) {
    EXPECT_EQ(FeedParser::extractFirstParagraph("<p>1 < 2"), FeedParser::kUnparsableDescription);
}

TEST(FeedParserTest, HtmlNamedEntitiesAreDecoded) {
    EXPECT_EQ(FeedParser::extractFirstParagraph("<p>It&rsquo;s here&hellip;</p>"),
              "It\xE2\x80\x99s here\xE2\x80\xA6");
    EXPECT_EQ(FeedParser::extractFirstParagraph("<p>Q&amp;A &mdash; live</p>"), "Q&A \xE2\x80\x94 live");
    EXPECT_EQ(FeedParser::extractFirstParagraph("<p>Keep &unknown; as is</p>"), "Keep &unknown; as is");
}

TEST(FeedParserTest, VoidElementsDoNotBreakDescription) {
    EXPECT_EQ(FeedParser::extractFirstParagraph("<p>Line one<br>Line two</p>"), "Line oneLine two");
    EXPECT_EQ(FeedParser::extractFirstParagraph("<img src=\"a.png\"><p>Hosts:&nbsp;Leo</p>"), "Hosts: Leo");
}

TEST(FeedParserTest, NonNumericOrNegativeLengthIsZero) {
    FeedParser parser;
    auto shows = parser.parse(rss(
        "<item><enclosure url=\"http://x/1.mp3\" length=\"abc\"/></item>"
        "<item><enclosure url=\"http://x/2.mp3\" length=\"-5\"/></item>"
        "<item><enclosure url=\"http://x/3.mp3\"/></item>"
        "<item><enclosure url=\"http://x/4.mp3\" length=\" 77 \"/></item>"));

    ASSERT_EQ(shows.size(), 4u);
    EXPECT_EQ(shows[0].lengthBytes, 0u);
    EXPECT_EQ(shows[1].lengthBytes, 0u);
    EXPECT_EQ(shows[2].lengthBytes, 0u);
    EXPECT_EQ(shows[3].lengthBytes, 77u);
    EXPECT_EQ(shows[2].link, "http://x/3.mp3");
}

TEST(FeedParserTest, PubDateTimestamps) {
    EXPECT_EQ(FeedParser::parsePubDate("Tue, 10 Jun 2003 04:00:00 GMT"), 1055217600);
    EXPECT_EQ(FeedParser::parsePubDate("Wed, 02 Oct 2002 08:00:00 -0400"), 1033560000);
    EXPECT_EQ(FeedParser::parsePubDate("02 Oct 2002 12:00 +0000"), 1033560000);
    EXPECT_EQ(FeedParser::parsePubDate("yesterday"), 0);
    EXPECT_EQ(FeedParser::parsePubDate(""), 0);
}

TEST(FeedParserTest, UnparseableDateKeepsRawText) {
    FeedParser parser;
    auto shows = parser.parse(rss("<item><pubDate>sometime soon</pubDate></item>"));
    ASSERT_EQ(shows.size(), 1u);
    EXPECT_EQ(shows[0].publishedRaw, "sometime soon");
    EXPECT_EQ(shows[0].publishedTimestamp, 0);
}

TEST(FeedParserTest, RdfItemsOutsideChannelAreFound) {
    FeedParser parser;
    auto shows = parser.parse(
        "<rdf:RDF xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\" xmlns=\"http://purl.org/rss/1.0/\">"
        "<channel><title>Old</title></channel>"
        "<item><title>One</title></item><item><title>Two</title></item>"
        "</rdf:RDF>");

    ASSERT_EQ(shows.size(), 2u);
    EXPECT_EQ(shows[0].title, "One");
    EXPECT_EQ(shows[1].title, "Two");
}

TEST(FeedParserTest, FeedWithoutItemsIsEmptyNotAnError) {
    FeedParser parser;
    EXPECT_TRUE(parser.parse(rss("")).empty());
}

TEST(FeedParserTest, MalformedDocumentThrowsParseError) {
    FeedParser parser;
    EXPECT_THROW(parser.parse("<rss><channel><item></channel>"), ParseError);
    EXPECT_THROW(parser.parse(""), ParseError);
    EXPECT_THROW(parser.parse("just some text"), ParseError);
}

TEST(FeedParserTest, ChannelTitle) {
    FeedParser parser;
    EXPECT_EQ(parser.parseChannelTitle(rss("")), "Club Shows");
    EXPECT_EQ(parser.parseChannelTitle("<rss><channel/></rss>"), "");
}
