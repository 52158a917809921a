// =============================================================================
// HTML Helper Tests
// =============================================================================

#include <gtest/gtest.h>
#include "mailclass/util/html.hpp"

using namespace mailclass::util;

class HtmlTest : public ::testing::Test {};

// Test attribute extraction with quoted, unquoted and commented markup
TEST_F(HtmlTest, ExtractAttributes) {
    auto attrs = extract_attributes(
        "<A HREF=\"http://x.com/\">x</a><!-- <img src=hidden> --><font color=red size='2'>");
    ASSERT_EQ(attrs.size(), 3u);
    EXPECT_EQ(attrs[0].tag, "a");
    EXPECT_EQ(attrs[0].name, "href");
    EXPECT_EQ(attrs[0].value, "http://x.com/");
    EXPECT_EQ(attrs[1].tag, "font");
    EXPECT_EQ(attrs[1].name, "color");
    EXPECT_EQ(attrs[1].value, "red");
    EXPECT_EQ(attrs[2].value, "2");
}

// Test markup stripping drops scripts, styles and comments
TEST_F(HtmlTest, StripMarkup) {
    std::string text = strip_markup(
        "<p>Hello<b>World</b></p><script>var spam = 1;</script>"
        "<style>.x{}</style><!-- hidden -->end");
    EXPECT_NE(text.find("Hello"), std::string::npos);
    EXPECT_NE(text.find("World"), std::string::npos);
    EXPECT_NE(text.find("end"), std::string::npos);
    EXPECT_EQ(text.find("spam"), std::string::npos);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_EQ(text.find('<'), std::string::npos);
    // Adjacent elements stay separate words
    EXPECT_EQ(text.find("HelloWorld"), std::string::npos);
}

// Test a bare '<' that does not open a tag is kept
TEST_F(HtmlTest, StripMarkupKeepsLessThan) {
    EXPECT_NE(strip_markup("1 < 2").find('<'), std::string::npos);
}

// Test named and numeric entities
TEST_F(HtmlTest, DecodeEntities) {
    EXPECT_EQ(decode_entities("a &amp; b &lt;c&gt;"), "a & b <c>");
    EXPECT_EQ(decode_entities("&#65;&#x42;&nbsp;"), "AB ");
    EXPECT_EQ(decode_entities("&bogus; & &"), "&bogus; & &");
    EXPECT_EQ(decode_entities("caf&#233;"), "caf\xC3\xA9");
}

// Test numeric entities beyond Unicode decode to the replacement character
TEST_F(HtmlTest, DecodeOversizedEntities) {
    EXPECT_EQ(decode_entities("&#x110000;"), "\xEF\xBF\xBD");
    EXPECT_EQ(decode_entities("&#xFFFFFFFF;"), "\xEF\xBF\xBD");
    EXPECT_EQ(decode_entities("&#999999999;"), "\xEF\xBF\xBD");
    EXPECT_EQ(decode_entities("&#x10FFFF;"), "\xF4\x8F\xBF\xBF");
    // Longer than any entity: kept as text
    EXPECT_EQ(decode_entities("&#4294967361;"), "&#4294967361;");
}

// Test link targets reduce to host or mail address
TEST_F(HtmlTest, LinkTarget) {
    EXPECT_EQ(link_target("http://user@Example.COM:8080/path?q=1"), "example.com");
    EXPECT_EQ(link_target("  https://www.spam.biz./buy"), "www.spam.biz");
    EXPECT_EQ(link_target("mailto:Bob@Example.org?subject=hi"), "bob@example.org");
    EXPECT_EQ(link_target("relative/page.html"), "");
    EXPECT_EQ(link_target("javascript:void(0)"), "");
}
