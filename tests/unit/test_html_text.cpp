#include <gtest/gtest.h>
#include "tools/html_text.hpp"

namespace {

using webscout::html_to_markdown;

TEST(HtmlToMarkdownTest, KeepsContentAndDropsChrome) {
    std::string html =
        "<html><head><title>T</title><style>p{color:red}</style></head><body>"
        "<nav><a href=\"/\">Home</a></nav>"
        "<h1>Investor Relations</h1>"
        "<p>Hello &amp; welcome</p>"
        "<ul><li>One</li><li>Two</li></ul>"
        "<p>See <a href=\"https://x.example/r.pdf\">the report</a>.</p>"
        "<script>var x = \"<p>not text</p>\";</script>"
        "<footer>Copyright</footer>"
        "</body></html>";

    EXPECT_EQ(html_to_markdown(html),
              "# Investor Relations\n"
              "Hello & welcome\n"
              "- One\n"
              "- Two\n"
              "See [the report](https://x.example/r.pdf).");
}

TEST(HtmlToMarkdownTest, NestedChromeIsSkippedByDepth) {
    std::string html = "<header><div><header>inner</header>still header</div></header><p>body</p>";
    EXPECT_EQ(html_to_markdown(html), "body");
}

TEST(HtmlToMarkdownTest, FragmentAndScriptLinksStayPlain) {
    std::string html = "<p><a href=\"#top\">Top</a> <a href='javascript:void(0)'>Menu</a></p>";
    EXPECT_EQ(html_to_markdown(html), "Top Menu");
}

TEST(HtmlToMarkdownTest, CollapsesWhitespaceAndComments) {
    std::string html = "<div>  a\n\n   b <!-- hidden --> c </div>\n\n<div></div>";
    EXPECT_EQ(html_to_markdown(html), "a b c");
}

TEST(HtmlToMarkdownTest, HeadingLevels) {
    EXPECT_EQ(html_to_markdown("<h2>Results</h2><h3>Q4</h3>"), "## Results\n### Q4");
}

TEST(HtmlToMarkdownTest, QuotedGreaterThanStaysInsideAttribute) {
    std::string html = "<p>Revenue <a href=\"/r.pdf\" title=\"Q4 > Q3\">Q4 report</a> here</p>";
    EXPECT_EQ(html_to_markdown(html), "Revenue [Q4 report](/r.pdf) here");
}

TEST(HtmlToMarkdownTest, DecodesEntities) {
    EXPECT_EQ(html_to_markdown("<p>a &lt; b &gt; c &amp; it&rsquo;s &#65;&#x42;</p>"),
              "a < b > c & it\xE2\x80\x99s AB");
}

TEST(HtmlToMarkdownTest, UnclosedTagsAreRepaired) {
    EXPECT_EQ(html_to_markdown("<ul><li>One<li>Two</ul><p>End"), "- One\n- Two\nEnd");
}

} // namespace
