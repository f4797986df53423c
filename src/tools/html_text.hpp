#pragma once
#include <string>

namespace webscout {

// Reduce an HTML page to readable markdown-ish text with gumbo: headings,
// list items and links survive; script/style/head and page chrome (nav,
// header, footer) are dropped; blank lines are removed.
std::string html_to_markdown(const std::string& html);

} // namespace webscout
