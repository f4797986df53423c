#include "html_text.hpp"
#include "../utils.hpp"
#include <gumbo.h>
#include <memory>

namespace webscout {

namespace {

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const {
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};

using GumboDocument = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

// Dropped with their whole subtree.
bool is_skipped(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_SCRIPT:
        case GUMBO_TAG_STYLE:
        case GUMBO_TAG_NOSCRIPT:
        case GUMBO_TAG_TEMPLATE:
        case GUMBO_TAG_SVG:
        case GUMBO_TAG_HEAD:
        case GUMBO_TAG_NAV:
        case GUMBO_TAG_HEADER:
        case GUMBO_TAG_FOOTER:
            return true;
        default:
            return false;
    }
}

bool is_block(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_P: case GUMBO_TAG_DIV: case GUMBO_TAG_BR: case GUMBO_TAG_HR:
        case GUMBO_TAG_TR: case GUMBO_TAG_TABLE: case GUMBO_TAG_SECTION: case GUMBO_TAG_ARTICLE:
        case GUMBO_TAG_MAIN: case GUMBO_TAG_ASIDE: case GUMBO_TAG_UL: case GUMBO_TAG_OL:
        case GUMBO_TAG_BLOCKQUOTE: case GUMBO_TAG_PRE: case GUMBO_TAG_FORM: case GUMBO_TAG_DL:
        case GUMBO_TAG_DT: case GUMBO_TAG_DD: case GUMBO_TAG_FIGURE: case GUMBO_TAG_FIGCAPTION:
            return true;
        default:
            return false;
    }
}

int heading_level(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_H1: return 1;
        case GUMBO_TAG_H2: return 2;
        case GUMBO_TAG_H3: return 3;
        case GUMBO_TAG_H4: return 4;
        case GUMBO_TAG_H5: return 5;
        case GUMBO_TAG_H6: return 6;
        default: return 0;
    }
}

// Collapses runs of whitespace into one space.
void append_text(std::string& out, const char* text) {
    for (const char* p = text; *p; ++p) {
        char c = *p;
        bool ws = c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
        if (ws) {
            if (!out.empty() && out.back() != ' ' && out.back() != '\n') out += ' ';
        } else {
            out += c;
        }
    }
}

std::string trim_spaces(const std::string& s) {
    size_t b = s.find_first_not_of(' ');
    if (b == std::string::npos) return "";
    return s.substr(b, s.find_last_not_of(' ') - b + 1);
}

void render(const GumboNode* node, std::string& out);

void render_children(const GumboVector& children, std::string& out) {
    for (unsigned int i = 0; i < children.length; i++) {
        render(static_cast<const GumboNode*>(children.data[i]), out);
    }
}

void render_link(const GumboElement& el, std::string& out) {
    const GumboAttribute* attr = gumbo_get_attribute(&el.attributes, "href");
    std::string href = attr ? attr->value : "";

    size_t start = out.size();
    render_children(el.children, out);

    std::string text = trim_spaces(out.substr(start));
    bool linkable = !href.empty() && href[0] != '#' && !starts_with(to_lower(href), "javascript:");
    if (!linkable || text.empty() || text.find('\n') != std::string::npos) return;

    out.erase(start);
    if (start > 0 && out.back() != ' ' && out.back() != '\n') out += ' ';
    out += "[" + text + "](" + href + ")";
}

void render(const GumboNode* node, std::string& out) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
        case GUMBO_NODE_CDATA:
            append_text(out, node->v.text.text);
            return;
        case GUMBO_NODE_DOCUMENT:
            render_children(node->v.document.children, out);
            return;
        case GUMBO_NODE_ELEMENT:
            break;
        default:  // comments, <template> contents
            return;
    }

    const GumboElement& el = node->v.element;
    if (is_skipped(el.tag)) return;

    if (int level = heading_level(el.tag)) {
        out += '\n' + std::string(level, '#') + ' ';
        render_children(el.children, out);
        out += '\n';
    } else if (el.tag == GUMBO_TAG_LI) {
        out += "\n- ";
        render_children(el.children, out);
        out += '\n';
    } else if (el.tag == GUMBO_TAG_TD || el.tag == GUMBO_TAG_TH) {
        render_children(el.children, out);
        out += ' ';
    } else if (el.tag == GUMBO_TAG_A) {
        render_link(el, out);
    } else if (is_block(el.tag)) {
        out += '\n';
        render_children(el.children, out);
        out += '\n';
    } else {
        render_children(el.children, out);
    }
}

} // namespace

std::string html_to_markdown(const std::string& html) {
    GumboDocument doc(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
    std::string out;
    if (doc) render(doc->document, out);

    // Trim every line and drop the empty ones.
    std::string result;
    size_t start = 0;
    while (start <= out.size()) {
        size_t nl = out.find('\n', start);
        if (nl == std::string::npos) nl = out.size();
        std::string line = out.substr(start, nl - start);
        size_t b = line.find_first_not_of(" \t\r");
        if (b != std::string::npos) {
            size_t e = line.find_last_not_of(" \t\r");
            if (!result.empty()) result += '\n';
            result += line.substr(b, e - b + 1);
        }
        start = nl + 1;
    }
    return result;
}

} // namespace webscout
