#include "../../include/aeo_engine/extraction/HtmlDocument.h"
#include "../../include/aeo_engine/common/TextUtils.h"
#include "../../include/Logger.h"

#include <cctype>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace aeo_engine::extraction {

using common::collapseWhitespace;
using common::toLower;
using common::trim;

namespace {

const GumboVector* childrenOf(const GumboNode* node) {
    if (!node) {
        return nullptr;
    }
    if (node->type == GUMBO_NODE_DOCUMENT) {
        return &node->v.document.children;
    }
    if (node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE) {
        return &node->v.element.children;
    }
    return nullptr;
}

// Split on `delimiter` outside of [...] and quotes
std::vector<std::string> splitTopLevel(const std::string& input, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    int bracketDepth = 0;
    char quote = 0;
    for (char c : input) {
        if (quote) {
            if (c == quote) quote = 0;
            current.push_back(c);
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            ++bracketDepth;
        } else if (c == ']') {
            --bracketDepth;
        }
        bool isDelimiter = delimiter == ' ' ? std::isspace(static_cast<unsigned char>(c)) != 0 : c == delimiter;
        if (isDelimiter && bracketDepth == 0) {
            if (!trim(current).empty()) {
                parts.push_back(trim(current));
            }
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (!trim(current).empty()) {
        parts.push_back(trim(current));
    }
    return parts;
}

std::string unquote(const std::string& value) {
    std::string v = trim(value);
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
        return v.substr(1, v.size() - 2);
    }
    return v;
}

bool isSkippedForText(const GumboNode* node) {
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) {
        return false;
    }
    switch (node->v.element.tag) {
        case GUMBO_TAG_SCRIPT:
        case GUMBO_TAG_STYLE:
        case GUMBO_TAG_NOSCRIPT:
        case GUMBO_TAG_TEMPLATE:
            return true;
        default:
            return false;
    }
}

} // namespace

Selector Selector::parse(const std::string& selector) {
    Selector result;
    for (const auto& alternative : splitTopLevel(selector, ',')) {
        Chain chain;
        for (const auto& compoundText : splitTopLevel(alternative, ' ')) {
            chain.push_back(parseCompound(compoundText));
        }
        if (!chain.empty()) {
            result.alternatives_.push_back(std::move(chain));
        }
    }
    return result;
}

Selector::Compound Selector::parseCompound(const std::string& text) {
    Compound compound;
    size_t pos = 0;
    while (pos < text.size() && text[pos] != '.' && text[pos] != '#' && text[pos] != '[') {
        compound.tag.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text[pos]))));
        ++pos;
    }

    while (pos < text.size()) {
        char marker = text[pos];
        if (marker == '.' || marker == '#') {
            size_t end = pos + 1;
            while (end < text.size() && text[end] != '.' && text[end] != '#' && text[end] != '[') {
                ++end;
            }
            AttributeTest test;
            test.name = marker == '.' ? "class" : "id";
            test.op = marker == '.' ? AttributeOp::CLASS_TOKEN : AttributeOp::EQUALS;
            test.value = text.substr(pos + 1, end - pos - 1);
            compound.tests.push_back(std::move(test));
            pos = end;
        } else if (marker == '[') {
            size_t end = text.find(']', pos);
            if (end == std::string::npos) {
                throw std::invalid_argument("Unterminated attribute selector: " + text);
            }
            std::string body = text.substr(pos + 1, end - pos - 1);
            AttributeTest test;
            size_t eq = body.find('=');
            if (eq == std::string::npos) {
                test.name = toLower(trim(body));
                test.op = AttributeOp::EXISTS;
            } else {
                std::string name = body.substr(0, eq);
                test.op = AttributeOp::EQUALS;
                if (!name.empty()) {
                    char modifier = name.back();
                    if (modifier == '*') { test.op = AttributeOp::CONTAINS; name.pop_back(); }
                    else if (modifier == '^') { test.op = AttributeOp::PREFIX; name.pop_back(); }
                    else if (modifier == '$') { test.op = AttributeOp::SUFFIX; name.pop_back(); }
                }
                test.name = toLower(trim(name));
                test.value = unquote(body.substr(eq + 1));
            }
            compound.tests.push_back(std::move(test));
            pos = end + 1;
        } else {
            throw std::invalid_argument("Unsupported selector syntax: " + text);
        }
    }
    return compound;
}

bool Selector::matchesCompound(const Compound& compound, const GumboNode* node) {
    if (!HtmlDocument::isElement(node)) {
        return false;
    }
    if (!compound.tag.empty() && compound.tag != "*" && HtmlDocument::tagName(node) != compound.tag) {
        return false;
    }
    for (const auto& test : compound.tests) {
        const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, test.name.c_str());
        if (!attr) {
            return false;
        }
        const std::string value = attr->value ? attr->value : "";
        switch (test.op) {
            case AttributeOp::EXISTS:
                break;
            case AttributeOp::EQUALS:
                if (value != test.value) return false;
                break;
            case AttributeOp::CONTAINS:
                if (test.value.empty() || value.find(test.value) == std::string::npos) return false;
                break;
            case AttributeOp::PREFIX:
                if (test.value.empty() || !common::startsWith(value, test.value)) return false;
                break;
            case AttributeOp::SUFFIX:
                if (test.value.empty() || !common::endsWith(value, test.value)) return false;
                break;
            case AttributeOp::CLASS_TOKEN: {
                std::istringstream tokens(value);
                std::string token;
                bool found = false;
                while (tokens >> token) {
                    if (token == test.value) { found = true; break; }
                }
                if (!found) return false;
                break;
            }
        }
    }
    return true;
}

bool Selector::matchesChain(const Chain& chain, const GumboNode* node) {
    if (chain.empty() || !matchesCompound(chain.back(), node)) {
        return false;
    }
    // Walk ancestors right to left for the descendant combinators
    int index = static_cast<int>(chain.size()) - 2;
    const GumboNode* ancestor = node->parent;
    while (index >= 0 && ancestor) {
        if (matchesCompound(chain[static_cast<size_t>(index)], ancestor)) {
            --index;
        }
        ancestor = ancestor->parent;
    }
    return index < 0;
}

bool Selector::matches(const GumboNode* node) const {
    for (const auto& chain : alternatives_) {
        if (matchesChain(chain, node)) {
            return true;
        }
    }
    return false;
}

HtmlDocument::HtmlDocument(const std::string& html)
    : output_(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size())) {
    if (!output_) {
        throw std::runtime_error("Failed to parse HTML document");
    }
}

HtmlDocument::~HtmlDocument() {
    if (output_) {
        gumbo_destroy_output(&kGumboDefaultOptions, output_);
    }
}

const GumboNode* HtmlDocument::root() const {
    return output_->root;
}

std::vector<const GumboNode*> HtmlDocument::select(const std::string& selector) const {
    return select(Selector::parse(selector));
}

std::vector<const GumboNode*> HtmlDocument::select(const Selector& selector) const {
    std::vector<const GumboNode*> out;
    collect(output_->document, selector, out);
    return out;
}

std::vector<const GumboNode*> HtmlDocument::selectWithin(const GumboNode* scope, const std::string& selector) const {
    std::vector<const GumboNode*> out;
    const Selector parsed = Selector::parse(selector);
    const GumboVector* children = childrenOf(scope);
    if (!children) {
        return out;
    }
    for (unsigned int i = 0; i < children->length; ++i) {
        collect(static_cast<const GumboNode*>(children->data[i]), parsed, out);
    }
    return out;
}

const GumboNode* HtmlDocument::selectFirst(const std::string& selector) const {
    auto matches = select(selector);
    return matches.empty() ? nullptr : matches.front();
}

size_t HtmlDocument::count(const std::string& selector) const {
    return select(selector).size();
}

bool HtmlDocument::exists(const std::string& selector) const {
    return selectFirst(selector) != nullptr;
}

std::string HtmlDocument::title() const {
    const GumboNode* titleNode = selectFirst("title");
    return titleNode ? text(titleNode) : "";
}

std::string HtmlDocument::bodyText() const {
    const GumboNode* body = selectFirst("body");
    return body ? text(body) : "";
}

std::string HtmlDocument::attribute(const GumboNode* node, const std::string& name) {
    if (!isElement(node)) {
        return "";
    }
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name.c_str());
    return attr && attr->value ? std::string(attr->value) : "";
}

bool HtmlDocument::hasAttribute(const GumboNode* node, const std::string& name) {
    return isElement(node) && gumbo_get_attribute(&node->v.element.attributes, name.c_str()) != nullptr;
}

bool HtmlDocument::isElement(const GumboNode* node) {
    return node && (node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE);
}

std::string HtmlDocument::tagName(const GumboNode* node) {
    if (!isElement(node)) {
        return "";
    }
    if (node->v.element.tag != GUMBO_TAG_UNKNOWN) {
        return gumbo_normalized_tagname(node->v.element.tag);
    }
    GumboStringPiece piece = node->v.element.original_tag;
    gumbo_tag_from_original_text(&piece);
    return toLower(std::string(piece.data, piece.length));
}

std::string HtmlDocument::text(const GumboNode* node) {
    std::string out;
    appendText(node, nullptr, out);
    return collapseWhitespace(out);
}

std::string HtmlDocument::text(const GumboNode* node, const Selector& exclude) {
    std::string out;
    appendText(node, &exclude, out);
    return collapseWhitespace(out);
}

std::string HtmlDocument::rawText(const GumboNode* node) {
    std::string out;
    const GumboVector* children = childrenOf(node);
    if (!children) {
        return out;
    }
    for (unsigned int i = 0; i < children->length; ++i) {
        const GumboNode* child = static_cast<const GumboNode*>(children->data[i]);
        if (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_CDATA || child->type == GUMBO_NODE_WHITESPACE) {
            out += child->v.text.text;
        } else {
            out += rawText(child);
        }
    }
    return out;
}

const GumboNode* HtmlDocument::nextElementSibling(const GumboNode* node) {
    if (!node || !node->parent) {
        return nullptr;
    }
    const GumboVector* siblings = childrenOf(node->parent);
    if (!siblings) {
        return nullptr;
    }
    for (unsigned int i = node->index_within_parent + 1; i < siblings->length; ++i) {
        const GumboNode* sibling = static_cast<const GumboNode*>(siblings->data[i]);
        if (isElement(sibling)) {
            return sibling;
        }
    }
    return nullptr;
}

void HtmlDocument::collect(const GumboNode* node, const Selector& selector, std::vector<const GumboNode*>& out) {
    if (isElement(node) && selector.matches(node)) {
        out.push_back(node);
    }
    const GumboVector* children = childrenOf(node);
    if (!children) {
        return;
    }
    for (unsigned int i = 0; i < children->length; ++i) {
        collect(static_cast<const GumboNode*>(children->data[i]), selector, out);
    }
}

void HtmlDocument::appendText(const GumboNode* node, const Selector* exclude, std::string& out) {
    if (!node) {
        return;
    }
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_CDATA || node->type == GUMBO_NODE_WHITESPACE) {
        out += node->v.text.text;
        return;
    }
    if (isSkippedForText(node)) {
        return;
    }
    if (exclude && isElement(node) && exclude->matches(node)) {
        return;
    }
    const GumboVector* children = childrenOf(node);
    if (!children) {
        return;
    }
    for (unsigned int i = 0; i < children->length; ++i) {
        appendText(static_cast<const GumboNode*>(children->data[i]), exclude, out);
        // Element boundaries separate words
        out.push_back(' ');
    }
}

} // namespace aeo_engine::extraction
