#pragma once

#include <string>
#include <vector>
#include <gumbo.h>

namespace aeo_engine::extraction {

/**
 * A small subset of CSS selectors evaluated against gumbo nodes.
 *
 * Supported: comma-separated groups, descendant combinator (whitespace),
 * type selectors (`div`, `*`), `.class`, `#id`, `[attr]`, `[attr=v]`,
 * `[attr*=v]`, `[attr^=v]` and `[attr$=v]`. Values may be quoted.
 */
class Selector {
public:
    static Selector parse(const std::string& selector);

    bool matches(const GumboNode* node) const;

    bool empty() const { return alternatives_.empty(); }

private:
    enum class AttributeOp { EXISTS, EQUALS, CONTAINS, PREFIX, SUFFIX, CLASS_TOKEN };

    struct AttributeTest {
        std::string name;
        AttributeOp op = AttributeOp::EXISTS;
        std::string value;
    };

    struct Compound {
        std::string tag;  // empty or "*" matches any element
        std::vector<AttributeTest> tests;
    };

    // Compounds of one selector, left to right; the last must match the node itself
    using Chain = std::vector<Compound>;

    static Compound parseCompound(const std::string& text);
    static bool matchesCompound(const Compound& compound, const GumboNode* node);
    static bool matchesChain(const Chain& chain, const GumboNode* node);

    std::vector<Chain> alternatives_;
};

// Owns a gumbo parse tree for the lifetime of the object
class HtmlDocument {
public:
    explicit HtmlDocument(const std::string& html);
    ~HtmlDocument();

    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    const GumboNode* root() const;

    // Elements matching the selector in document order
    std::vector<const GumboNode*> select(const std::string& selector) const;
    std::vector<const GumboNode*> select(const Selector& selector) const;
    std::vector<const GumboNode*> selectWithin(const GumboNode* scope, const std::string& selector) const;

    const GumboNode* selectFirst(const std::string& selector) const;
    size_t count(const std::string& selector) const;
    bool exists(const std::string& selector) const;

    // Text of the <title> element, whitespace-collapsed
    std::string title() const;

    // Whitespace-collapsed text of <body> (script/style excluded)
    std::string bodyText() const;

    static std::string attribute(const GumboNode* node, const std::string& name);
    static bool hasAttribute(const GumboNode* node, const std::string& name);
    static std::string tagName(const GumboNode* node);
    static bool isElement(const GumboNode* node);

    // Whitespace-collapsed text of the subtree; script, style, noscript and template are skipped
    static std::string text(const GumboNode* node);
    // Same, additionally skipping subtrees that match `exclude`
    static std::string text(const GumboNode* node, const Selector& exclude);

    // Raw concatenated text of the subtree without whitespace collapsing (used for <script> bodies)
    static std::string rawText(const GumboNode* node);

    static const GumboNode* nextElementSibling(const GumboNode* node);

private:
    static void collect(const GumboNode* node, const Selector& selector, std::vector<const GumboNode*>& out);
    static void appendText(const GumboNode* node, const Selector* exclude, std::string& out);

    GumboOutput* output_;
};

} // namespace aeo_engine::extraction
