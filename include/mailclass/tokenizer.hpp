#pragma once

#include <string>
#include <unordered_set>
#include <vector>
#include "mailclass/document.hpp"
#include "mailclass/types.hpp"

namespace mailclass {

/**
 * Turns a document into its set of distinct tokens.
 *
 * Header tokens carry the context they came from (`to:`, `from:`,
 * `subject:`, `agent:`); body words are untagged. HTML parts add the
 * `html:part` marker plus `url:`, `html:color:` and `html:lang:` tokens
 * taken from the markup before it is stripped.
 */
class TokenExtractor {
public:
    static constexpr const char* kHtmlMarker = "html:part";

    TokenExtractor() = default;
    explicit TokenExtractor(const std::vector<std::string>& ignored_tokens);

    TokenSet extract(const Document& doc) const;

    bool is_ignored(const std::string& word) const;

private:
    void add_word(TokenSet& out, const char* prefix, const std::string& word) const;
    void add_text(TokenSet& out, const char* prefix, const std::string& text) const;
    void add_addresses(TokenSet& out, const char* prefix, const std::vector<Address>& people) const;
    void add_html(TokenSet& out, const std::string& html) const;

    std::unordered_set<std::string> ignored_;
};

} // namespace mailclass
