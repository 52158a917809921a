#include "mailclass/tokenizer.hpp"
#include "mailclass/util/html.hpp"
#include "mailclass/util/text.hpp"

namespace mailclass {

TokenExtractor::TokenExtractor(const std::vector<std::string>& ignored_tokens) {
    for (const auto& token : ignored_tokens) {
        if (!token.empty()) ignored_.insert(util::to_lower(token));
    }
}

bool TokenExtractor::is_ignored(const std::string& word) const {
    return !ignored_.empty() && ignored_.count(util::to_lower(word)) > 0;
}

void TokenExtractor::add_word(TokenSet& out, const char* prefix, const std::string& word) const {
    if (!util::is_acceptable_token(word)) return;
    if (is_ignored(word)) return;
    out.insert(std::string(prefix) + word);
}

void TokenExtractor::add_text(TokenSet& out, const char* prefix, const std::string& text) const {
    for (const auto& word : util::split_words(text)) {
        add_word(out, prefix, word);
    }
}

void TokenExtractor::add_addresses(TokenSet& out, const char* prefix,
                                   const std::vector<Address>& people) const {
    for (const auto& person : people) {
        if (!person.phrase.empty()) add_text(out, prefix, person.phrase);
        if (!person.address.empty()) add_word(out, prefix, util::to_lower(person.address));
    }
}

void TokenExtractor::add_html(TokenSet& out, const std::string& html) const {
    out.insert(kHtmlMarker);

    for (const auto& attr : util::extract_attributes(html)) {
        if (attr.name == "href" || attr.name == "src" || attr.name == "action") {
            std::string target = util::link_target(attr.value);
            if (!target.empty()) add_word(out, "url:", target);
        } else if (attr.name == "color" || attr.name == "bgcolor") {
            add_word(out, "html:color:", util::to_lower(attr.value));
        } else if (attr.name == "lang" || attr.name == "xml:lang") {
            add_word(out, "html:lang:", util::to_lower(attr.value));
        }
    }

    add_text(out, "", util::decode_entities(util::strip_markup(html)));
}

TokenSet TokenExtractor::extract(const Document& doc) const {
    TokenSet tokens;

    add_addresses(tokens, "to:", doc.to);
    add_addresses(tokens, "to:", doc.cc);
    add_addresses(tokens, "from:", doc.from);
    add_text(tokens, "subject:", doc.subject);
    add_text(tokens, "agent:", doc.agent);

    for (const auto& part : doc.parts) {
        if (!part.is_text()) continue;
        if (part.is_html()) {
            add_html(tokens, part.text);
        } else {
            add_text(tokens, "", part.text);
        }
    }
    return tokens;
}

} // namespace mailclass
