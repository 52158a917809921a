#pragma once

#include <string>
#include <vector>

namespace mailclass::util {

struct TagAttribute {
    std::string tag;     // lower case element name
    std::string name;    // lower case attribute name
    std::string value;   // raw value, quotes removed
};

// Every attribute of every start tag, in document order.
std::vector<TagAttribute> extract_attributes(const std::string& html);

// Drop comments, script/style content and tags. Tags become a single space
// so that words on both sides stay apart.
std::string strip_markup(const std::string& html);

// Decode named (amp, lt, gt, quot, apos, nbsp) and numeric entities.
// Unknown entities are kept verbatim.
std::string decode_entities(const std::string& text);

// Host part of an absolute URL ("http://user@Host:80/x" -> "host"), or the
// address of a mailto: link. Empty when the value is neither.
std::string link_target(const std::string& url);

} // namespace mailclass::util
