#include "mailclass/util/html.hpp"
#include "mailclass/util/text.hpp"

#include <cctype>
#include <cstdlib>
#include <unordered_map>

namespace mailclass::util {

namespace {

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline bool is_name_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '-' || c == '_' || c == ':';
}

bool starts_with_nocase(const std::string& s, size_t pos, const char* prefix) {
    for (size_t k = 0; prefix[k]; ++k) {
        if (pos + k >= s.size()) return false;
        if (std::tolower(static_cast<unsigned char>(s[pos + k])) != prefix[k]) return false;
    }
    return true;
}

// Index just past the '>' closing the tag opened at `pos`, honouring quotes.
size_t skip_tag(const std::string& html, size_t pos) {
    char quote = 0;
    for (size_t i = pos + 1; i < html.size(); ++i) {
        char c = html[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '>') {
            return i + 1;
        }
    }
    return html.size();
}

size_t skip_comment(const std::string& html, size_t pos) {
    size_t end = html.find("-->", pos + 4);
    return end == std::string::npos ? html.size() : end + 3;
}

std::string read_tag_name(const std::string& html, size_t& i) {
    std::string name;
    while (i < html.size() && is_name_char(html[i])) {
        name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(html[i]))));
        ++i;
    }
    return name;
}

const std::unordered_map<std::string, std::string>& named_entities() {
    static const std::unordered_map<std::string, std::string> entities = {
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""},
        {"apos", "'"}, {"nbsp", " "},
    };
    return entities;
}

} // namespace

std::vector<TagAttribute> extract_attributes(const std::string& html) {
    std::vector<TagAttribute> out;
    size_t i = 0;
    while (i < html.size()) {
        if (html[i] != '<') { ++i; continue; }
        if (html.compare(i, 4, "<!--") == 0) { i = skip_comment(html, i); continue; }
        if (i + 1 >= html.size() || !std::isalpha(static_cast<unsigned char>(html[i + 1]))) {
            ++i;
            continue;
        }

        ++i;
        std::string tag = read_tag_name(html, i);
        while (i < html.size()) {
            while (i < html.size() && is_space(html[i])) ++i;
            if (i >= html.size()) break;
            if (html[i] == '>') { ++i; break; }
            if (html[i] == '/') { ++i; continue; }

            std::string name = read_tag_name(html, i);
            if (name.empty()) { ++i; continue; }
            while (i < html.size() && is_space(html[i])) ++i;

            std::string value;
            if (i < html.size() && html[i] == '=') {
                ++i;
                while (i < html.size() && is_space(html[i])) ++i;
                if (i < html.size() && (html[i] == '"' || html[i] == '\'')) {
                    char quote = html[i++];
                    size_t end = html.find(quote, i);
                    if (end == std::string::npos) end = html.size();
                    value = html.substr(i, end - i);
                    i = end < html.size() ? end + 1 : end;
                } else {
                    size_t start = i;
                    while (i < html.size() && !is_space(html[i]) && html[i] != '>') ++i;
                    value = html.substr(start, i - start);
                }
            }
            out.push_back({tag, std::move(name), std::move(value)});
        }
    }
    return out;
}

std::string strip_markup(const std::string& html) {
    std::string out;
    out.reserve(html.size());
    size_t i = 0;
    while (i < html.size()) {
        char c = html[i];
        if (c != '<') { out.push_back(c); ++i; continue; }

        if (html.compare(i, 4, "<!--") == 0) {
            i = skip_comment(html, i);
            out.push_back(' ');
            continue;
        }

        char next = i + 1 < html.size() ? html[i + 1] : '\0';
        if (!(std::isalpha(static_cast<unsigned char>(next)) || next == '/' || next == '!' || next == '?')) {
            out.push_back(c);
            ++i;
            continue;
        }

        size_t name_pos = i + 1;
        std::string name = read_tag_name(html, name_pos);
        i = skip_tag(html, i);
        if (name == "script" || name == "style") {
            std::string closing = "</" + name;
            size_t j = i;
            while (j < html.size() && !starts_with_nocase(html, j, closing.c_str())) ++j;
            i = j < html.size() ? skip_tag(html, j) : html.size();
        }
        out.push_back(' ');
    }
    return out;
}

std::string decode_entities(const std::string& text) {
    static constexpr size_t kMaxEntityLength = 10;

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') { out.push_back(text[i++]); continue; }

        size_t semi = text.find(';', i + 1);
        if (semi == std::string::npos || semi - i - 1 > kMaxEntityLength || semi == i + 1) {
            out.push_back(text[i++]);
            continue;
        }

        std::string body = text.substr(i + 1, semi - i - 1);
        bool decoded = false;
        if (body[0] == '#') {
            bool hex = body.size() > 1 && (body[1] == 'x' || body[1] == 'X');
            std::string digits = body.substr(hex ? 2 : 1);
            if (!digits.empty()) {
                char* end = nullptr;
                unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
                if (end && *end == '\0') {
                    // Out-of-range values (strtoul saturates) become U+FFFD.
                    if (cp > 0x10FFFF) cp = 0xFFFD;
                    out += encode_utf8(static_cast<uint32_t>(cp));
                    decoded = true;
                }
            }
        } else {
            const auto& entities = named_entities();
            auto it = entities.find(to_lower(body));
            if (it != entities.end()) {
                out += it->second;
                decoded = true;
            }
        }

        if (decoded) {
            i = semi + 1;
        } else {
            out.push_back(text[i++]);
        }
    }
    return out;
}

std::string link_target(const std::string& url) {
    size_t start = 0;
    while (start < url.size() && is_space(url[start])) ++start;
    std::string value = to_lower(url.substr(start));

    if (value.compare(0, 7, "mailto:") == 0) {
        std::string address = value.substr(7);
        size_t query = address.find('?');
        if (query != std::string::npos) address.erase(query);
        while (!address.empty() && is_space(address.back())) address.pop_back();
        return address;
    }

    size_t scheme_end = value.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) return "";
    for (size_t k = 0; k < scheme_end; ++k) {
        if (!std::isalpha(static_cast<unsigned char>(value[k]))) return "";
    }

    std::string host = value.substr(scheme_end + 3);
    size_t path = host.find_first_of("/?#");
    if (path != std::string::npos) host.erase(path);
    size_t at = host.rfind('@');
    if (at != std::string::npos) host.erase(0, at + 1);
    size_t port = host.find(':');
    if (port != std::string::npos) host.erase(port);
    while (!host.empty() && host.back() == '.') host.pop_back();
    return host;
}

} // namespace mailclass::util
