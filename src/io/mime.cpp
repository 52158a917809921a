#include "mailclass/io/mime.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <map>
#include <sstream>
#include "mailclass/util/text.hpp"

namespace mailclass::io {

namespace {

// Nested multiparts deeper than this are ignored.
constexpr int kMaxMultipartDepth = 8;

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string strip_quotes(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        std::string out;
        for (size_t i = 1; i + 1 < s.size(); ++i) {
            if (s[i] == '\\' && i + 2 < s.size()) ++i;
            out.push_back(s[i]);
        }
        return out;
    }
    return s;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string read_rest(std::istream& in) {
    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    body.erase(std::remove(body.begin(), body.end(), '\r'), body.end());
    return body;
}

struct ContentType {
    std::string media_type = "text/plain";
    std::map<std::string, std::string> params;
};

ContentType parse_content_type(const std::string& value) {
    ContentType ct;
    if (trim(value).empty()) return ct;

    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;
    for (char c : value) {
        if (c == '"') quoted = !quoted;
        if (c == ';' && !quoted) {
            fields.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(current);

    ct.media_type = util::to_lower(trim(fields[0]));
    for (size_t i = 1; i < fields.size(); ++i) {
        size_t eq = fields[i].find('=');
        if (eq == std::string::npos) continue;
        std::string key = util::to_lower(trim(fields[i].substr(0, eq)));
        ct.params[key] = strip_quotes(trim(fields[i].substr(eq + 1)));
    }
    return ct;
}

std::string decode_transfer(const std::string& encoding, const std::string& body) {
    if (encoding == "quoted-printable") return decode_quoted_printable(body);
    if (encoding == "base64") return decode_base64(body);
    return body;
}

// Bodies of the parts between "--boundary" lines; preamble and epilogue dropped.
std::vector<std::string> split_multipart(const std::string& body, const std::string& boundary) {
    const std::string delimiter = "--" + boundary;
    const std::string close = delimiter + "--";

    std::vector<std::string> parts;
    std::istringstream in(body);
    std::string line;
    std::string current;
    bool in_part = false;
    bool first_line = true;

    while (std::getline(in, line)) {
        std::string bare = line;
        while (!bare.empty() && (bare.back() == ' ' || bare.back() == '\t')) bare.pop_back();

        if (bare == close) {
            if (in_part) parts.push_back(current);
            return parts;
        }
        if (bare == delimiter) {
            if (in_part) parts.push_back(current);
            current.clear();
            in_part = true;
            first_line = true;
            continue;
        }
        if (in_part) {
            if (!first_line) current.push_back('\n');
            current += line;
            first_line = false;
        }
    }
    // Unterminated multipart: keep what was read.
    if (in_part) parts.push_back(current);
    return parts;
}

void collect_parts(const HeaderList& headers, const std::string& body, Document& doc, int depth) {
    const ContentType ct = parse_content_type(header_value(headers, "content-type"));
    const std::string encoding = util::to_lower(trim(header_value(headers, "content-transfer-encoding")));

    if (ct.media_type.compare(0, 10, "multipart/") == 0) {
        auto boundary = ct.params.find("boundary");
        if (boundary == ct.params.end() || boundary->second.empty() || depth >= kMaxMultipartDepth) {
            return;
        }
        for (const auto& part : split_multipart(body, boundary->second)) {
            std::istringstream in(part);
            HeaderList part_headers = read_headers(in);
            collect_parts(part_headers, read_rest(in), doc, depth + 1);
        }
        return;
    }

    if (ct.media_type.compare(0, 5, "text/") == 0) {
        doc.parts.push_back({ct.media_type, decode_transfer(encoding, body)});
    }
}

std::string joined_header(const HeaderList& headers, const std::string& name) {
    std::string out;
    for (const auto& [key, value] : headers) {
        if (key != name) continue;
        if (!out.empty()) out += ", ";
        out += value;
    }
    return out;
}

} // namespace

// =============================================================================
// Headers
// =============================================================================

HeaderList read_headers(std::istream& in) {
    HeaderList headers;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        if ((line[0] == ' ' || line[0] == '\t') && !headers.empty()) {
            headers.back().second += " " + trim(line);
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        headers.emplace_back(util::to_lower(trim(line.substr(0, colon))), trim(line.substr(colon + 1)));
    }
    return headers;
}

std::string header_value(const HeaderList& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (key == name) return value;
    }
    return "";
}

std::vector<Address> parse_address_list(const std::string& value) {
    std::vector<std::string> pieces;
    std::string current;
    bool quoted = false;
    int angle = 0;
    int paren = 0;
    for (char c : value) {
        if (c == '"' && paren == 0) quoted = !quoted;
        else if (!quoted && c == '<') ++angle;
        else if (!quoted && c == '>' && angle > 0) --angle;
        else if (!quoted && c == '(') ++paren;
        else if (!quoted && c == ')' && paren > 0) --paren;

        if ((c == ',' || c == ';') && !quoted && angle == 0 && paren == 0) {
            pieces.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    pieces.push_back(current);

    std::vector<Address> out;
    for (auto piece : pieces) {
        piece = trim(piece);
        // Group syntax "name: a, b;"
        size_t colon = piece.find(':');
        if (colon != std::string::npos && piece.find('"') > colon && piece.find('<') > colon &&
            piece.find('@') > colon) {
            piece = trim(piece.substr(colon + 1));
        }
        if (piece.empty()) continue;

        Address addr;
        size_t lt = piece.rfind('<');
        size_t gt = piece.find('>', lt == std::string::npos ? 0 : lt);
        if (lt != std::string::npos && gt != std::string::npos) {
            addr.address = trim(piece.substr(lt + 1, gt - lt - 1));
            addr.phrase = decode_encoded_words(strip_quotes(trim(piece.substr(0, lt))));
        } else if (size_t lp = piece.find('('); lp != std::string::npos) {
            size_t rp = piece.find(')', lp);
            addr.address = trim(piece.substr(0, lp));
            addr.phrase = decode_encoded_words(
                trim(piece.substr(lp + 1, rp == std::string::npos ? std::string::npos : rp - lp - 1)));
        } else {
            addr.address = piece;
        }
        out.push_back(std::move(addr));
    }
    return out;
}

// =============================================================================
// Transfer encodings
// =============================================================================

std::string decode_quoted_printable(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c != '=') {
            out.push_back(c);
            continue;
        }
        // Soft line break
        if (i + 1 < text.size() && text[i + 1] == '\n') {
            ++i;
            continue;
        }
        if (i + 2 < text.size() && text[i + 1] == '\r' && text[i + 2] == '\n') {
            i += 2;
            continue;
        }
        if (i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

std::string decode_base64(const std::string& text) {
    std::string out;
    out.reserve(text.size() * 3 / 4);
    uint32_t buffer = 0;
    int bits = 0;
    for (unsigned char c : text) {
        int v;
        if (c >= 'A' && c <= 'Z') v = c - 'A';
        else if (c >= 'a' && c <= 'z') v = c - 'a' + 26;
        else if (c >= '0' && c <= '9') v = c - '0' + 52;
        else if (c == '+') v = 62;
        else if (c == '/') v = 63;
        else if (c == '=') break;
        else continue;

        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

std::string decode_encoded_words(const std::string& text) {
    std::string out;
    size_t pos = 0;
    bool after_word = false;

    while (pos < text.size()) {
        size_t start = text.find("=?", pos);
        if (start == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        size_t q1 = text.find('?', start + 2);
        size_t q2 = q1 == std::string::npos ? std::string::npos : text.find('?', q1 + 1);
        size_t end = q2 == std::string::npos ? std::string::npos : text.find("?=", q2 + 1);
        if (end == std::string::npos || q2 != q1 + 2) {
            out.append(text, pos, start + 2 - pos);
            pos = start + 2;
            after_word = false;
            continue;
        }

        // Whitespace between two encoded words is not part of the text.
        std::string between = text.substr(pos, start - pos);
        if (!(after_word && trim(between).empty())) out += between;

        const char encoding = static_cast<char>(std::toupper(static_cast<unsigned char>(text[q1 + 1])));
        const std::string payload = text.substr(q2 + 1, end - q2 - 1);
        if (encoding == 'B') {
            out += decode_base64(payload);
        } else if (encoding == 'Q') {
            std::string q = payload;
            std::replace(q.begin(), q.end(), '_', ' ');
            out += decode_quoted_printable(q);
        } else {
            out.append(text, start, end + 2 - start);
        }
        pos = end + 2;
        after_word = true;
    }
    return out;
}

// =============================================================================
// Messages
// =============================================================================

Document parse_message(std::istream& in) {
    HeaderList headers = read_headers(in);
    const std::string body = read_rest(in);

    Document doc;
    doc.id = header_value(headers, "message-id");
    doc.to = parse_address_list(joined_header(headers, "to"));
    doc.cc = parse_address_list(joined_header(headers, "cc"));
    doc.from = parse_address_list(joined_header(headers, "from"));
    doc.subject = decode_encoded_words(header_value(headers, "subject"));
    doc.agent = header_value(headers, "x-mailer");
    if (doc.agent.empty()) doc.agent = header_value(headers, "user-agent");

    collect_parts(headers, body, doc, 0);
    return doc;
}

Document parse_message(const std::string& text) {
    std::istringstream in(text);
    return parse_message(in);
}

} // namespace mailclass::io
