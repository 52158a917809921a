#pragma once

#include <istream>
#include <string>
#include <utility>
#include <vector>
#include "mailclass/document.hpp"

namespace mailclass::io {

// Header fields in file order; names are lower-cased, folded lines joined.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * Split an RFC 822 message into its header fields and body. Reading stops
 * at the end of the stream.
 */
HeaderList read_headers(std::istream& in);

// First value of `name` (lower case), or empty.
std::string header_value(const HeaderList& headers, const std::string& name);

// "Name <a@b>", "a@b (Name)" and bare addresses, comma separated.
std::vector<Address> parse_address_list(const std::string& value);

std::string decode_quoted_printable(const std::string& text);
std::string decode_base64(const std::string& text);

// RFC 2047 encoded words (=?charset?B|Q?...?=); charsets are not converted.
std::string decode_encoded_words(const std::string& text);

/**
 * Build a Document from one message. Text parts are collected from
 * single-part bodies and from multipart/* bodies (recursively); every part
 * is transfer-decoded.
 */
Document parse_message(std::istream& in);
Document parse_message(const std::string& text);

} // namespace mailclass::io
