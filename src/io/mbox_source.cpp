#include "mailclass/io/mbox_source.hpp"

#include <fstream>
#include <sstream>
#include "mailclass/error.hpp"
#include "mailclass/io/mime.hpp"
#include "mailclass/logging.hpp"

namespace mailclass::io {

namespace {

bool is_separator(const std::string& line) {
    return line.compare(0, 5, "From ") == 0;
}

// ">From ", ">>From " ... lose one '>'.
void unescape_from(std::string& line) {
    size_t i = 0;
    while (i < line.size() && line[i] == '>') ++i;
    if (i > 0 && line.compare(i, 5, "From ") == 0) line.erase(0, 1);
}

} // namespace

MboxSource::MboxSource(std::string path)
    : path_(std::move(path)) {}

std::vector<Document> MboxSource::documents() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        throw ResourceError("Can't open mailbox '" + path_ + "'", "MboxSource::documents");
    }
    std::vector<Document> docs = read_mbox(file, path_);
    if (file.bad()) {
        throw ResourceError("Read failed on mailbox '" + path_ + "'", "MboxSource::documents");
    }
    LOG_DEBUG(docs.size(), " messages in mailbox ", path_);
    return docs;
}

std::vector<Document> MboxSource::read_mbox(std::istream& in, const std::string& origin) {
    std::vector<Document> docs;
    std::string message;
    bool have_message = false;
    bool previous_blank = true;

    auto flush = [&]() {
        if (!have_message) return;
        Document doc = parse_message(message);
        if (doc.id.empty()) doc.id = origin + "#" + std::to_string(docs.size());
        docs.push_back(std::move(doc));
        message.clear();
    };

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if ((previous_blank || !have_message) && is_separator(line)) {
            flush();
            have_message = true;
            previous_blank = false;
            continue;
        }
        previous_blank = line.empty();
        if (!have_message) continue;

        unescape_from(line);
        message += line;
        message.push_back('\n');
    }
    flush();
    return docs;
}

} // namespace mailclass::io
