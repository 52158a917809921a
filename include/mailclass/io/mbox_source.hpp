#pragma once

#include <istream>
#include <string>
#include <vector>
#include "mailclass/document.hpp"

namespace mailclass::io {

/**
 * Unix mbox file. A message starts at a "From " line that follows a blank
 * line or precedes the first message. ">From " escapes in bodies are undone.
 */
class MboxSource : public DocumentSource {
public:
    explicit MboxSource(std::string path);

    std::string name() const override { return path_; }

    // Throws ResourceError when the file can't be opened or read.
    std::vector<Document> documents() const override;

    // Messages of an mbox stream; ids default to "<origin>#<n>".
    static std::vector<Document> read_mbox(std::istream& in, const std::string& origin);

private:
    std::string path_;
};

} // namespace mailclass::io
