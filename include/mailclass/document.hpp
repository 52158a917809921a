#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mailclass {

struct Address {
    std::string phrase;    // display name, may be empty
    std::string address;   // local@domain, may be empty
};

struct BodyPart {
    std::string media_type;   // e.g. "text/plain", lower case
    std::string text;         // transfer-decoded content

    bool is_text() const { return media_type.compare(0, 5, "text/") == 0; }
    bool is_html() const { return media_type == "text/html"; }
};

/**
 * A parsed message as seen by the tokenizer.
 */
struct Document {
    std::string id;
    std::vector<Address> to;
    std::vector<Address> cc;
    std::vector<Address> from;
    std::string subject;
    std::string agent;
    std::vector<BodyPart> parts;
};

/**
 * A collection of documents, e.g. one mailbox.
 *
 * documents() throws ResourceError when the underlying container cannot be
 * opened or read.
 */
class DocumentSource {
public:
    virtual ~DocumentSource() = default;

    virtual std::string name() const = 0;
    virtual std::vector<Document> documents() const = 0;
};

class MemorySource : public DocumentSource {
public:
    MemorySource(std::string name, std::vector<Document> docs)
        : name_(std::move(name)), docs_(std::move(docs)) {}

    std::string name() const override { return name_; }
    std::vector<Document> documents() const override { return docs_; }

private:
    std::string name_;
    std::vector<Document> docs_;
};

// One labeled source of a corpus.
struct LabeledSource {
    std::shared_ptr<const DocumentSource> source;
    std::string category;
};

using Corpus = std::vector<LabeledSource>;

} // namespace mailclass
