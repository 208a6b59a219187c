#pragma once

#include "restcore/core/serialization.h"

#include <functional>
#include <istream>
#include <map>
#include <string>
#include <string_view>

namespace restcore::core {

// Maps a request Content-Type to the parser turning its payload into a tree.
// Lookup is by exact value; anything unknown goes to the default decoder.
class BodyCodecs {
public:
    using Decoder = std::function<Tree(std::istream&)>;

    // application/xml -> XML, everything else -> JSON.
    BodyCodecs();

    void add(std::string content_type, Decoder decoder);
    void set_default(Decoder decoder);

    const Decoder& find(std::string_view content_type) const;

private:
    std::map<std::string, Decoder, std::less<>> decoders_;
    Decoder default_;
};

Tree decode_json(std::istream& in);

// A document with a single root element is unwrapped to that element.
Tree decode_xml(std::istream& in);

} // namespace restcore::core
