#include "restcore/core/body_codecs.h"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/xml_parser.hpp>

namespace restcore::core {

BodyCodecs::BodyCodecs()
    : default_(decode_json) {
    add("application/xml", decode_xml);
}

void BodyCodecs::add(std::string content_type, Decoder decoder) {
    decoders_[std::move(content_type)] = std::move(decoder);
}

void BodyCodecs::set_default(Decoder decoder) {
    default_ = std::move(decoder);
}

const BodyCodecs::Decoder& BodyCodecs::find(std::string_view content_type) const {
    auto it = decoders_.find(content_type);
    return it != decoders_.end() ? it->second : default_;
}

Tree decode_json(std::istream& in) {
    Tree tree;
    boost::property_tree::read_json(in, tree);
    return tree;
}

Tree decode_xml(std::istream& in) {
    Tree document;
    boost::property_tree::read_xml(
        in, document,
        boost::property_tree::xml_parser::trim_whitespace | boost::property_tree::xml_parser::no_comments);
    if (document.size() == 1) {
        return document.front().second;
    }
    return document;
}

} // namespace restcore::core
