#pragma once

#include <boost/property_tree/ptree.hpp>
#include <nlohmann/json.hpp>

namespace restcore::core {

// Request bodies, whatever their format, are decoded into a property tree.
// XML responses are written from one. JSON responses are written from a
// typed json document so numbers and booleans keep their JSON types.
//
// A type bound from a request body provides, in its own namespace:
//     void from_ptree(const restcore::core::Tree& tree, T& value);
// A type written by an XML envelope provides:
//     void to_ptree(restcore::core::Tree& tree, const T& value);
// A type written by a JSON envelope provides:
//     void to_json(restcore::core::Json& json, const T& value);
using Tree = boost::property_tree::ptree;
using Json = nlohmann::json;

inline void to_ptree(Tree& tree, const Tree& value) {
    tree = value;
}

inline void from_ptree(const Tree& tree, Tree& value) {
    value = tree;
}

} // namespace restcore::core
