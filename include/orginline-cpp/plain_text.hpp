/// @file plain_text.hpp
/// @brief Canonical literal-text projection of inline trees.

#pragma once

#include <orginline-cpp/node.hpp>

#include <string>

namespace orginline_cpp {

/// Reduce a node to its literal text.
///
/// Footnote references project their definition (empty if none), links
/// their label, emphasis and scripts their children. Plain, Verbatim,
/// inline LaTeX and resolved entities contribute text. Every other
/// construct, Code included, projects to the empty string.
auto to_plain_text(const Node& node) -> std::string;

/// Concatenate the projection of every node in a sequence.
auto to_plain_text(const Nodes& nodes) -> std::string;

}  // namespace orginline_cpp
