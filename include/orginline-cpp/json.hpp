/// @file json.hpp
/// @brief nlohmann/json serialization of inline trees.
///
/// Every node is a JSON object tagged by `"type"` (see Node::type_name())
/// with its payload as sibling fields. Serialization is lossless:
/// from_json(to_json(n)) == n for every tree.

#pragma once

#include <orginline-cpp/datetime.hpp>
#include <orginline-cpp/entity.hpp>
#include <orginline-cpp/node.hpp>

#include <nlohmann/json.hpp>

namespace orginline_cpp {

// -- Date / time --------------------------------------------------------------

void to_json(nlohmann::json& j, const Date& d);
void from_json(const nlohmann::json& j, Date& d);

void to_json(nlohmann::json& j, const Time& t);
void from_json(const nlohmann::json& j, Time& t);

void to_json(nlohmann::json& j, const Repeater& r);
void from_json(const nlohmann::json& j, Repeater& r);

void to_json(nlohmann::json& j, const Stamp& s);
void from_json(const nlohmann::json& j, Stamp& s);

// -- Payloads -----------------------------------------------------------------

void to_json(nlohmann::json& j, const Entity& e);
void from_json(const nlohmann::json& j, Entity& e);

void to_json(nlohmann::json& j, const Url& u);
void from_json(const nlohmann::json& j, Url& u);

// -- Node ---------------------------------------------------------------------

/// Serialize a node (and its subtree).
void to_json(nlohmann::json& j, const Node& n);

/// Deserialize a node.
/// @throws std::runtime_error on an unknown tag or a missing field.
void from_json(const nlohmann::json& j, Node& n);

/// Serialize a sequence as a JSON array.
auto nodes_to_json(const Nodes& nodes) -> nlohmann::json;

/// Deserialize a JSON array of nodes.
/// @throws std::runtime_error if `j` is not an array of nodes.
auto nodes_from_json(const nlohmann::json& j) -> Nodes;

}  // namespace orginline_cpp
