/// @file orginline.hpp
/// @brief Umbrella header for the orginline-cpp library.
///
/// Include this single header for access to all public types:
/// Session, Node and its alternatives, ParseOptions, EntityTable,
/// the date/time sub-grammar, the plain-text projector and Error.

#pragma once

#include <orginline-cpp/datetime.hpp>
#include <orginline-cpp/entity.hpp>
#include <orginline-cpp/error.hpp>
#include <orginline-cpp/node.hpp>
#include <orginline-cpp/options.hpp>
#include <orginline-cpp/plain_text.hpp>
#include <orginline-cpp/session.hpp>
