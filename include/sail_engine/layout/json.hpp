/// @file json.hpp
/// @brief JSON interchange for layout documents

#pragma once

#include "fwd.hpp"
#include "document.hpp"

#include <sail_engine/core/error.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace sail_layout {

/// @brief Convert a layout document to JSON
///
/// Same tree shape as the RON form. Every transform field is written, enum
/// values become strings, image variants carry a "type" tag, and asset
/// loader options are kept as compact RON text.
[[nodiscard]] nlohmann::json to_json(const LayoutDocument& doc);

/// @brief Convert one subtree to JSON
[[nodiscard]] nlohmann::json node_to_json(const Node& node);

/// @brief Rebuild a layout document from its JSON form
[[nodiscard]] sail_core::Result<LayoutDocument> layout_from_json(const nlohmann::json& j);

/// @brief Parse JSON text, then rebuild the document
[[nodiscard]] sail_core::Result<LayoutDocument> layout_from_json_string(const std::string& text);

} // namespace sail_layout
