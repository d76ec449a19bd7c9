/// @file reader.hpp
/// @brief Decoder from RON value trees to layout documents

#pragma once

#include "fwd.hpp"
#include "document.hpp"

#include <sail_engine/core/error.hpp>
#include <sail_engine/ron/value.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace sail_layout {

/// @brief Decoder behaviour
struct ReaderOptions {
    /// Unknown fields are errors when true, logged and skipped otherwise
    bool strict_fields = true;
};

/// @brief Maps parsed RON onto Node trees
///
/// Node variants are named structs (`Container(...)`, `Label(...)`, ...).
/// Optional fields accept `Some(x)`, bare `x`, or `None`. Every error
/// carries the structural path of the offending value.
class LayoutReader {
public:
    LayoutReader() = default;
    explicit LayoutReader(ReaderOptions options) : m_options(options) {}

    [[nodiscard]] sail_core::Result<LayoutDocument> read(const sail_ron::Document& doc) const;
    [[nodiscard]] sail_core::Result<LayoutDocument> read_string(
        std::string_view source, std::string_view source_name = "<string>") const;
    [[nodiscard]] sail_core::Result<LayoutDocument> read_file(const std::filesystem::path& path) const;

    /// @brief Decode a single node subtree
    [[nodiscard]] sail_core::Result<std::unique_ptr<Node>> read_node(
        const sail_ron::Value& value, const std::string& path = {}) const;

    [[nodiscard]] const ReaderOptions& options() const noexcept { return m_options; }

private:
    ReaderOptions m_options;
};

} // namespace sail_layout
