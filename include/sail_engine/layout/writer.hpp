/// @file writer.hpp
/// @brief Encoder from layout documents back to RON

#pragma once

#include "fwd.hpp"
#include "document.hpp"

#include <sail_engine/ron/value.hpp>
#include <sail_engine/ron/writer.hpp>

#include <optional>
#include <string>

namespace sail_layout {

/// @brief Encoder behaviour
struct LayoutWriterOptions {
    sail_ron::WriterOptions format;
    bool omit_defaults = true;          ///< Skip fields equal to their default value
    std::optional<bool> implicit_some;  ///< Override the document's implicit_some extension
};

/// @brief Serializes layout trees to RON text
///
/// Output read back through LayoutReader yields an equal tree.
class LayoutWriter {
public:
    LayoutWriter() = default;
    explicit LayoutWriter(LayoutWriterOptions options) : m_options(std::move(options)) {}

    [[nodiscard]] std::string write(const LayoutDocument& doc) const;
    [[nodiscard]] sail_ron::Document to_ron(const LayoutDocument& doc) const;

    /// @brief Encode one subtree; optionals are bare when implicit_some is true
    [[nodiscard]] sail_ron::Value to_value(const Node& node, bool implicit_some = false) const;

    /// @brief Float as a RON value in shortest single-precision form
    [[nodiscard]] static sail_ron::Value float_value(float v);

    [[nodiscard]] const LayoutWriterOptions& options() const noexcept { return m_options; }

private:
    struct Context {
        bool implicit_some = false;
    };

    [[nodiscard]] sail_ron::Value encode_node(const Node& node, const Context& ctx) const;
    [[nodiscard]] sail_ron::Value encode_transform(const Transform& t) const;
    [[nodiscard]] sail_ron::Value encode_text(const TextDesc& text, const Context& ctx) const;
    [[nodiscard]] sail_ron::Value encode_button(const ButtonDesc& button, const Context& ctx) const;

    [[nodiscard]] static sail_ron::Value encode_stretch(const Stretch& stretch);
    [[nodiscard]] static sail_ron::Value encode_color(const Color& color);
    [[nodiscard]] static sail_ron::Value encode_asset(const AssetRef& asset);
    [[nodiscard]] static sail_ron::Value encode_image(const ImageDesc& image, bool omit_defaults);
    [[nodiscard]] static sail_ron::Value wrap_optional(sail_ron::Value value, const Context& ctx);

    LayoutWriterOptions m_options;
};

} // namespace sail_layout
