/// @file document.hpp
/// @brief Loaded layout document with id index

#pragma once

#include "fwd.hpp"
#include "node.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sail_layout {

/// @brief How an asset is consumed by its node
enum class AssetUsage : std::uint8_t {
    Font,
    Texture
};

[[nodiscard]] const char* asset_usage_name(AssetUsage usage) noexcept;

/// @brief One asset reference found in the tree
struct AssetUse {
    const Node* node = nullptr;
    const AssetRef* asset = nullptr;
    AssetUsage usage = AssetUsage::Texture;
    std::string path;  ///< Field path, e.g. "Container.children[0].background.tex"
};

/// @brief Root node plus RON extensions and an id index
///
/// The index maps every non-empty id to its first occurrence in pre-order.
/// Call reindex() after mutating the tree through root_mut().
class LayoutDocument {
public:
    LayoutDocument() = default;
    explicit LayoutDocument(std::unique_ptr<Node> root, std::vector<std::string> extensions = {});

    LayoutDocument(LayoutDocument&&) noexcept = default;
    LayoutDocument& operator=(LayoutDocument&&) noexcept = default;

    [[nodiscard]] bool empty() const noexcept { return !m_root; }

    /// @pre !empty(); a default-constructed document has no root
    [[nodiscard]] const Node& root() const { return *m_root; }
    /// @pre !empty()
    [[nodiscard]] Node& root_mut() { return *m_root; }

    [[nodiscard]] const std::vector<std::string>& extensions() const noexcept { return m_extensions; }
    [[nodiscard]] bool has_extension(std::string_view name) const;
    void set_extensions(std::vector<std::string> extensions) { m_extensions = std::move(extensions); }

    /// @brief Node with the given id, nullptr if none
    [[nodiscard]] const Node* find(std::string_view id) const;

    /// @brief Every node with the given id, in pre-order
    [[nodiscard]] std::vector<const Node*> find_all(std::string_view id) const;

    /// @brief Non-empty ids in pre-order, duplicates included
    [[nodiscard]] std::vector<std::string> ids() const;

    [[nodiscard]] std::size_t node_count() const;

    /// @brief Every asset reference with its usage, in pre-order
    [[nodiscard]] std::vector<AssetUse> asset_refs() const;

    /// @brief Rebuild the id index
    void reindex();

    /// @brief Deep copy
    [[nodiscard]] LayoutDocument clone() const;

private:
    std::unique_ptr<Node> m_root;
    std::vector<std::string> m_extensions;
    std::unordered_map<std::string, const Node*> m_index;
};

} // namespace sail_layout
