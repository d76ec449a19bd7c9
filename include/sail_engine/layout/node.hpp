/// @file node.hpp
/// @brief Layout tree node for sail_layout module

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sail_layout {

// =============================================================================
// NodeKind
// =============================================================================

/// @brief Node variant tag
enum class NodeKind : std::uint8_t {
    Container,
    Label,
    Image,
    Button
};

[[nodiscard]] const char* node_kind_name(NodeKind kind) noexcept;
[[nodiscard]] std::optional<NodeKind> node_kind_from_name(std::string_view name) noexcept;

// =============================================================================
// Payloads
// =============================================================================

/// @brief Container payload; children are owned by the Node itself
struct ContainerData {
    std::optional<ImageDesc> background;

    bool operator==(const ContainerData&) const = default;
};

/// @brief Image payload
struct ImageData {
    ImageDesc image;

    bool operator==(const ImageData&) const = default;
};

using NodePayload = std::variant<ContainerData, TextDesc, ImageData, ButtonDesc>;

// =============================================================================
// Node
// =============================================================================

/// @brief One element of the layout tree
///
/// Nodes own their children. Only containers may have children; the tree is
/// built once and afterwards only read.
class Node {
public:
    using Children = std::vector<std::unique_ptr<Node>>;
    using Visitor = std::function<void(const Node&, std::size_t depth)>;

    Node(Transform transform, NodePayload payload);
    ~Node() = default;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // Factories
    [[nodiscard]] static std::unique_ptr<Node> container(
        Transform transform, std::optional<ImageDesc> background = std::nullopt);
    [[nodiscard]] static std::unique_ptr<Node> label(Transform transform, TextDesc text);
    [[nodiscard]] static std::unique_ptr<Node> image(Transform transform, ImageDesc image);
    [[nodiscard]] static std::unique_ptr<Node> button(Transform transform, ButtonDesc button);

    // Identity
    [[nodiscard]] NodeKind kind() const noexcept { return static_cast<NodeKind>(m_payload.index()); }
    [[nodiscard]] bool is_container() const noexcept { return kind() == NodeKind::Container; }
    [[nodiscard]] const std::string& id() const noexcept { return m_transform.id; }

    // Transform
    [[nodiscard]] const Transform& transform() const noexcept { return m_transform; }
    [[nodiscard]] Transform& transform_mut() noexcept { return m_transform; }

    // Payload
    [[nodiscard]] const NodePayload& payload() const noexcept { return m_payload; }

    /// @brief Container background, nullptr when absent or not a container
    [[nodiscard]] const ImageDesc* background() const;
    [[nodiscard]] const TextDesc* as_label() const { return std::get_if<TextDesc>(&m_payload); }
    [[nodiscard]] TextDesc* as_label_mut() { return std::get_if<TextDesc>(&m_payload); }
    [[nodiscard]] const ImageData* as_image() const { return std::get_if<ImageData>(&m_payload); }
    [[nodiscard]] const ButtonDesc* as_button() const { return std::get_if<ButtonDesc>(&m_payload); }
    [[nodiscard]] ButtonDesc* as_button_mut() { return std::get_if<ButtonDesc>(&m_payload); }

    // Hierarchy
    [[nodiscard]] Node* parent() const noexcept { return m_parent; }
    [[nodiscard]] const Children& children() const noexcept { return m_children; }
    [[nodiscard]] std::size_t child_count() const noexcept { return m_children.size(); }
    [[nodiscard]] Node* child(std::size_t index) const;

    /// @brief Append a child; returns nullptr (and drops nothing) if this is not a container
    Node* add_child(std::unique_ptr<Node> child);

    /// @brief Position among the parent's children, 0 for the root
    [[nodiscard]] std::size_t index_in_parent() const;

    /// @brief Structural path from the root, e.g. "Container.children[2]"
    [[nodiscard]] std::string path() const;

    // Queries
    /// @brief First node with the given id in pre-order, including this one
    [[nodiscard]] const Node* find(std::string_view id) const;

    /// @brief Pre-order traversal
    void visit(const Visitor& visitor) const;

    /// @brief Number of nodes in this subtree, including this one
    [[nodiscard]] std::size_t subtree_size() const;

    /// @brief Deep copy
    [[nodiscard]] std::unique_ptr<Node> clone() const;

    /// @brief Deep structural comparison of transform, payload and children
    bool operator==(const Node& other) const;
    bool operator!=(const Node& other) const { return !(*this == other); }

private:
    void visit_impl(const Visitor& visitor, std::size_t depth) const;

    Transform m_transform;
    NodePayload m_payload;
    Node* m_parent = nullptr;
    Children m_children;
};

} // namespace sail_layout
