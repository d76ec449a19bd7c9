/// @file node.cpp
/// @brief Layout tree node implementation

#include <sail_engine/layout/node.hpp>

namespace sail_layout {

// =============================================================================
// NodeKind
// =============================================================================

const char* node_kind_name(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::Container: return "Container";
        case NodeKind::Label: return "Label";
        case NodeKind::Image: return "Image";
        case NodeKind::Button: return "Button";
    }
    return "Container";
}

std::optional<NodeKind> node_kind_from_name(std::string_view name) noexcept {
    if (name == "Container") return NodeKind::Container;
    if (name == "Label") return NodeKind::Label;
    if (name == "Image") return NodeKind::Image;
    if (name == "Button") return NodeKind::Button;
    return std::nullopt;
}

// =============================================================================
// Node
// =============================================================================

Node::Node(Transform transform, NodePayload payload)
    : m_transform(std::move(transform))
    , m_payload(std::move(payload)) {}

std::unique_ptr<Node> Node::container(Transform transform, std::optional<ImageDesc> background) {
    return std::make_unique<Node>(std::move(transform), ContainerData{std::move(background)});
}

std::unique_ptr<Node> Node::label(Transform transform, TextDesc text) {
    return std::make_unique<Node>(std::move(transform), std::move(text));
}

std::unique_ptr<Node> Node::image(Transform transform, ImageDesc image) {
    return std::make_unique<Node>(std::move(transform), ImageData{std::move(image)});
}

std::unique_ptr<Node> Node::button(Transform transform, ButtonDesc button) {
    return std::make_unique<Node>(std::move(transform), std::move(button));
}

const ImageDesc* Node::background() const {
    const auto* data = std::get_if<ContainerData>(&m_payload);
    if (!data || !data->background) {
        return nullptr;
    }
    return &*data->background;
}

Node* Node::child(std::size_t index) const {
    return index < m_children.size() ? m_children[index].get() : nullptr;
}

Node* Node::add_child(std::unique_ptr<Node> child) {
    if (!child || !is_container()) {
        return nullptr;
    }
    child->m_parent = this;
    m_children.push_back(std::move(child));
    return m_children.back().get();
}

std::size_t Node::index_in_parent() const {
    if (!m_parent) {
        return 0;
    }
    const auto& siblings = m_parent->m_children;
    for (std::size_t i = 0; i < siblings.size(); ++i) {
        if (siblings[i].get() == this) {
            return i;
        }
    }
    return 0;
}

std::string Node::path() const {
    if (!m_parent) {
        return node_kind_name(kind());
    }
    return m_parent->path() + ".children[" + std::to_string(index_in_parent()) + "]";
}

const Node* Node::find(std::string_view id) const {
    if (!m_transform.id.empty() && m_transform.id == id) {
        return this;
    }
    for (const auto& c : m_children) {
        if (const Node* found = c->find(id)) {
            return found;
        }
    }
    return nullptr;
}

void Node::visit(const Visitor& visitor) const {
    visit_impl(visitor, 0);
}

void Node::visit_impl(const Visitor& visitor, std::size_t depth) const {
    visitor(*this, depth);
    for (const auto& c : m_children) {
        c->visit_impl(visitor, depth + 1);
    }
}

std::size_t Node::subtree_size() const {
    std::size_t count = 1;
    for (const auto& c : m_children) {
        count += c->subtree_size();
    }
    return count;
}

std::unique_ptr<Node> Node::clone() const {
    auto copy = std::make_unique<Node>(m_transform, m_payload);
    for (const auto& c : m_children) {
        copy->add_child(c->clone());
    }
    return copy;
}

bool Node::operator==(const Node& other) const {
    if (!(m_transform == other.m_transform) || !(m_payload == other.m_payload)) {
        return false;
    }
    if (m_children.size() != other.m_children.size()) {
        return false;
    }
    for (std::size_t i = 0; i < m_children.size(); ++i) {
        if (*m_children[i] != *other.m_children[i]) {
            return false;
        }
    }
    return true;
}

} // namespace sail_layout
