/// @file document.cpp
/// @brief Layout document implementation

#include <sail_engine/layout/document.hpp>

#include <algorithm>

namespace sail_layout {

namespace {

void collect_image(const Node& node, const ImageDesc& image, const std::string& field,
                   std::vector<AssetUse>& out) {
    const AssetRef* tex = image_texture(image);
    if (!tex) {
        return;
    }
    // Texture(File(...)) is positional, the other variants name their field
    std::string path = field;
    if (!std::holds_alternative<TextureImage>(image)) {
        path += ".tex";
    }
    out.push_back(AssetUse{&node, tex, AssetUsage::Texture, std::move(path)});
}

void collect_font(const Node& node, const std::optional<AssetRef>& font, const std::string& base,
                  std::vector<AssetUse>& out) {
    if (font) {
        out.push_back(AssetUse{&node, &*font, AssetUsage::Font, base + ".font"});
    }
}

} // namespace

const char* asset_usage_name(AssetUsage usage) noexcept {
    switch (usage) {
        case AssetUsage::Font: return "font";
        case AssetUsage::Texture: return "texture";
    }
    return "texture";
}

LayoutDocument::LayoutDocument(std::unique_ptr<Node> root, std::vector<std::string> extensions)
    : m_root(std::move(root))
    , m_extensions(std::move(extensions)) {
    reindex();
}

bool LayoutDocument::has_extension(std::string_view name) const {
    return std::find(m_extensions.begin(), m_extensions.end(), name) != m_extensions.end();
}

void LayoutDocument::reindex() {
    m_index.clear();
    if (!m_root) {
        return;
    }
    m_root->visit([this](const Node& node, std::size_t) {
        if (!node.id().empty()) {
            m_index.emplace(node.id(), &node);
        }
    });
}

const Node* LayoutDocument::find(std::string_view id) const {
    auto it = m_index.find(std::string(id));
    return it != m_index.end() ? it->second : nullptr;
}

std::vector<const Node*> LayoutDocument::find_all(std::string_view id) const {
    std::vector<const Node*> found;
    if (!m_root || id.empty()) {
        return found;
    }
    m_root->visit([&](const Node& node, std::size_t) {
        if (node.id() == id) {
            found.push_back(&node);
        }
    });
    return found;
}

std::vector<std::string> LayoutDocument::ids() const {
    std::vector<std::string> result;
    if (!m_root) {
        return result;
    }
    m_root->visit([&result](const Node& node, std::size_t) {
        if (!node.id().empty()) {
            result.push_back(node.id());
        }
    });
    return result;
}

std::size_t LayoutDocument::node_count() const {
    return m_root ? m_root->subtree_size() : 0;
}

std::vector<AssetUse> LayoutDocument::asset_refs() const {
    std::vector<AssetUse> uses;
    if (!m_root) {
        return uses;
    }

    m_root->visit([&uses](const Node& node, std::size_t) {
        const std::string base = node.path();
        switch (node.kind()) {
            case NodeKind::Container:
                if (const ImageDesc* bg = node.background()) {
                    collect_image(node, *bg, base + ".background", uses);
                }
                break;
            case NodeKind::Label:
                collect_font(node, node.as_label()->font, base + ".text", uses);
                break;
            case NodeKind::Image:
                collect_image(node, node.as_image()->image, base + ".image", uses);
                break;
            case NodeKind::Button: {
                const ButtonDesc& button = *node.as_button();
                const std::string field = base + ".button";
                collect_font(node, button.font, field, uses);
                if (button.normal_image) collect_image(node, *button.normal_image, field + ".normal_image", uses);
                if (button.hover_image) collect_image(node, *button.hover_image, field + ".hover_image", uses);
                if (button.press_image) collect_image(node, *button.press_image, field + ".press_image", uses);
                break;
            }
        }
    });
    return uses;
}

LayoutDocument LayoutDocument::clone() const {
    return LayoutDocument(m_root ? m_root->clone() : nullptr, m_extensions);
}

} // namespace sail_layout
