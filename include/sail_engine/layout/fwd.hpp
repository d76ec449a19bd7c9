/// @file fwd.hpp
/// @brief Forward declarations for sail_layout module

#pragma once

#include <cstdint>

namespace sail_layout {

// =============================================================================
// Enumerations
// =============================================================================

enum class Anchor : std::uint8_t;
enum class LineMode : std::uint8_t;
enum class AssetKind : std::uint8_t;
enum class NodeKind : std::uint8_t;
enum class AssetUsage : std::uint8_t;
enum class Severity : std::uint8_t;

// =============================================================================
// Descriptors
// =============================================================================

struct Color;
struct Stretch;
struct Transform;
struct AssetRef;
struct SolidColor;
struct TextureImage;
struct NineSlice;
struct PartialTexture;
struct TextDesc;
struct ButtonDesc;

// =============================================================================
// Tree
// =============================================================================

class Node;
class LayoutDocument;
struct AssetUse;

// =============================================================================
// Codecs and Checks
// =============================================================================

struct ReaderOptions;
class LayoutReader;
struct LayoutWriterOptions;
class LayoutWriter;
struct ValidationIssue;
struct ValidationResult;
struct ValidatorOptions;
class LayoutValidator;
struct LayoutConfig;

} // namespace sail_layout
