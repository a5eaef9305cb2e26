/// @file value.hpp
/// @brief Value types: ScalarValue, NodeKind, MetaScope and helpers.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace scenesync {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// The kinds of node a scene may contain.
enum class NodeKind : std::uint8_t {
    canvas,     ///< The canvas root. Exactly one per document.
    text,       ///< A text block.
    image,      ///< An image referencing an asset.
    group,      ///< A container of other nodes.
    component,  ///< A reusable component instance.
};

/// Convert a NodeKind to its string representation.
constexpr auto to_string_view(NodeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case NodeKind::canvas:    return "canvas";
        case NodeKind::text:      return "text";
        case NodeKind::image:     return "image";
        case NodeKind::group:     return "group";
        case NodeKind::component: return "component";
    }
    return "unknown";
}

/// Parse a NodeKind from its string representation.
constexpr auto parse_node_kind(std::string_view s) noexcept -> std::optional<NodeKind> {
    if (s == "canvas")    return NodeKind::canvas;
    if (s == "text")      return NodeKind::text;
    if (s == "image")     return NodeKind::image;
    if (s == "group")     return NodeKind::group;
    if (s == "component") return NodeKind::component;
    return std::nullopt;
}

/// Document-level maps that live beside the node tree.
enum class MetaScope : std::uint8_t {
    canvas,    ///< Canvas dimensions and background.
    theme,     ///< Colours, fonts.
    settings,  ///< Editor and publishing settings.
    assets,    ///< Asset references keyed by "<type>.<id>".
};

/// Convert a MetaScope to its string representation.
constexpr auto to_string_view(MetaScope scope) noexcept -> std::string_view {
    switch (scope) {
        case MetaScope::canvas:   return "canvas";
        case MetaScope::theme:    return "theme";
        case MetaScope::settings: return "settings";
        case MetaScope::assets:   return "assets";
    }
    return "unknown";
}

/// Parse a MetaScope from its string representation.
constexpr auto parse_meta_scope(std::string_view s) noexcept -> std::optional<MetaScope> {
    if (s == "canvas")   return MetaScope::canvas;
    if (s == "theme")    return MetaScope::theme;
    if (s == "settings") return MetaScope::settings;
    if (s == "assets")   return MetaScope::assets;
    return std::nullopt;
}

/// A closed set of primitive values stored in node fields and meta maps.
///
/// Alternatives: Null, bool, int64_t, double, string.
using ScalarValue = std::variant<
    Null,
    bool,
    std::int64_t,
    double,
    std::string
>;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { ... },
///     [](std::int64_t i) { ... },
///     [](auto&&) { ... },
/// }, some_variant);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed scalar extraction helpers ------------------------------------------

/// Extract a typed scalar, or nullopt on type mismatch.
/// @code
/// auto text = get_scalar<std::string>(value);
/// @endcode
template <typename T>
auto get_scalar(const ScalarValue& v) -> std::optional<T> {
    if (const auto* t = std::get_if<T>(&v)) {
        return *t;
    }
    return std::nullopt;
}

/// Extract a typed scalar from an optional<ScalarValue>.
template <typename T>
auto get_scalar(const std::optional<ScalarValue>& v) -> std::optional<T> {
    if (!v) return std::nullopt;
    return get_scalar<T>(*v);
}

}  // namespace scenesync
