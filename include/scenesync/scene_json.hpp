/// @file scene_json.hpp
/// @brief nlohmann/json interoperability for scenesync.
///
/// Provides ADL serialization (to_json/from_json) for the replicated types
/// used on the wire, and import/export of the legacy scene-graph JSON stored
/// with each site version.

#pragma once

#include <scenesync/document.hpp>
#include <scenesync/op.hpp>
#include <scenesync/patch.hpp>
#include <scenesync/types.hpp>
#include <scenesync/value.hpp>
#include <scenesync/watermark.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <vector>

namespace scenesync {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================
//
// from_json overloads throw scenesync::Exception (decoding_error) on values
// that are well-formed JSON but not a valid encoding of the type.

// -- Scalars ------------------------------------------------------------------

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const ScalarValue& sv);
void from_json(const nlohmann::json& j, ScalarValue& sv);

// -- Identity types -----------------------------------------------------------

void to_json(nlohmann::json& j, const SessionId& id);
void from_json(const nlohmann::json& j, SessionId& id);

void to_json(nlohmann::json& j, const Stamp& s);
void from_json(const nlohmann::json& j, Stamp& s);

// -- Operations and watermarks ------------------------------------------------

void to_json(nlohmann::json& j, const Op& op);
void from_json(const nlohmann::json& j, Op& op);

void to_json(nlohmann::json& j, const Watermark& w);
void from_json(const nlohmann::json& j, Watermark& w);

// -- Materialized state -------------------------------------------------------

void to_json(nlohmann::json& j, const NodeView& n);
void from_json(const nlohmann::json& j, NodeView& n);

void to_json(nlohmann::json& j, const SceneState& s);
void from_json(const nlohmann::json& j, SceneState& s);

void to_json(nlohmann::json& j, const Patch& p);

// =============================================================================
// Legacy scene graph
// =============================================================================

/// Current version of the legacy scene-graph format.
inline constexpr std::int64_t scene_graph_version = 1;

/// The scene graph a brand new site version starts from:
/// a 1440x900 white canvas with no nodes, components or assets.
auto default_scene_graph() -> nlohmann::json;

/// Translate a legacy scene graph into unstamped ops that build it.
///
/// `canvas`, `assets`, `theme` and `metadata` become document-level map keys
/// (nested objects flattened to dotted keys). `nodes` and `components` become
/// nodes under their declared parent (or the canvas root) in array order; their
/// nested `position`, `size`, `style` and `props` objects are flattened to
/// dotted field names such as `style.color`.
/// @throws scenesync::Exception (validation_rejected) on a malformed graph.
auto import_scene_graph(const nlohmann::json& graph) -> std::vector<Op>;

/// Export the visible scene as a legacy scene graph.
auto export_scene_graph(const SceneState& state) -> nlohmann::json;

}  // namespace scenesync
