#pragma once

#include <cstddef>
#include <cstdint>

namespace dockbridge
{

// Tile identifier.  Unique across every tree owned by one DockingBridge
// (trees share a TileIdAllocator).
using TileId = uint64_t;
inline constexpr TileId INVALID_TILE_ID = 0;

// Opaque handle of host-application content hosted in a pane tile.
using PaneId = uint64_t;

// Presentation surface identifier.  The root viewport exists for the
// lifetime of the bridge; detached viewports are allocated on tear-off.
using ViewportId = uint64_t;
inline constexpr ViewportId ROOT_VIEWPORT_ID = 0;

// Contained floating window identifier (unique per bridge).
using FloatingId = uint64_t;

// Isolates independent docking instances living in one process.
using BridgeId = uint64_t;

// Insertion index meaning "after the last child".
inline constexpr size_t INSERT_AT_END = static_cast<size_t>(-1);

struct Vec2;
struct Rect;
struct Modifiers;
struct DockingOptions;
struct OverlayMetrics;

class DockTree;
class TileIdAllocator;
struct SubTree;
struct InsertionPoint;
struct DockZone;

class GeometryCache;
class DragSession;
struct DragPayload;
class AuthorityPolicy;
class DropResolver;
struct PendingDrop;
class DockModel;
class FloatingManager;
class LifecycleManager;
class WindowBackend;
class DiagnosticsLog;
class DockingBridge;

}   // namespace dockbridge
