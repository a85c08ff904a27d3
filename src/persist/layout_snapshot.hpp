#pragma once

#include <cstdint>
#include <dockbridge/fwd.hpp>
#include <dockbridge/types.hpp>
#include <optional>
#include <string>
#include <vector>

#include "bridge/dock_model.hpp"
#include "bridge/window_backend.hpp"
#include "tree/dock_tree.hpp"

namespace dockbridge
{

// Maps panes to ids that survive a restart.  Supplied by the host.
class PaneRegistry
{
   public:
    virtual ~PaneRegistry() = default;

    virtual std::optional<std::string> stable_id(PaneId pane) const           = 0;
    virtual std::optional<PaneId>      resolve(const std::string& stable) const = 0;
};

// Serializable layout state: every tree, detached viewport placement and
// floating window (with z-order and collapsed state).
struct LayoutSnapshot
{
    // File format version for migration support
    static constexpr uint32_t FORMAT_VERSION = 2;

    struct TileState
    {
        TileId              id   = INVALID_TILE_ID;
        TileKind            kind = TileKind::Pane;
        std::string         pane;   // stable id, panes only
        std::vector<TileId> children;
        TileId              active = INVALID_TILE_ID;
    };

    struct TreeState
    {
        std::optional<TileId>  root;
        std::vector<TileState> tiles;
    };

    struct DetachedState
    {
        ViewportId        viewport = 0;
        uint64_t          serial   = 0;
        ViewportPlacement placement;
        TreeState         tree;
    };

    // Listed back to front per viewport.
    struct FloatingState
    {
        ViewportId viewport = ROOT_VIEWPORT_ID;
        FloatingId id       = 0;
        Vec2       offset{};
        Vec2       size{};
        bool       collapsed = false;
        TreeState  tree;
    };

    uint32_t                   version = FORMAT_VERSION;
    TreeState                  root;
    std::vector<DetachedState> detached;
    std::vector<FloatingState> floating;
    ViewportId                 next_viewport = 1;
    uint64_t                   next_serial   = 1;
    FloatingId                 next_floating = 1;
};

struct RestoreReport
{
    size_t dropped_panes   = 0;   // stable id no longer resolves
    size_t dropped_windows = 0;   // window left without content
    size_t clamped_windows = 0;   // moved back onto a monitor
};

LayoutSnapshot capture_layout(const DockModel& model, const PaneRegistry& registry);

// Replaces the model's content.  Panes whose stable id does not resolve are
// dropped (containers left empty go with them); detached placements are
// clamped to `monitors` when known.
RestoreReport restore_layout(DockModel&                              model,
                             const LayoutSnapshot&                   snapshot,
                             const PaneRegistry&                     registry,
                             const std::optional<std::vector<Rect>>& monitors = std::nullopt);

std::string serialize_json(const LayoutSnapshot& snapshot);
bool        deserialize_json(const std::string& json, LayoutSnapshot& snapshot);

// Quotes, backslashes and control characters escaped for a JSON string.
std::string escape_json(const std::string& s);

}   // namespace dockbridge
