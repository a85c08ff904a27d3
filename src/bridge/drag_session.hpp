#pragma once

#include <cstdint>
#include <dockbridge/fwd.hpp>
#include <dockbridge/types.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace dockbridge
{

// Which kind of host a drag started from.
enum class SourceHost
{
    DockTree,         // a tile of the root tree or of a detached tree
    Floating,         // a contained floating window
    NativeViewport,   // a whole detached viewport
};

// ─── DragPayload ─────────────────────────────────────────────────────────────
// Immutable description of what is being dragged.  tile_id == nullopt means
// the whole window (its root / tab-bar background) is dragged as a unit.

struct DragPayload
{
    BridgeId                  bridge_id = 0;
    ViewportId                source_viewport = ROOT_VIEWPORT_ID;
    std::optional<FloatingId> source_floating;
    std::optional<TileId>     tile_id;

    bool is_window_move() const { return !tile_id.has_value(); }

    SourceHost source_host() const
    {
        if (source_floating)
            return SourceHost::Floating;
        if (!tile_id && source_viewport != ROOT_VIEWPORT_ID)
            return SourceHost::NativeViewport;
        return SourceHost::DockTree;
    }
};

// ─── DragSession ─────────────────────────────────────────────────────────────
// Single active drag of one bridge, with a monotonic release claim.
//
//   Idle ──begin()──► Active ──claim_release()──► Claimed
//     ▲                  │                           │
//     └──────end()───────┴───────────end()───────────┘
//
// begin() is refused while a drag is active.  claim_release() returns true
// at most once per drag; every later caller gets false and must not mutate.

class DragSession
{
   public:
    explicit DragSession(BridgeId bridge_id) : bridge_id_(bridge_id) {}
    ~DragSession() = default;

    DragSession(const DragSession&)            = delete;
    DragSession& operator=(const DragSession&) = delete;

    bool begin(const DragPayload& payload);
    bool claim_release(std::string_view handler);

    // claim_release for handlers that mutate layout.  A refusal during an
    // active drag is a routing bug and fails an assert in debug builds.
    bool claim_exclusive(std::string_view handler);
    void end();

    bool                              is_active() const { return payload_.has_value(); }
    bool                              release_claimed() const { return claimed_; }
    const std::optional<DragPayload>& payload() const { return payload_; }
    const std::string&                claimed_by() const { return claimed_by_; }
    BridgeId                          bridge_id() const { return bridge_id_; }

    // Counts begun drags; identifies the drag a decision was made for.
    uint64_t serial() const { return serial_; }

    // Refused claims observed over the session's lifetime.
    uint64_t refused_claims() const { return refused_claims_; }

    // The dragged entity changes host mid-drag (ghost tear-off).
    void retarget(const DragPayload& payload);

    // Ends the drag on scope exit unless dismissed.
    class EndGuard
    {
       public:
        explicit EndGuard(DragSession& session) : session_(&session) {}
        ~EndGuard()
        {
            if (session_)
                session_->end();
        }

        EndGuard(const EndGuard&)            = delete;
        EndGuard& operator=(const EndGuard&) = delete;

        void dismiss() { session_ = nullptr; }

       private:
        DragSession* session_;
    };

   private:
    BridgeId                   bridge_id_;
    std::optional<DragPayload> payload_;
    bool                       claimed_ = false;
    std::string                claimed_by_;
    uint64_t                   serial_         = 0;
    uint64_t                   refused_claims_ = 0;
};

}   // namespace dockbridge
