#include "drag_session.hpp"

#include <cassert>
#include <dockbridge/logger.hpp>

namespace dockbridge
{

bool DragSession::begin(const DragPayload& payload)
{
    if (payload.bridge_id != bridge_id_)
    {
        DOCKBRIDGE_LOG_DEBUG(log_category::SESSION,
                             "begin: payload of bridge {} ignored by bridge {}",
                             payload.bridge_id,
                             bridge_id_);
        return false;
    }
    if (payload_)
    {
        DOCKBRIDGE_LOG_DEBUG(log_category::SESSION,
                             "begin: drag {} still unresolved; new drag refused",
                             serial_);
        return false;
    }

    payload_ = payload;
    claimed_ = false;
    claimed_by_.clear();
    ++serial_;
    DOCKBRIDGE_LOG_DEBUG(log_category::SESSION,
                         "Drag {} started from viewport {} (tile {})",
                         serial_,
                         payload.source_viewport,
                         payload.tile_id ? *payload.tile_id : INVALID_TILE_ID);
    return true;
}

bool DragSession::claim_release(std::string_view handler)
{
    if (!payload_)
        return false;

    if (claimed_)
    {
        ++refused_claims_;
        DOCKBRIDGE_LOG_DEBUG(log_category::SESSION,
                             "claim_release by '{}' refused: already claimed by '{}'",
                             handler,
                             claimed_by_);
        return false;
    }

    claimed_    = true;
    claimed_by_ = std::string(handler);
    return true;
}

bool DragSession::claim_exclusive(std::string_view handler)
{
    bool was_claimed = claimed_;
    if (claim_release(handler))
        return true;
    assert(!(payload_ && was_claimed) && "release claimed twice in one drag");
    return false;
}

void DragSession::end()
{
    if (!payload_)
        return;
    DOCKBRIDGE_LOG_DEBUG(log_category::SESSION,
                         "Drag {} ended ({})",
                         serial_,
                         claimed_ ? claimed_by_ : std::string("unclaimed"));
    payload_.reset();
    claimed_ = false;
    claimed_by_.clear();
}

void DragSession::retarget(const DragPayload& payload)
{
    if (payload_ && payload.bridge_id == bridge_id_)
        payload_ = payload;
}

}   // namespace dockbridge
