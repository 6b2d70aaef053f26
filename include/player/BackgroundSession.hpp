#pragma once

namespace reprise::player {

/// Keeps the process eligible to play in the background (service, media
/// session, inhibitor). ensure_active() is idempotent and may throw when the
/// host refuses; the session logs and carries on without it.
class BackgroundSession {
public:
    virtual ~BackgroundSession() = default;
    virtual void ensure_active() = 0;
};

}  // namespace reprise::player
