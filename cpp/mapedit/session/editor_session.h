#pragma once

#include "mapedit/core/signal.h"
#include "mapedit/core/types.h"
#include <cstdint>

enum class SessionKind : std::uint8_t {
    Create = 0,
    EditGeometry = 1,
    EditFeatures = 2,
    Select = 3,
};

inline const char* sessionKindName(SessionKind kind) {
    switch (kind) {
        case SessionKind::Create: return "create";
        case SessionKind::EditGeometry: return "editGeometry";
        case SessionKind::EditFeatures: return "editFeatures";
        case SessionKind::Select: return "selectFeatures";
    }
    return "unknown";
}

// A set of interactions creating or editing features. A session stops when stop() is
// called or when its interactions are displaced from the dispatcher; a stopped session
// ignores further calls. Derived destructors stop the session.
class EditorSession {
public:
    explicit EditorSession(SessionKind kind) : kind_(kind) {}
    virtual ~EditorSession() = default;

    EditorSession(const EditorSession&) = delete;
    EditorSession& operator=(const EditorSession&) = delete;

    SessionKind kind() const noexcept { return kind_; }
    virtual void stop() = 0;
    bool isStopped() const noexcept { return isStopped_; }
    EditorError lastError() const noexcept { return lastError_; }

    // Raised once, after teardown.
    Signal<> stopped;

protected:
    // Returns false when the session was already stopped.
    bool markStopped() {
        if (isStopped_) return false;
        isStopped_ = true;
        return true;
    }
    // Records the outcome of a public call; returns false for convenience when err != Ok.
    bool setError(EditorError err) {
        lastError_ = err;
        return err == EditorError::Ok;
    }

private:
    SessionKind kind_;
    bool isStopped_ = false;
    EditorError lastError_ = EditorError::Ok;
};
