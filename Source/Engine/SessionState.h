#pragma once

#include "LooperTypes.h"

namespace LayerLoop
{

struct RecordingState
{
    bool active = false;
    bool isMaster = false;
    double startClockTime = 0.0;
    double captureOffsetWithinLoop = 0.0;
};

// Everything the session controller tracks between calls.
// Only the transition functions below produce new values.
struct SessionState
{
    LooperMode mode = LooperMode::Ready;
    RecordingState recording;
    bool finishingCapture = false; // waiting on flush + decode
    bool playing = false;
};

// Work the controller has to carry out after adopting a new state
enum class SessionEffect
{
    None,
    ArmCaptureDeadline,
    CancelCaptureDeadline,
    StartPlayback,
    RestartPlayback,
    StopPlayback,
    AddLayerUnit
};

struct SessionTransition
{
    SessionState state;
    SessionEffect effect = SessionEffect::None;
};

namespace Transitions
{
    SessionTransition captureStarted(const SessionState& current, bool isMaster,
                                     double startClockTime, double offsetWithinLoop);
    SessionTransition captureFinishing(const SessionState& current);
    SessionTransition captureAborted(const SessionState& current, bool hasMaster);
    SessionTransition masterCommitted(const SessionState& current);
    SessionTransition layerCommitted(const SessionState& current);
    SessionTransition captureFailed(const SessionState& current, bool hasMaster);

    SessionTransition playbackStarted(const SessionState& current);
    SessionTransition playbackStopped(const SessionState& current, bool hasMaster);

    SessionTransition layerPopped(const SessionState& current);
    SessionTransition cleared(const SessionState& current);

    // Mode implied by the recording and playback flags
    LooperMode deriveMode(const SessionState& state, bool hasMaster);
}

} // namespace LayerLoop
