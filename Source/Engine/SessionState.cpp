#include "SessionState.h"

namespace LayerLoop
{
namespace Transitions
{

LooperMode deriveMode(const SessionState& state, bool hasMaster)
{
    if (state.recording.active)
        return LooperMode::Recording;
    if (state.playing)
        return LooperMode::Playing;
    return hasMaster ? LooperMode::Stopped : LooperMode::Ready;
}

SessionTransition captureStarted(const SessionState& current, bool isMaster,
                                 double startClockTime, double offsetWithinLoop)
{
    SessionTransition t { current };
    t.state.recording.active = true;
    t.state.recording.isMaster = isMaster;
    t.state.recording.startClockTime = startClockTime;
    t.state.recording.captureOffsetWithinLoop = offsetWithinLoop;
    t.state.finishingCapture = false;
    t.state.mode = LooperMode::Recording;
    t.effect = isMaster ? SessionEffect::ArmCaptureDeadline : SessionEffect::None;
    return t;
}

SessionTransition captureFinishing(const SessionState& current)
{
    SessionTransition t { current };
    t.state.finishingCapture = true;
    t.effect = SessionEffect::CancelCaptureDeadline;
    return t;
}

SessionTransition captureAborted(const SessionState& current, bool hasMaster)
{
    SessionTransition t { current };
    t.state.recording = {};
    t.state.finishingCapture = false;
    t.state.mode = deriveMode(t.state, hasMaster);
    t.effect = SessionEffect::CancelCaptureDeadline;
    return t;
}

SessionTransition masterCommitted(const SessionState& current)
{
    SessionTransition t { current };
    t.state.recording = {};
    t.state.finishingCapture = false;
    t.state.playing = true;
    t.state.mode = LooperMode::Playing;
    t.effect = SessionEffect::StartPlayback;
    return t;
}

SessionTransition layerCommitted(const SessionState& current)
{
    SessionTransition t { current };
    t.state.recording = {};
    t.state.finishingCapture = false;
    t.state.mode = deriveMode(t.state, true);
    t.effect = current.playing ? SessionEffect::AddLayerUnit : SessionEffect::None;
    return t;
}

SessionTransition captureFailed(const SessionState& current, bool hasMaster)
{
    SessionTransition t { current };
    t.state.recording = {};
    t.state.finishingCapture = false;
    t.state.mode = deriveMode(t.state, hasMaster);
    return t;
}

SessionTransition playbackStarted(const SessionState& current)
{
    SessionTransition t { current };
    t.state.playing = true;
    t.state.mode = deriveMode(t.state, true);
    t.effect = SessionEffect::StartPlayback;
    return t;
}

SessionTransition playbackStopped(const SessionState& current, bool hasMaster)
{
    SessionTransition t { current };
    t.state.playing = false;
    t.state.mode = deriveMode(t.state, hasMaster);
    t.effect = SessionEffect::StopPlayback;
    return t;
}

SessionTransition layerPopped(const SessionState& current)
{
    SessionTransition t { current };
    t.state.mode = deriveMode(t.state, true);
    t.effect = current.playing ? SessionEffect::RestartPlayback : SessionEffect::None;
    return t;
}

SessionTransition cleared(const SessionState& current)
{
    SessionTransition t { current };
    t.state.recording = {};
    t.state.finishingCapture = false;
    t.state.playing = false;
    t.state.mode = LooperMode::Ready;
    t.effect = SessionEffect::StopPlayback;
    return t;
}

} // namespace Transitions
} // namespace LayerLoop
