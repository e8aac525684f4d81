#pragma once

#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>
#include "AudioClock.h"
#include "CaptureDevice.h"
#include "LayerStack.h"
#include "LoopOutput.h"
#include "LooperSettings.h"
#include "MasterLoopRecorder.h"
#include "MixdownEncoder.h"
#include "OverdubAligner.h"
#include "PlaybackScheduler.h"
#include "SessionState.h"
#include <functional>

namespace LayerLoop
{

// LooperSession is the one controller the UI talks to. It owns the master
// loop and layer stack, routes captures to the recorder or the aligner, and
// keeps playback in step with every change to the stack.
//
// All calls are made from the message thread. Errors are recovered here and
// reported once through onError; none of them changes the loop or its layers.
class LooperSession
{
public:
    LooperSession(const LooperSettings& settings,
                  CaptureDevice& captureDevice,
                  AudioDecoder& decoder,
                  AudioClock& clock,
                  LoopOutput& output);
    ~LooperSession();

    // Records the master loop if there is none, otherwise an overdub.
    // Ignored while another capture is in progress.
    void beginCapture();

    // Finishes the capture in progress. By the time the device has delivered
    // the passage, either the master is set, a layer is added, or an error was reported.
    void endCapture();

    void play();
    void stop();
    void togglePlay();

    // Removes the newest layer, or the master loop when there are no layers
    void undo();

    // Drops the master loop and all layers. The device stays open.
    void clear();

    juce::Result exportMix(juce::MemoryBlock& wavData);
    juce::Result exportMixToFile(const juce::File& file);

    // Stops an armed master capture that reached the maximum loop length
    void handleCaptureDeadline();

    LooperMode getMode() const { return state.mode; }
    const SessionState& getState() const { return state; }
    bool hasMasterLoop() const { return stack.hasMaster(); }
    bool isPlaying() const { return scheduler.isPlaying(); }
    bool isRecording() const { return state.recording.active; }
    bool isCaptureDeadlineArmed() const { return captureDeadline.isTimerRunning(); }
    double getLoopDuration() const;
    size_t getNumLayers() const { return stack.getNumLayers(); }

    const LayerStack& getLayerStack() const { return stack; }
    PlaybackScheduler& getScheduler() { return scheduler; }
    const PlaybackScheduler& getScheduler() const { return scheduler; }
    const LooperSettings& getSettings() const { return settings; }

    std::function<void(LooperMode)> onStateChange;
    std::function<void(double)> onProgress;
    std::function<void()> onLoopWrap;
    std::function<void(LooperError, const juce::String&)> onError;

private:
    class CaptureDeadline : public juce::Timer
    {
    public:
        explicit CaptureDeadline(LooperSession& s) : session(s) {}
        void timerCallback() override
        {
            stopTimer();
            session.handleCaptureDeadline();
        }

    private:
        LooperSession& session;
    };

    void apply(const SessionTransition& transition);
    void runEffect(SessionEffect effect);

    void finishCapture(juce::uint64 generation, const juce::Result& captureResult, const juce::MemoryBlock& bytes);
    void commitMaster(const DecodedAudio& decoded, double endClockTime);
    void commitOverdub(const DecodedAudio& decoded);
    void failCapture(LooperError error, const juce::String& message);
    void abortCapture();

    void reportError(LooperError error, const juce::String& message);
    void handleProgress(double phase);

    LooperSettings settings;
    CaptureDevice& captureDevice;
    AudioDecoder& decoder;
    AudioClock& clock;

    MasterLoopRecorder recorder;
    OverdubAligner aligner;
    LayerStack stack;
    PlaybackScheduler scheduler;
    MixdownEncoder mixdown;

    SessionState state;
    CaptureDeadline captureDeadline;
    double lastPhase = 0.0;
    juce::uint64 captureGeneration = 0; // bumped per capture and on abort

    JUCE_DECLARE_WEAK_REFERENCEABLE(LooperSession)
    JUCE_DECLARE_NON_COPYABLE(LooperSession)
};

} // namespace LayerLoop
