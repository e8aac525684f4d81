#pragma once

#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>
#include "AudioClock.h"
#include "LayerStack.h"
#include "LoopOutput.h"
#include <functional>
#include <map>

namespace LayerLoop
{

struct PlaybackState
{
    bool active = false;
    double loopStartClockTime = 0.0;
};

// PlaybackScheduler starts one looping voice per buffer (master plus every
// layer) at the same clock instant, so they all share loop phase 0.
// It only reads the layer stack.
class PlaybackScheduler
{
public:
    PlaybackScheduler(AudioClock& clock, LoopOutput& output);
    ~PlaybackScheduler();

    // Restarts if already playing. Returns false (and does nothing) without a master loop.
    bool play(const LayerStack& stack);
    void stop();
    bool togglePlay(const LayerStack& stack);

    bool isPlaying() const { return state.active; }
    const PlaybackState& getState() const { return state; }
    double getLoopStartClockTime() const { return state.loopStartClockTime; }

    // Full restart so every audible layer is back in phase. No-op when stopped.
    void resync(const LayerStack& stack);

    // Starts a voice for a single new layer at the current loop phase,
    // leaving the voices already sounding untouched
    void addLayerAtCurrentPhase(const Layer& layer);

    // Seconds into the loop, in [0, loopDuration)
    double getElapsedInLoop() const;

    // Loop phase in [0, 1); 0 when stopped
    double getPhase() const;

    size_t getNumActiveUnits() const { return units.size(); }
    bool hasUnitFor(LayerId layerId) const { return units.count(layerId) > 0; }

    // Progress is reported through onProgress every intervalMs while playing
    std::function<void(double)> onProgress;
    void setProgressInterval(int intervalMs);

    // One progress tick. Returns false once playback is no longer active.
    bool tick();

private:
    class ProgressTicker : public juce::Timer
    {
    public:
        explicit ProgressTicker(PlaybackScheduler& s) : owner(s) {}
        void timerCallback() override
        {
            if (! owner.tick())
                stopTimer();
        }

    private:
        PlaybackScheduler& owner;
    };

    void startUnit(LayerId layerId, const SampleBufferPtr& samples, int startOffsetSamples);

    AudioClock& clock;
    LoopOutput& output;

    PlaybackState state;
    double loopDuration = 0.0;
    int loopLength = 0;

    std::map<LayerId, VoiceHandle> units;

    ProgressTicker ticker;
    int progressIntervalMs = 33;

    JUCE_DECLARE_NON_COPYABLE(PlaybackScheduler)
};

} // namespace LayerLoop
