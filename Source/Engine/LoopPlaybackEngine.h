#pragma once

#include <juce_core/juce_core.h>
#include <juce_audio_basics/juce_audio_basics.h>
#include "AudioClock.h"
#include "LoopOutput.h"
#include <atomic>
#include <vector>

namespace LayerLoop
{

// LoopPlaybackEngine renders looping voices into the device output and keeps
// the audio clock. The clock is the number of samples rendered so far, so every
// voice started at the same now() stays sample-locked to the others.
class LoopPlaybackEngine : public AudioClock,
                           public LoopOutput
{
public:
    LoopPlaybackEngine();
    ~LoopPlaybackEngine() override = default;

    // Call when the audio device starts
    void prepare(double sampleRate);
    double getSampleRate() const { return sampleRate.load(); }

    double now() const override;
    juce::int64 getRenderedSamples() const { return renderedSamples.load(); }

    VoiceHandle startLoop(SampleBufferPtr buffer, int startOffsetSamples) override;
    bool stopLoop(VoiceHandle voice) override;
    void stopAll();

    int getNumActiveVoices() const;

    // Audio thread. Adds every voice into the output channels (which must
    // already be cleared) and advances the clock by numSamples.
    void renderNextBlock(float* const* outputChannelData, int numOutputChannels, int numSamples);

private:
    struct Voice
    {
        VoiceHandle handle = invalidVoiceHandle;
        SampleBufferPtr buffer;
        int position = 0;
    };

    juce::CriticalSection lock;
    std::vector<Voice> voices;
    VoiceHandle nextHandle = invalidVoiceHandle + 1;

    std::atomic<juce::int64> renderedSamples{0};
    std::atomic<double> sampleRate{44100.0};

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(LoopPlaybackEngine)
};

} // namespace LayerLoop
