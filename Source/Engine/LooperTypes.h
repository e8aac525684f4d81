#pragma once

#include <juce_core/juce_core.h>
#include <juce_audio_basics/juce_audio_basics.h>
#include <memory>

namespace LayerLoop
{

using LayerId = juce::uint64;
static constexpr LayerId masterLayerId = 0;

// Loop buffers are shared read-only between the layer stack and any voice playing them
using SampleBufferPtr = std::shared_ptr<const juce::AudioBuffer<float>>;

// The first recorded passage. Its length is the loop length for the whole session.
struct MasterLoop
{
    SampleBufferPtr samples;
    double sampleRate = 44100.0;

    int getNumChannels() const { return samples != nullptr ? samples->getNumChannels() : 0; }
    int getLength() const { return samples != nullptr ? samples->getNumSamples() : 0; }
    double getDuration() const { return sampleRate > 0.0 ? getLength() / sampleRate : 0.0; }
};

// One aligned overdub, always exactly as long as the master loop
struct Layer
{
    LayerId id = 0;
    SampleBufferPtr samples;
};

enum class LooperMode
{
    Ready,
    Recording,
    Playing,
    Stopped
};

enum class LooperError
{
    DeviceAccess,
    CaptureInit,
    Decode,
    ExportPrecondition
};

juce::String toString(LooperMode mode);
juce::String toString(LooperError error);

} // namespace LayerLoop
