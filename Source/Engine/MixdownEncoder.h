#pragma once

#include <juce_core/juce_core.h>
#include <juce_audio_basics/juce_audio_basics.h>
#include "LayerStack.h"

namespace LayerLoop
{

// MixdownEncoder renders the master loop and every layer once, summed, into a
// stereo buffer exactly one loop long, and encodes it as a 16-bit WAV.
class MixdownEncoder
{
public:
    static constexpr int exportChannels = 2;

    // Offline render pass; independent of the live playback voices.
    // Returns an empty buffer when the stack has no master loop.
    static juce::AudioBuffer<float> render(const LayerStack& stack);

    // Fails without rendering when there is nothing to export
    juce::Result exportMix(const LayerStack& stack, juce::MemoryBlock& wavData) const;
};

} // namespace LayerLoop
