#pragma once

#include <juce_core/juce_core.h>
#include "LooperTypes.h"

namespace LayerLoop
{

using VoiceHandle = juce::uint64;
static constexpr VoiceHandle invalidVoiceHandle = 0;

// Somewhere loop buffers can be played. A started buffer loops indefinitely,
// beginning at the current time of the output's clock.
class LoopOutput
{
public:
    virtual ~LoopOutput() = default;

    // Starts buffer looping right away, startOffsetSamples into the buffer
    virtual VoiceHandle startLoop(SampleBufferPtr buffer, int startOffsetSamples) = 0;

    // Returns false if the voice had already finished or never existed
    virtual bool stopLoop(VoiceHandle voice) = 0;
};

} // namespace LayerLoop
