#pragma once

#include <juce_core/juce_core.h>
#include "CaptureDevice.h"

namespace LayerLoop
{

struct LooperSettings
{
    double maxLoopSeconds = 10.0;
    double latencyCompensationSeconds = 0.0;
    double captureHeadroomSeconds = 60.0; // input capacity reserved per capture
    int progressIntervalMs = 33;
    juce::String exportFileName = "my-loop.wav";
    int inputChannels = 2;
    int outputChannels = 2;
    CaptureConstraints constraints;

    juce::var toVar() const;
    static juce::Result fromVar(const juce::var& data, LooperSettings& out);

    juce::Result saveToFile(const juce::File& file) const;
    static juce::Result loadFromFile(const juce::File& file, LooperSettings& out);
};

} // namespace LayerLoop
