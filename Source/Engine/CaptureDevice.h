#pragma once

#include <juce_core/juce_core.h>
#include <juce_audio_basics/juce_audio_basics.h>
#include <functional>

namespace LayerLoop
{

// Input processing requested from the capture backend.
// Backends that can't honour a constraint log it and capture unprocessed input.
struct CaptureConstraints
{
    bool echoCancellation = true;
    bool noiseSuppression = true;
    bool autoGainControl = false; // off to preserve dynamics
    bool lowLatency = true;
};

struct DecodedAudio
{
    juce::AudioBuffer<float> samples;
    double sampleRate = 0.0;
};

// Live input. Hands the engine encoded bytes for each finished capture.
class CaptureDevice
{
public:
    using CaptureCallback = std::function<void(juce::Result, juce::MemoryBlock)>;

    virtual ~CaptureDevice() = default;

    virtual juce::Result open(const CaptureConstraints& constraints) = 0;
    virtual bool isOpen() const = 0;

    virtual juce::Result beginCapture() = 0;

    // Stops capturing. onFinished is called once all buffered input has been
    // flushed, with the encoded passage or the reason there is none.
    virtual void endCapture(CaptureCallback onFinished) = 0;
};

class AudioDecoder
{
public:
    virtual ~AudioDecoder() = default;
    virtual juce::Result decode(const juce::MemoryBlock& bytes, DecodedAudio& out) = 0;
};

} // namespace LayerLoop
