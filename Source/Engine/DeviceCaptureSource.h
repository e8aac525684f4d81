#pragma once

#include <juce_core/juce_core.h>
#include <juce_audio_basics/juce_audio_basics.h>
#include "CaptureDevice.h"
#include <atomic>

namespace LayerLoop
{

class AudioDeviceHost;

// DeviceCaptureSource records the live input of the host's audio device.
// The audio thread appends into a buffer sized once per capture, so nothing
// is allocated while recording. endCapture hands back the passage as WAV bytes.
class DeviceCaptureSource : public CaptureDevice
{
public:
    DeviceCaptureSource(AudioDeviceHost& host, double headroomSeconds);
    ~DeviceCaptureSource() override = default;

    juce::Result open(const CaptureConstraints& constraints) override;
    bool isOpen() const override;

    juce::Result beginCapture() override;
    void endCapture(CaptureCallback onFinished) override;

    // Called by the host when the device (re)starts
    void prepare(double sampleRate, int numInputChannels);

    // Audio thread
    void pushInput(const float* const* inputChannelData, int numInputChannels, int numSamples);

    bool isCapturing() const { return capturing.load(); }
    int getNumCapturedSamples() const;
    double getSampleRate() const;

private:
    AudioDeviceHost& host;
    const double headroomSeconds;

    juce::CriticalSection lock;
    juce::AudioBuffer<float> captureBuffer;
    int writePosition = 0;
    bool overflowed = false;

    double sampleRate = 0.0;
    int numChannels = 0;
    std::atomic<bool> capturing{false};

    JUCE_DECLARE_NON_COPYABLE(DeviceCaptureSource)
};

} // namespace LayerLoop
