#pragma once

#include <juce_core/juce_core.h>
#include <juce_audio_devices/juce_audio_devices.h>
#include "DeviceCaptureSource.h"
#include "LoopPlaybackEngine.h"
#include "LooperSettings.h"

namespace LayerLoop
{

// AudioDeviceHost owns the audio device. Its callback feeds the input to the
// capture source and renders the looping voices into the output.
class AudioDeviceHost : public juce::AudioIODeviceCallback
{
public:
    explicit AudioDeviceHost(const LooperSettings& settings);
    ~AudioDeviceHost() override;

    // Opens the default input and output devices. Fails if no input channel
    // could be opened. Calling it again once open does nothing.
    juce::Result openDevice(const CaptureConstraints& constraints);
    bool isDeviceOpen() const;
    void closeDevice();

    LoopPlaybackEngine& getPlaybackEngine() { return playbackEngine; }
    DeviceCaptureSource& getCaptureSource() { return captureSource; }
    juce::AudioDeviceManager& getAudioDeviceManager() { return audioDeviceManager; }

    void audioDeviceIOCallbackWithContext(const float* const* inputChannelData,
                                          int numInputChannels,
                                          float* const* outputChannelData,
                                          int numOutputChannels,
                                          int numSamples,
                                          const juce::AudioIODeviceCallbackContext& context) override;

    void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;

private:
    void applyLowLatency(juce::AudioIODevice& device);

    const int numInputChannels;
    const int numOutputChannels;

    juce::AudioDeviceManager audioDeviceManager;
    LoopPlaybackEngine playbackEngine;
    DeviceCaptureSource captureSource;
    bool callbackAdded = false;

    JUCE_DECLARE_NON_COPYABLE(AudioDeviceHost)
};

} // namespace LayerLoop
