#include "AudioDeviceHost.h"

namespace LayerLoop
{

AudioDeviceHost::AudioDeviceHost(const LooperSettings& settings)
    : numInputChannels(settings.inputChannels),
      numOutputChannels(settings.outputChannels),
      captureSource(*this, settings.captureHeadroomSeconds)
{
}

AudioDeviceHost::~AudioDeviceHost()
{
    closeDevice();
}

juce::Result AudioDeviceHost::openDevice(const CaptureConstraints& constraints)
{
    if (isDeviceOpen())
        return juce::Result::ok();

    auto error = audioDeviceManager.initialiseWithDefaultDevices(numInputChannels, numOutputChannels);
    if (error.isNotEmpty())
        return juce::Result::fail("Microphone access denied or missing: " + error);

    auto* device = audioDeviceManager.getCurrentAudioDevice();
    if (device == nullptr)
        return juce::Result::fail("Microphone access denied or missing: no audio device available");

    if (device->getActiveInputChannels().countNumberOfSetBits() == 0)
    {
        audioDeviceManager.closeAudioDevice();
        return juce::Result::fail("Microphone access denied or missing: no input channels on "
                                  + device->getName());
    }

    if (constraints.lowLatency)
        applyLowLatency(*device);

    // JUCE device backends hand over the raw input
    if (constraints.echoCancellation || constraints.noiseSuppression || constraints.autoGainControl)
        juce::Logger::writeToLog("Input processing was requested but is not provided by "
                                 + audioDeviceManager.getCurrentAudioDeviceType()
                                 + ", capturing unprocessed input");

    if (! callbackAdded)
    {
        audioDeviceManager.addAudioCallback(this);
        callbackAdded = true;
    }

    device = audioDeviceManager.getCurrentAudioDevice();
    if (device != nullptr)
        juce::Logger::writeToLog("Audio device opened: " + device->getName()
                                 + " SampleRate: " + juce::String(device->getCurrentSampleRate())
                                 + " BufferSize: " + juce::String(device->getCurrentBufferSizeSamples())
                                 + " InputChannels: " + juce::String(device->getActiveInputChannels().countNumberOfSetBits())
                                 + " OutputChannels: " + juce::String(device->getActiveOutputChannels().countNumberOfSetBits()));

    return juce::Result::ok();
}

void AudioDeviceHost::applyLowLatency(juce::AudioIODevice& device)
{
    const auto sizes = device.getAvailableBufferSizes();
    if (sizes.isEmpty())
        return;

    int smallest = sizes.getFirst();
    for (auto size : sizes)
        smallest = juce::jmin(smallest, size);

    juce::AudioDeviceManager::AudioDeviceSetup setup;
    audioDeviceManager.getAudioDeviceSetup(setup);
    if (setup.bufferSize == smallest)
        return;

    setup.bufferSize = smallest;
    auto error = audioDeviceManager.setAudioDeviceSetup(setup, true);
    if (error.isNotEmpty())
        juce::Logger::writeToLog("Could not switch to a " + juce::String(smallest)
                                 + " sample buffer: " + error);
}

bool AudioDeviceHost::isDeviceOpen() const
{
    return audioDeviceManager.getCurrentAudioDevice() != nullptr && callbackAdded;
}

void AudioDeviceHost::closeDevice()
{
    if (callbackAdded)
    {
        audioDeviceManager.removeAudioCallback(this);
        callbackAdded = false;
    }
    audioDeviceManager.closeAudioDevice();
}

void AudioDeviceHost::audioDeviceAboutToStart(juce::AudioIODevice* device)
{
    if (device == nullptr)
    {
        DBG("WARNING: audioDeviceAboutToStart called with null device!");
        return;
    }

    const double sampleRate = device->getCurrentSampleRate();
    playbackEngine.prepare(sampleRate);
    captureSource.prepare(sampleRate, device->getActiveInputChannels().countNumberOfSetBits());

    DBG("Device starting - SampleRate: " << sampleRate
        << " BufferSize: " << device->getCurrentBufferSizeSamples());
}

void AudioDeviceHost::audioDeviceStopped()
{
    DBG("[AudioDeviceHost] device stopped");
}

void AudioDeviceHost::audioDeviceIOCallbackWithContext(const float* const* inputChannelData,
                                                       int numInputs,
                                                       float* const* outputChannelData,
                                                       int numOutputs,
                                                       int numSamples,
                                                       const juce::AudioIODeviceCallbackContext& context)
{
    juce::ignoreUnused(context);

    captureSource.pushInput(inputChannelData, numInputs, numSamples);

    for (int channel = 0; channel < numOutputs; ++channel)
    {
        if (outputChannelData[channel] != nullptr)
            juce::FloatVectorOperations::clear(outputChannelData[channel], numSamples);
    }

    playbackEngine.renderNextBlock(outputChannelData, numOutputs, numSamples);
}

} // namespace LayerLoop
