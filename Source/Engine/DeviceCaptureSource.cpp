#include "DeviceCaptureSource.h"
#include "AudioCodec.h"
#include "AudioDeviceHost.h"
#include <cmath>

namespace LayerLoop
{

DeviceCaptureSource::DeviceCaptureSource(AudioDeviceHost& h, double headroom)
    : host(h),
      headroomSeconds(headroom)
{
}

juce::Result DeviceCaptureSource::open(const CaptureConstraints& constraints)
{
    return host.openDevice(constraints);
}

bool DeviceCaptureSource::isOpen() const
{
    return host.isDeviceOpen();
}

void DeviceCaptureSource::prepare(double newSampleRate, int numInputChannels)
{
    const juce::ScopedLock sl(lock);
    if (capturing.load())
    {
        // The passage recorded so far was at the old rate
        juce::Logger::writeToLog("Audio device restarted during a capture, input from now on is dropped");
        capturing.store(false);
    }

    sampleRate = newSampleRate;
    numChannels = numInputChannels;
    DBG("[DeviceCaptureSource] prepared: " << numChannels << " input channel(s) at " << sampleRate << " Hz");
}

juce::Result DeviceCaptureSource::beginCapture()
{
    const juce::ScopedLock sl(lock);

    if (sampleRate <= 0.0 || numChannels <= 0)
        return juce::Result::fail("The input device is not running");

    if (capturing.load())
        return juce::Result::fail("A capture is already running");

    const int capacity = static_cast<int>(std::ceil(headroomSeconds * sampleRate));
    captureBuffer.setSize(numChannels, capacity, false, false, true);
    captureBuffer.clear();
    writePosition = 0;
    overflowed = false;

    capturing.store(true);
    return juce::Result::ok();
}

void DeviceCaptureSource::pushInput(const float* const* inputChannelData, int numInputChannels, int numSamples)
{
    if (! capturing.load() || numInputChannels <= 0 || numSamples <= 0)
        return;

    const juce::ScopedTryLock sl(lock);
    if (! sl.isLocked() || ! capturing.load())
        return;

    const int space = captureBuffer.getNumSamples() - writePosition;
    const int toCopy = juce::jmin(space, numSamples);
    if (toCopy < numSamples)
        overflowed = true;
    if (toCopy <= 0)
        return;

    for (int channel = 0; channel < captureBuffer.getNumChannels(); ++channel)
    {
        const float* src = inputChannelData[channel < numInputChannels ? channel : 0];
        if (src != nullptr)
            captureBuffer.copyFrom(channel, writePosition, src, toCopy);
    }

    writePosition += toCopy;
}

void DeviceCaptureSource::endCapture(CaptureCallback onFinished)
{
    juce::MemoryBlock bytes;
    auto result = juce::Result::ok();

    {
        // Taking the lock waits out any block the audio thread is still writing
        const juce::ScopedLock sl(lock);

        if (! capturing.exchange(false))
        {
            result = juce::Result::fail("No capture is running");
        }
        else
        {
            if (overflowed)
                juce::Logger::writeToLog("Capture ran past " + juce::String(headroomSeconds, 1)
                                         + "s of input and was cut short");

            result = encodeCapture(captureBuffer, writePosition, sampleRate, bytes);
            DBG("[DeviceCaptureSource] captured " << writePosition << " samples");
        }
    }

    if (onFinished != nullptr)
        onFinished(result, std::move(bytes));
}

int DeviceCaptureSource::getNumCapturedSamples() const
{
    const juce::ScopedLock sl(lock);
    return writePosition;
}

double DeviceCaptureSource::getSampleRate() const
{
    const juce::ScopedLock sl(lock);
    return sampleRate;
}

} // namespace LayerLoop
