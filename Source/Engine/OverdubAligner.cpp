#include "OverdubAligner.h"
#include <cmath>

namespace LayerLoop
{

double OverdubAligner::captureOffsetWithinLoop(double captureStartClockTime,
                                               bool playbackActive,
                                               double loopStartClockTime,
                                               double loopDuration) const
{
    if (! playbackActive || loopDuration <= 0.0)
        return 0.0;

    double offset = std::fmod(captureStartClockTime - latencyCompensationSeconds - loopStartClockTime, loopDuration);
    if (offset < 0.0)
        offset += loopDuration;

    // fmod of a value just below zero can round back up to exactly the duration
    return offset >= loopDuration ? 0.0 : offset;
}

int OverdubAligner::toSampleOffset(double offsetSeconds, double loopDuration, int loopLength)
{
    if (loopDuration <= 0.0 || loopLength <= 0)
        return 0;

    const auto offset = static_cast<int>(std::floor(offsetSeconds / loopDuration * loopLength));
    return juce::jlimit(0, loopLength - 1, offset);
}

juce::Result OverdubAligner::align(const MasterLoop& master,
                                   const DecodedAudio& passage,
                                   double offsetSeconds,
                                   std::shared_ptr<juce::AudioBuffer<float>>& aligned) const
{
    const int loopLength = master.getLength();
    const int numChannels = master.getNumChannels();
    jassert(loopLength > 0 && numChannels > 0);

    if (passage.samples.getNumChannels() <= 0 || passage.samples.getNumSamples() <= 0)
        return juce::Result::fail("Captured overdub is empty");

    const juce::AudioBuffer<float>* input = &passage.samples;
    juce::AudioBuffer<float> resampled;
    if (passage.sampleRate > 0.0 && std::abs(passage.sampleRate - master.sampleRate) > 0.5)
    {
        juce::Logger::writeToLog("OverdubAligner: resampling overdub from " + juce::String(passage.sampleRate)
                                 + " Hz to " + juce::String(master.sampleRate) + " Hz");
        resample(passage, master.sampleRate, resampled);
        input = &resampled;
    }

    const int inputLength = input->getNumSamples();
    const int inputChannels = input->getNumChannels();
    const int sampleOffset = toSampleOffset(offsetSeconds, master.getDuration(), loopLength);

    auto buffer = std::make_shared<juce::AudioBuffer<float>>(numChannels, loopLength);
    buffer->clear();

    for (int channel = 0; channel < numChannels; ++channel)
    {
        // Channels the capture doesn't have reuse its first channel
        const float* src = input->getReadPointer(channel < inputChannels ? channel : 0);
        float* dest = buffer->getWritePointer(channel);

        for (int i = 0; i < inputLength; ++i)
        {
            const auto writePos = static_cast<int>((static_cast<juce::int64>(sampleOffset) + i) % loopLength);
            dest[writePos] = src[i];
        }
    }

    DBG("OverdubAligner: wrote " << inputLength << " samples at offset " << sampleOffset
        << " of " << loopLength << (sampleOffset + inputLength > loopLength ? " (wrapped)" : ""));

    aligned = std::move(buffer);
    return juce::Result::ok();
}

void OverdubAligner::resample(const DecodedAudio& passage, double targetRate, juce::AudioBuffer<float>& out)
{
    const double speedRatio = passage.sampleRate / targetRate;
    const int inputLength = passage.samples.getNumSamples();
    const int outputLength = juce::jmax(1, static_cast<int>(std::floor(inputLength / speedRatio)));

    out.setSize(passage.samples.getNumChannels(), outputLength);
    for (int channel = 0; channel < passage.samples.getNumChannels(); ++channel)
    {
        juce::LagrangeInterpolator interpolator;
        interpolator.process(speedRatio,
                             passage.samples.getReadPointer(channel),
                             out.getWritePointer(channel),
                             outputLength,
                             inputLength,
                             0);
    }
}

} // namespace LayerLoop
