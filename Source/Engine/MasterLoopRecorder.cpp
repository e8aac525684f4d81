#include "MasterLoopRecorder.h"
#include <cmath>

namespace LayerLoop
{

MasterLoopRecorder::MasterLoopRecorder(double maxSeconds)
    : maxLoopSeconds(maxSeconds)
{
    jassert(maxLoopSeconds > 0.0);
}

void MasterLoopRecorder::setMaxLoopSeconds(double seconds)
{
    jassert(seconds > 0.0);
    maxLoopSeconds = seconds;
}

bool MasterLoopRecorder::begin(double clockTime)
{
    if (state != State::Idle)
        return false;

    startClockTime = clockTime;
    state = State::ArmedMaster;
    DBG("MasterLoopRecorder: armed at " << clockTime << "s, deadline " << getDeadlineClockTime() << "s");
    return true;
}

juce::Result MasterLoopRecorder::commit(const DecodedAudio& decoded, double endClockTime, MasterLoop& out)
{
    if (state != State::ArmedMaster)
        return juce::Result::fail("No master capture is in progress");

    const int numChannels = decoded.samples.getNumChannels();
    const int numSamples = decoded.samples.getNumSamples();
    if (numChannels <= 0 || numSamples <= 0 || decoded.sampleRate <= 0.0)
    {
        state = State::Idle;
        return juce::Result::fail("Captured master passage is empty");
    }

    const double elapsed = juce::jlimit(0.0, maxLoopSeconds, endClockTime - startClockTime);
    const int maxSamples = juce::roundToInt(maxLoopSeconds * decoded.sampleRate);
    const int length = juce::jmin(numSamples, maxSamples);

    const double bufferDuration = numSamples / decoded.sampleRate;
    if (std::abs(juce::jmin(bufferDuration, maxLoopSeconds) - elapsed) > sanityToleranceSeconds)
    {
        juce::Logger::writeToLog("MasterLoopRecorder: decoded duration " + juce::String(bufferDuration, 3)
                                 + "s differs from clock elapsed " + juce::String(elapsed, 3)
                                 + "s; using the decoded duration");
    }

    auto samples = std::make_shared<juce::AudioBuffer<float>>(numChannels, length);
    for (int channel = 0; channel < numChannels; ++channel)
        samples->copyFrom(channel, 0, decoded.samples, channel, 0, length);

    out.samples = std::move(samples);
    out.sampleRate = decoded.sampleRate;
    state = State::Committed;

    juce::Logger::writeToLog("Master Loop Created. Duration: " + juce::String(out.getDuration(), 3)
                             + "s (" + juce::String(length) + " samples"
                             + (numSamples > length ? ", truncated to maximum" : "") + ")");
    return juce::Result::ok();
}

void MasterLoopRecorder::cancel()
{
    if (state == State::ArmedMaster)
        state = State::Idle;
}

void MasterLoopRecorder::reset()
{
    state = State::Idle;
    startClockTime = 0.0;
}

} // namespace LayerLoop
