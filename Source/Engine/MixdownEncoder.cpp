#include "MixdownEncoder.h"
#include "WavEncoder.h"

namespace
{
void addToMix(juce::AudioBuffer<float>& mix, const juce::AudioBuffer<float>& source)
{
    const int numSamples = juce::jmin(mix.getNumSamples(), source.getNumSamples());

    // A mono source lands in both output channels
    if (source.getNumChannels() == 1)
    {
        for (int channel = 0; channel < mix.getNumChannels(); ++channel)
            mix.addFrom(channel, 0, source, 0, 0, numSamples);
        return;
    }

    // Wider sources fold down: even channels to the left, odd to the right
    for (int sourceChannel = 0; sourceChannel < source.getNumChannels(); ++sourceChannel)
        mix.addFrom(sourceChannel % mix.getNumChannels(), 0, source, sourceChannel, 0, numSamples);
}
} // namespace

namespace LayerLoop
{

juce::AudioBuffer<float> MixdownEncoder::render(const LayerStack& stack)
{
    if (! stack.hasMaster())
        return {};

    const auto& master = stack.getMaster();
    juce::AudioBuffer<float> mix(exportChannels, master.getLength());
    mix.clear();

    addToMix(mix, *master.samples);
    for (const auto& layer : stack.getLayers())
        addToMix(mix, *layer.samples);

    return mix;
}

juce::Result MixdownEncoder::exportMix(const LayerStack& stack, juce::MemoryBlock& wavData) const
{
    if (! stack.hasMaster())
        return juce::Result::fail("Nothing to export!");

    const auto mix = render(stack);
    const int sampleRate = juce::roundToInt(stack.getMaster().sampleRate);
    wavData = WavEncoder::encode(mix, sampleRate);

    juce::Logger::writeToLog("Exported mixdown of " + juce::String((int) stack.getNumLayers() + 1)
                             + " buffer(s): " + juce::String(mix.getNumSamples()) + " frames, "
                             + juce::String((juce::int64) wavData.getSize()) + " bytes");
    return juce::Result::ok();
}

} // namespace LayerLoop
