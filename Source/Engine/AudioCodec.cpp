#include "AudioCodec.h"
#include <limits>

namespace LayerLoop
{

juce::Result encodeCapture(const juce::AudioBuffer<float>& samples,
                           int numSamples,
                           double sampleRate,
                           juce::MemoryBlock& out)
{
    if (samples.getNumChannels() <= 0 || sampleRate <= 0.0)
        return juce::Result::fail("Capture has no channels to encode");

    numSamples = juce::jlimit(0, samples.getNumSamples(), numSamples);
    out.reset();

    auto stream = std::make_unique<juce::MemoryOutputStream>(out, false);
    juce::WavAudioFormat wavFormat;
    std::unique_ptr<juce::AudioFormatWriter> writer(
        wavFormat.createWriterFor(stream.get(),
                                  sampleRate,
                                  static_cast<unsigned int>(samples.getNumChannels()),
                                  32,
                                  {},
                                  0));
    if (writer == nullptr)
        return juce::Result::fail("Could not create a WAV writer for the capture");

    // The writer owns the stream from here on
    stream.release();

    if (! writer->writeFromAudioSampleBuffer(samples, 0, numSamples))
        return juce::Result::fail("Failed to encode captured audio");

    // The header is finalised when the writer goes away
    writer.reset();
    return juce::Result::ok();
}

JuceAudioDecoder::JuceAudioDecoder()
{
    formatManager.registerBasicFormats();
}

juce::Result JuceAudioDecoder::decode(const juce::MemoryBlock& bytes, DecodedAudio& out)
{
    if (bytes.getSize() == 0)
        return juce::Result::fail("No audio data was captured");

    std::unique_ptr<juce::AudioFormatReader> reader(
        formatManager.createReaderFor(std::make_unique<juce::MemoryInputStream>(bytes, false)));
    if (reader == nullptr)
        return juce::Result::fail("Failed to process audio. Format might be unsupported.");

    if (reader->numChannels == 0 || reader->sampleRate <= 0.0)
        return juce::Result::fail("Captured audio has no channels");

    if (reader->lengthInSamples > std::numeric_limits<int>::max())
        return juce::Result::fail("Captured audio is too long");

    const int length = static_cast<int>(reader->lengthInSamples);
    out.samples.setSize(static_cast<int>(reader->numChannels), length);
    out.samples.clear();

    if (length > 0 && ! reader->read(&out.samples, 0, length, 0, true, true))
        return juce::Result::fail("Failed to read captured audio data");

    out.sampleRate = reader->sampleRate;
    DBG("JuceAudioDecoder: decoded " << length << " samples, " << (int) reader->numChannels
        << " channels at " << reader->sampleRate << " Hz");
    return juce::Result::ok();
}

} // namespace LayerLoop
