#include "WavEncoder.h"

namespace LayerLoop
{

juce::int16 WavEncoder::toPcm16(float sample)
{
    const float clipped = juce::jlimit(-1.0f, 1.0f, sample);
    const float scaled = clipped < 0.0f ? clipped * 32768.0f : clipped * 32767.0f;
    return static_cast<juce::int16>(static_cast<int>(scaled));
}

void WavEncoder::write(const juce::AudioBuffer<float>& buffer, int sampleRate, juce::OutputStream& out)
{
    const int numChannels = buffer.getNumChannels();
    const int numFrames = buffer.getNumSamples();
    const auto dataBytes = static_cast<juce::uint32>(numFrames) * static_cast<juce::uint32>(numChannels) * 2u;
    const int blockAlign = numChannels * bitsPerSample / 8;

    out.write("RIFF", 4);
    out.writeInt(static_cast<int>(36u + dataBytes));
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    out.writeInt(16);
    out.writeShort(1); // PCM
    out.writeShort(static_cast<short>(numChannels));
    out.writeInt(sampleRate);
    out.writeInt(sampleRate * blockAlign);
    out.writeShort(static_cast<short>(blockAlign));
    out.writeShort(static_cast<short>(bitsPerSample));
    out.write("data", 4);
    out.writeInt(static_cast<int>(dataBytes));

    for (int i = 0; i < numFrames; ++i)
        for (int channel = 0; channel < numChannels; ++channel)
            out.writeShort(toPcm16(buffer.getSample(channel, i)));
}

juce::MemoryBlock WavEncoder::encode(const juce::AudioBuffer<float>& buffer, int sampleRate)
{
    juce::MemoryOutputStream stream;
    stream.preallocate(static_cast<size_t>(headerSize)
                       + static_cast<size_t>(buffer.getNumSamples()) * static_cast<size_t>(buffer.getNumChannels()) * 2);
    write(buffer, sampleRate, stream);
    return stream.getMemoryBlock();
}

} // namespace LayerLoop
