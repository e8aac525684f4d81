#pragma once

#include <juce_core/juce_core.h>
#include <juce_audio_basics/juce_audio_basics.h>

namespace LayerLoop
{

// Minimal 16-bit PCM WAV writer: a 44 byte RIFF/fmt/data header followed by
// interleaved little-endian samples. Nothing else is written, so the output
// layout is fixed byte for byte.
class WavEncoder
{
public:
    static constexpr int headerSize = 44;
    static constexpr int bitsPerSample = 16;

    static void write(const juce::AudioBuffer<float>& buffer, int sampleRate, juce::OutputStream& out);

    static juce::MemoryBlock encode(const juce::AudioBuffer<float>& buffer, int sampleRate);

    // Clamped to [-1, 1]; negatives scale by 32768, the rest by 32767, truncated
    static juce::int16 toPcm16(float sample);
};

} // namespace LayerLoop
