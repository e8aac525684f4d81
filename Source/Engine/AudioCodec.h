#pragma once

#include <juce_core/juce_core.h>
#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_formats/juce_audio_formats.h>
#include "CaptureDevice.h"

namespace LayerLoop
{

// Encodes the first numSamples of a captured passage as a 32-bit float WAV
juce::Result encodeCapture(const juce::AudioBuffer<float>& samples,
                           int numSamples,
                           double sampleRate,
                           juce::MemoryBlock& out);

// Decodes any format known to juce::AudioFormatManager::registerBasicFormats
class JuceAudioDecoder : public AudioDecoder
{
public:
    JuceAudioDecoder();
    ~JuceAudioDecoder() override = default;

    juce::Result decode(const juce::MemoryBlock& bytes, DecodedAudio& out) override;

private:
    juce::AudioFormatManager formatManager;

    JUCE_DECLARE_NON_COPYABLE(JuceAudioDecoder)
};

} // namespace LayerLoop
