#include "LoopPlaybackEngine.h"
#include <algorithm>

namespace LayerLoop
{

LoopPlaybackEngine::LoopPlaybackEngine()
{
    voices.reserve(64);
}

void LoopPlaybackEngine::prepare(double newSampleRate)
{
    if (newSampleRate > 0.0)
        sampleRate.store(newSampleRate);
    DBG("[LoopPlaybackEngine] prepared at " << newSampleRate << " Hz");
}

double LoopPlaybackEngine::now() const
{
    return static_cast<double>(renderedSamples.load()) / sampleRate.load();
}

VoiceHandle LoopPlaybackEngine::startLoop(SampleBufferPtr buffer, int startOffsetSamples)
{
    if (buffer == nullptr || buffer->getNumSamples() <= 0 || buffer->getNumChannels() <= 0)
        return invalidVoiceHandle;

    const int length = buffer->getNumSamples();
    Voice voice;
    voice.buffer = std::move(buffer);
    voice.position = ((startOffsetSamples % length) + length) % length;

    const juce::ScopedLock sl(lock);
    voice.handle = nextHandle++;
    voices.push_back(std::move(voice));
    return voices.back().handle;
}

bool LoopPlaybackEngine::stopLoop(VoiceHandle handle)
{
    SampleBufferPtr released;
    {
        const juce::ScopedLock sl(lock);
        auto it = std::find_if(voices.begin(), voices.end(),
                               [handle](const Voice& v) { return v.handle == handle; });
        if (it == voices.end())
            return false;

        // Drop the buffer reference outside the lock
        released = std::move(it->buffer);
        voices.erase(it);
    }
    return true;
}

void LoopPlaybackEngine::stopAll()
{
    std::vector<Voice> released;
    {
        const juce::ScopedLock sl(lock);
        released.swap(voices);
        voices.reserve(64);
    }
}

int LoopPlaybackEngine::getNumActiveVoices() const
{
    const juce::ScopedLock sl(lock);
    return static_cast<int>(voices.size());
}

void LoopPlaybackEngine::renderNextBlock(float* const* outputChannelData, int numOutputChannels, int numSamples)
{
    {
        const juce::ScopedLock sl(lock);

        for (auto& voice : voices)
        {
            const auto& buffer = *voice.buffer;
            const int length = buffer.getNumSamples();
            const int voiceChannels = buffer.getNumChannels();

            for (int channel = 0; channel < numOutputChannels; ++channel)
            {
                float* out = outputChannelData[channel];
                if (out == nullptr)
                    continue;

                // Outputs beyond the voice's channels get its first channel
                const float* src = buffer.getReadPointer(channel < voiceChannels ? channel : 0);
                int pos = voice.position;
                int done = 0;
                while (done < numSamples)
                {
                    const int chunk = juce::jmin(numSamples - done, length - pos);
                    juce::FloatVectorOperations::add(out + done, src + pos, chunk);
                    done += chunk;
                    pos = (pos + chunk) % length;
                }
            }

            voice.position = static_cast<int>((static_cast<juce::int64>(voice.position) + numSamples) % length);
        }
    }

    renderedSamples.fetch_add(numSamples);
}

} // namespace LayerLoop
