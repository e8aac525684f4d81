#pragma once

#include <juce_core/juce_core.h>
#include <juce_audio_basics/juce_audio_basics.h>
#include "CaptureDevice.h"
#include "LooperTypes.h"

namespace LayerLoop
{

// OverdubAligner writes a captured passage into a silent, loop-length buffer
// starting at the loop position where the capture began. Anything past the
// loop end wraps around to the start. Writes overwrite rather than mix, so a
// passage longer than the loop keeps only its most recent pass at each position.
class OverdubAligner
{
public:
    OverdubAligner() = default;
    ~OverdubAligner() = default;

    // Subtracted from the capture offset to account for input latency
    void setLatencyCompensation(double seconds) { latencyCompensationSeconds = seconds; }
    double getLatencyCompensation() const { return latencyCompensationSeconds; }

    // Loop position in seconds, in [0, loopDuration), at which a capture started.
    // 0 when playback isn't running.
    double captureOffsetWithinLoop(double captureStartClockTime,
                                   bool playbackActive,
                                   double loopStartClockTime,
                                   double loopDuration) const;

    // floor(offset / duration * length), kept inside the buffer
    static int toSampleOffset(double offsetSeconds, double loopDuration, int loopLength);

    // Produces a buffer with the master's channel count, length and sample rate.
    // Fails without touching aligned if the passage is empty.
    juce::Result align(const MasterLoop& master,
                       const DecodedAudio& passage,
                       double offsetSeconds,
                       std::shared_ptr<juce::AudioBuffer<float>>& aligned) const;

private:
    static void resample(const DecodedAudio& passage, double targetRate, juce::AudioBuffer<float>& out);

    double latencyCompensationSeconds = 0.0;
};

} // namespace LayerLoop
