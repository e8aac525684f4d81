#pragma once

#include <juce_core/juce_core.h>
#include "CaptureDevice.h"
#include "LooperTypes.h"

namespace LayerLoop
{

// MasterLoopRecorder turns the first captured passage into the master loop.
// The decoded buffer's own length is the loop length; clock time is only a
// sanity check, and both are bounded by the maximum loop length.
class MasterLoopRecorder
{
public:
    enum class State
    {
        Idle,
        ArmedMaster,
        Committed
    };

    explicit MasterLoopRecorder(double maxLoopSeconds = 10.0);
    ~MasterLoopRecorder() = default;

    void setMaxLoopSeconds(double seconds);
    double getMaxLoopSeconds() const { return maxLoopSeconds; }

    State getState() const { return state; }

    // Arms a master capture started at clockTime.
    // Returns false if a master is already armed or committed.
    bool begin(double clockTime);

    double getStartClockTime() const { return startClockTime; }

    // Clock time at which an armed capture must be force-stopped
    double getDeadlineClockTime() const { return startClockTime + maxLoopSeconds; }

    // Builds the master loop from the decoded passage.
    // On failure the recorder returns to Idle and out is left untouched.
    juce::Result commit(const DecodedAudio& decoded, double endClockTime, MasterLoop& out);

    // The capture failed before anything was decoded
    void cancel();

    // The master loop was discarded (undo or clear)
    void reset();

private:
    static constexpr double sanityToleranceSeconds = 0.25;

    double maxLoopSeconds;
    double startClockTime = 0.0;
    State state = State::Idle;
};

} // namespace LayerLoop
