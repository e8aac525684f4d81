#pragma once

namespace LayerLoop
{

// The one time source for all loop offset and phase math.
// now() is in seconds and never decreases.
class AudioClock
{
public:
    virtual ~AudioClock() = default;
    virtual double now() const = 0;
};

} // namespace LayerLoop
