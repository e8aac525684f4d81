#include "LooperTypes.h"

namespace LayerLoop
{

juce::String toString(LooperMode mode)
{
    switch (mode)
    {
        case LooperMode::Ready:     return "READY";
        case LooperMode::Recording: return "RECORDING";
        case LooperMode::Playing:   return "PLAYING";
        case LooperMode::Stopped:   return "STOPPED";
    }
    return "UNKNOWN";
}

juce::String toString(LooperError error)
{
    switch (error)
    {
        case LooperError::DeviceAccess:       return "DeviceAccessError";
        case LooperError::CaptureInit:        return "CaptureInitError";
        case LooperError::Decode:             return "DecodeError";
        case LooperError::ExportPrecondition: return "ExportPrecondition";
    }
    return "UnknownError";
}

} // namespace LayerLoop
