#include "LayerStack.h"

namespace LayerLoop
{

void LayerStack::setMaster(MasterLoop newMaster)
{
    jassert(newMaster.samples != nullptr);
    layers.clear();
    master = std::move(newMaster);
}

const MasterLoop& LayerStack::getMaster() const
{
    jassert(master.has_value());
    return *master;
}

juce::Result LayerStack::push(SampleBufferPtr samples, LayerId& newLayerId)
{
    if (! master.has_value())
        return juce::Result::fail("Cannot add a layer without a master loop");

    if (samples == nullptr
        || samples->getNumSamples() != master->getLength()
        || samples->getNumChannels() != master->getNumChannels())
        return juce::Result::fail("Layer does not match the master loop length");

    newLayerId = nextLayerId++;
    layers.push_back({ newLayerId, std::move(samples) });
    juce::Logger::writeToLog("Layer " + juce::String(newLayerId) + " pushed, "
                             + juce::String((int) layers.size()) + " layer(s) on the stack");
    return juce::Result::ok();
}

LayerStack::PopResult LayerStack::pop()
{
    if (! layers.empty())
    {
        juce::Logger::writeToLog("Undo: removed layer " + juce::String(layers.back().id));
        layers.pop_back();
        return PopResult::LayerRemoved;
    }

    if (master.has_value())
    {
        juce::Logger::writeToLog("Undo: no layers left, clearing the master loop");
        master.reset();
        return PopResult::MasterCleared;
    }

    return PopResult::Empty;
}

void LayerStack::clear()
{
    layers.clear();
    master.reset();
}

} // namespace LayerLoop
