#pragma once

#include <juce_core/juce_core.h>
#include "LooperTypes.h"
#include <optional>
#include <vector>

namespace LayerLoop
{

// LayerStack holds the master loop and the overdub layers recorded over it.
// Undo pops layers newest-first; once none are left it discards the master.
class LayerStack
{
public:
    enum class PopResult
    {
        LayerRemoved,
        MasterCleared,
        Empty
    };

    LayerStack() = default;
    ~LayerStack() = default;

    void setMaster(MasterLoop master);
    bool hasMaster() const { return master.has_value(); }
    const MasterLoop& getMaster() const;

    // Appends a layer. Fails if there is no master or the buffer doesn't match its shape.
    juce::Result push(SampleBufferPtr samples, LayerId& newLayerId);

    PopResult pop();
    void clear();

    const std::vector<Layer>& getLayers() const { return layers; }
    size_t getNumLayers() const { return layers.size(); }
    const Layer* getTopLayer() const { return layers.empty() ? nullptr : &layers.back(); }

private:
    std::optional<MasterLoop> master;
    std::vector<Layer> layers;
    LayerId nextLayerId = masterLayerId + 1;
};

} // namespace LayerLoop
