#include "LooperSettings.h"

namespace
{
double readDouble(juce::DynamicObject& obj, const juce::Identifier& name, double fallback)
{
    auto value = obj.getProperty(name);
    return value.isVoid() ? fallback : static_cast<double>(value);
}

int readInt(juce::DynamicObject& obj, const juce::Identifier& name, int fallback)
{
    auto value = obj.getProperty(name);
    return value.isVoid() ? fallback : static_cast<int>(value);
}

bool readBool(juce::DynamicObject& obj, const juce::Identifier& name, bool fallback)
{
    auto value = obj.getProperty(name);
    return value.isVoid() ? fallback : static_cast<bool>(value);
}
} // namespace

namespace LayerLoop
{

juce::var LooperSettings::toVar() const
{
    juce::DynamicObject::Ptr root = new juce::DynamicObject();
    root->setProperty("maxLoopSeconds", maxLoopSeconds);
    root->setProperty("latencyCompensationSeconds", latencyCompensationSeconds);
    root->setProperty("captureHeadroomSeconds", captureHeadroomSeconds);
    root->setProperty("progressIntervalMs", progressIntervalMs);
    root->setProperty("exportFileName", exportFileName);
    root->setProperty("inputChannels", inputChannels);
    root->setProperty("outputChannels", outputChannels);

    juce::DynamicObject::Ptr capture = new juce::DynamicObject();
    capture->setProperty("echoCancellation", constraints.echoCancellation);
    capture->setProperty("noiseSuppression", constraints.noiseSuppression);
    capture->setProperty("autoGainControl", constraints.autoGainControl);
    capture->setProperty("lowLatency", constraints.lowLatency);
    root->setProperty("capture", juce::var(capture));

    return juce::var(root);
}

juce::Result LooperSettings::fromVar(const juce::var& data, LooperSettings& out)
{
    if (! data.isObject())
        return juce::Result::fail("Settings data is not an object");

    auto* rootObj = data.getDynamicObject();
    if (rootObj == nullptr)
        return juce::Result::fail("Invalid settings object");

    LooperSettings settings;
    settings.maxLoopSeconds = readDouble(*rootObj, "maxLoopSeconds", settings.maxLoopSeconds);
    settings.latencyCompensationSeconds = readDouble(*rootObj, "latencyCompensationSeconds", settings.latencyCompensationSeconds);
    settings.captureHeadroomSeconds = readDouble(*rootObj, "captureHeadroomSeconds", settings.captureHeadroomSeconds);
    settings.progressIntervalMs = readInt(*rootObj, "progressIntervalMs", settings.progressIntervalMs);
    settings.inputChannels = readInt(*rootObj, "inputChannels", settings.inputChannels);
    settings.outputChannels = readInt(*rootObj, "outputChannels", settings.outputChannels);

    auto fileVar = rootObj->getProperty("exportFileName");
    if (! fileVar.isVoid() && fileVar.toString().isNotEmpty())
        settings.exportFileName = fileVar.toString();

    if (settings.maxLoopSeconds <= 0.0 || settings.maxLoopSeconds > 600.0)
        return juce::Result::fail("maxLoopSeconds must be in (0, 600]");

    settings.latencyCompensationSeconds = juce::jlimit(0.0, 1.0, settings.latencyCompensationSeconds);
    settings.captureHeadroomSeconds = juce::jmax(settings.maxLoopSeconds, settings.captureHeadroomSeconds);
    settings.progressIntervalMs = juce::jlimit(5, 1000, settings.progressIntervalMs);
    settings.inputChannels = juce::jlimit(1, 8, settings.inputChannels);
    settings.outputChannels = juce::jlimit(1, 8, settings.outputChannels);

    auto captureVar = rootObj->getProperty("capture");
    if (captureVar.isObject())
    {
        auto* capture = captureVar.getDynamicObject();
        auto& c = settings.constraints;
        c.echoCancellation = readBool(*capture, "echoCancellation", c.echoCancellation);
        c.noiseSuppression = readBool(*capture, "noiseSuppression", c.noiseSuppression);
        c.autoGainControl = readBool(*capture, "autoGainControl", c.autoGainControl);
        c.lowLatency = readBool(*capture, "lowLatency", c.lowLatency);
    }

    out = settings;
    return juce::Result::ok();
}

juce::Result LooperSettings::saveToFile(const juce::File& file) const
{
    juce::String json = juce::JSON::toString(toVar(), false);
    if (file.replaceWithText(json))
        return juce::Result::ok();
    return juce::Result::fail("Failed to write settings to " + file.getFullPathName());
}

juce::Result LooperSettings::loadFromFile(const juce::File& file, LooperSettings& out)
{
    if (! file.existsAsFile())
        return juce::Result::fail("Settings file not found: " + file.getFullPathName());

    auto jsonText = file.loadFileAsString();
    if (jsonText.isEmpty())
        return juce::Result::fail("Settings file is empty or unreadable");

    juce::var parsed;
    auto parseResult = juce::JSON::parse(jsonText, parsed);
    if (parseResult.failed())
        return juce::Result::fail("Unable to parse settings JSON: " + parseResult.getErrorMessage());

    return fromVar(parsed, out);
}

} // namespace LayerLoop
