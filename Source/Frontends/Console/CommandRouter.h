#pragma once

#include <juce_core/juce_core.h>
#include "../../Engine/LooperSession.h"
#include <functional>

namespace LayerLoop
{
namespace Console
{

// CommandRouter maps the console's text commands onto the looper session.
// It runs on the message thread, one line at a time.
class CommandRouter
{
public:
    CommandRouter(LooperSession& session, const LooperSettings& settings);

    // Returns false once the user asked to quit
    bool handleCommand(const juce::String& line);

    juce::String describeStatus() const;
    static juce::String getHelpText();

    // Where replies go; the application prints them to stdout
    std::function<void(const juce::String&)> onOutput;

    void setExportDirectory(const juce::File& directory) { exportDirectory = directory; }

private:
    // The record button: starts a master, or an overdub only while playing
    void recordPressed();
    void stopRecordPressed();
    void exportPressed(const juce::String& fileName);

    void print(const juce::String& text);

    LooperSession& session;
    juce::String defaultExportFileName;
    juce::File exportDirectory;

    JUCE_DECLARE_NON_COPYABLE(CommandRouter)
};

} // namespace Console
} // namespace LayerLoop
