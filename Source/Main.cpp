#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>
#include "Engine/AudioCodec.h"
#include "Engine/AudioDeviceHost.h"
#include "Engine/LooperSession.h"
#include "Frontends/Console/CommandRouter.h"
#include <iostream>
#include <string>

namespace
{

// Reads commands from stdin and runs each one on the message thread.
// Stops the dispatch loop on quit or end of input.
class CommandReader : public juce::Thread
{
public:
    explicit CommandReader(LayerLoop::Console::CommandRouter& r)
        : juce::Thread("LayerLoop command reader"), router(r)
    {
    }

    void run() override
    {
        std::string line;
        while (! threadShouldExit() && std::getline(std::cin, line))
        {
            const juce::String command(line);
            juce::WaitableEvent handled;
            bool keepRunning = true;

            const bool posted = juce::MessageManager::callAsync([this, command, &handled, &keepRunning]
            {
                keepRunning = router.handleCommand(command);
                handled.signal();
            });

            if (! posted)
                return;

            handled.wait(-1);
            if (! keepRunning)
                break;
        }

        juce::MessageManager::callAsync([] { juce::MessageManager::getInstance()->stopDispatchLoop(); });
    }

private:
    LayerLoop::Console::CommandRouter& router;
};

void printLine(const juce::String& text)
{
    std::cout << text << std::endl;
}

} // namespace

int main(int argc, char* argv[])
{
    juce::ScopedJuceInitialiser_GUI juceInitialiser;

    std::unique_ptr<juce::FileLogger> fileLogger(
        juce::FileLogger::createDefaultAppLogger("LayerLoop", "LayerLoop.log", "LayerLoop console session"));
    juce::Logger::setCurrentLogger(fileLogger.get());

    LayerLoop::LooperSettings settings;
    if (argc > 1)
    {
        const auto settingsFile = juce::File::getCurrentWorkingDirectory().getChildFile(argv[1]);
        auto result = LayerLoop::LooperSettings::loadFromFile(settingsFile, settings);
        if (result.failed())
        {
            std::cerr << "Could not load settings: " << result.getErrorMessage() << std::endl;
            juce::Logger::setCurrentLogger(nullptr);
            return 1;
        }
        juce::Logger::writeToLog("Loaded settings from " + settingsFile.getFullPathName());
    }

    {
        LayerLoop::AudioDeviceHost host(settings);
        LayerLoop::JuceAudioDecoder decoder;
        LayerLoop::LooperSession session(settings,
                                         host.getCaptureSource(),
                                         decoder,
                                         host.getPlaybackEngine(),
                                         host.getPlaybackEngine());

        LayerLoop::Console::CommandRouter router(session, settings);
        router.onOutput = printLine;

        session.onStateChange = [](LayerLoop::LooperMode mode)
        {
            printLine("[" + LayerLoop::toString(mode) + "]");
        };
        session.onError = [](LayerLoop::LooperError, const juce::String& message)
        {
            printLine("Error: " + message);
        };
        session.onLoopWrap = []
        {
            DBG("loop wrapped");
        };

        // The session retries on the first rec if this fails
        auto openResult = host.openDevice(settings.constraints);
        if (openResult.failed())
            printLine("Error: " + openResult.getErrorMessage());

        printLine("LayerLoop ready. Max loop length " + juce::String(settings.maxLoopSeconds, 1) + "s.");
        printLine(LayerLoop::Console::CommandRouter::getHelpText());

        CommandReader reader(router);
        reader.startThread();

        juce::MessageManager::getInstance()->runDispatchLoop();

        reader.stopThread(1000);
        session.clear();
    }

    juce::Logger::setCurrentLogger(nullptr);
    return 0;
}
