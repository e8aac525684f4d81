#include "CommandRouter.h"

namespace LayerLoop
{
namespace Console
{

CommandRouter::CommandRouter(LooperSession& s, const LooperSettings& settings)
    : session(s),
      defaultExportFileName(settings.exportFileName),
      exportDirectory(juce::File::getCurrentWorkingDirectory())
{
}

bool CommandRouter::handleCommand(const juce::String& line)
{
    const auto trimmed = line.trim();
    const auto command = trimmed.upToFirstOccurrenceOf(" ", false, false).toLowerCase();
    const auto argument = trimmed.fromFirstOccurrenceOf(" ", false, false).trim();

    if (command.isEmpty())
        return true;

    if (command == "quit" || command == "exit")
        return false;

    if (command == "rec")
        recordPressed();
    else if (command == "stop-rec")
        stopRecordPressed();
    else if (command == "play")
        session.play();
    else if (command == "stop")
        session.stop();
    else if (command == "toggle")
        session.togglePlay();
    else if (command == "undo")
        session.undo();
    else if (command == "clear")
        session.clear();
    else if (command == "export")
        exportPressed(argument);
    else if (command == "status")
        print(describeStatus());
    else if (command == "help")
        print(getHelpText());
    else
        print("Unknown command '" + command + "', type help for the list");

    return true;
}

void CommandRouter::recordPressed()
{
    if (session.isRecording())
    {
        print("Already recording");
        return;
    }

    if (session.hasMasterLoop() && ! session.isPlaying())
    {
        print("Start playback before recording an overdub");
        return;
    }

    session.beginCapture();
}

void CommandRouter::stopRecordPressed()
{
    if (! session.isRecording())
    {
        print("Not recording");
        return;
    }

    session.endCapture();
}

void CommandRouter::exportPressed(const juce::String& fileName)
{
    const auto file = exportDirectory.getChildFile(fileName.isNotEmpty() ? fileName : defaultExportFileName);

    auto result = session.exportMixToFile(file);
    if (result.failed())
    {
        // A missing master was already reported through the session's error callback
        if (session.hasMasterLoop())
            print("Export failed: " + result.getErrorMessage());
    }
    else
    {
        print("Exported " + file.getFullPathName());
    }
}

juce::String CommandRouter::describeStatus() const
{
    juce::String status = "Mode: " + toString(session.getMode());
    if (session.hasMasterLoop())
    {
        status << " | loop " << juce::String(session.getLoopDuration(), 3) << "s"
               << " | layers " << (int) session.getNumLayers();
        if (session.isPlaying())
            status << " | phase " << juce::String(session.getScheduler().getPhase(), 2);
    }
    return status;
}

juce::String CommandRouter::getHelpText()
{
    return "Commands:\n"
           "  rec           record the master loop, or an overdub while playing\n"
           "  stop-rec      finish the current recording\n"
           "  play | stop   start or stop playback\n"
           "  toggle        toggle playback\n"
           "  undo          remove the last layer, then the master loop\n"
           "  clear         discard everything\n"
           "  export [file] write the mixdown as 16-bit WAV\n"
           "  status        show the current state\n"
           "  quit";
}

void CommandRouter::print(const juce::String& text)
{
    if (onOutput != nullptr)
        onOutput(text);
}

} // namespace Console
} // namespace LayerLoop
