#include "LooperSession.h"

namespace LayerLoop
{

LooperSession::LooperSession(const LooperSettings& s,
                             CaptureDevice& capture,
                             AudioDecoder& audioDecoder,
                             AudioClock& audioClock,
                             LoopOutput& output)
    : settings(s),
      captureDevice(capture),
      decoder(audioDecoder),
      clock(audioClock),
      recorder(s.maxLoopSeconds),
      scheduler(audioClock, output),
      captureDeadline(*this)
{
    aligner.setLatencyCompensation(settings.latencyCompensationSeconds);
    scheduler.setProgressInterval(settings.progressIntervalMs);
    scheduler.onProgress = [this](double phase) { handleProgress(phase); };
}

LooperSession::~LooperSession()
{
    captureDeadline.stopTimer();
    scheduler.onProgress = nullptr;
    scheduler.stop();
}

double LooperSession::getLoopDuration() const
{
    return stack.hasMaster() ? stack.getMaster().getDuration() : 0.0;
}

//==============================================================================
void LooperSession::beginCapture()
{
    if (state.recording.active || state.finishingCapture)
    {
        DBG("[LooperSession] beginCapture ignored, a capture is already in progress");
        return;
    }

    if (! captureDevice.isOpen())
    {
        auto openResult = captureDevice.open(settings.constraints);
        if (openResult.failed())
        {
            reportError(LooperError::DeviceAccess, openResult.getErrorMessage());
            return;
        }
        juce::Logger::writeToLog("Audio Initialized");
    }

    auto startResult = captureDevice.beginCapture();
    if (startResult.failed())
    {
        reportError(LooperError::CaptureInit, "Microphone recording failed: " + startResult.getErrorMessage());
        return;
    }

    ++captureGeneration;
    const double startTime = clock.now();
    const bool isMaster = ! stack.hasMaster();
    double offset = 0.0;

    if (isMaster)
    {
        const bool armed = recorder.begin(startTime);
        jassert(armed);
        juce::ignoreUnused(armed);
    }
    else
    {
        offset = aligner.captureOffsetWithinLoop(startTime,
                                                 scheduler.isPlaying(),
                                                 scheduler.getLoopStartClockTime(),
                                                 stack.getMaster().getDuration());
    }

    juce::Logger::writeToLog(juce::String(isMaster ? "Recording master loop" : "Recording overdub")
                             + " at clock " + juce::String(startTime, 3) + "s, loop offset "
                             + juce::String(offset, 3) + "s");
    apply(Transitions::captureStarted(state, isMaster, startTime, offset));
}

void LooperSession::endCapture()
{
    if (! state.recording.active || state.finishingCapture)
        return;

    apply(Transitions::captureFinishing(state));

    juce::WeakReference<LooperSession> weakThis(this);
    const auto generation = captureGeneration;
    captureDevice.endCapture([weakThis, generation](juce::Result result, juce::MemoryBlock bytes)
    {
        if (auto* session = weakThis.get())
            session->finishCapture(generation, result, bytes);
    });
}

void LooperSession::handleCaptureDeadline()
{
    if (! state.recording.active || ! state.recording.isMaster || state.finishingCapture)
        return;

    juce::Logger::writeToLog("Maximum loop length of " + juce::String(recorder.getMaxLoopSeconds(), 1)
                             + "s reached, stopping master capture");
    endCapture();
}

void LooperSession::finishCapture(juce::uint64 generation,
                                  const juce::Result& captureResult,
                                  const juce::MemoryBlock& bytes)
{
    // A capture aborted by clear() may still report back, possibly after a
    // newer capture has been ended; only the capture being finished counts
    if (generation != captureGeneration || ! state.recording.active || ! state.finishingCapture)
    {
        DBG("[LooperSession] discarding a capture that is no longer wanted");
        return;
    }

    const double endTime = clock.now();

    if (captureResult.failed())
    {
        failCapture(LooperError::CaptureInit, "Microphone recording failed: " + captureResult.getErrorMessage());
        return;
    }

    DecodedAudio decoded;
    auto decodeResult = decoder.decode(bytes, decoded);
    if (decodeResult.failed())
    {
        failCapture(LooperError::Decode, decodeResult.getErrorMessage());
        return;
    }

    if (state.recording.isMaster)
        commitMaster(decoded, endTime);
    else
        commitOverdub(decoded);
}

void LooperSession::commitMaster(const DecodedAudio& decoded, double endClockTime)
{
    MasterLoop master;
    auto result = recorder.commit(decoded, endClockTime, master);
    if (result.failed())
    {
        failCapture(LooperError::Decode, result.getErrorMessage());
        return;
    }

    stack.setMaster(std::move(master));
    apply(Transitions::masterCommitted(state));
}

void LooperSession::commitOverdub(const DecodedAudio& decoded)
{
    jassert(stack.hasMaster());

    std::shared_ptr<juce::AudioBuffer<float>> aligned;
    auto result = aligner.align(stack.getMaster(), decoded, state.recording.captureOffsetWithinLoop, aligned);
    if (result.failed())
    {
        failCapture(LooperError::Decode, result.getErrorMessage());
        return;
    }

    LayerId layerId = 0;
    result = stack.push(std::move(aligned), layerId);
    if (result.failed())
    {
        failCapture(LooperError::Decode, result.getErrorMessage());
        return;
    }

    apply(Transitions::layerCommitted(state));
}

void LooperSession::failCapture(LooperError error, const juce::String& message)
{
    if (state.recording.isMaster)
        recorder.cancel();

    apply(Transitions::captureFailed(state, stack.hasMaster()));
    reportError(error, message);
}

void LooperSession::abortCapture()
{
    if (state.recording.isMaster)
        recorder.cancel();

    const bool wasFinishing = state.finishingCapture;
    ++captureGeneration;
    apply(Transitions::captureAborted(state, stack.hasMaster()));

    if (! wasFinishing)
        captureDevice.endCapture([](juce::Result, juce::MemoryBlock) {});

    juce::Logger::writeToLog("Capture in progress was discarded");
}

//==============================================================================
void LooperSession::play()
{
    if (! stack.hasMaster())
        return;

    apply(Transitions::playbackStarted(state));
}

void LooperSession::stop()
{
    apply(Transitions::playbackStopped(state, stack.hasMaster()));
}

void LooperSession::togglePlay()
{
    if (scheduler.isPlaying())
        stop();
    else
        play();
}

void LooperSession::undo()
{
    if (state.recording.active)
    {
        juce::Logger::writeToLog("Undo ignored while recording");
        return;
    }

    switch (stack.pop())
    {
        case LayerStack::PopResult::LayerRemoved:
            apply(Transitions::layerPopped(state));
            break;

        case LayerStack::PopResult::MasterCleared:
            recorder.reset();
            apply(Transitions::cleared(state));
            break;

        case LayerStack::PopResult::Empty:
            break;
    }
}

void LooperSession::clear()
{
    if (state.recording.active)
        abortCapture();

    stack.clear();
    recorder.reset();
    apply(Transitions::cleared(state));
    juce::Logger::writeToLog("Session cleared");
}

juce::Result LooperSession::exportMix(juce::MemoryBlock& wavData)
{
    if (! stack.hasMaster())
    {
        const juce::String message("Nothing to export!");
        reportError(LooperError::ExportPrecondition, message);
        return juce::Result::fail(message);
    }

    return mixdown.exportMix(stack, wavData);
}

juce::Result LooperSession::exportMixToFile(const juce::File& file)
{
    juce::MemoryBlock wavData;
    auto result = exportMix(wavData);
    if (result.failed())
        return result;

    if (! file.replaceWithData(wavData.getData(), wavData.getSize()))
    {
        juce::Logger::writeToLog("Export failed: could not write " + file.getFullPathName());
        return juce::Result::fail("Could not write " + file.getFullPathName());
    }

    juce::Logger::writeToLog("Mixdown written to " + file.getFullPathName());
    return juce::Result::ok();
}

//==============================================================================
void LooperSession::apply(const SessionTransition& transition)
{
    const auto previousMode = state.mode;
    state = transition.state;
    runEffect(transition.effect);

    if (state.mode != previousMode && onStateChange != nullptr)
        onStateChange(state.mode);
}

void LooperSession::runEffect(SessionEffect effect)
{
    switch (effect)
    {
        case SessionEffect::None:
            break;

        case SessionEffect::ArmCaptureDeadline:
            captureDeadline.startTimer(juce::roundToInt(recorder.getMaxLoopSeconds() * 1000.0));
            break;

        case SessionEffect::CancelCaptureDeadline:
            captureDeadline.stopTimer();
            break;

        case SessionEffect::StartPlayback:
            lastPhase = 0.0;
            if (! scheduler.play(stack))
            {
                state.playing = false;
                state.mode = Transitions::deriveMode(state, stack.hasMaster());
            }
            break;

        case SessionEffect::RestartPlayback:
            lastPhase = 0.0;
            scheduler.resync(stack);
            break;

        case SessionEffect::StopPlayback:
            scheduler.stop();
            lastPhase = 0.0;
            break;

        case SessionEffect::AddLayerUnit:
            if (auto* layer = stack.getTopLayer())
                scheduler.addLayerAtCurrentPhase(*layer);
            break;
    }
}

void LooperSession::reportError(LooperError error, const juce::String& message)
{
    juce::Logger::writeToLog(toString(error) + ": " + message);
    if (onError != nullptr)
        onError(error, message);
}

void LooperSession::handleProgress(double phase)
{
    if (phase < lastPhase && onLoopWrap != nullptr)
        onLoopWrap();
    lastPhase = phase;

    if (onProgress != nullptr)
        onProgress(phase);
}

} // namespace LayerLoop
