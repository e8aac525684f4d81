#include "PlaybackScheduler.h"
#include "OverdubAligner.h"
#include <cmath>

namespace LayerLoop
{

PlaybackScheduler::PlaybackScheduler(AudioClock& c, LoopOutput& o)
    : clock(c),
      output(o),
      ticker(*this)
{
}

PlaybackScheduler::~PlaybackScheduler()
{
    ticker.stopTimer();
    stop();
}

bool PlaybackScheduler::play(const LayerStack& stack)
{
    if (state.active)
        stop();

    if (! stack.hasMaster())
        return false;

    const auto& master = stack.getMaster();
    loopDuration = master.getDuration();
    loopLength = master.getLength();

    state.active = true;
    state.loopStartClockTime = clock.now();

    startUnit(masterLayerId, master.samples, 0);
    for (const auto& layer : stack.getLayers())
        startUnit(layer.id, layer.samples, 0);

    DBG("[PlaybackScheduler] playing " << (int) units.size() << " unit(s) from clock "
        << state.loopStartClockTime);

    ticker.startTimer(progressIntervalMs);
    return true;
}

void PlaybackScheduler::stop()
{
    for (const auto& unit : units)
    {
        // A voice that already finished is not an error
        if (! output.stopLoop(unit.second))
            DBG("[PlaybackScheduler] unit for layer " << (juce::int64) unit.first << " had already stopped");
    }
    units.clear();

    // The ticker sees the cleared flag on its next tick and stops itself
    state.active = false;
}

bool PlaybackScheduler::togglePlay(const LayerStack& stack)
{
    if (state.active)
    {
        stop();
        return false;
    }
    return play(stack);
}

void PlaybackScheduler::resync(const LayerStack& stack)
{
    if (! state.active)
        return;

    juce::Logger::writeToLog("Restarting playback to resync layers");
    play(stack);
}

void PlaybackScheduler::addLayerAtCurrentPhase(const Layer& layer)
{
    if (! state.active)
        return;

    const int offset = OverdubAligner::toSampleOffset(getElapsedInLoop(), loopDuration, loopLength);
    startUnit(layer.id, layer.samples, offset);
    DBG("[PlaybackScheduler] layer " << (juce::int64) layer.id << " joined at sample " << offset);
}

double PlaybackScheduler::getElapsedInLoop() const
{
    if (! state.active || loopDuration <= 0.0)
        return 0.0;

    double elapsed = std::fmod(clock.now() - state.loopStartClockTime, loopDuration);
    if (elapsed < 0.0)
        elapsed += loopDuration;
    return elapsed >= loopDuration ? 0.0 : elapsed;
}

double PlaybackScheduler::getPhase() const
{
    if (! state.active || loopDuration <= 0.0)
        return 0.0;
    return getElapsedInLoop() / loopDuration;
}

void PlaybackScheduler::setProgressInterval(int intervalMs)
{
    progressIntervalMs = juce::jmax(1, intervalMs);
    if (state.active && ticker.isTimerRunning())
        ticker.startTimer(progressIntervalMs);
}

bool PlaybackScheduler::tick()
{
    if (! state.active)
        return false;

    if (onProgress != nullptr)
        onProgress(getPhase());
    return true;
}

void PlaybackScheduler::startUnit(LayerId layerId, const SampleBufferPtr& samples, int startOffsetSamples)
{
    auto handle = output.startLoop(samples, startOffsetSamples);
    if (handle == invalidVoiceHandle)
    {
        juce::Logger::writeToLog("PlaybackScheduler: could not start a voice for layer " + juce::String(layerId));
        return;
    }
    units[layerId] = handle;
}

} // namespace LayerLoop
