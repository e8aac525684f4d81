#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>
#include "Engine/AudioDeviceHost.h"
#include "TestUtils.h"

using namespace LayerLoop;

class DeviceCaptureSourceTests : public juce::UnitTest
{
public:
    DeviceCaptureSourceTests() : juce::UnitTest("DeviceCaptureSourceTests") {}

    void runTest() override
    {
        beginTest("Capture needs a running device");
        testNotPrepared();

        beginTest("Captured input decodes back");
        testCaptureRoundTrip();

        beginTest("Input outside a capture is ignored");
        testIdleInput();

        beginTest("Capture stops at the headroom");
        testOverflow();

        beginTest("Mono input on a stereo capture");
        testMonoInput();

        beginTest("Device callback");
        testDeviceCallback();
    }

    static void push(DeviceCaptureSource& source, const juce::AudioBuffer<float>& block)
    {
        source.pushInput(block.getArrayOfReadPointers(), block.getNumChannels(), block.getNumSamples());
    }

    // Ends the capture and decodes what it delivered
    DecodedAudio finish(DeviceCaptureSource& source)
    {
        DecodedAudio decoded;
        bool called = false;
        source.endCapture([this, &decoded, &called](juce::Result result, juce::MemoryBlock bytes)
        {
            called = true;
            expect(result.wasOk(), result.getErrorMessage());
            JuceAudioDecoder decoder;
            auto decodeResult = decoder.decode(bytes, decoded);
            expect(decodeResult.wasOk(), decodeResult.getErrorMessage());
        });
        expect(called, "endCapture reports back before returning");
        return decoded;
    }

    void testNotPrepared()
    {
        LooperSettings settings;
        AudioDeviceHost host(settings);
        auto& source = host.getCaptureSource();

        expect(! source.isOpen());
        expect(source.beginCapture().failed());
        expect(! source.isCapturing());
    }

    void testCaptureRoundTrip()
    {
        LooperSettings settings;
        AudioDeviceHost host(settings);
        auto& source = host.getCaptureSource();
        source.prepare(8000.0, 1);

        expect(source.beginCapture().wasOk());
        expect(source.beginCapture().failed(), "Already capturing");

        auto input = TestUtils::makeRamp(1, 300, -0.2f, 0.001f);
        for (int start = 0; start < 300; start += 100)
        {
            juce::AudioBuffer<float> block(1, 100);
            block.copyFrom(0, 0, input, 0, start, 100);
            push(source, block);
        }
        expectEquals(source.getNumCapturedSamples(), 300);

        auto decoded = finish(source);
        expect(! source.isCapturing());
        expectEquals(decoded.sampleRate, 8000.0);
        expectEquals(decoded.samples.getNumSamples(), 300);
        for (int i = 0; i < 300; ++i)
            expectEquals(decoded.samples.getSample(0, i), input.getSample(0, i));

        bool failed = false;
        source.endCapture([&failed](juce::Result result, juce::MemoryBlock) { failed = result.failed(); });
        expect(failed, "A second endCapture has nothing to deliver");
    }

    void testIdleInput()
    {
        LooperSettings settings;
        AudioDeviceHost host(settings);
        auto& source = host.getCaptureSource();
        source.prepare(8000.0, 1);

        push(source, TestUtils::makeConstant(1, 64, 0.5f));
        expect(source.beginCapture().wasOk());
        expectEquals(source.getNumCapturedSamples(), 0);

        push(source, TestUtils::makeConstant(1, 32, 0.25f));
        auto decoded = finish(source);
        expectEquals(decoded.samples.getNumSamples(), 32);
        expectEquals(decoded.samples.getSample(0, 0), 0.25f);
    }

    void testOverflow()
    {
        LooperSettings settings;
        settings.captureHeadroomSeconds = 0.0625;
        AudioDeviceHost host(settings);
        auto& source = host.getCaptureSource();
        source.prepare(8000.0, 1);

        expect(source.beginCapture().wasOk());
        push(source, TestUtils::makeConstant(1, 300, 0.1f));
        push(source, TestUtils::makeConstant(1, 300, 0.1f));
        expectEquals(source.getNumCapturedSamples(), 500);

        auto decoded = finish(source);
        expectEquals(decoded.samples.getNumSamples(), 500, "What fit is kept");
    }

    void testMonoInput()
    {
        LooperSettings settings;
        AudioDeviceHost host(settings);
        auto& source = host.getCaptureSource();
        source.prepare(8000.0, 2);

        expect(source.beginCapture().wasOk());
        push(source, TestUtils::makeConstant(1, 50, 0.3f));

        auto decoded = finish(source);
        expectEquals(decoded.samples.getNumChannels(), 2);
        expectEquals(decoded.samples.getSample(1, 49), 0.3f);
    }

    void testDeviceCallback()
    {
        LooperSettings settings;
        AudioDeviceHost host(settings);
        host.getCaptureSource().prepare(8000.0, 1);
        host.getPlaybackEngine().prepare(8000.0);

        expect(host.getPlaybackEngine().startLoop(TestUtils::share(TestUtils::makeConstant(1, 10, 0.5f)), 0)
               != invalidVoiceHandle);
        expect(host.getCaptureSource().beginCapture().wasOk());

        auto input = TestUtils::makeConstant(1, 80, 0.125f);
        juce::AudioBuffer<float> output(2, 80);
        output.clear();
        output.setSample(0, 0, 9.0f); // stale data the callback must clear

        juce::AudioIODeviceCallbackContext context;
        host.audioDeviceIOCallbackWithContext(input.getArrayOfReadPointers(), 1,
                                              output.getArrayOfWritePointers(), 2,
                                              80, context);

        expectEquals(output.getSample(0, 0), 0.5f);
        expectEquals(output.getSample(1, 79), 0.5f);
        expectEquals(host.getCaptureSource().getNumCapturedSamples(), 80);
        expectWithinAbsoluteError(host.getPlaybackEngine().now(), 0.01, 1e-12);

        auto decoded = finish(host.getCaptureSource());
        expectEquals(decoded.samples.getSample(0, 40), 0.125f);
    }
};

int main(int argc, char* argv[])
{
    juce::ignoreUnused(argc, argv);
    juce::ScopedJuceInitialiser_GUI juceInitialiser;

    DeviceCaptureSourceTests tests;
    juce::UnitTestRunner runner;
    runner.runTests({ &tests });

    int failures = 0;
    for (int i = 0; i < runner.getNumResults(); ++i)
        failures += runner.getResult(i)->failures;
    return failures > 0 ? 1 : 0;
}
