#include <juce_core/juce_core.h>
#include "Engine/LayerStack.h"
#include "TestUtils.h"

using namespace LayerLoop;

class LayerStackTests : public juce::UnitTest
{
public:
    LayerStackTests() : juce::UnitTest("LayerStackTests") {}

    void runTest() override
    {
        beginTest("Push requires a master");
        testPushWithoutMaster();

        beginTest("Layer shape must match the master");
        testShapeMismatch();

        beginTest("Undo is LIFO");
        testUndoOrder();

        beginTest("Undo past the last layer clears the master");
        testTwoTierUndo();

        beginTest("Clear");
        testClear();

        beginTest("New master drops old layers");
        testReplaceMaster();
    }

    void testPushWithoutMaster()
    {
        LayerStack stack;
        LayerId id = 0;
        auto result = stack.push(TestUtils::share(TestUtils::makeConstant(1, 10, 0.1f)), id);
        expect(result.failed());
        expectEquals((int) stack.getNumLayers(), 0);
    }

    void testShapeMismatch()
    {
        LayerStack stack;
        stack.setMaster(TestUtils::makeMaster(2, 100, 100.0));

        LayerId id = 0;
        expect(stack.push(TestUtils::share(TestUtils::makeConstant(2, 99, 0.1f)), id).failed(), "Short layer rejected");
        expect(stack.push(TestUtils::share(TestUtils::makeConstant(1, 100, 0.1f)), id).failed(), "Channel mismatch rejected");
        expect(stack.push(nullptr, id).failed());
        expectEquals((int) stack.getNumLayers(), 0);

        expect(stack.push(TestUtils::share(TestUtils::makeConstant(2, 100, 0.1f)), id).wasOk());
        expectEquals((int) stack.getNumLayers(), 1);
    }

    void testUndoOrder()
    {
        LayerStack stack;
        stack.setMaster(TestUtils::makeMaster(1, 10, 10.0));

        std::vector<LayerId> ids;
        for (int i = 0; i < 3; ++i)
        {
            LayerId id = 0;
            expect(stack.push(TestUtils::share(TestUtils::makeConstant(1, 10, 0.1f * (float) (i + 1))), id).wasOk());
            ids.push_back(id);
        }

        expect(ids[0] != masterLayerId);
        expect(ids[0] < ids[1] && ids[1] < ids[2], "Ids follow recording order");
        expect(stack.getTopLayer() != nullptr && stack.getTopLayer()->id == ids[2]);

        expect(stack.pop() == LayerStack::PopResult::LayerRemoved);
        expect(stack.getTopLayer()->id == ids[1], "Newest layer went first");

        expect(stack.pop() == LayerStack::PopResult::LayerRemoved);
        expect(stack.getTopLayer()->id == ids[0]);
        expect(stack.hasMaster());
    }

    void testTwoTierUndo()
    {
        LayerStack stack;
        stack.setMaster(TestUtils::makeMaster(1, 10, 10.0));

        LayerId id = 0;
        expect(stack.push(TestUtils::share(TestUtils::makeConstant(1, 10, 0.2f)), id).wasOk());

        expect(stack.pop() == LayerStack::PopResult::LayerRemoved);
        expect(stack.hasMaster());

        expect(stack.pop() == LayerStack::PopResult::MasterCleared);
        expect(! stack.hasMaster());

        expect(stack.pop() == LayerStack::PopResult::Empty, "Nothing left to undo");
    }

    void testClear()
    {
        LayerStack stack;
        stack.setMaster(TestUtils::makeMaster(1, 10, 10.0));
        LayerId id = 0;
        expect(stack.push(TestUtils::share(TestUtils::makeConstant(1, 10, 0.2f)), id).wasOk());

        stack.clear();
        expect(! stack.hasMaster());
        expectEquals((int) stack.getNumLayers(), 0);
        expect(stack.getTopLayer() == nullptr);
    }

    void testReplaceMaster()
    {
        LayerStack stack;
        stack.setMaster(TestUtils::makeMaster(1, 10, 10.0));
        LayerId id = 0;
        expect(stack.push(TestUtils::share(TestUtils::makeConstant(1, 10, 0.2f)), id).wasOk());

        stack.setMaster(TestUtils::makeMaster(1, 20, 10.0));
        expectEquals((int) stack.getNumLayers(), 0);
        expectEquals(stack.getMaster().getLength(), 20);
    }
};

int main(int argc, char* argv[])
{
    juce::ignoreUnused(argc, argv);
    LayerStackTests tests;
    juce::UnitTestRunner runner;
    runner.runTests({ &tests });

    int failures = 0;
    for (int i = 0; i < runner.getNumResults(); ++i)
        failures += runner.getResult(i)->failures;
    return failures > 0 ? 1 : 0;
}
