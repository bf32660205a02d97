#include <gtest/gtest.h>
#include <drawlink/drawlink.h>

using namespace drawlink;

// ============================================================================
// LayoutResultTest - box storage and bounds
// ============================================================================

TEST(LayoutResultTest, StoresAndReplacesBoxes) {
    LayoutResult result;
    result.setNodeBox("a", Rect{0, 0, 10, 10});
    result.setNodeBox("a", Rect{5, 5, 20, 20});

    EXPECT_EQ(result.nodeCount(), 1u);
    EXPECT_TRUE(result.hasNodeBox("a"));
    EXPECT_EQ(result.nodeBox("a"), (Rect{5, 5, 20, 20}));
}

TEST(LayoutResultTest, MissingBoxLookup) {
    LayoutResult result;

    EXPECT_FALSE(result.hasNodeBox("ghost"));
    EXPECT_EQ(result.findNodeBox("ghost"), nullptr);
    try {
        result.nodeBox("ghost");
        FAIL() << "expected LayoutError";
    } catch (const LayoutError& e) {
        EXPECT_EQ(e.nodeId(), "ghost");
    }
}

TEST(LayoutResultTest, ComputeBoundsUnitesEveryBox) {
    LayoutResult result;
    EXPECT_EQ(result.computeBounds(), Rect{});

    result.setNodeBox("a", Rect{-10, 0, 20, 5});
    result.setNodeBox("b", Rect{30, -40, 10, 10});

    EXPECT_EQ(result.computeBounds(), (Rect{-10, -40, 50, 45}));
}
