#include <string>

#include "gtest/gtest.h"
#include "selection.hpp"

using namespace PTG;

class SelectionAdapterTest : public ::testing::Test {
protected:
    SelectionAdapterTest() : selection(graph) {
        graph.SetVerbose(false);
        graph.Reset();
    }

    PlanarGraph graph;
    SelectionAdapter selection;
};

TEST_F(SelectionAdapterTest, StartsIdleAndIgnoresPicks) {
    EXPECT_EQ(selection.GetState(), SelectionStateType::SS_IDLE);
    EXPECT_EQ(selection.OnVertexPicked(1), PickOutcomeType::PK_IGNORED);
    EXPECT_EQ(selection.GetState(), SelectionStateType::SS_IDLE);
    EXPECT_TRUE(selection.GetSelection().empty());
}

TEST_F(SelectionAdapterTest, TwoPicksInsertOnArc) {
    selection.BeginAddVertex();
    EXPECT_EQ(selection.GetState(), SelectionStateType::SS_AWAITING_FIRST);

    EXPECT_EQ(selection.OnVertexPicked(1), PickOutcomeType::PK_RECORDED);
    EXPECT_EQ(selection.GetState(), SelectionStateType::SS_AWAITING_SECOND);
    EXPECT_EQ(selection.GetSelection(), (IdxList{1}));

    EXPECT_EQ(selection.OnVertexPicked(2), PickOutcomeType::PK_INSERTED);
    EXPECT_EQ(selection.GetState(), SelectionStateType::SS_IDLE);
    EXPECT_TRUE(selection.GetSelection().empty());
    EXPECT_EQ(selection.GetLastInserted(), 4u);
    EXPECT_EQ(selection.GetLastResult(), InsertResultType::IR_SUCCESS);
    EXPECT_EQ(graph.GetPeriphery(), (IdxList{1, 4, 2, 3}));
}

TEST_F(SelectionAdapterTest, FirstPickMustBeOnPeriphery) {
    IdxType v = INVALID_VTX_IDX;
    ASSERT_EQ(graph.InsertOnArc(1, 3, 0, v), InsertResultType::IR_SUCCESS);
    ASSERT_FALSE(graph.IsOnPeriphery(2));

    selection.BeginAddVertex();
    EXPECT_EQ(selection.OnVertexPicked(2), PickOutcomeType::PK_IGNORED);
    EXPECT_EQ(selection.OnVertexPicked(INVALID_VTX_IDX), PickOutcomeType::PK_IGNORED);
    EXPECT_EQ(selection.GetState(), SelectionStateType::SS_AWAITING_FIRST);
    EXPECT_TRUE(selection.GetSelection().empty());
}

TEST_F(SelectionAdapterTest, SecondPickOfSameVertexOrMissIsIgnored) {
    selection.BeginAddVertex();
    selection.OnVertexPicked(3);

    EXPECT_EQ(selection.OnVertexPicked(3), PickOutcomeType::PK_IGNORED);
    EXPECT_EQ(selection.OnVertexPicked(INVALID_VTX_IDX), PickOutcomeType::PK_IGNORED);
    EXPECT_EQ(selection.GetState(), SelectionStateType::SS_AWAITING_SECOND);
    EXPECT_EQ(graph.VertexCount(), 3u);
}

TEST_F(SelectionAdapterTest, FailedInsertionStillEndsTheFlow) {
    IdxType v = INVALID_VTX_IDX;
    ASSERT_EQ(graph.InsertOnArc(1, 3, 0, v), InsertResultType::IR_SUCCESS);
    const size_t vertexCount = graph.VertexCount();
    const size_t edgeCount = graph.EdgeCount();

    selection.BeginAddVertex();
    selection.OnVertexPicked(1);
    // 2 is interior now
    EXPECT_EQ(selection.OnVertexPicked(2), PickOutcomeType::PK_REJECTED);

    EXPECT_EQ(selection.GetState(), SelectionStateType::SS_IDLE);
    EXPECT_TRUE(selection.GetSelection().empty());
    EXPECT_EQ(selection.GetLastResult(), InsertResultType::IR_INVALID_BOUNDARY_VERTEX);
    EXPECT_EQ(graph.VertexCount(), vertexCount);
    EXPECT_EQ(graph.EdgeCount(), edgeCount);
}

TEST_F(SelectionAdapterTest, CancelFromEitherAwaitingState) {
    selection.BeginAddVertex();
    selection.Cancel();
    EXPECT_EQ(selection.GetState(), SelectionStateType::SS_IDLE);

    selection.BeginAddVertex();
    selection.OnVertexPicked(1);
    selection.Cancel();
    EXPECT_EQ(selection.GetState(), SelectionStateType::SS_IDLE);
    EXPECT_TRUE(selection.GetSelection().empty());
    EXPECT_EQ(graph.VertexCount(), 3u);
}

TEST_F(SelectionAdapterTest, BeginRestartsSelection) {
    selection.BeginAddVertex();
    selection.OnVertexPicked(1);

    selection.BeginAddVertex();

    EXPECT_EQ(selection.GetState(), SelectionStateType::SS_AWAITING_FIRST);
    EXPECT_TRUE(selection.GetSelection().empty());
}

TEST_F(SelectionAdapterTest, ResetCancelsAndReseeds) {
    selection.BeginAddVertex();
    selection.OnVertexPicked(1);
    selection.OnVertexPicked(2);
    selection.BeginAddVertex();
    selection.OnVertexPicked(4);

    selection.Reset();

    EXPECT_EQ(selection.GetState(), SelectionStateType::SS_IDLE);
    EXPECT_TRUE(selection.GetSelection().empty());
    EXPECT_EQ(selection.GetLastInserted(), INVALID_VTX_IDX);
    EXPECT_EQ(graph.VertexCount(), 3u);
    EXPECT_EQ(graph.GetPeriphery(), (IdxList{1, 2, 3}));
}

TEST_F(SelectionAdapterTest, UsesSelectedColorClass) {
    selection.SetColor(3);
    selection.BeginAddVertex();
    selection.OnVertexPicked(2);
    selection.OnVertexPicked(3);

    ASSERT_EQ(selection.GetLastInserted(), 4u);
    EXPECT_EQ(graph.GetVertex(4).Color(), 3);
}

TEST(SelectionStateNameTest, NamesEveryState) {
    EXPECT_EQ(std::string(SelectionStateName(SS_IDLE)), "idle");
    EXPECT_EQ(std::string(SelectionStateName(SS_AWAITING_FIRST)), "select vp");
    EXPECT_EQ(std::string(SelectionStateName(SS_AWAITING_SECOND)), "select vq");
}
