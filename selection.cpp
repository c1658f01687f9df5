#include "selection.hpp"


namespace PTG
{
	SelectionAdapter::SelectionAdapter(PlanarGraph& graph)
		: graph(graph)
	{
	}

	void SelectionAdapter::BeginAddVertex()
	{
		selection.clear();
		state = SelectionStateType::SS_AWAITING_FIRST;
	}

	void SelectionAdapter::Cancel()
	{
		selection.clear();
		state = SelectionStateType::SS_IDLE;
	}

	void SelectionAdapter::Reset()
	{
		Cancel();
		lastInserted = INVALID_VTX_IDX;
		lastResult = InsertResultType::IR_SUCCESS;
		graph.Reset();
	}

	PickOutcomeType SelectionAdapter::OnVertexPicked(IdxType v)
	{
		if (v == INVALID_VTX_IDX)
			return PickOutcomeType::PK_IGNORED;

		switch (state)
		{
		case SelectionStateType::SS_AWAITING_FIRST:
			if (!graph.IsOnPeriphery(v))
				return PickOutcomeType::PK_IGNORED;
			selection.push_back(v);
			state = SelectionStateType::SS_AWAITING_SECOND;
			return PickOutcomeType::PK_RECORDED;

		case SelectionStateType::SS_AWAITING_SECOND:
		{
			IdxType vp = selection.front();
			if (v == vp)
				return PickOutcomeType::PK_IGNORED;
			selection.push_back(v);
			lastResult = graph.InsertOnArc(vp, v, color, lastInserted);
			// a failed insertion still ends the flow
			Cancel();
			return lastResult == InsertResultType::IR_SUCCESS ?
				PickOutcomeType::PK_INSERTED : PickOutcomeType::PK_REJECTED;
		}

		case SelectionStateType::SS_IDLE:
		default:
			return PickOutcomeType::PK_IGNORED;
		}
	}

	const char* SelectionStateName(SelectionStateType state)
	{
		switch (state)
		{
		case SelectionStateType::SS_AWAITING_FIRST:
			return "select vp";
		case SelectionStateType::SS_AWAITING_SECOND:
			return "select vq";
		case SelectionStateType::SS_IDLE:
		default:
			return "idle";
		}
	}
}
