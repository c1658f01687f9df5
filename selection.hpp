#pragma once

#include <vector>

#include "ptg2d.hpp"


namespace PTG
{
	enum SelectionStateType
	{
		SS_IDLE = 0,
		SS_AWAITING_FIRST,
		SS_AWAITING_SECOND,
	};

	enum PickOutcomeType
	{
		PK_IGNORED = 0,     // pick did not change anything
		PK_RECORDED,        // first endpoint recorded
		PK_INSERTED,        // second endpoint picked, vertex inserted
		PK_REJECTED,        // second endpoint picked, insertion failed
	};

	/* Two-click add-vertex flow: pick vp, pick vq, insert on arc vp..vq.
	The graph must outlive the adapter*/
	class SelectionAdapter
	{
	public:
		explicit SelectionAdapter(PlanarGraph& graph);

		void BeginAddVertex();
		void Cancel();
		/* Cancel the flow and install a fresh seed triangle*/
		void Reset();

		/* v is INVALID_VTX_IDX for a click that hit no vertex*/
		PickOutcomeType OnVertexPicked(IdxType v);

		inline SelectionStateType GetState() const { return state; };
		inline const IdxList& GetSelection() const { return selection; };
		inline IdxType GetLastInserted() const { return lastInserted; };
		inline InsertResultType GetLastResult() const { return lastResult; };

		/* Colour class handed to InsertOnArc*/
		inline void SetColor(ColorClass c) { color = c; };
		inline ColorClass GetColor() const { return color; };

	private:
		PlanarGraph& graph;
		SelectionStateType state = SS_IDLE;
		/* 0 to 2 picked vertices*/
		IdxList selection;
		ColorClass color = 0;
		IdxType lastInserted = INVALID_VTX_IDX;
		InsertResultType lastResult = IR_SUCCESS;
	};

	const char* SelectionStateName(SelectionStateType state);
}
