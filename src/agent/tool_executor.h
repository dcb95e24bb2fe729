#pragma once

#include "chat_types.h"

namespace PatchArbiter {

/**
 * Runs the agent's tool calls for one episode.
 *
 * Prepare() is called once before the first turn and Finish() once on a
 * terminal state. Execute() never throws for a bad call; unknown tools and
 * unencodable arguments come back as failed ToolResults.
 */
class IToolExecutor {
public:
	virtual ~IToolExecutor() = default;

	virtual void Prepare() = 0;
	virtual ToolResult Execute(const ToolCall& call) = 0;
	virtual void Finish() = 0;
};

}  // namespace PatchArbiter
