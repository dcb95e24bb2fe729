#ifndef PATCHARBITER_SRC_AGENT_SELECTOR_TOOLS_H_
#define PATCHARBITER_SRC_AGENT_SELECTOR_TOOLS_H_

#include <vector>

#include "chat_types.h"

namespace PatchArbiter {

extern const char kBashToolName[];
extern const char kEditToolName[];

// Definitions of the bash and file editing tools offered to the selector.
std::vector<ToolSpec> SelectorToolSpecs();

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_AGENT_SELECTOR_TOOLS_H_
