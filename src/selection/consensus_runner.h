#ifndef PATCHARBITER_SRC_SELECTION_CONSENSUS_RUNNER_H_
#define PATCHARBITER_SRC_SELECTION_CONSENSUS_RUNNER_H_

#include <functional>
#include <string>
#include <vector>

#include "agent/selector_agent.h"

namespace PatchArbiter {

struct Vote {
	int round = 0;
	int chosen_id = 0;
	std::string patch;
};

struct ConsensusResult {
	int chosen_id = 0;
	std::string patch;
	std::vector<Vote> votes;
};

// Runs one episode; `round` is 0-based.
using EpisodeRunner = std::function<EpisodeResult(int round)>;

/**
 * Majority voting over repeated episodes. Up to `num_candidate` episodes run
 * in round order; voting stops once an id holds more than half of
 * `num_candidate`. Without voting a single episode decides.
 */
class ConsensusRunner {
public:
	ConsensusRunner(int num_candidate, bool majority_voting);

	ConsensusResult Run(const EpisodeRunner& episode) const;

	// Most votes wins; among tied ids the one whose last vote came earliest.
	// The patch is the winner's first returned text.
	static ConsensusResult Tally(const std::vector<Vote>& votes);

private:
	int num_candidate_;
	bool majority_voting_;
};

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_SELECTION_CONSENSUS_RUNNER_H_
