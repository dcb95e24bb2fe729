#include "consensus_runner.h"

#include <map>
#include <sstream>

#include <glog/logging.h>

#include "common/errors.h"

namespace PatchArbiter {

ConsensusRunner::ConsensusRunner(int num_candidate, bool majority_voting)
	: num_candidate_(num_candidate), majority_voting_(majority_voting) {
	if (num_candidate_ < 1) {
		throw ArbiterError("ConsensusRunner needs num_candidate >= 1");
	}
}

ConsensusResult ConsensusRunner::Run(const EpisodeRunner& episode) const {
	std::vector<Vote> votes;
	if (!majority_voting_) {
		EpisodeResult r = episode(0);
		votes.push_back({0, r.chosen_id, r.patch});
		return Tally(votes);
	}

	std::map<int, int> counts;
	for (int round = 0; round < num_candidate_; ++round) {
		EpisodeResult r = episode(round);
		votes.push_back({round, r.chosen_id, r.patch});
		const int count = ++counts[r.chosen_id];
		VLOG(1) << "round " << round << " voted " << r.chosen_id << " (" << count << ")";
		if (count * 2 > num_candidate_) {
			LOG(INFO) << "Majority reached for candidate " << r.chosen_id << " after "
				<< round + 1 << " rounds";
			break;
		}
	}

	ConsensusResult result = Tally(votes);
	std::ostringstream ids;
	for (const auto& v : votes) ids << (v.round ? "," : "") << v.chosen_id;
	LOG(INFO) << "Votes [" << ids.str() << "] -> candidate " << result.chosen_id;
	return result;
}

ConsensusResult ConsensusRunner::Tally(const std::vector<Vote>& votes) {
	if (votes.empty()) {
		throw ArbiterError("cannot tally zero votes");
	}
	struct Standing {
		int count = 0;
		size_t first = 0;
		size_t last = 0;
	};
	std::map<int, Standing> standings;
	for (size_t i = 0; i < votes.size(); ++i) {
		auto it = standings.find(votes[i].chosen_id);
		if (it == standings.end()) {
			standings[votes[i].chosen_id] = {1, i, i};
		} else {
			++it->second.count;
			it->second.last = i;
		}
	}

	auto best = standings.begin();
	for (auto it = standings.begin(); it != standings.end(); ++it) {
		if (it->second.count > best->second.count ||
				(it->second.count == best->second.count && it->second.last < best->second.last)) {
			best = it;
		}
	}

	ConsensusResult result;
	result.chosen_id = best->first;
	result.patch = votes[best->second.first].patch;
	result.votes = votes;
	return result;
}

}  // namespace PatchArbiter
