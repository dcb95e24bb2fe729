#include "patch_canonicalizer.h"

#include <cctype>
#include <optional>
#include <regex>
#include <sstream>

#include <glog/logging.h>

namespace PatchArbiter {

namespace {

const std::regex kHunkHeader(R"(^@@ -(\d+)(?:,(\d+))? \+(\d+)(?:,(\d+))? @@)");
const std::regex kPureComment(R"(^\s*#)");

std::vector<std::string> SplitLines(const std::string& text) {
	std::vector<std::string> lines;
	std::string line;
	std::istringstream in(text);
	while (std::getline(in, line)) {
		if (!line.empty() && line.back() == '\r') line.pop_back();
		lines.push_back(line);
	}
	return lines;
}

std::string RightTrim(const std::string& s) {
	size_t end = s.size();
	while (end > 0 && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
	return s.substr(0, end);
}

bool IsBlank(const std::string& s) {
	for (char c : s) {
		if (!std::isspace(static_cast<unsigned char>(c))) return false;
	}
	return true;
}

// Position of the first '#' that starts a comment, npos when there is none,
// nullopt when the line does not tokenize on its own.
std::optional<size_t> FindCommentStart(const std::string& line) {
	int depth = 0;
	size_t i = 0;
	const size_t n = line.size();
	while (i < n) {
		char c = line[i];
		if (c == '#') {
			// A comment inside open brackets leaves the statement unfinished.
			return depth == 0 ? std::optional<size_t>(i) : std::nullopt;
		}
		if (c == '\'' || c == '"') {
			const bool triple = i + 2 < n && line[i + 1] == c && line[i + 2] == c;
			const size_t quote_len = triple ? 3 : 1;
			size_t j = i + quote_len;
			bool closed = false;
			while (j < n) {
				if (line[j] == '\\') {
					j += 2;
					continue;
				}
				if (line[j] == c) {
					if (!triple) {
						closed = true;
						j += 1;
						break;
					}
					if (j + 2 < n && line[j + 1] == c && line[j + 2] == c) {
						closed = true;
						j += 3;
						break;
					}
				}
				++j;
			}
			if (!closed) return std::nullopt;
			i = j;
			continue;
		}
		if (c == '(' || c == '[' || c == '{') {
			++depth;
		} else if (c == ')' || c == ']' || c == '}') {
			if (depth > 0) --depth;
		} else if (c == '\\' && i + 1 == n) {
			// explicit line continuation
			return std::nullopt;
		}
		++i;
	}
	if (depth != 0) return std::nullopt;
	return std::string::npos;
}

}  // namespace

std::vector<FileDiff> ParseUnifiedDiff(const std::string& text) {
	const std::vector<std::string> lines = SplitLines(text);
	std::vector<FileDiff> files;
	bool saw_hunk_header = false;

	auto current_file = [&files]() -> FileDiff& {
		if (files.empty()) files.emplace_back();
		return files.back();
	};

	long remaining_src = 0;
	long remaining_tgt = 0;
	DiffHunk* hunk = nullptr;       // hunk with declared lines still to read
	DiffHunk* last_hunk = nullptr;  // latest hunk of the current file

	for (size_t i = 0; i < lines.size(); ++i) {
		const std::string& line = lines[i];
		if (hunk && (remaining_src > 0 || remaining_tgt > 0)) {
			if (!line.empty() && line[0] == '+') {
				hunk->lines.push_back({'+', line.substr(1)});
				--remaining_tgt;
				continue;
			}
			if (!line.empty() && line[0] == '-') {
				hunk->lines.push_back({'-', line.substr(1)});
				--remaining_src;
				continue;
			}
			if (line.empty() || line[0] == ' ') {
				hunk->lines.push_back({' ', line.empty() ? "" : line.substr(1)});
				--remaining_src;
				--remaining_tgt;
				continue;
			}
			if (line[0] == '\\') {
				continue;  // "\ No newline at end of file"
			}
			VLOG(3) << "Hunk ended early at: " << line;
			hunk = nullptr;
		}
		if (!line.empty() && line[0] == '\\') {
			continue;
		}

		std::smatch m;
		if (std::regex_search(line, m, kHunkHeader)) {
			saw_hunk_header = true;
			remaining_src = m[2].matched ? std::stol(m[2].str()) : 1;
			remaining_tgt = m[4].matched ? std::stol(m[4].str()) : 1;
			FileDiff& file = current_file();
			file.hunks.emplace_back();
			hunk = last_hunk = &file.hunks.back();
			continue;
		}
		hunk = nullptr;

		const bool source_header = line.rfind("--- ", 0) == 0 &&
			i + 1 < lines.size() && lines[i + 1].rfind("+++ ", 0) == 0;
		const bool target_header = line.rfind("+++ ", 0) == 0 &&
			i > 0 && lines[i - 1].rfind("--- ", 0) == 0;
		if (last_hunk && !source_header && !target_header &&
				!line.empty() && (line[0] == '+' || line[0] == '-')) {
			// Change lines past an understated count still belong to the hunk.
			VLOG(3) << "Line beyond the hunk's declared counts: " << line;
			last_hunk->lines.push_back({line[0], line.substr(1)});
			continue;
		}

		if (line.rfind("diff --git ", 0) == 0) {
			files.emplace_back();
			last_hunk = nullptr;
		} else if (line.rfind("--- ", 0) == 0) {
			if (files.empty() || !files.back().hunks.empty() || !files.back().source.empty()) {
				files.emplace_back();
			}
			files.back().source = line.substr(4);
			last_hunk = nullptr;
		} else if (line.rfind("+++ ", 0) == 0) {
			current_file().target = line.substr(4);
			last_hunk = nullptr;
		}
	}

	if (saw_hunk_header) {
		return files;
	}

	// No hunk headers at all: read the text as a single bare hunk.
	FileDiff bare;
	bare.hunks.emplace_back();
	for (const std::string& line : lines) {
		if (line.rfind("+++ ", 0) == 0 || line.rfind("--- ", 0) == 0) continue;
		if (!line.empty() && (line[0] == '+' || line[0] == '-')) {
			bare.hunks.back().lines.push_back({line[0], line.substr(1)});
		}
	}
	return {bare};
}

std::string StripTrailingComment(const std::string& line) {
	std::optional<size_t> start = FindCommentStart(line);
	if (!start.has_value()) {
		size_t hash = line.find('#');
		if (hash == std::string::npos) return line;
		return RightTrim(line.substr(0, hash));
	}
	if (*start == std::string::npos) return RightTrim(line);
	return RightTrim(line.substr(0, *start));
}

std::string CanonicalizePatch(const std::string& raw_diff) {
	std::string joined;
	bool first = true;
	for (const FileDiff& file : ParseUnifiedDiff(raw_diff)) {
		for (const DiffHunk& hunk : file.hunks) {
			for (const DiffLine& line : hunk.lines) {
				if (line.kind != '+' && line.kind != '-') continue;
				std::string content = line.text;
				size_t skip = content.find_first_not_of(line.kind);
				content = skip == std::string::npos ? "" : content.substr(skip);
				if (IsBlank(content) || std::regex_search(content, kPureComment)) continue;
				content = StripTrailingComment(RightTrim(content));
				if (!first) joined += '\n';
				joined += line.kind;
				joined += content;
				first = false;
			}
		}
	}

	std::string signature;
	signature.reserve(joined.size());
	for (char c : joined) {
		if (!std::isspace(static_cast<unsigned char>(c))) signature += c;
	}
	return signature;
}

}  // namespace PatchArbiter
