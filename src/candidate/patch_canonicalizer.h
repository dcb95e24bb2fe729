#ifndef PATCHARBITER_SRC_CANDIDATE_PATCH_CANONICALIZER_H_
#define PATCHARBITER_SRC_CANDIDATE_PATCH_CANONICALIZER_H_

#include <string>
#include <vector>

namespace PatchArbiter {

struct DiffLine {
	char kind;           // '+', '-' or ' '
	std::string text;    // line content without the marker
};

struct DiffHunk {
	std::vector<DiffLine> lines;
};

struct FileDiff {
	std::string source;
	std::string target;
	std::vector<DiffHunk> hunks;
};

/**
 * Splits unified-diff text into files and hunks. Hunk line counts from the
 * "@@ -a,b +c,d @@" header decide where a hunk ends, so content lines that
 * happen to start with "---" or "+++" stay inside their hunk. Further +/-
 * lines after the counts run out, up to the next header, are kept in the
 * last hunk. Text without any hunk header is read as one bare hunk of +/-
 * lines.
 */
std::vector<FileDiff> ParseUnifiedDiff(const std::string& text);

/**
 * Drops a trailing '#' comment from one source line. String literals
 * (single, double, triple quoted) and bracket nesting are tracked; when the
 * line cannot be tokenized on its own the first '#' is used instead.
 */
std::string StripTrailingComment(const std::string& line);

/**
 * Comment- and whitespace-insensitive signature of a diff: the added and
 * removed lines (pure comment and blank lines dropped, trailing comments
 * stripped) prefixed with their marker, with all whitespace removed.
 * Pure function of its input.
 */
std::string CanonicalizePatch(const std::string& raw_diff);

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_CANDIDATE_PATCH_CANONICALIZER_H_
