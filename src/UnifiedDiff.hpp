#pragma once
#include <cstddef>
#include <string>
#include <vector>

enum class DiffOpKind { Equal, Delete, Insert };

struct DiffOp {
    DiffOpKind kind;
    size_t oldIndex; // line in the old sequence (insertion point for Insert)
    size_t newIndex; // line in the new sequence (insertion point for Delete)
};

// Shortest edit script between two line sequences (Myers). Within each run of changes
// deletions precede insertions.
std::vector<DiffOp> diff_lines(const std::vector<std::string>& oldLines, const std::vector<std::string>& newLines);

// Unified diff of two texts compared line by line, with `context` unchanged lines around
// each change. Returns an empty string when the texts are identical.
std::string unified_diff(const std::string& oldText, const std::string& newText,
                         const std::string& fromLabel, const std::string& toLabel, size_t context = 3);
