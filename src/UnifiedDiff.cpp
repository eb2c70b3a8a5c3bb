#include "UnifiedDiff.hpp"
#include "LineUtils.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_map>

namespace {

// Linear space Myers: split each region at its middle snake and recurse. Lines are
// compared as interned ids.
class MyersDiff {
public:
    MyersDiff(const std::vector<int>& a, const std::vector<int>& b) : a_(a), b_(b) {}

    std::vector<DiffOp> run() {
        compare(0, static_cast<long>(a_.size()), 0, static_cast<long>(b_.size()));
        return std::move(ops_);
    }

private:
    void emit(DiffOpKind kind, long count) {
        for (long i = 0; i < count; ++i) {
            ops_.push_back({kind, 0, 0});
        }
    }

    void compare(long a0, long a1, long b0, long b1) {
        long prefix = 0;
        while (a0 + prefix < a1 && b0 + prefix < b1 && a_[a0 + prefix] == b_[b0 + prefix]) {
            ++prefix;
        }
        emit(DiffOpKind::Equal, prefix);
        a0 += prefix;
        b0 += prefix;

        long suffix = 0;
        while (a0 < a1 - suffix && b0 < b1 - suffix && a_[a1 - suffix - 1] == b_[b1 - suffix - 1]) {
            ++suffix;
        }
        a1 -= suffix;
        b1 -= suffix;

        if (a0 == a1) {
            emit(DiffOpKind::Insert, b1 - b0);
        } else if (b0 == b1) {
            emit(DiffOpKind::Delete, a1 - a0);
        } else {
            long x = 0;
            long y = 0;
            if (middleSnake(a0, a1, b0, b1, x, y)) {
                compare(a0, a0 + x, b0, b0 + y);
                compare(a0 + x, a1, b0 + y, b1);
            } else {
                emit(DiffOpKind::Delete, a1 - a0);
                emit(DiffOpKind::Insert, b1 - b0);
            }
        }
        emit(DiffOpKind::Equal, suffix);
    }

    // Walks forward from the top-left and backward from the bottom-right until the
    // two frontiers overlap. On success (x, y) is the split point relative to (a0, b0).
    bool middleSnake(long a0, long a1, long b0, long b1, long& splitX, long& splitY) {
        const long n = a1 - a0;
        const long m = b1 - b0;
        const long maxD = (n + m + 1) / 2;
        const long offset = maxD;
        const long length = 2 * maxD + 2;
        std::vector<long> forward(length, -1);
        std::vector<long> backward(length, -1);
        forward[offset + 1] = 0;
        backward[offset + 1] = 0;
        const long delta = n - m;
        const bool oddDelta = (delta % 2) != 0;
        long k1start = 0, k1end = 0, k2start = 0, k2end = 0;

        for (long d = 0; d < maxD; ++d) {
            for (long k1 = -d + k1start; k1 <= d - k1end; k1 += 2) {
                const long k1Offset = offset + k1;
                long x1;
                if (k1 == -d || (k1 != d && forward[k1Offset - 1] < forward[k1Offset + 1])) {
                    x1 = forward[k1Offset + 1];
                } else {
                    x1 = forward[k1Offset - 1] + 1;
                }
                long y1 = x1 - k1;
                while (x1 < n && y1 < m && a_[a0 + x1] == b_[b0 + y1]) {
                    ++x1;
                    ++y1;
                }
                forward[k1Offset] = x1;
                if (x1 > n) {
                    k1end += 2;
                } else if (y1 > m) {
                    k1start += 2;
                } else if (oddDelta) {
                    const long k2Offset = offset + delta - k1;
                    if (k2Offset >= 0 && k2Offset < length && backward[k2Offset] != -1) {
                        if (x1 >= n - backward[k2Offset]) {
                            splitX = x1;
                            splitY = y1;
                            return true;
                        }
                    }
                }
            }
            for (long k2 = -d + k2start; k2 <= d - k2end; k2 += 2) {
                const long k2Offset = offset + k2;
                long x2;
                if (k2 == -d || (k2 != d && backward[k2Offset - 1] < backward[k2Offset + 1])) {
                    x2 = backward[k2Offset + 1];
                } else {
                    x2 = backward[k2Offset - 1] + 1;
                }
                long y2 = x2 - k2;
                while (x2 < n && y2 < m && a_[a1 - x2 - 1] == b_[b1 - y2 - 1]) {
                    ++x2;
                    ++y2;
                }
                backward[k2Offset] = x2;
                if (x2 > n) {
                    k2end += 2;
                } else if (y2 > m) {
                    k2start += 2;
                } else if (!oddDelta) {
                    const long k1Offset = offset + delta - k2;
                    if (k1Offset >= 0 && k1Offset < length && forward[k1Offset] != -1) {
                        const long x1 = forward[k1Offset];
                        const long y1 = offset + x1 - k1Offset;
                        if (x1 >= n - x2) {
                            splitX = x1;
                            splitY = y1;
                            return true;
                        }
                    }
                }
            }
        }
        return false;
    }

    const std::vector<int>& a_;
    const std::vector<int>& b_;
    std::vector<DiffOp> ops_;
};

// Move deletions ahead of insertions inside every change run and renumber positions.
void normalize_runs(std::vector<DiffOp>& ops) {
    auto it = ops.begin();
    while (it != ops.end()) {
        if (it->kind == DiffOpKind::Equal) {
            ++it;
            continue;
        }
        auto runEnd = std::find_if(it, ops.end(), [](const DiffOp& op) { return op.kind == DiffOpKind::Equal; });
        std::stable_partition(it, runEnd, [](const DiffOp& op) { return op.kind == DiffOpKind::Delete; });
        it = runEnd;
    }
    size_t i = 0;
    size_t j = 0;
    for (auto& op : ops) {
        op.oldIndex = i;
        op.newIndex = j;
        if (op.kind != DiffOpKind::Insert) ++i;
        if (op.kind != DiffOpKind::Delete) ++j;
    }
}

std::string format_range(size_t start, size_t length) {
    size_t beginning = start + 1;
    if (length == 1) {
        return std::to_string(beginning);
    }
    if (length == 0) {
        --beginning;
    }
    return std::to_string(beginning) + "," + std::to_string(length);
}

} // namespace

std::vector<DiffOp> diff_lines(const std::vector<std::string>& oldLines, const std::vector<std::string>& newLines) {
    std::unordered_map<std::string, int> ids;
    auto intern = [&ids](const std::vector<std::string>& lines) {
        std::vector<int> out;
        out.reserve(lines.size());
        for (const auto& line : lines) {
            out.push_back(ids.emplace(line, static_cast<int>(ids.size())).first->second);
        }
        return out;
    };
    const std::vector<int> a = intern(oldLines);
    const std::vector<int> b = intern(newLines);

    std::vector<DiffOp> ops = MyersDiff(a, b).run();
    normalize_runs(ops);
    return ops;
}

std::string unified_diff(const std::string& oldText, const std::string& newText,
                         const std::string& fromLabel, const std::string& toLabel, size_t context) {
    const auto oldLines = split_lines_keep_ends(oldText);
    const auto newLines = split_lines_keep_ends(newText);
    const auto ops = diff_lines(oldLines, newLines);

    std::vector<size_t> changes;
    for (size_t i = 0; i < ops.size(); ++i) {
        if (ops[i].kind != DiffOpKind::Equal) changes.push_back(i);
    }
    if (changes.empty()) {
        return "";
    }

    std::ostringstream out;
    out << "--- " << fromLabel << "\n";
    out << "+++ " << toLabel << "\n";

    size_t c = 0;
    while (c < changes.size()) {
        size_t groupEnd = c;
        // Changes separated by at most 2*context unchanged lines share a hunk.
        while (groupEnd + 1 < changes.size() && changes[groupEnd + 1] - changes[groupEnd] - 1 <= 2 * context) {
            ++groupEnd;
        }
        size_t first = changes[c] >= context ? changes[c] - context : 0;
        size_t last = std::min(ops.size(), changes[groupEnd] + 1 + context);

        size_t oldLen = 0;
        size_t newLen = 0;
        for (size_t i = first; i < last; ++i) {
            if (ops[i].kind != DiffOpKind::Insert) ++oldLen;
            if (ops[i].kind != DiffOpKind::Delete) ++newLen;
        }
        out << "@@ -" << format_range(ops[first].oldIndex, oldLen)
            << " +" << format_range(ops[first].newIndex, newLen) << " @@\n";
        for (size_t i = first; i < last; ++i) {
            switch (ops[i].kind) {
                case DiffOpKind::Equal: out << ' ' << oldLines[ops[i].oldIndex]; break;
                case DiffOpKind::Delete: out << '-' << oldLines[ops[i].oldIndex]; break;
                case DiffOpKind::Insert: out << '+' << newLines[ops[i].newIndex]; break;
            }
        }
        c = groupEnd + 1;
    }
    return out.str();
}
