#include <cstdio>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include "../src/LineUtils.hpp"
#include "../src/UnifiedDiff.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

// Reference patch application: rebuilds the new text from the old text and a unified diff.
// Returns false if the diff does not describe the old text.
static bool apply_patch(const std::string& oldText, const std::string& diff, std::string& out) {
    auto oldLines = split_lines_keep_ends(oldText);
    auto diffLines = split_lines_keep_ends(diff);
    out.clear();
    if (diffLines.size() < 2) return false;
    if (diffLines[0].rfind("--- ", 0) != 0 || diffLines[1].rfind("+++ ", 0) != 0) return false;

    size_t oldPos = 0;
    size_t i = 2;
    while (i < diffLines.size()) {
        unsigned long a = 0, b = 1, c = 0, d = 1;
        const std::string& header = diffLines[i];
        if (std::sscanf(header.c_str(), "@@ -%lu,%lu +%lu,%lu @@", &a, &b, &c, &d) != 4) {
            b = 1;
            d = 1;
            if (std::sscanf(header.c_str(), "@@ -%lu,%lu +%lu @@", &a, &b, &c) == 3) {
            } else if (std::sscanf(header.c_str(), "@@ -%lu +%lu,%lu @@", &a, &c, &d) == 3) {
            } else if (std::sscanf(header.c_str(), "@@ -%lu +%lu @@", &a, &c) == 2) {
            } else {
                return false;
            }
        }
        size_t start = (b == 0) ? a : a - 1;
        if (start < oldPos || start > oldLines.size()) return false;
        while (oldPos < start) out += oldLines[oldPos++];
        ++i;
        size_t seenOld = 0, seenNew = 0;
        while (i < diffLines.size() && diffLines[i].rfind("@@", 0) != 0) {
            const std::string& line = diffLines[i];
            const std::string body = line.substr(1);
            if (line[0] == ' ' || line[0] == '-') {
                if (oldPos >= oldLines.size() || oldLines[oldPos] != body) return false;
                ++oldPos;
                ++seenOld;
            }
            if (line[0] == ' ' || line[0] == '+') {
                out += body;
                ++seenNew;
            }
            ++i;
        }
        if (seenOld != b || seenNew != d) return false;
    }
    while (oldPos < oldLines.size()) out += oldLines[oldPos++];
    return true;
}

static std::string random_text(std::mt19937& rng, int maxLines) {
    std::uniform_int_distribution<int> count_d(0, maxLines);
    std::uniform_int_distribution<int> word_d(0, 5);
    static const char* words[] = {"alpha", "beta", "gamma", "delta", "", "omega"};
    std::string s;
    int n = count_d(rng);
    for (int i = 0; i < n; ++i) {
        s += words[word_d(rng)];
        s += '\n';
    }
    return s;
}

static std::string mutate(std::mt19937& rng, const std::string& text) {
    auto lines = split_lines_keep_ends(text);
    std::uniform_int_distribution<int> op_d(0, 2);
    std::uniform_int_distribution<int> edits_d(0, 4);
    int edits = edits_d(rng);
    for (int e = 0; e < edits; ++e) {
        int op = op_d(rng);
        size_t pos = lines.empty() ? 0 : rng() % (lines.size() + 1);
        if (op == 0 || lines.empty()) {
            lines.insert(lines.begin() + pos, "inserted" + std::to_string(e) + "\n");
        } else if (op == 1 && pos < lines.size()) {
            lines.erase(lines.begin() + pos);
        } else if (pos < lines.size()) {
            lines[pos] = "changed" + std::to_string(e) + "\n";
        }
    }
    std::string out;
    for (const auto& l : lines) out += l;
    return out;
}

int main() {
    try {
        std::mt19937 rng(424242);
        for (int iter = 0; iter < 2000; ++iter) {
            std::string oldText = random_text(rng, 40);
            std::string newText = (iter % 7 == 0) ? random_text(rng, 40) : mutate(rng, oldText);
            std::string diff = unified_diff(oldText, newText, "a/f", "b/f");
            if (oldText == newText) {
                ASSERT_TRUE(diff.empty());
                continue;
            }
            std::string rebuilt;
            if (!apply_patch(oldText, diff, rebuilt) || rebuilt != newText) {
                std::cerr << "Patch mismatch at iter=" << iter << "\n--- old ---\n" << oldText
                          << "--- new ---\n" << newText << "--- diff ---\n" << diff << std::endl;
                return 1;
            }
        }

        // Full rewrite of a large file
        std::string bigOld;
        std::string bigNew;
        for (int i = 0; i < 6000; ++i) {
            bigOld += "old line " + std::to_string(i) + "\n";
            bigNew += "new line " + std::to_string(i) + "\n";
        }
        std::string bigDiff = unified_diff(bigOld, bigNew, "a/big", "b/big");
        ASSERT_TRUE(bigDiff.find("@@ -1,6000 +1,6000 @@\n") != std::string::npos);
        std::string rebuilt;
        ASSERT_TRUE(apply_patch(bigOld, bigDiff, rebuilt));
        ASSERT_TRUE(rebuilt == bigNew);

        // Large file with scattered edits keeps small hunks
        std::string scattered = bigOld;
        for (int i : {10, 2500, 5990}) {
            std::string from = "old line " + std::to_string(i) + "\n";
            scattered.replace(scattered.find(from), from.size(), "edited " + std::to_string(i) + "\n");
        }
        bigDiff = unified_diff(bigOld, scattered, "a/big", "b/big");
        size_t hunks = 0;
        for (size_t pos = bigDiff.find("\n@@ "); pos != std::string::npos; pos = bigDiff.find("\n@@ ", pos + 1)) ++hunks;
        ASSERT_TRUE(hunks == 3);
        ASSERT_TRUE(apply_patch(bigOld, bigDiff, rebuilt));
        ASSERT_TRUE(rebuilt == scattered);

        // Edit script covers every line exactly once
        std::vector<std::string> a = {"x\n", "y\n", "z\n"};
        std::vector<std::string> b = {"y\n", "z\n", "w\n"};
        auto ops = diff_lines(a, b);
        size_t deletes = 0, inserts = 0, equals = 0;
        for (const auto& op : ops) {
            if (op.kind == DiffOpKind::Delete) ++deletes;
            if (op.kind == DiffOpKind::Insert) ++inserts;
            if (op.kind == DiffOpKind::Equal) ++equals;
        }
        ASSERT_TRUE(equals == 2);
        ASSERT_TRUE(deletes == 1);
        ASSERT_TRUE(inserts == 1);

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All unified diff fuzz tests passed" << std::endl;
    return 0;
}
