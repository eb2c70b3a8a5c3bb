#include <iostream>
#include <string>
#include <vector>
#include "../src/FsError.hpp"
#include "../src/TextEditor.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

int main() {
    try {
        // Only the first occurrence is replaced
        std::string text = "one two one two\n";
        std::string out = TextEditor::applyEdits(text, {{"one", "1"}});
        ASSERT_TRUE(out == "1 two one two\n");

        // Edits see the output of the previous edit
        out = TextEditor::applyEdits(text, {{"one", "1"}, {"one", "uno"}, {"1 two", "done"}});
        ASSERT_TRUE(out == "done uno two\n");

        // Deterministic: same input, same output
        std::vector<EditOperation> edits = {{"two", "2"}, {"two", "II"}};
        ASSERT_TRUE(TextEditor::applyEdits(text, edits) == TextEditor::applyEdits(text, edits));

        // Missing oldText fails with a preview of the missing text
        bool threw = false;
        try {
            TextEditor::applyEdits(text, {{"one", "1"}, {std::string(80, 'q'), "x"}});
        } catch (const FsError& e) {
            threw = true;
            ASSERT_TRUE(e.kind() == FsErrorKind::EditNotFound);
            std::string msg = e.what();
            ASSERT_TRUE(msg.find(std::string(50, 'q') + "...") != std::string::npos);
            ASSERT_TRUE(msg.find(std::string(51, 'q')) == std::string::npos);
        }
        ASSERT_TRUE(threw);

        // A replacement may create text a later edit depends on
        out = TextEditor::applyEdits("abc", {{"b", "XYZ"}, {"XY", "-"}});
        ASSERT_TRUE(out == "a-Zc");

        // Diff of a single changed line without trailing newline
        std::string diff = TextEditor::diff("hello", "world", "/data/a.txt");
        ASSERT_TRUE(diff.find("--- a//data/a.txt\n") == 0);
        ASSERT_TRUE(diff.find("+++ b//data/a.txt\n") != std::string::npos);
        ASSERT_TRUE(diff.find("@@ -1 +1 @@\n") != std::string::npos);
        ASSERT_TRUE(diff.find("-hello") != std::string::npos);
        ASSERT_TRUE(diff.find("+world") != std::string::npos);

        // Context is limited to three lines around a change
        std::string before;
        for (int i = 1; i <= 20; ++i) before += "line" + std::to_string(i) + "\n";
        std::string after = TextEditor::applyEdits(before, {{"line10\n", "line ten\n"}});
        diff = TextEditor::diff(before, after, "f.txt");
        std::string expected =
            "--- a/f.txt\n"
            "+++ b/f.txt\n"
            "@@ -7,7 +7,7 @@\n"
            " line7\n"
            " line8\n"
            " line9\n"
            "-line10\n"
            "+line ten\n"
            " line11\n"
            " line12\n"
            " line13\n";
        ASSERT_TRUE(diff == expected);

        // Far apart changes get separate hunks
        after = TextEditor::applyEdits(before, {{"line2\n", "two\n"}, {"line19\n", "nineteen\n"}});
        diff = TextEditor::diff(before, after, "f.txt");
        ASSERT_TRUE(diff.find("@@ -1,5 +1,5 @@\n") != std::string::npos);
        ASSERT_TRUE(diff.find("@@ -16,5 +16,5 @@\n") != std::string::npos);

        // Pure insertion into an empty file
        diff = TextEditor::diff("", "new\n", "n.txt");
        ASSERT_TRUE(diff.find("@@ -0,0 +1 @@\n+new\n") != std::string::npos);

        // No change, no diff
        ASSERT_TRUE(TextEditor::diff(before, before, "f.txt").empty());

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All text editor tests passed" << std::endl;
    return 0;
}
