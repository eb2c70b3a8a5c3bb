#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>
#include "../src/DirectoryWalker.hpp"
#include "../src/FsError.hpp"
#include "../src/PathGuard.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

namespace fs = std::filesystem;

static void writeFile(const fs::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary);
    out << content;
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

static const TreeNode* findNode(const std::vector<TreeNode>& nodes, const std::string& name) {
    for (const auto& n : nodes) {
        if (n.name == name) return &n;
    }
    return nullptr;
}

int main() {
    auto base = fs::canonical(fs::temp_directory_path()) / ("securefs_walker_" + std::to_string(::getpid()));
    try {
        fs::remove_all(base);
        auto root = base / "data";
        fs::create_directories(root / "docs" / "nested");
        fs::create_directories(root / "node_modules" / "pkg");
        fs::create_directories(root / "empty");
        writeFile(root / "report.txt", "Quarterly REPORT\n  total: 42  \nend\n");
        writeFile(root / "x.txt", "nothing here\n");
        writeFile(root / "docs" / "Report2.csv", "a,b\nreport,1\n");
        writeFile(root / "docs" / "nested" / "deep.txt", "line one\r\nsecond Report line\r\n");
        writeFile(root / "node_modules" / "pkg" / "report.js", "report()\n");
        writeFile(root / "docs" / "binary.txt", std::string("ok\xFF\xFE report\n", 12));

        PathGuard guard({root.string()});
        DirectoryWalker walker(guard);

        // list: immediate children only
        auto entries = walker.list(root);
        ASSERT_TRUE(entries.size() == 5);
        bool sawDocs = false;
        for (const auto& e : entries) {
            if (e.name == "docs") { sawDocs = true; ASSERT_TRUE(e.isDirectory); }
            if (e.name == "x.txt") ASSERT_TRUE(!e.isDirectory);
        }
        ASSERT_TRUE(sawDocs);
        ASSERT_TRUE(walker.list(root / "empty").empty());

        bool threw = false;
        try { walker.list(root / "missing"); } catch (const FsError& e) { threw = e.kind() == FsErrorKind::NotFound; }
        ASSERT_TRUE(threw);
        threw = false;
        try { walker.list(root / "x.txt"); } catch (const FsError& e) {
            threw = e.kind() == FsErrorKind::InvalidArgument && std::string(e.what()) == "Provided path is not a directory";
        }
        ASSERT_TRUE(threw);

        // tree: nested children, cycle through a symlink is cut
        fs::create_directory_symlink(root / "docs", root / "docs" / "nested" / "loop");
        auto tree = walker.tree(root);
        const TreeNode* docs = findNode(tree, "docs");
        ASSERT_TRUE(docs != nullptr && docs->isDirectory);
        const TreeNode* nested = findNode(docs->children, "nested");
        ASSERT_TRUE(nested != nullptr && nested->isDirectory);
        ASSERT_TRUE(findNode(nested->children, "deep.txt") != nullptr);
        const TreeNode* loop = findNode(nested->children, "loop");
        ASSERT_TRUE(loop != nullptr && loop->isDirectory && loop->children.empty());
        const TreeNode* file = findNode(tree, "x.txt");
        ASSERT_TRUE(file != nullptr && !file->isDirectory && file->children.empty());
        ASSERT_TRUE(findNode(tree, "empty")->children.empty());
        fs::remove(root / "docs" / "nested" / "loop");

        // searchFiles: case-insensitive substring on names
        auto found = walker.searchFiles(root, "report", {});
        ASSERT_TRUE(found.hasMatches());
        ASSERT_TRUE(contains(found.matches, (root / "report.txt").string()));
        ASSERT_TRUE(contains(found.matches, (root / "docs" / "Report2.csv").string()));
        ASSERT_TRUE(contains(found.matches, (root / "node_modules" / "pkg" / "report.js").string()));
        ASSERT_TRUE(!contains(found.matches, (root / "x.txt").string()));

        // Files of a directory are reported before its subdirectories
        found = walker.searchFiles(root, "e", {});
        auto fileAt = std::find(found.matches.begin(), found.matches.end(), (root / "report.txt").string());
        auto dirAt = std::find(found.matches.begin(), found.matches.end(), (root / "empty").string());
        ASSERT_TRUE(fileAt != found.matches.end() && dirAt != found.matches.end() && fileAt < dirAt);

        // Nothing inside an excluded directory is searched, its own name still matches
        found = walker.searchFiles(root, "node", {"node_modules"});
        ASSERT_TRUE(found.matches.size() == 1);
        ASSERT_TRUE(found.matches[0] == (root / "node_modules").string());
        found = walker.searchFiles(root, "report", {"node_modules"});
        ASSERT_TRUE(!contains(found.matches, (root / "node_modules" / "pkg" / "report.js").string()));
        ASSERT_TRUE(contains(found.matches, (root / "docs" / "Report2.csv").string()));
        found = walker.searchFiles(root, "deep", {"*/docs/nested"});
        ASSERT_TRUE(!found.hasMatches());

        // Name matching folds non-ASCII letters too
        writeFile(root / "docs" / "\xC3\x89" "COLE.txt", "Le caf\xC3\x89 est ferm\xC3\xA9\n");
        found = walker.searchFiles(root, "\xC3\xA9" "cole", {});
        ASSERT_TRUE(found.matches.size() == 1);
        ASSERT_TRUE(found.matches[0] == (root / "docs" / "\xC3\x89" "COLE.txt").string());
        auto accentReport = walker.searchContent(root, "CAF\xC3\xA9", true, "*.txt");
        ASSERT_TRUE(accentReport.result.matches.size() == 1);
        ASSERT_TRUE(accentReport.result.matches[0].lineText == "Le caf\xC3\x89 est ferm\xC3\xA9");
        fs::remove(root / "docs" / "\xC3\x89" "COLE.txt");

        // No match is a distinct outcome, not an error
        found = walker.searchFiles(root, "does-not-exist", {});
        ASSERT_TRUE(!found.hasMatches());
        ASSERT_TRUE(found.matches.empty());
        ASSERT_TRUE(!walker.searchFiles(root / "x.txt", "x", {}).hasMatches());

        // searchContent: line numbers are 1-based, text is trimmed
        auto report = walker.searchContent(root, "total", true, "*");
        ASSERT_TRUE(report.result.matches.size() == 1);
        ASSERT_TRUE(report.result.matches[0].filePath == (root / "report.txt").string());
        ASSERT_TRUE(report.result.matches[0].lineNumber == 2);
        ASSERT_TRUE(report.result.matches[0].lineText == "total: 42");

        report = walker.searchContent(root, "REPORT", true, "*");
        std::vector<std::string> hitFiles;
        for (const auto& m : report.result.matches) hitFiles.push_back(m.filePath);
        ASSERT_TRUE(contains(hitFiles, (root / "report.txt").string()));
        ASSERT_TRUE(contains(hitFiles, (root / "docs" / "Report2.csv").string()));
        ASSERT_TRUE(contains(hitFiles, (root / "docs" / "nested" / "deep.txt").string()));
        ASSERT_TRUE(contains(hitFiles, (root / "node_modules" / "pkg" / "report.js").string()));
        // invalid bytes are dropped, the rest of the line still matches
        ASSERT_TRUE(contains(hitFiles, (root / "docs" / "binary.txt").string()));
        for (const auto& m : report.result.matches) {
            if (m.filePath == (root / "docs" / "nested" / "deep.txt").string()) {
                ASSERT_TRUE(m.lineNumber == 2);
                ASSERT_TRUE(m.lineText == "second Report line");
            }
            if (m.filePath == (root / "docs" / "binary.txt").string()) {
                ASSERT_TRUE(m.lineText == "ok report");
            }
        }

        // file pattern restricts which files are scanned
        report = walker.searchContent(root, "report", true, "*.csv");
        ASSERT_TRUE(report.result.matches.size() == 1);
        ASSERT_TRUE(report.result.matches[0].filePath == (root / "docs" / "Report2.csv").string());
        ASSERT_TRUE(report.result.matches[0].lineNumber == 2);

        // non-recursive only looks at the top level
        report = walker.searchContent(root, "report", false, "*");
        ASSERT_TRUE(report.result.matches.size() == 1);
        ASSERT_TRUE(report.result.matches[0].filePath == (root / "report.txt").string());

        report = walker.searchContent(root, "report", false, "docs/*.csv");
        ASSERT_TRUE(report.result.matches.size() == 1);
        ASSERT_TRUE(report.result.matches[0].filePath == (root / "docs" / "Report2.csv").string());

        report = walker.searchContent(root, "absent text", true, "*");
        ASSERT_TRUE(!report.result.hasMatches());
        ASSERT_TRUE(report.skipped.empty());

        // An unreadable file is listed as skipped and the other files are still searched
        {
            const fs::path locked = root / "locked.txt";
            writeFile(locked, "report inside\n");
            fs::permissions(locked, fs::perms::none);
            const bool asRoot = ::geteuid() == 0;
            // root reads through any mode bits, so drop to an unprivileged user for the scan
            const bool restricted = !asRoot || ::seteuid(65534) == 0;
            if (restricted) {
                auto lockedReport = walker.searchContent(root, "report", false, "*.txt");
                if (asRoot) {
                    ASSERT_TRUE(::seteuid(0) == 0);
                }
                ASSERT_TRUE(lockedReport.skipped.size() == 1);
                ASSERT_TRUE(lockedReport.skipped[0].filePath == locked.string());
                ASSERT_TRUE(!lockedReport.skipped[0].reason.empty());
                ASSERT_TRUE(lockedReport.result.matches.size() == 1);
                ASSERT_TRUE(lockedReport.result.matches[0].filePath == (root / "report.txt").string());
            } else {
                std::cout << "Skipping unreadable file check: cannot drop privileges" << std::endl;
            }
            fs::permissions(locked, fs::perms::owner_read | fs::perms::owner_write);
            fs::remove(locked);
        }

        threw = false;
        try { walker.searchContent(root, "x", true, "/abs/*"); } catch (const FsError& e) { threw = e.kind() == FsErrorKind::InvalidArgument; }
        ASSERT_TRUE(threw);

        // Glob matching is anchored at the right
        ASSERT_TRUE(DirectoryWalker::matchesGlob("a/b/c.txt", "*.txt"));
        ASSERT_TRUE(DirectoryWalker::matchesGlob("a/b/c.txt", "b/*.txt"));
        ASSERT_TRUE(!DirectoryWalker::matchesGlob("a/b/c.txt", "a/*.txt"));
        ASSERT_TRUE(DirectoryWalker::matchesGlob("/a/b", "/a/*"));
        ASSERT_TRUE(!DirectoryWalker::matchesGlob("/x/a/b", "/a/*"));
        ASSERT_TRUE(!DirectoryWalker::matchesGlob("c.txt", "*.csv"));

        fs::remove_all(base);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All directory walker tests passed" << std::endl;
    return 0;
}
