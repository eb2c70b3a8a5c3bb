#pragma once
#include <string>
#include <vector>

struct EditOperation {
    std::string oldText;
    std::string newText;
};

class TextEditor {
public:
    // Apply `edits` in order, each replacing the first occurrence of its oldText in the
    // text produced so far. Throws FsError(EditNotFound) naming the missing text.
    static std::string applyEdits(const std::string& original, const std::vector<EditOperation>& edits);

    // Unified diff between `original` and `modified` labelled a/<path> and b/<path>.
    static std::string diff(const std::string& original, const std::string& modified, const std::string& path);
};
