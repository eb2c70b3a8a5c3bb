#include "TextEditor.hpp"
#include "FsError.hpp"
#include "LineUtils.hpp"
#include "UnifiedDiff.hpp"

namespace {
constexpr size_t kEditPreviewChars = 50;
}

std::string TextEditor::applyEdits(const std::string& original, const std::vector<EditOperation>& edits) {
    std::string modified = original;
    for (const auto& edit : edits) {
        auto pos = modified.find(edit.oldText);
        if (pos == std::string::npos) {
            throw FsError(FsErrorKind::EditNotFound,
                          "Edit failed: oldText not found in content: '" + utf8_prefix(edit.oldText, kEditPreviewChars) + "...'");
        }
        modified.replace(pos, edit.oldText.size(), edit.newText);
    }
    return modified;
}

std::string TextEditor::diff(const std::string& original, const std::string& modified, const std::string& path) {
    return unified_diff(original, modified, "a/" + path, "b/" + path);
}
