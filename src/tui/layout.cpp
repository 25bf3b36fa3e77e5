#include "tui/layout.h"
#include <algorithm>

namespace leetshell {
namespace tui {

ViewMode nextViewMode(ViewMode mode) {
    switch (mode) {
        case ViewMode::SPLIT: return ViewMode::EDITOR;
        case ViewMode::EDITOR: return ViewMode::DESCRIPTION;
        case ViewMode::DESCRIPTION: return ViewMode::SPLIT;
    }
    return ViewMode::SPLIT;
}

const char* viewModeToString(ViewMode mode) {
    switch (mode) {
        case ViewMode::SPLIT: return "split";
        case ViewMode::EDITOR: return "editor";
        case ViewMode::DESCRIPTION: return "description";
    }
    return "unknown";
}

ViewComposer::ViewComposer(int splitPercent)
    : splitPercent_(std::max(10, std::min(90, splitPercent))) {}

Rect ViewComposer::body(int cols, int rows) const {
    cols = std::max(0, cols);
    rows = std::max(0, rows);
    return Rect(1, 0, std::max(0, rows - 2), cols);
}

PaneLayout ViewComposer::compose(ViewMode mode, int cols, int rows) const {
    cols = std::max(0, cols);
    rows = std::max(0, rows);

    PaneLayout layout;
    layout.mode = mode;
    layout.titleBar = Rect(0, 0, rows > 0 ? 1 : 0, cols);
    layout.statusBar = Rect(rows - 1, 0, rows > 1 ? 1 : 0, cols);

    Rect area = body(cols, rows);
    Rect header(area.row, area.col, area.rows > 0 ? 1 : 0, area.cols);
    Rect below(area.row + 1, area.col, std::max(0, area.rows - 1), area.cols);

    switch (mode) {
        case ViewMode::SPLIT: {
            int descCols = cols * splitPercent_ / 100;
            int editorCols = std::max(0, cols - descCols - 1);
            layout.description = Rect(area.row, 0, area.rows, descCols);
            layout.divider = Rect(area.row, descCols, area.rows, cols > descCols ? 1 : 0);
            layout.editorHeader = Rect(area.row, descCols + 1, header.rows, editorCols);
            layout.editor = Rect(below.row, descCols + 1, below.rows, editorCols);
            break;
        }
        case ViewMode::EDITOR:
            layout.editorHeader = header;
            layout.editor = below;
            break;
        case ViewMode::DESCRIPTION:
            layout.descriptionHeader = header;
            layout.description = below;
            break;
    }
    return layout;
}

}
}
