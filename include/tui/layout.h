#pragma once

#include <string>

namespace leetshell {
namespace tui {

enum class ViewMode {
    SPLIT,
    EDITOR,
    DESCRIPTION
};

ViewMode nextViewMode(ViewMode mode);
const char* viewModeToString(ViewMode mode);

struct Rect {
    int row = 0;
    int col = 0;
    int rows = 0;
    int cols = 0;

    Rect() = default;
    Rect(int r, int c, int h, int w) : row(r), col(c), rows(h), cols(w) {}

    bool empty() const { return rows <= 0 || cols <= 0; }
    int bottom() const { return row + rows; }
    int right() const { return col + cols; }
    bool operator==(const Rect& o) const {
        return row == o.row && col == o.col && rows == o.rows && cols == o.cols;
    }
};

// Panes that a mode does not show are empty rectangles.
struct PaneLayout {
    ViewMode mode = ViewMode::SPLIT;
    Rect titleBar;
    Rect statusBar;
    Rect descriptionHeader;
    Rect description;
    Rect divider;
    Rect editorHeader;
    Rect editor;
};

class ViewComposer {
public:
    explicit ViewComposer(int splitPercent = 40);

    PaneLayout compose(ViewMode mode, int cols, int rows) const;

    // Area between the title bar and the status bar.
    Rect body(int cols, int rows) const;

    int splitPercent() const { return splitPercent_; }

private:
    int splitPercent_;
};

}
}
