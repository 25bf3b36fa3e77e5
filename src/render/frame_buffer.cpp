#include "render/frame_buffer.h"
#include "utils/utils.h"
#include <algorithm>

namespace leetshell {
namespace render {

FrameBuffer::FrameBuffer(int cols, int rows) : cols_(0), rows_(0) {
    resize(cols, rows);
}

void FrameBuffer::resize(int cols, int rows) {
    cols_ = std::max(0, cols);
    rows_ = std::max(0, rows);
    cells_.assign(static_cast<size_t>(cols_) * rows_, Cell());
}

void FrameBuffer::clear() {
    std::fill(cells_.begin(), cells_.end(), Cell());
}

void FrameBuffer::fill(const Cell& cell) {
    std::fill(cells_.begin(), cells_.end(), cell);
}

void FrameBuffer::set(int row, int col, const Cell& cell) {
    if (!inBounds(row, col)) return;
    cells_[static_cast<size_t>(row) * cols_ + col] = cell;
}

std::string FrameBuffer::rowText(int row) const {
    std::string out;
    if (row < 0 || row >= rows_) return out;
    for (int c = 0; c < cols_; c++) {
        utils::utf8Append(out, at(row, c).ch);
    }
    return out;
}

}
}
