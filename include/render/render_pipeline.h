#pragma once

#include "render/frame_buffer.h"
#include "render/draw_list.h"
#include "term/terminal.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace leetshell {
namespace render {

// Contiguous changed cells on one row sharing a style.
struct Run {
    int row;
    int col;
    std::u32string text;
    Style style;
};

struct RenderStats {
    uint64_t frames = 0;
    uint64_t runs = 0;
    uint64_t bytes = 0;
    uint64_t fullRepaints = 0;
};

class RenderPipeline {
public:
    RenderPipeline(int cols, int rows);

    // Reallocates both buffers; the next present repaints every cell.
    void resize(int cols, int rows);

    const FrameBuffer& compose(const DrawList& drawList);

    static std::vector<Run> diff(const FrameBuffer& candidate, const FrameBuffer& previous);

    // Emits runs to the sink and makes the composed frame the new baseline.
    size_t flush(const std::vector<Run>& runs, term::OutputSink& sink);

    size_t present(term::OutputSink& sink);

    static std::string sgr(const Style& style);

    const FrameBuffer& current() const { return current_; }
    const FrameBuffer& previous() const { return previous_; }
    int cols() const { return current_.cols(); }
    int rows() const { return current_.rows(); }
    const RenderStats& stats() const { return stats_; }

private:
    void invalidatePrevious();

    FrameBuffer current_;
    FrameBuffer previous_;
    std::optional<Style> terminalStyle_;
    RenderStats stats_;
};

}
}
