#include "render/render_pipeline.h"
#include <cassert>
#include <string>
#include <vector>

using namespace leetshell::render;
using leetshell::term::OutputSink;

class CaptureSink : public OutputSink {
public:
    void write(const std::string& bytes) override { data += bytes; }
    void flush() override { flushes++; }

    std::string take() {
        std::string out = data;
        data.clear();
        return out;
    }

    std::string data;
    int flushes = 0;
};

static size_t countOf(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    size_t pos = 0;
    while ((pos = haystack.find(needle, pos)) != std::string::npos) {
        n++;
        pos += needle.size();
    }
    return n;
}

static void testComposeClipsOutOfBounds() {
    RenderPipeline pipeline(10, 3);
    DrawList list;
    list.text(0, 7, "abcdef");
    list.text(-1, 0, "hidden");
    list.text(5, 0, "hidden");
    list.text(1, -2, "xyz");
    list.fill(2, 8, 10, 10, U'#');
    list.hline(1, 5, 100, U'-');
    const FrameBuffer& fb = pipeline.compose(list);
    assert(fb.rowText(0) == "       abc");
    assert(fb.rowText(1) == "z    -----");
    assert(fb.rowText(2) == "        ##");
    assert(fb.generation() == 1);
}

static void testComposeRespectsMaxWidth() {
    RenderPipeline pipeline(10, 1);
    DrawList list;
    list.text(0, 0, "abcdefgh", Style(), 3);
    const FrameBuffer& fb = pipeline.compose(list);
    assert(fb.rowText(0) == "abc       ");
}

static void testComposeReplacesControlCharacters() {
    RenderPipeline pipeline(4, 1);
    DrawList list;
    list.text(0, 0, "a\tb\n");
    const FrameBuffer& fb = pipeline.compose(list);
    assert(fb.rowText(0) == "a b ");
}

static void testFirstPresentPaintsEverything() {
    RenderPipeline pipeline(5, 2);
    DrawList list;
    list.text(0, 0, "hi");
    pipeline.compose(list);
    auto runs = RenderPipeline::diff(pipeline.current(), pipeline.previous());
    size_t cells = 0;
    for (const auto& run : runs) cells += run.text.size();
    assert(cells == 10);
}

static void testPresentIsIdempotent() {
    RenderPipeline pipeline(20, 4);
    CaptureSink sink;
    DrawList list;
    list.text(1, 2, "hello", Style(Color::GREEN));
    pipeline.compose(list);
    assert(pipeline.present(sink) > 0);
    sink.take();

    assert(pipeline.present(sink) == 0);
    assert(sink.data.empty());
    assert(RenderPipeline::diff(pipeline.current(), pipeline.previous()).empty());
    assert(RenderPipeline::diff(pipeline.current(), pipeline.previous()).empty());
}

static void testUnchangedCellsProduceNoOutput() {
    RenderPipeline pipeline(20, 4);
    CaptureSink sink;
    DrawList list;
    list.text(0, 0, "status: idle");
    pipeline.compose(list);
    pipeline.present(sink);
    sink.take();

    DrawList next;
    next.text(0, 0, "status: busy");
    pipeline.compose(next);
    auto runs = RenderPipeline::diff(pipeline.current(), pipeline.previous());
    assert(runs.size() == 1);
    assert(runs[0].row == 0 && runs[0].col == 8);
    assert(runs[0].text == U"busy");

    pipeline.flush(runs, sink);
    std::string out = sink.take();
    assert(out.find("\x1b[1;9H") == 0);
    assert(out.find("busy") != std::string::npos);
    assert(out.find("status") == std::string::npos);
}

static void testRunsSplitOnStyleChange() {
    RenderPipeline pipeline(10, 1);
    CaptureSink sink;
    pipeline.compose(DrawList());
    pipeline.present(sink);

    DrawList list;
    list.text(0, 0, "ab", Style(Color::RED));
    list.text(0, 2, "cd", Style(Color::RED));
    list.text(0, 4, "ef", Style(Color::BLUE, Color::DEFAULT, ATTR_BOLD));
    pipeline.compose(list);
    auto runs = RenderPipeline::diff(pipeline.current(), pipeline.previous());
    assert(runs.size() == 2);
    assert(runs[0].text == U"abcd");
    assert(runs[1].text == U"ef");
    for (size_t i = 1; i < runs.size(); i++) {
        bool touching = runs[i].row == runs[i - 1].row &&
                        runs[i].col == runs[i - 1].col + static_cast<int>(runs[i - 1].text.size());
        if (touching) assert(runs[i].style != runs[i - 1].style);
    }
}

static void testSgrOnlyWhenStyleChanges() {
    RenderPipeline pipeline(20, 3);
    CaptureSink sink;
    pipeline.compose(DrawList());
    pipeline.present(sink);
    sink.take();

    Style green(Color::GREEN);
    DrawList list;
    list.text(0, 0, "one", green);
    list.text(1, 0, "two", green);
    list.text(2, 0, "three", Style(Color::RED, Color::DEFAULT, ATTR_BOLD));
    pipeline.compose(list);
    pipeline.present(sink);
    std::string out = sink.take();
    assert(countOf(out, "\x1b[0;32m") == 1);
    assert(countOf(out, "\x1b[0;1;31m") == 1);
    assert(countOf(out, "H") == 3);
}

static void testSgrEncoding() {
    assert(RenderPipeline::sgr(Style()) == "\x1b[0m");
    assert(RenderPipeline::sgr(Style(Color::YELLOW, Color::BLUE)) == "\x1b[0;33;44m");
    assert(RenderPipeline::sgr(Style(Color::BRIGHT_BLACK, Color::DEFAULT, ATTR_DIM | ATTR_REVERSE)) == "\x1b[0;2;7;90m");
    assert(RenderPipeline::sgr(Style(Color::DEFAULT, Color::DEFAULT, ATTR_UNDERLINE)) == "\x1b[0;4m");
}

static void testResizeForcesFullRepaint() {
    RenderPipeline pipeline(80, 24);
    CaptureSink sink;
    DrawList list;
    list.text(0, 0, "title");
    pipeline.compose(list);
    pipeline.present(sink);
    assert(pipeline.present(sink) == 0);

    pipeline.resize(120, 40);
    assert(pipeline.cols() == 120 && pipeline.rows() == 40);
    pipeline.compose(list);
    auto runs = RenderPipeline::diff(pipeline.current(), pipeline.previous());
    size_t cells = 0;
    for (const auto& run : runs) cells += run.text.size();
    assert(cells == 120u * 40u);

    sink.take();
    pipeline.flush(runs, sink);
    assert(countOf(sink.data, "\x1b[40;1H") == 1);
    assert(pipeline.present(sink) == 0);
}

static void testUtf8Output() {
    RenderPipeline pipeline(4, 1);
    CaptureSink sink;
    pipeline.compose(DrawList());
    pipeline.present(sink);
    sink.take();

    DrawList list;
    list.text(0, 0, U"│é");
    pipeline.compose(list);
    pipeline.present(sink);
    assert(sink.data.find("\xe2\x94\x82\xc3\xa9") != std::string::npos);
}

int main() {
    testComposeClipsOutOfBounds();
    testComposeRespectsMaxWidth();
    testComposeReplacesControlCharacters();
    testFirstPresentPaintsEverything();
    testPresentIsIdempotent();
    testUnchangedCellsProduceNoOutput();
    testRunsSplitOnStyleChange();
    testSgrOnlyWhenStyleChanges();
    testSgrEncoding();
    testResizeForcesFullRepaint();
    testUtf8Output();
    return 0;
}
