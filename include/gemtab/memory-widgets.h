#pragma once

#include <gemtab/viewport.h>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace gemtab {

/**
 * MemoryViewport - Viewport without a terminal behind it.
 *
 * Used by the headless replay tool and by tests. Offsets are clamped at 0
 * like a real text view. scrollToHighlight() moves to the row registered for
 * the highlighted region with setRegionRow(), if any.
 */
class MemoryViewport : public Viewport {
public:
    std::pair<int, int> scrollOffset() const override { return {_row, _column}; }
    void scrollTo(int row, int column) override;

    void highlight(const std::string& id) override;
    std::vector<std::string> highlights() const override { return _highlights; }
    void scrollToHighlight() override;

    void redraw() override { _redraws++; }

    void setRegionRow(const std::string& id, int row) { _regionRows[id] = row; }

    [[nodiscard]] uint32_t redrawCount() const noexcept { return _redraws; }
    [[nodiscard]] uint32_t scrollToHighlightCount() const noexcept { return _scrollToHighlightCalls; }

private:
    int _row = 0;
    int _column = 0;
    std::vector<std::string> _highlights;
    std::unordered_map<std::string, int> _regionRows;
    uint32_t _redraws = 0;
    uint32_t _scrollToHighlightCalls = 0;
};

class MemoryStatusBar : public StatusBar {
public:
    std::string label() const override { return _label; }
    void setLabel(const std::string& label) override { _label = label; }

    std::string text() const override { return _text; }
    void setText(const std::string& text) override { _text = text; }

private:
    std::string _label;
    std::string _text;
};

} // namespace gemtab
