#include <gemtab/memory-widgets.h>

#include <algorithm>

namespace gemtab {

void MemoryViewport::scrollTo(int row, int column) {
    _row = std::max(0, row);
    _column = std::max(0, column);
}

void MemoryViewport::highlight(const std::string& id) {
    _highlights.clear();
    if (!id.empty()) {
        _highlights.push_back(id);
    }
}

void MemoryViewport::scrollToHighlight() {
    _scrollToHighlightCalls++;
    if (_highlights.empty()) return;
    auto it = _regionRows.find(_highlights.front());
    if (it != _regionRows.end()) {
        _row = std::max(0, it->second);
    }
}

} // namespace gemtab
