#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gemtab {

//=============================================================================
// Viewport - the scrollable text widget a tab displays its document in
//
// Highlights are opaque region ids. Link regions use the link index as id
// ("0", "1", ...), other text regions use non-numeric ids.
//=============================================================================

class Viewport {
public:
    using Ptr = std::shared_ptr<Viewport>;

    virtual ~Viewport() = default;

    // (row, column)
    virtual std::pair<int, int> scrollOffset() const = 0;
    virtual void scrollTo(int row, int column) = 0;

    // Empty id clears all highlights
    virtual void highlight(const std::string& id) = 0;
    virtual std::vector<std::string> highlights() const = 0;
    virtual void scrollToHighlight() = 0;

    virtual void redraw() = 0;
};

//=============================================================================
// StatusBar - the single bottom bar shared by all tabs
//=============================================================================

class StatusBar {
public:
    virtual ~StatusBar() = default;

    virtual std::string label() const = 0;
    virtual void setLabel(const std::string& label) = 0;

    virtual std::string text() const = 0;
    virtual void setText(const std::string& text) = 0;
};

} // namespace gemtab
