#pragma once

#include <gemtab/document.h>
#include <gemtab/navigator.h>
#include <gemtab/viewport.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace gemtab {

/**
 * LinkSelector - keyboard highlighting of a document's links
 *
 * State machine:
 *   Off --(Enter, links > 0)--> Selecting(0)
 *   Off --(Enter, no links)---> Off
 *   Selecting(i) --(Tab)------> Selecting((i + 1) mod n)
 *   Selecting(i) --(Backtab)--> Selecting((i - 1 + n) mod n)
 *   Selecting(i) --(Enter)----> Off, highlight cleared, follow links[i]
 *   Selecting(i) --(Esc)------> Off, highlight cleared
 *   Selecting(i) --(other)----> Selecting(i)
 *
 * Side effects go to the viewport, the shared status bar and the document's
 * selection fields. Following a link is returned to the caller as an Outcome;
 * the state is already Off when the caller dispatches it.
 */
class LinkSelector {
public:
    enum class State : uint8_t {
        Off = 0,
        Selecting = 1
    };

    struct Outcome {
        enum class Action : uint8_t {
            None,         // Key ignored or absorbed
            Highlighted,  // A link is highlighted (entered or moved)
            Cleared,      // Selection cancelled
            Follow        // Load target relative to baseUrl
        };

        Action action = Action::None;
        std::string baseUrl;
        std::string target;
    };

    static constexpr const char* DEFAULT_LINK_LABEL = "Link: ";

    explicit LinkSelector(std::string linkLabel = DEFAULT_LINK_LABEL)
        : _linkLabel(std::move(linkLabel)) {}

    Outcome handleKey(Key key, Document& doc, Viewport& view, StatusBar& bar);

    /**
     * Restore Selecting(i) for a document that was left in link-select mode,
     * using its selectedId. Documents in normal mode leave the selector Off.
     */
    void resume(Document& doc, Viewport& view, StatusBar& bar);

    // Back to Off without touching any widget
    void reset() noexcept {
        _state = State::Off;
        _index = 0;
    }

    [[nodiscard]] State state() const noexcept { return _state; }
    [[nodiscard]] bool isSelecting() const noexcept { return _state == State::Selecting; }

    // Only meaningful while selecting
    [[nodiscard]] size_t index() const noexcept { return _index; }

    [[nodiscard]] const std::string& linkLabel() const noexcept { return _linkLabel; }

private:
    void select(size_t index, Document& doc, Viewport& view, StatusBar& bar);
    void clear(Document& doc, Viewport& view, StatusBar& bar);

    State _state = State::Off;
    size_t _index = 0;
    std::string _linkLabel;
};

const char* linkSelectorStateName(LinkSelector::State state) noexcept;

} // namespace gemtab
