#include <gemtab/link-selector.h>

#include <ytrace/ytrace.hpp>

namespace gemtab {

const char* keyName(Key key) noexcept {
    switch (key) {
    case Key::Enter:   return "Enter";
    case Key::Escape:  return "Escape";
    case Key::Tab:     return "Tab";
    case Key::Backtab: return "Backtab";
    case Key::Other:   return "Other";
    }
    return "Other";
}

const char* linkSelectorStateName(LinkSelector::State state) noexcept {
    return state == LinkSelector::State::Selecting ? "Selecting" : "Off";
}

LinkSelector::Outcome LinkSelector::handleKey(Key key, Document& doc, Viewport& view,
                                              StatusBar& bar) {
    Outcome outcome;
    const size_t count = doc.links.size();

    if (_state == State::Selecting && _index >= count) {
        // Links changed under an active selection
        ywarn("LinkSelector: index {} invalid for {} links, resetting", _index, count);
        reset();
        doc.mode = NavigationMode::Normal;
    }

    switch (_state) {
    case State::Off:
        if (key == Key::Enter) {
            if (count == 0) {
                ydebug("LinkSelector: Enter ignored, {} has no links", doc.url);
                break;
            }
            _state = State::Selecting;
            doc.mode = NavigationMode::LinkSelect;
            select(0, doc, view, bar);
            outcome.action = Outcome::Action::Highlighted;
        } else if (key == Key::Escape) {
            clear(doc, view, bar);
            outcome.action = Outcome::Action::Cleared;
        }
        break;

    case State::Selecting:
        switch (key) {
        case Key::Enter:
            // Off before the caller navigates, so a re-entrant Enter starts clean
            outcome.action = Outcome::Action::Follow;
            outcome.baseUrl = doc.url;
            outcome.target = doc.links[_index];
            reset();
            doc.mode = NavigationMode::Normal;
            doc.selected.clear();
            doc.selectedId.clear();
            view.highlight("");
            bar.setLabel("");
            ydebug("LinkSelector: follow {} relative to {}", outcome.target, outcome.baseUrl);
            break;

        case Key::Tab:
            select((_index + 1) % count, doc, view, bar);
            outcome.action = Outcome::Action::Highlighted;
            break;

        case Key::Backtab:
            select((_index + count - 1) % count, doc, view, bar);
            outcome.action = Outcome::Action::Highlighted;
            break;

        case Key::Escape:
            reset();
            doc.mode = NavigationMode::Normal;
            clear(doc, view, bar);
            outcome.action = Outcome::Action::Cleared;
            break;

        case Key::Other:
            break;
        }
        break;
    }

    return outcome;
}

void LinkSelector::resume(Document& doc, Viewport& view, StatusBar& bar) {
    reset();
    if (doc.mode != NavigationMode::LinkSelect) return;

    if (doc.links.empty()) {
        doc.mode = NavigationMode::Normal;
        return;
    }

    size_t index = 0;
    if (auto res = parseLinkId(doc.selectedId, doc.links.size()); res) {
        index = *res;
    } else {
        ywarn("LinkSelector: {}: {}, falling back to link 0", doc.url, error_msg(res));
    }
    _state = State::Selecting;
    select(index, doc, view, bar);
}

void LinkSelector::select(size_t index, Document& doc, Viewport& view, StatusBar& bar) {
    _index = index;
    const std::string id = std::to_string(index);
    view.highlight(id);
    view.scrollToHighlight();
    bar.setLabel(_linkLabel);
    bar.setText(doc.links[index]);
    doc.selected = doc.links[index];
    doc.selectedId = id;
}

void LinkSelector::clear(Document& doc, Viewport& view, StatusBar& bar) {
    view.highlight("");
    bar.setLabel("");
    bar.setText(doc.url);
    doc.selected.clear();
    doc.selectedId.clear();
}

} // namespace gemtab
