//=============================================================================
// LinkSelector Tests
//
// State transitions, wraparound, and the widget and document side effects
//=============================================================================

#include <cstddef>
#include <string>
#include <vector>

#include <boost/ut.hpp>
#include <gemtab/link-selector.h>
#include <gemtab/memory-widgets.h>

using namespace boost::ut;
using namespace gemtab;

namespace {

struct Fixture {
    Document::Ptr doc = Document::create("gemini://example.org/index.gmi");
    MemoryViewport view;
    MemoryStatusBar bar;
    LinkSelector selector;

    explicit Fixture(std::vector<std::string> links = {"gemini://a", "gemini://b", "gemini://c"}) {
        doc->links = std::move(links);
    }

    LinkSelector::Outcome press(Key key) { return selector.handleKey(key, *doc, view, bar); }
};

} // anonymous namespace

suite link_selector_tests = [] {
    "starts off"_test = [] {
        LinkSelector selector;
        expect(selector.state() == LinkSelector::State::Off);
        expect(!selector.isSelecting());
        expect(selector.linkLabel() == "Link: ");
    };

    "enter highlights the first link"_test = [] {
        Fixture f;
        auto outcome = f.press(Key::Enter);

        expect(outcome.action == LinkSelector::Outcome::Action::Highlighted);
        expect(f.selector.isSelecting());
        expect(f.selector.index() == 0_ul);
        expect(f.view.highlights().size() == 1_ul);
        expect(f.view.highlights()[0] == "0");
        expect(f.view.scrollToHighlightCount() == 1_u);
        expect(f.bar.label() == "Link: ");
        expect(f.bar.text() == "gemini://a");
        expect(f.doc->selected == "gemini://a");
        expect(f.doc->selectedId == "0");
        expect(f.doc->mode == NavigationMode::LinkSelect);
    };

    "enter without links stays off"_test = [] {
        Fixture f({});
        f.bar.setText("unchanged");
        auto outcome = f.press(Key::Enter);

        expect(outcome.action == LinkSelector::Outcome::Action::None);
        expect(!f.selector.isSelecting());
        expect(f.view.highlights().empty());
        expect(f.bar.text() == "unchanged");
        expect(f.doc->mode == NavigationMode::Normal);
    };

    "tab wraps around forward"_test = [] {
        Fixture f;
        f.press(Key::Enter);

        std::vector<size_t> seen;
        for (int i = 0; i < 4; ++i) {
            f.press(Key::Tab);
            seen.push_back(f.selector.index());
        }
        expect(seen == std::vector<size_t>{1, 2, 0, 1});
        expect(f.bar.text() == "gemini://b");
        expect(f.doc->selectedId == "1");
    };

    "backtab wraps around backward"_test = [] {
        Fixture f;
        f.press(Key::Enter);

        f.press(Key::Backtab);
        expect(f.selector.index() == 2_ul);
        expect(f.view.highlights()[0] == "2");
        expect(f.bar.text() == "gemini://c");

        f.press(Key::Backtab);
        expect(f.selector.index() == 1_ul);

        f.press(Key::Backtab);
        expect(f.selector.index() == 0_ul);
        expect(f.view.highlights()[0] == "0");
        expect(f.bar.text() == "gemini://a");
    };

    "single link cycles onto itself"_test = [] {
        Fixture f({"gemini://only"});
        f.press(Key::Enter);
        f.press(Key::Tab);
        expect(f.selector.index() == 0_ul);
        f.press(Key::Backtab);
        expect(f.selector.index() == 0_ul);
        expect(f.bar.text() == "gemini://only");
    };

    "highlight scrolls to the link region"_test = [] {
        Fixture f;
        f.view.setRegionRow("1", 40);
        f.press(Key::Enter);
        f.press(Key::Tab);

        expect(f.view.scrollOffset().first == 40_i);
        expect(f.view.scrollToHighlightCount() == 2_u);
    };

    "escape clears the selection and shows the url"_test = [] {
        Fixture f;
        f.press(Key::Enter);
        f.press(Key::Tab);
        auto outcome = f.press(Key::Escape);

        expect(outcome.action == LinkSelector::Outcome::Action::Cleared);
        expect(!f.selector.isSelecting());
        expect(f.view.highlights().empty());
        expect(f.bar.label().empty());
        expect(f.bar.text() == f.doc->url);
        expect(f.doc->selected.empty());
        expect(f.doc->selectedId.empty());
        expect(f.doc->mode == NavigationMode::Normal);
    };

    "escape while off also clears"_test = [] {
        Fixture f;
        f.bar.setLabel("stale");
        f.bar.setText("stale");
        auto outcome = f.press(Key::Escape);

        expect(outcome.action == LinkSelector::Outcome::Action::Cleared);
        expect(f.bar.label().empty());
        expect(f.bar.text() == f.doc->url);
    };

    "enter while selecting follows the link"_test = [] {
        Fixture f;
        f.press(Key::Enter);
        f.press(Key::Tab);
        auto outcome = f.press(Key::Enter);

        expect(outcome.action == LinkSelector::Outcome::Action::Follow);
        expect(outcome.baseUrl == "gemini://example.org/index.gmi");
        expect(outcome.target == "gemini://b");
        expect(f.selector.state() == LinkSelector::State::Off);
        expect(f.bar.label().empty());
        expect(f.doc->mode == NavigationMode::Normal);
    };

    "following a link clears the highlight and selection"_test = [] {
        Fixture f;
        f.press(Key::Enter);
        f.press(Key::Tab);
        f.press(Key::Enter);

        expect(f.view.highlights().empty());
        expect(f.doc->selected.empty());
        expect(f.doc->selectedId.empty());

        // Off again: Tab does nothing, Enter starts over at the first link
        expect(f.press(Key::Tab).action == LinkSelector::Outcome::Action::None);
        expect(f.view.highlights().empty());
        f.press(Key::Enter);
        expect(f.selector.index() == 0_ul);
        expect(f.view.highlights()[0] == "0");
    };

    "other keys are absorbed while selecting"_test = [] {
        Fixture f;
        f.press(Key::Enter);
        f.press(Key::Tab);
        auto outcome = f.press(Key::Other);

        expect(outcome.action == LinkSelector::Outcome::Action::None);
        expect(f.selector.isSelecting());
        expect(f.selector.index() == 1_ul);
    };

    "other keys do nothing while off"_test = [] {
        Fixture f;
        expect(f.press(Key::Other).action == LinkSelector::Outcome::Action::None);
        expect(f.press(Key::Tab).action == LinkSelector::Outcome::Action::None);
        expect(!f.selector.isSelecting());
    };

    "shrunken link list resets the selection"_test = [] {
        Fixture f;
        f.press(Key::Enter);
        f.press(Key::Backtab);
        expect(f.selector.index() == 2_ul);

        f.doc->links.resize(1);
        auto outcome = f.press(Key::Tab);
        expect(outcome.action == LinkSelector::Outcome::Action::None);
        expect(!f.selector.isSelecting());
    };

    "custom label"_test = [] {
        Fixture f;
        f.selector = LinkSelector("-> ");
        f.press(Key::Enter);
        expect(f.bar.label() == "-> ");
    };
};

suite link_selector_resume_tests = [] {
    "resume restores the stored index"_test = [] {
        Fixture f;
        f.doc->mode = NavigationMode::LinkSelect;
        f.doc->selectedId = "2";
        f.selector.resume(*f.doc, f.view, f.bar);

        expect(f.selector.isSelecting());
        expect(f.selector.index() == 2_ul);
        expect(f.view.highlights()[0] == "2");
        expect(f.bar.label() == "Link: ");
        expect(f.bar.text() == "gemini://c");
    };

    "malformed id falls back to the first link"_test = [] {
        Fixture f;
        f.doc->mode = NavigationMode::LinkSelect;
        f.doc->selectedId = "bogus";
        f.selector.resume(*f.doc, f.view, f.bar);

        expect(f.selector.isSelecting());
        expect(f.selector.index() == 0_ul);
        expect(f.doc->selectedId == "0");
    };

    "out of range id falls back to the first link"_test = [] {
        Fixture f;
        f.doc->mode = NavigationMode::LinkSelect;
        f.doc->selectedId = "7";
        f.selector.resume(*f.doc, f.view, f.bar);
        expect(f.selector.index() == 0_ul);
    };

    "normal documents stay off"_test = [] {
        Fixture f;
        f.doc->selectedId = "1";
        f.selector.resume(*f.doc, f.view, f.bar);

        expect(!f.selector.isSelecting());
        expect(f.view.highlights().empty());
    };

    "link select mode without links goes back to normal"_test = [] {
        Fixture f({});
        f.doc->mode = NavigationMode::LinkSelect;
        f.selector.resume(*f.doc, f.view, f.bar);

        expect(!f.selector.isSelecting());
        expect(f.doc->mode == NavigationMode::Normal);
    };
};
