#include <gemtab/session.h>
#include <gemtab/memory-widgets.h>

#include <ytrace/ytrace.hpp>

#include <cstddef>
#include <utility>

namespace gemtab {

SessionOptions SessionOptions::fromConfig(const Config& config) {
    SessionOptions options;
    options.tab.linkLabel = config.linkLabel();
    options.tab.pagePercent = config.pagePercent();
    options.placeholderUrl = config.placeholderUrl();
    return options;
}

Session::Session(StatusBar& bar, Navigator& navigator, Renderer& renderer,
                 ViewportFactory makeViewport, SessionOptions options)
    : _bar(bar),
      _navigator(navigator),
      _renderer(renderer),
      _makeViewport(std::move(makeViewport)),
      _options(std::move(options)) {
    newTab();
}

size_t Session::newTab() {
    if (!_tabs.empty()) {
        Tab& current = activeTab();
        if (current.hasContent()) current.saveScroll();
        current.saveBottomBar(_bar);
    }

    auto tab = Tab::create(_makeViewport(), _options.tab, _nextTabId++);
    auto placeholder = Document::create(_options.placeholderUrl);
    placeholder->termWidth = _options.termWidth;
    tab->setDocument(std::move(placeholder));

    _tabs.push_back(tab);
    _active = _tabs.size() - 1;

    _bar.setLabel("");
    _bar.setText("");
    tab->saveBottomBar(_bar);
    tab->viewport().redraw();

    yinfo("Session: opened tab {} at {} ({} tabs)", tab->id(), _active, _tabs.size());
    return _active;
}

Result<void> Session::closeTab(size_t index) {
    if (auto res = tabAt(index); !res) {
        return Err("Cannot close tab", res);
    }
    if (_tabs.size() == 1) {
        return Err("Cannot close the last tab");
    }

    const bool wasActive = index == _active;
    _tabs.erase(_tabs.begin() + static_cast<std::ptrdiff_t>(index));

    if (wasActive) {
        // The tab before the closed one takes over
        _active = index > 0 ? index - 1 : 0;
        Tab& incoming = activeTab();
        reflowIfNeeded(incoming);
        incoming.applyScroll();
        incoming.applyBottomBar(_bar);
        incoming.viewport().redraw();
    } else if (index < _active) {
        _active--;
    }

    yinfo("Session: closed tab {}, active {} ({} tabs)", index, _active, _tabs.size());
    return Ok();
}

Result<void> Session::switchTab(size_t index) {
    if (auto res = tabAt(index); !res) {
        return Err("Cannot switch tab", res);
    }
    if (index == _active) return Ok();

    Tab& outgoing = activeTab();
    if (outgoing.hasContent()) outgoing.saveScroll();
    outgoing.saveBottomBar(_bar);

    _active = index;
    Tab& incoming = activeTab();
    reflowIfNeeded(incoming);
    incoming.applyScroll();
    incoming.applyBottomBar(_bar);
    incoming.viewport().redraw();

    ydebug("Session: switched to tab {}", index);
    return Ok();
}

Tab::Ptr Session::tab(size_t index) const {
    if (index >= _tabs.size()) return nullptr;
    return _tabs[index];
}

Result<size_t> Session::indexOf(TabId id) const {
    for (size_t i = 0; i < _tabs.size(); i++) {
        if (_tabs[i]->id() == id) return Ok(i);
    }
    return Err<size_t>("tab " + std::to_string(id) + " is closed");
}

LinkSelector::Outcome Session::handleKey(Key key) {
    auto outcome = activeTab().handleKey(key, _bar, _navigator);
    if (outcome.action != LinkSelector::Outcome::Action::None) {
        activeTab().viewport().redraw();
    }
    return outcome;
}

void Session::pageUp() {
    activeTab().pageUp(_options.termHeight);
    activeTab().viewport().redraw();
}

void Session::pageDown() {
    activeTab().pageDown(_options.termHeight);
    activeTab().viewport().redraw();
}

Result<bool> Session::resize(int width, int height) {
    _options.termWidth = width;
    _options.termHeight = height;

    Tab& tab = activeTab();
    if (!tab.document()->needsReflow(width)) {
        return Ok(false);
    }
    auto res = tab.reflow(width, _renderer);
    if (!res) {
        return Err<bool>("Resize to " + std::to_string(width) + "x" + std::to_string(height), res);
    }
    if (*res) {
        tab.viewport().redraw();
    }
    return res;
}

Result<void> Session::goBack(size_t index) {
    auto tabRes = tabAt(index);
    if (!tabRes) {
        return Err("Cannot go back", tabRes);
    }
    Tab& tab = **tabRes;

    if (tab.hasContent()) tab.saveScroll();
    auto url = tab.history().back();
    if (!url) {
        return Result<void>(url.error());
    }
    tab.setPendingHistoryStep(tab.pendingHistoryStep() - 1);
    _navigator.load(tab.id(), *url);
    return Ok();
}

Result<void> Session::goForward(size_t index) {
    auto tabRes = tabAt(index);
    if (!tabRes) {
        return Err("Cannot go forward", tabRes);
    }
    Tab& tab = **tabRes;

    if (tab.hasContent()) tab.saveScroll();
    auto url = tab.history().forward();
    if (!url) {
        return Result<void>(url.error());
    }
    tab.setPendingHistoryStep(tab.pendingHistoryStep() + 1);
    _navigator.load(tab.id(), *url);
    return Ok();
}

Result<void> Session::navigationCompleted(TabId id, Document::Ptr doc, NavigationKind kind) {
    auto indexRes = indexOf(id);
    if (!indexRes) {
        return Err("Navigation result dropped", indexRes);
    }
    if (!doc) {
        return Err("Navigation result for tab " + std::to_string(id) + " has no document");
    }
    const size_t index = *indexRes;
    Tab& tab = *_tabs[index];
    const bool isActive = index == _active;

    if (kind == NavigationKind::New) {
        if (tab.hasContent()) tab.saveScroll();
        tab.history().push(doc->url);
        doc->mode = NavigationMode::Normal;
    }

    tab.setDocument(doc);
    tab.setPendingHistoryStep(0);
    tab.viewport().highlight("");
    if (isActive) {
        reflowIfNeeded(tab);
    }

    if (kind == NavigationKind::New) {
        // Fresh documents start at the top
        tab.viewport().scrollTo(0, 0);
    } else {
        tab.applyScroll();
    }

    withStatusBar(index, [&](StatusBar& bar) {
        bar.setLabel("");
        bar.setText(doc->url);
        if (kind == NavigationKind::History) {
            tab.resumeSelection(bar);
        }
    });

    if (isActive) {
        tab.viewport().redraw();
    }
    yinfo("Session: tab {} now shows {} ({} bytes)", id, doc->url, doc->approximateSize());
    return Ok();
}

Result<void> Session::navigationFailed(TabId id, NavigationKind kind, const std::string& reason) {
    auto indexRes = indexOf(id);
    if (!indexRes) {
        return Err("Navigation failure dropped", indexRes);
    }
    const size_t index = *indexRes;
    Tab& tab = *_tabs[index];

    if (kind == NavigationKind::History) {
        // Undo the cursor move, the old document is still displayed
        int step = tab.pendingHistoryStep();
        for (; step < 0; ++step) {
            if (auto res = tab.history().forward(); !res) {
                ywarn("Session: tab {}: cannot undo history move: {}", id, error_msg(res));
                break;
            }
        }
        for (; step > 0; --step) {
            if (auto res = tab.history().back(); !res) {
                ywarn("Session: tab {}: cannot undo history move: {}", id, error_msg(res));
                break;
            }
        }
        tab.setPendingHistoryStep(0);
    }

    ywarn("Session: navigation in tab {} failed: {}", id, reason);
    withStatusBar(index, [&](StatusBar& bar) {
        bar.setLabel("");
        bar.setText(reason);
    });
    return Ok();
}

Result<Tab*> Session::tabAt(size_t index) const {
    if (index >= _tabs.size()) {
        return Err<Tab*>("invalid tab index " + std::to_string(index) + " (" +
                         std::to_string(_tabs.size()) + " tabs)");
    }
    return Ok(_tabs[index].get());
}

void Session::withStatusBar(size_t index, const std::function<void(StatusBar&)>& fn) {
    Tab& tab = *_tabs[index];
    if (index == _active) {
        fn(_bar);
        tab.saveBottomBar(_bar);
        return;
    }
    MemoryStatusBar scratch;
    tab.applyBottomBar(scratch);
    fn(scratch);
    tab.saveBottomBar(scratch);
}

void Session::reflowIfNeeded(Tab& tab) {
    if (!tab.document()->needsReflow(_options.termWidth)) return;
    if (auto res = tab.reflow(_options.termWidth, _renderer); !res) {
        ywarn("Session: {}", error_msg(res));
    }
}

} // namespace gemtab
