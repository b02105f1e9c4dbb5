#pragma once

#include <gemtab/config.h>
#include <gemtab/document.h>
#include <gemtab/navigator.h>
#include <gemtab/result.hpp>
#include <gemtab/tab.h>
#include <gemtab/viewport.h>

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace gemtab {

struct SessionOptions {
    TabOptions tab;
    std::string placeholderUrl = "about:newtab";
    int termWidth = 80;
    int termHeight = 24;

    static SessionOptions fromConfig(const Config& config);
};

/**
 * Session - the browser context.
 *
 * Owns the tabs and the active index, and holds the collaborators shared by
 * all tabs: the status bar, the navigator and the renderer used for reflow.
 * Loads are tracked by tab id, not position: they complete later, and the
 * user may have switched or closed tabs in between. Results for a closed tab
 * are dropped.
 *
 * A session always has at least one tab.
 */
class Session {
public:
    using ViewportFactory = std::function<Viewport::Ptr()>;

    Session(StatusBar& bar, Navigator& navigator, Renderer& renderer,
            ViewportFactory makeViewport, SessionOptions options = SessionOptions());

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Open a tab on the placeholder page and make it active. Returns its index.
    size_t newTab();

    // Fails for an invalid index and for the last remaining tab
    Result<void> closeTab(size_t index);

    // Saves scroll and status bar of the outgoing tab, applies the incoming one
    Result<void> switchTab(size_t index);

    size_t activeIndex() const noexcept { return _active; }
    Tab& activeTab() { return *_tabs[_active]; }
    size_t tabCount() const noexcept { return _tabs.size(); }

    // nullptr for an invalid index
    Tab::Ptr tab(size_t index) const;

    // Current position of the tab with this id; fails once it was closed
    Result<size_t> indexOf(TabId id) const;

    const std::vector<Tab::Ptr>& tabs() const noexcept { return _tabs; }

    // Key event for the active tab
    LinkSelector::Outcome handleKey(Key key);

    void pageUp();
    void pageDown();

    /**
     * New terminal size. The active tab is reflowed if its document was
     * rendered for another width; other tabs are reflowed when shown.
     */
    Result<bool> resize(int width, int height);

    int termWidth() const noexcept { return _options.termWidth; }
    int termHeight() const noexcept { return _options.termHeight; }

    /**
     * Move the history cursor of the tab at index and ask the navigator to
     * load the entry for its id.
     * Fails with "no history available" at either end, nothing changes then.
     */
    Result<void> goBack(size_t index);
    Result<void> goForward(size_t index);

    /**
     * A load started by the navigator produced a document.
     * New: the old position is saved, the URL pushed, the view starts at the top.
     * History: the document's stored position is applied.
     */
    Result<void> navigationCompleted(TabId id, Document::Ptr doc, NavigationKind kind);

    /**
     * A load produced nothing. The previous document stays, a pending history
     * move is undone and reason is shown in the tab's status bar.
     */
    Result<void> navigationFailed(TabId id, NavigationKind kind, const std::string& reason);

    StatusBar& statusBar() noexcept { return _bar; }

private:
    Result<Tab*> tabAt(size_t index) const;

    // Runs fn against the shared bar for the active tab, against a scratch
    // bar seeded from the tab's snapshot otherwise. The snapshot is updated.
    void withStatusBar(size_t index, const std::function<void(StatusBar&)>& fn);

    void reflowIfNeeded(Tab& tab);

    StatusBar& _bar;
    Navigator& _navigator;
    Renderer& _renderer;
    ViewportFactory _makeViewport;
    SessionOptions _options;

    std::vector<Tab::Ptr> _tabs;
    size_t _active = 0;
    TabId _nextTabId = 1;
};

} // namespace gemtab
