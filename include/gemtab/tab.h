#pragma once

#include <gemtab/document.h>
#include <gemtab/history.h>
#include <gemtab/link-selector.h>
#include <gemtab/navigator.h>
#include <gemtab/result.hpp>
#include <gemtab/viewport.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace gemtab {

struct TabOptions {
    std::string linkLabel = LinkSelector::DEFAULT_LINK_LABEL;
    int pagePercent = 75;  // Share of the terminal height moved by page up/down
};

// URLs with this scheme are synthetic pages, never real navigation state
inline constexpr const char* PLACEHOLDER_SCHEME = "about:";

/**
 * Tab - one browsing context.
 *
 * Owns its viewport, history and link selector, and holds the current
 * document through a shared pointer (see Document). The status bar is shared
 * by all tabs, so each tab keeps a snapshot of it that is saved and applied
 * at tab-switch boundaries.
 *
 * All calls are expected on the event loop thread. reflow() is guarded by a
 * non-blocking in-progress flag, so a reflow requested while another one is
 * rendering (a resize handled from inside the renderer) never interleaves
 * with it.
 */
class Tab {
public:
    using Ptr = std::shared_ptr<Tab>;

    static Ptr create(Viewport::Ptr view, const TabOptions& options = TabOptions(), TabId id = 0);

    Tab(const Tab&) = delete;
    Tab& operator=(const Tab&) = delete;

    TabId id() const noexcept { return _id; }

    // Current document, never null
    const Document::Ptr& document() const noexcept { return _document; }

    /**
     * Adopt a new current document. The link selector goes back to Off and
     * any reflow still running for the previous document is discarded.
     */
    void setDocument(Document::Ptr doc);

    NavigationMode mode() const noexcept {
        return _selector.isSelecting() ? NavigationMode::LinkSelect : NavigationMode::Normal;
    }

    Viewport& viewport() noexcept { return *_view; }
    History& history() noexcept { return _history; }
    const History& history() const noexcept { return _history; }
    const LinkSelector& selector() const noexcept { return _selector; }

    // History cursor move still waiting for its document: -1 back, +1 forward, 0 none
    int pendingHistoryStep() const noexcept { return _pendingHistoryStep; }
    void setPendingHistoryStep(int step) noexcept { _pendingHistoryStep = step; }

    /**
     * Handle a key while this tab is active. Link selection keys go to the
     * link selector; a followed link is handed to the navigator with id().
     * The status bar is snapshotted afterwards.
     */
    LinkSelector::Outcome handleKey(Key key, StatusBar& bar, Navigator& navigator);

    // Re-enter link-select mode if the current document was left in it
    void resumeSelection(StatusBar& bar);

    // Store the viewport offset in the document. Call before leaving it.
    void saveScroll();

    // Scroll the viewport to the document's stored offset.
    // Only for documents already visited (back/forward, tab switch).
    void applyScroll();

    void pageUp(int termHeight);
    void pageDown(int termHeight);

    void saveBottomBar(const StatusBar& bar);
    void applyBottomBar(StatusBar& bar) const;

    const std::string& barLabel() const noexcept { return _barLabel; }
    const std::string& barText() const noexcept { return _barText; }

    /**
     * False for the new-tab placeholder and anything else that is not real
     * navigation state: no document, empty URL, placeholder scheme, or
     * nothing rendered.
     */
    [[nodiscard]] bool hasContent() const;

    /**
     * Re-render the current document for width if it was rendered for
     * another one.
     *
     * Returns Ok(true) when new content was applied, Ok(false) when nothing
     * was applied: already up to date, another reflow is in progress (it
     * picks up this width), or the document was replaced meanwhile.
     * Results rendered for a width that was superseded while rendering are
     * discarded and the render is repeated for the latest width.
     */
    Result<bool> reflow(int width, Renderer& renderer);

    [[nodiscard]] bool isReflowing() const noexcept { return _reflowing.load(std::memory_order_acquire); }

private:
    Tab(Viewport::Ptr view, const TabOptions& options, TabId id);

    TabId _id;
    Document::Ptr _document;
    Viewport::Ptr _view;
    History _history;
    LinkSelector _selector;
    TabOptions _options;

    std::string _barLabel;
    std::string _barText;

    int _pendingHistoryStep = 0;

    std::atomic<bool> _reflowing{false};
    std::atomic<int> _requestedWidth{0};
    std::atomic<uint64_t> _generation{0};
};

} // namespace gemtab
