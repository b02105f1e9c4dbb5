#include <gemtab/tab.h>

#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <utility>

namespace gemtab {

namespace {

// Holds the reflow flag for one scope. Acquisition never blocks: owned() is
// false when another reflow already holds it.
class ReflowGuard {
public:
    explicit ReflowGuard(std::atomic<bool>& flag) : _flag(flag) {
        bool expected = false;
        _owned = _flag.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

    ~ReflowGuard() {
        if (_owned) {
            _flag.store(false, std::memory_order_release);
        }
    }

    ReflowGuard(const ReflowGuard&) = delete;
    ReflowGuard& operator=(const ReflowGuard&) = delete;

    bool owned() const noexcept { return _owned; }

private:
    std::atomic<bool>& _flag;
    bool _owned = false;
};

} // anonymous namespace

Tab::Ptr Tab::create(Viewport::Ptr view, const TabOptions& options, TabId id) {
    return Ptr(new Tab(std::move(view), options, id));
}

Tab::Tab(Viewport::Ptr view, const TabOptions& options, TabId id)
    : _id(id),
      _document(Document::create()),
      _view(std::move(view)),
      _selector(options.linkLabel),
      _options(options) {}

void Tab::setDocument(Document::Ptr doc) {
    if (!doc) {
        ywarn("Tab: null document adopted, using an empty one");
        doc = Document::create();
    }
    _document = std::move(doc);
    _selector.reset();
    _generation.fetch_add(1, std::memory_order_acq_rel);
}

LinkSelector::Outcome Tab::handleKey(Key key, StatusBar& bar, Navigator& navigator) {
    auto outcome = _selector.handleKey(key, *_document, *_view, bar);
    ydebug("Tab {}: key {} -> {}", _id, keyName(key),
           linkSelectorStateName(_selector.state()));

    if (outcome.action == LinkSelector::Outcome::Action::Follow) {
        navigator.followLink(_id, outcome.baseUrl, outcome.target);
    }
    saveBottomBar(bar);
    return outcome;
}

void Tab::resumeSelection(StatusBar& bar) {
    _selector.resume(*_document, *_view, bar);
}

void Tab::saveScroll() {
    // The cache holds the same document, so this is also saved there
    auto [row, column] = _view->scrollOffset();
    _document->row = row;
    _document->column = column;
}

void Tab::applyScroll() {
    _view->scrollTo(_document->row, _document->column);
}

void Tab::pageUp(int termHeight) {
    auto [row, column] = _view->scrollOffset();
    const int step = std::max(0, termHeight) * _options.pagePercent / 100;
    _view->scrollTo(std::max(0, row - step), column);
}

void Tab::pageDown(int termHeight) {
    auto [row, column] = _view->scrollOffset();
    const int step = std::max(0, termHeight) * _options.pagePercent / 100;
    _view->scrollTo(row + step, column);
}

void Tab::saveBottomBar(const StatusBar& bar) {
    _barLabel = bar.label();
    _barText = bar.text();
}

void Tab::applyBottomBar(StatusBar& bar) const {
    bar.setLabel(_barLabel);
    bar.setText(_barText);
}

bool Tab::hasContent() const {
    if (!_document || !_view) return false;
    if (_document->url.empty()) return false;
    if (_document->url.rfind(PLACEHOLDER_SCHEME, 0) == 0) return false;
    if (_document->content.empty()) return false;
    return true;
}

Result<bool> Tab::reflow(int width, Renderer& renderer) {
    _requestedWidth.store(width, std::memory_order_release);

    ReflowGuard guard(_reflowing);
    if (!guard.owned()) {
        ydebug("Tab: reflow in progress, width {} left to it", width);
        return Ok(false);
    }

    const Document::Ptr doc = _document;
    const uint64_t generation = _generation.load(std::memory_order_acquire);

    while (true) {
        const int target = _requestedWidth.load(std::memory_order_acquire);
        if (!doc->needsReflow(target)) {
            return Ok(false);
        }

        auto rendered = renderer.render(*doc, target);
        if (!rendered) {
            return Err<bool>("reflow of " + doc->url + " failed", rendered);
        }

        if (_generation.load(std::memory_order_acquire) != generation) {
            ydebug("Tab: document replaced during reflow of {}, result dropped", doc->url);
            return Ok(false);
        }
        if (_requestedWidth.load(std::memory_order_acquire) != target) {
            ydebug("Tab: reflow for width {} superseded, rendering again", target);
            continue;
        }

        doc->content = std::move(rendered->content);
        doc->maxPreCols = rendered->maxPreCols;
        doc->termWidth = target;
        yinfo("Tab: reflowed {} for width {}", doc->url, target);
        return Ok(true);
    }
}

} // namespace gemtab
