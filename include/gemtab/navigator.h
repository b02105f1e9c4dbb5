#pragma once

#include <gemtab/document.h>
#include <gemtab/result.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace gemtab {

enum class Key : uint8_t {
    Enter,
    Escape,
    Tab,
    Backtab,
    Other
};

const char* keyName(Key key) noexcept;

// Stable tab identity. Positions shift when tabs close, ids never do.
using TabId = uint64_t;

enum class NavigationKind : uint8_t {
    New,      // Followed link or typed URL: pushed to history, starts at the top
    History   // Back/forward: history untouched, saved scroll is applied
};

//=============================================================================
// Navigator - resolves and loads URLs for a tab
//
// Both calls only start loading. The result is reported later, as a separate
// event, through Session::navigationCompleted() or
// Session::navigationFailed() with the same tab id.
//=============================================================================

class Navigator {
public:
    virtual ~Navigator() = default;

    // Resolve relativeUrl against baseUrl and load it as a new navigation
    virtual void followLink(TabId tabId, const std::string& baseUrl,
                            const std::string& relativeUrl) = 0;

    // Load an absolute URL taken from the tab's history
    virtual void load(TabId tabId, const std::string& url) = 0;
};

//=============================================================================
// Renderer - produces display text for a document at a given width
//=============================================================================

struct Rendered {
    std::string content;
    int maxPreCols = 0;
};

class Renderer {
public:
    virtual ~Renderer() = default;

    virtual Result<Rendered> render(const Document& document, int width) = 0;
};

} // namespace gemtab
