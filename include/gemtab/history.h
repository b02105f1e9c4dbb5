#pragma once

#include <gemtab/result.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace gemtab {

/**
 * History - visited URLs of one tab with a back/forward cursor.
 *
 * push() after moving back drops the forward branch, like any browser.
 * Entries are never removed otherwise.
 */
class History {
public:
    History() = default;

    /**
     * Add a URL that is being loaded and displayed.
     * Everything ahead of the cursor is discarded first.
     */
    void push(const std::string& url);

    /**
     * Move the cursor one entry back / forward and return the URL there.
     * At either end nothing changes and "no history available" is returned.
     */
    Result<std::string> back();
    Result<std::string> forward();

    [[nodiscard]] bool canGoBack() const noexcept { return _pos > 0; }
    [[nodiscard]] bool canGoForward() const noexcept {
        return _pos + 1 < static_cast<int>(_urls.size());
    }

    // Empty string when there is no history yet
    [[nodiscard]] std::string current() const;

    [[nodiscard]] int position() const noexcept { return _pos; }
    [[nodiscard]] size_t size() const noexcept { return _urls.size(); }
    [[nodiscard]] bool empty() const noexcept { return _urls.empty(); }
    [[nodiscard]] const std::vector<std::string>& urls() const noexcept { return _urls; }

private:
    std::vector<std::string> _urls;
    int _pos = -1;
};

} // namespace gemtab
