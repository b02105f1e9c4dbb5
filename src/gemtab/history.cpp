#include <gemtab/history.h>

#include <ytrace/ytrace.hpp>

namespace gemtab {

void History::push(const std::string& url) {
    if (_pos < static_cast<int>(_urls.size()) - 1) {
        // Somewhere in the middle, drop the stale forward branch
        ydebug("History: dropping {} forward entries", _urls.size() - static_cast<size_t>(_pos + 1));
        _urls.resize(static_cast<size_t>(_pos + 1));
    }
    _urls.push_back(url);
    _pos = static_cast<int>(_urls.size()) - 1;
}

Result<std::string> History::back() {
    if (!canGoBack()) {
        return Err<std::string>("no history available");
    }
    _pos--;
    return Ok(_urls[static_cast<size_t>(_pos)]);
}

Result<std::string> History::forward() {
    if (!canGoForward()) {
        return Err<std::string>("no history available");
    }
    _pos++;
    return Ok(_urls[static_cast<size_t>(_pos)]);
}

std::string History::current() const {
    if (_urls.empty()) return {};
    return _urls[static_cast<size_t>(_pos)];
}

} // namespace gemtab
