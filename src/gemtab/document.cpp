#include <gemtab/document.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace gemtab {

Document::Ptr Document::create(std::string url) {
    auto doc = std::make_shared<Document>();
    doc->url = std::move(url);
    return doc;
}

size_t Document::approximateSize() const noexcept {
    size_t n = raw.size() + content.size() + url.size() + selected.size() + selectedId.size();
    for (const auto& link : links) {
        n += link.size();
    }
    return n;
}

bool Document::isStale(Clock::time_point now, Clock::duration maxAge) const noexcept {
    if (createdAt == Clock::time_point{}) return false;
    return now - createdAt > maxAge;
}

Mediatype mediatypeFromString(const std::string& raw) {
    std::string type = raw.substr(0, raw.find(';'));

    // Trim and lowercase
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    type.erase(type.begin(), std::find_if(type.begin(), type.end(), notSpace));
    type.erase(std::find_if(type.rbegin(), type.rend(), notSpace).base(), type.end());
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (type == "text/gemini") return Mediatype::Gemtext;
    if (type == "text/x-ansi") return Mediatype::Ansi;
    return Mediatype::Plain;
}

const char* mediatypeName(Mediatype mediatype) noexcept {
    switch (mediatype) {
    case Mediatype::Gemtext: return "text/gemini";
    case Mediatype::Plain:   return "text/plain";
    case Mediatype::Ansi:    return "text/x-ansi";
    }
    return "text/plain";
}

Result<size_t> parseLinkId(const std::string& id, size_t linkCount) {
    if (id.empty()) {
        return Err<size_t>("empty link id");
    }
    size_t index = 0;
    auto [end, ec] = std::from_chars(id.data(), id.data() + id.size(), index);
    if (ec != std::errc() || end != id.data() + id.size()) {
        return Err<size_t>("link id '" + id + "' is not a number");
    }
    if (index >= linkCount) {
        return Err<size_t>("link id " + id + " out of range (" +
                           std::to_string(linkCount) + " links)");
    }
    return Ok(index);
}

} // namespace gemtab
