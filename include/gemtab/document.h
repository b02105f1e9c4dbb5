#pragma once

#include <gemtab/result.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace gemtab {

// Generalized media type, used to pick a renderer. The literal type sent by
// the server is kept separately in Document::rawMediatype.
enum class Mediatype : uint8_t {
    Gemtext = 0,  // text/gemini
    Plain = 1,    // text/plain and anything unrecognized
    Ansi = 2      // text/x-ansi
};

enum class NavigationMode : uint8_t {
    Normal = 0,
    LinkSelect = 1  // Enter was pressed, Tab/Backtab cycle through links
};

/**
 * Document - one fetched and rendered resource plus its view state.
 *
 * Documents are created by the fetch/render collaborator and handled through
 * Document::Ptr. A tab and an external cache keyed by url hold the same
 * pointer, so writes to the view-state fields (row, column, selected,
 * selectedId, mode) are seen by both. The document lives until the later of
 * the two releases it.
 */
struct Document {
    using Ptr = std::shared_ptr<Document>;
    using Clock = std::chrono::system_clock;

    static constexpr int UNLIMITED_PRE_COLS = -1;

    std::string url;
    Mediatype mediatype = Mediatype::Gemtext;
    std::string rawMediatype;

    std::string raw;      // Response body as received
    std::string content;  // Rendered form: style markers and left margin included

    // Terminal columns of the longest preformatted line in raw.
    // UNLIMITED_PRE_COLS means lines may always scroll horizontally.
    int maxPreCols = 0;

    std::vector<std::string> links;  // Index is the link id used for highlights

    int row = 0;
    int column = 0;  // Includes left margin changes, not a literal cell column

    int termWidth = 0;  // Width content was rendered for

    std::string selected;
    std::string selectedId;

    NavigationMode mode = NavigationMode::Normal;

    // Zero means the document never goes stale.
    Clock::time_point createdAt{};

    static Ptr create(std::string url = "");

    /**
     * Approximate size in bytes, for cache accounting only.
     * Sum of the lengths of raw, content, url, selected, selectedId and links.
     */
    [[nodiscard]] size_t approximateSize() const noexcept;

    /**
     * True when createdAt is set and older than maxAge relative to now.
     */
    [[nodiscard]] bool isStale(Clock::time_point now, Clock::duration maxAge) const noexcept;

    [[nodiscard]] bool needsReflow(int width) const noexcept { return termWidth != width; }

    [[nodiscard]] bool hasLinks() const noexcept { return !links.empty(); }
};

/**
 * Map a server media type string ("text/gemini; charset=utf-8") to the
 * generalized Mediatype. Parameters and case are ignored.
 */
Mediatype mediatypeFromString(const std::string& raw);

const char* mediatypeName(Mediatype mediatype) noexcept;

/**
 * Parse a highlight region id into a link index.
 * Fails for empty, non-numeric or out-of-range ids.
 */
Result<size_t> parseLinkId(const std::string& id, size_t linkCount);

} // namespace gemtab
