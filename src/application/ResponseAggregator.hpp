/**
 * @file ResponseAggregator.hpp
 * @brief Drains a backend's fragment stream into a normalized ConversionResult.
 */

#pragma once

#include "domain/Conversion.hpp"
#include "domain/FragmentStream.hpp"
#include <functional>
#include <string>

namespace codeshift::application {

/**
 * @struct FenceReport
 * @brief Which code-fence markers a raw reply contained.
 */
struct FenceReport {
    bool hasOpening = false;
    bool hasClosing = false;

    bool wellFormed() const { return hasOpening && hasClosing; }
};

/**
 * @class ResponseAggregator
 * @brief Collects fragments, forwards them for progressive display and normalizes the result.
 */
class ResponseAggregator {
public:
    /** @brief Receives each fragment and the normalized text accumulated so far. */
    using Observer = std::function<void(const domain::Fragment& fragment, const std::string& progress)>;

    static constexpr const char* kOpeningMarker = "```cpp";
    static constexpr const char* kClosingMarker = "```";

    /**
     * @brief Consumes @p stream and builds the result.
     * @param stream Single-use stream returned by a gateway.
     * @param backend Backend that produced the stream.
     * @param observer Optional progressive-display callback.
     * @throws domain::RequestError when the call fails or yields no text.
     */
    domain::ConversionResult aggregate(domain::FragmentStream& stream,
                                       domain::Backend backend,
                                       const Observer& observer = nullptr) const;

    /**
     * @brief Strips every occurrence of the fence markers, then trims whitespace.
     *
     * Text without markers passes through trimmed; nothing is validated.
     */
    static std::string Normalize(const std::string& rawText);

    static FenceReport Inspect(const std::string& rawText);
};

} // namespace codeshift::application
