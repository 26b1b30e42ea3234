/**
 * @file ResponseAggregator.cpp
 * @brief Implementation of ResponseAggregator.
 */
#include "application/ResponseAggregator.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"
#include <cstring>

namespace codeshift::application {

using infrastructure::Logger;

namespace {

void RemoveAll(std::string& text, const std::string& marker) {
    std::size_t pos = 0;
    while ((pos = text.find(marker, pos)) != std::string::npos) {
        text.erase(pos, marker.size());
        // Erasing can splice a new occurrence that starts before pos.
        pos = pos >= marker.size() - 1 ? pos - (marker.size() - 1) : 0;
    }
}

std::string Trim(const std::string& text) {
    const char* ws = " \t\r\n\f\v";
    auto first = text.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

} // namespace

std::string ResponseAggregator::Normalize(const std::string& rawText) {
    std::string code = rawText;
    RemoveAll(code, kOpeningMarker);
    RemoveAll(code, kClosingMarker);
    return Trim(code);
}

FenceReport ResponseAggregator::Inspect(const std::string& rawText) {
    FenceReport report;
    auto opening = rawText.find(kOpeningMarker);
    report.hasOpening = opening != std::string::npos;

    std::size_t searchFrom = report.hasOpening ? opening + std::strlen(kOpeningMarker) : 0;
    report.hasClosing = rawText.find(kClosingMarker, searchFrom) != std::string::npos;
    return report;
}

domain::ConversionResult ResponseAggregator::aggregate(domain::FragmentStream& stream,
                                                       domain::Backend backend,
                                                       const Observer& observer) const {
    std::string raw;
    stream.consume([&raw, &observer](const domain::Fragment& fragment) {
        raw += fragment.text;
        if (observer) observer(fragment, Normalize(raw));
    });

    if (raw.empty()) {
        throw domain::RequestError(domain::RequestError::Kind::MalformedResponse,
                                   domain::BackendDisplayName(backend) + " returned no text.");
    }

    FenceReport fences = Inspect(raw);
    if (!fences.wellFormed()) {
        Logger::Debug("ResponseAggregator", "Reply from " + domain::BackendDisplayName(backend) +
                                            " has no complete code fence; passing text through.");
    }

    domain::ConversionResult result;
    result.rawText = std::move(raw);
    result.normalizedCode = Normalize(result.rawText);
    result.backend = backend;
    result.producedAt = std::chrono::system_clock::now();
    return result;
}

} // namespace codeshift::application
