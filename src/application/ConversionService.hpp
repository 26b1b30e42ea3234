/**
 * @file ConversionService.hpp
 * @brief Orchestrates one conversion-and-verify cycle.
 */

#pragma once

#include "application/CompileExecuteSandbox.hpp"
#include "application/ResponseAggregator.hpp"
#include "domain/ProviderGateway.hpp"
#include "infrastructure/ArtifactStore.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codeshift::application {

/**
 * @enum ConversionStage
 * @brief States of a single cycle. CompileFailed, RuntimeFailed, Completed and Failed are terminal.
 */
enum class ConversionStage {
    Idle,
    Submitted,
    Streaming,
    Waiting,
    Aggregated,
    Persisted,
    Compiling,
    CompileFailed,
    Compiled,
    Executing,
    RuntimeFailed,
    Completed,
    Failed
};

std::string StageToString(ConversionStage stage);

/**
 * @struct ConversionReport
 * @brief Everything produced by one cycle. sandbox is set only when verification ran.
 */
struct ConversionReport {
    domain::ConversionResult result;
    domain::ArtifactRecord artifact;
    std::optional<SandboxReport> sandbox;
};

/**
 * @class ConversionService
 * @brief Runs gateway -> aggregator -> store -> sandbox, one request at a time.
 *
 * Gateways are owned by the caller and must outlive the service.
 */
class ConversionService {
public:
    using StageObserver = std::function<void(domain::Backend, ConversionStage)>;

    ConversionService(std::vector<domain::ProviderGateway*> gateways,
                      infrastructure::ArtifactStore& store,
                      const CompileExecuteSandbox& sandbox,
                      StageObserver stageObserver = nullptr);

    /**
     * @brief Submits @p request and aggregates the reply.
     * @throws domain::RequestError on any backend failure.
     */
    domain::ConversionResult convert(const domain::ConversionRequest& request,
                                     const ResponseAggregator::Observer& observer = nullptr);

    /** @brief convert() and write the normalized code to the artifact store. */
    domain::ArtifactRecord convertAndPersist(const domain::ConversionRequest& request,
                                             const ResponseAggregator::Observer& observer = nullptr);

    /** @brief Full cycle including compile and run of the artifact. */
    ConversionReport convertAndVerify(const domain::ConversionRequest& request,
                                      const ResponseAggregator::Observer& observer = nullptr);

    /**
     * @brief Runs every backend of @p selection in order.
     *
     * The first failure propagates and later backends are not attempted.
     */
    std::vector<ConversionReport> convertSelection(const std::string& sourceText,
                                                   domain::BackendSelection selection,
                                                   int maxOutputTokens,
                                                   bool verify,
                                                   const ResponseAggregator::Observer& observer = nullptr);

    ConversionStage stage() const { return m_stage; }

    bool hasGateway(domain::Backend backend) const;

private:
    domain::ProviderGateway& gatewayFor(domain::Backend backend) const;
    void setStage(domain::Backend backend, ConversionStage stage);
    ConversionReport runCycle(const domain::ConversionRequest& request,
                              const ResponseAggregator::Observer& observer,
                              bool verify);

    std::map<domain::Backend, domain::ProviderGateway*> m_gateways;
    infrastructure::ArtifactStore& m_store;
    const CompileExecuteSandbox& m_sandbox;
    ResponseAggregator m_aggregator;
    StageObserver m_stageObserver;
    ConversionStage m_stage = ConversionStage::Idle;
};

} // namespace codeshift::application
