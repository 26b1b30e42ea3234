/**
 * @file ConversionService.cpp
 * @brief Implementation of ConversionService.
 */
#include "application/ConversionService.hpp"
#include "infrastructure/Logger.hpp"
#include <stdexcept>

namespace codeshift::application {

using infrastructure::Logger;

std::string StageToString(ConversionStage stage) {
    switch (stage) {
        case ConversionStage::Idle: return "Idle";
        case ConversionStage::Submitted: return "Submitted";
        case ConversionStage::Streaming: return "Streaming";
        case ConversionStage::Waiting: return "Waiting";
        case ConversionStage::Aggregated: return "Aggregated";
        case ConversionStage::Persisted: return "Persisted";
        case ConversionStage::Compiling: return "Compiling";
        case ConversionStage::CompileFailed: return "CompileFailed";
        case ConversionStage::Compiled: return "Compiled";
        case ConversionStage::Executing: return "Executing";
        case ConversionStage::RuntimeFailed: return "RuntimeFailed";
        case ConversionStage::Completed: return "Completed";
        case ConversionStage::Failed: return "Failed";
    }
    return "Idle";
}

ConversionService::ConversionService(std::vector<domain::ProviderGateway*> gateways,
                                     infrastructure::ArtifactStore& store,
                                     const CompileExecuteSandbox& sandbox,
                                     StageObserver stageObserver)
    : m_store(store), m_sandbox(sandbox), m_stageObserver(std::move(stageObserver)) {
    for (auto* gateway : gateways) {
        if (gateway) {
            m_gateways[gateway->backend()] = gateway;
        }
    }
}

bool ConversionService::hasGateway(domain::Backend backend) const {
    return m_gateways.count(backend) > 0;
}

domain::ProviderGateway& ConversionService::gatewayFor(domain::Backend backend) const {
    auto it = m_gateways.find(backend);
    if (it == m_gateways.end()) {
        throw std::invalid_argument("No gateway registered for " + domain::BackendDisplayName(backend));
    }
    return *it->second;
}

void ConversionService::setStage(domain::Backend backend, ConversionStage stage) {
    m_stage = stage;
    Logger::Debug("ConversionService", domain::BackendDisplayName(backend) + ": " + StageToString(stage));
    if (m_stageObserver) m_stageObserver(backend, stage);
}

domain::ConversionResult ConversionService::convert(const domain::ConversionRequest& request,
                                                    const ResponseAggregator::Observer& observer) {
    const domain::Backend backend = request.backend();
    domain::ProviderGateway& gateway = gatewayFor(backend);

    setStage(backend, ConversionStage::Submitted);
    try {
        domain::FragmentStream stream = gateway.submit(request);
        setStage(backend, backend == domain::Backend::Gpt ? ConversionStage::Streaming : ConversionStage::Waiting);
        domain::ConversionResult result = m_aggregator.aggregate(stream, backend, observer);
        setStage(backend, ConversionStage::Aggregated);
        return result;
    } catch (const std::exception& e) {
        Logger::Error("ConversionService", domain::BackendDisplayName(backend) + " request failed: " + e.what());
        setStage(backend, ConversionStage::Failed);
        throw;
    }
}

domain::ArtifactRecord ConversionService::convertAndPersist(const domain::ConversionRequest& request,
                                                            const ResponseAggregator::Observer& observer) {
    return runCycle(request, observer, false).artifact;
}

ConversionReport ConversionService::convertAndVerify(const domain::ConversionRequest& request,
                                                     const ResponseAggregator::Observer& observer) {
    return runCycle(request, observer, true);
}

ConversionReport ConversionService::runCycle(const domain::ConversionRequest& request,
                                             const ResponseAggregator::Observer& observer,
                                             bool verify) {
    const domain::Backend backend = request.backend();

    ConversionReport report;
    report.result = convert(request, observer);

    try {
        report.artifact = m_store.write(report.result.normalizedCode, backend);
    } catch (const std::exception&) {
        setStage(backend, ConversionStage::Failed);
        throw;
    }
    setStage(backend, ConversionStage::Persisted);

    if (!verify) {
        return report;
    }

    setStage(backend, ConversionStage::Compiling);
    SandboxReport sandbox;
    try {
        sandbox.compile = m_sandbox.compile(report.artifact.path);
        if (!sandbox.compile.success) {
            setStage(backend, ConversionStage::CompileFailed);
            report.sandbox = std::move(sandbox);
            return report;
        }
        setStage(backend, ConversionStage::Compiled);

        setStage(backend, ConversionStage::Executing);
        sandbox.execution = m_sandbox.execute();
    } catch (const std::exception& e) {
        Logger::Error("ConversionService", std::string("Sandbox failed: ") + e.what());
        setStage(backend, ConversionStage::Failed);
        throw;
    }
    setStage(backend, sandbox.execution->exitCode == 0 ? ConversionStage::Completed
                                                       : ConversionStage::RuntimeFailed);
    report.sandbox = std::move(sandbox);
    return report;
}

std::vector<ConversionReport> ConversionService::convertSelection(const std::string& sourceText,
                                                                  domain::BackendSelection selection,
                                                                  int maxOutputTokens,
                                                                  bool verify,
                                                                  const ResponseAggregator::Observer& observer) {
    std::vector<ConversionReport> reports;
    for (domain::Backend backend : domain::ExpandSelection(selection)) {
        domain::ConversionRequest request(sourceText, backend, maxOutputTokens);
        reports.push_back(runCycle(request, observer, verify));
    }
    return reports;
}

} // namespace codeshift::application
