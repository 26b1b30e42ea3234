#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>
#include <string>
#include <vector>

#include "application/ConversionService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace codeshift;
using application::CompileExecuteSandbox;
using application::ConversionService;
using application::ConversionStage;
using application::ToolchainSettings;
namespace fs = std::filesystem;

namespace {

/// Replays canned fragments, or fails, without any network access.
class FakeGateway : public domain::ProviderGateway {
public:
    FakeGateway(domain::Backend backend, std::vector<std::string> fragments)
        : m_backend(backend), m_fragments(std::move(fragments)) {}

    domain::Backend backend() const override { return m_backend; }

    domain::FragmentStream submit(const domain::ConversionRequest& request) override {
        ++submissions;
        lastMaxTokens = request.maxOutputTokens();
        auto fragments = m_fragments;
        bool fail = failWith.has_value();
        auto kind = failWith.value_or(domain::RequestError::Kind::Backend);
        return domain::FragmentStream([fragments, fail, kind](const domain::FragmentStream::Sink& sink) {
            for (const auto& text : fragments) {
                sink(domain::Fragment{text});
            }
            if (fail) {
                throw domain::RequestError(kind, "HTTP Error 500: fake failure");
            }
        });
    }

    int submissions = 0;
    int lastMaxTokens = 0;
    std::optional<domain::RequestError::Kind> failWith;

private:
    domain::Backend m_backend;
    std::vector<std::string> m_fragments;
};

struct StageLog {
    std::vector<std::pair<domain::Backend, ConversionStage>> entries;

    ConversionService::StageObserver observer() {
        return [this](domain::Backend backend, ConversionStage stage) { entries.emplace_back(backend, stage); };
    }

    std::vector<ConversionStage> stagesFor(domain::Backend backend) const {
        std::vector<ConversionStage> stages;
        for (const auto& entry : entries) {
            if (entry.first == backend) stages.push_back(entry.second);
        }
        return stages;
    }
};

const std::string kProgram =
    "```cpp\n#include <iostream>\nint main() { std::cout << 15; return 0; }\n```";

ToolchainSettings Toolchain(const fs::path& root, const std::string& compiler) {
    ToolchainSettings settings;
    settings.compiler = compiler;
    settings.workDir = root;
    settings.compileLimits.timeout = std::chrono::milliseconds(120000);
    settings.runLimits.timeout = std::chrono::milliseconds(5000);
    return settings;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConversionService Test..." << std::endl;

    fs::path root = infrastructure::PathUtils::MakeTempPath("codeshift_service_", "");
    fs::create_directories(root);
    infrastructure::ArtifactStore store(root / "generated");

    std::cout << "[Test] Persist flow and stage order..." << std::endl;
    {
        FakeGateway gpt(domain::Backend::Gpt, {"```cpp\n", "int main()", "{}", "\n```"});
        FakeGateway claude(domain::Backend::Claude, {"```cpp\nint main(){return 0;}\n```"});
        CompileExecuteSandbox sandbox(Toolchain(root, "true"), infrastructure::ProcessRunner());
        StageLog log;
        ConversionService service({&gpt, &claude}, store, sandbox, log.observer());
        assert(service.stage() == ConversionStage::Idle);

        std::vector<std::string> progress;
        auto artifact = service.convertAndPersist(
            domain::ConversionRequest("print(1)", domain::Backend::Gpt, 321),
            [&progress](const domain::Fragment&, const std::string& soFar) { progress.push_back(soFar); });

        assert(artifact.code == "int main(){}");
        assert(store.read(domain::Backend::Gpt).value() == "int main(){}");
        assert(progress.size() == 4);
        assert((log.stagesFor(domain::Backend::Gpt) == std::vector<ConversionStage>{
            ConversionStage::Submitted, ConversionStage::Streaming,
            ConversionStage::Aggregated, ConversionStage::Persisted}));
        assert(service.stage() == ConversionStage::Persisted);

        service.convertAndPersist(domain::ConversionRequest("print(1)", domain::Backend::Claude, 321));
        assert(claude.lastMaxTokens == 321);
        assert(log.stagesFor(domain::Backend::Claude)[1] == ConversionStage::Waiting);
    }

    std::cout << "[Test] Backend failure aborts the remaining selection..." << std::endl;
    {
        FakeGateway gpt(domain::Backend::Gpt, {"int "});
        gpt.failWith = domain::RequestError::Kind::Backend;
        FakeGateway claude(domain::Backend::Claude, {"int main(){}"});
        CompileExecuteSandbox sandbox(Toolchain(root, "true"), infrastructure::ProcessRunner());
        StageLog log;
        ConversionService service({&gpt, &claude}, store, sandbox, log.observer());

        auto before = store.read(domain::Backend::Gpt);
        bool threw = false;
        try {
            service.convertSelection("print(1)", domain::BackendSelection::Both, 100, false);
        } catch (const domain::RequestError& e) {
            threw = e.kind() == domain::RequestError::Kind::Backend;
        }
        assert(threw);
        assert(gpt.submissions == 1);
        assert(claude.submissions == 0);
        assert(service.stage() == ConversionStage::Failed);
        assert(log.stagesFor(domain::Backend::Gpt).back() == ConversionStage::Failed);
        assert(store.read(domain::Backend::Gpt) == before && "A failed request must not touch the artifact.");
    }

    std::cout << "[Test] Both backends run in order..." << std::endl;
    {
        FakeGateway gpt(domain::Backend::Gpt, {"// gpt"});
        FakeGateway claude(domain::Backend::Claude, {"// claude"});
        CompileExecuteSandbox sandbox(Toolchain(root, "true"), infrastructure::ProcessRunner());
        StageLog log;
        ConversionService service({&gpt, &claude}, store, sandbox, log.observer());

        auto reports = service.convertSelection("print(1)", domain::BackendSelection::Both, 100, false);
        assert(reports.size() == 2);
        assert(reports[0].result.backend == domain::Backend::Gpt);
        assert(reports[1].result.backend == domain::Backend::Claude);
        assert(!reports[0].sandbox.has_value());
        assert(log.entries.front().first == domain::Backend::Gpt);
        assert(log.entries.back().first == domain::Backend::Claude);
    }

    std::cout << "[Test] Unregistered backend..." << std::endl;
    {
        FakeGateway gpt(domain::Backend::Gpt, {"x"});
        CompileExecuteSandbox sandbox(Toolchain(root, "true"), infrastructure::ProcessRunner());
        ConversionService service({&gpt}, store, sandbox);
        assert(service.hasGateway(domain::Backend::Gpt));
        assert(!service.hasGateway(domain::Backend::Claude));
        bool threw = false;
        try {
            service.convert(domain::ConversionRequest("x", domain::Backend::Claude, 10));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[Test] Compile failure is a terminal stage, not an error..." << std::endl;
    {
        FakeGateway gpt(domain::Backend::Gpt, {kProgram});
        CompileExecuteSandbox sandbox(Toolchain(root, "codeshift-no-such-compiler"), infrastructure::ProcessRunner());
        StageLog log;
        ConversionService service({&gpt}, store, sandbox, log.observer());

        auto report = service.convertAndVerify(domain::ConversionRequest("print(15)", domain::Backend::Gpt, 10));
        assert(report.sandbox.has_value());
        assert(!report.sandbox->compile.success);
        assert(!report.sandbox->execution.has_value());
        assert(service.stage() == ConversionStage::CompileFailed);
        auto stages = log.stagesFor(domain::Backend::Gpt);
        assert(stages[stages.size() - 2] == ConversionStage::Compiling);
    }

    std::cout << "[Test] Missing binary is a runtime failure..." << std::endl;
    {
        // "true" accepts any arguments and produces no binary.
        FakeGateway gpt(domain::Backend::Gpt, {kProgram});
        ToolchainSettings settings = Toolchain(root, "true");
        settings.binaryName = "never_built";
        CompileExecuteSandbox sandbox(settings, infrastructure::ProcessRunner());
        StageLog log;
        ConversionService service({&gpt}, store, sandbox, log.observer());

        auto report = service.convertAndVerify(domain::ConversionRequest("print(15)", domain::Backend::Gpt, 10));
        assert(report.sandbox->compile.success);
        assert(report.sandbox->execution.has_value());
        assert(report.sandbox->execution->exitCode != 0);
        assert(service.stage() == ConversionStage::RuntimeFailed);
        assert((log.stagesFor(domain::Backend::Gpt) == std::vector<ConversionStage>{
            ConversionStage::Submitted, ConversionStage::Streaming, ConversionStage::Aggregated,
            ConversionStage::Persisted, ConversionStage::Compiling, ConversionStage::Compiled,
            ConversionStage::Executing, ConversionStage::RuntimeFailed}));
    }

    ToolchainSettings defaults;
    if (infrastructure::PathUtils::IsOnPath(defaults.compiler)) {
        std::cout << "[Test] Full cycle with the native toolchain..." << std::endl;
        FakeGateway gpt(domain::Backend::Gpt, {kProgram});
        CompileExecuteSandbox sandbox(Toolchain(root, defaults.compiler), infrastructure::ProcessRunner());
        ConversionService service({&gpt}, store, sandbox);

        auto report = service.convertAndVerify(domain::ConversionRequest("print(15)", domain::Backend::Gpt, 10));
        assert(report.sandbox->succeeded());
        assert(report.sandbox->execution->stdoutText == "15");
        assert(service.stage() == ConversionStage::Completed);
    } else {
        std::cout << "[SKIP] No C++ compiler on PATH; full cycle skipped." << std::endl;
    }

    std::error_code ec;
    fs::remove_all(root, ec);

    std::cout << "[PASS] ConversionService Test." << std::endl;
    return 0;
}
