#include <cassert>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

extern "C" {
#include <sys/stat.h>
#include <unistd.h>
}

#include "application/ReferenceSandbox.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include "infrastructure/PythonScriptEvaluator.hpp"
#include "infrastructure/StdoutCapture.hpp"

using namespace codeshift;
using application::ReferenceSandbox;

namespace {

/// Writes through every stdout layer, then optionally fails.
class ScriptedEvaluator : public domain::ScriptEvaluator {
public:
    explicit ScriptedEvaluator(bool fail) : m_fail(fail) {}

    void evaluate(const std::string& sourceText) override {
        std::cout << "cout:" << sourceText << "\n";
        std::printf("printf;");
        ssize_t ignored = ::write(STDOUT_FILENO, "raw", 3);
        (void)ignored;
        if (m_fail) {
            throw std::runtime_error("division by zero");
        }
    }

private:
    bool m_fail;
};

class OddThrowEvaluator : public domain::ScriptEvaluator {
public:
    void evaluate(const std::string&) override { throw 42; }
};

struct FdIdentity {
    dev_t dev;
    ino_t ino;
};

FdIdentity StdoutIdentity() {
    std::cout.flush();
    std::fflush(stdout);
    struct stat st;
    int rc = ::fstat(STDOUT_FILENO, &st);
    assert(rc == 0);
    (void)rc;
    return {st.st_dev, st.st_ino};
}

bool SameIdentity(const FdIdentity& a, const FdIdentity& b) {
    return a.dev == b.dev && a.ino == b.ino;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ReferenceSandbox Test..." << std::endl;
    const FdIdentity original = StdoutIdentity();

    std::cout << "[Test] Captures every write to stdout..." << std::endl;
    {
        ReferenceSandbox sandbox(std::make_shared<ScriptedEvaluator>(false));
        auto outcome = sandbox.evaluate("x");
        assert(!outcome.error.has_value());
        assert(outcome.stdoutText.find("cout:x\n") != std::string::npos);
        assert(outcome.stdoutText.find("printf;") != std::string::npos);
        assert(outcome.stdoutText.find("raw") != std::string::npos);
        assert(SameIdentity(original, StdoutIdentity()));
    }

    std::cout << "[Test] Failure is reported, never propagated, and stdout is restored..." << std::endl;
    {
        ReferenceSandbox sandbox(std::make_shared<ScriptedEvaluator>(true));
        auto outcome = sandbox.evaluate("1/0");
        assert(outcome.error.has_value());
        assert(outcome.error->rfind("Error: ", 0) == 0);
        assert(outcome.error->find("division by zero") != std::string::npos);
        assert(SameIdentity(original, StdoutIdentity()));
    }

    std::cout << "[Test] Non-standard exceptions are reported too..." << std::endl;
    {
        ReferenceSandbox sandbox(std::make_shared<OddThrowEvaluator>());
        auto outcome = sandbox.evaluate("");
        assert(outcome.error.has_value());
        assert(SameIdentity(original, StdoutIdentity()));
    }

    std::cout << "[Test] StdoutCapture restore is idempotent..." << std::endl;
    {
        infrastructure::StdoutCapture capture;
        assert(capture.active());
        std::printf("hidden");
        capture.restore();
        capture.restore();
        assert(!capture.active());
        assert(capture.text() == "hidden");
        assert(SameIdentity(original, StdoutIdentity()));
    }

    std::cout << "[Test] StdoutCapture uses the system temp directory..." << std::endl;
    {
        namespace fs = std::filesystem;
        const char* previous = std::getenv("TMPDIR");
        std::string saved = previous ? previous : "";

        fs::path customTmp = infrastructure::PathUtils::MakeTempPath("codeshift_tmpdir_", "");
        fs::create_directories(customTmp);
        ::setenv("TMPDIR", customTmp.c_str(), 1);
        {
            infrastructure::StdoutCapture capture;
            std::printf("in custom tmp");
            assert(capture.text() == "in custom tmp");
        }
        assert(SameIdentity(original, StdoutIdentity()));

        ::setenv("TMPDIR", (customTmp / "missing").c_str(), 1);
        bool threw = false;
        try {
            infrastructure::StdoutCapture capture;
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        assert(SameIdentity(original, StdoutIdentity()));

        if (previous) {
            ::setenv("TMPDIR", saved.c_str(), 1);
        } else {
            ::unsetenv("TMPDIR");
        }
        fs::remove_all(customTmp);
    }

    if (!infrastructure::PathUtils::IsOnPath("python3")) {
        std::cout << "[SKIP] python3 not on PATH; interpreter cases skipped." << std::endl;
        std::cout << "[PASS] ReferenceSandbox Test." << std::endl;
        return 0;
    }

    std::cout << "[Test] Python interpreter output is captured..." << std::endl;
    {
        infrastructure::ProcessLimits limits;
        limits.timeout = std::chrono::milliseconds(20000);
        auto evaluator = std::make_shared<infrastructure::PythonScriptEvaluator>(
            "python3", infrastructure::ProcessRunner(), limits);
        ReferenceSandbox sandbox(evaluator);

        auto ok = sandbox.evaluate("print(sum(range(6)))\n");
        assert(!ok.error.has_value());
        assert(ok.stdoutText == "15\n");

        auto failed = sandbox.evaluate("print('partial')\nprint(1/0)\n");
        assert(failed.error.has_value());
        assert(failed.error->find("ZeroDivisionError") != std::string::npos);
        assert(SameIdentity(original, StdoutIdentity()));
    }

    std::cout << "[PASS] ReferenceSandbox Test." << std::endl;
    return 0;
}
