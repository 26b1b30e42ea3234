#include <CLI/CLI.hpp>

#include <iostream>
#include <map>
#include <string>

#include "app/CodeShiftApp.hpp"
#include "domain/CancellationToken.hpp"
#include "infrastructure/InterruptHandler.hpp"

using namespace codeshift;

int main(int argc, char** argv) {
    CLI::App cli{"Convert Python code to optimized C++ with GPT or Claude, then build and run it."};
    cli.name("codeshift");

    app::CliOptions options;

    auto* input = cli.add_option_group("input", "Python source to convert");
    input->add_option("-f,--file", options.file, "Path to a Python source file")->check(CLI::ExistingFile);
    input->add_option("-c,--code", options.code, "Inline Python code");
    input->require_option(1);

    const std::map<std::string, domain::BackendSelection> models{
        {"gpt", domain::BackendSelection::Gpt},
        {"claude", domain::BackendSelection::Claude},
        {"both", domain::BackendSelection::Both},
    };
    cli.add_option("-m,--model", options.selection, "Backend to use: gpt, claude or both")
        ->transform(CLI::CheckedTransformer(models, CLI::ignore_case))
        ->default_str("gpt");

    cli.add_option("--max-tokens", options.maxTokens, "Maximum output tokens (Claude only, default 2000)")
        ->check(CLI::PositiveNumber);
    cli.add_flag("-v,--verbose", options.verbose, "Verbose logging");
    cli.add_flag("--run", options.run, "Compile and run the generated C++");
    cli.add_flag("--reference", options.reference, "Run the original Python code for comparison");
    cli.add_option("--config", options.configPath, "Path to settings.json");

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli.exit(e) == 0 ? 0 : 1;
    }

    domain::CancellationToken cancel;
    infrastructure::InterruptHandler::Install(cancel);

    int exitCode = 1;
    try {
        app::CodeShiftApp codeShift(cancel);
        exitCode = codeShift.Run(options);
    } catch (const std::exception& e) {
        std::cerr << "[main] Unhandled error: " << e.what() << std::endl;
        exitCode = 1;
    }

    infrastructure::InterruptHandler::Uninstall();
    return exitCode;
}
