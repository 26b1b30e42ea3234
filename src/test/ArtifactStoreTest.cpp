#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "domain/Errors.hpp"
#include "infrastructure/ArtifactStore.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace codeshift;
using infrastructure::ArtifactStore;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting ArtifactStore Test..." << std::endl;

    fs::path root = infrastructure::PathUtils::MakeTempPath("codeshift_store_", "");
    ArtifactStore store(root / "nested" / "generated");

    // Paths depend only on the backend.
    assert(store.pathFor(domain::Backend::Gpt) == root / "nested" / "generated" / "optimized_gpt.cpp");
    assert(store.pathFor(domain::Backend::Claude).filename() == "optimized_claude.cpp");
    assert(!store.read(domain::Backend::Gpt).has_value());

    // Directory creation is idempotent.
    store.ensureDirectory();
    store.ensureDirectory();
    assert(fs::is_directory(store.baseDir()));

    // Overwrite semantics: the second write for a backend replaces the first.
    auto first = store.write("int main(){return 1;}", domain::Backend::Gpt);
    auto second = store.write("int main(){return 0;}", domain::Backend::Gpt);
    assert(first.path == second.path);
    assert(second.backend == domain::Backend::Gpt);
    assert(second.code == "int main(){return 0;}");
    assert(store.read(domain::Backend::Gpt).value() == "int main(){return 0;}");

    // Backends never share a file.
    auto claude = store.write("// claude", domain::Backend::Claude);
    assert(claude.path != second.path);
    assert(store.read(domain::Backend::Gpt).value() == "int main(){return 0;}");

    // No temp files are left behind.
    int files = 0;
    for (const auto& entry : fs::directory_iterator(store.baseDir())) {
        (void)entry;
        ++files;
    }
    assert(files == 2);

    // A base path that is a regular file cannot become a directory.
    fs::path blocker = root / "blocker";
    { std::ofstream(blocker) << "x"; }
    ArtifactStore broken(blocker / "generated");
    bool threw = false;
    try {
        broken.write("int main(){}", domain::Backend::Gpt);
    } catch (const domain::ArtifactError&) {
        threw = true;
    }
    assert(threw);

    std::error_code ec;
    fs::remove_all(root, ec);

    std::cout << "[PASS] ArtifactStore Test." << std::endl;
    return 0;
}
