#include "infrastructure/PromptCatalog.hpp"

namespace codeshift::infrastructure {

std::string PromptCatalog::GetSystemPrompt() {
    return
        "You are an assistant that reimplements Python code in high performance C++. "
        "Respond only with C++ code; use comments sparingly and do not provide any explanation "
        "other than occasional comments. "
        "The C++ response needs to produce an identical output in the fastest possible time.";
}

std::string PromptCatalog::GetUserPrompt(const std::string& sourceText) {
    return
        "Rewrite this Python code in C++ with the fastest possible implementation that produces "
        "identical output in the least time. "
        "Respond only with C++ code; do not explain your work other than a few comments. "
        "Pay attention to number types to ensure no int overflows. "
        "Remember to #include all necessary C++ headers such as iomanip.\n\n" + sourceText;
}

} // namespace codeshift::infrastructure
