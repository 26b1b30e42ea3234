#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/ResponseAggregator.hpp"
#include "domain/Errors.hpp"
#include "domain/FragmentStream.hpp"

using namespace codeshift;
using application::ResponseAggregator;

namespace {

domain::FragmentStream MakeStream(std::vector<std::string> chunks, int* calls = nullptr) {
    return domain::FragmentStream([chunks, calls](const domain::FragmentStream::Sink& sink) {
        if (calls) ++*calls;
        for (const auto& chunk : chunks) {
            sink(domain::Fragment{chunk});
        }
    });
}

} // namespace

int main() {
    std::cout << "[Test] Starting ResponseAggregator Test..." << std::endl;
    ResponseAggregator aggregator;

    // Lazy: nothing runs before consume().
    {
        int calls = 0;
        auto stream = MakeStream({"a"}, &calls);
        assert(calls == 0);
        assert(!stream.consumed());
        stream.consume(nullptr);
        assert(calls == 1);
        assert(stream.consumed());

        bool threw = false;
        try {
            stream.consume(nullptr);
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw && "A consumed stream must not restart.");
        assert(calls == 1);
    }

    // Fragments arrive in order with sequence numbers; observer sees normalized progress.
    {
        auto stream = MakeStream({"```cpp\n", "int main()", "{return 0;}", "\n```"});
        std::vector<std::size_t> sequences;
        std::vector<std::string> texts;
        std::vector<std::string> progress;

        auto result = aggregator.aggregate(stream, domain::Backend::Gpt,
            [&](const domain::Fragment& fragment, const std::string& soFar) {
                sequences.push_back(fragment.sequence);
                texts.push_back(fragment.text);
                progress.push_back(soFar);
            });

        assert((sequences == std::vector<std::size_t>{0, 1, 2, 3}));
        assert(texts[1] == "int main()");
        assert(progress[1] == "int main()");
        assert(progress.back() == "int main(){return 0;}");
        assert(result.rawText == "```cpp\nint main(){return 0;}\n```");
        assert(result.normalizedCode == "int main(){return 0;}");
        assert(result.backend == domain::Backend::Gpt);
        assert(result.producedAt.time_since_epoch().count() > 0);
    }

    // Single-shot style: exactly one fragment.
    {
        auto stream = MakeStream({"int main(){}"});
        int observed = 0;
        auto result = aggregator.aggregate(stream, domain::Backend::Claude,
            [&](const domain::Fragment&, const std::string&) { ++observed; });
        assert(observed == 1);
        assert(result.normalizedCode == "int main(){}");
        assert(result.backend == domain::Backend::Claude);
    }

    // Failure mid-stream propagates; no result is produced.
    {
        domain::FragmentStream stream([](const domain::FragmentStream::Sink& sink) {
            sink(domain::Fragment{"int "});
            throw domain::RequestError(domain::RequestError::Kind::Transport, "connection reset");
        });
        std::string lastProgress;
        bool threw = false;
        try {
            aggregator.aggregate(stream, domain::Backend::Gpt,
                [&](const domain::Fragment&, const std::string& soFar) { lastProgress = soFar; });
        } catch (const domain::RequestError& e) {
            threw = e.kind() == domain::RequestError::Kind::Transport;
        }
        assert(threw);
        assert(lastProgress == "int");
    }

    // An empty reply is a malformed response.
    {
        auto stream = MakeStream({});
        bool threw = false;
        try {
            aggregator.aggregate(stream, domain::Backend::Claude);
        } catch (const domain::RequestError& e) {
            threw = e.kind() == domain::RequestError::Kind::MalformedResponse;
        }
        assert(threw);
    }

    std::cout << "[PASS] ResponseAggregator Test." << std::endl;
    return 0;
}
