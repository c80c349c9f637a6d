/**
 * Event Stream Usage Example
 *
 * Demonstrates turning run-log patches into lifecycle events:
 * - Feeding patches from a producer thread through a bounded channel
 * - Pulling events lazily from the translator
 * - Folding streamed chunks back into one value
 */

#include <runstream/accumulate.hpp>
#include <runstream/channel.hpp>
#include <runstream/event_translator.hpp>
#include <iostream>
#include <thread>
#include <vector>

using namespace runstream;

namespace {

std::vector<RunLogPatch> build_session() {
    std::vector<RunLogPatch> patches;
    patches.push_back(RunLogPatch{PatchOp::replace("", ValueObject{
        {"id", "run-1"},
        {"name", "RunnableSequence"},
        {"type", "chain"},
        {"streamed_output", ValueList{}},
        {"final_output", nullptr},
        {"logs", ValueObject{}}
    })});
    patches.push_back(RunLogPatch{PatchOp::add("/logs/ChatModel", ValueObject{
        {"id", "run-2"},
        {"name", "ChatModel"},
        {"type", "llm"},
        {"tags", ValueList{"seq:step:1"}},
        {"inputs", ValueObject{{"prompts", ValueList{"Tell me a joke"}}}},
        {"streamed_output", ValueList{}},
        {"end_time", nullptr}
    })});

    for (const char* token : {"Why ", "did ", "the ", "chicken..."}) {
        patches.push_back(RunLogPatch{PatchOp::add("/logs/ChatModel/streamed_output/-", token)});
        patches.push_back(RunLogPatch{PatchOp::add("/streamed_output/-", token)});
    }

    patches.push_back(RunLogPatch{
        PatchOp::add("/logs/ChatModel/final_output", ValueObject{{"generations", ValueList{"Why did the chicken..."}}}),
        PatchOp::add("/logs/ChatModel/end_time", "2024-01-01T00:00:02")
    });
    patches.push_back(RunLogPatch{PatchOp::replace("/final_output", ValueObject{{"output", "Why did the chicken..."}})});
    return patches;
}

} // anonymous namespace

int main() {
    std::cout << "=== Event Stream Usage Example ===\n\n";

    // Example 1: Producer thread feeding a bounded channel
    std::cout << "=== Example 1: Streaming Translation ===\n";
    Channel<RunLogPatch> patches(2);

    std::thread tracer([&patches]() {
        for (auto& patch : build_session()) {
            if (!patches.push(std::move(patch))) {
                return;  // consumer went away
            }
        }
        patches.close();
    });

    std::vector<Value> root_chunks;
    auto stream = as_event_stream(patches);
    try {
        while (auto event = stream->next()) {
            std::cout << format_event(*event, "  ") << "\n";
            if (event->event == "on_chain_stream") {
                root_chunks.push_back(event->data.at("chunk"));
            }
        }
    } catch (const RunStreamError& e) {
        std::cerr << "Translation failed: " << e.what() << "\n";
        stream->cancel();
        tracer.join();
        return 1;
    }
    tracer.join();

    // Example 2: Folding streamed chunks
    std::cout << "\n=== Example 2: Accumulated Output ===\n";
    std::cout << "Streamed text: " << accumulate(root_chunks).to_string() << "\n";

    Value merged = accumulate(std::vector<Value>{
        Value(ValueObject{{"answer", "4"}}),
        Value(ValueObject{{"answer", "2"}, {"sources", ValueList{"doc1"}}})
    });
    std::cout << "Merged partials: " << merged.to_string() << "\n";

    // Example 3: Invariant violation from a misbehaving producer
    std::cout << "\n=== Example 3: Fatal Producer Bug ===\n";
    EventTranslator translator;
    translator.process(RunLogPatch{PatchOp::add("/logs/a/id", "run-3")});
    try {
        translator.process(RunLogPatch{
            PatchOp::add("/logs/a/streamed_output/-", "one"),
            PatchOp::add("/logs/a/streamed_output/-", "two")
        });
    } catch (const InvariantViolation& e) {
        std::cout << "Caught: " << e.what() << "\n";
    }

    return 0;
}
