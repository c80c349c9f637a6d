#ifndef RUNSTREAM_EVENT_TRANSLATOR_HPP
#define RUNSTREAM_EVENT_TRANSLATOR_HPP

#include <runstream/channel.hpp>
#include <runstream/run_log.hpp>
#include <runstream/run_shape.hpp>
#include <runstream/stream_event.hpp>
#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace runstream {

// A producer flushed more (or fewer) than one chunk between two patches
class InvariantViolation : public RunStreamError {
public:
    explicit InvariantViolation(const std::string& message)
        : RunStreamError("Invariant violation: " + message) {}
};

struct TranslatorOptions {
    // Categories whose inputs/outputs are not wrapped in {"input"}/{"output"}
    std::vector<std::string> legacy_types{"retriever", "tool", "llm"};
};

enum class RunPhase : uint8_t {
    Pending,    // not yet seen with an id
    Running,    // start emitted, no chunk surfaced yet
    Streaming,  // at least one chunk surfaced
    Ended       // end emitted, further patches ignored
};

const char* run_phase_name(RunPhase phase);

/**
 * Derives lifecycle events from a sequence of run-log patches.
 *
 * One translator owns the cumulative run state of one session. Each call
 * to process() applies a patch batch and returns the events it caused;
 * finish() closes the session with the root end event.
 *
 * Sub-runs touched by the same batch are reported in first-touch order,
 * which callers must not rely on; batches are reported in arrival order.
 */
class EventTranslator {
public:
    explicit EventTranslator(TranslatorOptions options = {});

    // Throws InvariantViolation or PatchError; the session is unusable afterwards
    std::vector<StreamEvent> process(const RunLogPatch& patch);

    // Root end event; exactly once
    StreamEvent finish();

    const RunLog& run_log() const { return run_log_; }
    RunPhase phase_of(const std::string& segment) const;
    bool root_started() const { return root_started_; }
    bool finished() const { return finished_; }
    size_t patches_processed() const { return patches_processed_; }

private:
    std::vector<std::string> touched_segments(const RunLogPatch& patch) const;
    void emit_root_start(std::vector<StreamEvent>& out);
    void emit_sub_run(const std::string& segment, std::vector<StreamEvent>& out);
    void emit_root_stream(std::vector<StreamEvent>& out);
    void ensure_usable() const;

    TranslatorOptions options_;
    RunLog run_log_;
    std::unordered_map<std::string, RunPhase> phases_;
    size_t patches_processed_{0};
    bool root_started_{false};
    bool finished_{false};
    bool failed_{false};
};

/**
 * Lazily translates an upstream patch source: a patch is pulled only when
 * the consumer asks for an event that is not already buffered.
 *
 * Ends with the root end event. On failure the error is thrown once and
 * the stream then reports exhaustion. cancel() is forwarded upstream.
 */
class EventStream : public Source<StreamEvent> {
public:
    explicit EventStream(Source<RunLogPatch>& patches, TranslatorOptions options = {});

    std::optional<StreamEvent> next() override;
    void cancel() override;

    const EventTranslator& translator() const { return translator_; }

private:
    enum class State : uint8_t {
        Open,
        Finished,
        Failed,
        Cancelled
    };

    Source<RunLogPatch>& patches_;
    EventTranslator translator_;
    std::deque<StreamEvent> pending_;
    std::atomic<State> state_{State::Open};
};

std::unique_ptr<EventStream> as_event_stream(Source<RunLogPatch>& patches,
                                             TranslatorOptions options = {});

// Whole-sequence convenience: every event, root end included
std::vector<StreamEvent> collect_events(const std::vector<RunLogPatch>& patches,
                                        TranslatorOptions options = {});

} // namespace runstream

#endif // RUNSTREAM_EVENT_TRANSLATOR_HPP
