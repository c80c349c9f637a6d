#include <runstream/event_translator.hpp>
#include <runstream/debug_log.hpp>
#include <stdexcept>
#include <unordered_set>

namespace runstream {

const char* run_phase_name(RunPhase phase) {
    switch (phase) {
        case RunPhase::Pending: return "pending";
        case RunPhase::Running: return "running";
        case RunPhase::Streaming: return "streaming";
        case RunPhase::Ended: return "ended";
    }
    return "unknown";
}

namespace {

std::string string_field(const ValueObject& state, const char* key) {
    const Value* value = state.find(key);
    if (!value || value->is_null()) {
        return {};
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    return value->to_string();
}

bool has_non_null(const ValueObject& state, const char* key) {
    const Value* value = state.find(key);
    return value && !value->is_null();
}

size_t buffered_chunks(const ValueObject& state) {
    const Value* chunks = state.find("streamed_output");
    if (!chunks || !chunks->is_list()) {
        return 0;
    }
    return chunks->get<ValueList>().size();
}

std::vector<std::string> tags_of(const ValueObject& state) {
    std::vector<std::string> tags;
    const Value* value = state.find("tags");
    if (!value || !value->is_list()) {
        return tags;
    }
    for (const auto& tag : value->get<ValueList>()) {
        tags.push_back(tag.is_string() ? tag.get<std::string>() : tag.to_string());
    }
    return tags;
}

ValueObject metadata_of(const ValueObject& state) {
    const Value* value = state.find("metadata");
    if (!value || !value->is_object()) {
        return {};
    }
    return value->get<ValueObject>();
}

// Drains streamed_output, which must hold exactly one chunk
Value take_single_chunk(ValueObject& state) {
    auto chunks = consume_field(state, "streamed_output");
    state.set("streamed_output", ValueList{});

    size_t count = chunks && chunks->is_list() ? chunks->get<ValueList>().size() : 0;
    if (count != 1) {
        RUNSTREAM_DEBUG_LOG("run '%s' buffered %zu chunks", string_field(state, "name").c_str(), count);
        throw InvariantViolation("expected exactly one chunk of streamed output, got " +
                                 std::to_string(count) + " in run '" + string_field(state, "name") + "'");
    }
    return std::move(chunks->get<ValueList>().front());
}

StreamEvent make_event(const ValueObject& state, const RunShape& shape, EventKind kind, ValueObject data) {
    StreamEvent event;
    event.event = event_name(run_category(shape), kind);
    event.name = string_field(state, "name");
    event.run_id = string_field(state, "id");
    event.tags = tags_of(state);
    event.metadata = metadata_of(state);
    event.data = std::move(data);
    return event;
}

} // anonymous namespace

EventTranslator::EventTranslator(TranslatorOptions options)
    : options_(std::move(options)) {}

RunPhase EventTranslator::phase_of(const std::string& segment) const {
    auto it = phases_.find(segment);
    return it == phases_.end() ? RunPhase::Pending : it->second;
}

void EventTranslator::ensure_usable() const {
    if (failed_) {
        throw std::logic_error("EventTranslator used after a failed patch");
    }
    if (finished_) {
        throw std::logic_error("EventTranslator already finished");
    }
}

std::vector<std::string> EventTranslator::touched_segments(const RunLogPatch& patch) const {
    std::vector<std::string> segments;
    std::unordered_set<std::string> seen;
    for (const auto& op : patch.ops) {
        if (op.path.compare(0, 6, "/logs/") != 0) {
            continue;
        }
        auto parts = split_pointer(op.path);
        if (parts.size() < 2) {
            continue;
        }
        if (seen.insert(parts[1]).second) {
            segments.push_back(parts[1]);
        }
    }
    return segments;
}

std::vector<StreamEvent> EventTranslator::process(const RunLogPatch& patch) {
    ensure_usable();

    std::vector<StreamEvent> events;
    try {
        run_log_.apply(patch);
        ++patches_processed_;

        if (!root_started_ && has_non_null(run_log_.root(), "id")) {
            emit_root_start(events);
        }

        for (const auto& segment : touched_segments(patch)) {
            emit_sub_run(segment, events);
        }

        emit_root_stream(events);
    } catch (...) {
        failed_ = true;
        throw;
    }

    for (const auto& event : events) {
        RUNSTREAM_DEBUG_LOG("emit %s", event.to_string().c_str());
    }
    return events;
}

void EventTranslator::emit_root_start(std::vector<StreamEvent>& out) {
    const ValueObject& root = run_log_.root();
    RunShape shape = classify_run(string_field(root, "type"), options_.legacy_types);

    // Inputs are not reliably known yet; tags and metadata are not reported for the root
    StreamEvent event = make_event(root, shape, EventKind::Start, ValueObject{});
    event.tags.clear();
    event.metadata = ValueObject{};
    out.push_back(std::move(event));
    root_started_ = true;
}

void EventTranslator::emit_sub_run(const std::string& segment, std::vector<StreamEvent>& out) {
    RunPhase& phase = phases_[segment];
    if (phase == RunPhase::Ended) {
        return;
    }

    ValueObject* state = run_log_.find_log(segment);
    if (!state || !has_non_null(*state, "id")) {
        return;
    }

    RunShape shape = classify_run(string_field(*state, "type"), options_.legacy_types);
    const bool ended = has_non_null(*state, "end_time");
    const bool has_chunks = buffered_chunks(*state) > 0;

    // Every tracked sub-run opens with exactly one start event
    if (phase == RunPhase::Pending) {
        out.push_back(make_event(*state, shape, EventKind::Start, start_event_data(shape, *state)));
        phase = RunPhase::Running;
    }

    // A chunk flushed in the same batch as end_time still goes out before the end
    if (has_chunks) {
        ValueObject data;
        data.set("chunk", take_single_chunk(*state));
        out.push_back(make_event(*state, shape, EventKind::Stream, std::move(data)));
        phase = RunPhase::Streaming;
    }

    if (ended) {
        out.push_back(make_event(*state, shape, EventKind::End, end_event_data(shape, *state)));
        phase = RunPhase::Ended;
        RUNSTREAM_DEBUG_LOG("sub-run '%s' ended", segment.c_str());
    }
}

void EventTranslator::emit_root_stream(std::vector<StreamEvent>& out) {
    ValueObject& root = run_log_.root();
    if (buffered_chunks(root) == 0) {
        return;
    }

    // A root that streams before its id arrives still opens with a start
    if (!root_started_) {
        emit_root_start(out);
    }

    RunShape shape = classify_run(string_field(root, "type"), options_.legacy_types);
    ValueObject data;
    data.set("chunk", take_single_chunk(root));
    out.push_back(make_event(root, shape, EventKind::Stream, std::move(data)));
}

StreamEvent EventTranslator::finish() {
    ensure_usable();
    finished_ = true;

    const ValueObject& root = run_log_.root();
    RunShape shape = classify_run(string_field(root, "type"), options_.legacy_types);

    const Value* final_output = root.find("final_output");
    ValueObject data;
    data.set("output", root_output(shape, final_output ? *final_output : Value{}));

    // TODO: confirm whether the closing root event should carry the accumulated tags and metadata
    StreamEvent event = make_event(root, shape, EventKind::End, std::move(data));
    event.tags.clear();
    event.metadata = ValueObject{};

    RUNSTREAM_DEBUG_LOG("emit %s", event.to_string().c_str());
    return event;
}

// EventStream

EventStream::EventStream(Source<RunLogPatch>& patches, TranslatorOptions options)
    : patches_(patches), translator_(std::move(options)) {}

std::optional<StreamEvent> EventStream::next() {
    while (pending_.empty()) {
        State state = state_.load();
        if (state == State::Cancelled) {
            throw StreamCancelled();
        }
        if (state != State::Open) {
            return std::nullopt;
        }

        std::optional<RunLogPatch> patch;
        try {
            patch = patches_.next();
        } catch (const StreamCancelled&) {
            state_.store(State::Cancelled);
            throw;
        } catch (...) {
            state_.store(State::Failed);
            throw;
        }

        if (!patch) {
            pending_.push_back(translator_.finish());
            state_.store(State::Finished);
            break;
        }

        try {
            for (auto& event : translator_.process(*patch)) {
                pending_.push_back(std::move(event));
            }
        } catch (...) {
            state_.store(State::Failed);
            throw;
        }
    }

    if (state_.load() == State::Cancelled) {
        pending_.clear();
        throw StreamCancelled();
    }

    StreamEvent event = std::move(pending_.front());
    pending_.pop_front();
    return event;
}

void EventStream::cancel() {
    state_.store(State::Cancelled);
    patches_.cancel();
}

std::unique_ptr<EventStream> as_event_stream(Source<RunLogPatch>& patches, TranslatorOptions options) {
    return std::make_unique<EventStream>(patches, std::move(options));
}

std::vector<StreamEvent> collect_events(const std::vector<RunLogPatch>& patches, TranslatorOptions options) {
    EventTranslator translator(std::move(options));
    std::vector<StreamEvent> events;
    for (const auto& patch : patches) {
        for (auto& event : translator.process(patch)) {
            events.push_back(std::move(event));
        }
    }
    events.push_back(translator.finish());
    return events;
}

} // namespace runstream
