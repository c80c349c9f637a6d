#ifndef RUNSTREAM_DISPATCH_HPP
#define RUNSTREAM_DISPATCH_HPP

#include <runstream/event_translator.hpp>
#include <runstream/stream_event.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace runstream {

using EventConsumer = std::function<void(const StreamEvent&)>;

/**
 * Delivers the same ordered events to every consumer, each consumer running
 * as one bounded task. Every consumer sees every event in order. The first
 * consumer to throw aborts the dispatch and its exception is rethrown.
 */
void dispatch_events(const std::vector<StreamEvent>& events,
                     const std::vector<EventConsumer>& consumers,
                     std::optional<size_t> limit = std::nullopt);

/**
 * Translates independent sessions concurrently, at most `limit` at a time.
 * Results are in session order; a failing session fails the whole call.
 */
std::vector<std::vector<StreamEvent>> translate_sessions(
    const std::vector<std::vector<RunLogPatch>>& sessions,
    std::optional<size_t> limit = std::nullopt,
    const TranslatorOptions& options = {});

} // namespace runstream

#endif // RUNSTREAM_DISPATCH_HPP
