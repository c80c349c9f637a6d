#include <runstream/dispatch.hpp>
#include <runstream/debug_log.hpp>
#include <job_system/bounded_run.hpp>
#include <atomic>
#include <memory>

namespace runstream {

// Tasks own copies of their inputs: after a failure run_bounded returns while
// sibling tasks may still be running.

void dispatch_events(const std::vector<StreamEvent>& events,
                     const std::vector<EventConsumer>& consumers,
                     std::optional<size_t> limit) {
    RUNSTREAM_DEBUG_LOG("dispatching %zu events to %zu consumers", events.size(), consumers.size());

    auto shared_events = std::make_shared<const std::vector<StreamEvent>>(events);
    auto aborted = std::make_shared<std::atomic<bool>>(false);

    std::vector<std::function<void()>> tasks;
    tasks.reserve(consumers.size());
    for (const auto& consumer : consumers) {
        tasks.emplace_back([shared_events, aborted, consumer]() {
            try {
                for (const auto& event : *shared_events) {
                    if (aborted->load(std::memory_order_acquire)) {
                        return;
                    }
                    consumer(event);
                }
            } catch (...) {
                aborted->store(true, std::memory_order_release);
                throw;
            }
        });
    }

    job_system::run_bounded(limit, std::move(tasks));
}

std::vector<std::vector<StreamEvent>> translate_sessions(
    const std::vector<std::vector<RunLogPatch>>& sessions,
    std::optional<size_t> limit,
    const TranslatorOptions& options) {
    std::vector<std::function<std::vector<StreamEvent>()>> tasks;
    tasks.reserve(sessions.size());
    for (const auto& session : sessions) {
        tasks.emplace_back([session, options]() {
            return collect_events(session, options);
        });
    }

    return job_system::run_bounded(limit, std::move(tasks));
}

} // namespace runstream
