#ifndef RUNSTREAM_STREAM_EVENT_HPP
#define RUNSTREAM_STREAM_EVENT_HPP

#include <runstream/value.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace runstream {

enum class EventKind : uint8_t {
    Start,
    Stream,
    End
};

const char* event_kind_name(EventKind kind);

// "on_<category>_<start|stream|end>"
std::string event_name(const std::string& category, EventKind kind);

/**
 * One lifecycle event of the root run or a sub-run.
 * `data` holds "input", "output" or "chunk" depending on the kind.
 */
struct StreamEvent {
    std::string event;
    std::string name;
    std::string run_id;
    std::vector<std::string> tags;
    ValueObject metadata;
    ValueObject data;

    std::string to_string() const;

    bool operator==(const StreamEvent& other) const;
    bool operator!=(const StreamEvent& other) const { return !(*this == other); }
};

// Multi-line form for logs; continuation lines are indented under the prefix
std::string format_event(const StreamEvent& event, const std::string& prefix = "");

// Indents every line after the first by prefix.size() spaces
std::string indent_lines_after_first(const std::string& text, const std::string& prefix);

} // namespace runstream

#endif // RUNSTREAM_STREAM_EVENT_HPP
