#include <runstream/stream_event.hpp>
#include <sstream>

namespace runstream {

const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::Start: return "start";
        case EventKind::Stream: return "stream";
        case EventKind::End: return "end";
    }
    return "unknown";
}

std::string event_name(const std::string& category, EventKind kind) {
    return "on_" + category + "_" + event_kind_name(kind);
}

namespace {

Value tags_value(const std::vector<std::string>& tags) {
    ValueList list;
    list.reserve(tags.size());
    for (const auto& tag : tags) {
        list.emplace_back(tag);
    }
    return Value(std::move(list));
}

} // anonymous namespace

std::string StreamEvent::to_string() const {
    std::ostringstream out;
    out << event << " name=" << Value(name).to_string()
        << " run_id=" << Value(run_id).to_string()
        << " tags=" << tags_value(tags).to_string()
        << " metadata=" << Value(metadata).to_string()
        << " data=" << Value(data).to_string();
    return out.str();
}

bool StreamEvent::operator==(const StreamEvent& other) const {
    return event == other.event && name == other.name && run_id == other.run_id &&
           tags == other.tags && metadata == other.metadata && data == other.data;
}

std::string format_event(const StreamEvent& event, const std::string& prefix) {
    std::ostringstream out;
    out << prefix << event.event << "\n"
        << "name: " << event.name << "\n"
        << "run_id: " << event.run_id << "\n"
        << "tags: " << tags_value(event.tags).to_string() << "\n"
        << "metadata: " << Value(event.metadata).to_string() << "\n"
        << "data: " << Value(event.data).to_string();
    return indent_lines_after_first(out.str(), prefix);
}

std::string indent_lines_after_first(const std::string& text, const std::string& prefix) {
    const std::string spaces(prefix.size(), ' ');
    std::istringstream in(text);
    std::ostringstream out;
    std::string line;
    bool first = true;
    while (std::getline(in, line)) {
        if (!first) {
            out << "\n" << spaces;
        }
        out << line;
        first = false;
    }
    return out.str();
}

} // namespace runstream
