#include <runstream/run_log.hpp>
#include <runstream/debug_log.hpp>
#include <cctype>
#include <limits>

namespace runstream {

const char* patch_op_name(PatchOpKind kind) {
    switch (kind) {
        case PatchOpKind::Add: return "add";
        case PatchOpKind::Replace: return "replace";
        case PatchOpKind::Remove: return "remove";
    }
    return "unknown";
}

PatchOp PatchOp::add(std::string path, Value value) {
    return PatchOp{PatchOpKind::Add, std::move(path), std::move(value)};
}

PatchOp PatchOp::replace(std::string path, Value value) {
    return PatchOp{PatchOpKind::Replace, std::move(path), std::move(value)};
}

PatchOp PatchOp::remove(std::string path) {
    return PatchOp{PatchOpKind::Remove, std::move(path), Value{}};
}

bool PatchOp::operator==(const PatchOp& other) const {
    return op == other.op && path == other.path && value == other.value;
}

std::vector<std::string> split_pointer(const std::string& path) {
    std::vector<std::string> segments;
    if (path.empty()) {
        return segments;
    }
    if (path[0] != '/') {
        throw PatchError("JSON pointer must start with '/'", path);
    }

    std::string current;
    for (size_t i = 1; i <= path.size(); ++i) {
        if (i == path.size() || path[i] == '/') {
            segments.push_back(std::move(current));
            current.clear();
            continue;
        }
        if (path[i] == '~') {
            if (i + 1 >= path.size() || (path[i + 1] != '0' && path[i + 1] != '1')) {
                throw PatchError("invalid '~' escape", path);
            }
            current.push_back(path[i + 1] == '0' ? '~' : '/');
            ++i;
            continue;
        }
        current.push_back(path[i]);
    }
    return segments;
}

RunLogPatch operator+(const RunLogPatch& left, const RunLogPatch& right) {
    RunLogPatch joined = left;
    joined.ops.insert(joined.ops.end(), right.ops.begin(), right.ops.end());
    return joined;
}

namespace {

std::optional<size_t> parse_index(const std::string& segment) {
    if (segment.empty() || (segment.size() > 1 && segment[0] == '0')) {
        return std::nullopt;
    }
    size_t index = 0;
    for (char c : segment) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        if (index > (std::numeric_limits<size_t>::max() - 9) / 10) {
            return std::nullopt;
        }
        index = index * 10 + static_cast<size_t>(c - '0');
    }
    return index;
}

size_t require_index(const std::string& segment, size_t limit, const std::string& path) {
    auto index = parse_index(segment);
    if (!index) {
        throw PatchError("'" + segment + "' is not a list index", path);
    }
    if (*index >= limit) {
        throw PatchError("list index " + segment + " out of range", path);
    }
    return *index;
}

// Step one level down; missing members become null placeholders when creating
Value& descend(Value& node, const std::string& segment, const std::string& path, bool create) {
    if (node.is_null() && create) {
        node = ValueObject{};
    }

    if (node.is_object()) {
        auto& object = node.get<ValueObject>();
        if (Value* child = object.find(segment)) {
            return *child;
        }
        if (!create) {
            throw PatchError("member '" + segment + "' does not exist", path);
        }
        return object[segment];
    }

    if (node.is_list()) {
        auto& list = node.get<ValueList>();
        return list[require_index(segment, list.size(), path)];
    }

    throw PatchError(std::string("cannot descend into ") + value_type_name(node.type()), path);
}

void apply_to_list(ValueList& list, const std::string& last, const PatchOp& op) {
    if (last == "-") {
        if (op.op != PatchOpKind::Add) {
            throw PatchError("'-' is only valid for add", op.path);
        }
        list.push_back(op.value);
        return;
    }

    switch (op.op) {
        case PatchOpKind::Add: {
            size_t index = require_index(last, list.size() + 1, op.path);
            list.insert(list.begin() + static_cast<std::ptrdiff_t>(index), op.value);
            break;
        }
        case PatchOpKind::Replace:
            list[require_index(last, list.size(), op.path)] = op.value;
            break;
        case PatchOpKind::Remove: {
            size_t index = require_index(last, list.size(), op.path);
            list.erase(list.begin() + static_cast<std::ptrdiff_t>(index));
            break;
        }
    }
}

} // anonymous namespace

void RunLog::apply(const PatchOp& op) {
    auto segments = split_pointer(op.path);

    if (segments.empty()) {
        if (op.op == PatchOpKind::Remove) {
            throw PatchError("cannot remove the document root", op.path);
        }
        state_ = op.value;
        return;
    }

    const bool create = op.op != PatchOpKind::Remove;
    Value* parent = &state_;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        parent = &descend(*parent, segments[i], op.path, create);
    }

    const std::string& last = segments.back();
    if (parent->is_null() && create) {
        if (last == "-" || parse_index(last)) {
            *parent = ValueList{};
        } else {
            *parent = ValueObject{};
        }
    }

    if (parent->is_object()) {
        auto& object = parent->get<ValueObject>();
        if (op.op == PatchOpKind::Remove) {
            if (!object.erase(last)) {
                throw PatchError("member '" + last + "' does not exist", op.path);
            }
        } else {
            object.set(last, op.value);
        }
        return;
    }

    if (parent->is_list()) {
        apply_to_list(parent->get<ValueList>(), last, op);
        return;
    }

    throw PatchError(std::string("cannot modify a member of ") + value_type_name(parent->type()), op.path);
}

void RunLog::apply(const RunLogPatch& patch) {
    RUNSTREAM_DEBUG_LOG("applying patch with %zu ops", patch.ops.size());
    for (const auto& op : patch.ops) {
        apply(op);
    }
}

ValueObject& RunLog::root() {
    return state_.as_object();
}

const ValueObject& RunLog::root() const {
    return state_.as_object();
}

ValueObject* RunLog::find_log(const std::string& segment) {
    Value* logs = root().find("logs");
    if (!logs || !logs->is_object()) {
        return nullptr;
    }
    Value* entry = logs->get<ValueObject>().find(segment);
    if (!entry || !entry->is_object()) {
        return nullptr;
    }
    return &entry->get<ValueObject>();
}

const ValueObject* RunLog::find_log(const std::string& segment) const {
    const Value* logs = root().find("logs");
    if (!logs || !logs->is_object()) {
        return nullptr;
    }
    const Value* entry = logs->get<ValueObject>().find(segment);
    if (!entry || !entry->is_object()) {
        return nullptr;
    }
    return &entry->get<ValueObject>();
}

RunLog operator+(RunLog log, const RunLogPatch& patch) {
    log.apply(patch);
    return log;
}

} // namespace runstream
