#ifndef RUNSTREAM_RUN_LOG_HPP
#define RUNSTREAM_RUN_LOG_HPP

#include <runstream/value.hpp>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace runstream {

class PatchError : public RunStreamError {
public:
    PatchError(const std::string& message, const std::string& path)
        : RunStreamError("Patch error at '" + path + "': " + message), path_(path) {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

enum class PatchOpKind : uint8_t {
    Add,
    Replace,
    Remove
};

const char* patch_op_name(PatchOpKind kind);

/**
 * One structural operation against the run-state tree.
 * `path` is a JSON pointer: "" is the whole document, "/logs/a/id" a member,
 * a trailing "-" appends to a list.
 */
struct PatchOp {
    PatchOpKind op = PatchOpKind::Add;
    std::string path;
    Value value;

    static PatchOp add(std::string path, Value value);
    static PatchOp replace(std::string path, Value value);
    static PatchOp remove(std::string path);

    bool operator==(const PatchOp& other) const;
    bool operator!=(const PatchOp& other) const { return !(*this == other); }
};

// Splits a JSON pointer into unescaped segments ("~1" -> "/", "~0" -> "~")
std::vector<std::string> split_pointer(const std::string& path);

/**
 * Operations emitted together by the tracer. Batches are addable:
 * combining two concatenates their operations.
 */
struct RunLogPatch {
    std::vector<PatchOp> ops;

    RunLogPatch() = default;
    explicit RunLogPatch(std::vector<PatchOp> operations) : ops(std::move(operations)) {}
    RunLogPatch(std::initializer_list<PatchOp> operations) : ops(operations) {}

    bool empty() const { return ops.empty(); }
};

RunLogPatch operator+(const RunLogPatch& left, const RunLogPatch& right);

/**
 * Cumulative run state, built by applying every patch seen so far.
 * Starts as an empty object.
 */
class RunLog {
public:
    RunLog() : state_(ValueObject{}) {}
    explicit RunLog(Value state) : state_(std::move(state)) {}

    const Value& state() const { return state_; }
    Value& state() { return state_; }

    // Throws PatchError when a path cannot be resolved
    void apply(const PatchOp& op);
    void apply(const RunLogPatch& patch);

    // Root object; throws TypeError if a patch replaced the root with a non-object
    ValueObject& root();
    const ValueObject& root() const;

    // Sub-run state under /logs/<segment>, or null if not present
    ValueObject* find_log(const std::string& segment);
    const ValueObject* find_log(const std::string& segment) const;

private:
    Value state_;
};

RunLog operator+(RunLog log, const RunLogPatch& patch);

} // namespace runstream

#endif // RUNSTREAM_RUN_LOG_HPP
