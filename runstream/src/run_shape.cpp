#include <runstream/run_shape.hpp>
#include <algorithm>
#include <type_traits>

namespace runstream {

RunShape classify_run(const std::string& type, const std::vector<std::string>& legacy_types) {
    if (std::find(legacy_types.begin(), legacy_types.end(), type) != legacy_types.end()) {
        return LegacyRun{type};
    }
    return ChainRun{type};
}

const std::string& run_category(const RunShape& shape) {
    return std::visit([](const auto& run) -> const std::string& { return run.category; }, shape);
}

bool is_legacy(const RunShape& shape) {
    return std::holds_alternative<LegacyRun>(shape);
}

std::optional<Value> consume_field(ValueObject& state, const std::string& key) {
    return state.take(key);
}

namespace {

const Value* wrapped_member(const Value* container, const char* key) {
    if (!container || !container->is_object()) {
        return nullptr;
    }
    return container->get<ValueObject>().find(key);
}

} // anonymous namespace

ValueObject start_event_data(const RunShape& shape, const ValueObject& state) {
    ValueObject data;
    const Value* inputs = state.find("inputs");

    std::visit([&](const auto& run) {
        using T = std::decay_t<decltype(run)>;
        if constexpr (std::is_same_v<T, LegacyRun>) {
            if (inputs && inputs->truthy()) {
                data.set("input", *inputs);
            }
        } else {
            // Streaming chains usually learn their input only at the end
            if (const Value* input = wrapped_member(inputs, "input")) {
                data.set("input", *input);
            }
        }
    }, shape);

    return data;
}

ValueObject end_event_data(const RunShape& shape, ValueObject& state) {
    ValueObject data;

    std::visit([&](const auto& run) {
        using T = std::decay_t<decltype(run)>;
        if constexpr (std::is_same_v<T, LegacyRun>) {
            auto output = consume_field(state, "final_output");
            data.set("output", output ? std::move(*output) : Value{});

            const Value* inputs = state.find("inputs");
            if (inputs && inputs->truthy()) {
                data.set("input", *consume_field(state, "inputs"));
            }
        } else {
            const Value* final_output = state.find("final_output");
            if (!final_output || final_output->is_null()) {
                data.set("output", Value{});
            } else if (final_output->is_object()) {
                auto wrapped = consume_field(state, "final_output");
                const Value* output = wrapped->get<ValueObject>().find("output");
                data.set("output", output ? *output : Value{});
            }
            // Any other shape is left out of the event

            if (wrapped_member(state.find("inputs"), "input")) {
                auto inputs = consume_field(state, "inputs");
                data.set("input", inputs->get<ValueObject>().at("input"));
            }
        }
    }, shape);

    return data;
}

Value root_output(const RunShape& shape, const Value& final_output) {
    if (is_legacy(shape)) {
        return final_output;
    }
    if (const Value* output = wrapped_member(&final_output, "output")) {
        return *output;
    }
    return final_output;
}

} // namespace runstream
