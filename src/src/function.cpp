#include "vt/function.h"

#include "vt/engine.h"

namespace vt {

FunctionSchema FunctionSchema::input(std::vector<SchemaPtr> args) const {
    for (auto const& a : args)
        if (!a) throw SchemaDefinitionError("function argument schema is null");
    FunctionSchema copy = *this;
    copy.m_inputs = std::move(args);
    copy.m_has_inputs = true;
    return copy;
}

FunctionSchema FunctionSchema::output(SchemaPtr result) const {
    if (!result) throw SchemaDefinitionError("function return schema is null");
    FunctionSchema copy = *this;
    copy.m_output = std::move(result);
    return copy;
}

static std::vector<Value> check_arguments(const std::vector<SchemaPtr>& inputs, const std::vector<Value>& args) {
    if (args.size() != inputs.size()) {
        bool few = args.size() < inputs.size();
        RawIssue issue;
        issue.code = few ? IssueCode::TooSmall : IssueCode::TooBig;
        issue.input = Value::array(args);
        issue.properties["origin"] = "array";
        issue.properties[few ? "minimum" : "maximum"] = static_cast<int64_t>(inputs.size());
        issue.properties["inclusive"] = true;
        throw make_validation_error({issue}, nullptr);
    }
    ParsePayload payload(Value::array(args));
    std::vector<Value> out;
    for (size_t i = 0; i < args.size(); ++i) {
        ParsePayload child = payload.child(args[i], static_cast<int64_t>(i));
        inputs[i]->run(child);
        payload.absorb(child);
        out.push_back(std::move(child.value));
    }
    if (payload.failed()) throw make_validation_error(payload.issues, nullptr);
    return out;
}

Value FunctionSchema::wrap(const Value& fn) const {
    std::vector<SchemaPtr> inputs = m_inputs;
    bool has_inputs = m_has_inputs;
    SchemaPtr output = m_output;
    return Value::function([fn, inputs, has_inputs, output](const std::vector<Value>& args) {
        std::vector<Value> checked = has_inputs ? check_arguments(inputs, args) : args;
        Value result = fn.deref().call(checked);
        if (!output) return result;
        return output->mustParse(result);
    });
}

void FunctionSchema::run(ParsePayload& payload) const {
    ParseHooks hooks;
    hooks.expected = "function";
    hooks.accepts = [](const Value& v) { return v.isFunction(); };
    if (m_has_inputs || m_output) hooks.descend = [this](ParsePayload& p) { p.value = wrap(p.value); };
    parse_with(*this, hooks, payload);
}

Value FunctionSchema::implement(Callable fn) const { return mustParse(Value::function(std::move(fn))); }

}  // namespace vt
