#include "dynq/dynamic_expression.hpp"
#include "dynq/diagnostics.hpp"
#include "dynq/env.hpp"
#include "dynq/evaluator.hpp"

#include <cstdio>
#include <stdexcept>

namespace dynq {

namespace {

// Runs a parse step; positional errors are echoed as JSON when asked for.
template<class F>
auto reporting(F&& f) -> decltype(f()) {
    try {
        return f();
    } catch(const query_error& e){
        maybe_print_json(e);
        throw;
    }
}

void debug_dump(std::string_view text, const lambda& l){
    if(!detect_env().debug_parse) return;
    std::fprintf(stderr, "[dbg][parse] %.*s => %s\n", (int)text.size(), text.data(), to_string(l).c_str());
}

} // namespace

compiled_lambda::compiled_lambda(lambda_ref l, std::string source, compile_options opts)
    : lambda_(std::move(l)), source_(std::move(source)) {
    if(!lambda_) throw std::invalid_argument("compiled_lambda: lambda is null");
    if(opts.jit || detect_env().jit) native_ = compile_native(*lambda_);
}

value compiled_lambda::operator()(const value& it) const {
    if(native_) return (*native_)(it);
    return dynq::invoke(*lambda_, {it});
}

value compiled_lambda::invoke(const std::vector<value>& args) const {
    if(native_ && args.size() == 1) return (*native_)(args[0]);
    return dynq::invoke(*lambda_, args);
}

lambda_ref parse_lambda(const std::vector<parameter_ref>& params, type_ref result_type, std::string_view text,
                        const std::vector<bound_value>& values, const named_values& externals){
    return reporting([&]{
        expression_parser p(params, text, values, externals);
        lambda_ref l = make_lambda(params, p.parse(result_type));
        debug_dump(text, *l);
        return l;
    });
}

lambda_ref parse_lambda(type_ref it_type, type_ref result_type, std::string_view text,
                        const std::vector<bound_value>& values, const named_values& externals){
    if(!it_type) throw std::invalid_argument("parse_lambda: element type is null");
    return parse_lambda(std::vector<parameter_ref>{make_parameter("", it_type)}, result_type, text, values, externals);
}

lambda_ref parse(std::string_view text, type_ref result_type,
                 const std::vector<bound_value>& values, const named_values& externals){
    return parse_lambda(std::vector<parameter_ref>{}, result_type, text, values, externals);
}

std::vector<ordering> parse_ordering(type_ref it_type, std::string_view text, const std::vector<bound_value>& values){
    if(!it_type) throw std::invalid_argument("parse_ordering: element type is null");
    return reporting([&]{
        parameter_ref it = make_parameter("", it_type);
        expression_parser p({it}, text, values);
        std::vector<ordering> out;
        for(auto& o : p.parse_ordering()){
            lambda_ref key = make_lambda({it}, std::move(o.key));
            debug_dump(text, *key);
            out.push_back(ordering{std::move(key), o.ascending});
        }
        return out;
    });
}

compiled_lambda compile_lambda(type_ref it_type, type_ref result_type, std::string_view text,
                               const std::vector<bound_value>& values, compile_options opts){
    return compiled_lambda(parse_lambda(it_type, result_type, text, values), std::string(text), opts);
}

} // namespace dynq
