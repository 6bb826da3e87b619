// Public entry points: query text in, executable lambdas out.
#pragma once
#include "dynq/entity.hpp"
#include "dynq/expression.hpp"
#include "dynq/jit.hpp"
#include "dynq/parser.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dynq {

// Positional and named values for {n} / @n placeholders.
template<class T>
bound_value bind(const T& x){
    return bound_value{value_traits<T>::to_value(x), value_traits<T>::static_type(), nullptr};
}
inline bound_value bind(const char* s){ return bound_value{value(s), string_type(), nullptr}; }
inline bound_value bind(lambda_ref fn){
    if(!fn) throw std::invalid_argument("bind: lambda is null");
    return bound_value{value{}, fn->result_type(), std::move(fn)};
}
inline bound_value bind_null(type_ref t){ return bound_value{value{}, t, nullptr}; }

inline parameter_ref param(std::string name, type_ref t){ return make_parameter(std::move(name), t); }

struct compile_options {
    bool jit{false};   // also enabled process-wide by DYNQ_JIT=1
};

// A parsed lambda plus, when requested and eligible, its native form.
class compiled_lambda {
public:
    compiled_lambda() = default;
    compiled_lambda(lambda_ref l, std::string source, compile_options opts = {});

    // Single-parameter call.
    value operator()(const value& it) const;
    value invoke(const std::vector<value>& args) const;

    bool valid() const { return lambda_ != nullptr; }
    bool is_native() const { return native_ != nullptr; }
    const lambda& tree() const { return *lambda_; }
    const lambda_ref& shared_tree() const { return lambda_; }
    const std::string& source() const { return source_; }
    type_ref result_type() const { return lambda_->result_type(); }

private:
    lambda_ref lambda_;
    std::string source_;
    std::shared_ptr<const native_lambda> native_;
};

// Lambda over explicitly declared parameters. A single unnamed parameter is `it`.
// result_type may be nullptr to accept whatever the text produces.
lambda_ref parse_lambda(const std::vector<parameter_ref>& params, type_ref result_type, std::string_view text,
                        const std::vector<bound_value>& values = {}, const named_values& externals = {});
// Lambda over a single implicit `it` of it_type.
lambda_ref parse_lambda(type_ref it_type, type_ref result_type, std::string_view text,
                        const std::vector<bound_value>& values = {}, const named_values& externals = {});
// Parameterless expression.
lambda_ref parse(std::string_view text, type_ref result_type,
                 const std::vector<bound_value>& values = {}, const named_values& externals = {});

struct ordering {
    lambda_ref key;
    bool ascending{true};
};
// "Status, ConferenceId desc": one key lambda over it_type per entry, in source order.
std::vector<ordering> parse_ordering(type_ref it_type, std::string_view text,
                                     const std::vector<bound_value>& values = {});

inline compiled_lambda compile(lambda_ref l, std::string source = {}, compile_options opts = {}){
    return compiled_lambda(std::move(l), std::move(source), opts);
}

// Convenience: parse_lambda over it_type then compile.
compiled_lambda compile_lambda(type_ref it_type, type_ref result_type, std::string_view text,
                               const std::vector<bound_value>& values = {}, compile_options opts = {});

} // namespace dynq
