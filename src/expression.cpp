#include "dynq/expression.hpp"
#include "dynq/builtins.hpp"
#include "dynq/record.hpp"
#include <sstream>

namespace dynq {

const char* binary_op_name(binary_op op){
    switch(op){
        case binary_op::OrElse: return "OrElse";
        case binary_op::AndAlso: return "AndAlso";
        case binary_op::Equal: return "Equal";
        case binary_op::NotEqual: return "NotEqual";
        case binary_op::Less: return "LessThan";
        case binary_op::LessEqual: return "LessThanOrEqual";
        case binary_op::Greater: return "GreaterThan";
        case binary_op::GreaterEqual: return "GreaterThanOrEqual";
        case binary_op::Add: return "Add";
        case binary_op::Subtract: return "Subtract";
        case binary_op::Multiply: return "Multiply";
        case binary_op::Divide: return "Divide";
        case binary_op::Modulo: return "Modulo";
        case binary_op::Concat: return "Concat";
    }
    return "?";
}

const char* aggregate_fn_name(aggregate_fn fn){
    switch(fn){
        case aggregate_fn::Where: return "Where";
        case aggregate_fn::Any: return "Any";
        case aggregate_fn::All: return "All";
        case aggregate_fn::Count: return "Count";
        case aggregate_fn::Min: return "Min";
        case aggregate_fn::Max: return "Max";
        case aggregate_fn::Sum: return "Sum";
        case aggregate_fn::Average: return "Average";
    }
    return "?";
}

expr_ptr make_constant(value v, type_ref t, int pos){
    constant_node c;
    c.val = std::move(v);
    return make_expr(t, pos, std::move(c));
}

expr_ptr make_convert(expr_ptr e, type_ref t, bool checked){
    int pos = e->pos;
    return make_expr(t, pos, convert_node{std::move(e), checked});
}

bool is_null_literal(const expr& e){
    auto c = std::get_if<constant_node>(&e.node);
    return c && c->is_null_literal;
}

lambda_ref make_lambda(std::vector<parameter_ref> params, expr_ptr body){
    auto l = std::make_shared<lambda>();
    l->params = std::move(params);
    l->body = std::move(body);
    return l;
}

namespace {

void dump(std::ostringstream& os, const expr& e);

void dump_args(std::ostringstream& os, const std::vector<expr_ptr>& args){
    for(const auto& a : args){ os << ' '; dump(os, *a); }
}

void dump(std::ostringstream& os, const expr& e){
    std::visit([&](const auto& n){
        using N = std::decay_t<decltype(n)>;
        if constexpr(std::is_same_v<N, constant_node>){
            if(n.val.is_null()) os << "(Const " << type_name(e.type) << " null)";
            else if(n.val.template is<std::string>()) os << "(Const " << type_name(e.type) << " \"" << to_display(n.val) << "\")";
            else os << "(Const " << type_name(e.type) << ' ' << to_display(n.val) << ')';
        } else if constexpr(std::is_same_v<N, param_node>){
            os << "(Param " << (n.param->name.empty() ? "it" : n.param->name) << ')';
        } else if constexpr(std::is_same_v<N, member_node>){
            os << "(Member ";
            dump(os, *n.instance);
            os << ' ' << n.name << ')';
        } else if constexpr(std::is_same_v<N, index_node>){
            os << "(Index ";
            dump(os, *n.target);
            os << ' ';
            dump(os, *n.index);
            os << ')';
        } else if constexpr(std::is_same_v<N, unary_node>){
            os << '(' << (n.op == unary_op::Negate ? "Negate " : "Not ");
            dump(os, *n.operand);
            os << ')';
        } else if constexpr(std::is_same_v<N, binary_node>){
            os << '(' << binary_op_name(n.op) << ' ';
            dump(os, *n.left);
            os << ' ';
            dump(os, *n.right);
            os << ')';
        } else if constexpr(std::is_same_v<N, conditional_node>){
            os << "(Conditional ";
            dump(os, *n.test);
            os << ' ';
            dump(os, *n.if_true);
            os << ' ';
            dump(os, *n.if_false);
            os << ')';
        } else if constexpr(std::is_same_v<N, convert_node>){
            os << (n.checked ? "(ConvertChecked " : "(Convert ") << type_name(e.type) << ' ';
            dump(os, *n.operand);
            os << ')';
        } else if constexpr(std::is_same_v<N, coalesce_node>){
            os << "(Coalesce ";
            dump(os, *n.operand);
            os << ' ';
            dump(os, *n.fallback);
            os << ')';
        } else if constexpr(std::is_same_v<N, call_node>){
            os << "(Call " << (n.fn->owner ? type_name(n.fn->owner) + "." : std::string()) << n.fn->name;
            if(n.instance){ os << ' '; dump(os, *n.instance); }
            dump_args(os, n.args);
            os << ')';
        } else if constexpr(std::is_same_v<N, new_record_node>){
            os << "(New " << n.record->name();
            for(size_t i = 0; i < n.args.size(); ++i){
                os << ' ' << n.record->properties()[n.slots[i]].name << '=';
                dump(os, *n.args[i]);
            }
            os << ')';
        } else if constexpr(std::is_same_v<N, new_array_node>){
            os << "(NewArray " << type_name(e.type);
            dump_args(os, n.items);
            os << ')';
        } else if constexpr(std::is_same_v<N, aggregate_node>){
            os << '(' << aggregate_fn_name(n.fn) << ' ';
            dump(os, *n.source);
            if(n.body){ os << ' '; dump(os, *n.body); }
            os << ')';
        } else if constexpr(std::is_same_v<N, invoke_node>){
            os << "(Invoke " << to_string(*n.target);
            dump_args(os, n.args);
            os << ')';
        }
    }, e.node);
}

} // namespace

std::string to_string(const expr& e){
    std::ostringstream os;
    dump(os, e);
    return os.str();
}

std::string to_string(const lambda& l){
    std::ostringstream os;
    os << "(Lambda (";
    for(size_t i = 0; i < l.params.size(); ++i){
        if(i) os << ' ';
        os << (l.params[i]->name.empty() ? "it" : l.params[i]->name) << ':' << type_name(l.params[i]->type);
    }
    os << ") ";
    if(l.body) dump(os, *l.body);
    os << ')';
    return os.str();
}

} // namespace dynq
