#include "dynq/overloads.hpp"
#include <algorithm>
#include <initializer_list>

namespace dynq {

namespace {

type_ref T(type_kind k){ return base_type(k); }
type_ref N(type_kind k){ return nullable_of(base_type(k)); }

bool kind_in(type_kind k, std::initializer_list<type_kind> set){
    return std::find(set.begin(), set.end(), k) != set.end();
}

// Numeric widening table; char is deliberately absent.
bool widens_to(type_kind s, type_kind t){
    using K = type_kind;
    switch(s){
        case K::SByte: return kind_in(t, {K::SByte, K::Int16, K::Int32, K::Int64, K::Single, K::Double, K::Decimal});
        case K::Byte: return kind_in(t, {K::Byte, K::Int16, K::UInt16, K::Int32, K::UInt32, K::Int64, K::UInt64, K::Single, K::Double, K::Decimal});
        case K::Int16: return kind_in(t, {K::Int16, K::Int32, K::Int64, K::Single, K::Double, K::Decimal});
        case K::UInt16: return kind_in(t, {K::UInt16, K::Int32, K::UInt32, K::Int64, K::UInt64, K::Single, K::Double, K::Decimal});
        case K::Int32: return kind_in(t, {K::Int32, K::Int64, K::Single, K::Double, K::Decimal});
        case K::UInt32: return kind_in(t, {K::UInt32, K::Int64, K::UInt64, K::Single, K::Double, K::Decimal});
        case K::Int64: return kind_in(t, {K::Int64, K::Single, K::Double, K::Decimal});
        case K::UInt64: return kind_in(t, {K::UInt64, K::Single, K::Double, K::Decimal});
        case K::Single: return kind_in(t, {K::Single, K::Double});
        default: return s == t;
    }
}

void add_same(std::vector<signature>& out, std::initializer_list<type_kind> kinds){
    for(type_kind k : kinds){
        out.push_back({T(k), T(k)});
    }
    for(type_kind k : kinds){
        out.push_back({N(k), N(k)});
    }
}

struct catalogs {
    std::vector<signature> logical, arithmetic, relational, equality, add, subtract, negation, not_;

    catalogs(){
        using K = type_kind;
        add_same(logical, {K::Boolean});

        add_same(arithmetic, {K::Int32, K::UInt32, K::Int64, K::UInt64, K::Single, K::Double, K::Decimal});

        relational = arithmetic;
        relational.push_back({T(K::String), T(K::String)});
        add_same(relational, {K::Char, K::DateTime, K::TimeSpan});

        equality = relational;
        add_same(equality, {K::Boolean, K::Guid});

        add = arithmetic;
        add.push_back({T(K::DateTime), T(K::TimeSpan)});
        add.push_back({T(K::TimeSpan), T(K::TimeSpan)});
        add.push_back({N(K::DateTime), N(K::TimeSpan)});
        add.push_back({N(K::TimeSpan), N(K::TimeSpan)});

        subtract = add;
        subtract.push_back({T(K::DateTime), T(K::DateTime)});
        subtract.push_back({N(K::DateTime), N(K::DateTime)});

        for(K k : {K::Int32, K::Int64, K::Single, K::Double, K::Decimal}) negation.push_back({T(k)});
        for(K k : {K::Int32, K::Int64, K::Single, K::Double, K::Decimal}) negation.push_back({N(k)});

        not_.push_back({T(K::Boolean)});
        not_.push_back({N(K::Boolean)});
    }
};

bool literal_retypes(const constant_node& c, type_ref source, type_ref target){
    if(c.literal.empty()) return false;
    type_ref tt = non_nullable(target);
    if(!is_numeric(tt) || tt->kind == type_kind::Char) return false;
    switch(source->kind){
        case type_kind::Int32: case type_kind::UInt32: case type_kind::Int64: case type_kind::UInt64:
            return parse_numeric(c.literal, tt).has_value();
        case type_kind::Double:
            return tt->kind == type_kind::Decimal && parse_numeric(c.literal, tt).has_value();
        default:
            return false;
    }
}

bool is_better_than(const std::vector<expr_ptr>& args, const signature& m1, const signature& m2){
    bool better = false;
    for(size_t i = 0; i < args.size(); ++i){
        int c = compare_conversions(args[i]->type, m1[i], m2[i]);
        if(c < 0) return false;
        if(c > 0) better = true;
    }
    return better;
}

} // namespace

const std::vector<signature>& signatures(signature_family family){
    static const catalogs c;
    switch(family){
        case signature_family::Logical: return c.logical;
        case signature_family::Arithmetic: return c.arithmetic;
        case signature_family::Relational: return c.relational;
        case signature_family::Equality: return c.equality;
        case signature_family::Add: return c.add;
        case signature_family::Subtract: return c.subtract;
        case signature_family::Negation: return c.negation;
        case signature_family::Not: return c.not_;
    }
    return c.arithmetic;
}

bool is_assignable(type_ref target, type_ref source){
    if(target == source) return true;
    if(!target || !source) return false;
    if(target->kind == type_kind::Object) return source->kind != type_kind::Static;
    if(source->kind == type_kind::Null) return !is_value_type(target) && target->kind != type_kind::Static;
    return false;
}

bool is_compatible_with(type_ref source, type_ref target){
    if(source == target) return true;
    if(!source || !target) return false;
    if(!is_value_type(target)) return is_assignable(target, source);
    if(!is_value_type(source)) return false;
    type_ref st = non_nullable(source);
    type_ref tt = non_nullable(target);
    if(st != source && tt == target) return false;
    return widens_to(st->kind, tt->kind);
}

bool can_promote(const expr& e, type_ref target){
    if(e.type == target) return true;
    if(auto c = std::get_if<constant_node>(&e.node)){
        if(c->is_null_literal){
            if(!is_value_type(target) || is_nullable(target)) return true;
        } else if(literal_retypes(*c, e.type, target)){
            return true;
        }
    }
    return is_compatible_with(e.type, target);
}

expr_ptr promote_expression(expr_ptr& e, type_ref target, bool exact){
    if(e->type == target) return std::move(e);
    if(auto c = std::get_if<constant_node>(&e->node)){
        if(c->is_null_literal){
            if(!is_value_type(target) || is_nullable(target)) return make_constant(value{}, target, e->pos);
        } else if(literal_retypes(*c, e->type, target)){
            auto parsed = parse_numeric(c->literal, non_nullable(target));
            return make_constant(std::move(*parsed), target, e->pos);
        }
    }
    if(is_compatible_with(e->type, target)){
        if(is_value_type(target) || exact) return make_convert(std::move(e), target);
        return std::move(e);
    }
    return nullptr;
}

int compare_conversions(type_ref s, type_ref t1, type_ref t2){
    if(t1 == t2) return 0;
    if(s == t1) return 1;
    if(s == t2) return -1;
    bool t1t2 = is_compatible_with(t1, t2);
    bool t2t1 = is_compatible_with(t2, t1);
    if(t1t2 && !t2t1) return 1;
    if(t2t1 && !t1t2) return -1;
    if(is_signed_integral(t1) && is_unsigned_integral(t2)) return 1;
    if(is_signed_integral(t2) && is_unsigned_integral(t1)) return -1;
    return 0;
}

size_t find_best_overload(const std::vector<signature>& candidates, std::vector<expr_ptr>& args, overload_match& match){
    std::vector<size_t> applicable;
    for(size_t i = 0; i < candidates.size(); ++i){
        const auto& params = candidates[i];
        if(params.size() != args.size()) continue;
        bool ok = true;
        for(size_t a = 0; a < args.size() && ok; ++a) ok = can_promote(*args[a], params[a]);
        if(ok) applicable.push_back(i);
    }
    if(applicable.size() > 1){
        std::vector<size_t> best;
        for(size_t m : applicable){
            bool wins = true;
            for(size_t n : applicable)
                if(m != n && !is_better_than(args, candidates[m], candidates[n])){ wins = false; break; }
            if(wins) best.push_back(m);
        }
        // no single winner: report every applicable candidate as ambiguous
        if(!best.empty()) applicable = std::move(best);
    }
    if(applicable.size() == 1){
        match.index = applicable.front();
        match.args.clear();
        const auto& params = candidates[match.index];
        for(size_t a = 0; a < args.size(); ++a) match.args.push_back(promote_expression(args[a], params[a], false));
    }
    return applicable.size();
}

} // namespace dynq
