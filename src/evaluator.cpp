#include "dynq/evaluator.hpp"
#include "dynq/builtins.hpp"
#include "dynq/errors.hpp"
#include "dynq/record.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace dynq {

const value& frame::lookup(const parameter* p) const {
    for(auto it = slots_.rbegin(); it != slots_.rend(); ++it)
        if(it->first == p) return it->second;
    throw std::logic_error("parameter '" + (p ? p->name : std::string("?")) + "' is not bound");
}

namespace {

[[noreturn]] void null_reference(){ throw evaluation_error(codes::null_reference, "null reference"); }
[[noreturn]] void divide_by_zero(){ throw evaluation_error(codes::divide_by_zero, "Attempted to divide by zero."); }
[[noreturn]] void overflow(){ throw evaluation_error(codes::overflow, "Arithmetic operation resulted in an overflow."); }
[[noreturn]] void invalid_cast(){ throw evaluation_error(codes::invalid_argument, "Specified cast is not valid."); }
[[noreturn]] void no_elements(){ throw evaluation_error(codes::empty_sequence, "Sequence contains no elements"); }

// Drops scopes pushed by an aggregate or invocation, also on unwind.
struct frame_scope {
    frame& f;
    size_t depth;
    explicit frame_scope(frame& fr) : f(fr), depth(fr.depth()) {}
    ~frame_scope(){ f.truncate(depth); }
};

enum class num_class { None, Signed, Unsigned, Real };

num_class classify(const value& v){
    return std::visit([](const auto& x) -> num_class {
        using X = std::decay_t<decltype(x)>;
        if constexpr(std::is_same_v<X, char>) return num_class::Unsigned;   // 8-bit char, unsigned view
        else if constexpr(std::is_same_v<X, bool>) return num_class::None;
        else if constexpr(std::is_integral_v<X>) return std::is_signed_v<X> ? num_class::Signed : num_class::Unsigned;
        else if constexpr(std::is_floating_point_v<X> || std::is_same_v<X, decimal_t>) return num_class::Real;
        else return num_class::None;
    }, v.v);
}

template<class T> value wrap_to(uint64_t bits){ return value(static_cast<T>(bits)); }

// Two's-complement truncation of bits to the integral kind k.
value integral_from_bits(type_kind k, uint64_t bits){
    switch(k){
        case type_kind::Char: return value(static_cast<char>(static_cast<uint8_t>(bits)));
        case type_kind::SByte: return wrap_to<int8_t>(bits);
        case type_kind::Byte: return wrap_to<uint8_t>(bits);
        case type_kind::Int16: return wrap_to<int16_t>(bits);
        case type_kind::UInt16: return wrap_to<uint16_t>(bits);
        case type_kind::Int32: return wrap_to<int32_t>(bits);
        case type_kind::UInt32: return wrap_to<uint32_t>(bits);
        case type_kind::Int64: return wrap_to<int64_t>(bits);
        default: return wrap_to<uint64_t>(bits);
    }
}

struct int_range { int64_t min; uint64_t max; };

int_range range_of(type_kind k){
    switch(k){
        case type_kind::Char: return {0, 0xFF};
        case type_kind::SByte: return {INT8_MIN, INT8_MAX};
        case type_kind::Byte: return {0, UINT8_MAX};
        case type_kind::Int16: return {INT16_MIN, INT16_MAX};
        case type_kind::UInt16: return {0, UINT16_MAX};
        case type_kind::Int32: return {INT32_MIN, INT32_MAX};
        case type_kind::UInt32: return {0, UINT32_MAX};
        case type_kind::Int64: return {INT64_MIN, (uint64_t)INT64_MAX};
        default: return {0, UINT64_MAX};
    }
}

value to_integral(const value& v, type_kind k, bool checked){
    const int_range r = range_of(k);
    switch(classify(v)){
        case num_class::Signed: {
            int64_t s = to_int64(v);
            if(checked && (s < r.min || (s > 0 && (uint64_t)s > r.max))) overflow();
            return integral_from_bits(k, (uint64_t)s);
        }
        case num_class::Unsigned: {
            uint64_t u = to_uint64(v);
            if(checked && u > r.max) overflow();
            return integral_from_bits(k, u);
        }
        case num_class::Real: {
            long double d = std::trunc(to_long_double(v));
            if(std::isnan(d) || d < (long double)r.min || d > (long double)r.max){
                if(checked) overflow();
                return integral_from_bits(k, 0);
            }
            if(d < 0) return integral_from_bits(k, (uint64_t)(int64_t)d);
            return integral_from_bits(k, (uint64_t)d);
        }
        default:
            invalid_cast();
    }
}

value to_real(const value& v, type_kind k, bool checked){
    if(classify(v) == num_class::None) invalid_cast();
    long double d = to_long_double(v);
    switch(k){
        case type_kind::Single: return value(static_cast<float>(d));
        case type_kind::Double: return value(static_cast<double>(d));
        default:
            if(checked && (std::isnan(d) || std::isinf(d))) overflow();
            return value(decimal_t{d});
    }
}

template<class T>
value integer_arith(binary_op op, T a, T b){
    using U = std::make_unsigned_t<T>;
    switch(op){
        case binary_op::Add: return value(static_cast<T>(static_cast<U>(a) + static_cast<U>(b)));
        case binary_op::Subtract: return value(static_cast<T>(static_cast<U>(a) - static_cast<U>(b)));
        case binary_op::Multiply: return value(static_cast<T>(static_cast<U>(a) * static_cast<U>(b)));
        case binary_op::Divide:
        case binary_op::Modulo:
            if(b == 0) divide_by_zero();
            if constexpr(std::is_signed_v<T>)
                if(a == std::numeric_limits<T>::min() && b == -1) overflow();
            return value(op == binary_op::Divide ? static_cast<T>(a / b) : static_cast<T>(a % b));
        default:
            throw std::logic_error("not an arithmetic operator");
    }
}

template<class T>
value real_arith(binary_op op, T a, T b){
    switch(op){
        case binary_op::Add: return value(a + b);
        case binary_op::Subtract: return value(a - b);
        case binary_op::Multiply: return value(a * b);
        case binary_op::Divide: return value(a / b);
        case binary_op::Modulo: return value(static_cast<T>(std::fmod(a, b)));
        default:
            throw std::logic_error("not an arithmetic operator");
    }
}

value decimal_arith(binary_op op, decimal_t a, decimal_t b){
    if((op == binary_op::Divide || op == binary_op::Modulo) && b.v == 0) divide_by_zero();
    switch(op){
        case binary_op::Add: return value(decimal_t{a.v + b.v});
        case binary_op::Subtract: return value(decimal_t{a.v - b.v});
        case binary_op::Multiply: return value(decimal_t{a.v * b.v});
        case binary_op::Divide: return value(decimal_t{a.v / b.v});
        case binary_op::Modulo: return value(decimal_t{std::fmod(a.v, b.v)});
        default:
            throw std::logic_error("not an arithmetic operator");
    }
}

date_time shift(date_time d, int64_t ticks){
    try {
        return d.add_ticks(ticks);
    } catch(const std::out_of_range&){
        throw evaluation_error(codes::overflow, "The added or subtracted value results in an un-representable DateTime.");
    }
}

value arithmetic(binary_op op, const value& l, const value& r){
    if(l.is_null() || r.is_null()) return value{};
    if(l.is<date_time>()){
        if(r.is<time_span>()){
            int64_t t = r.as<time_span>().ticks;
            return value(shift(l.as<date_time>(), op == binary_op::Add ? t : -t));
        }
        return value(time_span{l.as<date_time>().ticks - r.as<date_time>().ticks});
    }
    if(l.is<time_span>()){
        int64_t a = l.as<time_span>().ticks, b = r.as<time_span>().ticks, out = 0;
        bool ovf = op == binary_op::Add ? __builtin_add_overflow(a, b, &out) : __builtin_sub_overflow(a, b, &out);
        if(ovf) throw evaluation_error(codes::overflow, "TimeSpan overflowed because the duration is too long.");
        return value(time_span{out});
    }
    return std::visit([&](const auto& a) -> value {
        using A = std::decay_t<decltype(a)>;
        if constexpr(std::is_same_v<A, int32_t> || std::is_same_v<A, uint32_t> ||
                     std::is_same_v<A, int64_t> || std::is_same_v<A, uint64_t>)
            return integer_arith<A>(op, a, r.as<A>());
        else if constexpr(std::is_same_v<A, float> || std::is_same_v<A, double>)
            return real_arith<A>(op, a, r.as<A>());
        else if constexpr(std::is_same_v<A, decimal_t>)
            return decimal_arith(op, a, r.as<decimal_t>());
        else
            throw std::logic_error("operands have no arithmetic operator");
    }, l.v);
}

value negate(const value& v){
    if(v.is_null()) return v;
    return std::visit([](const auto& a) -> value {
        using A = std::decay_t<decltype(a)>;
        if constexpr(std::is_same_v<A, int32_t> || std::is_same_v<A, int64_t>)
            return value(static_cast<A>(0 - static_cast<std::make_unsigned_t<A>>(a)));
        else if constexpr(std::is_same_v<A, float> || std::is_same_v<A, double>)
            return value(-a);
        else if constexpr(std::is_same_v<A, decimal_t>)
            return value(decimal_t{-a.v});
        else
            throw std::logic_error("operand has no negation operator");
    }, v.v);
}

bool compare(binary_op op, const value& l, const value& r){
    switch(op){
        case binary_op::Equal:
            if(l.is_null() || r.is_null()) return l.is_null() && r.is_null();
            return values_equal(l, r);
        case binary_op::NotEqual:
            if(l.is_null() || r.is_null()) return !(l.is_null() && r.is_null());
            return !values_equal(l, r);
        default:
            break;
    }
    // lifted relational operators are false when either side is null
    if(l.is_null() || r.is_null()) return false;
    // NaN compares false both ways
    if((l.is<double>() && std::isnan(l.as<double>())) || (r.is<double>() && std::isnan(r.as<double>()))) return false;
    if((l.is<float>() && std::isnan(l.as<float>())) || (r.is<float>() && std::isnan(r.as<float>()))) return false;
    int c = compare_values(l, r);
    switch(op){
        case binary_op::Less: return c < 0;
        case binary_op::LessEqual: return c <= 0;
        case binary_op::Greater: return c > 0;
        default: return c >= 0;
    }
}

const value_sequence& as_sequence(const value& v){
    if(v.is_null()) null_reference();
    return *v.as<sequence_ref>();
}

bool truthy(const value& v){ return !v.is_null() && v.as<bool>(); }

value sum_of(const std::vector<value>& items, type_ref t){
    switch(non_nullable(t)->kind){
        case type_kind::Int32: {
            int32_t acc = 0;
            for(const auto& v : items)
                if(!v.is_null() && __builtin_add_overflow(acc, v.as<int32_t>(), &acc)) overflow();
            return value(acc);
        }
        case type_kind::Int64: {
            int64_t acc = 0;
            for(const auto& v : items)
                if(!v.is_null() && __builtin_add_overflow(acc, v.as<int64_t>(), &acc)) overflow();
            return value(acc);
        }
        case type_kind::Single: {
            double acc = 0;
            for(const auto& v : items) if(!v.is_null()) acc += v.as<float>();
            return value(static_cast<float>(acc));
        }
        case type_kind::Double: {
            double acc = 0;
            for(const auto& v : items) if(!v.is_null()) acc += v.as<double>();
            return value(acc);
        }
        default: {
            long double acc = 0;
            for(const auto& v : items) if(!v.is_null()) acc += v.as<decimal_t>().v;
            return value(decimal_t{acc});
        }
    }
}

value average_of(const std::vector<value>& items, type_ref selector, type_ref result){
    long double acc = 0;
    size_t n = 0;
    for(const auto& v : items){
        if(v.is_null()) continue;
        acc += to_long_double(v);
        ++n;
    }
    if(n == 0){
        if(is_nullable(selector)) return value{};
        no_elements();
    }
    long double avg = acc / (long double)n;
    switch(non_nullable(result)->kind){
        case type_kind::Single: return value(static_cast<float>(avg));
        case type_kind::Decimal: return value(decimal_t{avg});
        default: return value(static_cast<double>(avg));
    }
}

value extreme_of(const std::vector<value>& items, type_ref t, bool want_max){
    const value* best = nullptr;
    for(const auto& v : items){
        if(v.is_null()) continue;
        if(!best){ best = &v; continue; }
        int c = compare_values(v, *best);
        if(want_max ? c > 0 : c < 0) best = &v;
    }
    if(best) return *best;
    if(is_value_type(t) && !is_nullable(t)) no_elements();
    return value{};
}

value evaluate_aggregate(const aggregate_node& n, type_ref result, frame& f){
    const value source = evaluate(*n.source, f);
    const value_sequence& seq = as_sequence(source);

    // applies the body to each element in its own scope
    std::vector<value> mapped;
    if(n.body){
        frame_scope scope(f);
        mapped.reserve(seq.items.size());
        for(const auto& item : seq.items){
            f.push(n.element.get(), item);
            mapped.push_back(evaluate(*n.body, f));
            f.pop();
        }
    }

    switch(n.fn){
        case aggregate_fn::Where: {
            std::vector<value> kept;
            for(size_t i = 0; i < seq.items.size(); ++i)
                if(truthy(mapped[i])) kept.push_back(seq.items[i]);
            return make_sequence(seq.element, std::move(kept));
        }
        case aggregate_fn::Any:
            if(!n.body) return value(!seq.items.empty());
            for(const auto& m : mapped) if(truthy(m)) return value(true);
            return value(false);
        case aggregate_fn::All:
            for(const auto& m : mapped) if(!truthy(m)) return value(false);
            return value(true);
        case aggregate_fn::Count: {
            if(!n.body) return value(static_cast<int32_t>(seq.items.size()));
            int32_t c = 0;
            for(const auto& m : mapped) if(truthy(m)) ++c;
            return value(c);
        }
        case aggregate_fn::Min: return extreme_of(mapped, n.body->type, false);
        case aggregate_fn::Max: return extreme_of(mapped, n.body->type, true);
        case aggregate_fn::Sum: return sum_of(mapped, n.body->type);
        case aggregate_fn::Average: return average_of(mapped, n.body->type, result);
    }
    return value{};
}

value evaluate_call(const call_node& n, frame& f){
    value instance;
    if(n.instance){
        instance = evaluate(*n.instance, f);
        if(instance.is_null()){
            // ToString on an empty nullable is the empty string
            if(n.fn->owner == nullptr && is_nullable(n.instance->type)) return value(std::string());
            null_reference();
        }
    }
    std::vector<value> args;
    args.reserve(n.args.size());
    for(const auto& a : n.args) args.push_back(evaluate(*a, f));
    try {
        return n.fn->impl(instance, args);
    } catch(const std::out_of_range& ex){
        throw evaluation_error(codes::invalid_argument, ex.what());
    }
}

value evaluate_index(const index_node& n, frame& f){
    value target = evaluate(*n.target, f);
    if(target.is_null()) null_reference();
    value index = evaluate(*n.index, f);
    const int32_t i = index.as<int32_t>();
    if(target.is<std::string>()){
        const std::string& s = target.as<std::string>();
        if(i < 0 || (size_t)i >= s.size()) throw evaluation_error(codes::index_out_of_range, "Index was outside the bounds of the array.");
        return value(s[(size_t)i]);
    }
    const value_sequence& seq = as_sequence(target);
    if(i < 0 || (size_t)i >= seq.items.size()) throw evaluation_error(codes::index_out_of_range, "Index was outside the bounds of the array.");
    return seq.items[(size_t)i];
}

value evaluate_logical(const binary_node& n, frame& f){
    const bool and_also = n.op == binary_op::AndAlso;
    value l = evaluate(*n.left, f);
    if(!l.is_null() && l.as<bool>() != and_also) return l;   // false && ..., true || ...
    value r = evaluate(*n.right, f);
    if(l.is_null()){
        // three-valued logic for bool?
        if(!r.is_null() && r.as<bool>() != and_also) return r;
        return value{};
    }
    return r;
}

} // namespace

value evaluate(const expr& e, frame& f){
    return std::visit([&](const auto& n) -> value {
        using N = std::decay_t<decltype(n)>;
        if constexpr(std::is_same_v<N, constant_node>){
            return n.val;
        } else if constexpr(std::is_same_v<N, param_node>){
            return f.lookup(n.param.get());
        } else if constexpr(std::is_same_v<N, member_node>){
            value instance = evaluate(*n.instance, f);
            if(instance.is_null()) null_reference();
            const record_ref& r = instance.as<record_ref>();
            return r.type->get(r.object, n.index);
        } else if constexpr(std::is_same_v<N, index_node>){
            return evaluate_index(n, f);
        } else if constexpr(std::is_same_v<N, unary_node>){
            value v = evaluate(*n.operand, f);
            if(n.op == unary_op::Negate) return negate(v);
            if(v.is_null()) return v;
            return value(!v.as<bool>());
        } else if constexpr(std::is_same_v<N, binary_node>){
            switch(n.op){
                case binary_op::AndAlso: case binary_op::OrElse:
                    return evaluate_logical(n, f);
                case binary_op::Equal: case binary_op::NotEqual:
                case binary_op::Less: case binary_op::LessEqual:
                case binary_op::Greater: case binary_op::GreaterEqual: {
                    value l = evaluate(*n.left, f);
                    value r = evaluate(*n.right, f);
                    return value(compare(n.op, l, r));
                }
                case binary_op::Concat: {
                    value l = evaluate(*n.left, f);
                    value r = evaluate(*n.right, f);
                    return value(to_display(l) + to_display(r));
                }
                default: {
                    value l = evaluate(*n.left, f);
                    value r = evaluate(*n.right, f);
                    return arithmetic(n.op, l, r);
                }
            }
        } else if constexpr(std::is_same_v<N, conditional_node>){
            return truthy(evaluate(*n.test, f)) ? evaluate(*n.if_true, f) : evaluate(*n.if_false, f);
        } else if constexpr(std::is_same_v<N, convert_node>){
            return convert_value(evaluate(*n.operand, f), e.type, n.checked);
        } else if constexpr(std::is_same_v<N, coalesce_node>){
            value v = evaluate(*n.operand, f);
            return v.is_null() ? evaluate(*n.fallback, f) : v;
        } else if constexpr(std::is_same_v<N, call_node>){
            return evaluate_call(n, f);
        } else if constexpr(std::is_same_v<N, new_record_node>){
            const auto& props = n.record->properties();
            std::vector<value> fields;
            fields.reserve(props.size());
            for(const auto& p : props) fields.push_back(default_value(p.type));
            for(size_t i = 0; i < n.args.size(); ++i) fields[n.slots[i]] = evaluate(*n.args[i], f);
            return n.record->make(std::move(fields));
        } else if constexpr(std::is_same_v<N, new_array_node>){
            std::vector<value> items;
            items.reserve(n.items.size());
            for(const auto& i : n.items) items.push_back(evaluate(*i, f));
            return make_sequence(e.type->element, std::move(items));
        } else if constexpr(std::is_same_v<N, aggregate_node>){
            return evaluate_aggregate(n, e.type, f);
        } else if constexpr(std::is_same_v<N, invoke_node>){
            std::vector<value> args;
            args.reserve(n.args.size());
            for(const auto& a : n.args) args.push_back(evaluate(*a, f));
            frame_scope scope(f);
            for(size_t i = 0; i < args.size(); ++i) f.push(n.target->params[i].get(), std::move(args[i]));
            return evaluate(*n.target->body, f);
        }
    }, e.node);
}

value invoke(const lambda& l, const std::vector<value>& args){
    if(args.size() != l.params.size())
        throw std::invalid_argument("lambda expects " + std::to_string(l.params.size()) + " argument(s), got " + std::to_string(args.size()));
    frame f;
    for(size_t i = 0; i < args.size(); ++i) f.push(l.params[i].get(), args[i]);
    return evaluate(*l.body, f);
}

value convert_value(const value& v, type_ref target, bool checked){
    if(v.is_null()){
        if(!is_value_type(target) || is_nullable(target)) return v;
        throw evaluation_error(codes::null_reference, "Nullable object must have a value.");
    }
    type_ref t = non_nullable(target);
    switch(t->kind){
        case type_kind::Object: case type_kind::Null:
            return v;
        case type_kind::String:
            if(!v.is<std::string>()) invalid_cast();
            return v;
        case type_kind::Record:
            if(!v.is<record_ref>()) invalid_cast();
            return v;
        case type_kind::Sequence:
            if(!v.is<sequence_ref>()) invalid_cast();
            return v;
        case type_kind::Boolean:
            if(!v.is<bool>()) invalid_cast();
            return v;
        case type_kind::DateTime:
            if(!v.is<date_time>()) invalid_cast();
            return v;
        case type_kind::TimeSpan:
            if(!v.is<time_span>()) invalid_cast();
            return v;
        case type_kind::Guid:
            if(!v.is<guid>()) invalid_cast();
            return v;
        case type_kind::Single: case type_kind::Double: case type_kind::Decimal:
            return to_real(v, t->kind, checked);
        case type_kind::Static: case type_kind::Nullable:
            invalid_cast();
        default:
            return to_integral(v, t->kind, checked);
    }
}

long double to_long_double(const value& v){
    return std::visit([](const auto& x) -> long double {
        using X = std::decay_t<decltype(x)>;
        if constexpr(std::is_same_v<X, char>) return (long double)(unsigned char)x;
        else if constexpr(std::is_same_v<X, bool>) return x ? 1 : 0;
        else if constexpr(std::is_arithmetic_v<X>) return (long double)x;
        else if constexpr(std::is_same_v<X, decimal_t>) return x.v;
        else throw evaluation_error(codes::invalid_argument, "Specified cast is not valid.");
    }, v.v);
}

int64_t to_int64(const value& v){
    return std::visit([](const auto& x) -> int64_t {
        using X = std::decay_t<decltype(x)>;
        if constexpr(std::is_same_v<X, char>) return (int64_t)(unsigned char)x;
        else if constexpr(std::is_integral_v<X>) return (int64_t)x;
        else if constexpr(std::is_floating_point_v<X>) return (int64_t)x;
        else if constexpr(std::is_same_v<X, decimal_t>) return (int64_t)x.v;
        else throw evaluation_error(codes::invalid_argument, "Specified cast is not valid.");
    }, v.v);
}

uint64_t to_uint64(const value& v){
    return std::visit([](const auto& x) -> uint64_t {
        using X = std::decay_t<decltype(x)>;
        if constexpr(std::is_same_v<X, char>) return (uint64_t)(unsigned char)x;
        else if constexpr(std::is_integral_v<X>) return (uint64_t)x;
        else if constexpr(std::is_floating_point_v<X>) return (uint64_t)x;
        else if constexpr(std::is_same_v<X, decimal_t>) return (uint64_t)x.v;
        else throw evaluation_error(codes::invalid_argument, "Specified cast is not valid.");
    }, v.v);
}

} // namespace dynq
