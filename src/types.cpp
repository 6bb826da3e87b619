#include "dynq/types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace dynq {

namespace {
std::string lower(std::string_view s){
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return out;
}
}

type_context& type_context::instance(){
    static type_context ctx;
    return ctx;
}

type_context::type_context(){
    // seed base types; names double as the lookup keys for type access
    seed(type_kind::Null, "null");
    seed(type_kind::Object, "Object");
    seed(type_kind::Boolean, "Boolean");
    seed(type_kind::Char, "Char");
    seed(type_kind::String, "String");
    seed(type_kind::SByte, "SByte");
    seed(type_kind::Byte, "Byte");
    seed(type_kind::Int16, "Int16");
    seed(type_kind::UInt16, "UInt16");
    seed(type_kind::Int32, "Int32");
    seed(type_kind::UInt32, "UInt32");
    seed(type_kind::Int64, "Int64");
    seed(type_kind::UInt64, "UInt64");
    seed(type_kind::Single, "Single");
    seed(type_kind::Double, "Double");
    seed(type_kind::Decimal, "Decimal");
    seed(type_kind::DateTime, "DateTime");
    seed(type_kind::TimeSpan, "TimeSpan");
    seed(type_kind::Guid, "Guid");
    names_.erase("null");

    static const std::pair<const char*, type_kind> aliases[] = {
        {"object", type_kind::Object}, {"bool", type_kind::Boolean}, {"char", type_kind::Char},
        {"string", type_kind::String}, {"sbyte", type_kind::SByte}, {"byte", type_kind::Byte},
        {"short", type_kind::Int16}, {"ushort", type_kind::UInt16}, {"int", type_kind::Int32},
        {"uint", type_kind::UInt32}, {"long", type_kind::Int64}, {"ulong", type_kind::UInt64},
        {"float", type_kind::Single}, {"double", type_kind::Double}, {"decimal", type_kind::Decimal},
    };
    for(const auto& [alias, k] : aliases) names_.emplace(alias, get_base(k));

    math_ = std::make_unique<type>(type{type_kind::Static, "Math", nullptr, nullptr});
    convert_ = std::make_unique<type>(type{type_kind::Static, "Convert", nullptr, nullptr});
    names_["math"] = math_.get();
    names_["convert"] = convert_.get();
}

type_ref type_context::seed(type_kind k, const char* name){
    auto t = std::make_unique<type>();
    t->kind = k;
    t->name = name;
    type_ref r = t.get();
    base_[static_cast<int>(k)] = std::move(t);
    names_[lower(name)] = r;
    return r;
}

type_ref type_context::get_base(type_kind k) const {
    auto it = base_.find(static_cast<int>(k));
    if(it == base_.end()) throw std::invalid_argument("not a base type kind");
    return it->second.get();
}

type_ref type_context::get_nullable(type_ref underlying){
    if(!underlying || !is_value_type(underlying) || underlying->kind == type_kind::Nullable)
        throw std::invalid_argument("nullable form requires a non-nullable value type");
    std::lock_guard<std::mutex> lk(mu_);
    auto it = nullable_cache_.find(underlying);
    if(it != nullable_cache_.end()) return it->second.get();
    auto t = std::make_unique<type>();
    t->kind = type_kind::Nullable;
    t->name = underlying->name + "?";
    t->element = underlying;
    type_ref r = t.get();
    nullable_cache_.emplace(underlying, std::move(t));
    return r;
}

type_ref type_context::get_sequence(type_ref element){
    if(!element) throw std::invalid_argument("sequence element type is null");
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sequence_cache_.find(element);
    if(it != sequence_cache_.end()) return it->second.get();
    auto t = std::make_unique<type>();
    t->kind = type_kind::Sequence;
    t->name = "IEnumerable<" + type_name(element) + ">";
    t->element = element;
    type_ref r = t.get();
    sequence_cache_.emplace(element, std::move(t));
    return r;
}

std::optional<type_ref> type_context::find_predefined(std::string_view name) const {
    auto it = names_.find(lower(name));
    if(it == names_.end()) return std::nullopt;
    return it->second;
}

type_ref base_type(type_kind k){ return type_context::instance().get_base(k); }
type_ref nullable_of(type_ref t){ return type_context::instance().get_nullable(t); }
type_ref sequence_of(type_ref t){ return type_context::instance().get_sequence(t); }

bool is_nullable(type_ref t){ return t && t->kind == type_kind::Nullable; }
type_ref non_nullable(type_ref t){ return is_nullable(t) ? t->element : t; }

bool is_value_type(type_ref t){
    if(!t) return false;
    switch(t->kind){
        case type_kind::Null: case type_kind::Object: case type_kind::String:
        case type_kind::Static: case type_kind::Record: case type_kind::Sequence:
            return false;
        default:
            return true;
    }
}

bool is_signed_integral(type_ref t){
    switch(non_nullable(t)->kind){
        case type_kind::SByte: case type_kind::Int16: case type_kind::Int32: case type_kind::Int64: return true;
        default: return false;
    }
}

bool is_unsigned_integral(type_ref t){
    switch(non_nullable(t)->kind){
        case type_kind::Byte: case type_kind::UInt16: case type_kind::UInt32: case type_kind::UInt64: return true;
        default: return false;
    }
}

bool is_integral(type_ref t){ return is_signed_integral(t) || is_unsigned_integral(t); }

bool is_numeric(type_ref t){
    if(!t) return false;
    switch(non_nullable(t)->kind){
        case type_kind::Char: case type_kind::Single: case type_kind::Double: case type_kind::Decimal: return true;
        default: return is_integral(t);
    }
}

bool is_record(type_ref t){ return t && t->kind == type_kind::Record; }
bool is_sequence(type_ref t){ return t && t->kind == type_kind::Sequence; }

std::string type_name(type_ref t){
    if(!t) return "<none>";
    return t->name;
}

} // namespace dynq
