#include "dynq/jit.hpp"
#include "dynq/env.hpp"
#include "dynq/errors.hpp"
#include "dynq/record.hpp"

#include <llvm/Config/llvm-config.h>
#include <llvm/ExecutionEngine/Orc/LLJIT.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Support/raw_ostream.h>

#include <array>
#include <cstdio>
#include <cstring>
#include <map>
#include <mutex>
#include <set>

namespace dynq {

namespace {

bool native_kind(type_ref t){
    if(!t || is_nullable(t)) return false;
    switch(t->kind){
        case type_kind::Boolean: case type_kind::Char: case type_kind::Single: case type_kind::Double: return true;
        default: return is_integral(t);
    }
}

bool is_real(type_ref t){ return t->kind == type_kind::Single || t->kind == type_kind::Double; }
// char is an unsigned 8-bit code unit
bool is_unsigned(type_ref t){ return t->kind == type_kind::Char || is_unsigned_integral(t); }

unsigned bit_width(type_ref t){
    switch(t->kind){
        case type_kind::Boolean: return 1;
        case type_kind::Char: case type_kind::SByte: case type_kind::Byte: return 8;
        case type_kind::Int16: case type_kind::UInt16: return 16;
        case type_kind::Int32: case type_kind::UInt32: case type_kind::Single: return 32;
        default: return 64;
    }
}

// Walks a lambda body and records the parameter members it reads.
struct subset_check {
    const parameter* param{nullptr};
    std::set<size_t> members;

    std::string operator()(const expr& e){
        if(!native_kind(e.type)) return "type " + type_name(e.type) + " has no native form";
        return std::visit([&](const auto& n) -> std::string {
            using N = std::decay_t<decltype(n)>;
            if constexpr(std::is_same_v<N, constant_node>){
                return {};
            } else if constexpr(std::is_same_v<N, member_node>){
                auto p = std::get_if<param_node>(&n.instance->node);
                if(!p || p->param.get() != param) return "member " + n.name + " is not read from the parameter";
                members.insert(n.index);
                return {};
            } else if constexpr(std::is_same_v<N, convert_node>){
                type_ref from = n.operand->type;
                if(n.checked) return "checked conversion";
                if(!native_kind(from) || from->kind == type_kind::Boolean) return "conversion from " + type_name(from);
                if(is_real(from) && !(from->kind == type_kind::Single && e.type->kind == type_kind::Double))
                    return "narrowing conversion from " + type_name(from);
                return (*this)(*n.operand);
            } else if constexpr(std::is_same_v<N, unary_node>){
                return (*this)(*n.operand);
            } else if constexpr(std::is_same_v<N, binary_node>){
                if(n.op == binary_op::Concat) return "string concatenation";
                std::string why = (*this)(*n.left);
                return why.empty() ? (*this)(*n.right) : why;
            } else if constexpr(std::is_same_v<N, conditional_node>){
                std::string why = (*this)(*n.test);
                if(why.empty()) why = (*this)(*n.if_true);
                if(why.empty()) why = (*this)(*n.if_false);
                return why;
            } else {
                return "node outside the native subset";
            }
        }, e.node);
    }
};

class codegen {
public:
    codegen(llvm::LLVMContext& ctx, llvm::Module& m, const parameter* param)
        : ctx_(ctx), m_(m), b_(ctx), param_(param) {}

    llvm::Function* emit(const lambda& l, const std::string& name){
        llvm::Type* i64 = b_.getInt64Ty();
        llvm::Type* ptr = llvm::PointerType::getUnqual(i64);
        auto* fty = llvm::FunctionType::get(b_.getInt32Ty(), {ptr, ptr}, false);
        fn_ = llvm::Function::Create(fty, llvm::Function::ExternalLinkage, name, m_);
        auto arg = fn_->arg_begin();
        slots_ = &*arg;
        slots_->setName("slots");
        llvm::Value* result = &*(++arg);
        result->setName("result");
        b_.SetInsertPoint(llvm::BasicBlock::Create(ctx_, "entry", fn_));
        llvm::Value* v = gen(*l.body);
        b_.CreateStore(to_bits(v, l.body->type), result);
        b_.CreateRet(b_.getInt32(native_ok));
        return fn_;
    }

    std::vector<size_t> members() const {
        std::vector<size_t> out(slot_of_.size());
        for(const auto& [member, slot] : slot_of_) out[slot] = member;
        return out;
    }

private:
    llvm::Type* llvm_type(type_ref t){
        switch(t->kind){
            case type_kind::Single: return b_.getFloatTy();
            case type_kind::Double: return b_.getDoubleTy();
            default: return b_.getIntNTy(bit_width(t));
        }
    }

    llvm::Value* from_bits(llvm::Value* raw, type_ref t){
        switch(t->kind){
            case type_kind::Boolean: return b_.CreateICmpNE(raw, b_.getInt64(0));
            case type_kind::Single: return b_.CreateBitCast(b_.CreateTrunc(raw, b_.getInt32Ty()), b_.getFloatTy());
            case type_kind::Double: return b_.CreateBitCast(raw, b_.getDoubleTy());
            default:
                return bit_width(t) == 64 ? raw : b_.CreateTrunc(raw, llvm_type(t));
        }
    }

    llvm::Value* to_bits(llvm::Value* v, type_ref t){
        llvm::Type* i64 = b_.getInt64Ty();
        switch(t->kind){
            case type_kind::Boolean: return b_.CreateZExt(v, i64);
            case type_kind::Single: return b_.CreateZExt(b_.CreateBitCast(v, b_.getInt32Ty()), i64);
            case type_kind::Double: return b_.CreateBitCast(v, i64);
            default:
                if(bit_width(t) == 64) return v;
                return is_unsigned(t) ? b_.CreateZExt(v, i64) : b_.CreateSExt(v, i64);
        }
    }

    llvm::Value* load_member(size_t index, type_ref t){
        auto found = slot_of_.find(index);
        unsigned slot = found != slot_of_.end() ? found->second : (unsigned)slot_of_.size();
        if(found == slot_of_.end()) slot_of_.emplace(index, slot);
        llvm::Value* at = b_.CreateConstInBoundsGEP1_64(b_.getInt64Ty(), slots_, slot);
        return from_bits(b_.CreateLoad(b_.getInt64Ty(), at), t);
    }

    llvm::Value* constant(const value& v, type_ref t){
        return std::visit([&](const auto& x) -> llvm::Value* {
            using X = std::decay_t<decltype(x)>;
            if constexpr(std::is_same_v<X, bool>) return b_.getInt1(x);
            else if constexpr(std::is_same_v<X, char>) return b_.getInt8((uint8_t)x);
            else if constexpr(std::is_integral_v<X>) return llvm::ConstantInt::get(llvm_type(t), (uint64_t)x, std::is_signed_v<X>);
            else if constexpr(std::is_floating_point_v<X>) return llvm::ConstantFP::get(llvm_type(t), (double)x);
            else throw std::logic_error("constant has no native form");
        }, v.v);
    }

    llvm::Value* convert(llvm::Value* v, type_ref from, type_ref to){
        if(from == to) return v;
        if(is_real(from)) return to->kind == type_kind::Double ? b_.CreateFPExt(v, b_.getDoubleTy()) : v;
        if(is_real(to)) return is_unsigned(from) ? b_.CreateUIToFP(v, llvm_type(to)) : b_.CreateSIToFP(v, llvm_type(to));
        unsigned wf = bit_width(from), wt = bit_width(to);
        if(wt > wf) return is_unsigned(from) ? b_.CreateZExt(v, llvm_type(to)) : b_.CreateSExt(v, llvm_type(to));
        if(wt < wf) return b_.CreateTrunc(v, llvm_type(to));
        return v;
    }

    // Leaves the function with `status` when fault holds.
    void guard(llvm::Value* fault, native_status status){
        llvm::BasicBlock* bad = llvm::BasicBlock::Create(ctx_, "fault", fn_);
        llvm::BasicBlock* ok = llvm::BasicBlock::Create(ctx_, "ok", fn_);
        b_.CreateCondBr(fault, bad, ok);
        b_.SetInsertPoint(bad);
        b_.CreateRet(b_.getInt32(status));
        b_.SetInsertPoint(ok);
    }

    llvm::Value* arithmetic(binary_op op, llvm::Value* l, llvm::Value* r, type_ref t){
        if(is_real(t)){
            switch(op){
                case binary_op::Add: return b_.CreateFAdd(l, r);
                case binary_op::Subtract: return b_.CreateFSub(l, r);
                case binary_op::Multiply: return b_.CreateFMul(l, r);
                case binary_op::Divide: return b_.CreateFDiv(l, r);
                default: return b_.CreateFRem(l, r);
            }
        }
        switch(op){
            case binary_op::Add: return b_.CreateAdd(l, r);
            case binary_op::Subtract: return b_.CreateSub(l, r);
            case binary_op::Multiply: return b_.CreateMul(l, r);
            default: break;
        }
        llvm::Type* ty = llvm_type(t);
        guard(b_.CreateICmpEQ(r, llvm::ConstantInt::get(ty, 0)), native_divide_by_zero);
        if(is_unsigned(t)) return op == binary_op::Divide ? b_.CreateUDiv(l, r) : b_.CreateURem(l, r);
        llvm::Value* min = llvm::ConstantInt::get(ty, llvm::APInt::getSignedMinValue(bit_width(t)));
        llvm::Value* minus_one = llvm::ConstantInt::get(ty, (uint64_t)-1, true);
        guard(b_.CreateAnd(b_.CreateICmpEQ(l, min), b_.CreateICmpEQ(r, minus_one)), native_overflow);
        return op == binary_op::Divide ? b_.CreateSDiv(l, r) : b_.CreateSRem(l, r);
    }

    llvm::Value* comparison(binary_op op, llvm::Value* l, llvm::Value* r, type_ref t){
        using P = llvm::CmpInst::Predicate;
        if(is_real(t)){
            P p = P::FCMP_OEQ;
            switch(op){
                case binary_op::NotEqual: p = P::FCMP_UNE; break;
                case binary_op::Less: p = P::FCMP_OLT; break;
                case binary_op::LessEqual: p = P::FCMP_OLE; break;
                case binary_op::Greater: p = P::FCMP_OGT; break;
                case binary_op::GreaterEqual: p = P::FCMP_OGE; break;
                default: break;
            }
            return b_.CreateFCmp(p, l, r);
        }
        const bool u = is_unsigned(t);
        P p = P::ICMP_EQ;
        switch(op){
            case binary_op::NotEqual: p = P::ICMP_NE; break;
            case binary_op::Less: p = u ? P::ICMP_ULT : P::ICMP_SLT; break;
            case binary_op::LessEqual: p = u ? P::ICMP_ULE : P::ICMP_SLE; break;
            case binary_op::Greater: p = u ? P::ICMP_UGT : P::ICMP_SGT; break;
            case binary_op::GreaterEqual: p = u ? P::ICMP_UGE : P::ICMP_SGE; break;
            default: break;
        }
        return b_.CreateICmp(p, l, r);
    }

    // && and || evaluate the right side only when it decides the result
    llvm::Value* logical(const binary_node& n){
        const bool and_also = n.op == binary_op::AndAlso;
        llvm::Value* l = gen(*n.left);
        llvm::BasicBlock* lhs_end = b_.GetInsertBlock();
        llvm::BasicBlock* rhs = llvm::BasicBlock::Create(ctx_, and_also ? "and.rhs" : "or.rhs", fn_);
        llvm::BasicBlock* merge = llvm::BasicBlock::Create(ctx_, and_also ? "and.end" : "or.end", fn_);
        if(and_also) b_.CreateCondBr(l, rhs, merge);
        else b_.CreateCondBr(l, merge, rhs);
        b_.SetInsertPoint(rhs);
        llvm::Value* r = gen(*n.right);
        llvm::BasicBlock* rhs_end = b_.GetInsertBlock();
        b_.CreateBr(merge);
        b_.SetInsertPoint(merge);
        llvm::PHINode* phi = b_.CreatePHI(b_.getInt1Ty(), 2);
        phi->addIncoming(b_.getInt1(!and_also), lhs_end);
        phi->addIncoming(r, rhs_end);
        return phi;
    }

    llvm::Value* conditional(const conditional_node& n, type_ref t){
        llvm::Value* test = gen(*n.test);
        llvm::BasicBlock* then_bb = llvm::BasicBlock::Create(ctx_, "cond.true", fn_);
        llvm::BasicBlock* else_bb = llvm::BasicBlock::Create(ctx_, "cond.false", fn_);
        llvm::BasicBlock* merge = llvm::BasicBlock::Create(ctx_, "cond.end", fn_);
        b_.CreateCondBr(test, then_bb, else_bb);
        b_.SetInsertPoint(then_bb);
        llvm::Value* a = gen(*n.if_true);
        llvm::BasicBlock* then_end = b_.GetInsertBlock();
        b_.CreateBr(merge);
        b_.SetInsertPoint(else_bb);
        llvm::Value* c = gen(*n.if_false);
        llvm::BasicBlock* else_end = b_.GetInsertBlock();
        b_.CreateBr(merge);
        b_.SetInsertPoint(merge);
        llvm::PHINode* phi = b_.CreatePHI(llvm_type(t), 2);
        phi->addIncoming(a, then_end);
        phi->addIncoming(c, else_end);
        return phi;
    }

    llvm::Value* gen(const expr& e){
        return std::visit([&](const auto& n) -> llvm::Value* {
            using N = std::decay_t<decltype(n)>;
            if constexpr(std::is_same_v<N, constant_node>){
                return constant(n.val, e.type);
            } else if constexpr(std::is_same_v<N, member_node>){
                return load_member(n.index, e.type);
            } else if constexpr(std::is_same_v<N, convert_node>){
                return convert(gen(*n.operand), n.operand->type, e.type);
            } else if constexpr(std::is_same_v<N, unary_node>){
                llvm::Value* v = gen(*n.operand);
                if(n.op == unary_op::Not) return b_.CreateNot(v);
                return is_real(e.type) ? b_.CreateFNeg(v) : b_.CreateNeg(v);
            } else if constexpr(std::is_same_v<N, binary_node>){
                switch(n.op){
                    case binary_op::AndAlso: case binary_op::OrElse:
                        return logical(n);
                    case binary_op::Equal: case binary_op::NotEqual:
                    case binary_op::Less: case binary_op::LessEqual:
                    case binary_op::Greater: case binary_op::GreaterEqual: {
                        llvm::Value* l = gen(*n.left);
                        llvm::Value* r = gen(*n.right);
                        return comparison(n.op, l, r, n.left->type);
                    }
                    default: {
                        llvm::Value* l = gen(*n.left);
                        llvm::Value* r = gen(*n.right);
                        return arithmetic(n.op, l, r, e.type);
                    }
                }
            } else if constexpr(std::is_same_v<N, conditional_node>){
                return conditional(n, e.type);
            } else {
                throw std::logic_error("node outside the native subset");
            }
        }, e.node);
    }

    llvm::LLVMContext& ctx_;
    llvm::Module& m_;
    llvm::IRBuilder<> b_;
    const parameter* param_;
    llvm::Function* fn_{nullptr};
    llvm::Value* slots_{nullptr};
    std::map<size_t, unsigned> slot_of_;
};

// One LLJIT instance per process; modules are added under the mutex.
struct engine {
    std::unique_ptr<llvm::orc::LLJIT> jit;
    std::string error;
    std::mutex mu;
    uint64_t counter{0};
};

engine& shared_engine(){
    static engine e;
    static std::once_flag once;
    std::call_once(once, []{
        llvm::InitializeNativeTarget();
        llvm::InitializeNativeTargetAsmPrinter();
        auto jit = llvm::orc::LLJITBuilder().create();
        if(!jit){ e.error = llvm::toString(jit.takeError()); return; }
        e.jit = std::move(*jit);
    });
    return e;
}

int64_t encode(const value& v){
    return std::visit([](const auto& x) -> int64_t {
        using X = std::decay_t<decltype(x)>;
        if constexpr(std::is_same_v<X, bool>) return x ? 1 : 0;
        else if constexpr(std::is_same_v<X, char>) return (int64_t)(uint8_t)x;
        else if constexpr(std::is_integral_v<X>) return (int64_t)x;
        else if constexpr(std::is_same_v<X, float>){ uint32_t b; std::memcpy(&b, &x, sizeof b); return (int64_t)b; }
        else if constexpr(std::is_same_v<X, double>){ int64_t b; std::memcpy(&b, &x, sizeof b); return b; }
        else throw evaluation_error(codes::invalid_argument, "Specified cast is not valid.");
    }, v.v);
}

value decode(int64_t bits, type_ref t){
    switch(t->kind){
        case type_kind::Boolean: return value(bits != 0);
        case type_kind::Char: return value((char)(uint8_t)bits);
        case type_kind::SByte: return value((int8_t)bits);
        case type_kind::Byte: return value((uint8_t)bits);
        case type_kind::Int16: return value((int16_t)bits);
        case type_kind::UInt16: return value((uint16_t)bits);
        case type_kind::Int32: return value((int32_t)bits);
        case type_kind::UInt32: return value((uint32_t)bits);
        case type_kind::Int64: return value(bits);
        case type_kind::UInt64: return value((uint64_t)bits);
        case type_kind::Single: { uint32_t b = (uint32_t)bits; float f; std::memcpy(&f, &b, sizeof f); return value(f); }
        default: { double d; std::memcpy(&d, &bits, sizeof d); return value(d); }
    }
}

} // namespace

value native_lambda::operator()(const value& it) const {
    if(it.is_null()) throw evaluation_error(codes::null_reference, "null reference");
    const record_ref& r = it.as<record_ref>();
    std::array<int64_t, max_slots> slots{};
    for(size_t i = 0; i < members_.size(); ++i) slots[i] = encode(r.type->get(r.object, members_[i]));
    int64_t out = 0;
    switch(fn_(slots.data(), &out)){
        case native_divide_by_zero: throw evaluation_error(codes::divide_by_zero, "Attempted to divide by zero.");
        case native_overflow: throw evaluation_error(codes::overflow, "Arithmetic operation resulted in an overflow.");
        default: break;
    }
    return decode(out, result_);
}

std::string native_rejection(const lambda& l){
    if(l.params.size() != 1 || !is_record(l.params[0]->type)) return "lambda does not take a single record parameter";
    subset_check check;
    check.param = l.params[0].get();
    std::string why = check(*l.body);
    if(why.empty() && check.members.size() > native_lambda::max_slots) why = "too many members";
    return why;
}

std::shared_ptr<const native_lambda> compile_native(const lambda& l){
    const query_env env = detect_env();
    std::string why = native_rejection(l);
    if(!why.empty()){
        if(env.debug_jit) std::fprintf(stderr, "[dbg][jit] interpreter: %s\n", why.c_str());
        return nullptr;
    }
    engine& eng = shared_engine();
    if(!eng.jit){
        if(env.debug_jit) std::fprintf(stderr, "[dbg][jit] engine unavailable: %s\n", eng.error.c_str());
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(eng.mu);
    const std::string name = "dynq_fn_" + std::to_string(++eng.counter);
    auto ctx = std::make_unique<llvm::LLVMContext>();
    auto mod = std::make_unique<llvm::Module>(name, *ctx);
    codegen cg(*ctx, *mod, l.params[0].get());
    llvm::Function* fn = cg.emit(l, name);
    if(llvm::verifyFunction(*fn, &llvm::errs())){
        if(env.debug_jit) std::fprintf(stderr, "[dbg][jit] %s failed verification\n", name.c_str());
        return nullptr;
    }
    if(env.debug_jit){
        std::fprintf(stderr, "[dbg][jit] compiling %s: %s\n", name.c_str(), to_string(l).c_str());
        mod->print(llvm::errs(), nullptr);
    }
    std::vector<size_t> members = cg.members();
    if(auto err = eng.jit->addIRModule(llvm::orc::ThreadSafeModule(std::move(mod), std::move(ctx)))){
        std::string msg = llvm::toString(std::move(err));
        if(env.debug_jit) std::fprintf(stderr, "[dbg][jit] failed to add module %s: %s\n", name.c_str(), msg.c_str());
        return nullptr;
    }
    auto sym = eng.jit->lookup(name);
    if(!sym){
        std::string msg = llvm::toString(sym.takeError());
        if(env.debug_jit) std::fprintf(stderr, "[dbg][jit] lookup of %s failed: %s\n", name.c_str(), msg.c_str());
        return nullptr;
    }
#if LLVM_VERSION_MAJOR >= 15
    native_fn entry = sym->toPtr<native_fn>();
#else
    native_fn entry = reinterpret_cast<native_fn>(static_cast<uintptr_t>(sym->getAddress()));
#endif
    return std::make_shared<const native_lambda>(entry, std::move(members), l.result_type());
}

} // namespace dynq
