// Native tier: lowers the scalar subset of a lambda to machine code through
// LLVM ORC. Anything outside the subset stays with the interpreter.
#pragma once
#include "dynq/expression.hpp"
#include "dynq/value.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dynq {

// Status returned by generated code; faults are re-raised as evaluation_error.
enum native_status : int32_t {
    native_ok = 0,
    native_divide_by_zero = 1,
    native_overflow = 2
};

// int32_t fn(const int64_t* slots, int64_t* result). Each slot carries one
// member of the lambda parameter; scalars travel as their bit pattern
// widened to 64 bits.
using native_fn = int32_t (*)(const int64_t* slots, int64_t* result);

class native_lambda {
public:
    static constexpr size_t max_slots = 32;

    native_lambda(native_fn fn, std::vector<size_t> members, type_ref result)
        : fn_(fn), members_(std::move(members)), result_(result) {}

    value operator()(const value& it) const;
    // Record property indexes loaded into the slots, in slot order.
    const std::vector<size_t>& members() const { return members_; }

private:
    native_fn fn_;
    std::vector<size_t> members_;
    type_ref result_;
};

// Empty when every node of l is in the native subset, otherwise the reason.
std::string native_rejection(const lambda& l);
// nullptr when l is outside the subset or LLVM fails to build it.
std::shared_ptr<const native_lambda> compile_native(const lambda& l);

} // namespace dynq
