// Error taxonomy for the query language and the data-access layer
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace dynq {

// Extra context attached to a positional error (suggestions, expected/found pairs).
struct error_note { std::string message; int position=-1; };

// Root of every error raised while turning query text into an executable form.
// position is the 0-based character offset into the source text, -1 if not positional.
class query_error : public std::runtime_error {
public:
    query_error(std::string code, std::string message, int position)
        : std::runtime_error(format_what(message, position)),
          code_(std::move(code)), message_(std::move(message)), position_(position) {}

    const std::string& code() const { return code_; }
    const std::string& message() const { return message_; }
    int position() const { return position_; }
    const std::vector<error_note>& notes() const { return notes_; }
    void add_note(std::string message, int position=-1){ notes_.push_back(error_note{std::move(message), position}); }

private:
    static std::string format_what(const std::string& message, int position){
        if(position < 0) return message;
        return message + " (at index " + std::to_string(position) + ")";
    }
    std::string code_;
    std::string message_;
    int position_;
    std::vector<error_note> notes_;
};

// Invalid character sequence or unterminated literal.
struct lex_error : query_error { using query_error::query_error; };

// Grammar violation: unexpected token, unmatched parenthesis, unknown identifier.
struct parse_error : query_error { using query_error::query_error; };

// Overload resolution found no applicable signature.
struct incompatible_operands_error : parse_error { using parse_error::parse_error; };

// Overload resolution found several applicable signatures and none is most specific.
struct ambiguous_operator_error : parse_error { using parse_error::parse_error; };

// Member access, method call or indexer target not found on the resolved type.
struct unknown_member_error : parse_error { using parse_error::parse_error; };

// Runtime fault while executing a compiled expression (null reference, overflow, division by zero).
class evaluation_error : public std::runtime_error {
public:
    evaluation_error(std::string code, const std::string& message)
        : std::runtime_error(message), code_(std::move(code)) {}
    const std::string& code() const { return code_; }
private:
    std::string code_;
};

// Failure reported by the underlying entity store (key violation, missing entity).
struct store_error : std::runtime_error { using std::runtime_error::runtime_error; };

// Stable diagnostic codes.
namespace codes {
    // E01xx lexical
    inline constexpr const char* invalid_character = "E0101";
    inline constexpr const char* unterminated_string = "E0102";
    inline constexpr const char* digit_expected = "E0103";
    inline constexpr const char* invalid_integer_literal = "E0104";
    inline constexpr const char* invalid_real_literal = "E0105";
    inline constexpr const char* invalid_character_literal = "E0106";
    // E02xx grammar
    inline constexpr const char* syntax_error = "E0201";
    inline constexpr const char* expression_expected = "E0202";
    inline constexpr const char* token_expected = "E0203";
    inline constexpr const char* unknown_identifier = "E0204";
    inline constexpr const char* type_mismatch = "E0205";
    inline constexpr const char* no_it_in_scope = "E0206";
    inline constexpr const char* iif_arity = "E0207";
    inline constexpr const char* missing_as_clause = "E0208";
    inline constexpr const char* duplicate_identifier = "E0209";
    inline constexpr const char* no_nullable_form = "E0210";
    inline constexpr const char* lambda_arguments = "E0211";
    inline constexpr const char* placeholder_range = "E0212";
    // E03xx operator / conversion resolution
    inline constexpr const char* incompatible_operands = "E0301";
    inline constexpr const char* incompatible_operand = "E0302";
    inline constexpr const char* ambiguous_operator = "E0303";
    inline constexpr const char* first_expr_must_be_bool = "E0304";
    inline constexpr const char* both_types_convert = "E0305";
    inline constexpr const char* neither_type_converts = "E0306";
    inline constexpr const char* cannot_convert = "E0307";
    // E04xx member resolution
    inline constexpr const char* unknown_member = "E0401";
    inline constexpr const char* no_applicable_method = "E0402";
    inline constexpr const char* ambiguous_method = "E0403";
    inline constexpr const char* no_applicable_indexer = "E0404";
    inline constexpr const char* ambiguous_indexer = "E0405";
    inline constexpr const char* no_matching_constructor = "E0406";
    inline constexpr const char* ambiguous_constructor = "E0407";
    inline constexpr const char* no_applicable_aggregate = "E0408";
    inline constexpr const char* invalid_index = "E0409";
    // E05xx evaluation
    inline constexpr const char* null_reference = "E0501";
    inline constexpr const char* divide_by_zero = "E0502";
    inline constexpr const char* overflow = "E0503";
    inline constexpr const char* empty_sequence = "E0504";
    inline constexpr const char* index_out_of_range = "E0505";
    inline constexpr const char* invalid_argument = "E0506";
}

} // namespace dynq
