#include "dynq/lexer.hpp"
#include "dynq/errors.hpp"
#include <tao/pegtl.hpp>
#include <cctype>

namespace dynq {

namespace lex_grammar {
using namespace tao::pegtl;

struct ident_first : sor< ranges<'a','z','A','Z'>, one<'_','@'> > {};
struct ident_rest : ranges<'a','z','A','Z','0','9','_','_'> {};
struct identifier : seq< ident_first, star< ident_rest > > {};

// a doubled quote inside a literal stands for the quote itself
struct dq_string : seq< one<'"'>, star< sor< two<'"'>, not_one<'"'> > >, one<'"'> > {};
struct sq_string : seq< one<'\''>, star< sor< two<'\''>, not_one<'\''> > >, one<'\''> > {};
struct string_literal : sor< dq_string, sq_string > {};

struct int_suffix : sor< istring<'u','l'>, istring<'l','u'>, one<'u','U','l','L'> > {};
struct real_suffix : one<'f','F','d','D','m','M'> {};
struct fraction : seq< one<'.'>, star< digit > > {};
struct exponent : seq< one<'e','E'>, opt< one<'+','-'> >, star< digit > > {};
struct hex_number : seq< one<'0'>, one<'x','X'>, plus< xdigit >, opt< int_suffix > > {};
struct dec_number : seq< plus< digit >, opt< fraction >, opt< exponent >, opt< sor< real_suffix, int_suffix > > > {};
struct number : sor< hex_number, dec_number > {};

struct op_double_equal : two<'='> {};
struct op_not_equal : string<'!','='> {};
struct op_less_equal : string<'<','='> {};
struct op_greater_equal : string<'>','='> {};
struct op_less_greater : string<'<','>'> {};
struct op_and : two<'&'> {};
struct op_or : two<'|'> {};
struct two_char_op : sor< op_double_equal, op_not_equal, op_less_equal, op_greater_equal,
                          op_less_greater, op_and, op_or > {};

struct punct : one<'!','%','&','(',')','*','+',',','-','.','/',':','<','=','>','?','[',']','|','{','}'> {};

struct end_of_text : eof {};
struct token_body : sor< identifier, number, string_literal, two_char_op, punct > {};
struct next_token : seq< star< space >, sor< end_of_text, token_body > > {};

struct lex_state {
    size_t base = 0;   // offset of the input start within the full text
    token_kind kind = token_kind::End;
    size_t start = 0;
    std::string text;
};

template<typename Rule> struct action : nothing<Rule> {};

template<token_kind K> struct sets_kind {
    template<typename ActionInput>
    static void apply(const ActionInput&, lex_state& st){ st.kind = K; }
};

template<> struct action<identifier> : sets_kind<token_kind::Identifier> {};
template<> struct action<string_literal> : sets_kind<token_kind::StringLiteral> {};
template<> struct action<op_double_equal> : sets_kind<token_kind::DoubleEqual> {};
template<> struct action<op_not_equal> : sets_kind<token_kind::ExclamationEqual> {};
template<> struct action<op_less_equal> : sets_kind<token_kind::LessThanEqual> {};
template<> struct action<op_greater_equal> : sets_kind<token_kind::GreaterThanEqual> {};
template<> struct action<op_less_greater> : sets_kind<token_kind::LessGreater> {};
template<> struct action<op_and> : sets_kind<token_kind::DoubleAmpersand> {};
template<> struct action<op_or> : sets_kind<token_kind::DoubleBar> {};

template<> struct action<fraction> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        if(in.size() == 1)
            throw lex_error(codes::digit_expected, "Digit expected", (int)(st.base + in.position().byte + 1));
    }
};

template<> struct action<exponent> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        const std::string s = in.string();
        char last = s.back();
        if(last < '0' || last > '9')
            throw lex_error(codes::digit_expected, "Digit expected", (int)(st.base + in.position().byte + s.size()));
    }
};

template<> struct action<number> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        const std::string s = in.string();
        bool hex = s.size() > 1 && (s[1] == 'x' || s[1] == 'X');
        bool real = false;
        if(!hex){
            for(char c : s)
                if(c == '.' || c == 'e' || c == 'E') real = true;
            char last = s.back();
            if(last == 'f' || last == 'F' || last == 'd' || last == 'D' || last == 'm' || last == 'M') real = true;
        }
        st.kind = real ? token_kind::RealLiteral : token_kind::IntegerLiteral;
    }
};

template<> struct action<punct> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        switch(*in.begin()){
            case '!': st.kind = token_kind::Exclamation; break;
            case '%': st.kind = token_kind::Percent; break;
            case '&': st.kind = token_kind::Ampersand; break;
            case '(': st.kind = token_kind::OpenParen; break;
            case ')': st.kind = token_kind::CloseParen; break;
            case '*': st.kind = token_kind::Asterisk; break;
            case '+': st.kind = token_kind::Plus; break;
            case ',': st.kind = token_kind::Comma; break;
            case '-': st.kind = token_kind::Minus; break;
            case '.': st.kind = token_kind::Dot; break;
            case '/': st.kind = token_kind::Slash; break;
            case ':': st.kind = token_kind::Colon; break;
            case '<': st.kind = token_kind::LessThan; break;
            case '=': st.kind = token_kind::Equal; break;
            case '>': st.kind = token_kind::GreaterThan; break;
            case '?': st.kind = token_kind::Question; break;
            case '[': st.kind = token_kind::OpenBracket; break;
            case ']': st.kind = token_kind::CloseBracket; break;
            case '|': st.kind = token_kind::Bar; break;
            case '{': st.kind = token_kind::OpenBrace; break;
            case '}': st.kind = token_kind::CloseBrace; break;
        }
    }
};

template<> struct action<token_body> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        st.start = st.base + in.position().byte;
        st.text = in.string();
    }
};

template<> struct action<end_of_text> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, lex_state& st){
        st.kind = token_kind::End;
        st.start = st.base + in.position().byte;
        st.text.clear();
    }
};

} // namespace lex_grammar

const char* token_kind_name(token_kind k){
    switch(k){
        case token_kind::End: return "end of expression";
        case token_kind::Identifier: return "identifier";
        case token_kind::StringLiteral: return "string literal";
        case token_kind::IntegerLiteral: return "integer literal";
        case token_kind::RealLiteral: return "real literal";
        case token_kind::Exclamation: return "!";
        case token_kind::Percent: return "%";
        case token_kind::Ampersand: return "&";
        case token_kind::OpenParen: return "(";
        case token_kind::CloseParen: return ")";
        case token_kind::Asterisk: return "*";
        case token_kind::Plus: return "+";
        case token_kind::Comma: return ",";
        case token_kind::Minus: return "-";
        case token_kind::Dot: return ".";
        case token_kind::Slash: return "/";
        case token_kind::Colon: return ":";
        case token_kind::LessThan: return "<";
        case token_kind::Equal: return "=";
        case token_kind::GreaterThan: return ">";
        case token_kind::Question: return "?";
        case token_kind::OpenBracket: return "[";
        case token_kind::CloseBracket: return "]";
        case token_kind::Bar: return "|";
        case token_kind::OpenBrace: return "{";
        case token_kind::CloseBrace: return "}";
        case token_kind::ExclamationEqual: return "!=";
        case token_kind::DoubleAmpersand: return "&&";
        case token_kind::LessThanEqual: return "<=";
        case token_kind::LessGreater: return "<>";
        case token_kind::DoubleEqual: return "==";
        case token_kind::GreaterThanEqual: return ">=";
        case token_kind::DoubleBar: return "||";
    }
    return "?";
}

lexer::lexer(std::string_view text) : text_(text) { next(); }

void lexer::next(){
    using namespace lex_grammar;
    lex_state st;
    st.base = pos_;
    tao::pegtl::memory_input<> in(text_.data() + pos_, text_.size() - pos_, "query");
    bool ok = tao::pegtl::parse< next_token, action >(in, st);
    if(!ok){
        // skip the whitespace the failed match consumed to find the offending char
        size_t at = pos_;
        while(at < text_.size() && std::isspace((unsigned char)text_[at])) ++at;
        char c = at < text_.size() ? text_[at] : '\0';
        if(c == '"' || c == '\'')
            throw lex_error(codes::unterminated_string, "Unterminated string literal", (int)text_.size());
        throw lex_error(codes::invalid_character, std::string("Syntax error '") + c + "'", (int)at);
    }
    tok_.kind = st.kind;
    tok_.text = std::move(st.text);
    tok_.pos = (int)st.start;
    pos_ = (size_t)(in.current() - text_.data());
}

} // namespace dynq
