#include "dynq/diagnostics.hpp"
#include "dynq/env.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace dynq {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string to_json(const query_error& e){
    std::ostringstream os;
    os<<"{\"code\":"<<json_escape(e.code())
      <<",\"message\":"<<json_escape(e.message())
      <<",\"position\":"<<e.position()
      <<",\"notes\":[";
    const auto& notes = e.notes();
    for(size_t i=0;i<notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(notes[i].message)
          <<",\"position\":"<<notes[i].position
          <<"}";
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const query_error& e){
    if(!detect_env().diag_json) return;
    auto js = to_json(e);
    std::fprintf(stderr, "%s\n", js.c_str());
}

std::string render_caret(const query_error& e, const std::string& source){
    std::ostringstream os;
    os<<"  "<<source<<"\n";
    if(e.position() >= 0){
        size_t col = std::min<size_t>((size_t)e.position(), source.size());
        os<<"  "<<std::string(col, ' ')<<"^\n";
    }
    os<<"error["<<e.code()<<"]: "<<e.message()<<"\n";
    for(const auto& n : e.notes()) os<<"note: "<<n.message<<"\n";
    return os.str();
}

namespace {
std::string lower(std::string s){
    for(char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}
}

size_t edit_distance(const std::string& a, const std::string& b){
    const size_t n=a.size(), m=b.size();
    if(n>64 || m>64) return (n>m? n-m : m-n) + 64; // keep bounded
    size_t dp[65][65];
    for(size_t i=0;i<=n;++i) dp[i][0]=i;
    for(size_t j=0;j<=m;++j) dp[0][j]=j;
    for(size_t i=1;i<=n;++i){
        for(size_t j=1;j<=m;++j){
            size_t cost = (a[i-1]==b[j-1])?0:1;
            dp[i][j] = std::min({ dp[i-1][j]+1, dp[i][j-1]+1, dp[i-1][j-1]+cost });
        }
    }
    return dp[n][m];
}

std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, size_t maxDist){
    std::vector<std::pair<size_t,std::string>> scored;
    const std::string t = lower(target);
    for(const auto& s : pool){
        size_t d = edit_distance(t, lower(s));
        if(d<=maxDist) scored.emplace_back(d, s);
    }
    std::stable_sort(scored.begin(), scored.end(), [](const auto& x, const auto& y){ return x.first < y.first; });
    std::vector<std::string> out;
    for(auto& p : scored){
        if(std::find(out.begin(), out.end(), p.second) != out.end()) continue;
        out.push_back(std::move(p.second));
        if(out.size()==5) break;
    }
    return out;
}

void append_suggestions(query_error& e, const std::string& target, const std::vector<std::string>& pool){
    if(!detect_env().suggest) return;
    auto c = fuzzy_candidates(target, pool);
    if(c.empty()) return;
    std::string msg = "did you mean ";
    for(size_t i=0;i<c.size(); ++i){
        if(i){ msg += (i+1==c.size()) ? " or " : ", "; }
        msg += c[i];
    }
    e.add_note(msg, e.position());
}

} // namespace dynq
