#include "wikitext/preprocess.hpp"
#include <string_view>

namespace wikitext {

namespace {

const char* const kLeftDoubleQuote = "\xE2\x80\x9C";  // “
const char* const kRightDoubleQuote = "\xE2\x80\x9D"; // ”
const char* const kLowDoubleQuote = "\xE2\x80\x9E";   // „
const char* const kLeftSingleQuote = "\xE2\x80\x98";  // ‘
const char* const kRightSingleQuote = "\xE2\x80\x99"; // ’
const char* const kLeftGuillemet = "\xC2\xAB";        // «
const char* const kRightGuillemet = "\xC2\xBB";       // »
const char* const kEllipsis = "\xE2\x80\xA6";         // …

// Replace every `open ... close` pair found within one line.
void replace_pairs(std::string& s, std::string_view open, std::string_view close,
                   const char* left, const char* right){
    std::string out;
    out.reserve(s.size());
    size_t i=0;
    while(i<s.size()){
        size_t o = s.find(open.data(), i, open.size());
        if(o==std::string::npos){ out.append(s, i, std::string::npos); break; }
        size_t eol = s.find('\n', o);
        size_t c = s.find(close.data(), o+open.size(), close.size());
        if(c==std::string::npos || (eol!=std::string::npos && c>eol)){
            out.append(s, i, o+open.size()-i);
            i = o+open.size();
            continue;
        }
        out.append(s, i, o-i);
        out += left;
        out.append(s, o+open.size(), c-(o+open.size()));
        out += right;
        i = c+close.size();
    }
    s.swap(out);
}

void replace_all(std::string& s, std::string_view from, const char* to){
    std::string out;
    out.reserve(s.size());
    size_t i=0;
    while(i<s.size()){
        size_t p = s.find(from.data(), i, from.size());
        if(p==std::string::npos){ out.append(s, i, std::string::npos); break; }
        out.append(s, i, p-i);
        out += to;
        i = p+from.size();
    }
    s.swap(out);
}

// `>>` inside a run of `>` starting in column 1 is a quote marker and is left alone.
bool in_quote_prefix(const std::string& s, size_t pos){
    size_t i = pos;
    while(i>0 && s[i-1]=='>') --i;
    return i==0 || s[i-1]=='\n';
}

void replace_guillemets(std::string& s){
    std::string out;
    out.reserve(s.size());
    size_t i=0;
    while(i<s.size()){
        if(i+1<s.size() && s[i]=='<' && s[i+1]=='<'){ out += kLeftGuillemet; i+=2; continue; }
        if(i+1<s.size() && s[i]=='>' && s[i+1]=='>' && !in_quote_prefix(s, i)){ out += kRightGuillemet; i+=2; continue; }
        out += s[i++];
    }
    s.swap(out);
}

} // namespace

void substitute_typography(std::string& text){
    replace_pairs(text, "``", "''", kLeftDoubleQuote, kRightDoubleQuote);
    replace_pairs(text, ",,", "''", kLowDoubleQuote, kRightDoubleQuote);
    replace_pairs(text, "`", "'", kLeftSingleQuote, kRightSingleQuote);
    replace_guillemets(text);
    replace_all(text, ". . .", kEllipsis);
    replace_all(text, "...", kEllipsis);
}

} // namespace wikitext
