#pragma once
#include <tao/pegtl.hpp>

namespace wikitext::pegtl_front::grammar {
using namespace tao::pegtl;

// Line-start markers (bol: column 1 of a line)
struct heading_marker : seq< bol, rep_min_max< 1, 6, one< '+' > >, plus< blank > > {};
struct bullet_marker : seq< bol, star< one< ' ' > >, one< '*' >, plus< blank > > {};
struct numbered_marker : seq< bol, star< one< ' ' > >, one< '#' >, plus< blank > > {};
struct quote_marker : seq< bol, plus< one< '>' > >, sor< plus< blank >, at< eolf > > > {};
struct rule_marker : seq< bol, rep_min< 4, one< '-' > >, star< blank >, at< eolf > > {};

// Tables
struct column_title : string< '|', '|', '~' > {};
struct column : two< '|' > {};

// Links and blocks; longer markers first
struct link_open : string< '[', '[', '[' > {};
struct link_close : string< ']', ']', ']' > {};
struct block_end_open : string< '[', '[', '/' > {};
struct block_open : two< '[' > {};
struct block_close : two< ']' > {};
struct anchor_open : string< '[', '#' > {};
struct bracket_open : one< '[' > {};
struct bracket_close : one< ']' > {};
struct pipe : one< '|' > {};

// Formatting toggles
struct bold : two< '*' > {};
struct italics : two< '/' > {};
struct underline : two< '_' > {};
struct strikethrough : two< '-' > {};
struct superscript : two< '^' > {};
struct subscript : two< ',' > {};
struct mono_open : two< '{' > {};
struct mono_close : two< '}' > {};
struct raw_toggle : two< '@' > {};
struct raw_open : string< '@', '<' > {};
struct raw_close : string< '>', '@' > {};
struct color : two< '#' > {};

// Bare URLs
struct url_scheme : sor< istring< 'h', 't', 't', 'p', 's' >, istring< 'h', 't', 't', 'p' >, istring< 'f', 't', 'p' > > {};
struct url_char : not_one< ' ', '\t', '\n', '\r', '[', ']', '|', '"', '<', '>' > {};
struct url : seq< url_scheme, string< ':', '/', '/' >, plus< url_char > > {};

// Bare e-mail addresses; the local part is capped at 64 characters
struct email_local_char : sor< alnum, one< '.', '_', '%', '+', '-' > > {};
struct email_domain_label : plus< sor< alnum, one< '-' > > > {};
struct email : seq< rep_min_max< 1, 64, email_local_char >, one< '@' >, email_domain_label,
                    plus< seq< one< '.' >, email_domain_label > > > {};

// Breaks, whitespace and text runs
struct paragraph_break : seq< one< '\n' >, plus< star< blank >, one< '\n' > > > {};
struct line_break : one< '\n' > {};
struct whitespace : plus< blank > {};
struct word : plus< sor< alnum, range< '\x80', '\xff' > > > {};
struct other : any {};

struct token : sor< heading_marker, bullet_marker, numbered_marker, quote_marker, rule_marker,
                    column_title, column,
                    link_open, link_close, block_end_open, block_open, block_close,
                    anchor_open, bracket_open, bracket_close, pipe,
                    bold, italics, underline, strikethrough, superscript, subscript,
                    mono_open, mono_close, raw_toggle, raw_open, raw_close, color,
                    url, email, paragraph_break, line_break, whitespace, word, other > {};

struct document : seq< star< token >, eof > {};

} // namespace wikitext::pegtl_front::grammar
