#pragma once
#include <tao/pegtl.hpp>

namespace wikitext::pegtl_front::arguments {
using namespace tao::pegtl;

// Block attributes: key="value" key='value' key=value ...
struct attr_key : plus< sor< alnum, one< '_', '-', ':' > > > {};
struct attr_double : seq< one< '"' >, star< not_one< '"' > >, one< '"' > > {};
struct attr_single : seq< one< '\'' >, star< not_one< '\'' > >, one< '\'' > > {};
struct attr_bare : plus< not_one< ' ', '\t', '\n', '"', '\'' > > {};
struct attribute : seq< attr_key, star< blank >, one< '=' >, star< blank >, sor< attr_double, attr_single, attr_bare > > {};
struct attribute_list : seq< star< space >, star< attribute, star< space > >, eof > {};

// Include call: <page> [| ] key=value | key=value ...
struct site_name : plus< sor< alnum, one< '-', '_' > > > {};
struct page_name : plus< not_one< ' ', '\t', '\n', '\r', '|' > > {};
struct page_ref : seq< opt< one< ':' >, site_name, one< ':' > >, page_name > {};
struct var_key : plus< sor< alnum, one< '_', '-' > > > {};
struct var_value : star< not_one< '|' > > {};
struct var_pair : seq< star< space >, var_key, star< space >, one< '=' >, var_value > {};
struct var_sep : seq< star< space >, one< '|' > > {};
struct var_list : seq< opt< var_sep >, var_pair, star< var_sep, var_pair >, opt< var_sep > > {};
struct include_call : seq< star< space >, page_ref, star< space >, opt< var_list >, star< space >, eof > {};

} // namespace wikitext::pegtl_front::arguments
