// Umbrella header for the wikitext pipeline
#pragma once
#include "wikitext/ast.hpp"
#include "wikitext/diagnostic.hpp"
#include "wikitext/diagnostics_json.hpp"
#include "wikitext/edn_writer.hpp"
#include "wikitext/include.hpp"
#include "wikitext/lexer.hpp"
#include "wikitext/outcome.hpp"
#include "wikitext/parser.hpp"
#include "wikitext/pipeline.hpp"
#include "wikitext/preprocess.hpp"
#include "wikitext/span.hpp"
#include "wikitext/token.hpp"
