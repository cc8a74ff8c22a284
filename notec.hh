//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
//
//  Compiles authored clinical-note templates into JSON Schemas, a resolved
//  non-model snapshot and a linted prompt bundle for a structured-output
//  language model call.
#pragma once

#include "notec_common.hh"
#include "notec_config.hh"
#include "notec_path.hh"
#include "notec_template.hh"
#include "notec_schema.hh"
#include "notec_derive.hh"
#include "notec_merge.hh"
#include "notec_formula.hh"
#include "notec_resolve.hh"
#include "notec_prompt.hh"
#include "notec_lint.hh"
#include "notec_compose.hh"
