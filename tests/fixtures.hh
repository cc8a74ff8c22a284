//  notec: Note Template Compiler
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the notec authors
#pragma once

#include "check.hh"

// Shared documents for the test executables

namespace fixtures {

  // Every slot kind, a nested listItems block with explicit indices and a
  // tableMap inside a child component
  inline const char* SOAP_TEMPLATE = R"({
    "id": "soap",
    "name": "SOAP Note",
    "version": "1.0.0",
    "prompt": {
      "system": "You are a clinical scribe.",
      "main": "Draft the assessment and plan.",
      "rules": ["Be concise.", "Use plain language."]
    },
    "layout": [
      {
        "id": "assessment",
        "type": "section",
        "title": "Assessment",
        "content": [
          {
            "id": "summary",
            "slot": "model",
            "outputPath": "assessment.summary",
            "description": "Overall clinical impression",
            "guidance": ["Summarize mood and scores."],
            "aiDeps": ["subjective.mood", "scores.phq9Delta"],
            "constraints": {"required": true, "minWords": 10, "maxWords": 80}
          },
          {
            "id": "mood",
            "slot": "lookup",
            "lookup": "subjective.mood",
            "targetPath": "subjective.mood"
          },
          {
            "id": "severity",
            "slot": "model",
            "outputPath": "assessment.severity",
            "source": ["assessments.phq9", "assessments.phq9"],
            "constraints": {"enum": ["mild", "moderate", "severe"]}
          },
          {
            "id": "delta",
            "slot": "computed",
            "formula": "assessments.phq9.score - assessments.phq9.baseline",
            "resultType": "number",
            "targetPath": "scores.phq9Delta"
          }
        ]
      },
      {
        "id": "plan",
        "type": "list",
        "content": [
          {
            "id": "plan-header",
            "slot": "static",
            "text": "Plan",
            "listItems": [
              {"id": "step0", "slot": "model", "outputPath": "plan.steps[0]",
               "aiDeps": ["subjective.mood"]},
              {"id": "step1", "slot": "model", "outputPath": "plan.steps[1]",
               "aiDeps": ["subjective.mood"]}
            ]
          }
        ],
        "children": [
          {
            "id": "meds",
            "type": "table",
            "content": [
              {
                "id": "med-table",
                "slot": "static",
                "text": "Medications",
                "tableMap": {
                  "name": {"id": "med-name", "slot": "lookup",
                           "lookup": "medications[].name",
                           "targetPath": "medications[].name"},
                  "note": {"id": "med-note", "slot": "model",
                           "outputPath": "medicationNotes[].note",
                           "aiDeps": ["medications[].name"],
                           "styleHints": {"tone": "clinical",
                                          "sparkle": true,
                                          "tableCell": {"columnIndex": 1,
                                                        "glow": "red"}}}
                }
              }
            ]
          }
        ]
      }
    ]
  })";

  inline const char* SOAP_SOURCE = R"({
    "subjective": {"mood": "stable"},
    "assessments": {"phq9": {"score": 21, "baseline": 6}},
    "medications": [{"name": "sertraline"}, {"name": "melatonin"}],
    "transcript": {
      "visit_123": {
        "segments": [
          {"timestamp": 35, "text": "before"},
          {"timestamp": 40, "text": "I have been"},
          {"timestamp": 55, "text": "sleeping better."},
          {"timestamp": 60, "text": "after"}
        ]
      }
    }
  })";

  inline notec::NoteTemplate soap_template(
    std::vector< std::string >* warnings = nullptr )
  {
    return notec::load_template( check::json(SOAP_TEMPLATE), warnings );
  }

  // Wrap content items into a one-component template
  inline notec::NoteTemplate single_section( const std::string& items ) {
    return notec::load_template( check::json(
      R"({"id": "t", "name": "T", "version": "1", "layout": [)"
      R"({"id": "s", "type": "section", "content": [)" + items + "]}]}" ) );
  }

  // Non-model snapshot of SOAP_TEMPLATE over SOAP_SOURCE
  inline notec::ordered_node soap_snapshot() {
    const notec::NoteTemplate t = soap_template();
    const notec::ResolutionEngine engine( notec::default_resolvers() );
    return engine.build( t, check::json(SOAP_SOURCE),
      notec::derive_non_model_schema(t) ).snapshot;
  }

  inline const char* FIXED_TIME = "2026-03-01T09:30:00.000Z";

} // namespace fixtures
