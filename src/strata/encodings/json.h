#ifndef STRATA_ENCODINGS_JSON_H
#define STRATA_ENCODINGS_JSON_H

#include <nlohmann/json.hpp>

#include <strata/core.h>

// JSON - conversion to and from JSON strings

namespace strata {

// Structured documents (blob metadata, configuration) are represented
// directly as nlohmann JSON values.
typedef nlohmann::json json_document;

// Parse some JSON text into a document.
// If the text isn't valid JSON, this throws a parsing_error.
json_document
parse_json_document(char const* json, size_t length);

static inline json_document
parse_json_document(string const& json)
{
    return parse_json_document(json.c_str(), json.length());
}

// Write a document to a string in (compact) JSON format.
string
write_json_document(json_document const& document);

} // namespace strata

#endif
