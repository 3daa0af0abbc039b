#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace nsclient {

struct ParsedResponse {
    bool success = false;
    nlohmann::json data;
    std::string error_message;
};

/// True if body starts with an "<?xml" prologue followed by whitespace.
bool looks_like_xml(const std::string& body);

/// Decode an XML response body into
///   {"<root>": {"attribs": {...}, "<child>": [{...attributes...}, ...]}}
///
/// "attribs" appears only when the root element has attributes. Every child
/// element contributes its attribute set to the array named after it, in
/// document order; a child without attributes contributes {}. Text content
/// and deeper descendants are not represented.
ParsedResponse parse_structured_response(const std::string& body);

}  // namespace nsclient
