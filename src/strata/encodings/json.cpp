#include <strata/encodings/json.h>

#include <strata/utilities/errors.h>
#include <strata/utilities/text.h>

namespace strata {

json_document
parse_json_document(char const* json, size_t length)
{
    try
    {
        return json_document::parse(json, json + length);
    }
    catch (nlohmann::json::parse_error& e)
    {
        STRATA_THROW(
            parsing_error() << expected_format_info("JSON")
                            << parsed_text_info(string(json, length))
                            << parsing_error_info(e.what()));
    }
}

string
write_json_document(json_document const& document)
{
    return document.dump();
}

} // namespace strata
