#include <strata/encodings/json.h>

#include <strata/utilities/testing.h>
#include <strata/utilities/text.h>

using namespace strata;

TEST_CASE("JSON documents", "[encodings][json]")
{
    auto document = parse_json_document(string(R"(
        {
            "codec": "h264",
            "frames": 24,
            "tags": ["a", "b"],
            "ratio": 1.25,
            "extra": null
        }
    )"));
    REQUIRE(document["codec"] == "h264");
    REQUIRE(document["frames"] == 24);
    REQUIRE(document["tags"].size() == 2);
    REQUIRE(document["ratio"] == 1.25);
    REQUIRE(document["extra"].is_null());

    // Written documents are compact and parse back to the same thing.
    auto text = write_json_document(document);
    REQUIRE(text.find('\n') == string::npos);
    REQUIRE(parse_json_document(text) == document);

    REQUIRE(write_json_document(json_document::object()) == "{}");
}

TEST_CASE("malformed JSON", "[encodings][json]")
{
    try
    {
        parse_json_document(string("{\"a\": "));
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<expected_format_info>(e) == "JSON");
        REQUIRE(get_required_error_info<parsed_text_info>(e) == "{\"a\": ");
        get_required_error_info<parsing_error_info>(e);
    }
}
