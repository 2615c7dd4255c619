#include <catch2/catch_all.hpp>
#include <catch2/catch_test_macros.hpp>
#include <lexicon/json.hh>

using namespace lex;

static auto Dict() -> Lexicon {
    return Lexicon::Build(
        "傢俱 家具 [jia1 ju4] /furniture/\n"
        "家 家 [jia1] /home/family/"
    );
}

TEST_CASE("JSON: entry") {
    auto dict = Dict();
    REQUIRE(dict.get("家具"));
    CHECK(Dump(ToJson(*dict.get("家具")), true) == R"({"definitions":["furniture"],"pronunciation":"jia1 ju4","simplified":"家具","traditional":"傢俱"})");
}

TEST_CASE("JSON: segments") {
    auto dict = Dict();
    std::u32string text = U"我家具";
    auto segments = Split(dict, str32{text});
    CHECK(Dump(ToJson(segments), false) == R"json([
    {
        "length": 1,
        "matched": false,
        "offset": 0,
        "text": "我"
    },
    {
        "entry": {
            "definitions": [
                "furniture"
            ],
            "pronunciation": "jia1 ju4",
            "simplified": "家具",
            "traditional": "傢俱"
        },
        "length": 2,
        "matched": true,
        "offset": 1,
        "text": "家具"
    }
])json");
}

TEST_CASE("JSON: stats") {
    auto dict = Dict();
    auto j = ToJson(dict.stats());
    CHECK(j["entries"] == 2);
    CHECK(j["keys"] == 3);
    CHECK(j["max-key-length"] == 2);
    CHECK(j["rejected"] == 0);
    CHECK(j["lines"] == 2);
}
