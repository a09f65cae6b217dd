#include <array>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <sift/coerce/sift_coerce.hpp>
#include <sift/coerce/sift_reflect.hpp>
#include <sift/decode/sift_json.hpp>
#include <sift/decode/sift_yaml.hpp>
#include <sift/messages/sift_record.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

using namespace Sift;

namespace {

struct Scalars {
    bool flag{};
    int8_t small{};
    uint16_t port{};
    int64_t id{};
    uint64_t big{};
    float ratio{};
    double score{};
    std::string label;
    Timestamp at{};

    SIFT_RECORD_FIELDS(SIFT_FIELD(flag, "flag"), SIFT_FIELD(small, "small"),
                       SIFT_FIELD(port, "port"), SIFT_FIELD(id, "id"),
                       SIFT_FIELD(big, "big"), SIFT_FIELD(ratio, "ratio"),
                       SIFT_FIELD(score, "score"), SIFT_FIELD(label, "label"),
                       SIFT_FIELD(at, "at"))
};

struct Address {
    std::string city;
    std::string zip;
    SIFT_RECORD_FIELDS(SIFT_FIELD(city, "city"), SIFT_FIELD(zip, "zip"))
};

struct Customer {
    std::string name;
    std::unique_ptr<int> age;
    std::optional<std::string> nickname;
    Address address;
    std::vector<int> scores;
    std::array<int, 2> pair{};
    std::map<std::string, int> counts;
    std::unordered_map<std::string, Address> branches;
    RawMessage extra;
    Node anything;
    std::string hidden = "keep";

    SIFT_RECORD_FIELDS(SIFT_FIELD(name, "name"), SIFT_FIELD(age, "age"),
                       SIFT_FIELD(nickname, "nickname"),
                       SIFT_FIELD(address, "address"),
                       SIFT_FIELD(scores, "scores"), SIFT_FIELD(pair, "pair"),
                       SIFT_FIELD(counts, "counts"),
                       SIFT_FIELD(branches, "branches"),
                       SIFT_FIELD(extra, "extra"),
                       SIFT_FIELD(anything, "anything"),
                       SIFT_FIELD(hidden, "-"))
};

struct Credentials {
    std::string user;
    int password_hash{};
    SIFT_RECORD_FIELDS(SIFT_FIELD(user, "user"),
                       SIFT_FIELD(password_hash, "password_hash"))
};

struct Chain {
    int value{};
    std::unique_ptr<Chain> next;
    SIFT_RECORD_FIELDS(SIFT_FIELD(value, "value"), SIFT_FIELD(next, "next"))
};

template <typename T>
struct Outcome {
    T value{};
    ErrorList errors;
};

template <typename T>
Outcome<T> Run(std::string_view doc, Format format = Format::JSON,
               int64_t max_depth = DefaultMaxValidationDepth) {
    auto tree = format == Format::JSON ? json::Decode(doc, 0)
                                       : yaml::Decode(doc, 0);
    REQUIRE(tree.has_value());
    Outcome<T> out;
    coerce::Context ctx{.format = format, .source = doc, .max_depth = max_depth};
    (void)coerce::Coerce(*tree, out.value, "", 0, ctx);
    out.errors = std::move(ctx.errors);
    return out;
}

}  // namespace

TEST_CASE("Scalar coercion", "[coerce]") {
    SECTION("Native values") {
        const auto out = Run<Scalars>(
            R"({"flag":true,"small":-5,"port":8080,"id":9007199254740993,)"
            R"("big":18446744073709551615,"ratio":0.5,"score":1e3,"label":"x",)"
            R"("at":"2023-12-25T10:30:00Z"})");
        REQUIRE(out.errors.empty());
        REQUIRE(out.value.flag);
        REQUIRE(out.value.small == -5);
        REQUIRE(out.value.port == 8080);
        REQUIRE(out.value.id == 9007199254740993);
        REQUIRE(out.value.big == UINT64_MAX);
        REQUIRE(out.value.ratio == 0.5F);
        REQUIRE(out.value.score == 1000.0);
        REQUIRE(out.value.label == "x");
        REQUIRE(out.value.at == time::ParseTimestamp("2023-12-25T10:30:00Z"));
    }

    SECTION("Strings to numbers and booleans") {
        const auto out = Run<Scalars>(
            R"({"flag":"YES","small":"+12","port":"443","ratio":"2.5","score":"NaN"})");
        REQUIRE(out.errors.empty());
        REQUIRE(out.value.flag);
        REQUIRE(out.value.small == 12);
        REQUIRE(out.value.port == 443);
        REQUIRE(out.value.ratio == 2.5F);
        REQUIRE(std::isnan(out.value.score));
    }

    SECTION("Numbers to booleans and strings") {
        const auto out = Run<Scalars>(R"({"flag":1,"label":42})");
        REQUIRE(out.errors.empty());
        REQUIRE(out.value.flag);
        REQUIRE(out.value.label == "42");

        const auto floats = Run<Scalars>(R"({"label":1.5,"id":true})");
        REQUIRE(floats.errors.empty());
        REQUIRE(floats.value.label == "1.5");
        REQUIRE(floats.value.id == 1);
    }

    SECTION("Fractional numbers truncate into integers") {
        const auto out = Run<Scalars>(R"({"id":-3.9,"port":7.2})");
        REQUIRE(out.errors.empty());
        REQUIRE(out.value.id == -3);
        REQUIRE(out.value.port == 7);
    }

    SECTION("Float truncation reaches the signed minimum") {
        const auto out =
            Run<Scalars>(R"({"id":-9223372036854775808.0,"small":-128.9})");
        REQUIRE(out.errors.empty());
        REQUIRE(out.value.id == INT64_MIN);
        REQUIRE(out.value.small == -128);

        const auto below = Run<Scalars>(R"({"small":-129.0})");
        REQUIRE(below.errors.size() == 1);
        REQUIRE(below.errors[0].message ==
                "value \"-129.0\" out of range for int8");
    }

    SECTION("Unix seconds into timestamps") {
        const auto whole = Run<Scalars>(R"({"at":1703500200})");
        REQUIRE(whole.errors.empty());
        REQUIRE(whole.value.at == time::ParseTimestamp("2023-12-25T10:30:00Z"));

        const auto fractional = Run<Scalars>(R"({"at":1703505045.123})");
        REQUIRE(fractional.errors.empty());
        REQUIRE(fractional.value.at.nanos == 122999906);

        const auto zero = Run<Scalars>(R"({"at":0})");
        REQUIRE(zero.errors.empty());
        REQUIRE_FALSE(time::IsZero(zero.value.at));
        REQUIRE(time::FormatTimestamp(zero.value.at) == "1970-01-01T00:00:00Z");
    }

    SECTION("Dates outside the nanosecond clock range") {
        const auto early = Run<Scalars>(R"({"at":"0001-01-01"})");
        REQUIRE(early.errors.empty());
        REQUIRE(time::IsZero(early.value.at));

        const auto late = Run<Scalars>(R"({"at":"2500-06-01T00:00:00Z"})");
        REQUIRE(late.errors.empty());
        REQUIRE(time::FormatTimestamp(late.value.at) == "2500-06-01T00:00:00Z");

        const auto unix_late = Run<Scalars>(R"({"at":16738272000})");
        REQUIRE(unix_late.errors.empty());
        REQUIRE(unix_late.value.at == late.value.at);
    }

    SECTION("Unix seconds beyond year 9999") {
        const auto out = Run<Scalars>(R"({"at":253402300800})");
        REQUIRE(out.errors.size() == 1);
        REQUIRE(out.errors[0].message ==
                "value \"253402300800\" out of range for timestamp");
    }

    SECTION("Null yields the zero value") {
        const auto out = Run<Scalars>(R"({"flag":null,"id":null,"at":null})");
        REQUIRE(out.errors.empty());
        REQUIRE_FALSE(out.value.flag);
        REQUIRE(out.value.id == 0);
        REQUIRE(time::IsZero(out.value.at));
    }
}

TEST_CASE("Scalar coercion failures", "[coerce]") {
    SECTION("Unparseable integer string") {
        const auto out = Run<Scalars>(R"({"id":"not-a-number"})");
        REQUIRE(out.errors.size() == 1);
        REQUIRE(out.errors[0] == ErrorCode::CoercionError);
        REQUIRE(out.errors[0].field == "id");
        REQUIRE(out.errors[0].message ==
                "cannot parse string \"not-a-number\" as integer");
    }

    SECTION("Range errors do not wrap") {
        const auto out = Run<Scalars>(R"({"small":300,"port":-1,"big":-5})");
        REQUIRE(out.errors.size() == 3);
        REQUIRE(out.errors[0].message == "value \"300\" out of range for int8");
        REQUIRE(out.errors[1].message ==
                "negative value cannot be coerced to uint16");
        REQUIRE(out.errors[2].field == "big");
    }

    SECTION("Booleans accept only the canonical spellings") {
        const auto out = Run<Scalars>(R"({"flag":2})");
        REQUIRE(out.errors.size() == 1);
        const auto text = Run<Scalars>(R"({"flag":"maybe"})");
        REQUIRE(text.errors.size() == 1);
        REQUIRE(text.errors[0].message == "cannot parse string \"maybe\" as bool");
    }

    SECTION("Timestamps") {
        const auto out = Run<Scalars>(R"({"at":"yesterday"})");
        REQUIRE(out.errors.size() == 1);
        REQUIRE(out.errors[0].message ==
                "cannot parse string \"yesterday\" as timestamp using standard "
                "formats");
    }

    SECTION("Independent fields are all reported") {
        const auto out =
            Run<Scalars>(R"({"id":"x","port":"y","label":[1],"flag":true})");
        REQUIRE(out.errors.size() == 3);
        REQUIRE(out.value.flag);
    }

    SECTION("Sensitive values are kept out of messages") {
        const auto out =
            Run<Credentials>(R"({"user":"bob","password_hash":"hunter2"})");
        REQUIRE(out.errors.size() == 1);
        REQUIRE(out.errors[0].message ==
                "cannot parse string [REDACTED] as integer");
        REQUIRE(out.errors[0].sanitized_value() == Value{"[REDACTED]"});
    }
}

TEST_CASE("Pointer and optional members", "[coerce]") {
    SECTION("Missing and null are both unset") {
        const auto missing = Run<Customer>(R"({"name":"a"})");
        const auto null = Run<Customer>(R"({"name":"a","age":null,"nickname":null})");
        REQUIRE(missing.errors.empty());
        REQUIRE(null.errors.empty());
        REQUIRE(missing.value.age == nullptr);
        REQUIRE(null.value.age == nullptr);
        REQUIRE_FALSE(missing.value.nickname.has_value());
        REQUIRE_FALSE(null.value.nickname.has_value());
    }

    SECTION("Present values are allocated") {
        const auto out = Run<Customer>(R"({"age":0,"nickname":""})");
        REQUIRE(out.errors.empty());
        REQUIRE(out.value.age != nullptr);
        REQUIRE(*out.value.age == 0);
        REQUIRE(out.value.nickname == std::string{});
    }

    SECTION("Failures inside the pointee propagate") {
        const auto out = Run<Customer>(R"({"age":"old"})");
        REQUIRE(out.errors.size() == 1);
        REQUIRE(out.errors[0].field_path == "age");
    }
}

TEST_CASE("Containers and nested records", "[coerce]") {
    SECTION("Populated") {
        const auto out = Run<Customer>(
            R"({"address":{"city":"Paris","zip":75001},"scores":[1,"2",3],)"
            R"("pair":[4,5],"counts":{"a":1,"b":2},)"
            R"("branches":{"north":{"city":"Lille"}}})");
        REQUIRE(out.errors.empty());
        REQUIRE(out.value.address.city == "Paris");
        REQUIRE(out.value.address.zip == "75001");
        REQUIRE(out.value.scores == std::vector<int>{1, 2, 3});
        REQUIRE(out.value.pair == std::array<int, 2>{4, 5});
        REQUIRE(out.value.counts.at("b") == 2);
        REQUIRE(out.value.branches.at("north").city == "Lille");
    }

    SECTION("Element failures keep sibling elements") {
        const auto out = Run<Customer>(R"({"scores":[1,"x",3,"y"]})");
        REQUIRE(out.errors.size() == 2);
        REQUIRE(out.errors[0].field_path == "scores[1]");
        REQUIRE(out.errors[1].field_path == "scores[3]");
        REQUIRE(out.value.scores.size() == 4);
        REQUIRE(out.value.scores[2] == 3);
    }

    SECTION("Nested paths") {
        const auto out =
            Run<Customer>(R"({"address":{"zip":[1]},"branches":{"s":{"city":{}}}})");
        REQUIRE(out.errors.size() == 2);
        REQUIRE(out.errors[0].field_path == "address.zip");
        REQUIRE(out.errors[1].field_path == "branches.s.city");
        REQUIRE(out.errors[1].field == "city");
    }

    SECTION("Shape mismatches") {
        const auto out = Run<Customer>(
            R"({"address":"x","scores":{},"pair":[1,2,3],"counts":[]})");
        REQUIRE(out.errors.size() == 4);
        REQUIRE(out.errors[0].message ==
                "cannot parse non-object data into record");
        REQUIRE(out.errors[1].message ==
                "cannot parse non-array data into sequence");
        REQUIRE(out.errors[2].message ==
                "array length mismatch: expected 2 elements, got 3");
        REQUIRE(out.errors[3].message == "cannot parse non-object data into map");
    }

    SECTION("Skipped members are untouched") {
        const auto out = Run<Customer>(R"({"hidden":"overwritten","-":"x"})");
        REQUIRE(out.errors.empty());
        REQUIRE(out.value.hidden == "keep");
    }
}

TEST_CASE("Raw and untyped capture", "[coerce]") {
    SECTION("Exact bytes from JSON") {
        const auto out =
            Run<Customer>(R"({"extra": {"b": 2,  "a": [1, 2.50]}, "anything": [1, "x"]})");
        REQUIRE(out.errors.empty());
        REQUIRE(out.value.extra.bytes() == R"({"b": 2,  "a": [1, 2.50]})");
        REQUIRE(out.value.anything.size() == 2);
    }

    SECTION("Escaped keys capture the value that was kept") {
        const auto out = Run<Customer>(R"({"extra":1,"\u0065xtra":[2, 3]})");
        REQUIRE(out.errors.empty());
        REQUIRE(out.value.extra.bytes() == "[2, 3]");
    }

    SECTION("Null and missing") {
        const auto null = Run<Customer>(R"({"extra":null})");
        REQUIRE(null.value.extra.bytes() == "null");
        REQUIRE(null.value.extra.is_null());
        const auto missing = Run<Customer>(R"({})");
        REQUIRE(missing.value.extra.empty());
    }

    SECTION("YAML captures are re-encoded as JSON") {
        const auto out =
            Run<Customer>("extra:\n  b: 2\n  a: [1, x]\n", Format::YAML);
        REQUIRE(out.errors.empty());
        REQUIRE(out.value.extra.bytes() == R"({"b":2,"a":[1,"x"]})");
    }
}

TEST_CASE("Top-level shapes", "[coerce]") {
    REQUIRE(Run<Customer>("[]").errors[0].message ==
            "cannot parse non-object data into record");
    REQUIRE(Run<std::vector<int>>("{}").errors[0].message ==
            "cannot parse non-array data into sequence");
    REQUIRE(Run<std::vector<int>>("[1,2]").value == std::vector<int>{1, 2});
}

TEST_CASE("Recursion depth", "[coerce][limits]") {
    const std::string_view doc =
        R"({"value":1,"next":{"value":2,"next":{"value":3,"next":{"value":4}}}})";

    const auto ok = Run<Chain>(doc);
    REQUIRE(ok.errors.empty());
    REQUIRE(ok.value.next->next->next->value == 4);

    const auto limited = Run<Chain>(doc, Format::JSON, 2);
    REQUIRE(limited.errors.size() == 1);
    REQUIRE(limited.errors[0] == ErrorCode::DepthExceeded);
    REQUIRE(limited.errors[0].field_path == "next.next.next");
}

TEST_CASE("Typed values back into trees", "[coerce]") {
    Customer c;
    c.name = "Ada";
    c.age = std::make_unique<int>(36);
    c.scores = {1, 2};
    c.extra.assign(R"({"k":1})");

    const Value v = coerce::ToValue(c);
    REQUIRE(v.find("name") != nullptr);
    REQUIRE(*v.find("name") == Value{"Ada"});
    REQUIRE(*v.find("age") == Value{36});
    REQUIRE(v.find("nickname")->is_null());
    REQUIRE(v.find("scores")->length() == std::size_t{2});
    REQUIRE(v.find("address")->find("city") != nullptr);

    const Node n = coerce::ToNode(c, Format::JSON);
    REQUIRE(n.find("hidden") == nullptr);
    REQUIRE(n.find("extra")->find("k") != nullptr);
    REQUIRE(n.find("age")->get_if<Number>()->as_int == int64_t{36});
}
