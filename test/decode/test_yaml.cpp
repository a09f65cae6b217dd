#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <cstdint>
#include <sift/decode/sift_decode.hpp>
#include <sift/decode/sift_yaml.hpp>
#include <string>

using namespace Sift;

TEST_CASE("YAML scalar resolution", "[yaml]") {
    const auto tree = yaml::Decode(
        "name: Ada\n"
        "age: 36\n"
        "ratio: 0.5\n"
        "active: true\n"
        "note: ~\n"
        "empty:\n"
        "zip: \"02134\"\n"
        "code: !!str 42\n"
        "big: 18446744073709551615\n"
        "inf: .inf\n");
    REQUIRE(tree.has_value());
    REQUIRE(tree->is_object());

    REQUIRE(*tree->find("name")->get_if<std::string>() == "Ada");
    REQUIRE(tree->find("age")->get_if<Number>()->as_int == int64_t{36});
    REQUIRE(tree->find("ratio")->get_if<Number>()->value == 0.5);
    REQUIRE(*tree->find("active")->get_if<bool>());
    REQUIRE(tree->find("note")->is_null());
    REQUIRE(tree->find("empty")->is_null());
    REQUIRE(*tree->find("zip")->get_if<std::string>() == "02134");
    REQUIRE(*tree->find("code")->get_if<std::string>() == "42");
    REQUIRE(tree->find("big")->get_if<Number>()->as_uint == UINT64_MAX);
    REQUIRE(std::isinf(tree->find("inf")->get_if<Number>()->value));
}

TEST_CASE("YAML containers", "[yaml]") {
    const auto tree = Decode(
        "---\n"
        "items:\n"
        "  - sku: A1\n"
        "    qty: 2\n"
        "  - sku: B2\n"
        "    qty: 1\n"
        "labels: {env: prod}\n");
    REQUIRE(tree.has_value());
    const auto* items = tree->find("items");
    REQUIRE(items->is_array());
    REQUIRE(items->size() == 2);
    REQUIRE(*(*items->get_if<Node::Array>())[1].find("sku")->get_if<std::string>() ==
            "B2");
    REQUIRE(*tree->find("labels")->find("env")->get_if<std::string>() == "prod");
}

TEST_CASE("Malformed YAML", "[yaml]") {
    const auto tree = yaml::Decode("key: [unclosed\n");
    REQUIRE_FALSE(tree.has_value());
    REQUIRE(tree.error() == ErrorCode::DecodeError);
    REQUIRE(tree.error().format == Format::YAML);
    REQUIRE(tree.error().what().starts_with("yaml parse error"));
}

TEST_CASE("YAML structure depth", "[yaml][limits]") {
    constexpr const char* doc = "a:\n  b:\n    c: 1\n";
    REQUIRE(yaml::Decode(doc, 3).has_value());

    const auto tree = yaml::Decode(doc, 2);
    REQUIRE_FALSE(tree.has_value());
    REQUIRE(tree.error() == ErrorCode::DepthExceeded);
}

TEST_CASE("Empty YAML document is null", "[yaml]") {
    const auto tree = yaml::Decode("");
    REQUIRE(tree.has_value());
    REQUIRE(tree->is_null());
}

TEST_CASE("YAML aliases", "[yaml][limits]") {
    SECTION("An alias expands to a copy of its anchor") {
        const auto tree = yaml::Decode("base: &b {x: 1}\nuse: *b\n");
        REQUIRE(tree.has_value());
        REQUIRE(tree->find("use")->find("x")->get_if<Number>()->as_int ==
                int64_t{1});
    }

    SECTION("Nested anchors that multiply are rejected") {
        std::string doc = "l0: &l0 [x, x, x, x, x, x, x, x, x, x]\n";
        for (int level = 1; level <= 6; ++level) {
            const std::string prev = "*l" + std::to_string(level - 1);
            doc += "l" + std::to_string(level) + ": &l" +
                   std::to_string(level) + " [";
            for (int i = 0; i < 10; ++i) {
                doc += (i == 0 ? "" : ", ") + prev;
            }
            doc += "]\n";
        }

        const auto tree = yaml::Decode(doc);
        REQUIRE_FALSE(tree.has_value());
        REQUIRE(tree.error() == ErrorCode::DecodeError);
        REQUIRE(tree.error().message == "document contains excessive aliasing");
    }
}
