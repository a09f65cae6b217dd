#include <catch2/catch_test_macros.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <sift/sift.hpp>
#include <string>
#include <vector>

using namespace Sift;

namespace {

struct Signup {
    int64_t id{};
    std::string username;
    std::string email;
    int age{};
    std::string name;

    SIFT_RECORD_FIELDS(SIFT_FIELD(id, "id", "required,min=1"),
                       SIFT_FIELD(username, "username", "min=3"),
                       SIFT_FIELD(email, "email", "email"),
                       SIFT_FIELD(age, "age", "min=18"),
                       SIFT_FIELD(name, "name", "alpha"))
};

struct Item {
    std::string sku;
    int qty{};
    SIFT_RECORD_FIELDS(SIFT_FIELD(sku, "sku", "required,length=4"),
                       SIFT_FIELD(qty, "qty", "min=1"))
};

struct Label {
    std::string value;
    SIFT_RECORD_FIELDS(SIFT_FIELD(value, "value", "alphanum"))
};

struct Place {
    std::string city;
    SIFT_RECORD_FIELDS(SIFT_FIELD(city, "city", "required"))
};

struct Order {
    std::optional<Place> address;
    std::vector<Item> items;
    std::map<std::string, Label> labels;
    SIFT_RECORD_FIELDS(SIFT_FIELD(address, "address"),
                       SIFT_FIELD(items, "items", "min=1"),
                       SIFT_FIELD(labels, "labels"))
};

struct Password {
    std::string password;
    std::string confirm;
    SIFT_RECORD_FIELDS(SIFT_FIELD(password, "password", "required,min=8"),
                       SIFT_FIELD(confirm, "confirm", "matches_password"))
};

struct Loose {
    std::string code;
    SIFT_RECORD_FIELDS(SIFT_FIELD(code, "code", "no_such_rule,required"))
};

std::optional<Error> MatchesPassword(std::string_view field,
                                     const Value& value,
                                     const RecordView& record,
                                     const Params&) {
    const Value* password = record.field("password");
    if (password == nullptr || *password != value) {
        return Error::validation(field, "matches_password",
                                 "passwords do not match", value);
    }
    return std::nullopt;
}

}  // namespace

TEST_CASE("Every failing rule is reported at once", "[validate]") {
    const auto result = ParseInto<Signup>(
        R"({"id":0,"username":"ab","email":"invalid","age":15,"name":"John123"})");
    REQUIRE_FALSE(result.has_value());

    const auto& errors = result.error();
    // id fails both of its rules.
    REQUIRE(errors.size() == 6);
    REQUIRE(errors.validation_errors().size() == 6);

    const auto groups = errors.group_by_field();
    REQUIRE(groups.size() == 5);
    REQUIRE(groups.at("id").size() == 2);
    REQUIRE(groups.at("id").front().rule == "required");
    REQUIRE(groups.at("id").back().rule == "min");
    REQUIRE(groups.at("username").front().rule == "min");
    REQUIRE(groups.at("email").front().message == "invalid email address format");
    REQUIRE(groups.at("age").front().message == "value must be at least 18");
    REQUIRE(groups.at("name").front().rule == "alpha");

    REQUIRE(errors.what().starts_with(
        "multiple errors: validation error on field \"id\": field is required"));
}

TEST_CASE("The same rules pass on valid input", "[validate]") {
    const auto result = ParseInto<Signup>(
        "id: 1\nusername: ada\nemail: ada@example.com\nage: 36\nname: Ada\n");
    REQUIRE(result.has_value());
    REQUIRE(result->email == "ada@example.com");
}

TEST_CASE("Nested records report dotted paths", "[validate]") {
    const auto result = ParseInto<Order>(R"({
        "address": {"city": ""},
        "items": [{"sku": "AAAA", "qty": 1}, {"sku": "BBBB", "qty": 2},
                  {"sku": "C", "qty": 0}],
        "labels": {"env": {"value": "prod-1"}}
    })");
    REQUIRE_FALSE(result.has_value());

    const auto groups = result.error().group_by_field();
    REQUIRE(groups.size() == 4);
    REQUIRE(groups.at("address.city").front().field == "city");
    REQUIRE(groups.at("items[2].sku").front().rule == "length");
    REQUIRE(groups.at("items[2].qty").front().rule == "min");
    REQUIRE(groups.at("labels.env.value").front().rule == "alphanum");
}

TEST_CASE("Validate runs on populated values", "[validate]") {
    Order order;
    order.items.push_back(Item{.sku = "ABCD", .qty = 1});
    REQUIRE_FALSE(Validate(order).has_value());

    order.address = Place{};
    order.items.clear();
    const auto errors = Validate(order);
    REQUIRE(errors.has_value());
    REQUIRE(errors->size() == 2);
    REQUIRE(errors->group_by_field().contains("address.city"));
    REQUIRE(errors->group_by_field().contains("items"));

    REQUIRE_FALSE(Validate(std::vector<int>{1, 2}).has_value());
}

TEST_CASE("Validation depth is bounded", "[validate][limits]") {
    const auto saved = GetMaxValidationDepth();
    SetMaxValidationDepth(1);

    Order order;
    order.items.push_back(Item{.sku = "ABCD", .qty = 1});
    const auto errors = Validate(order);
    SetMaxValidationDepth(saved);

    REQUIRE(errors.has_value());
    REQUIRE(errors->contains(ErrorCode::DepthExceeded));
}

TEST_CASE("Cross-field rules through a parser registry", "[validate]") {
    Parser parser;
    REQUIRE_FALSE(parser.registry()
                      .register_cross_field("matches_password", MatchesPassword)
                      .has_value());

    const auto ok = parser.ParseInto<Password>(
        R"({"password":"correct horse","confirm":"correct horse"})");
    REQUIRE(ok.has_value());

    const auto mismatch = parser.ParseInto<Password>(
        R"({"password":"correct horse","confirm":"battery staple"})");
    REQUIRE_FALSE(mismatch.has_value());
    REQUIRE(mismatch.error().size() == 1);
    REQUIRE(mismatch.error().front().field == "confirm");
    REQUIRE(mismatch.error().front().message == "passwords do not match");

    // The default registry never saw the rule, so it is skipped there.
    REQUIRE(ParseInto<Password>(
                R"({"password":"correct horse","confirm":"x"})")
                .has_value());
    REQUIRE_FALSE(parser.Validate(*ok).has_value());
}

TEST_CASE("Unknown rules are skipped", "[validate]") {
    REQUIRE_FALSE(CheckRecord<Loose>().has_value());
    REQUIRE(ParseInto<Loose>(R"({"code":"x"})").has_value());

    const auto missing = ParseInto<Loose>(R"({"code":""})");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().front().rule == "required");
}

TEST_CASE("Reports redact sensitive values", "[validate]") {
    const auto result = ParseInto<Password>(
        R"({"password":"hunter2","confirm":"hunter2"})");
    REQUIRE_FALSE(result.has_value());

    const auto& err = result.error().front();
    REQUIRE(err.field == "password");
    REQUIRE(err.sanitized_value() == Value{RedactedValue});
    REQUIRE(result.error().to_json().find("hunter2") == std::string::npos);

    const auto report = nlohmann::ordered_json::parse(result.error().to_json());
    REQUIRE(report["count"].get<int>() == 1);
    REQUIRE(report["errors"][0]["field_path"].get<std::string>() == "password");
    REQUIRE(report["errors"][0]["value"].get<std::string>() == RedactedValue);
    REQUIRE(report["errors"][0]["validation_errors"][0]["rule"]
                .get<std::string>() == "min");
    REQUIRE(report["errors"][0]["validation_errors"][0]["details"]["min"]
                .get<double>() == 8.0);
}
