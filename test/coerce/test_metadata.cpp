#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <optional>
#include <sift/core/sift_log.hpp>
#include <sift/fields/sift_raw.hpp>
#include <sift/messages/sift_metadata.hpp>
#include <sift/messages/sift_record.hpp>
#include <string>
#include <string_view>
#include <vector>

using namespace Sift;
using namespace Sift::messages;

namespace {

struct Address {
    std::string city;
    SIFT_RECORD_FIELDS(SIFT_FIELD(city, "city", "required"))
};

struct Profile {
    int id{};
    std::string display_name;
    std::optional<Address> address;
    std::vector<Address> previous;
    RawMessage extra;
    std::string internal;
    std::unique_ptr<int> score;

    SIFT_RECORD_FIELDS(SIFT_FIELD(id, "id", "required,min=1"),
                       SIFT_FIELD_YAML(display_name, "displayName", "display_name",
                                       " required , min=3 ,max = 20 "),
                       SIFT_FIELD(address, ""),
                       SIFT_FIELD(previous, "previous"),
                       SIFT_FIELD(extra, "extra"),
                       SIFT_FIELD(internal, "-"),
                       SIFT_FIELD(score, "score", "oneof=red"))
};

struct Broken {
    int id{};
    SIFT_RECORD_FIELDS(SIFT_FIELD(id, "id", "required,=5"))
};

struct HoldsBroken {
    std::vector<Broken> items;
    SIFT_RECORD_FIELDS(SIFT_FIELD(items, "items"))
};

struct SkipsBroken {
    std::optional<Broken> hidden;
    SIFT_RECORD_FIELDS(SIFT_FIELD(hidden, "-"))
};

struct Link {
    std::string label;
    std::unique_ptr<Link> next;
    SIFT_RECORD_FIELDS(SIFT_FIELD(label, "label", "required"),
                       SIFT_FIELD(next, "next"))
};

struct Misnamed {
    std::string code;
    SIFT_RECORD_FIELDS(SIFT_FIELD(code, "code", "min=1,,=x"))
};

}  // namespace

TEST_CASE("Rule string parsing", "[metadata]") {
    SECTION("Names and numeric arguments") {
        const auto rules = ParseRules("required,min=3,max=2.5");
        REQUIRE(rules.has_value());
        REQUIRE(rules->size() == 3);
        REQUIRE((*rules)[0] == Rule{"required", {}});
        REQUIRE((*rules)[1].name == "min");
        REQUIRE((*rules)[1].params.at("value") == Value{3.0});
        REQUIRE((*rules)[2].params.at("value") == Value{2.5});
    }

    SECTION("Non-numeric arguments stay strings") {
        const auto rules = ParseRules("oneof=red");
        REQUIRE(rules.has_value());
        REQUIRE((*rules)[0].params.at("value") == Value{"red"});
    }

    SECTION("Empty entries are skipped") {
        const auto rules = ParseRules(",required,,");
        REQUIRE(rules.has_value());
        REQUIRE(rules->size() == 1);
        REQUIRE(ParseRules("")->empty());
    }

    SECTION("A rule without a name is a configuration error") {
        const auto rules = ParseRules("required,=3");
        REQUIRE_FALSE(rules.has_value());
        REQUIRE(rules.error() == ErrorCode::ConfigurationError);
    }
}

TEST_CASE("Record metadata", "[metadata]") {
    const auto& meta = Metadata<Profile>();
    REQUIRE(meta.fields.size() == 7);
    REQUIRE_FALSE(meta.error.has_value());

    SECTION("Keys per format") {
        const auto* name = meta.find("display_name");
        REQUIRE(name != nullptr);
        REQUIRE(name->key(Format::JSON) == "displayName");
        REQUIRE(name->key(Format::YAML) == "display_name");
        REQUIRE(meta.find("id")->key(Format::YAML) == "id");
        REQUIRE(meta.find("address")->json_key == "address");
    }

    SECTION("Trimmed rules") {
        const auto* name = meta.find("display_name");
        REQUIRE(name->rules.size() == 3);
        REQUIRE(name->rules[2].name == "max");
        REQUIRE(name->rules[2].params.at("value") == Value{20.0});
    }

    SECTION("Member shapes") {
        REQUIRE(meta.find("address")->optional);
        REQUIRE(meta.find("address")->nested != nullptr);
        REQUIRE(meta.find("address")->nested().fields.size() == 1);
        REQUIRE(meta.find("previous")->kind == fields::FieldKind::Sequence);
        REQUIRE(meta.find("previous")->nested != nullptr);
        REQUIRE(meta.find("extra")->raw);
        REQUIRE(meta.find("internal")->skip);
        REQUIRE(meta.find("score")->optional);
        REQUIRE(meta.find("score")->nested == nullptr);
    }

    SECTION("Computed once") {
        REQUIRE(&Metadata<Profile>() == &meta);
    }
}

TEST_CASE("Malformed rule strings surface on the record", "[metadata]") {
    const auto& meta = Metadata<Broken>();
    REQUIRE(meta.error.has_value());
    REQUIRE(*meta.error == ErrorCode::ConfigurationError);
    REQUIRE(meta.error->field == "id");
    REQUIRE(meta.error->message.find("on field \"id\"") != std::string::npos);
}

TEST_CASE("Records can be checked before first use", "[metadata]") {
    REQUIRE_FALSE(CheckRecord<Profile>().has_value());
    REQUIRE_FALSE(CheckRecord<Link>().has_value());
    REQUIRE_FALSE(CheckRecord<SkipsBroken>().has_value());

    const auto direct = CheckRecord<Broken>();
    REQUIRE(direct.has_value());
    REQUIRE(*direct == ErrorCode::ConfigurationError);

    const auto nested = CheckRecord<HoldsBroken>();
    REQUIRE(nested.has_value());
    REQUIRE(nested->field == "id");
}

TEST_CASE("Malformed rules are logged when first resolved", "[metadata][log]") {
    std::vector<std::string> lines;
    log::SetSink([&](log::Level level, std::string_view message) {
        if (level == log::Level::Error) {
            lines.emplace_back(message);
        }
    });
    const auto first = CheckRecord<Misnamed>();
    const auto second = CheckRecord<Misnamed>();
    log::SetSink({});

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].starts_with("record rules rejected: malformed validation rule"));
}
