#include <catch2/catch.hpp>
#include <components/document/identity_generator.hpp>
#include <components/document/msgpack/msgpack_encoder.hpp>

using namespace components::document;

TEST_CASE("components::document::msgpack::serialize") {
    default_identity_generator_t generator;
    auto oid = generator.object_id();
    auto guid = generator.guid();
    auto now = generator.timestamp();

    document_t doc{{"_id", oid},
                   {"int32", int32_t(-7)},
                   {"int64", int64_t(1) << 40},
                   {"small_int64", int64_t(3)},
                   {"double", 2.5},
                   {"string", "text"},
                   {"flag", true},
                   {"nothing", nullptr},
                   {"guid", guid},
                   {"date", now},
                   {"binary", binary_t{1, 2, 3}},
                   {"array", array_t{value_t(1), value_t("two")}},
                   {"nested", document_t{{"city", "Oslo"}}}};

    auto buffer = serialize(doc);
    auto result = deserialize(buffer);

    SECTION("values survive") { REQUIRE(result == doc); }

    SECTION("types survive") {
        REQUIRE(result.get("_id").is_object_id());
        REQUIRE(result.get("_id").as_object_id() == oid);
        REQUIRE(result.get("int32").is_int32());
        REQUIRE(result.get("int64").is_int64());
        REQUIRE(result.get("small_int64").is_int64());
        REQUIRE(result.get("guid").as_guid() == guid);
        REQUIRE(result.get("date").as_datetime() == now);
        REQUIRE(result.get("nested").as_document().get("city") == value_t("Oslo"));
    }

    SECTION("field order") {
        auto it = result.begin();
        REQUIRE(it->first == "_id");
        REQUIRE((++it)->first == "int32");
    }
}

TEST_CASE("components::document::msgpack::sentinels") {
    document_t doc{{"low", value_t::min_value()}, {"high", value_t::max_value()}};
    auto result = deserialize(serialize(doc));
    REQUIRE(result.get("low").is_min_value());
    REQUIRE(result.get("high").is_max_value());
}

TEST_CASE("components::document::msgpack::invalid") {
    msgpack::sbuffer sbuf;
    msgpack::pack(sbuf, 42);
    REQUIRE_THROWS_AS(deserialize(sbuf.data(), sbuf.size()), std::logic_error);
}
