#include "test_context.hpp"

#include <catch2/catch.hpp>

#include <functional>
#include <limits>

using namespace components::storage;
using namespace components::document;
using components::base::engine_exception_t;
using components::base::error_code_t;
using services::collection::document_writer_t;
using services::index::index_order_t;

namespace {

    error_code_t error_of(const std::function<void()>& action) {
        try {
            action();
        } catch (const engine_exception_t& e) {
            return e.code();
        }
        return error_code_t::none;
    }

    documents_t single(std::pmr::memory_resource* resource, document_ptr document) {
        documents_t documents(resource);
        documents.push_back(std::move(document));
        return documents;
    }

} // namespace

TEST_CASE("services::collection::document_writer::insert") {
    test_storage_t storage;
    auto documents = make_documents(&storage.resource, 50);

    REQUIRE(storage.insert("items", documents, auto_id_t::object_id) == 50);

    for (const auto& document : documents) {
        auto id = document->get(id_field);
        REQUIRE(id.is_object_id());
        REQUIRE(document->begin()->first == id_field);
        auto stored = storage.find("items", id);
        REQUIRE(stored.has_value());
        REQUIRE(*stored == *document);
    }

    auto context = storage.begin();
    auto* collection = context->collections.get("items");
    REQUIRE(collection->document_count() == 50);
    REQUIRE(collection->sequence() == 50);
}

TEST_CASE("services::collection::document_writer::auto id") {
    test_storage_t storage;

    SECTION("guid") {
        auto documents = make_documents(&storage.resource, 2);
        storage.insert("items", documents, auto_id_t::guid);
        REQUIRE(documents[0]->get(id_field).is_guid());
        REQUIRE(documents[0]->get(id_field) != documents[1]->get(id_field));
    }

    SECTION("datetime") {
        auto documents = make_documents(&storage.resource, 1);
        storage.insert("items", documents, auto_id_t::datetime);
        REQUIRE(documents[0]->get(id_field).is_datetime());
        REQUIRE(storage.find("items", documents[0]->get(id_field)).has_value());
    }

    SECTION("int64") {
        auto documents = make_documents(&storage.resource, 2);
        storage.insert("items", documents, auto_id_t::int64);
        REQUIRE(documents[0]->get(id_field).is_int64());
        REQUIRE(documents[1]->get(id_field) == value_t(int64_t(2)));
    }
}

TEST_CASE("services::collection::document_writer::sequence") {
    test_storage_t storage;
    auto& resource = storage.resource;

    SECTION("int32 scenario") {
        auto documents = make_documents(&resource, 3);
        REQUIRE(storage.insert("items", documents, auto_id_t::int32) == 3);
        REQUIRE(storage.sequence("items") == 3);
        REQUIRE(documents[0]->get(id_field) == value_t(int32_t(1)));
        REQUIRE(documents[1]->get(id_field) == value_t(int32_t(2)));
        REQUIRE(documents[2]->get(id_field) == value_t(int32_t(3)));
        REQUIRE(documents[2]->get(id_field).is_int32());

        storage.insert("items", single(&resource, make_document(std::initializer_list<document_t::field_t>{{"_id", 10}})), auto_id_t::int32);
        REQUIRE(storage.sequence("items") == 10);

        storage.insert("items", single(&resource, make_document(std::initializer_list<document_t::field_t>{{"_id", 5}})), auto_id_t::int32);
        REQUIRE(storage.sequence("items") == 10);

        auto next = make_documents(&resource, 1);
        storage.insert("items", next, auto_id_t::int32);
        REQUIRE(next[0]->get(id_field) == value_t(int32_t(11)));
    }

    SECTION("int64 bubble") {
        storage.insert("items", make_documents(&resource, 4), auto_id_t::int64);
        const int64_t start = storage.sequence("items");

        storage.insert("items", make_documents(&resource, 1), auto_id_t::int64);
        REQUIRE(storage.sequence("items") == start + 1);

        storage.insert("items",
                       single(&resource, make_document(std::initializer_list<document_t::field_t>{{"_id", value_t(start + 5)}})),
                       auto_id_t::int64);
        REQUIRE(storage.sequence("items") == start + 5);

        storage.insert("items",
                       single(&resource, make_document(std::initializer_list<document_t::field_t>{{"_id", value_t(start + 2)}})),
                       auto_id_t::int64);
        REQUIRE(storage.sequence("items") == start + 5);
    }

    SECTION("non-numeric explicit ids give back the increment") {
        storage.insert("items", make_documents(&resource, 3), auto_id_t::int32);
        REQUIRE(storage.sequence("items") == 3);

        storage.insert("items",
                       single(&resource, make_document(std::initializer_list<document_t::field_t>{{"_id", "abc"}})),
                       auto_id_t::int32);
        REQUIRE(storage.sequence("items") == 3);

        storage.insert(
            "items",
            single(&resource,
                   make_document(std::initializer_list<document_t::field_t>{{"_id", value_t(storage.generator.object_id())}})),
            auto_id_t::int64);
        REQUIRE(storage.sequence("items") == 3);
        REQUIRE(storage.find("items", value_t("abc")).has_value());
    }

    SECTION("sequence wraps after the largest id") {
        constexpr auto largest = std::numeric_limits<int64_t>::max();
        storage.insert("items",
                       single(&resource, make_document(std::initializer_list<document_t::field_t>{{"_id", value_t(largest)}})),
                       auto_id_t::int64);
        REQUIRE(storage.sequence("items") == largest);

        auto next = make_documents(&resource, 1);
        storage.insert("items", next, auto_id_t::int64);
        REQUIRE(storage.sequence("items") == std::numeric_limits<int64_t>::min());
        REQUIRE(next[0]->get(id_field) == value_t(std::numeric_limits<int64_t>::min()));
    }

    SECTION("huge double ids saturate the sequence") {
        storage.insert("items",
                       single(&resource, make_document(std::initializer_list<document_t::field_t>{{"_id", 1e300}})),
                       auto_id_t::int64);
        REQUIRE(storage.sequence("items") == std::numeric_limits<int64_t>::max());
        REQUIRE(storage.find("items", value_t(1e300)).has_value());
    }

    SECTION("explicit ids leave object id mode alone") {
        storage.insert("items", single(&resource, make_document(std::initializer_list<document_t::field_t>{{"_id", 100}})), auto_id_t::object_id);
        REQUIRE(storage.sequence("items") == 1);
    }
}

TEST_CASE("services::collection::document_writer::invalid identity") {
    test_storage_t storage;
    auto& resource = storage.resource;
    storage.insert("items", make_documents(&resource, 1), auto_id_t::int32);
    auto pages = storage.file.page_count();

    for (auto auto_id : {auto_id_t::object_id, auto_id_t::guid, auto_id_t::datetime, auto_id_t::int32, auto_id_t::int64}) {
        for (const auto& id : {value_t(), value_t::min_value(), value_t::max_value()}) {
            auto documents = single(&resource, make_document(std::initializer_list<document_t::field_t>{{"_id", id}, {"a", 1}}));
            REQUIRE(error_of([&] { storage.insert("items", documents, auto_id); }) == error_code_t::invalid_data_type);
            REQUIRE(error_of([&] { storage.insert("fresh", documents, auto_id); }) == error_code_t::invalid_data_type);
        }
    }

    REQUIRE(storage.file.page_count() == pages);
    REQUIRE(storage.sequence("items") == 1);
    auto context = storage.begin();
    REQUIRE(context->collections.get("fresh") == nullptr);
}

TEST_CASE("services::collection::document_writer::arguments") {
    test_storage_t storage;
    auto& resource = storage.resource;
    auto context = storage.begin();
    document_writer_t writer(*context, storage.generator);

    REQUIRE(error_of([&] { writer.insert("", make_documents(&resource, 1), auto_id_t::object_id); }) ==
            error_code_t::argument_error);
    REQUIRE(error_of([&] { writer.insert("  ", make_documents(&resource, 1), auto_id_t::object_id); }) ==
            error_code_t::argument_error);
    REQUIRE(error_of([&] { writer.upsert("items", single(&resource, nullptr), auto_id_t::object_id); }) ==
            error_code_t::argument_error);
    REQUIRE(error_of([&] { writer.insert("bad name", make_documents(&resource, 1), auto_id_t::object_id); }) ==
            error_code_t::invalid_format);
    REQUIRE(context->transaction.is_active());
}

TEST_CASE("services::collection::document_writer::batch is atomic") {
    test_storage_t storage;
    auto& resource = storage.resource;
    storage.insert("items", make_documents(&resource, 2), auto_id_t::int32);

    documents_t documents(&resource);
    documents.push_back(make_document(std::initializer_list<document_t::field_t>{{"_id", 20}}));
    documents.push_back(make_document(std::initializer_list<document_t::field_t>{{"_id", 21}}));
    documents.push_back(make_document(std::initializer_list<document_t::field_t>{{"_id", 1}}));
    REQUIRE(error_of([&] { storage.insert("items", documents, auto_id_t::int32); }) == error_code_t::index_duplicate_key);

    REQUIRE_FALSE(storage.find("items", value_t(20)).has_value());
    REQUIRE_FALSE(storage.find("items", value_t(21)).has_value());
    REQUIRE(storage.sequence("items") == 2);
}

TEST_CASE("services::collection::document_writer::upsert") {
    test_storage_t storage;
    auto& resource = storage.resource;

    SECTION("into an empty collection") {
        auto documents = make_documents(&resource, 10);
        auto context = storage.begin();
        REQUIRE(document_writer_t(*context, storage.generator).upsert("items", documents, auto_id_t::int64) == 10);
        REQUIRE(storage.sequence("items") == 10);
    }

    SECTION("updates existing documents") {
        storage.insert("items", make_documents(&resource, 3), auto_id_t::int32);

        documents_t documents(&resource);
        documents.push_back(make_document(std::initializer_list<document_t::field_t>{{"_id", 2}, {"name", "changed"}}));
        documents.push_back(make_document(std::initializer_list<document_t::field_t>{{"_id", 7}, {"name", "new"}}));
        documents.push_back(make_document(std::initializer_list<document_t::field_t>{{"name", "auto"}}));

        auto context = storage.begin();
        REQUIRE(document_writer_t(*context, storage.generator).upsert("items", documents, auto_id_t::int32) == 2);

        REQUIRE(storage.find("items", value_t(2))->get("name") == value_t("changed"));
        REQUIRE(storage.find("items", value_t(7))->get("name") == value_t("new"));
        REQUIRE(documents[2]->get(id_field) == value_t(int32_t(8)));
        auto check = storage.begin();
        REQUIRE(check->collections.get("items")->document_count() == 5);
    }
}

TEST_CASE("services::collection::document_writer::fan-out") {
    test_storage_t storage;
    auto& resource = storage.resource;
    {
        auto context = storage.begin();
        REQUIRE(document_writer_t(*context, storage.generator).ensure_index("items", "tags", "$.tags[*]", false));
    }

    auto document = make_document(std::initializer_list<document_t::field_t>{
        {"_id", 1},
        {"tags", array_t{value_t("red"), value_t("green"), value_t("blue")}}});
    storage.insert("items", single(&resource, document), auto_id_t::int32);
    storage.insert("items",
                   single(&resource, make_document(std::initializer_list<document_t::field_t>{{"_id", 2}})),
                   auto_id_t::int32);

    auto context = storage.begin();
    auto* collection = context->collections.get("items");
    auto* tags = collection->get_index("tags");
    REQUIRE(tags != nullptr);
    auto* primary = context->indexer.find(collection->pk(), value_t(1));
    REQUIRE(primary != nullptr);

    std::vector<std::string> keys;
    std::size_t nulls = 0;
    for (const auto& node : context->indexer.find_all(*tags, index_order_t::ascending)) {
        if (node.key.is_null()) {
            ++nulls;
            continue;
        }
        REQUIRE(node.data_block == primary->data_block);
        REQUIRE(node.primary == primary->position);
        keys.push_back(node.key.as_string());
    }
    REQUIRE(keys == std::vector<std::string>{"blue", "green", "red"});
    // a document without tags is indexed under null
    REQUIRE(nulls == 1);
}

TEST_CASE("services::collection::document_writer::unique secondary index") {
    test_storage_t storage;
    auto& resource = storage.resource;
    {
        auto context = storage.begin();
        REQUIRE(document_writer_t(*context, storage.generator).ensure_index("users", "email", "$.email", true));
    }
    {
        auto context = storage.begin();
        REQUIRE_FALSE(document_writer_t(*context, storage.generator).ensure_index("users", "email", "$.email", true));
    }

    storage.insert("users",
                   single(&resource, make_document(std::initializer_list<document_t::field_t>{{"email", "a@x.org"}})),
                   auto_id_t::int32);
    REQUIRE(error_of([&] {
                storage.insert("users",
                               single(&resource, make_document(std::initializer_list<document_t::field_t>{{"email", "a@x.org"}})),
                               auto_id_t::int32);
            }) == error_code_t::index_duplicate_key);
}

TEST_CASE("services::collection::document_writer::update") {
    test_storage_t storage;
    auto& resource = storage.resource;
    {
        auto context = storage.begin();
        document_writer_t(*context, storage.generator).ensure_index("items", "tags", "$.tags[*]", false);
    }
    storage.insert("items",
                   single(&resource, make_document(std::initializer_list<document_t::field_t>{
                                         {"_id", 1}, {"tags", array_t{value_t("a"), value_t("b")}}})),
                   auto_id_t::int32);

    {
        documents_t documents(&resource);
        documents.push_back(make_document(std::initializer_list<document_t::field_t>{
            {"_id", 1}, {"tags", array_t{value_t("c")}}, {"payload", std::string(20000, 'x')}}));
        documents.push_back(make_document(std::initializer_list<document_t::field_t>{{"_id", 9}}));
        auto context = storage.begin();
        REQUIRE(document_writer_t(*context, storage.generator).update("items", documents) == 1);
    }
    {
        auto context = storage.begin();
        REQUIRE(document_writer_t(*context, storage.generator).update("missing", make_documents(&resource, 1)) == 0);
    }

    auto stored = storage.find("items", value_t(1));
    REQUIRE(stored.has_value());
    REQUIRE(stored->get("payload").as_string().size() == 20000);
    REQUIRE_FALSE(storage.find("items", value_t(9)).has_value());

    auto context = storage.begin();
    auto* collection = context->collections.get("items");
    std::vector<std::string> keys;
    for (const auto& node : context->indexer.find_all(*collection->get_index("tags"), index_order_t::ascending)) {
        keys.push_back(node.key.as_string());
    }
    REQUIRE(keys == std::vector<std::string>{"c"});
    REQUIRE(collection->document_count() == 1);
}
