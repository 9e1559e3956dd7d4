#include "test_context.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

using namespace components::storage;
using namespace components::document;
using components::base::engine_exception_t;
using components::base::error_code_t;
using services::collection::collection_service_t;

namespace {

    error_code_t error_of(const std::function<void()>& action) {
        try {
            action();
        } catch (const engine_exception_t& e) {
            return e.code();
        }
        return error_code_t::none;
    }

    std::vector<std::string> names_of(services::context_storage_t& context) {
        std::vector<std::string> names;
        for (const auto& collection : context.collections.get_all()) {
            names.push_back(collection.collection_name());
        }
        return names;
    }

} // namespace

TEST_CASE("services::collection::collection_service::add") {
    test_storage_t storage;

    {
        auto context = storage.begin();
        auto* collection = context->collections.add("Items");
        REQUIRE(collection->collection_name() == "Items");
        REQUIRE(collection->sequence() == 0);

        const auto& pk = collection->pk();
        REQUIRE(pk.name == "_id");
        REQUIRE(pk.expression == "$._id");
        REQUIRE(pk.unique);
        REQUIRE_FALSE(pk.head_node.is_empty());
        REQUIRE_FALSE(pk.tail_node.is_empty());
        REQUIRE(collection->get_indexes(false).empty());
        REQUIRE(context->transaction.holds_header_lock());
        context->transaction.commit();
    }

    auto context = storage.begin();
    SECTION("get ignores case") {
        REQUIRE(context->collections.get("items") != nullptr);
        REQUIRE(context->collections.get("ITEMS") == context->collections.get("Items"));
        REQUIRE(context->collections.get("orders") == nullptr);
        REQUIRE(error_of([&] { context->collections.get(""); }) == error_code_t::argument_error);
    }

    SECTION("get_or_add returns the existing collection") {
        auto* existing = context->collections.get("Items");
        REQUIRE(context->collections.get_or_add("items") == existing);
        REQUIRE_FALSE(context->transaction.holds_header_lock());
        REQUIRE(names_of(*context).size() == 1);
    }

    SECTION("add existing name") {
        REQUIRE(error_of([&] { context->collections.add("iTeMs"); }) == error_code_t::already_exists);
    }
}

TEST_CASE("services::collection::collection_service::names") {
    REQUIRE(collection_service_t::is_valid_name("items"));
    REQUIRE(collection_service_t::is_valid_name("order_lines-2024"));
    REQUIRE(collection_service_t::is_valid_name(std::string(60, 'a')));
    REQUIRE_FALSE(collection_service_t::is_valid_name(std::string(61, 'a')));
    REQUIRE_FALSE(collection_service_t::is_valid_name(""));
    REQUIRE_FALSE(collection_service_t::is_valid_name("my items"));
    REQUIRE_FALSE(collection_service_t::is_valid_name("a.b"));
    REQUIRE_FALSE(collection_service_t::is_valid_name("$items"));

    test_storage_t storage;
    auto context = storage.begin();
    REQUIRE(error_of([&] { context->collections.add("my items"); }) == error_code_t::invalid_format);
    REQUIRE(error_of([&] { context->collections.get_or_add("a/b"); }) == error_code_t::invalid_format);
}

TEST_CASE("services::collection::collection_service::limit") {
    test_storage_t storage;
    // "abcdefghij" takes 10 + 8 bytes of a 30 byte directory
    auto context = storage.begin(30);
    context->collections.add("abcdefghij");

    SECTION("meeting the limit fails") {
        REQUIRE(error_of([&] { context->collections.add("abcd"); }) == error_code_t::collection_limit_exceeded);
        REQUIRE(names_of(*context).size() == 1);
    }

    SECTION("below the limit") {
        context->collections.add("abc");
        REQUIRE(names_of(*context).size() == 2);
        REQUIRE(error_of([&] { context->collections.add("a"); }) == error_code_t::collection_limit_exceeded);
    }

    SECTION("rename to a longer name") {
        auto* collection = context->collections.get("abcdefghij");
        auto too_long = std::string(22, 'x');
        REQUIRE(error_of([&] { context->collections.rename(*collection, too_long); }) ==
                error_code_t::collection_limit_exceeded);
        REQUIRE(collection->collection_name() == "abcdefghij");
        REQUIRE(names_of(*context) == std::vector<std::string>{"abcdefghij"});

        context->collections.rename(*collection, std::string(21, 'x'));
        REQUIRE(names_of(*context) == std::vector<std::string>{std::string(21, 'x')});
    }
}

TEST_CASE("services::collection::collection_service::get_all") {
    test_storage_t storage;
    {
        auto context = storage.begin();
        context->collections.add("orders");
        context->collections.add("items");
        context->collections.add("customers");
        context->transaction.commit();
    }

    auto context = storage.begin();
    auto all = context->collections.get_all();
    std::vector<std::string> expected{"customers", "items", "orders"};
    std::vector<std::string> first;
    for (const auto& collection : all) {
        first.push_back(collection.collection_name());
    }
    REQUIRE(first == expected);

    context->collections.add("lines");
    std::vector<std::string> second;
    for (const auto& collection : all) {
        second.push_back(collection.collection_name());
    }
    REQUIRE(second.size() == 4);
}

TEST_CASE("services::collection::collection_service::rename") {
    test_storage_t storage;
    {
        auto context = storage.begin();
        context->collections.add("items");
        context->collections.add("orders");
        context->transaction.commit();
    }

    SECTION("to a new name") {
        {
            auto context = storage.begin();
            context->collections.rename(*context->collections.get("items"), "products");
            context->transaction.commit();
        }
        auto context = storage.begin();
        REQUIRE(context->collections.get("items") == nullptr);
        auto* renamed = context->collections.get("products");
        REQUIRE(renamed != nullptr);
        REQUIRE(renamed->collection_name() == "products");
        REQUIRE(names_of(*context) == std::vector<std::string>{"orders", "products"});
    }

    SECTION("to an existing name in any case") {
        {
            auto context = storage.begin();
            auto* items = context->collections.get("items");
            REQUIRE(error_of([&] { context->collections.rename(*items, "ORDERS"); }) == error_code_t::already_exists);
            REQUIRE(error_of([&] { context->collections.rename(*items, "Items"); }) == error_code_t::already_exists);
        }
        auto context = storage.begin();
        auto* items = context->collections.get("items");
        auto* orders = context->collections.get("orders");
        REQUIRE(items != nullptr);
        REQUIRE(orders != nullptr);
        REQUIRE(items->collection_name() == "items");
        REQUIRE(items->id() != orders->id());
    }

    SECTION("to an invalid name") {
        auto context = storage.begin();
        auto* items = context->collections.get("items");
        REQUIRE(error_of([&] { context->collections.rename(*items, "new items"); }) == error_code_t::invalid_format);
    }
}

TEST_CASE("services::collection::collection_service::drop") {
    test_storage_t storage;
    REQUIRE(storage.file.page_count() == 1);

    {
        auto context = storage.begin();
        services::collection::document_writer_t writer(*context, storage.generator);
        REQUIRE(writer.ensure_index("items", "tags", "$.tags[*]", false));
    }
    documents_t documents(&storage.resource);
    for (int32_t i = 0; i < 300; ++i) {
        documents.push_back(make_document(std::initializer_list<document_t::field_t>{
            {"_id", i},
            {"tags", array_t{value_t("a" + std::to_string(i % 7)), value_t("b" + std::to_string(i % 5))}},
            {"payload", std::string(i % 50 == 0 ? 20000 : 100, 'p')}}));
    }
    REQUIRE(storage.insert("items", documents, auto_id_t::int32) == 300);
    storage.insert("orders", make_documents(&storage.resource, 3), auto_id_t::object_id);
    auto pages_with_orders = storage.file.page_count();

    {
        auto context = storage.begin();
        context->transaction.write_lock("orders");
        context->collections.drop(*context->collections.get("orders"));
        context->transaction.commit();
    }
    auto pages_with_items = storage.file.page_count();
    REQUIRE(pages_with_items < pages_with_orders);

    {
        auto context = storage.begin();
        context->transaction.write_lock("items");
        context->collections.drop(*context->collections.get("items"));
        context->transaction.commit();
    }

    REQUIRE(storage.file.page_count() == 1);
    auto context = storage.begin();
    REQUIRE(names_of(*context).empty());
    REQUIRE(context->collections.get("items") == nullptr);
    REQUIRE(storage.file.free_count() + 1 >= pages_with_orders);
}

TEST_CASE("services::collection::collection_service::concurrent get_or_add") {
    test_storage_t storage;
    constexpr int writers = 8;
    std::vector<std::thread> threads;
    std::vector<page_id_t> pages(writers, invalid_page_id);
    for (int i = 0; i < writers; ++i) {
        threads.emplace_back([&storage, &pages, i] {
            auto context = storage.begin();
            pages[static_cast<std::size_t>(i)] = context->collections.get_or_add("shared")->id();
            context->transaction.commit();
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto context = storage.begin();
    REQUIRE(names_of(*context) == std::vector<std::string>{"shared"});
    auto id = context->collections.get("shared")->id();
    for (auto page : pages) {
        REQUIRE(page == id);
    }
}

TEST_CASE("services::collection::collection_service::get_all during drop") {
    test_storage_t storage;
    {
        auto context = storage.begin();
        context->collections.add("a");
        context->collections.add("b");
        context->transaction.commit();
    }

    auto reader = storage.begin();
    auto all = reader->collections.get_all();
    auto it = all.begin();

    std::atomic<bool> dropped{false};
    std::thread writer([&storage, &dropped] {
        auto context = storage.begin();
        context->transaction.write_lock("a");
        context->collections.drop(*context->collections.get("a"));
        context->transaction.commit();
        dropped = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::vector<std::string> names;
    for (; it != all.end(); ++it) {
        names.push_back(it->collection_name());
    }
    bool dropped_while_reading = dropped.load();
    reader.reset();
    writer.join();

    REQUIRE(names == std::vector<std::string>{"a", "b"});
    REQUIRE_FALSE(dropped_while_reading);
    REQUIRE(dropped.load());
    auto context = storage.begin();
    REQUIRE(names_of(*context) == std::vector<std::string>{"b"});
}
