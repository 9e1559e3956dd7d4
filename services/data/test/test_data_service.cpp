#include <catch2/catch.hpp>
#include <services/data/data_service.hpp>

using namespace components::storage;
using components::base::engine_exception_t;
using components::base::error_code_t;
using services::data::data_service_t;

namespace {

    struct data_fixture_t {
        std::pmr::synchronized_pool_resource resource;
        page_file_t file{&resource};
        services::transaction::lock_service_t locks{&resource};
        log_t log{initialization_logger("burrowdb_data", "/tmp/burrowdb_test_data/log")};
        services::transaction::transaction_t transaction{&resource, file, locks, log};
        services::transaction::page_service_t pager{transaction};
        data_service_t data{pager, log};
        collection_page_t* collection{pager.new_page<collection_page_t>()};
    };

    buffer_t make_bytes(std::size_t size, char seed) {
        buffer_t result(size);
        for (std::size_t i = 0; i < size; ++i) {
            result[i] = static_cast<char>(seed + static_cast<char>(i % 31));
        }
        return result;
    }

} // namespace

TEST_CASE("services::data::data_service::insert") {
    data_fixture_t fixture;
    auto& data = fixture.data;

    SECTION("small documents share a page") {
        auto first = data.insert(*fixture.collection, make_bytes(100, 'a'));
        auto second = data.insert(*fixture.collection, make_bytes(200, 'b'));
        REQUIRE(first.page_id == second.page_id);
        REQUIRE(first.index != second.index);
        REQUIRE(fixture.collection->free_data_page_id() == first.page_id);
        REQUIRE(data.read(first) == make_bytes(100, 'a'));
        REQUIRE(data.read(second) == make_bytes(200, 'b'));
        REQUIRE(data.get_block(first).extend_page_id == invalid_page_id);
    }

    SECTION("large document continues in extend pages") {
        auto bytes = make_bytes(30000, 'c');
        auto position = data.insert(*fixture.collection, bytes);
        auto block = data.get_block(position);
        REQUIRE(block.document_length == 30000);
        REQUIRE(block.extend_page_id != invalid_page_id);
        REQUIRE(block.data.size() < bytes.size());

        std::size_t chain = 0;
        for (auto next = block.extend_page_id; next != invalid_page_id;
             next = fixture.transaction.get_page<extend_page_t>(next)->next_page_id()) {
            ++chain;
        }
        REQUIRE(chain == 3);
        REQUIRE(data.read(position) == bytes);
    }

    SECTION("full page is not reused") {
        auto first = data.insert(*fixture.collection, make_bytes(8000, 'd'));
        auto second = data.insert(*fixture.collection, make_bytes(300, 'e'));
        REQUIRE(first.page_id != second.page_id);
        REQUIRE(fixture.collection->free_data_page_id() == second.page_id);
    }
}

TEST_CASE("services::data::data_service::update") {
    data_fixture_t fixture;
    auto& data = fixture.data;
    auto position = data.insert(*fixture.collection, make_bytes(500, 'a'));
    data.insert(*fixture.collection, make_bytes(500, 'b'));

    SECTION("shrink") {
        data.update(*fixture.collection, position, make_bytes(50, 'x'));
        REQUIRE(data.read(position) == make_bytes(50, 'x'));
    }

    SECTION("grow past the page") {
        data.update(*fixture.collection, position, make_bytes(20000, 'y'));
        REQUIRE(data.read(position) == make_bytes(20000, 'y'));
        REQUIRE(data.get_block(position).extend_page_id != invalid_page_id);

        data.update(*fixture.collection, position, make_bytes(10, 'z'));
        REQUIRE(data.read(position) == make_bytes(10, 'z'));
        REQUIRE(data.get_block(position).extend_page_id == invalid_page_id);
    }
}

TEST_CASE("services::data::data_service::corruption") {
    data_fixture_t fixture;
    auto position = fixture.data.insert(*fixture.collection, make_bytes(64, 'a'));
    auto* page = fixture.transaction.get_page<data_page_t>(position.page_id);

    SECTION("checksum") {
        page->get_block(position.index)->data[3] ^= 0x1;
        try {
            fixture.data.read(position);
            FAIL("storage_corrupted expected");
        } catch (const engine_exception_t& e) {
            REQUIRE(e.code() == error_code_t::storage_corrupted);
        }
    }

    SECTION("length") {
        page->get_block(position.index)->document_length = 65;
        REQUIRE_THROWS_AS(fixture.data.read(position), engine_exception_t);
    }

    SECTION("missing block") {
        REQUIRE_THROWS_AS(fixture.data.get_block(page_address_t(position.page_id, 7)), engine_exception_t);
    }
}
