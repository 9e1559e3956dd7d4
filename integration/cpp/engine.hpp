#pragma once

#include <components/configuration/configuration.hpp>
#include <components/document/document.hpp>
#include <components/document/identity_generator.hpp>
#include <components/log/log.hpp>
#include <components/storage/page_file.hpp>
#include <core/pmr.hpp>
#include <services/transaction/lock_service.hpp>

#include <filesystem>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace services {
    struct context_storage_t;
} // namespace services

namespace burrowdb {

    /// Embeddable document store. Every call runs in its own transaction:
    /// it either commits completely or leaves no trace.
    class engine_t {
    public:
        explicit engine_t(const configuration::config& config,
                          std::unique_ptr<components::document::identity_generator_t> generator = nullptr);
        engine_t(const engine_t&) = delete;
        engine_t& operator=(const engine_t&) = delete;
        ~engine_t();

        log_t& get_log();
        std::pmr::memory_resource* resource();
        components::storage::page_file_t& page_file();

        std::size_t insert(std::string_view collection,
                           const components::document::documents_t& documents,
                           components::document::auto_id_t auto_id);
        std::size_t insert(std::string_view collection, const components::document::documents_t& documents);
        std::size_t upsert(std::string_view collection,
                           const components::document::documents_t& documents,
                           components::document::auto_id_t auto_id);
        std::size_t upsert(std::string_view collection, const components::document::documents_t& documents);
        std::size_t update(std::string_view collection, const components::document::documents_t& documents);

        std::optional<components::document::document_t> find_by_id(std::string_view collection,
                                                                    const components::document::value_t& id);
        bool ensure_index(std::string_view collection, std::string_view name, std::string_view expression, bool unique);

        bool drop_collection(std::string_view name);
        bool rename_collection(std::string_view name, std::string_view new_name);
        std::vector<std::string> collection_names();
        std::size_t count(std::string_view collection);
        /// current identity sequence of `collection`, 0 if it does not exist
        int64_t sequence(std::string_view collection);

    private:
        core::pmr::unique_ptr<services::context_storage_t> begin_();

        std::filesystem::path main_path_;
        configuration::config_storage storage_config_;
        std::pmr::synchronized_pool_resource resource_;
        log_t log_;
        components::storage::page_file_t page_file_;
        services::transaction::lock_service_t locks_;
        std::unique_ptr<components::document::identity_generator_t> generator_;

        inline static std::set<std::filesystem::path> paths_ = {};
        inline static std::mutex m_;
    };

} // namespace burrowdb
