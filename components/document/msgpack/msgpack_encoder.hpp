#pragma once

#include <components/document/document.hpp>

#include <msgpack.hpp>

#include <vector>

namespace components::document {

    using buffer_t = std::vector<char>;

    // msgpack ext type ids for values without a native msgpack representation
    enum class ext_type_t : int8_t
    {
        object_id = 1,
        guid = 2,
        datetime = 3,
        int64 = 4,
        min_value = 5,
        max_value = 6
    };

    buffer_t serialize(const document_t& document);
    document_t deserialize(const char* data, std::size_t size);
    inline document_t deserialize(const buffer_t& buffer) { return deserialize(buffer.data(), buffer.size()); }

    value_t to_value(const msgpack::object& object);
    document_t to_document(const msgpack::object& object);

    namespace detail {

        inline void pack_u64_be(char* out, uint64_t value) noexcept {
            for (int i = 7; i >= 0; --i) {
                out[i] = static_cast<char>(value & 0xFFu);
                value >>= 8;
            }
        }

        inline uint64_t unpack_u64_be(const char* in) noexcept {
            uint64_t value = 0;
            for (int i = 0; i < 8; ++i) {
                value = (value << 8) | static_cast<uint8_t>(in[i]);
            }
            return value;
        }

        template<typename Stream>
        void pack_ext(msgpack::packer<Stream>& o, ext_type_t type, const char* data, uint32_t size) {
            o.pack_ext(size, static_cast<int8_t>(type));
            if (size != 0) {
                o.pack_ext_body(data, size);
            }
        }

    } // namespace detail

} // namespace components::document

template<typename Stream>
void to_msgpack_(msgpack::packer<Stream>& o, const components::document::document_t& document);

template<typename Stream>
void to_msgpack_(msgpack::packer<Stream>& o, const components::document::value_t& value) {
    using components::document::ext_type_t;
    using components::document::value_type;
    namespace detail = components::document::detail;

    switch (value.type()) {
        case value_type::min_value: {
            detail::pack_ext(o, ext_type_t::min_value, nullptr, 0);
            break;
        }
        case value_type::max_value: {
            detail::pack_ext(o, ext_type_t::max_value, nullptr, 0);
            break;
        }
        case value_type::null: {
            o.pack_nil();
            break;
        }
        case value_type::boolean: {
            o.pack(value.as_bool());
            break;
        }
        case value_type::int32: {
            o.pack_int32(value.as_int32());
            break;
        }
        case value_type::int64: {
            char buffer[8];
            detail::pack_u64_be(buffer, static_cast<uint64_t>(value.as_int64()));
            detail::pack_ext(o, ext_type_t::int64, buffer, sizeof(buffer));
            break;
        }
        case value_type::double_value: {
            o.pack_double(value.as_double());
            break;
        }
        case value_type::string: {
            const auto& str = value.as_string();
            o.pack_str(static_cast<uint32_t>(str.size()));
            o.pack_str_body(str.data(), static_cast<uint32_t>(str.size()));
            break;
        }
        case value_type::binary: {
            const auto& bin = value.as_binary();
            o.pack_bin(static_cast<uint32_t>(bin.size()));
            o.pack_bin_body(reinterpret_cast<const char*>(bin.data()), static_cast<uint32_t>(bin.size()));
            break;
        }
        case value_type::object_id: {
            const auto& bytes = value.as_object_id().bytes();
            detail::pack_ext(o,
                             ext_type_t::object_id,
                             reinterpret_cast<const char*>(bytes.data()),
                             static_cast<uint32_t>(bytes.size()));
            break;
        }
        case value_type::guid: {
            const auto& guid = value.as_guid();
            detail::pack_ext(o,
                             ext_type_t::guid,
                             reinterpret_cast<const char*>(guid.data),
                             static_cast<uint32_t>(guid.size()));
            break;
        }
        case value_type::datetime: {
            char buffer[8];
            detail::pack_u64_be(buffer, static_cast<uint64_t>(value.as_datetime().time_since_epoch().count()));
            detail::pack_ext(o, ext_type_t::datetime, buffer, sizeof(buffer));
            break;
        }
        case value_type::array: {
            const auto& array = value.as_array();
            o.pack_array(static_cast<uint32_t>(array.size()));
            for (const auto& item : array) {
                to_msgpack_(o, item);
            }
            break;
        }
        case value_type::document: {
            to_msgpack_(o, value.as_document());
            break;
        }
    }
}

template<typename Stream>
void to_msgpack_(msgpack::packer<Stream>& o, const components::document::document_t& document) {
    o.pack_map(static_cast<uint32_t>(document.size()));
    for (const auto& [key, value] : document) {
        o.pack_str(static_cast<uint32_t>(key.size()));
        o.pack_str_body(key.data(), static_cast<uint32_t>(key.size()));
        to_msgpack_(o, value);
    }
}

namespace msgpack {
    MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS) {
        namespace adaptor {

            template<>
            struct pack<components::document::document_t> final {
                template<typename Stream>
                packer<Stream>& operator()(msgpack::packer<Stream>& o,
                                           const components::document::document_t& v) const {
                    to_msgpack_(o, v);
                    return o;
                }
            };

            template<>
            struct pack<components::document::value_t> final {
                template<typename Stream>
                packer<Stream>& operator()(msgpack::packer<Stream>& o, const components::document::value_t& v) const {
                    to_msgpack_(o, v);
                    return o;
                }
            };

        } // namespace adaptor
    }     // MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
} // namespace msgpack
