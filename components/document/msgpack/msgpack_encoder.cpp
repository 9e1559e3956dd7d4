#include "msgpack_encoder.hpp"

#include <cstring>
#include <stdexcept>

namespace components::document {

    namespace {

        value_t ext_to_value(const msgpack::object_ext& ext) {
            switch (static_cast<ext_type_t>(ext.type())) {
                case ext_type_t::min_value:
                    return value_t::min_value();
                case ext_type_t::max_value:
                    return value_t::max_value();
                case ext_type_t::int64: {
                    if (ext.size != 8) {
                        throw std::logic_error("to_value: int64 ext has invalid size");
                    }
                    return value_t(static_cast<int64_t>(detail::unpack_u64_be(ext.data())));
                }
                case ext_type_t::datetime: {
                    if (ext.size != 8) {
                        throw std::logic_error("to_value: datetime ext has invalid size");
                    }
                    auto micros = static_cast<int64_t>(detail::unpack_u64_be(ext.data()));
                    return value_t(datetime_t(std::chrono::microseconds(micros)));
                }
                case ext_type_t::object_id: {
                    if (ext.size != object_id_t::size) {
                        throw std::logic_error("to_value: object_id ext has invalid size");
                    }
                    object_id_t::bytes_t bytes{};
                    std::memcpy(bytes.data(), ext.data(), bytes.size());
                    return value_t(object_id_t(bytes));
                }
                case ext_type_t::guid: {
                    guid_t guid{};
                    if (ext.size != guid.size()) {
                        throw std::logic_error("to_value: guid ext has invalid size");
                    }
                    std::memcpy(guid.data, ext.data(), guid.size());
                    return value_t(guid);
                }
            }
            throw std::logic_error("to_value: unknown msgpack ext type");
        }

    } // namespace

    value_t to_value(const msgpack::object& object) {
        switch (object.type) {
            case msgpack::type::NIL:
                return value_t();
            case msgpack::type::BOOLEAN:
                return value_t(object.via.boolean);
            case msgpack::type::POSITIVE_INTEGER:
                return value_t(static_cast<int32_t>(object.via.u64));
            case msgpack::type::NEGATIVE_INTEGER:
                return value_t(static_cast<int32_t>(object.via.i64));
            case msgpack::type::FLOAT32:
            case msgpack::type::FLOAT64:
                return value_t(object.via.f64);
            case msgpack::type::STR:
                return value_t(std::string(object.via.str.ptr, object.via.str.size));
            case msgpack::type::BIN: {
                const auto* begin = reinterpret_cast<const uint8_t*>(object.via.bin.ptr);
                return value_t(binary_t(begin, begin + object.via.bin.size));
            }
            case msgpack::type::ARRAY: {
                array_t array;
                array.reserve(object.via.array.size);
                for (uint32_t i = 0; i < object.via.array.size; ++i) {
                    array.push_back(to_value(object.via.array.ptr[i]));
                }
                return value_t(std::move(array));
            }
            case msgpack::type::MAP:
                return value_t(to_document(object));
            case msgpack::type::EXT:
                return ext_to_value(object.via.ext);
            default:
                throw std::logic_error("to_value: unsupported msgpack type");
        }
    }

    document_t to_document(const msgpack::object& object) {
        if (object.type != msgpack::type::MAP) {
            throw std::logic_error("to_document: msgpack object is not a map");
        }
        document_t document;
        for (uint32_t i = 0; i < object.via.map.size; ++i) {
            const auto& kv = object.via.map.ptr[i];
            if (kv.key.type != msgpack::type::STR) {
                throw std::logic_error("to_document: field name is not a string");
            }
            document.set(std::string_view(kv.key.via.str.ptr, kv.key.via.str.size), to_value(kv.val));
        }
        return document;
    }

    buffer_t serialize(const document_t& document) {
        msgpack::sbuffer sbuf;
        msgpack::pack(sbuf, document);
        return buffer_t(sbuf.data(), sbuf.data() + sbuf.size());
    }

    document_t deserialize(const char* data, std::size_t size) {
        auto handle = msgpack::unpack(data, size);
        return to_document(handle.get());
    }

} // namespace components::document
