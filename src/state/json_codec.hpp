#pragma once

#include "buffers/pooled_buffer_writer.hpp"
#include "common/bytes.hpp"

#include <optional>
#include <string>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace cstate {

namespace detail {

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

} // namespace detail

// ── JsonCodec ────────────────────────────────────────────────────────────────
//
// Default value codec for PersistentState::persist_as_json() and
// try_take_as_json().  Any type nlohmann::json can convert (including user
// types with to_json/from_json) is supported.  std::optional maps to JSON
// null when empty; `nullptr` encodes as null.
//
// A replacement codec provides the same two static members.  decode() reports
// failure by throwing; PersistentState turns that into DecodeError.

struct JsonCodec {
    template <typename T>
    static void encode(const T& value, PooledBufferWriter& out) {
        out.write(to_json(value).dump());
    }

    template <typename T>
    [[nodiscard]] static T decode(ByteView bytes) {
        auto text = as_string_view(bytes);
        auto json = nlohmann::json::parse(text.begin(), text.end());
        return from_json<T>(json);
    }

private:
    template <typename T>
    static nlohmann::json to_json(const T& value) {
        if constexpr (detail::is_optional<T>::value) {
            if (!value.has_value()) {
                return nullptr;
            }
            return to_json(*value);
        } else {
            return nlohmann::json(value);
        }
    }

    template <typename T>
    static T from_json(const nlohmann::json& json) {
        if constexpr (detail::is_optional<T>::value) {
            if (json.is_null()) {
                return std::nullopt;
            }
            return from_json<typename T::value_type>(json);
        } else {
            return json.get<T>();
        }
    }
};

} // namespace cstate
