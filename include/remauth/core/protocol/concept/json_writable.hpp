// ============================================================================
// JSON Writable Concepts
// ----------------------------------------------------------------------------
//
// Contract for client -> server opcodes: each schema serializes itself into a
// caller-provided buffer whose required size it reports up front.
//
//   • StaticJsonWritable   max_json_size() is a constant expression
//                          (e.g. the payload-less heartbeat)
//   • DynamicJsonWritable  max_json_size() depends on field contents
//                          (e.g. init carrying a base64 public key)
//
// write_json() never allocates and never throws. Schemas may additionally
// provide an allocating to_json() for tests and logging.
// ============================================================================

#pragma once

#include <concepts>
#include <cstddef>

namespace remauth::core::protocol {

template<typename T>
concept StaticJsonWritable =
    requires(const T& t, char* buffer) {
        { T::max_json_size() } noexcept -> std::convertible_to<std::size_t>;
        { t.write_json(buffer) } noexcept -> std::same_as<std::size_t>;
    }
    &&
    requires {
        requires (T::max_json_size() > 0);
    };

template<typename T>
concept DynamicJsonWritable =
    (!StaticJsonWritable<T>)
    &&
    requires(const T& t, char* buffer) {
        { t.max_json_size() } noexcept -> std::convertible_to<std::size_t>;
        { t.write_json(buffer) } noexcept -> std::same_as<std::size_t>;
    };

template<typename T>
concept JsonWritable = StaticJsonWritable<T> || DynamicJsonWritable<T>;

} // namespace remauth::core::protocol
