#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <type_traits>

namespace reprise::util {

// Length-prefixed string: uint32 length, then the bytes
inline void write_string(std::ostream& out, const std::string& s) {
    uint32_t len = static_cast<uint32_t>(s.length());
    out.write(reinterpret_cast<const char*>(&len), sizeof(len));
    if (len > 0) out.write(s.data(), len);
}

// Fails the stream on a truncated record
inline bool read_string(std::istream& in, std::string& s, uint32_t max_len = 1u << 20) {
    uint32_t len = 0;
    if (!in.read(reinterpret_cast<char*>(&len), sizeof(len))) return false;
    if (len > max_len) {
        in.setstate(std::ios::failbit);
        return false;
    }
    s.assign(len, '\0');
    if (len > 0 && !in.read(s.data(), len)) return false;
    return true;
}

template <typename T>
inline void write_pod(std::ostream& out, const T& value) {
    static_assert(std::is_trivially_copyable_v<T>);
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
inline bool read_pod(std::istream& in, T& value) {
    static_assert(std::is_trivially_copyable_v<T>);
    return static_cast<bool>(in.read(reinterpret_cast<char*>(&value), sizeof(T)));
}

}  // namespace reprise::util
