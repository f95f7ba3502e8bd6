/**
 * @file input.hh
 * @brief Bounds-checked cursor over an in-memory byte buffer
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/byte_order.hh>
#include <pngme/exceptions.hh>

namespace pngme {

    // Reads from a borrowed buffer. Every read checks the remaining length
    // first and throws parse_error instead of running past the end.
    class PNGME_EXPORT memory_reader {
        public:
            memory_reader(const std::byte* data, std::size_t size);
            explicit memory_reader(const std::vector<std::byte>& data);

            // Copies up to size bytes, returns how many were copied
            std::size_t read(void* dst, std::size_t size);

            [[nodiscard]] std::uint64_t tell() const { return m_position; }
            [[nodiscard]] std::uint64_t size() const { return m_size; }
            [[nodiscard]] std::uint64_t remaining() const { return m_size - m_position; }
            [[nodiscard]] bool at_end() const { return m_position >= m_size; }

            // Throws parse_error unless n more bytes are available
            void require(std::uint64_t n, const char* what) const;

            std::vector<std::byte> read_exact(std::size_t size);

            template<typename T>
            T read(byte_order bo) {
                require(sizeof(T), "integer");
                std::array<std::byte, sizeof(T)> buff;
                read(buff.data(), sizeof(T));

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            std::array<std::byte, 4> read_type_code();

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}
