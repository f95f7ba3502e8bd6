/**
 * @file output.hh
 * @brief Appending writer for encoding records into a byte buffer
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/byte_order.hh>

namespace pngme {

    class PNGME_EXPORT memory_writer {
        public:
            explicit memory_writer(std::vector<std::byte>& out);

            void write(const void* src, std::size_t size);

            template<typename T>
            void write(T value, byte_order bo) {
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                std::array<std::byte, sizeof(T)> buff;
                std::memcpy(buff.data(), &value, sizeof(T));
                write(buff.data(), sizeof(T));
            }

            void reserve(std::size_t additional);

            [[nodiscard]] std::size_t tell() const { return m_out.size(); }

        private:
            std::vector<std::byte>& m_out;
    };
}
