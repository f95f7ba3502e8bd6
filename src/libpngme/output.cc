#include "output.hh"

namespace pngme {
    memory_writer::memory_writer(std::vector<std::byte>& out)
        : m_out(out) {}

    void memory_writer::write(const void* src, std::size_t size) {
        if (size == 0) {
            return;
        }
        auto first = static_cast<const std::byte*>(src);
        m_out.insert(m_out.end(), first, first + size);
    }

    void memory_writer::reserve(std::size_t additional) {
        m_out.reserve(m_out.size() + additional);
    }
}
