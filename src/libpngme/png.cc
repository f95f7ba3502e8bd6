#include <pngme/png.hh>
#include <pngme/exceptions.hh>

#include <algorithm>
#include <iomanip>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>

#include "chunk_codec.hh"
#include "input.hh"
#include "output.hh"

namespace pngme {

    namespace {
        std::string hex_bytes(const std::byte* data, std::size_t size) {
            std::ostringstream os;
            os << std::hex << std::uppercase << std::setfill('0');
            for (std::size_t i = 0; i < size; i++) {
                if (i > 0) {
                    os << ' ';
                }
                os << std::setw(2) << static_cast<unsigned>(data[i]);
            }
            return os.str();
        }

        auto find_type(const std::vector<chunk>& chunks, std::string_view type) {
            return std::find_if(chunks.begin(), chunks.end(), [type](const chunk& c) {
                return c.type().to_string_view() == type;
            });
        }
    }

    png png::parse(const std::byte* data, std::size_t size, const parse_options& options) {
        memory_reader in(data, size);

        if (in.remaining() < signature.size()) {
            THROW_PARSE("Invalid PNG signature: input is only ", size, " bytes, expected at least ",
                        signature.size());
        }
        std::array<std::byte, 8> magic{};
        in.read(magic.data(), magic.size());
        if (magic != signature) {
            THROW_PARSE("Invalid PNG signature: expected ", hex_bytes(signature.data(), signature.size()),
                        ", got ", hex_bytes(magic.data(), magic.size()));
        }

        png result;
        while (!in.at_end()) {
            result.m_chunks.push_back(read_chunk(in, options));
        }
        return result;
    }

    png png::parse(const std::vector<std::byte>& bytes, const parse_options& options) {
        return parse(bytes.data(), bytes.size(), options);
    }

    png png::parse(std::istream& is, const parse_options& options) {
        std::vector<std::byte> bytes;
        char buffer[4096];
        while (is.read(buffer, sizeof(buffer)) || is.gcount() > 0) {
            auto first = reinterpret_cast<const std::byte*>(buffer);
            bytes.insert(bytes.end(), first, first + is.gcount());
        }
        THROW_IO_IF(is.bad(), "Stream read failed after ", bytes.size(), " bytes");
        return parse(bytes, options);
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk png::remove_chunk(std::string_view type) {
        auto it = find_type(m_chunks, type);
        if (it == m_chunks.end()) {
            THROW_NOT_FOUND("Chunk '", type, "' not found");
        }
        chunk removed = *it;
        m_chunks.erase(it);
        return removed;
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        auto it = find_type(m_chunks, type);
        return it == m_chunks.end() ? nullptr : &*it;
    }

    std::vector<std::byte> png::to_bytes() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.encoded_size();
        }

        std::vector<std::byte> out;
        memory_writer writer(out);
        writer.reserve(total);
        writer.write(signature.data(), signature.size());
        for (const auto& c : m_chunks) {
            c.write_to(out);
        }
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        const auto& chunks = p.chunks();
        os << "PNG with " << chunks.size() << (chunks.size() == 1 ? " chunk" : " chunks") << "\n";
        for (std::size_t i = 0; i < chunks.size(); i++) {
            os << "  [" << i << "] " << chunks[i] << "\n";
        }
        return os;
    }

} // namespace pngme
