#pragma once

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <pngc/datastream.hh>
#include <pngc/fourcc.hh>
#include <pngc/compressor.hh>

// Raw bytes from a list of integers
inline std::vector<std::byte> bytes_of(std::initializer_list<unsigned> values) {
    std::vector<std::byte> out;
    for (auto v : values) {
        out.push_back(static_cast<std::byte>(v));
    }
    return out;
}

inline std::vector<std::byte> bytes_of(std::string_view text) {
    std::vector<std::byte> out;
    for (char c : text) {
        out.push_back(static_cast<std::byte>(c));
    }
    return out;
}

inline void append_u32(std::vector<std::byte>& out, std::uint32_t v) {
    out.push_back(static_cast<std::byte>(v >> 24));
    out.push_back(static_cast<std::byte>(v >> 16));
    out.push_back(static_cast<std::byte>(v >> 8));
    out.push_back(static_cast<std::byte>(v));
}

inline void append_u16(std::vector<std::byte>& out, std::uint16_t v) {
    out.push_back(static_cast<std::byte>(v >> 8));
    out.push_back(static_cast<std::byte>(v));
}

inline void append(std::vector<std::byte>& out, const std::vector<std::byte>& more) {
    out.insert(out.end(), more.begin(), more.end());
}

// IHDR body for the given geometry
inline std::vector<std::byte> ihdr_body(std::uint32_t width, std::uint32_t height,
                                        unsigned bit_depth, unsigned color_type, unsigned interlace = 0) {
    std::vector<std::byte> body;
    append_u32(body, width);
    append_u32(body, height);
    append(body, bytes_of({bit_depth, color_type, 0, 0, interlace}));
    return body;
}

// Palette body with count grey entries
inline std::vector<std::byte> plte_body(std::size_t count) {
    std::vector<std::byte> body;
    for (std::size_t i = 0; i < count; i++) {
        auto v = static_cast<unsigned>(i & 0xFF);
        append(body, bytes_of({v, v, v}));
    }
    return body;
}

// Builds a PNG datastream record by record
class png_builder {
public:
    explicit png_builder(bool with_signature = true) {
        if (with_signature) {
            for (auto b : pngc::png_signature) {
                m_data.push_back(static_cast<std::byte>(b));
            }
        }
    }

    png_builder& chunk(std::string_view type, const std::vector<std::byte>& body) {
        pngc::fourcc name(type);
        return chunk_with_crc(type, body, pngc::record_crc(name, body));
    }

    png_builder& chunk_with_crc(std::string_view type, const std::vector<std::byte>& body, std::uint32_t crc) {
        append_u32(m_data, static_cast<std::uint32_t>(body.size()));
        append(m_data, bytes_of(type));
        append(m_data, body);
        append_u32(m_data, crc);
        return *this;
    }

    png_builder& header(std::uint32_t width = 2, std::uint32_t height = 2,
                        unsigned bit_depth = 8, unsigned color_type = 6) {
        return chunk("IHDR", ihdr_body(width, height, bit_depth, color_type));
    }

    png_builder& idat(const std::vector<std::byte>& body = bytes_of({1, 2, 3})) {
        return chunk("IDAT", body);
    }

    png_builder& end() {
        return chunk("IEND", {});
    }

    png_builder& raw(const std::vector<std::byte>& bytes) {
        append(m_data, bytes);
        return *this;
    }

    [[nodiscard]] const std::vector<std::byte>& bytes() const { return m_data; }

    [[nodiscard]] std::string str() const {
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

private:
    std::vector<std::byte> m_data;
};

inline pngc::parse_options lenient() {
    pngc::parse_options opts;
    opts.strict = false;
    return opts;
}

// Collects warnings delivered through parse_options::on_warning
struct warning_tracker {
    struct warning_info {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    }

    [[nodiscard]] bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }

    [[nodiscard]] std::size_t count_category(std::string_view category) const {
        return static_cast<std::size_t>(std::count_if(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; }));
    }
};
