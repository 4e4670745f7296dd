//
// Created by igor on 16/08/2025.
//

#include <pngc/compressor.hh>
#include <pngc/exceptions.hh>
#include <zlib.h>
#include <array>

namespace pngc {

    compressor::compressor(int level)
        : m_level(level) {
        if (m_level < Z_DEFAULT_COMPRESSION || m_level > Z_BEST_COMPRESSION) {
            throw compression_error(build_error_msg("Invalid compression level ", level));
        }
    }

    std::vector<std::byte> compressor::compress(const std::vector<std::byte>& data) const {
        uLongf bound = ::compressBound(static_cast<uLong>(data.size()));
        std::vector<std::byte> out(bound);

        int rc = ::compress2(reinterpret_cast<Bytef*>(out.data()), &bound,
                             reinterpret_cast<const Bytef*>(data.data()),
                             static_cast<uLong>(data.size()), m_level);
        if (rc != Z_OK) {
            throw compression_error(build_error_msg("zlib compress2 failed with code ", rc));
        }
        out.resize(bound);
        return out;
    }

    std::vector<std::byte> compressor::decompress(const std::vector<std::byte>& data) const {
        z_stream zs{};
        if (::inflateInit(&zs) != Z_OK) {
            throw compression_error("zlib inflateInit failed");
        }

        zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));
        zs.avail_in = static_cast<uInt>(data.size());

        std::vector<std::byte> out;
        std::array<Bytef, 16384> buffer;
        int rc = Z_OK;

        while (rc != Z_STREAM_END) {
            zs.next_out = buffer.data();
            zs.avail_out = static_cast<uInt>(buffer.size());

            rc = ::inflate(&zs, Z_NO_FLUSH);
            if (rc != Z_OK && rc != Z_STREAM_END) {
                std::string reason = zs.msg ? zs.msg : "unknown error";
                ::inflateEnd(&zs);
                // Z_BUF_ERROR here means the input ended before the stream did
                if (rc == Z_BUF_ERROR) {
                    throw compression_error("zlib stream is truncated");
                }
                throw compression_error(build_error_msg("zlib inflate failed: ", reason));
            }

            auto produced = buffer.size() - zs.avail_out;
            auto first = reinterpret_cast<const std::byte*>(buffer.data());
            out.insert(out.end(), first, first + produced);
        }

        bool trailing = zs.avail_in != 0;
        ::inflateEnd(&zs);
        if (trailing) {
            throw compression_error("Extra data after end of zlib stream");
        }
        return out;
    }

} // namespace pngc
