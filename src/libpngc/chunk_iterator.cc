//
// Created by igor on 13/08/2025.
//

#include <pngc/chunk_iterator.hh>
#include <pngc/exceptions.hh>
#include "png_chunk_iterator.hh"

namespace pngc {

    std::unique_ptr<chunk_iterator> chunk_iterator::get_iterator(std::istream& stream) {
        parse_options default_opts;
        return get_iterator(stream, default_opts);
    }

    std::unique_ptr<chunk_iterator> chunk_iterator::get_iterator(std::istream& stream, const parse_options& options) {
        return std::make_unique<png_chunk_iterator>(stream, options);
    }

} // namespace pngc
