//
// Created by igor on 16/08/2025.
//

#include <pngc/exceptions.hh>

namespace pngc {

    const char* to_string(error_kind kind) noexcept {
        switch (kind) {
            case error_kind::unknown_chunk_type: return "unknown_chunk_type";
            case error_kind::unknown_critical_chunk: return "unknown_critical_chunk";
            case error_kind::duplicate_chunk: return "duplicate_chunk";
            case error_kind::missing_dependency: return "missing_dependency";
            case error_kind::malformed_length: return "malformed_length";
            case error_kind::invalid_for_color_type: return "invalid_for_color_type";
            case error_kind::palette_too_small: return "palette_too_small";
            case error_kind::index_out_of_range: return "index_out_of_range";
            case error_kind::invalid_tag: return "invalid_tag";
            case error_kind::version_out_of_range: return "version_out_of_range";
            case error_kind::malformed_payload: return "malformed_payload";
            case error_kind::unimplemented_encode: return "unimplemented_encode";
            case error_kind::invalid_field: return "invalid_field";
            case error_kind::order_violation: return "order_violation";
        }
        return "unknown";
    }

} // namespace pngc
