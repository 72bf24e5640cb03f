//
// Location annotation for parse errors
//

#include <pngme/exceptions.hh>

namespace pngme {

    void parse_error::locate(std::size_t chunk_index, std::uint64_t offset) {
        if (m_chunk_index) {
            return;  // keep the innermost location
        }
        m_chunk_index = chunk_index;
        m_offset = offset;
        m_what += build_error_msg(" (chunk #", chunk_index, " at offset ", offset, ")");
    }

} // namespace pngme
