//
// UTF-8 validation
//

#pragma once

#include <cstddef>
#include <optional>

namespace pngme {

    // Offset of the first byte that does not begin a well-formed UTF-8
    // sequence, or nullopt if the whole buffer is valid.
    // Overlong encodings, surrogates and code points above U+10FFFF are invalid.
    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size);
}
