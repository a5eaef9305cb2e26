// Fuzz target for transport frame parsing. Malformed frames must surface as
// scenesync::Exception; anything that parses must serialize again.

#include <scenesync/error.hpp>
#include <scenesync/protocol.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    try {
        auto frame = scenesync::parse_frame(text);
        auto serialized = scenesync::serialize_frame(frame);
        (void)serialized;
    } catch (const scenesync::Exception&) {
        // rejected input
    }
    return 0;
}
