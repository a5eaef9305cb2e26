// Fuzz target for Document::load(). Exercises the chunk envelope, zlib
// inflate and the snapshot decoder. Any document that loads is saved again
// and must load back to the same scene.

#include <scenesync/document.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto doc = scenesync::Document::load(span);
    if (doc) {
        auto saved = doc->save();
        auto again = scenesync::Document::load(saved);
        if (!again || again->state() != doc->state()) std::abort();
    }
    return 0;
}
