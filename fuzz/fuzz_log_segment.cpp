// Fuzz target for log segment decoding, followed by a merge of whatever
// decoded into an empty document (unknown parents, repeated seqs, cycles).

#include <scenesync/codec.hpp>
#include <scenesync/document.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto ops = scenesync::decode_ops(span);
    if (ops) {
        auto doc = scenesync::Document{};
        doc.merge(*ops);
        auto state = doc.state();
        (void)state;
    }
    return 0;
}
