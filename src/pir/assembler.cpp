#include "ghostpir/pir/assembler.hpp"

namespace ghostpir::pir {

Assembler::Assembler(const ModuleDescriptor& descriptor, size_t chunk_size)
    : chunk_count_(descriptor.chunk_count),
      chunk_size_(chunk_size),
      compressed_size_(descriptor.compressed_size) {
    if (!descriptor.size_consistent(chunk_size)) {
        throw ProtocolError("Module " + descriptor.id + " declares " +
                            std::to_string(descriptor.chunk_count) + " chunks for " +
                            std::to_string(descriptor.compressed_size) +
                            " bytes at chunk size " + std::to_string(chunk_size));
    }
}

void Assembler::add(size_t chunk_index, std::vector<uint8_t> plaintext) {
    if (chunk_index >= chunk_count_) {
        throw ProtocolError("Chunk index " + std::to_string(chunk_index) +
                            " beyond chunk count " + std::to_string(chunk_count_));
    }

    if (plaintext.size() != chunk_size_) {
        throw ProtocolError("Chunk " + std::to_string(chunk_index) + " has " +
                            std::to_string(plaintext.size()) + " bytes, expected " +
                            std::to_string(chunk_size_));
    }

    auto [it, inserted] = chunks_.emplace(chunk_index, std::move(plaintext));
    if (!inserted) {
        throw ProtocolError("Chunk " + std::to_string(chunk_index) + " received twice");
    }
}

std::vector<uint8_t> Assembler::assemble() const {
    std::vector<uint8_t> stream;
    stream.reserve(chunk_count_ * chunk_size_);

    // std::map iterates in ascending key order
    size_t expected = 0;
    for (const auto& [index, chunk] : chunks_) {
        if (index != expected) {
            throw ProtocolError("Missing chunk " + std::to_string(expected));
        }
        stream.insert(stream.end(), chunk.begin(), chunk.end());
        ++expected;
    }

    if (expected != chunk_count_) {
        throw ProtocolError("Missing chunk " + std::to_string(expected));
    }

    // Trailing zero padding from the responder
    stream.resize(compressed_size_);
    return stream;
}

} // namespace ghostpir::pir
