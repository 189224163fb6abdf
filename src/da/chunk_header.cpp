// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <da/chunk_header.h>

#include <crypto/common.h>
#include <hash.h>
#include <util.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace da {

std::string ChunkFormatErrorString(ChunkFormatError error)
{
    switch (error) {
    case ChunkFormatError::NONE: return "ok";
    case ChunkFormatError::TOO_SHORT: return "payload shorter than chunk header";
    case ChunkFormatError::UNKNOWN_VERSION: return "unknown chunk encoding version";
    case ChunkFormatError::INVALID_INDEX: return "chunk index out of range";
    }
    return "unknown";
}

std::vector<unsigned char> DaChunkHeader::Serialize() const
{
    std::vector<unsigned char> out(DA_CHUNK_HEADER_SIZE);
    out[0] = version;
    std::copy(blobHash.begin(), blobHash.end(), out.begin() + 1);
    WriteBE16(&out[33], chunkIndex);
    WriteBE16(&out[35], totalChunks);
    return out;
}

bool DaChunkHeader::Parse(const std::vector<unsigned char>& payload, DaChunkHeader& header,
                          ChunkFormatError* error)
{
    ChunkFormatError err = ChunkFormatError::NONE;
    DaChunkHeader parsed;

    if (payload.size() < DA_CHUNK_HEADER_SIZE) {
        err = ChunkFormatError::TOO_SHORT;
    } else if (payload[0] != DA_CHUNK_ENCODING_VERSION) {
        err = ChunkFormatError::UNKNOWN_VERSION;
    } else {
        parsed.version = payload[0];
        parsed.blobHash = uint256(std::vector<unsigned char>(payload.begin() + 1, payload.begin() + 33));
        parsed.chunkIndex = ReadBE16(&payload[33]);
        parsed.totalChunks = ReadBE16(&payload[35]);
        if (!parsed.IsValid()) {
            err = ChunkFormatError::INVALID_INDEX;
        }
    }

    if (error) {
        *error = err;
    }
    if (err != ChunkFormatError::NONE) {
        return false;
    }
    header = parsed;
    return true;
}

std::string DaChunkHeader::ToString() const
{
    return strprintf("DaChunkHeader(version=%u, blob=%s, chunk=%u/%u)",
                     (unsigned)version, blobHash.ToString().substr(0, 16), chunkIndex, totalChunks);
}

uint256 ComputeBlobHash(const std::vector<unsigned char>& blob)
{
    return SingleSHA256(blob.begin(), blob.end());
}

std::vector<std::vector<unsigned char>> SplitBlob(const std::vector<unsigned char>& blob, size_t maxChunkPayload)
{
    if (maxChunkPayload == 0) {
        throw std::invalid_argument("SplitBlob: chunk size must be positive");
    }
    std::vector<std::vector<unsigned char>> chunks;
    for (size_t offset = 0; offset < blob.size(); offset += maxChunkPayload) {
        size_t len = std::min(maxChunkPayload, blob.size() - offset);
        chunks.emplace_back(blob.begin() + offset, blob.begin() + offset + len);
    }
    return chunks;
}

std::vector<std::vector<unsigned char>> EncodeChunks(const std::vector<unsigned char>& blob, size_t maxChunkPayload)
{
    if (blob.empty()) {
        throw std::invalid_argument("EncodeChunks: cannot split an empty blob");
    }
    std::vector<std::vector<unsigned char>> bodies = SplitBlob(blob, maxChunkPayload);
    if (bodies.size() > std::numeric_limits<uint16_t>::max()) {
        throw std::invalid_argument(strprintf("EncodeChunks: blob needs %u chunks", bodies.size()));
    }

    const uint256 hash = ComputeBlobHash(blob);
    const uint16_t total = static_cast<uint16_t>(bodies.size());

    std::vector<std::vector<unsigned char>> chunks;
    chunks.reserve(bodies.size());
    for (uint16_t i = 0; i < total; ++i) {
        std::vector<unsigned char> chunk = DaChunkHeader(hash, i, total).Serialize();
        chunk.insert(chunk.end(), bodies[i].begin(), bodies[i].end());
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

} // namespace da
