// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DACHECK_DA_CHUNK_HEADER_H
#define DACHECK_DA_CHUNK_HEADER_H

/**
 * @file chunk_header.h
 * @brief DA chunk header codec
 *
 * Every DA chunk carried in a reveal transaction's witness starts with a
 * fixed 37-byte header:
 *
 *   offset  size  field
 *   0       1     version
 *   1       32    blob_hash     (SHA-256 of the complete, unsplit blob)
 *   33      2     chunk_index   (u16, big-endian)
 *   35      2     total_chunks  (u16, big-endian)
 *
 * The chunk body follows the header immediately.
 */

#include <uint256.h>

#include <cstdint>
#include <string>
#include <vector>

namespace da {

/** Serialized size of a DaChunkHeader */
static constexpr size_t DA_CHUNK_HEADER_SIZE = 37;

/** The only chunk encoding version understood by this codec */
static constexpr uint8_t DA_CHUNK_ENCODING_VERSION = 0;

/**
 * Maximum chunk body size in bytes. Keeps a single-input reveal under the
 * 400,000 wu standardness limit with room for the linking tag output.
 */
static constexpr size_t MAX_CHUNK_PAYLOAD = 395000;

/** Why a payload was rejected as a chunk */
enum class ChunkFormatError {
    NONE,
    TOO_SHORT,        //!< fewer than DA_CHUNK_HEADER_SIZE bytes
    UNKNOWN_VERSION,  //!< version byte is not DA_CHUNK_ENCODING_VERSION
    INVALID_INDEX,    //!< chunk_index >= total_chunks
};

std::string ChunkFormatErrorString(ChunkFormatError error);

/** Parsed DA chunk header */
struct DaChunkHeader {
    uint8_t version;
    uint256 blobHash;
    uint16_t chunkIndex;
    uint16_t totalChunks;

    DaChunkHeader() : version(DA_CHUNK_ENCODING_VERSION), chunkIndex(0), totalChunks(0) {}

    DaChunkHeader(const uint256& hash, uint16_t index, uint16_t total)
        : version(DA_CHUNK_ENCODING_VERSION), blobHash(hash), chunkIndex(index), totalChunks(total) {}

    /** chunk_index < total_chunks */
    bool IsValid() const { return chunkIndex < totalChunks; }

    bool IsLastChunk() const { return totalChunks > 0 && chunkIndex == totalChunks - 1; }

    /** Encode to the 37-byte wire form */
    std::vector<unsigned char> Serialize() const;

    /**
     * @brief Parse a header from the front of a chunk payload
     * @param payload Chunk payload (header followed by body)
     * @param[out] header Parsed header, only written on success
     * @param[out] error Reason for rejection, may be null
     * @return true if the payload starts with a well-formed header
     */
    static bool Parse(const std::vector<unsigned char>& payload, DaChunkHeader& header,
                      ChunkFormatError* error = nullptr);

    std::string ToString() const;

    bool operator==(const DaChunkHeader& other) const {
        return version == other.version &&
               blobHash == other.blobHash &&
               chunkIndex == other.chunkIndex &&
               totalChunks == other.totalChunks;
    }
    bool operator!=(const DaChunkHeader& other) const { return !(*this == other); }
};

/** SHA-256 of a complete blob; the identity shared by all its chunks */
uint256 ComputeBlobHash(const std::vector<unsigned char>& blob);

/**
 * Split a blob into chunk bodies of at most maxChunkPayload bytes.
 * Concatenating the result in order yields the blob again. An empty blob
 * yields no chunks.
 */
std::vector<std::vector<unsigned char>> SplitBlob(const std::vector<unsigned char>& blob,
                                                  size_t maxChunkPayload = MAX_CHUNK_PAYLOAD);

/**
 * Frame a blob as a list of chunk payloads (header ++ body), ready to be
 * placed in envelope scripts.
 * @throws std::invalid_argument if the blob is empty or needs more than 65535 chunks
 */
std::vector<std::vector<unsigned char>> EncodeChunks(const std::vector<unsigned char>& blob,
                                                     size_t maxChunkPayload = MAX_CHUNK_PAYLOAD);

} // namespace da

#endif // DACHECK_DA_CHUNK_HEADER_H
