// Copyright (c) 2024 The DaCheck developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <crypto/sha256.h>
#include <hash.h>
#include <uint256.h>
#include <utilstrencodings.h>
#include <test/test_dacheck.h>

#include <boost/test/unit_test.hpp>

#include <stdexcept>
#include <string>
#include <vector>

BOOST_FIXTURE_TEST_SUITE(hash_tests, BasicTestingSetup)

namespace {

std::string SHA256Hex(const std::string& in)
{
    unsigned char out[CSHA256::OUTPUT_SIZE];
    CSHA256().Write((const unsigned char*)in.data(), in.size()).Finalize(out);
    return HexStr(out, out + sizeof(out));
}

} // anonymous namespace

BOOST_AUTO_TEST_CASE(sha256_testvectors)
{
    BOOST_CHECK_EQUAL(SHA256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    BOOST_CHECK_EQUAL(SHA256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    BOOST_CHECK_EQUAL(SHA256Hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
                      "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

BOOST_AUTO_TEST_CASE(sha256_incremental)
{
    const std::vector<unsigned char> data = InsecureRandBytes(1000);
    unsigned char once[CSHA256::OUTPUT_SIZE];
    unsigned char pieces[CSHA256::OUTPUT_SIZE];

    CSHA256().Write(data.data(), data.size()).Finalize(once);

    CSHA256 hasher;
    hasher.Write(data.data(), 1).Write(data.data() + 1, 0).Write(data.data() + 1, 600);
    hasher.Write(data.data() + 601, data.size() - 601).Finalize(pieces);
    BOOST_CHECK(std::vector<unsigned char>(once, once + 32) == std::vector<unsigned char>(pieces, pieces + 32));

    // Reusable after Reset
    hasher.Reset().Write(data.data(), data.size()).Finalize(pieces);
    BOOST_CHECK(std::vector<unsigned char>(once, once + 32) == std::vector<unsigned char>(pieces, pieces + 32));
}

BOOST_AUTO_TEST_CASE(double_sha256)
{
    const std::vector<unsigned char> empty;
    uint256 hash = Hash(empty.begin(), empty.end());
    BOOST_CHECK_EQUAL(HexStr(hash.begin(), hash.end()),
                      "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
    // Display order is reversed
    BOOST_CHECK_EQUAL(hash.GetHex(), "56944c5d3f98413ef45cf54545538103cc9f298e0575820ad3591376e2e0f65d");

    uint256 single = SingleSHA256(empty.begin(), empty.end());
    BOOST_CHECK_EQUAL(HexStr(single.begin(), single.end()),
                      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

BOOST_AUTO_TEST_CASE(hash_writer_matches_hash)
{
    const std::vector<unsigned char> data = InsecureRandBytes(77);
    CHashWriter ss(SER_GETHASH, 0);
    ss << data;

    // Vectors are serialized with a compact size prefix
    std::vector<unsigned char> framed{77};
    framed.insert(framed.end(), data.begin(), data.end());
    BOOST_CHECK(ss.GetHash() == Hash(framed.begin(), framed.end()));
}

BOOST_AUTO_TEST_CASE(uint256_hex)
{
    const std::string display = "00000000000000000000000000000000000000000000000000000000000000ff";
    uint256 value = uint256S(display);
    BOOST_CHECK_EQUAL(value.GetHex(), display);
    BOOST_CHECK_EQUAL(*value.begin(), 0xff);
    BOOST_CHECK(!value.IsNull());
    BOOST_CHECK(uint256().IsNull());
    BOOST_CHECK(uint256S("0x" + display) == value);
    BOOST_CHECK(uint256() < value);

    BOOST_CHECK_THROW(uint256(std::vector<unsigned char>(31)), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
