#include <catch2/catch.hpp>

#include <dedupstore/fingerprint.hpp>

#include "test_util.hpp"

#include <string>

using namespace dedupstore;

namespace {

fingerprint fingerprint_of(const std::string& s) {
    return compute_fingerprint(reinterpret_cast<const byte*>(s.data()), s.size());
}

} // namespace

TEST_CASE("fingerprints are sha256 digests", "[fingerprint]") {
    REQUIRE(to_hex(fingerprint_of(""))
            == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(to_hex(fingerprint_of("abc"))
            == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("fingerprints depend only on the contents", "[fingerprint]") {
    const bytes a = test::unique_block(1);
    const bytes b = test::unique_block(2);
    const bytes a_copy = a;

    REQUIRE(compute_fingerprint(a.data(), a.size()) == compute_fingerprint(a_copy.data(), a_copy.size()));
    REQUIRE(compute_fingerprint(a.data(), a.size()) != compute_fingerprint(b.data(), b.size()));

    const fingerprint zeros = compute_fingerprint(test::pattern(0).data(), test::bs);
    REQUIRE(to_hex(zeros).size() == 2 * fingerprint_size);
}

TEST_CASE("hex formatting", "[fingerprint]") {
    fingerprint fp{};
    fp[0] = 0x01;
    fp[1] = 0xAB;
    fp[31] = 0xF0;

    const std::string hex = to_hex(fp);
    REQUIRE(hex.size() == 64);
    REQUIRE(hex.substr(0, 4) == "01ab");
    REQUIRE(hex.substr(62) == "f0");
}
