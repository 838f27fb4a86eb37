#include <iostream>
#include <string>
#include <vector>

#include "common/test_check.hpp"
#include "../common/compress.hpp"
#include "../common/errors.hpp"

using namespace gzip;

static std::string unzip_all(const ByteBuffer& buf) {
    std::vector<u8> plain = gunzip(buf.data(), buf.size());
    return std::string(plain.begin(), plain.end());
}

void test_valid_levels() {
    std::cout << "[TEST] Compression level range\n";

    TEST_CHECK(valid_level(DEFAULT_COMPRESSION));
    TEST_CHECK(valid_level(NO_COMPRESSION));
    for (int l = BEST_SPEED; l <= BEST_COMPRESSION; ++l) {
        TEST_CHECK(valid_level(l));
    }
    TEST_CHECK(!valid_level(-2));
    TEST_CHECK(!valid_level(10));
    TEST_CHECK(!valid_level(42));
}

void test_gzip_roundtrip_and_header() {
    std::cout << "[TEST] GzipWriter output is a gzip member\n";

    ByteBuffer buf;
    GzipWriter zw(buf, DEFAULT_COMPRESSION);
    std::string text = "{\"short_message\":\"hello\",\"level\":6}";
    TEST_CHECK(zw.write(text.data(), text.size()) == text.size());
    zw.close();
    TEST_CHECK(zw.closed());

    TEST_CHECK(buf.size() > 10);
    TEST_CHECK(buf.data()[0] == 0x1F);
    TEST_CHECK(buf.data()[1] == 0x8B);
    TEST_CHECK(unzip_all(buf) == text);

    // close() again is a no-op
    size_t before = buf.size();
    zw.close();
    TEST_CHECK(buf.size() == before);
}

void test_write_after_close_fails() {
    std::cout << "[TEST] GzipWriter refuses input after close\n";

    ByteBuffer buf;
    GzipWriter zw(buf, BEST_SPEED);
    zw.close();
    TEST_THROWS(zw.write("x", 1), CompressionError);
}

void test_reset_starts_fresh_member() {
    std::cout << "[TEST] GzipWriter reset leaves no state from the previous message\n";

    ByteBuffer buf;
    GzipWriter zw(buf, BEST_COMPRESSION);

    zw.write("first message", 13);
    zw.close();
    TEST_CHECK(unzip_all(buf) == "first message");

    size_t cap = buf.capacity();
    buf.clear();
    zw.reset(buf);
    TEST_CHECK(!zw.closed());

    zw.write("second", 6);
    zw.close();
    TEST_CHECK(unzip_all(buf) == "second");
    TEST_CHECK(buf.capacity() >= cap);
}

void test_large_and_stored() {
    std::cout << "[TEST] GzipWriter large input, level 0\n";

    std::string big;
    for (int i = 0; i < 50000; ++i) big += (char)('a' + (i * 7919) % 26);

    ByteBuffer buf;
    GzipWriter zw(buf, NO_COMPRESSION);
    zw.write(big.data(), big.size());
    zw.close();

    // Stored blocks never shrink the input
    TEST_CHECK(buf.size() > big.size());
    TEST_CHECK(unzip_all(buf) == big);
}

void test_zlib_api_alongside() {
    std::cout << "[TEST] zlib's own compress() coexists with the gzip wrapper\n";

    const std::string text = "zlib-wrapped, not gzip";
    std::vector<Bytef> out(compressBound((uLong)text.size()));
    uLongf out_len = (uLongf)out.size();
    int rc = ::compress(out.data(), &out_len,
                        reinterpret_cast<const Bytef*>(text.data()), (uLong)text.size());
    TEST_CHECK(rc == Z_OK);

    // A zlib stream is not a gzip member
    TEST_THROWS(gzip::gunzip(out.data(), out_len), CompressionError);
}

void test_gunzip_rejects_garbage() {
    std::cout << "[TEST] gunzip rejects corrupt and truncated input\n";

    const u8 junk[] = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05};
    TEST_THROWS(gunzip(junk, sizeof(junk)), CompressionError);

    ByteBuffer buf;
    GzipWriter zw(buf, DEFAULT_COMPRESSION);
    zw.write("truncated payload", 17);
    zw.close();
    TEST_THROWS(gunzip(buf.data(), buf.size() - 4), CompressionError);
}

int main() {
    test_valid_levels();
    test_gzip_roundtrip_and_header();
    test_write_after_close_fails();
    test_reset_starts_fresh_member();
    test_large_and_stored();
    test_zlib_api_alongside();
    test_gunzip_rejects_garbage();

    std::cout << "[TEST] ALL COMPRESS TESTS PASSED\n";
    return 0;
}
