#include <gtest/gtest.h>

#include "BinaryTableFormat.h"
#include "TabulaExceptions.h"
#include "TestSupport.h"

#include <cstdint>
#include <fstream>
#include <sstream>

namespace {
void appendLittleEndian(std::string& out, uint64_t value, size_t bytes) {
    for (size_t i = 0; i < bytes; ++i) out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
}

// Signature, version, row count and weight count of a binary table.
std::string binaryPrefix(uint64_t rows) {
    std::string out("TABULA_TBL_V1", sizeof("TABULA_TBL_V1"));
    appendLittleEndian(out, BinaryTableFormat::kFormatVersion, 4);
    appendLittleEndian(out, rows, 8);
    appendLittleEndian(out, 0, 8);
    return out;
}
} // namespace

class BinaryTableFormatTest : public ::testing::Test {
protected:
    std::string readBytes(const std::string& path) const {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    ScratchDir dir_;
    BinaryTableFormat format_;
    ReadOptions options_;
};

TEST_F(BinaryTableFormatTest, RoundTripKeepsDomainAndColumns) {
    const Table original = sampleTable();
    const std::string path = dir_.path("sample.tbin");
    format_.writeFile(path, original);

    const Table back = format_.readFile(path, options_);
    expectSameTable(original, back);
    EXPECT_EQ(back.domain().find("x")->attributes.at("unit"), "cm");
    EXPECT_TRUE(back.domain().classVars[0].ordered);
}

TEST_F(BinaryTableFormatTest, EmptyTableRoundTrips) {
    const Table empty(Domain{}, {}, {}, {}, {}, 0);
    const std::string path = dir_.path("empty.tbin");
    format_.writeFile(path, empty);
    const Table back = format_.readFile(path, options_);
    EXPECT_EQ(back.rowCount(), 0u);
    EXPECT_EQ(back.domain().size(), 0u);
}

TEST_F(BinaryTableFormatTest, FlippedByteFailsChecksum) {
    const std::string path = dir_.path("sample.tbin");
    format_.writeFile(path, sampleTable());
    std::string bytes = readBytes(path);
    bytes[bytes.size() - 12] ^= 0x01;
    dir_.file("sample.tbin", bytes);

    EXPECT_THROW(format_.readFile(path, options_), Tabula::ParseException);
}

TEST_F(BinaryTableFormatTest, TruncatedFileIsRejected) {
    const std::string path = dir_.path("sample.tbin");
    format_.writeFile(path, sampleTable());
    const std::string bytes = readBytes(path);
    dir_.file("short.tbin", bytes.substr(0, bytes.size() / 2));

    EXPECT_THROW(format_.readFile(dir_.path("short.tbin"), options_), Tabula::ParseException);
}

TEST_F(BinaryTableFormatTest, ForeignFileHasBadSignature) {
    const std::string path = dir_.file("text.tbin", "a,b,c\n1,2,3\n");
    try {
        format_.readFile(path, options_);
        FAIL() << "expected ParseException";
    } catch (const Tabula::ParseException& e) {
        EXPECT_NE(std::string(e.what()).find("signature"), std::string::npos);
    }
}

TEST_F(BinaryTableFormatTest, MissingFileIsAnIOError) {
    EXPECT_THROW(format_.readFile(dir_.path("absent.tbin"), options_), Tabula::IOException);
}

TEST_F(BinaryTableFormatTest, HugeVariableCountIsRejectedBeforeAllocating) {
    std::string bytes = binaryPrefix(1);
    appendLittleEndian(bytes, 1ULL << 32, 8);
    const std::string path = dir_.file("huge.tbin", bytes);

    try {
        format_.readFile(path, options_);
        FAIL() << "expected ParseException";
    } catch (const Tabula::ParseException& e) {
        EXPECT_NE(std::string(e.what()).find("Corrupt count"), std::string::npos);
    }
}

TEST_F(BinaryTableFormatTest, HugeNameLengthIsRejected) {
    std::string bytes = binaryPrefix(1);
    appendLittleEndian(bytes, 1, 8);
    appendLittleEndian(bytes, 1ULL << 31, 8);
    bytes.append(40, '\0');
    const std::string path = dir_.file("name.tbin", bytes);

    EXPECT_THROW(format_.readFile(path, options_), Tabula::ParseException);
}

TEST_F(BinaryTableFormatTest, RowCountBeyondFileSizeIsRejected) {
    std::string bytes = binaryPrefix(1ULL << 31);
    appendLittleEndian(bytes, 1, 8);   // one attribute
    appendLittleEndian(bytes, 1, 8);   // name "x"
    bytes.push_back('x');
    bytes.push_back('\0');            // continuous
    bytes.push_back('\0');            // not ordered
    appendLittleEndian(bytes, 0, 8);   // no values
    appendLittleEndian(bytes, 0, 8);   // no attributes
    appendLittleEndian(bytes, 0, 8);   // no class variables
    appendLittleEndian(bytes, 0, 8);   // no metas
    bytes.append(16, '\0');
    const std::string path = dir_.file("rows.tbin", bytes);

    EXPECT_THROW(format_.readFile(path, options_), Tabula::ParseException);
}
