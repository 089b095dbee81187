#include "BinaryTableFormat.h"
#include "TabulaExceptions.h"

#include <algorithm>
#include <cstring>
#include <fstream>

namespace {
constexpr char kSignature[] = "TABULA_TBL_V1";
constexpr uint64_t kChecksumOffsetBasis = 1469598103934665603ULL;
constexpr uint64_t kChecksumPrime = 1099511628211ULL;
constexpr uint64_t kHardMaxCount = 1ULL << 32;

bool isLittleEndian() {
    uint16_t number = 0x1;
    const auto* bytes = reinterpret_cast<const char*>(&number);
    return bytes[0] == 1;
}

template <typename T>
void swapEndian(T& val) {
    auto* first = reinterpret_cast<unsigned char*>(&val);
    std::reverse(first, first + sizeof(T));
}

void updateChecksumBytes(uint64_t& checksum, const unsigned char* bytes, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        checksum ^= static_cast<uint64_t>(bytes[i]);
        checksum *= kChecksumPrime;
    }
}

template <typename T>
void updateChecksum(uint64_t& checksum, const T& value) {
    T copy = value;
    if (!isLittleEndian()) swapEndian(copy);
    updateChecksumBytes(checksum, reinterpret_cast<const unsigned char*>(&copy), sizeof(T));
}

// Stream plus running checksum; every value written is also hashed.
struct BinaryWriter {
    std::ostream& out;
    uint64_t checksum = kChecksumOffsetBasis;

    template <typename T>
    void put(T value) {
        updateChecksum(checksum, value);
        if (!isLittleEndian()) swapEndian(value);
        out.write(reinterpret_cast<const char*>(&value), sizeof(T));
        if (!out) throw Tabula::IOException("Binary write failed");
    }

    void putString(const std::string& s) {
        put(static_cast<uint64_t>(s.size()));
        updateChecksumBytes(checksum, reinterpret_cast<const unsigned char*>(s.data()), s.size());
        out.write(s.data(), static_cast<std::streamsize>(s.size()));
        if (!out) throw Tabula::IOException("Binary write failed");
    }
};

// Every count is checked against the bytes left in the file before anything is allocated.
struct BinaryReader {
    std::istream& in;
    uint64_t checksum = kChecksumOffsetBasis;
    uint64_t size = 0;

    uint64_t remaining() {
        const std::streampos pos = in.tellg();
        if (pos < 0 || static_cast<uint64_t>(pos) > size) return 0;
        return size - static_cast<uint64_t>(pos);
    }

    void require(uint64_t count, uint64_t bytesEach) {
        if (bytesEach > 0 && count > remaining() / bytesEach) {
            throw Tabula::ParseException("Corrupt count in binary table");
        }
    }

    template <typename T>
    T get() {
        T value{};
        in.read(reinterpret_cast<char*>(&value), sizeof(T));
        if (!in) throw Tabula::ParseException("Binary table is truncated");
        if (!isLittleEndian()) swapEndian(value);
        updateChecksum(checksum, value);
        return value;
    }

    // bytesEach: smallest encoded size of one counted item.
    uint64_t getCount(uint64_t bytesEach) {
        const uint64_t n = get<uint64_t>();
        if (n > kHardMaxCount) throw Tabula::ParseException("Corrupt count in binary table");
        require(n, bytesEach);
        return n;
    }

    std::string getString() {
        const uint64_t n = getCount(1);
        std::string s(static_cast<size_t>(n), '\0');
        in.read(&s[0], static_cast<std::streamsize>(n));
        if (!in) throw Tabula::ParseException("Binary table is truncated");
        updateChecksumBytes(checksum, reinterpret_cast<const unsigned char*>(s.data()), s.size());
        return s;
    }
};

// name length, kind, ordered flag, value count, attribute count
constexpr uint64_t kMinVariableBytes = 8 + 1 + 1 + 8 + 8;

void writeVariables(BinaryWriter& w, const std::vector<Variable>& vars) {
    w.put(static_cast<uint64_t>(vars.size()));
    for (const auto& var : vars) {
        w.putString(var.name);
        w.put(static_cast<uint8_t>(var.kind));
        w.put(static_cast<uint8_t>(var.ordered ? 1 : 0));
        w.put(static_cast<uint64_t>(var.values.size()));
        for (const auto& v : var.values) w.putString(v);
        w.put(static_cast<uint64_t>(var.attributes.size()));
        for (const auto& kv : var.attributes) {
            w.putString(kv.first);
            w.putString(kv.second);
        }
    }
}

std::vector<Variable> readVariables(BinaryReader& r) {
    std::vector<Variable> vars(static_cast<size_t>(r.getCount(kMinVariableBytes)));
    for (auto& var : vars) {
        var.name = r.getString();
        const auto kind = r.get<uint8_t>();
        if (kind > static_cast<uint8_t>(VariableKind::STRING)) throw Tabula::ParseException("Unknown variable kind in binary table");
        var.kind = static_cast<VariableKind>(kind);
        var.ordered = r.get<uint8_t>() != 0;
        var.values.resize(static_cast<size_t>(r.getCount(8)));
        for (auto& v : var.values) v = r.getString();
        const uint64_t nattr = r.getCount(16);
        for (uint64_t i = 0; i < nattr; ++i) {
            std::string key = r.getString();
            var.attributes[key] = r.getString();
        }
    }
    return vars;
}

void writeNumeric(BinaryWriter& w, const NumericColumn& column) {
    for (double v : column) w.put(v);
}

NumericColumn readNumeric(BinaryReader& r, size_t rows) {
    r.require(rows, sizeof(double));
    NumericColumn column(rows);
    for (double& v : column) v = r.get<double>();
    return column;
}
} // namespace

void BinaryTableFormat::writeFile(const std::string& filename, const Table& table) const {
    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) throw Tabula::IOException("Could not open " + filename + " for writing");

    out.write(kSignature, sizeof(kSignature));
    BinaryWriter w{out};
    w.put(kFormatVersion);

    const Domain& d = table.domain();
    w.put(static_cast<uint64_t>(table.rowCount()));
    w.put(static_cast<uint64_t>(table.W().size()));
    writeVariables(w, d.attributes);
    writeVariables(w, d.classVars);
    writeVariables(w, d.metas);

    for (const auto& column : table.W()) writeNumeric(w, column);
    for (const auto& column : table.X()) writeNumeric(w, column);
    for (const auto& column : table.Y()) writeNumeric(w, column);
    for (const auto& column : table.metas()) {
        if (const auto* strings = std::get_if<StringColumn>(&column)) {
            for (const auto& s : *strings) w.putString(s);
        } else {
            writeNumeric(w, std::get<NumericColumn>(column));
        }
    }

    const uint64_t checksum = w.checksum;
    w.put(checksum);
    out.flush();
    if (!out) throw Tabula::IOException("Failed writing " + filename);
}

Table BinaryTableFormat::readFile(const std::string& filename, const ReadOptions&) const {
    std::ifstream in(filename, std::ios::binary);
    if (!in) throw Tabula::IOException("Could not open " + filename + " for reading");

    char signature[sizeof(kSignature)];
    in.read(signature, sizeof(signature));
    if (!in || std::memcmp(signature, kSignature, sizeof(kSignature)) != 0) {
        throw Tabula::ParseException("Unsupported or invalid binary table signature");
    }

    in.seekg(0, std::ios::end);
    const std::streampos end = in.tellg();
    in.seekg(static_cast<std::streamoff>(sizeof(kSignature)), std::ios::beg);
    if (end < 0 || !in) throw Tabula::IOException("Could not determine size of " + filename);

    BinaryReader r{in, kChecksumOffsetBasis, static_cast<uint64_t>(end)};
    if (r.get<uint32_t>() != kFormatVersion) throw Tabula::ParseException("Unsupported binary table version");

    const auto rows = static_cast<size_t>(r.getCount(0));
    // An empty table still stores at least one byte per column after this point.
    const auto weights = static_cast<size_t>(r.getCount(std::max<uint64_t>(rows * sizeof(double), 1)));
    Domain domain;
    domain.attributes = readVariables(r);
    domain.classVars = readVariables(r);
    domain.metas = readVariables(r);

    std::vector<NumericColumn> W;
    std::vector<NumericColumn> X;
    std::vector<NumericColumn> Y;
    std::vector<MetaColumn> metas;
    for (size_t i = 0; i < weights; ++i) W.push_back(readNumeric(r, rows));
    for (size_t i = 0; i < domain.attributes.size(); ++i) X.push_back(readNumeric(r, rows));
    for (size_t i = 0; i < domain.classVars.size(); ++i) Y.push_back(readNumeric(r, rows));
    for (const auto& var : domain.metas) {
        if (var.isString()) {
            r.require(rows, 8);
            StringColumn column(rows);
            for (auto& s : column) s = r.getString();
            metas.emplace_back(std::move(column));
        } else {
            metas.emplace_back(readNumeric(r, rows));
        }
    }

    const uint64_t expected = r.checksum;
    uint64_t stored = 0;
    in.read(reinterpret_cast<char*>(&stored), sizeof(stored));
    if (!in) throw Tabula::ParseException("Binary table is truncated");
    if (!isLittleEndian()) swapEndian(stored);
    if (stored != expected) throw Tabula::ParseException("Binary table checksum mismatch");

    return Table(std::move(domain), std::move(X), std::move(Y), std::move(metas), std::move(W), rows);
}
