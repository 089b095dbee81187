#include "ParquetFormat.h"
#include "ColumnFlags.h"
#include "TabulaExceptions.h"

#ifdef TABULA_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cmath>
#include <memory>

namespace {
const std::string kRoleKey = "tabula.role";
const std::string kKindKey = "tabula.kind";
const std::string kValuesKey = "tabula.values";
const std::string kOrderedKey = "tabula.ordered";
const std::string kAttributePrefix = "tabula.attr.";

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) throw Tabula::IOException(what + ": " + status.ToString());
}

std::shared_ptr<arrow::KeyValueMetadata> fieldMetadata(const std::string& role, const Variable* var) {
    std::vector<std::string> keys = {kRoleKey};
    std::vector<std::string> values = {role};
    if (var) {
        keys.push_back(kKindKey);
        values.push_back(variableKindName(var->kind));
        if (var->isDiscrete()) {
            keys.push_back(kValuesKey);
            values.push_back(ColumnFlags::join(var->values));
            keys.push_back(kOrderedKey);
            values.push_back(var->ordered ? "1" : "0");
        }
        for (const auto& kv : var->attributes) {
            keys.push_back(kAttributePrefix + kv.first);
            values.push_back(kv.second);
        }
    }
    return arrow::key_value_metadata(keys, values);
}

std::shared_ptr<arrow::Array> numericArray(const NumericColumn& column, const std::string& name) {
    arrow::DoubleBuilder builder;
    for (double v : column) {
        if (std::isnan(v)) {
            check(builder.AppendNull(), "Failed to append null for column '" + name + "'");
        } else {
            check(builder.Append(v), "Failed to append value for column '" + name + "'");
        }
    }
    std::shared_ptr<arrow::Array> arr;
    check(builder.Finish(&arr), "Failed to finalize Arrow array for column '" + name + "'");
    return arr;
}

std::shared_ptr<arrow::Array> stringArray(const StringColumn& column, const std::string& name) {
    arrow::StringBuilder builder;
    for (const auto& v : column) check(builder.Append(v), "Failed to append value for column '" + name + "'");
    std::shared_ptr<arrow::Array> arr;
    check(builder.Finish(&arr), "Failed to finalize Arrow array for column '" + name + "'");
    return arr;
}

std::string metadataValue(const std::shared_ptr<const arrow::KeyValueMetadata>& metadata, const std::string& key) {
    if (!metadata) return "";
    const int idx = metadata->FindKey(key);
    return idx < 0 ? "" : metadata->value(idx);
}

NumericColumn readNumeric(const arrow::ChunkedArray& chunks, const std::string& name) {
    NumericColumn out;
    out.reserve(static_cast<size_t>(chunks.length()));
    for (const auto& chunk : chunks.chunks()) {
        for (int64_t i = 0; i < chunk->length(); ++i) {
            if (chunk->IsNull(i)) {
                out.push_back(TableUtils::missingValue());
                continue;
            }
            switch (chunk->type_id()) {
                case arrow::Type::DOUBLE: out.push_back(std::static_pointer_cast<arrow::DoubleArray>(chunk)->Value(i)); break;
                case arrow::Type::FLOAT: out.push_back(std::static_pointer_cast<arrow::FloatArray>(chunk)->Value(i)); break;
                case arrow::Type::INT32: out.push_back(std::static_pointer_cast<arrow::Int32Array>(chunk)->Value(i)); break;
                case arrow::Type::INT64: out.push_back(static_cast<double>(std::static_pointer_cast<arrow::Int64Array>(chunk)->Value(i))); break;
                default:
                    throw Tabula::ParseException("Unsupported Parquet column type " + chunk->type()->ToString() + " for '" + name + "'");
            }
        }
    }
    return out;
}

StringColumn readStrings(const arrow::ChunkedArray& chunks, const std::string& name) {
    StringColumn out;
    out.reserve(static_cast<size_t>(chunks.length()));
    for (const auto& chunk : chunks.chunks()) {
        if (chunk->type_id() != arrow::Type::STRING) {
            throw Tabula::ParseException("Column '" + name + "' is not a string column");
        }
        const auto strings = std::static_pointer_cast<arrow::StringArray>(chunk);
        for (int64_t i = 0; i < strings->length(); ++i) {
            out.push_back(strings->IsNull(i) ? std::string() : strings->GetString(i));
        }
    }
    return out;
}
} // namespace

bool ParquetFormat::nativeSupport() noexcept { return true; }

void ParquetFormat::writeFile(const std::string& filename, const Table& table) const {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    const Domain& d = table.domain();

    for (size_t i = 0; i < table.W().size(); ++i) {
        const std::string name = "weights_" + std::to_string(i);
        fields.push_back(arrow::field(name, arrow::float64(), true, fieldMetadata("weight", nullptr)));
        arrays.push_back(numericArray(table.W()[i], name));
    }
    for (size_t i = 0; i < d.attributes.size(); ++i) {
        fields.push_back(arrow::field(d.attributes[i].name, arrow::float64(), true, fieldMetadata("attribute", &d.attributes[i])));
        arrays.push_back(numericArray(table.X()[i], d.attributes[i].name));
    }
    for (size_t i = 0; i < d.classVars.size(); ++i) {
        fields.push_back(arrow::field(d.classVars[i].name, arrow::float64(), true, fieldMetadata("class", &d.classVars[i])));
        arrays.push_back(numericArray(table.Y()[i], d.classVars[i].name));
    }
    for (size_t i = 0; i < d.metas.size(); ++i) {
        const Variable& var = d.metas[i];
        if (const auto* strings = std::get_if<StringColumn>(&table.metas()[i])) {
            fields.push_back(arrow::field(var.name, arrow::utf8(), true, fieldMetadata("meta", &var)));
            arrays.push_back(stringArray(*strings, var.name));
        } else {
            fields.push_back(arrow::field(var.name, arrow::float64(), true, fieldMetadata("meta", &var)));
            arrays.push_back(numericArray(std::get<NumericColumn>(table.metas()[i]), var.name));
        }
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto arrowTable = arrow::Table::Make(schema, arrays, static_cast<int64_t>(table.rowCount()));

    auto outRes = arrow::io::FileOutputStream::Open(filename);
    if (!outRes.ok()) throw Tabula::IOException("Failed to open parquet output path: " + outRes.status().ToString());
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    // Field metadata only survives when the Arrow schema is stored alongside.
    auto arrowProps = parquet::ArrowWriterProperties::Builder().store_schema()->build();
    const int64_t chunkRows = std::max<int64_t>(1024, std::min<int64_t>(65536, static_cast<int64_t>(table.rowCount())));
    check(parquet::arrow::WriteTable(*arrowTable, arrow::default_memory_pool(), sink, chunkRows,
                                     parquet::default_writer_properties(), arrowProps),
          "Parquet write failed");
    check(sink->Close(), "Failed to close parquet output stream");
}

Table ParquetFormat::readFile(const std::string& filename, const ReadOptions&) const {
    parquet::arrow::FileReaderBuilder builder;
    check(builder.OpenFile(filename), "Could not open " + filename);
    std::unique_ptr<parquet::arrow::FileReader> reader;
    check(builder.Build(&reader), "Could not read Parquet metadata of " + filename);
    std::shared_ptr<arrow::Table> arrowTable;
    check(reader->ReadTable(&arrowTable), "Could not read Parquet data of " + filename);

    const auto rows = static_cast<size_t>(arrowTable->num_rows());
    Domain domain;
    std::vector<NumericColumn> X;
    std::vector<NumericColumn> Y;
    std::vector<MetaColumn> metas;
    std::vector<NumericColumn> W;

    for (int i = 0; i < arrowTable->num_columns(); ++i) {
        const auto field = arrowTable->schema()->field(i);
        const auto metadata = field->metadata();
        const auto& chunks = *arrowTable->column(i);
        const bool isText = field->type()->id() == arrow::Type::STRING;

        std::string role = metadataValue(metadata, kRoleKey);
        if (role == "weight") {
            W.push_back(readNumeric(chunks, field->name()));
            continue;
        }

        Variable var;
        var.name = field->name();
        const std::string kind = metadataValue(metadata, kKindKey);
        if (kind == "discrete") {
            var.kind = VariableKind::DISCRETE;
            var.values = ColumnFlags::split(metadataValue(metadata, kValuesKey));
            if (var.values.size() == 1 && var.values.front().empty()) var.values.clear();
            var.ordered = metadataValue(metadata, kOrderedKey) == "1";
        } else if (kind == "string" || (kind.empty() && isText)) {
            var.kind = VariableKind::STRING;
        } else {
            var.kind = VariableKind::CONTINUOUS;
        }
        if (metadata) {
            for (int64_t k = 0; k < metadata->size(); ++k) {
                const std::string& key = metadata->key(k);
                if (key.compare(0, kAttributePrefix.size(), kAttributePrefix) == 0) {
                    var.attributes[key.substr(kAttributePrefix.size())] = metadata->value(k);
                }
            }
        }

        if (role == "meta" || var.isString()) {
            if (var.isString()) {
                metas.emplace_back(readStrings(chunks, var.name));
            } else {
                metas.emplace_back(readNumeric(chunks, var.name));
            }
            domain.metas.push_back(std::move(var));
        } else if (role == "class") {
            Y.push_back(readNumeric(chunks, var.name));
            domain.classVars.push_back(std::move(var));
        } else {
            X.push_back(readNumeric(chunks, var.name));
            domain.attributes.push_back(std::move(var));
        }
    }

    return Table(std::move(domain), std::move(X), std::move(Y), std::move(metas), std::move(W), rows);
}

#else

bool ParquetFormat::nativeSupport() noexcept { return false; }

void ParquetFormat::writeFile(const std::string& filename, const Table&) const {
    throw Tabula::IOException("Cannot write " + filename + ": compiled without native parquet support");
}

Table ParquetFormat::readFile(const std::string& filename, const ReadOptions&) const {
    throw Tabula::IOException("Cannot read " + filename + ": compiled without native parquet support");
}

#endif
