#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

using RawRow = std::vector<std::string>;

/**
 * @brief Lazy, single-pass sequence of raw rows.
 */
class RowSource {
public:
    virtual ~RowSource() = default;

    /**
     * @brief Moves the next row into `row`.
     * @return false once the source is exhausted (row is left untouched).
     */
    virtual bool next(RawRow& row) = 0;
};

class VectorRowSource : public RowSource {
public:
    explicit VectorRowSource(std::vector<RawRow> rows) : rows_(std::move(rows)) {}

    bool next(RawRow& row) override {
        if (pos_ >= rows_.size()) return false;
        row = std::move(rows_[pos_++]);
        return true;
    }

private:
    std::vector<RawRow> rows_;
    size_t pos_ = 0;
};

// Replays rows already pulled off `rest` before continuing with it.
class SplicedRowSource : public RowSource {
public:
    SplicedRowSource(std::vector<RawRow> front, RowSource& rest) : front_(std::move(front)), rest_(rest) {}

    bool next(RawRow& row) override {
        if (pos_ < front_.size()) {
            row = std::move(front_[pos_++]);
            return true;
        }
        return rest_.next(row);
    }

private:
    std::vector<RawRow> front_;
    size_t pos_ = 0;
    RowSource& rest_;
};
