#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// ---------------------------------------------------------------------------
// TableSchema - names of the reserved bookkeeping columns in an input table
// ---------------------------------------------------------------------------
struct TableSchema {
    std::string id_column = "entity_id";
    std::string date_column = "date";
};

// Derived columns computed during aggregation. Never aggregated as features.
inline const std::vector<std::string>& derived_column_names() {
    static const std::vector<std::string> names = {"age", "weight"};
    return names;
}

// ---------------------------------------------------------------------------
// ObservationRow - one entity's numeric observations on one date.
// values[i] belongs to ObservationTable::column_names()[i]; NaN means missing.
// ---------------------------------------------------------------------------
struct ObservationRow {
    std::string entity_id;
    int date = 0;  // YYYYMMDD
    std::vector<double> values;
};

// ---------------------------------------------------------------------------
// ObservationTable - immutable-by-convention per-entity, per-date table.
//
// Holds the feature column names (the reserved id/date columns are carried
// by ObservationRow itself) and the rows in insertion order. Selection
// methods return new tables; nothing here mutates a table it did not build.
// ---------------------------------------------------------------------------
class ObservationTable {
public:
    ObservationTable() = default;

    explicit ObservationTable(std::vector<std::string> column_names,
                              TableSchema schema = {})
        : schema_(std::move(schema)), columns_(std::move(column_names)) {
        for (size_t i = 0; i < columns_.size(); ++i) {
            const auto& name = columns_[i];
            if (name.empty()) {
                throw std::invalid_argument("Feature column name must not be empty");
            }
            if (is_key_column(name)) {
                throw std::invalid_argument("Column '" + name +
                                            "' is the id or date column and cannot be a feature");
            }
            if (!index_.emplace(name, i).second) {
                throw std::invalid_argument("Duplicate column name: " + name);
            }
        }
    }

    const TableSchema& schema() const { return schema_; }
    const std::vector<std::string>& column_names() const { return columns_; }
    const std::vector<ObservationRow>& rows() const { return rows_; }
    size_t num_columns() const { return columns_.size(); }
    size_t num_rows() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    bool is_key_column(const std::string& name) const {
        return name == schema_.id_column || name == schema_.date_column;
    }

    // Key columns plus the derived names. A table may carry an input column
    // named like a derived one; it is stored but never aggregated.
    bool is_reserved(const std::string& name) const {
        if (is_key_column(name)) return true;
        const auto& derived = derived_column_names();
        return std::find(derived.begin(), derived.end(), name) != derived.end();
    }

    std::optional<size_t> column_index(const std::string& name) const {
        auto it = index_.find(name);
        if (it == index_.end()) return std::nullopt;
        return it->second;
    }

    bool has_column(const std::string& name) const {
        return index_.count(name) > 0;
    }

    void add_row(ObservationRow row) {
        if (row.entity_id.empty()) {
            throw std::invalid_argument("Row has an empty entity id");
        }
        if (row.values.size() != columns_.size()) {
            throw std::invalid_argument(
                "Row for entity '" + row.entity_id + "' has " +
                std::to_string(row.values.size()) + " values, expected " +
                std::to_string(columns_.size()));
        }
        rows_.push_back(std::move(row));
    }

    void add_row(const std::string& entity_id, int date, std::vector<double> values) {
        add_row(ObservationRow{entity_id, date, std::move(values)});
    }

    // Value of `column` in `row`, NaN when the column does not exist.
    double value(const ObservationRow& row, const std::string& column) const {
        auto idx = column_index(column);
        if (!idx) return std::numeric_limits<double>::quiet_NaN();
        return row.values[*idx];
    }

    // Sorted distinct entity ids.
    std::vector<std::string> entity_ids() const {
        std::set<std::string> ids;
        for (const auto& r : rows_) ids.insert(r.entity_id);
        return {ids.begin(), ids.end()};
    }

    // Rows of each entity, in table order, keyed by id (ordered map = sorted ids).
    std::map<std::string, std::vector<ObservationRow>> group_by_entity() const {
        std::map<std::string, std::vector<ObservationRow>> groups;
        for (const auto& r : rows_) groups[r.entity_id].push_back(r);
        return groups;
    }

    std::vector<ObservationRow> rows_for_entity(const std::string& entity_id) const {
        std::vector<ObservationRow> out;
        for (const auto& r : rows_) {
            if (r.entity_id == entity_id) out.push_back(r);
        }
        return out;
    }

    template <typename Pred>
    ObservationTable filter(Pred pred) const {
        ObservationTable out = empty_like();
        for (const auto& r : rows_) {
            if (pred(r)) out.rows_.push_back(r);
        }
        return out;
    }

    ObservationTable rows_before(int cutoff) const {
        return filter([cutoff](const ObservationRow& r) { return r.date < cutoff; });
    }

    ObservationTable rows_on(int date) const {
        return filter([date](const ObservationRow& r) { return r.date == date; });
    }

    ObservationTable restrict_to_entities(const std::set<std::string>& ids) const {
        return filter([&ids](const ObservationRow& r) { return ids.count(r.entity_id) > 0; });
    }

    // New table with `name` appended, computed per row by `fn`.
    template <typename Fn>
    ObservationTable with_column(const std::string& name, Fn fn) const {
        if (has_column(name)) {
            throw std::invalid_argument("Column already exists: " + name);
        }
        auto cols = columns_;
        cols.push_back(name);
        ObservationTable out(std::move(cols), schema_);
        out.rows_.reserve(rows_.size());
        for (const auto& r : rows_) {
            ObservationRow copy = r;
            copy.values.push_back(fn(*this, r));
            out.rows_.push_back(std::move(copy));
        }
        return out;
    }

private:
    TableSchema schema_;
    std::vector<std::string> columns_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<ObservationRow> rows_;

    ObservationTable empty_like() const {
        ObservationTable out;
        out.schema_ = schema_;
        out.columns_ = columns_;
        out.index_ = index_;
        return out;
    }
};
