#include "History.hpp"

namespace tokensim {

    void History::beginRow() {
        if (rowOpen_) {
            throw std::logic_error("History: row already open");
        }
        rowOpen_ = true;
    }

    void History::record(const std::string& name, double value) {
        if (!rowOpen_) {
            throw std::logic_error("History: record outside of an open row");
        }

        auto it = index_.find(name);
        if (it == index_.end()) {
            if (rows_ > 0) {
                throw ConfigurationError("Variable " + name + " first recorded at step "
                    + std::to_string(rows_) + "; every variable must be recorded from step 0");
            }
            index_[name] = columns_.size();
            names_.push_back(name);
            columns_.emplace_back();
            columns_.back().push_back(value);
            return;
        }

        auto& col = columns_[it->second];
        if (col.size() > rows_) {
            throw ConfigurationError("Duplicate variable name within one step: " + name);
        }
        col.push_back(value);
    }

    void History::set(const std::string& name, double value) {
        auto& col = columns_[indexOf(name)];
        if (!rowOpen_ || col.size() != rows_ + 1) {
            throw std::logic_error("History: " + name + " has no value in the open row");
        }
        col.back() = value;
    }

    void History::commitRow() {
        if (!rowOpen_) {
            throw std::logic_error("History: commit without an open row");
        }
        for (size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].size() != rows_ + 1) {
                throw std::logic_error("History: variable " + names_[i] + " missing from step "
                    + std::to_string(rows_));
            }
        }
        rows_++;
        rowOpen_ = false;
    }

    void History::discardRow() {
        for (auto& col : columns_) {
            if (col.size() > rows_) col.resize(rows_);
        }
        rowOpen_ = false;
    }

    void History::clear() {
        names_.clear();
        index_.clear();
        columns_.clear();
        rows_ = 0;
        rowOpen_ = false;
    }

    bool History::hasColumn(const std::string& name) const {
        return index_.find(name) != index_.end();
    }

    const std::vector<double>& History::column(const std::string& name) const {
        return columns_[indexOf(name)];
    }

    double History::at(const std::string& name, StepIndex step) const {
        const auto& col = columns_[indexOf(name)];
        if (step >= col.size()) {
            throw std::out_of_range("History: step " + std::to_string(step)
                + " not recorded for " + name);
        }
        return col[step];
    }

    double History::latest(const std::string& name) const {
        const auto& col = columns_[indexOf(name)];
        if (col.empty()) {
            throw std::out_of_range("History: nothing recorded for " + name);
        }
        return col.back();
    }

    double History::previous(const std::string& name, double fallback) const {
        if (rows_ == 0) return fallback;
        auto it = index_.find(name);
        if (it == index_.end()) return fallback;
        return columns_[it->second][rows_ - 1];
    }

    size_t History::indexOf(const std::string& name) const {
        auto it = index_.find(name);
        if (it == index_.end()) {
            throw KeyNotFoundError(name);
        }
        return it->second;
    }

} // namespace tokensim
