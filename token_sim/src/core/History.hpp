#pragma once

#include "Types.hpp"
#include <string>
#include <vector>
#include <unordered_map>

namespace tokensim {

    // Append-only table of recorded variables: one column per variable name,
    // one row per elapsed step. Price functions and add-ons only ever see a
    // const reference.
    class History {
    public:
        History() = default;

        // Row lifecycle (economy only)
        void beginRow();
        void record(const std::string& name, double value);
        void set(const std::string& name, double value);
        void commitRow();
        void discardRow();
        void clear();

        // Committed rows
        size_t rows() const { return rows_; }
        bool isRowOpen() const { return rowOpen_; }

        bool hasColumn(const std::string& name) const;
        const std::vector<double>& column(const std::string& name) const;
        const std::vector<std::string>& columnNames() const { return names_; }

        // Value at a step; the open row counts as step rows()
        double at(const std::string& name, StepIndex step) const;

        // Most recent value, including the open row
        double latest(const std::string& name) const;

        // Value at the last committed row, or fallback when nothing is committed
        double previous(const std::string& name, double fallback) const;

    private:
        std::vector<std::string> names_;
        std::unordered_map<std::string, size_t> index_;
        std::vector<std::vector<double>> columns_;
        size_t rows_ = 0;
        bool rowOpen_ = false;

        size_t indexOf(const std::string& name) const;
    };

} // namespace tokensim
