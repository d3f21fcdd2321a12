// File: src/core/case_base.hpp
#pragma once

#include "core/case_record.hpp"
#include <vector>

namespace cinecbr {

/// CaseBase: ordered, append-only collection of case records
///
/// Insertion order is preserved and is the tie-break key when ranking.
/// The base is read-only while a retrieval runs over it.
class CaseBase {
public:
    using const_iterator = std::vector<CaseRecord>::const_iterator;

    CaseBase() = default;
    explicit CaseBase(std::vector<CaseRecord> cases) : cases_(std::move(cases)) {}

    /// Append a case
    /// @return Insertion position of the new case
    size_t Add(CaseRecord record);

    size_t Size() const { return cases_.size(); }
    bool Empty() const { return cases_.empty(); }
    void Clear() { cases_.clear(); }

    const CaseRecord& operator[](size_t index) const { return cases_[index]; }

    /// Bounds-checked access
    /// @throws std::out_of_range if index >= Size()
    const CaseRecord& At(size_t index) const;

    const_iterator begin() const { return cases_.begin(); }
    const_iterator end() const { return cases_.end(); }

private:
    std::vector<CaseRecord> cases_;
};

} // namespace cinecbr
