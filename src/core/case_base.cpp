// File: src/core/case_base.cpp
#include "core/case_base.hpp"
#include <stdexcept>
#include <string>

namespace cinecbr {

size_t CaseBase::Add(CaseRecord record) {
    cases_.push_back(std::move(record));
    return cases_.size() - 1;
}

const CaseRecord& CaseBase::At(size_t index) const {
    if (index >= cases_.size()) {
        throw std::out_of_range("Case index " + std::to_string(index) +
                                " out of range (size " + std::to_string(cases_.size()) + ")");
    }
    return cases_[index];
}

} // namespace cinecbr
