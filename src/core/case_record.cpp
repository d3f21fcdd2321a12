// File: src/core/case_record.cpp
#include "core/case_record.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace cinecbr {

std::string FormatNumber(double value) {
    if (!std::isfinite(value)) {
        return std::isnan(value) ? "nan" : (value > 0 ? "inf" : "-inf");
    }

    std::ostringstream ss;
    ss << std::setprecision(15) << value;
    return ss.str();
}

namespace {

struct DisplayVisitor {
    std::string operator()(double value) const { return FormatNumber(value); }

    std::string operator()(const std::string& value) const { return value; }

    std::string operator()(const std::vector<std::string>& values) const {
        std::string out;
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += values[i];
        }
        return out;
    }
};

} // anonymous namespace

std::string ToDisplayString(const AttributeValue& value) {
    return std::visit(DisplayVisitor{}, value);
}

// ============================================================================
// CaseRecord
// ============================================================================

void CaseRecord::Set(const std::string& name, AttributeValue value) {
    attributes_[name] = std::move(value);
}

bool CaseRecord::Erase(const std::string& name) {
    return attributes_.erase(name) > 0;
}

bool CaseRecord::Has(const std::string& name) const {
    return attributes_.find(name) != attributes_.end();
}

const AttributeValue* CaseRecord::Find(const std::string& name) const {
    auto it = attributes_.find(name);
    if (it == attributes_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> CaseRecord::GetNames() const {
    std::vector<std::string> names;
    names.reserve(attributes_.size());
    for (const auto& [name, value] : attributes_) {
        names.push_back(name);
    }
    return names;
}

} // namespace cinecbr
