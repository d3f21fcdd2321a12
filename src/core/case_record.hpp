// File: src/core/case_record.hpp
#pragma once

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace cinecbr {

/// Typed attribute value of a case or query
///
/// - double: numeric scalar (year, runtime, score)
/// - std::string: text scalar (categorical or ordinal value)
/// - std::vector<std::string>: ordered sequence (multi-valued attribute)
using AttributeValue = std::variant<double, std::string, std::vector<std::string>>;

/// Render a value for display ("14", "8.7", "Drama, Sci-Fi")
std::string ToDisplayString(const AttributeValue& value);

/// Render a number without trailing zeros
std::string FormatNumber(double value);

/// CaseRecord: one recorded movie (or a partial query) with typed attributes
///
/// The title identifies the record for display and takes no part in
/// similarity. Attributes are stored by name; an attribute that was never
/// set is unknown for this record.
class CaseRecord {
public:
    CaseRecord() = default;
    explicit CaseRecord(std::string title) : title_(std::move(title)) {}

    const std::string& GetTitle() const { return title_; }
    void SetTitle(const std::string& title) { title_ = title; }

    /// Set (or replace) an attribute value
    void Set(const std::string& name, AttributeValue value);

    /// Remove an attribute
    /// @return true if the attribute was present
    bool Erase(const std::string& name);

    /// Remove all attributes (title is kept)
    void Clear() { attributes_.clear(); }

    bool Has(const std::string& name) const;

    /// Find an attribute value
    /// @return Pointer to the value, or nullptr if the attribute is unknown
    const AttributeValue* Find(const std::string& name) const;

    /// Attribute names in lexicographic order
    std::vector<std::string> GetNames() const;

    size_t Size() const { return attributes_.size(); }
    bool Empty() const { return attributes_.empty(); }

    const std::map<std::string, AttributeValue>& GetAttributes() const { return attributes_; }

    bool operator==(const CaseRecord& other) const {
        return title_ == other.title_ && attributes_ == other.attributes_;
    }
    bool operator!=(const CaseRecord& other) const { return !(*this == other); }

private:
    std::string title_;
    std::map<std::string, AttributeValue> attributes_;
};

/// A query has the same shape as a case; any subset of attributes may be set
using Query = CaseRecord;

} // namespace cinecbr
