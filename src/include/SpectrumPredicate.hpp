#pragma once

#include <string>
#include <vector>
#include "SpectrumRecord.hpp"

namespace msms {

enum class CompareOp { EQ, NE, LT, LE, GT, GE };

struct FieldComparison {
	// Canonical name: lower-case for core fields, upper-case for extra keys
	std::string field;
	CompareOp op;
	FieldValue value;
};

// Conjunction of simple comparisons over scalar metadata fields.
//
// A comparison against a missing value is false. Numeric comparisons against
// extra fields read the stored text as a number; text that is not a number
// never matches. The empty predicate matches every record.
class SpectrumPredicate {
public:
	SpectrumPredicate() = default;

	// Add a comparison to the conjunction. Throws std::invalid_argument when the
	// value type cannot apply to a core field (text for a numeric field or the
	// reverse).
	SpectrumPredicate &where(const std::string &field, CompareOp op, FieldValue value);

	// Parse "field op value [AND field op value ...]".
	// Operators: == = != <> < <= > >=. Values: numbers or quoted text ('..' or "..").
	// Throws std::invalid_argument on malformed input.
	static SpectrumPredicate parse(const std::string &expression);

	[[nodiscard]] bool matches(const SpectrumRecord &record) const;

	const std::vector<FieldComparison> &comparisons() const {
		return comparisons_;
	}
	bool empty() const {
		return comparisons_.empty();
	}

	std::string to_string() const;

private:
	std::vector<FieldComparison> comparisons_;
};

const char *compare_op_symbol(CompareOp op);

// True for the numeric alternatives of FieldValue
bool is_numeric(const FieldValue &value);

} // namespace msms
