#include "SpectrumPredicate.hpp"
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace msms {

const char *compare_op_symbol(CompareOp op) {
	switch (op) {
	case CompareOp::EQ:
		return "=";
	case CompareOp::NE:
		return "<>";
	case CompareOp::LT:
		return "<";
	case CompareOp::LE:
		return "<=";
	case CompareOp::GT:
		return ">";
	case CompareOp::GE:
		return ">=";
	default:
		throw std::invalid_argument("Invalid comparison operator");
	}
}

bool is_numeric(const FieldValue &value) {
	return !std::holds_alternative<std::string>(value);
}

static double AsDouble(const FieldValue &value) {
	if (std::holds_alternative<int64_t>(value)) {
		return static_cast<double>(std::get<int64_t>(value));
	}
	return std::get<double>(value);
}

// Text stored in an extra field read as a number. Hexadecimal forms and
// non-finite values (nan, inf) are rejected so that the result agrees with
// the SQL expression used by the hybrid store.
static bool TextAsDouble(const std::string &text, double &out) {
	if (text.empty() || text.find_first_of("xX") != std::string::npos) {
		return false;
	}
	try {
		size_t pos = 0;
		out = std::stod(text, &pos);
		return pos == text.size() && std::isfinite(out);
	} catch (const std::invalid_argument &) {
		return false;
	} catch (const std::out_of_range &) {
		return false;
	}
}

template <typename T>
static bool Apply(CompareOp op, const T &lhs, const T &rhs) {
	switch (op) {
	case CompareOp::EQ:
		return lhs == rhs;
	case CompareOp::NE:
		return lhs != rhs;
	case CompareOp::LT:
		return lhs < rhs;
	case CompareOp::LE:
		return lhs <= rhs;
	case CompareOp::GT:
		return lhs > rhs;
	case CompareOp::GE:
		return lhs >= rhs;
	default:
		return false;
	}
}

SpectrumPredicate &SpectrumPredicate::where(const std::string &field, CompareOp op, FieldValue value) {
	if (field.empty()) {
		throw std::invalid_argument("Predicate field name must not be empty");
	}
	if (std::holds_alternative<double>(value) && !std::isfinite(std::get<double>(value))) {
		throw std::invalid_argument("Predicate value for '" + field + "' must be a finite number");
	}
	auto name = canonical_field_name(field);
	if (is_core_field(name)) {
		bool text_field = name == FIELD_ID || name == FIELD_SCANS;
		if (text_field && is_numeric(value)) {
			throw std::invalid_argument("Field '" + name + "' is text and cannot be compared with a number");
		}
		if (!text_field && !is_numeric(value)) {
			throw std::invalid_argument("Field '" + name + "' is numeric and cannot be compared with text");
		}
	}
	comparisons_.push_back(FieldComparison {std::move(name), op, std::move(value)});
	return *this;
}

bool SpectrumPredicate::matches(const SpectrumRecord &record) const {
	for (const auto &cmp : comparisons_) {
		auto actual = record.field(cmp.field);
		if (!actual) {
			return false;
		}

		if (is_numeric(cmp.value)) {
			double lhs = 0;
			if (is_numeric(*actual)) {
				lhs = AsDouble(*actual);
			} else if (!TextAsDouble(std::get<std::string>(*actual), lhs)) {
				return false;
			}
			if (!Apply(cmp.op, lhs, AsDouble(cmp.value))) {
				return false;
			}
		} else {
			if (is_numeric(*actual)) {
				return false;
			}
			if (!Apply(cmp.op, std::get<std::string>(*actual), std::get<std::string>(cmp.value))) {
				return false;
			}
		}
	}
	return true;
}

std::string SpectrumPredicate::to_string() const {
	std::ostringstream out;
	for (size_t i = 0; i < comparisons_.size(); i++) {
		const auto &cmp = comparisons_[i];
		if (i > 0) {
			out << " AND ";
		}
		out << cmp.field << " " << compare_op_symbol(cmp.op) << " ";
		if (std::holds_alternative<std::string>(cmp.value)) {
			out << "'" << std::get<std::string>(cmp.value) << "'";
		} else if (std::holds_alternative<int64_t>(cmp.value)) {
			out << std::get<int64_t>(cmp.value);
		} else {
			out << std::get<double>(cmp.value);
		}
	}
	return out.str();
}

//===--------------------------------------------------------------------===//
// Parsing
//===--------------------------------------------------------------------===//
namespace {

class ExpressionLexer {
public:
	explicit ExpressionLexer(const std::string &text) : text_(text) {
	}

	bool at_end() {
		skip_space();
		return pos_ >= text_.size();
	}

	std::string identifier() {
		skip_space();
		size_t start = pos_;
		while (pos_ < text_.size() && (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
			pos_++;
		}
		if (pos_ == start) {
			fail("expected a field name");
		}
		return text_.substr(start, pos_ - start);
	}

	CompareOp op() {
		skip_space();
		auto rest = std::string_view(text_).substr(pos_);
		auto take = [&](size_t n, CompareOp result) {
			pos_ += n;
			return result;
		};
		if (rest.rfind("==", 0) == 0) {
			return take(2, CompareOp::EQ);
		}
		if (rest.rfind("!=", 0) == 0 || rest.rfind("<>", 0) == 0) {
			return take(2, CompareOp::NE);
		}
		if (rest.rfind("<=", 0) == 0) {
			return take(2, CompareOp::LE);
		}
		if (rest.rfind(">=", 0) == 0) {
			return take(2, CompareOp::GE);
		}
		if (rest.rfind("=", 0) == 0) {
			return take(1, CompareOp::EQ);
		}
		if (rest.rfind("<", 0) == 0) {
			return take(1, CompareOp::LT);
		}
		if (rest.rfind(">", 0) == 0) {
			return take(1, CompareOp::GT);
		}
		fail("expected a comparison operator");
	}

	FieldValue value() {
		skip_space();
		if (pos_ >= text_.size()) {
			fail("expected a value");
		}
		char quote = text_[pos_];
		if (quote == '\'' || quote == '"') {
			size_t end = text_.find(quote, pos_ + 1);
			if (end == std::string::npos) {
				fail("unterminated string literal");
			}
			auto literal = text_.substr(pos_ + 1, end - pos_ - 1);
			pos_ = end + 1;
			return FieldValue(literal);
		}

		size_t start = pos_;
		while (pos_ < text_.size() && !std::isspace(static_cast<unsigned char>(text_[pos_]))) {
			pos_++;
		}
		auto token = text_.substr(start, pos_ - start);
		try {
			size_t used = 0;
			if (token.find_first_of(".eE") == std::string::npos) {
				int64_t v = std::stoll(token, &used);
				if (used == token.size()) {
					return FieldValue(v);
				}
			} else {
				double v = std::stod(token, &used);
				if (used == token.size()) {
					return FieldValue(v);
				}
			}
		} catch (const std::invalid_argument &) {
		} catch (const std::out_of_range &) {
		}
		pos_ = start;
		fail("invalid numeric literal '" + token + "' (quote text values)");
	}

	void expect_and() {
		auto word = identifier();
		for (auto &c : word) {
			c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
		}
		if (word != "AND") {
			fail("expected AND, got '" + word + "'");
		}
	}

private:
	const std::string &text_;
	size_t pos_ = 0;

	void skip_space() {
		while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
			pos_++;
		}
	}

	[[noreturn]] void fail(const std::string &what) const {
		throw std::invalid_argument("Invalid predicate '" + text_ + "' at position " + std::to_string(pos_) + ": " +
		                            what);
	}
};

} // namespace

SpectrumPredicate SpectrumPredicate::parse(const std::string &expression) {
	SpectrumPredicate predicate;
	ExpressionLexer lexer(expression);
	if (lexer.at_end()) {
		return predicate;
	}
	while (true) {
		auto field = lexer.identifier();
		auto op = lexer.op();
		auto value = lexer.value();
		predicate.where(field, op, std::move(value));
		if (lexer.at_end()) {
			break;
		}
		lexer.expect_and();
	}
	return predicate;
}

} // namespace msms
