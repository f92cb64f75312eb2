#pragma once
#include "hate/visibility.h"
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sinter::dynamics {

/**
 * Immutable mathematical expression used in the right-hand sides of dynamics equations.
 * Nodes are shared between copies.
 */
struct SYMBOL_VISIBLE Expression
{
	enum class Operator
	{
		constant,
		symbol,

		// binary arithmetic
		add,
		subtract,
		multiply,
		divide,
		power,

		// binary boolean
		less,
		less_equal,
		greater,
		greater_equal,
		equal,
		not_equal,
		logical_and,
		logical_or,

		// unary
		negate,
		logical_not,
		function
	};

	/**
	 * Construct constant expression.
	 * @param value Constant value
	 */
	Expression(double value = 0.) SYMBOL_VISIBLE;

	/**
	 * Construct reference to a parameter, state variable, alias or analog port.
	 * @param name Referenced name
	 */
	static Expression symbol(std::string const& name) SYMBOL_VISIBLE;

	/**
	 * Construct binary operation.
	 * @throws std::invalid_argument On operator not being binary
	 */
	static Expression binary(Operator op, Expression const& lhs, Expression const& rhs)
	    SYMBOL_VISIBLE;

	/**
	 * Construct negation or logical negation.
	 * @throws std::invalid_argument On operator not being a unary operator
	 */
	static Expression unary(Operator op, Expression const& operand) SYMBOL_VISIBLE;

	/**
	 * Construct call of builtin function, e.g. "exp" or "sqrt".
	 * @param name Function name
	 * @param argument Function argument
	 */
	static Expression function(std::string const& name, Expression const& argument)
	    SYMBOL_VISIBLE;

	Operator get_operator() const SYMBOL_VISIBLE;

	/**
	 * Get value of constant expression.
	 * @throws std::logic_error On expression not being a constant
	 */
	double get_value() const SYMBOL_VISIBLE;

	/**
	 * Get name of symbol or function.
	 * @throws std::logic_error On expression being neither symbol nor function
	 */
	std::string const& get_name() const SYMBOL_VISIBLE;

	std::vector<Expression> const& get_operands() const SYMBOL_VISIBLE;

	/**
	 * Get names of all symbols referenced in the expression.
	 */
	std::set<std::string> get_symbols() const SYMBOL_VISIBLE;

	/**
	 * Replace symbols by expressions.
	 * Symbols without replacement are kept.
	 * @param replacements Expression to insert for each symbol name
	 */
	Expression substitute(std::map<std::string, Expression> const& replacements) const
	    SYMBOL_VISIBLE;

	/**
	 * Rename symbols.
	 * Symbols without new name are kept.
	 * @param names New name for each symbol name
	 */
	Expression rename(std::map<std::string, std::string> const& names) const SYMBOL_VISIBLE;

	/**
	 * Get polynomial degree of the expression in the given symbols.
	 * Occurrences inside non-polynomial terms, e.g. function arguments, divisors or comparisons,
	 * yield no degree.
	 * @param symbols Symbols to consider as variables, all other symbols are constants
	 */
	std::optional<size_t> get_degree_in(std::set<std::string> const& symbols) const SYMBOL_VISIBLE;

	/**
	 * Get whether the expression is linear (or constant) in the given symbols.
	 */
	bool is_linear_in(std::set<std::string> const& symbols) const SYMBOL_VISIBLE;

	bool operator==(Expression const& other) const SYMBOL_VISIBLE;
	bool operator!=(Expression const& other) const SYMBOL_VISIBLE;

	friend std::ostream& operator<<(std::ostream& os, Expression const& expression)
	    SYMBOL_VISIBLE;

private:
	struct Node
	{
		Operator op;
		double value;
		std::string name;
		std::vector<Expression> operands;
	};

	explicit Expression(std::shared_ptr<Node const> node);

	std::shared_ptr<Node const> m_node;
};

Expression operator+(Expression const& lhs, Expression const& rhs) SYMBOL_VISIBLE;
Expression operator-(Expression const& lhs, Expression const& rhs) SYMBOL_VISIBLE;
Expression operator*(Expression const& lhs, Expression const& rhs) SYMBOL_VISIBLE;
Expression operator/(Expression const& lhs, Expression const& rhs) SYMBOL_VISIBLE;
Expression operator-(Expression const& operand) SYMBOL_VISIBLE;

std::ostream& operator<<(std::ostream& os, Expression::Operator op) SYMBOL_VISIBLE;

} // namespace sinter::dynamics
