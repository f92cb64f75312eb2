#include "sinter/dynamics/expression.h"

#include <algorithm>
#include <cmath>
#include <ostream>
#include <stdexcept>

namespace sinter::dynamics {

namespace {

bool is_binary(Expression::Operator const op)
{
	switch (op) {
		case Expression::Operator::add:
		case Expression::Operator::subtract:
		case Expression::Operator::multiply:
		case Expression::Operator::divide:
		case Expression::Operator::power:
		case Expression::Operator::less:
		case Expression::Operator::less_equal:
		case Expression::Operator::greater:
		case Expression::Operator::greater_equal:
		case Expression::Operator::equal:
		case Expression::Operator::not_equal:
		case Expression::Operator::logical_and:
		case Expression::Operator::logical_or:
			return true;
		default:
			return false;
	}
}

} // namespace

Expression::Expression(double const value) :
    m_node(std::make_shared<Node const>(Node{Operator::constant, value, {}, {}}))
{}

Expression::Expression(std::shared_ptr<Node const> node) : m_node(std::move(node)) {}

Expression Expression::symbol(std::string const& name)
{
	return Expression(std::make_shared<Node const>(Node{Operator::symbol, 0., name, {}}));
}

Expression Expression::binary(Operator const op, Expression const& lhs, Expression const& rhs)
{
	if (!is_binary(op)) {
		throw std::invalid_argument("Operator is not a binary operator.");
	}
	return Expression(std::make_shared<Node const>(Node{op, 0., {}, {lhs, rhs}}));
}

Expression Expression::unary(Operator const op, Expression const& operand)
{
	if (op != Operator::negate && op != Operator::logical_not) {
		throw std::invalid_argument("Operator is not a unary operator.");
	}
	return Expression(std::make_shared<Node const>(Node{op, 0., {}, {operand}}));
}

Expression Expression::function(std::string const& name, Expression const& argument)
{
	return Expression(std::make_shared<Node const>(Node{Operator::function, 0., name, {argument}}));
}

Expression::Operator Expression::get_operator() const
{
	return m_node->op;
}

double Expression::get_value() const
{
	if (m_node->op != Operator::constant) {
		throw std::logic_error("Expression is not a constant.");
	}
	return m_node->value;
}

std::string const& Expression::get_name() const
{
	if (m_node->op != Operator::symbol && m_node->op != Operator::function) {
		throw std::logic_error("Expression is neither a symbol nor a function.");
	}
	return m_node->name;
}

std::vector<Expression> const& Expression::get_operands() const
{
	return m_node->operands;
}

std::set<std::string> Expression::get_symbols() const
{
	std::set<std::string> symbols;
	if (m_node->op == Operator::symbol) {
		symbols.insert(m_node->name);
	}
	for (auto const& operand : m_node->operands) {
		symbols.merge(operand.get_symbols());
	}
	return symbols;
}

Expression Expression::substitute(std::map<std::string, Expression> const& replacements) const
{
	if (m_node->op == Operator::symbol) {
		if (auto const it = replacements.find(m_node->name); it != replacements.end()) {
			return it->second;
		}
		return *this;
	}
	if (m_node->operands.empty()) {
		return *this;
	}
	std::vector<Expression> operands;
	for (auto const& operand : m_node->operands) {
		operands.push_back(operand.substitute(replacements));
	}
	return Expression(
	    std::make_shared<Node const>(Node{m_node->op, m_node->value, m_node->name, operands}));
}

Expression Expression::rename(std::map<std::string, std::string> const& names) const
{
	std::map<std::string, Expression> replacements;
	for (auto const& [from, to] : names) {
		replacements.emplace(from, symbol(to));
	}
	return substitute(replacements);
}

std::optional<size_t> Expression::get_degree_in(std::set<std::string> const& symbols) const
{
	auto const& operands = m_node->operands;
	switch (m_node->op) {
		case Operator::constant:
			return 0;
		case Operator::symbol:
			return symbols.contains(m_node->name) ? 1 : 0;
		case Operator::add:
		case Operator::subtract: {
			auto const lhs = operands.at(0).get_degree_in(symbols);
			auto const rhs = operands.at(1).get_degree_in(symbols);
			if (!lhs || !rhs) {
				return std::nullopt;
			}
			return std::max(*lhs, *rhs);
		}
		case Operator::multiply: {
			auto const lhs = operands.at(0).get_degree_in(symbols);
			auto const rhs = operands.at(1).get_degree_in(symbols);
			if (!lhs || !rhs) {
				return std::nullopt;
			}
			return *lhs + *rhs;
		}
		case Operator::divide: {
			auto const rhs = operands.at(1).get_degree_in(symbols);
			if (!rhs || *rhs != 0) {
				return std::nullopt;
			}
			return operands.at(0).get_degree_in(symbols);
		}
		case Operator::power: {
			auto const base = operands.at(0).get_degree_in(symbols);
			auto const exponent = operands.at(1).get_degree_in(symbols);
			if (!base || !exponent || *exponent != 0) {
				return std::nullopt;
			}
			if (*base == 0) {
				return 0;
			}
			// only non-negative integral constant exponents keep the expression polynomial
			auto const& e = operands.at(1);
			if (e.get_operator() != Operator::constant || e.get_value() < 0. ||
			    std::floor(e.get_value()) != e.get_value()) {
				return std::nullopt;
			}
			return *base * static_cast<size_t>(e.get_value());
		}
		case Operator::negate:
			return operands.at(0).get_degree_in(symbols);
		default: {
			// functions, comparisons and logical operations only stay polynomial on constants
			for (auto const& operand : operands) {
				auto const degree = operand.get_degree_in(symbols);
				if (!degree || *degree != 0) {
					return std::nullopt;
				}
			}
			return 0;
		}
	}
}

bool Expression::is_linear_in(std::set<std::string> const& symbols) const
{
	auto const degree = get_degree_in(symbols);
	return degree && *degree <= 1;
}

bool Expression::operator==(Expression const& other) const
{
	if (m_node == other.m_node) {
		return true;
	}
	return m_node->op == other.m_node->op && m_node->value == other.m_node->value &&
	       m_node->name == other.m_node->name && m_node->operands == other.m_node->operands;
}

bool Expression::operator!=(Expression const& other) const
{
	return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, Expression::Operator const op)
{
	switch (op) {
		case Expression::Operator::add:
			return os << "+";
		case Expression::Operator::subtract:
		case Expression::Operator::negate:
			return os << "-";
		case Expression::Operator::multiply:
			return os << "*";
		case Expression::Operator::divide:
			return os << "/";
		case Expression::Operator::power:
			return os << "^";
		case Expression::Operator::less:
			return os << "<";
		case Expression::Operator::less_equal:
			return os << "<=";
		case Expression::Operator::greater:
			return os << ">";
		case Expression::Operator::greater_equal:
			return os << ">=";
		case Expression::Operator::equal:
			return os << "==";
		case Expression::Operator::not_equal:
			return os << "!=";
		case Expression::Operator::logical_and:
			return os << "&&";
		case Expression::Operator::logical_or:
			return os << "||";
		case Expression::Operator::logical_not:
			return os << "!";
		case Expression::Operator::constant:
			return os << "constant";
		case Expression::Operator::symbol:
			return os << "symbol";
		case Expression::Operator::function:
			return os << "function";
	}
	throw std::logic_error("Unknown expression operator.");
}

std::ostream& operator<<(std::ostream& os, Expression const& expression)
{
	auto const& node = *expression.m_node;
	switch (node.op) {
		case Expression::Operator::constant:
			return os << node.value;
		case Expression::Operator::symbol:
			return os << node.name;
		case Expression::Operator::function:
			return os << node.name << "(" << node.operands.at(0) << ")";
		case Expression::Operator::negate:
		case Expression::Operator::logical_not:
			return os << node.op << node.operands.at(0);
		default:
			return os << "(" << node.operands.at(0) << " " << node.op << " " << node.operands.at(1)
			          << ")";
	}
}

Expression operator+(Expression const& lhs, Expression const& rhs)
{
	return Expression::binary(Expression::Operator::add, lhs, rhs);
}

Expression operator-(Expression const& lhs, Expression const& rhs)
{
	return Expression::binary(Expression::Operator::subtract, lhs, rhs);
}

Expression operator*(Expression const& lhs, Expression const& rhs)
{
	return Expression::binary(Expression::Operator::multiply, lhs, rhs);
}

Expression operator/(Expression const& lhs, Expression const& rhs)
{
	return Expression::binary(Expression::Operator::divide, lhs, rhs);
}

Expression operator-(Expression const& operand)
{
	return Expression::unary(Expression::Operator::negate, operand);
}

} // namespace sinter::dynamics
