#pragma once
#include "sinter/dynamics/expression.h"
#include "hate/visibility.h"
#include <iosfwd>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sinter::dynamics {

/** Kind of information exchanged through a port. */
enum class Communication
{
	event,
	analog
};

std::ostream& operator<<(std::ostream& os, Communication communication) SYMBOL_VISIBLE;


/** Named interaction point of dynamics. */
struct SYMBOL_VISIBLE Port
{
	enum class Mode
	{
		send,
		receive,
		/** Analog receive port summing all incoming connections. */
		reduce
	};

	std::string name;
	Mode mode;
	Communication communication;
	std::string dimension;

	Port(
	    std::string name,
	    Mode mode,
	    Communication communication,
	    std::string dimension = "dimensionless") SYMBOL_VISIBLE;

	bool operator==(Port const& other) const = default;
	bool operator!=(Port const& other) const = default;

	friend std::ostream& operator<<(std::ostream& os, Port const& port) SYMBOL_VISIBLE;
};

std::ostream& operator<<(std::ostream& os, Port::Mode mode) SYMBOL_VISIBLE;


struct SYMBOL_VISIBLE Parameter
{
	std::string name;
	std::string dimension = "dimensionless";

	bool operator==(Parameter const& other) const = default;
	bool operator!=(Parameter const& other) const = default;
};

struct SYMBOL_VISIBLE StateVariable
{
	std::string name;
	std::string dimension = "dimensionless";

	bool operator==(StateVariable const& other) const = default;
	bool operator!=(StateVariable const& other) const = default;
};

/** Named expression which can be referenced like a symbol. */
struct SYMBOL_VISIBLE Alias
{
	std::string name;
	Expression rhs;

	bool operator==(Alias const& other) const = default;
	bool operator!=(Alias const& other) const = default;
};

struct SYMBOL_VISIBLE TimeDerivative
{
	std::string variable;
	Expression rhs;

	bool operator==(TimeDerivative const& other) const = default;
	bool operator!=(TimeDerivative const& other) const = default;
};

struct SYMBOL_VISIBLE StateAssignment
{
	std::string variable;
	Expression rhs;

	bool operator==(StateAssignment const& other) const = default;
	bool operator!=(StateAssignment const& other) const = default;
};

/** Discrete transition triggered by an incoming event. */
struct SYMBOL_VISIBLE OnEvent
{
	std::string src_port;
	std::vector<StateAssignment> state_assignments{};
	std::vector<std::string> output_events{};
	std::optional<std::string> target_regime{};

	bool operator==(OnEvent const& other) const = default;
	bool operator!=(OnEvent const& other) const = default;
};

/** Discrete transition triggered by a condition on the continuous state. */
struct SYMBOL_VISIBLE OnCondition
{
	Expression trigger;
	std::vector<StateAssignment> state_assignments{};
	std::vector<std::string> output_events{};
	std::optional<std::string> target_regime{};

	bool operator==(OnCondition const& other) const = default;
	bool operator!=(OnCondition const& other) const = default;
};

struct SYMBOL_VISIBLE Regime
{
	std::string name;
	std::vector<TimeDerivative> time_derivatives{};
	std::vector<OnEvent> on_events{};
	std::vector<OnCondition> on_conditions{};

	bool operator==(Regime const& other) const = default;
	bool operator!=(Regime const& other) const = default;
};


/**
 * Definitions referenced by a set of expressions.
 * Aliases are followed transitively.
 */
struct SYMBOL_VISIBLE RequiredDefinitions
{
	std::set<std::string> parameters;
	std::set<std::string> state_variables;
	std::set<std::string> ports;
	std::set<std::string> aliases;

	bool operator==(RequiredDefinitions const& other) const = default;
	bool operator!=(RequiredDefinitions const& other) const = default;
};


/**
 * Definition of continuous and discrete state evolution exposing named ports.
 * Send ports refer to the state variable or alias of the same name.
 */
struct SYMBOL_VISIBLE Dynamics
{
	std::string name;
	std::vector<Parameter> parameters{};
	std::vector<Port> ports{};
	std::vector<StateVariable> state_variables{};
	std::vector<Alias> aliases{};
	std::vector<Regime> regimes{};

	bool has_parameter(std::string const& name) const SYMBOL_VISIBLE;
	bool has_state_variable(std::string const& name) const SYMBOL_VISIBLE;
	bool has_alias(std::string const& name) const SYMBOL_VISIBLE;
	bool has_port(std::string const& name) const SYMBOL_VISIBLE;

	/**
	 * Get port by name.
	 * @throws std::out_of_range On no port with given name being present
	 */
	Port const& get_port(std::string const& name) const SYMBOL_VISIBLE;

	std::set<std::string> get_state_variable_names() const SYMBOL_VISIBLE;

	std::vector<TimeDerivative> get_time_derivatives() const SYMBOL_VISIBLE;
	std::vector<OnEvent> get_on_events() const SYMBOL_VISIBLE;
	std::vector<OnCondition> get_on_conditions() const SYMBOL_VISIBLE;

	/**
	 * Replace aliases in expression by their definition until no alias is referenced.
	 * @throws StructuralError On cyclic alias definitions
	 */
	Expression expand_aliases(Expression const& expression) const SYMBOL_VISIBLE;

	/**
	 * Get definitions required to evaluate given expressions.
	 * @param expressions Expressions to evaluate
	 */
	RequiredDefinitions required_for(std::vector<Expression> const& expressions) const
	    SYMBOL_VISIBLE;

	/**
	 * Get reason why the dynamics is not linear.
	 * Dynamics is linear, if it features a single regime without on-conditions and all time
	 * derivatives and on-event state assignments are linear in its state variables.
	 * @return Reason or no value for linear dynamics
	 */
	std::optional<std::string> get_nonlinearity() const SYMBOL_VISIBLE;

	bool is_linear() const SYMBOL_VISIBLE;

	/**
	 * Check that all names are unique and every referenced symbol, port and regime is defined.
	 */
	bool valid() const SYMBOL_VISIBLE;

	bool operator==(Dynamics const& other) const = default;
	bool operator!=(Dynamics const& other) const = default;

	friend std::ostream& operator<<(std::ostream& os, Dynamics const& dynamics) SYMBOL_VISIBLE;
};

} // namespace sinter::dynamics
