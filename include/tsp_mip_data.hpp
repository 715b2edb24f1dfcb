#ifndef TSP_MIP_DATA_HPP
#define TSP_MIP_DATA_HPP

#include <lemon/tolerance.h>
#include <cstddef>
#include <tsp_instance.hpp>
#include <tsp_solution.hpp>
#include <vector>
#include <mixed_integer_program.hpp>

/**
 * Gibt an, wie die MTZ-Implikation "x(i,j)=1 => u(i)+1=u(j)" an den Solver übergeben wird
 */
enum class SubtourEncoding {
	//Native Indikator-Bedingungen des Solvers
	indicator,
	//Lineare Big-M-Ungleichungen mit M=n
	big_m
};

/*
 * Das MIP-Modell des (A)TSP mit Miller-Tucker-Zemlin-Bedingungen. Speichert, welche MIP-Variablen welchen Kanten
 * bzw. Städten entsprechen, und erzeugt die Nebenbedingungen. Die Variablen sind wie folgt angeordnet:
 * 0, ..., n(n-1)-1: binäre Kantenvariablen x(i,j), zeilenweise nach (i,j) ohne Diagonale
 * n(n-1), ..., n(n-1)+n-1: kontinuierliche Positionsvariablen u(i)
 */
class TspMipData {
public:
	using Constraint = MixedIntegerProgram::Constraint;
	using IndicatorConstraint = MixedIntegerProgram::IndicatorConstraint;

	TspMipData(const TSPInstance& inst, city_id anchor, SubtourEncoding encoding);

	inline variable_id getArcVariable(city_id from, city_id to) const;

	inline variable_id getOrderVariable(city_id city) const;

	inline const Arc& getArc(variable_id var) const;

	inline variable_id getArcVariableCount() const;

	inline variable_id getVariableCount() const;

	inline city_id getAnchor() const;

	inline SubtourEncoding getEncoding() const;

	inline const TSPInstance& getTSP() const;

	std::vector<Constraint> degreeConstraints() const;

	std::vector<IndicatorConstraint> orderingImplications() const;

	std::vector<Constraint> bigMConstraints() const;

	void setupMIP(MixedIntegerProgram& mip) const;

	void addWarmStart(MixedIntegerProgram& mip, const TSPSolution& tour) const;

	std::vector<double> toAssignment(const TSPSolution& tour) const;

	size_t countViolations(const std::vector<double>& values) const;

private:
	const TSPInstance& inst;
	const city_id anchor;
	const SubtourEncoding encoding;
	std::vector<Arc> variableToArc;
	//arcToVariable[i][j] ist die Variable der Kante von i nach j, auf der Diagonalen invalid_variable
	std::vector<std::vector<variable_id>> arcToVariable;
	lemon::Tolerance<double> tolerance;
};

/**
 * @return Die Variable für die Kante von from nach to, oder MixedIntegerProgram::invalid_variable, falls from==to
 */
variable_id TspMipData::getArcVariable(city_id from, city_id to) const {
	inst.checkCity(from);
	inst.checkCity(to);
	return arcToVariable[from][to];
}

/**
 * @return Die Positionsvariable u(city)
 */
variable_id TspMipData::getOrderVariable(city_id city) const {
	inst.checkCity(city);
	return getArcVariableCount() + city;
}

/**
 * @return die zur gegebenen Kantenvariable gehörende Kante
 */
const Arc& TspMipData::getArc(variable_id var) const {
	return variableToArc[var];
}

variable_id TspMipData::getArcVariableCount() const {
	return static_cast<variable_id>(variableToArc.size());
}

variable_id TspMipData::getVariableCount() const {
	return getArcVariableCount() + inst.getCityCount();
}

city_id TspMipData::getAnchor() const {
	return anchor;
}

SubtourEncoding TspMipData::getEncoding() const {
	return encoding;
}

const TSPInstance& TspMipData::getTSP() const {
	return inst;
}

#endif
