#include <tsp_mip_data.hpp>
#include <cstddef>
#include <string>
#include <tsp_instance.hpp>
#include <tsp_solution.hpp>
#include <mixed_integer_program.hpp>

using std::size_t;

TspMipData::TspMipData(const TSPInstance& inst, city_id anchor, SubtourEncoding encoding)
		: inst(inst), anchor(anchor), encoding(encoding),
		  arcToVariable(static_cast<size_t>(inst.getCityCount()),
						std::vector<variable_id>(static_cast<size_t>(inst.getCityCount()),
												 MixedIntegerProgram::invalid_variable)),
		  tolerance(1e-6) {
	if (inst.getCityCount() < 2) {
		throw InputError("A tour needs at least 2 cities, got " + std::to_string(inst.getCityCount()));
	}
	inst.checkCity(anchor);
	//Allen Kanten im vollständigen gerichteten Graphen Variablen zuordnen
	variableToArc.reserve(static_cast<size_t>(inst.getArcCount()));
	for (city_id from = 0; from < inst.getCityCount(); ++from) {
		for (city_id to = 0; to < inst.getCityCount(); ++to) {
			if (from != to) {
				arcToVariable[from][to] = static_cast<variable_id>(variableToArc.size());
				variableToArc.emplace_back(from, to);
			}
		}
	}
}

/**
 * @return Für jede Stadt eine Bedingung "genau eine ausgehende Kante" und eine Bedingung "genau eine eingehende
 * Kante", in dieser Reihenfolge
 */
std::vector<TspMipData::Constraint> TspMipData::degreeConstraints() const {
	const city_id n = inst.getCityCount();
	std::vector<Constraint> ret;
	ret.reserve(2 * static_cast<size_t>(n));
	const std::vector<double> ones(static_cast<size_t>(n - 1), 1);
	for (city_id city = 0; city < n; ++city) {
		std::vector<variable_id> outgoing;
		std::vector<variable_id> incoming;
		for (city_id other = 0; other < n; ++other) {
			if (other != city) {
				outgoing.push_back(arcToVariable[city][other]);
				incoming.push_back(arcToVariable[other][city]);
			}
		}
		ret.emplace_back(outgoing, ones, MixedIntegerProgram::equal, 1);
		ret.emplace_back(incoming, ones, MixedIntegerProgram::equal, 1);
	}
	return ret;
}

/**
 * @return Die MTZ-Implikationen x(i,j)=1 => u(j)-u(i)=1 für alle Kanten (i,j), deren Ziel nicht der Anker ist
 */
std::vector<TspMipData::IndicatorConstraint> TspMipData::orderingImplications() const {
	std::vector<IndicatorConstraint> ret;
	for (variable_id var = 0; var < getArcVariableCount(); ++var) {
		const Arc& arc = getArc(var);
		if (arc.second == anchor) {
			continue;
		}
		ret.push_back({var, Constraint({getOrderVariable(arc.second), getOrderVariable(arc.first)}, {1, -1},
									   MixedIntegerProgram::equal, 1)});
	}
	return ret;
}

/**
 * Linearisierung der MTZ-Implikationen. Für jede Kante (i,j) mit j != Anker:
 * u(i) - u(j) + M x(i,j) <= M - 1 und u(j) - u(i) + M x(i,j) <= M + 1
 * Da alle u in [0, n-1] liegen, ist M=n groß genug, damit beide Ungleichungen für x(i,j)=0 redundant sind.
 */
std::vector<TspMipData::Constraint> TspMipData::bigMConstraints() const {
	const auto bigM = static_cast<double>(inst.getCityCount());
	std::vector<Constraint> ret;
	for (const IndicatorConstraint& implication:orderingImplications()) {
		const Arc& arc = getArc(implication.indicator);
		variable_id from = getOrderVariable(arc.first);
		variable_id to = getOrderVariable(arc.second);
		ret.emplace_back(std::vector<variable_id>{from, to, implication.indicator}, std::vector<double>{1, -1, bigM},
						 MixedIntegerProgram::less_eq, bigM - 1);
		ret.emplace_back(std::vector<variable_id>{to, from, implication.indicator}, std::vector<double>{1, -1, bigM},
						 MixedIntegerProgram::less_eq, bigM + 1);
	}
	return ret;
}

/**
 * Fügt Variablen, Zielfunktion und alle Nebenbedingungen zum (leeren) MIP hinzu
 */
void TspMipData::setupMIP(MixedIntegerProgram& mip) const {
	if (mip.getVariableCount() != 0) {
		throw std::runtime_error("TSP model must be built into an empty MIP");
	}
	std::vector<double> arcCosts;
	arcCosts.reserve(variableToArc.size());
	for (const Arc& arc:variableToArc) {
		arcCosts.push_back(inst.getDistance(arc));
	}
	mip.addVariables(arcCosts, std::vector<double>(arcCosts.size(), 0), std::vector<double>(arcCosts.size(), 1),
					 MixedIntegerProgram::binary);
	const auto n = static_cast<size_t>(inst.getCityCount());
	mip.addVariables(std::vector<double>(n, 0), std::vector<double>(n, 0), std::vector<double>(n, n - 1.0),
					 MixedIntegerProgram::continuous);

	std::vector<Constraint> degree = degreeConstraints();
	mip.addConstraints(degree.begin(), degree.end());
	if (encoding == SubtourEncoding::indicator) {
		for (const IndicatorConstraint& implication:orderingImplications()) {
			mip.addIndicatorConstraint(implication);
		}
	} else {
		std::vector<Constraint> linearized = bigMConstraints();
		mip.addConstraints(linearized.begin(), linearized.end());
	}
}

/**
 * Übergibt die Kanten der Tour als Startlösung: 1 für jede Kante der Tour einschließlich der Kante von der letzten
 * Stadt zurück zur ersten, 0 für alle anderen Kanten. Die Positionsvariablen ergänzt der Solver.
 */
void TspMipData::addWarmStart(MixedIntegerProgram& mip, const TSPSolution& tour) const {
	if (!tour.isValid() || tour.getOrder().size() != static_cast<size_t>(inst.getCityCount())) {
		throw InputError("Warm start tour does not match the instance");
	}
	std::vector<variable_id> vars(static_cast<size_t>(getArcVariableCount()));
	std::vector<double> values(vars.size(), 0);
	for (variable_id var = 0; var < getArcVariableCount(); ++var) {
		vars[var] = var;
	}
	for (const Arc& arc:tour.getArcs()) {
		values[arcToVariable[arc.first][arc.second]] = 1;
	}
	mip.addMipStart(vars, values, "warmstart");
}

/**
 * @return Die vollständige Variablenbelegung, die der Tour entspricht. Die Positionen werden ab dem Anker gezählt.
 */
std::vector<double> TspMipData::toAssignment(const TSPSolution& tour) const {
	if (!tour.isValid() || tour.getOrder().size() != static_cast<size_t>(inst.getCityCount())) {
		throw InputError("Tour does not match the instance");
	}
	std::vector<double> ret(static_cast<size_t>(getVariableCount()), 0);
	for (const Arc& arc:tour.getArcs()) {
		ret[arcToVariable[arc.first][arc.second]] = 1;
	}
	TSPSolution rotated = tour.rotatedTo(anchor);
	const std::vector<city_id>& fromAnchor = rotated.getOrder();
	for (size_t pos = 0; pos < fromAnchor.size(); ++pos) {
		ret[getOrderVariable(fromAnchor[pos])] = static_cast<double>(pos);
	}
	return ret;
}

/**
 * @return Die Anzahl der Nebenbedingungen des Modells (in der gewählten Kodierung), die von values verletzt werden
 */
size_t TspMipData::countViolations(const std::vector<double>& values) const {
	if (values.size() != static_cast<size_t>(getVariableCount())) {
		throw InputError("Assignment has " + std::to_string(values.size()) + " values, expected " +
						 std::to_string(getVariableCount()));
	}
	size_t violated = 0;
	for (const Constraint& c:degreeConstraints()) {
		if (c.isViolated(values, tolerance)) {
			++violated;
		}
	}
	if (encoding == SubtourEncoding::indicator) {
		for (const IndicatorConstraint& c:orderingImplications()) {
			if (c.isViolated(values, tolerance)) {
				++violated;
			}
		}
	} else {
		for (const Constraint& c:bigMConstraints()) {
			if (c.isViolated(values, tolerance)) {
				++violated;
			}
		}
	}
	return violated;
}
