#include <lemon/core.h>
#include <lemon/full_graph.h>
#include <lemon/tolerance.h>
#include <algorithm>
#include <cstddef>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tsp_instance.hpp>
#include <tsp_mip_data.hpp>
#include <tsp_solution.hpp>
#include <tsp_utils.hpp>
#include <utility>
#include <vector>

/**
 * Rekonstruiert die Tour aus einer Lösung des MIPs, beginnend beim Anker des Modells. Kantenvariablen mit Wert >0.5
 * gelten als gewählt. Ist die Belegung keine einzelne Tour durch alle Städte, wird ein ExtractionValidationError
 * geworfen.
 * @param inst Die TSP-Instanz
 * @param variables Die Belegung der MIP-Variablen
 * @param variableMap gibt an, welche MIP-Variable welcher Kante entspricht
 * @param reportedObjective Der vom Solver gemeldete Zielfunktionswert, nur für Fehlermeldungen
 * @param reportedStatus Der vom Solver gemeldete Status, nur für Fehlermeldungen
 */
TSPSolution::TSPSolution(const TSPInstance& inst, const std::vector<double>& variables, const TspMipData& variableMap,
						 double reportedObjective, MipStatus reportedStatus)
		: inst(&inst) {
	if (variables.size() < static_cast<std::size_t>(variableMap.getArcVariableCount())) {
		throw ExtractionValidationError("Solution has only " + std::to_string(variables.size()) + " values",
										{}, reportedObjective, reportedStatus);
	}
	const lemon::Tolerance<double> selected(0.5);
	lemon::FullDigraph g(inst.getCityCount());
	lemon::FullDigraph::ArcMap<bool> used(g, false);
	for (variable_id i = 0; i < variableMap.getArcVariableCount(); ++i) {
		if (selected.positive(variables[i])) {
			const Arc& arc = variableMap.getArc(i);
			used[g.arc(g(arc.first), g(arc.second))] = true;
		}
	}
	try {
		initFromGraph(g, used, variableMap.getAnchor());
	} catch (const std::runtime_error& err) {
		throw ExtractionValidationError(err.what(), order, reportedObjective, reportedStatus);
	}
}

/**
 * Läuft die gewählten Kanten ab dem Anker ab. Bei einem Fehler enthält order die bis dahin besuchten Städte.
 */
void TSPSolution::initFromGraph(const lemon::FullDigraph& g, const lemon::FullDigraph::ArcMap<bool>& used,
								city_id anchor) {
	using lemon::FullDigraph;
	FullDigraph::NodeMap<int> outDegree(g, 0);
	FullDigraph::NodeMap<int> inDegree(g, 0);
	for (FullDigraph::ArcIt it(g); it != lemon::INVALID; ++it) {
		if (used[it] && g.source(it) != g.target(it)) {
			++outDegree[g.source(it)];
			++inDegree[g.target(it)];
		}
	}
	auto degreeError = [&](FullDigraph::Node node) {
		return std::runtime_error("Invalid TSP solution, city " + std::to_string(FullDigraph::id(node)) +
								  " has out-degree " + std::to_string(outDegree[node]) + " and in-degree " +
								  std::to_string(inDegree[node]));
	};
	FullDigraph::Node currentCity = g(anchor);
	do {
		order.push_back(FullDigraph::id(currentCity));
		if (outDegree[currentCity] != 1 || inDegree[currentCity] != 1) {
			throw degreeError(currentCity);
		}
		for (FullDigraph::OutArcIt it(g, currentCity); it != lemon::INVALID; ++it) {
			if (used[it] && g.target(it) != currentCity) {
				currentCity = g.target(it);
				break;
			}
		}
	} while (currentCity != g(anchor));
	//Alle Städte mit Grad 1 außerhalb des Kreises liegen auf weiteren Kreisen
	for (FullDigraph::NodeIt node(g); node != lemon::INVALID; ++node) {
		if (outDegree[node] != 1 || inDegree[node] != 1) {
			throw degreeError(node);
		}
	}
	if (order.size() < static_cast<std::size_t>(g.nodeNum())) {
		throw std::runtime_error("Invalid TSP solution, the anchor " + std::to_string(anchor) +
								 " is in a cycle of length " + std::to_string(order.size()));
	}
	initTourCost();
}

/**
 * Erstellt eine Tour aus der gegebenen Reihenfolge. Diese muss jede Stadt genau einmal enthalten.
 */
TSPSolution::TSPSolution(const TSPInstance& inst, std::vector<city_id> order)
		: inst(&inst), order(std::move(order)) {
	if (!tsp_util::isPermutation(this->order, inst.getCityCount())) {
		throw InputError("Tour does not visit each of the " + std::to_string(inst.getCityCount()) +
						 " cities exactly once");
	}
	initTourCost();
}

/**
 * Liest eine Tour im TSPLib-Format ein
 * @param instance Die zur Tour gehörende Instanz
 */
TSPSolution::TSPSolution(const TSPInstance& instance, std::istream& input) : inst(&instance) {
	std::string line;
	bool emptyLines = false;
	while (std::getline(input, line)) {
		if (!line.empty()) {
			if (emptyLines) {
				std::cout << "Skipped empty line(s)" << std::endl;
				emptyLines = false;
			}
			std::stringstream ss(line);
			std::string keyword = tsp_util::readKeyword(ss);
			if (keyword == "NAME" || keyword == "COMMENT") {
				//NOP
			} else if (keyword == "TYPE") {
				std::string type;
				ss >> type;
				if (type != "TOUR") {
					throw InputError("Tried to read tour from non-tour file");
				}
			} else if (keyword == "DIMENSION") {
				auto dim = tsp_util::readOrThrow<city_id>(ss);
				if (dim != inst->getCityCount()) {
					throw InputError("Tour and instance have different dimension");
				}
			} else if (keyword == "TOUR_SECTION") {
				order.resize(static_cast<std::size_t>(inst->getCityCount()));
				for (city_id& i : order) {
					i = tsp_util::readOrThrow<city_id>(input) - 1;
				}
				auto end = tsp_util::readOrThrow<city_id>(input);
				if (end != -1) {
					throw InputError("Tour wasn't followed by -1!");
				}
				input >> std::ws;
			} else if (keyword == "EOF") {
				break;
			} else {
				throw InputError("Unknown keyword in tour file: " + keyword);
			}
		} else {
			emptyLines = true;
		}
	}
	if (order.empty()) {
		throw InputError("Tour file did not contain tour data!");
	}
	if (!tsp_util::isPermutation(order, inst->getCityCount())) {
		throw InputError("Tour file does not visit each city exactly once");
	}
	initTourCost();
}

/**
 * @return Die Kosten der Lösung
 */
cost_t TSPSolution::getCost() const {
	return cost;
}

/**
 * @return Die Städte in der Reihenfolge, in der sie in dieser Lösung besucht werden
 */
const std::vector<city_id>& TSPSolution::getOrder() const {
	return order;
}

/**
 * @return Die gerichteten Kanten der Tour, einschließlich der Kante von der letzten Stadt zurück zur ersten
 */
std::vector<Arc> TSPSolution::getArcs() const {
	std::vector<Arc> ret;
	ret.reserve(order.size());
	for (std::size_t i = 0; i < order.size(); ++i) {
		ret.emplace_back(order[i], order[(i + 1) % order.size()]);
	}
	return ret;
}

/**
 * @return Die Tour in umgekehrter Richtung mit derselben ersten Stadt
 */
TSPSolution TSPSolution::reversed() const {
	if (!isValid()) {
		return {};
	}
	std::vector<city_id> reversedOrder(order.size());
	reversedOrder[0] = order[0];
	std::reverse_copy(order.begin() + 1, order.end(), reversedOrder.begin() + 1);
	return TSPSolution(*inst, reversedOrder);
}

/**
 * @return Dieselbe Tour, aber beginnend bei anchor
 */
TSPSolution TSPSolution::rotatedTo(city_id anchor) const {
	if (!isValid()) {
		return {};
	}
	inst->checkCity(anchor);
	std::vector<city_id> rotated(order);
	std::rotate(rotated.begin(), std::find(rotated.begin(), rotated.end(), anchor), rotated.end());
	return TSPSolution(*inst, rotated);
}

/**
 * Gibt die Lösung im TSPLIB-Format in out aus
 */
void TSPSolution::write(std::ostream& out) const {
	if (inst == nullptr) {
		throw std::runtime_error("Tried to write invalid TSP solution!");
	}
	out << "NAME: " << inst->getName() << ".tour\n"
		<< "COMMENT: Length " << getCost() << "\n"
		<< "TYPE: TOUR\n"
		<< "DIMENSION: " << inst->getCityCount() << "\n"
		<< "TOUR_SECTION\n";
	for (city_id c:getOrder()) {
		out << c + 1 << "\n";
	}
	out << "-1\nEOF\n";
}

bool TSPSolution::isValid() const {
	return inst != nullptr;
}

/**
 * Berechnet die Kosten der Tour aus der Knotenreihenfolge
 */
void TSPSolution::initTourCost() {
	cost = 0;
	for (const Arc& arc:getArcs()) {
		cost += inst->getDistance(arc);
	}
}
