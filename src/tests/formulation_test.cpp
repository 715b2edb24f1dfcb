#include <cstddef>
#include <string>
#include <vector>
#include <tsp_instance.hpp>
#include <tsp_mip_data.hpp>
#include <tsp_solution.hpp>
#include "test_checks.hpp"

namespace {
	std::string encodingName(SubtourEncoding encoding) {
		return encoding == SubtourEncoding::indicator ? "indicator" : "big-M";
	}

	/**
	 * Belegung der Kantenvariablen mit den angegebenen Kanten, alle Positionsvariablen 0
	 */
	std::vector<double> arcsOnly(const TspMipData& data, const std::vector<Arc>& arcs) {
		std::vector<double> ret(static_cast<size_t>(data.getVariableCount()), 0);
		for (const Arc& arc:arcs) {
			ret[data.getArcVariable(arc.first, arc.second)] = 1;
		}
		return ret;
	}
}

int main() {
	TestChecks checks("formulation_test");
	const std::vector<SubtourEncoding> encodings{SubtourEncoding::indicator, SubtourEncoding::big_m};

	TSPInstance five({{0, 0}, {1, 5}, {4, 2}, {7, 7}, {3, 3}});
	for (SubtourEncoding encoding:encodings) {
		TspMipData data(five, 0, encoding);
		std::string name = encodingName(encoding);
		checks.check(data.getArcVariableCount() == 20, name + ": one binary per arc");
		checks.check(data.getVariableCount() == 25, name + ": one order variable per city");
		checks.check(data.degreeConstraints().size() == 10, name + ": in- and out-degree per city");
		checks.check(data.orderingImplications().size() == 16, name + ": MTZ implication per arc not entering 0");
		checks.check(data.bigMConstraints().size() == 32, name + ": two big-M rows per implication");
		for (variable_id var = 0; var < data.getArcVariableCount(); ++var) {
			const Arc& arc = data.getArc(var);
			checks.check(arc.first != arc.second && data.getArcVariable(arc.first, arc.second) == var,
						 name + ": arc mapping of variable " + std::to_string(var));
		}
		for (const TspMipData::IndicatorConstraint& c:data.orderingImplications()) {
			checks.check(data.getArc(c.indicator).second != data.getAnchor(),
						 name + ": no ordering constraint enters the anchor");
		}
	}
	checks.check(TspMipData(five, 0, SubtourEncoding::indicator).getArcVariable(2, 2) ==
				 MixedIntegerProgram::invalid_variable, "no variable for loops");

	TSPInstance square({{0, 0}, {0, 10}, {10, 10}, {10, 0}});
	TSPSolution perimeter(square, {0, 1, 2, 3});
	TSPSolution crossing(square, {0, 2, 1, 3});
	for (SubtourEncoding encoding:encodings) {
		for (city_id anchor = 0; anchor < square.getCityCount(); ++anchor) {
			TspMipData data(square, anchor, encoding);
			std::string name = encodingName(encoding) + ", anchor " + std::to_string(anchor);
			checks.check(data.countViolations(data.toAssignment(perimeter)) == 0, name + ": perimeter is feasible");
			checks.check(data.countViolations(data.toAssignment(crossing)) == 0, name + ": crossing tour is feasible");
			checks.check(data.countViolations(data.toAssignment(perimeter.reversed())) == 0,
						 name + ": reversed tour is feasible");
		}
	}

	//Der Startwert schließt die Tour: die Kante von der letzten zur ersten Stadt ist gesetzt
	TspMipData anchored(square, 0, SubtourEncoding::indicator);
	std::vector<double> start = anchored.toAssignment(perimeter);
	checks.check(start[anchored.getArcVariable(3, 0)] == 1, "closing arc 3 -> 0 is part of the assignment");
	checks.check(start[anchored.getArcVariable(0, 3)] == 0, "reverse closing arc is not");
	checks.check(start[anchored.getOrderVariable(2)] == 2, "order of city 2 counts from the anchor");

	/*
	 * Zwei disjunkte 2-Kreise erfüllen alle Gradbedingungen, aber für keine Wahl der Positionen die
	 * MTZ-Bedingungen
	 */
	for (SubtourEncoding encoding:encodings) {
		for (city_id anchor = 0; anchor < square.getCityCount(); ++anchor) {
			TspMipData data(square, anchor, encoding);
			std::string name = encodingName(encoding) + ", anchor " + std::to_string(anchor);
			std::vector<double> values = arcsOnly(data, {{0, 1}, {1, 0}, {2, 3}, {3, 2}});
			size_t violatedEverywhere = 0;
			size_t positions = 0;
			for (int code = 0; code < 4 * 4 * 4 * 4; ++code) {
				int rest = code;
				for (city_id c = 0; c < 4; ++c) {
					values[data.getOrderVariable(c)] = rest % 4;
					rest /= 4;
				}
				++positions;
				if (data.countViolations(values) > 0) {
					++violatedEverywhere;
				}
			}
			checks.check(violatedEverywhere == positions, name + ": two 2-cycles violate MTZ for every ordering");
			size_t degreeViolations = 0;
			for (const TspMipData::Constraint& c:data.degreeConstraints()) {
				if (c.isViolated(values, lemon::Tolerance<double>(1e-6))) {
					++degreeViolations;
				}
			}
			checks.check(degreeViolations == 0, name + ": two 2-cycles satisfy the degree constraints");
		}
	}

	TspMipData data(square, 0, SubtourEncoding::indicator);
	checks.check(data.countViolations(arcsOnly(data, {{0, 1}, {0, 2}, {1, 2}, {2, 3}, {3, 0}})) > 0,
				 "city with out-degree 2 violates the degree constraints");
	checks.check(data.countViolations(arcsOnly(data, {})) == 8, "empty assignment violates all degree constraints");
	checks.checkThrows<InputError>([&data] { data.countViolations(std::vector<double>(3, 0)); },
								   "assignment of wrong size");

	TSPInstance pair({{0, 0}, {3, 4}});
	for (SubtourEncoding encoding:encodings) {
		TspMipData twoCities(pair, 0, encoding);
		checks.check(twoCities.getArcVariableCount() == 2, encodingName(encoding) + ": two cities, two arcs");
		checks.check(twoCities.orderingImplications().size() == 1, encodingName(encoding) + ": one implication");
		checks.check(twoCities.countViolations(twoCities.toAssignment(TSPSolution(pair, {0, 1}))) == 0,
					 encodingName(encoding) + ": round trip is feasible");
	}

	checks.checkThrows<InputError>([&square] { TspMipData(square, 4, SubtourEncoding::indicator); },
								   "anchor out of range");
	checks.checkThrows<InputError>([&square] { TspMipData(square, -1, SubtourEncoding::big_m); },
								   "negative anchor");
	checks.checkThrows<InputError>([&data] { data.getOrderVariable(5); }, "order variable out of range");
	return checks.exitCode();
}
