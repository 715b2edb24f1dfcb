#ifndef TSP_SOLVERS_HPP
#define TSP_SOLVERS_HPP

#include <tsp_instance.hpp>
#include <tsp_solution.hpp>
#include <tsp_mip_data.hpp>
#include <mixed_integer_program.hpp>
#include <vector>

/**
 * Das Ergebnis eines Aufrufs von tspsolvers::solveMIP. Tour, Zielfunktionswert und Variablenwerte sind nur gesetzt,
 * falls der Solver eine Lösung gefunden hat.
 */
struct SolveResult {
	MipStatus status = MipStatus::timed_out_no_solution;
	TSPSolution tour;
	double objective = 0;
	double relativeGap = 0;
	//Werte der Kantenvariablen, arcValues[v] gehört zu TspMipData::getArc(v)
	std::vector<double> arcValues;
	//Werte der Positionsvariablen, eine pro Stadt
	std::vector<double> orderValues;

	bool hasSolution() const;
};

namespace tspsolvers {
	/**
	 * Einstellungen für das exakte Lösen
	 */
	struct MipOptions {
		MixedIntegerProgram::Parameters solver;
		city_id anchor = 0;
		SubtourEncoding encoding = SubtourEncoding::indicator;
	};

	TSPSolution solveNearestNeighbor(const TSPInstance& inst, city_id anchor = 0);

	SolveResult solveMIP(const TSPInstance& inst, const TSPSolution *initial, const SharedCplexEnv& env,
						 const MipOptions& options);
}
#endif
